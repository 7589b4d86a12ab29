#pragma once
#include "zkeb/core/result.hpp"
#include "zkeb/core/failures.hpp"
#include "zkeb/models/encryption_envelope.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace zkeb::envelope {

/**
 * @brief AEAD seal/open of application data under any 32-byte key
 *
 * Each Encrypt draws a fresh 12-byte nonce from libsodium's CSPRNG, so callers
 * never handle nonces themselves. Decrypt verifies the tag before any
 * plaintext is returned; a mismatch is reported as Authentication and must
 * be treated as tampering.
 */
class EnvelopeCipher {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ZkebFailure> GenerateKey();
    [[nodiscard]] static Result<std::vector<uint8_t>, ZkebFailure> GenerateNonce();

    [[nodiscard]] static Result<models::EncryptionEnvelope, ZkebFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key,
        std::optional<std::span<const uint8_t>> associated_data = std::nullopt);

    [[nodiscard]] static Result<std::vector<uint8_t>, ZkebFailure> Decrypt(
        const models::EncryptionEnvelope& envelope,
        std::span<const uint8_t> key);

    [[nodiscard]] static Result<models::EncryptionEnvelope, ZkebFailure> EncryptString(
        std::string_view plaintext,
        std::span<const uint8_t> key,
        std::optional<std::span<const uint8_t>> associated_data = std::nullopt);

    /// Decode fails if the authenticated plaintext is not well-formed UTF-8
    [[nodiscard]] static Result<std::string, ZkebFailure> DecryptString(
        const models::EncryptionEnvelope& envelope,
        std::span<const uint8_t> key);

private:
    EnvelopeCipher() = delete;
};
}
