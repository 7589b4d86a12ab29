#pragma once
#include "zkeb/core/result.hpp"
#include "zkeb/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace zkeb::crypto {

/**
 * AES-256-GCM primitive over OpenSSL EVP.
 *
 * Stateless: the caller supplies the nonce and is responsible for never
 * reusing a (key, nonce) pair. EnvelopeCipher draws a fresh random nonce for
 * every call and is the intended entry point; this class exists so that the
 * envelope layer and known-answer tests can share one implementation.
 *
 * Output layout of Encrypt is ciphertext || tag (tag is 16 bytes).
 * Decrypt fails with ZkebFailureType::Authentication when the tag does not
 * verify. The comparison is OpenSSL's, never a byte loop in this library.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ZkebFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, ZkebFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
