#include "zkeb/envelope/envelope_cipher.hpp"
#include "zkeb/crypto/aes_gcm.hpp"
#include "zkeb/crypto/sodium_interop.hpp"
#include "zkeb/core/constants.hpp"
#include "zkeb/debug/derivation_trace.hpp"
#include "zkeb/utilities/utf8.hpp"
#include <fmt/format.h>
namespace zkeb::envelope {
using crypto::AesGcm;
using crypto::SodiumInterop;
using models::EncryptionEnvelope;
namespace {
    Result<std::vector<uint8_t>, ZkebFailure> RandomBytes(size_t size) {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::vector<uint8_t>, ZkebFailure>::Err(
                ZkebFailure::RandomSourceUnavailable(init.UnwrapErr().message));
        }
        return SodiumInterop::GetRandomBytes(size).MapErr(
            [](SodiumFailure failure) { return ZkebFailure::FromSodiumFailure(failure); });
    }
    Result<Unit, ZkebFailure> ValidateKey(std::span<const uint8_t> key) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, ZkebFailure>::Err(
                ZkebFailure::InvalidKeyLength(
                    fmt::format("Invalid key length: expected {} bytes, got {} bytes",
                        Constants::AES_KEY_SIZE, key.size())));
        }
        return Result<Unit, ZkebFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, ZkebFailure> EnvelopeCipher::GenerateKey() {
    return RandomBytes(Constants::AES_KEY_SIZE);
}
Result<std::vector<uint8_t>, ZkebFailure> EnvelopeCipher::GenerateNonce() {
    return RandomBytes(Constants::AES_GCM_NONCE_SIZE);
}
Result<EncryptionEnvelope, ZkebFailure> EnvelopeCipher::Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> key,
    std::optional<std::span<const uint8_t>> associated_data) {
    if (auto key_check = ValidateKey(key); key_check.IsErr()) {
        return Result<EncryptionEnvelope, ZkebFailure>::Err(std::move(key_check).UnwrapErr());
    }
    auto nonce_result = GenerateNonce();
    if (nonce_result.IsErr()) {
        return Result<EncryptionEnvelope, ZkebFailure>::Err(std::move(nonce_result).UnwrapErr());
    }
    auto nonce = std::move(nonce_result).Unwrap();
    const std::span<const uint8_t> aad = associated_data.value_or(std::span<const uint8_t>{});
    auto sealed = AesGcm::Encrypt(key, nonce, plaintext, aad);
    if (sealed.IsErr()) {
        return Result<EncryptionEnvelope, ZkebFailure>::Err(std::move(sealed).UnwrapErr());
    }
    auto& combined = sealed.Unwrap();
    const auto tag_begin = combined.end() - static_cast<std::ptrdiff_t>(Constants::AES_GCM_TAG_SIZE);
    EncryptionEnvelope envelope;
    envelope.tag.assign(tag_begin, combined.end());
    combined.erase(tag_begin, combined.end());
    envelope.ciphertext = std::move(combined);
    envelope.nonce = std::move(nonce);
    if (associated_data.has_value()) {
        envelope.associated_data.emplace(aad.begin(), aad.end());
    }
    debug::TraceSeal(envelope.nonce, envelope.tag, envelope.ciphertext.size(), aad.size());
    return Result<EncryptionEnvelope, ZkebFailure>::Ok(std::move(envelope));
}
Result<std::vector<uint8_t>, ZkebFailure> EnvelopeCipher::Decrypt(
    const EncryptionEnvelope& envelope,
    std::span<const uint8_t> key) {
    if (auto key_check = ValidateKey(key); key_check.IsErr()) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(std::move(key_check).UnwrapErr());
    }
    if (envelope.nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::InvalidNonceLength(
                fmt::format("Invalid nonce length: expected {} bytes, got {} bytes",
                    Constants::AES_GCM_NONCE_SIZE, envelope.nonce.size())));
    }
    if (envelope.tag.size() != Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::InvalidInput(
                fmt::format("Invalid tag length: expected {} bytes, got {} bytes",
                    Constants::AES_GCM_TAG_SIZE, envelope.tag.size())));
    }
    std::vector<uint8_t> combined;
    combined.reserve(envelope.ciphertext.size() + envelope.tag.size());
    combined.insert(combined.end(), envelope.ciphertext.begin(), envelope.ciphertext.end());
    combined.insert(combined.end(), envelope.tag.begin(), envelope.tag.end());
    std::span<const uint8_t> aad;
    if (envelope.associated_data.has_value()) {
        aad = *envelope.associated_data;
    }
    auto opened = AesGcm::Decrypt(key, envelope.nonce, combined, aad);
    debug::TraceOpen(envelope.nonce, opened.IsOk());
    return opened;
}
Result<EncryptionEnvelope, ZkebFailure> EnvelopeCipher::EncryptString(
    std::string_view plaintext,
    std::span<const uint8_t> key,
    std::optional<std::span<const uint8_t>> associated_data) {
    const std::span<const uint8_t> bytes(
        reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size());
    return Encrypt(bytes, key, associated_data);
}
Result<std::string, ZkebFailure> EnvelopeCipher::DecryptString(
    const EncryptionEnvelope& envelope,
    std::span<const uint8_t> key) {
    auto opened = Decrypt(envelope, key);
    if (opened.IsErr()) {
        return Result<std::string, ZkebFailure>::Err(std::move(opened).UnwrapErr());
    }
    auto& bytes = opened.Unwrap();
    if (!utilities::Utf8::IsValid(bytes)) {
        sodium_memzero(bytes.data(), bytes.size());
        return Result<std::string, ZkebFailure>::Err(
            ZkebFailure::Decode(std::string(ErrorMessages::INVALID_UTF8)));
    }
    std::string text(bytes.begin(), bytes.end());
    sodium_memzero(bytes.data(), bytes.size());
    return Result<std::string, ZkebFailure>::Ok(std::move(text));
}
}
