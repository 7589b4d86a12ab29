#include "zkeb/crypto/aes_gcm.hpp"
#include "zkeb/crypto/sodium_interop.hpp"
#include "zkeb/core/constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <fmt/format.h>
#include <algorithm>
#include <climits>
#include <memory>
#include <string>
namespace zkeb::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    constexpr size_t MAX_UPDATE_CHUNK = static_cast<size_t>(INT_MAX) & ~static_cast<size_t>(0xF);
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    void Wipe(std::span<uint8_t> buffer) noexcept {
        sodium_memzero(buffer.data(), buffer.size());
    }
    Result<Unit, ZkebFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, ZkebFailure>::Err(
                ZkebFailure::InvalidKeyLength(
                    fmt::format("Invalid key length: expected {} bytes, got {} bytes",
                        Constants::AES_KEY_SIZE, key.size())));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return Result<Unit, ZkebFailure>::Err(
                ZkebFailure::InvalidNonceLength(
                    fmt::format("Invalid nonce length: expected {} bytes, got {} bytes",
                        Constants::AES_GCM_NONCE_SIZE, nonce.size())));
        }
        return Result<Unit, ZkebFailure>::Ok(unit);
    }
    // EVP_*Update takes an int length; feed large inputs in chunks.
    template<typename UpdateFn>
    bool UpdateChunked(
        EVP_CIPHER_CTX* ctx,
        UpdateFn update,
        uint8_t* out,
        std::span<const uint8_t> in,
        size_t& written) {
        written = 0;
        size_t offset = 0;
        while (offset < in.size()) {
            const size_t chunk = std::min(MAX_UPDATE_CHUNK, in.size() - offset);
            int chunk_out = 0;
            if (update(ctx, out == nullptr ? nullptr : out + written, &chunk_out,
                       in.data() + offset, static_cast<int>(chunk)) != OpenSSL::SUCCESS) {
                return false;
            }
            written += static_cast<size_t>(chunk_out);
            offset += chunk;
        }
        return true;
    }
}
Result<std::vector<uint8_t>, ZkebFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    auto validation = ValidateKeyAndNonce(key, nonce);
    if (validation.IsErr()) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            std::move(validation).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Encryption(
                fmt::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Encryption(
                fmt::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Encryption(
                fmt::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Encryption(
                fmt::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    size_t aad_written = 0;
    if (!UpdateChunked(ctx.get(), EVP_EncryptUpdate, nullptr, associated_data, aad_written)) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Encryption(
                fmt::format("Failed to add associated data: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    size_t ciphertext_len = 0;
    if (!UpdateChunked(ctx.get(), EVP_EncryptUpdate, output.data(), plaintext, ciphertext_len)) {
        Wipe(output);
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Encryption(
                fmt::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Encryption(
                fmt::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += static_cast<size_t>(final_len);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Encryption(
                fmt::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(ciphertext_len + Constants::AES_GCM_TAG_SIZE);
    return Result<std::vector<uint8_t>, ZkebFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, ZkebFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    auto validation = ValidateKeyAndNonce(key, nonce);
    if (validation.IsErr()) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            std::move(validation).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::InvalidInput(
                fmt::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    const std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    const std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Generic(
                fmt::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Generic(
                fmt::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Generic(
                fmt::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Generic(
                fmt::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    size_t aad_written = 0;
    if (!UpdateChunked(ctx.get(), EVP_DecryptUpdate, nullptr, associated_data, aad_written)) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Generic(
                fmt::format("Failed to add associated data: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> output(ciphertext_len);
    size_t plaintext_len = 0;
    if (!UpdateChunked(ctx.get(), EVP_DecryptUpdate, output.data(), ciphertext, plaintext_len)) {
        Wipe(output);
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Generic(
                fmt::format("Decryption failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           tag_copy.data()) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Generic(
                fmt::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        // Unauthenticated plaintext never leaves this function
        Wipe(output);
        ERR_clear_error();
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            ZkebFailure::Authentication(
                std::string(ErrorMessages::AES_GCM_AUTHENTICATION_FAILED)));
    }
    plaintext_len += static_cast<size_t>(final_len);
    output.resize(plaintext_len);
    return Result<std::vector<uint8_t>, ZkebFailure>::Ok(std::move(output));
}
}
