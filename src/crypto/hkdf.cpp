#include "zkeb/crypto/hkdf.hpp"
#include "zkeb/crypto/sodium_interop.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <initializer_list>
#include <memory>
#include <string>

namespace zkeb::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_MAC_Deleter {
        void operator()(EVP_MAC* mac) const {
            if (mac) {
                EVP_MAC_free(mac);
            }
        }
    };
    struct EVP_MAC_CTX_Deleter {
        void operator()(EVP_MAC_CTX* ctx) const {
            if (ctx) {
                EVP_MAC_CTX_free(ctx);
            }
        }
    };
    using EVP_MAC_ptr = std::unique_ptr<EVP_MAC, EVP_MAC_Deleter>;
    using EVP_MAC_CTX_ptr = std::unique_ptr<EVP_MAC_CTX, EVP_MAC_CTX_Deleter>;

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

    Result<Unit, ZkebFailure> ValidateOutputLength(const int64_t length) {
        if (length <= 0) {
            return Result<Unit, ZkebFailure>::Err(
                ZkebFailure::InvalidLength(
                    fmt::format("HKDF output length must be positive, got {}", length)));
        }
        if (static_cast<uint64_t>(length) > Hkdf::MAX_OUTPUT_LEN) {
            return Result<Unit, ZkebFailure>::Err(
                ZkebFailure::InvalidLength(
                    fmt::format("HKDF output length {} exceeds maximum {} (255 * HashLen)",
                        length, Hkdf::MAX_OUTPUT_LEN)));
        }
        return Result<Unit, ZkebFailure>::Ok(unit);
    }

    // HMAC-SHA256(key, part_0 | part_1 | ...) written to out[0..HASH_LEN)
    Result<Unit, ZkebFailure> HmacSha256(
        std::span<const uint8_t> key,
        std::initializer_list<std::span<const uint8_t>> message_parts,
        std::span<uint8_t> out) {

        EVP_MAC_ptr mac(EVP_MAC_fetch(nullptr, OpenSSL::ALGORITHM_HMAC, nullptr));
        if (!mac) {
            return Result<Unit, ZkebFailure>::Err(
                ZkebFailure::DeriveKey(
                    fmt::format("Failed to fetch HMAC: {}", GetOpenSSLError())));
        }
        EVP_MAC_CTX_ptr ctx(EVP_MAC_CTX_new(mac.get()));
        if (!ctx) {
            return Result<Unit, ZkebFailure>::Err(
                ZkebFailure::DeriveKey(
                    fmt::format("Failed to create HMAC context: {}", GetOpenSSLError())));
        }

        OSSL_PARAM params[2];
        params[0] = OSSL_PARAM_construct_utf8_string(
            OpenSSL::PARAM_DIGEST, const_cast<char*>(OpenSSL::ALGORITHM_SHA256), 0);
        params[1] = OSSL_PARAM_construct_end();

        if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != OpenSSL::SUCCESS) {
            return Result<Unit, ZkebFailure>::Err(
                ZkebFailure::DeriveKey(
                    fmt::format("Failed to initialize HMAC-SHA256: {}", GetOpenSSLError())));
        }
        for (const auto part : message_parts) {
            if (part.empty()) {
                continue;
            }
            if (EVP_MAC_update(ctx.get(), part.data(), part.size()) != OpenSSL::SUCCESS) {
                return Result<Unit, ZkebFailure>::Err(
                    ZkebFailure::DeriveKey(
                        fmt::format("HMAC update failed: {}", GetOpenSSLError())));
            }
        }
        size_t written = 0;
        if (EVP_MAC_final(ctx.get(), out.data(), &written, out.size()) != OpenSSL::SUCCESS ||
            written != Hkdf::HASH_LEN) {
            return Result<Unit, ZkebFailure>::Err(
                ZkebFailure::DeriveKey(
                    fmt::format("HMAC finalization failed: {}", GetOpenSSLError())));
        }
        return Result<Unit, ZkebFailure>::Ok(unit);
    }
}

Result<std::vector<uint8_t>, ZkebFailure> Hkdf::Extract(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> ikm) {

    const std::array<uint8_t, HASH_LEN> zero_salt{};
    const std::span<const uint8_t> hmac_key = salt.empty()
        ? std::span<const uint8_t>(zero_salt)
        : salt;

    std::vector<uint8_t> prk(HASH_LEN);
    auto result = HmacSha256(hmac_key, {ikm}, prk);
    if (result.IsErr()) {
        Wipe(prk);
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ZkebFailure>::Ok(std::move(prk));
}

Result<Unit, ZkebFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    std::span<const uint8_t> info,
    std::span<uint8_t> output) {

    auto length_check = ValidateOutputLength(static_cast<int64_t>(output.size()));
    if (length_check.IsErr()) {
        return length_check;
    }
    if (prk.size() < HASH_LEN) {
        return Result<Unit, ZkebFailure>::Err(
            ZkebFailure::InvalidInput(
                fmt::format("HKDF PRK must be at least {} bytes, got {}", HASH_LEN, prk.size())));
    }

    const size_t block_count = (output.size() + HASH_LEN - 1) / HASH_LEN;
    std::array<uint8_t, HASH_LEN> block{};
    size_t previous_len = 0;  // T(0) is the empty string
    size_t offset = 0;

    for (size_t i = 1; i <= block_count; ++i) {
        const uint8_t counter = static_cast<uint8_t>(i);
        auto step = HmacSha256(
            prk,
            {std::span<const uint8_t>(block.data(), previous_len),
             info,
             std::span<const uint8_t>(&counter, 1)},
            block);
        if (step.IsErr()) {
            Wipe(block);
            Wipe(output);
            return step;
        }
        const size_t take = std::min(HASH_LEN, output.size() - offset);
        std::copy_n(block.begin(), take, output.begin() + static_cast<std::ptrdiff_t>(offset));
        offset += take;
        previous_len = HASH_LEN;
    }

    Wipe(block);
    return Result<Unit, ZkebFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ZkebFailure> Hkdf::ExpandBytes(
    std::span<const uint8_t> prk,
    std::span<const uint8_t> info,
    const int64_t length) {

    auto length_check = ValidateOutputLength(length);
    if (length_check.IsErr()) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            std::move(length_check).UnwrapErr());
    }

    std::vector<uint8_t> okm(static_cast<size_t>(length));
    auto result = Expand(prk, info, okm);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ZkebFailure>::Ok(std::move(okm));
}

Result<Unit, ZkebFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> info,
    std::span<uint8_t> output) {

    auto length_check = ValidateOutputLength(static_cast<int64_t>(output.size()));
    if (length_check.IsErr()) {
        return length_check;
    }

    auto prk_result = Extract(salt, ikm);
    if (prk_result.IsErr()) {
        return Result<Unit, ZkebFailure>::Err(std::move(prk_result).UnwrapErr());
    }
    auto prk = std::move(prk_result).Unwrap();
    auto result = Expand(prk, info, output);
    Wipe(prk);
    return result;
}

Result<std::vector<uint8_t>, ZkebFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> info,
    const int64_t length) {

    auto length_check = ValidateOutputLength(length);
    if (length_check.IsErr()) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            std::move(length_check).UnwrapErr());
    }

    std::vector<uint8_t> okm(static_cast<size_t>(length));
    auto result = DeriveKey(salt, ikm, info, okm);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, ZkebFailure>::Err(
            std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ZkebFailure>::Ok(std::move(okm));
}

} // namespace zkeb::crypto
