#pragma once

#include "zkeb/core/result.hpp"
#include "zkeb/core/failures.hpp"
#include "zkeb/core/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace zkeb::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869)
 *
 * Extract and Expand are composed here on top of OpenSSL's HMAC-SHA256.
 * Every call is a pure function of its arguments: no state is shared
 * between calls, so any number of threads may derive concurrently.
 *
 * Argument order follows the RFC: salt, IKM, info, L.
 */
class Hkdf {
public:
    /**
     * @brief HKDF Extract (RFC 5869 section 2.2)
     *
     * PRK = HMAC-SHA256(key = salt, message = ikm). An empty salt is
     * replaced by HASH_LEN zero bytes. Empty IKM is accepted.
     *
     * @return Ok(prk) where prk is exactly HASH_LEN bytes
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ZkebFailure> Extract(
        std::span<const uint8_t> salt,
        std::span<const uint8_t> ikm);

    /**
     * @brief HKDF Expand (RFC 5869 section 2.3)
     *
     * Fills output with T(1) | T(2) | ... truncated to output.size(), where
     * T(i) = HMAC-SHA256(prk, T(i-1) | info | i).
     *
     * @param prk Pseudorandom key, at least HASH_LEN bytes
     * @param info Context string (may be empty)
     * @param output 1..MAX_OUTPUT_LEN bytes
     * @return InvalidLength if output is empty or too long,
     *         InvalidInput if prk is shorter than HASH_LEN
     */
    [[nodiscard]] static Result<Unit, ZkebFailure> Expand(
        std::span<const uint8_t> prk,
        std::span<const uint8_t> info,
        std::span<uint8_t> output);

    /**
     * @brief Expand into a newly allocated buffer of length bytes
     *
     * length <= 0 and length > MAX_OUTPUT_LEN fail with InvalidLength.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ZkebFailure> ExpandBytes(
        std::span<const uint8_t> prk,
        std::span<const uint8_t> info,
        int64_t length);

    /**
     * @brief Extract-then-Expand into a caller-supplied buffer
     */
    [[nodiscard]] static Result<Unit, ZkebFailure> DeriveKey(
        std::span<const uint8_t> salt,
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> info,
        std::span<uint8_t> output);

    /**
     * @brief Extract-then-Expand returning length bytes of OKM
     *
     * For fixed salt, ikm and info the result for length L is a byte prefix
     * of the result for any larger length.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ZkebFailure> DeriveKeyBytes(
        std::span<const uint8_t> salt,
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> info,
        int64_t length);

    static constexpr size_t HASH_LEN = Constants::HASH_LEN;
    static constexpr size_t MAX_OUTPUT_LEN = Constants::HKDF_MAX_OUTPUT_LEN;

private:
    Hkdf() = delete;
};

} // namespace zkeb::crypto
