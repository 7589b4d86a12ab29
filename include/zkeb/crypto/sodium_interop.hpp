#pragma once

#include "zkeb/core/result.hpp"
#include "zkeb/core/failures.hpp"
#include "zkeb/core/constants.hpp"

#include <sodium.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace zkeb::crypto {

/**
 * @brief Process-wide access to libsodium
 *
 * libsodium's CSPRNG is the only randomness source in the library. There is
 * no fallback: if the platform source cannot be opened, Initialize fails and
 * every caller that needs fresh keys or nonces reports
 * RandomSourceUnavailable.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /// Thread-safe and idempotent; the outcome of the first call is sticky
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Randomness
    // ========================================================================

    /// Overwrite every byte of output with CSPRNG output
    static Result<Unit, SodiumFailure> FillRandom(std::span<uint8_t> output);

    static Result<std::vector<uint8_t>, SodiumFailure> GetRandomBytes(size_t size);

    // ========================================================================
    // Memory hygiene
    // ========================================================================

    /// Zero buffer in a way the optimiser cannot elide
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Compare two buffers in time independent of their contents
     *
     * Length is not secret: buffers of different length are unequal.
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

private:
    SodiumInterop() = delete;
};

} // namespace zkeb::crypto
