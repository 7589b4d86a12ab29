#include "zkeb/crypto/sodium_interop.hpp"

#include <fmt/format.h>

#include <atomic>
#include <mutex>
#include <string>

namespace zkeb::crypto {

namespace {
    std::once_flag sodium_once;
    std::atomic<bool> sodium_ready{false};

    SodiumFailure NotInitialized(std::string_view operation) {
        return SodiumFailure::InitializationFailed(
            fmt::format("{}: {}", operation, ErrorMessages::NOT_INITIALIZED));
    }
}

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(sodium_once, [] {
        // sodium_init returns 1 when already initialised elsewhere in the process
        sodium_ready.store(sodium_init() >= 0, std::memory_order_release);
    });
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return sodium_ready.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::FillRandom(std::span<uint8_t> output) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            NotInitialized(ErrorMessages::RANDOM_SOURCE_UNAVAILABLE));
    }
    if (!output.empty()) {
        randombytes_buf(output.data(), output.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> bytes(size);
    auto filled = FillRandom(bytes);
    if (filled.IsErr()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(std::move(filled).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(bytes));
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    // sodium_memzero has no dependency on sodium_init
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            NotInitialized(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED));
    }
    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

} // namespace zkeb::crypto
