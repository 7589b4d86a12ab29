#pragma once

#include "zkeb/core/result.hpp"
#include "zkeb/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <type_traits>
#include <vector>

namespace zkeb::crypto {

/**
 * @brief Guarded storage for key material a caller keeps between calls
 *
 * Backed by sodium_malloc: guard pages on both sides, locked in RAM, and
 * zeroed by sodium_free when the handle goes away. The library itself never
 * holds keys across calls; this is for the UMK/DMK/BEK/MEK an application
 * chooses to retain.
 *
 * Move-only. Not internally synchronised.
 *
 * @code
 * auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
 * handle.Write(umk.Bytes());
 * auto dmk = handle.WithReadAccess([&](std::span<const uint8_t> stored) {
 *     return KeyHierarchy::DeriveDeviceMasterKey(stored, device_id);
 * });
 * @endcode
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    SecureMemoryHandle() noexcept = default;
    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;
    ~SecureMemoryHandle() = default;

    /// Replace the contents; bytes past data.size() become zero
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /// Copy the whole allocation into output, which must hold Size() bytes
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    /// Copy the first size bytes out
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /// Lend the stored bytes to func; the span must not escape the call
    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using R = Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure>;
        if (IsInvalid()) {
            return R::Err(Disposed());
        }
        return R::Ok(std::forward<F>(func)(std::span<const uint8_t>(bytes_.get(), size_)));
    }

    template<typename F>
    auto WithWriteAccess(F&& func)
        -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using R = Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure>;
        if (IsInvalid()) {
            return R::Err(Disposed());
        }
        return R::Ok(std::forward<F>(func)(std::span<uint8_t>(bytes_.get(), size_)));
    }

    [[nodiscard]] bool IsInvalid() const noexcept { return bytes_ == nullptr; }
    [[nodiscard]] size_t Size() const noexcept { return size_; }

private:
    struct SodiumFree {
        void operator()(uint8_t* ptr) const noexcept;
    };

    SecureMemoryHandle(uint8_t* ptr, size_t size) noexcept;

    static SodiumFailure Disposed();

    std::unique_ptr<uint8_t, SodiumFree> bytes_;
    size_t size_ = 0;
};

} // namespace zkeb::crypto
