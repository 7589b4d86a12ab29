#pragma once
#include "zkeb/crypto/secure_memory_handle.hpp"
#include "zkeb/core/result.hpp"
#include "zkeb/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
namespace zkeb::models {

/**
 * @brief Move-only owner of derived key bytes
 *
 * The buffer is wiped when the object is destroyed or assigned over. For
 * long-lived storage move the bytes into guarded memory with ToSecureHandle().
 */
class SecretKeyBytes {
public:
    explicit SecretKeyBytes(std::vector<uint8_t> bytes) noexcept;
    ~SecretKeyBytes();

    SecretKeyBytes(SecretKeyBytes&& other) noexcept;
    SecretKeyBytes& operator=(SecretKeyBytes&& other) noexcept;
    SecretKeyBytes(const SecretKeyBytes&) = delete;
    SecretKeyBytes& operator=(const SecretKeyBytes&) = delete;

    [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept { return bytes_; }
    [[nodiscard]] size_t Size() const noexcept { return bytes_.size(); }

    [[nodiscard]] Result<crypto::SecureMemoryHandle, SodiumFailure> ToSecureHandle() const;

    /// Constant-time equality; false if sizes differ
    [[nodiscard]] Result<bool, SodiumFailure> ConstantTimeEquals(const SecretKeyBytes& other) const;

private:
    void Wipe() noexcept;

    std::vector<uint8_t> bytes_;
};
}
