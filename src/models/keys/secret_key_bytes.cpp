#include "zkeb/models/keys/secret_key_bytes.hpp"
#include "zkeb/crypto/sodium_interop.hpp"
#include <sodium.h>
namespace zkeb::models {
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;

SecretKeyBytes::SecretKeyBytes(std::vector<uint8_t> bytes) noexcept
    : bytes_(std::move(bytes)) {}

SecretKeyBytes::~SecretKeyBytes() {
    Wipe();
}

SecretKeyBytes::SecretKeyBytes(SecretKeyBytes&& other) noexcept
    : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

SecretKeyBytes& SecretKeyBytes::operator=(SecretKeyBytes&& other) noexcept {
    if (this != &other) {
        Wipe();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

void SecretKeyBytes::Wipe() noexcept {
    if (!bytes_.empty()) {
        sodium_memzero(bytes_.data(), bytes_.size());
    }
}

Result<SecureMemoryHandle, SodiumFailure> SecretKeyBytes::ToSecureHandle() const {
    auto handle_result = SecureMemoryHandle::Allocate(bytes_.size());
    if (handle_result.IsErr()) {
        return handle_result;
    }
    auto handle = std::move(handle_result).Unwrap();
    auto write_result = handle.Write(bytes_);
    if (write_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            std::move(write_result).UnwrapErr());
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

Result<bool, SodiumFailure> SecretKeyBytes::ConstantTimeEquals(const SecretKeyBytes& other) const {
    return SodiumInterop::ConstantTimeEquals(bytes_, other.bytes_);
}
}
