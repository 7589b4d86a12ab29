#include "zkeb/crypto/secure_memory_handle.hpp"
#include "zkeb/crypto/sodium_interop.hpp"
#include "zkeb/core/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <utility>

namespace zkeb::crypto {

void SecureMemoryHandle::SodiumFree::operator()(uint8_t* ptr) const noexcept {
    sodium_free(ptr);
}

SecureMemoryHandle::SecureMemoryHandle(uint8_t* ptr, const size_t size) noexcept
    : bytes_(ptr)
    , size_(size) {}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : bytes_(std::move(other.bytes_))
    , size_(std::exchange(other.size_, 0)) {}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        bytes_ = std::move(other.bytes_);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

SodiumFailure SecureMemoryHandle::Disposed() {
    return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("Cannot allocate zero-sized secure memory"));
    }
    auto* ptr = static_cast<uint8_t*>(sodium_malloc(size));
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                fmt::format("{}{} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(SecureMemoryHandle(ptr, size));
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(Disposed());
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                fmt::format("{} (data: {}, buffer: {})",
                    ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }
    auto* tail = std::copy(data.begin(), data.end(), bytes_.get());
    std::fill(tail, bytes_.get() + size_, uint8_t{0});
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(Disposed());
    }
    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                fmt::format("Output buffer too small (requested: {}, provided: {})",
                    size_, output.size())));
    }
    std::copy_n(bytes_.get(), size_, output.begin());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(const size_t size) const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(Disposed());
    }
    if (size > size_) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::ReadOperationFailed(
                fmt::format("{}requested {} bytes from a {}-byte allocation",
                    ErrorMessages::FAILED_TO_READ_SECURE_MEMORY, size, size_)));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(
        std::vector<uint8_t>(bytes_.get(), bytes_.get() + size));
}

} // namespace zkeb::crypto
