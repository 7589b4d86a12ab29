#pragma once
#include <string>
#include <utility>
namespace zkeb {

/// libsodium-level failures; converted to ZkebFailure at the library boundary
enum class SodiumFailureType {
    InitializationFailed,
    AllocationFailed,
    BufferTooSmall,
    ReadOperationFailed,
    InvalidOperation
};

enum class ZkebFailureType {
    Generic,
    DeriveKey,
    InvalidInput,
    InvalidLength,
    InvalidUserMasterKey,
    InvalidDeviceId,
    InvalidDeviceMasterKey,
    InvalidKeyLength,
    InvalidNonceLength,
    Encryption,
    Authentication,
    Decode,
    RandomSourceUnavailable
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;

    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Failure reported by every fallible zkeb operation
 *
 * Authentication failures mean tampering or a wrong key/nonce/AAD and are
 * never retried. RandomSourceUnavailable is fatal: there is no fallback
 * generator. Everything else is a caller input error.
 */
class ZkebFailure {
public:
    ZkebFailureType type;
    std::string message;

    ZkebFailure(const ZkebFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    [[nodiscard]] bool IsFatal() const noexcept {
        return type == ZkebFailureType::RandomSourceUnavailable;
    }
    [[nodiscard]] bool IsAuthentication() const noexcept {
        return type == ZkebFailureType::Authentication;
    }

    static ZkebFailure Generic(std::string msg) { return {ZkebFailureType::Generic, std::move(msg)}; }
    static ZkebFailure DeriveKey(std::string msg) { return {ZkebFailureType::DeriveKey, std::move(msg)}; }
    static ZkebFailure InvalidInput(std::string msg) { return {ZkebFailureType::InvalidInput, std::move(msg)}; }
    static ZkebFailure InvalidLength(std::string msg) { return {ZkebFailureType::InvalidLength, std::move(msg)}; }

    // Hierarchy inputs
    static ZkebFailure InvalidUserMasterKey(std::string msg) {
        return {ZkebFailureType::InvalidUserMasterKey, std::move(msg)};
    }
    static ZkebFailure InvalidDeviceId(std::string msg) {
        return {ZkebFailureType::InvalidDeviceId, std::move(msg)};
    }
    static ZkebFailure InvalidDeviceMasterKey(std::string msg) {
        return {ZkebFailureType::InvalidDeviceMasterKey, std::move(msg)};
    }

    // AEAD
    static ZkebFailure InvalidKeyLength(std::string msg) {
        return {ZkebFailureType::InvalidKeyLength, std::move(msg)};
    }
    static ZkebFailure InvalidNonceLength(std::string msg) {
        return {ZkebFailureType::InvalidNonceLength, std::move(msg)};
    }
    static ZkebFailure Encryption(std::string msg) { return {ZkebFailureType::Encryption, std::move(msg)}; }
    static ZkebFailure Authentication(std::string msg) { return {ZkebFailureType::Authentication, std::move(msg)}; }
    static ZkebFailure Decode(std::string msg) { return {ZkebFailureType::Decode, std::move(msg)}; }

    static ZkebFailure RandomSourceUnavailable(std::string msg) {
        return {ZkebFailureType::RandomSourceUnavailable, std::move(msg)};
    }

    /// Initialisation failures mean no CSPRNG; anything else is Generic
    static ZkebFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return RandomSourceUnavailable(sf.message);
        }
        return Generic(sf.message);
    }
};
}
