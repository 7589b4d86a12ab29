#pragma once
#include "zkeb/models/keys/secret_key_bytes.hpp"
#include "zkeb/models/keys/device_master_key.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace zkeb::models {

/**
 * @brief Purpose keys derived from one DMK
 *
 * BEK = HKDF-SHA256(salt = "backup",   ikm = DMK, info = "ZKEB-BEK-v1", L = 32)
 * MEK = HKDF-SHA256(salt = "metadata", ikm = DMK, info = "ZKEB-MEK-v1", L = 32)
 */
class DeviceKeySet {
public:
    DeviceKeySet(std::vector<uint8_t> backup_encryption_key,
                 std::vector<uint8_t> metadata_encryption_key) noexcept
        : backup_encryption_key_(std::move(backup_encryption_key))
        , metadata_encryption_key_(std::move(metadata_encryption_key)) {}

    [[nodiscard]] std::span<const uint8_t> BackupEncryptionKey() const noexcept {
        return backup_encryption_key_.Bytes();
    }
    [[nodiscard]] std::span<const uint8_t> MetadataEncryptionKey() const noexcept {
        return metadata_encryption_key_.Bytes();
    }
    [[nodiscard]] const SecretKeyBytes& BackupKey() const noexcept { return backup_encryption_key_; }
    [[nodiscard]] const SecretKeyBytes& MetadataKey() const noexcept { return metadata_encryption_key_; }

private:
    SecretKeyBytes backup_encryption_key_;
    SecretKeyBytes metadata_encryption_key_;
};

/// Result of a full UMK -> DMK -> {BEK, MEK} derivation
struct DerivedHierarchy {
    DeviceMasterKey dmk;
    DeviceKeySet keys;
};
}
