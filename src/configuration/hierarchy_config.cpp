#include "zkeb/configuration/hierarchy_config.hpp"
#include "zkeb/core/constants.hpp"

#include <fmt/format.h>

#include <utility>

namespace zkeb::configuration {

namespace {
    std::span<const uint8_t> AsBytes(const std::string& value) noexcept {
        return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
    }
}

HierarchyConfig::HierarchyConfig(
    std::string device_master_key_info,
    std::string backup_key_info,
    std::string backup_key_salt,
    std::string metadata_key_info,
    std::string metadata_key_salt)
    : device_master_key_info_(std::move(device_master_key_info))
    , backup_key_info_(std::move(backup_key_info))
    , backup_key_salt_(std::move(backup_key_salt))
    , metadata_key_info_(std::move(metadata_key_info))
    , metadata_key_salt_(std::move(metadata_key_salt)) {}

const HierarchyConfig& HierarchyConfig::Version1() {
    static const HierarchyConfig config(
        std::string(HierarchyConstants::DEVICE_MASTER_KEY_INFO),
        std::string(HierarchyConstants::BACKUP_KEY_INFO),
        std::string(HierarchyConstants::BACKUP_KEY_SALT),
        std::string(HierarchyConstants::METADATA_KEY_INFO),
        std::string(HierarchyConstants::METADATA_KEY_SALT));
    return config;
}

Result<HierarchyConfig, ZkebFailure> HierarchyConfig::Create(
    std::string device_master_key_info,
    std::string backup_key_info,
    std::string backup_key_salt,
    std::string metadata_key_info,
    std::string metadata_key_salt) {

    const std::pair<std::string_view, const std::string*> labels[] = {
        {"device master key info", &device_master_key_info},
        {"backup key info", &backup_key_info},
        {"backup key salt", &backup_key_salt},
        {"metadata key info", &metadata_key_info},
        {"metadata key salt", &metadata_key_salt},
    };
    for (const auto& [name, value] : labels) {
        if (value->empty()) {
            return Result<HierarchyConfig, ZkebFailure>::Err(
                ZkebFailure::InvalidInput(fmt::format("Hierarchy {} cannot be empty", name)));
        }
    }

    if (backup_key_info == metadata_key_info && backup_key_salt == metadata_key_salt) {
        return Result<HierarchyConfig, ZkebFailure>::Err(
            ZkebFailure::InvalidInput(
                "Backup and metadata keys must use distinct salt or info"));
    }
    if (device_master_key_info == backup_key_info ||
        device_master_key_info == metadata_key_info) {
        return Result<HierarchyConfig, ZkebFailure>::Err(
            ZkebFailure::InvalidInput(
                "Device master key info must differ from backup and metadata info"));
    }

    return Result<HierarchyConfig, ZkebFailure>::Ok(HierarchyConfig(
        std::move(device_master_key_info),
        std::move(backup_key_info),
        std::move(backup_key_salt),
        std::move(metadata_key_info),
        std::move(metadata_key_salt)));
}

std::span<const uint8_t> HierarchyConfig::DeviceMasterKeyInfo() const noexcept {
    return AsBytes(device_master_key_info_);
}

std::span<const uint8_t> HierarchyConfig::BackupKeyInfo() const noexcept {
    return AsBytes(backup_key_info_);
}

std::span<const uint8_t> HierarchyConfig::BackupKeySalt() const noexcept {
    return AsBytes(backup_key_salt_);
}

std::span<const uint8_t> HierarchyConfig::MetadataKeyInfo() const noexcept {
    return AsBytes(metadata_key_info_);
}

std::span<const uint8_t> HierarchyConfig::MetadataKeySalt() const noexcept {
    return AsBytes(metadata_key_salt_);
}

bool HierarchyConfig::IsVersion1() const noexcept {
    return *this == Version1();
}

} // namespace zkeb::configuration
