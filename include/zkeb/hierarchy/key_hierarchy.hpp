#pragma once
#include "zkeb/core/result.hpp"
#include "zkeb/core/failures.hpp"
#include "zkeb/configuration/hierarchy_config.hpp"
#include "zkeb/models/keys/user_master_key.hpp"
#include "zkeb/models/keys/device_master_key.hpp"
#include "zkeb/models/keys/device_key_set.hpp"
#include <cstdint>
#include <span>
#include <string_view>
namespace zkeb::hierarchy {
using configuration::HierarchyConfig;

/**
 * @brief Deterministic key hierarchy: UMK -> DMK -> {BEK, MEK}
 *
 * Every call recomputes from its explicit inputs. Nothing is cached and no
 * key outlives the value returned to the caller.
 *
 * Inputs are validated before any derivation starts:
 * - UMK and DMK must be exactly 32 bytes
 * - device_id must be non-empty after trimming surrounding whitespace
 */
class KeyHierarchy {
public:
    /// 32 bytes from libsodium's CSPRNG; RandomSourceUnavailable is fatal
    [[nodiscard]] static Result<models::UserMasterKey, ZkebFailure> GenerateUserMasterKey();

    [[nodiscard]] static Result<models::DeviceMasterKey, ZkebFailure> DeriveDeviceMasterKey(
        std::span<const uint8_t> user_master_key,
        std::string_view device_id,
        const HierarchyConfig& config = HierarchyConfig::Version1());

    [[nodiscard]] static Result<models::DeviceKeySet, ZkebFailure> DeriveDeviceKeys(
        std::span<const uint8_t> device_master_key,
        const HierarchyConfig& config = HierarchyConfig::Version1());

    [[nodiscard]] static Result<models::DerivedHierarchy, ZkebFailure> DeriveKeysFromUserMasterKey(
        std::span<const uint8_t> user_master_key,
        std::string_view device_id,
        const HierarchyConfig& config = HierarchyConfig::Version1());

private:
    static constexpr size_t KEY_SIZE = HierarchyConfig::KeySize();
    KeyHierarchy() = delete;
};
}
