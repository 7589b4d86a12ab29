#include "zkeb/hierarchy/key_hierarchy.hpp"
#include "zkeb/crypto/hkdf.hpp"
#include "zkeb/crypto/sodium_interop.hpp"
#include "zkeb/debug/derivation_trace.hpp"
#include <fmt/format.h>
#include <string>
#include <vector>

namespace zkeb::hierarchy {
using crypto::Hkdf;
using crypto::SodiumInterop;
using models::DerivedHierarchy;
using models::DeviceKeySet;
using models::DeviceMasterKey;
using models::UserMasterKey;

namespace {
    // UTF-8 encodings of ECMAScript WhiteSpace and LineTerminator: TAB, LF,
    // VT, FF, CR, SPACE, NBSP, U+1680, U+2000..U+200A, U+2028, U+2029,
    // U+202F, U+205F, U+3000 and U+FEFF
    size_t WhitespaceLength(std::string_view value) {
        const auto byte = [&](size_t i) { return static_cast<uint8_t>(value[i]); };
        switch (byte(0)) {
            case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
                return 1;
            case 0xC2:
                return value.size() >= 2 && byte(1) == 0xA0 ? 2 : 0;
            case 0xE1:
                return value.size() >= 3 && byte(1) == 0x9A && byte(2) == 0x80 ? 3 : 0;
            case 0xE2:
                if (value.size() < 3) {
                    return 0;
                }
                if (byte(1) == 0x80) {
                    const uint8_t last = byte(2);
                    return (last >= 0x80 && last <= 0x8A) || last == 0xA8 || last == 0xA9 || last == 0xAF
                        ? 3 : 0;
                }
                return byte(1) == 0x81 && byte(2) == 0x9F ? 3 : 0;
            case 0xE3:
                return value.size() >= 3 && byte(1) == 0x80 && byte(2) == 0x80 ? 3 : 0;
            case 0xEF:
                return value.size() >= 3 && byte(1) == 0xBB && byte(2) == 0xBF ? 3 : 0;
            default:
                return 0;
        }
    }

    // True when trimming leading whitespace consumes the whole id
    bool IsBlank(std::string_view value) {
        while (!value.empty()) {
            const size_t length = WhitespaceLength(value);
            if (length == 0) {
                return false;
            }
            value.remove_prefix(length);
        }
        return true;
    }

    std::span<const uint8_t> Utf8Bytes(std::string_view value) {
        return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
    }
}

Result<UserMasterKey, ZkebFailure> KeyHierarchy::GenerateUserMasterKey() {
    auto init = SodiumInterop::Initialize();
    if (init.IsErr()) {
        return Result<UserMasterKey, ZkebFailure>::Err(
            ZkebFailure::RandomSourceUnavailable(init.UnwrapErr().message));
    }
    auto random = SodiumInterop::GetRandomBytes(KEY_SIZE);
    if (random.IsErr()) {
        return Result<UserMasterKey, ZkebFailure>::Err(
            ZkebFailure::FromSodiumFailure(random.UnwrapErr()));
    }
    return Result<UserMasterKey, ZkebFailure>::Ok(
        UserMasterKey(std::move(random).Unwrap()));
}

Result<DeviceMasterKey, ZkebFailure> KeyHierarchy::DeriveDeviceMasterKey(
    std::span<const uint8_t> user_master_key,
    std::string_view device_id,
    const HierarchyConfig& config) {

    if (user_master_key.size() != KEY_SIZE) {
        return Result<DeviceMasterKey, ZkebFailure>::Err(
            ZkebFailure::InvalidUserMasterKey(
                fmt::format("Invalid UMK: expected {} bytes, got {} bytes",
                    KEY_SIZE, user_master_key.size())));
    }
    if (IsBlank(device_id)) {
        return Result<DeviceMasterKey, ZkebFailure>::Err(
            ZkebFailure::InvalidDeviceId(std::string(ErrorMessages::DEVICE_ID_EMPTY)));
    }

    debug::TraceDeviceMasterKeyDerivation(device_id, config.DeviceMasterKeyLabel());

    auto dmk = Hkdf::DeriveKeyBytes(
        Utf8Bytes(device_id),
        user_master_key,
        config.DeviceMasterKeyInfo(),
        static_cast<int64_t>(KEY_SIZE));
    if (dmk.IsErr()) {
        return Result<DeviceMasterKey, ZkebFailure>::Err(
            ZkebFailure::DeriveKey(
                "Failed to derive Device Master Key: " + dmk.UnwrapErr().message));
    }

    return Result<DeviceMasterKey, ZkebFailure>::Ok(
        DeviceMasterKey(std::move(dmk).Unwrap(), std::string(device_id)));
}

Result<DeviceKeySet, ZkebFailure> KeyHierarchy::DeriveDeviceKeys(
    std::span<const uint8_t> device_master_key,
    const HierarchyConfig& config) {

    if (device_master_key.size() != KEY_SIZE) {
        return Result<DeviceKeySet, ZkebFailure>::Err(
            ZkebFailure::InvalidDeviceMasterKey(
                fmt::format("Invalid DMK: expected {} bytes, got {} bytes",
                    KEY_SIZE, device_master_key.size())));
    }

    debug::TraceDeviceKeysDerivation(device_master_key.size());

    auto backup_key = Hkdf::DeriveKeyBytes(
        config.BackupKeySalt(),
        device_master_key,
        config.BackupKeyInfo(),
        static_cast<int64_t>(KEY_SIZE));
    if (backup_key.IsErr()) {
        return Result<DeviceKeySet, ZkebFailure>::Err(
            ZkebFailure::DeriveKey(
                "Failed to derive Backup Encryption Key: " + backup_key.UnwrapErr().message));
    }

    auto metadata_key = Hkdf::DeriveKeyBytes(
        config.MetadataKeySalt(),
        device_master_key,
        config.MetadataKeyInfo(),
        static_cast<int64_t>(KEY_SIZE));
    if (metadata_key.IsErr()) {
        // Wrap the BEK so it is wiped on the way out
        models::SecretKeyBytes discarded(std::move(backup_key).Unwrap());
        return Result<DeviceKeySet, ZkebFailure>::Err(
            ZkebFailure::DeriveKey(
                "Failed to derive Metadata Encryption Key: " + metadata_key.UnwrapErr().message));
    }

    return Result<DeviceKeySet, ZkebFailure>::Ok(
        DeviceKeySet(std::move(backup_key).Unwrap(), std::move(metadata_key).Unwrap()));
}

Result<DerivedHierarchy, ZkebFailure> KeyHierarchy::DeriveKeysFromUserMasterKey(
    std::span<const uint8_t> user_master_key,
    std::string_view device_id,
    const HierarchyConfig& config) {

    auto dmk_result = DeriveDeviceMasterKey(user_master_key, device_id, config);
    if (dmk_result.IsErr()) {
        return Result<DerivedHierarchy, ZkebFailure>::Err(std::move(dmk_result).UnwrapErr());
    }
    auto dmk = std::move(dmk_result).Unwrap();

    auto keys_result = DeriveDeviceKeys(dmk.Bytes(), config);
    if (keys_result.IsErr()) {
        return Result<DerivedHierarchy, ZkebFailure>::Err(std::move(keys_result).UnwrapErr());
    }

    return Result<DerivedHierarchy, ZkebFailure>::Ok(
        DerivedHierarchy{std::move(dmk), std::move(keys_result).Unwrap()});
}
}
