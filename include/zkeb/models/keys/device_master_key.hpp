#pragma once
#include "zkeb/models/keys/secret_key_bytes.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace zkeb::models {

/**
 * @brief Per-device key (DMK)
 *
 * DMK = HKDF-SHA256(salt = UTF-8(device_id), ikm = UMK, info = "ZKEB-DMK-v1", L = 32)
 *
 * A pure function of (UMK, device_id). The device id is kept exactly as the
 * caller supplied it, surrounding whitespace included, because it is the salt.
 */
class DeviceMasterKey {
public:
    DeviceMasterKey(std::vector<uint8_t> key, std::string device_id) noexcept
        : key_(std::move(key)), device_id_(std::move(device_id)) {}

    [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept { return key_.Bytes(); }
    [[nodiscard]] const SecretKeyBytes& Key() const noexcept { return key_; }
    [[nodiscard]] std::string_view DeviceId() const noexcept { return device_id_; }

private:
    SecretKeyBytes key_;
    std::string device_id_;
};
}
