#pragma once
#include "zkeb/models/keys/secret_key_bytes.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace zkeb::models {

/**
 * @brief Root of the key hierarchy (UMK)
 *
 * 32 CSPRNG bytes generated once on the originating client. The library never
 * stores or transmits it; storage and destruction belong to the caller.
 */
class UserMasterKey {
public:
    explicit UserMasterKey(std::vector<uint8_t> key) noexcept
        : key_(std::move(key)) {}

    [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept { return key_.Bytes(); }
    [[nodiscard]] const SecretKeyBytes& Key() const noexcept { return key_; }

private:
    SecretKeyBytes key_;
};
}
