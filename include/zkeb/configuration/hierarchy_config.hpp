#pragma once

#include "zkeb/core/result.hpp"
#include "zkeb/core/failures.hpp"
#include "zkeb/core/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace zkeb::configuration {

/// Domain-separation labels used by the key hierarchy
///
/// Every platform client derives with the same labels; `Version1()` carries
/// the interoperable set and is the default of every KeyHierarchy call:
///
/// | Key | salt                | info          |
/// |-----|---------------------|---------------|
/// | DMK | UTF-8 of deviceId   | `ZKEB-DMK-v1` |
/// | BEK | `backup`            | `ZKEB-BEK-v1` |
/// | MEK | `metadata`          | `ZKEB-MEK-v1` |
///
/// A future label version is introduced through `Create()`, which rejects
/// sets that would collapse two purposes onto the same derivation.
///
/// @example
/// ```cpp
/// auto v1 = HierarchyConfig::Version1();
/// auto v2 = HierarchyConfig::Create("ZKEB-DMK-v2", "ZKEB-BEK-v2", "backup",
///                                   "ZKEB-MEK-v2", "metadata");
/// ```
class HierarchyConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Interoperable labels shared by every platform implementation
    [[nodiscard]] static const HierarchyConfig& Version1();

    /// Custom label set; InvalidInput if a label is empty or two purposes collide
    [[nodiscard]] static Result<HierarchyConfig, ZkebFailure> Create(
        std::string device_master_key_info,
        std::string backup_key_info,
        std::string backup_key_salt,
        std::string metadata_key_info,
        std::string metadata_key_salt);

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] std::span<const uint8_t> DeviceMasterKeyInfo() const noexcept;
    [[nodiscard]] std::span<const uint8_t> BackupKeyInfo() const noexcept;
    [[nodiscard]] std::span<const uint8_t> BackupKeySalt() const noexcept;
    [[nodiscard]] std::span<const uint8_t> MetadataKeyInfo() const noexcept;
    [[nodiscard]] std::span<const uint8_t> MetadataKeySalt() const noexcept;

    [[nodiscard]] std::string_view DeviceMasterKeyLabel() const noexcept {
        return device_master_key_info_;
    }

    /// Size in bytes of every key the hierarchy produces
    [[nodiscard]] static constexpr size_t KeySize() noexcept { return Constants::MASTER_KEY_SIZE; }

    [[nodiscard]] bool IsVersion1() const noexcept;

    bool operator==(const HierarchyConfig& other) const = default;

private:
    HierarchyConfig(
        std::string device_master_key_info,
        std::string backup_key_info,
        std::string backup_key_salt,
        std::string metadata_key_info,
        std::string metadata_key_salt);

    std::string device_master_key_info_;
    std::string backup_key_info_;
    std::string backup_key_salt_;
    std::string metadata_key_info_;
    std::string metadata_key_salt_;
};

} // namespace zkeb::configuration
