#pragma once
#include <cstdint>
#include <optional>
#include <vector>
namespace zkeb::models {

/**
 * @brief Output of one AES-256-GCM seal
 *
 * The tag authenticates ciphertext and associated_data together. The
 * associated data travels in clear. No wire encoding is defined here;
 * serialising an envelope is the transport's job.
 */
struct EncryptionEnvelope {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> tag;
    std::optional<std::vector<uint8_t>> associated_data;

    [[nodiscard]] bool HasAssociatedData() const noexcept {
        return associated_data.has_value();
    }
};
}
