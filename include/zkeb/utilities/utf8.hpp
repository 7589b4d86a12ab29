#pragma once
#include <cstdint>
#include <span>
namespace zkeb::utilities {

/**
 * Strict UTF-8 validation (RFC 3629).
 *
 * Rejects overlong encodings, UTF-16 surrogates (U+D800..U+DFFF), code
 * points above U+10FFFF, stray continuation bytes and truncated sequences.
 */
class Utf8 {
public:
    [[nodiscard]] static bool IsValid(std::span<const uint8_t> data) noexcept;

private:
    Utf8() = delete;
};
}
