#include "zkeb/utilities/utf8.hpp"
namespace zkeb::utilities {
namespace {
    constexpr bool IsContinuation(uint8_t byte) noexcept {
        return (byte & 0xC0) == 0x80;
    }
}
bool Utf8::IsValid(std::span<const uint8_t> data) noexcept {
    size_t i = 0;
    const size_t n = data.size();
    while (i < n) {
        const uint8_t lead = data[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }
        size_t length = 0;
        uint8_t second_min = 0x80;
        uint8_t second_max = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead == 0xE0) {
            length = 3;
            second_min = 0xA0;
        } else if (lead == 0xED) {
            length = 3;
            second_max = 0x9F;
        } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
            length = 3;
        } else if (lead == 0xF0) {
            length = 4;
            second_min = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            length = 4;
        } else if (lead == 0xF4) {
            length = 4;
            second_max = 0x8F;
        } else {
            // 0x80..0xC1 and 0xF5..0xFF never start a sequence
            return false;
        }
        if (n - i < length) {
            return false;
        }
        const uint8_t second = data[i + 1];
        if (second < second_min || second > second_max) {
            return false;
        }
        for (size_t k = 2; k < length; ++k) {
            if (!IsContinuation(data[i + k])) {
                return false;
            }
        }
        i += length;
    }
    return true;
}
}
