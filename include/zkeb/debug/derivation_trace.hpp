#pragma once

/**
 * @file derivation_trace.hpp
 * @brief Development trace of hierarchy derivations and envelope operations.
 *
 * Used to line up derivation steps between platform implementations while
 * debugging interop. Only public values are printed (labels, lengths,
 * device ids, nonces, tags). Key material is never printed.
 *
 * Enable via CMake: -DZKEB_DEBUG_TRACE=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace zkeb::debug {

#ifdef ZKEB_DEBUG_TRACE

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

#define ZKEB_TRACE_PUBLIC(operation, name, data) \
    do { \
        fprintf(stdout, "[ZKEB-TRACE] %s %s: %s\n", \
            operation, \
            name, \
            ::zkeb::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define ZKEB_TRACE_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[ZKEB-TRACE] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define ZKEB_TRACE_MSG(operation, message) \
    do { \
        fprintf(stdout, "[ZKEB-TRACE] %s %s\n", operation, message); \
        fflush(stdout); \
    } while(0)

#define ZKEB_TRACE_SECTION(section_name) \
    do { \
        fprintf(stdout, "[ZKEB-TRACE] ========== %s ==========\n", section_name); \
        fflush(stdout); \
    } while(0)

inline void TraceDeviceMasterKeyDerivation(std::string_view device_id, std::string_view info) {
    ZKEB_TRACE_SECTION("DMK DERIVATION");
    ZKEB_TRACE_MSG("DMK", ("device_id=" + std::string(device_id)).c_str());
    ZKEB_TRACE_MSG("DMK", ("info=" + std::string(info)).c_str());
}

inline void TraceDeviceKeysDerivation(size_t dmk_length) {
    ZKEB_TRACE_SECTION("DEVICE KEYS DERIVATION");
    ZKEB_TRACE_VALUE("DEVICE_KEYS", "dmk_length", dmk_length);
}

inline void TraceSeal(
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> tag,
    size_t ciphertext_length,
    size_t associated_data_length) {
    ZKEB_TRACE_PUBLIC("SEAL", "nonce", nonce);
    ZKEB_TRACE_PUBLIC("SEAL", "tag", tag);
    ZKEB_TRACE_VALUE("SEAL", "ciphertext_length", ciphertext_length);
    ZKEB_TRACE_VALUE("SEAL", "aad_length", associated_data_length);
}

inline void TraceOpen(std::span<const uint8_t> nonce, bool authenticated) {
    ZKEB_TRACE_PUBLIC("OPEN", "nonce", nonce);
    ZKEB_TRACE_MSG("OPEN", authenticated ? "authenticated" : "AUTHENTICATION FAILED");
}

#else // !ZKEB_DEBUG_TRACE

#define ZKEB_TRACE_PUBLIC(operation, name, data) ((void)0)
#define ZKEB_TRACE_VALUE(operation, name, value) ((void)0)
#define ZKEB_TRACE_MSG(operation, message) ((void)0)
#define ZKEB_TRACE_SECTION(section_name) ((void)0)

inline void TraceDeviceMasterKeyDerivation(std::string_view, std::string_view) {}
inline void TraceDeviceKeysDerivation(size_t) {}
inline void TraceSeal(std::span<const uint8_t>, std::span<const uint8_t>, size_t, size_t) {}
inline void TraceOpen(std::span<const uint8_t>, bool) {}

#endif // ZKEB_DEBUG_TRACE

} // namespace zkeb::debug
