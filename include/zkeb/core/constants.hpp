#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace zkeb {
struct Constants {
    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t HKDF_MAX_BLOCKS = 255;
    static constexpr size_t HKDF_MAX_OUTPUT_LEN = HKDF_MAX_BLOCKS * HASH_LEN;
    static constexpr size_t MASTER_KEY_SIZE = 32;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct HierarchyConstants {
    static constexpr std::string_view DEVICE_MASTER_KEY_INFO = "ZKEB-DMK-v1";
    static constexpr std::string_view BACKUP_KEY_INFO = "ZKEB-BEK-v1";
    static constexpr std::string_view METADATA_KEY_INFO = "ZKEB-MEK-v1";
    static constexpr std::string_view BACKUP_KEY_SALT = "backup";
    static constexpr std::string_view METADATA_KEY_SALT = "metadata";
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr const char* ALGORITHM_HMAC = "HMAC";
    static constexpr const char* ALGORITHM_SHA256 = "SHA256";
    static constexpr const char* PARAM_DIGEST = "digest";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view RANDOM_SOURCE_UNAVAILABLE = "Secure random source unavailable";
    static constexpr std::string_view AES_GCM_AUTHENTICATION_FAILED =
        "Decryption failed (authentication tag mismatch or corrupted data)";
    static constexpr std::string_view DEVICE_ID_EMPTY = "Device ID cannot be empty";
    static constexpr std::string_view INVALID_UTF8 = "Decrypted data is not valid UTF-8";
};
}
