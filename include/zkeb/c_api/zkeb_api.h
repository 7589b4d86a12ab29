#pragma once

#include "zkeb/c_api/zkeb_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define ZKEB_API_VERSION_MAJOR 1
#define ZKEB_API_VERSION_MINOR 0
#define ZKEB_API_VERSION_PATCH 0

#define ZKEB_KEY_SIZE 32
#define ZKEB_NONCE_SIZE 12
#define ZKEB_TAG_SIZE 16
#define ZKEB_HKDF_MAX_OUTPUT 8160

typedef enum {
    ZKEB_SUCCESS = 0,
    ZKEB_ERROR_GENERIC = 1,
    ZKEB_ERROR_INVALID_INPUT = 2,
    ZKEB_ERROR_INVALID_LENGTH = 3,
    ZKEB_ERROR_INVALID_UMK = 4,
    ZKEB_ERROR_INVALID_DEVICE_ID = 5,
    ZKEB_ERROR_INVALID_DMK = 6,
    ZKEB_ERROR_INVALID_KEY_LENGTH = 7,
    ZKEB_ERROR_INVALID_NONCE_LENGTH = 8,
    ZKEB_ERROR_AUTHENTICATION = 9,
    ZKEB_ERROR_DECODE = 10,
    ZKEB_ERROR_RANDOM_UNAVAILABLE = 11,
    ZKEB_ERROR_NULL_POINTER = 12,
    ZKEB_ERROR_BUFFER_TOO_SMALL = 13,
    ZKEB_ERROR_OUT_OF_MEMORY = 14
} ZkebErrorCode;

typedef struct ZkebBuffer {
    uint8_t* data;
    size_t length;
} ZkebBuffer;

typedef struct ZkebError {
    ZkebErrorCode code;
    char* message;
} ZkebError;

// Buffers produced by zkeb_encrypt are owned by the library until passed to
// zkeb_envelope_free. Envelopes handed to zkeb_decrypt stay caller-owned.
typedef struct ZkebEnvelope {
    ZkebBuffer ciphertext;
    ZkebBuffer nonce;
    ZkebBuffer tag;
    ZkebBuffer associated_data;
    bool has_associated_data;
} ZkebEnvelope;

ZKEB_API const char* zkeb_version(void);

ZKEB_API ZkebErrorCode zkeb_init(void);

ZKEB_API void zkeb_shutdown(void);

// RFC 5869 HKDF-SHA256. out_key_length is L and must be 1..ZKEB_HKDF_MAX_OUTPUT.
ZKEB_API ZkebErrorCode zkeb_hkdf(
    const uint8_t* salt,
    size_t salt_length,
    const uint8_t* ikm,
    size_t ikm_length,
    const uint8_t* info,
    size_t info_length,
    uint8_t* out_key,
    size_t out_key_length,
    ZkebError* out_error);

ZKEB_API ZkebErrorCode zkeb_generate_user_master_key(
    uint8_t* out_umk,
    size_t out_umk_length,
    ZkebError* out_error);

// device_id is UTF-8 and need not be NUL-terminated
ZKEB_API ZkebErrorCode zkeb_derive_device_master_key(
    const uint8_t* umk,
    size_t umk_length,
    const char* device_id,
    size_t device_id_length,
    uint8_t* out_dmk,
    size_t out_dmk_length,
    ZkebError* out_error);

ZKEB_API ZkebErrorCode zkeb_derive_device_keys(
    const uint8_t* dmk,
    size_t dmk_length,
    uint8_t* out_bek,
    size_t out_bek_length,
    uint8_t* out_mek,
    size_t out_mek_length,
    ZkebError* out_error);

ZKEB_API ZkebErrorCode zkeb_derive_keys_from_umk(
    const uint8_t* umk,
    size_t umk_length,
    const char* device_id,
    size_t device_id_length,
    uint8_t* out_dmk,
    size_t out_dmk_length,
    uint8_t* out_bek,
    size_t out_bek_length,
    uint8_t* out_mek,
    size_t out_mek_length,
    ZkebError* out_error);

ZKEB_API ZkebErrorCode zkeb_generate_key(
    uint8_t* out_key,
    size_t out_key_length,
    ZkebError* out_error);

ZKEB_API ZkebErrorCode zkeb_generate_nonce(
    uint8_t* out_nonce,
    size_t out_nonce_length,
    ZkebError* out_error);

// A fresh nonce is drawn for every call. associated_data is only used when
// has_associated_data is true.
ZKEB_API ZkebErrorCode zkeb_encrypt(
    const uint8_t* plaintext,
    size_t plaintext_length,
    const uint8_t* key,
    size_t key_length,
    const uint8_t* associated_data,
    size_t associated_data_length,
    bool has_associated_data,
    ZkebEnvelope* out_envelope,
    ZkebError* out_error);

ZKEB_API ZkebErrorCode zkeb_decrypt(
    const ZkebEnvelope* envelope,
    const uint8_t* key,
    size_t key_length,
    ZkebBuffer* out_plaintext,
    ZkebError* out_error);

// Wipes and releases data owned by the buffer; the struct itself stays with the caller
ZKEB_API void zkeb_buffer_free(ZkebBuffer* buffer);

ZKEB_API void zkeb_envelope_free(ZkebEnvelope* envelope);

ZKEB_API void zkeb_error_free(ZkebError* error);

ZKEB_API const char* zkeb_error_string(ZkebErrorCode code);

#ifdef __cplusplus
}
#endif
