#include "zkeb/c_api/zkeb_api.h"
#include "zkeb_internal.hpp"
#include "zkeb/crypto/hkdf.hpp"
#include "zkeb/crypto/sodium_interop.hpp"
#include "zkeb/hierarchy/key_hierarchy.hpp"
#include "zkeb/envelope/envelope_cipher.hpp"
#include "zkeb/core/constants.hpp"
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <mutex>
#include <new>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

using zkeb::ZkebFailure;
using zkeb::ZkebFailureType;
using zkeb::Constants;
using zkeb::crypto::Hkdf;
using zkeb::crypto::SodiumInterop;
using zkeb::hierarchy::KeyHierarchy;
using zkeb::envelope::EnvelopeCipher;
using zkeb::models::EncryptionEnvelope;

// ============================================================================
// Internal Helper Implementations
// ============================================================================

namespace zkeb::c_api::internal {

ZkebErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto result = SodiumInterop::Initialize();
        init_success.store(result.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? ZKEB_SUCCESS
               : ZKEB_ERROR_RANDOM_UNAVAILABLE;
}

void fill_error(ZkebError* out_error, const ZkebErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
#ifdef _WIN32
        out_error->message = _strdup(message.c_str());
#else
        out_error->message = strdup(message.c_str());
#endif
    }
}

ZkebErrorCode fill_error_from_failure(ZkebError* out_error, const ZkebFailure& failure) {
    ZkebErrorCode code = ZKEB_ERROR_GENERIC;

    switch (failure.type) {
        case ZkebFailureType::InvalidInput:
            code = ZKEB_ERROR_INVALID_INPUT;
            break;
        case ZkebFailureType::InvalidLength:
            code = ZKEB_ERROR_INVALID_LENGTH;
            break;
        case ZkebFailureType::InvalidUserMasterKey:
            code = ZKEB_ERROR_INVALID_UMK;
            break;
        case ZkebFailureType::InvalidDeviceId:
            code = ZKEB_ERROR_INVALID_DEVICE_ID;
            break;
        case ZkebFailureType::InvalidDeviceMasterKey:
            code = ZKEB_ERROR_INVALID_DMK;
            break;
        case ZkebFailureType::InvalidKeyLength:
            code = ZKEB_ERROR_INVALID_KEY_LENGTH;
            break;
        case ZkebFailureType::InvalidNonceLength:
            code = ZKEB_ERROR_INVALID_NONCE_LENGTH;
            break;
        case ZkebFailureType::Authentication:
            code = ZKEB_ERROR_AUTHENTICATION;
            break;
        case ZkebFailureType::Decode:
            code = ZKEB_ERROR_DECODE;
            break;
        case ZkebFailureType::RandomSourceUnavailable:
            code = ZKEB_ERROR_RANDOM_UNAVAILABLE;
            break;
        default:
            code = ZKEB_ERROR_GENERIC;
            break;
    }

    fill_error(out_error, code, failure.message);
    return code;
}

bool validate_buffer_param(const void* data, const size_t length, ZkebError* out_error) {
    if (!data && length > 0) {
        fill_error(out_error, ZKEB_ERROR_NULL_POINTER, "Buffer data is null but length is non-zero");
        return false;
    }
    return true;
}

ZkebErrorCode validate_key_output(const uint8_t* out, const size_t length, const size_t required, ZkebError* out_error) {
    if (!out) {
        fill_error(out_error, ZKEB_ERROR_NULL_POINTER, "Output key buffer is null");
        return ZKEB_ERROR_NULL_POINTER;
    }
    if (length < required) {
        fill_error(out_error, ZKEB_ERROR_BUFFER_TOO_SMALL,
                   "Output buffer too small: need " + std::to_string(required) + " bytes");
        return ZKEB_ERROR_BUFFER_TOO_SMALL;
    }
    return ZKEB_SUCCESS;
}

bool copy_to_buffer(const std::span<const uint8_t> input, ZkebBuffer* out_buffer, ZkebError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, ZKEB_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }

    // Length-zero outputs still get a distinct allocation so data is never null on success
    auto* data = new(std::nothrow) uint8_t[input.empty() ? 1 : input.size()];
    if (!data) {
        fill_error(out_error, ZKEB_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    if (!input.empty()) {
        std::memcpy(data, input.data(), input.size());
    }
    out_buffer->data = data;
    out_buffer->length = input.size();
    return true;
}

void release_buffer(ZkebBuffer* buffer) {
    if (buffer && buffer->data) {
        sodium_memzero(buffer->data, buffer->length);
        delete[] buffer->data;
        buffer->data = nullptr;
        buffer->length = 0;
    }
}

} // namespace zkeb::c_api::internal

using namespace zkeb::c_api::internal;

namespace {

std::span<const uint8_t> as_span(const uint8_t* data, const size_t length) {
    return data ? std::span<const uint8_t>(data, length) : std::span<const uint8_t>();
}

std::string_view as_string_view(const char* data, const size_t length) {
    return data ? std::string_view(data, length) : std::string_view();
}

void copy_key(std::span<const uint8_t> key, uint8_t* out) {
    std::memcpy(out, key.data(), key.size());
}

} // namespace

extern "C" {

// ----------------------------------------------------------------------------
// Version & Initialization
// ----------------------------------------------------------------------------

const char* zkeb_version(void) {
    return "1.0.0";
}

ZkebErrorCode zkeb_init(void) {
    return EnsureInitialized();
}

void zkeb_shutdown(void) {
}

// ----------------------------------------------------------------------------
// Key Derivation
// ----------------------------------------------------------------------------

ZkebErrorCode zkeb_hkdf(
    const uint8_t* salt,
    const size_t salt_length,
    const uint8_t* ikm,
    const size_t ikm_length,
    const uint8_t* info,
    const size_t info_length,
    uint8_t* out_key,
    const size_t out_key_length,
    ZkebError* out_error) {
    if (!validate_buffer_param(salt, salt_length, out_error) ||
        !validate_buffer_param(ikm, ikm_length, out_error) ||
        !validate_buffer_param(info, info_length, out_error) ||
        !validate_buffer_param(out_key, out_key_length, out_error)) {
        return ZKEB_ERROR_NULL_POINTER;
    }

    std::span<uint8_t> output = out_key ? std::span<uint8_t>(out_key, out_key_length) : std::span<uint8_t>();
    auto result = Hkdf::DeriveKey(
        as_span(salt, salt_length), as_span(ikm, ikm_length), as_span(info, info_length), output);
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    return ZKEB_SUCCESS;
}

ZkebErrorCode zkeb_generate_user_master_key(
    uint8_t* out_umk,
    const size_t out_umk_length,
    ZkebError* out_error) {
    if (const auto err = EnsureInitialized(); err != ZKEB_SUCCESS) {
        fill_error(out_error, err, std::string(zkeb::ErrorMessages::RANDOM_SOURCE_UNAVAILABLE));
        return err;
    }
    if (const auto err = validate_key_output(out_umk, out_umk_length, Constants::MASTER_KEY_SIZE, out_error); err != ZKEB_SUCCESS) {
        return err;
    }

    auto result = KeyHierarchy::GenerateUserMasterKey();
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    copy_key(result.Unwrap().Bytes(), out_umk);
    return ZKEB_SUCCESS;
}

ZkebErrorCode zkeb_derive_device_master_key(
    const uint8_t* umk,
    const size_t umk_length,
    const char* device_id,
    const size_t device_id_length,
    uint8_t* out_dmk,
    const size_t out_dmk_length,
    ZkebError* out_error) {
    if (!validate_buffer_param(umk, umk_length, out_error) ||
        !validate_buffer_param(device_id, device_id_length, out_error)) {
        return ZKEB_ERROR_NULL_POINTER;
    }
    if (const auto err = validate_key_output(out_dmk, out_dmk_length, Constants::MASTER_KEY_SIZE, out_error); err != ZKEB_SUCCESS) {
        return err;
    }

    auto result = KeyHierarchy::DeriveDeviceMasterKey(
        as_span(umk, umk_length), as_string_view(device_id, device_id_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    copy_key(result.Unwrap().Bytes(), out_dmk);
    return ZKEB_SUCCESS;
}

ZkebErrorCode zkeb_derive_device_keys(
    const uint8_t* dmk,
    const size_t dmk_length,
    uint8_t* out_bek,
    const size_t out_bek_length,
    uint8_t* out_mek,
    const size_t out_mek_length,
    ZkebError* out_error) {
    if (!validate_buffer_param(dmk, dmk_length, out_error)) {
        return ZKEB_ERROR_NULL_POINTER;
    }
    for (const auto& [out, length] : {std::pair{out_bek, out_bek_length}, std::pair{out_mek, out_mek_length}}) {
        if (const auto err = validate_key_output(out, length, Constants::MASTER_KEY_SIZE, out_error); err != ZKEB_SUCCESS) {
            return err;
        }
    }

    auto result = KeyHierarchy::DeriveDeviceKeys(as_span(dmk, dmk_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    const auto& keys = result.Unwrap();
    copy_key(keys.BackupEncryptionKey(), out_bek);
    copy_key(keys.MetadataEncryptionKey(), out_mek);
    return ZKEB_SUCCESS;
}

ZkebErrorCode zkeb_derive_keys_from_umk(
    const uint8_t* umk,
    const size_t umk_length,
    const char* device_id,
    const size_t device_id_length,
    uint8_t* out_dmk,
    const size_t out_dmk_length,
    uint8_t* out_bek,
    const size_t out_bek_length,
    uint8_t* out_mek,
    const size_t out_mek_length,
    ZkebError* out_error) {
    if (!validate_buffer_param(umk, umk_length, out_error) ||
        !validate_buffer_param(device_id, device_id_length, out_error)) {
        return ZKEB_ERROR_NULL_POINTER;
    }
    for (const auto& [out, length] : {std::pair{out_dmk, out_dmk_length},
                                      std::pair{out_bek, out_bek_length},
                                      std::pair{out_mek, out_mek_length}}) {
        if (const auto err = validate_key_output(out, length, Constants::MASTER_KEY_SIZE, out_error); err != ZKEB_SUCCESS) {
            return err;
        }
    }

    auto result = KeyHierarchy::DeriveKeysFromUserMasterKey(
        as_span(umk, umk_length), as_string_view(device_id, device_id_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    const auto& derived = result.Unwrap();
    copy_key(derived.dmk.Bytes(), out_dmk);
    copy_key(derived.keys.BackupEncryptionKey(), out_bek);
    copy_key(derived.keys.MetadataEncryptionKey(), out_mek);
    return ZKEB_SUCCESS;
}

// ----------------------------------------------------------------------------
// Envelope Encryption
// ----------------------------------------------------------------------------

ZkebErrorCode zkeb_generate_key(
    uint8_t* out_key,
    const size_t out_key_length,
    ZkebError* out_error) {
    if (const auto err = validate_key_output(out_key, out_key_length, Constants::AES_KEY_SIZE, out_error); err != ZKEB_SUCCESS) {
        return err;
    }
    auto result = EnvelopeCipher::GenerateKey();
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    auto& key = result.Unwrap();
    copy_key(key, out_key);
    sodium_memzero(key.data(), key.size());
    return ZKEB_SUCCESS;
}

ZkebErrorCode zkeb_generate_nonce(
    uint8_t* out_nonce,
    const size_t out_nonce_length,
    ZkebError* out_error) {
    if (const auto err = validate_key_output(out_nonce, out_nonce_length, Constants::AES_GCM_NONCE_SIZE, out_error); err != ZKEB_SUCCESS) {
        return err;
    }
    auto result = EnvelopeCipher::GenerateNonce();
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    copy_key(result.Unwrap(), out_nonce);
    return ZKEB_SUCCESS;
}

ZkebErrorCode zkeb_encrypt(
    const uint8_t* plaintext,
    const size_t plaintext_length,
    const uint8_t* key,
    const size_t key_length,
    const uint8_t* associated_data,
    const size_t associated_data_length,
    const bool has_associated_data,
    ZkebEnvelope* out_envelope,
    ZkebError* out_error) {
    if (!out_envelope) {
        fill_error(out_error, ZKEB_ERROR_NULL_POINTER, "Output envelope is null");
        return ZKEB_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(plaintext, plaintext_length, out_error) ||
        !validate_buffer_param(key, key_length, out_error) ||
        !validate_buffer_param(associated_data, associated_data_length, out_error)) {
        return ZKEB_ERROR_NULL_POINTER;
    }

    std::optional<std::span<const uint8_t>> aad;
    if (has_associated_data) {
        aad = as_span(associated_data, associated_data_length);
    }
    auto result = EnvelopeCipher::Encrypt(as_span(plaintext, plaintext_length), as_span(key, key_length), aad);
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    const auto& envelope = result.Unwrap();

    ZkebEnvelope produced{};
    if (!copy_to_buffer(envelope.ciphertext, &produced.ciphertext, out_error) ||
        !copy_to_buffer(envelope.nonce, &produced.nonce, out_error) ||
        !copy_to_buffer(envelope.tag, &produced.tag, out_error)) {
        zkeb_envelope_free(&produced);
        return ZKEB_ERROR_OUT_OF_MEMORY;
    }
    if (envelope.associated_data.has_value()) {
        if (!copy_to_buffer(*envelope.associated_data, &produced.associated_data, out_error)) {
            zkeb_envelope_free(&produced);
            return ZKEB_ERROR_OUT_OF_MEMORY;
        }
        produced.has_associated_data = true;
    }
    *out_envelope = produced;
    return ZKEB_SUCCESS;
}

ZkebErrorCode zkeb_decrypt(
    const ZkebEnvelope* envelope,
    const uint8_t* key,
    const size_t key_length,
    ZkebBuffer* out_plaintext,
    ZkebError* out_error) {
    if (!envelope || !out_plaintext) {
        fill_error(out_error, ZKEB_ERROR_NULL_POINTER, "Envelope or output buffer is null");
        return ZKEB_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(envelope->ciphertext.data, envelope->ciphertext.length, out_error) ||
        !validate_buffer_param(envelope->nonce.data, envelope->nonce.length, out_error) ||
        !validate_buffer_param(envelope->tag.data, envelope->tag.length, out_error) ||
        !validate_buffer_param(envelope->associated_data.data, envelope->associated_data.length, out_error) ||
        !validate_buffer_param(key, key_length, out_error)) {
        return ZKEB_ERROR_NULL_POINTER;
    }

    const auto ciphertext = as_span(envelope->ciphertext.data, envelope->ciphertext.length);
    const auto nonce = as_span(envelope->nonce.data, envelope->nonce.length);
    const auto tag = as_span(envelope->tag.data, envelope->tag.length);

    EncryptionEnvelope native;
    native.ciphertext.assign(ciphertext.begin(), ciphertext.end());
    native.nonce.assign(nonce.begin(), nonce.end());
    native.tag.assign(tag.begin(), tag.end());
    if (envelope->has_associated_data) {
        const auto aad = as_span(envelope->associated_data.data, envelope->associated_data.length);
        native.associated_data.emplace(aad.begin(), aad.end());
    }

    auto result = EnvelopeCipher::Decrypt(native, as_span(key, key_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    auto& plaintext = result.Unwrap();
    const bool copied = copy_to_buffer(plaintext, out_plaintext, out_error);
    sodium_memzero(plaintext.data(), plaintext.size());
    return copied ? ZKEB_SUCCESS : ZKEB_ERROR_OUT_OF_MEMORY;
}

// ----------------------------------------------------------------------------
// Memory Management
// ----------------------------------------------------------------------------

void zkeb_buffer_free(ZkebBuffer* buffer) {
    release_buffer(buffer);
}

void zkeb_envelope_free(ZkebEnvelope* envelope) {
    if (envelope) {
        release_buffer(&envelope->ciphertext);
        release_buffer(&envelope->nonce);
        release_buffer(&envelope->tag);
        release_buffer(&envelope->associated_data);
        envelope->has_associated_data = false;
    }
}

void zkeb_error_free(ZkebError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

const char* zkeb_error_string(const ZkebErrorCode code) {
    switch (code) {
        case ZKEB_SUCCESS: return "Success";
        case ZKEB_ERROR_GENERIC: return "Generic error";
        case ZKEB_ERROR_INVALID_INPUT: return "Invalid input";
        case ZKEB_ERROR_INVALID_LENGTH: return "Invalid output length";
        case ZKEB_ERROR_INVALID_UMK: return "Invalid user master key";
        case ZKEB_ERROR_INVALID_DEVICE_ID: return "Invalid device ID";
        case ZKEB_ERROR_INVALID_DMK: return "Invalid device master key";
        case ZKEB_ERROR_INVALID_KEY_LENGTH: return "Invalid key length";
        case ZKEB_ERROR_INVALID_NONCE_LENGTH: return "Invalid nonce length";
        case ZKEB_ERROR_AUTHENTICATION: return "Authentication failed";
        case ZKEB_ERROR_DECODE: return "Decoding failed";
        case ZKEB_ERROR_RANDOM_UNAVAILABLE: return "Secure random source unavailable";
        case ZKEB_ERROR_NULL_POINTER: return "Null pointer";
        case ZKEB_ERROR_BUFFER_TOO_SMALL: return "Buffer too small";
        case ZKEB_ERROR_OUT_OF_MEMORY: return "Out of memory";
        default: return "Unknown error";
    }
}

} // extern "C"
