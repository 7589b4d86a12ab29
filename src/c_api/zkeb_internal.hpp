/**
 * @file zkeb_internal.hpp
 * @brief Shared helpers for the zkeb C API implementation
 *
 * This header is NOT part of the public API.
 */

#ifndef ZKEB_INTERNAL_HPP
#define ZKEB_INTERNAL_HPP

#include "zkeb/c_api/zkeb_api.h"
#include "zkeb/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace zkeb::c_api::internal {

/**
 * @brief Ensure libsodium is initialized
 * @return ZKEB_SUCCESS if initialized, ZKEB_ERROR_RANDOM_UNAVAILABLE otherwise
 */
ZkebErrorCode EnsureInitialized();

void fill_error(ZkebError* out_error, ZkebErrorCode code, const std::string& message);

/**
 * @brief Map a ZkebFailure to an error code and fill the error struct
 * @return The corresponding ZkebErrorCode
 */
ZkebErrorCode fill_error_from_failure(ZkebError* out_error, const ZkebFailure& failure);

/// Null data with non-zero length is rejected with ZKEB_ERROR_NULL_POINTER
bool validate_buffer_param(const void* data, size_t length, ZkebError* out_error);

/// Fixed-size key output: non-null and at least required bytes
ZkebErrorCode validate_key_output(const uint8_t* out, size_t length, size_t required, ZkebError* out_error);

/**
 * @brief Copy data to a library-owned output buffer
 * @return true on success, false on failure (fills out_error)
 */
bool copy_to_buffer(std::span<const uint8_t> input, ZkebBuffer* out_buffer, ZkebError* out_error);

void release_buffer(ZkebBuffer* buffer);

} // namespace zkeb::c_api::internal

#endif // ZKEB_INTERNAL_HPP
