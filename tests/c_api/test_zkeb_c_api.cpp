#include <catch2/catch_test_macros.hpp>
#include "zkeb/c_api/zkeb_api.h"
#include <cstring>
#include <string>
#include <vector>

namespace {
    const std::vector<uint8_t> kUmk(ZKEB_KEY_SIZE, 0x01);
    const std::string kDeviceId = "test-device-id";
}

TEST_CASE("C API - Initialization", "[c_api][boundary][init]") {
    SECTION("Initialize succeeds") {
        REQUIRE(zkeb_init() == ZKEB_SUCCESS);
        zkeb_shutdown();
    }
    SECTION("Version string is valid") {
        const char* version = zkeb_version();
        REQUIRE(version != nullptr);
        REQUIRE(std::strcmp(version, "1.0.0") == 0);
    }
    SECTION("Multiple initialize calls are safe") {
        REQUIRE(zkeb_init() == ZKEB_SUCCESS);
        REQUIRE(zkeb_init() == ZKEB_SUCCESS);
    }
    SECTION("Every code has a description") {
        REQUIRE(std::strcmp(zkeb_error_string(ZKEB_SUCCESS), "Success") == 0);
        REQUIRE(std::strcmp(zkeb_error_string(ZKEB_ERROR_AUTHENTICATION), "Authentication failed") == 0);
        REQUIRE(std::strcmp(zkeb_error_string(static_cast<ZkebErrorCode>(999)), "Unknown error") == 0);
    }
}

TEST_CASE("C API - HKDF", "[c_api][hkdf]") {
    const std::vector<uint8_t> ikm(22, 0x0b);
    std::vector<uint8_t> salt;
    for (uint8_t b = 0x00; b <= 0x0c; ++b) salt.push_back(b);
    std::vector<uint8_t> info;
    for (uint8_t b = 0xf0; b <= 0xf9; ++b) info.push_back(b);

    SECTION("RFC 5869 A.1 prefix") {
        uint8_t okm[42];
        ZkebError error{};
        REQUIRE(zkeb_hkdf(salt.data(), salt.size(), ikm.data(), ikm.size(),
                          info.data(), info.size(), okm, sizeof(okm), &error) == ZKEB_SUCCESS);
        REQUIRE(okm[0] == 0x3c);
        REQUIRE(okm[1] == 0xb2);
        REQUIRE(okm[41] == 0x65);
    }
    SECTION("Zero-length output is rejected") {
        ZkebError error{};
        REQUIRE(zkeb_hkdf(salt.data(), salt.size(), ikm.data(), ikm.size(),
                          info.data(), info.size(), nullptr, 0, &error) == ZKEB_ERROR_INVALID_LENGTH);
        REQUIRE(error.code == ZKEB_ERROR_INVALID_LENGTH);
        REQUIRE(error.message != nullptr);
        zkeb_error_free(&error);
        REQUIRE(error.message == nullptr);
    }
    SECTION("Output above 8160 bytes is rejected") {
        std::vector<uint8_t> out(ZKEB_HKDF_MAX_OUTPUT + 1);
        ZkebError error{};
        REQUIRE(zkeb_hkdf(salt.data(), salt.size(), ikm.data(), ikm.size(),
                          info.data(), info.size(), out.data(), out.size(), &error) == ZKEB_ERROR_INVALID_LENGTH);
        zkeb_error_free(&error);
    }
    SECTION("Null salt with non-zero length") {
        uint8_t okm[32];
        ZkebError error{};
        REQUIRE(zkeb_hkdf(nullptr, 4, ikm.data(), ikm.size(),
                          info.data(), info.size(), okm, sizeof(okm), &error) == ZKEB_ERROR_NULL_POINTER);
        zkeb_error_free(&error);
    }
    SECTION("Null error pointer is tolerated") {
        uint8_t okm[32];
        REQUIRE(zkeb_hkdf(nullptr, 0, nullptr, 0, nullptr, 0, okm, sizeof(okm), nullptr) == ZKEB_SUCCESS);
    }
}

TEST_CASE("C API - Key hierarchy", "[c_api][hierarchy]") {
    REQUIRE(zkeb_init() == ZKEB_SUCCESS);

    SECTION("Generated UMK is random") {
        uint8_t a[ZKEB_KEY_SIZE];
        uint8_t b[ZKEB_KEY_SIZE];
        REQUIRE(zkeb_generate_user_master_key(a, sizeof(a), nullptr) == ZKEB_SUCCESS);
        REQUIRE(zkeb_generate_user_master_key(b, sizeof(b), nullptr) == ZKEB_SUCCESS);
        REQUIRE(std::memcmp(a, b, ZKEB_KEY_SIZE) != 0);
    }
    SECTION("Step-by-step derivation matches the full chain") {
        uint8_t dmk[ZKEB_KEY_SIZE];
        uint8_t bek[ZKEB_KEY_SIZE];
        uint8_t mek[ZKEB_KEY_SIZE];
        REQUIRE(zkeb_derive_device_master_key(kUmk.data(), kUmk.size(), kDeviceId.data(), kDeviceId.size(),
                                              dmk, sizeof(dmk), nullptr) == ZKEB_SUCCESS);
        REQUIRE(zkeb_derive_device_keys(dmk, sizeof(dmk), bek, sizeof(bek), mek, sizeof(mek), nullptr)
                == ZKEB_SUCCESS);

        uint8_t dmk2[ZKEB_KEY_SIZE];
        uint8_t bek2[ZKEB_KEY_SIZE];
        uint8_t mek2[ZKEB_KEY_SIZE];
        REQUIRE(zkeb_derive_keys_from_umk(kUmk.data(), kUmk.size(), kDeviceId.data(), kDeviceId.size(),
                                          dmk2, sizeof(dmk2), bek2, sizeof(bek2), mek2, sizeof(mek2),
                                          nullptr) == ZKEB_SUCCESS);
        REQUIRE(std::memcmp(dmk, dmk2, ZKEB_KEY_SIZE) == 0);
        REQUIRE(std::memcmp(bek, bek2, ZKEB_KEY_SIZE) == 0);
        REQUIRE(std::memcmp(mek, mek2, ZKEB_KEY_SIZE) == 0);
        REQUIRE(std::memcmp(bek, mek, ZKEB_KEY_SIZE) != 0);
    }
    SECTION("Short UMK") {
        uint8_t dmk[ZKEB_KEY_SIZE];
        ZkebError error{};
        REQUIRE(zkeb_derive_device_master_key(kUmk.data(), 31, kDeviceId.data(), kDeviceId.size(),
                                              dmk, sizeof(dmk), &error) == ZKEB_ERROR_INVALID_UMK);
        REQUIRE(std::string(error.message) == "Invalid UMK: expected 32 bytes, got 31 bytes");
        zkeb_error_free(&error);
    }
    SECTION("Blank device id") {
        uint8_t dmk[ZKEB_KEY_SIZE];
        ZkebError error{};
        REQUIRE(zkeb_derive_device_master_key(kUmk.data(), kUmk.size(), "  ", 2,
                                              dmk, sizeof(dmk), &error) == ZKEB_ERROR_INVALID_DEVICE_ID);
        zkeb_error_free(&error);
    }
    SECTION("Ideographic space device id") {
        uint8_t dmk[ZKEB_KEY_SIZE];
        REQUIRE(zkeb_derive_device_master_key(kUmk.data(), kUmk.size(), "\xE3\x80\x80", 3,
                                              dmk, sizeof(dmk), nullptr) == ZKEB_ERROR_INVALID_DEVICE_ID);
    }
    SECTION("Empty device id with null pointer") {
        uint8_t dmk[ZKEB_KEY_SIZE];
        REQUIRE(zkeb_derive_device_master_key(kUmk.data(), kUmk.size(), nullptr, 0,
                                              dmk, sizeof(dmk), nullptr) == ZKEB_ERROR_INVALID_DEVICE_ID);
    }
    SECTION("Wrong DMK size") {
        uint8_t bek[ZKEB_KEY_SIZE];
        uint8_t mek[ZKEB_KEY_SIZE];
        REQUIRE(zkeb_derive_device_keys(kUmk.data(), 16, bek, sizeof(bek), mek, sizeof(mek), nullptr)
                == ZKEB_ERROR_INVALID_DMK);
    }
    SECTION("Output buffer too small") {
        uint8_t dmk[16];
        ZkebError error{};
        REQUIRE(zkeb_derive_device_master_key(kUmk.data(), kUmk.size(), kDeviceId.data(), kDeviceId.size(),
                                              dmk, sizeof(dmk), &error) == ZKEB_ERROR_BUFFER_TOO_SMALL);
        zkeb_error_free(&error);
    }
    SECTION("Null output buffer") {
        REQUIRE(zkeb_generate_user_master_key(nullptr, ZKEB_KEY_SIZE, nullptr) == ZKEB_ERROR_NULL_POINTER);
    }
    SECTION("Null UMK with non-zero length") {
        uint8_t dmk[ZKEB_KEY_SIZE];
        REQUIRE(zkeb_derive_device_master_key(nullptr, 32, kDeviceId.data(), kDeviceId.size(),
                                              dmk, sizeof(dmk), nullptr) == ZKEB_ERROR_NULL_POINTER);
    }
}

TEST_CASE("C API - Envelope", "[c_api][envelope]") {
    REQUIRE(zkeb_init() == ZKEB_SUCCESS);
    uint8_t key[ZKEB_KEY_SIZE];
    REQUIRE(zkeb_generate_key(key, sizeof(key), nullptr) == ZKEB_SUCCESS);
    const std::string message = "backup manifest";
    const std::string aad = "manifest-v1";

    SECTION("Round trip with associated data") {
        ZkebEnvelope envelope{};
        REQUIRE(zkeb_encrypt(reinterpret_cast<const uint8_t*>(message.data()), message.size(),
                             key, sizeof(key),
                             reinterpret_cast<const uint8_t*>(aad.data()), aad.size(), true,
                             &envelope, nullptr) == ZKEB_SUCCESS);
        REQUIRE(envelope.ciphertext.length == message.size());
        REQUIRE(envelope.nonce.length == ZKEB_NONCE_SIZE);
        REQUIRE(envelope.tag.length == ZKEB_TAG_SIZE);
        REQUIRE(envelope.has_associated_data);
        REQUIRE(envelope.associated_data.length == aad.size());

        ZkebBuffer plaintext{};
        REQUIRE(zkeb_decrypt(&envelope, key, sizeof(key), &plaintext, nullptr) == ZKEB_SUCCESS);
        REQUIRE(std::string(reinterpret_cast<char*>(plaintext.data), plaintext.length) == message);

        zkeb_buffer_free(&plaintext);
        REQUIRE(plaintext.data == nullptr);
        zkeb_envelope_free(&envelope);
        REQUIRE(envelope.ciphertext.data == nullptr);
        REQUIRE_FALSE(envelope.has_associated_data);
    }
    SECTION("Empty plaintext") {
        ZkebEnvelope envelope{};
        REQUIRE(zkeb_encrypt(nullptr, 0, key, sizeof(key), nullptr, 0, false, &envelope, nullptr)
                == ZKEB_SUCCESS);
        ZkebBuffer plaintext{};
        REQUIRE(zkeb_decrypt(&envelope, key, sizeof(key), &plaintext, nullptr) == ZKEB_SUCCESS);
        REQUIRE(plaintext.length == 0);
        zkeb_buffer_free(&plaintext);
        zkeb_envelope_free(&envelope);
    }
    SECTION("Tampered tag is reported as authentication failure") {
        ZkebEnvelope envelope{};
        REQUIRE(zkeb_encrypt(reinterpret_cast<const uint8_t*>(message.data()), message.size(),
                             key, sizeof(key), nullptr, 0, false, &envelope, nullptr) == ZKEB_SUCCESS);
        envelope.tag.data[0] ^= 0x01;
        ZkebBuffer plaintext{};
        ZkebError error{};
        REQUIRE(zkeb_decrypt(&envelope, key, sizeof(key), &plaintext, &error) == ZKEB_ERROR_AUTHENTICATION);
        REQUIRE(plaintext.data == nullptr);
        zkeb_error_free(&error);
        zkeb_envelope_free(&envelope);
    }
    SECTION("Dropping associated data fails authentication") {
        ZkebEnvelope envelope{};
        REQUIRE(zkeb_encrypt(reinterpret_cast<const uint8_t*>(message.data()), message.size(),
                             key, sizeof(key),
                             reinterpret_cast<const uint8_t*>(aad.data()), aad.size(), true,
                             &envelope, nullptr) == ZKEB_SUCCESS);
        ZkebEnvelope stripped = envelope;
        stripped.has_associated_data = false;
        stripped.associated_data = ZkebBuffer{nullptr, 0};
        ZkebBuffer plaintext{};
        REQUIRE(zkeb_decrypt(&stripped, key, sizeof(key), &plaintext, nullptr) == ZKEB_ERROR_AUTHENTICATION);
        zkeb_envelope_free(&envelope);
    }
    SECTION("Wrong key length") {
        ZkebEnvelope envelope{};
        ZkebError error{};
        REQUIRE(zkeb_encrypt(reinterpret_cast<const uint8_t*>(message.data()), message.size(),
                             key, 16, nullptr, 0, false, &envelope, &error) == ZKEB_ERROR_INVALID_KEY_LENGTH);
        REQUIRE(envelope.ciphertext.data == nullptr);
        zkeb_error_free(&error);
    }
    SECTION("Wrong nonce length") {
        ZkebEnvelope envelope{};
        REQUIRE(zkeb_encrypt(reinterpret_cast<const uint8_t*>(message.data()), message.size(),
                             key, sizeof(key), nullptr, 0, false, &envelope, nullptr) == ZKEB_SUCCESS);
        ZkebEnvelope truncated = envelope;
        truncated.nonce.length = 8;
        ZkebBuffer plaintext{};
        REQUIRE(zkeb_decrypt(&truncated, key, sizeof(key), &plaintext, nullptr) == ZKEB_ERROR_INVALID_NONCE_LENGTH);
        zkeb_envelope_free(&envelope);
    }
    SECTION("Null envelope") {
        ZkebBuffer plaintext{};
        REQUIRE(zkeb_decrypt(nullptr, key, sizeof(key), &plaintext, nullptr) == ZKEB_ERROR_NULL_POINTER);
        REQUIRE(zkeb_encrypt(nullptr, 0, key, sizeof(key), nullptr, 0, false, nullptr, nullptr)
                == ZKEB_ERROR_NULL_POINTER);
    }
    SECTION("Nonce generation") {
        uint8_t a[ZKEB_NONCE_SIZE];
        uint8_t b[ZKEB_NONCE_SIZE];
        REQUIRE(zkeb_generate_nonce(a, sizeof(a), nullptr) == ZKEB_SUCCESS);
        REQUIRE(zkeb_generate_nonce(b, sizeof(b), nullptr) == ZKEB_SUCCESS);
        REQUIRE(std::memcmp(a, b, ZKEB_NONCE_SIZE) != 0);
        uint8_t small[8];
        REQUIRE(zkeb_generate_nonce(small, sizeof(small), nullptr) == ZKEB_ERROR_BUFFER_TOO_SMALL);
    }
    SECTION("Freeing empty structures is safe") {
        zkeb_buffer_free(nullptr);
        zkeb_envelope_free(nullptr);
        zkeb_error_free(nullptr);
        ZkebBuffer empty{};
        zkeb_buffer_free(&empty);
    }
}
