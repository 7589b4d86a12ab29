#include <catch2/catch_test_macros.hpp>
#include "zkeb/envelope/envelope_cipher.hpp"
#include "zkeb/hierarchy/key_hierarchy.hpp"
#include "zkeb/crypto/sodium_interop.hpp"
#include "helpers/hex.hpp"
#include <algorithm>
#include <vector>
using namespace zkeb;
using namespace zkeb::crypto;
using namespace zkeb::envelope;
using namespace zkeb::test;
using zkeb::models::EncryptionEnvelope;
namespace {
    void RequireAuthenticationFailure(const EncryptionEnvelope& envelope, std::span<const uint8_t> key) {
        auto result = EnvelopeCipher::Decrypt(envelope, key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().IsAuthentication());
    }
}
TEST_CASE("Envelope attacks - Single bit flips", "[attacks][envelope][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key = EnvelopeCipher::GenerateKey().Unwrap();
    const auto aad = Bytes("header:v1");
    const auto original = EnvelopeCipher::Encrypt(Bytes("attack at dawn, bring snacks"), key, aad).Unwrap();
    SECTION("Every ciphertext bit") {
        for (size_t bit = 0; bit < original.ciphertext.size() * 8; ++bit) {
            auto tampered = original;
            tampered.ciphertext[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
            RequireAuthenticationFailure(tampered, key);
        }
    }
    SECTION("Every tag bit") {
        for (size_t bit = 0; bit < original.tag.size() * 8; ++bit) {
            auto tampered = original;
            tampered.tag[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
            RequireAuthenticationFailure(tampered, key);
        }
    }
    SECTION("Every nonce bit") {
        for (size_t bit = 0; bit < original.nonce.size() * 8; ++bit) {
            auto tampered = original;
            tampered.nonce[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
            RequireAuthenticationFailure(tampered, key);
        }
    }
    SECTION("Every key bit") {
        for (size_t bit = 0; bit < key.size() * 8; bit += 7) {
            auto wrong_key = key;
            wrong_key[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
            RequireAuthenticationFailure(original, wrong_key);
        }
    }
    SECTION("Untouched envelope still opens") {
        REQUIRE(EnvelopeCipher::Decrypt(original, key).IsOk());
    }
}
TEST_CASE("Envelope attacks - Associated data", "[attacks][envelope][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key = EnvelopeCipher::GenerateKey().Unwrap();
    const auto plaintext = Bytes("payload");
    SECTION("Altered associated data") {
        auto envelope = EnvelopeCipher::Encrypt(plaintext, key, Bytes("owner=alice")).Unwrap();
        envelope.associated_data = Bytes("owner=mallory");
        RequireAuthenticationFailure(envelope, key);
    }
    SECTION("One bit of associated data flipped") {
        auto envelope = EnvelopeCipher::Encrypt(plaintext, key, Bytes("owner=alice")).Unwrap();
        (*envelope.associated_data)[0] ^= 0x01;
        RequireAuthenticationFailure(envelope, key);
    }
    SECTION("Associated data removed") {
        auto envelope = EnvelopeCipher::Encrypt(plaintext, key, Bytes("owner=alice")).Unwrap();
        envelope.associated_data.reset();
        RequireAuthenticationFailure(envelope, key);
    }
    SECTION("Associated data added") {
        auto envelope = EnvelopeCipher::Encrypt(plaintext, key).Unwrap();
        envelope.associated_data = Bytes("owner=mallory");
        RequireAuthenticationFailure(envelope, key);
    }
}
TEST_CASE("Envelope attacks - Structural tampering", "[attacks][envelope][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key = EnvelopeCipher::GenerateKey().Unwrap();
    const auto original = EnvelopeCipher::Encrypt(Bytes("sixteen byte msg and more"), key).Unwrap();
    SECTION("Truncated ciphertext") {
        auto tampered = original;
        tampered.ciphertext.pop_back();
        RequireAuthenticationFailure(tampered, key);
    }
    SECTION("Extended ciphertext") {
        auto tampered = original;
        tampered.ciphertext.push_back(0x00);
        RequireAuthenticationFailure(tampered, key);
    }
    SECTION("Ciphertext swapped between envelopes") {
        auto other = EnvelopeCipher::Encrypt(Bytes("sixteen byte msg and more"), key).Unwrap();
        auto tampered = original;
        tampered.ciphertext = other.ciphertext;
        RequireAuthenticationFailure(tampered, key);
    }
    SECTION("Zeroed tag") {
        auto tampered = original;
        std::fill(tampered.tag.begin(), tampered.tag.end(), 0x00);
        RequireAuthenticationFailure(tampered, key);
    }
}
TEST_CASE("Envelope attacks - Cross-purpose keys", "[attacks][envelope][hierarchy]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> umk(32, 0x33);
    auto phone = hierarchy::KeyHierarchy::DeriveKeysFromUserMasterKey(umk, "phone").Unwrap();
    auto laptop = hierarchy::KeyHierarchy::DeriveKeysFromUserMasterKey(umk, "laptop").Unwrap();
    auto envelope = EnvelopeCipher::Encrypt(Bytes("photo"), phone.keys.BackupEncryptionKey()).Unwrap();
    SECTION("MEK cannot open a BEK envelope") {
        RequireAuthenticationFailure(envelope, phone.keys.MetadataEncryptionKey());
    }
    SECTION("Another device's BEK cannot open it") {
        RequireAuthenticationFailure(envelope, laptop.keys.BackupEncryptionKey());
    }
    SECTION("The DMK cannot open it") {
        RequireAuthenticationFailure(envelope, phone.dmk.Bytes());
    }
}
