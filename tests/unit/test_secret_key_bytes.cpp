#include <catch2/catch_test_macros.hpp>
#include "zkeb/models/keys/secret_key_bytes.hpp"
#include "zkeb/crypto/sodium_interop.hpp"
#include <vector>
using namespace zkeb;
using namespace zkeb::models;
using zkeb::crypto::SodiumInterop;
TEST_CASE("SecretKeyBytes - Ownership", "[models][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move leaves the source empty") {
        SecretKeyBytes a(std::vector<uint8_t>(32, 0xAB));
        SecretKeyBytes b(std::move(a));
        REQUIRE(a.Size() == 0);
        REQUIRE(b.Size() == 32);
        REQUIRE(b.Bytes()[0] == 0xAB);
    }
    SECTION("Move assignment replaces contents") {
        SecretKeyBytes a(std::vector<uint8_t>(32, 0x01));
        SecretKeyBytes b(std::vector<uint8_t>(16, 0x02));
        b = std::move(a);
        REQUIRE(b.Size() == 32);
        REQUIRE(b.Bytes()[31] == 0x01);
    }
}
TEST_CASE("SecretKeyBytes - Comparison and secure storage", "[models][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SecretKeyBytes key(std::vector<uint8_t>(32, 0x5C));
    SECTION("Constant-time equality") {
        SecretKeyBytes same(std::vector<uint8_t>(32, 0x5C));
        SecretKeyBytes other(std::vector<uint8_t>(32, 0x5D));
        REQUIRE(key.ConstantTimeEquals(same).Unwrap());
        REQUIRE_FALSE(key.ConstantTimeEquals(other).Unwrap());
    }
    SECTION("Secure handle holds the same bytes") {
        auto handle = key.ToSecureHandle();
        REQUIRE(handle.IsOk());
        auto bytes = handle.Unwrap().ReadBytes(32).Unwrap();
        REQUIRE(bytes == std::vector<uint8_t>(32, 0x5C));
    }
}
