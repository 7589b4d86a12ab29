#include <catch2/catch_test_macros.hpp>
#include "zkeb/hierarchy/key_hierarchy.hpp"
#include "zkeb/envelope/envelope_cipher.hpp"
#include "zkeb/crypto/sodium_interop.hpp"
#include "helpers/hex.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>
using namespace zkeb;
using namespace zkeb::crypto;
using namespace zkeb::hierarchy;
using namespace zkeb::envelope;
using namespace zkeb::test;

TEST_CASE("Concurrency - Parallel derivation is deterministic", "[concurrency][hierarchy]") {
    const std::vector<uint8_t> umk(32, 0x01);
    const std::string expected_bek =
        "0ab0b9c7b2d20408ff070bdffb1d1cfebe0def53d1483e40688290f1ed6edb7d";

    constexpr int THREAD_COUNT = 16;
    constexpr int DERIVATIONS_PER_THREAD = 200;
    std::atomic<int> mismatches{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < DERIVATIONS_PER_THREAD; ++i) {
                auto derived = KeyHierarchy::DeriveKeysFromUserMasterKey(umk, "test-device-id");
                if (derived.IsErr()) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                    continue;
                }
                if (ToHex(derived.Unwrap().keys.BackupEncryptionKey()) != expected_bek) {
                    mismatches.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(failures.load() == 0);
    REQUIRE(mismatches.load() == 0);
}

TEST_CASE("Concurrency - Distinct devices in parallel", "[concurrency][hierarchy]") {
    const std::vector<uint8_t> umk(32, 0x02);
    constexpr int DEVICE_COUNT = 64;
    std::vector<std::string> results(DEVICE_COUNT);

    std::vector<std::thread> threads;
    threads.reserve(DEVICE_COUNT);
    for (int d = 0; d < DEVICE_COUNT; ++d) {
        threads.emplace_back([&, d]() {
            auto dmk = KeyHierarchy::DeriveDeviceMasterKey(umk, "device-" + std::to_string(d));
            if (dmk.IsOk()) {
                results[static_cast<size_t>(d)] = ToHex(dmk.Unwrap().Bytes());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::string> unique(results.begin(), results.end());
    REQUIRE(unique.size() == DEVICE_COUNT);
    REQUIRE_FALSE(unique.contains(std::string()));
}

TEST_CASE("Concurrency - Nonce freshness", "[concurrency][envelope][nonce]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("10,000 sequential nonces are pairwise distinct") {
        std::unordered_set<std::string> nonces;
        for (int i = 0; i < 10'000; ++i) {
            nonces.insert(ToHex(EnvelopeCipher::GenerateNonce().Unwrap()));
        }
        REQUIRE(nonces.size() == 10'000);
    }

    SECTION("10,000 encryptions under one key use distinct nonces") {
        auto key = EnvelopeCipher::GenerateKey().Unwrap();
        const std::vector<uint8_t> plaintext = {0x00};

        constexpr int THREAD_COUNT = 10;
        constexpr int ENCRYPTIONS_PER_THREAD = 1000;
        std::unordered_set<std::string> nonces;
        std::mutex nonce_mutex;
        std::atomic<int> failures{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                std::vector<std::string> local;
                local.reserve(ENCRYPTIONS_PER_THREAD);
                for (int i = 0; i < ENCRYPTIONS_PER_THREAD; ++i) {
                    auto envelope = EnvelopeCipher::Encrypt(plaintext, key);
                    if (envelope.IsErr()) {
                        failures.fetch_add(1, std::memory_order_relaxed);
                        continue;
                    }
                    local.push_back(ToHex(envelope.Unwrap().nonce));
                }
                std::lock_guard lock(nonce_mutex);
                nonces.insert(local.begin(), local.end());
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE(failures.load() == 0);
        REQUIRE(nonces.size() == THREAD_COUNT * ENCRYPTIONS_PER_THREAD);
    }
}

TEST_CASE("Concurrency - Parallel seal and open", "[concurrency][envelope]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key = EnvelopeCipher::GenerateKey().Unwrap();
    constexpr int THREAD_COUNT = 8;
    constexpr int ROUNDS = 250;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < ROUNDS; ++i) {
                const std::string text = "thread " + std::to_string(t) + " round " + std::to_string(i);
                auto envelope = EnvelopeCipher::EncryptString(text, key);
                if (envelope.IsErr()) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                    continue;
                }
                auto opened = EnvelopeCipher::DecryptString(envelope.Unwrap(), key);
                if (opened.IsErr() || opened.Unwrap() != text) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(failures.load() == 0);
}
