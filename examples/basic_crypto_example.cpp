/**
 * @file basic_crypto_example.cpp
 * @brief Derives a device key hierarchy and seals a backup record with it
 */

#include "zkeb/crypto/sodium_interop.hpp"
#include "zkeb/hierarchy/key_hierarchy.hpp"
#include "zkeb/envelope/envelope_cipher.hpp"
#include "zkeb/core/result.hpp"

#include <iostream>
#include <iomanip>
#include <span>
#include <string>
#include <vector>

using namespace zkeb;
using namespace zkeb::crypto;
using namespace zkeb::hierarchy;
using namespace zkeb::envelope;

void print_hex(const std::string& label, std::span<const uint8_t> data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

int main() {
    std::cout << "=== ZKEB - Key Hierarchy and Envelope Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Generating User Master Key..." << std::endl;
    auto umk_result = KeyHierarchy::GenerateUserMasterKey();
    if (umk_result.IsErr()) {
        std::cerr << "Failed to generate UMK: " << umk_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto umk = std::move(umk_result).Unwrap();
    std::cout << "   ✓ Generated " << umk.Bytes().size() << "-byte UMK" << std::endl;
    std::cout << "   UMK: [SECRET - never leaves the originating client]" << std::endl;
    std::cout << std::endl;

    const std::string device_id = "laptop-7f3a";
    std::cout << "3. Deriving keys for device '" << device_id << "'..." << std::endl;
    auto derived_result = KeyHierarchy::DeriveKeysFromUserMasterKey(umk.Bytes(), device_id);
    if (derived_result.IsErr()) {
        std::cerr << "Derivation failed: " << derived_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& derived = derived_result.Unwrap();
    std::cout << "   ✓ DMK, BEK and MEK derived" << std::endl;

    auto again = KeyHierarchy::DeriveKeysFromUserMasterKey(umk.Bytes(), device_id);
    if (again.IsErr()) {
        std::cerr << "Second derivation failed" << std::endl;
        return 1;
    }
    auto same = derived.keys.BackupKey().ConstantTimeEquals(again.Unwrap().keys.BackupKey());
    std::cout << "   Re-derivation reproduces BEK: "
              << (same.IsOk() && same.Unwrap() ? "yes" : "NO") << std::endl;
    std::cout << std::endl;

    std::cout << "4. Sealing a backup record with the BEK..." << std::endl;
    const std::string record = "photos/2024/beach.jpg:sha256=9f86d08";
    const std::string context = "backup-v1";
    const std::span<const uint8_t> aad(
        reinterpret_cast<const uint8_t*>(context.data()), context.size());
    auto sealed = EnvelopeCipher::EncryptString(record, derived.keys.BackupEncryptionKey(), aad);
    if (sealed.IsErr()) {
        std::cerr << "Encryption failed: " << sealed.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& envelope = sealed.Unwrap();
    print_hex("   Nonce", envelope.nonce);
    print_hex("   Tag", envelope.tag);
    std::cout << "   Ciphertext: " << envelope.ciphertext.size() << " bytes" << std::endl;
    std::cout << std::endl;

    std::cout << "5. Opening the envelope..." << std::endl;
    auto opened = EnvelopeCipher::DecryptString(envelope, derived.keys.BackupEncryptionKey());
    if (opened.IsErr()) {
        std::cerr << "Decryption failed: " << opened.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Plaintext: " << opened.Unwrap() << std::endl;
    std::cout << std::endl;

    std::cout << "6. Opening with the MEK instead (must fail)..." << std::endl;
    auto wrong = EnvelopeCipher::Decrypt(envelope, derived.keys.MetadataEncryptionKey());
    if (wrong.IsOk() || !wrong.UnwrapErr().IsAuthentication()) {
        std::cerr << "Expected an authentication failure" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Rejected: " << wrong.UnwrapErr().message << std::endl;
    std::cout << std::endl;

    std::cout << "7. Moving the BEK into guarded memory..." << std::endl;
    auto handle_result = derived.keys.BackupKey().ToSecureHandle();
    if (handle_result.IsErr()) {
        std::cerr << "Failed to allocate secure memory" << std::endl;
        return 1;
    }
    auto handle = std::move(handle_result).Unwrap();
    std::cout << "   ✓ Stored " << handle.Size() << " bytes in locked memory" << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
