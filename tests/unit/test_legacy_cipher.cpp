#include <catch2/catch_test_macros.hpp>
#include "dmsync/crypto/legacy_cipher.hpp"
#include "dmsync/crypto/aes_cbc.hpp"
#include "dmsync/crypto/encoding.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include <string>
#include <vector>
using namespace dmsync;
using namespace dmsync::crypto;

TEST_CASE("AesCbc - NIST SP 800-38A F.2.5 first block", "[crypto][aes]") {
    const auto key = Encoding::HexDecode(
        "603deb1015ca71be2b73aef0857d77811f352c073b6108d72d9810a30914dff4").Unwrap();
    const auto iv = Encoding::HexDecode("000102030405060708090a0b0c0d0e0f").Unwrap();
    const auto plaintext = Encoding::HexDecode("6bc1bee22e409f96e93d7e117393172a").Unwrap();

    const auto ciphertext = AesCbc::Encrypt(key, iv, plaintext).Unwrap();
    // One full block plus one block of PKCS#7 padding.
    REQUIRE(ciphertext.size() == 32);
    REQUIRE(Encoding::HexEncode(std::span<const uint8_t>(ciphertext).subspan(0, 16)) ==
            "f58c4c04d6e5f1ba779eabfb5f7bfbd6");
    REQUIRE(AesCbc::Decrypt(key, iv, ciphertext).Unwrap() == plaintext);
}

TEST_CASE("AesCbc - Parameter checks", "[crypto][aes]") {
    const std::vector<uint8_t> key(32, 1);
    const std::vector<uint8_t> iv(16, 2);
    SECTION("Wrong key size") {
        REQUIRE(AesCbc::Encrypt(std::vector<uint8_t>(16, 1), iv, std::vector<uint8_t>{1}).IsErr());
    }
    SECTION("Wrong IV size") {
        REQUIRE(AesCbc::Encrypt(key, std::vector<uint8_t>(8, 2), std::vector<uint8_t>{1}).IsErr());
    }
    SECTION("Ciphertext not a block multiple") {
        auto result = AesCbc::Decrypt(key, iv, std::vector<uint8_t>(15, 0));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == DmFailureType::DecryptionFailed);
    }
}

TEST_CASE("LegacyCipher - Payload exchange", "[crypto][legacy]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto alice = SodiumInterop::GenerateEd25519KeyPair().Unwrap();
    const auto bob = SodiumInterop::GenerateEd25519KeyPair().Unwrap();
    const auto alice_hex = Encoding::HexEncode(alice.second);
    const auto bob_hex = Encoding::HexEncode(bob.second);

    SECTION("Bob decrypts what Alice encrypted") {
        const auto payload = LegacyCipher::Encrypt(alice.first, bob_hex, "meet at noon").Unwrap();
        REQUIRE(payload.find(LegacyCipher::IV_SEPARATOR) != std::string::npos);
        REQUIRE(LegacyCipher::Decrypt(bob.first, alice_hex, payload).Unwrap() == "meet at noon");
    }
    SECTION("Each encryption uses a fresh IV") {
        const auto first = LegacyCipher::Encrypt(alice.first, bob_hex, "same").Unwrap();
        const auto second = LegacyCipher::Encrypt(alice.first, bob_hex, "same").Unwrap();
        REQUIRE(first != second);
    }
    SECTION("Empty text round-trips") {
        const auto payload = LegacyCipher::Encrypt(alice.first, bob_hex, "").Unwrap();
        REQUIRE(LegacyCipher::Decrypt(bob.first, alice_hex, payload).Unwrap().empty());
    }
    SECTION("Missing IV") {
        auto result = LegacyCipher::Decrypt(bob.first, alice_hex, "c29tZXRoaW5n");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == DmFailureType::DecryptionFailed);
    }
    SECTION("Garbage base64") {
        auto result = LegacyCipher::Decrypt(bob.first, alice_hex, "!!!?iv=AAAAAAAAAAAAAAAAAAAAAA==");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == DmFailureType::DecryptionFailed);
    }
    SECTION("Third party cannot read it") {
        const auto eve = SodiumInterop::GenerateEd25519KeyPair().Unwrap();
        const auto payload = LegacyCipher::Encrypt(alice.first, bob_hex, "meet at noon").Unwrap();
        auto result = LegacyCipher::Decrypt(eve.first, alice_hex, payload);
        if (result.IsOk()) {
            REQUIRE(result.Unwrap() != "meet at noon");
        } else {
            REQUIRE(result.UnwrapErr().type == DmFailureType::DecryptionFailed);
        }
    }
}
