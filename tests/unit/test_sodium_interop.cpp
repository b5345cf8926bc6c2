#include <catch2/catch_test_macros.hpp>
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/crypto/key_agreement.hpp"
#include "dmsync/crypto/encoding.hpp"
#include "dmsync/core/constants.hpp"
#include <set>
#include <string>
#include <vector>
using namespace dmsync;
using namespace dmsync::crypto;

TEST_CASE("SodiumInterop - Initialization", "[crypto][sodium]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::IsInitialized());
    SECTION("Initialize is idempotent") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - Memory hygiene", "[crypto][sodium]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("SecureWipe zeroes the buffer") {
        std::vector<uint8_t> buffer(64, 0xAB);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        for (const auto byte : buffer) {
            REQUIRE(byte == 0);
        }
    }
    SECTION("ConstantTimeEquals") {
        const std::vector<uint8_t> a(32, 1);
        std::vector<uint8_t> b(32, 1);
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
        b[31] = 2;
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
        const std::vector<uint8_t> shorter(16, 1);
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, shorter).Unwrap());
    }
}

TEST_CASE("SodiumInterop - Randomness", "[crypto][sodium]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("GetRandomBytes returns distinct buffers") {
        const auto a = SodiumInterop::GetRandomBytes(32);
        const auto b = SodiumInterop::GetRandomBytes(32);
        REQUIRE(a.size() == 32);
        REQUIRE(a != b);
    }
    SECTION("RandomUniform stays below the bound") {
        std::set<uint32_t> seen;
        for (int i = 0; i < 200; ++i) {
            const auto value = SodiumInterop::RandomUniform(10);
            REQUIRE(value < 10);
            seen.insert(value);
        }
        REQUIRE(seen.size() > 1);
    }
}

TEST_CASE("SodiumInterop - Ed25519", "[crypto][sodium]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto [secret, pub] = SodiumInterop::GenerateEd25519KeyPair().Unwrap();
    REQUIRE(secret.size() == Constants::ED_25519_SECRET_KEY_SIZE);
    REQUIRE(pub.size() == Constants::ED_25519_PUBLIC_KEY_SIZE);

    const std::vector<uint8_t> message = {'h', 'e', 'l', 'l', 'o'};

    SECTION("Signature verifies") {
        const auto signature = SodiumInterop::SignDetached(message, secret).Unwrap();
        REQUIRE(signature.size() == Constants::ED_25519_SIGNATURE_SIZE);
        REQUIRE(SodiumInterop::VerifyDetached(signature, message, pub));
    }
    SECTION("Tampered message is rejected") {
        const auto signature = SodiumInterop::SignDetached(message, secret).Unwrap();
        auto tampered = message;
        tampered[0] = 'j';
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(signature, tampered, pub));
    }
    SECTION("Seed derivation is deterministic") {
        const std::vector<uint8_t> seed(32, 0x11);
        const auto first = SodiumInterop::Ed25519KeyPairFromSeed(seed).Unwrap();
        const auto second = SodiumInterop::Ed25519KeyPairFromSeed(seed).Unwrap();
        REQUIRE(first.second == second.second);
    }
    SECTION("Seed of wrong size is rejected") {
        const std::vector<uint8_t> seed(16, 0x11);
        REQUIRE(SodiumInterop::Ed25519KeyPairFromSeed(seed).IsErr());
    }
    SECTION("Short secret key is rejected") {
        const std::vector<uint8_t> short_key(10, 0);
        REQUIRE(SodiumInterop::SignDetached(message, short_key).IsErr());
    }
}

TEST_CASE("SodiumInterop - X25519 agreement is symmetric", "[crypto][sodium]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto alice = SodiumInterop::GenerateEd25519KeyPair().Unwrap();
    const auto bob = SodiumInterop::GenerateEd25519KeyPair().Unwrap();

    SECTION("Raw conversion") {
        const auto alice_x = SodiumInterop::Ed25519SecretToX25519(alice.first).Unwrap();
        const auto bob_x = SodiumInterop::Ed25519SecretToX25519(bob.first).Unwrap();
        const auto alice_pub_x = SodiumInterop::Ed25519PublicToX25519(alice.second).Unwrap();
        const auto bob_pub_x = SodiumInterop::Ed25519PublicToX25519(bob.second).Unwrap();

        const auto ab = SodiumInterop::X25519SharedSecret(alice_x, bob_pub_x).Unwrap();
        const auto ba = SodiumInterop::X25519SharedSecret(bob_x, alice_pub_x).Unwrap();
        REQUIRE(ab == ba);
        REQUIRE(ab.size() == Constants::X_25519_SHARED_SECRET_SIZE);
    }
    SECTION("KeyAgreement over hex public keys") {
        const auto ab = KeyAgreement::SharedSecret(alice.first, Encoding::HexEncode(bob.second)).Unwrap();
        const auto ba = KeyAgreement::SharedSecret(bob.first, Encoding::HexEncode(alice.second)).Unwrap();
        REQUIRE(ab == ba);
    }
    SECTION("KeyAgreement rejects a malformed public key") {
        REQUIRE(KeyAgreement::SharedSecret(alice.first, "not-hex").IsErr());
    }
}

TEST_CASE("SodiumInterop - ChaCha20 keystream", "[crypto][sodium]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(32, 0x01);
    const std::vector<uint8_t> nonce(12, 0x02);
    const std::vector<uint8_t> input = {1, 2, 3, 4, 5, 6, 7, 8};

    const auto encrypted = SodiumInterop::ChaCha20Xor(key, nonce, input).Unwrap();
    REQUIRE(encrypted != input);
    REQUIRE(SodiumInterop::ChaCha20Xor(key, nonce, encrypted).Unwrap() == input);

    const std::vector<uint8_t> bad_nonce(8, 0x02);
    REQUIRE(SodiumInterop::ChaCha20Xor(key, bad_nonce, input).IsErr());
}
