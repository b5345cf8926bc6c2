#include <catch2/catch_test_macros.hpp>
#include "dmsync/crypto/private_cipher.hpp"
#include "dmsync/crypto/encoding.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/core/constants.hpp"
#include <string>
#include <utility>
#include <vector>
using namespace dmsync;
using namespace dmsync::crypto;

TEST_CASE("PrivateCipher - Padding buckets", "[crypto][private]") {
    const std::vector<std::pair<size_t, size_t>> expected = {
        {1, 32}, {32, 32}, {33, 64}, {65, 96}, {100, 128}, {200, 224},
        {250, 256}, {320, 320}, {400, 448}, {515, 640}, {900, 1024},
    };
    for (const auto& [unpadded, padded] : expected) {
        INFO("unpadded length " << unpadded);
        REQUIRE(PrivateCipher::CalcPaddedLength(unpadded) == padded);
    }
}

TEST_CASE("PrivateCipher - Pad and unpad", "[crypto][private]") {
    SECTION("Length prefix is big-endian") {
        const auto padded = PrivateCipher::Pad(std::string(300, 'x')).Unwrap();
        REQUIRE(padded.size() == 2 + PrivateCipher::CalcPaddedLength(300));
        REQUIRE(padded[0] == 0x01);
        REQUIRE(padded[1] == 0x2C);
        REQUIRE(PrivateCipher::Unpad(padded).Unwrap() == std::string(300, 'x'));
    }
    SECTION("Empty and oversized plaintexts are rejected") {
        REQUIRE(PrivateCipher::Pad("").IsErr());
        REQUIRE(PrivateCipher::Pad(std::string(65536, 'x')).IsErr());
        REQUIRE(PrivateCipher::Pad(std::string(65535, 'x')).IsOk());
    }
    SECTION("Truncated padding is rejected") {
        auto padded = PrivateCipher::Pad("hello").Unwrap();
        padded.pop_back();
        REQUIRE(PrivateCipher::Unpad(padded).IsErr());
    }
}

TEST_CASE("PrivateCipher - Conversation key is symmetric", "[crypto][private]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto alice = SodiumInterop::GenerateEd25519KeyPair().Unwrap();
    const auto bob = SodiumInterop::GenerateEd25519KeyPair().Unwrap();

    const auto ab = PrivateCipher::ConversationKey(alice.first, Encoding::HexEncode(bob.second)).Unwrap();
    const auto ba = PrivateCipher::ConversationKey(bob.first, Encoding::HexEncode(alice.second)).Unwrap();
    REQUIRE(ab.size() == 32);
    REQUIRE(ab == ba);
}

TEST_CASE("PrivateCipher - Encrypt and decrypt", "[crypto][private]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(32, 0x42);

    SECTION("Round trip") {
        const auto payload = PrivateCipher::Encrypt(key, "a secret note").Unwrap();
        REQUIRE(PrivateCipher::Decrypt(key, payload).Unwrap() == "a secret note");
    }
    SECTION("Payload layout") {
        const std::vector<uint8_t> nonce(PrivatePayloadConstants::NONCE_SIZE, 0x07);
        const auto payload = PrivateCipher::Encrypt(key, "hi", nonce).Unwrap();
        const auto raw = Encoding::Base64Decode(payload).Unwrap();
        REQUIRE(raw.size() == 1 + 32 + 2 + 32 + 32);
        REQUIRE(raw[0] == PrivatePayloadConstants::VERSION);
        REQUIRE(std::vector<uint8_t>(raw.begin() + 1, raw.begin() + 33) == nonce);
    }
    SECTION("Fixed nonce is deterministic") {
        const std::vector<uint8_t> nonce(PrivatePayloadConstants::NONCE_SIZE, 0x07);
        REQUIRE(PrivateCipher::Encrypt(key, "hi", nonce).Unwrap() ==
                PrivateCipher::Encrypt(key, "hi", nonce).Unwrap());
    }
    SECTION("Nonce of the wrong size") {
        const std::vector<uint8_t> nonce(12, 0x07);
        REQUIRE(PrivateCipher::Encrypt(key, "hi", nonce).IsErr());
    }
    SECTION("Wrong key fails the MAC") {
        const auto payload = PrivateCipher::Encrypt(key, "a secret note").Unwrap();
        const std::vector<uint8_t> other(32, 0x43);
        auto result = PrivateCipher::Decrypt(other, payload);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == DmFailureType::DecryptionFailed);
    }
    SECTION("Flipped ciphertext byte fails the MAC") {
        const auto payload = PrivateCipher::Encrypt(key, "a secret note").Unwrap();
        auto raw = Encoding::Base64Decode(payload).Unwrap();
        raw[40] ^= 0x01;
        REQUIRE(PrivateCipher::Decrypt(key, Encoding::Base64Encode(raw)).IsErr());
    }
    SECTION("Unknown version") {
        const auto payload = PrivateCipher::Encrypt(key, "a secret note").Unwrap();
        auto raw = Encoding::Base64Decode(payload).Unwrap();
        raw[0] = 1;
        REQUIRE(PrivateCipher::Decrypt(key, Encoding::Base64Encode(raw)).IsErr());
        REQUIRE(PrivateCipher::Decrypt(key, "#" + payload.substr(1)).IsErr());
    }
    SECTION("Payload too short") {
        REQUIRE(PrivateCipher::Decrypt(key, "AAAA").IsErr());
        REQUIRE(PrivateCipher::Decrypt(key, "").IsErr());
    }
    SECTION("Large plaintext") {
        const std::string text(5000, 'z');
        REQUIRE(PrivateCipher::Decrypt(key, PrivateCipher::Encrypt(key, text).Unwrap()).Unwrap() == text);
    }
}
