#include "dmsync/crypto/private_cipher.hpp"
#include "dmsync/crypto/digest.hpp"
#include "dmsync/crypto/encoding.hpp"
#include "dmsync/crypto/hkdf.hpp"
#include "dmsync/crypto/key_agreement.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"

#include <algorithm>
#include <bit>

namespace dmsync::crypto {

using Payload = PrivatePayloadConstants;

namespace {
    std::span<const uint8_t> AsBytes(const std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    struct MessageKeys {
        std::vector<uint8_t> material;

        [[nodiscard]] std::span<const uint8_t> ChaChaKey() const {
            return std::span<const uint8_t>(material).subspan(0, Payload::CHACHA_KEY_SIZE);
        }
        [[nodiscard]] std::span<const uint8_t> ChaChaNonce() const {
            return std::span<const uint8_t>(material).subspan(
                Payload::CHACHA_KEY_SIZE, Payload::CHACHA_NONCE_SIZE);
        }
        [[nodiscard]] std::span<const uint8_t> HmacKey() const {
            return std::span<const uint8_t>(material).subspan(
                Payload::CHACHA_KEY_SIZE + Payload::CHACHA_NONCE_SIZE, Payload::HMAC_KEY_SIZE);
        }

        ~MessageKeys() {
            SodiumInterop::SecureWipe(std::span<uint8_t>(material));
        }
    };

    Result<MessageKeys, DmFailure> DeriveMessageKeys(
        std::span<const uint8_t> conversation_key,
        std::span<const uint8_t> nonce) {

        if (conversation_key.size() != Hkdf::HASH_LEN) {
            return Result<MessageKeys, DmFailure>::Err(
                DmFailure::InvalidInput("Conversation key must be 32 bytes"));
        }
        auto expanded = Hkdf::Expand(conversation_key, Payload::MESSAGE_KEYS_SIZE, nonce);
        if (expanded.IsErr()) {
            return Fail(std::move(expanded).UnwrapErr());
        }
        return Result<MessageKeys, DmFailure>::Ok(MessageKeys{std::move(expanded).Unwrap()});
    }

    DmFailure Rejected(const std::string_view reason) {
        return DmFailure::DecryptionFailed(compat::format("Private payload rejected: {}", reason));
    }
}

Result<std::vector<uint8_t>, DmFailure> PrivateCipher::ConversationKey(
    std::span<const uint8_t> my_ed25519_secret,
    const std::string_view their_pubkey_hex) {

    auto shared_result = KeyAgreement::SharedSecret(my_ed25519_secret, their_pubkey_hex);
    if (shared_result.IsErr()) {
        return shared_result;
    }
    auto shared = std::move(shared_result).Unwrap();
    auto key = Hkdf::Extract(shared, AsBytes(Payload::SALT));
    SodiumInterop::SecureWipe(std::span<uint8_t>(shared));
    return key;
}

size_t PrivateCipher::CalcPaddedLength(const size_t unpadded_length) noexcept {
    if (unpadded_length <= Payload::MIN_PADDED_SIZE) {
        return Payload::MIN_PADDED_SIZE;
    }
    const size_t next_power = size_t{1} << std::bit_width(unpadded_length - 1);
    const size_t chunk = next_power <= 256 ? 32 : next_power / 8;
    return chunk * ((unpadded_length - 1) / chunk + 1);
}

Result<std::vector<uint8_t>, DmFailure> PrivateCipher::Pad(const std::string_view plaintext) {
    const size_t length = plaintext.size();
    if (length < Payload::MIN_PLAINTEXT_SIZE || length > Payload::MAX_PLAINTEXT_SIZE) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput(compat::format(
                "Plaintext length {} outside {}..{}", length,
                Payload::MIN_PLAINTEXT_SIZE, Payload::MAX_PLAINTEXT_SIZE)));
    }

    std::vector<uint8_t> padded(Payload::LENGTH_PREFIX_SIZE + CalcPaddedLength(length), 0);
    padded[0] = static_cast<uint8_t>((length >> 8) & 0xFF);
    padded[1] = static_cast<uint8_t>(length & 0xFF);
    std::copy(plaintext.begin(), plaintext.end(), padded.begin() + Payload::LENGTH_PREFIX_SIZE);
    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(padded));
}

Result<std::string, DmFailure> PrivateCipher::Unpad(std::span<const uint8_t> padded) {
    if (padded.size() < Payload::LENGTH_PREFIX_SIZE) {
        return Result<std::string, DmFailure>::Err(Rejected("padding too short"));
    }
    const size_t length = (static_cast<size_t>(padded[0]) << 8) | padded[1];
    if (length < Payload::MIN_PLAINTEXT_SIZE ||
        padded.size() != Payload::LENGTH_PREFIX_SIZE + CalcPaddedLength(length)) {
        return Result<std::string, DmFailure>::Err(Rejected("invalid padding"));
    }
    const auto body = padded.subspan(Payload::LENGTH_PREFIX_SIZE, length);
    return Result<std::string, DmFailure>::Ok(std::string(body.begin(), body.end()));
}

Result<std::string, DmFailure> PrivateCipher::Encrypt(
    std::span<const uint8_t> conversation_key,
    const std::string_view plaintext,
    std::span<const uint8_t> nonce) {

    std::vector<uint8_t> nonce_bytes;
    if (nonce.empty()) {
        nonce_bytes = SodiumInterop::GetRandomBytes(Payload::NONCE_SIZE);
    } else if (nonce.size() == Payload::NONCE_SIZE) {
        nonce_bytes.assign(nonce.begin(), nonce.end());
    } else {
        return Result<std::string, DmFailure>::Err(
            DmFailure::InvalidInput("Nonce must be 32 bytes"));
    }

    auto padded_result = Pad(plaintext);
    if (padded_result.IsErr()) {
        return Fail(std::move(padded_result).UnwrapErr());
    }
    auto padded = std::move(padded_result).Unwrap();

    auto keys_result = DeriveMessageKeys(conversation_key, nonce_bytes);
    if (keys_result.IsErr()) {
        return Fail(std::move(keys_result).UnwrapErr());
    }
    const auto keys = std::move(keys_result).Unwrap();

    auto ciphertext = SodiumInterop::ChaCha20Xor(keys.ChaChaKey(), keys.ChaChaNonce(), padded);
    SodiumInterop::SecureWipe(std::span<uint8_t>(padded));
    if (ciphertext.IsErr()) {
        return Fail(std::move(ciphertext).UnwrapErr());
    }
    auto mac = Digest::HmacSha256(keys.HmacKey(), {nonce_bytes, ciphertext.Unwrap()});
    if (mac.IsErr()) {
        return Fail(std::move(mac).UnwrapErr());
    }

    std::vector<uint8_t> raw;
    raw.reserve(1 + nonce_bytes.size() + ciphertext.Unwrap().size() + Payload::MAC_SIZE);
    raw.push_back(Payload::VERSION);
    raw.insert(raw.end(), nonce_bytes.begin(), nonce_bytes.end());
    raw.insert(raw.end(), ciphertext.Unwrap().begin(), ciphertext.Unwrap().end());
    raw.insert(raw.end(), mac.Unwrap().begin(), mac.Unwrap().end());

    return Result<std::string, DmFailure>::Ok(Encoding::Base64Encode(raw));
}

Result<std::string, DmFailure> PrivateCipher::Decrypt(
    std::span<const uint8_t> conversation_key,
    const std::string_view payload) {

    if (payload.empty() || payload.front() == '#') {
        return Result<std::string, DmFailure>::Err(Rejected("unknown version"));
    }
    if (payload.size() < Payload::MIN_PAYLOAD_B64_SIZE || payload.size() > Payload::MAX_PAYLOAD_B64_SIZE) {
        return Result<std::string, DmFailure>::Err(Rejected("invalid payload size"));
    }

    auto decoded_result = Encoding::Base64Decode(payload);
    if (decoded_result.IsErr()) {
        return Result<std::string, DmFailure>::Err(Rejected("invalid base64"));
    }
    const auto decoded = std::move(decoded_result).Unwrap();
    if (decoded.size() < Payload::MIN_DECODED_SIZE || decoded.size() > Payload::MAX_DECODED_SIZE) {
        return Result<std::string, DmFailure>::Err(Rejected("invalid data size"));
    }
    if (decoded[0] != Payload::VERSION) {
        return Result<std::string, DmFailure>::Err(
            Rejected(compat::format("unknown version {}", static_cast<int>(decoded[0]))));
    }

    const std::span<const uint8_t> bytes(decoded);
    const auto nonce = bytes.subspan(1, Payload::NONCE_SIZE);
    const auto ciphertext = bytes.subspan(
        1 + Payload::NONCE_SIZE, bytes.size() - 1 - Payload::NONCE_SIZE - Payload::MAC_SIZE);
    const auto mac = bytes.subspan(bytes.size() - Payload::MAC_SIZE);

    auto keys_result = DeriveMessageKeys(conversation_key, nonce);
    if (keys_result.IsErr()) {
        return Fail(std::move(keys_result).UnwrapErr());
    }
    const auto keys = std::move(keys_result).Unwrap();

    auto expected_mac = Digest::HmacSha256(keys.HmacKey(), {nonce, ciphertext});
    if (expected_mac.IsErr()) {
        return Fail(std::move(expected_mac).UnwrapErr());
    }
    auto equal = SodiumInterop::ConstantTimeEquals(expected_mac.Unwrap(), mac);
    if (equal.IsErr() || !equal.Unwrap()) {
        return Result<std::string, DmFailure>::Err(Rejected("invalid MAC"));
    }

    auto padded_result = SodiumInterop::ChaCha20Xor(keys.ChaChaKey(), keys.ChaChaNonce(), ciphertext);
    if (padded_result.IsErr()) {
        return Fail(std::move(padded_result).UnwrapErr());
    }
    auto padded = std::move(padded_result).Unwrap();
    auto plaintext = Unpad(padded);
    SodiumInterop::SecureWipe(std::span<uint8_t>(padded));
    return plaintext;
}

} // namespace dmsync::crypto
