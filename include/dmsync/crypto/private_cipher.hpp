#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dmsync::crypto {

/**
 * @brief Versioned authenticated payload used by seals and gift wraps
 *
 * Key schedule:
 *   conversation_key = HKDF-Extract(salt = "nip44-v2", X25519(me, them))
 *   message_keys     = HKDF-Expand(conversation_key, info = nonce, 76)
 *                    = chacha_key[32] || chacha_nonce[12] || hmac_key[32]
 *
 * Payload (base64):
 *   0x02 || nonce[32] || ChaCha20(padded plaintext) || HMAC-SHA256(hmac_key, nonce || ct)
 *
 * The padded plaintext is a big-endian u16 length followed by the text and
 * zero bytes up to CalcPaddedLength(length). Padding hides the exact length
 * inside size buckets.
 */
class PrivateCipher {
public:
    /**
     * @brief Derive the symmetric key shared by a pair of users
     *
     * Symmetric: ConversationKey(a, B) == ConversationKey(b, A).
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, DmFailure> ConversationKey(
        std::span<const uint8_t> my_ed25519_secret,
        std::string_view their_pubkey_hex);

    /**
     * @brief Encrypt under a conversation key
     *
     * @param nonce 32 bytes; empty draws a fresh random nonce. Only tests
     *              should pass a fixed nonce.
     * @return Ok(base64 payload), or InvalidInput for plaintext outside 1..65535 bytes
     */
    [[nodiscard]] static Result<std::string, DmFailure> Encrypt(
        std::span<const uint8_t> conversation_key,
        std::string_view plaintext,
        std::span<const uint8_t> nonce = {});

    /**
     * @brief Verify and decrypt a payload
     *
     * Checks length bounds, version, MAC (constant time) and padding, in
     * that order. Every rejection is DecryptionFailed.
     */
    [[nodiscard]] static Result<std::string, DmFailure> Decrypt(
        std::span<const uint8_t> conversation_key,
        std::string_view payload);

    /// Padded body length for an unpadded length, without the 2-byte prefix.
    [[nodiscard]] static size_t CalcPaddedLength(size_t unpadded_length) noexcept;

    [[nodiscard]] static Result<std::vector<uint8_t>, DmFailure> Pad(std::string_view plaintext);
    [[nodiscard]] static Result<std::string, DmFailure> Unpad(std::span<const uint8_t> padded);

private:
    PrivateCipher() = delete;
};

} // namespace dmsync::crypto
