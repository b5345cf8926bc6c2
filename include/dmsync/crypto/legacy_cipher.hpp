#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace dmsync::crypto {

/**
 * @brief Single-layer legacy direct-message payload
 *
 * AES-256-CBC keyed by the raw X25519 shared secret, with a random IV.
 * Wire form: base64(ciphertext) "?iv=" base64(iv).
 *
 * One recipient only. The sender and recipient are visible on the outer
 * event, so this format leaks metadata; new conversations should use
 * PrivateCipher via the gift-wrap codec.
 */
class LegacyCipher {
public:
    [[nodiscard]] static Result<std::string, DmFailure> Encrypt(
        std::span<const uint8_t> my_ed25519_secret,
        std::string_view their_pubkey_hex,
        std::string_view plaintext);

    /// Malformed payloads and padding errors are DecryptionFailed.
    [[nodiscard]] static Result<std::string, DmFailure> Decrypt(
        std::span<const uint8_t> my_ed25519_secret,
        std::string_view their_pubkey_hex,
        std::string_view payload);

    static constexpr std::string_view IV_SEPARATOR = "?iv=";

private:
    LegacyCipher() = delete;
};

} // namespace dmsync::crypto
