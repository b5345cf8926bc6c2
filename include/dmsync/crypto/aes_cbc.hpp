#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace dmsync::crypto {

/**
 * AES-256-CBC with PKCS#7 padding
 *
 * Unauthenticated. Exists only to read and write the legacy direct-message
 * format; a wrong key normally surfaces as a padding error on Decrypt, but
 * not always, so callers must not treat a successful Decrypt as proof of
 * authenticity.
 *
 * The IV must be fresh and random for every Encrypt call.
 */
class AesCbc {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, DmFailure> Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] static Result<std::vector<uint8_t>, DmFailure> Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> ciphertext);

private:
    AesCbc() = delete;
};

} // namespace dmsync::crypto
