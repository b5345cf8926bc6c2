#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace dmsync::crypto {

/**
 * @brief RFC 5869 HKDF-SHA256 over the OpenSSL EVP_KDF interface
 *
 * Extract and Expand run as separate OpenSSL modes so a pseudorandom key can
 * be cached and expanded many times (one conversation key, one expansion per
 * message).
 */
class Hkdf {
public:
    /**
     * @brief HKDF-Extract
     *
     * @param ikm Input key material, must not be empty
     * @param salt Salt value
     * @return Ok(prk) where prk is HASH_LEN bytes
     */
    static Result<std::vector<uint8_t>, DmFailure> Extract(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt);

    /**
     * @brief HKDF-Expand
     *
     * @param prk Pseudorandom key, exactly HASH_LEN bytes
     * @param output_size Bytes to produce, at most MAX_OUTPUT_LEN
     * @param info Context info
     */
    static Result<std::vector<uint8_t>, DmFailure> Expand(
        std::span<const uint8_t> prk,
        size_t output_size,
        std::span<const uint8_t> info = {});

    /**
     * @brief Extract followed by Expand
     */
    static Result<std::vector<uint8_t>, DmFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace dmsync::crypto
