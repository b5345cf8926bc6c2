#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"

#include <cstdint>
#include <initializer_list>
#include <span>
#include <vector>

namespace dmsync::crypto {

/// SHA-256 and HMAC-SHA256 through OpenSSL EVP.
class Digest {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, DmFailure> Sha256(
        std::span<const uint8_t> data);

    /// HMAC-SHA256 over the concatenation of all parts, in order.
    [[nodiscard]] static Result<std::vector<uint8_t>, DmFailure> HmacSha256(
        std::span<const uint8_t> key,
        std::initializer_list<std::span<const uint8_t>> parts);

private:
    Digest() = delete;
};

} // namespace dmsync::crypto
