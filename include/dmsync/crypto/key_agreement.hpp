#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace dmsync::crypto {

/// X25519 agreement between a local Ed25519 secret key and a peer's hex
/// Ed25519 public key. Both keys are converted to their Montgomery form first.
class KeyAgreement {
public:
    static Result<std::vector<uint8_t>, DmFailure> SharedSecret(
        std::span<const uint8_t> my_ed25519_secret,
        std::string_view their_pubkey_hex);

private:
    KeyAgreement() = delete;
};

} // namespace dmsync::crypto
