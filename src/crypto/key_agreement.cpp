#include "dmsync/crypto/key_agreement.hpp"
#include "dmsync/crypto/encoding.hpp"
#include "dmsync/crypto/sodium_interop.hpp"

namespace dmsync::crypto {

Result<std::vector<uint8_t>, DmFailure> KeyAgreement::SharedSecret(
    std::span<const uint8_t> my_ed25519_secret,
    const std::string_view their_pubkey_hex) {

    if (!Encoding::IsHexKey(their_pubkey_hex)) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput("Peer public key must be 64 lowercase hex characters"));
    }

    auto their_ed = Encoding::HexDecode(their_pubkey_hex);
    if (their_ed.IsErr()) {
        return their_ed;
    }
    auto their_x = SodiumInterop::Ed25519PublicToX25519(their_ed.Unwrap());
    if (their_x.IsErr()) {
        return their_x;
    }
    auto my_x_result = SodiumInterop::Ed25519SecretToX25519(my_ed25519_secret);
    if (my_x_result.IsErr()) {
        return my_x_result;
    }

    auto my_x = std::move(my_x_result).Unwrap();
    auto shared = SodiumInterop::X25519SharedSecret(my_x, their_x.Unwrap());
    SodiumInterop::SecureWipe(std::span<uint8_t>(my_x));
    return shared;
}

} // namespace dmsync::crypto
