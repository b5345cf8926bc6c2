#include "dmsync/crypto/legacy_cipher.hpp"
#include "dmsync/crypto/aes_cbc.hpp"
#include "dmsync/crypto/encoding.hpp"
#include "dmsync/crypto/key_agreement.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/core/constants.hpp"

#include <vector>

namespace dmsync::crypto {

Result<std::string, DmFailure> LegacyCipher::Encrypt(
    std::span<const uint8_t> my_ed25519_secret,
    const std::string_view their_pubkey_hex,
    const std::string_view plaintext) {

    auto key_result = KeyAgreement::SharedSecret(my_ed25519_secret, their_pubkey_hex);
    if (key_result.IsErr()) {
        return Fail(std::move(key_result).UnwrapErr());
    }
    auto key = std::move(key_result).Unwrap();

    const auto iv = SodiumInterop::GetRandomBytes(Constants::AES_CBC_IV_SIZE);
    auto ciphertext = AesCbc::Encrypt(
        key, iv,
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size()));
    SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    if (ciphertext.IsErr()) {
        return Fail(std::move(ciphertext).UnwrapErr());
    }

    std::string payload = Encoding::Base64Encode(ciphertext.Unwrap());
    payload.append(IV_SEPARATOR);
    payload.append(Encoding::Base64Encode(iv));
    return Result<std::string, DmFailure>::Ok(std::move(payload));
}

Result<std::string, DmFailure> LegacyCipher::Decrypt(
    std::span<const uint8_t> my_ed25519_secret,
    const std::string_view their_pubkey_hex,
    const std::string_view payload) {

    const size_t separator = payload.find(IV_SEPARATOR);
    if (separator == std::string_view::npos) {
        return Result<std::string, DmFailure>::Err(
            DmFailure::DecryptionFailed("Legacy payload has no IV"));
    }

    auto ciphertext = Encoding::Base64Decode(payload.substr(0, separator));
    auto iv = Encoding::Base64Decode(payload.substr(separator + IV_SEPARATOR.size()));
    if (ciphertext.IsErr() || iv.IsErr()) {
        return Result<std::string, DmFailure>::Err(
            DmFailure::DecryptionFailed("Legacy payload is not valid base64"));
    }
    if (iv.Unwrap().size() != Constants::AES_CBC_IV_SIZE) {
        return Result<std::string, DmFailure>::Err(
            DmFailure::DecryptionFailed("Legacy payload IV has wrong size"));
    }

    auto key_result = KeyAgreement::SharedSecret(my_ed25519_secret, their_pubkey_hex);
    if (key_result.IsErr()) {
        return Fail(std::move(key_result).UnwrapErr());
    }
    auto key = std::move(key_result).Unwrap();

    auto plaintext = AesCbc::Decrypt(key, iv.Unwrap(), ciphertext.Unwrap());
    SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    if (plaintext.IsErr()) {
        return Fail(std::move(plaintext).UnwrapErr());
    }

    const auto& bytes = plaintext.Unwrap();
    return Result<std::string, DmFailure>::Ok(std::string(bytes.begin(), bytes.end()));
}

} // namespace dmsync::crypto
