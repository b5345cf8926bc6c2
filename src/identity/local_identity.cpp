#include "dmsync/identity/local_identity.hpp"
#include "dmsync/crypto/encoding.hpp"
#include "dmsync/crypto/legacy_cipher.hpp"
#include "dmsync/crypto/private_cipher.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/event/event_codec.hpp"
#include "dmsync/core/constants.hpp"

namespace dmsync::identity {

using crypto::SodiumInterop;

LocalIdentity::LocalIdentity(SecureMemoryHandle secret_key, std::string public_key_hex)
    : secret_key_(std::move(secret_key))
    , public_key_hex_(std::move(public_key_hex)) {}

Result<LocalIdentity, DmFailure> LocalIdentity::Generate() {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<LocalIdentity, DmFailure>::Err(DmFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto key_pair = SodiumInterop::GenerateEd25519KeyPair();
    if (key_pair.IsErr()) {
        return Fail(std::move(key_pair).UnwrapErr());
    }
    auto [secret_key, public_key] = std::move(key_pair).Unwrap();
    return FromKeyPair(std::move(secret_key), public_key);
}

Result<LocalIdentity, DmFailure> LocalIdentity::FromSecretKey(std::span<const uint8_t> seed) {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<LocalIdentity, DmFailure>::Err(DmFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto key_pair = SodiumInterop::Ed25519KeyPairFromSeed(seed);
    if (key_pair.IsErr()) {
        return Fail(std::move(key_pair).UnwrapErr());
    }
    auto [secret_key, public_key] = std::move(key_pair).Unwrap();
    return FromKeyPair(std::move(secret_key), public_key);
}

Result<LocalIdentity, DmFailure> LocalIdentity::FromKeyPair(
    std::vector<uint8_t> secret_key,
    const std::vector<uint8_t>& public_key) {

    auto handle_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (handle_result.IsErr()) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(secret_key));
        return Result<LocalIdentity, DmFailure>::Err(
            DmFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto handle = std::move(handle_result).Unwrap();
    auto write = handle.Write(secret_key);
    SodiumInterop::SecureWipe(std::span<uint8_t>(secret_key));
    if (write.IsErr()) {
        return Result<LocalIdentity, DmFailure>::Err(DmFailure::FromSodiumFailure(write.UnwrapErr()));
    }

    return Result<LocalIdentity, DmFailure>::Ok(
        LocalIdentity(std::move(handle), crypto::Encoding::HexEncode(public_key)));
}

template<typename F>
Result<std::string, DmFailure> LocalIdentity::WithSecretKey(F&& operation) const {
    auto outcome = secret_key_.WithReadAccess(std::forward<F>(operation));
    if (outcome.IsErr()) {
        return Result<std::string, DmFailure>::Err(DmFailure::FromSodiumFailure(outcome.UnwrapErr()));
    }
    return std::move(outcome).Unwrap();
}

std::string LocalIdentity::GetPublicKey() const {
    return public_key_hex_;
}

Result<event::Event, DmFailure> LocalIdentity::Sign(event::Event unsigned_event) const {
    auto outcome = secret_key_.WithReadAccess([&unsigned_event](std::span<const uint8_t> secret_key) {
        return event::EventCodec::Finalize(std::move(unsigned_event), secret_key);
    });
    if (outcome.IsErr()) {
        return Result<event::Event, DmFailure>::Err(DmFailure::FromSodiumFailure(outcome.UnwrapErr()));
    }
    return std::move(outcome).Unwrap();
}

Result<std::string, DmFailure> LocalIdentity::EncryptLegacy(
    const std::string& counterpart, const std::string& plaintext) const {
    return WithSecretKey([&](std::span<const uint8_t> secret_key) {
        return crypto::LegacyCipher::Encrypt(secret_key, counterpart, plaintext);
    });
}

Result<std::string, DmFailure> LocalIdentity::DecryptLegacy(
    const std::string& counterpart, const std::string& payload) const {
    return WithSecretKey([&](std::span<const uint8_t> secret_key) {
        return crypto::LegacyCipher::Decrypt(secret_key, counterpart, payload);
    });
}

Result<std::string, DmFailure> LocalIdentity::EncryptPrivate(
    const std::string& counterpart, const std::string& plaintext) const {
    return WithSecretKey([&](std::span<const uint8_t> secret_key) -> Result<std::string, DmFailure> {
        auto conversation_key = crypto::PrivateCipher::ConversationKey(secret_key, counterpart);
        if (conversation_key.IsErr()) {
            return Fail(std::move(conversation_key).UnwrapErr());
        }
        auto key = std::move(conversation_key).Unwrap();
        auto payload = crypto::PrivateCipher::Encrypt(key, plaintext);
        SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return payload;
    });
}

Result<std::string, DmFailure> LocalIdentity::DecryptPrivate(
    const std::string& counterpart, const std::string& payload) const {
    return WithSecretKey([&](std::span<const uint8_t> secret_key) -> Result<std::string, DmFailure> {
        auto conversation_key = crypto::PrivateCipher::ConversationKey(secret_key, counterpart);
        if (conversation_key.IsErr()) {
            return Fail(std::move(conversation_key).UnwrapErr());
        }
        auto key = std::move(conversation_key).Unwrap();
        auto plaintext = crypto::PrivateCipher::Decrypt(key, payload);
        SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return plaintext;
    });
}

}
