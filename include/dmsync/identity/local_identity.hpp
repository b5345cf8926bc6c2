#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/crypto/secure_memory_handle.hpp"
#include "dmsync/interfaces/i_signer.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace dmsync::identity {

using crypto::SecureMemoryHandle;

/**
 * @brief Ed25519 identity whose secret key lives in sodium secure memory
 *
 * Used as the local user's signer and, with Generate(), as the throwaway
 * key that signs each gift wrap.
 */
class LocalIdentity final : public interfaces::ISigner {
public:
    [[nodiscard]] static Result<LocalIdentity, DmFailure> Generate();

    /// @param seed 32-byte Ed25519 seed
    [[nodiscard]] static Result<LocalIdentity, DmFailure> FromSecretKey(std::span<const uint8_t> seed);

    [[nodiscard]] const std::string& PublicKeyHex() const noexcept { return public_key_hex_; }

    [[nodiscard]] std::string GetPublicKey() const override;
    [[nodiscard]] Result<event::Event, DmFailure> Sign(event::Event unsigned_event) const override;

    [[nodiscard]] Result<std::string, DmFailure> EncryptLegacy(
        const std::string& counterpart, const std::string& plaintext) const override;
    [[nodiscard]] Result<std::string, DmFailure> DecryptLegacy(
        const std::string& counterpart, const std::string& payload) const override;

    [[nodiscard]] Result<std::string, DmFailure> EncryptPrivate(
        const std::string& counterpart, const std::string& plaintext) const override;
    [[nodiscard]] Result<std::string, DmFailure> DecryptPrivate(
        const std::string& counterpart, const std::string& payload) const override;

    LocalIdentity(LocalIdentity&&) noexcept = default;
    LocalIdentity& operator=(LocalIdentity&&) noexcept = default;
    LocalIdentity(const LocalIdentity&) = delete;
    LocalIdentity& operator=(const LocalIdentity&) = delete;
    ~LocalIdentity() override = default;

private:
    LocalIdentity(SecureMemoryHandle secret_key, std::string public_key_hex);

    [[nodiscard]] static Result<LocalIdentity, DmFailure> FromKeyPair(
        std::vector<uint8_t> secret_key,
        const std::vector<uint8_t>& public_key);

    template<typename F>
    [[nodiscard]] Result<std::string, DmFailure> WithSecretKey(F&& operation) const;

    SecureMemoryHandle secret_key_;
    std::string public_key_hex_;
};

}
