#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/event/event.hpp"

#include <string>

namespace dmsync::interfaces {

/// The local user's key: signs events and performs both payload ciphers
/// against a counterpart public key (64-char hex).
class ISigner {
public:
    virtual ~ISigner() = default;

    [[nodiscard]] virtual std::string GetPublicKey() const = 0;

    /// Returns the event with pubkey, id and sig filled in.
    [[nodiscard]] virtual Result<event::Event, DmFailure> Sign(event::Event unsigned_event) const = 0;

    [[nodiscard]] virtual Result<std::string, DmFailure> EncryptLegacy(
        const std::string& counterpart, const std::string& plaintext) const = 0;
    [[nodiscard]] virtual Result<std::string, DmFailure> DecryptLegacy(
        const std::string& counterpart, const std::string& payload) const = 0;

    [[nodiscard]] virtual Result<std::string, DmFailure> EncryptPrivate(
        const std::string& counterpart, const std::string& plaintext) const = 0;
    [[nodiscard]] virtual Result<std::string, DmFailure> DecryptPrivate(
        const std::string& counterpart, const std::string& payload) const = 0;
};

}
