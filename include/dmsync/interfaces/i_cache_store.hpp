#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/merge/messaging_state.hpp"

#include <optional>
#include <string>

namespace dmsync::interfaces {

/// Per-user persistent snapshot of the messaging state.
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    /// Ok(nullopt) when nothing usable is stored for the user.
    [[nodiscard]] virtual Result<std::optional<merge::MessagingState>, DmFailure> ReadCache(
        const std::string& user_pubkey) = 0;

    [[nodiscard]] virtual Result<Unit, DmFailure> WriteCache(
        const std::string& user_pubkey,
        const merge::MessagingState& state) = 0;

    [[nodiscard]] virtual Result<Unit, DmFailure> DeleteCache(const std::string& user_pubkey) = 0;
};

}
