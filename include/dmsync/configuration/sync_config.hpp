#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace dmsync::configuration {

/// How a user's relay set is derived from their published relay lists.
enum class RelayMode : uint8_t {
    /// Use only the configured discovery relays; ignore published lists.
    Discovery = 0,

    /// Published DM-inbox relays, plus read relays, plus discovery relays.
    /// Widest coverage, slowest queries.
    Hybrid = 1,

    /// Published lists only. Read relays are used only when no DM-inbox
    /// list exists. Discovery relays are never added.
    StrictOutbox = 2
};

/// Tunables for one messaging session.
///
/// Every field has a usable default. Values are copied into the orchestrator, the subscription manager
/// and the persistence queue when a session starts; changing a config after
/// that has no effect on the running session.
///
/// @example
/// ```cpp
/// auto config = SyncConfig::Default();
/// config.relay_mode = RelayMode::StrictOutbox;
/// config.query_limit = 5000;
/// if (auto valid = config.Validate(); valid.IsErr()) {
///     // reject
/// }
/// ```
class SyncConfig {
public:
    /// Relays used to look up relay lists and as a fallback inbox.
    std::vector<std::string> discovery_relays;

    /// Relay-set derivation policy. Default: Hybrid.
    RelayMode relay_mode = RelayMode::Hybrid;

    /// How long a participant's resolved relay set stays fresh.
    /// Stale participants are re-resolved on warm start. Default: 7 days.
    std::chrono::milliseconds relay_ttl{std::chrono::hours(24 * 7)};

    /// Events requested per filter per round. Default: 1000.
    uint32_t batch_size = 1000;

    /// Total-message ceiling for one query pass. Hitting it sets
    /// query_limit_reached instead of silently truncating. Default: 20000.
    uint32_t query_limit = 20000;

    /// Per-relay query timeout. Default: 5 seconds.
    std::chrono::milliseconds query_timeout{5000};

    /// Safety overlap subtracted from sync cursors to catch race windows.
    /// Default: 10 seconds.
    std::chrono::seconds subscription_overlap{10};

    /// Debounce delay for cache writes. Default: 15 seconds.
    std::chrono::milliseconds debounced_write_delay{15000};

    /// Maximum distance between an optimistic placeholder and its relay echo.
    /// Default: 60 seconds.
    std::chrono::seconds optimistic_match_tolerance{60};

    /// Idle period after which a newly arrived message forces an immediate
    /// cache flush. Default: 5 seconds.
    std::chrono::milliseconds recent_message_threshold{5000};

    /// Fraction of discovery relays that must answer a relay-list lookup
    /// before the lookup returns early. Default: 0.6.
    double discovery_majority_ratio = 0.6;

    /// Query, subscribe to and send the gift-wrapped protocol.
    bool enable_private_protocol = true;

    [[nodiscard]] static SyncConfig Default();

    /// Checks the invariants the engine relies on.
    ///
    /// @return Ok, or InvalidInput naming the first offending field
    [[nodiscard]] Result<Unit, DmFailure> Validate() const;
};

[[nodiscard]] const char* RelayModeToString(RelayMode mode) noexcept;

}
