#pragma once

#include "dmsync/core/cancellation.hpp"
#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/configuration/sync_config.hpp"
#include "dmsync/interfaces/i_cache_store.hpp"
#include "dmsync/interfaces/i_relay_transport.hpp"
#include "dmsync/interfaces/i_signer.hpp"
#include "dmsync/merge/messaging_state.hpp"
#include "dmsync/relay/relay_resolver.hpp"
#include "dmsync/sync/message_fetcher.hpp"
#include "dmsync/sync/sync_types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dmsync::sync {

/// Everything the orchestrator proposes to its owner while it runs.
struct SyncHooks {
    std::function<void(SyncPhase)> on_phase;
    /// Merge `incoming` into the canonical state.
    std::function<void(const merge::MessagingState& incoming, PersistMode persist)> on_state;
    std::function<void(MessageProtocol, const ScanProgress&)> on_progress;
    std::function<void(const RelayError&)> on_relay_error;
    /// The local user's newest relay-list events.
    std::function<void(const relay::RelayLists&)> on_my_relay_lists;
    std::function<Result<Unit, DmFailure>(const std::vector<std::string>& relays)> start_subscriptions;
};

struct SyncDependencies {
    std::shared_ptr<interfaces::IRelayTransport> transport;
    std::shared_ptr<const interfaces::ISigner> signer;
    std::shared_ptr<interfaces::ICacheStore> store;
    UnixClock clock;
};

struct RunOutcome {
    relay::StartupMode mode = relay::StartupMode::Cold;
    /// Relays the user's messages were read from; the live subscriptions use them too.
    std::vector<std::string> my_relays;
    std::vector<std::string> gap_fill_relays;
    std::optional<RelayError> relay_error;
    /// Phases that finished in Error; the run still reached Ready.
    std::vector<SyncPhase> failed_phases;
};

/**
 * @brief One cold or warm synchronisation pass
 *
 *   Cache -> InitialQuery -> GapFill -> Subscriptions -> Ready
 *
 * The orchestrator never owns state. Everything it learns is proposed
 * through SyncHooks::on_state and merged by the owner.
 */
class SyncOrchestrator {
public:
    SyncOrchestrator(SyncDependencies dependencies, configuration::SyncConfig config, SyncHooks hooks);

    /**
     * @brief Run every phase in order
     *
     * @return Cancelled when the token fired; no hook is invoked after
     *         cancellation is observed
     */
    [[nodiscard]] Result<RunOutcome, DmFailure> Run(const CancellationToken& cancellation);

    /**
     * Lower bound for the initial query. 0 without a cache time; otherwise
     * the cache time in seconds minus the overlap, and for PRIVATE minus the
     * gift-wrap fuzz window as well.
     */
    [[nodiscard]] static int64_t ComputeSince(
        std::optional<int64_t> last_cache_time_ms,
        MessageProtocol protocol,
        std::chrono::seconds overlap);

private:
    struct ProtocolFetch {
        FetchResult legacy;
        FetchResult wraps;
    };

    [[nodiscard]] ProtocolFetch FetchBoth(
        const std::vector<std::string>& relays,
        int64_t legacy_since,
        int64_t private_since,
        const CancellationToken& cancellation) const;

    [[nodiscard]] relay::ParticipantMap ResolveParticipants(
        const std::vector<std::string>& pubkeys,
        relay::RelayInfoMap& relay_info,
        const CancellationToken& cancellation) const;

    void EnterPhase(SyncPhase phase, const CancellationToken& cancellation) const;

    [[nodiscard]] FetchLimits Limits() const;

    SyncDependencies deps_;
    configuration::SyncConfig config_;
    SyncHooks hooks_;
};

}
