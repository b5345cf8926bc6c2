#include "dmsync/sync/sync_orchestrator.hpp"
#include "dmsync/sync/message_decryptor.hpp"
#include "dmsync/merge/merge_engine.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"
#include "dmsync/debug/logger.hpp"

#include <algorithm>
#include <future>
#include <set>

namespace dmsync::sync {

using merge::DecryptedMessage;
using merge::MergeEngine;
using merge::MessagingState;
using relay::RelayResolver;
using relay::StartupMode;

namespace {
    constexpr const char* COMPONENT = "orchestrator";

    Result<RunOutcome, DmFailure> CancelledRun() {
        return Result<RunOutcome, DmFailure>::Err(DmFailure::Cancelled("Sync run cancelled"));
    }

    std::vector<DecryptedMessage> DecryptBoth(
        const std::vector<event::Event>& legacy,
        const std::vector<event::Event>& wraps,
        const interfaces::ISigner& signer) {

        auto messages = MessageDecryptor::DecryptAll(legacy, signer);
        auto unwrapped = MessageDecryptor::DecryptAll(wraps, signer);
        messages.insert(messages.end(),
            std::make_move_iterator(unwrapped.begin()), std::make_move_iterator(unwrapped.end()));
        return messages;
    }

    ScanProgress ProgressOf(const FetchResult& fetch) {
        return ScanProgress{fetch.events.size(), fetch.limit_reached};
    }

    /// A single notice when both protocols failed in the same phase.
    std::optional<RelayError> CombineErrors(
        const std::optional<RelayError>& legacy,
        const std::optional<RelayError>& wraps,
        const size_t total_relays) {

        if (!legacy || !wraps) {
            return legacy ? legacy : wraps;
        }
        RelayError combined;
        combined.failed_relays = legacy->failed_relays;
        for (const auto& relay : wraps->failed_relays) {
            if (std::find(combined.failed_relays.begin(), combined.failed_relays.end(), relay) ==
                combined.failed_relays.end()) {
                combined.failed_relays.push_back(relay);
            }
        }
        combined.total_relays = total_relays;
        combined.message = compat::format("Failed to query {} of {} relays for messages",
            combined.failed_relays.size(), total_relays);
        return combined;
    }

    std::vector<std::string> KeysOf(const relay::ParticipantMap& participants) {
        std::vector<std::string> keys;
        keys.reserve(participants.size());
        for (const auto& [pubkey, participant] : participants) {
            keys.push_back(pubkey);
        }
        return keys;
    }
}

SyncOrchestrator::SyncOrchestrator(SyncDependencies dependencies, configuration::SyncConfig config, SyncHooks hooks)
    : deps_(std::move(dependencies))
    , config_(std::move(config))
    , hooks_(std::move(hooks)) {}

int64_t SyncOrchestrator::ComputeSince(
    const std::optional<int64_t> last_cache_time_ms,
    const MessageProtocol protocol,
    const std::chrono::seconds overlap) {

    if (!last_cache_time_ms) {
        return 0;
    }
    int64_t since = *last_cache_time_ms / 1000 - overlap.count();
    if (protocol == MessageProtocol::Private) {
        since -= SyncConstants::GIFT_WRAP_FUZZ_WINDOW.count();
    }
    return std::max<int64_t>(since, 0);
}

FetchLimits SyncOrchestrator::Limits() const {
    return FetchLimits{config_.batch_size, config_.query_limit, config_.query_timeout};
}

void SyncOrchestrator::EnterPhase(const SyncPhase phase, const CancellationToken& cancellation) const {
    if (cancellation.IsCancelled()) {
        return;
    }
    DMSYNC_LOG_INFO(COMPONENT, "Phase {}", SyncPhaseToString(phase));
    if (hooks_.on_phase) {
        hooks_.on_phase(phase);
    }
}

SyncOrchestrator::ProtocolFetch SyncOrchestrator::FetchBoth(
    const std::vector<std::string>& relays,
    const int64_t legacy_since,
    const int64_t private_since,
    const CancellationToken& cancellation) const {

    const std::string me = deps_.signer->GetPublicKey();
    const FetchLimits limits = Limits();
    auto& transport = *deps_.transport;

    auto legacy = std::async(std::launch::async, [&transport, &relays, &me, legacy_since, &limits, &cancellation]() {
        return MessageFetcher::Fetch(
            transport, relays, me, MessageProtocol::Legacy, legacy_since, limits, cancellation);
    });

    ProtocolFetch fetched;
    if (config_.enable_private_protocol) {
        fetched.wraps = MessageFetcher::Fetch(
            transport, relays, me, MessageProtocol::Private, private_since, limits, cancellation);
    }
    fetched.legacy = legacy.get();
    return fetched;
}

relay::ParticipantMap SyncOrchestrator::ResolveParticipants(
    const std::vector<std::string>& pubkeys,
    relay::RelayInfoMap& relay_info,
    const CancellationToken& cancellation) const {

    auto lookup = RelayResolver::FetchRelayLists(
        deps_.transport, config_.discovery_relays, pubkeys,
        config_.query_timeout, config_.discovery_majority_ratio, cancellation);
    if (lookup.cancelled) {
        return {};
    }
    if (lookup.warning) {
        DMSYNC_LOG_WARN(COMPONENT, "{}", lookup.warning->message);
    }
    relay_info = RelayResolver::MergeRelayInfo(relay_info, lookup.relay_info);
    return RelayResolver::BuildParticipants(
        pubkeys, lookup.lists, config_.relay_mode, config_.discovery_relays, deps_.clock());
}

Result<RunOutcome, DmFailure> SyncOrchestrator::Run(const CancellationToken& cancellation) {
    const std::string me = deps_.signer->GetPublicKey();
    RunOutcome outcome;
    if (cancellation.IsCancelled()) {
        return CancelledRun();
    }

    // Cache
    EnterPhase(SyncPhase::Cache, cancellation);
    std::optional<MessagingState> cached;
    if (auto read = deps_.store->ReadCache(me); read.IsErr()) {
        DMSYNC_LOG_WARN(COMPONENT, "Cache read failed, starting cold: {}", read.UnwrapErr().message);
    } else {
        cached = std::move(read).Unwrap();
    }
    if (cached && !cached->sync_state.last_cache_time_ms) {
        cached.reset();
    }
    outcome.mode = cached ? StartupMode::Warm : StartupMode::Cold;
    if (cancellation.IsCancelled()) {
        return CancelledRun();
    }
    if (cached) {
        DMSYNC_LOG_INFO(COMPONENT, "Warm start with {} cached conversations", cached->conversations.size());
        hooks_.on_state(*cached, PersistMode::None);
    }

    // Own relay set and participants
    relay::RelayInfoMap relay_info;
    auto my_lookup = RelayResolver::FetchRelayLists(
        deps_.transport, config_.discovery_relays, {me},
        config_.query_timeout, config_.discovery_majority_ratio, cancellation);
    if (my_lookup.cancelled || cancellation.IsCancelled()) {
        return CancelledRun();
    }
    if (my_lookup.warning) {
        DMSYNC_LOG_WARN(COMPONENT, "{}", my_lookup.warning->message);
    }
    relay_info = RelayResolver::MergeRelayInfo(relay_info, my_lookup.relay_info);
    const relay::RelayLists my_lists = my_lookup.lists[me];
    if (hooks_.on_my_relay_lists) {
        hooks_.on_my_relay_lists(my_lists);
    }

    auto my_participant = RelayResolver::BuildParticipant(
        me, my_lists, config_.relay_mode, config_.discovery_relays, deps_.clock());
    std::vector<std::string> my_relays = my_participant.derived_relays;
    if (my_relays.empty()) {
        DMSYNC_LOG_WARN(COMPONENT, "No relays derived for {} mode, falling back to discovery relays",
            configuration::RelayModeToString(config_.relay_mode));
        my_relays = config_.discovery_relays;
    }
    outcome.my_relays = my_relays;

    relay::ParticipantMap participants = cached ? cached->participants : relay::ParticipantMap{};
    participants = RelayResolver::MergeParticipants(participants, {{me, my_participant}});
    if (cached) {
        const auto stale = RelayResolver::GetStaleParticipants(participants, config_.relay_ttl, deps_.clock());
        if (!stale.empty()) {
            DMSYNC_LOG_INFO(COMPONENT, "Refreshing {} stale participants", stale.size());
            participants = RelayResolver::MergeParticipants(participants, ResolveParticipants(stale, relay_info, cancellation));
        }
        if (cancellation.IsCancelled()) {
            return CancelledRun();
        }
    }

    // InitialQuery
    EnterPhase(SyncPhase::InitialQuery, cancellation);
    const std::optional<int64_t> last_cache_time =
        cached ? cached->sync_state.last_cache_time_ms : std::nullopt;
    auto initial = FetchBoth(
        my_relays,
        ComputeSince(last_cache_time, MessageProtocol::Legacy, config_.subscription_overlap),
        ComputeSince(last_cache_time, MessageProtocol::Private, config_.subscription_overlap),
        cancellation);
    if (cancellation.IsCancelled() || initial.legacy.cancelled || initial.wraps.cancelled) {
        return CancelledRun();
    }
    if (hooks_.on_progress) {
        hooks_.on_progress(MessageProtocol::Legacy, ProgressOf(initial.legacy));
        hooks_.on_progress(MessageProtocol::Private, ProgressOf(initial.wraps));
    }
    relay_info = RelayResolver::MergeRelayInfo(relay_info, initial.legacy.relay_info);
    relay_info = RelayResolver::MergeRelayInfo(relay_info, initial.wraps.relay_info);

    auto initial_messages = DecryptBoth(initial.legacy.events, initial.wraps.events, *deps_.signer);
    const auto initial_error = CombineErrors(initial.legacy.relay_error, initial.wraps.relay_error, my_relays.size());
    const bool initial_limit = initial.legacy.limit_reached || initial.wraps.limit_reached;

    {
        const auto queried = RelayResolver::ComputeAllQueriedRelays(outcome.mode, cached, my_relays, {});
        merge::BuildInput input;
        input.me = me;
        input.participants = participants;
        input.initial = initial_messages;
        input.queried_relays = std::set<std::string>(queried.begin(), queried.end());
        input.limit_reached = initial_limit;
        input.relay_info = relay_info;
        input.now_ms = deps_.clock();
        auto state = MergeEngine::BuildMessagingState(input);

        const int64_t now_s = input.now_ms / 1000;
        if (!initial.legacy.relay_error) {
            state.last_sync.legacy = now_s;
        }
        if (config_.enable_private_protocol && !initial.wraps.relay_error) {
            state.last_sync.private_messages = now_s;
        }
        if (initial_error) {
            state.sync_state.last_cache_time_ms = last_cache_time;
        }
        if (cancellation.IsCancelled()) {
            return CancelledRun();
        }
        hooks_.on_state(state, initial_error ? PersistMode::Immediate : PersistMode::Debounced);
    }

    if (initial_error) {
        DMSYNC_LOG_ERROR(COMPONENT, "Initial query failed: {}", initial_error->message);
        outcome.relay_error = initial_error;
        outcome.failed_phases.push_back(SyncPhase::InitialQuery);
        if (hooks_.on_relay_error) {
            hooks_.on_relay_error(*initial_error);
        }
        EnterPhase(SyncPhase::Error, cancellation);
    } else {
        // GapFill
        EnterPhase(SyncPhase::GapFill, cancellation);
        const auto found = RelayResolver::ExtractOtherPubkeys(initial_messages, me);
        const auto new_pubkeys = RelayResolver::GetNewPubkeys(found, KeysOf(participants));
        if (!new_pubkeys.empty()) {
            DMSYNC_LOG_INFO(COMPONENT, "Resolving relays of {} new participants", new_pubkeys.size());
            participants = RelayResolver::MergeParticipants(ResolveParticipants(new_pubkeys, relay_info, cancellation), participants);
        }
        if (cancellation.IsCancelled()) {
            return CancelledRun();
        }

        const std::vector<std::string> already_queried = cached
            ? std::vector<std::string>(cached->sync_state.queried_relays.begin(), cached->sync_state.queried_relays.end())
            : my_relays;
        outcome.gap_fill_relays = RelayResolver::FindNewRelaysToQuery(participants, already_queried);

        ProtocolFetch gap;
        if (!outcome.gap_fill_relays.empty()) {
            DMSYNC_LOG_INFO(COMPONENT, "Gap filling from {} new relays", outcome.gap_fill_relays.size());
            gap = FetchBoth(outcome.gap_fill_relays, 0, 0, cancellation);
            if (cancellation.IsCancelled() || gap.legacy.cancelled || gap.wraps.cancelled) {
                return CancelledRun();
            }
            if (const auto gap_error = CombineErrors(gap.legacy.relay_error, gap.wraps.relay_error,
                    outcome.gap_fill_relays.size())) {
                DMSYNC_LOG_WARN(COMPONENT, "Gap fill incomplete: {}", gap_error->message);
            }
            relay_info = RelayResolver::MergeRelayInfo(relay_info, gap.legacy.relay_info);
            relay_info = RelayResolver::MergeRelayInfo(relay_info, gap.wraps.relay_info);
        }

        const auto queried = RelayResolver::ComputeAllQueriedRelays(
            outcome.mode, cached, my_relays, outcome.gap_fill_relays);
        merge::BuildInput input;
        input.me = me;
        input.participants = participants;
        input.initial = std::move(initial_messages);
        input.gap_fill = DecryptBoth(gap.legacy.events, gap.wraps.events, *deps_.signer);
        input.queried_relays = std::set<std::string>(queried.begin(), queried.end());
        input.limit_reached = initial_limit || gap.legacy.limit_reached || gap.wraps.limit_reached;
        input.relay_info = relay_info;
        input.now_ms = deps_.clock();
        auto state = MergeEngine::BuildMessagingState(input);
        state.last_sync.legacy = input.now_ms / 1000;
        if (config_.enable_private_protocol) {
            state.last_sync.private_messages = input.now_ms / 1000;
        }
        if (cancellation.IsCancelled()) {
            return CancelledRun();
        }
        hooks_.on_state(state, PersistMode::Immediate);
    }

    // Subscriptions
    EnterPhase(SyncPhase::Subscriptions, cancellation);
    if (hooks_.start_subscriptions && !cancellation.IsCancelled()) {
        if (auto started = hooks_.start_subscriptions(my_relays); started.IsErr()) {
            DMSYNC_LOG_WARN(COMPONENT, "Live subscriptions incomplete: {}", started.UnwrapErr().message);
            outcome.failed_phases.push_back(SyncPhase::Subscriptions);
        }
    }
    if (cancellation.IsCancelled()) {
        return CancelledRun();
    }

    EnterPhase(SyncPhase::Ready, cancellation);
    return Result<RunOutcome, DmFailure>::Ok(std::move(outcome));
}

}
