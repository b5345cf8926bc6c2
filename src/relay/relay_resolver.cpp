#include "dmsync/relay/relay_resolver.hpp"
#include "dmsync/relay/relay_query.hpp"
#include "dmsync/merge/merge_engine.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"
#include "dmsync/debug/logger.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace dmsync::relay {

using configuration::RelayMode;

namespace {
    constexpr const char* COMPONENT = "relay";
    constexpr std::string_view WHITESPACE = " \t\r\n";
    constexpr std::chrono::milliseconds CANCELLATION_POLL{50};

    /// Answers collected by the detached lookup threads.
    struct LookupRound {
        std::mutex lock;
        std::condition_variable completed;
        std::vector<RelayAnswer> answers;
    };

    std::string Trim(const std::string_view value) {
        const size_t first = value.find_first_not_of(WHITESPACE);
        if (first == std::string_view::npos) {
            return {};
        }
        const size_t last = value.find_last_not_of(WHITESPACE);
        return std::string(value.substr(first, last - first + 1));
    }

    void AppendUnique(std::vector<std::string>& values, const std::string& value) {
        if (!value.empty() && std::find(values.begin(), values.end(), value) == values.end()) {
            values.push_back(value);
        }
    }

    void AppendTagRelays(std::vector<std::string>& relays, const event::Tags& tags, const std::string_view name) {
        for (const auto& tag : tags) {
            if (tag.size() >= 2 && tag[0] == name) {
                AppendUnique(relays, Trim(tag[1]));
            }
        }
    }

    /// 10002 "r" tags whose marker is absent or equal to `marker`.
    std::vector<std::string> MarkedRelays(const std::optional<event::Event>& relay_list, const std::string_view marker) {
        std::vector<std::string> relays;
        if (!relay_list) {
            return relays;
        }
        for (const auto& tag : relay_list->tags) {
            if (tag.size() < 2 || tag[0] != "r") {
                continue;
            }
            if (tag.size() >= 3 && !tag[2].empty() && tag[2] != marker) {
                continue;
            }
            AppendUnique(relays, Trim(tag[1]));
        }
        return relays;
    }

    std::vector<std::string> InboxRelays(const std::optional<event::Event>& dm_inbox) {
        std::vector<std::string> relays;
        if (dm_inbox) {
            AppendTagRelays(relays, dm_inbox->tags, "relay");
        }
        return relays;
    }

    RelayResolution Fallback(const std::vector<std::string>& discovery, const std::string_view what) {
        RelayResolution resolution;
        resolution.relays = discovery;
        resolution.source = RelaySource::Discovery;
        resolution.degraded = true;
        resolution.warning = DmFailure::RelayResolutionDegraded(
            compat::format("No {} relays published, using {} discovery relays", what, discovery.size()));
        return resolution;
    }

    size_t MajorityThreshold(const size_t relay_count, const double ratio) {
        const auto needed = static_cast<size_t>(std::ceil(static_cast<double>(relay_count) * ratio));
        return std::clamp<size_t>(needed, 1, relay_count);
    }

    void KeepNewest(std::optional<event::Event>& slot, const event::Event& candidate) {
        if (!slot || candidate.created_at > slot->created_at) {
            slot = candidate;
        }
    }
}

const char* RelaySourceToString(const RelaySource source) noexcept {
    switch (source) {
        case RelaySource::DmInbox: return "dm-inbox";
        case RelaySource::ReadRelays: return "read";
        case RelaySource::WriteRelays: return "write";
        case RelaySource::SelfDeclared: return "self-declared";
        case RelaySource::Discovery: return "discovery";
    }
    return "unknown";
}

std::string RelayResolver::NormalizeRelayUrl(const std::string_view url) {
    std::string normalized = Trim(url);
    if (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

std::vector<std::string> RelayResolver::ExtractBlockedRelays(const std::optional<event::Event>& blocked) {
    std::vector<std::string> relays;
    if (blocked) {
        AppendTagRelays(relays, blocked->tags, "r");
    }
    return relays;
}

DerivedRelaySet RelayResolver::DeriveRelaySet(
    const RelayLists& lists,
    const RelayMode mode,
    const std::vector<std::string>& discovery) {

    DerivedRelaySet derived;
    derived.blocked_relays = ExtractBlockedRelays(lists.blocked);

    if (mode == RelayMode::Discovery) {
        derived.derived_relays = discovery;
        return derived;
    }

    derived.derived_relays = InboxRelays(lists.dm_inbox);
    if (derived.derived_relays.empty() || mode == RelayMode::Hybrid) {
        for (const auto& relay : MarkedRelays(lists.relay_list, "read")) {
            AppendUnique(derived.derived_relays, relay);
        }
    }
    if (mode == RelayMode::Hybrid) {
        for (const auto& relay : discovery) {
            AppendUnique(derived.derived_relays, relay);
        }
    }
    return derived;
}

RelayResolution RelayResolver::ResolveInboxRelays(
    const RelayLists& lists,
    const std::vector<std::string>& discovery) {

    if (auto inbox = InboxRelays(lists.dm_inbox); !inbox.empty()) {
        return RelayResolution{std::move(inbox), RelaySource::DmInbox, false, std::nullopt};
    }
    if (auto read = MarkedRelays(lists.relay_list, "read"); !read.empty()) {
        return RelayResolution{std::move(read), RelaySource::ReadRelays, false, std::nullopt};
    }
    return Fallback(discovery, "inbox");
}

RelayResolution RelayResolver::ResolveOutboxRelays(
    const RelayLists& lists,
    const std::vector<std::string>& discovery) {

    if (auto write = MarkedRelays(lists.relay_list, "write"); !write.empty()) {
        return RelayResolution{std::move(write), RelaySource::WriteRelays, false, std::nullopt};
    }
    return Fallback(discovery, "outbox");
}

RelayResolution RelayResolver::ResolvePublishRelays(
    const event::Event& event,
    const std::vector<std::string>& base) {

    RelayResolution resolution;
    resolution.source = RelaySource::SelfDeclared;
    for (const auto& relay : base) {
        AppendUnique(resolution.relays, relay);
    }
    if (event.kind == EventKind::DM_INBOX_RELAYS) {
        AppendTagRelays(resolution.relays, event.tags, "relay");
    } else if (event.kind == EventKind::RELAY_LIST) {
        AppendTagRelays(resolution.relays, event.tags, "r");
    }
    return resolution;
}

RelayListFetchResult RelayResolver::FetchRelayLists(
    const std::shared_ptr<interfaces::IRelayTransport>& transport,
    const std::vector<std::string>& discovery,
    const std::vector<std::string>& pubkeys,
    const std::chrono::milliseconds timeout,
    const double majority_ratio,
    const CancellationToken& cancellation) {

    RelayListFetchResult result;
    if (pubkeys.empty()) {
        return result;
    }
    if (cancellation.IsCancelled()) {
        result.cancelled = true;
        result.warning = DmFailure::Cancelled("Relay list lookup cancelled");
        return result;
    }
    for (const auto& pubkey : pubkeys) {
        result.lists.try_emplace(pubkey);
    }
    if (discovery.empty() || !transport) {
        result.degraded = true;
        result.warning = DmFailure::RelayResolutionDegraded("No discovery relays to look up relay lists");
        return result;
    }

    event::Filter filter;
    filter.kinds = {EventKind::RELAY_LIST, EventKind::DM_INBOX_RELAYS, EventKind::BLOCKED_RELAYS};
    filter.authors = pubkeys;
    const std::vector<event::Filter> filters{filter};

    // Threads own a reference to the transport and the round, so answers
    // arriving after the early exit land in a buffer nobody reads.
    auto round = std::make_shared<LookupRound>();
    for (const auto& relay : discovery) {
        std::thread([round, transport, relay, filters, timeout, cancellation]() {
            RelayAnswer answer;
            if (cancellation.IsCancelled()) {
                answer.relay = relay;
                answer.error = "cancelled";
            } else {
                answer = QueryRelay(*transport, relay, filters, timeout);
            }
            {
                std::lock_guard<std::mutex> guard(round->lock);
                round->answers.push_back(std::move(answer));
            }
            round->completed.notify_all();
        }).detach();
    }

    const size_t threshold = MajorityThreshold(discovery.size(), majority_ratio);
    std::vector<RelayAnswer> answers;
    {
        std::unique_lock<std::mutex> lock(round->lock);
        const auto enough = [&round, threshold]() { return round->answers.size() >= threshold; };
        while (!round->completed.wait_for(lock, CANCELLATION_POLL, enough)) {
            if (cancellation.IsCancelled()) {
                result.cancelled = true;
                result.warning = DmFailure::Cancelled("Relay list lookup cancelled");
                return result;
            }
        }
        answers = round->answers;
    }
    result.responded = answers.size();
    if (answers.size() < discovery.size()) {
        DMSYNC_LOG_INFO(COMPONENT, "Early exit: {}/{} discovery relays responded",
            answers.size(), discovery.size());
    }

    bool any_succeeded = false;
    for (const auto& answer : answers) {
        merge::RelayInfo info;
        info.last_query_succeeded = answer.succeeded;
        if (!answer.succeeded) {
            info.last_query_error = answer.error;
            DMSYNC_LOG_WARN(COMPONENT, "Relay list lookup on {} failed: {}", answer.relay, answer.error);
            result.relay_info[answer.relay] = std::move(info);
            continue;
        }
        any_succeeded = true;
        result.relay_info[answer.relay] = std::move(info);

        for (const auto& found : answer.events) {
            const auto lists = result.lists.find(found.pubkey);
            if (lists == result.lists.end()) {
                continue;
            }
            switch (found.kind) {
                case EventKind::RELAY_LIST: KeepNewest(lists->second.relay_list, found); break;
                case EventKind::DM_INBOX_RELAYS: KeepNewest(lists->second.dm_inbox, found); break;
                case EventKind::BLOCKED_RELAYS: KeepNewest(lists->second.blocked, found); break;
                default: break;
            }
        }
    }

    if (!any_succeeded) {
        result.degraded = true;
        result.warning = DmFailure::RelayResolutionDegraded(compat::format(
            "None of {} discovery relays answered the relay list lookup", discovery.size()));
    }
    return result;
}

RelayInfoMap RelayResolver::MergeRelayInfo(const RelayInfoMap& older, const RelayInfoMap& newer) {
    RelayInfoMap merged = older;
    for (const auto& [relay, info] : newer) {
        auto [it, inserted] = merged.try_emplace(relay, info);
        if (inserted) {
            continue;
        }
        it->second.last_query_succeeded = it->second.last_query_succeeded || info.last_query_succeeded;
        if (info.last_query_error) {
            it->second.last_query_error = info.last_query_error;
        }
    }
    return merged;
}

merge::Participant RelayResolver::BuildParticipant(
    const std::string& pubkey,
    const RelayLists& lists,
    const RelayMode mode,
    const std::vector<std::string>& discovery,
    const int64_t now_ms) {

    auto derived = DeriveRelaySet(lists, mode, discovery);
    merge::Participant participant;
    participant.pubkey = pubkey;
    participant.derived_relays = std::move(derived.derived_relays);
    participant.blocked_relays.insert(derived.blocked_relays.begin(), derived.blocked_relays.end());
    participant.last_fetched_ms = now_ms;
    return participant;
}

ParticipantMap RelayResolver::BuildParticipants(
    const std::vector<std::string>& pubkeys,
    const std::map<std::string, RelayLists>& lists,
    const RelayMode mode,
    const std::vector<std::string>& discovery,
    const int64_t now_ms) {

    static const RelayLists NONE;
    ParticipantMap participants;
    for (const auto& pubkey : pubkeys) {
        const auto found = lists.find(pubkey);
        participants[pubkey] = BuildParticipant(
            pubkey, found == lists.end() ? NONE : found->second, mode, discovery, now_ms);
    }
    return participants;
}

ParticipantMap RelayResolver::MergeParticipants(const ParticipantMap& base, const ParticipantMap& incoming) {
    ParticipantMap merged = base;
    for (const auto& [pubkey, participant] : incoming) {
        merged[pubkey] = participant;
    }
    return merged;
}

std::vector<std::string> RelayResolver::GetStaleParticipants(
    const ParticipantMap& participants,
    const std::chrono::milliseconds ttl,
    const int64_t now_ms) {

    const int64_t threshold = now_ms - ttl.count();
    std::vector<std::string> stale;
    for (const auto& [pubkey, participant] : participants) {
        if (participant.last_fetched_ms < threshold) {
            stale.push_back(pubkey);
        }
    }
    return stale;
}

std::vector<std::string> RelayResolver::GetNewPubkeys(
    const std::vector<std::string>& found,
    const std::vector<std::string>& existing) {

    const std::unordered_set<std::string> known(existing.begin(), existing.end());
    std::vector<std::string> fresh;
    for (const auto& pubkey : found) {
        if (known.count(pubkey) == 0) {
            AppendUnique(fresh, pubkey);
        }
    }
    return fresh;
}

std::vector<std::string> RelayResolver::ExtractOtherPubkeys(
    const std::vector<merge::DecryptedMessage>& messages,
    const std::string& me) {

    std::vector<std::string> others;
    for (const auto& message : messages) {
        if (message.message.sender_pubkey != me) {
            AppendUnique(others, message.message.sender_pubkey);
        }
        for (const auto& pubkey : message.participants) {
            if (pubkey != me) {
                AppendUnique(others, pubkey);
            }
        }
    }
    return others;
}

std::vector<std::pair<std::string, std::vector<std::string>>> RelayResolver::BuildRelayToUsersMap(
    const ParticipantMap& participants) {

    std::vector<std::pair<std::string, std::vector<std::string>>> relay_users;
    std::unordered_map<std::string, size_t> index;
    for (const auto& [pubkey, participant] : participants) {
        for (const auto& relay : participant.derived_relays) {
            auto [it, inserted] = index.try_emplace(relay, relay_users.size());
            if (inserted) {
                relay_users.emplace_back(relay, std::vector<std::string>{});
            }
            relay_users[it->second].second.push_back(pubkey);
        }
    }
    return relay_users;
}

std::vector<std::string> RelayResolver::FindNewRelaysToQuery(
    const ParticipantMap& participants,
    const std::vector<std::string>& already_queried) {

    const std::unordered_set<std::string> queried(already_queried.begin(), already_queried.end());
    std::vector<std::string> fresh;
    for (const auto& [relay, users] : BuildRelayToUsersMap(participants)) {
        if (queried.count(relay) == 0) {
            fresh.push_back(relay);
        }
    }
    return fresh;
}

std::vector<std::string> RelayResolver::ComputeAllQueriedRelays(
    const StartupMode mode,
    const std::optional<merge::MessagingState>& cached,
    const std::vector<std::string>& my_relays,
    const std::vector<std::string>& new_relays) {

    std::vector<std::string> all;
    if (mode == StartupMode::Warm && cached) {
        for (const auto& relay : cached->sync_state.queried_relays) {
            AppendUnique(all, relay);
        }
    } else {
        for (const auto& relay : my_relays) {
            AppendUnique(all, relay);
        }
    }
    for (const auto& relay : new_relays) {
        AppendUnique(all, relay);
    }
    return all;
}

Result<std::vector<ConversationRelay>, DmFailure> RelayResolver::GetConversationRelays(
    const std::string& conversation_id,
    const ParticipantMap& participants,
    const std::string& me) {

    auto parsed = merge::MergeEngine::ParseConversationId(conversation_id);
    if (parsed.IsErr()) {
        return Fail(std::move(parsed).UnwrapErr());
    }

    std::vector<ConversationRelay> relays;
    std::unordered_map<std::string, size_t> index;
    for (const auto& pubkey : parsed.Unwrap().participants) {
        const auto participant = participants.find(pubkey);
        if (participant == participants.end()) {
            continue;
        }
        const bool is_me = pubkey == me;
        for (const auto& relay : participant->second.derived_relays) {
            auto normalized = NormalizeRelayUrl(relay);
            auto [it, inserted] = index.try_emplace(normalized, relays.size());
            if (inserted) {
                relays.push_back(ConversationRelay{std::move(normalized), {}});
            }
            relays[it->second].users.push_back(
                RelayUser{pubkey, is_me, is_me ? "Your inbox relays" : "Inbox relays"});
        }
    }

    std::stable_sort(relays.begin(), relays.end(), [](const ConversationRelay& a, const ConversationRelay& b) {
        return a.users.size() > b.users.size();
    });
    return Result<std::vector<ConversationRelay>, DmFailure>::Ok(std::move(relays));
}

}
