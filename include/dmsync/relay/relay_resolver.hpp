#pragma once

#include "dmsync/core/cancellation.hpp"
#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/configuration/sync_config.hpp"
#include "dmsync/event/event.hpp"
#include "dmsync/interfaces/i_relay_transport.hpp"
#include "dmsync/merge/messaging_state.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace dmsync::relay {

/// Newest relay-list events published by one user.
struct RelayLists {
    std::optional<event::Event> relay_list;
    std::optional<event::Event> dm_inbox;
    std::optional<event::Event> blocked;

    bool operator==(const RelayLists& other) const = default;
};

struct DerivedRelaySet {
    std::vector<std::string> derived_relays;
    std::vector<std::string> blocked_relays;
};

enum class RelaySource : uint8_t {
    DmInbox = 0,
    ReadRelays = 1,
    WriteRelays = 2,
    SelfDeclared = 3,
    Discovery = 4
};

[[nodiscard]] const char* RelaySourceToString(RelaySource source) noexcept;

struct RelayResolution {
    std::vector<std::string> relays;
    RelaySource source = RelaySource::Discovery;
    /// The discovery fallback was used.
    bool degraded = false;
    /// RelayResolutionDegraded notice when `degraded`; the relays are still usable.
    std::optional<DmFailure> warning;
};

struct RelayListFetchResult {
    /// One entry per requested pubkey, empty lists when nothing was found.
    std::map<std::string, RelayLists> lists;
    std::map<std::string, merge::RelayInfo> relay_info;
    size_t responded = 0;
    /// No discovery relay answered successfully.
    bool degraded = false;
    /// The lookup was abandoned; lists and relay_info are empty.
    bool cancelled = false;
    std::optional<DmFailure> warning;
};

enum class StartupMode : uint8_t {
    Cold = 0,
    Warm = 1
};

struct RelayUser {
    std::string pubkey;
    bool is_current_user = false;
    std::string source;

    bool operator==(const RelayUser& other) const = default;
};

struct ConversationRelay {
    std::string relay;
    std::vector<RelayUser> users;
};

using ParticipantMap = std::map<std::string, merge::Participant>;
using RelayInfoMap = std::map<std::string, merge::RelayInfo>;

/**
 * @brief Relay discovery and per-user relay-set derivation
 *
 * Everything except FetchRelayLists is a pure function of its arguments.
 */
class RelayResolver {
public:
    /// Trims surrounding whitespace and one trailing '/'.
    [[nodiscard]] static std::string NormalizeRelayUrl(std::string_view url);

    /// Unique, trimmed "r" values of a kind 10006 event.
    [[nodiscard]] static std::vector<std::string> ExtractBlockedRelays(const std::optional<event::Event>& blocked);

    /**
     * @brief Relays to query for a user's direct messages
     *
     * Discovery mode returns the discovery relays. Otherwise the DM-inbox
     * "relay" tags come first, then the 10002 read relays (unmarked or
     * "read") when nothing was found yet or the mode is Hybrid; Hybrid then
     * appends the discovery relays. Order is kept, duplicates dropped.
     */
    [[nodiscard]] static DerivedRelaySet DeriveRelaySet(
        const RelayLists& lists,
        configuration::RelayMode mode,
        const std::vector<std::string>& discovery);

    /// DM inbox, else read relays, else discovery (degraded).
    [[nodiscard]] static RelayResolution ResolveInboxRelays(
        const RelayLists& lists,
        const std::vector<std::string>& discovery);

    /// Write relays, else discovery (degraded).
    [[nodiscard]] static RelayResolution ResolveOutboxRelays(
        const RelayLists& lists,
        const std::vector<std::string>& discovery);

    /// `base` plus every relay a relay-list event declares about itself.
    [[nodiscard]] static RelayResolution ResolvePublishRelays(
        const event::Event& event,
        const std::vector<std::string>& base);

    /**
     * @brief Look up kinds 10002, 10050 and 10006 for `pubkeys`
     *
     * Every discovery relay is queried in parallel. The call returns as soon
     * as ceil(n * majority_ratio) relays completed, or all of them did.
     * Later answers are discarded. The newest event per (pubkey, kind) wins.
     * Once `cancellation` fires the call returns within a poll interval and
     * relays that were not queried yet are skipped.
     */
    [[nodiscard]] static RelayListFetchResult FetchRelayLists(
        const std::shared_ptr<interfaces::IRelayTransport>& transport,
        const std::vector<std::string>& discovery,
        const std::vector<std::string>& pubkeys,
        std::chrono::milliseconds timeout,
        double majority_ratio,
        const CancellationToken& cancellation = CancellationToken());

    /// Success flags are ORed, the newer error wins, is_blocked is kept.
    [[nodiscard]] static RelayInfoMap MergeRelayInfo(const RelayInfoMap& older, const RelayInfoMap& newer);

    [[nodiscard]] static merge::Participant BuildParticipant(
        const std::string& pubkey,
        const RelayLists& lists,
        configuration::RelayMode mode,
        const std::vector<std::string>& discovery,
        int64_t now_ms);

    [[nodiscard]] static ParticipantMap BuildParticipants(
        const std::vector<std::string>& pubkeys,
        const std::map<std::string, RelayLists>& lists,
        configuration::RelayMode mode,
        const std::vector<std::string>& discovery,
        int64_t now_ms);

    /// Entries of `incoming` replace entries of `base`.
    [[nodiscard]] static ParticipantMap MergeParticipants(const ParticipantMap& base, const ParticipantMap& incoming);

    /// Pubkeys whose last_fetched_ms is older than now - ttl.
    [[nodiscard]] static std::vector<std::string> GetStaleParticipants(
        const ParticipantMap& participants,
        std::chrono::milliseconds ttl,
        int64_t now_ms);

    /// Members of `found` absent from `existing`, first occurrence order.
    [[nodiscard]] static std::vector<std::string> GetNewPubkeys(
        const std::vector<std::string>& found,
        const std::vector<std::string>& existing);

    /// Senders and participants other than `me`, first occurrence order.
    [[nodiscard]] static std::vector<std::string> ExtractOtherPubkeys(
        const std::vector<merge::DecryptedMessage>& messages,
        const std::string& me);

    /// Relay -> users who read from it, relays in first-seen order.
    [[nodiscard]] static std::vector<std::pair<std::string, std::vector<std::string>>> BuildRelayToUsersMap(
        const ParticipantMap& participants);

    [[nodiscard]] static std::vector<std::string> FindNewRelaysToQuery(
        const ParticipantMap& participants,
        const std::vector<std::string>& already_queried);

    /**
     * @brief Every relay the pass has queried
     *
     * Warm start: the cached queried set, else the user's own relays;
     * followed by `new_relays`, deduplicated.
     */
    [[nodiscard]] static std::vector<std::string> ComputeAllQueriedRelays(
        StartupMode mode,
        const std::optional<merge::MessagingState>& cached,
        const std::vector<std::string>& my_relays,
        const std::vector<std::string>& new_relays);

    /// Relays used by the conversation's members, most shared first.
    [[nodiscard]] static Result<std::vector<ConversationRelay>, DmFailure> GetConversationRelays(
        const std::string& conversation_id,
        const ParticipantMap& participants,
        const std::string& me);

private:
    RelayResolver() = delete;
};

}
