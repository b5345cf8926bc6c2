#include <catch2/catch_test_macros.hpp>
#include "dmsync/relay/relay_resolver.hpp"
#include "dmsync/merge/merge_engine.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/cancellation.hpp"
#include "helpers/fake_relay_network.hpp"
#include "helpers/test_identities.hpp"
#include <chrono>
#include <thread>
using namespace dmsync;
using namespace dmsync::relay;
using namespace dmsync::test_helpers;
using configuration::RelayMode;
using namespace std::chrono_literals;

namespace {
    const std::vector<std::string> DISCOVERY = {"wss://d1", "wss://d2"};

    event::Event ListEvent(const uint32_t kind, const event::Tags& tags, const int64_t created_at = 100) {
        event::Event list;
        list.kind = kind;
        list.tags = tags;
        list.created_at = created_at;
        return list;
    }

    RelayLists FullLists() {
        RelayLists lists;
        lists.dm_inbox = ListEvent(EventKind::DM_INBOX_RELAYS, {{"relay", "wss://inbox"}});
        lists.relay_list = ListEvent(EventKind::RELAY_LIST, {
            {"r", "wss://both"},
            {"r", "wss://read", "read"},
            {"r", "wss://write", "write"},
        });
        lists.blocked = ListEvent(EventKind::BLOCKED_RELAYS, {{"r", " wss://spam "}, {"r", "wss://spam"}});
        return lists;
    }
}

TEST_CASE("RelayResolver - Derived relay sets", "[relay][resolver]") {
    const auto lists = FullLists();

    SECTION("Discovery mode ignores published lists") {
        const auto derived = RelayResolver::DeriveRelaySet(lists, RelayMode::Discovery, DISCOVERY);
        REQUIRE(derived.derived_relays == DISCOVERY);
    }
    SECTION("Hybrid is inbox, then read relays, then discovery") {
        const auto derived = RelayResolver::DeriveRelaySet(lists, RelayMode::Hybrid, DISCOVERY);
        REQUIRE(derived.derived_relays ==
                std::vector<std::string>{"wss://inbox", "wss://both", "wss://read", "wss://d1", "wss://d2"});
        REQUIRE(derived.blocked_relays == std::vector<std::string>{"wss://spam"});
    }
    SECTION("Strict outbox prefers the inbox list alone") {
        const auto derived = RelayResolver::DeriveRelaySet(lists, RelayMode::StrictOutbox, DISCOVERY);
        REQUIRE(derived.derived_relays == std::vector<std::string>{"wss://inbox"});
    }
    SECTION("Strict outbox falls back to read relays") {
        auto no_inbox = lists;
        no_inbox.dm_inbox.reset();
        const auto derived = RelayResolver::DeriveRelaySet(no_inbox, RelayMode::StrictOutbox, DISCOVERY);
        REQUIRE(derived.derived_relays == std::vector<std::string>{"wss://both", "wss://read"});
    }
    SECTION("Strict outbox with nothing published is empty") {
        const auto derived = RelayResolver::DeriveRelaySet(RelayLists{}, RelayMode::StrictOutbox, DISCOVERY);
        REQUIRE(derived.derived_relays.empty());
    }
}

TEST_CASE("RelayResolver - Inbox and outbox resolution", "[relay][resolver]") {
    SECTION("Inbox list wins") {
        const auto resolution = RelayResolver::ResolveInboxRelays(FullLists(), DISCOVERY);
        REQUIRE(resolution.source == RelaySource::DmInbox);
        REQUIRE(resolution.relays == std::vector<std::string>{"wss://inbox"});
        REQUIRE_FALSE(resolution.degraded);
    }
    SECTION("Read relays next") {
        auto lists = FullLists();
        lists.dm_inbox.reset();
        const auto resolution = RelayResolver::ResolveInboxRelays(lists, DISCOVERY);
        REQUIRE(resolution.source == RelaySource::ReadRelays);
        REQUIRE(resolution.relays == std::vector<std::string>{"wss://both", "wss://read"});
    }
    SECTION("Nothing published degrades to discovery") {
        const auto resolution = RelayResolver::ResolveInboxRelays(RelayLists{}, DISCOVERY);
        REQUIRE(resolution.degraded);
        REQUIRE(resolution.relays == DISCOVERY);
        REQUIRE(resolution.warning->type == DmFailureType::RelayResolutionDegraded);
    }
    SECTION("Outbox uses write and unmarked relays") {
        const auto resolution = RelayResolver::ResolveOutboxRelays(FullLists(), DISCOVERY);
        REQUIRE(resolution.source == RelaySource::WriteRelays);
        REQUIRE(resolution.relays == std::vector<std::string>{"wss://both", "wss://write"});
        REQUIRE(RelayResolver::ResolveOutboxRelays(RelayLists{}, DISCOVERY).degraded);
    }
    SECTION("Relay list events are published to the relays they declare") {
        const auto inbox = ListEvent(EventKind::DM_INBOX_RELAYS, {{"relay", "wss://new"}});
        const auto resolution = RelayResolver::ResolvePublishRelays(inbox, {"wss://out"});
        REQUIRE(resolution.relays == std::vector<std::string>{"wss://out", "wss://new"});
    }
}

TEST_CASE("RelayResolver - URL helpers", "[relay][resolver]") {
    REQUIRE(RelayResolver::NormalizeRelayUrl("  wss://relay.example/ ") == "wss://relay.example");
    REQUIRE(RelayResolver::NormalizeRelayUrl("wss://relay.example") == "wss://relay.example");
    REQUIRE(RelayResolver::ExtractBlockedRelays(std::nullopt).empty());
    REQUIRE(std::string(RelaySourceToString(RelaySource::DmInbox)) == "dm-inbox");
}

TEST_CASE("RelayResolver - Participants", "[relay][resolver]") {
    const int64_t now_ms = 10'000'000;

    SECTION("Build and staleness") {
        std::map<std::string, RelayLists> lists;
        lists["alice"] = FullLists();
        auto participants = RelayResolver::BuildParticipants(
            {"alice", "bob"}, lists, RelayMode::StrictOutbox, DISCOVERY, now_ms);
        REQUIRE(participants.at("alice").derived_relays == std::vector<std::string>{"wss://inbox"});
        REQUIRE(participants.at("alice").blocked_relays.contains("wss://spam"));
        REQUIRE(participants.at("bob").derived_relays.empty());

        participants.at("bob").last_fetched_ms = now_ms - 2000;
        const auto stale = RelayResolver::GetStaleParticipants(participants, 1000ms, now_ms);
        REQUIRE(stale == std::vector<std::string>{"bob"});
    }
    SECTION("Incoming participants replace existing ones") {
        ParticipantMap base;
        base["alice"].derived_relays = {"wss://old"};
        base["bob"].derived_relays = {"wss://b"};
        ParticipantMap incoming;
        incoming["alice"].derived_relays = {"wss://new"};
        const auto merged = RelayResolver::MergeParticipants(base, incoming);
        REQUIRE(merged.at("alice").derived_relays == std::vector<std::string>{"wss://new"});
        REQUIRE(merged.at("bob").derived_relays == std::vector<std::string>{"wss://b"});
    }
    SECTION("New pubkeys and other pubkeys") {
        REQUIRE(RelayResolver::GetNewPubkeys({"a", "b", "a", "c"}, {"b"}) == std::vector<std::string>{"a", "c"});

        merge::DecryptedMessage message;
        message.participants = {"me", "x", "y"};
        message.message.sender_pubkey = "y";
        REQUIRE(RelayResolver::ExtractOtherPubkeys({message}, "me") == std::vector<std::string>{"y", "x"});
    }
}

TEST_CASE("RelayResolver - Relays to query", "[relay][resolver]") {
    ParticipantMap participants;
    participants["a"].derived_relays = {"wss://1", "wss://2"};
    participants["b"].derived_relays = {"wss://2", "wss://3"};

    SECTION("Relay to users") {
        const auto map = RelayResolver::BuildRelayToUsersMap(participants);
        REQUIRE(map.size() == 3);
        REQUIRE(map[1].first == "wss://2");
        REQUIRE(map[1].second == std::vector<std::string>{"a", "b"});
    }
    SECTION("Only relays not yet queried") {
        REQUIRE(RelayResolver::FindNewRelaysToQuery(participants, {"wss://1", "wss://2"}) ==
                std::vector<std::string>{"wss://3"});
    }
    SECTION("All queried relays on a warm start") {
        merge::MessagingState cached;
        cached.sync_state.queried_relays = {"wss://c"};
        const auto warm = RelayResolver::ComputeAllQueriedRelays(
            StartupMode::Warm, cached, {"wss://mine"}, {"wss://new", "wss://c"});
        REQUIRE(warm == std::vector<std::string>{"wss://c", "wss://new"});
        const auto cold = RelayResolver::ComputeAllQueriedRelays(
            StartupMode::Cold, std::nullopt, {"wss://mine"}, {"wss://new"});
        REQUIRE(cold == std::vector<std::string>{"wss://mine", "wss://new"});
    }
}

TEST_CASE("RelayResolver - Conversation relays", "[relay][resolver]") {
    const std::string me(64, 'a');
    const std::string bob(64, 'b');
    ParticipantMap participants;
    participants[me].derived_relays = {"wss://mine", "wss://shared/"};
    participants[bob].derived_relays = {"wss://shared", "wss://bobs"};

    const auto id = merge::MergeEngine::ComputeConversationId({me, bob}, "");
    const auto relays = RelayResolver::GetConversationRelays(id, participants, me).Unwrap();
    REQUIRE(relays.size() == 3);
    REQUIRE(relays[0].relay == "wss://shared");
    REQUIRE(relays[0].users.size() == 2);
    REQUIRE(relays[0].users[0].is_current_user);
    REQUIRE_FALSE(relays[0].users[1].is_current_user);

    REQUIRE(RelayResolver::GetConversationRelays("bogus", participants, me).IsErr());
}

TEST_CASE("RelayResolver - Relay info merge", "[relay][resolver]") {
    RelayInfoMap older;
    older["wss://a"] = merge::RelayInfo{true, std::nullopt, true};
    RelayInfoMap newer;
    newer["wss://a"] = merge::RelayInfo{false, std::string("timeout"), false};
    newer["wss://b"] = merge::RelayInfo{true, std::nullopt, false};

    const auto merged = RelayResolver::MergeRelayInfo(older, newer);
    REQUIRE(merged.at("wss://a").last_query_succeeded);
    REQUIRE(merged.at("wss://a").last_query_error == std::optional<std::string>("timeout"));
    REQUIRE(merged.at("wss://a").is_blocked);
    REQUIRE(merged.at("wss://b").last_query_succeeded);
}

TEST_CASE("RelayResolver - Relay list lookup", "[relay][resolver]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto network = std::make_shared<FakeRelayNetwork>();
    const auto alice = MakeIdentity();
    const auto bob = MakeIdentity();

    network->AddEvent("wss://d1", MakeInboxList(*alice, {"wss://alice-old"}, 100));
    network->AddEvent("wss://d2", MakeInboxList(*alice, {"wss://alice-new"}, 200));
    network->AddEvent("wss://d2", MakeRelayList(*bob, EventKind::RELAY_LIST, "r", {"wss://bob"}));

    SECTION("Newest event per kind wins across relays") {
        const auto result = RelayResolver::FetchRelayLists(
            network, DISCOVERY, {alice->PublicKeyHex(), bob->PublicKeyHex()}, 1000ms, 1.0);
        REQUIRE(result.responded == 2);
        REQUIRE_FALSE(result.degraded);
        const auto& alice_lists = result.lists.at(alice->PublicKeyHex());
        REQUIRE(alice_lists.dm_inbox->created_at == 200);
        REQUIRE(result.lists.at(bob->PublicKeyHex()).relay_list.has_value());
        REQUIRE_FALSE(result.lists.at(bob->PublicKeyHex()).dm_inbox.has_value());
        REQUIRE(result.relay_info.at("wss://d1").last_query_succeeded);
    }
    SECTION("One failing relay is recorded") {
        network->FailRelay("wss://d1");
        const auto result = RelayResolver::FetchRelayLists(
            network, DISCOVERY, {alice->PublicKeyHex()}, 1000ms, 1.0);
        REQUIRE_FALSE(result.degraded);
        REQUIRE_FALSE(result.relay_info.at("wss://d1").last_query_succeeded);
        REQUIRE(result.relay_info.at("wss://d1").last_query_error.has_value());
        REQUIRE(result.lists.at(alice->PublicKeyHex()).dm_inbox->created_at == 200);
    }
    SECTION("Every relay failing degrades the lookup") {
        network->FailRelay("wss://d1");
        network->ThrowOnQuery("wss://d2");
        const auto result = RelayResolver::FetchRelayLists(
            network, DISCOVERY, {alice->PublicKeyHex()}, 1000ms, 1.0);
        REQUIRE(result.degraded);
        REQUIRE(result.warning.has_value());
        REQUIRE(result.lists.contains(alice->PublicKeyHex()));
    }
    SECTION("No pubkeys means no queries") {
        const auto result = RelayResolver::FetchRelayLists(network, DISCOVERY, {}, 1000ms, 1.0);
        REQUIRE(result.lists.empty());
        REQUIRE(network->Queries().empty());
    }
    SECTION("Cancelled before the lookup starts") {
        CancellationToken cancellation;
        cancellation.Cancel();
        const auto result = RelayResolver::FetchRelayLists(
            network, DISCOVERY, {alice->PublicKeyHex()}, 1000ms, 1.0, cancellation);
        REQUIRE(result.cancelled);
        REQUIRE(result.lists.empty());
        REQUIRE(result.warning->type == DmFailureType::Cancelled);
        REQUIRE(network->Queries().empty());
    }
    SECTION("Cancelled while relays are stalled") {
        network->StallRelay("wss://d1");
        network->StallRelay("wss://d2");
        CancellationToken cancellation;
        std::thread canceller([cancellation]() mutable {
            std::this_thread::sleep_for(30ms);
            cancellation.Cancel();
        });

        const auto started = std::chrono::steady_clock::now();
        const auto result = RelayResolver::FetchRelayLists(
            network, DISCOVERY, {alice->PublicKeyHex()}, 1000ms, 1.0, cancellation);
        const auto elapsed = std::chrono::steady_clock::now() - started;
        canceller.join();
        network->Heal("wss://d1");
        network->Heal("wss://d2");

        REQUIRE(result.cancelled);
        REQUIRE(result.relay_info.empty());
        REQUIRE(elapsed < 1000ms);
    }
}
