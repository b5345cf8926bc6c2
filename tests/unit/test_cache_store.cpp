#include <catch2/catch_test_macros.hpp>
#include "dmsync/store/cache_codec.hpp"
#include "dmsync/store/file_cache_store.hpp"
#include "dmsync/store/persistence_queue.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/core/constants.hpp"
#include "helpers/in_memory_cache_store.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
using namespace dmsync;
using namespace dmsync::store;
using namespace dmsync::test_helpers;
using namespace std::chrono_literals;

namespace {
    const std::string USER(64, 'a');
    const std::string PEER(64, 'b');

    merge::MessagingState SampleState() {
        merge::MessagingState state;

        merge::Participant peer;
        peer.pubkey = PEER;
        peer.derived_relays = {"wss://one", "wss://two"};
        peer.blocked_relays = {"wss://spam"};
        peer.last_fetched_ms = 1234;
        state.participants[PEER] = peer;

        merge::Message message;
        message.id = "m1";
        message.protocol = MessageProtocol::Private;
        message.kind = EventKind::PRIVATE_FILE_MESSAGE;
        message.sender_pubkey = PEER;
        message.created_at = 1'700'000'000;
        message.tags = {{"p", USER}, {"subject", "pics"}};
        message.plaintext = "look\nhttps://x/cat.png";
        message.attachments = {event::Attachment{"https://x/cat.png", "image/png", 99, "", ""}};
        message.gift_wrap_id = "wrap-1";
        message.client_first_seen_ms = 42;

        event::Event wrap;
        wrap.id = "wrap-1";
        wrap.pubkey = std::string(64, 'e');
        wrap.kind = EventKind::GIFT_WRAP;
        wrap.created_at = 1'699'999'000;
        wrap.tags = {{"p", USER}};
        wrap.content = "ciphertext";
        wrap.sig = std::string(128, '0');
        message.raw_envelope = wrap;

        merge::Message failed;
        failed.id = "wrap-2";
        failed.protocol = MessageProtocol::Private;
        failed.kind = EventKind::GIFT_WRAP;
        failed.created_at = 1'700'000'100;
        failed.plaintext = "ciphertext";
        failed.decryption_error = "Unable to decrypt";

        merge::Conversation conversation;
        conversation.id = "group:" + USER + "," + PEER + ":pics";
        conversation.participants = {USER, PEER};
        conversation.subject = "pics";
        conversation.messages = {message, failed};
        conversation.last_activity = 1'700'000'100;
        conversation.last_read_at = 1'700'000'000;
        conversation.has_private = true;
        conversation.has_decryption_errors = true;
        state.conversations[conversation.id] = conversation;

        state.relay_info["wss://one"] = merge::RelayInfo{true, std::nullopt, false};
        state.relay_info["wss://spam"] = merge::RelayInfo{false, std::string("blocked"), true};
        state.sync_state.queried_relays = {"wss://one"};
        state.sync_state.last_cache_time_ms = 1'700'000'000'000;
        state.sync_state.query_limit_reached = true;
        state.last_sync.private_messages = 1'700'000'050;
        return state;
    }

    std::filesystem::path ScratchDirectory(const std::string& name) {
        auto path = std::filesystem::temp_directory_path() / ("dmsync-test-" + name);
        std::filesystem::remove_all(path);
        return path;
    }
}

TEST_CASE("CacheCodec - Snapshot survives serialization", "[store][codec]") {
    const auto state = SampleState();
    const auto bytes = CacheCodec::Serialize(USER, state).Unwrap();
    const auto restored = CacheCodec::Deserialize(bytes, USER).Unwrap();
    REQUIRE(restored == state);
}

TEST_CASE("CacheCodec - Rejected records", "[store][codec]") {
    const auto state = SampleState();

    SECTION("Another user's record") {
        const auto bytes = CacheCodec::Serialize(USER, state).Unwrap();
        auto result = CacheCodec::Deserialize(bytes, PEER);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == DmFailureType::Decode);
    }
    SECTION("Other format version") {
        auto cache = CacheCodec::ToProto(USER, state);
        cache.set_format_version(SyncConstants::CACHE_FORMAT_VERSION + 1);
        REQUIRE(CacheCodec::FromProto(cache, USER).IsErr());
    }
    SECTION("Missing sync state") {
        auto cache = CacheCodec::ToProto(USER, state);
        cache.clear_sync_state();
        REQUIRE(CacheCodec::FromProto(cache, USER).IsErr());
    }
    SECTION("Garbage bytes") {
        const std::vector<uint8_t> garbage = {0xff, 0xff, 0xff, 0xff, 0x01};
        REQUIRE(CacheCodec::Deserialize(garbage, USER).IsErr());
    }
}

TEST_CASE("CacheCodec - Text that is not UTF-8", "[store][codec]") {
    const std::string garbled = "\xff\xfe legacy plaintext";

    merge::Message message;
    message.id = std::string(64, 'c');
    message.protocol = MessageProtocol::Legacy;
    message.kind = EventKind::LEGACY_DIRECT_MESSAGE;
    message.sender_pubkey = PEER;
    message.created_at = 1'700'000'200;
    message.tags = {{"p", USER}, {"note", "\xc3\x28"}};
    message.plaintext = garbled;
    message.attachments = {event::Attachment{"https://x/\xe2\x28", "", std::nullopt, "\xf0\x28", ""}};

    auto state = SampleState();
    auto& conversation = state.conversations.begin()->second;
    conversation.messages.push_back(message);
    conversation.subject = "trip \xed\xa0\x80";
    state.relay_info["wss://two"] = merge::RelayInfo{false, std::string("NOTICE \x80"), false};

    SECTION("Survives the codec") {
        const auto restored = CacheCodec::Deserialize(CacheCodec::Serialize(USER, state).Unwrap(), USER).Unwrap();
        REQUIRE(restored == state);
        REQUIRE(restored.conversations.begin()->second.messages.back().plaintext == garbled);
    }
    SECTION("Survives the file store") {
        const auto directory = ScratchDirectory("file-store-utf8");
        FileCacheStore store(directory);
        REQUIRE(store.WriteCache(USER, state).IsOk());
        const auto restored = store.ReadCache(USER).Unwrap();
        REQUIRE(restored.has_value());
        REQUIRE(*restored == state);
        std::filesystem::remove_all(directory);
    }
    SECTION("Envelope that cannot be encoded is left out") {
        event::Event raw;
        raw.id = message.id;
        raw.pubkey = PEER;
        raw.kind = EventKind::LEGACY_DIRECT_MESSAGE;
        raw.created_at = message.created_at;
        raw.content = garbled;
        conversation.messages.back().raw_envelope = raw;

        const auto restored = CacheCodec::Deserialize(CacheCodec::Serialize(USER, state).Unwrap(), USER).Unwrap();
        const auto& kept = restored.conversations.begin()->second.messages.back();
        REQUIRE(kept.plaintext == garbled);
        REQUIRE_FALSE(kept.raw_envelope.has_value());
    }
}

TEST_CASE("FileCacheStore - Per-user files", "[store][file]") {
    const auto directory = ScratchDirectory("file-store");
    FileCacheStore store(directory);

    SECTION("Missing record reads as empty") {
        REQUIRE_FALSE(store.ReadCache(USER).Unwrap().has_value());
    }
    SECTION("Write then read") {
        REQUIRE(store.WriteCache(USER, SampleState()).IsOk());
        REQUIRE(std::filesystem::exists(directory / ("dm-cache_" + USER + ".pb")));
        const auto restored = store.ReadCache(USER).Unwrap();
        REQUIRE(restored.has_value());
        REQUIRE(*restored == SampleState());
        REQUIRE_FALSE(store.ReadCache(PEER).Unwrap().has_value());
    }
    SECTION("Delete") {
        REQUIRE(store.WriteCache(USER, SampleState()).IsOk());
        REQUIRE(store.DeleteCache(USER).IsOk());
        REQUIRE_FALSE(store.ReadCache(USER).Unwrap().has_value());
        REQUIRE(store.DeleteCache(USER).IsOk());
    }
    SECTION("Corrupt file is treated as absent") {
        std::filesystem::create_directories(directory);
        std::ofstream(directory / ("dm-cache_" + USER + ".pb"), std::ios::binary) << "not a protobuf";
        REQUIRE_FALSE(store.ReadCache(USER).Unwrap().has_value());
    }
    SECTION("Keys must be hex public keys") {
        REQUIRE(store.WriteCache("../escape", SampleState()).IsErr());
        REQUIRE(store.PathFor("short").IsErr());
    }

    std::filesystem::remove_all(directory);
}

TEST_CASE("PersistenceQueue - Debounced writes", "[store][persistence]") {
    auto store = std::make_shared<InMemoryCacheStore>();

    SECTION("Bursts collapse into one write") {
        PersistenceQueue queue(store, USER, 50ms);
        auto state = SampleState();
        for (int i = 0; i < 5; ++i) {
            state.sync_state.last_cache_time_ms = i;
            queue.Schedule(state);
        }
        REQUIRE(queue.HasPending());
        std::this_thread::sleep_for(400ms);
        REQUIRE(queue.WriteCount() == 1);
        REQUIRE(store->Stored(USER)->sync_state.last_cache_time_ms == std::optional<int64_t>(4));
    }
    SECTION("FlushNow writes at once and drops the pending snapshot") {
        PersistenceQueue queue(store, USER, 10s);
        queue.Schedule(SampleState());
        auto newer = SampleState();
        newer.sync_state.query_limit_reached = false;
        queue.FlushNow(newer);
        REQUIRE_FALSE(queue.HasPending());
        REQUIRE(store->Writes() == 1);
        REQUIRE_FALSE(store->Stored(USER)->sync_state.query_limit_reached);
    }
    SECTION("Flush writes the pending snapshot") {
        PersistenceQueue queue(store, USER, 10s);
        queue.Schedule(SampleState());
        queue.Flush();
        REQUIRE(store->Writes() == 1);
        queue.Flush();
        REQUIRE(store->Writes() == 1);
    }
    SECTION("Cancel drops it") {
        PersistenceQueue queue(store, USER, 10s);
        queue.Schedule(SampleState());
        queue.Cancel();
        queue.Stop();
        REQUIRE(store->Writes() == 0);
    }
    SECTION("Write failures are counted, not thrown") {
        store->FailWrites(true);
        PersistenceQueue queue(store, USER, 10s);
        queue.FlushNow(SampleState());
        REQUIRE(queue.WriteErrorCount() == 1);
        REQUIRE(queue.WriteCount() == 0);
    }
}
