#pragma once

#include "dmsync/core/failures.hpp"
#include "dmsync/event/envelope.hpp"
#include "dmsync/event/event.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dmsync::merge {

/// A user whose relays have been resolved.
struct Participant {
    std::string pubkey;
    /// Ordered, unique.
    std::vector<std::string> derived_relays;
    std::set<std::string> blocked_relays;
    /// Unix milliseconds of the last relay-list fetch.
    int64_t last_fetched_ms = 0;

    bool operator==(const Participant& other) const = default;
};

/// Canonical decrypted message, whichever protocol carried it.
struct Message {
    /// Legacy: event id. Private: inner message id (or gift-wrap id on failure).
    std::string id;
    MessageProtocol protocol = MessageProtocol::Legacy;
    uint32_t kind = 0;
    std::string sender_pubkey;
    /// Unix seconds.
    int64_t created_at = 0;
    event::Tags tags;
    /// Ciphertext when decryption failed.
    std::string plaintext;
    std::vector<event::Attachment> attachments;
    /// The legacy event itself, or the gift wrap.
    std::optional<event::Event> raw_envelope;
    std::string gift_wrap_id;
    std::optional<event::Event> seal;
    std::optional<std::string> decryption_error;
    bool is_sending = false;
    int64_t client_first_seen_ms = 0;

    [[nodiscard]] const std::string& DedupKey() const noexcept {
        return gift_wrap_id.empty() ? id : gift_wrap_id;
    }

    bool operator==(const Message& other) const = default;
};

/// A message together with the conversation it belongs to.
struct DecryptedMessage {
    std::string conversation_id;
    std::vector<std::string> participants;
    std::string subject;
    Message message;
};

struct Conversation {
    std::string id;
    /// Sorted, unique; includes the local user.
    std::vector<std::string> participants;
    std::string subject;
    /// Ascending by created_at, unique by DedupKey().
    std::vector<Message> messages;
    int64_t last_activity = 0;
    int64_t last_read_at = 0;
    bool has_legacy = false;
    bool has_private = false;
    /// The local user has sent at least one message here.
    bool is_known = false;
    bool is_request = true;
    bool has_decryption_errors = false;

    bool operator==(const Conversation& other) const = default;
};

struct RelayInfo {
    bool last_query_succeeded = false;
    std::optional<std::string> last_query_error;
    bool is_blocked = false;

    bool operator==(const RelayInfo& other) const = default;
};

struct SyncState {
    std::set<std::string> queried_relays;
    /// Unix milliseconds of the last completed sync pass.
    std::optional<int64_t> last_cache_time_ms;
    bool query_limit_reached = false;

    bool operator==(const SyncState& other) const = default;
};

/// Per-protocol live-subscription cursors, Unix seconds.
struct LastSync {
    std::optional<int64_t> legacy;
    std::optional<int64_t> private_messages;

    bool operator==(const LastSync& other) const = default;
};

struct MessagingState {
    std::map<std::string, Participant> participants;
    std::map<std::string, Conversation> conversations;
    std::map<std::string, RelayInfo> relay_info;
    SyncState sync_state;
    LastSync last_sync;

    bool operator==(const MessagingState& other) const = default;
};

/// List entry for a conversation, without its message history.
struct ConversationSummary {
    std::string id;
    std::vector<std::string> participants;
    std::string subject;
    int64_t last_activity = 0;
    int64_t last_read_at = 0;
    bool has_legacy = false;
    bool has_private = false;
    bool is_known = false;
    bool is_request = true;
    bool has_decryption_errors = false;
    size_t message_count = 0;
    std::optional<Message> last_message;
};

}
