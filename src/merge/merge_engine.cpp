#include "dmsync/merge/merge_engine.hpp"
#include "dmsync/crypto/encoding.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"

#include <algorithm>
#include <cstdlib>
#include <unordered_set>

namespace dmsync::merge {

namespace {
    std::vector<std::string> SortedUnique(std::vector<std::string> values) {
        std::sort(values.begin(), values.end());
        values.erase(std::unique(values.begin(), values.end()), values.end());
        return values;
    }

    void SortMessages(std::vector<Message>& messages) {
        std::stable_sort(messages.begin(), messages.end(), [](const Message& a, const Message& b) {
            return a.created_at < b.created_at;
        });
    }

    /// Flags derivable from messages alone; is_known is left to the caller.
    void RefreshFlags(Conversation& conversation) {
        conversation.last_activity = 0;
        conversation.has_legacy = false;
        conversation.has_private = false;
        conversation.has_decryption_errors = false;
        for (const auto& message : conversation.messages) {
            conversation.last_activity = std::max(conversation.last_activity, message.created_at);
            if (message.protocol == MessageProtocol::Legacy) {
                conversation.has_legacy = true;
            } else {
                conversation.has_private = true;
            }
            if (message.decryption_error) {
                conversation.has_decryption_errors = true;
            }
        }
        conversation.is_request = !conversation.is_known;
    }

    bool ContainsMessage(const Conversation& conversation, const Message& message) {
        return std::any_of(conversation.messages.begin(), conversation.messages.end(),
            [&message](const Message& existing) {
                return existing.DedupKey() == message.DedupKey();
            });
    }

    Conversation& EnsureConversation(
        MessagingState& state,
        const std::string& id,
        const std::vector<std::string>& participants,
        const std::string& subject) {

        auto [it, inserted] = state.conversations.try_emplace(id);
        if (inserted) {
            it->second.id = id;
            it->second.participants = SortedUnique(participants);
            it->second.subject = subject;
        }
        return it->second;
    }

    std::optional<int64_t> NewerCursor(const std::optional<int64_t>& a, const std::optional<int64_t>& b) {
        if (!a) {
            return b;
        }
        if (!b) {
            return a;
        }
        return std::max(*a, *b);
    }

    std::string NewOptimisticId(const int64_t now_ms) {
        const auto suffix = crypto::Encoding::HexEncode(crypto::SodiumInterop::GetRandomBytes(4));
        return compat::format("{}{}-{}", SyncConstants::OPTIMISTIC_ID_PREFIX, now_ms, suffix);
    }
}

std::string MergeEngine::ComputeConversationId(
    const std::vector<std::string>& participants,
    const std::string& subject) {

    std::string id(SyncConstants::CONVERSATION_ID_PREFIX);
    const auto sorted = SortedUnique(participants);
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0) {
            id.push_back(',');
        }
        id.append(sorted[i]);
    }
    id.push_back(':');
    id.append(subject);
    return id;
}

Result<ParsedConversationId, DmFailure> MergeEngine::ParseConversationId(const std::string_view id) {
    const auto prefix = SyncConstants::CONVERSATION_ID_PREFIX;
    if (id.substr(0, prefix.size()) != prefix) {
        return Result<ParsedConversationId, DmFailure>::Err(
            DmFailure::InvalidInput(compat::format("Conversation id must start with '{}'", prefix)));
    }

    const auto body = id.substr(prefix.size());
    const size_t separator = body.rfind(':');
    if (separator == std::string_view::npos) {
        return Result<ParsedConversationId, DmFailure>::Err(
            DmFailure::InvalidInput("Conversation id has no subject separator"));
    }

    ParsedConversationId parsed;
    parsed.subject = std::string(body.substr(separator + 1));
    const auto members = body.substr(0, separator);
    size_t start = 0;
    while (start <= members.size()) {
        const size_t comma = members.find(',', start);
        const auto member = members.substr(start, comma == std::string_view::npos ? members.npos : comma - start);
        if (!member.empty()) {
            parsed.participants.emplace_back(member);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }

    if (parsed.participants.empty()) {
        return Result<ParsedConversationId, DmFailure>::Err(
            DmFailure::InvalidInput("Conversation id has no participants"));
    }
    return Result<ParsedConversationId, DmFailure>::Ok(std::move(parsed));
}

MessagingState MergeEngine::BuildMessagingState(const BuildInput& input) {
    MessagingState state;
    state.participants = input.participants;
    state.relay_info = input.relay_info;
    state.sync_state.queried_relays = input.queried_relays;
    state.sync_state.query_limit_reached = input.limit_reached;
    state.sync_state.last_cache_time_ms = input.now_ms;

    std::unordered_set<std::string> seen;
    std::vector<const DecryptedMessage*> combined;
    for (const auto& message : input.initial) {
        if (seen.insert(message.message.DedupKey()).second) {
            combined.push_back(&message);
        }
    }
    for (const auto& message : input.gap_fill) {
        if (seen.insert(message.message.DedupKey()).second) {
            combined.push_back(&message);
        }
    }

    for (const auto* message : combined) {
        auto& conversation = EnsureConversation(
            state, message->conversation_id, message->participants, message->subject);
        if (!ContainsMessage(conversation, message->message)) {
            conversation.messages.push_back(message->message);
        }
    }

    for (auto& [id, conversation] : state.conversations) {
        SortMessages(conversation.messages);
        RecomputeMetadata(conversation, input.me);
    }

    if (const auto me = input.participants.find(input.me); me != input.participants.end()) {
        for (const auto& relay : me->second.blocked_relays) {
            state.relay_info[relay].is_blocked = true;
        }
    }

    return state;
}

MessagingState MergeEngine::Merge(const MessagingState& existing, const MessagingState& incoming) {
    MessagingState merged = existing;

    for (const auto& [pubkey, participant] : incoming.participants) {
        merged.participants[pubkey] = participant;
    }
    for (const auto& [relay, info] : incoming.relay_info) {
        merged.relay_info[relay] = info;
    }
    merged.sync_state = incoming.sync_state;
    merged.last_sync.legacy = NewerCursor(existing.last_sync.legacy, incoming.last_sync.legacy);
    merged.last_sync.private_messages =
        NewerCursor(existing.last_sync.private_messages, incoming.last_sync.private_messages);

    for (const auto& [id, conversation] : incoming.conversations) {
        auto [it, inserted] = merged.conversations.try_emplace(id, conversation);
        if (inserted) {
            continue;
        }
        auto& target = it->second;
        bool added = false;
        for (const auto& message : conversation.messages) {
            if (!ContainsMessage(target, message)) {
                target.messages.push_back(message);
                added = true;
            }
        }
        if (added) {
            SortMessages(target.messages);
        }
        target.is_known = target.is_known || conversation.is_known;
        target.last_read_at = std::max(target.last_read_at, conversation.last_read_at);
        RefreshFlags(target);
    }

    return merged;
}

bool MergeEngine::AddMessage(
    MessagingState& state,
    const DecryptedMessage& message,
    const std::string& me,
    const std::chrono::seconds tolerance) {

    auto& conversation = EnsureConversation(
        state, message.conversation_id, message.participants, message.subject);
    if (ContainsMessage(conversation, message.message)) {
        return false;
    }

    const auto placeholder = std::find_if(conversation.messages.begin(), conversation.messages.end(),
        [&message, tolerance](const Message& candidate) {
            return candidate.is_sending &&
                   candidate.sender_pubkey == message.message.sender_pubkey &&
                   candidate.plaintext == message.message.plaintext &&
                   std::llabs(candidate.created_at - message.message.created_at) <= tolerance.count();
        });

    if (placeholder != conversation.messages.end()) {
        Message confirmed = message.message;
        confirmed.created_at = placeholder->created_at;
        confirmed.client_first_seen_ms = placeholder->client_first_seen_ms;
        confirmed.is_sending = false;
        *placeholder = std::move(confirmed);
    } else {
        conversation.messages.push_back(message.message);
        SortMessages(conversation.messages);
    }

    RecomputeMetadata(conversation, me);
    return true;
}

OptimisticHandle MergeEngine::AddOptimisticMessage(
    MessagingState& state,
    const std::string& me,
    const std::vector<std::string>& recipients,
    const std::string& content,
    const MessageProtocol protocol,
    const int64_t now_ms,
    const std::string& subject) {

    std::vector<std::string> participants = recipients;
    participants.push_back(me);
    const auto conversation_id = ComputeConversationId(participants, subject);
    auto& conversation = EnsureConversation(state, conversation_id, participants, subject);

    Message placeholder;
    placeholder.id = NewOptimisticId(now_ms);
    placeholder.protocol = protocol;
    placeholder.kind = protocol == MessageProtocol::Legacy
        ? EventKind::LEGACY_DIRECT_MESSAGE
        : EventKind::PRIVATE_DIRECT_MESSAGE;
    placeholder.sender_pubkey = me;
    placeholder.created_at = now_ms / 1000;
    placeholder.plaintext = content;
    placeholder.is_sending = true;
    placeholder.client_first_seen_ms = now_ms;
    for (const auto& recipient : recipients) {
        placeholder.tags.push_back({"p", recipient});
    }
    if (!subject.empty()) {
        placeholder.tags.push_back({"subject", subject});
    }

    OptimisticHandle handle{conversation_id, placeholder.id};
    conversation.messages.push_back(std::move(placeholder));
    SortMessages(conversation.messages);
    RecomputeMetadata(conversation, me);
    return handle;
}

bool MergeEngine::MarkSendFailed(
    MessagingState& state,
    const std::string& conversation_id,
    const std::string& message_id,
    const std::string& error) {

    const auto it = state.conversations.find(conversation_id);
    if (it == state.conversations.end()) {
        return false;
    }
    auto& messages = it->second.messages;
    const auto message = std::find_if(messages.begin(), messages.end(),
        [&message_id](const Message& candidate) { return candidate.id == message_id; });
    if (message == messages.end()) {
        return false;
    }
    message->is_sending = false;
    message->decryption_error = error;
    RefreshFlags(it->second);
    return true;
}

bool MergeEngine::MarkConversationRead(MessagingState& state, const std::string& conversation_id, const int64_t at) {
    const auto it = state.conversations.find(conversation_id);
    if (it == state.conversations.end()) {
        return false;
    }
    it->second.last_read_at = std::max(it->second.last_read_at, at);
    return true;
}

std::vector<ConversationSummary> MergeEngine::Summaries(const MessagingState& state) {
    std::vector<ConversationSummary> summaries;
    summaries.reserve(state.conversations.size());
    for (const auto& [id, conversation] : state.conversations) {
        ConversationSummary summary;
        summary.id = id;
        summary.participants = conversation.participants;
        summary.subject = conversation.subject;
        summary.last_activity = conversation.last_activity;
        summary.last_read_at = conversation.last_read_at;
        summary.has_legacy = conversation.has_legacy;
        summary.has_private = conversation.has_private;
        summary.is_known = conversation.is_known;
        summary.is_request = conversation.is_request;
        summary.has_decryption_errors = conversation.has_decryption_errors;
        summary.message_count = conversation.messages.size();
        if (!conversation.messages.empty()) {
            summary.last_message = conversation.messages.back();
        }
        summaries.push_back(std::move(summary));
    }
    std::stable_sort(summaries.begin(), summaries.end(),
        [](const ConversationSummary& a, const ConversationSummary& b) {
            return a.last_activity > b.last_activity;
        });
    return summaries;
}

void MergeEngine::RecomputeMetadata(Conversation& conversation, const std::string& me) {
    conversation.is_known = std::any_of(conversation.messages.begin(), conversation.messages.end(),
        [&me](const Message& message) { return message.sender_pubkey == me; });
    RefreshFlags(conversation);
}

}
