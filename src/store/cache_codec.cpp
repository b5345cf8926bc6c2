#include "dmsync/store/cache_codec.hpp"
#include "dmsync/event/event_codec.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"

#include <limits>

namespace dmsync::store {

using merge::Conversation;
using merge::Message;
using merge::MessagingState;
using proto::store::CachedConversation;
using proto::store::CachedMessage;
using proto::store::MessageCache;

namespace {
    void WriteMessage(const Message& message, CachedMessage& cached) {
        cached.set_id(message.id);
        cached.set_protocol(message.protocol == MessageProtocol::Legacy
            ? CachedMessage::LEGACY
            : CachedMessage::PRIVATE);
        cached.set_kind(message.kind);
        cached.set_sender_pubkey(message.sender_pubkey);
        cached.set_created_at(message.created_at);
        for (const auto& tag : message.tags) {
            auto* values = cached.add_tags();
            for (const auto& value : tag) {
                values->add_values(value);
            }
        }
        cached.set_plaintext(message.plaintext);
        for (const auto& attachment : message.attachments) {
            auto* entry = cached.add_attachments();
            entry->set_url(attachment.url);
            entry->set_mime_type(attachment.mime_type);
            if (attachment.size) {
                entry->set_size(*attachment.size);
            }
            entry->set_name(attachment.name);
            entry->set_sha256(attachment.sha256);
        }
        // Envelopes that cannot be re-encoded are left out; the message itself is kept.
        if (message.raw_envelope) {
            if (auto raw = event::EventCodec::Serialize(*message.raw_envelope); raw.IsOk()) {
                cached.set_raw_envelope(std::move(raw).Unwrap());
            }
        }
        cached.set_gift_wrap_id(message.gift_wrap_id);
        if (message.seal) {
            if (auto seal = event::EventCodec::Serialize(*message.seal); seal.IsOk()) {
                cached.set_seal(std::move(seal).Unwrap());
            }
        }
        if (message.decryption_error) {
            cached.set_decryption_error(*message.decryption_error);
        }
        cached.set_is_sending(message.is_sending);
        cached.set_client_first_seen_ms(message.client_first_seen_ms);
    }

    Result<Message, DmFailure> ReadMessage(const CachedMessage& cached) {
        Message message;
        message.id = cached.id();
        message.protocol = cached.protocol() == CachedMessage::LEGACY
            ? MessageProtocol::Legacy
            : MessageProtocol::Private;
        message.kind = cached.kind();
        message.sender_pubkey = cached.sender_pubkey();
        message.created_at = cached.created_at();
        for (const auto& tag : cached.tags()) {
            message.tags.emplace_back(tag.values().begin(), tag.values().end());
        }
        message.plaintext = cached.plaintext();
        for (const auto& entry : cached.attachments()) {
            event::Attachment attachment;
            attachment.url = entry.url();
            attachment.mime_type = entry.mime_type();
            if (entry.has_size()) {
                attachment.size = entry.size();
            }
            attachment.name = entry.name();
            attachment.sha256 = entry.sha256();
            message.attachments.push_back(std::move(attachment));
        }
        if (cached.has_raw_envelope()) {
            auto envelope = event::EventCodec::Parse(cached.raw_envelope(), false);
            if (envelope.IsErr()) {
                return Result<Message, DmFailure>::Err(DmFailure::Decode(compat::format(
                    "Cached envelope of message {} is unreadable: {}", cached.id(), envelope.UnwrapErr().message)));
            }
            message.raw_envelope = std::move(envelope).Unwrap();
        }
        message.gift_wrap_id = cached.gift_wrap_id();
        if (cached.has_seal()) {
            auto seal = event::EventCodec::Parse(cached.seal(), false);
            if (seal.IsErr()) {
                return Result<Message, DmFailure>::Err(DmFailure::Decode(compat::format(
                    "Cached seal of message {} is unreadable: {}", cached.id(), seal.UnwrapErr().message)));
            }
            message.seal = std::move(seal).Unwrap();
        }
        if (cached.has_decryption_error()) {
            message.decryption_error = cached.decryption_error();
        }
        message.is_sending = cached.is_sending();
        message.client_first_seen_ms = cached.client_first_seen_ms();
        return Result<Message, DmFailure>::Ok(std::move(message));
    }

    void WriteConversation(const Conversation& conversation, CachedConversation& cached) {
        cached.set_id(conversation.id);
        for (const auto& participant : conversation.participants) {
            cached.add_participants(participant);
        }
        cached.set_subject(conversation.subject);
        for (const auto& message : conversation.messages) {
            WriteMessage(message, *cached.add_messages());
        }
        cached.set_last_activity(conversation.last_activity);
        cached.set_last_read_at(conversation.last_read_at);
        cached.set_has_legacy(conversation.has_legacy);
        cached.set_has_private(conversation.has_private);
        cached.set_is_known(conversation.is_known);
        cached.set_is_request(conversation.is_request);
        cached.set_has_decryption_errors(conversation.has_decryption_errors);
    }

    Result<Conversation, DmFailure> ReadConversation(const CachedConversation& cached) {
        Conversation conversation;
        conversation.id = cached.id();
        conversation.participants.assign(cached.participants().begin(), cached.participants().end());
        conversation.subject = cached.subject();
        conversation.messages.reserve(static_cast<size_t>(cached.messages_size()));
        for (const auto& entry : cached.messages()) {
            auto message = ReadMessage(entry);
            if (message.IsErr()) {
                return Fail(std::move(message).UnwrapErr());
            }
            conversation.messages.push_back(std::move(message).Unwrap());
        }
        conversation.last_activity = cached.last_activity();
        conversation.last_read_at = cached.last_read_at();
        conversation.has_legacy = cached.has_legacy();
        conversation.has_private = cached.has_private();
        conversation.is_known = cached.is_known();
        conversation.is_request = cached.is_request();
        conversation.has_decryption_errors = cached.has_decryption_errors();
        return Result<Conversation, DmFailure>::Ok(std::move(conversation));
    }
}

MessageCache CacheCodec::ToProto(const std::string& user_pubkey, const MessagingState& state) {
    MessageCache cache;
    cache.set_format_version(SyncConstants::CACHE_FORMAT_VERSION);
    cache.set_user_pubkey(user_pubkey);

    for (const auto& [pubkey, participant] : state.participants) {
        auto* entry = cache.add_participants();
        entry->set_pubkey(pubkey);
        for (const auto& relay : participant.derived_relays) {
            entry->add_derived_relays(relay);
        }
        for (const auto& relay : participant.blocked_relays) {
            entry->add_blocked_relays(relay);
        }
        entry->set_last_fetched_ms(participant.last_fetched_ms);
    }

    for (const auto& [id, conversation] : state.conversations) {
        WriteConversation(conversation, *cache.add_conversations());
    }

    for (const auto& [relay, info] : state.relay_info) {
        auto* entry = cache.add_relay_info();
        entry->set_relay(relay);
        entry->set_last_query_succeeded(info.last_query_succeeded);
        if (info.last_query_error) {
            entry->set_last_query_error(*info.last_query_error);
        }
        entry->set_is_blocked(info.is_blocked);
    }

    auto* sync_state = cache.mutable_sync_state();
    for (const auto& relay : state.sync_state.queried_relays) {
        sync_state->add_queried_relays(relay);
    }
    if (state.sync_state.last_cache_time_ms) {
        sync_state->set_last_cache_time_ms(*state.sync_state.last_cache_time_ms);
    }
    sync_state->set_query_limit_reached(state.sync_state.query_limit_reached);

    auto* last_sync = cache.mutable_last_sync();
    if (state.last_sync.legacy) {
        last_sync->set_legacy(*state.last_sync.legacy);
    }
    if (state.last_sync.private_messages) {
        last_sync->set_private_messages(*state.last_sync.private_messages);
    }

    return cache;
}

Result<MessagingState, DmFailure> CacheCodec::FromProto(const MessageCache& cache, const std::string& user_pubkey) {
    if (cache.format_version() != SyncConstants::CACHE_FORMAT_VERSION) {
        return Result<MessagingState, DmFailure>::Err(DmFailure::Decode(compat::format(
            "Cache format version {} is not supported", cache.format_version())));
    }
    if (cache.user_pubkey().empty() || cache.user_pubkey() != user_pubkey) {
        return Result<MessagingState, DmFailure>::Err(
            DmFailure::Decode("Cache record does not belong to this user"));
    }
    if (!cache.has_sync_state()) {
        return Result<MessagingState, DmFailure>::Err(
            DmFailure::Decode("Cache record has no sync state"));
    }

    MessagingState state;
    for (const auto& entry : cache.participants()) {
        merge::Participant participant;
        participant.pubkey = entry.pubkey();
        participant.derived_relays.assign(entry.derived_relays().begin(), entry.derived_relays().end());
        participant.blocked_relays.insert(entry.blocked_relays().begin(), entry.blocked_relays().end());
        participant.last_fetched_ms = entry.last_fetched_ms();
        state.participants[entry.pubkey()] = std::move(participant);
    }

    for (const auto& entry : cache.conversations()) {
        auto conversation = ReadConversation(entry);
        if (conversation.IsErr()) {
            return Fail(std::move(conversation).UnwrapErr());
        }
        state.conversations[entry.id()] = std::move(conversation).Unwrap();
    }

    for (const auto& entry : cache.relay_info()) {
        merge::RelayInfo info;
        info.last_query_succeeded = entry.last_query_succeeded();
        if (entry.has_last_query_error()) {
            info.last_query_error = entry.last_query_error();
        }
        info.is_blocked = entry.is_blocked();
        state.relay_info[entry.relay()] = std::move(info);
    }

    const auto& sync_state = cache.sync_state();
    state.sync_state.queried_relays.insert(sync_state.queried_relays().begin(), sync_state.queried_relays().end());
    if (sync_state.has_last_cache_time_ms()) {
        state.sync_state.last_cache_time_ms = sync_state.last_cache_time_ms();
    }
    state.sync_state.query_limit_reached = sync_state.query_limit_reached();

    if (cache.has_last_sync()) {
        if (cache.last_sync().has_legacy()) {
            state.last_sync.legacy = cache.last_sync().legacy();
        }
        if (cache.last_sync().has_private_messages()) {
            state.last_sync.private_messages = cache.last_sync().private_messages();
        }
    }

    return Result<MessagingState, DmFailure>::Ok(std::move(state));
}

Result<std::vector<uint8_t>, DmFailure> CacheCodec::Serialize(
    const std::string& user_pubkey,
    const MessagingState& state) {

    const auto cache = ToProto(user_pubkey, state);
    const size_t size = cache.ByteSizeLong();
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Encode("Cache record exceeds the protobuf size limit"));
    }
    std::vector<uint8_t> bytes(size);
    if (!cache.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Encode("Failed to serialize cache record"));
    }
    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(bytes));
}

Result<MessagingState, DmFailure> CacheCodec::Deserialize(
    const std::span<const uint8_t> bytes,
    const std::string& user_pubkey) {

    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<MessagingState, DmFailure>::Err(
            DmFailure::Decode("Cache record exceeds the protobuf size limit"));
    }
    MessageCache cache;
    if (!cache.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<MessagingState, DmFailure>::Err(
            DmFailure::Decode("Cache record is not a valid MessageCache"));
    }
    return FromProto(cache, user_pubkey);
}

}
