#include "dmsync/crypto/gift_wrap_codec.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/event/event_codec.hpp"
#include "dmsync/identity/local_identity.hpp"
#include "dmsync/merge/merge_engine.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"
#include "dmsync/debug/logger.hpp"

#include <algorithm>

namespace dmsync::crypto {

using event::Event;
using event::EventCodec;
using event::EnvelopeParser;

namespace {
    constexpr const char* COMPONENT = "giftwrap";

    void AppendUnique(std::vector<std::string>& values, const std::string& value) {
        if (std::find(values.begin(), values.end(), value) == values.end()) {
            values.push_back(value);
        }
    }

    DmFailure AsDecryptionFailure(const std::string_view layer, const DmFailure& cause) {
        return DmFailure::DecryptionFailed(
            compat::format("Cannot decrypt {}: {}", layer, cause.message));
    }
}

int64_t GiftWrapCodec::FuzzTimestamp(const int64_t now) {
    const auto window = static_cast<uint32_t>(SyncConstants::GIFT_WRAP_FUZZ_WINDOW.count());
    return now - static_cast<int64_t>(SodiumInterop::RandomUniform(window));
}

Result<Event, DmFailure> GiftWrapCodec::BuildInnerMessage(
    const std::string& sender,
    const std::vector<std::string>& recipients,
    const std::string& content,
    const std::vector<event::Attachment>& attachments,
    const std::string& subject,
    const int64_t now) {

    if (recipients.empty()) {
        return Result<Event, DmFailure>::Err(
            DmFailure::InvalidInput("Inner message needs at least one recipient"));
    }

    Event inner;
    inner.pubkey = sender;
    inner.created_at = now;
    inner.kind = attachments.empty() ? EventKind::PRIVATE_DIRECT_MESSAGE : EventKind::PRIVATE_FILE_MESSAGE;
    inner.content = content;

    for (const auto& recipient : recipients) {
        inner.tags.push_back({"p", recipient});
    }
    if (!subject.empty()) {
        inner.tags.push_back({"subject", subject});
    }
    for (const auto& attachment : attachments) {
        inner.tags.push_back(EnvelopeParser::ToImetaTag(attachment));
        if (!inner.content.empty()) {
            inner.content.push_back('\n');
        }
        inner.content.append(attachment.url);
    }

    auto id = EventCodec::ComputeId(inner);
    if (id.IsErr()) {
        return Fail(std::move(id).UnwrapErr());
    }
    inner.id = std::move(id).Unwrap();
    return Result<Event, DmFailure>::Ok(std::move(inner));
}

Result<Event, DmFailure> GiftWrapCodec::CreateSeal(
    const Event& inner,
    const interfaces::ISigner& sender,
    const std::string& recipient,
    const int64_t now) {

    Event unsigned_inner = inner;
    unsigned_inner.sig.clear();

    auto serialized = EventCodec::Serialize(unsigned_inner);
    if (serialized.IsErr()) {
        return Fail(std::move(serialized).UnwrapErr());
    }
    auto content = sender.EncryptPrivate(recipient, serialized.Unwrap());
    if (content.IsErr()) {
        return Fail(std::move(content).UnwrapErr());
    }

    Event seal;
    seal.kind = EventKind::SEAL;
    seal.created_at = FuzzTimestamp(now);
    seal.content = std::move(content).Unwrap();
    return sender.Sign(std::move(seal));
}

Result<Event, DmFailure> GiftWrapCodec::CreateGiftWrap(
    const Event& seal,
    const std::string& recipient,
    const int64_t now) {

    auto ephemeral_result = identity::LocalIdentity::Generate();
    if (ephemeral_result.IsErr()) {
        return Fail(std::move(ephemeral_result).UnwrapErr());
    }
    const auto ephemeral = std::move(ephemeral_result).Unwrap();

    auto serialized = EventCodec::Serialize(seal);
    if (serialized.IsErr()) {
        return Fail(std::move(serialized).UnwrapErr());
    }
    auto content = ephemeral.EncryptPrivate(recipient, serialized.Unwrap());
    if (content.IsErr()) {
        return Fail(std::move(content).UnwrapErr());
    }

    Event wrap;
    wrap.kind = EventKind::GIFT_WRAP;
    wrap.created_at = FuzzTimestamp(now);
    wrap.tags.push_back({"p", recipient});
    wrap.content = std::move(content).Unwrap();
    return ephemeral.Sign(std::move(wrap));
}

Result<std::vector<WrappedCopy>, DmFailure> GiftWrapCodec::WrapForRecipients(
    const Event& inner,
    const interfaces::ISigner& sender,
    const std::vector<std::string>& recipients,
    const int64_t now) {

    std::vector<std::string> targets;
    for (const auto& recipient : recipients) {
        AppendUnique(targets, recipient);
    }
    AppendUnique(targets, sender.GetPublicKey());

    std::vector<WrappedCopy> copies;
    copies.reserve(targets.size());
    for (const auto& target : targets) {
        auto seal = CreateSeal(inner, sender, target, now);
        if (seal.IsErr()) {
            return Fail(std::move(seal).UnwrapErr());
        }
        auto wrap = CreateGiftWrap(seal.Unwrap(), target, now);
        if (wrap.IsErr()) {
            return Fail(std::move(wrap).UnwrapErr());
        }
        copies.push_back(WrappedCopy{target, std::move(wrap).Unwrap()});
    }

    DMSYNC_LOG_DEBUG(COMPONENT, "Wrapped inner message {} into {} copies", inner.id, copies.size());
    return Result<std::vector<WrappedCopy>, DmFailure>::Ok(std::move(copies));
}

Result<UnwrappedMessage, DmFailure> GiftWrapCodec::Unwrap(
    const Event& gift_wrap,
    const interfaces::ISigner& me) {

    auto wrap = EnvelopeParser::ParseGiftWrap(gift_wrap);
    if (wrap.IsErr()) {
        return Fail(std::move(wrap).UnwrapErr());
    }

    auto seal_json = me.DecryptPrivate(gift_wrap.pubkey, gift_wrap.content);
    if (seal_json.IsErr()) {
        return Result<UnwrappedMessage, DmFailure>::Err(
            AsDecryptionFailure("gift wrap", seal_json.UnwrapErr()));
    }
    auto seal = EnvelopeParser::ParseSeal(seal_json.Unwrap());
    if (seal.IsErr()) {
        return Fail(std::move(seal).UnwrapErr());
    }
    const Event& seal_event = seal.Unwrap().event;

    auto inner_json = me.DecryptPrivate(seal_event.pubkey, seal_event.content);
    if (inner_json.IsErr()) {
        return Result<UnwrappedMessage, DmFailure>::Err(
            AsDecryptionFailure("seal", inner_json.UnwrapErr()));
    }
    auto inner = EnvelopeParser::ParseInnerMessage(inner_json.Unwrap());
    if (inner.IsErr()) {
        return Fail(std::move(inner).UnwrapErr());
    }
    if (inner.Unwrap().rumor.pubkey != seal_event.pubkey) {
        return Result<UnwrappedMessage, DmFailure>::Err(
            DmFailure::MalformedEnvelope("Inner message author does not match seal author"));
    }

    UnwrappedMessage unwrapped;
    unwrapped.participants.push_back(seal_event.pubkey);
    for (const auto& recipient : inner.Unwrap().recipients) {
        AppendUnique(unwrapped.participants, recipient);
    }
    unwrapped.subject = inner.Unwrap().subject;
    unwrapped.conversation_id = merge::MergeEngine::ComputeConversationId(
        unwrapped.participants, unwrapped.subject);
    unwrapped.seal = std::move(seal).Unwrap();
    unwrapped.inner = std::move(inner).Unwrap();

    return Result<UnwrappedMessage, DmFailure>::Ok(std::move(unwrapped));
}

}
