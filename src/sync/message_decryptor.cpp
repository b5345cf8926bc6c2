#include "dmsync/sync/message_decryptor.hpp"
#include "dmsync/crypto/gift_wrap_codec.hpp"
#include "dmsync/merge/merge_engine.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/debug/logger.hpp"

namespace dmsync::sync {

using event::Event;
using merge::DecryptedMessage;
using merge::Message;

namespace {
    constexpr const char* COMPONENT = "decrypt";
}

DecryptedMessage MessageDecryptor::DecryptLegacy(const Event& envelope, const interfaces::ISigner& me) {
    const auto recipient = event::FirstTagValue(envelope.tags, "p");
    const std::string my_pubkey = me.GetPublicKey();

    DecryptedMessage decrypted;
    decrypted.participants.push_back(envelope.pubkey);
    if (recipient && *recipient != envelope.pubkey) {
        decrypted.participants.push_back(*recipient);
    }
    decrypted.conversation_id = merge::MergeEngine::ComputeConversationId(decrypted.participants, "");

    Message& message = decrypted.message;
    message.id = envelope.id;
    message.protocol = MessageProtocol::Legacy;
    message.kind = envelope.kind;
    message.sender_pubkey = envelope.pubkey;
    message.created_at = envelope.created_at;
    message.tags = envelope.tags;
    message.plaintext = envelope.content;
    message.raw_envelope = envelope;

    const std::optional<std::string> counterpart = envelope.pubkey == my_pubkey
        ? recipient
        : std::optional<std::string>(envelope.pubkey);
    if (!counterpart) {
        message.decryption_error = std::string(ErrorMessages::MISSING_RECIPIENT);
        return decrypted;
    }

    auto plaintext = me.DecryptLegacy(*counterpart, envelope.content);
    if (plaintext.IsErr()) {
        DMSYNC_LOG_DEBUG(COMPONENT, "Legacy message {} not decryptable: {}", envelope.id, plaintext.UnwrapErr().message);
        message.decryption_error = std::string(ErrorMessages::UNABLE_TO_DECRYPT);
        return decrypted;
    }
    message.plaintext = std::move(plaintext).Unwrap();
    return decrypted;
}

DecryptedMessage MessageDecryptor::DecryptGiftWrap(const Event& gift_wrap, const interfaces::ISigner& me) {
    DecryptedMessage decrypted;
    Message& message = decrypted.message;
    message.protocol = MessageProtocol::Private;
    message.raw_envelope = gift_wrap;
    message.gift_wrap_id = gift_wrap.id;

    auto unwrapped = crypto::GiftWrapCodec::Unwrap(gift_wrap, me);
    if (unwrapped.IsErr()) {
        DMSYNC_LOG_DEBUG(COMPONENT, "Gift wrap {} not unwrappable: {}", gift_wrap.id, unwrapped.UnwrapErr().message);
        decrypted.participants = {gift_wrap.pubkey};
        decrypted.conversation_id = merge::MergeEngine::ComputeConversationId(decrypted.participants, "");
        message.id = gift_wrap.id;
        message.kind = gift_wrap.kind;
        message.sender_pubkey = gift_wrap.pubkey;
        message.created_at = gift_wrap.created_at;
        message.tags = gift_wrap.tags;
        message.plaintext = gift_wrap.content;
        message.decryption_error = std::string(ErrorMessages::UNABLE_TO_DECRYPT);
        return decrypted;
    }

    auto parts = std::move(unwrapped).Unwrap();
    const Event& rumor = parts.inner.rumor;
    decrypted.conversation_id = std::move(parts.conversation_id);
    decrypted.participants = std::move(parts.participants);
    decrypted.subject = std::move(parts.subject);
    message.id = rumor.id;
    message.kind = rumor.kind;
    message.sender_pubkey = rumor.pubkey;
    message.created_at = rumor.created_at;
    message.tags = rumor.tags;
    message.plaintext = rumor.content;
    message.attachments = std::move(parts.inner.attachments);
    message.seal = std::move(parts.seal.event);
    return decrypted;
}

std::optional<DecryptedMessage> MessageDecryptor::Decrypt(const Event& envelope, const interfaces::ISigner& me) {
    if (envelope.kind == EventKind::LEGACY_DIRECT_MESSAGE) {
        return DecryptLegacy(envelope, me);
    }
    if (envelope.kind == EventKind::GIFT_WRAP) {
        return DecryptGiftWrap(envelope, me);
    }
    return std::nullopt;
}

std::vector<DecryptedMessage> MessageDecryptor::DecryptAll(const std::vector<Event>& envelopes, const interfaces::ISigner& me) {
    std::vector<DecryptedMessage> decrypted;
    decrypted.reserve(envelopes.size());
    size_t failures = 0;
    for (const auto& envelope : envelopes) {
        auto message = Decrypt(envelope, me);
        if (!message) {
            continue;
        }
        if (message->message.decryption_error) {
            ++failures;
        }
        decrypted.push_back(std::move(*message));
    }
    if (failures > 0) {
        DMSYNC_LOG_INFO(COMPONENT, "Processed {} messages, {} could not be decrypted", decrypted.size(), failures);
    }
    return decrypted;
}

}
