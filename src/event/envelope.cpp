#include "dmsync/event/envelope.hpp"
#include "dmsync/event/event_codec.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"

#include <charconv>

namespace dmsync::event {

namespace {
    bool IsInnerKind(const uint32_t kind) noexcept {
        return kind == EventKind::PRIVATE_DIRECT_MESSAGE || kind == EventKind::PRIVATE_FILE_MESSAGE;
    }

    std::optional<uint64_t> ParseSize(const std::string_view text) {
        uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }
}

Result<GiftWrap, DmFailure> EnvelopeParser::ParseGiftWrap(const Event& event) {
    if (event.kind != EventKind::GIFT_WRAP) {
        return Result<GiftWrap, DmFailure>::Err(DmFailure::MalformedEnvelope(
            compat::format("Expected gift wrap kind {}, got {}", EventKind::GIFT_WRAP, event.kind)));
    }
    auto recipient = FirstTagValue(event.tags, "p");
    if (!recipient) {
        return Result<GiftWrap, DmFailure>::Err(
            DmFailure::MalformedEnvelope("Gift wrap has no recipient tag"));
    }
    return Result<GiftWrap, DmFailure>::Ok(GiftWrap{event, std::move(*recipient)});
}

Result<Seal, DmFailure> EnvelopeParser::ParseSeal(const std::string_view json) {
    auto parsed = EventCodec::Parse(json);
    if (parsed.IsErr()) {
        return Fail(std::move(parsed).UnwrapErr());
    }
    auto seal = std::move(parsed).Unwrap();
    if (seal.kind != EventKind::SEAL) {
        return Result<Seal, DmFailure>::Err(DmFailure::MalformedEnvelope(
            compat::format("Expected seal kind {}, got {}", EventKind::SEAL, seal.kind)));
    }
    if (!EventCodec::Verify(seal)) {
        return Result<Seal, DmFailure>::Err(
            DmFailure::MalformedEnvelope("Seal signature is invalid"));
    }
    return Result<Seal, DmFailure>::Ok(Seal{std::move(seal)});
}

Result<InnerMessage, DmFailure> EnvelopeParser::ParseInnerMessage(const std::string_view json) {
    auto parsed = EventCodec::Parse(json, false);
    if (parsed.IsErr()) {
        return Fail(std::move(parsed).UnwrapErr());
    }
    return ParseInnerMessage(parsed.Unwrap());
}

Result<InnerMessage, DmFailure> EnvelopeParser::ParseInnerMessage(const Event& rumor) {
    if (!IsInnerKind(rumor.kind)) {
        return Result<InnerMessage, DmFailure>::Err(DmFailure::MalformedEnvelope(
            compat::format("Unexpected inner message kind {}", rumor.kind)));
    }

    InnerMessage inner;
    inner.rumor = rumor;
    inner.recipients = TagValues(rumor.tags, "p");
    if (inner.recipients.empty()) {
        return Result<InnerMessage, DmFailure>::Err(
            DmFailure::MalformedEnvelope("Inner message has no recipients"));
    }
    inner.subject = FirstTagValue(rumor.tags, "subject").value_or("");
    inner.attachments = ParseAttachments(rumor.tags);
    return Result<InnerMessage, DmFailure>::Ok(std::move(inner));
}

Result<Envelope, DmFailure> EnvelopeParser::Classify(const Event& event) {
    switch (event.kind) {
        case EventKind::GIFT_WRAP: {
            auto wrap = ParseGiftWrap(event);
            if (wrap.IsErr()) {
                return Fail(std::move(wrap).UnwrapErr());
            }
            return Result<Envelope, DmFailure>::Ok(std::move(wrap).Unwrap());
        }
        case EventKind::SEAL: {
            if (!EventCodec::Verify(event)) {
                return Result<Envelope, DmFailure>::Err(
                    DmFailure::MalformedEnvelope("Seal signature is invalid"));
            }
            return Result<Envelope, DmFailure>::Ok(Seal{event});
        }
        case EventKind::PRIVATE_DIRECT_MESSAGE:
        case EventKind::PRIVATE_FILE_MESSAGE: {
            auto inner = ParseInnerMessage(event);
            if (inner.IsErr()) {
                return Fail(std::move(inner).UnwrapErr());
            }
            return Result<Envelope, DmFailure>::Ok(std::move(inner).Unwrap());
        }
        default:
            return Result<Envelope, DmFailure>::Err(DmFailure::MalformedEnvelope(
                compat::format("Kind {} is not a private envelope layer", event.kind)));
    }
}

std::vector<Attachment> EnvelopeParser::ParseAttachments(const Tags& tags) {
    std::vector<Attachment> attachments;
    for (const auto& tag : tags) {
        if (tag.empty() || tag[0] != "imeta") {
            continue;
        }
        Attachment attachment;
        for (size_t i = 1; i < tag.size(); ++i) {
            const std::string_view entry = tag[i];
            const size_t space = entry.find(' ');
            if (space == std::string_view::npos) {
                continue;
            }
            const auto key = entry.substr(0, space);
            const auto value = entry.substr(space + 1);
            if (key == "url") {
                attachment.url = value;
            } else if (key == "m") {
                attachment.mime_type = value;
            } else if (key == "size") {
                attachment.size = ParseSize(value);
            } else if (key == "x") {
                attachment.sha256 = value;
            } else if (key == "name") {
                attachment.name = value;
            }
        }
        if (!attachment.url.empty()) {
            attachments.push_back(std::move(attachment));
        }
    }
    return attachments;
}

Tag EnvelopeParser::ToImetaTag(const Attachment& attachment) {
    Tag tag{"imeta", "url " + attachment.url};
    if (!attachment.mime_type.empty()) {
        tag.push_back("m " + attachment.mime_type);
    }
    if (attachment.size) {
        tag.push_back("size " + std::to_string(*attachment.size));
    }
    if (!attachment.sha256.empty()) {
        tag.push_back("x " + attachment.sha256);
    }
    if (!attachment.name.empty()) {
        tag.push_back("name " + attachment.name);
    }
    return tag;
}

}
