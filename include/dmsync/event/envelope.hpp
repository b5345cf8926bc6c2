#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/event/event.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dmsync::event {

/// File reference carried in an "imeta" tag of a kind-15 message.
struct Attachment {
    std::string url;
    std::string mime_type;
    std::optional<uint64_t> size;
    std::string name;
    std::string sha256;

    bool operator==(const Attachment& other) const = default;
};

/// Outer layer: kind 1059, signed by a throwaway key, addressed by one "p" tag.
struct GiftWrap {
    Event event;
    std::string recipient;
};

/// Middle layer: kind 13, no tags, signed by the real sender.
struct Seal {
    Event event;
};

/// Innermost unsigned message (kind 14 text or kind 15 file).
struct InnerMessage {
    Event rumor;
    std::vector<std::string> recipients;
    std::string subject;
    std::vector<Attachment> attachments;
};

using Envelope = std::variant<GiftWrap, Seal, InnerMessage>;

/**
 * @brief Shape checks for each layer of a private message
 *
 * Every parser either returns a fully typed layer or MalformedEnvelope.
 * Cryptographic unwrapping lives in crypto::GiftWrapCodec; these only
 * validate structure and signatures.
 */
class EnvelopeParser {
public:
    [[nodiscard]] static Result<GiftWrap, DmFailure> ParseGiftWrap(const Event& event);

    /// Parses decrypted seal JSON and verifies its signature.
    [[nodiscard]] static Result<Seal, DmFailure> ParseSeal(std::string_view json);

    [[nodiscard]] static Result<InnerMessage, DmFailure> ParseInnerMessage(std::string_view json);
    [[nodiscard]] static Result<InnerMessage, DmFailure> ParseInnerMessage(const Event& rumor);

    [[nodiscard]] static Result<Envelope, DmFailure> Classify(const Event& event);

    [[nodiscard]] static std::vector<Attachment> ParseAttachments(const Tags& tags);
    [[nodiscard]] static Tag ToImetaTag(const Attachment& attachment);

private:
    EnvelopeParser() = delete;
};

}
