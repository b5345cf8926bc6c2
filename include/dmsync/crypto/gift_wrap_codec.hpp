#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/event/envelope.hpp"
#include "dmsync/event/event.hpp"
#include "dmsync/interfaces/i_signer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dmsync::crypto {

/// Result of peeling a gift wrap down to its inner message.
struct UnwrappedMessage {
    event::InnerMessage inner;
    event::Seal seal;
    std::string conversation_id;
    /// Seal author followed by the inner "p" recipients, unique.
    std::vector<std::string> participants;
    std::string subject;
};

/// One gift wrap addressed to one member of the conversation.
struct WrappedCopy {
    std::string recipient;
    event::Event gift_wrap;
};

/**
 * @brief Three-layer private message codec
 *
 *   gift wrap (kind 1059, throwaway key, "p" = recipient)
 *     └ seal (kind 13, sender key, no tags)
 *         └ inner message (kind 14/15, unsigned)
 *
 * Each layer's content is a PrivateCipher payload of the next layer's JSON.
 * Outer timestamps are pushed up to GIFT_WRAP_FUZZ_WINDOW into the past so
 * relays cannot correlate them with the real send time.
 */
class GiftWrapCodec {
public:
    /**
     * @brief Build the unsigned inner message
     *
     * Kind 15 when attachments are present, else 14. Attachment URLs are
     * appended to the content, one per line, and described by "imeta" tags.
     */
    [[nodiscard]] static Result<event::Event, DmFailure> BuildInnerMessage(
        const std::string& sender,
        const std::vector<std::string>& recipients,
        const std::string& content,
        const std::vector<event::Attachment>& attachments,
        const std::string& subject,
        int64_t now);

    [[nodiscard]] static Result<event::Event, DmFailure> CreateSeal(
        const event::Event& inner,
        const interfaces::ISigner& sender,
        const std::string& recipient,
        int64_t now);

    /// Signs with a freshly generated key that is destroyed on return.
    [[nodiscard]] static Result<event::Event, DmFailure> CreateGiftWrap(
        const event::Event& seal,
        const std::string& recipient,
        int64_t now);

    /**
     * @brief One wrap per member of recipients ∪ {sender}
     *
     * Order: recipients as given, then the sender's own copy. Duplicates
     * are dropped.
     */
    [[nodiscard]] static Result<std::vector<WrappedCopy>, DmFailure> WrapForRecipients(
        const event::Event& inner,
        const interfaces::ISigner& sender,
        const std::vector<std::string>& recipients,
        int64_t now);

    /**
     * @brief Decrypt and validate every layer
     *
     * @return MalformedEnvelope for structural problems, DecryptionFailed
     *         when a layer cannot be decrypted
     */
    [[nodiscard]] static Result<UnwrappedMessage, DmFailure> Unwrap(
        const event::Event& gift_wrap,
        const interfaces::ISigner& me);

    /// now minus a uniform random offset in [0, GIFT_WRAP_FUZZ_WINDOW).
    [[nodiscard]] static int64_t FuzzTimestamp(int64_t now);

private:
    GiftWrapCodec() = delete;
};

}
