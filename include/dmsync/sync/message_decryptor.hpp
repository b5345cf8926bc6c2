#pragma once

#include "dmsync/event/event.hpp"
#include "dmsync/interfaces/i_signer.hpp"
#include "dmsync/merge/messaging_state.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dmsync::sync {

/**
 * @brief Turns fetched envelopes into canonical messages
 *
 * Failures never abort a batch: an undecryptable envelope becomes a
 * message carrying `decryption_error` and its original ciphertext.
 */
class MessageDecryptor {
public:
    /// nullopt for kinds other than 4 and 1059.
    [[nodiscard]] static std::optional<merge::DecryptedMessage> Decrypt(
        const event::Event& envelope,
        const interfaces::ISigner& me);

    [[nodiscard]] static std::vector<merge::DecryptedMessage> DecryptAll(
        const std::vector<event::Event>& envelopes,
        const interfaces::ISigner& me);

    /// Counterpart is the "p" tag when I wrote the event, else the author.
    [[nodiscard]] static merge::DecryptedMessage DecryptLegacy(
        const event::Event& envelope,
        const interfaces::ISigner& me);

    [[nodiscard]] static merge::DecryptedMessage DecryptGiftWrap(
        const event::Event& gift_wrap,
        const interfaces::ISigner& me);

private:
    MessageDecryptor() = delete;
};

}
