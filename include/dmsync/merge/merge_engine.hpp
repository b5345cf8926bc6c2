#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/merge/messaging_state.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace dmsync::merge {

struct ParsedConversationId {
    std::vector<std::string> participants;
    std::string subject;
};

/// Inputs of one sync pass, gathered by the orchestrator.
struct BuildInput {
    std::string me;
    std::map<std::string, Participant> participants;
    std::vector<DecryptedMessage> initial;
    std::vector<DecryptedMessage> gap_fill;
    std::set<std::string> queried_relays;
    bool limit_reached = false;
    std::map<std::string, RelayInfo> relay_info;
    int64_t now_ms = 0;
};

/// Where an optimistic placeholder was inserted.
struct OptimisticHandle {
    std::string conversation_id;
    std::string message_id;
};

/**
 * @brief Pure transformations of MessagingState
 *
 * Every operation keeps each conversation sorted ascending by created_at and
 * free of duplicate dedup keys, and recomputes the conversation flags after
 * touching its messages. None of them perform I/O.
 */
class MergeEngine {
public:
    /// "group:" + sorted unique pubkeys joined by "," + ":" + subject
    [[nodiscard]] static std::string ComputeConversationId(
        const std::vector<std::string>& participants,
        const std::string& subject);

    /// Subject is the text after the last ':'.
    [[nodiscard]] static Result<ParsedConversationId, DmFailure> ParseConversationId(std::string_view id);

    /**
     * @brief Assemble a state from freshly fetched messages
     *
     * Gap-fill messages already present in the initial batch are dropped.
     * Relays the local user blocks are flagged in relay_info.
     */
    [[nodiscard]] static MessagingState BuildMessagingState(const BuildInput& input);

    /**
     * @brief Union two states
     *
     * Messages are unioned per conversation by dedup key, existing copy
     * first. Participants, relay info and sync state from `incoming` win;
     * cursors and last_read_at keep the newer value. Idempotent.
     */
    [[nodiscard]] static MessagingState Merge(const MessagingState& existing, const MessagingState& incoming);

    /**
     * @brief Insert one live message
     *
     * Replaces a matching optimistic placeholder in place when one exists.
     * Placeholder matching (same sender and content, created_at within
     * tolerance) is best effort: two identical sends inside the window look
     * like one echo. Deduplication relies only on DedupKey().
     *
     * @return false when the message was already present
     */
    static bool AddMessage(
        MessagingState& state,
        const DecryptedMessage& message,
        const std::string& me,
        std::chrono::seconds tolerance);

    static OptimisticHandle AddOptimisticMessage(
        MessagingState& state,
        const std::string& me,
        const std::vector<std::string>& recipients,
        const std::string& content,
        MessageProtocol protocol,
        int64_t now_ms,
        const std::string& subject = {});

    static bool MarkSendFailed(
        MessagingState& state,
        const std::string& conversation_id,
        const std::string& message_id,
        const std::string& error);

    static bool MarkConversationRead(MessagingState& state, const std::string& conversation_id, int64_t at);

    /// Most recently active first.
    [[nodiscard]] static std::vector<ConversationSummary> Summaries(const MessagingState& state);

    static void RecomputeMetadata(Conversation& conversation, const std::string& me);

private:
    MergeEngine() = delete;
};

}
