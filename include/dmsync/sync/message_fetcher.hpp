#pragma once

#include "dmsync/core/cancellation.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/event/event.hpp"
#include "dmsync/event/filter.hpp"
#include "dmsync/interfaces/i_relay_transport.hpp"
#include "dmsync/merge/messaging_state.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dmsync::sync {

struct FetchLimits {
    uint32_t batch_size = 1000;
    uint32_t query_limit = 20000;
    std::chrono::milliseconds timeout{5000};
};

struct FetchResult {
    /// Unique by id, in arrival order.
    std::vector<event::Event> events;
    bool limit_reached = false;
    std::map<std::string, merge::RelayInfo> relay_info;
    /// Set when a round failed on every relay; `events` still holds earlier rounds.
    std::optional<RelayError> relay_error;
    bool cancelled = false;
    size_t rounds = 0;
};

/**
 * @brief Batched backward scan of one protocol's message streams
 *
 * LEGACY runs two streams (kind 4 to me, kind 4 from me), PRIVATE one
 * (kind 1059 to me). Each round asks every relay for
 * min(batch_size, query_limit - collected) events per active stream, all
 * in parallel, then moves the stream's upper bound to the oldest
 * created_at it returned. A stream is exhausted once a round returns fewer
 * events than it asked for.
 */
class MessageFetcher {
public:
    /// Filters for the protocol's streams, without paging fields.
    [[nodiscard]] static std::vector<event::Filter> StreamFilters(MessageProtocol protocol, const std::string& me);

    [[nodiscard]] static FetchResult Fetch(
        interfaces::IRelayTransport& transport,
        const std::vector<std::string>& relays,
        const std::string& me,
        MessageProtocol protocol,
        std::optional<int64_t> since,
        const FetchLimits& limits,
        const CancellationToken& cancellation);

private:
    MessageFetcher() = delete;
};

}
