#include "dmsync/sync/message_fetcher.hpp"
#include "dmsync/relay/relay_query.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"
#include "dmsync/debug/logger.hpp"

#include <algorithm>
#include <future>
#include <unordered_set>

namespace dmsync::sync {

using event::Event;
using event::Filter;
using relay::RelayAnswer;

namespace {
    constexpr const char* COMPONENT = "fetch";

    struct StreamState {
        Filter base;
        std::optional<int64_t> until;
        /// Ids already collected at created_at == until; the next page returns them again.
        std::unordered_set<std::string> boundary;
        size_t collected = 0;
        bool exhausted = false;
    };

    struct StreamRound {
        StreamState* stream = nullptr;
        uint32_t requested = 0;
        uint32_t limit = 0;
        std::vector<std::future<RelayAnswer>> answers;
    };

    void RecordAnswer(std::map<std::string, merge::RelayInfo>& relay_info, const RelayAnswer& answer) {
        auto& info = relay_info[answer.relay];
        if (answer.succeeded) {
            info.last_query_succeeded = true;
        } else {
            info.last_query_error = answer.error;
        }
    }
}

std::vector<Filter> MessageFetcher::StreamFilters(const MessageProtocol protocol, const std::string& me) {
    if (protocol == MessageProtocol::Legacy) {
        Filter to_me;
        to_me.kinds = {EventKind::LEGACY_DIRECT_MESSAGE};
        to_me.p_tags = {me};
        Filter from_me;
        from_me.kinds = {EventKind::LEGACY_DIRECT_MESSAGE};
        from_me.authors = {me};
        return {to_me, from_me};
    }
    Filter wraps;
    wraps.kinds = {EventKind::GIFT_WRAP};
    wraps.p_tags = {me};
    return {wraps};
}

FetchResult MessageFetcher::Fetch(
    interfaces::IRelayTransport& transport,
    const std::vector<std::string>& relays,
    const std::string& me,
    const MessageProtocol protocol,
    const std::optional<int64_t> since,
    const FetchLimits& limits,
    const CancellationToken& cancellation) {

    FetchResult result;
    if (relays.empty()) {
        return result;
    }

    std::vector<StreamState> streams;
    for (auto& filter : StreamFilters(protocol, me)) {
        filter.since = since.value_or(0);
        streams.push_back(StreamState{std::move(filter), std::nullopt, {}, 0, false});
    }

    std::unordered_set<std::string> seen;
    size_t total = 0;
    while (total < limits.query_limit) {
        if (cancellation.IsCancelled()) {
            result.cancelled = true;
            return result;
        }

        std::vector<StreamRound> round;
        for (auto& stream : streams) {
            if (stream.exhausted || stream.collected >= limits.query_limit) {
                continue;
            }
            StreamRound entry;
            entry.stream = &stream;
            entry.requested = std::min<uint32_t>(
                limits.batch_size, static_cast<uint32_t>(limits.query_limit - stream.collected));

            entry.limit = entry.requested + static_cast<uint32_t>(stream.boundary.size());

            Filter filter = stream.base;
            filter.until = stream.until;
            filter.limit = entry.limit;
            const std::vector<Filter> filters{filter};
            for (const auto& relay : relays) {
                entry.answers.push_back(std::async(std::launch::async,
                    [&transport, relay, filters, timeout = limits.timeout]() {
                        return relay::QueryRelay(transport, relay, filters, timeout);
                    }));
            }
            round.push_back(std::move(entry));
        }
        if (round.empty()) {
            break;
        }
        ++result.rounds;

        std::map<std::string, bool> relay_succeeded;
        std::vector<std::vector<RelayAnswer>> collected_answers;
        for (auto& entry : round) {
            std::vector<RelayAnswer> answers;
            for (auto& future : entry.answers) {
                answers.push_back(future.get());
                const auto& answer = answers.back();
                RecordAnswer(result.relay_info, answer);
                relay_succeeded[answer.relay] = relay_succeeded[answer.relay] || answer.succeeded;
            }
            collected_answers.push_back(std::move(answers));
        }

        if (cancellation.IsCancelled()) {
            result.cancelled = true;
            return result;
        }

        std::vector<std::string> failed;
        for (const auto& [relay, succeeded] : relay_succeeded) {
            if (!succeeded) {
                failed.push_back(relay);
            }
        }
        if (failed.size() == relays.size()) {
            RelayError error;
            error.message = compat::format("Failed to query {} of {} relays for {} messages",
                failed.size(), relays.size(), ProtocolName(protocol));
            error.protocol = protocol;
            error.failed_relays = std::move(failed);
            error.total_relays = relays.size();
            DMSYNC_LOG_WARN(COMPONENT, "{} after {} events", error.message, result.events.size());
            result.relay_error = std::move(error);
            break;
        }

        for (size_t i = 0; i < round.size(); ++i) {
            StreamState& stream = *round[i].stream;
            std::unordered_set<std::string> round_ids;
            std::vector<const Event*> page;
            size_t added = 0;
            std::optional<int64_t> oldest;
            for (const auto& answer : collected_answers[i]) {
                for (const auto& found : answer.events) {
                    if (!round_ids.insert(found.id).second) {
                        continue;
                    }
                    page.push_back(&found);
                    oldest = oldest ? std::min(*oldest, found.created_at) : found.created_at;
                    if (total < limits.query_limit && seen.insert(found.id).second) {
                        result.events.push_back(found);
                        ++added;
                        ++total;
                    }
                }
            }
            stream.collected += added;
            if (oldest) {
                if (stream.until != oldest) {
                    stream.boundary.clear();
                }
                for (const Event* found : page) {
                    if (found->created_at == *oldest) {
                        stream.boundary.insert(found->id);
                    }
                }
                stream.until = *oldest;
            }
            if (round_ids.size() < round[i].limit || added == 0) {
                stream.exhausted = true;
            }
        }

        const bool all_exhausted = std::all_of(streams.begin(), streams.end(),
            [](const StreamState& stream) { return stream.exhausted; });
        if (all_exhausted) {
            break;
        }
    }

    result.limit_reached = total >= limits.query_limit;
    DMSYNC_LOG_DEBUG(COMPONENT, "Fetched {} {} events in {} rounds", result.events.size(),
        ProtocolName(protocol), result.rounds);
    return result;
}

}
