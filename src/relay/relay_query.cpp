#include "dmsync/relay/relay_query.hpp"

#include <exception>
#include <future>

namespace dmsync::relay {

RelayAnswer QueryRelay(
    interfaces::IRelayTransport& transport,
    const std::string& relay,
    const std::vector<event::Filter>& filters,
    const std::chrono::milliseconds timeout) {

    RelayAnswer answer;
    answer.relay = relay;
    try {
        auto events = transport.Query(relay, filters, timeout);
        if (events.IsErr()) {
            answer.error = events.UnwrapErr().message;
            return answer;
        }
        answer.events = std::move(events).Unwrap();
        answer.succeeded = true;
    } catch (const std::exception& ex) {
        answer.error = ex.what();
    }
    return answer;
}

PublishReport PublishToRelays(
    interfaces::IRelayTransport& transport,
    const std::vector<std::string>& relays,
    const event::Event& event) {

    std::vector<std::future<std::string>> pending;
    pending.reserve(relays.size());
    for (const auto& relay : relays) {
        pending.push_back(std::async(std::launch::async, [&transport, &relay, &event]() -> std::string {
            try {
                auto published = transport.Publish(relay, event);
                return published.IsErr() ? published.UnwrapErr().message : std::string();
            } catch (const std::exception& ex) {
                return ex.what();
            }
        }));
    }

    PublishReport report;
    for (size_t i = 0; i < relays.size(); ++i) {
        auto error = pending[i].get();
        if (error.empty()) {
            report.accepted.push_back(relays[i]);
        } else {
            report.failed.emplace_back(relays[i], std::move(error));
        }
    }
    return report;
}

}
