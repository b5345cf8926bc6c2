#pragma once

#include "dmsync/event/event.hpp"
#include "dmsync/event/filter.hpp"
#include "dmsync/interfaces/i_relay_transport.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace dmsync::relay {

/// Outcome of one query against one relay.
struct RelayAnswer {
    std::string relay;
    bool succeeded = false;
    std::vector<event::Event> events;
    std::string error;
};

/// Runs the query and folds every transport failure, thrown or returned,
/// into the answer.
[[nodiscard]] RelayAnswer QueryRelay(
    interfaces::IRelayTransport& transport,
    const std::string& relay,
    const std::vector<event::Filter>& filters,
    std::chrono::milliseconds timeout);

struct PublishReport {
    std::vector<std::string> accepted;
    /// Relay and the reason it refused the event.
    std::vector<std::pair<std::string, std::string>> failed;

    [[nodiscard]] bool AnyAccepted() const noexcept { return !accepted.empty(); }
};

/// Publishes to every relay in parallel and waits for all of them.
[[nodiscard]] PublishReport PublishToRelays(
    interfaces::IRelayTransport& transport,
    const std::vector<std::string>& relays,
    const event::Event& event);

}
