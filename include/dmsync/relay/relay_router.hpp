#pragma once

#include "dmsync/event/event.hpp"
#include "dmsync/event/filter.hpp"

#include <map>
#include <string>
#include <vector>

namespace dmsync::relay {

/// Relay sets known at the moment a routing decision is made.
struct ResolverSnapshot {
    std::vector<std::string> my_inbox;
    std::vector<std::string> my_outbox;
    /// Recipient pubkey -> that recipient's inbox relays.
    std::map<std::string, std::vector<std::string>> recipient_inboxes;
    std::vector<std::string> discovery;
};

/**
 * @brief Chooses endpoints for outgoing filters and events
 *
 * Pure functions of (filter or event, snapshot). An empty route falls back
 * to the discovery relays.
 */
class RelayRouter {
public:
    /// DM filters go to my inbox, relay-list lookups to discovery, the rest to my outbox.
    [[nodiscard]] static std::vector<std::string> RouteFilter(
        const event::Filter& filter,
        const ResolverSnapshot& snapshot);

    /**
     * Gift wrap: the "p" recipient's inbox.
     * Legacy DM: my inbox and the recipient's inbox.
     * Relay lists: my outbox plus the relays the event declares.
     * Anything else: my outbox.
     */
    [[nodiscard]] static std::vector<std::string> RouteEvent(
        const event::Event& event,
        const ResolverSnapshot& snapshot);

private:
    RelayRouter() = delete;
};

}
