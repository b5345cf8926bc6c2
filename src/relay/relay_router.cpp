#include "dmsync/relay/relay_router.hpp"
#include "dmsync/relay/relay_resolver.hpp"
#include "dmsync/core/constants.hpp"

#include <algorithm>
#include <initializer_list>

namespace dmsync::relay {

namespace {
    void AppendAll(std::vector<std::string>& target, const std::vector<std::string>& relays) {
        for (const auto& relay : relays) {
            if (std::find(target.begin(), target.end(), relay) == target.end()) {
                target.push_back(relay);
            }
        }
    }

    std::vector<std::string> OrDiscovery(std::vector<std::string> relays, const ResolverSnapshot& snapshot) {
        if (relays.empty()) {
            return snapshot.discovery;
        }
        return relays;
    }

    std::vector<std::string> RecipientInbox(const event::Event& event, const ResolverSnapshot& snapshot) {
        const auto recipient = event::FirstTagValue(event.tags, "p");
        if (!recipient) {
            return {};
        }
        const auto inbox = snapshot.recipient_inboxes.find(*recipient);
        if (inbox == snapshot.recipient_inboxes.end()) {
            return {};
        }
        return inbox->second;
    }

    bool OnlyKinds(const event::Filter& filter, const std::initializer_list<uint32_t> allowed) {
        return !filter.kinds.empty() && std::all_of(filter.kinds.begin(), filter.kinds.end(),
            [allowed](const uint32_t kind) {
                return std::find(allowed.begin(), allowed.end(), kind) != allowed.end();
            });
    }
}

std::vector<std::string> RelayRouter::RouteFilter(const event::Filter& filter, const ResolverSnapshot& snapshot) {
    if (OnlyKinds(filter, {EventKind::LEGACY_DIRECT_MESSAGE, EventKind::GIFT_WRAP})) {
        return OrDiscovery(snapshot.my_inbox, snapshot);
    }
    if (OnlyKinds(filter, {EventKind::RELAY_LIST, EventKind::DM_INBOX_RELAYS, EventKind::BLOCKED_RELAYS})) {
        std::vector<std::string> relays = snapshot.discovery;
        AppendAll(relays, snapshot.my_outbox);
        return relays;
    }
    return OrDiscovery(snapshot.my_outbox, snapshot);
}

std::vector<std::string> RelayRouter::RouteEvent(const event::Event& event, const ResolverSnapshot& snapshot) {
    if (event.kind == EventKind::GIFT_WRAP) {
        return OrDiscovery(RecipientInbox(event, snapshot), snapshot);
    }
    if (event.kind == EventKind::LEGACY_DIRECT_MESSAGE) {
        std::vector<std::string> relays = snapshot.my_inbox;
        AppendAll(relays, RecipientInbox(event, snapshot));
        return OrDiscovery(std::move(relays), snapshot);
    }
    if (event::IsRelayListKind(event.kind)) {
        return OrDiscovery(RelayResolver::ResolvePublishRelays(event, snapshot.my_outbox).relays, snapshot);
    }
    return OrDiscovery(snapshot.my_outbox, snapshot);
}

}
