#include "dmsync/event/event.hpp"
#include "dmsync/core/constants.hpp"

namespace dmsync::event {

std::optional<std::string> FirstTagValue(const Tags& tags, const std::string_view name) {
    for (const auto& tag : tags) {
        if (tag.size() >= 2 && tag[0] == name) {
            return tag[1];
        }
    }
    return std::nullopt;
}

std::vector<std::string> TagValues(const Tags& tags, const std::string_view name) {
    std::vector<std::string> values;
    for (const auto& tag : tags) {
        if (tag.size() >= 2 && tag[0] == name) {
            values.push_back(tag[1]);
        }
    }
    return values;
}

bool IsRelayListKind(const uint32_t kind) noexcept {
    return kind == EventKind::RELAY_LIST ||
           kind == EventKind::DM_INBOX_RELAYS ||
           kind == EventKind::BLOCKED_RELAYS;
}

}
