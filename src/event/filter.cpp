#include "dmsync/event/filter.hpp"

#include <algorithm>

namespace dmsync::event {

nlohmann::json Filter::ToJson() const {
    nlohmann::json json = nlohmann::json::object();
    if (!kinds.empty()) {
        json["kinds"] = kinds;
    }
    if (!authors.empty()) {
        json["authors"] = authors;
    }
    if (!p_tags.empty()) {
        json["#p"] = p_tags;
    }
    if (since) {
        json["since"] = *since;
    }
    if (until) {
        json["until"] = *until;
    }
    if (limit) {
        json["limit"] = *limit;
    }
    return json;
}

bool Filter::Matches(const Event& event) const {
    if (!kinds.empty() && std::find(kinds.begin(), kinds.end(), event.kind) == kinds.end()) {
        return false;
    }
    if (!authors.empty() && std::find(authors.begin(), authors.end(), event.pubkey) == authors.end()) {
        return false;
    }
    if (!p_tags.empty()) {
        const auto values = TagValues(event.tags, "p");
        const bool any = std::any_of(values.begin(), values.end(), [this](const std::string& value) {
            return std::find(p_tags.begin(), p_tags.end(), value) != p_tags.end();
        });
        if (!any) {
            return false;
        }
    }
    if (since && event.created_at < *since) {
        return false;
    }
    if (until && event.created_at > *until) {
        return false;
    }
    return true;
}

}
