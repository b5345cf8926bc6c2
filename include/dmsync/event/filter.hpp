#pragma once

#include "dmsync/event/event.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dmsync::event {

/// Relay query filter. Empty vectors match anything; `p_tags` serialises as "#p".
struct Filter {
    std::vector<uint32_t> kinds;
    std::vector<std::string> authors;
    std::vector<std::string> p_tags;
    std::optional<int64_t> since;
    std::optional<int64_t> until;
    std::optional<uint32_t> limit;

    [[nodiscard]] nlohmann::json ToJson() const;

    /// In-memory evaluation; `limit` is not applied here.
    [[nodiscard]] bool Matches(const Event& event) const;

    bool operator==(const Filter& other) const = default;
};

}
