#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dmsync::event {

using Tag = std::vector<std::string>;
using Tags = std::vector<Tag>;

/// A signed relay event. Seals and gift wraps are events too; inner messages
/// are events with an empty signature.
struct Event {
    std::string id;
    std::string pubkey;
    int64_t created_at = 0;
    uint32_t kind = 0;
    Tags tags;
    std::string content;
    std::string sig;

    bool operator==(const Event& other) const = default;
};

/// Value at index 1 of the first tag named `name`.
[[nodiscard]] std::optional<std::string> FirstTagValue(const Tags& tags, std::string_view name);

/// Index-1 values of every tag named `name`, in tag order.
[[nodiscard]] std::vector<std::string> TagValues(const Tags& tags, std::string_view name);

[[nodiscard]] bool IsRelayListKind(uint32_t kind) noexcept;

}
