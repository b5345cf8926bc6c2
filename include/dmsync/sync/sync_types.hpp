#pragma once

#include "dmsync/core/failures.hpp"
#include "dmsync/merge/messaging_state.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dmsync::sync {

enum class SyncPhase : uint8_t {
    Idle = 0,
    Cache = 1,
    InitialQuery = 2,
    GapFill = 3,
    Subscriptions = 4,
    Ready = 5,
    Error = 6
};

[[nodiscard]] const char* SyncPhaseToString(SyncPhase phase) noexcept;

/// Wall clock in Unix milliseconds; replaced by a manual clock in tests.
using UnixClock = std::function<int64_t()>;

[[nodiscard]] int64_t SystemNowMs();

/// How a state change proposed to the session reaches the cache.
enum class PersistMode : uint8_t {
    None = 0,
    Debounced = 1,
    Immediate = 2
};

/// Progress of the batched scan for one protocol.
struct ScanProgress {
    size_t collected = 0;
    bool limit_reached = false;
};

struct SubscriptionStatus {
    bool legacy_connected = false;
    bool private_connected = false;
};

/// Read-only view handed to the UI layer.
struct SessionSnapshot {
    SyncPhase phase = SyncPhase::Idle;
    std::vector<merge::ConversationSummary> conversations;
    std::map<std::string, std::vector<merge::Message>> messages;
    std::map<std::string, merge::RelayInfo> relay_info;
    ScanProgress legacy_progress;
    ScanProgress private_progress;
    SubscriptionStatus subscriptions;
    std::optional<RelayError> relay_error;
};

}
