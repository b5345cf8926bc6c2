#include "dmsync/sync/sync_types.hpp"

#include <chrono>

namespace dmsync::sync {

const char* SyncPhaseToString(const SyncPhase phase) noexcept {
    switch (phase) {
        case SyncPhase::Idle: return "idle";
        case SyncPhase::Cache: return "cache";
        case SyncPhase::InitialQuery: return "initial-query";
        case SyncPhase::GapFill: return "gap-fill";
        case SyncPhase::Subscriptions: return "subscriptions";
        case SyncPhase::Ready: return "ready";
        case SyncPhase::Error: return "error";
    }
    return "unknown";
}

int64_t SystemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}
