#pragma once

#include "dmsync/core/failures.hpp"
#include "dmsync/sync/sync_types.hpp"

namespace dmsync::interfaces {

/// Callbacks from a running session. May be invoked from worker or transport
/// threads, never while the session holds its state lock.
class ISyncEventHandler {
public:
    virtual ~ISyncEventHandler() = default;

    virtual void OnPhaseChanged(sync::SyncPhase phase) = 0;

    virtual void OnStateChanged(const sync::SessionSnapshot& snapshot) = 0;

    virtual void OnRelayError(const RelayError& error) = 0;
};

}
