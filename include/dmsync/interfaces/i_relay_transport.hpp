#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/event/event.hpp"
#include "dmsync/event/filter.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dmsync::interfaces {

class ISubscription {
public:
    virtual ~ISubscription() = default;

    /// Idempotent. No callback is delivered after Close returns.
    virtual void Close() = 0;

    [[nodiscard]] virtual bool IsOpen() const = 0;
};

/// Invoked once per delivered event; may run on a transport-owned thread.
using EventCallback = std::function<void(const std::string& relay, const event::Event& event)>;

/**
 * @brief Relay network seen by the engine
 *
 * Implementations own sockets and reconnection. Queries are per relay so the
 * engine can keep health information per endpoint.
 */
class IRelayTransport {
public:
    virtual ~IRelayTransport() = default;

    /// Stored events matching any of the filters, until EOSE or timeout.
    [[nodiscard]] virtual Result<std::vector<event::Event>, DmFailure> Query(
        const std::string& relay,
        const std::vector<event::Filter>& filters,
        std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual Result<std::unique_ptr<ISubscription>, DmFailure> Subscribe(
        const std::vector<std::string>& relays,
        const std::vector<event::Filter>& filters,
        EventCallback on_event) = 0;

    [[nodiscard]] virtual Result<Unit, DmFailure> Publish(
        const std::string& relay,
        const event::Event& event) = 0;
};

}
