#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/event/filter.hpp"
#include "dmsync/interfaces/i_relay_transport.hpp"
#include "dmsync/interfaces/i_signer.hpp"
#include "dmsync/merge/messaging_state.hpp"
#include "dmsync/sync/sync_types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dmsync::sync {

/// One decrypted live event handed to the session.
struct LiveDelivery {
    MessageProtocol protocol = MessageProtocol::Legacy;
    merge::DecryptedMessage message;
    /// New cursor value (Unix seconds) when the event was processed cleanly.
    std::optional<int64_t> advance_cursor_to;
};

/**
 * @brief Standing subscriptions for new messages
 *
 * One subscription per protocol on the user's inbox relays. Events are
 * decrypted on the transport thread and handed to the delivery callback.
 * Events from a subscription generation that has been torn down are
 * dropped.
 */
class SubscriptionManager {
public:
    using DeliverFn = std::function<void(LiveDelivery)>;

    SubscriptionManager(
        std::shared_ptr<interfaces::IRelayTransport> transport,
        std::shared_ptr<const interfaces::ISigner> signer,
        std::chrono::seconds overlap,
        bool enable_private,
        UnixClock clock,
        DeliverFn deliver);

    ~SubscriptionManager();

    SubscriptionManager(const SubscriptionManager&) = delete;
    SubscriptionManager& operator=(const SubscriptionManager&) = delete;

    /**
     * @brief Open both subscriptions on `relays`
     *
     * Replaces any running subscriptions. A protocol whose subscription
     * cannot be opened stays disconnected; the first such failure is
     * returned.
     */
    [[nodiscard]] Result<Unit, DmFailure> Start(
        const std::vector<std::string>& relays,
        const merge::LastSync& cursors);

    /// Tears down and recreates every subscription when the relay set changed.
    [[nodiscard]] Result<bool, DmFailure> UpdateRelays(
        const std::vector<std::string>& relays,
        const merge::LastSync& cursors);

    /// Closes everything. No delivery happens after Stop returns.
    void Stop();

    [[nodiscard]] SubscriptionStatus Status() const;
    [[nodiscard]] std::vector<std::string> Relays() const;

    /**
     * LEGACY: cursor - overlap. PRIVATE: cursor - overlap - fuzz window.
     * Without a cursor, `now_s` stands in for it.
     */
    [[nodiscard]] static int64_t LiveSince(
        MessageProtocol protocol,
        std::optional<int64_t> cursor,
        std::chrono::seconds overlap,
        int64_t now_s);

    [[nodiscard]] static std::vector<event::Filter> LiveFilters(
        MessageProtocol protocol,
        const std::string& me,
        int64_t since);

private:
    Result<std::unique_ptr<interfaces::ISubscription>, DmFailure> Open(
        MessageProtocol protocol,
        const std::vector<std::string>& relays,
        std::optional<int64_t> cursor,
        uint64_t generation);

    void HandleEvent(MessageProtocol protocol, uint64_t generation, const event::Event& event);
    void CloseAll();

    std::shared_ptr<interfaces::IRelayTransport> transport_;
    std::shared_ptr<const interfaces::ISigner> signer_;
    std::chrono::seconds overlap_;
    bool enable_private_;
    UnixClock clock_;
    DeliverFn deliver_;

    mutable std::mutex lock_;
    std::vector<std::string> relays_;
    std::unique_ptr<interfaces::ISubscription> legacy_;
    std::unique_ptr<interfaces::ISubscription> private_;
    std::atomic<uint64_t> generation_{0};
};

}
