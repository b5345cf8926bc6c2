#pragma once

#include "dmsync/core/cancellation.hpp"
#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/configuration/sync_config.hpp"
#include "dmsync/event/envelope.hpp"
#include "dmsync/event/event.hpp"
#include "dmsync/interfaces/i_cache_store.hpp"
#include "dmsync/interfaces/i_relay_transport.hpp"
#include "dmsync/interfaces/i_signer.hpp"
#include "dmsync/interfaces/i_sync_event_handler.hpp"
#include "dmsync/merge/merge_engine.hpp"
#include "dmsync/merge/messaging_state.hpp"
#include "dmsync/relay/relay_resolver.hpp"
#include "dmsync/relay/relay_router.hpp"
#include "dmsync/store/persistence_queue.hpp"
#include "dmsync/sync/subscription_manager.hpp"
#include "dmsync/sync/sync_orchestrator.hpp"
#include "dmsync/sync/sync_types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dmsync::sync {

struct SessionDependencies {
    std::shared_ptr<interfaces::IRelayTransport> transport;
    std::shared_ptr<interfaces::ISigner> signer;
    std::shared_ptr<interfaces::ICacheStore> store;
    /// Optional.
    std::shared_ptr<interfaces::ISyncEventHandler> handler;
    /// Defaults to the system clock.
    UnixClock clock;
};

/**
 * @brief Messaging session of one local user
 *
 * Owns the canonical MessagingState and is the only place it is mutated,
 * always through MergeEngine and under the state lock. Sync runs execute on
 * a background thread; live events arrive on transport threads. Handler
 * callbacks are made without any session lock held.
 *
 * Lifecycle calls (Start, Wait, ClearCacheAndRefetch, SwitchUser, Shutdown)
 * must not be made from inside handler callbacks.
 */
class DmSession {
public:
    DmSession(SessionDependencies dependencies, configuration::SyncConfig config);
    ~DmSession();

    DmSession(const DmSession&) = delete;
    DmSession& operator=(const DmSession&) = delete;

    /// Starts a sync run in the background.
    [[nodiscard]] Result<Unit, DmFailure> Start();

    /// Blocks until the current run finished and returns its outcome.
    [[nodiscard]] Result<RunOutcome, DmFailure> Wait();

    [[nodiscard]] SessionSnapshot Snapshot() const;

    /// Copy of the canonical state.
    [[nodiscard]] merge::MessagingState State() const;

    [[nodiscard]] SyncPhase Phase() const;
    [[nodiscard]] std::string UserPubkey() const;

    /**
     * @brief Send a message
     *
     * `recipients` are pubkeys, or a single conversation id. The local user
     * is dropped from the list; nobody left means a note to self. An
     * optimistic placeholder is inserted before anything is published and
     * marked failed when the send fails.
     *
     * @return PublishFailed when no copy reached a relay,
     *         PublishPartialFailure when a recipient copy was not accepted,
     *         InvalidInput for a LEGACY send to more than one recipient
     */
    [[nodiscard]] Result<merge::OptimisticHandle, DmFailure> SendMessage(
        const std::vector<std::string>& recipients,
        const std::string& content,
        MessageProtocol protocol,
        const std::vector<event::Attachment>& attachments = {},
        const std::string& subject = {});

    /// Drops the cache and everything in memory, then syncs from scratch.
    [[nodiscard]] Result<Unit, DmFailure> ClearCacheAndRefetch();

    /**
     * @brief React to one of the local user's relay lists being republished
     *
     * @return true when the event id differs from the last one seen for its
     *         kind and a full refetch was started
     */
    bool OnRelayListsChanged(const event::Event& relay_list);

    /// Tears the session down for the current user and starts for `signer`.
    [[nodiscard]] Result<Unit, DmFailure> SwitchUser(std::shared_ptr<interfaces::ISigner> signer);

    /// Cancels work, closes subscriptions and writes the pending snapshot.
    void Shutdown();

    bool MarkConversationRead(const std::string& conversation_id);

    void DismissRelayError();

    [[nodiscard]] Result<std::vector<relay::ConversationRelay>, DmFailure> ConversationRelays(
        const std::string& conversation_id) const;

private:
    Result<Unit, DmFailure> StartLocked();
    void StopRunLocked();
    void ShutdownLocked();
    void EnsureComponentsLocked();

    void RunSync(CancellationToken cancellation);
    SyncHooks MakeHooks();

    void ApplyState(const merge::MessagingState& incoming, PersistMode persist);
    void SetPhase(SyncPhase phase);
    void RecordRelayError(const RelayError& error);
    void RecordRelayLists(const relay::RelayLists& lists);
    void OnLiveDelivery(LiveDelivery delivery);

    static void Persist(
        const std::shared_ptr<store::PersistenceQueue>& queue,
        merge::MessagingState state,
        PersistMode mode);
    void NotifyState();
    [[nodiscard]] SessionSnapshot SnapshotLocked() const;

    [[nodiscard]] Result<Unit, DmFailure> PublishPrivate(
        const interfaces::ISigner& signer,
        const event::Event& inner,
        const std::vector<std::string>& recipients,
        int64_t now_s);

    [[nodiscard]] Result<Unit, DmFailure> PublishLegacy(
        const interfaces::ISigner& signer,
        const std::string& counterpart,
        const std::string& text,
        int64_t now_s);

    [[nodiscard]] relay::ResolverSnapshot ResolveRoutes(const std::vector<std::string>& pubkeys) const;

    std::shared_ptr<interfaces::IRelayTransport> transport_;
    std::shared_ptr<interfaces::ICacheStore> store_;
    std::shared_ptr<interfaces::ISyncEventHandler> handler_;
    UnixClock clock_;
    configuration::SyncConfig config_;

    std::mutex lifecycle_lock_;
    std::thread run_thread_;
    CancellationToken cancellation_;

    mutable std::mutex state_lock_;
    std::shared_ptr<interfaces::ISigner> signer_;
    std::string user_pubkey_;
    /// Bumped whenever state_ is torn down; work started under an older
    /// value must not touch state_ or the cache.
    uint64_t generation_ = 0;
    std::shared_ptr<store::PersistenceQueue> persistence_;
    merge::MessagingState state_;
    SyncPhase phase_ = SyncPhase::Idle;
    ScanProgress legacy_progress_;
    ScanProgress private_progress_;
    std::optional<RelayError> relay_error_;
    std::map<uint32_t, std::string> relay_list_ids_;
    int64_t last_message_ms_ = 0;
    std::optional<Result<RunOutcome, DmFailure>> run_result_;
    std::unique_ptr<SubscriptionManager> subscriptions_;
};

}
