#include "dmsync/sync/dm_session.hpp"
#include "dmsync/crypto/encoding.hpp"
#include "dmsync/crypto/gift_wrap_codec.hpp"
#include "dmsync/relay/relay_query.hpp"
#include "dmsync/relay/relay_router.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"
#include "dmsync/debug/logger.hpp"

#include <algorithm>
#include <future>

namespace dmsync::sync {

using merge::MergeEngine;
using merge::MessagingState;
using relay::RelayResolver;

namespace {
    constexpr const char* COMPONENT = "session";

    void LogRefusals(const relay::PublishReport& report, const event::Event& event) {
        for (const auto& [relay, reason] : report.failed) {
            DMSYNC_LOG_WARN(COMPONENT, "Relay {} refused event {}: {}", relay, event.id, reason);
        }
    }
}

DmSession::DmSession(SessionDependencies dependencies, configuration::SyncConfig config)
    : transport_(std::move(dependencies.transport))
    , store_(std::move(dependencies.store))
    , handler_(std::move(dependencies.handler))
    , clock_(dependencies.clock ? std::move(dependencies.clock) : UnixClock(&SystemNowMs))
    , config_(std::move(config)) {
    signer_ = std::move(dependencies.signer);
    if (signer_) {
        user_pubkey_ = signer_->GetPublicKey();
    }
}

DmSession::~DmSession() {
    Shutdown();
}

Result<Unit, DmFailure> DmSession::Start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_lock_);
    return StartLocked();
}

Result<Unit, DmFailure> DmSession::StartLocked() {
    DMSYNC_TRY(config_.Validate());
    if (!transport_ || !store_) {
        return Result<Unit, DmFailure>::Err(DmFailure::InvalidState("Session needs a transport and a cache store"));
    }
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        if (!signer_) {
            return Result<Unit, DmFailure>::Err(DmFailure::InvalidState("No signer configured"));
        }
        run_result_.reset();
    }
    if (run_thread_.joinable()) {
        return Result<Unit, DmFailure>::Err(DmFailure::InvalidState("A sync run is already active"));
    }

    EnsureComponentsLocked();
    cancellation_ = CancellationToken();
    run_thread_ = std::thread([this, token = cancellation_]() {
        RunSync(token);
    });
    return Result<Unit, DmFailure>::Ok(unit);
}

Result<RunOutcome, DmFailure> DmSession::Wait() {
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_lock_);
        if (run_thread_.joinable()) {
            run_thread_.join();
        }
    }
    std::lock_guard<std::mutex> guard(state_lock_);
    if (!run_result_) {
        return Result<RunOutcome, DmFailure>::Err(DmFailure::InvalidState("No sync run has been started"));
    }
    return *run_result_;
}

void DmSession::StopRunLocked() {
    cancellation_.Cancel();
    if (run_thread_.joinable()) {
        run_thread_.join();
    }
}

void DmSession::EnsureComponentsLocked() {
    std::shared_ptr<interfaces::ISigner> signer;
    std::string me;
    bool needs_subscriptions = false;
    bool needs_persistence = false;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        signer = signer_;
        me = user_pubkey_;
        needs_subscriptions = !subscriptions_;
        needs_persistence = !persistence_;
    }

    if (needs_persistence) {
        auto queue = std::make_shared<store::PersistenceQueue>(store_, me, config_.debounced_write_delay);
        std::lock_guard<std::mutex> guard(state_lock_);
        persistence_ = std::move(queue);
    }
    if (needs_subscriptions) {
        auto subscriptions = std::make_unique<SubscriptionManager>(
            transport_, signer, config_.subscription_overlap, config_.enable_private_protocol, clock_,
            [this](LiveDelivery delivery) { OnLiveDelivery(std::move(delivery)); });
        std::lock_guard<std::mutex> guard(state_lock_);
        subscriptions_ = std::move(subscriptions);
    }
}

SyncHooks DmSession::MakeHooks() {
    SyncHooks hooks;
    hooks.on_phase = [this](const SyncPhase phase) { SetPhase(phase); };
    hooks.on_state = [this](const MessagingState& incoming, const PersistMode persist) {
        ApplyState(incoming, persist);
    };
    hooks.on_progress = [this](const MessageProtocol protocol, const ScanProgress& progress) {
        std::lock_guard<std::mutex> guard(state_lock_);
        (protocol == MessageProtocol::Legacy ? legacy_progress_ : private_progress_) = progress;
    };
    hooks.on_relay_error = [this](const RelayError& error) { RecordRelayError(error); };
    hooks.on_my_relay_lists = [this](const relay::RelayLists& lists) { RecordRelayLists(lists); };
    hooks.start_subscriptions = [this](const std::vector<std::string>& relays) -> Result<Unit, DmFailure> {
        SubscriptionManager* subscriptions = nullptr;
        merge::LastSync cursors;
        {
            std::lock_guard<std::mutex> guard(state_lock_);
            subscriptions = subscriptions_.get();
            cursors = state_.last_sync;
        }
        if (!subscriptions) {
            return Result<Unit, DmFailure>::Err(DmFailure::InvalidState("Subscription manager not running"));
        }
        auto updated = subscriptions->UpdateRelays(relays, cursors);
        if (updated.IsErr()) {
            return Fail(std::move(updated).UnwrapErr());
        }
        return Result<Unit, DmFailure>::Ok(unit);
    };
    return hooks;
}

void DmSession::RunSync(const CancellationToken cancellation) {
    std::shared_ptr<interfaces::ISigner> signer;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        signer = signer_;
    }

    SyncOrchestrator orchestrator(
        SyncDependencies{transport_, signer, store_, clock_}, config_, MakeHooks());
    auto outcome = orchestrator.Run(cancellation);
    if (outcome.IsErr() && outcome.UnwrapErr().type != DmFailureType::Cancelled) {
        DMSYNC_LOG_ERROR(COMPONENT, "Sync run failed: {}", outcome.UnwrapErr().message);
        SetPhase(SyncPhase::Error);
    }

    std::lock_guard<std::mutex> guard(state_lock_);
    run_result_ = std::move(outcome);
}

void DmSession::ApplyState(const MessagingState& incoming, const PersistMode persist) {
    MessagingState merged;
    std::shared_ptr<store::PersistenceQueue> queue;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        state_ = MergeEngine::Merge(state_, incoming);
        if (persist != PersistMode::None) {
            merged = state_;
            queue = persistence_;
        }
    }
    if (persist != PersistMode::None) {
        Persist(queue, std::move(merged), persist);
    }
    NotifyState();
}

void DmSession::Persist(
    const std::shared_ptr<store::PersistenceQueue>& queue,
    MessagingState state,
    const PersistMode mode) {

    if (!queue) {
        return;
    }
    if (mode == PersistMode::Immediate) {
        queue->FlushNow(std::move(state));
    } else if (mode == PersistMode::Debounced) {
        queue->Schedule(std::move(state));
    }
}

void DmSession::SetPhase(const SyncPhase phase) {
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        phase_ = phase;
    }
    if (handler_) {
        handler_->OnPhaseChanged(phase);
    }
}

void DmSession::RecordRelayError(const RelayError& error) {
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        relay_error_ = error;
    }
    if (handler_) {
        handler_->OnRelayError(error);
    }
}

void DmSession::RecordRelayLists(const relay::RelayLists& lists) {
    std::lock_guard<std::mutex> guard(state_lock_);
    for (const auto* list : {&lists.relay_list, &lists.dm_inbox, &lists.blocked}) {
        if (*list) {
            relay_list_ids_[(*list)->kind] = (*list)->id;
        }
    }
}

void DmSession::OnLiveDelivery(LiveDelivery delivery) {
    MessagingState snapshot;
    std::shared_ptr<store::PersistenceQueue> queue;
    PersistMode mode = PersistMode::Debounced;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        const bool added = MergeEngine::AddMessage(
            state_, delivery.message, user_pubkey_, config_.optimistic_match_tolerance);

        bool advanced = false;
        if (delivery.advance_cursor_to) {
            auto& cursor = delivery.protocol == MessageProtocol::Legacy
                ? state_.last_sync.legacy
                : state_.last_sync.private_messages;
            if (!cursor || *cursor < *delivery.advance_cursor_to) {
                cursor = *delivery.advance_cursor_to;
                advanced = true;
            }
        }
        if (!added && !advanced) {
            return;
        }

        if (added) {
            const int64_t now_ms = clock_();
            if (now_ms - last_message_ms_ >= config_.recent_message_threshold.count()) {
                mode = PersistMode::Immediate;
            }
            last_message_ms_ = now_ms;
        }
        snapshot = state_;
        queue = persistence_;
    }

    Persist(queue, std::move(snapshot), mode);
    NotifyState();
}

SessionSnapshot DmSession::SnapshotLocked() const {
    SessionSnapshot snapshot;
    snapshot.phase = phase_;
    snapshot.conversations = MergeEngine::Summaries(state_);
    for (const auto& [id, conversation] : state_.conversations) {
        snapshot.messages.emplace(id, conversation.messages);
    }
    snapshot.relay_info = state_.relay_info;
    snapshot.legacy_progress = legacy_progress_;
    snapshot.private_progress = private_progress_;
    if (subscriptions_) {
        snapshot.subscriptions = subscriptions_->Status();
    }
    snapshot.relay_error = relay_error_;
    return snapshot;
}

SessionSnapshot DmSession::Snapshot() const {
    std::lock_guard<std::mutex> guard(state_lock_);
    return SnapshotLocked();
}

void DmSession::NotifyState() {
    if (!handler_) {
        return;
    }
    SessionSnapshot snapshot;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        snapshot = SnapshotLocked();
    }
    handler_->OnStateChanged(snapshot);
}

MessagingState DmSession::State() const {
    std::lock_guard<std::mutex> guard(state_lock_);
    return state_;
}

SyncPhase DmSession::Phase() const {
    std::lock_guard<std::mutex> guard(state_lock_);
    return phase_;
}

std::string DmSession::UserPubkey() const {
    std::lock_guard<std::mutex> guard(state_lock_);
    return user_pubkey_;
}

relay::ResolverSnapshot DmSession::ResolveRoutes(const std::vector<std::string>& pubkeys) const {
    const std::string me = UserPubkey();
    const auto& discovery = config_.discovery_relays;
    auto lookup = RelayResolver::FetchRelayLists(
        transport_, discovery, pubkeys, config_.query_timeout, config_.discovery_majority_ratio);

    relay::ResolverSnapshot routes;
    routes.discovery = discovery;
    for (const auto& pubkey : pubkeys) {
        auto inbox = RelayResolver::ResolveInboxRelays(lookup.lists[pubkey], discovery);
        if (inbox.warning) {
            DMSYNC_LOG_WARN(COMPONENT, "{} ({})", inbox.warning->message, pubkey);
        }
        routes.recipient_inboxes[pubkey] = std::move(inbox.relays);
    }
    routes.my_inbox = routes.recipient_inboxes[me];
    routes.my_outbox = RelayResolver::ResolveOutboxRelays(lookup.lists[me], discovery).relays;
    return routes;
}

Result<Unit, DmFailure> DmSession::PublishPrivate(
    const interfaces::ISigner& signer,
    const event::Event& inner,
    const std::vector<std::string>& recipients,
    const int64_t now_s) {

    const std::string me = signer.GetPublicKey();
    auto wrapped = crypto::GiftWrapCodec::WrapForRecipients(inner, signer, recipients, now_s);
    if (wrapped.IsErr()) {
        return Fail(std::move(wrapped).UnwrapErr());
    }
    const auto copies = std::move(wrapped).Unwrap();

    std::vector<std::string> members;
    members.reserve(copies.size());
    for (const auto& copy : copies) {
        members.push_back(copy.recipient);
    }
    const auto routes = ResolveRoutes(members);

    std::vector<std::future<relay::PublishReport>> pending;
    pending.reserve(copies.size());
    for (const auto& copy : copies) {
        auto relays = relay::RelayRouter::RouteEvent(copy.gift_wrap, routes);
        pending.push_back(std::async(std::launch::async, [this, &copy, relays = std::move(relays)]() {
            return relay::PublishToRelays(*transport_, relays, copy.gift_wrap);
        }));
    }

    bool my_copy_stored = false;
    size_t recipient_copies = 0;
    size_t recipient_failures = 0;
    for (size_t i = 0; i < copies.size(); ++i) {
        const auto report = pending[i].get();
        LogRefusals(report, copies[i].gift_wrap);
        if (copies[i].recipient == me) {
            my_copy_stored = report.AnyAccepted();
            continue;
        }
        ++recipient_copies;
        if (!report.AnyAccepted()) {
            ++recipient_failures;
        }
    }

    if (!my_copy_stored && recipient_failures == recipient_copies) {
        return Result<Unit, DmFailure>::Err(DmFailure::PublishFailed("Message could not be published to any relay"));
    }
    if (recipient_failures > 0) {
        DMSYNC_LOG_WARN(COMPONENT, "{} of {} recipient copies were not accepted", recipient_failures, recipient_copies);
        return Result<Unit, DmFailure>::Err(
            DmFailure::PublishPartialFailure(std::string(ErrorMessages::MAY_NOT_BE_DELIVERED)));
    }
    if (!my_copy_stored) {
        DMSYNC_LOG_WARN(COMPONENT, "Own copy of the message was not stored; other devices will not see it");
    }
    return Result<Unit, DmFailure>::Ok(unit);
}

Result<Unit, DmFailure> DmSession::PublishLegacy(
    const interfaces::ISigner& signer,
    const std::string& counterpart,
    const std::string& text,
    const int64_t now_s) {

    auto ciphertext = signer.EncryptLegacy(counterpart, text);
    if (ciphertext.IsErr()) {
        return Fail(std::move(ciphertext).UnwrapErr());
    }

    event::Event envelope;
    envelope.kind = EventKind::LEGACY_DIRECT_MESSAGE;
    envelope.created_at = now_s;
    envelope.tags = {{"p", counterpart}};
    envelope.content = std::move(ciphertext).Unwrap();
    auto signed_event = signer.Sign(std::move(envelope));
    if (signed_event.IsErr()) {
        return Fail(std::move(signed_event).UnwrapErr());
    }
    const auto& message = signed_event.Unwrap();

    const std::string me = signer.GetPublicKey();
    std::vector<std::string> members{me};
    if (counterpart != me) {
        members.push_back(counterpart);
    }
    const auto relays = relay::RelayRouter::RouteEvent(message, ResolveRoutes(members));
    const auto report = relay::PublishToRelays(*transport_, relays, message);
    LogRefusals(report, message);
    if (!report.AnyAccepted()) {
        return Result<Unit, DmFailure>::Err(DmFailure::PublishFailed("Message could not be published to any relay"));
    }
    return Result<Unit, DmFailure>::Ok(unit);
}

Result<merge::OptimisticHandle, DmFailure> DmSession::SendMessage(
    const std::vector<std::string>& recipients,
    const std::string& content,
    const MessageProtocol protocol,
    const std::vector<event::Attachment>& attachments,
    const std::string& subject) {

    using SendResult = Result<merge::OptimisticHandle, DmFailure>;

    std::shared_ptr<interfaces::ISigner> signer;
    std::string me;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        signer = signer_;
        me = user_pubkey_;
        generation = generation_;
    }
    if (!signer) {
        return SendResult::Err(DmFailure::InvalidState("No signer configured"));
    }
    if (content.empty() && attachments.empty()) {
        return SendResult::Err(DmFailure::InvalidInput("Cannot send an empty message"));
    }
    if (!crypto::Encoding::IsValidUtf8(content) || !crypto::Encoding::IsValidUtf8(subject)) {
        return SendResult::Err(DmFailure::InvalidInput("Message text must be valid UTF-8"));
    }
    if (protocol == MessageProtocol::Private && !config_.enable_private_protocol) {
        return SendResult::Err(DmFailure::InvalidInput("Private messages are disabled"));
    }

    std::vector<std::string> targets = recipients;
    std::string conversation_subject = subject;
    if (recipients.size() == 1 && recipients.front().starts_with(SyncConstants::CONVERSATION_ID_PREFIX)) {
        auto parsed = MergeEngine::ParseConversationId(recipients.front());
        if (parsed.IsErr()) {
            return Fail(std::move(parsed).UnwrapErr());
        }
        auto conversation = std::move(parsed).Unwrap();
        targets = std::move(conversation.participants);
        if (conversation_subject.empty()) {
            conversation_subject = std::move(conversation.subject);
        }
    }
    if (targets.empty()) {
        return SendResult::Err(DmFailure::InvalidInput("A message needs at least one recipient"));
    }

    std::vector<std::string> others;
    for (const auto& target : targets) {
        if (!crypto::Encoding::IsHexKey(target)) {
            return SendResult::Err(DmFailure::InvalidInput(
                compat::format("Invalid recipient public key: {}", target)));
        }
        if (target != me && std::find(others.begin(), others.end(), target) == others.end()) {
            others.push_back(target);
        }
    }
    const std::vector<std::string> addressed = others.empty() ? std::vector<std::string>{me} : others;
    if (protocol == MessageProtocol::Legacy && addressed.size() != 1) {
        return SendResult::Err(DmFailure::InvalidInput("A legacy message has exactly one recipient"));
    }

    const int64_t now_ms = clock_();
    const int64_t now_s = now_ms / 1000;

    std::string text = content;
    event::Event inner;
    if (protocol == MessageProtocol::Private) {
        auto built = crypto::GiftWrapCodec::BuildInnerMessage(
            me, addressed, content, attachments, conversation_subject, now_s);
        if (built.IsErr()) {
            return Fail(std::move(built).UnwrapErr());
        }
        inner = std::move(built).Unwrap();
        text = inner.content;
    } else {
        for (const auto& attachment : attachments) {
            if (!text.empty()) {
                text += '\n';
            }
            text += attachment.url;
        }
    }

    merge::OptimisticHandle handle;
    MessagingState snapshot;
    std::shared_ptr<store::PersistenceQueue> queue;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        if (generation_ != generation) {
            return SendResult::Err(DmFailure::Cancelled("Session was reset while the message was prepared"));
        }
        handle = MergeEngine::AddOptimisticMessage(
            state_, me, addressed, text, protocol, now_ms,
            protocol == MessageProtocol::Private ? conversation_subject : std::string());
        snapshot = state_;
        queue = persistence_;
    }
    Persist(queue, std::move(snapshot), PersistMode::Debounced);
    NotifyState();

    auto published = protocol == MessageProtocol::Private
        ? PublishPrivate(*signer, inner, addressed, now_s)
        : PublishLegacy(*signer, addressed.front(), text, now_s);
    if (published.IsErr()) {
        DMSYNC_LOG_WARN(COMPONENT, "Send failed: {}", published.UnwrapErr().message);
        bool current = false;
        {
            std::lock_guard<std::mutex> guard(state_lock_);
            current = generation_ == generation;
            if (current) {
                MergeEngine::MarkSendFailed(
                    state_, handle.conversation_id, handle.message_id, published.UnwrapErr().message);
                snapshot = state_;
                queue = persistence_;
            }
        }
        if (current) {
            Persist(queue, std::move(snapshot), PersistMode::Debounced);
            NotifyState();
        }
        return Fail(std::move(published).UnwrapErr());
    }
    return SendResult::Ok(std::move(handle));
}

Result<Unit, DmFailure> DmSession::ClearCacheAndRefetch() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_lock_);
    StopRunLocked();

    std::string me;
    SubscriptionManager* subscriptions = nullptr;
    std::shared_ptr<store::PersistenceQueue> queue;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        ++generation_;
        me = user_pubkey_;
        subscriptions = subscriptions_.get();
        queue = persistence_;
    }
    if (subscriptions) {
        subscriptions->Stop();
    }
    if (queue) {
        queue->Cancel();
    }
    if (auto deleted = store_->DeleteCache(me); deleted.IsErr()) {
        DMSYNC_LOG_WARN(COMPONENT, "Cache delete failed: {}", deleted.UnwrapErr().message);
    }

    {
        std::lock_guard<std::mutex> guard(state_lock_);
        state_ = MessagingState{};
        legacy_progress_ = ScanProgress{};
        private_progress_ = ScanProgress{};
        relay_error_.reset();
        last_message_ms_ = 0;
    }
    SetPhase(SyncPhase::Idle);
    NotifyState();
    DMSYNC_LOG_INFO(COMPONENT, "Cache cleared, refetching");
    return StartLocked();
}

bool DmSession::OnRelayListsChanged(const event::Event& relay_list) {
    if (!event::IsRelayListKind(relay_list.kind)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        if (relay_list.pubkey != user_pubkey_) {
            return false;
        }
        const auto seen = relay_list_ids_.find(relay_list.kind);
        if (seen == relay_list_ids_.end()) {
            relay_list_ids_.emplace(relay_list.kind, relay_list.id);
            return false;
        }
        if (seen->second == relay_list.id) {
            return false;
        }
        seen->second = relay_list.id;
    }

    DMSYNC_LOG_INFO(COMPONENT, "Relay list of kind {} changed", relay_list.kind);
    if (auto restarted = ClearCacheAndRefetch(); restarted.IsErr()) {
        DMSYNC_LOG_ERROR(COMPONENT, "Refetch after relay list change failed: {}", restarted.UnwrapErr().message);
    }
    return true;
}

void DmSession::ShutdownLocked() {
    StopRunLocked();

    std::unique_ptr<SubscriptionManager> subscriptions;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        ++generation_;
        subscriptions = std::move(subscriptions_);
    }
    if (subscriptions) {
        subscriptions->Stop();
    }
    subscriptions.reset();

    std::shared_ptr<store::PersistenceQueue> queue;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        queue = std::move(persistence_);
    }
    if (queue) {
        queue->Flush();
        queue->Stop();
    }

    std::lock_guard<std::mutex> guard(state_lock_);
    state_ = MessagingState{};
    phase_ = SyncPhase::Idle;
    legacy_progress_ = ScanProgress{};
    private_progress_ = ScanProgress{};
    relay_error_.reset();
    relay_list_ids_.clear();
    last_message_ms_ = 0;
}

void DmSession::Shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_lock_);
    ShutdownLocked();
}

Result<Unit, DmFailure> DmSession::SwitchUser(std::shared_ptr<interfaces::ISigner> signer) {
    if (!signer) {
        return Result<Unit, DmFailure>::Err(DmFailure::InvalidInput("SwitchUser needs a signer"));
    }

    std::lock_guard<std::mutex> lifecycle(lifecycle_lock_);
    ShutdownLocked();
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        signer_ = std::move(signer);
        user_pubkey_ = signer_->GetPublicKey();
    }
    DMSYNC_LOG_INFO(COMPONENT, "Switched user");
    return StartLocked();
}

bool DmSession::MarkConversationRead(const std::string& conversation_id) {
    const int64_t now_s = clock_() / 1000;
    MessagingState snapshot;
    std::shared_ptr<store::PersistenceQueue> queue;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        if (!MergeEngine::MarkConversationRead(state_, conversation_id, now_s)) {
            return false;
        }
        snapshot = state_;
        queue = persistence_;
    }
    Persist(queue, std::move(snapshot), PersistMode::Debounced);
    NotifyState();
    return true;
}

void DmSession::DismissRelayError() {
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        relay_error_.reset();
    }
    NotifyState();
}

Result<std::vector<relay::ConversationRelay>, DmFailure> DmSession::ConversationRelays(
    const std::string& conversation_id) const {

    std::lock_guard<std::mutex> guard(state_lock_);
    return RelayResolver::GetConversationRelays(conversation_id, state_.participants, user_pubkey_);
}

}
