#include "dmsync/sync/subscription_manager.hpp"
#include "dmsync/sync/message_decryptor.hpp"
#include "dmsync/sync/message_fetcher.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/debug/logger.hpp"

#include <algorithm>

namespace dmsync::sync {

namespace {
    constexpr const char* COMPONENT = "subscriptions";
}

SubscriptionManager::SubscriptionManager(
    std::shared_ptr<interfaces::IRelayTransport> transport,
    std::shared_ptr<const interfaces::ISigner> signer,
    const std::chrono::seconds overlap,
    const bool enable_private,
    UnixClock clock,
    DeliverFn deliver)
    : transport_(std::move(transport))
    , signer_(std::move(signer))
    , overlap_(overlap)
    , enable_private_(enable_private)
    , clock_(std::move(clock))
    , deliver_(std::move(deliver)) {}

SubscriptionManager::~SubscriptionManager() {
    Stop();
}

int64_t SubscriptionManager::LiveSince(
    const MessageProtocol protocol,
    const std::optional<int64_t> cursor,
    const std::chrono::seconds overlap,
    const int64_t now_s) {

    int64_t since = cursor.value_or(now_s) - overlap.count();
    if (protocol == MessageProtocol::Private) {
        since -= SyncConstants::GIFT_WRAP_FUZZ_WINDOW.count();
    }
    return std::max<int64_t>(since, 0);
}

std::vector<event::Filter> SubscriptionManager::LiveFilters(
    const MessageProtocol protocol,
    const std::string& me,
    const int64_t since) {

    auto filters = MessageFetcher::StreamFilters(protocol, me);
    for (auto& filter : filters) {
        filter.since = since;
    }
    return filters;
}

Result<std::unique_ptr<interfaces::ISubscription>, DmFailure> SubscriptionManager::Open(
    const MessageProtocol protocol,
    const std::vector<std::string>& relays,
    const std::optional<int64_t> cursor,
    const uint64_t generation) {

    const int64_t since = LiveSince(protocol, cursor, overlap_, clock_() / 1000);
    auto filters = LiveFilters(protocol, signer_->GetPublicKey(), since);
    DMSYNC_LOG_DEBUG(COMPONENT, "Opening {} subscription on {} relays since {}",
        ProtocolName(protocol), relays.size(), since);

    return transport_->Subscribe(relays, filters,
        [this, protocol, generation](const std::string&, const event::Event& event) {
            HandleEvent(protocol, generation, event);
        });
}

Result<Unit, DmFailure> SubscriptionManager::Start(
    const std::vector<std::string>& relays,
    const merge::LastSync& cursors) {

    CloseAll();
    const uint64_t generation = generation_.fetch_add(1) + 1;

    std::optional<DmFailure> first_failure;
    auto legacy = Open(MessageProtocol::Legacy, relays, cursors.legacy, generation);
    if (legacy.IsErr()) {
        DMSYNC_LOG_WARN(COMPONENT, "Legacy subscription failed: {}", legacy.UnwrapErr().message);
        first_failure = legacy.UnwrapErr();
    }

    std::unique_ptr<interfaces::ISubscription> wraps;
    if (enable_private_) {
        auto opened = Open(MessageProtocol::Private, relays, cursors.private_messages, generation);
        if (opened.IsErr()) {
            DMSYNC_LOG_WARN(COMPONENT, "Private subscription failed: {}", opened.UnwrapErr().message);
            if (!first_failure) {
                first_failure = opened.UnwrapErr();
            }
        } else {
            wraps = std::move(opened).Unwrap();
        }
    }

    {
        std::lock_guard<std::mutex> guard(lock_);
        relays_ = relays;
        if (legacy.IsOk()) {
            legacy_ = std::move(legacy).Unwrap();
        }
        private_ = std::move(wraps);
    }

    if (first_failure) {
        return Result<Unit, DmFailure>::Err(std::move(*first_failure));
    }
    return Result<Unit, DmFailure>::Ok(unit);
}

Result<bool, DmFailure> SubscriptionManager::UpdateRelays(
    const std::vector<std::string>& relays,
    const merge::LastSync& cursors) {

    {
        std::lock_guard<std::mutex> guard(lock_);
        auto current = relays_;
        auto next = relays;
        std::sort(current.begin(), current.end());
        std::sort(next.begin(), next.end());
        if (current == next && (legacy_ || private_)) {
            return Result<bool, DmFailure>::Ok(false);
        }
    }

    DMSYNC_LOG_INFO(COMPONENT, "Relay set changed, recreating subscriptions on {} relays", relays.size());
    auto started = Start(relays, cursors);
    if (started.IsErr()) {
        return Fail(std::move(started).UnwrapErr());
    }
    return Result<bool, DmFailure>::Ok(true);
}

void SubscriptionManager::Stop() {
    generation_.fetch_add(1);
    CloseAll();
}

void SubscriptionManager::CloseAll() {
    std::unique_ptr<interfaces::ISubscription> legacy;
    std::unique_ptr<interfaces::ISubscription> wraps;
    {
        std::lock_guard<std::mutex> guard(lock_);
        legacy = std::move(legacy_);
        wraps = std::move(private_);
        relays_.clear();
    }
    if (legacy) {
        legacy->Close();
    }
    if (wraps) {
        wraps->Close();
    }
}

SubscriptionStatus SubscriptionManager::Status() const {
    std::lock_guard<std::mutex> guard(lock_);
    SubscriptionStatus status;
    status.legacy_connected = legacy_ && legacy_->IsOpen();
    status.private_connected = private_ && private_->IsOpen();
    return status;
}

std::vector<std::string> SubscriptionManager::Relays() const {
    std::lock_guard<std::mutex> guard(lock_);
    return relays_;
}

void SubscriptionManager::HandleEvent(
    const MessageProtocol protocol,
    const uint64_t generation,
    const event::Event& event) {

    if (generation != generation_.load()) {
        return;
    }

    auto decrypted = MessageDecryptor::Decrypt(event, *signer_);
    if (!decrypted) {
        DMSYNC_LOG_DEBUG(COMPONENT, "Ignoring live event {} of kind {}", event.id, event.kind);
        return;
    }

    LiveDelivery delivery;
    delivery.protocol = protocol;
    if (!decrypted->message.decryption_error) {
        delivery.advance_cursor_to = clock_() / 1000;
    }
    delivery.message = std::move(*decrypted);

    if (generation != generation_.load()) {
        return;
    }
    deliver_(std::move(delivery));
}

}
