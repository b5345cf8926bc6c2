#include "dmsync/store/persistence_queue.hpp"
#include "dmsync/debug/logger.hpp"

namespace dmsync::store {

namespace {
    constexpr const char* COMPONENT = "persistence";
}

PersistenceQueue::PersistenceQueue(
    std::shared_ptr<interfaces::ICacheStore> store,
    std::string user_pubkey,
    const std::chrono::milliseconds delay)
    : store_(std::move(store))
    , user_pubkey_(std::move(user_pubkey))
    , delay_(delay)
    , worker_([this]() { RunWorker(); }) {}

PersistenceQueue::~PersistenceQueue() {
    Stop();
}

void PersistenceQueue::Schedule(merge::MessagingState state) {
    {
        std::lock_guard<std::mutex> guard(lock_);
        pending_ = PendingWrite{std::move(state), next_sequence_++, Clock::now() + delay_};
    }
    wake_.notify_all();
}

void PersistenceQueue::FlushNow(merge::MessagingState state) {
    PendingWrite job;
    {
        std::lock_guard<std::mutex> guard(lock_);
        job = PendingWrite{std::move(state), next_sequence_++, Clock::now()};
        pending_.reset();
    }
    Write(job);
}

void PersistenceQueue::Flush() {
    std::optional<PendingWrite> job;
    {
        std::lock_guard<std::mutex> guard(lock_);
        job.swap(pending_);
    }
    if (job) {
        Write(*job);
    }
}

void PersistenceQueue::Cancel() {
    std::lock_guard<std::mutex> guard(lock_);
    if (pending_) {
        DMSYNC_LOG_DEBUG(COMPONENT, "Dropping pending write #{}", pending_->sequence);
    }
    pending_.reset();
}

void PersistenceQueue::Stop() {
    {
        std::lock_guard<std::mutex> guard(lock_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool PersistenceQueue::HasPending() const {
    std::lock_guard<std::mutex> guard(lock_);
    return pending_.has_value();
}

size_t PersistenceQueue::WriteCount() const noexcept {
    return writes_.load();
}

size_t PersistenceQueue::WriteErrorCount() const noexcept {
    return write_errors_.load();
}

const std::string& PersistenceQueue::UserPubkey() const noexcept {
    return user_pubkey_;
}

void PersistenceQueue::RunWorker() {
    std::unique_lock<std::mutex> lock(lock_);
    while (!stopping_) {
        if (!pending_) {
            wake_.wait(lock, [this]() { return stopping_ || pending_.has_value(); });
            continue;
        }
        if (const auto due = pending_->due; Clock::now() < due) {
            wake_.wait_until(lock, due);
            continue;
        }
        PendingWrite job = std::move(*pending_);
        pending_.reset();
        lock.unlock();
        Write(job);
        lock.lock();
    }
}

void PersistenceQueue::Write(const PendingWrite& job) {
    std::lock_guard<std::mutex> guard(write_lock_);
    if (job.sequence <= last_written_) {
        return;
    }
    last_written_ = job.sequence;

    auto written = store_->WriteCache(user_pubkey_, job.state);
    if (written.IsErr()) {
        write_errors_.fetch_add(1);
        DMSYNC_LOG_ERROR(COMPONENT, "Cache write #{} failed: {}", job.sequence, written.UnwrapErr().message);
        return;
    }
    writes_.fetch_add(1);
    DMSYNC_LOG_DEBUG(COMPONENT, "Cache write #{} done", job.sequence);
}

}
