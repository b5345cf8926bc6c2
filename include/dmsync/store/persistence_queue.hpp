#pragma once

#include "dmsync/interfaces/i_cache_store.hpp"
#include "dmsync/merge/messaging_state.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace dmsync::store {

/**
 * @brief Debounced cache writer for one user
 *
 * Holds at most one pending snapshot. A worker thread writes it once the
 * debounce delay has passed without a newer Schedule(). Snapshots carry a
 * sequence number and an older snapshot is never written over a newer one.
 * Write failures are logged and counted, never returned.
 */
class PersistenceQueue {
public:
    using Clock = std::chrono::steady_clock;

    PersistenceQueue(
        std::shared_ptr<interfaces::ICacheStore> store,
        std::string user_pubkey,
        std::chrono::milliseconds delay);

    ~PersistenceQueue();

    PersistenceQueue(const PersistenceQueue&) = delete;
    PersistenceQueue& operator=(const PersistenceQueue&) = delete;
    PersistenceQueue(PersistenceQueue&&) = delete;
    PersistenceQueue& operator=(PersistenceQueue&&) = delete;

    /// Replaces the pending snapshot and restarts the delay.
    void Schedule(merge::MessagingState state);

    /// Writes `state` on the calling thread and drops the pending snapshot.
    void FlushNow(merge::MessagingState state);

    /// Writes the pending snapshot, if any, on the calling thread.
    void Flush();

    /// Drops the pending snapshot without writing it.
    void Cancel();

    /// Joins the worker. Pending data is kept; call Flush() or Cancel() first.
    void Stop();

    [[nodiscard]] bool HasPending() const;
    [[nodiscard]] size_t WriteCount() const noexcept;
    [[nodiscard]] size_t WriteErrorCount() const noexcept;
    [[nodiscard]] const std::string& UserPubkey() const noexcept;

private:
    struct PendingWrite {
        merge::MessagingState state;
        uint64_t sequence = 0;
        Clock::time_point due;
    };

    void RunWorker();
    void Write(const PendingWrite& job);

    std::shared_ptr<interfaces::ICacheStore> store_;
    std::string user_pubkey_;
    std::chrono::milliseconds delay_;

    mutable std::mutex lock_;
    std::condition_variable wake_;
    std::optional<PendingWrite> pending_;
    uint64_t next_sequence_ = 1;
    bool stopping_ = false;

    std::mutex write_lock_;
    uint64_t last_written_ = 0;

    std::atomic<size_t> writes_{0};
    std::atomic<size_t> write_errors_{0};

    std::thread worker_;
};

}
