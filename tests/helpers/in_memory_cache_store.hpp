#pragma once
#include "dmsync/interfaces/i_cache_store.hpp"
#include "dmsync/store/cache_codec.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dmsync::test_helpers {

/// Cache store that keeps the serialised record in memory, so every write
/// goes through the same codec as the file store.
class InMemoryCacheStore final : public interfaces::ICacheStore {
public:
    [[nodiscard]] Result<std::optional<merge::MessagingState>, DmFailure> ReadCache(
        const std::string& user_pubkey) override {

        std::lock_guard<std::mutex> guard(lock_);
        ++reads_;
        const auto it = records_.find(user_pubkey);
        if (it == records_.end()) {
            return Result<std::optional<merge::MessagingState>, DmFailure>::Ok(std::nullopt);
        }
        auto state = store::CacheCodec::Deserialize(it->second, user_pubkey);
        if (state.IsErr()) {
            return Fail(std::move(state).UnwrapErr());
        }
        return Result<std::optional<merge::MessagingState>, DmFailure>::Ok(std::move(state).Unwrap());
    }

    [[nodiscard]] Result<Unit, DmFailure> WriteCache(
        const std::string& user_pubkey,
        const merge::MessagingState& state) override {

        std::lock_guard<std::mutex> guard(lock_);
        if (fail_writes_) {
            return Result<Unit, DmFailure>::Err(DmFailure::StoreFailed("disk full"));
        }
        auto bytes = store::CacheCodec::Serialize(user_pubkey, state);
        if (bytes.IsErr()) {
            return Fail(std::move(bytes).UnwrapErr());
        }
        records_[user_pubkey] = std::move(bytes).Unwrap();
        ++writes_;
        write_log_.push_back(user_pubkey);
        return Result<Unit, DmFailure>::Ok(unit);
    }

    [[nodiscard]] Result<Unit, DmFailure> DeleteCache(const std::string& user_pubkey) override {
        std::lock_guard<std::mutex> guard(lock_);
        records_.erase(user_pubkey);
        ++deletes_;
        return Result<Unit, DmFailure>::Ok(unit);
    }

    /// Seeds a record without counting it as a write.
    void Seed(const std::string& user_pubkey, const merge::MessagingState& state) {
        std::lock_guard<std::mutex> guard(lock_);
        records_[user_pubkey] = store::CacheCodec::Serialize(user_pubkey, state).Unwrap();
    }

    void SeedRaw(const std::string& user_pubkey, std::vector<uint8_t> bytes) {
        std::lock_guard<std::mutex> guard(lock_);
        records_[user_pubkey] = std::move(bytes);
    }

    /// Decoded record, or nullopt.
    [[nodiscard]] std::optional<merge::MessagingState> Stored(const std::string& user_pubkey) {
        std::lock_guard<std::mutex> guard(lock_);
        const auto it = records_.find(user_pubkey);
        if (it == records_.end()) {
            return std::nullopt;
        }
        auto state = store::CacheCodec::Deserialize(it->second, user_pubkey);
        if (state.IsErr()) {
            return std::nullopt;
        }
        return std::move(state).Unwrap();
    }

    [[nodiscard]] bool Contains(const std::string& user_pubkey) const {
        std::lock_guard<std::mutex> guard(lock_);
        return records_.contains(user_pubkey);
    }

    void FailWrites(const bool fail) {
        std::lock_guard<std::mutex> guard(lock_);
        fail_writes_ = fail;
    }

    [[nodiscard]] size_t Writes() const noexcept { return writes_.load(); }
    [[nodiscard]] size_t Reads() const noexcept { return reads_.load(); }
    [[nodiscard]] size_t Deletes() const noexcept { return deletes_.load(); }

    [[nodiscard]] std::vector<std::string> WriteLog() const {
        std::lock_guard<std::mutex> guard(lock_);
        return write_log_;
    }

private:
    mutable std::mutex lock_;
    std::map<std::string, std::vector<uint8_t>> records_;
    std::vector<std::string> write_log_;
    bool fail_writes_ = false;
    std::atomic<size_t> writes_{0};
    std::atomic<size_t> reads_{0};
    std::atomic<size_t> deletes_{0};
};

}
