#pragma once

#include "dmsync/interfaces/i_cache_store.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace dmsync::store {

/**
 * @brief One MessageCache file per user under a directory
 *
 * Writes go to a temporary sibling that is renamed over the target, so a
 * crash leaves either the old or the new record. Unreadable records are
 * logged and reported as absent.
 */
class FileCacheStore final : public interfaces::ICacheStore {
public:
    explicit FileCacheStore(std::filesystem::path directory);

    [[nodiscard]] Result<std::optional<merge::MessagingState>, DmFailure> ReadCache(
        const std::string& user_pubkey) override;

    [[nodiscard]] Result<Unit, DmFailure> WriteCache(
        const std::string& user_pubkey,
        const merge::MessagingState& state) override;

    [[nodiscard]] Result<Unit, DmFailure> DeleteCache(const std::string& user_pubkey) override;

    /// "<directory>/dm-cache_<pubkey>.pb"
    [[nodiscard]] Result<std::filesystem::path, DmFailure> PathFor(const std::string& user_pubkey) const;

private:
    std::filesystem::path directory_;
    std::mutex lock_;
};

}
