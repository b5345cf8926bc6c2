#include "dmsync/store/file_cache_store.hpp"
#include "dmsync/store/cache_codec.hpp"
#include "dmsync/crypto/encoding.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"
#include "dmsync/debug/logger.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

namespace dmsync::store {

namespace fs = std::filesystem;

namespace {
    constexpr const char* COMPONENT = "store";
    constexpr std::string_view FILE_EXTENSION = ".pb";
    constexpr std::string_view TEMP_SUFFIX = ".tmp";

    std::string FileNameFor(const std::string& user_pubkey) {
        std::string name(SyncConstants::CACHE_KEY_PREFIX);
        name.append(user_pubkey);
        for (auto& c : name) {
            if (c == ':') {
                c = '_';
            }
        }
        name.append(FILE_EXTENSION);
        return name;
    }
}

FileCacheStore::FileCacheStore(fs::path directory)
    : directory_(std::move(directory)) {}

Result<fs::path, DmFailure> FileCacheStore::PathFor(const std::string& user_pubkey) const {
    if (!crypto::Encoding::IsHexKey(user_pubkey)) {
        return Result<fs::path, DmFailure>::Err(
            DmFailure::InvalidInput("Cache key must be a 64-character hex public key"));
    }
    return Result<fs::path, DmFailure>::Ok(directory_ / FileNameFor(user_pubkey));
}

Result<std::optional<merge::MessagingState>, DmFailure> FileCacheStore::ReadCache(const std::string& user_pubkey) {
    using ReadResult = Result<std::optional<merge::MessagingState>, DmFailure>;

    auto path_result = PathFor(user_pubkey);
    if (path_result.IsErr()) {
        return Fail(std::move(path_result).UnwrapErr());
    }
    const auto path = std::move(path_result).Unwrap();

    std::lock_guard<std::mutex> guard(lock_);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return ReadResult::Ok(std::nullopt);
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return ReadResult::Err(DmFailure::StoreFailed(
            compat::format("Cannot open cache file {}", path.string())));
    }
    const std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return ReadResult::Err(DmFailure::StoreFailed(
            compat::format("Cannot read cache file {}", path.string())));
    }

    auto state = CacheCodec::Deserialize(bytes, user_pubkey);
    if (state.IsErr()) {
        DMSYNC_LOG_WARN(COMPONENT, "Ignoring unusable cache {}: {}", path.string(), state.UnwrapErr().message);
        return ReadResult::Ok(std::nullopt);
    }
    return ReadResult::Ok(std::move(state).Unwrap());
}

Result<Unit, DmFailure> FileCacheStore::WriteCache(
    const std::string& user_pubkey,
    const merge::MessagingState& state) {

    auto path_result = PathFor(user_pubkey);
    if (path_result.IsErr()) {
        return Fail(std::move(path_result).UnwrapErr());
    }
    const auto path = std::move(path_result).Unwrap();

    auto bytes = CacheCodec::Serialize(user_pubkey, state);
    if (bytes.IsErr()) {
        return Fail(std::move(bytes).UnwrapErr());
    }

    std::lock_guard<std::mutex> guard(lock_);
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return Result<Unit, DmFailure>::Err(DmFailure::StoreFailed(
            compat::format("Cannot create cache directory {}: {}", directory_.string(), ec.message())));
    }

    auto temp_path = path;
    temp_path += TEMP_SUFFIX;
    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        output.write(reinterpret_cast<const char*>(bytes.Unwrap().data()),
                     static_cast<std::streamsize>(bytes.Unwrap().size()));
        output.flush();
        if (!output) {
            fs::remove(temp_path, ec);
            return Result<Unit, DmFailure>::Err(DmFailure::StoreFailed(
                compat::format("Cannot write cache file {}", temp_path.string())));
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        const auto message = ec.message();
        fs::remove(temp_path, ec);
        return Result<Unit, DmFailure>::Err(DmFailure::StoreFailed(
            compat::format("Cannot replace cache file {}: {}", path.string(), message)));
    }

    DMSYNC_LOG_DEBUG(COMPONENT, "Wrote {} bytes to {}", bytes.Unwrap().size(), path.string());
    return Result<Unit, DmFailure>::Ok(unit);
}

Result<Unit, DmFailure> FileCacheStore::DeleteCache(const std::string& user_pubkey) {
    auto path_result = PathFor(user_pubkey);
    if (path_result.IsErr()) {
        return Fail(std::move(path_result).UnwrapErr());
    }
    const auto path = std::move(path_result).Unwrap();

    std::lock_guard<std::mutex> guard(lock_);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Result<Unit, DmFailure>::Err(DmFailure::StoreFailed(
            compat::format("Cannot delete cache file {}: {}", path.string(), ec.message())));
    }
    return Result<Unit, DmFailure>::Ok(unit);
}

}
