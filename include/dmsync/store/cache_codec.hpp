#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/merge/messaging_state.hpp"
#include "store/message_cache.pb.h"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace dmsync::store {

/**
 * @brief MessagingState <-> MessageCache protobuf
 *
 * Envelopes and seals are stored as event JSON next to the decrypted
 * plaintext so a cached message can be re-derived without the network.
 */
class CacheCodec {
public:
    [[nodiscard]] static proto::store::MessageCache ToProto(
        const std::string& user_pubkey,
        const merge::MessagingState& state);

    /**
     * @return Decode when the record belongs to another user, was written by
     *         another format version, lacks its sync state, or holds an
     *         unparseable envelope
     */
    [[nodiscard]] static Result<merge::MessagingState, DmFailure> FromProto(
        const proto::store::MessageCache& cache,
        const std::string& user_pubkey);

    [[nodiscard]] static Result<std::vector<uint8_t>, DmFailure> Serialize(
        const std::string& user_pubkey,
        const merge::MessagingState& state);

    [[nodiscard]] static Result<merge::MessagingState, DmFailure> Deserialize(
        std::span<const uint8_t> bytes,
        const std::string& user_pubkey);

private:
    CacheCodec() = delete;
};

}
