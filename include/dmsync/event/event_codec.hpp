#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/event/event.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace dmsync::event {

/**
 * @brief JSON form, identifiers and signatures of events
 *
 * The id is the lowercase hex SHA-256 of the compact JSON array
 * [0, pubkey, created_at, kind, tags, content]. The signature is Ed25519
 * over the 32 id bytes.
 */
class EventCodec {
public:
    [[nodiscard]] static nlohmann::json ToJson(const Event& event);

    /**
     * @brief Build an event from its JSON object form
     *
     * @param require_signature When false, "id" and "sig" may be absent
     *        (unsigned inner messages); a missing id is recomputed.
     * @return Ok(event), or MalformedEnvelope naming the first bad field
     */
    [[nodiscard]] static Result<Event, DmFailure> FromJson(
        const nlohmann::json& json,
        bool require_signature = true);

    /// Encode failure when a string field is not valid UTF-8.
    [[nodiscard]] static Result<std::string, DmFailure> Serialize(const Event& event);

    [[nodiscard]] static Result<Event, DmFailure> Parse(
        std::string_view text,
        bool require_signature = true);

    [[nodiscard]] static Result<std::string, DmFailure> ComputeId(const Event& event);

    /**
     * @brief Fill pubkey, id and sig from a 64-byte Ed25519 secret key
     */
    [[nodiscard]] static Result<Event, DmFailure> Finalize(
        Event event,
        std::span<const uint8_t> ed25519_secret);

    /// Id matches the content and the signature verifies against pubkey.
    [[nodiscard]] static bool Verify(const Event& event);

private:
    EventCodec() = delete;
};

}
