#include "dmsync/event/event_codec.hpp"
#include "dmsync/crypto/digest.hpp"
#include "dmsync/crypto/encoding.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"

#include <sodium.h>

namespace dmsync::event {

using crypto::Encoding;

namespace {
    DmFailure BadField(const std::string_view field) {
        return DmFailure::MalformedEnvelope(
            compat::format("Event field '{}' is missing or has the wrong type", field));
    }

    const nlohmann::json* FindField(const nlohmann::json& json, const char* name) {
        const auto it = json.find(name);
        return it == json.end() ? nullptr : &*it;
    }

    Result<std::string, DmFailure> Dump(const nlohmann::json& json) {
        try {
            return Result<std::string, DmFailure>::Ok(json.dump());
        } catch (const nlohmann::json::type_error& error) {
            return Result<std::string, DmFailure>::Err(DmFailure::Encode(
                compat::format("Event cannot be encoded as JSON: {}", error.what())));
        }
    }

    std::span<const uint8_t> AsBytes(const std::string& text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }
}

nlohmann::json EventCodec::ToJson(const Event& event) {
    nlohmann::json json = {
        {"id", event.id},
        {"pubkey", event.pubkey},
        {"created_at", event.created_at},
        {"kind", event.kind},
        {"tags", event.tags},
        {"content", event.content},
    };
    if (!event.sig.empty()) {
        json["sig"] = event.sig;
    }
    return json;
}

Result<Event, DmFailure> EventCodec::FromJson(const nlohmann::json& json, const bool require_signature) {
    if (!json.is_object()) {
        return Result<Event, DmFailure>::Err(
            DmFailure::MalformedEnvelope("Event is not a JSON object"));
    }

    Event event;

    const auto* pubkey = FindField(json, "pubkey");
    if (pubkey == nullptr || !pubkey->is_string()) {
        return Result<Event, DmFailure>::Err(BadField("pubkey"));
    }
    event.pubkey = pubkey->get<std::string>();

    const auto* created_at = FindField(json, "created_at");
    if (created_at == nullptr || !created_at->is_number_integer()) {
        return Result<Event, DmFailure>::Err(BadField("created_at"));
    }
    event.created_at = created_at->get<int64_t>();

    const auto* kind = FindField(json, "kind");
    if (kind == nullptr || !kind->is_number_unsigned()) {
        return Result<Event, DmFailure>::Err(BadField("kind"));
    }
    event.kind = kind->get<uint32_t>();

    const auto* content = FindField(json, "content");
    if (content == nullptr || !content->is_string()) {
        return Result<Event, DmFailure>::Err(BadField("content"));
    }
    event.content = content->get<std::string>();

    const auto* tags = FindField(json, "tags");
    if (tags == nullptr || !tags->is_array()) {
        return Result<Event, DmFailure>::Err(BadField("tags"));
    }
    for (const auto& tag : *tags) {
        if (!tag.is_array()) {
            return Result<Event, DmFailure>::Err(BadField("tags"));
        }
        Tag values;
        for (const auto& value : tag) {
            if (!value.is_string()) {
                return Result<Event, DmFailure>::Err(BadField("tags"));
            }
            values.push_back(value.get<std::string>());
        }
        event.tags.push_back(std::move(values));
    }

    const auto* id = FindField(json, "id");
    const auto* sig = FindField(json, "sig");
    if (id != nullptr && id->is_string()) {
        event.id = id->get<std::string>();
    } else if (require_signature || id != nullptr) {
        return Result<Event, DmFailure>::Err(BadField("id"));
    }
    if (sig != nullptr && sig->is_string()) {
        event.sig = sig->get<std::string>();
    } else if (require_signature || sig != nullptr) {
        return Result<Event, DmFailure>::Err(BadField("sig"));
    }

    if (event.id.empty()) {
        auto computed = ComputeId(event);
        if (computed.IsErr()) {
            return Fail(std::move(computed).UnwrapErr());
        }
        event.id = std::move(computed).Unwrap();
    }

    return Result<Event, DmFailure>::Ok(std::move(event));
}

Result<std::string, DmFailure> EventCodec::Serialize(const Event& event) {
    return Dump(ToJson(event));
}

Result<Event, DmFailure> EventCodec::Parse(const std::string_view text, const bool require_signature) {
    const auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        return Result<Event, DmFailure>::Err(
            DmFailure::MalformedEnvelope("Event is not valid JSON"));
    }
    return FromJson(json, require_signature);
}

Result<std::string, DmFailure> EventCodec::ComputeId(const Event& event) {
    const nlohmann::json canonical = nlohmann::json::array({
        0, event.pubkey, event.created_at, event.kind, event.tags, event.content});
    auto serialized = Dump(canonical);
    if (serialized.IsErr()) {
        return serialized;
    }

    auto digest = crypto::Digest::Sha256(AsBytes(serialized.Unwrap()));
    if (digest.IsErr()) {
        return Fail(std::move(digest).UnwrapErr());
    }
    return Result<std::string, DmFailure>::Ok(Encoding::HexEncode(digest.Unwrap()));
}

Result<Event, DmFailure> EventCodec::Finalize(Event event, std::span<const uint8_t> ed25519_secret) {
    if (ed25519_secret.size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<Event, DmFailure>::Err(
            DmFailure::InvalidInput("Ed25519 secret key has wrong size"));
    }

    std::vector<uint8_t> pubkey(Constants::ED_25519_PUBLIC_KEY_SIZE);
    if (crypto_sign_ed25519_sk_to_pk(pubkey.data(), ed25519_secret.data()) != SodiumConstants::SUCCESS) {
        return Result<Event, DmFailure>::Err(
            DmFailure::InvalidInput("Cannot derive public key from secret key"));
    }
    event.pubkey = Encoding::HexEncode(pubkey);

    auto id = ComputeId(event);
    if (id.IsErr()) {
        return Fail(std::move(id).UnwrapErr());
    }
    event.id = std::move(id).Unwrap();

    auto id_bytes = Encoding::HexDecode(event.id);
    if (id_bytes.IsErr()) {
        return Fail(std::move(id_bytes).UnwrapErr());
    }
    auto signature = crypto::SodiumInterop::SignDetached(id_bytes.Unwrap(), ed25519_secret);
    if (signature.IsErr()) {
        return Fail(std::move(signature).UnwrapErr());
    }
    event.sig = Encoding::HexEncode(signature.Unwrap());

    return Result<Event, DmFailure>::Ok(std::move(event));
}

bool EventCodec::Verify(const Event& event) {
    auto expected_id = ComputeId(event);
    if (expected_id.IsErr() || expected_id.Unwrap() != event.id) {
        return false;
    }

    auto id_bytes = Encoding::HexDecode(event.id);
    auto pubkey = Encoding::HexDecode(event.pubkey);
    auto signature = Encoding::HexDecode(event.sig);
    if (id_bytes.IsErr() || pubkey.IsErr() || signature.IsErr()) {
        return false;
    }

    return crypto::SodiumInterop::VerifyDetached(signature.Unwrap(), id_bytes.Unwrap(), pubkey.Unwrap());
}

}
