#include <catch2/catch_test_macros.hpp>
#include "dmsync/event/envelope.hpp"
#include "dmsync/event/event_codec.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/core/constants.hpp"
#include "helpers/test_identities.hpp"
#include <variant>
using namespace dmsync;
using namespace dmsync::event;
using namespace dmsync::test_helpers;
using crypto::SodiumInterop;

namespace {
    Event Rumor(const std::string& author, const std::vector<std::string>& recipients) {
        Event rumor;
        rumor.pubkey = author;
        rumor.created_at = 1'700'000'000;
        rumor.kind = EventKind::PRIVATE_DIRECT_MESSAGE;
        for (const auto& recipient : recipients) {
            rumor.tags.push_back({"p", recipient});
        }
        rumor.content = "hello";
        rumor.id = EventCodec::ComputeId(rumor).Unwrap();
        return rumor;
    }
}

TEST_CASE("EnvelopeParser - Gift wrap layer", "[event][envelope]") {
    Event wrap;
    wrap.kind = EventKind::GIFT_WRAP;
    wrap.tags = {{"p", std::string(64, 'c')}};

    SECTION("Recipient comes from the p tag") {
        const auto parsed = EnvelopeParser::ParseGiftWrap(wrap).Unwrap();
        REQUIRE(parsed.recipient == std::string(64, 'c'));
    }
    SECTION("Missing recipient") {
        wrap.tags.clear();
        auto result = EnvelopeParser::ParseGiftWrap(wrap);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == DmFailureType::MalformedEnvelope);
    }
    SECTION("Wrong kind") {
        wrap.kind = EventKind::SEAL;
        REQUIRE(EnvelopeParser::ParseGiftWrap(wrap).IsErr());
    }
}

TEST_CASE("EnvelopeParser - Seal layer", "[event][envelope]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto sender = MakeIdentity();

    Event seal;
    seal.kind = EventKind::SEAL;
    seal.created_at = 1'700'000'000;
    seal.content = "ciphertext";
    const auto signed_seal = sender->Sign(seal).Unwrap();

    SECTION("Valid seal") {
        const auto parsed = EnvelopeParser::ParseSeal(EventCodec::Serialize(signed_seal).Unwrap()).Unwrap();
        REQUIRE(parsed.event.pubkey == sender->PublicKeyHex());
    }
    SECTION("Forged signature") {
        auto forged = signed_seal;
        forged.content = "other";
        forged.id = EventCodec::ComputeId(forged).Unwrap();
        REQUIRE(EnvelopeParser::ParseSeal(EventCodec::Serialize(forged).Unwrap()).IsErr());
    }
    SECTION("Wrong kind") {
        auto other = seal;
        other.kind = EventKind::PRIVATE_DIRECT_MESSAGE;
        const auto signed_other = sender->Sign(other).Unwrap();
        REQUIRE(EnvelopeParser::ParseSeal(EventCodec::Serialize(signed_other).Unwrap()).IsErr());
    }
    SECTION("Not JSON") {
        REQUIRE(EnvelopeParser::ParseSeal("garbage").IsErr());
    }
}

TEST_CASE("EnvelopeParser - Inner message layer", "[event][envelope]") {
    const std::string alice(64, 'a');
    const std::string bob(64, 'b');
    const std::string carol(64, 'c');

    SECTION("Recipients and subject") {
        auto rumor = Rumor(alice, {bob, carol});
        rumor.tags.push_back({"subject", "weekend"});
        const auto inner = EnvelopeParser::ParseInnerMessage(rumor).Unwrap();
        REQUIRE(inner.recipients == std::vector<std::string>{bob, carol});
        REQUIRE(inner.subject == "weekend");
        REQUIRE(inner.attachments.empty());
    }
    SECTION("Parses unsigned JSON") {
        const auto rumor = Rumor(alice, {bob});
        const auto inner = EnvelopeParser::ParseInnerMessage(EventCodec::Serialize(rumor).Unwrap()).Unwrap();
        REQUIRE(inner.rumor.id == rumor.id);
        REQUIRE(inner.rumor.sig.empty());
    }
    SECTION("No recipients") {
        REQUIRE(EnvelopeParser::ParseInnerMessage(Rumor(alice, {})).IsErr());
    }
    SECTION("Unexpected kind") {
        auto rumor = Rumor(alice, {bob});
        rumor.kind = 1;
        REQUIRE(EnvelopeParser::ParseInnerMessage(rumor).IsErr());
    }
}

TEST_CASE("EnvelopeParser - Attachments", "[event][envelope]") {
    const Attachment photo{"https://files.example/cat.jpg", "image/jpeg", 2048, "cat.jpg", std::string(64, 'f')};
    const auto tag = EnvelopeParser::ToImetaTag(photo);
    REQUIRE(tag[0] == "imeta");
    REQUIRE(tag[1] == "url https://files.example/cat.jpg");

    SECTION("Tag round trip") {
        const auto parsed = EnvelopeParser::ParseAttachments({tag});
        REQUIRE(parsed.size() == 1);
        REQUIRE(parsed[0] == photo);
    }
    SECTION("Entries without a url are skipped") {
        const Tags tags = {{"imeta", "m image/png"}, {"imeta", "url https://x/y.png", "size abc"}};
        const auto parsed = EnvelopeParser::ParseAttachments(tags);
        REQUIRE(parsed.size() == 1);
        REQUIRE(parsed[0].url == "https://x/y.png");
        REQUIRE_FALSE(parsed[0].size.has_value());
    }
}

TEST_CASE("EnvelopeParser - Classify", "[event][envelope]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::string bob(64, 'b');

    Event wrap;
    wrap.kind = EventKind::GIFT_WRAP;
    wrap.tags = {{"p", bob}};
    REQUIRE(std::holds_alternative<GiftWrap>(EnvelopeParser::Classify(wrap).Unwrap()));

    const auto rumor = Rumor(std::string(64, 'a'), {bob});
    REQUIRE(std::holds_alternative<InnerMessage>(EnvelopeParser::Classify(rumor).Unwrap()));

    const auto sender = MakeIdentity();
    Event seal;
    seal.kind = EventKind::SEAL;
    seal.content = "x";
    REQUIRE(std::holds_alternative<Seal>(EnvelopeParser::Classify(sender->Sign(seal).Unwrap()).Unwrap()));

    Event note;
    note.kind = 1;
    REQUIRE(EnvelopeParser::Classify(note).IsErr());
}
