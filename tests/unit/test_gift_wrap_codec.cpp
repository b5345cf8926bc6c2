#include <catch2/catch_test_macros.hpp>
#include "dmsync/crypto/gift_wrap_codec.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/event/event_codec.hpp"
#include "dmsync/merge/merge_engine.hpp"
#include "dmsync/core/constants.hpp"
#include "helpers/test_identities.hpp"
#include <algorithm>
#include <set>
using namespace dmsync;
using namespace dmsync::crypto;
using namespace dmsync::test_helpers;
using event::Event;
using event::EventCodec;

namespace {
    constexpr int64_t NOW = 1'700'000'000;
    constexpr int64_t FUZZ = SyncConstants::GIFT_WRAP_FUZZ_WINDOW.count();
}

TEST_CASE("GiftWrapCodec - Inner message", "[crypto][giftwrap]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::string alice(64, 'a');
    const std::string bob(64, 'b');

    SECTION("Text message") {
        const auto inner = GiftWrapCodec::BuildInnerMessage(alice, {bob}, "hi", {}, "", NOW).Unwrap();
        REQUIRE(inner.kind == EventKind::PRIVATE_DIRECT_MESSAGE);
        REQUIRE(inner.pubkey == alice);
        REQUIRE(inner.created_at == NOW);
        REQUIRE(inner.sig.empty());
        REQUIRE(inner.id == EventCodec::ComputeId(inner).Unwrap());
        REQUIRE(event::TagValues(inner.tags, "p") == std::vector<std::string>{bob});
        REQUIRE_FALSE(event::FirstTagValue(inner.tags, "subject").has_value());
    }
    SECTION("Subject tag") {
        const auto inner = GiftWrapCodec::BuildInnerMessage(alice, {bob}, "hi", {}, "trip", NOW).Unwrap();
        REQUIRE(event::FirstTagValue(inner.tags, "subject") == std::optional<std::string>("trip"));
    }
    SECTION("Attachments make a file message") {
        const event::Attachment file{"https://files.example/a.pdf", "application/pdf", 10, "a.pdf", ""};
        const auto inner = GiftWrapCodec::BuildInnerMessage(alice, {bob}, "see", {file}, "", NOW).Unwrap();
        REQUIRE(inner.kind == EventKind::PRIVATE_FILE_MESSAGE);
        REQUIRE(inner.content == "see\nhttps://files.example/a.pdf");
        REQUIRE(event::EnvelopeParser::ParseAttachments(inner.tags).size() == 1);
    }
    SECTION("No recipients") {
        REQUIRE(GiftWrapCodec::BuildInnerMessage(alice, {}, "hi", {}, "", NOW).IsErr());
    }
}

TEST_CASE("GiftWrapCodec - Timestamp fuzzing", "[crypto][giftwrap]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::set<int64_t> seen;
    for (int i = 0; i < 50; ++i) {
        const auto fuzzed = GiftWrapCodec::FuzzTimestamp(NOW);
        REQUIRE(fuzzed <= NOW);
        REQUIRE(fuzzed > NOW - FUZZ);
        seen.insert(fuzzed);
    }
    REQUIRE(seen.size() > 1);
}

TEST_CASE("GiftWrapCodec - Wrap and unwrap", "[crypto][giftwrap]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto alice = MakeIdentity();
    const auto bob = MakeIdentity();
    const auto inner = GiftWrapCodec::BuildInnerMessage(
        alice->PublicKeyHex(), {bob->PublicKeyHex()}, "hello", {}, "", NOW).Unwrap();

    SECTION("Layers have the expected shape") {
        const auto seal = GiftWrapCodec::CreateSeal(inner, *alice, bob->PublicKeyHex(), NOW).Unwrap();
        REQUIRE(seal.kind == EventKind::SEAL);
        REQUIRE(seal.tags.empty());
        REQUIRE(seal.pubkey == alice->PublicKeyHex());
        REQUIRE(seal.created_at <= NOW);
        REQUIRE(EventCodec::Verify(seal));

        const auto wrap = GiftWrapCodec::CreateGiftWrap(seal, bob->PublicKeyHex(), NOW).Unwrap();
        REQUIRE(wrap.kind == EventKind::GIFT_WRAP);
        REQUIRE(wrap.pubkey != alice->PublicKeyHex());
        REQUIRE(event::FirstTagValue(wrap.tags, "p") == std::optional<std::string>(bob->PublicKeyHex()));
        REQUIRE(EventCodec::Verify(wrap));
    }
    SECTION("Recipient recovers the message") {
        const auto copies = GiftWrapCodec::WrapForRecipients(inner, *alice, {bob->PublicKeyHex()}, NOW).Unwrap();
        REQUIRE(copies.size() == 2);
        REQUIRE(copies[0].recipient == bob->PublicKeyHex());
        REQUIRE(copies[1].recipient == alice->PublicKeyHex());

        const auto unwrapped = GiftWrapCodec::Unwrap(copies[0].gift_wrap, *bob).Unwrap();
        REQUIRE(unwrapped.inner.rumor.content == "hello");
        REQUIRE(unwrapped.inner.rumor.id == inner.id);
        REQUIRE(unwrapped.seal.event.pubkey == alice->PublicKeyHex());
        REQUIRE(unwrapped.participants ==
                std::vector<std::string>{alice->PublicKeyHex(), bob->PublicKeyHex()});
        REQUIRE(unwrapped.conversation_id ==
                merge::MergeEngine::ComputeConversationId(unwrapped.participants, ""));
    }
    SECTION("Sender reads their own copy") {
        const auto copies = GiftWrapCodec::WrapForRecipients(inner, *alice, {bob->PublicKeyHex()}, NOW).Unwrap();
        const auto unwrapped = GiftWrapCodec::Unwrap(copies[1].gift_wrap, *alice).Unwrap();
        REQUIRE(unwrapped.inner.rumor.content == "hello");
    }
    SECTION("Copy for someone else cannot be opened") {
        const auto eve = MakeIdentity();
        const auto copies = GiftWrapCodec::WrapForRecipients(inner, *alice, {bob->PublicKeyHex()}, NOW).Unwrap();
        auto result = GiftWrapCodec::Unwrap(copies[0].gift_wrap, *eve);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == DmFailureType::DecryptionFailed);
    }
    SECTION("Every copy has its own throwaway key") {
        const auto carol = MakeIdentity();
        const auto group_inner = GiftWrapCodec::BuildInnerMessage(
            alice->PublicKeyHex(), {bob->PublicKeyHex(), carol->PublicKeyHex()}, "all", {}, "", NOW).Unwrap();
        const auto copies = GiftWrapCodec::WrapForRecipients(
            group_inner, *alice, {bob->PublicKeyHex(), carol->PublicKeyHex(), bob->PublicKeyHex()}, NOW).Unwrap();
        REQUIRE(copies.size() == 3);
        std::set<std::string> signers;
        for (const auto& copy : copies) {
            signers.insert(copy.gift_wrap.pubkey);
        }
        REQUIRE(signers.size() == 3);
        REQUIRE_FALSE(signers.contains(alice->PublicKeyHex()));
    }
    SECTION("Note to self makes one copy") {
        const auto self_inner = GiftWrapCodec::BuildInnerMessage(
            alice->PublicKeyHex(), {alice->PublicKeyHex()}, "memo", {}, "", NOW).Unwrap();
        const auto copies = GiftWrapCodec::WrapForRecipients(
            self_inner, *alice, {alice->PublicKeyHex()}, NOW).Unwrap();
        REQUIRE(copies.size() == 1);
    }
}

TEST_CASE("GiftWrapCodec - Impersonation is rejected", "[crypto][giftwrap]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto alice = MakeIdentity();
    const auto bob = MakeIdentity();
    const auto mallory = MakeIdentity();

    // Mallory seals an inner message claiming Alice as its author.
    const auto forged = GiftWrapCodec::BuildInnerMessage(
        alice->PublicKeyHex(), {bob->PublicKeyHex()}, "send money", {}, "", NOW).Unwrap();
    const auto seal = GiftWrapCodec::CreateSeal(forged, *mallory, bob->PublicKeyHex(), NOW).Unwrap();
    const auto wrap = GiftWrapCodec::CreateGiftWrap(seal, bob->PublicKeyHex(), NOW).Unwrap();

    auto result = GiftWrapCodec::Unwrap(wrap, *bob);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == DmFailureType::MalformedEnvelope);
}

TEST_CASE("LocalIdentity - Keys and ciphers", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Seeded identity is deterministic") {
        const std::vector<uint8_t> seed(32, 0x5A);
        const auto first = LocalIdentity::FromSecretKey(seed).Unwrap();
        const auto second = LocalIdentity::FromSecretKey(seed).Unwrap();
        REQUIRE(first.PublicKeyHex() == second.PublicKeyHex());
        REQUIRE(first.GetPublicKey() == first.PublicKeyHex());
    }
    SECTION("Bad seed") {
        REQUIRE(LocalIdentity::FromSecretKey(std::vector<uint8_t>(31, 0)).IsErr());
    }
    SECTION("Sign fills pubkey, id and signature") {
        const auto alice = MakeIdentity();
        Event note;
        note.kind = 1;
        note.content = "x";
        const auto signed_note = alice->Sign(note).Unwrap();
        REQUIRE(signed_note.pubkey == alice->PublicKeyHex());
        REQUIRE(EventCodec::Verify(signed_note));
    }
    SECTION("Both ciphers interoperate between two identities") {
        const auto alice = MakeIdentity();
        const auto bob = MakeIdentity();
        const auto legacy = alice->EncryptLegacy(bob->PublicKeyHex(), "old style").Unwrap();
        REQUIRE(bob->DecryptLegacy(alice->PublicKeyHex(), legacy).Unwrap() == "old style");
        const auto modern = alice->EncryptPrivate(bob->PublicKeyHex(), "new style").Unwrap();
        REQUIRE(bob->DecryptPrivate(alice->PublicKeyHex(), modern).Unwrap() == "new style");
    }
}
