#include <catch2/catch_test_macros.hpp>
#include "omemo_send/models/outgoing_message.hpp"
#include "omemo_send/models/encrypt_outcome.hpp"
#include "omemo_send/core/constants.hpp"

using namespace omemo_send;
using namespace omemo_send::models;

TEST_CASE("EncryptionMethod - Registry", "[eme][models]") {
    SECTION("Legacy OMEMO") {
        auto method = EncryptionMethod::ForNamespace(XmppNamespaces::OMEMO_LEGACY);
        REQUIRE(method.IsOk());
        REQUIRE(method.Unwrap().ns == "eu.siacs.conversations.axolotl");
        REQUIRE(method.Unwrap().name == "OMEMO");
    }
    SECTION("Other known mechanisms") {
        REQUIRE(EncryptionMethod::LookupName("urn:xmpp:omemo:2") == "OMEMO");
        REQUIRE(EncryptionMethod::LookupName("urn:xmpp:otr:0") == "OTR");
        REQUIRE(EncryptionMethod::LookupName("urn:xmpp:openpgp:0") == "OpenPGP for XMPP");
    }
    SECTION("Unknown namespace") {
        REQUIRE_FALSE(EncryptionMethod::LookupName("urn:example:none").has_value());
        auto method = EncryptionMethod::ForNamespace("urn:example:none");
        REQUIRE(method.IsErr());
        REQUIRE(method.UnwrapErr().type == WorkflowFailureType::InvalidInput);
        REQUIRE(method.UnwrapErr().message ==
                "No encryption mechanism registered for namespace 'urn:example:none'");
    }
}

TEST_CASE("OutgoingMessage - Construction", "[message][models]") {
    const auto bob = BareJid::Parse("bob@example.org").Unwrap();

    SECTION("Encrypted chat shell") {
        auto message = OutgoingMessage::Chat(bob);
        REQUIRE(message.Type() == "chat");
        REQUIRE_FALSE(message.Body().has_value());
        REQUIRE_FALSE(message.IsEncrypted());

        message.SetEncryptionMethod(EncryptionMethod::ForNamespace(XmppNamespaces::OMEMO_LEGACY).Unwrap());
        message.AttachEnvelope(EncryptedEnvelope("<encrypted/>"));
        REQUIRE(message.IsEncrypted());
        REQUIRE(message.Envelopes().front().Xml() == "<encrypted/>");
        REQUIRE(message.Method()->name == "OMEMO");
    }
    SECTION("Plain advisory") {
        auto message = OutgoingMessage::PlainChat(bob, "notice");
        REQUIRE(message.To() == bob);
        REQUIRE(message.Body() == "notice");
        REQUIRE_FALSE(message.Method().has_value());
        REQUIRE_FALSE(message.IsEncrypted());
    }
}

TEST_CASE("DeviceProblemKind - Descriptions", "[outcome][models]") {
    REQUIRE(ToString(DeviceProblemKind::MissingBundle) == "missing bundle");
    REQUIRE(ToString(DeviceProblemKind::NoSession) == "no session");
    REQUIRE(ToString(DeviceProblemKind::Untrusted) == "untrusted");
    REQUIRE(ToString(DeviceProblemKind::NoEligibleDevices) == "no eligible devices");
    REQUIRE(ToString(DeviceProblemKind::Other) == "other");
}
