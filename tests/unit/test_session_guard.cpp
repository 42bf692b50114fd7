#include <catch2/catch_test_macros.hpp>
#include "omemo_send/workflow/session_guard.hpp"
#include "omemo_send/workflow/plain_advisory_sender.hpp"
#include "helpers/mock_session.hpp"

using namespace omemo_send;
using namespace omemo_send::test_helpers;
using workflow::PlainAdvisorySender;
using workflow::SessionGuard;

TEST_CASE("SessionGuard - Disconnects exactly once", "[session-guard][workflow]") {
    MockSession session;

    SECTION("On scope exit") {
        {
            SessionGuard guard(session);
            REQUIRE(guard.IsArmed());
        }
        REQUIRE(session.DisconnectCalls() == 1);
        REQUIRE_FALSE(session.IsConnected());
    }
    SECTION("Explicit release then scope exit") {
        {
            SessionGuard guard(session);
            guard.Release();
            REQUIRE_FALSE(guard.IsArmed());
            guard.Release();
        }
        REQUIRE(session.DisconnectCalls() == 1);
    }
}

TEST_CASE("PlainAdvisorySender - Best effort notices", "[advisory][workflow]") {
    const auto bob = models::BareJid::Parse("bob@example.org").Unwrap();
    PlainAdvisorySender sender;

    SECTION("Sends an unencrypted chat message") {
        MockSession session;
        sender.Notify(session, bob, "Could not find keys");
        REQUIRE(session.Sent().size() == 1);
        const auto& message = session.Sent().front();
        REQUIRE(message.To() == bob);
        REQUIRE(message.Type() == "chat");
        REQUIRE(message.Body() == "Could not find keys");
        REQUIRE_FALSE(message.IsEncrypted());
        REQUIRE_FALSE(message.Method().has_value());
    }
    SECTION("A failed send is absorbed") {
        MockSession session;
        session.FailPlainSends();
        REQUIRE_NOTHROW(sender.Notify(session, bob, "notice"));
        REQUIRE(session.Sent().empty());
    }
}
