#include <catch2/catch_test_macros.hpp>
#include "omemo_send/models/expected_problems.hpp"

using namespace omemo_send;
using namespace omemo_send::models;

TEST_CASE("ExpectedProblems - Exclusion set", "[expected-problems][models]") {
    const auto bob = BareJid::Parse("bob@example.org").Unwrap();
    const auto alice = BareJid::Parse("alice@example.org").Unwrap();
    ExpectedProblems problems;

    SECTION("Starts empty") {
        REQUIRE(problems.Empty());
        REQUIRE(problems.Size() == 0);
        REQUIRE(problems.DevicesFor(bob).empty());
        REQUIRE_FALSE(problems.Contains(bob, 1));
    }
    SECTION("Add keeps insertion order per recipient") {
        REQUIRE(problems.Add(bob, 30));
        REQUIRE(problems.Add(bob, 10));
        REQUIRE(problems.Add(alice, 10));
        REQUIRE(problems.DevicesFor(bob) == std::vector<DeviceId>{30, 10});
        REQUIRE(problems.DevicesFor(alice) == std::vector<DeviceId>{10});
        REQUIRE(problems.Size() == 3);
        REQUIRE(problems.Entries().size() == 2);
    }
    SECTION("Duplicates are refused") {
        REQUIRE(problems.Add(bob, 7));
        REQUIRE_FALSE(problems.Add(bob, 7));
        REQUIRE(problems.Size() == 1);
    }
    SECTION("Devices are scoped by recipient") {
        REQUIRE(problems.Add(bob, 7));
        REQUIRE(problems.Contains(bob, 7));
        REQUIRE_FALSE(problems.Contains(alice, 7));
    }
    SECTION("Lookup of an unknown recipient does not create an entry") {
        REQUIRE_FALSE(problems.Contains(alice, 1));
        REQUIRE(problems.DevicesFor(alice).empty());
        REQUIRE(problems.Empty());
    }
}
