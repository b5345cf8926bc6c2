#include <catch2/catch_test_macros.hpp>
#include "dmsync/configuration/sync_config.hpp"
#include <cstring>
using namespace dmsync;
using namespace dmsync::configuration;
using namespace std::chrono_literals;

TEST_CASE("SyncConfig - Defaults", "[config]") {
    const auto config = SyncConfig::Default();

    REQUIRE(config.discovery_relays ==
            std::vector<std::string>{"wss://relay.damus.io", "wss://nos.lol", "wss://relay.primal.net"});
    REQUIRE(config.relay_mode == RelayMode::Hybrid);
    REQUIRE(config.relay_ttl == std::chrono::hours(24 * 7));
    REQUIRE(config.batch_size == 1000);
    REQUIRE(config.query_limit == 20000);
    REQUIRE(config.query_timeout == 5s);
    REQUIRE(config.subscription_overlap == 10s);
    REQUIRE(config.debounced_write_delay == 15s);
    REQUIRE(config.optimistic_match_tolerance == 60s);
    REQUIRE(config.recent_message_threshold == 5s);
    REQUIRE(config.discovery_majority_ratio == 0.6);
    REQUIRE(config.enable_private_protocol);
    REQUIRE(config.Validate().IsOk());

    REQUIRE(SyncConfig{}.discovery_relays.empty());
}

TEST_CASE("SyncConfig - Validation", "[config]") {
    auto config = SyncConfig::Default();

    SECTION("No discovery relays") {
        config.discovery_relays.clear();
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Blank discovery relay") {
        config.discovery_relays.push_back("");
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Zero batch size") {
        config.batch_size = 0;
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Query limit below batch size") {
        config.query_limit = 999;
        auto result = config.Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == DmFailureType::InvalidInput);
        REQUIRE(result.UnwrapErr().message.find("999") != std::string::npos);
    }
    SECTION("Query limit equal to batch size") {
        config.query_limit = config.batch_size;
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Majority ratio bounds") {
        config.discovery_majority_ratio = 0.0;
        REQUIRE(config.Validate().IsErr());
        config.discovery_majority_ratio = 1.5;
        REQUIRE(config.Validate().IsErr());
        config.discovery_majority_ratio = 1.0;
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Non-positive timeout") {
        config.query_timeout = 0ms;
        REQUIRE(config.Validate().IsErr());
    }
}

TEST_CASE("SyncConfig - Relay mode names", "[config]") {
    REQUIRE(std::strcmp(RelayModeToString(RelayMode::Discovery), "discovery") == 0);
    REQUIRE(std::strcmp(RelayModeToString(RelayMode::Hybrid), "hybrid") == 0);
    REQUIRE(std::strcmp(RelayModeToString(RelayMode::StrictOutbox), "strict_outbox") == 0);
}
