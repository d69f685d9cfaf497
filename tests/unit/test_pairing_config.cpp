#include <catch2/catch_test_macros.hpp>
#include "pairlink/configuration/pairing_config.hpp"
#include <chrono>
using namespace pairlink;
using namespace pairlink::configuration;
using namespace std::chrono_literals;
TEST_CASE("PairingConfig - Presets validate", "[config]") {
    REQUIRE(PairingConfig::Default().Validate().IsOk());
    REQUIRE(PairingConfig::ForTesting().Validate().IsOk());
    REQUIRE(PairingConfig::Default().CodeTtl() == 300s);
    REQUIRE(PairingConfig::ForTesting().CodeTtl() == 120s);
    REQUIRE(PairingConfig::Default().RepublishDivisor() == 3);
    REQUIRE_FALSE(PairingConfig::Default().RequireConsumerConfirmation());
    REQUIRE_FALSE(PairingConfig::Default() == PairingConfig::ForTesting());
}
TEST_CASE("PairingConfig - Code ttl clamping", "[config][expiry]") {
    const auto config = PairingConfig::Default();
    REQUIRE(config.ClampCodeTtl(0s) == config.CodeTtl());
    REQUIRE(config.ClampCodeTtl(-5s) == config.CodeTtl());
    REQUIRE(config.ClampCodeTtl(10s) == 30s);
    REQUIRE(config.ClampCodeTtl(120s) == 120s);
    REQUIRE(config.ClampCodeTtl(7200s) == 3600s);
}
TEST_CASE("PairingConfig - Derived intervals", "[config]") {
    const auto config = PairingConfig::ForTesting();
    SECTION("Republish interval is a fraction of the ttl") {
        REQUIRE(config.RepublishInterval(120s) == 40'000ms);
        REQUIRE(config.WithRepublishDivisor(4).RepublishInterval(120s) == 30'000ms);
    }
    SECTION("Retry backoff doubles up to the cap") {
        REQUIRE(config.RetryBackoff(0) == 100ms);
        REQUIRE(config.RetryBackoff(1) == 200ms);
        REQUIRE(config.RetryBackoff(3) == 800ms);
        REQUIRE(config.RetryBackoff(4) == 1'000ms);
        REQUIRE(config.RetryBackoff(60) == 1'000ms);
    }
}
TEST_CASE("PairingConfig - Modifiers return copies", "[config]") {
    const auto base = PairingConfig::Default();
    const auto changed = base.WithRequireConsumerConfirmation(true).WithTerminalGrace(10s);
    REQUIRE(changed.RequireConsumerConfirmation());
    REQUIRE(changed.TerminalGrace() == 10s);
    REQUIRE_FALSE(base.RequireConsumerConfirmation());
    REQUIRE(base.TerminalGrace() == 30s);
    const auto timeouts = base.WithTierTimeouts(1ms, 2ms, 3ms);
    REQUIRE(timeouts.DirectTimeout() == 1ms);
    REQUIRE(timeouts.HolePunchTimeout() == 2ms);
    REQUIRE(timeouts.RelayTimeout() == 3ms);
}
TEST_CASE("PairingConfig - Validation rejects inconsistent values", "[config]") {
    const auto base = PairingConfig::Default();
    SECTION("Republish divisor below two") {
        auto result = base.WithRepublishDivisor(1).Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PairingFailureType::InvalidState);
    }
    SECTION("Default ttl outside bounds") {
        REQUIRE(base.WithCodeTtl(10s).Validate().IsErr());
        REQUIRE(base.WithCodeTtl(4000s).Validate().IsErr());
    }
    SECTION("Zero timeouts") {
        REQUIRE(base.WithPublishTimeout(0ms).Validate().IsErr());
        REQUIRE(base.WithResolveTimeout(0ms).Validate().IsErr());
        REQUIRE(base.WithSweepInterval(0ms).Validate().IsErr());
        REQUIRE(base.WithTierTimeouts(0ms, 1ms, 1ms).Validate().IsErr());
        REQUIRE(base.WithConsumerSessionTtl(0s).Validate().IsErr());
    }
    SECTION("Inverted backoff") {
        REQUIRE(base.WithRetryBackoff(2'000ms, 1'000ms).Validate().IsErr());
        REQUIRE(base.WithRetryBackoff(0ms, 1'000ms).Validate().IsErr());
    }
    SECTION("Negative grace") {
        REQUIRE(base.WithTerminalGrace(-1s).Validate().IsErr());
        REQUIRE(base.WithTerminalGrace(0s).Validate().IsOk());
    }
}
