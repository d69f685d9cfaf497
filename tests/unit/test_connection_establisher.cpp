#include <catch2/catch_test_macros.hpp>
#include "pairlink/connection/connection_establisher.hpp"
#include "helpers/loopback_network.hpp"
using namespace pairlink;
using namespace pairlink::connection;
using namespace std::chrono_literals;
using pairlink::test_helpers::LoopbackNetwork;
using pairlink::test_helpers::LoopbackTransport;
TEST_CASE("ConnectionEstablisher - Address classification", "[connection]") {
    SECTION("Private, loopback and link-local addresses are Local") {
        REQUIRE(ConnectionEstablisher::ClassifyAddress("/ip4/192.168.1.10/tcp/4001") == AddressScope::Local);
        REQUIRE(ConnectionEstablisher::ClassifyAddress("/ip4/10.0.0.2/udp/4001/quic") == AddressScope::Local);
        REQUIRE(ConnectionEstablisher::ClassifyAddress("172.20.1.1:4001") == AddressScope::Local);
        REQUIRE(ConnectionEstablisher::ClassifyAddress("/ip4/127.0.0.1/tcp/1") == AddressScope::Local);
        REQUIRE(ConnectionEstablisher::ClassifyAddress("/ip6/fe80::1/tcp/4001") == AddressScope::Local);
        REQUIRE(ConnectionEstablisher::ClassifyAddress("[fd00::5]:4001") == AddressScope::Local);
        REQUIRE(ConnectionEstablisher::ClassifyAddress("/dns4/localhost/tcp/4001") == AddressScope::Local);
    }
    SECTION("Everything routable is Public") {
        REQUIRE(ConnectionEstablisher::ClassifyAddress("/ip4/203.0.113.5/tcp/4001") == AddressScope::Public);
        REQUIRE(ConnectionEstablisher::ClassifyAddress("/ip4/172.32.0.1/tcp/4001") == AddressScope::Public);
        REQUIRE(ConnectionEstablisher::ClassifyAddress("/ip6/2001:db8::1/tcp/4001") == AddressScope::Public);
        REQUIRE(ConnectionEstablisher::ClassifyAddress("/dns4/example.org/tcp/443") == AddressScope::Public);
    }
    SECTION("Circuit addresses are Relayed") {
        REQUIRE(ConnectionEstablisher::ClassifyAddress("/ip4/198.51.100.1/tcp/4001/p2p/QmRelay/p2p-circuit") == AddressScope::Relayed);
    }
}
TEST_CASE("ConnectionEstablisher - Hint ordering", "[connection]") {
    const std::vector<std::string> hints = {
        "/ip4/203.0.113.5/tcp/4001",
        "/ip4/198.51.100.1/tcp/4001/p2p/QmRelay/p2p-circuit",
        "/ip4/192.168.1.10/tcp/4001",
    };
    SECTION("Direct hints put local first and drop relays") {
        const auto direct = ConnectionEstablisher::DirectHints(hints);
        REQUIRE(direct == std::vector<std::string>{"/ip4/192.168.1.10/tcp/4001", "/ip4/203.0.113.5/tcp/4001"});
    }
    SECTION("Relay hints keep only circuit addresses") {
        const auto relays = ConnectionEstablisher::RelayHints(hints);
        REQUIRE(relays.size() == 1);
        REQUIRE(relays[0].find("p2p-circuit") != std::string::npos);
    }
}
TEST_CASE("ConnectionEstablisher - Tier fallback", "[connection]") {
    LoopbackNetwork network;
    network.Attach("peer", [](std::shared_ptr<interfaces::IPeerChannel>, std::vector<uint8_t>) {});
    LoopbackTransport transport(network, {});
    transport.SetIdentifier("self");
    const auto config = configuration::PairingConfig::ForTesting();
    ConnectionEstablisher establisher(ConnectionEstablisher::DefaultStrategies(transport, config));
    const std::vector<std::string> hints = {"/ip4/192.168.1.10/tcp/4001"};

    SECTION("Direct wins when it works") {
        auto handle = establisher.Connect("peer", hints);
        REQUIRE(handle.IsOk());
        REQUIRE(handle.Unwrap().tier == ConnectionTier::Direct);
        REQUIRE(transport.HolePunchAttempts() == 0);
        REQUIRE(transport.RelayAttempts() == 0);
    }
    SECTION("Hole punching is skipped when unsupported") {
        transport.SetTiers(false, false, true);
        auto handle = establisher.Connect("peer", hints);
        REQUIRE(handle.Unwrap().tier == ConnectionTier::Relayed);
        REQUIRE(transport.HolePunchAttempts() == 0);
    }
    SECTION("Direct and hole punch fail, relay carries the connection") {
        transport.SetTiers(false, false, true);
        transport.SetHolePunchSupportedButFailing();
        auto handle = establisher.Connect("peer", hints);
        REQUIRE(handle.IsOk());
        REQUIRE(handle.Unwrap().tier == ConnectionTier::Relayed);
        REQUIRE(transport.DirectAttempts() == 1);
        REQUIRE(transport.HolePunchAttempts() == 1);
        REQUIRE(transport.RelayAttempts() == 1);
    }
    SECTION("Hole punch used when direct fails") {
        transport.SetTiers(false, true, true);
        REQUIRE(establisher.Connect("peer", hints).Unwrap().tier == ConnectionTier::HolePunched);
        REQUIRE(transport.RelayAttempts() == 0);
    }
    SECTION("No direct hints skips the direct dial") {
        transport.SetTiers(true, false, true);
        auto handle = establisher.Connect("peer", {"/ip4/198.51.100.1/tcp/4001/p2p/QmRelay/p2p-circuit"});
        REQUIRE(handle.Unwrap().tier == ConnectionTier::Relayed);
        REQUIRE(transport.DirectAttempts() == 0);
    }
    SECTION("Every tier failing is Unreachable") {
        transport.SetTiers(false, false, false);
        auto handle = establisher.Connect("peer", hints);
        REQUIRE(handle.IsErr());
        REQUIRE(handle.UnwrapErr().type == PairingFailureType::Unreachable);
    }
}
TEST_CASE("ConnectionEstablisher - Custom strategies", "[connection]") {
    std::vector<ConnectionTier> tried;
    auto failing = [&tried](ConnectionTier tier) {
        return TierStrategy{tier, 10ms,
            [&tried, tier](const std::string&, const std::vector<std::string>&, std::chrono::milliseconds) {
                tried.push_back(tier);
                return Result<std::shared_ptr<interfaces::IPeerChannel>, PairingFailure>::Err(
                    PairingFailure::Unreachable("scripted"));
            }};
    };
    ConnectionEstablisher establisher({failing(ConnectionTier::Relayed), failing(ConnectionTier::Direct)});
    REQUIRE(establisher.Connect("peer", {}).IsErr());
    REQUIRE(tried == std::vector<ConnectionTier>{ConnectionTier::Relayed, ConnectionTier::Direct});
}
