#include <catch2/catch_test_macros.hpp>
#include "helpers/pairing_fixture.hpp"
#include "pairlink/core/constants.hpp"
#include <chrono>
#include <vector>
using namespace pairlink;
using namespace pairlink::test_helpers;
using namespace pairlink::session;
using namespace std::chrono_literals;
using pairlink::configuration::PairingConfig;
using pairlink::connection::ConnectionTier;
namespace {
const std::vector<std::string> kLaptopAddresses = {"/ip4/192.168.1.10/tcp/4001"};
const std::vector<std::string> kPhoneAddresses = {"/ip4/192.168.1.20/tcp/4001"};
}
TEST_CASE("Nearby pairing - Confirms without the directory", "[integration][pairing][nearby]") {
    ManualClock clock;
    ScriptedDirectory directory(clock);
    LoopbackNetwork network;
    PairingNode laptop("Laptop", clock, directory, network, kLaptopAddresses);
    PairingNode phone("Phone", clock, directory, network, kPhoneAddresses);
    const std::vector<PairingNode*> nodes = {&laptop, &phone};

    auto started = phone.service->PairWithNearby(laptop.Id(), kLaptopAddresses);
    REQUIRE(started.IsOk());
    const auto token = started.Unwrap();
    REQUIRE(phone.StateOf(token) == PairingState::Connecting);
    Pump(nodes);

    REQUIRE(phone.StateOf(token) == PairingState::Handshaking);
    const auto incoming = laptop.service->GetSession(token);
    REQUIRE(incoming.has_value());
    REQUIRE(incoming->role == SessionRole::Issuer);
    REQUIRE(incoming->method == PairingMethod::Direct);
    REQUIRE(incoming->state == PairingState::Handshaking);
    REQUIRE(incoming->peer_identifier == std::optional<std::string>(phone.Id()));
    REQUIRE_FALSE(incoming->code.has_value());

    SECTION("Laptop approves") {
        REQUIRE(laptop.service->Confirm(token).IsOk());
        Pump(nodes);
        const auto phone_view = phone.service->GetSession(token);
        REQUIRE(phone_view->state == PairingState::Confirmed);
        REQUIRE(phone_view->peer_identifier == std::optional<std::string>(laptop.Id()));
        REQUIRE(phone_view->peer_display_name == std::optional<std::string>("Laptop"));
        REQUIRE(phone_view->tier == std::optional<ConnectionTier>(ConnectionTier::Direct));
        REQUIRE(laptop.StateOf(token) == PairingState::Confirmed);

        auto phone_outcome = phone.service->TakeOutcome(token);
        auto laptop_outcome = laptop.service->TakeOutcome(token);
        REQUIRE(phone_outcome.IsOk());
        REQUIRE(laptop_outcome.IsOk());
        REQUIRE(phone_outcome.Unwrap().shared_key == laptop_outcome.Unwrap().shared_key);
        REQUIRE(phone_outcome.Unwrap().shared_key.size() == kPairingKeyBytes);

        REQUIRE(directory.PutCount() == 0);
        REQUIRE(directory.GetCount() == 0);
        REQUIRE(directory.RemoveCount() == 0);
        REQUIRE(laptop.observer.StatesFor(token) == std::vector<PairingState>{
            PairingState::Handshaking, PairingState::Confirmed});
        REQUIRE(phone.observer.StatesFor(token) == std::vector<PairingState>{
            PairingState::Connecting, PairingState::Handshaking, PairingState::Confirmed});
    }
    SECTION("Laptop declines") {
        REQUIRE(laptop.service->Reject(token).IsOk());
        Pump(nodes);
        const auto phone_view = phone.service->GetSession(token);
        REQUIRE(phone_view->state == PairingState::Rejected);
        REQUIRE(phone_view->reason == std::optional<PairingFailureType>(PairingFailureType::RejectedByPeer));
        REQUIRE(laptop.StateOf(token) == PairingState::Rejected);
    }
    SECTION("A second nearby attempt from the same peer is refused while the first is live") {
        auto again = phone.service->PairWithNearby(laptop.Id(), kLaptopAddresses);
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == PairingFailureType::DuplicateToken);
    }
    SECTION("Unanswered request expires on both sides") {
        AdvanceAndPump(clock, nodes, 61s, 500ms);
        REQUIRE(phone.StateOf(token) == PairingState::Expired);
        REQUIRE(laptop.StateOf(token) == PairingState::Expired);
        auto late = laptop.service->Confirm(token);
        REQUIRE(late.IsErr());
        REQUIRE(phone.observer.CountTerminal(token) == 1);
    }
}
TEST_CASE("Nearby pairing - Refused inputs", "[integration][pairing][nearby]") {
    ManualClock clock;
    ScriptedDirectory directory(clock);
    LoopbackNetwork network;
    PairingNode phone("Phone", clock, directory, network, kPhoneAddresses);
    const std::vector<PairingNode*> nodes = {&phone};

    SECTION("Own or empty identifier") {
        auto own = phone.service->PairWithNearby(phone.Id(), kPhoneAddresses);
        REQUIRE(own.IsErr());
        REQUIRE(own.UnwrapErr().type == PairingFailureType::InvalidState);
        auto empty = phone.service->PairWithNearby("", kLaptopAddresses);
        REQUIRE(empty.IsErr());
        REQUIRE(phone.service->GetRegistry().Size() == 0);
    }
    SECTION("Peer that is not reachable") {
        auto started = phone.service->PairWithNearby("0123456789abcdef0123456789abcdef01234567", kLaptopAddresses);
        REQUIRE(started.IsOk());
        Pump(nodes);
        const auto view = phone.service->GetSession(started.Unwrap());
        REQUIRE(view->state == PairingState::Failed);
        REQUIRE(view->reason == std::optional<PairingFailureType>(PairingFailureType::Unreachable));
    }
}
