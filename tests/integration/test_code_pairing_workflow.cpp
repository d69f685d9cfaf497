#include <catch2/catch_test_macros.hpp>
#include "helpers/pairing_fixture.hpp"
#include "pairlink/codec/share_code_codec.hpp"
#include "pairlink/directory/rendezvous_directory.hpp"
#include "pairlink/core/constants.hpp"
#include <chrono>
#include <optional>
#include <vector>
using namespace pairlink;
using namespace pairlink::test_helpers;
using namespace pairlink::session;
using namespace std::chrono_literals;
using pairlink::configuration::PairingConfig;
using pairlink::connection::ConnectionTier;
namespace {
constexpr uint32_t kCodePrefix = 230349344u;
const std::vector<std::string> kIssuerAddresses = {"/ip4/192.168.1.10/tcp/4001", "/ip4/203.0.113.7/tcp/4001"};
const std::vector<std::string> kConsumerAddresses = {"/ip4/192.168.1.20/tcp/4001"};
service::TokenSource FixedPrefix() {
    return [] { return TokenWithPrefix(kCodePrefix); };
}
}
TEST_CASE("Code pairing - Both sides confirm with matching peers", "[integration][pairing][code]") {
    ManualClock clock;
    ScriptedDirectory directory(clock);
    LoopbackNetwork network;
    PairingNode issuer("Laptop", clock, directory, network, kIssuerAddresses, PairingConfig::ForTesting(), FixedPrefix());
    PairingNode consumer("Phone", clock, directory, network, kConsumerAddresses);
    const std::vector<PairingNode*> nodes = {&issuer, &consumer};

    auto generated = issuer.service->GenerateCode(120s);
    REQUIRE(generated.IsOk());
    const auto info = generated.Unwrap();
    REQUIRE(info.code == "A3F7K2");
    REQUIRE(info.display_code == "A3F-7K2");
    REQUIRE(info.expires_at - info.created_at == 120s);
    REQUIRE(issuer.StateOf(info.token) == PairingState::Publishing);

    Pump(nodes);
    REQUIRE(issuer.StateOf(info.token) == PairingState::AwaitingPeer);
    REQUIRE(directory.PutCount() == 1);

    auto entered = consumer.service->EnterCode("a3f-7k2");
    REQUIRE(entered.IsOk());
    const auto consumer_token = entered.Unwrap();
    REQUIRE(consumer_token.Prefix() == kCodePrefix);
    Pump(nodes);

    REQUIRE(issuer.StateOf(info.token) == PairingState::Handshaking);
    REQUIRE(consumer.StateOf(consumer_token) == PairingState::Handshaking);
    REQUIRE(consumer.transport.LastDirectHints() == kIssuerAddresses);

    REQUIRE(issuer.service->Confirm(info.token).IsOk());
    Pump(nodes);

    const auto issuer_view = issuer.service->GetSession(info.token);
    const auto consumer_view = consumer.service->GetSession(consumer_token);
    REQUIRE(issuer_view.has_value());
    REQUIRE(consumer_view.has_value());
    REQUIRE(issuer_view->state == PairingState::Confirmed);
    REQUIRE(consumer_view->state == PairingState::Confirmed);
    REQUIRE(issuer_view->peer_identifier == std::optional<std::string>(consumer.Id()));
    REQUIRE(consumer_view->peer_identifier == std::optional<std::string>(issuer.Id()));
    REQUIRE(consumer_view->peer_display_name == std::optional<std::string>("Laptop"));
    REQUIRE(issuer_view->peer_display_name == std::optional<std::string>("Phone"));
    REQUIRE(consumer_view->tier == std::optional<ConnectionTier>(ConnectionTier::Direct));
    REQUIRE_FALSE(issuer_view->reason.has_value());

    SECTION("Both sides hold the same pairing key, handed out once") {
        auto issuer_outcome = issuer.service->TakeOutcome(info.token);
        auto consumer_outcome = consumer.service->TakeOutcome(consumer_token);
        REQUIRE(issuer_outcome.IsOk());
        REQUIRE(consumer_outcome.IsOk());
        REQUIRE(issuer_outcome.Unwrap().shared_key.size() == kPairingKeyBytes);
        REQUIRE(issuer_outcome.Unwrap().shared_key == consumer_outcome.Unwrap().shared_key);
        REQUIRE(consumer_outcome.Unwrap().peer_public_key == issuer.identity.GetPublicKey());
        REQUIRE(issuer_outcome.Unwrap().peer_public_key == consumer.identity.GetPublicKey());
        REQUIRE(consumer_outcome.Unwrap().peer_device.hostname == "host-Laptop");
        REQUIRE(consumer_outcome.Unwrap().channel != nullptr);
        REQUIRE(consumer_outcome.Unwrap().tier == std::optional<ConnectionTier>(ConnectionTier::Direct));
        REQUIRE_FALSE(issuer_outcome.Unwrap().tier.has_value());

        auto again = issuer.service->TakeOutcome(info.token);
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == PairingFailureType::InvalidState);
    }
    SECTION("Observers saw every transition once, in order") {
        REQUIRE(issuer.observer.StatesFor(info.token) == std::vector<PairingState>{
            PairingState::Publishing, PairingState::AwaitingPeer,
            PairingState::Handshaking, PairingState::Confirmed});
        REQUIRE(consumer.observer.StatesFor(consumer_token) == std::vector<PairingState>{
            PairingState::AwaitingPeer, PairingState::Connecting,
            PairingState::Handshaking, PairingState::Confirmed});
        REQUIRE(issuer.observer.CountTerminal(info.token) == 1);
        REQUIRE(consumer.observer.CountTerminal(consumer_token) == 1);
        const auto last = consumer.observer.For(consumer_token).back();
        REQUIRE(last.previous_state == PairingState::Handshaking);
        REQUIRE_FALSE(last.user_message.has_value());
    }
    SECTION("The record is withdrawn once the code is used") {
        REQUIRE(directory.RemoveCount() == 1);
        directory::RendezvousDirectory lookup(directory, clock);
        auto resolved = lookup.Resolve(directory::RendezvousDirectory::KeyFor(kCodePrefix), 1s);
        REQUIRE(resolved.IsErr());
        REQUIRE(resolved.UnwrapErr().type == PairingFailureType::NotFound);
    }
}
TEST_CASE("Code pairing - Unknown or malformed codes", "[integration][pairing][code]") {
    ManualClock clock;
    ScriptedDirectory directory(clock);
    LoopbackNetwork network;
    PairingNode issuer("Laptop", clock, directory, network, kIssuerAddresses, PairingConfig::ForTesting(), FixedPrefix());
    PairingNode consumer("Phone", clock, directory, network, kConsumerAddresses);
    const std::vector<PairingNode*> nodes = {&issuer, &consumer};

    SECTION("A code nobody published fails with NotFound") {
        auto entered = consumer.service->EnterCode("222222");
        REQUIRE(entered.IsOk());
        Pump(nodes);
        const auto view = consumer.service->GetSession(entered.Unwrap());
        REQUIRE(view.has_value());
        REQUIRE(view->state == PairingState::Failed);
        REQUIRE(view->reason == std::optional<PairingFailureType>(PairingFailureType::NotFound));
        const auto last = consumer.observer.For(entered.Unwrap()).back();
        REQUIRE(last.user_message == std::optional<std::string>("invalid or expired code"));
        REQUIRE(consumer.transport.DirectAttempts() == 0);
    }
    SECTION("Malformed input is refused synchronously") {
        auto short_code = consumer.service->EnterCode("A3F7K");
        REQUIRE(short_code.IsErr());
        REQUIRE(short_code.UnwrapErr().type == PairingFailureType::InvalidFormat);
        auto bad_alphabet = consumer.service->EnterCode("A3F7K0");
        REQUIRE(bad_alphabet.IsErr());
        REQUIRE(bad_alphabet.UnwrapErr().type == PairingFailureType::InvalidFormat);
        REQUIRE(consumer.service->GetRegistry().Size() == 0);
    }
    SECTION("A device cannot pair with its own code") {
        auto generated = issuer.service->GenerateCode();
        REQUIRE(generated.IsOk());
        Pump(nodes);
        auto own = issuer.service->EnterCode(generated.Unwrap().code);
        REQUIRE(own.IsErr());
        REQUIRE(own.UnwrapErr().type == PairingFailureType::InvalidState);
    }
}
TEST_CASE("Code pairing - Connection tier fallback", "[integration][pairing][connection]") {
    ManualClock clock;
    ScriptedDirectory directory(clock);
    LoopbackNetwork network;
    PairingNode issuer("Laptop", clock, directory, network, kIssuerAddresses, PairingConfig::ForTesting(), FixedPrefix());
    PairingNode consumer("Phone", clock, directory, network, kConsumerAddresses);
    const std::vector<PairingNode*> nodes = {&issuer, &consumer};

    auto info = issuer.service->GenerateCode().Unwrap();
    Pump(nodes);

    SECTION("Direct and hole punch fail, relay carries the session") {
        consumer.transport.SetTiers(false, false, true);
        consumer.transport.SetHolePunchSupportedButFailing();
        auto token = consumer.service->EnterCode(info.code).Unwrap();
        Pump(nodes);
        REQUIRE(issuer.service->Confirm(info.token).IsOk());
        Pump(nodes);
        const auto view = consumer.service->GetSession(token);
        REQUIRE(view->state == PairingState::Confirmed);
        REQUIRE(view->tier == std::optional<ConnectionTier>(ConnectionTier::Relayed));
        REQUIRE(consumer.transport.DirectAttempts() == 1);
        REQUIRE(consumer.transport.HolePunchAttempts() == 1);
        REQUIRE(consumer.transport.RelayAttempts() == 1);
    }
    SECTION("Hole punch succeeds after direct fails") {
        consumer.transport.SetTiers(false, true, false);
        auto token = consumer.service->EnterCode(info.code).Unwrap();
        Pump(nodes);
        const auto view = consumer.service->GetSession(token);
        REQUIRE(view->state == PairingState::Handshaking);
        REQUIRE(view->tier == std::optional<ConnectionTier>(ConnectionTier::HolePunched));
        REQUIRE(consumer.transport.RelayAttempts() == 0);
    }
    SECTION("Every tier fails: Unreachable, issuer keeps waiting") {
        consumer.transport.SetTiers(false, false, false);
        auto token = consumer.service->EnterCode(info.code).Unwrap();
        Pump(nodes);
        const auto view = consumer.service->GetSession(token);
        REQUIRE(view->state == PairingState::Failed);
        REQUIRE(view->reason == std::optional<PairingFailureType>(PairingFailureType::Unreachable));
        REQUIRE(consumer.observer.For(token).back().user_message == std::optional<std::string>("could not connect"));
        REQUIRE(issuer.StateOf(info.token) == PairingState::AwaitingPeer);
    }
}
TEST_CASE("Code pairing - Local decisions", "[integration][pairing][code]") {
    ManualClock clock;
    ScriptedDirectory directory(clock);
    LoopbackNetwork network;
    PairingNode issuer("Laptop", clock, directory, network, kIssuerAddresses, PairingConfig::ForTesting(), FixedPrefix());
    PairingNode consumer("Phone", clock, directory, network, kConsumerAddresses,
        PairingConfig::ForTesting().WithRequireConsumerConfirmation(true));
    const std::vector<PairingNode*> nodes = {&issuer, &consumer};

    auto info = issuer.service->GenerateCode().Unwrap();
    Pump(nodes);
    auto token = consumer.service->EnterCode(info.code).Unwrap();
    Pump(nodes);
    REQUIRE(consumer.StateOf(token) == PairingState::AwaitingLocalConfirmation);
    REQUIRE(issuer.StateOf(info.token) == PairingState::AwaitingPeer);

    SECTION("Consumer approves, issuer approves") {
        REQUIRE(consumer.service->Confirm(token).IsOk());
        Pump(nodes);
        REQUIRE(issuer.StateOf(info.token) == PairingState::Handshaking);
        REQUIRE(issuer.service->Confirm(info.token).IsOk());
        Pump(nodes);
        REQUIRE(issuer.StateOf(info.token) == PairingState::Confirmed);
        REQUIRE(consumer.StateOf(token) == PairingState::Confirmed);
    }
    SECTION("Consumer declines before anything is sent") {
        REQUIRE(consumer.service->Reject(token).IsOk());
        Pump(nodes);
        const auto view = consumer.service->GetSession(token);
        REQUIRE(view->state == PairingState::Rejected);
        REQUIRE(view->reason == std::optional<PairingFailureType>(PairingFailureType::RejectedLocally));
        REQUIRE(issuer.StateOf(info.token) == PairingState::AwaitingPeer);
        REQUIRE(network.Sent().empty());
    }
    SECTION("Issuer declines the request") {
        REQUIRE(consumer.service->Confirm(token).IsOk());
        Pump(nodes);
        REQUIRE(issuer.service->Reject(info.token).IsOk());
        Pump(nodes);
        const auto issuer_view = issuer.service->GetSession(info.token);
        const auto consumer_view = consumer.service->GetSession(token);
        REQUIRE(issuer_view->state == PairingState::Rejected);
        REQUIRE(issuer_view->reason == std::optional<PairingFailureType>(PairingFailureType::RejectedLocally));
        REQUIRE(consumer_view->state == PairingState::Rejected);
        REQUIRE(consumer_view->reason == std::optional<PairingFailureType>(PairingFailureType::RejectedByPeer));
        REQUIRE(consumer.observer.For(token).back().user_message == std::optional<std::string>("pairing declined"));
        REQUIRE(consumer.service->TakeOutcome(token).IsErr());
    }
    SECTION("Commands in the wrong state are refused") {
        auto early = issuer.service->Confirm(info.token);
        REQUIRE(early.IsErr());
        REQUIRE(early.UnwrapErr().type == PairingFailureType::InvalidState);
        REQUIRE(issuer.service->Reject(info.token).IsErr());
        auto unknown = issuer.service->Confirm(SessionToken::Generate());
        REQUIRE(unknown.IsErr());
        REQUIRE(unknown.UnwrapErr().type == PairingFailureType::NotFound);
    }
}
TEST_CASE("Code pairing - Distinct codes never cross", "[integration][pairing][code]") {
    ManualClock clock;
    ScriptedDirectory directory(clock);
    LoopbackNetwork network;
    PairingNode first_issuer("Laptop", clock, directory, network, {"/ip4/192.168.1.10/tcp/4001"});
    PairingNode second_issuer("Desktop", clock, directory, network, {"/ip4/192.168.1.11/tcp/4001"});
    PairingNode first_consumer("Phone", clock, directory, network, {"/ip4/192.168.1.20/tcp/4001"});
    PairingNode second_consumer("Tablet", clock, directory, network, {"/ip4/192.168.1.21/tcp/4001"});
    const std::vector<PairingNode*> nodes = {&first_issuer, &second_issuer, &first_consumer, &second_consumer};

    auto first = first_issuer.service->GenerateCode().Unwrap();
    auto second = second_issuer.service->GenerateCode().Unwrap();
    REQUIRE(first.code != second.code);
    Pump(nodes);

    auto first_token = first_consumer.service->EnterCode(first.code).Unwrap();
    auto second_token = second_consumer.service->EnterCode(second.code).Unwrap();
    Pump(nodes);
    REQUIRE(first_issuer.service->Confirm(first.token).IsOk());
    REQUIRE(second_issuer.service->Confirm(second.token).IsOk());
    Pump(nodes);

    REQUIRE(first_consumer.service->GetSession(first_token)->peer_identifier ==
            std::optional<std::string>(first_issuer.Id()));
    REQUIRE(second_consumer.service->GetSession(second_token)->peer_identifier ==
            std::optional<std::string>(second_issuer.Id()));
    REQUIRE(first_issuer.service->GetSession(first.token)->peer_identifier ==
            std::optional<std::string>(first_consumer.Id()));
    REQUIRE(second_issuer.service->GetSession(second.token)->peer_identifier ==
            std::optional<std::string>(second_consumer.Id()));
    REQUIRE(first_consumer.StateOf(first_token) == PairingState::Confirmed);
    REQUIRE(second_consumer.StateOf(second_token) == PairingState::Confirmed);
}
TEST_CASE("Code pairing - Request arriving before the publish completes", "[integration][pairing][code]") {
    ManualClock clock;
    ScriptedDirectory directory(clock);
    LoopbackNetwork network;
    PairingNode issuer("Laptop", clock, directory, network, kIssuerAddresses, PairingConfig::ForTesting(), FixedPrefix());
    PairingNode consumer("Phone", clock, directory, network, kConsumerAddresses);
    const std::vector<PairingNode*> nodes = {&issuer, &consumer};

    auto info = issuer.service->GenerateCode().Unwrap();
    std::optional<SessionToken> consumer_token;
    directory.SetAfterPut([&] {
        if (consumer_token.has_value()) {
            return;
        }
        consumer_token = consumer.service->EnterCode(info.code).Unwrap();
        Pump({&consumer});
    });

    REQUIRE(issuer.executor.RunAll() == 1);
    REQUIRE(consumer_token.has_value());
    REQUIRE(consumer.StateOf(*consumer_token) == PairingState::Handshaking);
    REQUIRE(issuer.StateOf(info.token) == PairingState::Publishing);

    Pump(nodes);
    REQUIRE(issuer.StateOf(info.token) == PairingState::Handshaking);
    REQUIRE(issuer.observer.StatesFor(info.token) ==
            std::vector<PairingState>{PairingState::Publishing, PairingState::Handshaking});

    REQUIRE(issuer.service->Confirm(info.token).IsOk());
    Pump(nodes);
    REQUIRE(issuer.StateOf(info.token) == PairingState::Confirmed);
    REQUIRE(consumer.StateOf(*consumer_token) == PairingState::Confirmed);
    REQUIRE(directory.RemoveCount() == 1);
}
