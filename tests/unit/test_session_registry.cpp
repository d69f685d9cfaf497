#include <catch2/catch_test_macros.hpp>
#include "pairlink/session/session_registry.hpp"
#include "pairlink/crypto/sodium_interop.hpp"
#include "helpers/loopback_network.hpp"
#include <chrono>
using namespace pairlink;
using namespace pairlink::session;
using namespace pairlink::crypto;
namespace {
const interfaces::TimePoint kStart{std::chrono::milliseconds(1'700'000'000'000)};
std::unique_ptr<PairingSession> MakeSession(
    const SessionToken& token,
    SessionRole role = SessionRole::Issuer,
    PairingMethod method = PairingMethod::Code,
    std::chrono::seconds ttl = std::chrono::seconds(120)) {
    SessionParams params;
    params.token = token;
    params.role = role;
    params.method = method;
    params.created_at = kStart;
    params.expires_at = kStart + ttl;
    auto result = PairingSession::Create(std::move(params));
    REQUIRE(result.IsOk());
    return std::move(result).Unwrap();
}
}
TEST_CASE("SessionRegistry - Register", "[registry][session]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SessionRegistry registry(std::chrono::seconds(2));
    const auto token = SessionToken::Generate();
    SECTION("Empty session is refused") {
        auto result = registry.Register(nullptr);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PairingFailureType::InvalidState);
    }
    SECTION("Generations are unique and increasing") {
        auto first = registry.Register(MakeSession(token));
        auto second = registry.Register(MakeSession(SessionToken::Generate()));
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE(first.Unwrap() == 1);
        REQUIRE(second.Unwrap() == 2);
        REQUIRE(registry.Size() == 2);
        REQUIRE(registry.Get(token)->GetGeneration() == 1);
    }
    SECTION("Second live session with the same token is DuplicateToken") {
        REQUIRE(registry.Register(MakeSession(token)).IsOk());
        PairingSession* original = registry.Get(token);
        REQUIRE(original->TransitionTo(PairingState::Publishing, kStart).IsOk());
        auto result = registry.Register(MakeSession(token));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PairingFailureType::DuplicateToken);
        REQUIRE(registry.Size() == 1);
        REQUIRE(registry.Get(token) == original);
        REQUIRE(original->GetState() == PairingState::Publishing);
    }
    SECTION("Terminal session awaiting eviction is replaced") {
        REQUIRE(registry.Register(MakeSession(token)).IsOk());
        REQUIRE(registry.Cancel(token, kStart).IsOk());
        auto result = registry.Register(MakeSession(token));
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == 2);
        REQUIRE(registry.Size() == 1);
        REQUIRE(registry.Get(token)->GetState() == PairingState::Idle);
        REQUIRE(registry.FindByGeneration(token, 1) == nullptr);
        REQUIRE(registry.FindByGeneration(token, 2) != nullptr);
    }
}
TEST_CASE("SessionRegistry - Sweep", "[registry][session][expiry]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SessionRegistry registry(std::chrono::seconds(2));
    const auto short_lived = SessionToken::Generate();
    const auto long_lived = SessionToken::Generate();
    REQUIRE(registry.Register(MakeSession(short_lived, SessionRole::Issuer, PairingMethod::Code, std::chrono::seconds(30))).IsOk());
    REQUIRE(registry.Register(MakeSession(long_lived, SessionRole::Issuer, PairingMethod::Code, std::chrono::seconds(300))).IsOk());
    SECTION("Nothing happens before expiry") {
        auto report = registry.Sweep(kStart + std::chrono::seconds(30));
        REQUIRE(report.expired.empty());
        REQUIRE(report.evicted == 0);
    }
    SECTION("Expired sessions are marked then evicted after grace") {
        const auto past = kStart + std::chrono::seconds(31);
        auto report = registry.Sweep(past);
        REQUIRE(report.expired.size() == 1);
        REQUIRE(report.expired.front() == short_lived);
        REQUIRE(report.evicted == 0);
        PairingSession* expired = registry.Get(short_lived);
        REQUIRE(expired != nullptr);
        REQUIRE(expired->GetState() == PairingState::Expired);
        REQUIRE(expired->GetReason() == std::optional<PairingFailureType>(PairingFailureType::Expired));
        REQUIRE(registry.Get(long_lived)->GetState() == PairingState::Idle);

        report = registry.Sweep(past + std::chrono::seconds(2));
        REQUIRE(report.expired.empty());
        REQUIRE(report.evicted == 0);

        report = registry.Sweep(past + std::chrono::seconds(3));
        REQUIRE(report.evicted == 1);
        REQUIRE(registry.Get(short_lived) == nullptr);
        REQUIRE(registry.Size() == 1);
    }
    SECTION("Expiry notifies the state listener") {
        int notifications = 0;
        registry.Get(short_lived)->SetStateListener([&notifications](const PairingSession& session, PairingState) {
            REQUIRE(session.GetState() == PairingState::Expired);
            ++notifications;
        });
        (void)registry.Sweep(kStart + std::chrono::seconds(31));
        (void)registry.Sweep(kStart + std::chrono::seconds(32));
        REQUIRE(notifications == 1);
    }
}
TEST_CASE("SessionRegistry - Cancel", "[registry][session]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SessionRegistry registry(std::chrono::seconds(2));
    const auto token = SessionToken::Generate();
    SECTION("Unknown token is NotFound") {
        auto result = registry.Cancel(token, kStart);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PairingFailureType::NotFound);
    }
    SECTION("Cancel is terminal and not repeatable") {
        REQUIRE(registry.Register(MakeSession(token)).IsOk());
        REQUIRE(registry.Cancel(token, kStart).IsOk());
        PairingSession* session = registry.Get(token);
        REQUIRE(session->GetState() == PairingState::Cancelled);
        REQUIRE(session->GetReason() == std::optional<PairingFailureType>(PairingFailureType::Cancelled));
        auto again = registry.Cancel(token, kStart);
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == PairingFailureType::InvalidState);
    }
}
TEST_CASE("SessionRegistry - Lookups", "[registry][session]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SessionRegistry registry(std::chrono::seconds(2));
    const auto issuer_token = SessionToken::FromPrefix(230349344u);
    const auto consumer_token = SessionToken::FromPrefix(12345u);
    REQUIRE(registry.Register(MakeSession(issuer_token)).IsOk());
    REQUIRE(registry.Register(MakeSession(consumer_token, SessionRole::Consumer)).IsOk());
    SECTION("Issuer by prefix ignores consumers and terminal sessions") {
        REQUIRE(registry.FindIssuerByPrefix(230349344u) == registry.Get(issuer_token));
        REQUIRE(registry.FindIssuerByPrefix(12345u) == nullptr);
        REQUIRE(registry.FindIssuerByPrefix(7u) == nullptr);
        REQUIRE(registry.Cancel(issuer_token, kStart).IsOk());
        REQUIRE(registry.FindIssuerByPrefix(230349344u) == nullptr);
    }
    SECTION("By peer") {
        PeerInfo peer;
        peer.identifier = "remote";
        registry.Get(consumer_token)->SetPeer(peer);
        REQUIRE(registry.FindByPeer("remote") == registry.Get(consumer_token));
        REQUIRE(registry.FindByPeer("someone-else") == nullptr);
    }
    SECTION("Consumer awaiting a response, by channel") {
        test_helpers::LoopbackNetwork network;
        auto channel = network.Connect("local", "remote");
        auto other = network.Connect("local", "elsewhere");
        PairingSession* consumer = registry.Get(consumer_token);
        consumer->SetConnection(channel, connection::ConnectionTier::Direct);
        REQUIRE(consumer->TransitionTo(PairingState::Connecting, kStart).IsOk());
        REQUIRE(consumer->TransitionTo(PairingState::Handshaking, kStart).IsOk());
        REQUIRE(registry.FindAwaitingResponse(channel.get()) == nullptr);
        consumer->MarkRequestSent();
        REQUIRE(registry.FindAwaitingResponse(channel.get()) == consumer);
        REQUIRE(registry.FindAwaitingResponse(other.get()) == nullptr);
        REQUIRE(registry.FindAwaitingResponse(nullptr) == nullptr);
        REQUIRE(registry.Cancel(consumer_token, kStart).IsOk());
        REQUIRE(registry.FindAwaitingResponse(channel.get()) == nullptr);
    }
    SECTION("Tokens lists every session") {
        const auto tokens = registry.Tokens();
        REQUIRE(tokens.size() == 2);
    }
}
