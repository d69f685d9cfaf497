#include "pairlink/session/pairing_session.hpp"
#include "pairlink/crypto/sodium_interop.hpp"
#include "pairlink/core/constants.hpp"
#include "pairlink/core/logger.hpp"

#include <fmt/format.h>

namespace pairlink::session {
using crypto::SodiumInterop;

Result<std::unique_ptr<PairingSession>, PairingFailure> PairingSession::Create(SessionParams params) {
    if (params.expires_at <= params.created_at) {
        return Result<std::unique_ptr<PairingSession>, PairingFailure>::Err(
            PairingFailure::InvalidState("Session must expire after it is created"));
    }
    if (!params.token.HasValidPrefix()) {
        return Result<std::unique_ptr<PairingSession>, PairingFailure>::Err(
            PairingFailure::InvalidFormat("Session token prefix outside the code space"));
    }

    auto key_pair_result = SodiumInterop::GenerateX25519KeyPair("pairing session");
    if (key_pair_result.IsErr()) {
        return Result<std::unique_ptr<PairingSession>, PairingFailure>::Err(
            std::move(key_pair_result).UnwrapErr());
    }
    auto [secret_key, public_key] = std::move(key_pair_result).Unwrap();
    auto nonce = SodiumInterop::GetRandomBytes(kHandshakeNonceBytes);

    return Result<std::unique_ptr<PairingSession>, PairingFailure>::Ok(
        std::unique_ptr<PairingSession>(new PairingSession(
            std::move(params),
            std::move(secret_key),
            std::move(public_key),
            std::move(nonce))));
}

PairingSession::PairingSession(
    SessionParams params,
    crypto::SecureMemoryHandle session_secret_key,
    std::vector<uint8_t> session_public_key,
    std::vector<uint8_t> nonce)
    : token_(params.token)
    , role_(params.role)
    , method_(params.method)
    , created_at_(params.created_at)
    , expires_at_(params.expires_at)
    , code_(std::move(params.code))
    , session_secret_key_(std::move(session_secret_key))
    , session_public_key_(std::move(session_public_key))
    , nonce_(std::move(nonce)) {}

PairingSession::~PairingSession() {
    if (keys_.has_value()) {
        keys_->Wipe();
    }
}

Result<Unit, PairingFailure> PairingSession::TransitionTo(
    const PairingState next,
    const interfaces::TimePoint now,
    const std::optional<PairingFailureType> reason) {
    if (!IsTransitionAllowed(role_, state_, next)) {
        return Result<Unit, PairingFailure>::Err(PairingFailure::InvalidState(fmt::format(
            "{} session cannot move from {} to {}",
            RoleName(role_), StateName(state_), StateName(next))));
    }

    const PairingState previous = state_;
    state_ = next;
    if (IsTerminal(next)) {
        terminal_at_ = now;
        if (next != PairingState::Confirmed) {
            reason_ = reason;
        }
    }

    PAIRLINK_LOG_DEBUG("Session {} ({}) {} -> {}",
        token_.ShortTag(), RoleName(role_), StateName(previous), StateName(next));
    if (listener_) {
        listener_(*this, previous);
    }
    return Result<Unit, PairingFailure>::Ok(unit);
}

SessionSnapshot PairingSession::Snapshot() const {
    SessionSnapshot snapshot;
    snapshot.token = token_;
    snapshot.code = code_;
    snapshot.role = role_;
    snapshot.method = method_;
    snapshot.state = state_;
    if (peer_.has_value()) {
        snapshot.peer_identifier = peer_->identifier;
        if (!peer_->display_name.empty()) {
            snapshot.peer_display_name = peer_->display_name;
        }
    }
    snapshot.tier = tier_;
    snapshot.reason = reason_;
    snapshot.created_at = created_at_;
    snapshot.expires_at = expires_at_;
    return snapshot;
}

void PairingSession::SetConnection(
    std::shared_ptr<interfaces::IPeerChannel> channel,
    const std::optional<connection::ConnectionTier> tier) {
    channel_ = std::move(channel);
    tier_ = tier;
}

void PairingSession::SetKeys(protocol::PairingKeys keys) {
    if (keys_.has_value()) {
        keys_->Wipe();
    }
    keys_ = std::move(keys);
}

std::vector<uint8_t> PairingSession::TakePairingKey() {
    if (!keys_.has_value()) {
        return {};
    }
    std::vector<uint8_t> key = std::move(keys_->pairing_key);
    keys_->Wipe();
    keys_.reset();
    return key;
}

std::shared_ptr<interfaces::IPeerChannel> PairingSession::TakeChannel() {
    return std::move(channel_);
}

}
