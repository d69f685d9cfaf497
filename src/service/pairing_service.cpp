#include "pairlink/service/pairing_service.hpp"
#include "pairlink/codec/share_code_codec.hpp"
#include "pairlink/protocol/handshake_codec.hpp"
#include "pairlink/core/constants.hpp"
#include "pairlink/core/logger.hpp"
#include "../codec/proto_mapping.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace pairlink::service {
using codec::ShareCodeCodec;
using codec::detail::AsBytes;
using codec::detail::ToVector;
using protocol::HandshakeCodec;
using session::PairingMethod;
using session::PairingSession;
using session::PairingState;
using session::SessionRole;
using session::SessionToken;

namespace {

constexpr auto kNonceCleanupInterval = std::chrono::minutes(1);
constexpr int kMaxTokenDraws = 8;

std::chrono::seconds RemainingSeconds(const interfaces::TimePoint now, const interfaces::TimePoint until) {
    const auto remaining = std::chrono::ceil<std::chrono::seconds>(until - now);
    return std::max(remaining, std::chrono::seconds(1));
}

}

PairingService::PairingService(PairingServiceDependencies dependencies)
    : identity_(dependencies.identity)
    , config_(dependencies.config)
    , loop_(dependencies.loop)
    , executor_(dependencies.executor)
    , clock_(dependencies.clock)
    , transport_(dependencies.transport)
    , observer_(dependencies.observer)
    , token_source_(dependencies.token_source ? std::move(dependencies.token_source) : TokenSource(&SessionToken::Generate))
    , device_(dependencies.device.has_value() ? std::move(*dependencies.device) : identity::DeviceDescriptor::Current())
    , directory_(dependencies.directory, dependencies.clock)
    , establisher_(dependencies.strategies.has_value()
          ? std::move(*dependencies.strategies)
          : connection::ConnectionEstablisher::DefaultStrategies(dependencies.transport, dependencies.config))
    , registry_(dependencies.config.TerminalGrace())
    , nonce_ledger_(dependencies.config.ReplayNonceLifetime(), kNonceCleanupInterval) {
}

Result<std::unique_ptr<PairingService>, PairingFailure> PairingService::Create(PairingServiceDependencies dependencies) {
    if (auto valid = dependencies.config.Validate(); valid.IsErr()) {
        PAIRLINK_LOG_ERROR("Refusing pairing configuration: {}", valid.UnwrapErr().message);
        return Result<std::unique_ptr<PairingService>, PairingFailure>::Err(std::move(valid).UnwrapErr());
    }
    auto service = std::unique_ptr<PairingService>(new PairingService(std::move(dependencies)));
    return Result<std::unique_ptr<PairingService>, PairingFailure>::Ok(std::move(service));
}

// ============================================================================
// Lifecycle
// ============================================================================

void PairingService::Start() {
    if (sweep_timer_.has_value()) {
        return;
    }
    PAIRLINK_LOG_INFO("Pairing service started for {}", identity_.GetPublicIdentifier());
    ScheduleSweep();
}

void PairingService::Stop() {
    if (sweep_timer_.has_value()) {
        loop_.CancelTimer(*sweep_timer_);
        sweep_timer_.reset();
    }
}

void PairingService::ScheduleSweep() {
    sweep_timer_ = loop_.PostDelayed(config_.SweepInterval(), [this] {
        const auto now = clock_.Now();
        (void)registry_.Sweep(now);
        nonce_ledger_.CleanupExpired(now);
        ScheduleSweep();
    });
}

// ============================================================================
// Commands
// ============================================================================

Result<ShareCodeInfo, PairingFailure> PairingService::GenerateCode(const std::chrono::seconds ttl) {
    const auto effective_ttl = config_.ClampCodeTtl(ttl);
    const auto now = clock_.Now();
    std::optional<SessionToken> drawn;
    for (int draw = 0; draw < kMaxTokenDraws && !drawn.has_value(); ++draw) {
        SessionToken candidate = token_source_();
        if (registry_.FindIssuerByPrefix(candidate.Prefix()) == nullptr) {
            drawn = candidate;
        }
    }
    if (!drawn.has_value()) {
        return Result<ShareCodeInfo, PairingFailure>::Err(
            PairingFailure::DuplicateToken("Every drawn code is already issued by this device"));
    }
    const SessionToken token = *drawn;

    auto code_result = ShareCodeCodec::Encode(token);
    if (code_result.IsErr()) {
        return Result<ShareCodeInfo, PairingFailure>::Err(std::move(code_result).UnwrapErr());
    }
    std::string code = std::move(code_result).Unwrap();

    session::SessionParams params;
    params.token = token;
    params.role = SessionRole::Issuer;
    params.method = PairingMethod::Code;
    params.created_at = now;
    params.expires_at = now + effective_ttl;
    params.code = code;

    auto session_result = CreateSession(std::move(params));
    if (session_result.IsErr()) {
        return Result<ShareCodeInfo, PairingFailure>::Err(std::move(session_result).UnwrapErr());
    }
    PairingSession& session = *session_result.Unwrap();

    PAIRLINK_LOG_INFO("Issued share code for session {}, ttl {}s", token.ShortTag(), effective_ttl.count());
    if (session.TransitionTo(PairingState::Publishing, now).IsOk()) {
        StartPublish(session);
    }

    ShareCodeInfo info;
    info.token = token;
    info.display_code = ShareCodeCodec::Display(code);
    info.code = std::move(code);
    info.created_at = now;
    info.expires_at = session.GetExpiresAt();
    return Result<ShareCodeInfo, PairingFailure>::Ok(std::move(info));
}

Result<SessionToken, PairingFailure> PairingService::EnterCode(std::string_view code) {
    auto prefix_result = ShareCodeCodec::Decode(code);
    if (prefix_result.IsErr()) {
        return Result<SessionToken, PairingFailure>::Err(std::move(prefix_result).UnwrapErr());
    }
    const uint32_t prefix = prefix_result.Unwrap();
    if (registry_.FindIssuerByPrefix(prefix) != nullptr) {
        return Result<SessionToken, PairingFailure>::Err(
            PairingFailure::InvalidState("Cannot pair with a code issued by this device"));
    }

    const auto now = clock_.Now();
    session::SessionParams params;
    params.token = SessionToken::FromPrefix(prefix);
    params.role = SessionRole::Consumer;
    params.method = PairingMethod::Code;
    params.created_at = now;
    params.expires_at = now + config_.ConsumerSessionTtl();
    params.code = ShareCodeCodec::Normalize(code);

    auto session_result = CreateSession(std::move(params));
    if (session_result.IsErr()) {
        return Result<SessionToken, PairingFailure>::Err(std::move(session_result).UnwrapErr());
    }
    PairingSession& session = *session_result.Unwrap();
    if (session.TransitionTo(PairingState::AwaitingPeer, now).IsOk()) {
        StartResolve(session);
    }
    return Result<SessionToken, PairingFailure>::Ok(session.GetToken());
}

Result<SessionToken, PairingFailure> PairingService::PairWithNearby(
    const std::string& peer_identifier,
    const std::vector<std::string>& addresses) {
    if (peer_identifier.empty() || peer_identifier == identity_.GetPublicIdentifier()) {
        return Result<SessionToken, PairingFailure>::Err(
            PairingFailure::InvalidState("Nearby peer identifier is empty or our own"));
    }
    if (registry_.FindByPeer(peer_identifier) != nullptr) {
        return Result<SessionToken, PairingFailure>::Err(
            PairingFailure::DuplicateToken("Already pairing with this device"));
    }

    const auto now = clock_.Now();
    session::SessionParams params;
    params.token = SessionToken::FromPrefix(token_source_().Prefix());
    params.role = SessionRole::Consumer;
    params.method = PairingMethod::Direct;
    params.created_at = now;
    params.expires_at = now + config_.ConsumerSessionTtl();

    auto session_result = CreateSession(std::move(params));
    if (session_result.IsErr()) {
        return Result<SessionToken, PairingFailure>::Err(std::move(session_result).UnwrapErr());
    }
    PairingSession& session = *session_result.Unwrap();

    session::PeerInfo peer;
    peer.identifier = peer_identifier;
    peer.addresses = addresses;
    session.SetPeer(std::move(peer));

    if (session.TransitionTo(PairingState::Connecting, now).IsOk()) {
        StartConnect(session);
    }
    return Result<SessionToken, PairingFailure>::Ok(session.GetToken());
}

Result<Unit, PairingFailure> PairingService::Confirm(const SessionToken& token) {
    PairingSession* session = registry_.Get(token);
    if (session == nullptr) {
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::NotFound(std::string(ErrorMessages::UNKNOWN_SESSION)));
    }
    const auto now = clock_.Now();

    if (session->GetRole() == SessionRole::Consumer) {
        if (session->GetState() != PairingState::AwaitingLocalConfirmation) {
            return Result<Unit, PairingFailure>::Err(PairingFailure::InvalidState(fmt::format(
                "Nothing to confirm in state {}", session::StateName(session->GetState()))));
        }
        if (session->IsExpired(now)) {
            return Result<Unit, PairingFailure>::Err(PairingFailure::Expired("Session expired"));
        }
        PAIRLINK_TRY_UNIT(session->TransitionTo(PairingState::Handshaking, now));
        SendRequest(*session);
        return Result<Unit, PairingFailure>::Ok(unit);
    }

    const auto& request = session->GetPendingRequest();
    if (session->GetState() != PairingState::Handshaking || !request.has_value() || !session->GetKeys().has_value()) {
        return Result<Unit, PairingFailure>::Err(PairingFailure::InvalidState(fmt::format(
            "Nothing to confirm in state {}", session::StateName(session->GetState()))));
    }
    if (session->IsExpired(now) || now > interfaces::FromUnixMillis(request->session_expires_at_ms())) {
        return Result<Unit, PairingFailure>::Err(PairingFailure::Expired("Session expired"));
    }

    auto confirmation = HandshakeCodec::ComputeKeyConfirmation(
        session->GetKeys()->confirmation_key,
        request->token_prefix(),
        AsBytes(request->nonce()),
        session->GetSessionPublicKey());
    if (confirmation.IsErr()) {
        Fail(*session, confirmation.UnwrapErr().type);
        return Result<Unit, PairingFailure>::Err(std::move(confirmation).UnwrapErr());
    }
    auto response = HandshakeCodec::BuildResponse(
        identity_, *request, true, session->GetSessionPublicKey(), confirmation.Unwrap(), device_);
    if (response.IsErr()) {
        Fail(*session, response.UnwrapErr().type);
        return Result<Unit, PairingFailure>::Err(std::move(response).UnwrapErr());
    }

    const auto& channel = session->GetChannel();
    auto sent = channel ? SendResponse(*channel, response.Unwrap())
                        : Result<Unit, PairingFailure>::Err(PairingFailure::Unreachable("No channel to peer"));
    if (sent.IsErr()) {
        PAIRLINK_LOG_WARN("Session {}: accepting response not delivered: {}",
            token.ShortTag(), sent.UnwrapErr().message);
        Fail(*session, PairingFailureType::Unreachable);
        return Result<Unit, PairingFailure>::Err(PairingFailure::Unreachable("Could not deliver response"));
    }
    return session->TransitionTo(PairingState::Confirmed, now);
}

Result<Unit, PairingFailure> PairingService::Reject(const SessionToken& token) {
    PairingSession* session = registry_.Get(token);
    if (session == nullptr) {
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::NotFound(std::string(ErrorMessages::UNKNOWN_SESSION)));
    }
    const auto now = clock_.Now();

    if (session->GetRole() == SessionRole::Issuer && session->GetState() == PairingState::Handshaking) {
        const auto& request = session->GetPendingRequest();
        if (request.has_value() && session->GetChannel()) {
            SendRejection(*session->GetChannel(), *request);
        }
        return session->TransitionTo(PairingState::Rejected, now, PairingFailureType::RejectedLocally);
    }
    if (session->GetRole() == SessionRole::Consumer && session->GetState() == PairingState::AwaitingLocalConfirmation) {
        return session->TransitionTo(PairingState::Rejected, now, PairingFailureType::RejectedLocally);
    }
    return Result<Unit, PairingFailure>::Err(PairingFailure::InvalidState(fmt::format(
        "Nothing to reject in state {}", session::StateName(session->GetState()))));
}

Result<Unit, PairingFailure> PairingService::Cancel(const SessionToken& token) {
    return registry_.Cancel(token, clock_.Now());
}

std::optional<session::SessionSnapshot> PairingService::GetSession(const SessionToken& token) const {
    const PairingSession* session = registry_.Get(token);
    if (session == nullptr) {
        return std::nullopt;
    }
    return session->Snapshot();
}

Result<PairingOutcome, PairingFailure> PairingService::TakeOutcome(const SessionToken& token) {
    PairingSession* session = registry_.Get(token);
    if (session == nullptr) {
        return Result<PairingOutcome, PairingFailure>::Err(
            PairingFailure::NotFound(std::string(ErrorMessages::UNKNOWN_SESSION)));
    }
    if (session->GetState() != PairingState::Confirmed || !session->GetPeer().has_value()) {
        return Result<PairingOutcome, PairingFailure>::Err(
            PairingFailure::InvalidState("Session is not confirmed"));
    }
    if (session->OutcomeTaken()) {
        return Result<PairingOutcome, PairingFailure>::Err(
            PairingFailure::InvalidState("Outcome already taken"));
    }

    const auto& peer = *session->GetPeer();
    PairingOutcome outcome;
    outcome.peer_identifier = peer.identifier;
    outcome.peer_display_name = peer.display_name;
    outcome.peer_public_key = peer.public_key;
    outcome.peer_device = peer.device;
    outcome.tier = session->GetTier();
    outcome.channel = session->TakeChannel();
    outcome.shared_key = session->TakePairingKey();
    session->MarkOutcomeTaken();
    return Result<PairingOutcome, PairingFailure>::Ok(std::move(outcome));
}

void PairingService::OnInboundMessage(std::shared_ptr<interfaces::IPeerChannel> channel, std::vector<uint8_t> bytes) {
    loop_.Post([this, channel = std::move(channel), bytes = std::move(bytes)] {
        HandleInbound(channel, bytes);
    });
}

// ============================================================================
// Session bookkeeping
// ============================================================================

Result<PairingSession*, PairingFailure> PairingService::CreateSession(session::SessionParams params) {
    auto created = PairingSession::Create(std::move(params));
    if (created.IsErr()) {
        return Result<PairingSession*, PairingFailure>::Err(std::move(created).UnwrapErr());
    }
    auto owned = std::move(created).Unwrap();
    PairingSession* session = owned.get();
    session->SetStateListener([this](const PairingSession& changed, const PairingState previous) {
        OnStateChanged(changed, previous);
    });
    auto registered = registry_.Register(std::move(owned));
    if (registered.IsErr()) {
        return Result<PairingSession*, PairingFailure>::Err(std::move(registered).UnwrapErr());
    }
    return Result<PairingSession*, PairingFailure>::Ok(session);
}

void PairingService::OnStateChanged(const PairingSession& session, const PairingState previous) {
    const auto snapshot = session.Snapshot();
    interfaces::SessionStateChange change;
    change.token = snapshot.token;
    change.code = snapshot.code;
    change.role = snapshot.role;
    change.method = snapshot.method;
    change.previous_state = previous;
    change.state = snapshot.state;
    change.peer_identifier = snapshot.peer_identifier;
    change.peer_display_name = snapshot.peer_display_name;
    change.tier = snapshot.tier;
    change.reason = snapshot.reason;
    if (snapshot.reason.has_value()) {
        change.user_message = std::string(UserFacingMessage(*snapshot.reason));
        PAIRLINK_LOG_WARN("Session {} ended {} ({})",
            snapshot.token.ShortTag(), session::StateName(snapshot.state), FailureTypeName(*snapshot.reason));
    }

    if (session::IsTerminal(snapshot.state)) {
        // The listener only sees a const session; the registry owns it.
        if (PairingSession* owned = registry_.Get(snapshot.token); owned == &session) {
            MaybeUnpublish(*owned);
        }
    }

    if (observer_ != nullptr) {
        loop_.Post([this, change = std::move(change)] {
            observer_->OnSessionStateChanged(change);
        });
    }
}

void PairingService::Finish(
    PairingSession& session,
    const PairingState terminal,
    const std::optional<PairingFailureType> reason) {
    auto moved = session.TransitionTo(terminal, clock_.Now(), reason);
    if (moved.IsErr()) {
        PAIRLINK_LOG_DEBUG("Session {}: {}", session.GetToken().ShortTag(), moved.UnwrapErr().message);
    }
}

void PairingService::Fail(PairingSession& session, const PairingFailureType reason) {
    Finish(session, PairingState::Failed, reason);
}

void PairingService::ScheduleRetry(
    PairingSession& session,
    const PairingState expected,
    std::function<void(PairingSession&)> action) {
    const auto delay = config_.RetryBackoff(session.NextRetryAttempt());
    if (clock_.Now() + delay > session.GetExpiresAt()) {
        PAIRLINK_LOG_DEBUG("Session {}: no retry before expiry", session.GetToken().ShortTag());
        return;
    }
    const Token token = session.GetToken();
    const uint64_t generation = session.GetGeneration();
    loop_.PostDelayed(delay, [this, token, generation, expected, action = std::move(action)] {
        PairingSession* current = registry_.FindByGeneration(token, generation);
        if (current != nullptr && current->GetState() == expected) {
            action(*current);
        }
    });
}

// ============================================================================
// Issuer: publish / unpublish
// ============================================================================

void PairingService::StartPublish(PairingSession& session) {
    const auto now = clock_.Now();
    const Token token = session.GetToken();
    const uint64_t generation = session.GetGeneration();
    const auto key = directory::RendezvousDirectory::KeyFor(token.Prefix());

    directory::RendezvousRecord record;
    record.session_token_hash.assign(key.begin(), key.end());
    record.publisher_identifier = identity_.GetPublicIdentifier();
    record.publisher_public_key = identity_.GetPublicKey();
    record.publisher_display_name = identity_.GetDisplayName();
    record.reachable_addresses = transport_.ListenAddresses();
    record.session_public_key = session.GetSessionPublicKey();
    record.device = device_;
    record.created_at = now;
    record.ttl = RemainingSeconds(now, session.GetExpiresAt());

    session.MarkPublishStarted();
    const auto timeout = config_.PublishTimeout();
    executor_.Submit([this, token, generation, key, record = std::move(record), timeout] {
        auto result = directory_.Publish(key, record, record.ttl, timeout);
        loop_.Post([this, token, generation, result = std::move(result)] {
            OnPublishCompleted(token, generation, result);
        });
    });
}

void PairingService::OnPublishCompleted(
    const Token& token,
    const uint64_t generation,
    Result<Unit, PairingFailure> result) {
    PairingSession* session = registry_.FindByGeneration(token, generation);
    if (session == nullptr) {
        return;
    }
    session->MarkPublishFinished();
    if (session->IsTerminalState()) {
        MaybeUnpublish(*session);
        return;
    }

    const PairingState state = session->GetState();
    if (state != PairingState::Publishing && state != PairingState::AwaitingPeer) {
        // A peer arrived while a republish was in flight.
        return;
    }

    if (result.IsOk()) {
        session->ResetRetryAttempt();
        if (state == PairingState::Publishing) {
            if (session->TransitionTo(PairingState::AwaitingPeer, clock_.Now()).IsErr()) {
                return;
            }
        }
        ScheduleRepublish(*session);
        return;
    }

    const auto& failure = result.UnwrapErr();
    if (failure.type == PairingFailureType::DuplicateToken) {
        Fail(*session, PairingFailureType::DuplicateToken);
        return;
    }
    if (failure.IsTransient()) {
        PAIRLINK_LOG_WARN("Session {}: publish failed, retrying: {}", token.ShortTag(), failure.message);
        ScheduleRetry(*session, state, [this](PairingSession& current) { StartPublish(current); });
        return;
    }
    Fail(*session, failure.type);
}

void PairingService::ScheduleRepublish(PairingSession& session) {
    const Token token = session.GetToken();
    const uint64_t generation = session.GetGeneration();
    const auto ttl = std::chrono::ceil<std::chrono::seconds>(session.GetExpiresAt() - session.GetCreatedAt());
    loop_.PostDelayed(config_.RepublishInterval(ttl), [this, token, generation] {
        PairingSession* session = registry_.FindByGeneration(token, generation);
        if (session != nullptr && session->GetState() == PairingState::AwaitingPeer && !session->PublishInFlight()) {
            StartPublish(*session);
        }
    });
}

void PairingService::MaybeUnpublish(PairingSession& session) {
    if (session.GetRole() != SessionRole::Issuer ||
        !session.PublishAttempted() ||
        session.PublishInFlight() ||
        session.Unpublished() ||
        session.GetReason() == PairingFailureType::DuplicateToken) {
        return;
    }
    session.MarkUnpublished();
    const auto key = directory::RendezvousDirectory::KeyFor(session.GetToken().Prefix());
    PAIRLINK_LOG_DEBUG("Session {}: unpublishing", session.GetToken().ShortTag());
    executor_.Submit([this, key] {
        directory_.Unpublish(key);
    });
}

// ============================================================================
// Consumer: resolve / connect / request
// ============================================================================

void PairingService::StartResolve(PairingSession& session) {
    const Token token = session.GetToken();
    const uint64_t generation = session.GetGeneration();
    const auto key = directory::RendezvousDirectory::KeyFor(token.Prefix());
    const auto timeout = config_.ResolveTimeout();
    executor_.Submit([this, token, generation, key, timeout] {
        auto result = directory_.Resolve(key, timeout);
        loop_.Post([this, token, generation, result = std::move(result)] {
            OnResolveCompleted(token, generation, result);
        });
    });
}

void PairingService::OnResolveCompleted(
    const Token& token,
    const uint64_t generation,
    Result<directory::RendezvousRecord, PairingFailure> result) {
    PairingSession* session = registry_.FindByGeneration(token, generation);
    if (session == nullptr || session->GetState() != PairingState::AwaitingPeer) {
        return;
    }

    if (result.IsErr()) {
        const auto& failure = result.UnwrapErr();
        if (failure.IsTransient()) {
            PAIRLINK_LOG_WARN("Session {}: resolve failed, retrying: {}", token.ShortTag(), failure.message);
            ScheduleRetry(*session, PairingState::AwaitingPeer, [this](PairingSession& current) { StartResolve(current); });
            return;
        }
        Fail(*session, failure.type);
        return;
    }

    auto record = std::move(result).Unwrap();
    if (record.publisher_identifier == identity_.GetPublicIdentifier()) {
        Fail(*session, PairingFailureType::NotFound);
        return;
    }

    session::PeerInfo peer;
    peer.identifier = record.publisher_identifier;
    peer.display_name = record.publisher_display_name;
    peer.public_key = std::move(record.publisher_public_key);
    peer.session_public_key = std::move(record.session_public_key);
    peer.addresses = std::move(record.reachable_addresses);
    peer.device = std::move(record.device);
    peer.record_expires_at = record.ExpiresAt();
    session->SetPeer(std::move(peer));
    session->ResetRetryAttempt();

    if (session->TransitionTo(PairingState::Connecting, clock_.Now()).IsOk()) {
        StartConnect(*session);
    }
}

void PairingService::StartConnect(PairingSession& session) {
    const Token token = session.GetToken();
    const uint64_t generation = session.GetGeneration();
    const auto& peer = *session.GetPeer();
    executor_.Submit([this, token, generation, identifier = peer.identifier, addresses = peer.addresses] {
        auto result = establisher_.Connect(identifier, addresses);
        loop_.Post([this, token, generation, result = std::move(result)] {
            OnConnectCompleted(token, generation, result);
        });
    });
}

void PairingService::OnConnectCompleted(
    const Token& token,
    const uint64_t generation,
    Result<connection::ConnectionHandle, PairingFailure> result) {
    PairingSession* session = registry_.FindByGeneration(token, generation);
    if (session == nullptr || session->GetState() != PairingState::Connecting) {
        return;
    }
    if (result.IsErr()) {
        Fail(*session, PairingFailureType::Unreachable);
        return;
    }

    auto handle = std::move(result).Unwrap();
    PAIRLINK_LOG_INFO("Session {}: connected over {}", token.ShortTag(), connection::TierName(handle.tier));
    session->SetConnection(std::move(handle.channel), handle.tier);

    const auto now = clock_.Now();
    if (config_.RequireConsumerConfirmation()) {
        (void)session->TransitionTo(PairingState::AwaitingLocalConfirmation, now);
        return;
    }
    if (session->TransitionTo(PairingState::Handshaking, now).IsOk()) {
        SendRequest(*session);
    }
}

void PairingService::SendRequest(PairingSession& session) {
    auto expires_at = session.GetExpiresAt();
    const auto& peer = session.GetPeer();
    if (peer.has_value() && peer->record_expires_at.has_value()) {
        expires_at = std::min(expires_at, *peer->record_expires_at);
    }

    auto request = HandshakeCodec::BuildRequest(
        identity_,
        session.GetToken().Prefix(),
        session.GetNonce(),
        session.GetSessionPublicKey(),
        session.GetMethod(),
        clock_.Now(),
        expires_at,
        device_);
    if (request.IsErr()) {
        Fail(session, request.UnwrapErr().type);
        return;
    }
    auto bytes = HandshakeCodec::Encode(request.Unwrap());
    if (bytes.IsErr()) {
        Fail(session, bytes.UnwrapErr().type);
        return;
    }
    const auto& channel = session.GetChannel();
    if (!channel || channel->Send(bytes.Unwrap()).IsErr()) {
        Fail(session, PairingFailureType::Unreachable);
        return;
    }
    session.MarkRequestSent();
}

// ============================================================================
// Inbound handshake traffic
// ============================================================================

void PairingService::HandleInbound(
    const std::shared_ptr<interfaces::IPeerChannel>& channel,
    std::span<const uint8_t> bytes) {
    if (!channel) {
        return;
    }
    auto envelope = HandshakeCodec::Decode(bytes);
    if (envelope.IsErr()) {
        PAIRLINK_LOG_WARN("Dropping undecodable pairing message: {}", envelope.UnwrapErr().message);
        return;
    }
    const auto& message = envelope.Unwrap();
    if (message.has_request()) {
        HandleRequest(channel, message.request());
    } else {
        HandleResponse(channel, message.response());
    }
}

void PairingService::HandleRequest(
    const std::shared_ptr<interfaces::IPeerChannel>& channel,
    const proto::pairing::PairingRequest& request) {
    if (HandshakeCodec::FromProto(request.method()) == PairingMethod::Direct) {
        HandleDirectRequest(channel, request);
        return;
    }

    PairingSession* session = registry_.FindIssuerByPrefix(request.token_prefix());
    if (session == nullptr ||
        (session->GetState() != PairingState::AwaitingPeer && session->GetState() != PairingState::Publishing)) {
        PAIRLINK_LOG_DEBUG("Pairing request for unknown or busy code");
        SendRejection(*channel, request);
        return;
    }

    const auto now = clock_.Now();
    auto accepted = AcceptRequest(*session, channel, request);
    if (accepted.IsErr()) {
        PAIRLINK_LOG_WARN("Session {}: request refused ({})",
            session->GetToken().ShortTag(), accepted.UnwrapErr().message);
        SendRejection(*channel, request);
        const bool expired = session->IsExpired(now) ||
            now > interfaces::FromUnixMillis(request.session_expires_at_ms());
        Finish(*session, PairingState::Rejected,
            expired ? PairingFailureType::Expired : PairingFailureType::InvalidHandshake);
        return;
    }
    if (auto moved = session->TransitionTo(PairingState::Handshaking, now); moved.IsErr()) {
        PAIRLINK_LOG_WARN("Session {}: {}", session->GetToken().ShortTag(), moved.UnwrapErr().message);
        SendRejection(*channel, request);
        Fail(*session, PairingFailureType::InvalidHandshake);
    }
}

void PairingService::HandleDirectRequest(
    const std::shared_ptr<interfaces::IPeerChannel>& channel,
    const proto::pairing::PairingRequest& request) {
    if (registry_.FindByPeer(request.initiator_identifier()) != nullptr) {
        PAIRLINK_LOG_DEBUG("Nearby request from a peer already pairing");
        SendRejection(*channel, request);
        return;
    }

    const auto now = clock_.Now();
    session::SessionParams params;
    params.token = SessionToken::FromPrefix(request.token_prefix());
    params.role = SessionRole::Issuer;
    params.method = PairingMethod::Direct;
    params.created_at = now;
    params.expires_at = std::min(
        now + config_.CodeTtl(),
        interfaces::FromUnixMillis(request.session_expires_at_ms()));
    if (params.expires_at <= now || !params.token.HasValidPrefix()) {
        SendRejection(*channel, request);
        return;
    }

    auto session_result = CreateSession(std::move(params));
    if (session_result.IsErr()) {
        PAIRLINK_LOG_WARN("Nearby request refused: {}", session_result.UnwrapErr().message);
        SendRejection(*channel, request);
        return;
    }
    PairingSession& session = *session_result.Unwrap();

    auto accepted = AcceptRequest(session, channel, request);
    if (accepted.IsErr()) {
        PAIRLINK_LOG_WARN("Session {}: nearby request refused ({})",
            session.GetToken().ShortTag(), accepted.UnwrapErr().message);
        SendRejection(*channel, request);
        Fail(session, PairingFailureType::InvalidHandshake);
        return;
    }
    if (auto moved = session.TransitionTo(PairingState::Handshaking, now); moved.IsErr()) {
        PAIRLINK_LOG_WARN("Session {}: {}", session.GetToken().ShortTag(), moved.UnwrapErr().message);
        SendRejection(*channel, request);
        Fail(session, PairingFailureType::InvalidHandshake);
    }
}

Result<Unit, PairingFailure> PairingService::AcceptRequest(
    PairingSession& session,
    const std::shared_ptr<interfaces::IPeerChannel>& channel,
    const proto::pairing::PairingRequest& request) {
    const auto now = clock_.Now();
    PAIRLINK_TRY_UNIT(HandshakeCodec::VerifyRequest(request, now, session.GetExpiresAt(), config_.MaxClockSkew()));
    if (request.initiator_identifier() == identity_.GetPublicIdentifier()) {
        return Result<Unit, PairingFailure>::Err(PairingFailure::InvalidHandshake("request from ourselves"));
    }
    PAIRLINK_TRY_UNIT(nonce_ledger_.CheckAndRecord(AsBytes(request.nonce()), now));

    auto keys = HandshakeCodec::DeriveKeys(
        session.GetSessionSecretKey(),
        AsBytes(request.initiator_session_public_key()),
        AsBytes(request.nonce()));
    if (keys.IsErr()) {
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::InvalidHandshake(keys.UnwrapErr().message));
    }
    session.SetKeys(std::move(keys).Unwrap());

    session::PeerInfo peer;
    peer.identifier = request.initiator_identifier();
    peer.display_name = request.initiator_display_name();
    peer.public_key = ToVector(request.initiator_public_key());
    peer.session_public_key = ToVector(request.initiator_session_public_key());
    peer.device = codec::detail::FromProto(request.device());
    session.SetPeer(std::move(peer));
    session.SetConnection(channel, std::nullopt);
    session.SetPendingRequest(request);
    return Result<Unit, PairingFailure>::Ok(unit);
}

void PairingService::HandleResponse(
    const std::shared_ptr<interfaces::IPeerChannel>& channel,
    const proto::pairing::PairingResponse& response) {
    // Matched by channel; a token mismatch on the right channel rejects
    // the session in VerifyResponse below.
    PairingSession* session = registry_.FindAwaitingResponse(channel.get());
    if (session == nullptr) {
        PAIRLINK_LOG_DEBUG("Dropping unexpected pairing response");
        return;
    }

    const auto& peer = *session->GetPeer();
    protocol::ResponseExpectation expected;
    expected.token_prefix = session->GetToken().Prefix();
    expected.nonce = session->GetNonce();
    expected.responder_identifier = peer.identifier;
    expected.responder_public_key = peer.public_key;
    expected.responder_session_public_key = peer.session_public_key;

    const auto now = clock_.Now();
    if (auto verified = HandshakeCodec::VerifyResponse(response, expected); verified.IsErr()) {
        PAIRLINK_LOG_WARN("Session {}: response refused ({})",
            session->GetToken().ShortTag(), verified.UnwrapErr().message);
        Finish(*session, PairingState::Rejected, PairingFailureType::InvalidHandshake);
        return;
    }
    if (!response.accepted()) {
        Finish(*session, PairingState::Rejected, PairingFailureType::RejectedByPeer);
        return;
    }
    if (session->IsExpired(now)) {
        Finish(*session, PairingState::Rejected, PairingFailureType::Expired);
        return;
    }

    auto keys = HandshakeCodec::DeriveKeys(
        session->GetSessionSecretKey(),
        AsBytes(response.responder_session_public_key()),
        session->GetNonce());
    if (keys.IsErr() || HandshakeCodec::VerifyKeyConfirmation(keys.Unwrap(), response).IsErr()) {
        if (keys.IsOk()) {
            keys.Unwrap().Wipe();
        }
        PAIRLINK_LOG_WARN("Session {}: key confirmation failed", session->GetToken().ShortTag());
        Finish(*session, PairingState::Rejected, PairingFailureType::InvalidHandshake);
        return;
    }
    session->SetKeys(std::move(keys).Unwrap());

    session::PeerInfo confirmed = peer;
    confirmed.display_name = response.responder_display_name();
    confirmed.public_key = ToVector(response.responder_public_key());
    confirmed.session_public_key = ToVector(response.responder_session_public_key());
    confirmed.device = codec::detail::FromProto(response.device());
    session->SetPeer(std::move(confirmed));

    (void)session->TransitionTo(PairingState::Confirmed, now);
}

void PairingService::SendRejection(interfaces::IPeerChannel& channel, const proto::pairing::PairingRequest& request) {
    auto response = HandshakeCodec::BuildResponse(identity_, request, false, {}, {}, device_);
    if (response.IsErr()) {
        PAIRLINK_LOG_WARN("Could not build rejection: {}", response.UnwrapErr().message);
        return;
    }
    if (auto sent = SendResponse(channel, response.Unwrap()); sent.IsErr()) {
        PAIRLINK_LOG_WARN("Could not deliver rejection: {}", sent.UnwrapErr().message);
    }
}

Result<Unit, PairingFailure> PairingService::SendResponse(
    interfaces::IPeerChannel& channel,
    const proto::pairing::PairingResponse& response) {
    auto bytes = HandshakeCodec::Encode(response);
    if (bytes.IsErr()) {
        return Result<Unit, PairingFailure>::Err(std::move(bytes).UnwrapErr());
    }
    return channel.Send(bytes.Unwrap());
}

}
