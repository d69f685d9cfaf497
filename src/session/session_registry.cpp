#include "pairlink/session/session_registry.hpp"
#include "pairlink/core/logger.hpp"

namespace pairlink::session {

SessionRegistry::SessionRegistry(const std::chrono::seconds terminal_grace)
    : terminal_grace_(terminal_grace) {}

Result<uint64_t, PairingFailure> SessionRegistry::Register(std::unique_ptr<PairingSession> session) {
    if (!session) {
        return Result<uint64_t, PairingFailure>::Err(
            PairingFailure::InvalidState("Cannot register an empty session"));
    }
    const SessionToken token = session->GetToken();
    if (auto it = sessions_.find(token); it != sessions_.end()) {
        if (!it->second->IsTerminalState()) {
            PAIRLINK_LOG_WARN("Refusing second session for token {}", token.ShortTag());
            return Result<uint64_t, PairingFailure>::Err(
                PairingFailure::DuplicateToken("A live session already uses this token"));
        }
        sessions_.erase(it);
    }

    const uint64_t generation = next_generation_++;
    session->AssignGeneration(generation);
    sessions_.emplace(token, std::move(session));
    return Result<uint64_t, PairingFailure>::Ok(generation);
}

SweepReport SessionRegistry::Sweep(const interfaces::TimePoint now) {
    SweepReport report;
    for (auto& [token, session] : sessions_) {
        if (session->IsTerminalState() || !session->IsExpired(now)) {
            continue;
        }
        if (session->TransitionTo(PairingState::Expired, now, PairingFailureType::Expired).IsOk()) {
            report.expired.push_back(token);
        }
    }

    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto& terminal_at = it->second->GetTerminalAt();
        if (terminal_at.has_value() && now > *terminal_at + terminal_grace_) {
            it = sessions_.erase(it);
            ++report.evicted;
        } else {
            ++it;
        }
    }

    if (!report.expired.empty() || report.evicted > 0) {
        PAIRLINK_LOG_DEBUG("Sweep expired {} and evicted {} sessions, {} remain",
            report.expired.size(), report.evicted, sessions_.size());
    }
    return report;
}

Result<Unit, PairingFailure> SessionRegistry::Cancel(const SessionToken& token, const interfaces::TimePoint now) {
    PairingSession* session = Get(token);
    if (session == nullptr) {
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::NotFound(std::string(ErrorMessages::UNKNOWN_SESSION)));
    }
    return session->TransitionTo(PairingState::Cancelled, now, PairingFailureType::Cancelled);
}

PairingSession* SessionRegistry::Get(const SessionToken& token) const {
    const auto it = sessions_.find(token);
    return it == sessions_.end() ? nullptr : it->second.get();
}

PairingSession* SessionRegistry::FindIssuerByPrefix(const uint32_t prefix) const {
    for (const auto& [token, session] : sessions_) {
        if (session->GetRole() == SessionRole::Issuer &&
            session->GetMethod() == PairingMethod::Code &&
            token.Prefix() == prefix &&
            !session->IsTerminalState()) {
            return session.get();
        }
    }
    return nullptr;
}

PairingSession* SessionRegistry::FindByPeer(const std::string& peer_identifier) const {
    for (const auto& [token, session] : sessions_) {
        const auto& peer = session->GetPeer();
        if (peer.has_value() && peer->identifier == peer_identifier && !session->IsTerminalState()) {
            return session.get();
        }
    }
    return nullptr;
}

PairingSession* SessionRegistry::FindAwaitingResponse(const interfaces::IPeerChannel* channel) const {
    if (channel == nullptr) {
        return nullptr;
    }
    for (const auto& [token, session] : sessions_) {
        if (session->GetRole() == SessionRole::Consumer &&
            session->GetState() == PairingState::Handshaking &&
            session->RequestSent() &&
            session->GetChannel().get() == channel) {
            return session.get();
        }
    }
    return nullptr;
}

PairingSession* SessionRegistry::FindByGeneration(const SessionToken& token, const uint64_t generation) const {
    PairingSession* session = Get(token);
    if (session == nullptr || session->GetGeneration() != generation) {
        return nullptr;
    }
    return session;
}

std::vector<SessionToken> SessionRegistry::Tokens() const {
    std::vector<SessionToken> tokens;
    tokens.reserve(sessions_.size());
    for (const auto& [token, session] : sessions_) {
        tokens.push_back(token);
    }
    return tokens;
}

}
