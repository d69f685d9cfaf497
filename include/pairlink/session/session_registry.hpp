#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"
#include "pairlink/interfaces/i_clock.hpp"
#include "pairlink/session/pairing_session.hpp"
#include "pairlink/session/session_token.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pairlink::session {

struct SweepReport {
    std::vector<SessionToken> expired;
    size_t evicted = 0;
};

/**
 * @brief Owner of every live PairingSession, keyed by token
 *
 * Hands out a fresh generation number on each registration; completions
 * of asynchronous work carry (token, generation) and are dropped when the
 * pair no longer matches. Sweep() is the only place expiry is enforced.
 *
 * Lookups return borrowed pointers, valid until the next Register(),
 * Sweep() or destruction. Not thread-safe; owned by the event loop.
 */
class SessionRegistry {
public:
    explicit SessionRegistry(std::chrono::seconds terminal_grace);

    /**
     * @brief Take ownership of `session`
     *
     * A live session with the same token makes this fail with
     * DuplicateToken and leaves the existing one untouched. A terminal one
     * still waiting for eviction is replaced.
     */
    [[nodiscard]] Result<uint64_t, PairingFailure> Register(std::unique_ptr<PairingSession> session);

    /// Expires live sessions past expires_at, then evicts terminal ones
    /// whose grace period ran out.
    SweepReport Sweep(interfaces::TimePoint now);

    [[nodiscard]] Result<Unit, PairingFailure> Cancel(const SessionToken& token, interfaces::TimePoint now);

    [[nodiscard]] PairingSession* Get(const SessionToken& token) const;

    /// Live issuer session whose token starts with `prefix`.
    [[nodiscard]] PairingSession* FindIssuerByPrefix(uint32_t prefix) const;

    /// Live session whose peer is `peer_identifier`.
    [[nodiscard]] PairingSession* FindByPeer(const std::string& peer_identifier) const;

    /// Live consumer session that sent its request over `channel` and is
    /// waiting for the answer.
    [[nodiscard]] PairingSession* FindAwaitingResponse(const interfaces::IPeerChannel* channel) const;

    [[nodiscard]] PairingSession* FindByGeneration(const SessionToken& token, uint64_t generation) const;

    [[nodiscard]] size_t Size() const noexcept { return sessions_.size(); }

    [[nodiscard]] std::vector<SessionToken> Tokens() const;

private:
    std::chrono::seconds terminal_grace_;
    std::map<SessionToken, std::unique_ptr<PairingSession>> sessions_;
    uint64_t next_generation_ = 1;
};

}
