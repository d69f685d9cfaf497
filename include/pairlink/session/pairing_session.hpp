#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"
#include "pairlink/connection/connection_tier.hpp"
#include "pairlink/crypto/sodium_secure_memory_handle.hpp"
#include "pairlink/identity/device_identity.hpp"
#include "pairlink/interfaces/i_clock.hpp"
#include "pairlink/interfaces/i_transport.hpp"
#include "pairlink/protocol/handshake_codec.hpp"
#include "pairlink/session/pairing_state.hpp"
#include "pairlink/session/session_token.hpp"

#include "pairing/handshake.pb.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pairlink::session {

/// What is known about the other device. Filled from the rendezvous
/// record (consumer, code path), from the nearby announcement (consumer,
/// direct path) or from the inbound request (issuer).
struct PeerInfo {
    std::string identifier;
    std::string display_name;
    std::vector<uint8_t> public_key;
    std::vector<uint8_t> session_public_key;
    std::vector<std::string> addresses;
    identity::DeviceDescriptor device;
    /// End of the published record's lifetime, when there was one.
    std::optional<interfaces::TimePoint> record_expires_at;
};

struct SessionParams {
    SessionToken token;
    SessionRole role = SessionRole::Issuer;
    PairingMethod method = PairingMethod::Code;
    interfaces::TimePoint created_at;
    interfaces::TimePoint expires_at;
    std::optional<std::string> code;
};

/// Read-only copy of a session for the presentation layer.
struct SessionSnapshot {
    SessionToken token;
    std::optional<std::string> code;
    SessionRole role = SessionRole::Issuer;
    PairingMethod method = PairingMethod::Code;
    PairingState state = PairingState::Idle;
    std::optional<std::string> peer_identifier;
    std::optional<std::string> peer_display_name;
    std::optional<connection::ConnectionTier> tier;
    std::optional<PairingFailureType> reason;
    interfaces::TimePoint created_at;
    interfaces::TimePoint expires_at;
};

/**
 * @brief One pairing attempt and its state machine
 *
 * A session never changes state on its own: the service moves it with
 * TransitionTo() after the matching event, and the registry sweep moves it
 * to Expired. Every accepted transition calls the state listener exactly
 * once; a refused one returns InvalidState and changes nothing.
 *
 * The per-session X25519 key pair and the handshake nonce are generated at
 * creation. Key material is wiped when the session is destroyed.
 *
 * Not thread-safe; only the event loop touches sessions.
 */
class PairingSession {
public:
    using StateListener = std::function<void(const PairingSession& session, PairingState previous)>;

    [[nodiscard]] static Result<std::unique_ptr<PairingSession>, PairingFailure> Create(SessionParams params);

    /**
     * @brief Move to `next`
     *
     * `reason` is recorded for terminal states other than Confirmed and
     * ignored otherwise. Entering a terminal state stamps terminal_at.
     */
    [[nodiscard]] Result<Unit, PairingFailure> TransitionTo(
        PairingState next,
        interfaces::TimePoint now,
        std::optional<PairingFailureType> reason = std::nullopt);

    void SetStateListener(StateListener listener) { listener_ = std::move(listener); }

    [[nodiscard]] bool IsExpired(const interfaces::TimePoint now) const noexcept { return now > expires_at_; }
    [[nodiscard]] bool IsTerminalState() const noexcept { return IsTerminal(state_); }

    [[nodiscard]] SessionSnapshot Snapshot() const;

    [[nodiscard]] const SessionToken& GetToken() const noexcept { return token_; }
    [[nodiscard]] SessionRole GetRole() const noexcept { return role_; }
    [[nodiscard]] PairingMethod GetMethod() const noexcept { return method_; }
    [[nodiscard]] PairingState GetState() const noexcept { return state_; }
    [[nodiscard]] uint64_t GetGeneration() const noexcept { return generation_; }
    [[nodiscard]] interfaces::TimePoint GetCreatedAt() const noexcept { return created_at_; }
    [[nodiscard]] interfaces::TimePoint GetExpiresAt() const noexcept { return expires_at_; }
    [[nodiscard]] const std::optional<interfaces::TimePoint>& GetTerminalAt() const noexcept { return terminal_at_; }
    [[nodiscard]] const std::optional<PairingFailureType>& GetReason() const noexcept { return reason_; }
    [[nodiscard]] const std::optional<std::string>& GetCode() const noexcept { return code_; }

    [[nodiscard]] const std::vector<uint8_t>& GetNonce() const noexcept { return nonce_; }
    [[nodiscard]] const std::vector<uint8_t>& GetSessionPublicKey() const noexcept { return session_public_key_; }
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSessionSecretKey() const noexcept { return session_secret_key_; }

    [[nodiscard]] const std::optional<PeerInfo>& GetPeer() const noexcept { return peer_; }
    void SetPeer(PeerInfo peer) { peer_ = std::move(peer); }

    [[nodiscard]] const std::shared_ptr<interfaces::IPeerChannel>& GetChannel() const noexcept { return channel_; }
    [[nodiscard]] const std::optional<connection::ConnectionTier>& GetTier() const noexcept { return tier_; }
    void SetConnection(std::shared_ptr<interfaces::IPeerChannel> channel, std::optional<connection::ConnectionTier> tier);

    /// Issuer only: the verified request the local user is asked about.
    [[nodiscard]] const std::optional<proto::pairing::PairingRequest>& GetPendingRequest() const noexcept {
        return pending_request_;
    }
    void SetPendingRequest(proto::pairing::PairingRequest request) { pending_request_ = std::move(request); }

    /// Consumer only. A response that arrives before the request went out
    /// is dropped.
    [[nodiscard]] bool RequestSent() const noexcept { return request_sent_; }
    void MarkRequestSent() noexcept { request_sent_ = true; }

    [[nodiscard]] const std::optional<protocol::PairingKeys>& GetKeys() const noexcept { return keys_; }
    void SetKeys(protocol::PairingKeys keys);

    [[nodiscard]] bool PublishAttempted() const noexcept { return publish_attempted_; }
    [[nodiscard]] bool PublishInFlight() const noexcept { return publish_in_flight_; }
    void MarkPublishStarted() noexcept {
        publish_attempted_ = true;
        publish_in_flight_ = true;
    }
    void MarkPublishFinished() noexcept { publish_in_flight_ = false; }

    [[nodiscard]] bool Unpublished() const noexcept { return unpublished_; }
    void MarkUnpublished() noexcept { unpublished_ = true; }

    [[nodiscard]] bool OutcomeTaken() const noexcept { return outcome_taken_; }
    void MarkOutcomeTaken() noexcept { outcome_taken_ = true; }

    [[nodiscard]] uint32_t GetRetryAttempt() const noexcept { return retry_attempt_; }
    uint32_t NextRetryAttempt() noexcept { return retry_attempt_++; }
    void ResetRetryAttempt() noexcept { retry_attempt_ = 0; }

    /// Hands the pairing key and channel over; the session keeps neither.
    [[nodiscard]] std::vector<uint8_t> TakePairingKey();
    [[nodiscard]] std::shared_ptr<interfaces::IPeerChannel> TakeChannel();

    PairingSession(const PairingSession&) = delete;
    PairingSession& operator=(const PairingSession&) = delete;
    PairingSession(PairingSession&&) = delete;
    PairingSession& operator=(PairingSession&&) = delete;
    ~PairingSession();

private:
    friend class SessionRegistry;

    PairingSession(
        SessionParams params,
        crypto::SecureMemoryHandle session_secret_key,
        std::vector<uint8_t> session_public_key,
        std::vector<uint8_t> nonce);

    void AssignGeneration(const uint64_t generation) noexcept { generation_ = generation; }

    SessionToken token_;
    SessionRole role_;
    PairingMethod method_;
    PairingState state_ = PairingState::Idle;
    uint64_t generation_ = 0;
    interfaces::TimePoint created_at_;
    interfaces::TimePoint expires_at_;
    std::optional<interfaces::TimePoint> terminal_at_;
    std::optional<PairingFailureType> reason_;
    std::optional<std::string> code_;

    crypto::SecureMemoryHandle session_secret_key_;
    std::vector<uint8_t> session_public_key_;
    std::vector<uint8_t> nonce_;

    std::optional<PeerInfo> peer_;
    std::shared_ptr<interfaces::IPeerChannel> channel_;
    std::optional<connection::ConnectionTier> tier_;
    std::optional<proto::pairing::PairingRequest> pending_request_;
    std::optional<protocol::PairingKeys> keys_;

    bool request_sent_ = false;
    bool publish_attempted_ = false;
    bool publish_in_flight_ = false;
    bool unpublished_ = false;
    bool outcome_taken_ = false;
    uint32_t retry_attempt_ = 0;

    StateListener listener_;
};

}
