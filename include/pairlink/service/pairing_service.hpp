#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"
#include "pairlink/configuration/pairing_config.hpp"
#include "pairlink/connection/connection_establisher.hpp"
#include "pairlink/directory/rendezvous_directory.hpp"
#include "pairlink/identity/device_identity.hpp"
#include "pairlink/interfaces/i_clock.hpp"
#include "pairlink/interfaces/i_key_value_directory.hpp"
#include "pairlink/interfaces/i_pairing_observer.hpp"
#include "pairlink/interfaces/i_task_executor.hpp"
#include "pairlink/interfaces/i_transport.hpp"
#include "pairlink/runtime/event_loop.hpp"
#include "pairlink/security/nonce_ledger.hpp"
#include "pairlink/session/pairing_session.hpp"
#include "pairlink/session/session_registry.hpp"
#include "pairlink/session/session_token.hpp"

#include "pairing/handshake.pb.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pairlink::service {

/// What the issuing user is shown after GenerateCode().
struct ShareCodeInfo {
    session::SessionToken token;
    std::string code;
    std::string display_code;
    interfaces::TimePoint created_at;
    interfaces::TimePoint expires_at;
};

/// Everything the transfer layer needs from a Confirmed session. `tier` is
/// empty on the issuer side, which did not dial.
struct PairingOutcome {
    std::string peer_identifier;
    std::string peer_display_name;
    std::vector<uint8_t> peer_public_key;
    identity::DeviceDescriptor peer_device;
    std::optional<connection::ConnectionTier> tier;
    std::shared_ptr<interfaces::IPeerChannel> channel;
    std::vector<uint8_t> shared_key;
};

using TokenSource = std::function<session::SessionToken()>;

/// Collaborators of a PairingService. All references must outlive it.
struct PairingServiceDependencies {
    const identity::DeviceIdentity& identity;
    configuration::PairingConfig config;
    runtime::EventLoop& loop;
    interfaces::ITaskExecutor& executor;
    const interfaces::IClock& clock;
    interfaces::IKeyValueDirectory& directory;
    interfaces::ITransport& transport;
    interfaces::IPairingObserver* observer = nullptr;
    /// Defaults to SessionToken::Generate.
    TokenSource token_source;
    /// Defaults to ConnectionEstablisher::DefaultStrategies.
    std::optional<std::vector<connection::TierStrategy>> strategies;
    /// Defaults to DeviceDescriptor::Current().
    std::optional<identity::DeviceDescriptor> device;
};

/**
 * @brief Drives every pairing session of this device
 *
 * Owns the session registry and wires it to the rendezvous directory, the
 * connection establisher and the handshake codec. Directory round-trips
 * and dialing run on the task executor; their completions are posted back
 * to the event loop tagged with (token, generation) and dropped when the
 * session moved on in the meantime.
 *
 * Threading: the commands below and Start()/Stop() must be called on the
 * event loop thread (post them from elsewhere). OnInboundMessage() is safe
 * from any thread.
 *
 * Issuer flow:
 * ```
 * GenerateCode -> Publishing -> AwaitingPeer -> (request) Handshaking
 *              -> Confirm -> Confirmed | Reject -> Rejected
 * Publishing -> (request before the publish completion) Handshaking
 * ```
 * Consumer flow:
 * ```
 * EnterCode -> AwaitingPeer -> Connecting -> Handshaking -> (response) Confirmed | Rejected
 * PairWithNearby -> Connecting -> ...
 * ```
 *
 * The host must stop the executor and the loop before destroying the
 * service.
 */
class PairingService {
public:
    /// Validates `dependencies.config` first; an inconsistent configuration
    /// is refused with InvalidState.
    [[nodiscard]] static Result<std::unique_ptr<PairingService>, PairingFailure> Create(
        PairingServiceDependencies dependencies);

    PairingService(const PairingService&) = delete;
    PairingService& operator=(const PairingService&) = delete;

    /// Starts the periodic registry sweep.
    void Start();

    void Stop();

    /**
     * @brief Issue a new share code and publish its rendezvous record
     *
     * `ttl` of zero means the configured default; other values are clamped
     * into the configured bounds. A drawn code that this device already
     * issued is redrawn. Returns as soon as publishing started.
     */
    [[nodiscard]] Result<ShareCodeInfo, PairingFailure> GenerateCode(std::chrono::seconds ttl = std::chrono::seconds(0));

    /// Starts resolving `code`. InvalidFormat for a malformed code; every
    /// later outcome arrives as a state change.
    [[nodiscard]] Result<session::SessionToken, PairingFailure> EnterCode(std::string_view code);

    /// Pairs with a device found by local discovery, skipping the directory.
    [[nodiscard]] Result<session::SessionToken, PairingFailure> PairWithNearby(
        const std::string& peer_identifier,
        const std::vector<std::string>& addresses);

    /**
     * @brief Local approval
     *
     * Issuer in Handshaking: sends the accepting response and confirms.
     * Consumer in AwaitingLocalConfirmation: sends the request. Past the
     * session's expiry this returns Expired and changes nothing.
     */
    [[nodiscard]] Result<Unit, PairingFailure> Confirm(const session::SessionToken& token);

    [[nodiscard]] Result<Unit, PairingFailure> Reject(const session::SessionToken& token);

    [[nodiscard]] Result<Unit, PairingFailure> Cancel(const session::SessionToken& token);

    [[nodiscard]] std::optional<session::SessionSnapshot> GetSession(const session::SessionToken& token) const;

    /// One-shot hand-off of a Confirmed session's channel and pairing key.
    [[nodiscard]] Result<PairingOutcome, PairingFailure> TakeOutcome(const session::SessionToken& token);

    /// Entry point for bytes the transport received on `channel`.
    void OnInboundMessage(std::shared_ptr<interfaces::IPeerChannel> channel, std::vector<uint8_t> bytes);

    [[nodiscard]] const session::SessionRegistry& GetRegistry() const noexcept { return registry_; }

    [[nodiscard]] const configuration::PairingConfig& GetConfig() const noexcept { return config_; }

private:
    using Token = session::SessionToken;

    explicit PairingService(PairingServiceDependencies dependencies);

    [[nodiscard]] Result<session::PairingSession*, PairingFailure> CreateSession(session::SessionParams params);
    void OnStateChanged(const session::PairingSession& session, session::PairingState previous);
    void Fail(session::PairingSession& session, PairingFailureType reason);
    void Finish(session::PairingSession& session, session::PairingState terminal, std::optional<PairingFailureType> reason);

    void StartPublish(session::PairingSession& session);
    void OnPublishCompleted(const Token& token, uint64_t generation, Result<Unit, PairingFailure> result);
    void MaybeUnpublish(session::PairingSession& session);

    void StartResolve(session::PairingSession& session);
    void OnResolveCompleted(const Token& token, uint64_t generation, Result<directory::RendezvousRecord, PairingFailure> result);

    void StartConnect(session::PairingSession& session);
    void OnConnectCompleted(const Token& token, uint64_t generation, Result<connection::ConnectionHandle, PairingFailure> result);

    /// Runs `action` after the next backoff step, unless the session has
    /// moved past `expected` or would expire first.
    void ScheduleRetry(session::PairingSession& session, session::PairingState expected, std::function<void(session::PairingSession&)> action);
    void ScheduleRepublish(session::PairingSession& session);

    void SendRequest(session::PairingSession& session);
    void HandleInbound(const std::shared_ptr<interfaces::IPeerChannel>& channel, std::span<const uint8_t> bytes);
    void HandleRequest(const std::shared_ptr<interfaces::IPeerChannel>& channel, const proto::pairing::PairingRequest& request);
    void HandleDirectRequest(const std::shared_ptr<interfaces::IPeerChannel>& channel, const proto::pairing::PairingRequest& request);
    void HandleResponse(const std::shared_ptr<interfaces::IPeerChannel>& channel, const proto::pairing::PairingResponse& response);
    [[nodiscard]] Result<Unit, PairingFailure> AcceptRequest(
        session::PairingSession& session,
        const std::shared_ptr<interfaces::IPeerChannel>& channel,
        const proto::pairing::PairingRequest& request);
    void SendRejection(interfaces::IPeerChannel& channel, const proto::pairing::PairingRequest& request);
    [[nodiscard]] Result<Unit, PairingFailure> SendResponse(interfaces::IPeerChannel& channel, const proto::pairing::PairingResponse& response);

    void ScheduleSweep();

    const identity::DeviceIdentity& identity_;
    configuration::PairingConfig config_;
    runtime::EventLoop& loop_;
    interfaces::ITaskExecutor& executor_;
    const interfaces::IClock& clock_;
    interfaces::ITransport& transport_;
    interfaces::IPairingObserver* observer_;
    TokenSource token_source_;
    identity::DeviceDescriptor device_;

    directory::RendezvousDirectory directory_;
    connection::ConnectionEstablisher establisher_;
    session::SessionRegistry registry_;
    security::NonceLedger nonce_ledger_;

    std::optional<runtime::EventLoop::TimerId> sweep_timer_;
};

}
