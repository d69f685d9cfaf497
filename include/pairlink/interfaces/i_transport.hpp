#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace pairlink::interfaces {

/// An established, authenticated stream to one remote peer. Inbound bytes
/// are not pulled from here; the transport pushes them into
/// PairingService::OnInboundMessage together with the channel.
class IPeerChannel {
public:
    virtual ~IPeerChannel() = default;

    [[nodiscard]] virtual std::string RemoteIdentifier() const = 0;

    virtual Result<Unit, PairingFailure> Send(std::span<const uint8_t> bytes) = 0;
};

/**
 * @brief Peer-dial primitive of the transport stack
 *
 * Every dial returns Unreachable on failure. All three dial flavours must
 * be safe to call from an executor thread.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual std::string LocalIdentifier() const = 0;

    [[nodiscard]] virtual std::vector<std::string> ListenAddresses() const = 0;

    virtual Result<std::shared_ptr<IPeerChannel>, PairingFailure> Dial(
        const std::string& peer_identifier,
        const std::vector<std::string>& address_hints,
        std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual bool SupportsHolePunch(const std::string& peer_identifier) const = 0;

    virtual Result<std::shared_ptr<IPeerChannel>, PairingFailure> HolePunch(
        const std::string& peer_identifier,
        std::chrono::milliseconds timeout) = 0;

    /// `relay_hints` may be empty, in which case the transport's default
    /// relay is used.
    virtual Result<std::shared_ptr<IPeerChannel>, PairingFailure> RelayDial(
        const std::string& peer_identifier,
        const std::vector<std::string>& relay_hints,
        std::chrono::milliseconds timeout) = 0;
};

}
