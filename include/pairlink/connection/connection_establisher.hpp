#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"
#include "pairlink/configuration/pairing_config.hpp"
#include "pairlink/connection/connection_tier.hpp"
#include "pairlink/interfaces/i_transport.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pairlink::connection {

/// An open channel to the peer and the tier that produced it. The tier is
/// informational only.
struct ConnectionHandle {
    std::shared_ptr<interfaces::IPeerChannel> channel;
    ConnectionTier tier = ConnectionTier::Direct;
};

using TierAttempt = std::function<Result<std::shared_ptr<interfaces::IPeerChannel>, PairingFailure>(
    const std::string& peer_identifier,
    const std::vector<std::string>& address_hints,
    std::chrono::milliseconds timeout)>;

/// One way of reaching a peer. Strategies are plain values; the
/// establisher walks them in order.
struct TierStrategy {
    ConnectionTier tier;
    std::chrono::milliseconds timeout;
    TierAttempt attempt;
};

/**
 * @brief Reaches a resolved peer through the best tier that works
 *
 * Tries each strategy in order and stops at the first success. A failing
 * tier is logged and skipped; only when every tier failed does Connect
 * return Unreachable. The default list is:
 *
 * 1. Direct: dial the non-relay hints, local addresses first.
 * 2. HolePunched: only when the transport says both sides support it.
 * 3. Relayed: dial through the relay hints (`/p2p-circuit`), or the
 *    transport's default relay when the peer advertised none.
 *
 * The transport enforces each dial's timeout. Connect blocks, so it runs
 * on the task executor, never on the event loop.
 */
class ConnectionEstablisher {
public:
    explicit ConnectionEstablisher(std::vector<TierStrategy> strategies);

    [[nodiscard]] static std::vector<TierStrategy> DefaultStrategies(
        interfaces::ITransport& transport,
        const configuration::PairingConfig& config);

    [[nodiscard]] Result<ConnectionHandle, PairingFailure> Connect(
        const std::string& peer_identifier,
        const std::vector<std::string>& address_hints) const;

    [[nodiscard]] static AddressScope ClassifyAddress(std::string_view address);

    /// Non-relay hints with Local addresses ahead of Public ones, order
    /// otherwise preserved.
    [[nodiscard]] static std::vector<std::string> DirectHints(const std::vector<std::string>& address_hints);

    [[nodiscard]] static std::vector<std::string> RelayHints(const std::vector<std::string>& address_hints);

    [[nodiscard]] const std::vector<TierStrategy>& GetStrategies() const noexcept { return strategies_; }

private:
    std::vector<TierStrategy> strategies_;
};

}
