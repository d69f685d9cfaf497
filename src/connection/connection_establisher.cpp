#include "pairlink/connection/connection_establisher.hpp"
#include "pairlink/core/constants.hpp"
#include "pairlink/core/logger.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <array>
#include <iterator>

namespace pairlink::connection {

namespace {

using ChannelResult = Result<std::shared_ptr<interfaces::IPeerChannel>, PairingFailure>;

/// Host part of "/ip4/<host>/...", "/ip6/<host>/...", "/dns*/<host>/...",
/// "host:port" or "[v6]:port".
std::string ExtractHost(std::string_view address) {
    if (!address.empty() && address.front() == '/') {
        const size_t proto_end = address.find('/', 1);
        if (proto_end == std::string_view::npos) {
            return {};
        }
        const size_t host_end = address.find('/', proto_end + 1);
        return std::string(address.substr(proto_end + 1,
            host_end == std::string_view::npos ? std::string_view::npos : host_end - proto_end - 1));
    }
    if (!address.empty() && address.front() == '[') {
        const size_t close = address.find(']');
        return close == std::string_view::npos ? std::string{} : std::string(address.substr(1, close - 1));
    }
    if (std::count(address.begin(), address.end(), ':') == 1) {
        return std::string(address.substr(0, address.find(':')));
    }
    return std::string(address);
}

bool IsLocalIPv4(const std::array<uint8_t, 4>& ip) noexcept {
    return ip[0] == 10 ||
           ip[0] == 127 ||
           (ip[0] == 172 && (ip[1] & 0xF0) == 16) ||
           (ip[0] == 192 && ip[1] == 168) ||
           (ip[0] == 169 && ip[1] == 254);
}

bool IsLocalIPv6(const std::array<uint8_t, 16>& ip) noexcept {
    static constexpr std::array<uint8_t, 16> kLoopback{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1};
    return ip == kLoopback ||
           (ip[0] == 0xFE && (ip[1] & 0xC0) == 0x80) ||
           (ip[0] & 0xFE) == 0xFC;
}

}

ConnectionEstablisher::ConnectionEstablisher(std::vector<TierStrategy> strategies)
    : strategies_(std::move(strategies)) {
}

std::vector<TierStrategy> ConnectionEstablisher::DefaultStrategies(
    interfaces::ITransport& transport,
    const configuration::PairingConfig& config) {
    std::vector<TierStrategy> strategies;
    strategies.push_back(TierStrategy{
        ConnectionTier::Direct,
        config.DirectTimeout(),
        [&transport](const std::string& peer, const std::vector<std::string>& hints, std::chrono::milliseconds timeout) {
            auto direct_hints = DirectHints(hints);
            if (direct_hints.empty()) {
                return ChannelResult::Err(PairingFailure::Unreachable("Peer advertised no direct address"));
            }
            return transport.Dial(peer, direct_hints, timeout);
        }});
    strategies.push_back(TierStrategy{
        ConnectionTier::HolePunched,
        config.HolePunchTimeout(),
        [&transport](const std::string& peer, const std::vector<std::string>&, std::chrono::milliseconds timeout) {
            if (!transport.SupportsHolePunch(peer)) {
                return ChannelResult::Err(PairingFailure::Unreachable("Hole punching unsupported for peer"));
            }
            return transport.HolePunch(peer, timeout);
        }});
    strategies.push_back(TierStrategy{
        ConnectionTier::Relayed,
        config.RelayTimeout(),
        [&transport](const std::string& peer, const std::vector<std::string>& hints, std::chrono::milliseconds timeout) {
            return transport.RelayDial(peer, RelayHints(hints), timeout);
        }});
    return strategies;
}

Result<ConnectionHandle, PairingFailure> ConnectionEstablisher::Connect(
    const std::string& peer_identifier,
    const std::vector<std::string>& address_hints) const {
    for (const auto& strategy : strategies_) {
        auto attempt = strategy.attempt(peer_identifier, address_hints, strategy.timeout);
        if (attempt.IsOk() && attempt.Unwrap() != nullptr) {
            PAIRLINK_LOG_DEBUG("Reached peer {} via {}", peer_identifier, TierName(strategy.tier));
            return Result<ConnectionHandle, PairingFailure>::Ok(
                ConnectionHandle{std::move(attempt).Unwrap(), strategy.tier});
        }
        PAIRLINK_LOG_DEBUG("Tier {} failed for peer {}: {}",
            TierName(strategy.tier), peer_identifier,
            attempt.IsErr() ? attempt.UnwrapErr().message : std::string("no channel"));
    }
    return Result<ConnectionHandle, PairingFailure>::Err(
        PairingFailure::Unreachable("All connection tiers failed"));
}

AddressScope ConnectionEstablisher::ClassifyAddress(std::string_view address) {
    if (address.find(kRelayAddressMarker) != std::string_view::npos) {
        return AddressScope::Relayed;
    }
    const std::string host = ExtractHost(address);
    if (host == "localhost") {
        return AddressScope::Local;
    }
    std::array<uint8_t, 4> v4{};
    if (inet_pton(AF_INET, host.c_str(), v4.data()) == 1) {
        return IsLocalIPv4(v4) ? AddressScope::Local : AddressScope::Public;
    }
    std::array<uint8_t, 16> v6{};
    if (inet_pton(AF_INET6, host.c_str(), v6.data()) == 1) {
        return IsLocalIPv6(v6) ? AddressScope::Local : AddressScope::Public;
    }
    return AddressScope::Public;
}

std::vector<std::string> ConnectionEstablisher::DirectHints(const std::vector<std::string>& address_hints) {
    std::vector<std::string> local;
    std::vector<std::string> remote;
    for (const auto& address : address_hints) {
        switch (ClassifyAddress(address)) {
            case AddressScope::Local: local.push_back(address); break;
            case AddressScope::Public: remote.push_back(address); break;
            case AddressScope::Relayed: break;
        }
    }
    local.insert(local.end(), remote.begin(), remote.end());
    return local;
}

std::vector<std::string> ConnectionEstablisher::RelayHints(const std::vector<std::string>& address_hints) {
    std::vector<std::string> relays;
    std::copy_if(address_hints.begin(), address_hints.end(), std::back_inserter(relays),
        [](const std::string& address) { return ClassifyAddress(address) == AddressScope::Relayed; });
    return relays;
}

}
