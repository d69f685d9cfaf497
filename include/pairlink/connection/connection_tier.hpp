#pragma once
#include <cstdint>
#include <string_view>

namespace pairlink::connection {

/// Connectivity tier that carried a pairing connection, best first.
enum class ConnectionTier : uint8_t {
    Direct,
    HolePunched,
    Relayed
};

/// Where an advertised address points.
enum class AddressScope : uint8_t {
    Local,
    Public,
    Relayed
};

[[nodiscard]] constexpr std::string_view TierName(const ConnectionTier tier) noexcept {
    switch (tier) {
        case ConnectionTier::Direct: return "Direct";
        case ConnectionTier::HolePunched: return "HolePunched";
        case ConnectionTier::Relayed: return "Relayed";
    }
    return "Unknown";
}

}
