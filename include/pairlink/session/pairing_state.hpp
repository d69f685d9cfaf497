#pragma once
#include <cstdint>
#include <string_view>

namespace pairlink::session {

enum class PairingState : uint8_t {
    Idle,
    Publishing,
    AwaitingPeer,
    Connecting,
    Handshaking,
    AwaitingLocalConfirmation,
    Confirmed,
    Rejected,
    Expired,
    Cancelled,
    Failed
};

enum class SessionRole : uint8_t {
    Issuer,
    Consumer
};

/// How the consumer found the issuer: a typed share code or a nearby
/// device announced by local-network discovery.
enum class PairingMethod : uint8_t {
    Code,
    Direct
};

[[nodiscard]] std::string_view StateName(PairingState state) noexcept;

[[nodiscard]] std::string_view RoleName(SessionRole role) noexcept;

[[nodiscard]] std::string_view MethodName(PairingMethod method) noexcept;

[[nodiscard]] constexpr bool IsTerminal(const PairingState state) noexcept {
    return state == PairingState::Confirmed ||
           state == PairingState::Rejected ||
           state == PairingState::Expired ||
           state == PairingState::Cancelled ||
           state == PairingState::Failed;
}

/**
 * @brief Transition table of the pairing state machine
 *
 * Issuer:   Idle -> Publishing -> AwaitingPeer -> Handshaking -> Confirmed | Rejected
 *           Idle -> Handshaking (inbound nearby request)
 * Consumer: Idle -> AwaitingPeer -> Connecting -> [AwaitingLocalConfirmation] -> Handshaking
 *                -> Confirmed | Rejected
 *           Idle -> Connecting (nearby peer, already resolved)
 *
 * Every non-terminal state may also move to Cancelled, Expired or Failed.
 * Nothing leaves a terminal state.
 */
[[nodiscard]] bool IsTransitionAllowed(SessionRole role, PairingState from, PairingState to) noexcept;

}
