#include "pairlink/session/pairing_state.hpp"

#include <array>

namespace pairlink::session {

namespace {

enum RoleMask : uint8_t {
    kIssuer = 1 << 0,
    kConsumer = 1 << 1,
    kBoth = kIssuer | kConsumer
};

struct TransitionRule {
    PairingState from;
    PairingState to;
    uint8_t roles;
};

constexpr std::array<TransitionRule, 12> kForwardTransitions{{
    {PairingState::Idle, PairingState::Publishing, kIssuer},
    {PairingState::Idle, PairingState::Handshaking, kIssuer},
    {PairingState::Idle, PairingState::AwaitingPeer, kConsumer},
    {PairingState::Idle, PairingState::Connecting, kConsumer},
    {PairingState::Publishing, PairingState::AwaitingPeer, kIssuer},
    {PairingState::Publishing, PairingState::Handshaking, kIssuer},
    {PairingState::AwaitingPeer, PairingState::Handshaking, kIssuer},
    {PairingState::AwaitingPeer, PairingState::Connecting, kConsumer},
    {PairingState::Connecting, PairingState::Handshaking, kConsumer},
    {PairingState::Connecting, PairingState::AwaitingLocalConfirmation, kConsumer},
    {PairingState::AwaitingLocalConfirmation, PairingState::Handshaking, kConsumer},
    {PairingState::Handshaking, PairingState::Confirmed, kBoth},
}};

uint8_t MaskFor(const SessionRole role) noexcept {
    return role == SessionRole::Issuer ? kIssuer : kConsumer;
}

}

std::string_view StateName(const PairingState state) noexcept {
    switch (state) {
        case PairingState::Idle: return "Idle";
        case PairingState::Publishing: return "Publishing";
        case PairingState::AwaitingPeer: return "AwaitingPeer";
        case PairingState::Connecting: return "Connecting";
        case PairingState::Handshaking: return "Handshaking";
        case PairingState::AwaitingLocalConfirmation: return "AwaitingLocalConfirmation";
        case PairingState::Confirmed: return "Confirmed";
        case PairingState::Rejected: return "Rejected";
        case PairingState::Expired: return "Expired";
        case PairingState::Cancelled: return "Cancelled";
        case PairingState::Failed: return "Failed";
    }
    return "Unknown";
}

std::string_view RoleName(const SessionRole role) noexcept {
    return role == SessionRole::Issuer ? "Issuer" : "Consumer";
}

std::string_view MethodName(const PairingMethod method) noexcept {
    return method == PairingMethod::Code ? "Code" : "Direct";
}

bool IsTransitionAllowed(const SessionRole role, const PairingState from, const PairingState to) noexcept {
    if (IsTerminal(from)) {
        return false;
    }
    switch (to) {
        case PairingState::Cancelled:
        case PairingState::Expired:
        case PairingState::Failed:
            return true;
        case PairingState::Rejected:
            // A handshake can be turned down while it runs, and a consumer
            // can decline the resolved peer before sending its request. The
            // record is visible before Put returns, so an issuer may already
            // refuse a request while still Publishing.
            return from == PairingState::Handshaking ||
                   ((from == PairingState::AwaitingPeer || from == PairingState::Publishing) &&
                    role == SessionRole::Issuer) ||
                   (from == PairingState::AwaitingLocalConfirmation && role == SessionRole::Consumer);
        default:
            break;
    }
    const uint8_t mask = MaskFor(role);
    for (const auto& rule : kForwardTransitions) {
        if (rule.from == from && rule.to == to && (rule.roles & mask) != 0) {
            return true;
        }
    }
    return false;
}

}
