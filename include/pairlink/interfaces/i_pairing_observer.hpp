#pragma once
#include "pairlink/core/failures.hpp"
#include "pairlink/connection/connection_tier.hpp"
#include "pairlink/session/pairing_state.hpp"
#include "pairlink/session/session_token.hpp"

#include <optional>
#include <string>

namespace pairlink::interfaces {

/// One state transition of one pairing session, as the presentation layer
/// sees it. `user_message` is set on every failure-like terminal state and
/// is the only text meant for display.
struct SessionStateChange {
    session::SessionToken token;
    std::optional<std::string> code;
    session::SessionRole role = session::SessionRole::Issuer;
    session::PairingMethod method = session::PairingMethod::Code;
    session::PairingState previous_state = session::PairingState::Idle;
    session::PairingState state = session::PairingState::Idle;
    std::optional<std::string> peer_identifier;
    std::optional<std::string> peer_display_name;
    std::optional<connection::ConnectionTier> tier;
    std::optional<PairingFailureType> reason;
    std::optional<std::string> user_message;
};

/// Called on the event loop thread, exactly once per transition, after the
/// transition is complete. Must not block; it may issue service commands.
class IPairingObserver {
public:
    virtual ~IPairingObserver() = default;

    virtual void OnSessionStateChanged(const SessionStateChange& change) = 0;
};

}
