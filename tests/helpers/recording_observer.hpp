#pragma once
#include "pairlink/interfaces/i_pairing_observer.hpp"

#include <vector>

namespace pairlink::test_helpers {

class RecordingObserver final : public interfaces::IPairingObserver {
public:
    void OnSessionStateChanged(const interfaces::SessionStateChange& change) override {
        changes_.push_back(change);
    }

    [[nodiscard]] const std::vector<interfaces::SessionStateChange>& Changes() const noexcept { return changes_; }

    [[nodiscard]] std::vector<interfaces::SessionStateChange> For(const session::SessionToken& token) const {
        std::vector<interfaces::SessionStateChange> matching;
        for (const auto& change : changes_) {
            if (change.token == token) {
                matching.push_back(change);
            }
        }
        return matching;
    }

    [[nodiscard]] std::vector<session::PairingState> StatesFor(const session::SessionToken& token) const {
        std::vector<session::PairingState> states;
        for (const auto& change : changes_) {
            if (change.token == token) {
                states.push_back(change.state);
            }
        }
        return states;
    }

    [[nodiscard]] size_t CountTerminal(const session::SessionToken& token) const {
        size_t count = 0;
        for (const auto& change : changes_) {
            if (change.token == token && session::IsTerminal(change.state)) {
                ++count;
            }
        }
        return count;
    }

    void Clear() { changes_.clear(); }

private:
    std::vector<interfaces::SessionStateChange> changes_;
};

}
