#pragma once
#include "pairlink/interfaces/i_clock.hpp"

#include <chrono>
#include <mutex>

namespace pairlink::test_helpers {

class ManualClock final : public interfaces::IClock {
public:
    ManualClock()
        : now_(interfaces::TimePoint(std::chrono::milliseconds(1'700'000'000'000))) {}

    [[nodiscard]] interfaces::TimePoint Now() const override {
        std::lock_guard<std::mutex> guard(lock_);
        return now_;
    }

    void Advance(const interfaces::Clock::duration delta) {
        std::lock_guard<std::mutex> guard(lock_);
        now_ += delta;
    }

    void Set(const interfaces::TimePoint now) {
        std::lock_guard<std::mutex> guard(lock_);
        now_ = now;
    }

private:
    mutable std::mutex lock_;
    interfaces::TimePoint now_;
};

}
