#pragma once
#include "pairlink/interfaces/i_clock.hpp"

namespace pairlink::runtime {

class SystemClock final : public interfaces::IClock {
public:
    [[nodiscard]] interfaces::TimePoint Now() const override {
        return interfaces::Clock::now();
    }
};

}
