#pragma once
#include <chrono>
#include <cstdint>

namespace pairlink::interfaces {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint Now() const = 0;
};

[[nodiscard]] inline uint64_t ToUnixMillis(TimePoint time) noexcept {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count();
    return millis < 0 ? 0 : static_cast<uint64_t>(millis);
}

[[nodiscard]] inline TimePoint FromUnixMillis(uint64_t millis) noexcept {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(static_cast<int64_t>(millis))));
}

}
