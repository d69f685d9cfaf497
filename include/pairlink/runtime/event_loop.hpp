#pragma once
#include "pairlink/interfaces/i_clock.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace pairlink::runtime {

/**
 * @brief The single sequential actor that owns all session state
 *
 * A FIFO of closures plus a timer queue. Post() and PostDelayed() are safe
 * from any thread; closures and timers only ever run on the thread that
 * calls Run() or RunPending(), one at a time, in posting order (timers by
 * due time, ties in scheduling order).
 *
 * Timers are due against the injected clock, so a test drives them by
 * advancing a manual clock and calling RunPending().
 */
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    explicit EventLoop(const interfaces::IClock& clock);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void Post(Task task);

    TimerId PostDelayed(interfaces::Duration delay, Task task);

    /// A timer that already fired or was cancelled is ignored.
    void CancelTimer(TimerId id);

    /// Runs every queued closure and every timer due now, including work
    /// those closures queue. Returns how many ran.
    size_t RunPending();

    /// Blocks, running work as it arrives, until Stop().
    void Run();

    void Stop();

    [[nodiscard]] bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

    [[nodiscard]] size_t PendingTimerCount() const;

private:
    using TimerKey = std::pair<interfaces::TimePoint, TimerId>;

    /// Pops the next runnable task, if any.
    bool TakeNext(Task& task);

    const interfaces::IClock& clock_;
    mutable std::mutex lock_;
    std::condition_variable wake_;
    std::deque<Task> queue_;
    std::map<TimerKey, Task> timers_;
    std::map<TimerId, interfaces::TimePoint> timer_due_;
    TimerId next_timer_id_ = 1;
    std::atomic<bool> running_{false};
    bool stop_requested_ = false;
};

}
