#include "pairlink/runtime/event_loop.hpp"
#include "pairlink/core/logger.hpp"

#include <algorithm>
#include <exception>

namespace pairlink::runtime {

namespace {
constexpr auto kMaxIdleWait = std::chrono::milliseconds(100);
}

EventLoop::EventLoop(const interfaces::IClock& clock)
    : clock_(clock) {}

EventLoop::~EventLoop() {
    Stop();
}

void EventLoop::Post(Task task) {
    {
        std::lock_guard<std::mutex> guard(lock_);
        queue_.push_back(std::move(task));
    }
    wake_.notify_one();
}

EventLoop::TimerId EventLoop::PostDelayed(const interfaces::Duration delay, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> guard(lock_);
        id = next_timer_id_++;
        const auto due = clock_.Now() + std::max(delay, interfaces::Duration::zero());
        timers_.emplace(TimerKey{due, id}, std::move(task));
        timer_due_.emplace(id, due);
    }
    wake_.notify_one();
    return id;
}

void EventLoop::CancelTimer(const TimerId id) {
    std::lock_guard<std::mutex> guard(lock_);
    const auto it = timer_due_.find(id);
    if (it == timer_due_.end()) {
        return;
    }
    timers_.erase(TimerKey{it->second, id});
    timer_due_.erase(it);
}

bool EventLoop::TakeNext(Task& task) {
    std::lock_guard<std::mutex> guard(lock_);
    if (!queue_.empty()) {
        task = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }
    if (!timers_.empty() && timers_.begin()->first.first <= clock_.Now()) {
        auto node = timers_.extract(timers_.begin());
        timer_due_.erase(node.key().second);
        task = std::move(node.mapped());
        return true;
    }
    return false;
}

size_t EventLoop::RunPending() {
    size_t ran = 0;
    Task task;
    while (TakeNext(task)) {
        try {
            task();
        } catch (const std::exception& ex) {
            PAIRLINK_LOG_ERROR("Event loop task threw: {}", ex.what());
        }
        ++ran;
    }
    return ran;
}

void EventLoop::Run() {
    {
        std::lock_guard<std::mutex> guard(lock_);
        stop_requested_ = false;
    }
    running_.store(true, std::memory_order_release);
    while (true) {
        RunPending();

        std::unique_lock<std::mutex> guard(lock_);
        if (stop_requested_) {
            break;
        }
        if (!queue_.empty()) {
            continue;
        }
        auto wait = kMaxIdleWait;
        if (!timers_.empty()) {
            const auto until_due = std::chrono::duration_cast<std::chrono::milliseconds>(
                timers_.begin()->first.first - clock_.Now());
            wait = std::clamp(until_due, std::chrono::milliseconds::zero(), kMaxIdleWait);
        }
        wake_.wait_for(guard, wait, [this] { return stop_requested_ || !queue_.empty(); });
        if (stop_requested_) {
            break;
        }
    }
    running_.store(false, std::memory_order_release);
}

void EventLoop::Stop() {
    {
        std::lock_guard<std::mutex> guard(lock_);
        stop_requested_ = true;
    }
    wake_.notify_all();
}

size_t EventLoop::PendingTimerCount() const {
    std::lock_guard<std::mutex> guard(lock_);
    return timers_.size();
}

}
