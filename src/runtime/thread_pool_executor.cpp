#include "pairlink/runtime/thread_pool_executor.hpp"
#include "pairlink/core/logger.hpp"

#include <algorithm>
#include <exception>

namespace pairlink::runtime {

ThreadPoolExecutor::ThreadPoolExecutor(const size_t worker_count) {
    const size_t count = std::max<size_t>(worker_count, 1);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&ThreadPoolExecutor::WorkerLoop, this);
    }
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    Shutdown();
}

void ThreadPoolExecutor::Submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> guard(lock_);
        if (stopping_) {
            PAIRLINK_LOG_WARN("Executor is shutting down, task dropped");
            return;
        }
        tasks_.push_back(std::move(task));
    }
    wake_.notify_one();
}

void ThreadPoolExecutor::Shutdown() {
    {
        std::lock_guard<std::mutex> guard(lock_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        tasks_.clear();
    }
    wake_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void ThreadPoolExecutor::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> guard(lock_);
            wake_.wait(guard, [this] { return stopping_ || !tasks_.empty(); });
            if (stopping_) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& ex) {
            PAIRLINK_LOG_ERROR("Executor task threw: {}", ex.what());
        }
    }
}

}
