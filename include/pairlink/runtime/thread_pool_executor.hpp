#pragma once
#include "pairlink/interfaces/i_task_executor.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace pairlink::runtime {

/// Fixed pool of worker threads for directory and dial work. Tasks still
/// queued at destruction are dropped; running ones are joined.
class ThreadPoolExecutor final : public interfaces::ITaskExecutor {
public:
    explicit ThreadPoolExecutor(size_t worker_count);
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    void Submit(std::function<void()> task) override;

    void Shutdown();

private:
    void WorkerLoop();

    std::mutex lock_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    bool stopping_ = false;
};

}
