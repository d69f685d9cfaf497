#include <catch2/catch_test_macros.hpp>
#include "pairlink/runtime/thread_pool_executor.hpp"
#include "pairlink/runtime/event_loop.hpp"
#include "pairlink/runtime/system_clock.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace pairlink::runtime;
using namespace std::chrono_literals;

namespace {
/// Counts down to zero; Wait() returns false on timeout.
class CountDown {
public:
    explicit CountDown(int count) : remaining_(count) {}

    void Hit() {
        std::lock_guard<std::mutex> guard(lock_);
        if (--remaining_ <= 0) {
            done_.notify_all();
        }
    }

    bool Wait(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> guard(lock_);
        return done_.wait_for(guard, timeout, [this] { return remaining_ <= 0; });
    }

private:
    std::mutex lock_;
    std::condition_variable done_;
    int remaining_;
};
}

TEST_CASE("Concurrency - Thread pool runs every task", "[concurrency][executor]") {
    constexpr int TASK_COUNT = 2000;
    constexpr size_t WORKER_COUNT = 4;

    ThreadPoolExecutor executor(WORKER_COUNT);
    std::atomic<int> ran{0};
    std::mutex ids_mutex;
    std::set<std::thread::id> worker_ids;
    CountDown finished(TASK_COUNT);

    for (int i = 0; i < TASK_COUNT; ++i) {
        executor.Submit([&] {
            {
                std::lock_guard<std::mutex> guard(ids_mutex);
                worker_ids.insert(std::this_thread::get_id());
            }
            ran.fetch_add(1);
            finished.Hit();
        });
    }

    REQUIRE(finished.Wait(10s));
    REQUIRE(ran.load() == TASK_COUNT);
    REQUIRE_FALSE(worker_ids.empty());
    REQUIRE(worker_ids.size() <= WORKER_COUNT);
    REQUIRE(worker_ids.count(std::this_thread::get_id()) == 0);
}

TEST_CASE("Concurrency - Thread pool submit from many threads", "[concurrency][executor]") {
    constexpr int THREAD_COUNT = 8;
    constexpr int TASKS_PER_THREAD = 250;

    ThreadPoolExecutor executor(3);
    std::atomic<int> ran{0};
    CountDown finished(THREAD_COUNT * TASKS_PER_THREAD);

    std::vector<std::thread> producers;
    producers.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        producers.emplace_back([&] {
            for (int i = 0; i < TASKS_PER_THREAD; ++i) {
                executor.Submit([&] {
                    ran.fetch_add(1);
                    finished.Hit();
                });
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    REQUIRE(finished.Wait(10s));
    REQUIRE(ran.load() == THREAD_COUNT * TASKS_PER_THREAD);
}

TEST_CASE("Concurrency - Thread pool shutdown", "[concurrency][executor]") {
    SECTION("Shutdown joins a running task and drops later submissions") {
        ThreadPoolExecutor executor(2);
        std::atomic<bool> started{false};
        std::atomic<bool> completed{false};
        executor.Submit([&] {
            started.store(true);
            std::this_thread::sleep_for(50ms);
            completed.store(true);
        });
        while (!started.load()) {
            std::this_thread::yield();
        }
        executor.Shutdown();
        REQUIRE(completed.load());

        std::atomic<int> late{0};
        executor.Submit([&] { late.fetch_add(1); });
        std::this_thread::sleep_for(20ms);
        REQUIRE(late.load() == 0);
    }
    SECTION("Shutdown twice is harmless") {
        ThreadPoolExecutor executor(1);
        executor.Shutdown();
        executor.Shutdown();
        SUCCEED();
    }
    SECTION("Zero workers still gets one") {
        ThreadPoolExecutor executor(0);
        CountDown finished(1);
        executor.Submit([&] { finished.Hit(); });
        REQUIRE(finished.Wait(5s));
    }
}

TEST_CASE("Concurrency - Throwing task does not kill its worker", "[concurrency][executor]") {
    ThreadPoolExecutor executor(1);
    CountDown finished(1);
    executor.Submit([] { throw std::runtime_error("directory exploded"); });
    executor.Submit([&] { finished.Hit(); });
    REQUIRE(finished.Wait(5s));
}

TEST_CASE("Concurrency - Completions posted back to the loop", "[concurrency][executor][event_loop]") {
    constexpr int TASK_COUNT = 200;

    SystemClock clock;
    EventLoop loop(clock);
    ThreadPoolExecutor executor(4);
    std::thread::id loop_thread;
    std::atomic<bool> foreign_completion{false};
    int completions = 0;

    std::thread runner([&] {
        loop_thread = std::this_thread::get_id();
        loop.Run();
    });

    for (int i = 0; i < TASK_COUNT; ++i) {
        executor.Submit([&] {
            loop.Post([&] {
                if (std::this_thread::get_id() != loop_thread) {
                    foreign_completion.store(true);
                }
                if (++completions == TASK_COUNT) {
                    loop.Stop();
                }
            });
        });
    }

    runner.join();
    executor.Shutdown();
    REQUIRE(completions == TASK_COUNT);
    REQUIRE_FALSE(foreign_completion.load());
}
