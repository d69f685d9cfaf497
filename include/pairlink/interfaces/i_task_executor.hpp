#pragma once
#include <functional>

namespace pairlink::interfaces {

/// Runs long operations (directory round-trips, dialing) off the event
/// loop. A task must post its completion back to the loop itself; it never
/// touches session state directly.
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    virtual void Submit(std::function<void()> task) = 0;
};

}
