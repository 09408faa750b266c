#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace dualstore {

// Runs a task on its own thread every `interval` until stopped. The first run
// happens one interval after start(). The task returns false to end the loop
// from inside; it must not call start() or stop() on its own timer.
class PeriodicTimer {
public:
    using Task = std::function<bool()>;

    explicit PeriodicTimer(std::string name = "timer");
    ~PeriodicTimer();

    // Disable copy
    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    // Stops any previous loop, then starts a new one
    void start(std::chrono::milliseconds interval, Task task);

    // Wakes the sleeping loop and joins it
    void stop();

    bool running() const;

    const std::string& name() const { return name_; }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool stopped = false;
    };

    static void run(std::shared_ptr<State> state, std::chrono::milliseconds interval,
                    Task task, std::string name);

    std::string name_;
    mutable std::mutex control_mutex_;
    std::shared_ptr<State> state_;
    std::thread thread_;
};

} // namespace dualstore
