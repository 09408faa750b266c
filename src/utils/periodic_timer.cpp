#include "dualstore/utils/periodic_timer.hpp"
#include "dualstore/utils/logger.hpp"

namespace dualstore {

PeriodicTimer::PeriodicTimer(std::string name) : name_(std::move(name)) {}

PeriodicTimer::~PeriodicTimer() {
    stop();
}

void PeriodicTimer::start(std::chrono::milliseconds interval, Task task) {
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (state_) {
        {
            std::lock_guard<std::mutex> state_lock(state_->mutex);
            state_->stopped = true;
        }
        state_->cv.notify_all();
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    state_ = std::make_shared<State>();
    thread_ = std::thread(&PeriodicTimer::run, state_, interval, std::move(task), name_);
}

void PeriodicTimer::stop() {
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (state_) {
        {
            std::lock_guard<std::mutex> state_lock(state_->mutex);
            state_->stopped = true;
        }
        state_->cv.notify_all();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    state_.reset();
}

bool PeriodicTimer::running() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> state_lock(state_->mutex);
    return !state_->stopped;
}

void PeriodicTimer::run(std::shared_ptr<State> state, std::chrono::milliseconds interval,
                        Task task, std::string name) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            if (state->cv.wait_for(lock, interval, [&state] { return state->stopped; })) {
                return;
            }
        }

        bool keep_going = true;
        try {
            keep_going = task();
        } catch (const std::exception& e) {
            log_error("timer", name + " task failed: " + e.what());
        }

        if (!keep_going) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->stopped = true;
            return;
        }
    }
}

} // namespace dualstore
