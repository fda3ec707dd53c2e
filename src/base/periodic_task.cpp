#include "lanshare/base/periodic_task.h"
#include "lanshare/base/error_code.h"
#include "lanshare/base/logger.h"
#include <elio/time/timer.hpp>
#include <algorithm>
#include <thread>

namespace lanshare {

namespace {

constexpr std::chrono::milliseconds SLEEP_SLICE{100};
constexpr std::chrono::milliseconds STOP_WARN_AFTER{5000};

// Task whose body is running on this thread
thread_local const PeriodicTask* current_task = nullptr;

} // anonymous namespace

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> body)
    : name_(std::move(name)), interval_(interval), body_(std::move(body)) {
    if (interval_.count() <= 0) {
        throw LanShareError(ErrorCode::InvalidArgument, name_ + ": interval must be positive");
    }
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start(elio::runtime::scheduler& scheduler) {
    if (!exited_.load()) {
        Logger::instance().warning("{} already running", name_);
        return;
    }
    running_ = true;
    exited_ = false;

    auto loop = run_loop();
    scheduler.spawn(loop.release());
    Logger::instance().debug("{} started, interval {}ms", name_, interval_.count());
}

void PeriodicTask::stop() {
    bool was_running = running_.exchange(false);
    if (current_task == this) {
        // Stopped from inside our own body: the loop ends once the body returns
        return;
    }

    auto warn_at = std::chrono::steady_clock::now() + STOP_WARN_AFTER;
    bool warned = false;
    while (!exited_.load()) {
        if (!warned && std::chrono::steady_clock::now() >= warn_at) {
            Logger::instance().warning("{} still running after {}ms, waiting for it to exit",
                                       name_, STOP_WARN_AFTER.count());
            warned = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (was_running) {
        Logger::instance().debug("{} stopped after {} runs", name_, runs_.load());
    }
}

void PeriodicTask::run_once() {
    current_task = this;
    try {
        body_();
    } catch (const std::exception& e) {
        Logger::instance().error("{} run failed: {}", name_, e.what());
    }
    current_task = nullptr;
    ++runs_;
}

elio::coro::task<void> PeriodicTask::run_loop() {
    using steady = std::chrono::steady_clock;
    auto next = steady::now();

    while (running_.load()) {
        auto now = steady::now();
        if (now < next) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
            co_await elio::time::sleep_for(std::min(remaining + std::chrono::milliseconds(1), SLEEP_SLICE));
            continue;
        }

        run_once();

        next += interval_;
        now = steady::now();
        while (next <= now) {
            next += interval_;
            ++skipped_;
        }
    }

    exited_ = true;
    co_return;
}

} // namespace lanshare
