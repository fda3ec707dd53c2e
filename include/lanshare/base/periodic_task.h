#ifndef LANSHARE_BASE_PERIODIC_TASK_H
#define LANSHARE_BASE_PERIODIC_TASK_H

#include <elio/elio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace lanshare {

// Runs a callback on an elio scheduler at a fixed period.
//
// The first run happens as soon as the coroutine is scheduled. Runs follow
// the start time plus whole multiples of the interval; if a run overshoots
// one or more slots those slots are skipped rather than run back to back.
// The running flag is checked at least every 100ms while sleeping.
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> body);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start(elio::runtime::scheduler& scheduler);

    // Clear the running flag and wait for the coroutine to report exit, however
    // long the current run takes. Called from the task's own body it only
    // clears the flag.
    void stop();

    bool is_running() const { return running_.load(); }
    uint64_t runs() const { return runs_.load(); }
    uint64_t skipped_slots() const { return skipped_.load(); }

private:
    elio::coro::task<void> run_loop();
    void run_once();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> body_;

    std::atomic<bool> running_{false};
    std::atomic<bool> exited_{true};
    std::atomic<uint64_t> runs_{0};
    std::atomic<uint64_t> skipped_{0};
};

} // namespace lanshare

#endif // LANSHARE_BASE_PERIODIC_TASK_H
