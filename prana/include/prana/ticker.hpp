#pragma once
// Ticker: the orchestrator's heartbeat
//
// Drives one tick at a time and sleeps for as long as the tick asks.
// Every wait is interruptible: stop() returns as soon as the current
// tick finishes, even in the middle of a throttle backoff.

#include "types.hpp"
#include "log.hpp"
#include "orchestrator.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace prana {

// Ticker event callback: (outcome of the tick just run)
using TickCallback = std::function<void(const TickOutcome&)>;

// Time source for ticks (wall clock unless replaced)
using ClockFn = std::function<Timestamp()>;

class Ticker {
public:
    explicit Ticker(Orchestrator& orchestrator, ClockFn clock = [] { return now(); })
        : orchestrator_(orchestrator)
        , clock_(std::move(clock))
        , running_(false)
        , stop_requested_(false) {}

    ~Ticker() {
        stop();
    }

    Ticker(const Ticker&) = delete;
    Ticker& operator=(const Ticker&) = delete;

    void on_tick(TickCallback callback) {
        callback_ = std::move(callback);
    }

    // Restart the orchestrator and run it on a background thread.
    // The orchestrator belongs to the ticker thread until stop() or halt.
    void start() {
        if (running_.exchange(true)) return;  // Already running
        if (thread_.joinable()) thread_.join();  // Previous run halted by itself

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = false;
            stats_ = Stats{};
        }
        orchestrator_.start(clock_());

        thread_ = std::thread([this]() {
            run_loop();
            running_ = false;
        });
    }

    // Request cancellation and wait for the loop to exit
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        wake_.notify_all();

        if (thread_.joinable()) {
            thread_.join();
        }
        running_ = false;
    }

    // Run on the calling thread until warp drive or stop() from elsewhere.
    // Returns true when the run completed (warp drive reached).
    bool run() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = false;
            stats_ = Stats{};
        }
        orchestrator_.start(clock_());
        running_ = true;
        bool completed = run_loop();
        running_ = false;
        return completed;
    }

    bool is_running() const { return running_; }

    struct Stats {
        size_t ticks = 0;
        size_t throttled = 0;
        size_t reverted = 0;
        size_t advanced = 0;
        size_t idle = 0;
        bool completed = false;
    };

    Stats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stop_requested_;
    }

    // Wait up to delay_ms; true if cancellation arrived first
    bool wait_for(int64_t delay_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (delay_ms <= 0) return stop_requested_;
        return wake_.wait_for(lock, std::chrono::milliseconds(delay_ms),
                              [this] { return stop_requested_; });
    }

    bool run_loop() {
        while (!cancelled()) {
            TickOutcome outcome = orchestrator_.tick(clock_());
            record(outcome);

            if (callback_) callback_(outcome);

            if (outcome.action == TickAction::Finalized ||
                outcome.action == TickAction::Halted) {
                return outcome.action == TickAction::Finalized;
            }

            if (wait_for(outcome.next_delay_ms)) break;
        }
        log_debug("ticker", "cancelled at %s", phase_name(orchestrator_.phase()));
        return false;
    }

    void record(const TickOutcome& outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.ticks++;
        switch (outcome.action) {
            case TickAction::Throttled: stats_.throttled++; break;
            case TickAction::Reverted:  stats_.reverted++; break;
            case TickAction::Advanced:  stats_.advanced++; break;
            case TickAction::Idle:      stats_.idle++; break;
            case TickAction::Finalized: stats_.completed = true; break;
            case TickAction::Halted:    break;
        }
    }

    Orchestrator& orchestrator_;
    ClockFn clock_;
    TickCallback callback_;

    std::atomic<bool> running_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_;

    Stats stats_;
};

} // namespace prana
