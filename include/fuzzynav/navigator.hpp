#pragma once

#include "fuzzynav/config.hpp"
#include "fuzzynav/nav/cycle.hpp"
#include "fuzzynav/transport/transport.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace fuzzynav {

    enum class RunResult {
        REACHED,          // Within tolerance of the target
        CANCELLED,        // Cancel flag raised
        TRANSPORT_FAILED, // Could not open, no base odometry, or too many consecutive failures
        ABORTED,          // Decision failure with abort_on_decision_failure
        CYCLE_LIMIT       // max_cycles exhausted
    };

    const char *to_string(RunResult result);

    // Counters for one run
    struct RunStats {
        std::size_t cycles = 0;
        std::size_t obstacle_cycles = 0;
        std::size_t transport_failures = 0;
        std::size_t decision_failures = 0;
        double final_distance = 0.0;
    };

    /// Sends a stop command and closes the transport when it goes out of scope.
    class StopGuard {
      public:
        explicit StopGuard(transport::Transport &transport) : transport_(transport) {}
        ~StopGuard();

        StopGuard(const StopGuard &) = delete;
        StopGuard &operator=(const StopGuard &) = delete;

      private:
        transport::Transport &transport_;
    };

    /// Drives the robot to the configured target over a Transport.
    ///
    /// Each tick fetches odometry and sensors, steps the ControlCycle and sends
    /// the command. A failed fetch or send skips the tick and backs off. Whatever
    /// the exit path, a final stop is sent and the transport is closed.
    class Navigator {
      public:
        // Delay hook, replaceable for tests
        using SleepFn = std::function<void(double seconds)>;

        /// Throws ConfigError on an invalid configuration.
        Navigator(const NavConfig &config, transport::Transport &transport);

        RunResult run(const std::atomic<bool> &cancel);

        const RunStats &stats() const { return stats_; }
        const nav::ControlCycle &cycle() const { return cycle_; }

        void set_sleep(SleepFn sleep) { sleep_ = std::move(sleep); }

        /// Called after every tick that produced a command (for visualization).
        void set_observer(std::function<void(const nav::CycleOutcome &)> observer) {
            observer_ = std::move(observer);
        }

      private:
        bool capture_base(const std::atomic<bool> &cancel);
        bool record_failure(const std::string &what);

        NavConfig config_;
        transport::Transport &transport_;
        nav::ControlCycle cycle_;
        RunStats stats_;
        std::size_t consecutive_failures_ = 0;
        SleepFn sleep_;
        std::function<void(const nav::CycleOutcome &)> observer_;
    };

} // namespace fuzzynav
