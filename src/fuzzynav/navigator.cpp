#include "fuzzynav/navigator.hpp"
#include <chrono>
#include <exception>
#include <spdlog/spdlog.h>
#include <thread>

namespace fuzzynav {

    const char *to_string(RunResult result) {
        switch (result) {
        case RunResult::REACHED:
            return "reached";
        case RunResult::CANCELLED:
            return "cancelled";
        case RunResult::TRANSPORT_FAILED:
            return "transport_failed";
        case RunResult::ABORTED:
            return "aborted";
        case RunResult::CYCLE_LIMIT:
            return "cycle_limit";
        }
        return "unknown";
    }

    StopGuard::~StopGuard() {
        try {
            const auto status = transport_.send_velocity(0.0, 0.0, 0.0);
            if (status.valid) {
                spdlog::info("Final stop sent");
            } else {
                spdlog::warn("Final stop failed: {}", status.status_message);
            }
            transport_.close();
        } catch (const std::exception &e) {
            spdlog::error("Stopping {} failed: {}", transport_.get_type(), e.what());
        }
    }

    Navigator::Navigator(const NavConfig &config, transport::Transport &transport)
        : config_(config), transport_(transport), cycle_(config) {
        sleep_ = [](double seconds) {
            if (seconds > 0.0) {
                std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
            }
        };
    }

    bool Navigator::record_failure(const std::string &what) {
        ++stats_.transport_failures;
        ++consecutive_failures_;
        spdlog::warn("Transport failure ({} in a row): {}", consecutive_failures_, what);

        if (config_.max_consecutive_failures > 0 && consecutive_failures_ >= config_.max_consecutive_failures) {
            spdlog::error("Giving up after {} consecutive transport failures", consecutive_failures_);
            return false;
        }
        sleep_(config_.retry_backoff);
        return true;
    }

    bool Navigator::capture_base(const std::atomic<bool> &cancel) {
        while (!cancel.load()) {
            const auto odometry = transport_.fetch_odometry();
            if (odometry.valid) {
                cycle_.set_base(odometry.position());
                consecutive_failures_ = 0;
                spdlog::info("Base odometry ({:.3f}, {:.3f})", odometry.position().x, odometry.position().y);
                return true;
            }
            if (!record_failure("base odometry: " + odometry.status_message)) {
                return false;
            }
        }
        return false;
    }

    RunResult Navigator::run(const std::atomic<bool> &cancel) {
        stats_ = RunStats{};
        consecutive_failures_ = 0;

        const auto opened = transport_.open();
        if (!opened.valid) {
            spdlog::error("Cannot open {}: {}", transport_.get_type(), opened.status_message);
            return RunResult::TRANSPORT_FAILED;
        }
        StopGuard guard(transport_);

        spdlog::info("Navigating to ({:.2f}, {:.2f}) over {}", config_.target.x, config_.target.y,
                     transport_.get_type());

        if (!capture_base(cancel)) {
            if (cancel.load()) {
                spdlog::info("Navigation cancelled before start");
                return RunResult::CANCELLED;
            }
            spdlog::error("No base odometry, aborting");
            return RunResult::TRANSPORT_FAILED;
        }

        while (!cancel.load()) {
            if (config_.max_cycles > 0 && stats_.cycles >= config_.max_cycles) {
                spdlog::warn("Cycle limit of {} reached {:.3f} m from the target", config_.max_cycles,
                             stats_.final_distance);
                return RunResult::CYCLE_LIMIT;
            }

            // Never act on stale data: a failed fetch skips the whole tick
            const auto odometry = transport_.fetch_odometry();
            if (!odometry.valid) {
                if (!record_failure("odometry: " + odometry.status_message)) return RunResult::TRANSPORT_FAILED;
                continue;
            }
            const auto sensors = transport_.fetch_sensors();
            if (!sensors.valid) {
                if (!record_failure("sensors: " + sensors.status_message)) return RunResult::TRANSPORT_FAILED;
                continue;
            }

            ++stats_.cycles;
            const auto outcome = cycle_.step(odometry.position(), sensors.distances);
            stats_.final_distance = outcome.distance;
            if (observer_) observer_(outcome);

            switch (outcome.kind) {
            case nav::CycleOutcome::Kind::DONE:
                spdlog::info("Target reached after {} cycles ({:.3f} m)", stats_.cycles, outcome.distance);
                return RunResult::REACHED;

            case nav::CycleOutcome::Kind::DECISION_FAILED: {
                ++stats_.decision_failures;
                spdlog::warn("{}; commanding zero velocity", outcome.command.status_message);
                const auto status = transport_.send_velocity(0.0, 0.0, 0.0);
                if (config_.abort_on_decision_failure) {
                    spdlog::error("Aborting on decision failure");
                    return RunResult::ABORTED;
                }
                if (!status.valid) {
                    if (!record_failure("send: " + status.status_message)) return RunResult::TRANSPORT_FAILED;
                    continue;
                }
                consecutive_failures_ = 0;
                break;
            }

            case nav::CycleOutcome::Kind::CONTINUE: {
                if (outcome.mode == nav::DecisionMode::OBSTACLE) ++stats_.obstacle_cycles;
                const auto &cmd = outcome.command;
                const auto status = transport_.send_velocity(cmd.linear_velocity, cmd.lateral_velocity, 0.0);
                if (!status.valid) {
                    if (!record_failure("send: " + status.status_message)) return RunResult::TRANSPORT_FAILED;
                    continue;
                }
                consecutive_failures_ = 0;
                spdlog::debug("Sent ({:.3f}, {:.3f}) in {} mode, {:.3f} m to go", cmd.linear_velocity,
                              cmd.lateral_velocity, nav::to_string(outcome.mode), outcome.distance);
                break;
            }
            }

            sleep_(config_.sample_period);
        }

        spdlog::info("Navigation cancelled after {} cycles", stats_.cycles);
        return RunResult::CANCELLED;
    }

} // namespace fuzzynav
