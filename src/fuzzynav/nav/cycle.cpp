#include "fuzzynav/nav/cycle.hpp"
#include "fuzzynav/utils/math.hpp"
#include <spdlog/spdlog.h>

namespace fuzzynav {
    namespace nav {

        const char *to_string(CycleOutcome::Kind kind) {
            switch (kind) {
            case CycleOutcome::Kind::CONTINUE:
                return "continue";
            case CycleOutcome::Kind::DONE:
                return "done";
            case CycleOutcome::Kind::DECISION_FAILED:
                return "decision_failed";
            }
            return "unknown";
        }

        ControlCycle::ControlCycle(const NavConfig &config) : decision_(config) {
            base_.x = 0.0;
            base_.y = 0.0;
        }

        void ControlCycle::set_base(const Point &base) { base_ = base; }

        Offset ControlCycle::offset(const Point &odometry) const {
            const auto &target = config().target;
            Offset off;
            off.dx = target.x - (odometry.x - base_.x);
            off.dy = target.y - (odometry.y - base_.y);
            return off;
        }

        CycleOutcome ControlCycle::step(const Point &odometry, const SensorReadings &sensors) const {
            const Offset off = offset(odometry);
            return step(off.dx, off.dy, sensors);
        }

        CycleOutcome ControlCycle::step(double dx, double dy, const SensorReadings &sensors) const {
            CycleOutcome outcome;
            outcome.distance = std::hypot(dx, dy);

            if (outcome.distance <= config().tolerance) {
                outcome.kind = CycleOutcome::Kind::DONE;
                outcome.command = stop_command("Goal reached");
                return outcome;
            }

            const Decision decision = decision_.decide(dx, dy, sensors);
            outcome.mode = decision.mode;

            if (!decision.valid) {
                outcome.kind = CycleOutcome::Kind::DECISION_FAILED;
                outcome.command = stop_command(decision.status_message);
                return outcome;
            }

            const double limit = config().max_velocity;
            outcome.kind = CycleOutcome::Kind::CONTINUE;
            outcome.command.valid = true;
            outcome.command.status_message = decision.status_message;
            outcome.command.linear_velocity = utils::Math::clamp_symmetric(decision.linear_velocity, limit);
            outcome.command.lateral_velocity = utils::Math::clamp_symmetric(decision.lateral_velocity, limit);
            outcome.command.angular_velocity = 0.0;

            spdlog::debug("Cycle: distance {:.3f}, {} mode, command ({:.3f}, {:.3f})", outcome.distance,
                          to_string(outcome.mode), outcome.command.linear_velocity,
                          outcome.command.lateral_velocity);
            return outcome;
        }

    } // namespace nav
} // namespace fuzzynav
