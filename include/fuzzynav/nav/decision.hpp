#pragma once

#include "fuzzynav/config.hpp"
#include "fuzzynav/fuzzy/engine.hpp"
#include "fuzzynav/types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace fuzzynav {
    namespace nav {

        // Which rule set governed a cycle
        enum class DecisionMode { GOAL, OBSTACLE };

        const char *to_string(DecisionMode mode);

        // Decision output: the command plus diagnostics
        struct Decision : public VelocityCommand {
            DecisionMode mode = DecisionMode::GOAL;
            std::vector<std::string> unfired; // Outputs forced to 0 because no rule fired
        };

        /// Chooses between goal tracking and obstacle avoidance each cycle.
        ///
        /// Obstacle mode engages when any reading is strictly below the obstacle
        /// threshold and returns the obstacle rule set's raw output. Goal mode runs
        /// the goal rule set, damps the weaker axis by min/max of the offsets and
        /// clamps to the decision velocity limit.
        class NavigationDecision {
          public:
            /// Builds both rule sets; throws ConfigError on an invalid configuration.
            explicit NavigationDecision(const NavConfig &config);

            /// Never throws for malformed inputs: a non-finite offset or reading, or
            /// an engine ConfigError, yields valid == false.
            Decision decide(double dx, double dy, const SensorReadings &sensors) const;

            /// True iff min(sensors) < obstacle_threshold.
            bool has_obstacles(const SensorReadings &sensors) const;

            /// Damp the weaker axis and clamp; returns {vx, vy}.
            std::pair<double, double> adjust_speeds(double dx, double dy, double vx, double vy) const;

            const fuzzy::InferenceEngine &goal_engine() const { return goal_engine_; }
            const fuzzy::InferenceEngine &obstacle_engine() const { return obstacle_engine_; }
            const NavConfig &config() const { return config_; }

          private:
            Decision move_to_target(double dx, double dy) const;
            Decision avoid_obstacles(double dx, double dy, const SensorReadings &sensors) const;

            NavConfig config_;
            fuzzy::InferenceEngine goal_engine_;
            fuzzy::InferenceEngine obstacle_engine_;
        };

    } // namespace nav
} // namespace fuzzynav
