#include "fuzzynav/nav/decision.hpp"
#include "fuzzynav/nav/rule_base.hpp"
#include "fuzzynav/utils/math.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace fuzzynav {
    namespace nav {

        namespace {
            const NavConfig &validated(const NavConfig &config) {
                config.validate();
                return config;
            }

            // Keeps the damping ratio finite when the robot sits on the target
            constexpr double MIN_MAIN_AXIS = 1e-4;

            std::string join(const std::vector<std::string> &items) {
                std::string out;
                for (const auto &item : items) {
                    if (!out.empty()) out += ", ";
                    out += item;
                }
                return out;
            }
        } // namespace

        const char *to_string(DecisionMode mode) { return mode == DecisionMode::OBSTACLE ? "obstacle" : "goal"; }

        NavigationDecision::NavigationDecision(const NavConfig &config)
            : config_(validated(config)), goal_engine_(make_goal_rules(config_)),
              obstacle_engine_(make_obstacle_rules(config_)) {
            spdlog::debug("Navigation decision ready: {} goal rules, {} obstacle rules",
                          goal_engine_.rule_set().size(), obstacle_engine_.rule_set().size());
        }

        bool NavigationDecision::has_obstacles(const SensorReadings &sensors) const {
            return std::any_of(sensors.begin(), sensors.end(),
                               [this](double s) { return s < config_.obstacle_threshold; });
        }

        std::pair<double, double> NavigationDecision::adjust_speeds(double dx, double dy, double vx, double vy) const {
            const double ax = std::abs(dx);
            const double ay = std::abs(dy);
            const double main_axis = std::max({ax, ay, MIN_MAIN_AXIS});
            const double scale = std::min(ax, ay) / main_axis;

            if (ax > ay) {
                vy *= scale;
            } else {
                vx *= scale;
            }

            const double limit = config_.decision_velocity_limit;
            return {utils::Math::clamp_symmetric(vx, limit), utils::Math::clamp_symmetric(vy, limit)};
        }

        Decision NavigationDecision::decide(double dx, double dy, const SensorReadings &sensors) const {
            Decision decision;

            if (!utils::Math::is_finite(dx) || !utils::Math::is_finite(dy)) {
                decision.status_message = "Decision failed: non-finite target offset";
                return decision;
            }
            for (Sensor s : all_sensors()) {
                if (!utils::Math::is_finite(sensors[sensor_index(s)])) {
                    decision.status_message = std::string("Decision failed: non-finite reading from ") + sensor_name(s);
                    return decision;
                }
            }

            try {
                if (has_obstacles(sensors)) {
                    return avoid_obstacles(dx, dy, sensors);
                }
                return move_to_target(dx, dy);
            } catch (const ConfigError &e) {
                spdlog::warn("Inference failed: {}", e.what());
                decision.valid = false;
                decision.status_message = std::string("Decision failed: ") + e.what();
                return decision;
            }
        }

        Decision NavigationDecision::move_to_target(double dx, double dy) const {
            const auto result = goal_engine_.compute({{POSITION_X, dx}, {POSITION_Y, dy}});

            const double vx = result.outputs.at(VELOCITY_X);
            const double vy = result.outputs.at(VELOCITY_Y);
            const auto adjusted = adjust_speeds(dx, dy, vx, vy);

            Decision decision;
            decision.valid = true;
            decision.mode = DecisionMode::GOAL;
            decision.linear_velocity = adjusted.first;
            decision.lateral_velocity = adjusted.second;
            decision.unfired = result.unfired;
            decision.status_message = "Tracking goal";

            if (!result.complete()) {
                spdlog::warn("Goal rules: no rule fired for {} (dx={:.3f}, dy={:.3f})", join(result.unfired), dx, dy);
            }
            spdlog::debug("Goal mode: raw ({:.3f}, {:.3f}) -> ({:.3f}, {:.3f})", vx, vy, adjusted.first,
                          adjusted.second);
            return decision;
        }

        Decision NavigationDecision::avoid_obstacles(double dx, double dy, const SensorReadings &sensors) const {
            fuzzy::CrispValues inputs;
            for (Sensor s : all_sensors()) {
                inputs[sensor_name(s)] = sensors[sensor_index(s)];
            }
            inputs[POSITION_Y] = dy;
            inputs[POSITION_X] = dx;

            const auto result = obstacle_engine_.compute(inputs);

            Decision decision;
            decision.valid = true;
            decision.mode = DecisionMode::OBSTACLE;
            decision.linear_velocity = result.outputs.at(VELOCITY_X);
            decision.lateral_velocity = result.outputs.at(VELOCITY_Y);
            decision.unfired = result.unfired;
            decision.status_message = "Avoiding obstacle";

            if (!result.complete()) {
                spdlog::warn("Obstacle rules: no rule fired for {}", join(result.unfired));
            }
            spdlog::debug("Obstacle mode: {} of {} rules fired -> ({:.3f}, {:.3f})", result.rules_fired(),
                          result.firing.size(), decision.linear_velocity, decision.lateral_velocity);
            return decision;
        }

    } // namespace nav
} // namespace fuzzynav
