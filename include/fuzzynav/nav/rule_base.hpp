#pragma once

#include "fuzzynav/config.hpp"
#include "fuzzynav/fuzzy/rule.hpp"
#include "fuzzynav/types.hpp"
#include <memory>

namespace fuzzynav {
    namespace nav {

        // Variable names shared by both rule sets
        constexpr const char *POSITION_X = "position_x";
        constexpr const char *POSITION_Y = "position_y";
        constexpr const char *VELOCITY_X = "velocity_x";
        constexpr const char *VELOCITY_Y = "velocity_y";

        // Closed label sets, one enum per kind of variable
        enum class Proximity { DANGEROUS, SAFE };
        enum class OffsetX { FAR_BACK, NEAR_BACK, CENTER, NEAR_FRONT, FAR_FRONT };
        enum class OffsetY { FAR_RIGHT, NEAR_RIGHT, CENTER, NEAR_LEFT, FAR_LEFT }; // Y+ is left
        enum class SpeedX { BACKWARD_FAST, BACKWARD_MED, BACKWARD_SLOW, STOP, FORWARD_SLOW, FORWARD_MED, FORWARD_FAST };
        enum class SpeedY { RIGHT_FAST, RIGHT_MED, RIGHT_SLOW, STOP, LEFT_SLOW, LEFT_MED, LEFT_FAST };

        const char *label(Proximity p);
        const char *label(OffsetX o);
        const char *label(OffsetY o);
        const char *label(SpeedX s);
        const char *label(SpeedY s);

        // Antecedent terms
        fuzzy::Expression is(Sensor sensor, Proximity p);
        fuzzy::Expression is(OffsetX o);
        fuzzy::Expression is(OffsetY o);

        // Consequents
        fuzzy::Consequent set(SpeedX s, double weight = 1.0);
        fuzzy::Consequent set(SpeedY s, double weight = 1.0);

        // Linguistic variables; shapes scale with the configured ranges
        fuzzy::FuzzyVariable make_position_x(const NavConfig &config);
        fuzzy::FuzzyVariable make_position_y(const NavConfig &config);
        fuzzy::FuzzyVariable make_sensor(Sensor sensor, const NavConfig &config);
        fuzzy::FuzzyVariable make_velocity_x(const NavConfig &config);
        fuzzy::FuzzyVariable make_velocity_y(const NavConfig &config);

        /// Goal tracking: one rule per offset label per axis.
        std::shared_ptr<const fuzzy::RuleSet> make_goal_rules(const NavConfig &config);

        /// Obstacle avoidance over the seven sensors plus the target offset.
        std::shared_ptr<const fuzzy::RuleSet> make_obstacle_rules(const NavConfig &config);

    } // namespace nav
} // namespace fuzzynav
