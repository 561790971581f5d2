#pragma once

#include "fuzzynav/config.hpp"
#include "fuzzynav/nav/decision.hpp"
#include "fuzzynav/types.hpp"
#include <cmath>
#include <string>

namespace fuzzynav {
    namespace nav {

        // Remaining displacement to the target
        struct Offset {
            double dx = 0.0;
            double dy = 0.0;

            double distance() const { return std::hypot(dx, dy); }
        };

        // Result of one control iteration
        struct CycleOutcome {
            enum class Kind { CONTINUE, DONE, DECISION_FAILED };

            Kind kind = Kind::CONTINUE;
            VelocityCommand command; // Clamped velocity, or a zero command for DONE / DECISION_FAILED
            DecisionMode mode = DecisionMode::GOAL;
            double distance = 0.0;
        };

        const char *to_string(CycleOutcome::Kind kind);

        /// One control iteration: goal test, decision, platform clamp.
        class ControlCycle {
          public:
            /// Throws ConfigError on an invalid configuration.
            explicit ControlCycle(const NavConfig &config);

            /// Odometry captured at start; offsets are measured from it.
            void set_base(const Point &base);
            const Point &base() const { return base_; }

            /// dx = Px - (x - bx), dy = Py - (y - by).
            Offset offset(const Point &odometry) const;

            /// DONE when hypot(dx, dy) <= tolerance, whatever the sensors say.
            CycleOutcome step(double dx, double dy, const SensorReadings &sensors) const;
            CycleOutcome step(const Point &odometry, const SensorReadings &sensors) const;

            const NavigationDecision &decision() const { return decision_; }
            const NavConfig &config() const { return decision_.config(); }

          private:
            NavigationDecision decision_;
            Point base_;
        };

    } // namespace nav
} // namespace fuzzynav
