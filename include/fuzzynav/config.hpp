#pragma once

#include "fuzzynav/types.hpp"

namespace fuzzynav {

    // Complete navigation configuration, immutable once handed to the controller
    struct NavConfig {
        // Target, relative to the odometry captured at start (m)
        Point target = default_target();
        double tolerance = 0.02; // Goal reached when distance <= tolerance (m)

        // Velocity limits
        double max_velocity = 0.30;            // Platform bound, symmetric (m/s)
        double decision_velocity_limit = 0.30; // Goal-mode clamp and output universe half-width (m/s)

        // Proximity sensing
        double obstacle_threshold = 0.20; // Obstacle mode when any reading is strictly below (m)
        double sensor_limit = 0.41;       // Maximum calibrated sensor distance (m)
        double proximity_band = 0.05;     // Width of the dangerous/safe crossover above the threshold (m)

        // Fuzzy universes
        double position_range = 2.0;  // Offset universe is [-range, range) (m)
        double universe_step = 0.01;  // Defuzzification sampling step

        // Loop timing
        double sample_period = 0.02; // Delay between cycles (s)
        double retry_backoff = 1.0;  // Delay after a failed fetch/send (s)

        // Loop policy
        size_t max_consecutive_failures = 0; // 0 = retry forever
        size_t max_cycles = 0;               // 0 = unlimited
        bool abort_on_decision_failure = false;

        /// Throws ConfigError describing the first invalid field.
        void validate() const;

        static Point default_target() {
            Point p;
            p.x = 1.0;
            p.y = 1.0;
            return p;
        }
    };

} // namespace fuzzynav
