#pragma once

#include <algorithm>
#include <cmath>

namespace fuzzynav {
    namespace utils {

        class Math {
          public:
            // Clamp into [-limit, limit]; in-range values pass through unchanged
            static double clamp_symmetric(double value, double limit) { return std::clamp(value, -limit, limit); }

            static bool is_finite(double value) { return std::isfinite(value); }

            // Fraction of the way from a to b, for a < b
            static double ramp(double x, double a, double b) { return (x - a) / (b - a); }
        };

    } // namespace utils
} // namespace fuzzynav
