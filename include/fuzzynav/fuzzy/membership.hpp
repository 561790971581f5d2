#pragma once

#include <array>
#include <string>

namespace fuzzynav {
    namespace fuzzy {

        /// Piecewise-linear membership function (triangle or trapezoid).
        ///
        /// A triangle (a, b, c) is stored as the trapezoid (a, b, b, c). A coincident
        /// pair of outer points is a vertical edge, so (0, 0, 0.2, 0.25) is a left
        /// shoulder with degree 1 at x = 0.
        class MembershipFunction {
          public:
            enum class Kind { TRIANGULAR, TRAPEZOIDAL };

            /// Throws ConfigError unless a <= b <= c and all points are finite.
            static MembershipFunction triangular(double a, double b, double c);

            /// Throws ConfigError unless a <= b <= c <= d and all points are finite.
            static MembershipFunction trapezoidal(double a, double b, double c, double d);

            /// Degree of membership of x, always in [0, 1] and 0 outside [first, last].
            double degree(double x) const;

            Kind kind() const { return kind_; }
            const std::array<double, 4> &points() const { return points_; }
            double first() const { return points_[0]; }
            double last() const { return points_[3]; }

            std::string to_string() const;

          private:
            MembershipFunction(Kind kind, const std::array<double, 4> &points);

            Kind kind_;
            std::array<double, 4> points_;
        };

    } // namespace fuzzy
} // namespace fuzzynav
