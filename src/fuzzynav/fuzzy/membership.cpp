#include "fuzzynav/fuzzy/membership.hpp"
#include "fuzzynav/types.hpp"
#include "fuzzynav/utils/math.hpp"
#include <sstream>

namespace fuzzynav {
    namespace fuzzy {

        namespace {
            void check_points(const std::array<double, 4> &points, const char *shape) {
                for (size_t i = 0; i < points.size(); ++i) {
                    if (!utils::Math::is_finite(points[i])) {
                        throw ConfigError(std::string(shape) + " membership point is not finite");
                    }
                    if (i > 0 && points[i] < points[i - 1]) {
                        throw ConfigError(std::string(shape) + " membership points must be non-decreasing");
                    }
                }
            }
        } // namespace

        MembershipFunction::MembershipFunction(Kind kind, const std::array<double, 4> &points)
            : kind_(kind), points_(points) {}

        MembershipFunction MembershipFunction::triangular(double a, double b, double c) {
            std::array<double, 4> points = {a, b, b, c};
            check_points(points, "triangular");
            return MembershipFunction(Kind::TRIANGULAR, points);
        }

        MembershipFunction MembershipFunction::trapezoidal(double a, double b, double c, double d) {
            std::array<double, 4> points = {a, b, c, d};
            check_points(points, "trapezoidal");
            return MembershipFunction(Kind::TRAPEZOIDAL, points);
        }

        double MembershipFunction::degree(double x) const {
            const double a = points_[0];
            const double b = points_[1];
            const double c = points_[2];
            const double d = points_[3];

            if (!utils::Math::is_finite(x) || x < a || x > d) {
                return 0.0;
            }
            if (x >= b && x <= c) {
                return 1.0;
            }
            // a <= x < b implies a < b, and c < x <= d implies c < d
            if (x < b) {
                return utils::Math::ramp(x, a, b);
            }
            return 1.0 - utils::Math::ramp(x, c, d);
        }

        std::string MembershipFunction::to_string() const {
            std::ostringstream out;
            if (kind_ == Kind::TRIANGULAR) {
                out << "tri(" << points_[0] << ", " << points_[1] << ", " << points_[3] << ")";
            } else {
                out << "trap(" << points_[0] << ", " << points_[1] << ", " << points_[2] << ", " << points_[3] << ")";
            }
            return out.str();
        }

    } // namespace fuzzy
} // namespace fuzzynav
