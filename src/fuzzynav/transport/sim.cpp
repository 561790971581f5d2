#include "fuzzynav/transport/sim.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace fuzzynav {
    namespace transport {

        namespace {
            constexpr double SENSOR_SPACING = 2.0 * M_PI / static_cast<double>(RAW_SENSOR_COUNT); // 40 degrees

            Status failure(const std::string &message) {
                Status status;
                status.valid = false;
                status.status_message = message;
                return status;
            }

            bool injected(std::size_t call, std::size_t every) { return every > 0 && call % every == 0; }
        } // namespace

        SimTransport::SimTransport() : SimTransport(SimConfig{}) {}

        SimTransport::SimTransport(const SimConfig &sim_config)
            : sim_config_(sim_config), position_(sim_config.start) {}

        void SimTransport::add_obstacle(const Point &center, double radius) {
            obstacles_.push_back(CircleObstacle{center, radius});
        }

        Status SimTransport::open() {
            if (sim_config_.fail_open) {
                return failure("Simulated connection refused");
            }
            open_ = true;
            Status status;
            status.valid = true;
            status.status_message = "Connected to simulator";
            return status;
        }

        void SimTransport::close() {
            open_ = false;
            ++close_count_;
        }

        // Distance from the robot body along the ray to the nearest obstacle, capped at range
        double SimTransport::cast_ray(double angle) const {
            const double ux = std::cos(angle);
            const double uy = std::sin(angle);
            double nearest = std::numeric_limits<double>::infinity();

            for (const auto &obstacle : obstacles_) {
                const double ox = position_.x - obstacle.center.x;
                const double oy = position_.y - obstacle.center.y;
                const double b = ux * ox + uy * oy;
                const double c = ox * ox + oy * oy - obstacle.radius * obstacle.radius;
                if (c <= 0.0) {
                    return 0.0; // Inside the obstacle
                }
                const double disc = b * b - c;
                if (disc < 0.0) {
                    continue;
                }
                const double t = -b - std::sqrt(disc);
                if (t >= 0.0) {
                    nearest = std::min(nearest, t);
                }
            }

            if (!std::isfinite(nearest)) {
                return sim_config_.sensor_range;
            }
            return std::clamp(nearest - sim_config_.robot_radius, 0.0, sim_config_.sensor_range);
        }

        std::vector<double> SimTransport::raw_sensors() const {
            std::vector<double> raw(RAW_SENSOR_COUNT);
            for (std::size_t i = 0; i < RAW_SENSOR_COUNT; ++i) {
                raw[i] = cast_ray(static_cast<double>(i) * SENSOR_SPACING);
            }
            return raw;
        }

        SensorFrame SimTransport::fetch_sensors() {
            ++sensor_calls_;
            if (!open_) {
                SensorFrame frame;
                frame.status_message = "Simulator not connected";
                return frame;
            }
            if (injected(sensor_calls_, sim_config_.sensor_failure_every)) {
                SensorFrame frame;
                frame.status_message = "Simulated sensor timeout";
                return frame;
            }
            return map_sensor_array(raw_sensors());
        }

        OdometryFrame SimTransport::fetch_odometry() {
            ++odometry_calls_;
            if (!open_) {
                OdometryFrame frame;
                frame.status_message = "Simulator not connected";
                return frame;
            }
            if (injected(odometry_calls_, sim_config_.odometry_failure_every)) {
                OdometryFrame frame;
                frame.status_message = "Simulated odometry timeout";
                return frame;
            }
            // x, y, phi, vx, vy, omega, sequence
            return make_odometry({position_.x, position_.y, 0.0, vx_, vy_, 0.0, static_cast<double>(odometry_calls_)});
        }

        Status SimTransport::send_velocity(double vx, double vy, double omega) {
            if (!open_) {
                return failure("Simulator not connected");
            }
            if (!std::isfinite(vx) || !std::isfinite(vy) || !std::isfinite(omega)) {
                return failure("Rejected non-finite velocity");
            }

            VelocityCommand cmd;
            cmd.valid = true;
            cmd.linear_velocity = vx;
            cmd.lateral_velocity = vy;
            cmd.angular_velocity = omega;
            commands_.push_back(cmd);

            vx_ = vx;
            vy_ = vy;
            position_.x += vx * sim_config_.dt;
            position_.y += vy * sim_config_.dt;

            Status status;
            status.valid = true;
            status.status_message = "OK";
            return status;
        }

        std::string SimTransport::get_type() const { return "sim_transport"; }

    } // namespace transport
} // namespace fuzzynav
