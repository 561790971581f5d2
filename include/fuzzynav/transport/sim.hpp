#pragma once

#include "fuzzynav/transport/transport.hpp"
#include <cstddef>
#include <vector>

namespace fuzzynav {
    namespace transport {

        // Round obstacle in the world frame
        struct CircleObstacle {
            Point center;
            double radius = 0.1;
        };

        /// Kinematic omnidirectional robot with nine ray-cast proximity sensors.
        /// Heading stays fixed at 0, so robot X/Y are world X/Y.
        class SimTransport : public Transport {
          public:
            struct SimConfig {
                double robot_radius = 0.2;  // Sensors measure from the body (m)
                double sensor_range = 0.41; // Readings saturate here (m)
                double dt = 0.05;           // Time integrated per velocity command (s)
                Point start = origin();     // Initial world position

                // Failure injection: every n-th call fails, 0 disables
                std::size_t sensor_failure_every = 0;
                std::size_t odometry_failure_every = 0;
                bool fail_open = false;

                static Point origin() {
                    Point p;
                    p.x = 0.0;
                    p.y = 0.0;
                    return p;
                }
            };

            SimTransport();
            explicit SimTransport(const SimConfig &sim_config);

            void add_obstacle(const Point &center, double radius);

            Status open() override;
            void close() override;
            bool is_open() const override { return open_; }

            SensorFrame fetch_sensors() override;
            OdometryFrame fetch_odometry() override;
            Status send_velocity(double vx, double vy, double omega) override;

            std::string get_type() const override;

            /// Physical readings in hardware order (index 0 front, counter-clockwise).
            std::vector<double> raw_sensors() const;

            const Point &position() const { return position_; }
            const std::vector<CircleObstacle> &obstacles() const { return obstacles_; }
            const std::vector<VelocityCommand> &commands() const { return commands_; }
            std::size_t close_count() const { return close_count_; }

          private:
            double cast_ray(double angle) const;

            SimConfig sim_config_;
            std::vector<CircleObstacle> obstacles_;
            std::vector<VelocityCommand> commands_;
            Point position_;
            double vx_ = 0.0;
            double vy_ = 0.0;
            bool open_ = false;
            std::size_t sensor_calls_ = 0;
            std::size_t odometry_calls_ = 0;
            std::size_t close_count_ = 0;
        };

    } // namespace transport
} // namespace fuzzynav
