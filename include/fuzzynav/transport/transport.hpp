#pragma once

#include "fuzzynav/types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace fuzzynav {
    namespace transport {

        // Physical proximity sensors, 40 degrees apart counter-clockwise from the front
        constexpr std::size_t RAW_SENSOR_COUNT = 9;

        // Outcome of a command send; valid == false is a transport error
        using Status = ControlOutput;

        // Seven logical distances
        struct SensorFrame : public ControlOutput {
            SensorReadings distances{};
        };

        // Odometry fields as reported, x and y first
        struct OdometryFrame : public ControlOutput {
            std::vector<double> fields;

            Point position() const;
        };

        /// Nine physical readings -> seven logical ones:
        /// left_front=raw[1], left_rear=raw[2], front=raw[0], right_front=raw[8],
        /// right_rear=raw[7], back_left=min(raw[3], raw[4]), back_right=min(raw[6], raw[5]).
        /// Any other count or a non-finite value gives valid == false.
        SensorFrame map_sensor_array(const std::vector<double> &raw);

        /// Valid when at least two finite leading fields (x, y) are present.
        OdometryFrame make_odometry(const std::vector<double> &fields);

        /// Abstract robot I/O. Implementations report failures through valid == false
        /// rather than throwing.
        class Transport {
          public:
            virtual ~Transport() = default;

            virtual Status open() = 0;
            virtual void close() = 0;
            virtual bool is_open() const = 0;

            virtual SensorFrame fetch_sensors() = 0;
            virtual OdometryFrame fetch_odometry() = 0;
            virtual Status send_velocity(double vx, double vy, double omega) = 0;

            /// Transport type name.
            virtual std::string get_type() const = 0;
        };

    } // namespace transport
} // namespace fuzzynav
