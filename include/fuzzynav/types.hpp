#pragma once

#include "datapod/spatial.hpp"
#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace fuzzynav {

    // Use Datapod types directly
    using Point = datapod::Point;

    /// Malformed variable, rule or configuration definition.
    /// Thrown from constructors; fatal at startup.
    class ConfigError : public std::runtime_error {
      public:
        explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
    };

    // Logical proximity sensor order
    enum class Sensor : std::size_t {
        LEFT_FRONT = 0,
        LEFT_REAR,
        FRONT,
        RIGHT_FRONT,
        RIGHT_REAR,
        BACK_LEFT, // min of the two rear-left physical sensors
        BACK_RIGHT // min of the two rear-right physical sensors
    };

    constexpr std::size_t SENSOR_COUNT = 7;

    // Calibrated distances in Sensor order (m)
    using SensorReadings = std::array<double, SENSOR_COUNT>;

    /// All sensors in logical order.
    const std::array<Sensor, SENSOR_COUNT> &all_sensors();

    /// Variable name used for a sensor in the rule base, e.g. "left_front".
    const char *sensor_name(Sensor sensor);

    inline std::size_t sensor_index(Sensor sensor) { return static_cast<std::size_t>(sensor); }

    // Base control output
    struct ControlOutput {
        bool valid = false;
        std::string status_message;
    };

    // Velocity-based output for an omnidirectional base
    struct VelocityCommand : public ControlOutput {
        double linear_velocity = 0.0;  // X, forward positive (m/s)
        double lateral_velocity = 0.0; // Y, left positive (m/s)
        double angular_velocity = 0.0; // Always 0 for this controller (rad/s)
    };

    /// Valid all-zero command.
    inline VelocityCommand stop_command(const std::string &message = "Stop") {
        VelocityCommand cmd;
        cmd.valid = true;
        cmd.status_message = message;
        return cmd;
    }

} // namespace fuzzynav
