#include "fuzzynav/types.hpp"

namespace fuzzynav {

    const std::array<Sensor, SENSOR_COUNT> &all_sensors() {
        static const std::array<Sensor, SENSOR_COUNT> sensors = {Sensor::LEFT_FRONT,  Sensor::LEFT_REAR,
                                                                 Sensor::FRONT,       Sensor::RIGHT_FRONT,
                                                                 Sensor::RIGHT_REAR,  Sensor::BACK_LEFT,
                                                                 Sensor::BACK_RIGHT};
        return sensors;
    }

    const char *sensor_name(Sensor sensor) {
        switch (sensor) {
        case Sensor::LEFT_FRONT:
            return "left_front";
        case Sensor::LEFT_REAR:
            return "left_rear";
        case Sensor::FRONT:
            return "front";
        case Sensor::RIGHT_FRONT:
            return "right_front";
        case Sensor::RIGHT_REAR:
            return "right_rear";
        case Sensor::BACK_LEFT:
            return "back_left";
        case Sensor::BACK_RIGHT:
            return "back_right";
        }
        return "unknown";
    }

} // namespace fuzzynav
