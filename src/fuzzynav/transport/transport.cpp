#include "fuzzynav/transport/transport.hpp"
#include "fuzzynav/utils/math.hpp"
#include <algorithm>

namespace fuzzynav {
    namespace transport {

        Point OdometryFrame::position() const {
            Point p;
            p.x = fields.size() > 0 ? fields[0] : 0.0;
            p.y = fields.size() > 1 ? fields[1] : 0.0;
            return p;
        }

        SensorFrame map_sensor_array(const std::vector<double> &raw) {
            SensorFrame frame;
            if (raw.size() != RAW_SENSOR_COUNT) {
                frame.status_message = "Expected " + std::to_string(RAW_SENSOR_COUNT) + " sensor readings, got " +
                                       std::to_string(raw.size());
                return frame;
            }
            for (size_t i = 0; i < raw.size(); ++i) {
                if (!utils::Math::is_finite(raw[i])) {
                    frame.status_message = "Sensor " + std::to_string(i) + " reading is not finite";
                    return frame;
                }
            }

            auto &d = frame.distances;
            d[sensor_index(Sensor::LEFT_FRONT)] = raw[1];
            d[sensor_index(Sensor::LEFT_REAR)] = raw[2];
            d[sensor_index(Sensor::FRONT)] = raw[0];
            d[sensor_index(Sensor::RIGHT_FRONT)] = raw[8];
            d[sensor_index(Sensor::RIGHT_REAR)] = raw[7];
            d[sensor_index(Sensor::BACK_LEFT)] = std::min(raw[3], raw[4]);
            d[sensor_index(Sensor::BACK_RIGHT)] = std::min(raw[6], raw[5]);

            frame.valid = true;
            return frame;
        }

        OdometryFrame make_odometry(const std::vector<double> &fields) {
            OdometryFrame frame;
            frame.fields = fields;
            if (fields.size() < 2) {
                frame.status_message = "Odometry needs at least x and y, got " + std::to_string(fields.size()) +
                                       " fields";
                return frame;
            }
            if (!utils::Math::is_finite(fields[0]) || !utils::Math::is_finite(fields[1])) {
                frame.status_message = "Odometry position is not finite";
                return frame;
            }
            frame.valid = true;
            return frame;
        }

    } // namespace transport
} // namespace fuzzynav
