#include "fuzzynav/config.hpp"
#include "fuzzynav/utils/math.hpp"
#include <string>

namespace fuzzynav {

    namespace {
        void require(bool condition, const std::string &message) {
            if (!condition) {
                throw ConfigError("invalid configuration: " + message);
            }
        }
    } // namespace

    void NavConfig::validate() const {
        require(utils::Math::is_finite(target.x) && utils::Math::is_finite(target.y), "target must be finite");
        require(tolerance > 0.0, "tolerance must be positive");
        require(max_velocity > 0.0, "max_velocity must be positive");
        require(decision_velocity_limit > 0.0, "decision_velocity_limit must be positive");
        require(sensor_limit > 0.0, "sensor_limit must be positive");
        require(proximity_band > 0.0, "proximity_band must be positive");
        require(obstacle_threshold > 0.0 && obstacle_threshold + proximity_band <= sensor_limit,
                "obstacle_threshold must lie in (0, sensor_limit - proximity_band]");
        // Far labels reach full degree at 0.25 m and run to the universe edge
        require(position_range >= 0.5, "position_range must be at least 0.5");
        require(universe_step > 0.0, "universe_step must be positive");
        require(sample_period >= 0.0, "sample_period must not be negative");
        require(retry_backoff >= 0.0, "retry_backoff must not be negative");
    }

} // namespace fuzzynav
