#pragma once

#ifdef HAS_RERUN

#include "fuzzynav/nav/cycle.hpp"
#include "fuzzynav/transport/sim.hpp"
#include "fuzzynav/types.hpp"
#include <memory>
#include <rerun.hpp>
#include <rerun/recording_stream.hpp>
#include <rerun/result.hpp>
#include <string>
#include <vector>

namespace fuzzynav {
    namespace visualize {

        // Show the round robot body and its sensor rays
        void show_robot(std::shared_ptr<rerun::RecordingStream> rec, const Point &position, double radius,
                        const std::vector<double> &raw_sensors, const std::string &entity_path = "robot",
                        const rerun::Color &color = {255, 255, 0});

        // Show goal as a simple point
        void show_goal(std::shared_ptr<rerun::RecordingStream> rec, const Point &goal,
                       const std::string &entity_path = "goal", const rerun::Color &color = {0, 255, 0});

        // Show obstacles as circles
        void show_obstacles(std::shared_ptr<rerun::RecordingStream> rec,
                            const std::vector<transport::CircleObstacle> &obstacles,
                            const std::string &entity_path = "obstacles", const rerun::Color &color = {255, 0, 0});

        // Show the commanded velocity as an arrow from the robot, colored by mode
        void show_command(std::shared_ptr<rerun::RecordingStream> rec, const Point &position,
                          const nav::CycleOutcome &outcome, const std::string &entity_path = "command");

    } // namespace visualize
} // namespace fuzzynav

#endif // HAS_RERUN
