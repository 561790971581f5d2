#ifdef HAS_RERUN

#include "fuzzynav/utils/visualize.hpp"
#include <cmath>
#include <string>

namespace fuzzynav {
    namespace visualize {

        namespace {
            std::vector<rerun::Position3D> circle(const Point &center, double radius, int segments = 32) {
                std::vector<rerun::Position3D> points;
                for (int i = 0; i <= segments; ++i) {
                    const double a = 2.0 * M_PI * static_cast<double>(i) / static_cast<double>(segments);
                    points.emplace_back(static_cast<float>(center.x + radius * std::cos(a)),
                                        static_cast<float>(center.y + radius * std::sin(a)), 0.0f);
                }
                return points;
            }
        } // namespace

        void show_robot(std::shared_ptr<rerun::RecordingStream> rec, const Point &position, double radius,
                        const std::vector<double> &raw_sensors, const std::string &entity_path,
                        const rerun::Color &color) {
            rec->log(entity_path + "/body",
                     rerun::LineStrips3D(rerun::components::LineStrip3D(circle(position, radius)))
                         .with_colors(color)
                         .with_radii(0.01f));

            // One ray per physical sensor, 40 degrees apart counter-clockwise from the front
            std::vector<rerun::components::LineStrip3D> rays;
            for (size_t i = 0; i < raw_sensors.size(); ++i) {
                const double a = 2.0 * M_PI * static_cast<double>(i) / static_cast<double>(raw_sensors.size());
                const double start = radius;
                const double end = radius + raw_sensors[i];
                std::vector<rerun::Position3D> ray = {
                    {static_cast<float>(position.x + start * std::cos(a)),
                     static_cast<float>(position.y + start * std::sin(a)), 0.0f},
                    {static_cast<float>(position.x + end * std::cos(a)),
                     static_cast<float>(position.y + end * std::sin(a)), 0.0f}};
                rays.emplace_back(ray);
            }
            rec->log(entity_path + "/sensors",
                     rerun::LineStrips3D(rays).with_colors(rerun::Color(0, 200, 255)).with_radii(0.005f));
        }

        void show_goal(std::shared_ptr<rerun::RecordingStream> rec, const Point &goal, const std::string &entity_path,
                       const rerun::Color &color) {
            rec->log_static(entity_path,
                            rerun::Points3D({{static_cast<float>(goal.x), static_cast<float>(goal.y), 0.0f}})
                                .with_colors(color)
                                .with_radii(0.05f));
        }

        void show_obstacles(std::shared_ptr<rerun::RecordingStream> rec,
                            const std::vector<transport::CircleObstacle> &obstacles, const std::string &entity_path,
                            const rerun::Color &color) {
            std::vector<rerun::components::LineStrip3D> outlines;
            for (const auto &obstacle : obstacles) {
                outlines.emplace_back(circle(obstacle.center, obstacle.radius));
            }
            if (!outlines.empty()) {
                rec->log_static(entity_path, rerun::LineStrips3D(outlines).with_colors(color).with_radii(0.01f));
            }
        }

        void show_command(std::shared_ptr<rerun::RecordingStream> rec, const Point &position,
                          const nav::CycleOutcome &outcome, const std::string &entity_path) {
            const bool avoiding = outcome.mode == nav::DecisionMode::OBSTACLE;
            const rerun::Color color = avoiding ? rerun::Color(255, 120, 0) : rerun::Color(0, 200, 0);

            // Scale so that 0.3 m/s draws as 0.3 m
            std::vector<rerun::Position3D> arrow = {
                {static_cast<float>(position.x), static_cast<float>(position.y), 0.0f},
                {static_cast<float>(position.x + outcome.command.linear_velocity),
                 static_cast<float>(position.y + outcome.command.lateral_velocity), 0.0f}};
            rec->log(entity_path, rerun::LineStrips3D(rerun::components::LineStrip3D(arrow))
                                      .with_colors(color)
                                      .with_radii(0.015f));

            std::string text = std::string(nav::to_string(outcome.kind)) + " / " + nav::to_string(outcome.mode) +
                               ": " + outcome.command.status_message + ", distance " +
                               std::to_string(outcome.distance);
            rec->log(entity_path + "/status", rerun::TextLog(text).with_level(rerun::TextLogLevel::Info));
        }

    } // namespace visualize
} // namespace fuzzynav

#endif // HAS_RERUN
