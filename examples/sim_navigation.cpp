#include "fuzzynav.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    std::atomic<bool> cancel_requested{false};

    void handle_signal(int) { cancel_requested.store(true); }

    fuzzynav::Point make_point(double x, double y) {
        fuzzynav::Point p;
        p.x = x;
        p.y = y;
        return p;
    }

    void print_usage(const char *program) {
        std::cout << "Usage: " << program << " [options]\n"
                  << "  --target X Y           target relative to the start (default 1 1)\n"
                  << "  --obstacle X Y R       add a round obstacle in the world frame (repeatable)\n"
                  << "  --max-velocity V       platform velocity bound (default 0.30)\n"
                  << "  --threshold D          obstacle threshold (default 0.20)\n"
                  << "  --tolerance D          goal tolerance (default 0.02)\n"
                  << "  --period S             sample period (default 0.02)\n"
                  << "  --max-cycles N         stop after N cycles (default 5000)\n"
                  << "  --sensor-failures N    every N-th sensor fetch fails (default 0)\n"
                  << "  --verbose              debug logging\n";
    }
} // namespace

int main(int argc, char **argv) {
    fuzzynav::NavConfig config;
    config.max_cycles = 5000;
    config.retry_backoff = 0.1;

    fuzzynav::transport::SimTransport::SimConfig sim_config;
    std::vector<fuzzynav::transport::CircleObstacle> obstacles;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto need = [&](int count) {
                if (i + count >= argc) {
                    throw std::invalid_argument(arg + " needs " + std::to_string(count) + " value(s)");
                }
            };
            if (arg == "--target") {
                need(2);
                config.target = make_point(std::stod(argv[i + 1]), std::stod(argv[i + 2]));
                i += 2;
            } else if (arg == "--obstacle") {
                need(3);
                obstacles.push_back({make_point(std::stod(argv[i + 1]), std::stod(argv[i + 2])), std::stod(argv[i + 3])});
                i += 3;
            } else if (arg == "--max-velocity") {
                need(1);
                config.max_velocity = std::stod(argv[++i]);
            } else if (arg == "--threshold") {
                need(1);
                config.obstacle_threshold = std::stod(argv[++i]);
            } else if (arg == "--tolerance") {
                need(1);
                config.tolerance = std::stod(argv[++i]);
            } else if (arg == "--period") {
                need(1);
                config.sample_period = std::stod(argv[++i]);
            } else if (arg == "--max-cycles") {
                need(1);
                config.max_cycles = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--sensor-failures") {
                need(1);
                sim_config.sensor_failure_every = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--verbose") {
                spdlog::set_level(spdlog::level::debug);
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                throw std::invalid_argument("unknown option " + arg);
            }
        }
    } catch (const std::exception &e) {
        spdlog::error("Bad arguments: {}", e.what());
        print_usage(argv[0]);
        return 2;
    }

    if (obstacles.empty()) {
        // Default course: one post on the diagonal to the default target
        obstacles.push_back({make_point(0.5, 0.45), 0.08});
    }

    sim_config.sensor_range = config.sensor_limit;
    sim_config.dt = config.sample_period > 0.0 ? config.sample_period : 0.02;
    fuzzynav::transport::SimTransport robot(sim_config);
    for (const auto &obstacle : obstacles) {
        robot.add_obstacle(obstacle.center, obstacle.radius);
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        fuzzynav::Navigator navigator(config, robot);

#ifdef HAS_RERUN
        auto rec = std::make_shared<rerun::RecordingStream>("fuzzynav_sim", "navigation");
        if (rec->connect_grpc("rerun+http://0.0.0.0:9876/proxy").is_err()) {
            spdlog::warn("Failed to connect to rerun, running without visualization");
        } else {
            spdlog::info("Visualization initialized");
            fuzzynav::visualize::show_goal(rec, config.target);
            fuzzynav::visualize::show_obstacles(rec, robot.obstacles());
            navigator.set_observer([&](const fuzzynav::nav::CycleOutcome &outcome) {
                fuzzynav::visualize::show_robot(rec, robot.position(), sim_config.robot_radius, robot.raw_sensors());
                fuzzynav::visualize::show_command(rec, robot.position(), outcome);
            });
        }
#endif

        const auto result = navigator.run(cancel_requested);
        const auto &stats = navigator.stats();

        spdlog::info("Run finished: {}", fuzzynav::to_string(result));
        spdlog::info("  cycles={}, obstacle cycles={}, transport failures={}, decision failures={}", stats.cycles,
                     stats.obstacle_cycles, stats.transport_failures, stats.decision_failures);
        spdlog::info("  final position ({:.3f}, {:.3f}), {:.3f} m from target", robot.position().x,
                     robot.position().y, stats.final_distance);

        return result == fuzzynav::RunResult::REACHED ? 0 : 1;
    } catch (const fuzzynav::ConfigError &e) {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    }
}
