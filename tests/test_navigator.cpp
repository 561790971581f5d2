#include "fuzzynav/navigator.hpp"
#include "fuzzynav/transport/sim.hpp"
#include <atomic>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <limits>
#include <vector>

using namespace fuzzynav;
using namespace fuzzynav::transport;

namespace {
    Point make_point(double x, double y) {
        Point p;
        p.x = x;
        p.y = y;
        return p;
    }

    NavConfig test_config() {
        NavConfig config;
        config.max_cycles = 5000;
        return config;
    }

    void no_sleep(double) {}

    bool is_stop(const VelocityCommand &cmd) {
        return cmd.linear_velocity == 0.0 && cmd.lateral_velocity == 0.0 && cmd.angular_velocity == 0.0;
    }

    // Healthy transport whose sensors report a non-finite distance
    class GarbledTransport : public Transport {
      public:
        Status open() override {
            open_ = true;
            return ok();
        }
        void close() override {
            open_ = false;
            ++closes;
        }
        bool is_open() const override { return open_; }

        SensorFrame fetch_sensors() override {
            SensorFrame frame;
            frame.valid = true;
            frame.distances.fill(0.41);
            frame.distances[sensor_index(Sensor::FRONT)] = std::numeric_limits<double>::quiet_NaN();
            return frame;
        }

        OdometryFrame fetch_odometry() override {
            ++odometry_calls_;
            if (odometry_failure_every > 0 && odometry_calls_ % odometry_failure_every == 0) {
                OdometryFrame frame;
                frame.status_message = "odometry timeout";
                return frame;
            }
            return make_odometry({0.0, 0.0});
        }

        Status send_velocity(double vx, double vy, double omega) override {
            sent.push_back({vx, vy, omega});
            return ok();
        }

        std::string get_type() const override { return "garbled_transport"; }

        std::vector<std::vector<double>> sent;
        int closes = 0;
        std::size_t odometry_failure_every = 0; // Every n-th odometry fetch fails, 0 disables

      private:
        static Status ok() {
            Status status;
            status.valid = true;
            return status;
        }

        bool open_ = false;
        std::size_t odometry_calls_ = 0;
    };
} // namespace

void test_reaches_target() {
    std::cout << "Testing navigation to the target..." << std::endl;

    SimTransport sim;
    Navigator navigator(test_config(), sim);
    navigator.set_sleep(no_sleep);

    std::atomic<bool> cancel{false};
    const auto result = navigator.run(cancel);

    assert(result == RunResult::REACHED);
    assert(navigator.stats().cycles > 0);
    assert(navigator.stats().obstacle_cycles == 0);
    assert(navigator.stats().transport_failures == 0);
    assert(navigator.stats().final_distance <= 0.02);
    assert(std::hypot(sim.position().x - 1.0, sim.position().y - 1.0) <= 0.02 + 1e-9);

    // Final stop, transport closed exactly once
    assert(!sim.commands().empty());
    assert(is_stop(sim.commands().back()));
    assert(!sim.is_open());
    assert(sim.close_count() == 1);

    for (const auto &cmd : sim.commands()) {
        assert(std::abs(cmd.linear_velocity) <= 0.30);
        assert(std::abs(cmd.lateral_velocity) <= 0.30);
        assert(cmd.angular_velocity == 0.0);
    }

    std::cout << "✓ Navigation to target test passed" << std::endl;
}

void test_target_relative_to_start() {
    std::cout << "Testing target relative to the start pose..." << std::endl;

    SimTransport::SimConfig sim_config;
    sim_config.start = make_point(5.0, -2.0);
    SimTransport sim(sim_config);

    NavConfig config = test_config();
    config.target = make_point(-0.5, 0.3);
    Navigator navigator(config, sim);
    navigator.set_sleep(no_sleep);

    std::atomic<bool> cancel{false};
    assert(navigator.run(cancel) == RunResult::REACHED);
    assert(std::abs(sim.position().x - 4.5) <= 0.03);
    assert(std::abs(sim.position().y + 1.7) <= 0.03);
    assert(navigator.cycle().base().x == 5.0);

    std::cout << "✓ Relative target test passed" << std::endl;
}

void test_obstacle_on_path() {
    std::cout << "Testing obstacle on the path..." << std::endl;

    SimTransport::SimConfig sim_config;
    sim_config.dt = 0.02; // One sample period per command
    SimTransport sim(sim_config);
    sim.add_obstacle(make_point(0.5, 0.5), 0.1);

    Navigator navigator(test_config(), sim);
    navigator.set_sleep(no_sleep);
    std::vector<nav::DecisionMode> modes;
    navigator.set_observer([&](const nav::CycleOutcome &outcome) { modes.push_back(outcome.mode); });

    std::atomic<bool> cancel{false};
    const auto result = navigator.run(cancel);

    assert(result == RunResult::REACHED);
    assert(navigator.stats().obstacle_cycles > 0);
    assert(navigator.stats().final_distance <= 0.02);
    assert(modes.size() == navigator.stats().cycles);
    assert(is_stop(sim.commands().back()));
    assert(sim.close_count() == 1);

    std::cout << "✓ Obstacle on path test passed" << std::endl;
}

void test_target_beyond_universe() {
    std::cout << "Testing navigation to a target beyond the offset universe..." << std::endl;

    SimTransport sim;
    NavConfig config = test_config();
    config.target = make_point(-2.5, -0.5);
    Navigator navigator(config, sim);
    navigator.set_sleep(no_sleep);

    std::atomic<bool> cancel{false};
    assert(navigator.run(cancel) == RunResult::REACHED);
    assert(std::hypot(sim.position().x + 2.5, sim.position().y + 0.5) <= 0.02 + 1e-9);

    // The first command already heads back and to the right
    assert(sim.commands().front().linear_velocity < -0.2);
    assert(sim.commands().front().lateral_velocity < 0.0);

    std::cout << "✓ Target beyond universe test passed" << std::endl;
}

void test_cancellation() {
    std::cout << "Testing cancellation..." << std::endl;

    // Cancelled before the first tick
    {
        SimTransport sim;
        Navigator navigator(test_config(), sim);
        navigator.set_sleep(no_sleep);
        std::atomic<bool> cancel{true};
        assert(navigator.run(cancel) == RunResult::CANCELLED);
        assert(navigator.stats().cycles == 0);
        assert(sim.commands().size() == 1);
        assert(is_stop(sim.commands().back()));
        assert(sim.close_count() == 1);
    }

    // Cancelled from the observer after five ticks
    {
        SimTransport sim;
        Navigator navigator(test_config(), sim);
        navigator.set_sleep(no_sleep);
        std::atomic<bool> cancel{false};
        navigator.set_observer([&](const nav::CycleOutcome &) {
            if (navigator.stats().cycles == 5) cancel.store(true);
        });
        assert(navigator.run(cancel) == RunResult::CANCELLED);
        assert(navigator.stats().cycles == 5);
        assert(is_stop(sim.commands().back()));
        assert(sim.close_count() == 1);
    }

    std::cout << "✓ Cancellation test passed" << std::endl;
}

void test_open_failure() {
    std::cout << "Testing open failure..." << std::endl;

    SimTransport::SimConfig sim_config;
    sim_config.fail_open = true;
    SimTransport sim(sim_config);

    Navigator navigator(test_config(), sim);
    navigator.set_sleep(no_sleep);
    std::atomic<bool> cancel{false};
    assert(navigator.run(cancel) == RunResult::TRANSPORT_FAILED);
    assert(sim.commands().empty());

    std::cout << "✓ Open failure test passed" << std::endl;
}

void test_retries() {
    std::cout << "Testing retries on transport failures..." << std::endl;

    SimTransport::SimConfig sim_config;
    sim_config.sensor_failure_every = 4;
    SimTransport sim(sim_config);

    NavConfig config = test_config();
    config.retry_backoff = 0.5;
    Navigator navigator(config, sim);

    std::vector<double> delays;
    navigator.set_sleep([&](double seconds) { delays.push_back(seconds); });

    std::atomic<bool> cancel{false};
    assert(navigator.run(cancel) == RunResult::REACHED);

    const auto &stats = navigator.stats();
    assert(stats.transport_failures > 0);
    size_t backoffs = 0;
    for (double d : delays) {
        if (d == 0.5) ++backoffs;
    }
    assert(backoffs == stats.transport_failures);
    assert(sim.close_count() == 1);

    std::cout << "✓ Retries test passed" << std::endl;
}

void test_failure_limit() {
    std::cout << "Testing consecutive failure limit..." << std::endl;

    SimTransport::SimConfig sim_config;
    sim_config.sensor_failure_every = 1; // Every sensor fetch fails
    SimTransport sim(sim_config);

    NavConfig config = test_config();
    config.max_consecutive_failures = 3;
    Navigator navigator(config, sim);
    navigator.set_sleep(no_sleep);

    std::atomic<bool> cancel{false};
    assert(navigator.run(cancel) == RunResult::TRANSPORT_FAILED);
    assert(navigator.stats().transport_failures == 3);
    assert(navigator.stats().cycles == 0);
    assert(sim.commands().size() == 1);
    assert(is_stop(sim.commands().back()));
    assert(sim.close_count() == 1);

    std::cout << "✓ Failure limit test passed" << std::endl;
}

void test_cycle_limit() {
    std::cout << "Testing cycle limit..." << std::endl;

    SimTransport sim;
    NavConfig config = test_config();
    config.max_cycles = 3;
    Navigator navigator(config, sim);
    navigator.set_sleep(no_sleep);

    std::atomic<bool> cancel{false};
    assert(navigator.run(cancel) == RunResult::CYCLE_LIMIT);
    assert(navigator.stats().cycles == 3);
    // Three commands plus the final stop
    assert(sim.commands().size() == 4);
    assert(is_stop(sim.commands().back()));

    std::cout << "✓ Cycle limit test passed" << std::endl;
}

void test_decision_failures() {
    std::cout << "Testing decision failures..." << std::endl;

    // Keep going: zero commands each tick
    {
        GarbledTransport transport;
        NavConfig config = test_config();
        config.max_cycles = 4;
        Navigator navigator(config, transport);
        navigator.set_sleep(no_sleep);

        std::atomic<bool> cancel{false};
        assert(navigator.run(cancel) == RunResult::CYCLE_LIMIT);
        assert(navigator.stats().decision_failures == 4);
        assert(transport.sent.size() == 5);
        for (const auto &cmd : transport.sent) {
            assert(cmd[0] == 0.0 && cmd[1] == 0.0 && cmd[2] == 0.0);
        }
        assert(transport.closes == 1);
    }

    // Abort on the first one
    {
        GarbledTransport transport;
        NavConfig config = test_config();
        config.abort_on_decision_failure = true;
        Navigator navigator(config, transport);
        navigator.set_sleep(no_sleep);

        std::atomic<bool> cancel{false};
        assert(navigator.run(cancel) == RunResult::ABORTED);
        assert(navigator.stats().decision_failures == 1);
        assert(transport.closes == 1);
    }

    std::cout << "✓ Decision failures test passed" << std::endl;
}

void test_failure_count_resets_after_stop() {
    std::cout << "Testing failure count reset after a decision failure..." << std::endl;

    // Odometry fails every other fetch; each good tick fails the decision and sends a stop
    GarbledTransport transport;
    transport.odometry_failure_every = 2;

    NavConfig config = test_config();
    config.max_cycles = 3;
    config.max_consecutive_failures = 2;
    Navigator navigator(config, transport);
    navigator.set_sleep(no_sleep);

    std::atomic<bool> cancel{false};
    assert(navigator.run(cancel) == RunResult::CYCLE_LIMIT);
    assert(navigator.stats().transport_failures == 3);
    assert(navigator.stats().decision_failures == 3);
    assert(transport.closes == 1);

    std::cout << "✓ Failure count reset test passed" << std::endl;
}

void test_invalid_config() {
    std::cout << "Testing navigator with an invalid configuration..." << std::endl;

    SimTransport sim;
    NavConfig config = test_config();
    config.tolerance = -1.0;

    bool thrown = false;
    try {
        Navigator navigator(config, sim);
    } catch (const ConfigError &) {
        thrown = true;
    }
    assert(thrown);
    assert(std::string(to_string(RunResult::TRANSPORT_FAILED)) == "transport_failed");

    std::cout << "✓ Invalid configuration test passed" << std::endl;
}

int main() {
    std::cout << "Running navigator tests...\n" << std::endl;

    try {
        test_reaches_target();
        test_target_relative_to_start();
        test_obstacle_on_path();
        test_target_beyond_universe();
        test_cancellation();
        test_open_failure();
        test_retries();
        test_failure_limit();
        test_cycle_limit();
        test_decision_failures();
        test_failure_count_resets_after_stop();
        test_invalid_config();

        std::cout << "\n✅ All navigator tests passed!" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
