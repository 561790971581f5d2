#include "fuzzynav/nav/decision.hpp"
#include "fuzzynav/nav/rule_base.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace fuzzynav;
using namespace fuzzynav::nav;

namespace {
    SensorReadings clear_readings() {
        SensorReadings s;
        s.fill(0.41);
        return s;
    }

    template <typename Fn> bool throws_config_error(Fn fn) {
        try {
            fn();
        } catch (const ConfigError &) {
            return true;
        }
        return false;
    }
} // namespace

void test_config_validation() {
    std::cout << "Testing configuration validation..." << std::endl;

    NavConfig config;
    config.validate();
    assert(config.target.x == 1.0 && config.target.y == 1.0);

    NavConfig bad = config;
    bad.tolerance = 0.0;
    assert(throws_config_error([&] { bad.validate(); }));

    bad = config;
    bad.max_velocity = -0.1;
    assert(throws_config_error([&] { bad.validate(); }));

    bad = config;
    bad.obstacle_threshold = 0.40; // Leaves no room for the proximity band
    assert(throws_config_error([&] { bad.validate(); }));

    bad = config;
    bad.target.x = std::numeric_limits<double>::quiet_NaN();
    assert(throws_config_error([&] { bad.validate(); }));

    bad = config;
    bad.universe_step = 0.0;
    assert(throws_config_error([&] { NavigationDecision decision(bad); }));

    std::cout << "✓ Configuration validation test passed" << std::endl;
}

void test_rule_bases() {
    std::cout << "Testing rule bases..." << std::endl;

    NavConfig config;
    auto goal = make_goal_rules(config);
    assert(goal->size() == 10);
    assert(goal->inputs().size() == 2);
    assert(goal->outputs().size() == 2);

    auto obstacle = make_obstacle_rules(config);
    assert(obstacle->inputs().size() == SENSOR_COUNT + 2);
    assert(obstacle->find_input("front") != nullptr);
    assert(obstacle->find_input(POSITION_Y) != nullptr);
    assert(obstacle->size() >= 28);

    auto front = make_sensor(Sensor::FRONT, config);
    assert(front.degree("dangerous", 0.10) == 1.0);
    assert(front.degree("safe", 0.40) == 1.0);

    auto vx = make_velocity_x(config);
    assert(vx.labels().size() == 7);
    assert(vx.has_label("backward_fast") && vx.has_label("forward_fast"));

    std::cout << "✓ Rule bases test passed" << std::endl;
}

void test_decide_at_target() {
    std::cout << "Testing decision at the target..." << std::endl;

    NavigationDecision decision{NavConfig{}};
    auto d = decision.decide(0.0, 0.0, clear_readings());
    assert(d.valid);
    assert(d.mode == DecisionMode::GOAL);
    assert(std::abs(d.linear_velocity) <= 0.01);
    assert(std::abs(d.lateral_velocity) <= 0.01);
    assert(d.angular_velocity == 0.0);

    std::cout << "✓ Decision at target test passed" << std::endl;
}

void test_decide_straight_ahead() {
    std::cout << "Testing decision with the target straight ahead..." << std::endl;

    NavigationDecision decision{NavConfig{}};
    auto d = decision.decide(1.0, 0.0, clear_readings());
    assert(d.valid);
    assert(d.mode == DecisionMode::GOAL);
    assert(d.linear_velocity > 0.0);
    assert(d.linear_velocity <= 0.30);
    assert(std::abs(d.lateral_velocity) <= 0.01);
    assert(d.unfired.empty());

    // Mirror image
    d = decision.decide(-1.0, 0.0, clear_readings());
    assert(d.linear_velocity < 0.0);

    // Target to the left
    d = decision.decide(0.0, 1.0, clear_readings());
    assert(d.lateral_velocity > 0.0);
    assert(std::abs(d.linear_velocity) <= 0.01);

    // Far outside the universe still commands full speed
    d = decision.decide(10.0, 10.0, clear_readings());
    assert(d.linear_velocity > 0.2 && d.lateral_velocity > 0.2);

    std::cout << "✓ Straight ahead decision test passed" << std::endl;
}

void test_far_targets_on_every_side() {
    std::cout << "Testing far targets on every side..." << std::endl;

    NavConfig config;
    auto px = make_position_x(config);
    auto py = make_position_y(config);

    // Outer labels keep full degree at and beyond both universe edges
    assert(px.fuzzify(-2.0).at("far_back") == 1.0);
    assert(px.fuzzify(-5.0).at("far_back") == 1.0);
    assert(px.fuzzify(1.99).at("far_front") == 1.0);
    assert(px.fuzzify(5.0).at("far_front") == 1.0);
    assert(py.fuzzify(-2.5).at("far_right") == 1.0);
    assert(py.fuzzify(2.5).at("far_left") == 1.0);

    NavigationDecision decision(config);

    auto ahead = decision.decide(10.0, 0.0, clear_readings());
    auto behind = decision.decide(-10.0, 0.0, clear_readings());
    assert(behind.valid);
    assert(behind.unfired.empty());
    assert(behind.linear_velocity < -0.2);
    assert(std::abs(behind.lateral_velocity) <= 0.01);
    assert(std::abs(ahead.linear_velocity + behind.linear_velocity) <= 0.02);

    auto right = decision.decide(0.0, -10.0, clear_readings());
    assert(right.unfired.empty());
    assert(right.lateral_velocity < -0.2);
    assert(std::abs(right.linear_velocity) <= 0.01);

    // On the universe edge itself
    for (double edge : {-2.0, -2.5}) {
        auto d = decision.decide(edge, 0.0, clear_readings());
        assert(d.unfired.empty());
        assert(d.linear_velocity < 0.0);
        d = decision.decide(0.0, edge, clear_readings());
        assert(d.unfired.empty());
        assert(d.lateral_velocity < 0.0);
    }

    std::cout << "✓ Far targets test passed" << std::endl;
}

void test_decide_obstacles() {
    std::cout << "Testing obstacle decisions..." << std::endl;

    NavigationDecision decision{NavConfig{}};

    // Head on, target straight ahead
    auto sensors = clear_readings();
    sensors[sensor_index(Sensor::FRONT)] = 0.10;
    assert(decision.has_obstacles(sensors));
    auto d = decision.decide(1.0, 0.0, sensors);
    assert(d.valid);
    assert(d.mode == DecisionMode::OBSTACLE);
    assert(d.linear_velocity < 0.0 || std::abs(d.lateral_velocity) > 0.0);
    assert(d.linear_velocity < 0.0);

    // Wall on the left front: keep going, step right
    sensors = clear_readings();
    sensors[sensor_index(Sensor::LEFT_FRONT)] = 0.10;
    d = decision.decide(1.0, 0.0, sensors);
    assert(d.mode == DecisionMode::OBSTACLE);
    assert(d.linear_velocity > 0.0);
    assert(d.lateral_velocity < 0.0);

    // Mirror: wall on the right front
    sensors = clear_readings();
    sensors[sensor_index(Sensor::RIGHT_FRONT)] = 0.10;
    d = decision.decide(1.0, 0.0, sensors);
    assert(d.linear_velocity > 0.0);
    assert(d.lateral_velocity > 0.0);

    // Both rear sensors blocked: move forward
    sensors = clear_readings();
    sensors[sensor_index(Sensor::BACK_LEFT)] = 0.05;
    sensors[sensor_index(Sensor::BACK_RIGHT)] = 0.05;
    d = decision.decide(0.0, 1.0, sensors);
    assert(d.mode == DecisionMode::OBSTACLE);
    assert(d.linear_velocity > 0.0);

    std::cout << "✓ Obstacle decisions test passed" << std::endl;
}

void test_obstacle_threshold_is_strict() {
    std::cout << "Testing strict obstacle threshold..." << std::endl;

    NavigationDecision decision{NavConfig{}};
    auto sensors = clear_readings();
    sensors[sensor_index(Sensor::FRONT)] = 0.20;
    assert(!decision.has_obstacles(sensors));
    assert(decision.decide(1.0, 0.0, sensors).mode == DecisionMode::GOAL);

    sensors[sensor_index(Sensor::FRONT)] = 0.1999;
    assert(decision.has_obstacles(sensors));
    assert(decision.decide(1.0, 0.0, sensors).mode == DecisionMode::OBSTACLE);

    std::cout << "✓ Strict obstacle threshold test passed" << std::endl;
}

void test_adjust_speeds() {
    std::cout << "Testing speed adjustment..." << std::endl;

    NavigationDecision decision{NavConfig{}};

    // X dominates: Y scaled by |dy| / |dx|
    auto v = decision.adjust_speeds(1.0, 0.5, 0.2, 0.2);
    assert(std::abs(v.first - 0.2) < 1e-12);
    assert(std::abs(v.second - 0.1) < 1e-12);

    // Y dominates
    v = decision.adjust_speeds(0.25, -1.0, 0.2, -0.2);
    assert(std::abs(v.first - 0.05) < 1e-12);
    assert(std::abs(v.second + 0.2) < 1e-12);

    // Clamped to the decision limit, and clamping again changes nothing
    v = decision.adjust_speeds(1.0, 1.0, 0.5, -0.5);
    assert(v.first == 0.30 && v.second == -0.30);
    auto again = decision.adjust_speeds(1.0, 1.0, v.first, v.second);
    assert(again.first == v.first && again.second == v.second);

    // On the target: finite result
    v = decision.adjust_speeds(0.0, 0.0, 0.1, 0.1);
    assert(std::isfinite(v.first) && std::isfinite(v.second));

    std::cout << "✓ Speed adjustment test passed" << std::endl;
}

void test_invalid_inputs() {
    std::cout << "Testing invalid decision inputs..." << std::endl;

    NavigationDecision decision{NavConfig{}};
    const double nan = std::numeric_limits<double>::quiet_NaN();

    auto d = decision.decide(nan, 0.0, clear_readings());
    assert(!d.valid);
    assert(!d.status_message.empty());

    auto sensors = clear_readings();
    sensors[sensor_index(Sensor::BACK_RIGHT)] = std::numeric_limits<double>::infinity();
    d = decision.decide(1.0, 0.0, sensors);
    assert(!d.valid);

    std::cout << "✓ Invalid inputs test passed" << std::endl;
}

int main() {
    std::cout << "Running navigation decision tests...\n" << std::endl;

    try {
        test_config_validation();
        test_rule_bases();
        test_decide_at_target();
        test_decide_straight_ahead();
        test_far_targets_on_every_side();
        test_decide_obstacles();
        test_obstacle_threshold_is_strict();
        test_adjust_speeds();
        test_invalid_inputs();

        std::cout << "\n✅ All navigation decision tests passed!" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
