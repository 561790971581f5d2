#include "fuzzynav/nav/rule_base.hpp"
#include <utility>
#include <vector>

namespace fuzzynav {
    namespace nav {

        using fuzzy::Consequent;
        using fuzzy::Expression;
        using fuzzy::FuzzyVariable;
        using fuzzy::MembershipFunction;
        using fuzzy::Rule;
        using fuzzy::RuleSet;

        const char *label(Proximity p) { return p == Proximity::DANGEROUS ? "dangerous" : "safe"; }

        const char *label(OffsetX o) {
            switch (o) {
            case OffsetX::FAR_BACK:
                return "far_back";
            case OffsetX::NEAR_BACK:
                return "near_back";
            case OffsetX::CENTER:
                return "center";
            case OffsetX::NEAR_FRONT:
                return "near_front";
            case OffsetX::FAR_FRONT:
                return "far_front";
            }
            return "";
        }

        const char *label(OffsetY o) {
            switch (o) {
            case OffsetY::FAR_RIGHT:
                return "far_right";
            case OffsetY::NEAR_RIGHT:
                return "near_right";
            case OffsetY::CENTER:
                return "center";
            case OffsetY::NEAR_LEFT:
                return "near_left";
            case OffsetY::FAR_LEFT:
                return "far_left";
            }
            return "";
        }

        const char *label(SpeedX s) {
            switch (s) {
            case SpeedX::BACKWARD_FAST:
                return "backward_fast";
            case SpeedX::BACKWARD_MED:
                return "backward_med";
            case SpeedX::BACKWARD_SLOW:
                return "backward_slow";
            case SpeedX::STOP:
                return "stop";
            case SpeedX::FORWARD_SLOW:
                return "forward_slow";
            case SpeedX::FORWARD_MED:
                return "forward_med";
            case SpeedX::FORWARD_FAST:
                return "forward_fast";
            }
            return "";
        }

        const char *label(SpeedY s) {
            switch (s) {
            case SpeedY::RIGHT_FAST:
                return "right_fast";
            case SpeedY::RIGHT_MED:
                return "right_med";
            case SpeedY::RIGHT_SLOW:
                return "right_slow";
            case SpeedY::STOP:
                return "stop";
            case SpeedY::LEFT_SLOW:
                return "left_slow";
            case SpeedY::LEFT_MED:
                return "left_med";
            case SpeedY::LEFT_FAST:
                return "left_fast";
            }
            return "";
        }

        Expression is(Sensor sensor, Proximity p) { return Expression::term(sensor_name(sensor), label(p)); }

        Expression is(OffsetX o) { return Expression::term(POSITION_X, label(o)); }

        Expression is(OffsetY o) { return Expression::term(POSITION_Y, label(o)); }

        Consequent set(SpeedX s, double weight) { return Consequent{VELOCITY_X, label(s), weight}; }

        Consequent set(SpeedY s, double weight) { return Consequent{VELOCITY_Y, label(s), weight}; }

        namespace {

            // Five offset labels: near/center are fixed (m), the far labels are open
            // shoulders so saturated inputs keep full degree at both universe edges
            std::vector<FuzzyVariable::Term> offset_terms(double range, const char *far_neg, const char *near_neg,
                                                          const char *near_pos, const char *far_pos) {
                return {
                    {far_neg, MembershipFunction::trapezoidal(-range, -range, -0.25, -0.20)},
                    {near_neg, MembershipFunction::trapezoidal(-0.25, -0.20, -0.04, 0.0)},
                    {"center", MembershipFunction::triangular(-0.04, 0.0, 0.04)},
                    {near_pos, MembershipFunction::trapezoidal(0.0, 0.04, 0.20, 0.25)},
                    {far_pos, MembershipFunction::trapezoidal(0.20, 0.25, range, range)},
                };
            }

            // Seven speed labels laid out for a 0.30 m/s limit and scaled to the configured one
            std::vector<FuzzyVariable::Term> speed_terms(double limit, const char *fast_neg, const char *med_neg,
                                                         const char *slow_neg, const char *slow_pos,
                                                         const char *med_pos, const char *fast_pos) {
                const double k = limit / 0.30;
                return {
                    {fast_neg, MembershipFunction::trapezoidal(-0.30 * k, -0.30 * k, -0.22 * k, -0.20 * k)},
                    {med_neg, MembershipFunction::trapezoidal(-0.22 * k, -0.20 * k, -0.12 * k, -0.10 * k)},
                    {slow_neg, MembershipFunction::trapezoidal(-0.12 * k, -0.10 * k, -0.025 * k, 0.0)},
                    {"stop", MembershipFunction::triangular(-0.025 * k, 0.0, 0.025 * k)},
                    {slow_pos, MembershipFunction::trapezoidal(0.0, 0.025 * k, 0.10 * k, 0.12 * k)},
                    {med_pos, MembershipFunction::trapezoidal(0.10 * k, 0.12 * k, 0.20 * k, 0.22 * k)},
                    {fast_pos, MembershipFunction::trapezoidal(0.20 * k, 0.22 * k, 0.30 * k, 0.30 * k)},
                };
            }

            std::vector<FuzzyVariable> make_velocities(const NavConfig &config) {
                std::vector<FuzzyVariable> outputs;
                outputs.push_back(make_velocity_x(config));
                outputs.push_back(make_velocity_y(config));
                return outputs;
            }

            Rule rule(Expression antecedent, SpeedX vx, SpeedY vy, std::string description) {
                return Rule{std::move(antecedent), {set(vx), set(vy)}, std::move(description)};
            }

            // Shorthands for the obstacle table
            Expression danger(Sensor s) { return is(s, Proximity::DANGEROUS); }
            Expression clear(Sensor s) { return is(s, Proximity::SAFE); }

        } // namespace

        FuzzyVariable make_position_x(const NavConfig &config) {
            const double r = config.position_range;
            return FuzzyVariable(POSITION_X, fuzzy::Universe{-r, r, config.universe_step},
                                 offset_terms(r, "far_back", "near_back", "near_front", "far_front"));
        }

        FuzzyVariable make_position_y(const NavConfig &config) {
            const double r = config.position_range;
            return FuzzyVariable(POSITION_Y, fuzzy::Universe{-r, r, config.universe_step},
                                 offset_terms(r, "far_right", "near_right", "near_left", "far_left"));
        }

        FuzzyVariable make_sensor(Sensor sensor, const NavConfig &config) {
            const double t = config.obstacle_threshold;
            const double fade = t + config.proximity_band;
            const double limit = config.sensor_limit;
            return FuzzyVariable(sensor_name(sensor), fuzzy::Universe{0.0, limit, config.universe_step},
                                 {
                                     {label(Proximity::DANGEROUS), MembershipFunction::trapezoidal(0.0, 0.0, t, fade)},
                                     {label(Proximity::SAFE), MembershipFunction::trapezoidal(t, fade, limit, limit)},
                                 });
        }

        FuzzyVariable make_velocity_x(const NavConfig &config) {
            const double v = config.decision_velocity_limit;
            return FuzzyVariable(VELOCITY_X, fuzzy::Universe{-v, v, config.universe_step},
                                 speed_terms(v, "backward_fast", "backward_med", "backward_slow", "forward_slow",
                                             "forward_med", "forward_fast"));
        }

        FuzzyVariable make_velocity_y(const NavConfig &config) {
            const double v = config.decision_velocity_limit;
            return FuzzyVariable(VELOCITY_Y, fuzzy::Universe{-v, v, config.universe_step},
                                 speed_terms(v, "right_fast", "right_med", "right_slow", "left_slow", "left_med",
                                             "left_fast"));
        }

        std::shared_ptr<const RuleSet> make_goal_rules(const NavConfig &config) {
            std::vector<FuzzyVariable> inputs;
            inputs.push_back(make_position_x(config));
            inputs.push_back(make_position_y(config));

            std::vector<Rule> rules = {
                {is(OffsetX::FAR_BACK), {set(SpeedX::BACKWARD_FAST)}, "x far back"},
                {is(OffsetX::NEAR_BACK), {set(SpeedX::BACKWARD_SLOW)}, "x near back"},
                {is(OffsetX::CENTER), {set(SpeedX::STOP)}, "x centered"},
                {is(OffsetX::NEAR_FRONT), {set(SpeedX::FORWARD_SLOW)}, "x near front"},
                {is(OffsetX::FAR_FRONT), {set(SpeedX::FORWARD_FAST)}, "x far front"},

                {is(OffsetY::FAR_RIGHT), {set(SpeedY::RIGHT_FAST)}, "y far right"},
                {is(OffsetY::NEAR_RIGHT), {set(SpeedY::RIGHT_SLOW)}, "y near right"},
                {is(OffsetY::CENTER), {set(SpeedY::STOP)}, "y centered"},
                {is(OffsetY::NEAR_LEFT), {set(SpeedY::LEFT_SLOW)}, "y near left"},
                {is(OffsetY::FAR_LEFT), {set(SpeedY::LEFT_FAST)}, "y far left"},
            };

            return std::make_shared<const RuleSet>("goal", std::move(inputs), make_velocities(config),
                                                   std::move(rules));
        }

        std::shared_ptr<const RuleSet> make_obstacle_rules(const NavConfig &config) {
            std::vector<FuzzyVariable> inputs;
            for (Sensor s : all_sensors()) {
                inputs.push_back(make_sensor(s, config));
            }
            inputs.push_back(make_position_y(config));
            inputs.push_back(make_position_x(config));

            const Expression target_left = is(OffsetY::NEAR_LEFT);
            const Expression target_right = is(OffsetY::NEAR_RIGHT);

            // "(sensors and far side) or near side": the near-side term alone fires the rule
            std::vector<Rule> rules = {
                // Front (X+)
                rule(Expression::disjunction(Expression::all_of({clear(Sensor::LEFT_FRONT), danger(Sensor::FRONT),
                                                                 clear(Sensor::RIGHT_FRONT), is(OffsetY::FAR_LEFT)}),
                                             target_left),
                     SpeedX::BACKWARD_MED, SpeedY::LEFT_MED, "front blocked, exit left"),
                rule(Expression::disjunction(Expression::all_of({clear(Sensor::LEFT_FRONT), danger(Sensor::FRONT),
                                                                 clear(Sensor::RIGHT_FRONT), is(OffsetY::FAR_RIGHT)}),
                                             target_right),
                     SpeedX::BACKWARD_MED, SpeedY::RIGHT_MED, "front blocked, exit right"),
                rule(Expression::all_of(
                         {danger(Sensor::LEFT_FRONT), danger(Sensor::FRONT), clear(Sensor::RIGHT_FRONT)}),
                     SpeedX::BACKWARD_MED, SpeedY::RIGHT_MED, "front and left front"),
                rule(Expression::all_of(
                         {clear(Sensor::LEFT_FRONT), danger(Sensor::FRONT), danger(Sensor::RIGHT_FRONT)}),
                     SpeedX::BACKWARD_MED, SpeedY::LEFT_MED, "front and right front"),
                rule(Expression::disjunction(Expression::all_of({danger(Sensor::LEFT_FRONT), danger(Sensor::FRONT),
                                                                 danger(Sensor::RIGHT_FRONT), is(OffsetY::FAR_LEFT)}),
                                             target_left),
                     SpeedX::BACKWARD_FAST, SpeedY::LEFT_MED, "front fully blocked, exit left"),
                rule(Expression::disjunction(Expression::all_of({danger(Sensor::LEFT_FRONT), danger(Sensor::FRONT),
                                                                 danger(Sensor::RIGHT_FRONT), is(OffsetY::FAR_RIGHT)}),
                                             target_right),
                     SpeedX::BACKWARD_FAST, SpeedY::RIGHT_MED, "front fully blocked, exit right"),
                rule(Expression::all_of({clear(Sensor::LEFT_FRONT), danger(Sensor::FRONT), clear(Sensor::RIGHT_FRONT),
                                         is(OffsetY::CENTER)}),
                     SpeedX::BACKWARD_MED, SpeedY::LEFT_MED, "front blocked, target dead ahead"),

                // Left side (Y+)
                rule(Expression::all_of({danger(Sensor::FRONT), danger(Sensor::LEFT_FRONT), danger(Sensor::LEFT_REAR)}),
                     SpeedX::STOP, SpeedY::RIGHT_FAST, "front and whole left side"),
                rule(Expression::all_of({clear(Sensor::FRONT), danger(Sensor::LEFT_FRONT), danger(Sensor::LEFT_REAR)}),
                     SpeedX::FORWARD_MED, SpeedY::RIGHT_MED, "whole left side"),
                rule(Expression::all_of({clear(Sensor::FRONT), danger(Sensor::LEFT_FRONT), clear(Sensor::LEFT_REAR)}),
                     SpeedX::FORWARD_MED, SpeedY::RIGHT_MED, "left front only"),
                rule(Expression::all_of({clear(Sensor::FRONT), clear(Sensor::LEFT_FRONT), danger(Sensor::LEFT_REAR)}),
                     SpeedX::FORWARD_MED, SpeedY::RIGHT_MED, "left rear only"),

                // Right side (Y-)
                rule(Expression::all_of(
                         {danger(Sensor::FRONT), danger(Sensor::RIGHT_FRONT), danger(Sensor::RIGHT_REAR)}),
                     SpeedX::STOP, SpeedY::LEFT_FAST, "front and whole right side"),
                rule(Expression::all_of(
                         {clear(Sensor::FRONT), danger(Sensor::RIGHT_FRONT), danger(Sensor::RIGHT_REAR)}),
                     SpeedX::FORWARD_MED, SpeedY::LEFT_MED, "whole right side"),
                rule(Expression::all_of(
                         {clear(Sensor::FRONT), danger(Sensor::RIGHT_FRONT), clear(Sensor::RIGHT_REAR)}),
                     SpeedX::FORWARD_MED, SpeedY::LEFT_MED, "right front only"),
                rule(Expression::all_of(
                         {clear(Sensor::FRONT), clear(Sensor::RIGHT_FRONT), danger(Sensor::RIGHT_REAR)}),
                     SpeedX::FORWARD_MED, SpeedY::LEFT_MED, "right rear only"),

                // Back (X-)
                rule(Expression::disjunction(Expression::all_of({danger(Sensor::BACK_LEFT), danger(Sensor::BACK_RIGHT),
                                                                 is(OffsetY::FAR_LEFT)}),
                                             target_left),
                     SpeedX::FORWARD_FAST, SpeedY::LEFT_MED, "back blocked, exit left"),
                // Exits right but commands left_med
                rule(Expression::disjunction(Expression::all_of({danger(Sensor::BACK_LEFT), danger(Sensor::BACK_RIGHT),
                                                                 is(OffsetY::FAR_RIGHT)}),
                                             target_right),
                     SpeedX::FORWARD_FAST, SpeedY::LEFT_MED, "back blocked, exit right"),
                rule(Expression::all_of({danger(Sensor::BACK_LEFT), clear(Sensor::BACK_RIGHT)}), SpeedX::FORWARD_MED,
                     SpeedY::RIGHT_MED, "back left"),
                rule(Expression::all_of({danger(Sensor::BACK_RIGHT), clear(Sensor::BACK_LEFT)}), SpeedX::FORWARD_MED,
                     SpeedY::LEFT_MED, "back right"),

                // Several sides
                rule(Expression::all_of({danger(Sensor::LEFT_REAR), danger(Sensor::RIGHT_REAR)}), SpeedX::FORWARD_FAST,
                     SpeedY::STOP, "both sides"),
                rule(Expression::all_of(
                         {danger(Sensor::LEFT_REAR), danger(Sensor::LEFT_FRONT), danger(Sensor::RIGHT_REAR)}),
                     SpeedX::FORWARD_FAST, SpeedY::RIGHT_FAST, "both sides and left front"),
                rule(Expression::all_of(
                         {danger(Sensor::LEFT_REAR), danger(Sensor::RIGHT_FRONT), danger(Sensor::RIGHT_REAR)}),
                     SpeedX::FORWARD_FAST, SpeedY::LEFT_FAST, "both sides and right front"),
                rule(Expression::disjunction(Expression::all_of({danger(Sensor::LEFT_REAR), danger(Sensor::FRONT),
                                                                 danger(Sensor::RIGHT_REAR), is(OffsetY::FAR_LEFT)}),
                                             target_left),
                     SpeedX::BACKWARD_FAST, SpeedY::LEFT_MED, "both sides and front, exit left"),
                rule(Expression::disjunction(Expression::all_of({danger(Sensor::LEFT_REAR), danger(Sensor::FRONT),
                                                                 danger(Sensor::RIGHT_REAR), is(OffsetY::FAR_RIGHT)}),
                                             target_right),
                     SpeedX::BACKWARD_FAST, SpeedY::RIGHT_MED, "both sides and front, exit right"),

                // Close to the target
                rule(Expression::conjunction(is(OffsetX::NEAR_FRONT), danger(Sensor::LEFT_FRONT)),
                     SpeedX::FORWARD_SLOW, SpeedY::RIGHT_SLOW, "target close ahead, left front"),
                rule(Expression::conjunction(is(OffsetX::NEAR_FRONT), danger(Sensor::RIGHT_FRONT)),
                     SpeedX::FORWARD_SLOW, SpeedY::LEFT_SLOW, "target close ahead, right front"),
                rule(Expression::conjunction(is(OffsetY::NEAR_LEFT), danger(Sensor::FRONT)), SpeedX::BACKWARD_SLOW,
                     SpeedY::RIGHT_SLOW, "target close left, front"),
                rule(Expression::conjunction(is(OffsetY::NEAR_RIGHT), danger(Sensor::FRONT)), SpeedX::BACKWARD_SLOW,
                     SpeedY::LEFT_SLOW, "target close right, front"),

                // Lateral offset compensation
                rule(Expression::conjunction(Expression::disjunction(is(OffsetY::FAR_LEFT), is(OffsetY::FAR_RIGHT)),
                                             clear(Sensor::FRONT)),
                     SpeedX::FORWARD_FAST, SpeedY::STOP, "far lateral offset, front clear"),
            };

            return std::make_shared<const RuleSet>("obstacle", std::move(inputs), make_velocities(config),
                                                   std::move(rules));
        }

    } // namespace nav
} // namespace fuzzynav
