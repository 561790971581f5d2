#include "fuzzynav/fuzzy/engine.hpp"
#include "fuzzynav/types.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace fuzzynav {
    namespace fuzzy {

        size_t InferenceResult::rules_fired() const {
            return static_cast<size_t>(std::count_if(firing.begin(), firing.end(), [](double s) { return s > 0.0; }));
        }

        InferenceEngine::InferenceEngine(std::shared_ptr<const RuleSet> rules) : rules_(std::move(rules)) {
            if (!rules_) {
                throw ConfigError("inference engine needs a rule set");
            }
        }

        Fuzzified InferenceEngine::fuzzify(const CrispValues &inputs) const {
            Fuzzified fuzzified;
            for (const auto &variable : rules_->inputs()) {
                auto it = inputs.find(variable.name());
                if (it == inputs.end()) {
                    throw ConfigError("rule set '" + rules_->name() + "': missing input '" + variable.name() + "'");
                }
                fuzzified[variable.name()] = variable.fuzzify(it->second);
            }
            return fuzzified;
        }

        double InferenceEngine::centroid(const Eigen::VectorXd &grid, const Eigen::VectorXd &mu) {
            const double mass = mu.sum();
            if (!(mass > 0.0)) {
                return 0.0;
            }
            return grid.dot(mu) / mass;
        }

        InferenceResult InferenceEngine::compute(const CrispValues &inputs) const {
            InferenceResult result;
            const Fuzzified fuzzified = fuzzify(inputs);

            // Firing strength
            const auto &rules = rules_->rules();
            result.firing.reserve(rules.size());
            for (size_t i = 0; i < rules.size(); ++i) {
                const double strength = rules[i].antecedent.evaluate(fuzzified);
                result.firing.push_back(strength);
                if (strength > 0.0) {
                    spdlog::debug("{}: rule {} fired at {:.3f} ({})", rules_->name(), i, strength,
                                  rules[i].description);
                }
            }

            for (const auto &output : rules_->outputs()) {
                result.aggregated[output.name()] = Eigen::VectorXd::Zero(output.grid().size());
            }

            // Implication (clip) and aggregation (max)
            for (size_t i = 0; i < rules.size(); ++i) {
                const double strength = result.firing[i];
                if (strength <= 0.0) {
                    continue;
                }
                for (const auto &consequent : rules[i].consequents) {
                    const double cut = std::min(strength * consequent.weight, 1.0);
                    if (cut <= 0.0) {
                        continue;
                    }
                    const FuzzyVariable *output = rules_->find_output(consequent.variable);
                    auto &aggregate = result.aggregated[consequent.variable];
                    aggregate = aggregate.cwiseMax(output->sampled(consequent.label).cwiseMin(cut));
                }
            }

            // Defuzzification
            for (const auto &output : rules_->outputs()) {
                const auto &aggregate = result.aggregated[output.name()];
                if (aggregate.sum() > 0.0) {
                    result.outputs[output.name()] = centroid(output.grid(), aggregate);
                } else {
                    result.outputs[output.name()] = 0.0;
                    result.unfired.push_back(output.name());
                    spdlog::debug("{}: no rule fired for '{}'", rules_->name(), output.name());
                }
            }

            return result;
        }

    } // namespace fuzzy
} // namespace fuzzynav
