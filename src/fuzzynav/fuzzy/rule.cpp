#include "fuzzynav/fuzzy/rule.hpp"
#include "fuzzynav/types.hpp"
#include "fuzzynav/utils/math.hpp"
#include <set>
#include <utility>

namespace fuzzynav {
    namespace fuzzy {

        namespace {
            const FuzzyVariable *find_variable(const std::vector<FuzzyVariable> &variables, const std::string &name) {
                for (const auto &variable : variables) {
                    if (variable.name() == name) {
                        return &variable;
                    }
                }
                return nullptr;
            }

            std::string rule_tag(const std::string &set_name, size_t index) {
                return "rule set '" + set_name + "', rule " + std::to_string(index);
            }
        } // namespace

        RuleSet::RuleSet(std::string name, std::vector<FuzzyVariable> inputs, std::vector<FuzzyVariable> outputs,
                         std::vector<Rule> rules)
            : name_(std::move(name)), inputs_(std::move(inputs)), outputs_(std::move(outputs)),
              rules_(std::move(rules)) {
            validate();
        }

        const FuzzyVariable *RuleSet::find_input(const std::string &name) const { return find_variable(inputs_, name); }

        const FuzzyVariable *RuleSet::find_output(const std::string &name) const {
            return find_variable(outputs_, name);
        }

        void RuleSet::validate() const {
            if (inputs_.empty() || outputs_.empty()) {
                throw ConfigError("rule set '" + name_ + "' needs at least one input and one output");
            }

            std::set<std::string> names;
            for (const auto *group : {&inputs_, &outputs_}) {
                for (const auto &variable : *group) {
                    if (!names.insert(variable.name()).second) {
                        throw ConfigError("rule set '" + name_ + "': duplicate variable '" + variable.name() + "'");
                    }
                }
            }

            for (size_t i = 0; i < rules_.size(); ++i) {
                const auto &rule = rules_[i];

                std::vector<std::pair<std::string, std::string>> terms;
                rule.antecedent.collect_terms(terms);
                for (const auto &term : terms) {
                    const auto *input = find_input(term.first);
                    if (input == nullptr) {
                        throw ConfigError(rule_tag(name_, i) + ": unknown input '" + term.first + "'");
                    }
                    if (!input->has_label(term.second)) {
                        throw ConfigError(rule_tag(name_, i) + ": input '" + term.first + "' has no label '" +
                                          term.second + "'");
                    }
                }

                if (rule.consequents.empty()) {
                    throw ConfigError(rule_tag(name_, i) + ": no consequents");
                }
                for (const auto &consequent : rule.consequents) {
                    const auto *output = find_output(consequent.variable);
                    if (output == nullptr) {
                        throw ConfigError(rule_tag(name_, i) + ": unknown output '" + consequent.variable + "'");
                    }
                    if (!output->has_label(consequent.label)) {
                        throw ConfigError(rule_tag(name_, i) + ": output '" + consequent.variable +
                                          "' has no label '" + consequent.label + "'");
                    }
                    if (!utils::Math::is_finite(consequent.weight) || consequent.weight < 0.0) {
                        throw ConfigError(rule_tag(name_, i) + ": weight must be finite and non-negative");
                    }
                }
            }
        }

    } // namespace fuzzy
} // namespace fuzzynav
