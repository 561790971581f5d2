#pragma once

#include "fuzzynav/fuzzy/expression.hpp"
#include "fuzzynav/fuzzy/variable.hpp"
#include <string>
#include <vector>

namespace fuzzynav {
    namespace fuzzy {

        // THEN clause: output variable takes a label, scaled by weight
        struct Consequent {
            std::string variable;
            std::string label;
            double weight = 1.0;
        };

        // IF antecedent THEN consequents
        struct Rule {
            Expression antecedent;
            std::vector<Consequent> consequents;
            std::string description; // Free text for logs
        };

        /// Immutable set of input variables, output variables and ordered rules.
        ///
        /// Every term and consequent is checked against the declared variables and
        /// their labels here, so a constructed RuleSet cannot reference a missing
        /// label at inference time.
        class RuleSet {
          public:
            /// Throws ConfigError on duplicate variable names, a rule referencing an
            /// undeclared input/output or label, a rule without consequents, or a
            /// negative or non-finite weight.
            RuleSet(std::string name, std::vector<FuzzyVariable> inputs, std::vector<FuzzyVariable> outputs,
                    std::vector<Rule> rules);

            const std::string &name() const { return name_; }
            const std::vector<FuzzyVariable> &inputs() const { return inputs_; }
            const std::vector<FuzzyVariable> &outputs() const { return outputs_; }
            const std::vector<Rule> &rules() const { return rules_; }
            size_t size() const { return rules_.size(); }

            // nullptr when absent
            const FuzzyVariable *find_input(const std::string &name) const;
            const FuzzyVariable *find_output(const std::string &name) const;

          private:
            void validate() const;

            std::string name_;
            std::vector<FuzzyVariable> inputs_;
            std::vector<FuzzyVariable> outputs_;
            std::vector<Rule> rules_;
        };

    } // namespace fuzzy
} // namespace fuzzynav
