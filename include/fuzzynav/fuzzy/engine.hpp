#pragma once

#include "fuzzynav/fuzzy/rule.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fuzzynav {
    namespace fuzzy {

        // Variable name -> crisp value
        using CrispValues = std::map<std::string, double>;

        // State of one inference pass, freshly allocated per call
        struct InferenceResult {
            CrispValues outputs;                               // Defuzzified value per output variable
            std::vector<double> firing;                        // Firing strength per rule, rule-set order
            std::map<std::string, Eigen::VectorXd> aggregated; // Aggregated fuzzy set per output on its grid
            std::vector<std::string> unfired;                  // Outputs no rule fired for (value forced to 0)

            bool complete() const { return unfired.empty(); }
            size_t rules_fired() const;
        };

        /// Mamdani inference: fuzzify, fire (min/max), clip implication,
        /// max aggregation, centroid defuzzification.
        class InferenceEngine {
          public:
            explicit InferenceEngine(std::shared_ptr<const RuleSet> rules);

            /// Throws ConfigError when a declared input has no crisp value.
            InferenceResult compute(const CrispValues &inputs) const;

            /// Centroid of mu over grid, or 0 when mu has no mass.
            static double centroid(const Eigen::VectorXd &grid, const Eigen::VectorXd &mu);

            const RuleSet &rule_set() const { return *rules_; }

          private:
            Fuzzified fuzzify(const CrispValues &inputs) const;

            std::shared_ptr<const RuleSet> rules_;
        };

    } // namespace fuzzy
} // namespace fuzzynav
