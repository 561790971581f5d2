#pragma once

#include "fuzzynav/fuzzy/membership.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fuzzynav {
    namespace fuzzy {

        // Label -> degree for one variable
        using LabelDegrees = std::map<std::string, double>;

        // Universe of discourse, sampled half-open: min, min + step, ... < max
        struct Universe {
            double min = 0.0;
            double max = 1.0;
            double step = 0.01;
        };

        /// Named linguistic variable with a closed set of labeled membership functions.
        class FuzzyVariable {
          public:
            using Term = std::pair<std::string, MembershipFunction>;

            /// Throws ConfigError on an empty universe, a non-positive step,
            /// no terms or a duplicated label.
            FuzzyVariable(std::string name, const Universe &universe, std::vector<Term> terms);

            /// Degree of every label at x. x saturates to the sampled universe first.
            LabelDegrees fuzzify(double x) const;

            /// Degree of one label at x; throws ConfigError for an unknown label.
            double degree(const std::string &label, double x) const;

            /// Clamp x to the first/last sample of the universe.
            double saturate(double x) const;

            bool has_label(const std::string &label) const { return index_.count(label) > 0; }
            std::vector<std::string> labels() const;
            const MembershipFunction &term(const std::string &label) const;

            // Defuzzification grid and the label sampled on it
            const Eigen::VectorXd &grid() const { return grid_; }
            const Eigen::VectorXd &sampled(const std::string &label) const;

            const std::string &name() const { return name_; }
            const Universe &universe() const { return universe_; }

          private:
            size_t label_index(const std::string &label) const;

            std::string name_;
            Universe universe_;
            std::vector<Term> terms_;
            std::map<std::string, size_t> index_;
            Eigen::VectorXd grid_;
            std::vector<Eigen::VectorXd> samples_;
        };

    } // namespace fuzzy
} // namespace fuzzynav
