#include "fuzzynav/fuzzy/variable.hpp"
#include "fuzzynav/types.hpp"
#include "fuzzynav/utils/math.hpp"
#include <algorithm>
#include <cmath>

namespace fuzzynav {
    namespace fuzzy {

        FuzzyVariable::FuzzyVariable(std::string name, const Universe &universe, std::vector<Term> terms)
            : name_(std::move(name)), universe_(universe), terms_(std::move(terms)) {
            if (name_.empty()) {
                throw ConfigError("fuzzy variable needs a name");
            }
            if (!utils::Math::is_finite(universe_.min) || !utils::Math::is_finite(universe_.max) ||
                universe_.max <= universe_.min) {
                throw ConfigError("variable '" + name_ + "': universe is empty");
            }
            if (!(universe_.step > 0.0) || universe_.step > universe_.max - universe_.min) {
                throw ConfigError("variable '" + name_ + "': step must be positive and fit the universe");
            }
            if (terms_.empty()) {
                throw ConfigError("variable '" + name_ + "': no membership functions");
            }

            for (size_t i = 0; i < terms_.size(); ++i) {
                const auto &label = terms_[i].first;
                if (label.empty()) {
                    throw ConfigError("variable '" + name_ + "': empty label");
                }
                if (!index_.emplace(label, i).second) {
                    throw ConfigError("variable '" + name_ + "': duplicate label '" + label + "'");
                }
            }

            // Same sample count as arange(min, max, step); the tolerance absorbs
            // representation error in (max - min) / step
            const double span = (universe_.max - universe_.min) / universe_.step;
            const auto count = static_cast<Eigen::Index>(std::ceil(span - 1e-9));
            grid_.resize(count);
            for (Eigen::Index k = 0; k < count; ++k) {
                grid_[k] = universe_.min + static_cast<double>(k) * universe_.step;
            }

            samples_.reserve(terms_.size());
            for (const auto &term : terms_) {
                Eigen::VectorXd mu(count);
                for (Eigen::Index k = 0; k < count; ++k) {
                    mu[k] = term.second.degree(grid_[k]);
                }
                samples_.push_back(std::move(mu));
            }
        }

        double FuzzyVariable::saturate(double x) const {
            return std::clamp(x, grid_[0], grid_[grid_.size() - 1]);
        }

        LabelDegrees FuzzyVariable::fuzzify(double x) const {
            const double value = saturate(x);
            LabelDegrees degrees;
            for (const auto &term : terms_) {
                degrees[term.first] = term.second.degree(value);
            }
            return degrees;
        }

        double FuzzyVariable::degree(const std::string &label, double x) const {
            return terms_[label_index(label)].second.degree(saturate(x));
        }

        std::vector<std::string> FuzzyVariable::labels() const {
            std::vector<std::string> result;
            result.reserve(terms_.size());
            for (const auto &term : terms_) {
                result.push_back(term.first);
            }
            return result;
        }

        const MembershipFunction &FuzzyVariable::term(const std::string &label) const {
            return terms_[label_index(label)].second;
        }

        const Eigen::VectorXd &FuzzyVariable::sampled(const std::string &label) const {
            return samples_[label_index(label)];
        }

        size_t FuzzyVariable::label_index(const std::string &label) const {
            auto it = index_.find(label);
            if (it == index_.end()) {
                throw ConfigError("variable '" + name_ + "' has no label '" + label + "'");
            }
            return it->second;
        }

    } // namespace fuzzy
} // namespace fuzzynav
