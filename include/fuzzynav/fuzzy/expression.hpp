#pragma once

#include "fuzzynav/fuzzy/variable.hpp"
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fuzzynav {
    namespace fuzzy {

        // Variable -> (label -> degree)
        using Fuzzified = std::map<std::string, LabelDegrees>;

        /// Fuzzy boolean antecedent tree: Term(variable, label), And(l, r), Or(l, r).
        ///
        /// Grouping is always explicit; there is no operator overloading, so
        /// `(A and B) or C` is written disjunction(conjunction(A, B), C).
        class Expression {
          public:
            enum class Kind { TERM, AND, OR };

            static Expression term(const std::string &variable, const std::string &label);
            static Expression conjunction(const Expression &left, const Expression &right);
            static Expression disjunction(const Expression &left, const Expression &right);

            /// Left-nested conjunction ((a and b) and c) ...; throws ConfigError when empty.
            static Expression all_of(std::initializer_list<Expression> operands);
            /// Left-nested disjunction; throws ConfigError when empty.
            static Expression any_of(std::initializer_list<Expression> operands);

            /// Firing degree: min for And, max for Or, the fuzzified degree for a Term.
            /// Throws ConfigError when a term's variable or label is absent.
            double evaluate(const Fuzzified &fuzzified) const;

            /// Append every (variable, label) leaf, left to right.
            void collect_terms(std::vector<std::pair<std::string, std::string>> &terms) const;

            Kind kind() const { return kind_; }
            const std::string &variable() const { return variable_; }
            const std::string &label() const { return label_; }
            const Expression &left() const { return *left_; }
            const Expression &right() const { return *right_; }

            std::string to_string() const;

          private:
            Expression(Kind kind, std::string variable, std::string label, std::shared_ptr<const Expression> left,
                       std::shared_ptr<const Expression> right);

            Kind kind_;
            std::string variable_;
            std::string label_;
            std::shared_ptr<const Expression> left_;
            std::shared_ptr<const Expression> right_;
        };

    } // namespace fuzzy
} // namespace fuzzynav
