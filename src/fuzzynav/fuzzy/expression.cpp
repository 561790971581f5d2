#include "fuzzynav/fuzzy/expression.hpp"
#include "fuzzynav/types.hpp"
#include <algorithm>

namespace fuzzynav {
    namespace fuzzy {

        namespace {
            Expression fold(std::initializer_list<Expression> operands, Expression::Kind kind) {
                if (operands.size() == 0) {
                    throw ConfigError("cannot combine an empty list of expressions");
                }
                auto it = operands.begin();
                Expression result = *it;
                for (++it; it != operands.end(); ++it) {
                    result = (kind == Expression::Kind::AND) ? Expression::conjunction(result, *it)
                                                             : Expression::disjunction(result, *it);
                }
                return result;
            }
        } // namespace

        Expression::Expression(Kind kind, std::string variable, std::string label,
                               std::shared_ptr<const Expression> left, std::shared_ptr<const Expression> right)
            : kind_(kind), variable_(std::move(variable)), label_(std::move(label)), left_(std::move(left)),
              right_(std::move(right)) {}

        Expression Expression::term(const std::string &variable, const std::string &label) {
            if (variable.empty() || label.empty()) {
                throw ConfigError("term needs a variable and a label");
            }
            return Expression(Kind::TERM, variable, label, nullptr, nullptr);
        }

        Expression Expression::conjunction(const Expression &left, const Expression &right) {
            return Expression(Kind::AND, "", "", std::make_shared<const Expression>(left),
                              std::make_shared<const Expression>(right));
        }

        Expression Expression::disjunction(const Expression &left, const Expression &right) {
            return Expression(Kind::OR, "", "", std::make_shared<const Expression>(left),
                              std::make_shared<const Expression>(right));
        }

        Expression Expression::all_of(std::initializer_list<Expression> operands) { return fold(operands, Kind::AND); }

        Expression Expression::any_of(std::initializer_list<Expression> operands) { return fold(operands, Kind::OR); }

        double Expression::evaluate(const Fuzzified &fuzzified) const {
            switch (kind_) {
            case Kind::TERM: {
                auto var = fuzzified.find(variable_);
                if (var == fuzzified.end()) {
                    throw ConfigError("no fuzzified value for variable '" + variable_ + "'");
                }
                auto deg = var->second.find(label_);
                if (deg == var->second.end()) {
                    throw ConfigError("variable '" + variable_ + "' has no label '" + label_ + "'");
                }
                return deg->second;
            }
            case Kind::AND:
                return std::min(left_->evaluate(fuzzified), right_->evaluate(fuzzified));
            case Kind::OR:
                return std::max(left_->evaluate(fuzzified), right_->evaluate(fuzzified));
            }
            return 0.0;
        }

        void Expression::collect_terms(std::vector<std::pair<std::string, std::string>> &terms) const {
            if (kind_ == Kind::TERM) {
                terms.emplace_back(variable_, label_);
                return;
            }
            left_->collect_terms(terms);
            right_->collect_terms(terms);
        }

        std::string Expression::to_string() const {
            switch (kind_) {
            case Kind::TERM:
                return variable_ + "[" + label_ + "]";
            case Kind::AND:
                return "(" + left_->to_string() + " AND " + right_->to_string() + ")";
            case Kind::OR:
                return "(" + left_->to_string() + " OR " + right_->to_string() + ")";
            }
            return "";
        }

    } // namespace fuzzy
} // namespace fuzzynav
