#include <relq/ir/typing.hpp>

#include <fmt/core.h>

namespace relq::ir {

namespace {

auto type_error(std::string_view subject, std::string message) -> std::unexpected<Error> {
    return make_error(ErrorKind::TypeError, std::string(subject), std::move(message));
}

class TypeChecker {
   public:
    explicit TypeChecker(const Scope& scope) : scope_(scope) {}

    auto infer(const Expr& expr) -> Result<SemanticType> {
        if (const auto* ref = std::get_if<ColumnRef>(&expr.node)) {
            return infer_column(*ref);
        }
        if (const auto* lit = std::get_if<Literal>(&expr.node)) {
            return lit->type();
        }
        if (const auto* un = std::get_if<UnaryExpr>(&expr.node)) {
            return infer_unary(*un);
        }
        if (const auto* bin = std::get_if<BinaryExpr>(&expr.node)) {
            return infer_binary(*bin);
        }
        if (const auto* call = std::get_if<CallExpr>(&expr.node)) {
            return infer_call(*call);
        }
        if (const auto* alias = std::get_if<AliasExpr>(&expr.node)) {
            return infer_child(alias->expr, alias->alias);
        }
        if (const auto* cond = std::get_if<IfExpr>(&expr.node)) {
            return infer_if(*cond);
        }
        if (std::holds_alternative<OrderSpec>(expr.node)) {
            return type_error("sort", "an order specification is not a value");
        }
        if (std::holds_alternative<GroupSpec>(expr.node)) {
            return type_error("groupBy", "a group specification is not a value");
        }
        return type_error("join", "a join specification is not a value");
    }

   private:
    auto infer_child(const ExprPtr& child, std::string_view owner) -> Result<SemanticType> {
        if (!child) {
            return type_error(owner, fmt::format("'{}' is missing an operand", owner));
        }
        return infer(*child);
    }

    auto infer_column(const ColumnRef& ref) -> Result<SemanticType> {
        if (scope_.columns != nullptr) {
            if (const auto* column = scope_.columns->find(ref.name)) {
                return column->type;
            }
        }
        if (scope_.grouped_source != nullptr && scope_.grouped_source->contains(ref.name)) {
            return make_error(ErrorKind::InvalidAggregateReference, ref.name,
                              fmt::format("column '{}' is neither a grouping key nor an "
                                          "aggregate",
                                          ref.name));
        }
        return make_error(ErrorKind::UnknownColumn, ref.name,
                          fmt::format("unknown column '{}'", ref.name));
    }

    auto infer_unary(const UnaryExpr& un) -> Result<SemanticType> {
        auto name = to_string(un.op);
        auto operand = infer_child(un.operand, name);
        if (!operand) {
            return operand;
        }
        if (un.op == UnaryOp::Not) {
            if (*operand != SemanticType::Boolean) {
                return type_error(name, fmt::format("NOT requires a bool operand, got {}",
                                                    to_string(*operand)));
            }
            return SemanticType::Boolean;
        }
        if (!std::holds_alternative<ColumnRef>(un.operand->node)) {
            return type_error(name, fmt::format("{} applies to a column reference", name));
        }
        return SemanticType::Boolean;
    }

    auto infer_binary(const BinaryExpr& bin) -> Result<SemanticType> {
        auto name = to_string(bin.op);
        auto left = infer_child(bin.left, name);
        if (!left) {
            return left;
        }
        auto right = infer_child(bin.right, name);
        if (!right) {
            return right;
        }
        const SemanticType lt = *left;
        const SemanticType rt = *right;

        if (bin.op == BinaryOp::Like) {
            if (!std::holds_alternative<ColumnRef>(bin.left->node) || lt != SemanticType::String) {
                return type_error(name, "LIKE requires a string column on the left");
            }
            if (!std::holds_alternative<Literal>(bin.right->node) || rt != SemanticType::String) {
                return type_error(name, "LIKE requires a string literal pattern");
            }
            return SemanticType::Boolean;
        }
        if (is_comparison(bin.op)) {
            const bool equality = bin.op == BinaryOp::Eq || bin.op == BinaryOp::Ne ||
                                  bin.op == BinaryOp::In || bin.op == BinaryOp::NotIn;
            if (family_of(lt) != family_of(rt) ||
                (family_of(lt) == TypeFamily::Boolean && !equality)) {
                return type_error(name, fmt::format("cannot compare {} with {}", to_string(lt),
                                                    to_string(rt)));
            }
            return SemanticType::Boolean;
        }
        if (is_logical(bin.op)) {
            if (lt != SemanticType::Boolean || rt != SemanticType::Boolean) {
                return type_error(name, fmt::format("{} requires bool operands, got {} and {}",
                                                    name, to_string(lt), to_string(rt)));
            }
            return SemanticType::Boolean;
        }
        if (is_bitwise(bin.op)) {
            if (!is_integral(lt) || !is_integral(rt)) {
                return type_error(name, fmt::format("{} requires int or long operands, got {} "
                                                    "and {}",
                                                    name, to_string(lt), to_string(rt)));
            }
            return widen(lt, rt);
        }
        // Mod and Pow render as mod()/pow() calls and are typed like them.
        if (bin.op == BinaryOp::Mod && (!is_integral(lt) || !is_integral(rt))) {
            return type_error(name, fmt::format("MOD requires int or long operands, got {} and {}",
                                                to_string(lt), to_string(rt)));
        }
        if (!is_numeric(lt) || !is_numeric(rt)) {
            return type_error(name, fmt::format("arithmetic '{}' requires numeric operands, got "
                                                "{} and {}",
                                                name, to_string(lt), to_string(rt)));
        }
        if (bin.op == BinaryOp::Pow) {
            return SemanticType::Double;
        }
        return widen(lt, rt);
    }

    auto infer_call(const CallExpr& call) -> Result<SemanticType> {
        auto name = to_string(call.fn);
        const std::size_t arity =
            (call.fn == Function::Modulo || call.fn == Function::Power) ? 2 : 1;
        if (call.args.size() != arity) {
            return type_error(name, fmt::format("{} expects {} argument(s), got {}", name, arity,
                                                call.args.size()));
        }

        std::vector<SemanticType> types;
        types.reserve(call.args.size());
        if (is_aggregate(call.fn)) {
            if (!scope_.allow_aggregates) {
                return make_error(ErrorKind::InvalidAggregateReference, std::string(name),
                                  fmt::format("aggregate '{}' is not allowed here", name));
            }
            Scope inner{
                .columns =
                    scope_.aggregate_input != nullptr ? scope_.aggregate_input : scope_.columns,
                .aggregate_input = nullptr,
                .grouped_source = nullptr,
                .allow_aggregates = false,
            };
            TypeChecker arg_checker(inner);
            for (const auto& arg : call.args) {
                if (!arg) {
                    return type_error(name, fmt::format("'{}' is missing an argument", name));
                }
                auto type = arg_checker.infer(*arg);
                if (!type) {
                    return std::unexpected(type.error());
                }
                types.push_back(*type);
            }
        } else {
            for (const auto& arg : call.args) {
                auto type = infer_child(arg, name);
                if (!type) {
                    return type;
                }
                types.push_back(*type);
            }
        }

        switch (call.fn) {
            case Function::Count:
                return SemanticType::Long;
            case Function::Sum:
                if (!is_numeric(types[0])) {
                    break;
                }
                return types[0] == SemanticType::Double ? SemanticType::Double
                                                        : SemanticType::Long;
            case Function::Avg:
                if (!is_numeric(types[0])) {
                    break;
                }
                return SemanticType::Double;
            case Function::Min:
            case Function::Max:
                if (family_of(types[0]) == TypeFamily::Boolean) {
                    break;
                }
                return types[0];
            case Function::Modulo:
                if (!is_integral(types[0]) || !is_integral(types[1])) {
                    break;
                }
                return widen(types[0], types[1]);
            case Function::Power:
                if (!is_numeric(types[0]) || !is_numeric(types[1])) {
                    break;
                }
                return SemanticType::Double;
        }
        return type_error(name, fmt::format("invalid argument type {} for {}",
                                            to_string(types.back()), name));
    }

    auto infer_if(const IfExpr& cond) -> Result<SemanticType> {
        auto test = infer_child(cond.test, "if");
        if (!test) {
            return test;
        }
        if (*test != SemanticType::Boolean) {
            return type_error("if", fmt::format("if condition must be bool, got {}",
                                                to_string(*test)));
        }
        auto then_type = infer_child(cond.then_branch, "if");
        if (!then_type) {
            return then_type;
        }
        auto else_type = infer_child(cond.else_branch, "if");
        if (!else_type) {
            return else_type;
        }
        if (family_of(*then_type) != family_of(*else_type)) {
            return type_error("if", fmt::format("if branches disagree: {} and {}",
                                                to_string(*then_type), to_string(*else_type)));
        }
        if (is_numeric(*then_type)) {
            return widen(*then_type, *else_type);
        }
        return *then_type;
    }

    const Scope& scope_;
};

}  // namespace

auto infer_type(const Expr& expr, const Scope& scope) -> Result<SemanticType> {
    TypeChecker checker(scope);
    return checker.infer(expr);
}

auto infer_type(const Expr& expr, const TableSchema& schema) -> Result<SemanticType> {
    return infer_type(expr, Scope{.columns = &schema});
}

auto check_predicate(const Expr& expr, const Scope& scope, std::string_view context)
    -> Result<void> {
    auto type = infer_type(expr, scope);
    if (!type) {
        return std::unexpected(type.error());
    }
    if (*type != SemanticType::Boolean) {
        return make_error(ErrorKind::TypeError, std::string(context),
                          fmt::format("{} condition must be bool, got {}", context,
                                      to_string(*type)));
    }
    return {};
}

}  // namespace relq::ir
