#include <relq/ir/expr_builder.hpp>

#include <utility>

namespace relq::ir {

namespace {

auto make(auto node) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{std::move(node)});
}

}  // namespace

auto col(std::string name) -> ExprPtr {
    return make(ColumnRef{.name = std::move(name)});
}

auto lit_int(std::int32_t v) -> ExprPtr {
    return make(Literal{.value = v});
}

auto lit_long(std::int64_t v) -> ExprPtr {
    return make(Literal{.value = v});
}

auto lit_double(double v) -> ExprPtr {
    return make(Literal{.value = v});
}

auto lit_str(std::string v) -> ExprPtr {
    return make(Literal{.value = std::move(v)});
}

auto lit_bool(bool v) -> ExprPtr {
    return make(Literal{.value = v});
}

auto lit_date(Date v) -> ExprPtr {
    return make(Literal{.value = v});
}

auto unary(UnaryOp op, ExprPtr operand) -> ExprPtr {
    return make(UnaryExpr{.op = op, .operand = std::move(operand)});
}

auto binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
    return make(BinaryExpr{.op = op, .left = std::move(left), .right = std::move(right)});
}

auto eq(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Eq, std::move(l), std::move(r));
}

auto ne(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Ne, std::move(l), std::move(r));
}

auto lt(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Lt, std::move(l), std::move(r));
}

auto le(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Le, std::move(l), std::move(r));
}

auto gt(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Gt, std::move(l), std::move(r));
}

auto ge(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Ge, std::move(l), std::move(r));
}

auto like(ExprPtr column, ExprPtr pattern) -> ExprPtr {
    return binary(BinaryOp::Like, std::move(column), std::move(pattern));
}

auto in(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::In, std::move(l), std::move(r));
}

auto not_in(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::NotIn, std::move(l), std::move(r));
}

auto is_null(ExprPtr operand) -> ExprPtr {
    return unary(UnaryOp::IsNull, std::move(operand));
}

auto is_not_null(ExprPtr operand) -> ExprPtr {
    return unary(UnaryOp::IsNotNull, std::move(operand));
}

auto and_(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::And, std::move(l), std::move(r));
}

auto or_(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Or, std::move(l), std::move(r));
}

auto not_(ExprPtr operand) -> ExprPtr {
    return unary(UnaryOp::Not, std::move(operand));
}

auto add(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Add, std::move(l), std::move(r));
}

auto sub(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Sub, std::move(l), std::move(r));
}

auto mul(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Mul, std::move(l), std::move(r));
}

auto div(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Div, std::move(l), std::move(r));
}

auto mod(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Mod, std::move(l), std::move(r));
}

auto pow(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::Pow, std::move(l), std::move(r));
}

auto bit_and(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::BitAnd, std::move(l), std::move(r));
}

auto bit_or(ExprPtr l, ExprPtr r) -> ExprPtr {
    return binary(BinaryOp::BitOr, std::move(l), std::move(r));
}

auto call(Function fn, std::vector<ExprPtr> args) -> ExprPtr {
    return make(CallExpr{.fn = fn, .args = std::move(args)});
}

auto count(ExprPtr arg) -> ExprPtr {
    return call(Function::Count, {std::move(arg)});
}

auto sum(ExprPtr arg) -> ExprPtr {
    return call(Function::Sum, {std::move(arg)});
}

auto avg(ExprPtr arg) -> ExprPtr {
    return call(Function::Avg, {std::move(arg)});
}

auto min(ExprPtr arg) -> ExprPtr {
    return call(Function::Min, {std::move(arg)});
}

auto max(ExprPtr arg) -> ExprPtr {
    return call(Function::Max, {std::move(arg)});
}

auto modulo(ExprPtr value, ExprPtr divisor) -> ExprPtr {
    return call(Function::Modulo, {std::move(value), std::move(divisor)});
}

auto power(ExprPtr base, ExprPtr exponent) -> ExprPtr {
    return call(Function::Power, {std::move(base), std::move(exponent)});
}

auto as(ExprPtr expr, std::string alias) -> ExprPtr {
    return make(AliasExpr{.alias = std::move(alias), .expr = std::move(expr)});
}

auto if_(ExprPtr test, ExprPtr then_branch, ExprPtr else_branch) -> ExprPtr {
    return make(IfExpr{.test = std::move(test),
                       .then_branch = std::move(then_branch),
                       .else_branch = std::move(else_branch)});
}

auto asc(ExprPtr expr) -> ExprPtr {
    return make(OrderSpec{.direction = Direction::Ascending, .expr = std::move(expr)});
}

auto desc(ExprPtr expr) -> ExprPtr {
    return make(OrderSpec{.direction = Direction::Descending, .expr = std::move(expr)});
}

auto group(std::vector<ExprPtr> selections, std::vector<ExprPtr> keys, ExprPtr having)
    -> ExprPtr {
    return make(GroupSpec{
        .selections = std::move(selections), .keys = std::move(keys), .having = std::move(having)});
}

auto join_on(ExprPtr condition) -> ExprPtr {
    return make(JoinSpec{.condition = std::move(condition)});
}

}  // namespace relq::ir
