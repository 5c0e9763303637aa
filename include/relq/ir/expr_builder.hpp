#pragma once

#include <relq/ir/expr.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace relq::ir {

// ─── Leaves ───────────────────────────────────────────────────────────────────
//  Explicit factories for expression trees. Each returns a new shared node and
//  never touches its arguments.

[[nodiscard]] auto col(std::string name) -> ExprPtr;
[[nodiscard]] auto lit_int(std::int32_t v) -> ExprPtr;
[[nodiscard]] auto lit_long(std::int64_t v) -> ExprPtr;
[[nodiscard]] auto lit_double(double v) -> ExprPtr;
[[nodiscard]] auto lit_str(std::string v) -> ExprPtr;
[[nodiscard]] auto lit_bool(bool v) -> ExprPtr;
[[nodiscard]] auto lit_date(Date v) -> ExprPtr;

// ─── Operators ────────────────────────────────────────────────────────────────

[[nodiscard]] auto unary(UnaryOp op, ExprPtr operand) -> ExprPtr;
[[nodiscard]] auto binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr;

[[nodiscard]] auto eq(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto ne(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto lt(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto le(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto gt(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto ge(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto like(ExprPtr column, ExprPtr pattern) -> ExprPtr;
[[nodiscard]] auto in(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto not_in(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto is_null(ExprPtr operand) -> ExprPtr;
[[nodiscard]] auto is_not_null(ExprPtr operand) -> ExprPtr;

[[nodiscard]] auto and_(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto or_(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto not_(ExprPtr operand) -> ExprPtr;

[[nodiscard]] auto add(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto sub(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto mul(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto div(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto mod(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto pow(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto bit_and(ExprPtr l, ExprPtr r) -> ExprPtr;
[[nodiscard]] auto bit_or(ExprPtr l, ExprPtr r) -> ExprPtr;

// ─── Functions ────────────────────────────────────────────────────────────────

[[nodiscard]] auto call(Function fn, std::vector<ExprPtr> args) -> ExprPtr;
[[nodiscard]] auto count(ExprPtr arg) -> ExprPtr;
[[nodiscard]] auto sum(ExprPtr arg) -> ExprPtr;
[[nodiscard]] auto avg(ExprPtr arg) -> ExprPtr;
[[nodiscard]] auto min(ExprPtr arg) -> ExprPtr;
[[nodiscard]] auto max(ExprPtr arg) -> ExprPtr;
[[nodiscard]] auto modulo(ExprPtr value, ExprPtr divisor) -> ExprPtr;
[[nodiscard]] auto power(ExprPtr base, ExprPtr exponent) -> ExprPtr;

// ─── Compound ─────────────────────────────────────────────────────────────────

[[nodiscard]] auto as(ExprPtr expr, std::string alias) -> ExprPtr;
[[nodiscard]] auto if_(ExprPtr test, ExprPtr then_branch, ExprPtr else_branch) -> ExprPtr;
[[nodiscard]] auto asc(ExprPtr expr) -> ExprPtr;
[[nodiscard]] auto desc(ExprPtr expr) -> ExprPtr;
[[nodiscard]] auto group(std::vector<ExprPtr> selections, std::vector<ExprPtr> keys,
                         ExprPtr having = nullptr) -> ExprPtr;
[[nodiscard]] auto join_on(ExprPtr condition) -> ExprPtr;

}  // namespace relq::ir
