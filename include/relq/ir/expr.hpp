#pragma once

#include <relq/core/schema.hpp>
#include <relq/core/time.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace relq::ir {

/// Expression trees are persistent: nodes are immutable once built and children
/// are shared, never mutated, so a subtree can appear in several trees.
struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/// Column reference, resolved by name against the current schema snapshot.
struct ColumnRef {
    std::string name;
};

/// Typed literal. Integers and longs are distinct so that widening stays exact.
struct Literal {
    std::variant<std::int32_t, std::int64_t, double, std::string, bool, Date> value;

    [[nodiscard]] auto type() const noexcept -> SemanticType;
};

enum class UnaryOp : std::uint8_t {
    Not,
    IsNull,
    IsNotNull,
};

/// Binary operators.
/// Comparison: Eq .. NotIn. Logical: And, Or. Arithmetic: Add .. Pow.
/// Bitwise: BitAnd, BitOr.
enum class BinaryOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    Like,
    In,
    NotIn,
    And,
    Or,
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Pow,
    BitAnd,
    BitOr,
};

enum class Function : std::uint8_t {
    Count,
    Sum,
    Avg,
    Min,
    Max,
    Modulo,
    Power,
};

enum class Direction : std::uint8_t {
    Ascending,
    Descending,
};

struct UnaryExpr {
    UnaryOp op = UnaryOp::Not;
    ExprPtr operand;
};

struct BinaryExpr {
    BinaryOp op = BinaryOp::Eq;
    ExprPtr left;
    ExprPtr right;
};

struct CallExpr {
    Function fn = Function::Count;
    std::vector<ExprPtr> args;
};

/// `expr as alias`.
struct AliasExpr {
    std::string alias;
    ExprPtr expr;
};

struct IfExpr {
    ExprPtr test;
    ExprPtr then_branch;
    ExprPtr else_branch;
};

struct OrderSpec {
    Direction direction = Direction::Ascending;
    ExprPtr expr;
};

/// Grouping: output selections, grouping keys and an optional having predicate
/// (null when absent).
struct GroupSpec {
    std::vector<ExprPtr> selections;
    std::vector<ExprPtr> keys;
    ExprPtr having;
};

struct JoinSpec {
    ExprPtr condition;
};

struct Expr {
    std::variant<ColumnRef, Literal, UnaryExpr, BinaryExpr, CallExpr, AliasExpr, IfExpr, OrderSpec,
                 GroupSpec, JoinSpec>
        node;
};

[[nodiscard]] auto is_comparison(BinaryOp op) noexcept -> bool;
[[nodiscard]] auto is_logical(BinaryOp op) noexcept -> bool;
[[nodiscard]] auto is_arithmetic(BinaryOp op) noexcept -> bool;
[[nodiscard]] auto is_bitwise(BinaryOp op) noexcept -> bool;
[[nodiscard]] auto is_aggregate(Function fn) noexcept -> bool;

/// Operator and function names used in diagnostics (not backend tokens).
[[nodiscard]] auto to_string(UnaryOp op) -> std::string_view;
[[nodiscard]] auto to_string(BinaryOp op) -> std::string_view;
[[nodiscard]] auto to_string(Function fn) -> std::string_view;

}  // namespace relq::ir
