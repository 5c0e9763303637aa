#pragma once

#include <relq/ir/expr.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace relq::ir {

/// Pipeline stage kinds.
enum class ClauseKind : std::uint8_t {
    From,
    Select,
    Extend,
    Rename,
    Filter,
    GroupBy,
    OrderBy,
    Limit,
    Offset,
    Distinct,
    Join,
};

enum class JoinKind : std::uint8_t {
    Inner,
    Left,
};

/// Source table of a pipeline or of the right side of a join.
struct FromClause {
    std::string database;
    std::string table;
};

/// Projection onto existing columns, in the given order.
struct SelectClause {
    std::vector<ColumnRef> columns;
};

/// Appends computed columns; every field is an AliasExpr.
struct ExtendClause {
    std::vector<ExprPtr> fields;
};

struct RenamePair {
    std::string from;
    std::string to;
};

struct RenameClause {
    std::vector<RenamePair> renames;
};

struct FilterClause {
    ExprPtr predicate;
};

struct GroupByClause {
    GroupSpec spec;
};

struct OrderByClause {
    std::vector<OrderSpec> specs;
};

struct LimitClause {
    std::int64_t count = 0;
};

struct OffsetClause {
    std::int64_t count = 0;
};

/// Drops duplicate rows over `columns`, or over all columns when empty.
struct DistinctClause {
    std::vector<ColumnRef> columns;
};

struct JoinClause {
    FromClause source;
    JoinKind kind = JoinKind::Inner;
    JoinSpec on;
};

/// One validated relational operation. Clauses are only produced by the
/// pipeline resolver, so everything a Clause embeds has already been checked
/// against the schema it applies to.
struct Clause {
    std::variant<FromClause, SelectClause, ExtendClause, RenameClause, FilterClause, GroupByClause,
                 OrderByClause, LimitClause, OffsetClause, DistinctClause, JoinClause>
        node;

    [[nodiscard]] auto kind() const noexcept -> ClauseKind {
        return static_cast<ClauseKind>(node.index());
    }
};

[[nodiscard]] auto to_string(ClauseKind kind) -> std::string_view;
[[nodiscard]] auto to_string(JoinKind kind) -> std::string_view;

}  // namespace relq::ir
