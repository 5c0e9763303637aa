#pragma once

#include <relq/core/error.hpp>
#include <relq/core/schema.hpp>
#include <relq/ir/expr.hpp>

namespace relq::ir {

/// Name-resolution scope for type inference.
///
/// `columns` answers plain column references. Aggregate arguments resolve
/// against `aggregate_input` when set (the pre-aggregation schema of a group),
/// otherwise against `columns`. A reference that misses `columns` but hits
/// `grouped_source` is an InvalidAggregateReference rather than UnknownColumn.
struct Scope {
    const TableSchema* columns = nullptr;
    const TableSchema* aggregate_input = nullptr;
    const TableSchema* grouped_source = nullptr;
    bool allow_aggregates = true;
};

/// Infer the result type of a value expression, enforcing operator and
/// function legality. Raises TypeError, UnknownColumn or
/// InvalidAggregateReference.
[[nodiscard]] auto infer_type(const Expr& expr, const Scope& scope) -> Result<SemanticType>;

[[nodiscard]] auto infer_type(const Expr& expr, const TableSchema& schema) -> Result<SemanticType>;

/// Infer and require Boolean. `context` names the clause in the message.
[[nodiscard]] auto check_predicate(const Expr& expr, const Scope& scope, std::string_view context)
    -> Result<void>;

}  // namespace relq::ir
