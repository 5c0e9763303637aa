#pragma once

#include <relq/core/error.hpp>
#include <relq/core/schema.hpp>
#include <relq/ir/clause.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace relq::pipeline {

/// A validated clause together with the schema it produces.
struct Resolved {
    ir::Clause clause;
    SchemaPtr schema;
};

using ResolveResult = Result<Resolved>;

// ─── Per-clause resolution ────────────────────────────────────────────────────
//  Each function validates a clause request against the current snapshot and
//  returns the IR clause plus the next snapshot. None of them has side effects;
//  `current` is never modified and is shared into the result when a clause
//  leaves the schema unchanged.

[[nodiscard]] auto resolve_select(const SchemaPtr& current, const std::vector<std::string>& names)
    -> ResolveResult;

[[nodiscard]] auto resolve_extend(const SchemaPtr& current, const std::vector<ir::ExprPtr>& fields)
    -> ResolveResult;

[[nodiscard]] auto resolve_rename(const SchemaPtr& current,
                                  const std::vector<std::pair<std::string, std::string>>& pairs)
    -> ResolveResult;

[[nodiscard]] auto resolve_filter(const SchemaPtr& current, const ir::ExprPtr& predicate)
    -> ResolveResult;

[[nodiscard]] auto resolve_group_by(const SchemaPtr& current,
                                    const std::vector<ir::ExprPtr>& selections,
                                    const std::vector<ir::ExprPtr>& keys,
                                    const ir::ExprPtr& having) -> ResolveResult;

[[nodiscard]] auto resolve_order_by(const SchemaPtr& current, const std::vector<ir::ExprPtr>& specs)
    -> ResolveResult;

[[nodiscard]] auto resolve_limit(const SchemaPtr& current, std::int64_t count) -> ResolveResult;

[[nodiscard]] auto resolve_offset(const SchemaPtr& current, std::int64_t count) -> ResolveResult;

[[nodiscard]] auto resolve_distinct(const SchemaPtr& current,
                                    const std::vector<std::string>& names) -> ResolveResult;

/// Joins are checked for column-name collisions before the condition is typed.
[[nodiscard]] auto resolve_join(const SchemaPtr& current, const SchemaPtr& other,
                                ir::JoinKind kind, const ir::ExprPtr& condition)
    -> ResolveResult;

}  // namespace relq::pipeline
