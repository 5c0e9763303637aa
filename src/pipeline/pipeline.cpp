#include <relq/pipeline/pipeline.hpp>

#include <spdlog/spdlog.h>

namespace relq::pipeline {

Pipeline::Pipeline(SchemaPtr schema) {
    clauses_.push_back(ir::Clause{
        ir::FromClause{.database = schema->database(), .table = schema->table()}});
    snapshots_.push_back(std::move(schema));
}

auto Pipeline::from(SchemaPtr schema) -> Result<Pipeline> {
    if (!schema) {
        return make_error(ErrorKind::ConfigError, "from", "pipeline requires a base table");
    }
    spdlog::debug("pipeline: from {}.{} ({} columns)", schema->database(), schema->table(),
                  schema->size());
    return Pipeline(std::move(schema));
}

auto Pipeline::append(ir::ClauseKind kind, ResolveResult resolved) -> Result<void> {
    if (!resolved) {
        const auto& err = resolved.error();
        spdlog::debug("pipeline: rejected {} on {}.{}: {} '{}': {}", ir::to_string(kind),
                      source().database, source().table, to_string(err.kind), err.subject,
                      err.message);
        return std::unexpected(err);
    }
    clauses_.push_back(std::move(resolved->clause));
    snapshots_.push_back(std::move(resolved->schema));
    spdlog::debug("pipeline: appended {} (clause {}, {} columns)", ir::to_string(kind),
                  clauses_.size() - 1, snapshots_.back()->size());
    return {};
}

auto Pipeline::select(const std::vector<std::string>& names) -> Result<void> {
    return append(ir::ClauseKind::Select, resolve_select(snapshots_.back(), names));
}

auto Pipeline::extend(const std::vector<ir::ExprPtr>& fields) -> Result<void> {
    return append(ir::ClauseKind::Extend, resolve_extend(snapshots_.back(), fields));
}

auto Pipeline::rename(const std::vector<std::pair<std::string, std::string>>& pairs)
    -> Result<void> {
    return append(ir::ClauseKind::Rename, resolve_rename(snapshots_.back(), pairs));
}

auto Pipeline::filter(const ir::ExprPtr& predicate) -> Result<void> {
    return append(ir::ClauseKind::Filter, resolve_filter(snapshots_.back(), predicate));
}

auto Pipeline::group_by(const std::vector<ir::ExprPtr>& selections,
                        const std::vector<ir::ExprPtr>& keys, const ir::ExprPtr& having)
    -> Result<void> {
    return append(ir::ClauseKind::GroupBy,
                  resolve_group_by(snapshots_.back(), selections, keys, having));
}

auto Pipeline::group_by(const ir::ExprPtr& spec) -> Result<void> {
    const auto* group = spec ? std::get_if<ir::GroupSpec>(&spec->node) : nullptr;
    if (group == nullptr) {
        return append(ir::ClauseKind::GroupBy,
                      make_error(ErrorKind::TypeError, "groupBy",
                                 "groupBy expects a specification built with group()"));
    }
    return group_by(group->selections, group->keys, group->having);
}

auto Pipeline::order_by(const std::vector<ir::ExprPtr>& specs) -> Result<void> {
    return append(ir::ClauseKind::OrderBy, resolve_order_by(snapshots_.back(), specs));
}

auto Pipeline::limit(std::int64_t count) -> Result<void> {
    return append(ir::ClauseKind::Limit, resolve_limit(snapshots_.back(), count));
}

auto Pipeline::offset(std::int64_t count) -> Result<void> {
    return append(ir::ClauseKind::Offset, resolve_offset(snapshots_.back(), count));
}

auto Pipeline::slice(std::int64_t offset, std::int64_t limit) -> Result<void> {
    // Both halves are resolved before either is stored.
    auto skip = resolve_offset(snapshots_.back(), offset);
    if (!skip) {
        return append(ir::ClauseKind::Offset, std::move(skip));
    }
    auto take = resolve_limit(skip->schema, limit);
    if (!take) {
        return append(ir::ClauseKind::Limit, std::move(take));
    }
    if (auto ok = append(ir::ClauseKind::Offset, std::move(skip)); !ok) {
        return ok;
    }
    return append(ir::ClauseKind::Limit, std::move(take));
}

auto Pipeline::distinct(const std::vector<std::string>& names) -> Result<void> {
    return append(ir::ClauseKind::Distinct, resolve_distinct(snapshots_.back(), names));
}

auto Pipeline::join(const SchemaPtr& other, ir::JoinKind kind, const ir::ExprPtr& condition)
    -> Result<void> {
    return append(ir::ClauseKind::Join, resolve_join(snapshots_.back(), other, kind, condition));
}

}  // namespace relq::pipeline
