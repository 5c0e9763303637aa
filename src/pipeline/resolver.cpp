#include <relq/ir/expr_builder.hpp>
#include <relq/ir/typing.hpp>
#include <relq/pipeline/resolver.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <unordered_set>

namespace relq::pipeline {

namespace {

auto resolved(ir::Clause clause, SchemaPtr schema) -> ResolveResult {
    return Resolved{.clause = std::move(clause), .schema = std::move(schema)};
}

auto unknown_column(const std::string& name, const TableSchema& schema) -> std::unexpected<Error> {
    return make_error(ErrorKind::UnknownColumn, name,
                      fmt::format("unknown column '{}' in '{}.{}'", name, schema.database(),
                                  schema.table()));
}

auto duplicate_alias(const std::string& name, std::string_view what) -> std::unexpected<Error> {
    return make_error(ErrorKind::DuplicateAlias, name,
                      fmt::format("{} '{}' collides with an existing column", what, name));
}

/// Shared by select and distinct: names exist, appear once, list non-empty.
auto resolve_column_list(const TableSchema& schema, const std::vector<std::string>& names,
                         std::string_view clause) -> Result<std::vector<ir::ColumnRef>> {
    if (names.empty()) {
        return make_error(ErrorKind::ConfigError, std::string(clause),
                          fmt::format("{} requires at least one column", clause));
    }
    std::unordered_set<std::string_view> seen;
    std::vector<ir::ColumnRef> refs;
    refs.reserve(names.size());
    for (const auto& name : names) {
        if (!schema.contains(name)) {
            return unknown_column(name, schema);
        }
        if (!seen.insert(name).second) {
            return make_error(ErrorKind::DuplicateAlias, name,
                              fmt::format("column '{}' is listed twice in {}", name, clause));
        }
        refs.push_back(ir::ColumnRef{.name = name});
    }
    return refs;
}

/// Output name of a group selection: alias, key name, `<fn>_<column>`, or positional.
auto selection_name(const ir::Expr& selection, std::size_t position) -> std::string {
    if (const auto* alias = std::get_if<ir::AliasExpr>(&selection.node)) {
        return alias->alias;
    }
    if (const auto* ref = std::get_if<ir::ColumnRef>(&selection.node)) {
        return ref->name;
    }
    if (const auto* call = std::get_if<ir::CallExpr>(&selection.node)) {
        if (call->args.size() == 1 && call->args[0]) {
            if (const auto* arg = std::get_if<ir::ColumnRef>(&call->args[0]->node)) {
                return fmt::format("{}_{}", ir::to_string(call->fn), arg->name);
            }
        }
    }
    return fmt::format("agg_{}", position + 1);
}

}  // namespace

auto resolve_select(const SchemaPtr& current, const std::vector<std::string>& names)
    -> ResolveResult {
    auto refs = resolve_column_list(*current, names, "select");
    if (!refs) {
        return std::unexpected(refs.error());
    }
    auto schema = current->project(names);
    if (!schema) {
        return std::unexpected(schema.error());
    }
    return resolved(ir::Clause{ir::SelectClause{.columns = std::move(*refs)}}, std::move(*schema));
}

auto resolve_extend(const SchemaPtr& current, const std::vector<ir::ExprPtr>& fields)
    -> ResolveResult {
    if (fields.empty()) {
        return make_error(ErrorKind::ConfigError, "extend",
                          "extend requires at least one computed column");
    }

    // Aliases are checked before any expression is typed so that a collision
    // is always reported as such.
    std::unordered_set<std::string_view> seen;
    std::vector<const ir::AliasExpr*> aliases;
    aliases.reserve(fields.size());
    for (const auto& field : fields) {
        const auto* alias = field ? std::get_if<ir::AliasExpr>(&field->node) : nullptr;
        if (alias == nullptr) {
            return make_error(ErrorKind::TypeError, "extend",
                              "extend fields must be named with as(expr, alias)");
        }
        if (alias->alias.empty()) {
            return make_error(ErrorKind::ConfigError, "extend", "extend alias must not be empty");
        }
        if (current->contains(alias->alias) || !seen.insert(alias->alias).second) {
            return duplicate_alias(alias->alias, "extend alias");
        }
        aliases.push_back(alias);
    }

    std::vector<Column> added;
    added.reserve(aliases.size());
    const ir::Scope scope{.columns = current.get()};
    for (const auto* alias : aliases) {
        if (!alias->expr) {
            return make_error(ErrorKind::TypeError, alias->alias,
                              fmt::format("extend alias '{}' has no expression", alias->alias));
        }
        auto type = ir::infer_type(*alias->expr, scope);
        if (!type) {
            return std::unexpected(type.error());
        }
        added.push_back(Column{.name = alias->alias, .type = *type});
    }

    auto schema = current->append(std::move(added));
    if (!schema) {
        return std::unexpected(schema.error());
    }
    return resolved(ir::Clause{ir::ExtendClause{.fields = fields}}, std::move(*schema));
}

auto resolve_rename(const SchemaPtr& current,
                    const std::vector<std::pair<std::string, std::string>>& pairs)
    -> ResolveResult {
    if (pairs.empty()) {
        return make_error(ErrorKind::ConfigError, "rename", "rename requires at least one pair");
    }
    std::unordered_set<std::string_view> sources;
    std::unordered_set<std::string_view> targets;
    for (const auto& [from, to] : pairs) {
        if (!current->contains(from)) {
            return unknown_column(from, *current);
        }
        if (!sources.insert(from).second) {
            return make_error(ErrorKind::DuplicateAlias, from,
                              fmt::format("column '{}' is renamed more than once", from));
        }
        if (to.empty()) {
            return make_error(ErrorKind::ConfigError, from,
                              fmt::format("new name for '{}' must not be empty", from));
        }
        if (!targets.insert(to).second) {
            return make_error(ErrorKind::DuplicateAlias, to,
                              fmt::format("two columns are renamed to '{}'", to));
        }
    }
    std::vector<ir::RenamePair> renames;
    renames.reserve(pairs.size());
    for (const auto& [from, to] : pairs) {
        if (current->contains(to) && !sources.contains(to)) {
            return duplicate_alias(to, "rename target");
        }
        renames.push_back(ir::RenamePair{.from = from, .to = to});
    }

    auto schema = current->rename(pairs);
    if (!schema) {
        return std::unexpected(schema.error());
    }
    return resolved(ir::Clause{ir::RenameClause{.renames = std::move(renames)}},
                    std::move(*schema));
}

auto resolve_filter(const SchemaPtr& current, const ir::ExprPtr& predicate) -> ResolveResult {
    if (!predicate) {
        return make_error(ErrorKind::ConfigError, "filter", "filter requires a predicate");
    }
    const ir::Scope scope{.columns = current.get(), .allow_aggregates = false};
    if (auto ok = ir::check_predicate(*predicate, scope, "filter"); !ok) {
        return std::unexpected(ok.error());
    }
    return resolved(ir::Clause{ir::FilterClause{.predicate = predicate}}, current);
}

auto resolve_group_by(const SchemaPtr& current, const std::vector<ir::ExprPtr>& selections,
                      const std::vector<ir::ExprPtr>& keys, const ir::ExprPtr& having)
    -> ResolveResult {
    if (selections.empty()) {
        return make_error(ErrorKind::ConfigError, "groupBy",
                          "groupBy requires at least one selection");
    }

    std::vector<std::string> key_names;
    key_names.reserve(keys.size());
    for (const auto& key : keys) {
        const auto* ref = key ? std::get_if<ir::ColumnRef>(&key->node) : nullptr;
        if (ref == nullptr) {
            return make_error(ErrorKind::TypeError, "groupBy",
                              "grouping keys must be column references");
        }
        if (!current->contains(ref->name)) {
            return unknown_column(ref->name, *current);
        }
        if (std::find(key_names.begin(), key_names.end(), ref->name) != key_names.end()) {
            return make_error(ErrorKind::DuplicateAlias, ref->name,
                              fmt::format("grouping key '{}' is listed twice", ref->name));
        }
        key_names.push_back(ref->name);
    }
    auto key_schema = current->project(key_names);
    if (!key_schema) {
        return std::unexpected(key_schema.error());
    }

    // Plain references see only the keys; aggregate arguments see the full input.
    const ir::Scope selection_scope{
        .columns = key_schema->get(),
        .aggregate_input = current.get(),
        .grouped_source = current.get(),
        .allow_aggregates = true,
    };
    std::unordered_set<std::string> seen;
    std::vector<Column> outputs;
    std::vector<ir::ExprPtr> named;
    outputs.reserve(selections.size());
    named.reserve(selections.size());
    for (std::size_t i = 0; i < selections.size(); ++i) {
        const auto& selection = selections[i];
        if (!selection) {
            return make_error(ErrorKind::ConfigError, "groupBy",
                              fmt::format("groupBy selection {} is empty", i + 1));
        }
        auto type = ir::infer_type(*selection, selection_scope);
        if (!type) {
            return std::unexpected(type.error());
        }
        auto name = selection_name(*selection, i);
        if (!seen.insert(name).second) {
            return duplicate_alias(name, "groupBy output");
        }
        // A derived output name is stored as an alias so that it is spelled
        // out wherever the clause is rendered.
        const bool plain = std::holds_alternative<ir::AliasExpr>(selection->node) ||
                           std::holds_alternative<ir::ColumnRef>(selection->node);
        named.push_back(plain ? selection : ir::as(selection, name));
        outputs.push_back(Column{.name = std::move(name), .type = *type});
    }
    auto schema = current->with_columns(std::move(outputs));
    if (!schema) {
        return std::unexpected(schema.error());
    }

    if (having) {
        const ir::Scope having_scope{
            .columns = schema->get(),
            .aggregate_input = current.get(),
            .grouped_source = current.get(),
            .allow_aggregates = true,
        };
        if (auto ok = ir::check_predicate(*having, having_scope, "having"); !ok) {
            return std::unexpected(ok.error());
        }
    }

    ir::GroupSpec spec{.selections = std::move(named), .keys = keys, .having = having};
    return resolved(ir::Clause{ir::GroupByClause{.spec = std::move(spec)}}, std::move(*schema));
}

auto resolve_order_by(const SchemaPtr& current, const std::vector<ir::ExprPtr>& specs)
    -> ResolveResult {
    if (specs.empty()) {
        return make_error(ErrorKind::ConfigError, "orderBy",
                          "orderBy requires at least one sort key");
    }
    const ir::Scope scope{.columns = current.get(), .allow_aggregates = false};
    std::vector<ir::OrderSpec> order;
    order.reserve(specs.size());
    for (const auto& spec : specs) {
        const auto* order_spec = spec ? std::get_if<ir::OrderSpec>(&spec->node) : nullptr;
        if (order_spec == nullptr || !order_spec->expr) {
            return make_error(ErrorKind::TypeError, "orderBy",
                              "sort keys must be built with asc() or desc()");
        }
        auto type = ir::infer_type(*order_spec->expr, scope);
        if (!type) {
            return std::unexpected(type.error());
        }
        order.push_back(*order_spec);
    }
    return resolved(ir::Clause{ir::OrderByClause{.specs = std::move(order)}}, current);
}

auto resolve_limit(const SchemaPtr& current, std::int64_t count) -> ResolveResult {
    if (count < 0) {
        return make_error(ErrorKind::ConfigError, "limit",
                          fmt::format("limit must be non-negative, got {}", count));
    }
    return resolved(ir::Clause{ir::LimitClause{.count = count}}, current);
}

auto resolve_offset(const SchemaPtr& current, std::int64_t count) -> ResolveResult {
    if (count < 0) {
        return make_error(ErrorKind::ConfigError, "offset",
                          fmt::format("offset must be non-negative, got {}", count));
    }
    return resolved(ir::Clause{ir::OffsetClause{.count = count}}, current);
}

auto resolve_distinct(const SchemaPtr& current, const std::vector<std::string>& names)
    -> ResolveResult {
    if (names.empty()) {
        return resolved(ir::Clause{ir::DistinctClause{}}, current);
    }
    auto refs = resolve_column_list(*current, names, "distinct");
    if (!refs) {
        return std::unexpected(refs.error());
    }
    auto schema = current->project(names);
    if (!schema) {
        return std::unexpected(schema.error());
    }
    return resolved(ir::Clause{ir::DistinctClause{.columns = std::move(*refs)}},
                    std::move(*schema));
}

auto resolve_join(const SchemaPtr& current, const SchemaPtr& other, ir::JoinKind kind,
                  const ir::ExprPtr& condition) -> ResolveResult {
    if (!other) {
        return make_error(ErrorKind::ConfigError, "join", "join requires a table to join with");
    }
    for (const auto& column : other->columns()) {
        if (current->contains(column.name)) {
            return make_error(ErrorKind::DuplicateAlias, column.name,
                              fmt::format("column '{}' exists on both sides of the join with "
                                          "'{}.{}'; rename it before joining",
                                          column.name, other->database(), other->table()));
        }
    }
    if (!condition) {
        return make_error(ErrorKind::ConfigError, "join", "join requires a condition");
    }
    auto joined = current->concat(*other);
    if (!joined) {
        return std::unexpected(joined.error());
    }
    const ir::Scope scope{.columns = joined->get(), .allow_aggregates = false};
    if (auto ok = ir::check_predicate(*condition, scope, "join"); !ok) {
        return std::unexpected(ok.error());
    }
    ir::JoinClause clause{
        .source = ir::FromClause{.database = other->database(), .table = other->table()},
        .kind = kind,
        .on = ir::JoinSpec{.condition = condition},
    };
    return resolved(ir::Clause{std::move(clause)}, std::move(*joined));
}

}  // namespace relq::pipeline
