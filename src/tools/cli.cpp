#include <relq/ir/expr_builder.hpp>
#include <relq/tools/cli.hpp>

#include <fmt/core.h>

namespace relq::tools {

namespace {

auto bad_flag(std::string_view flag, std::string_view text, std::string_view expected)
    -> std::unexpected<Error> {
    return make_error(ErrorKind::ConfigError, std::string(text),
                      fmt::format("bad --{} '{}', expected {}", flag, text, expected));
}

}  // namespace

auto parse_column(std::string_view text) -> Result<Column> {
    auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return bad_flag("column", text, "name:type");
    }
    auto type = parse_semantic_type(text.substr(colon + 1));
    if (!type) {
        return bad_flag("column", text,
                        "a type of int, long, double, string, bool, date or datetime");
    }
    return Column{.name = std::string(text.substr(0, colon)), .type = *type};
}

auto parse_rename(std::string_view text) -> Result<std::pair<std::string, std::string>> {
    auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0 || eq + 1 == text.size()) {
        return bad_flag("rename", text, "old=new");
    }
    return std::pair{std::string(text.substr(0, eq)), std::string(text.substr(eq + 1))};
}

auto parse_sort_key(std::string_view text) -> Result<ir::ExprPtr> {
    auto colon = text.find(':');
    auto name = std::string(text.substr(0, colon));
    if (name.empty()) {
        return bad_flag("sort", text, "column[:asc|desc]");
    }
    if (colon == std::string_view::npos) {
        return ir::asc(ir::col(std::move(name)));
    }
    auto direction = text.substr(colon + 1);
    if (direction == "asc") {
        return ir::asc(ir::col(std::move(name)));
    }
    if (direction == "desc") {
        return ir::desc(ir::col(std::move(name)));
    }
    return bad_flag("sort", text, "column[:asc|desc]");
}

auto build_pipeline(const Options& options) -> Result<pipeline::Pipeline> {
    std::vector<Column> columns;
    columns.reserve(options.columns.size());
    for (const auto& spec : options.columns) {
        auto column = parse_column(spec);
        if (!column) {
            return std::unexpected(column.error());
        }
        columns.push_back(std::move(*column));
    }

    auto schema = TableSchema::make(options.database, options.table, std::move(columns));
    if (!schema) {
        return std::unexpected(schema.error());
    }
    auto p = pipeline::Pipeline::from(*schema);
    if (!p) {
        return p;
    }

    if (!options.select.empty()) {
        if (auto ok = p->select(options.select); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (!options.renames.empty()) {
        std::vector<std::pair<std::string, std::string>> pairs;
        pairs.reserve(options.renames.size());
        for (const auto& text : options.renames) {
            auto pair = parse_rename(text);
            if (!pair) {
                return std::unexpected(pair.error());
            }
            pairs.push_back(std::move(*pair));
        }
        if (auto ok = p->rename(pairs); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (!options.sort_keys.empty()) {
        std::vector<ir::ExprPtr> specs;
        specs.reserve(options.sort_keys.size());
        for (const auto& text : options.sort_keys) {
            auto spec = parse_sort_key(text);
            if (!spec) {
                return std::unexpected(spec.error());
            }
            specs.push_back(std::move(*spec));
        }
        if (auto ok = p->order_by(specs); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (options.offset) {
        if (auto ok = p->offset(*options.offset); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (options.limit) {
        if (auto ok = p->limit(*options.limit); !ok) {
            return std::unexpected(ok.error());
        }
    }
    return p;
}

}  // namespace relq::tools
