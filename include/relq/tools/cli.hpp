#pragma once

#include <relq/core/error.hpp>
#include <relq/core/schema.hpp>
#include <relq/ir/expr.hpp>
#include <relq/pipeline/pipeline.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relq::tools {

/// Command-line request of relq_render, as collected by CLI11.
struct Options {
    std::string database;
    std::string table;
    /// `name:type`, in column order.
    std::vector<std::string> columns;
    std::vector<std::string> select;
    /// `old=new`.
    std::vector<std::string> renames;
    /// `column`, `column:asc` or `column:desc`.
    std::vector<std::string> sort_keys;
    std::optional<std::int64_t> offset;
    std::optional<std::int64_t> limit;
};

/// Parse `name:type`. Malformed text or an unknown type is a ConfigError.
[[nodiscard]] auto parse_column(std::string_view text) -> Result<Column>;

/// Parse `old=new`. Both sides must be non-empty.
[[nodiscard]] auto parse_rename(std::string_view text)
    -> Result<std::pair<std::string, std::string>>;

/// Parse a sort key into an asc() or desc() node; the direction defaults to asc.
[[nodiscard]] auto parse_sort_key(std::string_view text) -> Result<ir::ExprPtr>;

/// Declare the table and apply the options in the fixed order select, rename,
/// sort, offset, limit. Stops at the first parse or pipeline error.
[[nodiscard]] auto build_pipeline(const Options& options) -> Result<pipeline::Pipeline>;

}  // namespace relq::tools
