#pragma once

#include <relq/core/error.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relq {

/// Semantic column types.
enum class SemanticType : std::uint8_t {
    Integer,
    Long,
    Double,
    String,
    Boolean,
    Date,
    DateTime,
};

/// Comparable type families. Two types compare only within one family.
enum class TypeFamily : std::uint8_t {
    Numeric,
    String,
    Temporal,
    Boolean,
};

[[nodiscard]] auto family_of(SemanticType type) noexcept -> TypeFamily;
[[nodiscard]] auto is_numeric(SemanticType type) noexcept -> bool;
[[nodiscard]] auto is_integral(SemanticType type) noexcept -> bool;

/// Wider of two numeric types (Integer < Long < Double).
[[nodiscard]] auto widen(SemanticType a, SemanticType b) noexcept -> SemanticType;

[[nodiscard]] auto to_string(SemanticType type) -> std::string_view;

/// Parse a type name as accepted on the command line ("int", "long", "double",
/// "string", "bool", "date", "datetime").
[[nodiscard]] auto parse_semantic_type(std::string_view text) -> std::optional<SemanticType>;

struct Column {
    std::string name;
    SemanticType type = SemanticType::Integer;

    auto operator==(const Column&) const -> bool = default;
};

class TableSchema;
using SchemaPtr = std::shared_ptr<const TableSchema>;

/// Immutable table schema: database, table and ordered columns.
///
/// Every derivation returns a new schema, so a snapshot handed out by a
/// pipeline never changes underneath its holder.
class TableSchema {
   public:
    /// Validate and build a schema. Column names must be unique.
    [[nodiscard]] static auto make(std::string database, std::string table,
                                   std::vector<Column> columns) -> Result<SchemaPtr>;

    [[nodiscard]] auto database() const noexcept -> const std::string& { return database_; }
    [[nodiscard]] auto table() const noexcept -> const std::string& { return table_; }
    [[nodiscard]] auto columns() const noexcept -> const std::vector<Column>& { return columns_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return columns_.size(); }

    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto find(std::string_view name) const -> const Column*;
    [[nodiscard]] auto index_of(std::string_view name) const -> std::optional<std::size_t>;
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;

    /// Columns named in `names`, in that order.
    [[nodiscard]] auto project(const std::vector<std::string>& names) const -> Result<SchemaPtr>;
    /// This schema followed by `extra`.
    [[nodiscard]] auto append(std::vector<Column> extra) const -> Result<SchemaPtr>;
    /// Rename columns in place; order is preserved.
    [[nodiscard]] auto rename(const std::vector<std::pair<std::string, std::string>>& pairs) const
        -> Result<SchemaPtr>;
    /// Columns of this schema followed by those of `other`; keeps this schema's names.
    [[nodiscard]] auto concat(const TableSchema& other) const -> Result<SchemaPtr>;
    /// Same database and table, replacement column list.
    [[nodiscard]] auto with_columns(std::vector<Column> columns) const -> Result<SchemaPtr>;

   private:
    TableSchema(std::string database, std::string table, std::vector<Column> columns);

    std::string database_;
    std::string table_;
    std::vector<Column> columns_;
    robin_hood::unordered_flat_map<std::string, std::size_t> index_;
};

/// Tables of one database, by table name.
using Database = robin_hood::unordered_flat_map<std::string, SchemaPtr>;

/// Register several tables of one database at once. Each table is validated
/// as by TableSchema::make; a table name given twice is a DuplicateAlias.
[[nodiscard]] auto make_database(
    const std::string& database,
    std::vector<std::pair<std::string, std::vector<Column>>> tables) -> Result<Database>;

}  // namespace relq
