#include <relq/core/schema.hpp>

#include <fmt/core.h>

#include <iterator>
#include <unordered_map>
#include <unordered_set>

namespace relq {

auto family_of(SemanticType type) noexcept -> TypeFamily {
    switch (type) {
        case SemanticType::Integer:
        case SemanticType::Long:
        case SemanticType::Double:
            return TypeFamily::Numeric;
        case SemanticType::String:
            return TypeFamily::String;
        case SemanticType::Date:
        case SemanticType::DateTime:
            return TypeFamily::Temporal;
        case SemanticType::Boolean:
            return TypeFamily::Boolean;
    }
    return TypeFamily::Boolean;
}

auto is_numeric(SemanticType type) noexcept -> bool {
    return family_of(type) == TypeFamily::Numeric;
}

auto is_integral(SemanticType type) noexcept -> bool {
    return type == SemanticType::Integer || type == SemanticType::Long;
}

auto widen(SemanticType a, SemanticType b) noexcept -> SemanticType {
    if (a == SemanticType::Double || b == SemanticType::Double) {
        return SemanticType::Double;
    }
    if (a == SemanticType::Long || b == SemanticType::Long) {
        return SemanticType::Long;
    }
    return SemanticType::Integer;
}

auto to_string(SemanticType type) -> std::string_view {
    switch (type) {
        case SemanticType::Integer:
            return "int";
        case SemanticType::Long:
            return "long";
        case SemanticType::Double:
            return "double";
        case SemanticType::String:
            return "string";
        case SemanticType::Boolean:
            return "bool";
        case SemanticType::Date:
            return "date";
        case SemanticType::DateTime:
            return "datetime";
    }
    return "unknown";
}

auto parse_semantic_type(std::string_view text) -> std::optional<SemanticType> {
    static const std::unordered_map<std::string_view, SemanticType> kNames = {
        {"int", SemanticType::Integer},      {"integer", SemanticType::Integer},
        {"long", SemanticType::Long},        {"double", SemanticType::Double},
        {"string", SemanticType::String},    {"bool", SemanticType::Boolean},
        {"boolean", SemanticType::Boolean},  {"date", SemanticType::Date},
        {"datetime", SemanticType::DateTime},
    };
    if (auto it = kNames.find(text); it != kNames.end()) {
        return it->second;
    }
    return std::nullopt;
}

TableSchema::TableSchema(std::string database, std::string table, std::vector<Column> columns)
    : database_(std::move(database)), table_(std::move(table)), columns_(std::move(columns)) {
    index_.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        index_.emplace(columns_[i].name, i);
    }
}

auto TableSchema::make(std::string database, std::string table, std::vector<Column> columns)
    -> Result<SchemaPtr> {
    if (database.empty()) {
        return make_error(ErrorKind::ConfigError, table, "schema requires a database name");
    }
    if (table.empty()) {
        return make_error(ErrorKind::ConfigError, database, "schema requires a table name");
    }
    std::unordered_set<std::string_view> seen;
    for (const auto& column : columns) {
        if (column.name.empty()) {
            return make_error(ErrorKind::ConfigError, table,
                              fmt::format("table '{}' has a column with an empty name", table));
        }
        if (!seen.insert(column.name).second) {
            return make_error(ErrorKind::DuplicateAlias, column.name,
                              fmt::format("column '{}' appears more than once in '{}.{}'",
                                          column.name, database, table));
        }
    }
    return SchemaPtr(new TableSchema(std::move(database), std::move(table), std::move(columns)));
}

auto TableSchema::contains(std::string_view name) const -> bool {
    return index_.find(std::string(name)) != index_.end();
}

auto TableSchema::find(std::string_view name) const -> const Column* {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &columns_[it->second];
}

auto TableSchema::index_of(std::string_view name) const -> std::optional<std::size_t> {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto TableSchema::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.name);
    }
    return names;
}

auto TableSchema::project(const std::vector<std::string>& names) const -> Result<SchemaPtr> {
    std::vector<Column> projected;
    projected.reserve(names.size());
    for (const auto& name : names) {
        const auto* column = find(name);
        if (column == nullptr) {
            return make_error(ErrorKind::UnknownColumn, name,
                              fmt::format("unknown column '{}' in '{}.{}'", name, database_,
                                          table_));
        }
        projected.push_back(*column);
    }
    return with_columns(std::move(projected));
}

auto TableSchema::append(std::vector<Column> extra) const -> Result<SchemaPtr> {
    std::vector<Column> columns = columns_;
    columns.insert(columns.end(), std::make_move_iterator(extra.begin()),
                   std::make_move_iterator(extra.end()));
    return with_columns(std::move(columns));
}

auto TableSchema::rename(const std::vector<std::pair<std::string, std::string>>& pairs) const
    -> Result<SchemaPtr> {
    std::vector<Column> columns = columns_;
    for (const auto& [from, to] : pairs) {
        auto idx = index_of(from);
        if (!idx) {
            return make_error(ErrorKind::UnknownColumn, from,
                              fmt::format("cannot rename unknown column '{}'", from));
        }
        columns[*idx].name = to;
    }
    return with_columns(std::move(columns));
}

auto TableSchema::concat(const TableSchema& other) const -> Result<SchemaPtr> {
    return append(other.columns_);
}

auto TableSchema::with_columns(std::vector<Column> columns) const -> Result<SchemaPtr> {
    return make(database_, table_, std::move(columns));
}

auto make_database(const std::string& database,
                   std::vector<std::pair<std::string, std::vector<Column>>> tables)
    -> Result<Database> {
    if (tables.empty()) {
        return make_error(ErrorKind::ConfigError, database,
                          fmt::format("database '{}' declares no tables", database));
    }
    Database db;
    db.reserve(tables.size());
    for (auto& [table, columns] : tables) {
        if (db.find(table) != db.end()) {
            return make_error(ErrorKind::DuplicateAlias, table,
                              fmt::format("table '{}' is declared twice in '{}'", table,
                                          database));
        }
        auto schema = TableSchema::make(database, table, std::move(columns));
        if (!schema) {
            return std::unexpected(schema.error());
        }
        db.emplace(table, std::move(*schema));
    }
    return db;
}

}  // namespace relq
