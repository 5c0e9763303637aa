#include <relq/core/error.hpp>
#include <relq/core/schema.hpp>
#include <relq/core/time.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace relq;

static auto employees() -> SchemaPtr {
    auto schema = TableSchema::make("test", "employees",
                                    {
                                        {.name = "id", .type = SemanticType::Integer},
                                        {.name = "name", .type = SemanticType::String},
                                        {.name = "age", .type = SemanticType::Integer},
                                        {.name = "salary", .type = SemanticType::Double},
                                    });
    REQUIRE(schema.has_value());
    return *schema;
}

// ─── Construction ─────────────────────────────────────────────────────────────

TEST_CASE("schema: make keeps database, table and column order", "[schema]") {
    auto schema = employees();
    CHECK(schema->database() == "test");
    CHECK(schema->table() == "employees");
    REQUIRE(schema->size() == 4);
    CHECK(schema->column_names() == std::vector<std::string>{"id", "name", "age", "salary"});
    CHECK(schema->columns()[3].type == SemanticType::Double);
}

TEST_CASE("schema: lookup by name", "[schema]") {
    auto schema = employees();
    CHECK(schema->contains("age"));
    CHECK_FALSE(schema->contains("bonus"));

    const auto* salary = schema->find("salary");
    REQUIRE(salary != nullptr);
    CHECK(salary->type == SemanticType::Double);
    CHECK(schema->find("bonus") == nullptr);

    CHECK(schema->index_of("name") == 1);
    CHECK_FALSE(schema->index_of("bonus").has_value());
}

TEST_CASE("schema: duplicate column names are rejected", "[schema]") {
    auto schema = TableSchema::make("test", "t",
                                    {
                                        {.name = "id", .type = SemanticType::Integer},
                                        {.name = "id", .type = SemanticType::Long},
                                    });
    REQUIRE_FALSE(schema.has_value());
    CHECK(schema.error().kind == ErrorKind::DuplicateAlias);
    CHECK(schema.error().subject == "id");
}

TEST_CASE("schema: empty names are configuration errors", "[schema]") {
    auto no_db = TableSchema::make("", "t", {{.name = "id", .type = SemanticType::Integer}});
    REQUIRE_FALSE(no_db.has_value());
    CHECK(no_db.error().kind == ErrorKind::ConfigError);

    auto no_table = TableSchema::make("db", "", {{.name = "id", .type = SemanticType::Integer}});
    REQUIRE_FALSE(no_table.has_value());
    CHECK(no_table.error().kind == ErrorKind::ConfigError);

    auto no_column = TableSchema::make("db", "t", {{.name = "", .type = SemanticType::Integer}});
    REQUIRE_FALSE(no_column.has_value());
    CHECK(no_column.error().kind == ErrorKind::ConfigError);
}

// ─── Derivation ───────────────────────────────────────────────────────────────

TEST_CASE("schema: project reorders and keeps types", "[schema]") {
    auto schema = employees();
    auto projected = schema->project({"salary", "id"});
    REQUIRE(projected.has_value());
    REQUIRE((*projected)->size() == 2);
    CHECK((*projected)->columns()[0] == Column{.name = "salary", .type = SemanticType::Double});
    CHECK((*projected)->columns()[1] == Column{.name = "id", .type = SemanticType::Integer});
    CHECK((*projected)->table() == "employees");

    // The source snapshot is untouched.
    CHECK(schema->size() == 4);
}

TEST_CASE("schema: project of an unknown column", "[schema]") {
    auto projected = employees()->project({"id", "bonus"});
    REQUIRE_FALSE(projected.has_value());
    CHECK(projected.error().kind == ErrorKind::UnknownColumn);
    CHECK(projected.error().subject == "bonus");
}

TEST_CASE("schema: rename in place", "[schema]") {
    auto renamed = employees()->rename({{"id", "employee_id"}, {"name", "employee_name"}});
    REQUIRE(renamed.has_value());
    CHECK((*renamed)->column_names() ==
          std::vector<std::string>{"employee_id", "employee_name", "age", "salary"});
    CHECK((*renamed)->find("employee_name")->type == SemanticType::String);
}

TEST_CASE("schema: append and concat", "[schema]") {
    auto schema = employees();
    auto extended = schema->append({{.name = "bonus", .type = SemanticType::Double}});
    REQUIRE(extended.has_value());
    CHECK((*extended)->size() == 5);
    CHECK((*extended)->columns().back().name == "bonus");

    auto clash = schema->append({{.name = "age", .type = SemanticType::Long}});
    REQUIRE_FALSE(clash.has_value());
    CHECK(clash.error().kind == ErrorKind::DuplicateAlias);

    auto departments = TableSchema::make("test", "departments",
                                         {{.name = "dept_id", .type = SemanticType::Integer},
                                          {.name = "title", .type = SemanticType::String}});
    REQUIRE(departments.has_value());
    auto joined = schema->concat(**departments);
    REQUIRE(joined.has_value());
    CHECK((*joined)->size() == 6);
    CHECK((*joined)->table() == "employees");
    CHECK((*joined)->index_of("title") == 5);
}

// ─── Types ────────────────────────────────────────────────────────────────────

TEST_CASE("schema: type families and widening", "[schema]") {
    CHECK(family_of(SemanticType::Long) == TypeFamily::Numeric);
    CHECK(family_of(SemanticType::DateTime) == TypeFamily::Temporal);
    CHECK(family_of(SemanticType::Boolean) == TypeFamily::Boolean);
    CHECK(is_integral(SemanticType::Long));
    CHECK_FALSE(is_integral(SemanticType::Double));

    CHECK(widen(SemanticType::Integer, SemanticType::Integer) == SemanticType::Integer);
    CHECK(widen(SemanticType::Integer, SemanticType::Long) == SemanticType::Long);
    CHECK(widen(SemanticType::Double, SemanticType::Long) == SemanticType::Double);
}

TEST_CASE("schema: type names", "[schema]") {
    CHECK(to_string(SemanticType::Integer) == "int");
    CHECK(to_string(SemanticType::DateTime) == "datetime");
    CHECK(parse_semantic_type("double") == SemanticType::Double);
    CHECK(parse_semantic_type("bool") == SemanticType::Boolean);
    CHECK_FALSE(parse_semantic_type("decimal").has_value());
}

TEST_CASE("schema: error kind names", "[schema]") {
    CHECK(to_string(ErrorKind::UnknownColumn) == "UnknownColumn");
    CHECK(to_string(ErrorKind::InvalidAggregateReference) == "InvalidAggregateReference");
    CHECK(to_string(ErrorKind::BackendUnsupported) == "BackendUnsupported");
}

TEST_CASE("time: dates count days from the epoch", "[schema][time]") {
    CHECK(make_date(1970, 1, 1).days == 0);
    CHECK(make_date(1970, 1, 2).days == 1);
    CHECK(make_date(1969, 12, 31).days == -1);
    CHECK(format_date(make_date(2024, 2, 29)) == "2024-02-29");
    CHECK(make_date(2020, 1, 1) < make_date(2021, 1, 1));
}

// ─── Database ─────────────────────────────────────────────────────────────────

TEST_CASE("schema: database registers several tables", "[schema]") {
    auto db = make_database("test",
                            {
                                {"employees",
                                 {{.name = "id", .type = SemanticType::Integer},
                                  {.name = "department_id", .type = SemanticType::Integer}}},
                                {"departments",
                                 {{.name = "dept_id", .type = SemanticType::Integer},
                                  {.name = "title", .type = SemanticType::String}}},
                            });
    REQUIRE(db.has_value());
    REQUIRE(db->size() == 2);

    auto it = db->find("departments");
    REQUIRE(it != db->end());
    CHECK(it->second->database() == "test");
    CHECK(it->second->table() == "departments");
    CHECK(it->second->column_names() == std::vector<std::string>{"dept_id", "title"});
}

TEST_CASE("schema: database errors", "[schema]") {
    auto twice = make_database("test", {{"t", {{.name = "a", .type = SemanticType::Integer}}},
                                        {"t", {{.name = "b", .type = SemanticType::Integer}}}});
    REQUIRE_FALSE(twice.has_value());
    CHECK(twice.error().kind == ErrorKind::DuplicateAlias);
    CHECK(twice.error().subject == "t");

    auto bad_table = make_database("test", {{"t",
                                             {{.name = "a", .type = SemanticType::Integer},
                                              {.name = "a", .type = SemanticType::Long}}}});
    REQUIRE_FALSE(bad_table.has_value());
    CHECK(bad_table.error().kind == ErrorKind::DuplicateAlias);
    CHECK(bad_table.error().subject == "a");

    auto empty = make_database("test", {});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().kind == ErrorKind::ConfigError);
}
