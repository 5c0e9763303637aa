#include <relq/core/schema.hpp>
#include <relq/ir/expr_builder.hpp>
#include <relq/pipeline/pipeline.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace relq;
using pipeline::Pipeline;

static auto make_schema(std::string database, std::string table, std::vector<Column> columns)
    -> SchemaPtr {
    auto schema = TableSchema::make(std::move(database), std::move(table), std::move(columns));
    REQUIRE(schema.has_value());
    return *schema;
}

static auto employees() -> SchemaPtr {
    return make_schema("company", "employees",
                       {
                           {.name = "id", .type = SemanticType::Integer},
                           {.name = "name", .type = SemanticType::String},
                           {.name = "age", .type = SemanticType::Integer},
                           {.name = "salary", .type = SemanticType::Double},
                           {.name = "department_id", .type = SemanticType::Integer},
                       });
}

static auto departments() -> SchemaPtr {
    return make_schema("company", "departments",
                       {
                           {.name = "id", .type = SemanticType::Integer},
                           {.name = "name", .type = SemanticType::String},
                       });
}

static auto start(SchemaPtr schema) -> Pipeline {
    auto p = Pipeline::from(std::move(schema));
    REQUIRE(p.has_value());
    return std::move(*p);
}

// ─── Construction ─────────────────────────────────────────────────────────────

TEST_CASE("pipeline: starts with a single from clause", "[pipeline]") {
    auto p = start(employees());
    REQUIRE(p.size() == 1);
    CHECK(p.clauses()[0].kind() == ir::ClauseKind::From);
    CHECK(p.source().database == "company");
    CHECK(p.source().table == "employees");
    CHECK(p.snapshots().size() == 1);
    CHECK(p.schema().size() == 5);
}

TEST_CASE("pipeline: a moved-from pipeline stays usable", "[pipeline]") {
    auto p = start(employees());
    REQUIRE(p.filter(ir::gt(ir::col("age"), ir::lit_int(30))));

    Pipeline moved = std::move(p);
    CHECK(moved.size() == 2);
    CHECK(p.size() == 2);  // NOLINT(bugprone-use-after-move)
    CHECK(p.source().table == "employees");
    CHECK(p.schema().size() == 5);
    REQUIRE(p.limit(3));
    CHECK(p.size() == 3);
    CHECK(moved.size() == 2);

    auto other = start(departments());
    other = std::move(moved);
    CHECK(other.source().table == "employees");
    CHECK(moved.source().table == "employees");  // NOLINT(bugprone-use-after-move)
}

TEST_CASE("pipeline: null base schema", "[pipeline]") {
    auto p = Pipeline::from(nullptr);
    REQUIRE_FALSE(p.has_value());
    CHECK(p.error().kind == ErrorKind::ConfigError);
}

TEST_CASE("pipeline: every clause has a snapshot", "[pipeline]") {
    auto p = start(employees());
    REQUIRE(p.filter(ir::gt(ir::col("age"), ir::lit_int(30))));
    REQUIRE(p.extend({ir::as(ir::add(ir::col("salary"), ir::lit_int(1000)), "bonus")}));
    REQUIRE(p.select({"name", "bonus"}));
    REQUIRE(p.order_by({ir::desc(ir::col("bonus"))}));
    REQUIRE(p.limit(10));

    REQUIRE(p.size() == 6);
    REQUIRE(p.snapshots().size() == 6);
    CHECK(p.snapshots()[1]->size() == 5);
    CHECK(p.snapshots()[2]->size() == 6);
    CHECK(p.snapshots()[3]->column_names() == std::vector<std::string>{"name", "bonus"});
    CHECK(p.schema().column_names() == std::vector<std::string>{"name", "bonus"});
    CHECK(p.clauses()[5].kind() == ir::ClauseKind::Limit);
}

// ─── Select ───────────────────────────────────────────────────────────────────

TEST_CASE("pipeline: select preserves order and types", "[pipeline]") {
    auto p = start(employees());
    REQUIRE(p.select({"salary", "name"}));
    REQUIRE(p.schema().size() == 2);
    CHECK(p.schema().columns()[0] == Column{.name = "salary", .type = SemanticType::Double});
    CHECK(p.schema().columns()[1] == Column{.name = "name", .type = SemanticType::String});
}

TEST_CASE("pipeline: selecting every column is idempotent", "[pipeline]") {
    auto p = start(employees());
    auto all = p.schema().column_names();
    REQUIRE(p.select(all));
    REQUIRE(p.select(all));
    CHECK(p.schema().columns() == employees()->columns());
    CHECK(p.snapshots()[1]->columns() == p.snapshots()[2]->columns());
}

TEST_CASE("pipeline: select then filter on a dropped column", "[pipeline]") {
    auto p = start(employees());
    REQUIRE(p.select({"name", "salary"}));

    auto ok = p.filter(ir::gt(ir::col("age"), ir::lit_int(30)));
    REQUIRE_FALSE(ok.has_value());
    CHECK(ok.error().kind == ErrorKind::UnknownColumn);
    CHECK(ok.error().subject == "age");
    CHECK(p.size() == 2);
}

// ─── Rollback ─────────────────────────────────────────────────────────────────

TEST_CASE("pipeline: a rejected append leaves the pipeline unchanged", "[pipeline]") {
    auto p = start(employees());
    REQUIRE(p.filter(ir::gt(ir::col("age"), ir::lit_int(30))));
    const auto before = p.schema().columns();
    const auto* last = p.snapshots().back().get();

    auto dup = p.extend({ir::as(ir::col("salary"), "age")});
    REQUIRE_FALSE(dup.has_value());
    CHECK(dup.error().kind == ErrorKind::DuplicateAlias);

    auto bad_type = p.filter(ir::add(ir::col("age"), ir::lit_int(1)));
    REQUIRE_FALSE(bad_type.has_value());
    CHECK(bad_type.error().kind == ErrorKind::TypeError);

    auto bad_limit = p.limit(-1);
    REQUIRE_FALSE(bad_limit.has_value());
    CHECK(bad_limit.error().kind == ErrorKind::ConfigError);

    CHECK(p.size() == 2);
    CHECK(p.snapshots().size() == 2);
    CHECK(p.snapshots().back().get() == last);
    CHECK(p.schema().columns() == before);

    // Still usable after rejections.
    REQUIRE(p.extend({ir::as(ir::col("salary"), "pay")}));
    CHECK(p.size() == 3);
}

TEST_CASE("pipeline: extend with an existing name is rejected", "[pipeline]") {
    auto p = start(employees());
    REQUIRE(p.extend({ir::as(ir::add(ir::col("salary"), ir::lit_int(1000)), "bonus")}));

    auto again = p.extend({ir::as(ir::col("salary"), "bonus")});
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().kind == ErrorKind::DuplicateAlias);
    CHECK(again.error().subject == "bonus");
}

// ─── Slice ────────────────────────────────────────────────────────────────────

TEST_CASE("pipeline: slice appends offset then limit", "[pipeline]") {
    auto p = start(employees());
    REQUIRE(p.slice(5, 10));
    REQUIRE(p.size() == 3);
    CHECK(std::get<ir::OffsetClause>(p.clauses()[1].node).count == 5);
    CHECK(std::get<ir::LimitClause>(p.clauses()[2].node).count == 10);
}

TEST_CASE("pipeline: slice is all or nothing", "[pipeline]") {
    auto p = start(employees());

    auto bad_limit = p.slice(5, -1);
    REQUIRE_FALSE(bad_limit.has_value());
    CHECK(bad_limit.error().kind == ErrorKind::ConfigError);
    CHECK(bad_limit.error().subject == "limit");
    CHECK(p.size() == 1);

    auto bad_offset = p.slice(-1, 5);
    REQUIRE_FALSE(bad_offset.has_value());
    CHECK(bad_offset.error().subject == "offset");
    CHECK(p.size() == 1);
}

// ─── Limit / Offset ───────────────────────────────────────────────────────────

TEST_CASE("pipeline: limit then offset", "[pipeline]") {
    auto p = start(employees());
    REQUIRE_FALSE(p.limit(-1).has_value());
    REQUIRE(p.limit(5));
    REQUIRE(p.offset(10));
    CHECK(p.size() == 3);
    CHECK(p.clauses()[1].kind() == ir::ClauseKind::Limit);
    CHECK(p.clauses()[2].kind() == ir::ClauseKind::Offset);
}

// ─── GroupBy ──────────────────────────────────────────────────────────────────

TEST_CASE("pipeline: group by replaces the schema", "[pipeline][group]") {
    auto p = start(employees());
    REQUIRE(p.group_by({ir::col("department_id"), ir::as(ir::avg(ir::col("salary")), "avg_salary")},
                       {ir::col("department_id")}));
    CHECK(p.schema().column_names() == std::vector<std::string>{"department_id", "avg_salary"});

    // Only the grouped columns remain visible downstream.
    auto gone = p.filter(ir::gt(ir::col("age"), ir::lit_int(30)));
    REQUIRE_FALSE(gone.has_value());
    CHECK(gone.error().kind == ErrorKind::UnknownColumn);

    REQUIRE(p.filter(ir::gt(ir::col("avg_salary"), ir::lit_int(50000))));
}

TEST_CASE("pipeline: group by from a group specification", "[pipeline][group]") {
    auto p = start(employees());
    auto spec = ir::group({ir::col("department_id"), ir::as(ir::count(ir::col("id")), "n")},
                          {ir::col("department_id")},
                          ir::gt(ir::count(ir::col("id")), ir::lit_int(3)));
    REQUIRE(p.group_by(spec));
    const auto& clause = std::get<ir::GroupByClause>(p.clauses()[1].node);
    CHECK(clause.spec.having != nullptr);
    CHECK(p.schema().find("n")->type == SemanticType::Long);

    auto q = start(employees());
    auto wrong = q.group_by(ir::col("department_id"));
    REQUIRE_FALSE(wrong.has_value());
    CHECK(wrong.error().kind == ErrorKind::TypeError);
    CHECK(q.size() == 1);
}

TEST_CASE("pipeline: group by with a bare non-key column", "[pipeline][group]") {
    auto p = start(employees());
    auto ok = p.group_by({ir::col("department_id"), ir::col("name")}, {ir::col("department_id")});
    REQUIRE_FALSE(ok.has_value());
    CHECK(ok.error().kind == ErrorKind::InvalidAggregateReference);
    CHECK(ok.error().subject == "name");
    CHECK(p.size() == 1);
}

TEST_CASE("pipeline: having on a non-key input column", "[pipeline][group]") {
    auto p = start(employees());
    auto ok = p.group_by({ir::col("department_id"), ir::as(ir::sum(ir::col("salary")), "total")},
                         {ir::col("department_id")}, ir::gt(ir::col("salary"), ir::lit_int(10)));
    REQUIRE_FALSE(ok.has_value());
    CHECK(ok.error().kind == ErrorKind::InvalidAggregateReference);
    CHECK(ok.error().subject == "salary");
}

// ─── Join ─────────────────────────────────────────────────────────────────────

TEST_CASE("pipeline: join with clashing column names", "[pipeline][join]") {
    auto p = start(employees());
    auto ok = p.join(departments(), ir::JoinKind::Inner,
                     ir::eq(ir::col("department_id"), ir::col("id")));
    REQUIRE_FALSE(ok.has_value());
    CHECK(ok.error().kind == ErrorKind::DuplicateAlias);
    CHECK(p.size() == 1);
}

TEST_CASE("pipeline: join after renaming the clashing columns", "[pipeline][join]") {
    auto p = start(employees());
    REQUIRE(p.rename({{"id", "employee_id"}, {"name", "employee_name"}}));
    REQUIRE(p.join(departments(), ir::JoinKind::Left,
                   ir::eq(ir::col("department_id"), ir::col("id"))));
    CHECK(p.schema().column_names() ==
          std::vector<std::string>{"employee_id", "employee_name", "age", "salary",
                                   "department_id", "id", "name"});
    CHECK(p.schema().table() == "employees");
}

TEST_CASE("pipeline: join with a null table", "[pipeline][join]") {
    auto p = start(employees());
    auto ok = p.join(nullptr, ir::JoinKind::Inner, ir::lit_bool(true));
    REQUIRE_FALSE(ok.has_value());
    CHECK(ok.error().kind == ErrorKind::ConfigError);
}

// ─── Distinct ─────────────────────────────────────────────────────────────────

TEST_CASE("pipeline: distinct", "[pipeline]") {
    auto p = start(employees());
    REQUIRE(p.distinct());
    CHECK(p.schema().size() == 5);
    REQUIRE(p.distinct({"department_id"}));
    CHECK(p.schema().column_names() == std::vector<std::string>{"department_id"});
    CHECK(p.clauses().back().kind() == ir::ClauseKind::Distinct);
}
