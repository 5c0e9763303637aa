#include <relq/core/schema.hpp>
#include <relq/ir/expr_builder.hpp>
#include <relq/pipeline/pipeline.hpp>
#include <relq/render/pure_relation.hpp>

#include <fmt/core.h>

using namespace relq;

auto main() -> int {
    auto employees = TableSchema::make("company", "employees",
                                       {
                                           {.name = "id", .type = SemanticType::Integer},
                                           {.name = "name", .type = SemanticType::String},
                                           {.name = "age", .type = SemanticType::Integer},
                                           {.name = "salary", .type = SemanticType::Double},
                                           {.name = "department_id", .type = SemanticType::Integer},
                                       });
    if (!employees) {
        fmt::print(stderr, "schema: {}\n", employees.error().message);
        return 1;
    }

    auto query = pipeline::Pipeline::from(*employees);
    if (!query) {
        fmt::print(stderr, "pipeline: {}\n", query.error().message);
        return 1;
    }

    fmt::print("=== Building ===\n");

    if (auto ok = query->filter(ir::gt(ir::col("age"), ir::lit_int(30))); !ok) {
        fmt::print(stderr, "filter: {}\n", ok.error().message);
        return 1;
    }
    if (auto ok = query->extend({ir::as(ir::add(ir::col("salary"), ir::lit_int(1000)), "bonus")});
        !ok) {
        fmt::print(stderr, "extend: {}\n", ok.error().message);
        return 1;
    }

    // Rejected: 'bonus' now exists. The pipeline is left as it was.
    if (auto ok = query->extend({ir::as(ir::col("salary"), "bonus")}); !ok) {
        fmt::print("rejected extend: {} ({})\n", to_string(ok.error().kind), ok.error().subject);
    }

    if (auto ok = query->order_by({ir::desc(ir::col("salary"))}); !ok) {
        fmt::print(stderr, "order_by: {}\n", ok.error().message);
        return 1;
    }
    if (auto ok = query->limit(10); !ok) {
        fmt::print(stderr, "limit: {}\n", ok.error().message);
        return 1;
    }

    fmt::print("clauses: {}, final columns: {}\n", query->size(), query->schema().size());

    fmt::print("\n=== Rendering ===\n");
    render::PureRelationBackend backend;
    auto text = backend.render(*query);
    if (!text) {
        fmt::print(stderr, "render: {}\n", text.error().message);
        return 1;
    }
    fmt::print("{}\n", *text);
    return 0;
}
