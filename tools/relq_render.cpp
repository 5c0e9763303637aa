#include <relq/core/error.hpp>
#include <relq/render/pure_relation.hpp>
#include <relq/tools/cli.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace {

auto report(const relq::Error& error) -> int {
    fmt::print(stderr, "relq_render: {} '{}': {}\n", relq::to_string(error.kind), error.subject,
               error.message);
    return 1;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"relq_render: build a relational pipeline and print its pure relation text"};
    app.set_version_flag("--version", "relq_render 0.1.0");

    bool verbose = false;
    relq::tools::Options options;

    app.add_flag("-v,--verbose", verbose, "Log each appended clause");
    app.add_option("--database", options.database, "Database name")->required();
    app.add_option("--table", options.table, "Table name")->required();
    app.add_option("--column", options.columns, "Column as name:type (repeatable)")->required();
    app.add_option("--select", options.select, "Columns to keep, in order")->delimiter(',');
    app.add_option("--rename", options.renames, "Rename as old=new (repeatable)");
    app.add_option("--sort", options.sort_keys, "Sort key as column[:asc|desc] (repeatable)");
    app.add_option("--offset", options.offset, "Rows to skip");
    app.add_option("--limit", options.limit, "Rows to keep");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    auto pipeline = relq::tools::build_pipeline(options);
    if (!pipeline) {
        return report(pipeline.error());
    }

    relq::render::PureRelationBackend backend(
        relq::render::PureRelationBackend::Config{.trace = verbose});
    auto text = backend.render(*pipeline);
    if (!text) {
        return report(text.error());
    }
    fmt::print("{}\n", *text);
    return 0;
}
