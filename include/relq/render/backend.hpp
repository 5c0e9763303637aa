#pragma once

#include <relq/core/error.hpp>
#include <relq/ir/clause.hpp>
#include <relq/pipeline/pipeline.hpp>

#include <string>
#include <string_view>

namespace relq::render {

/// Target-syntax backend.
///
/// A backend turns validated IR into text and never re-validates. A rendered
/// program is the source followed by one suffix per later clause, so
/// `render(p ++ [c]) == render(p) + render_suffix(c)` holds for every backend
/// that keeps the default `render`. Implementations hold no per-call state,
/// which makes concurrent renders of one pipeline safe.
class Backend {
   public:
    Backend() = default;
    virtual ~Backend() = default;

    Backend(const Backend&) = delete;
    auto operator=(const Backend&) -> Backend& = delete;
    Backend(Backend&&) = default;
    auto operator=(Backend&&) -> Backend& = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// Text for the pipeline's base table.
    [[nodiscard]] virtual auto render_source(const ir::FromClause& from) const
        -> Result<std::string> = 0;

    /// Text appended for one clause after the source. Reports
    /// BackendUnsupported for clause or expression kinds without a mapping.
    [[nodiscard]] virtual auto render_suffix(const ir::Clause& clause) const
        -> Result<std::string> = 0;

    [[nodiscard]] virtual auto render(const pipeline::Pipeline& pipeline) const
        -> Result<std::string>;
};

}  // namespace relq::render
