#pragma once

#include <relq/render/backend.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace relq::render {

/// Renders pipelines as pure relation text:
///
///     company.employees
///     ->filter((age > 30))
///     ->project([id, name])
///
/// The source renders as `<database>.<table>`; each later clause adds
/// `\n-><op>(<args>)`.
class PureRelationBackend final : public Backend {
   public:
    struct Config {
        /// Log every rendered suffix at debug level.
        bool trace = false;
    };

    PureRelationBackend() = default;
    explicit PureRelationBackend(Config config) : config_(config) {}

    [[nodiscard]] auto name() const -> std::string_view override { return "pure-relation"; }

    [[nodiscard]] auto render_source(const ir::FromClause& from) const
        -> Result<std::string> override;

    [[nodiscard]] auto render_suffix(const ir::Clause& clause) const
        -> Result<std::string> override;

    /// Render a single value expression.
    [[nodiscard]] auto render_expr(const ir::Expr& expr) const -> Result<std::string>;

    [[nodiscard]] static auto binary_token(ir::BinaryOp op) -> std::string_view;
    [[nodiscard]] static auto function_token(ir::Function fn) -> std::string_view;
    [[nodiscard]] static auto render_literal(const ir::Literal& literal) -> std::string;

   private:
    auto render_list(const std::vector<ir::ExprPtr>& exprs) const -> Result<std::string>;
    auto render_operand(const ir::ExprPtr& expr) const -> Result<std::string>;

    Config config_;
};

}  // namespace relq::render
