#pragma once

#include <relq/core/error.hpp>
#include <relq/core/schema.hpp>
#include <relq/ir/clause.hpp>
#include <relq/pipeline/resolver.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace relq::pipeline {

/// Ordered, validated list of clauses over one base table.
///
/// Element zero is always the From clause of the base table, and
/// `snapshots()[i]` is the schema produced by `clauses()[i]`. Every append
/// resolves the request against the latest snapshot first; a failed append
/// returns the error and leaves the pipeline exactly as it was.
///
/// A pipeline is not safe for concurrent mutation. Once construction is done
/// any number of renders may read it concurrently.
class Pipeline {
   public:
    /// Start a pipeline on `schema`. Fails with ConfigError on a null schema.
    [[nodiscard]] static auto from(SchemaPtr schema) -> Result<Pipeline>;

    /// Clauses and snapshots are shared immutable data, so moving copies them
    /// and the source keeps its From clause and remains fully usable.
    Pipeline(const Pipeline&) = default;
    Pipeline(Pipeline&& other) : Pipeline(std::as_const(other)) {}
    auto operator=(const Pipeline&) -> Pipeline& = default;
    auto operator=(Pipeline&& other) -> Pipeline& { return *this = std::as_const(other); }
    ~Pipeline() = default;

    [[nodiscard]] auto select(const std::vector<std::string>& names) -> Result<void>;
    [[nodiscard]] auto extend(const std::vector<ir::ExprPtr>& fields) -> Result<void>;
    [[nodiscard]] auto rename(const std::vector<std::pair<std::string, std::string>>& pairs)
        -> Result<void>;
    [[nodiscard]] auto filter(const ir::ExprPtr& predicate) -> Result<void>;
    [[nodiscard]] auto group_by(const std::vector<ir::ExprPtr>& selections,
                                const std::vector<ir::ExprPtr>& keys,
                                const ir::ExprPtr& having = nullptr) -> Result<void>;
    /// Accepts a GroupSpec node built with ir::group().
    [[nodiscard]] auto group_by(const ir::ExprPtr& spec) -> Result<void>;
    [[nodiscard]] auto order_by(const std::vector<ir::ExprPtr>& specs) -> Result<void>;
    [[nodiscard]] auto limit(std::int64_t count) -> Result<void>;
    [[nodiscard]] auto offset(std::int64_t count) -> Result<void>;
    /// Offset then limit, appended together or not at all.
    [[nodiscard]] auto slice(std::int64_t offset, std::int64_t limit) -> Result<void>;
    [[nodiscard]] auto distinct(const std::vector<std::string>& names = {}) -> Result<void>;
    [[nodiscard]] auto join(const SchemaPtr& other, ir::JoinKind kind,
                            const ir::ExprPtr& condition) -> Result<void>;

    [[nodiscard]] auto clauses() const noexcept -> const std::vector<ir::Clause>& {
        return clauses_;
    }
    [[nodiscard]] auto snapshots() const noexcept -> const std::vector<SchemaPtr>& {
        return snapshots_;
    }
    /// Latest schema snapshot.
    [[nodiscard]] auto schema() const noexcept -> const TableSchema& { return *snapshots_.back(); }
    [[nodiscard]] auto source() const noexcept -> const ir::FromClause& {
        return std::get<ir::FromClause>(clauses_.front().node);
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return clauses_.size(); }

   private:
    explicit Pipeline(SchemaPtr schema);

    auto append(ir::ClauseKind kind, ResolveResult resolved) -> Result<void>;

    std::vector<ir::Clause> clauses_;
    std::vector<SchemaPtr> snapshots_;
};

}  // namespace relq::pipeline
