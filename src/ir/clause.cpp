#include <relq/ir/clause.hpp>

namespace relq::ir {

static_assert(std::variant_size_v<decltype(Clause::node)> ==
                  static_cast<std::size_t>(ClauseKind::Join) + 1,
              "ClauseKind must mirror the Clause alternatives");

auto to_string(ClauseKind kind) -> std::string_view {
    switch (kind) {
        case ClauseKind::From:
            return "from";
        case ClauseKind::Select:
            return "select";
        case ClauseKind::Extend:
            return "extend";
        case ClauseKind::Rename:
            return "rename";
        case ClauseKind::Filter:
            return "filter";
        case ClauseKind::GroupBy:
            return "groupBy";
        case ClauseKind::OrderBy:
            return "orderBy";
        case ClauseKind::Limit:
            return "limit";
        case ClauseKind::Offset:
            return "offset";
        case ClauseKind::Distinct:
            return "distinct";
        case ClauseKind::Join:
            return "join";
    }
    return "unknown";
}

auto to_string(JoinKind kind) -> std::string_view {
    switch (kind) {
        case JoinKind::Inner:
            return "inner";
        case JoinKind::Left:
            return "left";
    }
    return "unknown";
}

}  // namespace relq::ir
