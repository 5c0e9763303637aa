#include <relq/render/pure_relation.hpp>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <type_traits>
#include <variant>

namespace relq::render {

namespace {

auto unsupported(std::string_view what) -> std::unexpected<Error> {
    return make_error(ErrorKind::BackendUnsupported, std::string(what),
                      fmt::format("pure-relation backend has no mapping for {}", what));
}

auto join_kind_token(ir::JoinKind kind) -> std::string_view {
    switch (kind) {
        case ir::JoinKind::Inner:
            return "INNER";
        case ir::JoinKind::Left:
            return "LEFT_OUTER";
    }
    return "INNER";
}

auto direction_token(ir::Direction direction) -> std::string_view {
    return direction == ir::Direction::Descending ? "desc" : "asc";
}

auto quote(const std::string& value) -> std::string {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

auto format_double(double value) -> std::string {
    auto text = fmt::format("{}", value);
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

}  // namespace

auto PureRelationBackend::binary_token(ir::BinaryOp op) -> std::string_view {
    switch (op) {
        case ir::BinaryOp::Eq:
            return "==";
        case ir::BinaryOp::Ne:
            return "!=";
        case ir::BinaryOp::Lt:
            return "<";
        case ir::BinaryOp::Le:
            return "<=";
        case ir::BinaryOp::Gt:
            return ">";
        case ir::BinaryOp::Ge:
            return ">=";
        case ir::BinaryOp::Like:
            return "like";
        case ir::BinaryOp::In:
            return "in";
        case ir::BinaryOp::NotIn:
            return "notIn";
        case ir::BinaryOp::And:
            return "&&";
        case ir::BinaryOp::Or:
            return "||";
        case ir::BinaryOp::Add:
            return "+";
        case ir::BinaryOp::Sub:
            return "-";
        case ir::BinaryOp::Mul:
            return "*";
        case ir::BinaryOp::Div:
            return "/";
        case ir::BinaryOp::Mod:
            return "mod";
        case ir::BinaryOp::Pow:
            return "pow";
        case ir::BinaryOp::BitAnd:
            return "&";
        case ir::BinaryOp::BitOr:
            return "|";
    }
    return "?";
}

auto PureRelationBackend::function_token(ir::Function fn) -> std::string_view {
    switch (fn) {
        case ir::Function::Count:
            return "count";
        case ir::Function::Sum:
            return "sum";
        case ir::Function::Avg:
            return "avg";
        case ir::Function::Min:
            return "min";
        case ir::Function::Max:
            return "max";
        case ir::Function::Modulo:
            return "mod";
        case ir::Function::Power:
            return "pow";
    }
    return "?";
}

auto PureRelationBackend::render_literal(const ir::Literal& literal) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return quote(v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(v);
            } else if constexpr (std::is_same_v<T, Date>) {
                return fmt::format("%{}%", format_date(v));
            } else {
                return fmt::format("{}", v);
            }
        },
        literal.value);
}

auto PureRelationBackend::render_source(const ir::FromClause& from) const -> Result<std::string> {
    return fmt::format("{}.{}", from.database, from.table);
}

auto PureRelationBackend::render_operand(const ir::ExprPtr& expr) const -> Result<std::string> {
    if (!expr) {
        return unsupported("an empty expression");
    }
    return render_expr(*expr);
}

auto PureRelationBackend::render_list(const std::vector<ir::ExprPtr>& exprs) const
    -> Result<std::string> {
    std::vector<std::string> parts;
    parts.reserve(exprs.size());
    for (const auto& expr : exprs) {
        auto text = render_operand(expr);
        if (!text) {
            return text;
        }
        parts.push_back(std::move(*text));
    }
    return fmt::format("[{}]", fmt::join(parts, ", "));
}

auto PureRelationBackend::render_expr(const ir::Expr& expr) const -> Result<std::string> {
    if (const auto* ref = std::get_if<ir::ColumnRef>(&expr.node)) {
        return ref->name;
    }
    if (const auto* lit = std::get_if<ir::Literal>(&expr.node)) {
        return render_literal(*lit);
    }
    if (const auto* un = std::get_if<ir::UnaryExpr>(&expr.node)) {
        auto operand = render_operand(un->operand);
        if (!operand) {
            return operand;
        }
        switch (un->op) {
            case ir::UnaryOp::Not:
                return fmt::format("not({})", *operand);
            case ir::UnaryOp::IsNull:
                return fmt::format("({} is null)", *operand);
            case ir::UnaryOp::IsNotNull:
                return fmt::format("({} is not null)", *operand);
        }
        return unsupported("a unary operator");
    }
    if (const auto* bin = std::get_if<ir::BinaryExpr>(&expr.node)) {
        auto left = render_operand(bin->left);
        if (!left) {
            return left;
        }
        auto right = render_operand(bin->right);
        if (!right) {
            return right;
        }
        // Mod and Pow have no infix token; they render as calls.
        if (bin->op == ir::BinaryOp::Mod || bin->op == ir::BinaryOp::Pow) {
            return fmt::format("{}({}, {})", binary_token(bin->op), *left, *right);
        }
        return fmt::format("({} {} {})", *left, binary_token(bin->op), *right);
    }
    if (const auto* call = std::get_if<ir::CallExpr>(&expr.node)) {
        std::vector<std::string> args;
        args.reserve(call->args.size());
        for (const auto& arg : call->args) {
            auto text = render_operand(arg);
            if (!text) {
                return text;
            }
            args.push_back(std::move(*text));
        }
        return fmt::format("{}({})", function_token(call->fn), fmt::join(args, ", "));
    }
    if (const auto* alias = std::get_if<ir::AliasExpr>(&expr.node)) {
        auto inner = render_operand(alias->expr);
        if (!inner) {
            return inner;
        }
        return fmt::format("{} as {}", *inner, alias->alias);
    }
    if (const auto* cond = std::get_if<ir::IfExpr>(&expr.node)) {
        auto test = render_operand(cond->test);
        if (!test) {
            return test;
        }
        auto then_text = render_operand(cond->then_branch);
        if (!then_text) {
            return then_text;
        }
        auto else_text = render_operand(cond->else_branch);
        if (!else_text) {
            return else_text;
        }
        return fmt::format("if({}, {}, {})", *test, *then_text, *else_text);
    }
    if (std::holds_alternative<ir::OrderSpec>(expr.node)) {
        return unsupported("an order specification used as a value");
    }
    if (std::holds_alternative<ir::GroupSpec>(expr.node)) {
        return unsupported("a group specification used as a value");
    }
    return unsupported("a join specification used as a value");
}

auto PureRelationBackend::render_suffix(const ir::Clause& clause) const -> Result<std::string> {
    Result<std::string> text = unsupported(ir::to_string(clause.kind()));

    if (const auto* select = std::get_if<ir::SelectClause>(&clause.node)) {
        std::vector<std::string_view> names;
        names.reserve(select->columns.size());
        for (const auto& column : select->columns) {
            names.push_back(column.name);
        }
        text = fmt::format("\n->project([{}])", fmt::join(names, ", "));
    } else if (const auto* extend = std::get_if<ir::ExtendClause>(&clause.node)) {
        auto fields = render_list(extend->fields);
        if (!fields) {
            return fields;
        }
        text = fmt::format("\n->extend({})", *fields);
    } else if (const auto* rename = std::get_if<ir::RenameClause>(&clause.node)) {
        std::vector<std::string> pairs;
        pairs.reserve(rename->renames.size());
        for (const auto& pair : rename->renames) {
            pairs.push_back(fmt::format("{} as {}", pair.from, pair.to));
        }
        text = fmt::format("\n->rename([{}])", fmt::join(pairs, ", "));
    } else if (const auto* filter = std::get_if<ir::FilterClause>(&clause.node)) {
        auto predicate = render_operand(filter->predicate);
        if (!predicate) {
            return predicate;
        }
        text = fmt::format("\n->filter({})", *predicate);
    } else if (const auto* group = std::get_if<ir::GroupByClause>(&clause.node)) {
        auto keys = render_list(group->spec.keys);
        if (!keys) {
            return keys;
        }
        auto selections = render_list(group->spec.selections);
        if (!selections) {
            return selections;
        }
        if (group->spec.having) {
            auto having = render_expr(*group->spec.having);
            if (!having) {
                return having;
            }
            text = fmt::format("\n->groupBy({}, {}, {})", *keys, *selections, *having);
        } else {
            text = fmt::format("\n->groupBy({}, {})", *keys, *selections);
        }
    } else if (const auto* order = std::get_if<ir::OrderByClause>(&clause.node)) {
        std::vector<std::string_view> directions;
        directions.reserve(order->specs.size());
        for (const auto& spec : order->specs) {
            directions.push_back(direction_token(spec.direction));
        }
        text = fmt::format("\n->sort([{}])", fmt::join(directions, ", "));
    } else if (const auto* limit = std::get_if<ir::LimitClause>(&clause.node)) {
        text = fmt::format("\n->take({})", limit->count);
    } else if (const auto* offset = std::get_if<ir::OffsetClause>(&clause.node)) {
        text = fmt::format("\n->drop({})", offset->count);
    } else if (const auto* join = std::get_if<ir::JoinClause>(&clause.node)) {
        auto condition = render_operand(join->on.condition);
        if (!condition) {
            return condition;
        }
        text = fmt::format("\n->join({}.{}, {}, {})", join->source.database, join->source.table,
                           join_kind_token(join->kind), *condition);
    }

    if (text && config_.trace) {
        spdlog::debug("pure-relation: rendered {} as '{}'", ir::to_string(clause.kind()),
                      text->substr(1));
    }
    return text;
}

}  // namespace relq::render
