#include <relq/ir/expr.hpp>

namespace relq::ir {

auto Literal::type() const noexcept -> SemanticType {
    switch (value.index()) {
        case 0:
            return SemanticType::Integer;
        case 1:
            return SemanticType::Long;
        case 2:
            return SemanticType::Double;
        case 3:
            return SemanticType::String;
        case 4:
            return SemanticType::Boolean;
        default:
            return SemanticType::Date;
    }
}

auto is_comparison(BinaryOp op) noexcept -> bool {
    switch (op) {
        case BinaryOp::Eq:
        case BinaryOp::Ne:
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
        case BinaryOp::Like:
        case BinaryOp::In:
        case BinaryOp::NotIn:
            return true;
        default:
            return false;
    }
}

auto is_logical(BinaryOp op) noexcept -> bool {
    return op == BinaryOp::And || op == BinaryOp::Or;
}

auto is_arithmetic(BinaryOp op) noexcept -> bool {
    switch (op) {
        case BinaryOp::Add:
        case BinaryOp::Sub:
        case BinaryOp::Mul:
        case BinaryOp::Div:
        case BinaryOp::Mod:
        case BinaryOp::Pow:
            return true;
        default:
            return false;
    }
}

auto is_bitwise(BinaryOp op) noexcept -> bool {
    return op == BinaryOp::BitAnd || op == BinaryOp::BitOr;
}

auto is_aggregate(Function fn) noexcept -> bool {
    return fn != Function::Modulo && fn != Function::Power;
}

auto to_string(UnaryOp op) -> std::string_view {
    switch (op) {
        case UnaryOp::Not:
            return "NOT";
        case UnaryOp::IsNull:
            return "IS NULL";
        case UnaryOp::IsNotNull:
            return "IS NOT NULL";
    }
    return "?";
}

auto to_string(BinaryOp op) -> std::string_view {
    switch (op) {
        case BinaryOp::Eq:
            return "=";
        case BinaryOp::Ne:
            return "<>";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::Like:
            return "LIKE";
        case BinaryOp::In:
            return "IN";
        case BinaryOp::NotIn:
            return "NOT IN";
        case BinaryOp::And:
            return "AND";
        case BinaryOp::Or:
            return "OR";
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Mod:
            return "MOD";
        case BinaryOp::Pow:
            return "POW";
        case BinaryOp::BitAnd:
            return "BITAND";
        case BinaryOp::BitOr:
            return "BITOR";
    }
    return "?";
}

auto to_string(Function fn) -> std::string_view {
    switch (fn) {
        case Function::Count:
            return "count";
        case Function::Sum:
            return "sum";
        case Function::Avg:
            return "avg";
        case Function::Min:
            return "min";
        case Function::Max:
            return "max";
        case Function::Modulo:
            return "modulo";
        case Function::Power:
            return "power";
    }
    return "?";
}

}  // namespace relq::ir
