#include "fairos/expression.hpp"

namespace fairos {

Expr Expr::All() {
    return Expr(Kind::All, "", ExprValue::Number(0));
}

Expr Expr::Eq(const std::string& field, const ExprValue& value) {
    return Expr(Kind::Eq, field, value);
}

Expr Expr::Gt(const std::string& field, const ExprValue& value) {
    return Expr(Kind::Gt, field, value);
}

Expr Expr::Gte(const std::string& field, const ExprValue& value) {
    return Expr(Kind::Gte, field, value);
}

Expr Expr::Lt(const std::string& field, const ExprValue& value) {
    return Expr(Kind::Lt, field, value);
}

Expr Expr::Lte(const std::string& field, const ExprValue& value) {
    return Expr(Kind::Lte, field, value);
}

Expr Expr::And(const Expr& lhs, const Expr& rhs) {
    Expr expr(Kind::And, "", ExprValue::Number(0));
    expr.lhs_ = std::make_shared<const Expr>(lhs);
    expr.rhs_ = std::make_shared<const Expr>(rhs);
    return expr;
}

Expr Expr::Or(const Expr& lhs, const Expr& rhs) {
    Expr expr(Kind::Or, "", ExprValue::Number(0));
    expr.lhs_ = std::make_shared<const Expr>(lhs);
    expr.rhs_ = std::make_shared<const Expr>(rhs);
    return expr;
}

Result<std::string> CompileValue(const ExprValue& value) {
    switch (value.GetKind()) {
        case ExprValue::Kind::Str:
            // 服务端的字符串字面量：用预编码的双引号包裹
            return "%22" + value.StrValue() + "%22";
        case ExprValue::Kind::Number:
            return std::to_string(value.NumberValue());
        case ExprValue::Kind::Map:
            break;
    }
    return Error(ErrorCode::UnsupportedExpression, "map values are not supported in expressions");
}

Result<std::string> CompileExpr(const Expr& expr) {
    if (expr.GetKind() == Expr::Kind::All) {
        return std::string();
    }
    if (expr.GetKind() == Expr::Kind::And) {
        return Error(ErrorCode::UnsupportedExpression, "'and' expressions are not supported");
    }
    if (expr.GetKind() == Expr::Kind::Or) {
        return Error(ErrorCode::UnsupportedExpression, "'or' expressions are not supported");
    }

    auto value = CompileValue(expr.Value());
    if (!value.ok()) {
        return value.error();
    }
    const std::string& v = value.value();
    const std::string& field = expr.Field();

    switch (expr.GetKind()) {
        case Expr::Kind::Eq:
            return field + "=" + v;
        case Expr::Kind::Gt:
            return field + "%3e" + v;
        case Expr::Kind::Gte:
            return field + "%3e=" + v;
        // Lt/Lte与Gt/Gte操作数顺序相反，这是服务端现有的线上格式，保持不变
        case Expr::Kind::Lt:
            return v + "%3e" + field;
        case Expr::Kind::Lte:
            return v + "%3e=" + field;
        default:
            break;
    }
    return Error(ErrorCode::UnsupportedExpression, "unknown expression kind");
}

} // namespace fairos
