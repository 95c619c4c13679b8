#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "fairos/types.hpp"

namespace fairos {

// 表达式中的值
class ExprValue {
public:
    enum class Kind {
        Str,
        Number,
        Map     // 暂无比较语义，编译时报错
    };

    static ExprValue Str(const std::string& s) { return ExprValue(Kind::Str, s, 0); }
    static ExprValue Number(uint32_t n) { return ExprValue(Kind::Number, "", n); }
    static ExprValue Map() { return ExprValue(Kind::Map, "", 0); }

    Kind GetKind() const { return kind_; }
    const std::string& StrValue() const { return str_; }
    uint32_t NumberValue() const { return number_; }

private:
    ExprValue(Kind kind, std::string str, uint32_t number)
        : kind_(kind), str_(std::move(str)), number_(number) {}

    Kind kind_;
    std::string str_;
    uint32_t number_;
};

// 文档查询的过滤表达式树，不可变
class Expr {
public:
    enum class Kind {
        All,
        Eq,
        Gt,
        Gte,
        Lt,
        Lte,
        And,
        Or
    };

    static Expr All();
    static Expr Eq(const std::string& field, const ExprValue& value);
    static Expr Gt(const std::string& field, const ExprValue& value);
    static Expr Gte(const std::string& field, const ExprValue& value);
    static Expr Lt(const std::string& field, const ExprValue& value);
    static Expr Lte(const std::string& field, const ExprValue& value);
    static Expr And(const Expr& lhs, const Expr& rhs);
    static Expr Or(const Expr& lhs, const Expr& rhs);

    Kind GetKind() const { return kind_; }
    const std::string& Field() const { return field_; }
    const ExprValue& Value() const { return value_; }
    // 仅And/Or有子节点，其他节点返回nullptr
    const Expr* Lhs() const { return lhs_.get(); }
    const Expr* Rhs() const { return rhs_.get(); }

private:
    Expr(Kind kind, std::string field, ExprValue value)
        : kind_(kind), field_(std::move(field)), value_(std::move(value)) {}

    Kind kind_;
    std::string field_;
    ExprValue value_;
    std::shared_ptr<const Expr> lhs_;
    std::shared_ptr<const Expr> rhs_;
};

// 将表达式编译为服务端的查询字符串。
// 输出已按服务端约定预编码（%22包裹字符串，%3e表示'>'），调用方不得再做URL编码。
// And/Or以及Map值尚未支持，返回UnsupportedExpression。
Result<std::string> CompileExpr(const Expr& expr);

// 单个值的编码
Result<std::string> CompileValue(const ExprValue& value);

} // namespace fairos
