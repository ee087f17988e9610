// KIR Scalar Evaluation Implementation

#include "ir/eval.hpp"

#include <bit>
#include <cmath>
#include <limits>

namespace kir::ir {

namespace {

// Integer view of an int or bool constant
auto int_operand(const Value& v) -> std::optional<int64_t> {
    if (auto i = v.as_int()) {
        return i;
    }
    if (auto b = v.as_bool()) {
        return *b ? 1 : 0;
    }
    return std::nullopt;
}

auto int_result(uint64_t raw, const IrTypePtr& type) -> Value {
    if (type->is_bool()) {
        return make_const_bool((raw & 1) != 0);
    }
    return make_const_int(static_cast<int64_t>(raw), type);
}

auto sign_extend(uint64_t raw, int bits) -> int64_t {
    if (bits <= 0 || bits >= 64) {
        return static_cast<int64_t>(raw);
    }
    uint64_t sign = uint64_t{1} << (bits - 1);
    raw &= (uint64_t{1} << bits) - 1;
    return static_cast<int64_t>((raw ^ sign) - sign);
}

auto zero_extend(int64_t value, int bits) -> uint64_t {
    if (bits <= 0 || bits >= 64) {
        return static_cast<uint64_t>(value);
    }
    return static_cast<uint64_t>(value) & ((uint64_t{1} << bits) - 1);
}

auto eval_int_binary(BinOp op, int64_t x, int64_t y, const IrTypePtr& type)
    -> std::optional<Value> {
    auto a = static_cast<uint64_t>(x);
    auto b = static_cast<uint64_t>(y);
    bool is_signed = type->is_signed();
    int bits = type->bit_width();

    switch (op) {
    case BinOp::Add:
        return int_result(a + b, type);
    case BinOp::Sub:
        return int_result(a - b, type);
    case BinOp::Mul:
        return int_result(a * b, type);
    case BinOp::And:
        return int_result(a & b, type);
    case BinOp::Or:
        return int_result(a | b, type);
    case BinOp::Xor:
        return int_result(a ^ b, type);
    case BinOp::Shl:
        return int_result(a << (b % static_cast<uint64_t>(bits)), type);
    case BinOp::Shr: {
        auto amount = static_cast<int>(b % static_cast<uint64_t>(bits));
        if (is_signed) {
            return int_result(static_cast<uint64_t>(x >> amount), type);
        }
        return int_result(zero_extend(x, bits) >> amount, type);
    }
    case BinOp::Div:
    case BinOp::Rem: {
        if (y == 0) {
            return std::nullopt;
        }
        if (is_signed) {
            if (x == std::numeric_limits<int64_t>::min() && y == -1) {
                return int_result(op == BinOp::Div ? a : 0, type);
            }
            int64_t r = op == BinOp::Div ? x / y : x % y;
            return int_result(static_cast<uint64_t>(r), type);
        }
        uint64_t ua = zero_extend(x, bits);
        uint64_t ub = zero_extend(y, bits);
        return int_result(op == BinOp::Div ? ua / ub : ua % ub, type);
    }
    }
    return std::nullopt;
}

auto eval_float_binary(BinOp op, double x, double y, const IrTypePtr& type)
    -> std::optional<Value> {
    switch (op) {
    case BinOp::Add:
        return make_const_float(x + y, type);
    case BinOp::Sub:
        return make_const_float(x - y, type);
    case BinOp::Mul:
        return make_const_float(x * y, type);
    case BinOp::Div:
        return make_const_float(x / y, type);
    case BinOp::Rem:
        return make_const_float(std::fmod(x, y), type);
    default:
        return std::nullopt;
    }
}

template <typename T> auto compare(CmpOp op, T x, T y) -> bool {
    switch (op) {
    case CmpOp::Eq:
        return x == y;
    case CmpOp::Ne:
        return x != y;
    case CmpOp::Lt:
        return x < y;
    case CmpOp::Le:
        return x <= y;
    case CmpOp::Gt:
        return x > y;
    case CmpOp::Ge:
        return x >= y;
    }
    return false;
}

// Float to integer conversion, truncating toward zero
auto float_to_int(double x, const IrTypePtr& type, bool as_signed) -> std::optional<Value> {
    if (std::isnan(x)) {
        return std::nullopt;
    }
    int bits = type->bit_width();
    double t = std::trunc(x);
    if (as_signed) {
        double lo = -std::ldexp(1.0, bits - 1);
        double hi = std::ldexp(1.0, bits - 1);
        if (!(t >= lo && t < hi)) {
            return std::nullopt;
        }
        return int_result(static_cast<uint64_t>(static_cast<int64_t>(t)), type);
    }
    double hi = std::ldexp(1.0, bits);
    if (!(t >= 0.0 && t < hi)) {
        return std::nullopt;
    }
    return int_result(static_cast<uint64_t>(t), type);
}

} // namespace

auto eval_binary(BinOp op, const Value& lhs, const Value& rhs, const IrTypePtr& type)
    -> std::optional<Value> {
    if (type->is_float()) {
        auto x = lhs.as_float();
        auto y = rhs.as_float();
        if (!x || !y) {
            return std::nullopt;
        }
        return eval_float_binary(op, *x, *y, type);
    }
    auto x = int_operand(lhs);
    auto y = int_operand(rhs);
    if (!x || !y || !(type->is_integer() || type->is_bool())) {
        return std::nullopt;
    }
    return eval_int_binary(op, *x, *y, type);
}

auto eval_compare(CmpOp op, const Value& lhs, const Value& rhs) -> std::optional<Value> {
    if (auto x = lhs.as_float()) {
        auto y = rhs.as_float();
        if (!y) {
            return std::nullopt;
        }
        return make_const_bool(compare(op, *x, *y));
    }
    if (lhs.is_constant() && rhs.is_constant() &&
        std::holds_alternative<ConstNull>(*lhs.as_constant()) &&
        std::holds_alternative<ConstNull>(*rhs.as_constant())) {
        return make_const_bool(op == CmpOp::Eq || op == CmpOp::Le || op == CmpOp::Ge);
    }
    auto x = int_operand(lhs);
    auto y = int_operand(rhs);
    if (!x || !y) {
        return std::nullopt;
    }
    if (lhs.type && lhs.type->is_integer() && !lhs.type->is_signed()) {
        int bits = lhs.type->bit_width();
        return make_const_bool(compare(op, zero_extend(*x, bits), zero_extend(*y, bits)));
    }
    return make_const_bool(compare(op, *x, *y));
}

auto eval_unary(UnaryOp op, const Value& operand, const IrTypePtr& type) -> std::optional<Value> {
    if (type->is_float()) {
        auto x = operand.as_float();
        if (!x || op != UnaryOp::Neg) {
            return std::nullopt;
        }
        return make_const_float(-*x, type);
    }
    auto x = int_operand(operand);
    if (!x) {
        return std::nullopt;
    }
    auto a = static_cast<uint64_t>(*x);
    if (op == UnaryOp::Neg) {
        return int_result(uint64_t{0} - a, type);
    }
    if (type->is_bool()) {
        return make_const_bool(a == 0);
    }
    return int_result(~a, type);
}

auto eval_cast(CastKind kind, const Value& operand, const IrTypePtr& type)
    -> std::optional<Value> {
    const auto& from = operand.type;
    if (!from) {
        return std::nullopt;
    }
    int from_bits = from->bit_width();

    switch (kind) {
    case CastKind::Trunc: {
        auto x = int_operand(operand);
        if (!x) {
            return std::nullopt;
        }
        return int_result(static_cast<uint64_t>(*x), type);
    }
    case CastKind::ZExt: {
        auto x = int_operand(operand);
        if (!x) {
            return std::nullopt;
        }
        return int_result(zero_extend(*x, from_bits), type);
    }
    case CastKind::SExt: {
        auto x = int_operand(operand);
        if (!x) {
            return std::nullopt;
        }
        return int_result(static_cast<uint64_t>(sign_extend(static_cast<uint64_t>(*x), from_bits)),
                          type);
    }
    case CastKind::FpToSi:
    case CastKind::FpToUi: {
        auto x = operand.as_float();
        if (!x) {
            return std::nullopt;
        }
        return float_to_int(*x, type, kind == CastKind::FpToSi);
    }
    case CastKind::SiToFp: {
        auto x = int_operand(operand);
        if (!x) {
            return std::nullopt;
        }
        auto v = sign_extend(static_cast<uint64_t>(*x), from_bits);
        return make_const_float(static_cast<double>(v), type);
    }
    case CastKind::UiToFp: {
        auto x = int_operand(operand);
        if (!x) {
            return std::nullopt;
        }
        return make_const_float(static_cast<double>(zero_extend(*x, from_bits)), type);
    }
    case CastKind::FpTrunc:
    case CastKind::FpExt: {
        auto x = operand.as_float();
        if (!x) {
            return std::nullopt;
        }
        return make_const_float(*x, type);
    }
    case CastKind::PtrToInt:
        if (operand.is_constant() && std::holds_alternative<ConstNull>(*operand.as_constant())) {
            return int_result(0, type);
        }
        return std::nullopt;
    case CastKind::IntToPtr:
        if (auto x = int_operand(operand); x && *x == 0) {
            return make_const_null();
        }
        return std::nullopt;
    case CastKind::Bitcast: {
        if (from->is_float() && type->is_integer()) {
            auto x = operand.as_float();
            if (!x) {
                return std::nullopt;
            }
            if (from_bits == 32) {
                auto raw = std::bit_cast<uint32_t>(static_cast<float>(*x));
                return int_result(raw, type);
            }
            return int_result(std::bit_cast<uint64_t>(*x), type);
        }
        if (from->is_integer() && type->is_float()) {
            auto x = int_operand(operand);
            if (!x) {
                return std::nullopt;
            }
            if (type->bit_width() == 32) {
                auto bits = static_cast<uint32_t>(zero_extend(*x, 32));
                return make_const_float(static_cast<double>(std::bit_cast<float>(bits)), type);
            }
            return make_const_float(std::bit_cast<double>(static_cast<uint64_t>(*x)), type);
        }
        if (type->is_float()) {
            return operand.as_float() ? std::optional<Value>(make_const_float(*operand.as_float(), type))
                                      : std::nullopt;
        }
        auto x = int_operand(operand);
        if (!x) {
            return std::nullopt;
        }
        return int_result(static_cast<uint64_t>(*x), type);
    }
    }
    return std::nullopt;
}

auto eval_intrinsic(IntrinsicKind kind, const std::vector<Value>& args, const IrTypePtr& type)
    -> std::optional<Value> {
    if (kind == IntrinsicKind::Trap || args.empty()) {
        return std::nullopt;
    }

    if (type->is_float()) {
        std::vector<double> xs;
        for (const auto& arg : args) {
            auto x = arg.as_float();
            if (!x) {
                return std::nullopt;
            }
            xs.push_back(*x);
        }
        switch (kind) {
        case IntrinsicKind::Abs:
            return make_const_float(std::fabs(xs[0]), type);
        case IntrinsicKind::Sqrt:
            return make_const_float(std::sqrt(xs[0]), type);
        case IntrinsicKind::Min:
            return xs.size() == 2 ? std::optional<Value>(make_const_float(std::fmin(xs[0], xs[1]), type))
                                  : std::nullopt;
        case IntrinsicKind::Max:
            return xs.size() == 2 ? std::optional<Value>(make_const_float(std::fmax(xs[0], xs[1]), type))
                                  : std::nullopt;
        case IntrinsicKind::Trap:
            break;
        }
        return std::nullopt;
    }

    std::vector<int64_t> xs;
    for (const auto& arg : args) {
        auto x = int_operand(arg);
        if (!x) {
            return std::nullopt;
        }
        xs.push_back(*x);
    }
    bool is_signed = type->is_signed();
    int bits = type->bit_width();

    switch (kind) {
    case IntrinsicKind::Abs:
        if (is_signed && xs[0] < 0) {
            return int_result(uint64_t{0} - static_cast<uint64_t>(xs[0]), type);
        }
        return int_result(static_cast<uint64_t>(xs[0]), type);
    case IntrinsicKind::Min:
    case IntrinsicKind::Max: {
        if (xs.size() != 2) {
            return std::nullopt;
        }
        bool less = is_signed ? xs[0] < xs[1] : zero_extend(xs[0], bits) < zero_extend(xs[1], bits);
        bool pick_first = kind == IntrinsicKind::Min ? less : !less;
        return int_result(static_cast<uint64_t>(pick_first ? xs[0] : xs[1]), type);
    }
    case IntrinsicKind::Sqrt:
    case IntrinsicKind::Trap:
        break;
    }
    return std::nullopt;
}

} // namespace kir::ir
