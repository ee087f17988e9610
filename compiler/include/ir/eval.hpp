// KIR Scalar Evaluation
//
// The arithmetic semantics of KIR opcodes over constant operands, shared by
// constant folding and the interpreter so both agree bit for bit.
//
// - Integers wrap at the bit width of the result type; Shr is arithmetic for
//   signed types and logical for unsigned ones; shift amounts are taken
//   modulo the bit width
// - Integer division and remainder by zero are not computable (nullopt);
//   INT_MIN / -1 wraps to INT_MIN with remainder 0
// - Floats follow IEEE-754 in double precision, rounded to f32 when the
//   result type is f32; NaN and infinities propagate
// - Float-to-integer casts of NaN or out-of-range values are not computable
//
// Every function returns nullopt when an operand is not a constant.

#pragma once

#include "ir/ir.hpp"

namespace kir::ir {

[[nodiscard]] auto eval_binary(BinOp op, const Value& lhs, const Value& rhs,
                               const IrTypePtr& type) -> std::optional<Value>;

[[nodiscard]] auto eval_compare(CmpOp op, const Value& lhs, const Value& rhs)
    -> std::optional<Value>;

[[nodiscard]] auto eval_unary(UnaryOp op, const Value& operand, const IrTypePtr& type)
    -> std::optional<Value>;

[[nodiscard]] auto eval_cast(CastKind kind, const Value& operand, const IrTypePtr& type)
    -> std::optional<Value>;

// Pure intrinsics only; Trap is never evaluated
[[nodiscard]] auto eval_intrinsic(IntrinsicKind kind, const std::vector<Value>& args,
                                  const IrTypePtr& type) -> std::optional<Value>;

} // namespace kir::ir
