// KIR Instruction Utilities
//
// Generic operand and successor access over the closed instruction variant.
// Every pass goes through these helpers instead of matching on each
// instruction kind itself, so adding an opcode means touching this file, the
// verifier and the printer.

#include "ir/ir.hpp"

#include <algorithm>

namespace kir::ir {

auto is_bitwise(BinOp op) -> bool {
    switch (op) {
    case BinOp::And:
    case BinOp::Or:
    case BinOp::Xor:
    case BinOp::Shl:
    case BinOp::Shr:
        return true;
    default:
        return false;
    }
}

auto is_terminator(const Instruction& inst) -> bool {
    return std::holds_alternative<JumpInst>(inst) || std::holds_alternative<JumpIfInst>(inst) ||
           std::holds_alternative<SwitchInst>(inst) || std::holds_alternative<RetInst>(inst) ||
           std::holds_alternative<UnreachableInst>(inst);
}

auto binop_name(BinOp op) -> const char* {
    switch (op) {
    case BinOp::Add:
        return "add";
    case BinOp::Sub:
        return "sub";
    case BinOp::Mul:
        return "mul";
    case BinOp::Div:
        return "div";
    case BinOp::Rem:
        return "rem";
    case BinOp::And:
        return "and";
    case BinOp::Or:
        return "or";
    case BinOp::Xor:
        return "xor";
    case BinOp::Shl:
        return "shl";
    case BinOp::Shr:
        return "shr";
    }
    return "?";
}

auto cmpop_name(CmpOp op) -> const char* {
    switch (op) {
    case CmpOp::Eq:
        return "eq";
    case CmpOp::Ne:
        return "ne";
    case CmpOp::Lt:
        return "lt";
    case CmpOp::Le:
        return "le";
    case CmpOp::Gt:
        return "gt";
    case CmpOp::Ge:
        return "ge";
    }
    return "?";
}

auto cast_name(CastKind kind) -> const char* {
    switch (kind) {
    case CastKind::Trunc:
        return "trunc";
    case CastKind::ZExt:
        return "zext";
    case CastKind::SExt:
        return "sext";
    case CastKind::FpToSi:
        return "fptosi";
    case CastKind::FpToUi:
        return "fptoui";
    case CastKind::SiToFp:
        return "sitofp";
    case CastKind::UiToFp:
        return "uitofp";
    case CastKind::FpTrunc:
        return "fptrunc";
    case CastKind::FpExt:
        return "fpext";
    case CastKind::PtrToInt:
        return "ptrtoint";
    case CastKind::IntToPtr:
        return "inttoptr";
    case CastKind::Bitcast:
        return "bitcast";
    }
    return "?";
}

auto intrinsic_name(IntrinsicKind kind) -> const char* {
    switch (kind) {
    case IntrinsicKind::Abs:
        return "abs";
    case IntrinsicKind::Min:
        return "min";
    case IntrinsicKind::Max:
        return "max";
    case IntrinsicKind::Sqrt:
        return "sqrt";
    case IntrinsicKind::Trap:
        return "trap";
    }
    return "?";
}

auto atomic_name(AtomicOp op) -> const char* {
    switch (op) {
    case AtomicOp::Load:
        return "load";
    case AtomicOp::Store:
        return "store";
    case AtomicOp::Add:
        return "add";
    case AtomicOp::Sub:
        return "sub";
    case AtomicOp::Xchg:
        return "xchg";
    case AtomicOp::CmpXchg:
        return "cmpxchg";
    }
    return "?";
}

auto intrinsic_from_name(std::string_view name) -> std::optional<IntrinsicKind> {
    if (name == "abs")
        return IntrinsicKind::Abs;
    if (name == "min")
        return IntrinsicKind::Min;
    if (name == "max")
        return IntrinsicKind::Max;
    if (name == "sqrt")
        return IntrinsicKind::Sqrt;
    if (name == "trap")
        return IntrinsicKind::Trap;
    return std::nullopt;
}

auto opcode_name(const Instruction& inst) -> std::string {
    return std::visit(
        [](const auto& i) -> std::string {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, JumpInst>) {
                return "jump";
            } else if constexpr (std::is_same_v<T, JumpIfInst>) {
                return "jump_if";
            } else if constexpr (std::is_same_v<T, SwitchInst>) {
                return "switch";
            } else if constexpr (std::is_same_v<T, RetInst>) {
                return "ret";
            } else if constexpr (std::is_same_v<T, UnreachableInst>) {
                return "unreachable";
            } else if constexpr (std::is_same_v<T, CallInst>) {
                return "call";
            } else if constexpr (std::is_same_v<T, AllocaInst>) {
                return "alloca";
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                return "load";
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                return "store";
            } else if constexpr (std::is_same_v<T, MemsetInst>) {
                return "memset";
            } else if constexpr (std::is_same_v<T, MemcpyInst>) {
                return "memcpy";
            } else if constexpr (std::is_same_v<T, BinaryInst>) {
                return binop_name(i.op);
            } else if constexpr (std::is_same_v<T, CompareInst>) {
                return std::string("cmp ") + cmpop_name(i.op);
            } else if constexpr (std::is_same_v<T, UnaryInst>) {
                return i.op == UnaryOp::Neg ? "neg" : "not";
            } else if constexpr (std::is_same_v<T, CastInst>) {
                return cast_name(i.kind);
            } else if constexpr (std::is_same_v<T, AtomicInst>) {
                return std::string("atomic ") + atomic_name(i.op);
            } else if constexpr (std::is_same_v<T, IntrinsicInst>) {
                return intrinsic_name(i.kind);
            } else if constexpr (std::is_same_v<T, PhiInst>) {
                return "phi";
            } else {
                return "copy";
            }
        },
        inst);
}

// Shared by the const and mutable entry points; `Inst` carries the constness.
template <typename Inst, typename Fn> static void visit_operand_slots(Inst& inst, Fn&& fn) {
    std::visit(
        [&fn](auto& i) {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, JumpIfInst>) {
                fn(i.condition);
            } else if constexpr (std::is_same_v<T, SwitchInst>) {
                fn(i.discriminant);
            } else if constexpr (std::is_same_v<T, RetInst>) {
                if (i.value) {
                    fn(*i.value);
                }
            } else if constexpr (std::is_same_v<T, CallInst>) {
                for (auto& arg : i.args) {
                    fn(arg);
                }
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                fn(i.ptr);
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                fn(i.ptr);
                fn(i.value);
            } else if constexpr (std::is_same_v<T, MemsetInst>) {
                fn(i.dest);
                fn(i.byte);
                fn(i.size);
            } else if constexpr (std::is_same_v<T, MemcpyInst>) {
                fn(i.dest);
                fn(i.src);
                fn(i.size);
            } else if constexpr (std::is_same_v<T, BinaryInst> || std::is_same_v<T, CompareInst>) {
                fn(i.lhs);
                fn(i.rhs);
            } else if constexpr (std::is_same_v<T, UnaryInst> || std::is_same_v<T, CastInst>) {
                fn(i.operand);
            } else if constexpr (std::is_same_v<T, AtomicInst>) {
                fn(i.ptr);
                if (i.value) {
                    fn(*i.value);
                }
                if (i.expected) {
                    fn(*i.expected);
                }
            } else if constexpr (std::is_same_v<T, IntrinsicInst>) {
                for (auto& arg : i.args) {
                    fn(arg);
                }
            } else if constexpr (std::is_same_v<T, PhiInst>) {
                for (auto& in : i.incoming) {
                    fn(in.value);
                }
            } else if constexpr (std::is_same_v<T, CopyInst>) {
                fn(i.source);
            }
            // JumpInst, UnreachableInst, AllocaInst: no operands
        },
        inst);
}

void for_each_operand(Instruction& inst, const std::function<void(Value&)>& fn) {
    visit_operand_slots(inst, fn);
}

auto operands(const Instruction& inst) -> std::vector<Value> {
    std::vector<Value> result;
    visit_operand_slots(inst, [&result](const Value& v) { result.push_back(v); });
    return result;
}

auto successors(const Instruction& inst) -> std::vector<BlockId> {
    std::vector<BlockId> result;
    auto add = [&result](BlockId id) {
        if (std::find(result.begin(), result.end(), id) == result.end()) {
            result.push_back(id);
        }
    };
    if (auto* j = std::get_if<JumpInst>(&inst)) {
        add(j->target);
    } else if (auto* ji = std::get_if<JumpIfInst>(&inst)) {
        add(ji->then_block);
        add(ji->else_block);
    } else if (auto* sw = std::get_if<SwitchInst>(&inst)) {
        for (const auto& [_, target] : sw->cases) {
            add(target);
        }
        add(sw->default_block);
    }
    return result;
}

void retarget_successor(Instruction& inst, BlockId from, BlockId to) {
    auto fix = [from, to](BlockId& id) {
        if (id == from) {
            id = to;
        }
    };
    if (auto* j = std::get_if<JumpInst>(&inst)) {
        fix(j->target);
    } else if (auto* ji = std::get_if<JumpIfInst>(&inst)) {
        fix(ji->then_block);
        fix(ji->else_block);
    } else if (auto* sw = std::get_if<SwitchInst>(&inst)) {
        for (auto& [_, target] : sw->cases) {
            fix(target);
        }
        fix(sw->default_block);
    }
}

} // namespace kir::ir
