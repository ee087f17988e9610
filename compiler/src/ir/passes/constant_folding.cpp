// Constant Folding Optimization Pass Implementation

#include "ir/passes/constant_folding.hpp"

#include "ir/eval.hpp"
#include "log/log.hpp"

#include <cmath>

namespace kir::ir {

namespace {

auto is_int_const(const Value& v, int64_t expected) -> bool {
    auto i = v.as_int();
    return i && *i == expected;
}

auto is_float_const(const Value& v, double expected) -> bool {
    auto f = v.as_float();
    return f && *f == expected && !std::signbit(*f);
}

auto resolve(Value v, const std::unordered_map<ValueId, Value>& folded) -> Value {
    while (v.is_register()) {
        auto it = folded.find(v.reg());
        if (it == folded.end()) {
            break;
        }
        v = it->second;
    }
    return v;
}

} // namespace

auto ConstantFoldingPass::run_on_function(Function& func) -> bool {
    bool changed = false;
    std::unordered_map<ValueId, Value> folded;

    bool progress = true;
    while (progress) {
        progress = false;
        for (auto& block : func.blocks) {
            for (auto& inst : block.instructions) {
                for_each_operand(inst.inst, [&folded](Value& v) { v = resolve(v, folded); });
                if (!inst.has_result() || folded.contains(inst.result)) {
                    continue;
                }
                if (auto value = try_fold(inst)) {
                    folded[inst.result] = *value;
                    ++stats_.constants_folded;
                    progress = true;
                    continue;
                }
                std::optional<Value> value;
                if (try_simplify(inst, value)) {
                    if (value) {
                        folded[inst.result] = *value;
                    }
                    ++stats_.constants_folded;
                    progress = true;
                }
            }
        }
        changed |= progress;
    }

    if (!folded.empty()) {
        for (auto& block : func.blocks) {
            std::erase_if(block.instructions, [&folded](const InstructionData& inst) {
                return inst.has_result() && folded.contains(inst.result);
            });
            for (auto& inst : block.instructions) {
                for_each_operand(inst.inst, [&folded](Value& v) { v = resolve(v, folded); });
            }
        }
    }

    changed |= fold_branches(func);

    if (changed) {
        KIR_LOG_TRACE("opt", "const-fold changed '" << func.name << "'");
    }
    return changed;
}

auto ConstantFoldingPass::try_fold(const InstructionData& inst) -> std::optional<Value> {
    return std::visit(
        [&inst](const auto& i) -> std::optional<Value> {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, BinaryInst>) {
                return eval_binary(i.op, i.lhs, i.rhs, inst.type);
            } else if constexpr (std::is_same_v<T, CompareInst>) {
                return eval_compare(i.op, i.lhs, i.rhs);
            } else if constexpr (std::is_same_v<T, UnaryInst>) {
                return eval_unary(i.op, i.operand, inst.type);
            } else if constexpr (std::is_same_v<T, CastInst>) {
                return eval_cast(i.kind, i.operand, inst.type);
            } else if constexpr (std::is_same_v<T, IntrinsicInst>) {
                return eval_intrinsic(i.kind, i.args, inst.type);
            } else {
                return std::nullopt;
            }
        },
        inst.inst);
}

auto ConstantFoldingPass::try_simplify(InstructionData& inst, std::optional<Value>& folded)
    -> bool {
    auto* bin = inst.as<BinaryInst>();
    if (!bin) {
        return false;
    }
    const auto& type = inst.type;
    const Value lhs = bin->lhs;
    const Value rhs = bin->rhs;

    auto to_copy = [&inst](const Value& source) {
        inst.inst = CopyInst{source};
        return true;
    };

    if (type->is_integer()) {
        switch (bin->op) {
        case BinOp::Add:
        case BinOp::Or:
        case BinOp::Xor:
            if (is_int_const(rhs, 0)) {
                return to_copy(lhs);
            }
            if (is_int_const(lhs, 0)) {
                return to_copy(rhs);
            }
            break;
        case BinOp::Sub:
        case BinOp::Shl:
        case BinOp::Shr:
            if (is_int_const(rhs, 0)) {
                return to_copy(lhs);
            }
            break;
        case BinOp::Mul:
            if (is_int_const(rhs, 1)) {
                return to_copy(lhs);
            }
            if (is_int_const(lhs, 1)) {
                return to_copy(rhs);
            }
            if (is_int_const(rhs, 0) || is_int_const(lhs, 0)) {
                folded = make_const_int(0, type);
                return true;
            }
            break;
        case BinOp::Div:
            if (is_int_const(rhs, 1)) {
                return to_copy(lhs);
            }
            break;
        case BinOp::And:
            if (is_int_const(rhs, 0) || is_int_const(lhs, 0)) {
                folded = make_const_int(0, type);
                return true;
            }
            break;
        case BinOp::Rem:
            break;
        }
        return false;
    }

    if (type->is_bool()) {
        auto l = lhs.as_bool();
        auto r = rhs.as_bool();
        if (bin->op == BinOp::And) {
            if ((l && !*l) || (r && !*r)) {
                folded = make_const_bool(false);
                return true;
            }
            if (r && *r) {
                return to_copy(lhs);
            }
            if (l && *l) {
                return to_copy(rhs);
            }
        } else if (bin->op == BinOp::Or) {
            if ((l && *l) || (r && *r)) {
                folded = make_const_bool(true);
                return true;
            }
            if (r && !*r) {
                return to_copy(lhs);
            }
            if (l && !*l) {
                return to_copy(rhs);
            }
        }
        return false;
    }

    if (type->is_float()) {
        // Only identities exact for every input, signed zeros and NaN included
        switch (bin->op) {
        case BinOp::Mul:
            if (is_float_const(rhs, 1.0)) {
                return to_copy(lhs);
            }
            if (is_float_const(lhs, 1.0)) {
                return to_copy(rhs);
            }
            break;
        case BinOp::Sub:
            if (is_float_const(rhs, 0.0)) {
                return to_copy(lhs);
            }
            break;
        case BinOp::Div:
            if (is_float_const(rhs, 1.0)) {
                return to_copy(lhs);
            }
            break;
        default:
            break;
        }
    }
    return false;
}

auto ConstantFoldingPass::fold_branches(Function& func) -> bool {
    bool changed = false;
    for (auto& block : func.blocks) {
        auto* term = block.terminator();
        if (!term) {
            continue;
        }

        std::optional<BlockId> target;
        if (const auto* br = term->as<JumpIfInst>()) {
            if (auto cond = br->condition.as_bool()) {
                target = *cond ? br->then_block : br->else_block;
            }
        } else if (const auto* sw = term->as<SwitchInst>()) {
            if (auto disc = sw->discriminant.as_int()) {
                target = sw->default_block;
                for (const auto& [value, dest] : sw->cases) {
                    if (value == *disc) {
                        target = dest;
                        break;
                    }
                }
            }
        }
        if (!target) {
            continue;
        }

        // Drop this block from the phis of every successor it no longer reaches
        for (BlockId succ : successors(term->inst)) {
            if (succ == *target) {
                continue;
            }
            auto* dropped = func.get_block(succ);
            for (auto& inst : dropped->instructions) {
                if (auto* phi = inst.as<PhiInst>()) {
                    std::erase_if(phi->incoming, [&block](const PhiIncoming& in) {
                        return in.block == block.id;
                    });
                }
            }
        }
        term->inst = JumpInst{*target};
        changed = true;
    }

    if (changed) {
        func.rebuild_cfg();
        func.remove_unreachable_blocks();
    }
    return changed;
}

} // namespace kir::ir
