// KIR Optimization Pass Infrastructure Implementation

#include "ir/ir_pass.hpp"

namespace kir::ir {

auto OptimizationStats::operator+=(const OptimizationStats& other) -> OptimizationStats& {
    constants_folded += other.constants_folded;
    instructions_removed += other.instructions_removed;
    copies_propagated += other.copies_propagated;
    subexpressions_eliminated += other.subexpressions_eliminated;
    calls_inlined += other.calls_inlined;
    loops_unrolled += other.loops_unrolled;
    rounds += other.rounds;
    return *this;
}

// ============================================================================
// FunctionPass Implementation
// ============================================================================

auto FunctionPass::run(Module& module) -> bool {
    module_ = &module;
    bool changed = false;
    for (auto& func : module.functions) {
        if (!func.is_declaration()) {
            changed |= run_on_function(func);
        }
    }
    module_ = nullptr;
    return changed;
}

// ============================================================================
// Analysis Utilities Implementation
// ============================================================================

namespace {

// Integer division traps at run time when the divisor is zero
auto may_trap(const Instruction& inst) -> bool {
    const auto* bin = std::get_if<BinaryInst>(&inst);
    if (!bin || (bin->op != BinOp::Div && bin->op != BinOp::Rem)) {
        return false;
    }
    if (!bin->rhs.type || bin->rhs.type->is_float()) {
        return false;
    }
    auto divisor = bin->rhs.as_int();
    return !divisor || *divisor == 0;
}

// Effects of the function body other than its calls
auto locally_pure(const Function& func) -> bool {
    std::unordered_set<ValueId> local_slots;
    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            if (inst.is<AllocaInst>()) {
                local_slots.insert(inst.result);
            }
        }
    }

    for (const auto& block : func.blocks) {
        for (const auto& data : block.instructions) {
            const auto& inst = data.inst;
            if (const auto* store = std::get_if<StoreInst>(&inst)) {
                bool local = store->ptr.is_register() && local_slots.contains(store->ptr.reg());
                if (!local || store->is_volatile) {
                    return false;
                }
            } else if (const auto* load = std::get_if<LoadInst>(&inst)) {
                if (load->is_volatile) {
                    return false;
                }
            } else if (std::holds_alternative<AtomicInst>(inst) ||
                       std::holds_alternative<MemsetInst>(inst) ||
                       std::holds_alternative<MemcpyInst>(inst)) {
                return false;
            } else if (const auto* intrinsic = std::get_if<IntrinsicInst>(&inst)) {
                if (intrinsic->kind == IntrinsicKind::Trap) {
                    return false;
                }
            } else if (may_trap(inst)) {
                return false;
            }
        }
    }
    return true;
}

} // namespace

PurityAnalysis::PurityAnalysis(const Module& module) {
    std::vector<const Function*> pending;
    for (const auto& func : module.functions) {
        if (func.has_attribute("pure")) {
            pure_.insert(func.name);
        } else if (!func.is_declaration() && locally_pure(func)) {
            pending.push_back(&func);
        }
    }

    // A function becomes pure once every callee is known pure; whatever is
    // left when nothing changes sits on an unresolved cycle or calls
    // something impure.
    bool changed = true;
    while (changed) {
        changed = false;
        std::erase_if(pending, [&](const Function* func) {
            for (const auto& block : func->blocks) {
                for (const auto& inst : block.instructions) {
                    const auto* call = inst.as<CallInst>();
                    if (call && !pure_.contains(call->callee)) {
                        return false;
                    }
                }
            }
            pure_.insert(func->name);
            changed = true;
            return true;
        });
    }
}

auto PurityAnalysis::is_pure(std::string_view function) const -> bool {
    return pure_.contains(std::string(function));
}

auto has_side_effects(const Instruction& inst, const PurityAnalysis* purity) -> bool {
    return std::visit(
        [&](const auto& i) -> bool {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, StoreInst> || std::is_same_v<T, AtomicInst> ||
                          std::is_same_v<T, MemsetInst> || std::is_same_v<T, MemcpyInst>) {
                return true;
            } else if constexpr (std::is_same_v<T, CallInst>) {
                return !purity || !purity->is_pure(i.callee);
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                return i.is_volatile;
            } else if constexpr (std::is_same_v<T, IntrinsicInst>) {
                return i.kind == IntrinsicKind::Trap;
            } else if constexpr (std::is_same_v<T, BinaryInst>) {
                return may_trap(inst);
            } else {
                return is_terminator(inst);
            }
        },
        inst);
}

auto build_def_map(const Function& func) -> std::unordered_map<ValueId, const InstructionData*> {
    std::unordered_map<ValueId, const InstructionData*> defs;
    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            if (inst.has_result()) {
                defs[inst.result] = &inst;
            }
        }
    }
    return defs;
}

} // namespace kir::ir
