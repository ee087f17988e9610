// Dead Code Elimination Pass Implementation
//
// Mark and sweep: instructions with side effects are live, and so is the
// definition of every operand of a live instruction. Everything else goes.
// Sweeping everything unmarked at once reaches the same fixpoint as
// repeatedly deleting zero-use instructions, and also catches phi cycles
// that keep each other alive.

#include "ir/passes/dead_code_elimination.hpp"

#include "log/log.hpp"

namespace kir::ir {

auto DeadCodeEliminationPass::run(Module& module) -> bool {
    purity_.emplace(module);
    bool changed = FunctionPass::run(module);
    purity_.reset();
    return changed;
}

auto DeadCodeEliminationPass::run_on_function(Function& func) -> bool {
    auto defs = build_def_map(func);
    std::unordered_set<ValueId> live;
    std::vector<const InstructionData*> worklist;

    auto mark = [&](const InstructionData& inst) {
        for (const auto& op : operands(inst.inst)) {
            if (!op.is_register()) {
                continue;
            }
            auto it = defs.find(op.reg());
            if (it != defs.end() && live.insert(op.reg()).second) {
                worklist.push_back(it->second);
            }
        }
    };

    const PurityAnalysis* purity = purity_ ? &*purity_ : nullptr;
    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            if (has_side_effects(inst.inst, purity)) {
                if (inst.has_result()) {
                    live.insert(inst.result);
                }
                mark(inst);
            }
        }
    }
    while (!worklist.empty()) {
        const auto* inst = worklist.back();
        worklist.pop_back();
        mark(*inst);
    }

    size_t removed = 0;
    for (auto& block : func.blocks) {
        removed += std::erase_if(block.instructions, [&](const InstructionData& inst) {
            if (has_side_effects(inst.inst, purity)) {
                return false;
            }
            return !inst.has_result() || !live.contains(inst.result);
        });
    }

    if (removed > 0) {
        stats_.instructions_removed += removed;
        KIR_LOG_TRACE("opt", "dce removed " << removed << " instructions from '" << func.name
                                            << "'");
    }
    return removed > 0;
}

} // namespace kir::ir
