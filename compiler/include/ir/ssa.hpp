// KIR SSA Construction
//
// Promotes stack slots to registers (mem2reg) and places phis at iterated
// dominance frontiers.
//
// An ALLOCA is promotable when its address only ever appears as the address
// operand of non-volatile LOADs and STOREs of the slot's type. For each
// promotable slot:
// 1. Phis are inserted at DF+(blocks that store to the slot)
// 2. A depth-first walk of the dominator tree keeps a stack of reaching
//    values per slot; LOADs are replaced by the top of the stack, STOREs and
//    phis push, leaving a subtree pops
// 3. The ALLOCA and its LOADs and STOREs are deleted
//
// Address-taken slots stay in memory. Phi operands follow each block's stored
// predecessor order, so running the construction twice is deterministic.
//
// Phis whose slot is never read stay behind with their operands; copy
// propagation and dead-code elimination remove them.

#pragma once

#include "ir/ir.hpp"

namespace kir::ir {

struct SsaStats {
    size_t slots_promoted = 0;
    size_t phis_inserted = 0;
    size_t loads_replaced = 0;
};

// Results of the promotable ALLOCAs in `func`, in instruction order
[[nodiscard]] auto find_promotable_allocas(const Function& func) -> std::vector<ValueId>;

// Promotes every promotable slot in `func`. Rebuilds the CFG first.
auto construct_ssa(Function& func) -> SsaStats;

// Runs construct_ssa on every defined function in the module
auto construct_ssa(Module& module) -> SsaStats;

} // namespace kir::ir
