#pragma once

// Dead Code Elimination (DCE) Optimization Pass
//
// This pass removes instructions whose results are never used.
// An instruction is dead if:
// 1. It produces a result that is never used
// 2. It has no side effect (STORE, CALL to a possibly impure function,
//    atomics, MEMSET, MEMCPY, volatile LOAD, trap, integer division that
//    may trap, terminators)
//
// DCE is applied iteratively because removing one instruction may make
// other instructions dead. Phis that only feed each other (dead loop-carried
// cycles) are removed together.

#include "ir/ir_pass.hpp"

namespace kir::ir {

class DeadCodeEliminationPass : public FunctionPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "dce";
    }

    auto run(Module& module) -> bool override;

protected:
    auto run_on_function(Function& func) -> bool override;

private:
    std::optional<PurityAnalysis> purity_;
};

} // namespace kir::ir
