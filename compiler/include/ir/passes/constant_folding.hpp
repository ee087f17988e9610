#pragma once

// Constant Folding Optimization Pass
//
// This pass evaluates instructions whose operands are all constants and
// replaces their uses with the folded constant. For example, `add i32 2, 3`
// becomes `5`.
//
// Optimizations performed:
// - Binary, comparison, unary and cast operations on constants
// - Pure intrinsics (abs, min, max, sqrt) on constants
// - Algebraic identities (`x + 0`, `x * 1`, `x - 0`, `x / 1`, `x | 0`,
//   `x ^ 0`, shifts by 0) become COPYs for copy propagation to remove;
//   `x * 0` and `x & 0` on integers become 0
// - JUMP_IF on a constant condition and SWITCH on a constant discriminant
//   become JUMPs; blocks left unreachable are removed
//
// Integer division or remainder by a constant zero is left in place to trap
// at run time.

#include "ir/ir_pass.hpp"

namespace kir::ir {

class ConstantFoldingPass : public FunctionPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "const-fold";
    }

protected:
    auto run_on_function(Function& func) -> bool override;

private:
    // Folds one instruction to a constant, or nullopt
    auto try_fold(const InstructionData& inst) -> std::optional<Value>;

    // Rewrites identities into COPY / constant form; true if rewritten
    auto try_simplify(InstructionData& inst, std::optional<Value>& folded) -> bool;

    // Turns constant conditional branches into jumps
    auto fold_branches(Function& func) -> bool;
};

} // namespace kir::ir
