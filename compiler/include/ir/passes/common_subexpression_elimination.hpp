#pragma once

// Common Subexpression Elimination (CSE) Optimization Pass
//
// This pass identifies and eliminates redundant computations.
// If the same expression is computed multiple times with the
// same operands, occurrences dominated by an earlier one are replaced
// with references to the earlier result.
//
// Example:
//   %1 = add i32 %a, %b
//   %2 = add i32 %a, %b  ; same as %1
//   %3 = mul i32 %1, %2
// Becomes:
//   %1 = add i32 %a, %b
//   %3 = mul i32 %1, %1  ; %2 replaced with %1
//
// The table is scoped by the dominator tree: an expression seen in block A
// is available in every block A dominates. Operands of commutative
// operations are put in a canonical order first.
//
// Never eliminated: atomics, volatile memory operations, calls, loads,
// allocas, phis and trap.

#include "ir/ir_pass.hpp"

#include <functional>
#include <unordered_map>

namespace kir::ir {

// Hashed by (opcode, operand identities, result type); equality is
// structural, so hash collisions never merge different expressions
struct ExprKey {
    std::string opcode; // Mnemonic including the sub-operation, e.g. "add"
    std::vector<Value> operands;
    IrTypePtr type;

    auto operator==(const ExprKey& other) const -> bool;
};

struct ExprKeyHash {
    auto operator()(const ExprKey& key) const -> std::size_t;
};

class CommonSubexpressionEliminationPass : public FunctionPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "cse";
    }

protected:
    auto run_on_function(Function& func) -> bool override;

private:
    // Key for an eligible expression, nullopt for everything else
    auto make_expr_key(const InstructionData& inst) -> std::optional<ExprKey>;
};

} // namespace kir::ir
