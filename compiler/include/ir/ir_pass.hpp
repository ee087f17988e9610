#pragma once

// KIR Optimization Pass Infrastructure
//
// Every pass has the same capability: transform the Module, report whether
// anything changed. Passes never talk to each other except through the Module
// they jointly mutate.
// - IrPass: module level (inlining needs every function at once)
// - FunctionPass: one defined function at a time

#include "ir/ir.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kir::ir {

// Counters accumulated by the passes and reported with the compile result
struct OptimizationStats {
    size_t constants_folded = 0;
    size_t instructions_removed = 0;
    size_t copies_propagated = 0;
    size_t subexpressions_eliminated = 0;
    size_t calls_inlined = 0;
    size_t loops_unrolled = 0;
    size_t rounds = 0;

    auto operator+=(const OptimizationStats& other) -> OptimizationStats&;
};

// ============================================================================
// Pass Base Classes
// ============================================================================

class IrPass {
public:
    virtual ~IrPass() = default;

    // Pass name as used in pass lists and logs, e.g. "const-fold"
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    // Run the pass on a module, returns true if any changes were made
    virtual auto run(Module& module) -> bool = 0;

    // Counters accumulated over every run of this pass instance
    [[nodiscard]] auto stats() const -> const OptimizationStats& {
        return stats_;
    }

protected:
    OptimizationStats stats_;
};

// Function-level pass - operates on one defined function at a time
class FunctionPass : public IrPass {
public:
    auto run(Module& module) -> bool override;

protected:
    // The module being transformed; valid during run_on_function
    Module* module_ = nullptr;

    virtual auto run_on_function(Function& func) -> bool = 0;
};

// ============================================================================
// Analysis Utilities
// ============================================================================

// Module-wide call purity. A function is pure when its body has no STORE
// through a pointer it did not allocate, no atomics, MEMSET, MEMCPY or
// volatile access, no trap, and calls only pure functions. External
// declarations are impure unless marked "pure"; functions marked "pure" are
// trusted. Call cycles are resolved pessimistically.
class PurityAnalysis {
public:
    explicit PurityAnalysis(const Module& module);

    [[nodiscard]] auto is_pure(std::string_view function) const -> bool;

private:
    std::unordered_set<std::string> pure_;
};

// True for opcodes that must be kept even when their result is unused.
// CALLs count as side-effecting unless `purity` proves the callee pure.
[[nodiscard]] auto has_side_effects(const Instruction& inst, const PurityAnalysis* purity = nullptr)
    -> bool;

// Defining instruction of every register, for quick lookups by id
[[nodiscard]] auto build_def_map(const Function& func)
    -> std::unordered_map<ValueId, const InstructionData*>;

} // namespace kir::ir
