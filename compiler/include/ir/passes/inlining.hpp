#pragma once

// Function Inlining Optimization Pass
//
// Replaces calls with a copy of the callee's body.
//
// A call site is a candidate when the callee is defined in the module, is
// not marked "noinline", and either has fewer instructions than the
// threshold or is marked "inline".
//
// Inlining a call:
// 1. Splits the caller's block at the call; the tail moves to a
//    continuation block
// 2. Clones the callee's blocks with fresh block ids and registers,
//    substituting the actual arguments for the formal parameters
// 3. Turns every RET into a JUMP to the continuation; with several returns
//    a phi at the top of the continuation merges the returned values and
//    takes over the call's result register
//
// Recursion: every block remembers the chain of functions whose inlining
// produced it. A call to a function already on its block's chain, or past
// the maximum chain depth, is refused. Refusals leave the module unchanged
// and are logged at debug level.

#include "ir/ir_pass.hpp"

#include <set>
#include <unordered_map>

namespace kir::ir {

struct InliningOptions {
    size_t threshold = 10;      // Callees with fewer instructions are inlined
    size_t max_chain_depth = 4; // Nested inlines along one chain
};

enum class InlineDecision {
    Inline,
    NoDefinition,   // External declaration
    NeverInline,    // "noinline" attribute
    TooLarge,       // Over the threshold and not marked "inline"
    Recursive,      // Callee already on the inlining chain
    ChainTooDeep,   // Chain reached max_chain_depth
};

[[nodiscard]] auto inline_decision_name(InlineDecision decision) -> const char*;

class InliningPass : public IrPass {
public:
    explicit InliningPass(InliningOptions opts = {}) : options_(opts) {}

    [[nodiscard]] auto name() const -> std::string override {
        return "inline";
    }

    auto run(Module& module) -> bool override;

    // Decision for a call from a block whose inlining chain is `chain`
    [[nodiscard]] auto decide(const Function& callee, const std::set<FunctionId>& chain) const
        -> InlineDecision;

private:
    InliningOptions options_;

    // Per function, the inlining chain of each block; blocks not listed
    // belong to the function itself. Kept across runs so the chain survives
    // pass-manager rounds.
    std::unordered_map<FunctionId, std::unordered_map<BlockId, std::set<FunctionId>>> chains_;

    auto chain_of(const Function& func, BlockId block) -> std::set<FunctionId>;

    auto inline_function_calls(Module& module, Function& caller) -> bool;

    // Inlines the call at `index` of `block_id`
    void inline_call(Function& caller, BlockId block_id, size_t index, const Function& callee,
                     const std::set<FunctionId>& chain);
};

} // namespace kir::ir
