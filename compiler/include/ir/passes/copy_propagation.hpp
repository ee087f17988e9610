#pragma once

// Copy Propagation Optimization Pass
//
// Replaces uses of trivial identities with their source and removes them:
// - COPY %x                      -> %x
// - phi [bb1: %x], [bb2: %x]     -> %x (all incoming values identical)
// - phi [bb1: %x], [bb2: %self]  -> %x (self references ignored)
//
// Chains resolve transitively: if %2 = copy %1 and %3 = copy %2, uses of %3
// become %1.

#include "ir/ir_pass.hpp"

namespace kir::ir {

class CopyPropagationPass : public FunctionPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "copy-prop";
    }

protected:
    auto run_on_function(Function& func) -> bool override;

private:
    // Source of a trivial identity, or nullopt
    auto find_source(const InstructionData& inst) -> std::optional<Value>;
};

} // namespace kir::ir
