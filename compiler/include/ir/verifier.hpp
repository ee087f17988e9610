// KIR Verifier
//
// Read-only structural checks. The verifier stops at the first violated
// invariant and reports it as a MalformedIr diagnostic naming the function,
// the block and the offending instruction.
//
// Checks, in order, per function:
// 1. CFG: every block ends in exactly one terminator, terminators name
//    existing blocks, stored predecessor lists match the terminators
// 2. Phi placement: phis are grouped at block start, and each phi has exactly
//    one operand per predecessor
// 3. SSA: every register is defined once, every use has a definition, and
//    every definition dominates its uses (phi operands: dominates the end of
//    the incoming edge's predecessor)
// 4. Types: each opcode's typing rule between operands and result type

#pragma once

#include "ir/diagnostic.hpp"
#include "ir/ir.hpp"

namespace kir::ir {

class DominatorTree;

class IrVerifier {
public:
    explicit IrVerifier(const Module& module) : module_(module) {}

    [[nodiscard]] auto verify() -> Result<Ok, Diagnostic>;
    [[nodiscard]] auto verify_function(const Function& func) -> Result<Ok, Diagnostic>;

private:
    const Module& module_;

    auto check_cfg(const Function& func) -> std::optional<Diagnostic>;
    auto check_phis(const Function& func) -> std::optional<Diagnostic>;
    auto check_ssa(const Function& func, const DominatorTree& dom) -> std::optional<Diagnostic>;
    auto check_types(const Function& func) -> std::optional<Diagnostic>;
    auto check_instruction_types(const Function& func, const InstructionData& inst)
        -> std::optional<std::string>;
};

auto verify_module(const Module& module) -> Result<Ok, Diagnostic>;
auto verify_function(const Module& module, const Function& func) -> Result<Ok, Diagnostic>;

} // namespace kir::ir
