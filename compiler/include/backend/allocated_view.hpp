#pragma once

// Read-only walk of an allocated module: blocks in order, instructions in
// order, every result and operand annotated with where it lives. Views hold
// pointers into the CompiledModule and must not outlive it.

#include "backend/backend.hpp"

#include <vector>

namespace kir::backend {

struct OperandView {
    ir::Value value;
    regalloc::Location location;
};

struct InstructionView {
    const ir::InstructionData* inst;
    regalloc::Location result; // Kind::None for void instructions
    std::vector<OperandView> operands;
};

struct BlockView {
    const ir::BasicBlock* block;
    std::vector<InstructionView> instructions;
};

struct FunctionView {
    const ir::Function* func;
    const regalloc::AllocationResult* allocation;
    std::vector<regalloc::Location> params;
    std::vector<BlockView> blocks;
};

class AllocatedModuleView {
public:
    // Defined functions of the allocated module, in module order
    explicit AllocatedModuleView(const CompiledModule& compiled);

    [[nodiscard]] auto functions() const -> const std::vector<FunctionView>& {
        return functions_;
    }

    [[nodiscard]] auto find(std::string_view name) const -> const FunctionView*;

    // Location of an operand under an allocation
    [[nodiscard]] static auto locate(const regalloc::AllocationResult& allocation,
                                     const ir::Value& value) -> regalloc::Location;

private:
    std::vector<FunctionView> functions_;
};

} // namespace kir::backend
