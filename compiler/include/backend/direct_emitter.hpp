#pragma once

// Direct Emitter
//
// Non-optimizing code generation from the allocated module. Every KIR
// instruction becomes a short group of three-address pseudo-assembly lines
// over the physical registers chosen by the allocator, preceded by the
// instruction itself as a comment.
//
// Frame: spill slots first, then the edge temporary when a phi copy touches
// a slot, then allocas, 8-byte cells, the total rounded up to the stack
// alignment. Phi copies happen on the incoming edge as a sequentialized
// parallel move over registers and spill slots; edges out of a conditional
// terminator get their own stub label when they carry copies. A copy into a
// slot from memory or an immediate goes through the class's first scratch
// register, or through a saved allocatable register when there is none.
// Spill loads and stores of values that stay in their slot emit nothing.
// Registers live across a call are saved around it.
//
// Atomics on targets without atomic support and intrinsics outside the
// target's intrinsic set have no lowering and raise UnsupportedOpcode.

#include "backend/allocated_view.hpp"
#include "backend/backend.hpp"

#include <sstream>

namespace kir::backend {

class DirectEmitter : public Backend {
public:
    explicit DirectEmitter(regalloc::TargetDesc target) : target_(std::move(target)) {}

    [[nodiscard]] auto name() const -> std::string_view override {
        return "direct";
    }

    [[nodiscard]] auto kind() const -> BackendKind override {
        return BackendKind::Direct;
    }

    [[nodiscard]] auto emit(const CompiledModule& compiled)
        -> Result<std::string, ir::Diagnostic> override;

private:
    regalloc::TargetDesc target_;
    std::stringstream output_;

    // Current function context
    const FunctionView* current_ = nullptr;
    std::unordered_map<ir::ValueId, int64_t> alloca_offsets_;
    int64_t frame_size_ = 0;
    std::vector<std::pair<ir::BlockId, ir::BlockId>> edge_stubs_; // Pending (from, to)
    std::string edge_temp_; // Slot parking one value of a copy cycle through memory

    // One copy of a parallel move; locations are registers or "[fp-N]" slots
    struct Move {
        std::string dst;
        std::string src;
        regalloc::RegClass cls;
    };

    auto emit_function(const FunctionView& fv) -> std::optional<ir::Diagnostic>;
    auto emit_instruction(const BlockView& bv, const InstructionView& iv,
                          const std::vector<std::string>& live_across)
        -> std::optional<ir::Diagnostic>;
    void emit_terminator(const BlockView& bv, const InstructionView& iv);
    void emit_call(const std::string& callee, const std::vector<ir::Value>& args,
                   const InstructionView& iv, const std::vector<std::string>& live_across);

    // Copies feeding the phis of `to` along the edge from `from`
    auto phi_moves(ir::BlockId from, ir::BlockId to) const -> std::vector<Move>;
    void emit_parallel_move(std::vector<Move> moves);
    void emit_move(const Move& move);

    // A register value the allocator left in its spill slot
    auto in_slot(const ir::Value& value) const -> bool;

    // Label to branch to for the edge; a stub when the edge carries copies
    auto edge_label(ir::BlockId from, ir::BlockId to) -> std::string;

    auto label(ir::BlockId block) const -> std::string;
    auto operand(const OperandView& op) const -> std::string;
    auto operand(const ir::Value& value) const -> std::string;
    auto slot_address(uint32_t slot) const -> std::string;
    auto unsupported(const ir::InstructionData& inst, const std::string& what) const
        -> ir::Diagnostic;

    void emitln(const std::string& s = "");
    void emit_comment(const std::string& s);
};

} // namespace kir::backend
