#pragma once

// Toolchain Bridge
//
// Hands the optimized module to an external optimizing toolchain as
// LLVM-style textual IR. The bridge walks the pre-allocation SSA module; the
// toolchain allocates registers itself, so the midend's allocation is not
// consulted. Each KIR instruction maps to one instruction of the external
// vocabulary (two for compare-exchange), and each function is preceded by
// its ABI table entry under the target's calling convention.

#include "backend/backend.hpp"

#include <set>
#include <sstream>

namespace kir::backend {

// Calling-convention view of one function signature
struct AbiEntry {
    std::string function;
    std::vector<std::string> args; // Register name or "stack+<offset>"
    std::string ret;               // Register name, or "void"
    int stack_alignment = 16;

    // "name(rdi, xmm0, stack+0) -> rax, stack align 16"
    [[nodiscard]] auto to_string() const -> std::string;
};

[[nodiscard]] auto abi_entry(const ir::Function& func, const regalloc::CallingConvention& cc)
    -> AbiEntry;

// One entry per function of the module, declarations included
[[nodiscard]] auto abi_table(const ir::Module& module, const regalloc::CallingConvention& cc)
    -> std::vector<AbiEntry>;

// LLVM spelling of a KIR type ("i32", "double", "ptr", "[4 x i8]")
[[nodiscard]] auto llvm_type(const ir::IrTypePtr& type) -> std::string;

class ToolchainBridge : public Backend {
public:
    explicit ToolchainBridge(regalloc::TargetDesc target) : target_(std::move(target)) {}

    [[nodiscard]] auto name() const -> std::string_view override {
        return "toolchain";
    }

    [[nodiscard]] auto kind() const -> BackendKind override {
        return BackendKind::Toolchain;
    }

    [[nodiscard]] auto emit(const CompiledModule& compiled)
        -> Result<std::string, ir::Diagnostic> override;

private:
    regalloc::TargetDesc target_;
    std::stringstream output_;
    std::set<std::string> intrinsic_decls_;
    const ir::Module* module_ = nullptr;
    const ir::Function* current_ = nullptr;

    auto emit_function(const ir::Function& func) -> std::optional<ir::Diagnostic>;
    auto emit_instruction(const ir::InstructionData& inst) -> std::optional<ir::Diagnostic>;
    void emit_terminator(const ir::InstructionData& inst);
    void emit_intrinsic(const ir::InstructionData& inst, const ir::IntrinsicInst& intrinsic);

    auto value(const ir::Value& v) const -> std::string;
    auto typed(const ir::Value& v) const -> std::string;
    auto result(const ir::InstructionData& inst) const -> std::string;
    auto block_label(ir::BlockId id) const -> std::string;

    void emitln(const std::string& s = "");
};

} // namespace kir::backend
