//! # Backend Dispatch
//!
//! The contract between the midend and its code generators. A backend
//! consumes a finished compile and produces target text; it never mutates
//! the module it is handed.
//!
//! ## Architecture
//!
//! ```text
//!     Backend (abstract)
//!     ├── name() / kind()
//!     └── emit(CompiledModule) → Result<std::string, Diagnostic>
//!            │
//!   ┌────────┴──────────┐
//!   │                   │
//! DirectEmitter      ToolchainBridge
//! (allocated module) (SSA module + ABI table)
//! ```
//!
//! The direct emitter walks the allocated module through
//! `AllocatedModuleView`. The toolchain bridge ignores the allocation and
//! walks the pre-allocation SSA module, since the external toolchain
//! allocates registers itself.

#pragma once

#include "ir/diagnostic.hpp"
#include "ir/ir.hpp"
#include "ir/ir_pass.hpp"
#include "regalloc/linear_scan.hpp"
#include "regalloc/target.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kir::backend {

/// Everything the midend hands to a backend.
struct CompiledModule {
    /// Optimized module in SSA form, before register allocation.
    ir::Module ssa_module;

    /// The same module after allocation, with spill traffic inserted.
    ir::Module allocated_module;

    /// Allocation of each defined function, by name.
    std::unordered_map<std::string, regalloc::AllocationResult> allocations;

    /// Counters accumulated by the optimizer.
    ir::OptimizationStats stats;

    /// Target the allocation was made for.
    regalloc::TargetDesc target;
};

/// Available backends.
enum class BackendKind {
    Direct,    ///< Pseudo-assembly from the allocated module
    Toolchain, ///< LLVM-style textual IR for an external optimizing toolchain
};

[[nodiscard]] auto backend_kind_name(BackendKind kind) -> const char*;

/// Abstract behavior for code generation backends.
class Backend {
public:
    virtual ~Backend() = default;

    /// Backend name (e.g. "direct", "toolchain").
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    [[nodiscard]] virtual auto kind() const -> BackendKind = 0;

    /// Produces the backend's output for the whole module, or the first
    /// diagnostic. Fails with UnsupportedOpcode when an instruction has no
    /// lowering for the target.
    [[nodiscard]] virtual auto emit(const CompiledModule& compiled)
        -> Result<std::string, ir::Diagnostic> = 0;
};

/// Create a backend instance by kind.
[[nodiscard]] auto create_backend(BackendKind kind, const regalloc::TargetDesc& target)
    -> std::unique_ptr<Backend>;

} // namespace kir::backend
