//! # Compile Pipeline
//!
//! Drives one module from typed AST to a `CompiledModule` ready for backend
//! dispatch.
//!
//! ## Stages
//!
//! ```text
//! typed AST → lower → verify → SSA → verify
//!           → pre-optimize hooks → pass manager → post-optimize hooks → verify
//!           → register allocation (per function, optionally on worker threads)
//!           → CompiledModule
//! ```
//!
//! Verification between stages follows `PipelineConfig::verify`. Register
//! allocation works on a copy of the optimized module, so the result carries
//! both the SSA module for the toolchain bridge and the allocated module for
//! the direct emitter. Worker threads are joined before the result is
//! returned.
//!
//! ## Hooks
//!
//! A `ModuleHook` is an external transform or lint run on the whole module
//! before or after the optimizer's fixpoint loop, never inside it.

#pragma once

#include "ast/typed_ast.hpp"
#include "backend/backend.hpp"
#include "ir/diagnostic.hpp"
#include "ir/pass_manager.hpp"
#include "regalloc/target.hpp"

#include <memory>
#include <string>
#include <vector>

namespace kir::driver {

/// Compile settings for one module.
struct PipelineConfig {
    ir::OptLevel opt_level = ir::OptLevel::O2;
    ir::PassManagerConfig passes = ir::PassManagerConfig::for_level(ir::OptLevel::O2);
    regalloc::TargetDesc target = regalloc::TargetDesc::x86_64();

    /// Run the verifier between stages.
#ifdef NDEBUG
    bool verify = false;
#else
    bool verify = true;
#endif

    /// Worker threads for register allocation; 0 and 1 allocate inline.
    unsigned jobs = 1;

    /// Standard configuration for an optimization level.
    [[nodiscard]] static auto for_level(ir::OptLevel level) -> PipelineConfig;
};

/// Whole-module plugin run outside the optimizer's fixpoint loop.
class ModuleHook {
public:
    virtual ~ModuleHook() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /// Returns true when the module changed; diagnostics abort the compile.
    virtual auto run(ir::Module& module) -> Result<bool, std::vector<ir::Diagnostic>> = 0;
};

struct PipelineHooks {
    std::vector<std::shared_ptr<ModuleHook>> pre_optimize;
    std::vector<std::shared_ptr<ModuleHook>> post_optimize;
};

using CompileResult = Result<backend::CompiledModule, std::vector<ir::Diagnostic>>;

/// Lowers and compiles a typed AST module.
[[nodiscard]] auto compile_module(const ast::Module& ast_module, const PipelineConfig& config,
                                  const PipelineHooks& hooks = {}) -> CompileResult;

/// Compiles an already-lowered module. The module may still hold promotable
/// stack slots; SSA construction runs first.
[[nodiscard]] auto compile_ir(ir::Module module, const PipelineConfig& config,
                              const PipelineHooks& hooks = {}) -> CompileResult;

/// Allocates every defined function of `module` in place. Functions are
/// distributed over `jobs` threads; errors are returned in function order.
[[nodiscard]] auto allocate_module(ir::Module& module, const regalloc::TargetDesc& target,
                                   unsigned jobs)
    -> Result<std::unordered_map<std::string, regalloc::AllocationResult>,
              std::vector<ir::Diagnostic>>;

/// Runs a backend over a compiled module.
[[nodiscard]] auto emit(const backend::CompiledModule& compiled, backend::BackendKind kind)
    -> Result<std::string, ir::Diagnostic>;

} // namespace kir::driver
