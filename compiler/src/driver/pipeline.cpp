//! # Compile Pipeline Implementation
//!
//! Stage order and error propagation for `compile_module` / `compile_ir`.
//! Every stage either hands a module to the next one or stops the compile
//! with its diagnostics; nothing is retried.

#include "driver/pipeline.hpp"

#include "ir/ir_builder.hpp"
#include "ir/ssa.hpp"
#include "ir/verifier.hpp"
#include "log/log.hpp"
#include "regalloc/linear_scan.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

namespace kir::driver {

using namespace ir;

namespace {

using Diagnostics = std::vector<Diagnostic>;

auto verify_stage(const Module& module, const char* after) -> std::optional<Diagnostic> {
    auto result = verify_module(module);
    if (is_ok(result)) {
        return std::nullopt;
    }
    auto diag = std::move(unwrap_err(result));
    diag.notes.push_back(std::string("after ") + after);
    return diag;
}

auto cancelled(const PipelineConfig& config) -> bool {
    return config.passes.cancel && config.passes.cancel->load();
}

auto cancel_diagnostic(const char* stage) -> Diagnostic {
    return make_diagnostic(DiagnosticKind::InternalCompilerError, Stage::Driver, "",
                           std::string("compilation cancelled before ") + stage);
}

auto run_hooks(Module& module, const std::vector<std::shared_ptr<ModuleHook>>& hooks,
               const char* point) -> std::optional<Diagnostics> {
    for (const auto& hook : hooks) {
        auto result = hook->run(module);
        if (is_err(result)) {
            auto diags = std::move(unwrap_err(result));
            KIR_LOG_ERROR("driver", "hook '" << hook->name() << "' failed " << point << " with "
                                             << diags.size() << " diagnostic(s)");
            return diags;
        }
        KIR_LOG_DEBUG("driver", "hook '" << hook->name() << "' " << point
                                         << (unwrap(result) ? " changed the module" : ": no change"));
    }
    return std::nullopt;
}

} // namespace

auto PipelineConfig::for_level(OptLevel level) -> PipelineConfig {
    PipelineConfig config;
    config.opt_level = level;
    config.passes = PassManagerConfig::for_level(level);
    return config;
}

auto allocate_module(Module& module, const regalloc::TargetDesc& target, unsigned jobs)
    -> Result<std::unordered_map<std::string, regalloc::AllocationResult>, Diagnostics> {
    std::vector<Function*> work;
    for (auto& func : module.functions) {
        if (!func.is_declaration()) {
            work.push_back(&func);
        }
    }

    // One slot per function; each worker writes only the slots it claimed
    std::vector<std::optional<Result<regalloc::AllocationResult, Diagnostic>>> results(work.size());
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < work.size(); i = next.fetch_add(1)) {
            results[i] = regalloc::allocate_registers(*work[i], target);
        }
    };

    unsigned threads = std::min<unsigned>(jobs, static_cast<unsigned>(work.size()));
    if (threads <= 1) {
        worker();
    } else {
        KIR_LOG_DEBUG("driver", "allocating " << work.size() << " functions on " << threads
                                              << " threads");
        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (unsigned t = 0; t < threads; ++t) {
            workers.emplace_back(worker);
        }
        for (auto& w : workers) {
            w.join();
        }
    }

    std::unordered_map<std::string, regalloc::AllocationResult> allocations;
    Diagnostics errors;
    for (size_t i = 0; i < work.size(); ++i) {
        auto& result = *results[i];
        if (is_err(result)) {
            errors.push_back(std::move(unwrap_err(result)));
        } else {
            allocations.emplace(work[i]->name, std::move(unwrap(result)));
        }
    }
    if (!errors.empty()) {
        return errors;
    }
    return allocations;
}

auto compile_ir(Module module, const PipelineConfig& config, const PipelineHooks& hooks)
    -> CompileResult {
    auto start = std::chrono::steady_clock::now();
    KIR_LOG_INFO("driver", "compiling '" << module.name << "' at " << opt_level_name(config.opt_level)
                                         << " for " << config.target.triple);

    if (config.verify) {
        if (auto diag = verify_stage(module, "lowering")) {
            return Diagnostics{*diag};
        }
    }

    auto ssa = construct_ssa(module);
    KIR_LOG_DEBUG("driver", "ssa: " << ssa.slots_promoted << " slots promoted, "
                                    << ssa.phis_inserted << " phis inserted");
    if (config.verify) {
        if (auto diag = verify_stage(module, "SSA construction")) {
            return Diagnostics{*diag};
        }
    }

    if (auto diags = run_hooks(module, hooks.pre_optimize, "before optimization")) {
        return *diags;
    }

    auto pass_config = config.passes;
    pass_config.verify_each_pass = pass_config.verify_each_pass && config.verify;
    PassManager manager(std::move(pass_config));
    auto optimized = manager.run(module);
    if (is_err(optimized)) {
        return Diagnostics{std::move(unwrap_err(optimized))};
    }
    auto stats = std::move(unwrap(optimized));

    if (auto diags = run_hooks(module, hooks.post_optimize, "after optimization")) {
        return *diags;
    }
    if (config.verify) {
        if (auto diag = verify_stage(module, "optimization")) {
            return Diagnostics{*diag};
        }
    }

    if (cancelled(config)) {
        return Diagnostics{cancel_diagnostic("register allocation")};
    }

    backend::CompiledModule compiled{module, module, {}, stats, config.target};
    auto allocated = allocate_module(compiled.allocated_module, config.target, config.jobs);
    if (is_err(allocated)) {
        return std::move(unwrap_err(allocated));
    }
    compiled.allocations = std::move(unwrap(allocated));

    if (config.verify) {
        if (auto diag = verify_stage(compiled.allocated_module, "register allocation")) {
            return Diagnostics{*diag};
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();
    KIR_LOG_INFO("driver", "compiled '" << module.name << "': " << stats.rounds << " rounds, "
                                        << stats.constants_folded << " folded, "
                                        << stats.instructions_removed << " removed, "
                                        << stats.calls_inlined << " inlined in " << elapsed
                                        << " ms");
    return compiled;
}

auto compile_module(const ast::Module& ast_module, const PipelineConfig& config,
                    const PipelineHooks& hooks) -> CompileResult {
    auto built = build_module(ast_module);
    if (is_err(built)) {
        auto diag = std::move(unwrap_err(built));
        KIR_LOG_ERROR("driver", diag.to_string());
        return Diagnostics{std::move(diag)};
    }
    return compile_ir(std::move(unwrap(built)), config, hooks);
}

auto emit(const backend::CompiledModule& compiled, backend::BackendKind kind)
    -> Result<std::string, Diagnostic> {
    auto backend = backend::create_backend(kind, compiled.target);
    KIR_LOG_DEBUG("driver", "dispatching '" << compiled.ssa_module.name << "' to the "
                                            << backend->name() << " backend");
    return backend->emit(compiled);
}

} // namespace kir::driver
