// KIR Pass Manager Implementation

#include "ir/pass_manager.hpp"

#include "ir/passes/common_subexpression_elimination.hpp"
#include "ir/passes/constant_folding.hpp"
#include "ir/passes/copy_propagation.hpp"
#include "ir/passes/dead_code_elimination.hpp"
#include "ir/verifier.hpp"
#include "log/log.hpp"

namespace kir::ir {

auto opt_level_name(OptLevel level) -> const char* {
    switch (level) {
    case OptLevel::O0:
        return "O0";
    case OptLevel::O1:
        return "O1";
    case OptLevel::O2:
        return "O2";
    case OptLevel::O3:
        return "O3";
    }
    return "O?";
}

auto PassManagerConfig::for_level(OptLevel level) -> PassManagerConfig {
    PassManagerConfig config;
    switch (level) {
    case OptLevel::O0:
        break;
    case OptLevel::O1:
        config.passes = {"const-fold", "copy-prop", "dce"};
        break;
    case OptLevel::O2:
        config.passes = {"inline", "const-fold", "copy-prop", "cse", "dce"};
        break;
    case OptLevel::O3:
        // Unrolled bodies are folded in the following round
        config.passes = {"inline", "const-fold", "copy-prop", "cse", "dce", "loop-unroll"};
        break;
    }
    return config;
}

auto make_pass(const std::string& name, const PassManagerConfig& config)
    -> std::unique_ptr<IrPass> {
    if (name == "const-fold") {
        return std::make_unique<ConstantFoldingPass>();
    }
    if (name == "dce") {
        return std::make_unique<DeadCodeEliminationPass>();
    }
    if (name == "copy-prop") {
        return std::make_unique<CopyPropagationPass>();
    }
    if (name == "cse") {
        return std::make_unique<CommonSubexpressionEliminationPass>();
    }
    if (name == "inline") {
        return std::make_unique<InliningPass>(config.inlining);
    }
    if (name == "loop-unroll") {
        return std::make_unique<LoopUnrollPass>(config.unroll);
    }
    return nullptr;
}

auto PassManager::run(Module& module) -> Result<OptimizationStats, Diagnostic> {
    std::vector<std::unique_ptr<IrPass>> passes;
    for (const auto& name : config_.passes) {
        auto pass = make_pass(name, config_);
        if (!pass) {
            return make_diagnostic(DiagnosticKind::InternalCompilerError, Stage::Optimize, "",
                                   "unknown pass '" + name + "'");
        }
        passes.push_back(std::move(pass));
    }

    OptimizationStats stats;
    bool changed = !passes.empty();
    while (changed && stats.rounds < static_cast<size_t>(config_.max_rounds)) {
        changed = false;
        ++stats.rounds;
        for (auto& pass : passes) {
            if (config_.cancel && config_.cancel->load(std::memory_order_relaxed)) {
                KIR_LOG_INFO("opt", "compilation cancelled before '" << pass->name() << "'");
                return make_diagnostic(DiagnosticKind::InternalCompilerError, Stage::Optimize, "",
                                       "compilation cancelled");
            }

            bool pass_changed = pass->run(module);
            KIR_LOG_TRACE("opt", "round " << stats.rounds << ": " << pass->name()
                                          << (pass_changed ? " changed the module" : " no change"));
            if (!pass_changed) {
                continue;
            }
            changed = true;

            if (config_.verify_each_pass) {
                auto verified = verify_module(module);
                if (is_err(verified)) {
                    auto diag = unwrap_err(verified);
                    diag.notes.push_back("after pass '" + pass->name() + "' in round " +
                                         std::to_string(stats.rounds));
                    return diag;
                }
            }
        }
    }

    if (changed) {
        KIR_LOG_DEBUG("opt", "round budget of " << config_.max_rounds
                                                << " exhausted before a fixpoint");
    }

    for (const auto& pass : passes) {
        stats += pass->stats();
    }
    KIR_LOG_DEBUG("opt", "optimized '" << module.name << "' in " << stats.rounds << " rounds: "
                                       << stats.constants_folded << " folded, "
                                       << stats.instructions_removed << " removed, "
                                       << stats.calls_inlined << " inlined, "
                                       << stats.loops_unrolled << " loops unrolled");
    return stats;
}

} // namespace kir::ir
