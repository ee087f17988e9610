#pragma once

// KIR Pass Manager
//
// Runs an ordered list of passes over a Module in rounds. A round applies
// every pass once; the manager stops after the first round in which no pass
// reported a change, or when the round budget is spent.
//
// The pipeline is an explicit configuration value. Pass instances live for
// one PassManager::run, so state a pass keeps between rounds (the inliner's
// chains) spans the whole fixpoint loop and nothing longer.
//
// Between passes the manager checks the optional cancel flag. With
// verify_each_pass set, the verifier runs after every pass that changed the
// Module; a violation stops the run and names the pass in a note.

#include "ir/diagnostic.hpp"
#include "ir/ir_pass.hpp"
#include "ir/passes/inlining.hpp"
#include "ir/passes/loop_unroll.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace kir::ir {

enum class OptLevel {
    O0, // No optimization
    O1, // Folding, copy propagation, dead-code elimination
    O2, // O1 plus CSE and inlining
    O3, // O2 plus loop unrolling
};

[[nodiscard]] auto opt_level_name(OptLevel level) -> const char*;

struct PassManagerConfig {
    // Pass names in application order, e.g. "const-fold", "dce"
    std::vector<std::string> passes;

    // Upper bound on fixpoint rounds
    int max_rounds = 10;

    // Verify after every changing pass
#ifdef NDEBUG
    bool verify_each_pass = false;
#else
    bool verify_each_pass = true;
#endif

    // Checked between passes; a set flag aborts the run
    const std::atomic<bool>* cancel = nullptr;

    InliningOptions inlining;
    LoopUnrollOptions unroll;

    // The standard pipeline for an optimization level
    [[nodiscard]] static auto for_level(OptLevel level) -> PassManagerConfig;
};

// Creates a pass by name, or nullptr for an unknown name
[[nodiscard]] auto make_pass(const std::string& name, const PassManagerConfig& config)
    -> std::unique_ptr<IrPass>;

class PassManager {
public:
    explicit PassManager(PassManagerConfig config) : config_(std::move(config)) {}

    // Runs the pipeline to a fixpoint. The Module must not be used after an
    // error; it may be partially transformed.
    [[nodiscard]] auto run(Module& module) -> Result<OptimizationStats, Diagnostic>;

    [[nodiscard]] auto config() const -> const PassManagerConfig& {
        return config_;
    }

private:
    PassManagerConfig config_;
};

} // namespace kir::ir
