// Compile Pipeline Tests
//
// Whole-module compiles from the typed AST: stage ordering, hooks,
// cancellation, parallel register allocation and backend dispatch.

#include "driver/pipeline.hpp"
#include "ir/interpreter.hpp"
#include "ir/ir_builder.hpp"
#include "support/ast_fixtures.hpp"
#include "support/ir_fixtures.hpp"

#include <atomic>
#include <gtest/gtest.h>

using namespace kir;
using namespace kir::ast;
using kir::driver::compile_ir;
using kir::driver::compile_module;
using kir::driver::ModuleHook;
using kir::driver::PipelineConfig;
using kir::driver::PipelineHooks;
using kir::test::func;
using kir::test::i32_var;
using kir::test::module_of;
using kir::test::param;
using kir::test::ty;

namespace {

// fn sum() -> i32 { let mut s = 0; for i in 1..=4 { s = s + i; } s }
auto sum_function() -> FuncDecl {
    auto body = make_block(
        stmt_list(make_let(0, "s", ty(TypeKind::I32), make_int(0), true),
                  make_expr_stmt(make_for(
                      1, "i", make_int(1), make_int(4),
                      make_assign(0, "s", make_binary(BinaryOp::Add, i32_var(0, "s"), i32_var(1, "i"))),
                      std::nullopt, true))),
        i32_var(0, "s"));
    return func("sum", {}, TypeKind::I32, std::move(body));
}

// fn <name>(x: i32) -> i32 { x * k + 1 }
auto affine_function(const std::string& name, int64_t k) -> FuncDecl {
    auto body = make_block(
        {}, make_binary(BinaryOp::Add, make_binary(BinaryOp::Mul, i32_var(0, "x"), make_int(k)),
                        make_int(1)));
    return func(name, {param(0, "x")}, TypeKind::I32, std::move(body));
}

auto call_i32(const ir::Module& module, const std::string& name, std::vector<int64_t> args)
    -> ir::ExecOutcome {
    std::vector<ir::Value> values;
    for (auto a : args) {
        values.push_back(ir::make_const_int(a, ir::make_i32_type()));
    }
    return ir::Interpreter(module).call(name, values);
}

// Tags every defined function with an attribute
class TagHook : public ModuleHook {
public:
    explicit TagHook(std::string tag) : tag_(std::move(tag)) {}

    [[nodiscard]] auto name() const -> std::string override {
        return "tag:" + tag_;
    }

    auto run(ir::Module& module) -> Result<bool, std::vector<ir::Diagnostic>> override {
        ++runs;
        bool changed = false;
        for (auto& f : module.functions) {
            if (!f.is_declaration() && !f.has_attribute(tag_)) {
                f.attributes.push_back(tag_);
                changed = true;
            }
        }
        return changed;
    }

    int runs = 0;

private:
    std::string tag_;
};

// Rejects every module it sees
class RejectHook : public ModuleHook {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "reject";
    }

    auto run(ir::Module& module) -> Result<bool, std::vector<ir::Diagnostic>> override {
        std::vector<ir::Diagnostic> diags;
        for (const auto& f : module.functions) {
            diags.push_back(ir::make_diagnostic(ir::DiagnosticKind::MalformedIr, ir::Stage::Driver,
                                                f.name, "rejected by lint"));
        }
        return diags;
    }
};

} // namespace

TEST(PipelineConfigTest, ForLevel) {
    auto config = PipelineConfig::for_level(ir::OptLevel::O1);
    EXPECT_EQ(config.opt_level, ir::OptLevel::O1);
    EXPECT_EQ(config.passes.passes, ir::PassManagerConfig::for_level(ir::OptLevel::O1).passes);
    EXPECT_EQ(config.target.arch, regalloc::Arch::X86_64);
    EXPECT_EQ(config.jobs, 1u);
}

// ============================================================================
// End to End
// ============================================================================

TEST(PipelineTest, CompilesCountedLoopToAConstant) {
    auto config = PipelineConfig::for_level(ir::OptLevel::O3);
    config.verify = true;
    auto result = compile_module(module_of("loops", sum_function()), config);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).front().to_string();
    const auto& compiled = unwrap(result);

    EXPECT_EQ(compiled.stats.loops_unrolled, 1u);
    const auto* f = compiled.ssa_module.find_function("sum");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(kir::test::count_of<ir::PhiInst>(*f), 0u);
    EXPECT_EQ(kir::test::count_of<ir::AllocaInst>(*f), 0u);

    EXPECT_EQ(call_i32(compiled.ssa_module, "sum", {}).value->as_int(), 10);
    EXPECT_EQ(call_i32(compiled.allocated_module, "sum", {}).value->as_int(), 10);
    EXPECT_TRUE(compiled.allocations.contains("sum"));
}

TEST(PipelineTest, UnoptimizedCompileStillPromotesSlots) {
    auto result = compile_module(module_of("loops", sum_function()),
                                 PipelineConfig::for_level(ir::OptLevel::O0));
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).front().to_string();
    const auto& compiled = unwrap(result);

    EXPECT_EQ(compiled.stats.rounds, 0u);
    const auto* f = compiled.ssa_module.find_function("sum");
    EXPECT_EQ(kir::test::count_of<ir::AllocaInst>(*f), 0u);
    EXPECT_GT(kir::test::count_of<ir::PhiInst>(*f), 0u);
    EXPECT_EQ(call_i32(compiled.allocated_module, "sum", {}).value->as_int(), 10);
}

TEST(PipelineTest, LoweringErrorsStopTheCompile) {
    auto body = make_block({}, make_call("missing", {}, ty(TypeKind::I32)));
    auto result = compile_module(module_of("bad", func("f", {}, TypeKind::I32, std::move(body))),
                                 PipelineConfig{});
    ASSERT_TRUE(is_err(result));
    ASSERT_EQ(unwrap_err(result).size(), 1u);
    EXPECT_EQ(unwrap_err(result).front().stage, ir::Stage::Build);
    EXPECT_EQ(unwrap_err(result).front().message, "call to unknown function 'missing'");
}

TEST(PipelineTest, MalformedInputIsCaughtBeforeOptimizing) {
    ir::Module module;
    module.name = "raw";
    kir::test::FunctionBuilder fb("f", kir::test::i32());
    fb.ret(fb.add(ir::make_register(9, kir::test::i32()), kir::test::FunctionBuilder::i32(1)));
    kir::test::add_function(module, fb.finish());

    auto config = PipelineConfig::for_level(ir::OptLevel::O2);
    config.verify = true;
    auto result = compile_ir(std::move(module), config);
    ASSERT_TRUE(is_err(result));
    const auto& diag = unwrap_err(result).front();
    EXPECT_EQ(diag.kind, ir::DiagnosticKind::MalformedIr);
    ASSERT_FALSE(diag.notes.empty());
    EXPECT_EQ(diag.notes.back(), "after lowering");
}

// ============================================================================
// Hooks
// ============================================================================

TEST(PipelineTest, HooksRunAroundTheOptimizer) {
    auto pre = std::make_shared<TagHook>("linted");
    auto post = std::make_shared<TagHook>("checked");
    PipelineHooks hooks;
    hooks.pre_optimize.push_back(pre);
    hooks.post_optimize.push_back(post);

    auto result = compile_module(module_of("hooks", affine_function("f", 3)),
                                 PipelineConfig::for_level(ir::OptLevel::O2), hooks);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).front().to_string();

    // Each hook runs once, not once per fixpoint round
    EXPECT_EQ(pre->runs, 1);
    EXPECT_EQ(post->runs, 1);
    const auto* f = unwrap(result).ssa_module.find_function("f");
    EXPECT_TRUE(f->has_attribute("linted"));
    EXPECT_TRUE(f->has_attribute("checked"));
}

TEST(PipelineTest, HookDiagnosticsAbortTheCompile) {
    auto post = std::make_shared<TagHook>("never");
    PipelineHooks hooks;
    hooks.pre_optimize.push_back(std::make_shared<RejectHook>());
    hooks.post_optimize.push_back(post);

    auto result = compile_module(
        module_of("hooks", affine_function("f", 3), affine_function("g", 4)),
        PipelineConfig::for_level(ir::OptLevel::O1), hooks);
    ASSERT_TRUE(is_err(result));
    ASSERT_EQ(unwrap_err(result).size(), 2u);
    EXPECT_EQ(unwrap_err(result)[0].function, "f");
    EXPECT_EQ(unwrap_err(result)[1].function, "g");
    EXPECT_EQ(post->runs, 0);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST(PipelineTest, CancelDuringOptimization) {
    std::atomic<bool> cancel{true};
    auto config = PipelineConfig::for_level(ir::OptLevel::O2);
    config.passes.cancel = &cancel;

    auto result = compile_module(module_of("c", affine_function("f", 2)), config);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).front().stage, ir::Stage::Optimize);
    EXPECT_EQ(unwrap_err(result).front().message, "compilation cancelled");
}

TEST(PipelineTest, CancelBeforeRegisterAllocation) {
    // With no passes the optimizer never looks at the flag
    std::atomic<bool> cancel{true};
    auto config = PipelineConfig::for_level(ir::OptLevel::O0);
    config.passes.cancel = &cancel;

    auto result = compile_module(module_of("c", affine_function("f", 2)), config);
    ASSERT_TRUE(is_err(result));
    ASSERT_EQ(unwrap_err(result).size(), 1u);
    EXPECT_EQ(unwrap_err(result).front().stage, ir::Stage::Driver);
    EXPECT_EQ(unwrap_err(result).front().message,
              "compilation cancelled before register allocation");
}

// ============================================================================
// Register Allocation
// ============================================================================

TEST(PipelineTest, ParallelAllocationMatchesSerial) {
    ast::Module ast_module;
    ast_module.name = "many";
    for (int i = 0; i < 12; ++i) {
        ast_module.functions.push_back(affine_function("f" + std::to_string(i), i + 2));
    }

    auto serial_config = PipelineConfig::for_level(ir::OptLevel::O1);
    auto parallel_config = serial_config;
    parallel_config.jobs = 4;

    auto serial = compile_module(ast_module, serial_config);
    auto parallel = compile_module(ast_module, parallel_config);
    ASSERT_TRUE(is_ok(serial));
    ASSERT_TRUE(is_ok(parallel));

    EXPECT_EQ(ir::print_module(unwrap(serial).allocated_module),
              ir::print_module(unwrap(parallel).allocated_module));
    ASSERT_EQ(unwrap(parallel).allocations.size(), 12u);
    for (const auto& [name, allocation] : unwrap(serial).allocations) {
        const auto& other = unwrap(parallel).allocations.at(name);
        EXPECT_EQ(allocation.function, name);
        ASSERT_EQ(allocation.locations.size(), other.locations.size()) << name;
        for (const auto& [vreg, location] : allocation.locations) {
            EXPECT_EQ(location.to_string(), other.location(vreg).to_string()) << name;
        }
    }
}

TEST(PipelineTest, AllocationErrorsAreReportedInFunctionOrder) {
    auto built = ir::build_module(
        module_of("m", affine_function("first", 2), affine_function("second", 3)));
    ASSERT_TRUE(is_ok(built));
    auto module = std::move(unwrap(built));

    auto target = regalloc::TargetDesc::x86_64();
    target.gpr.allocatable.clear();
    target.gpr.scratch.clear();
    auto result = driver::allocate_module(module, target, 2);
    ASSERT_TRUE(is_err(result));
    ASSERT_EQ(unwrap_err(result).size(), 2u);
    EXPECT_EQ(unwrap_err(result)[0].function, "first");
    EXPECT_EQ(unwrap_err(result)[1].function, "second");
    EXPECT_EQ(unwrap_err(result)[0].kind, ir::DiagnosticKind::AllocationExhaustion);
}

// ============================================================================
// Backend Dispatch
// ============================================================================

TEST(PipelineTest, EmitsThroughBothBackends) {
    auto result = compile_module(module_of("out", affine_function("scale", 5)),
                                 PipelineConfig::for_level(ir::OptLevel::O2));
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).front().to_string();
    const auto& compiled = unwrap(result);

    auto direct = driver::emit(compiled, backend::BackendKind::Direct);
    ASSERT_TRUE(is_ok(direct)) << unwrap_err(direct).to_string();
    EXPECT_NE(unwrap(direct).find(".globl scale\n"), std::string::npos) << unwrap(direct);

    auto bridge = driver::emit(compiled, backend::BackendKind::Toolchain);
    ASSERT_TRUE(is_ok(bridge)) << unwrap_err(bridge).to_string();
    EXPECT_NE(unwrap(bridge).find("define i32 @scale(i32 %v0)"), std::string::npos)
        << unwrap(bridge);
    EXPECT_NE(unwrap(bridge).find("mul i32 %v0, 5"), std::string::npos) << unwrap(bridge);
}
