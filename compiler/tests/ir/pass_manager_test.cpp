// Pass Manager Tests
//
// Pipeline configuration per level, fixpoint rounds, cancellation, and
// verification between passes.

#include "ir/pass_manager.hpp"
#include "support/ir_fixtures.hpp"

#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>

using namespace kir;
using namespace kir::ir;
using kir::test::FunctionBuilder;

namespace {

// %a = add %x, 0; %b = mul %a, 1; ret %b
auto identity_module() -> Module {
    Module module;
    module.name = "identity";
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto a = fb.add(x, FunctionBuilder::i32(0));
    fb.ret(fb.mul(a, FunctionBuilder::i32(1)));
    kir::test::add_function(module, fb.finish());
    return module;
}

} // namespace

TEST(PassManagerConfigTest, StandardPipelines) {
    EXPECT_TRUE(PassManagerConfig::for_level(OptLevel::O0).passes.empty());
    EXPECT_EQ(PassManagerConfig::for_level(OptLevel::O1).passes,
              (std::vector<std::string>{"const-fold", "copy-prop", "dce"}));

    auto o2 = PassManagerConfig::for_level(OptLevel::O2).passes;
    EXPECT_NE(std::find(o2.begin(), o2.end(), "cse"), o2.end());
    EXPECT_NE(std::find(o2.begin(), o2.end(), "inline"), o2.end());
    EXPECT_EQ(std::find(o2.begin(), o2.end(), "loop-unroll"), o2.end());

    auto o3 = PassManagerConfig::for_level(OptLevel::O3).passes;
    EXPECT_NE(std::find(o3.begin(), o3.end(), "loop-unroll"), o3.end());
    EXPECT_STREQ(opt_level_name(OptLevel::O3), "O3");
}

TEST(PassManagerConfigTest, MakePassByName) {
    PassManagerConfig config;
    for (const char* name : {"const-fold", "dce", "copy-prop", "cse", "inline", "loop-unroll"}) {
        auto pass = make_pass(name, config);
        ASSERT_NE(pass, nullptr) << name;
        EXPECT_EQ(pass->name(), name);
    }
    EXPECT_EQ(make_pass("vectorize", config), nullptr);
}

TEST(PassManagerTest, RunsToFixpoint) {
    auto module = identity_module();
    PassManager manager(PassManagerConfig::for_level(OptLevel::O1));
    auto result = manager.run(module);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();

    const auto& stats = unwrap(result);
    // One round that changes things, one that confirms the fixpoint
    EXPECT_EQ(stats.rounds, 2u);
    EXPECT_EQ(stats.constants_folded, 2u);

    const auto& f = module.functions.front();
    ASSERT_EQ(f.instruction_count(), 1u);
    const auto* ret = f.blocks[0].instructions[0].as<RetInst>();
    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret->value->reg(), f.params[0].value_id);
}

TEST(PassManagerTest, EmptyPipelineDoesNothing) {
    auto module = identity_module();
    PassManager manager(PassManagerConfig::for_level(OptLevel::O0));
    auto result = manager.run(module);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).rounds, 0u);
    EXPECT_EQ(module.functions.front().instruction_count(), 3u);
}

TEST(PassManagerTest, RoundBudgetIsHonored) {
    auto module = identity_module();
    auto config = PassManagerConfig::for_level(OptLevel::O1);
    config.max_rounds = 1;
    PassManager manager(config);
    auto result = manager.run(module);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).rounds, 1u);
}

TEST(PassManagerTest, UnknownPassIsAnError) {
    auto module = identity_module();
    PassManagerConfig config;
    config.passes = {"const-fold", "magic"};
    PassManager manager(config);
    auto result = manager.run(module);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, DiagnosticKind::InternalCompilerError);
    EXPECT_EQ(unwrap_err(result).message, "unknown pass 'magic'");
}

TEST(PassManagerTest, CancelFlagStopsTheRun) {
    auto module = identity_module();
    std::atomic<bool> cancel{true};
    auto config = PassManagerConfig::for_level(OptLevel::O2);
    config.cancel = &cancel;
    PassManager manager(config);
    auto result = manager.run(module);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, DiagnosticKind::InternalCompilerError);
    EXPECT_EQ(unwrap_err(result).stage, Stage::Optimize);
    EXPECT_EQ(unwrap_err(result).message, "compilation cancelled");

    // Nothing ran
    EXPECT_EQ(module.functions.front().instruction_count(), 3u);
}

TEST(PassManagerTest, VerificationNamesTheChangingPass) {
    // A use of an undefined register survives folding and is caught after it
    Module module;
    module.name = "broken";
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto a = fb.add(x, FunctionBuilder::i32(0));
    auto bad = fb.add(make_register(77, kir::test::i32()), a);
    fb.ret(bad);
    kir::test::add_function(module, fb.finish());

    PassManagerConfig config;
    config.passes = {"const-fold"};
    config.verify_each_pass = true;
    PassManager manager(config);
    auto result = manager.run(module);
    ASSERT_TRUE(is_err(result));

    const auto& diag = unwrap_err(result);
    EXPECT_EQ(diag.kind, DiagnosticKind::MalformedIr);
    ASSERT_EQ(diag.notes.size(), 1u);
    EXPECT_EQ(diag.notes[0], "after pass 'const-fold' in round 1");
}

TEST(PassManagerTest, StatsAccumulate) {
    OptimizationStats a;
    a.constants_folded = 2;
    a.rounds = 1;
    OptimizationStats b;
    b.constants_folded = 3;
    b.calls_inlined = 1;
    a += b;
    EXPECT_EQ(a.constants_folded, 5u);
    EXPECT_EQ(a.calls_inlined, 1u);
    EXPECT_EQ(a.rounds, 1u);
}
