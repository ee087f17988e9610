// Optimization Pass Tests
//
// Each pass on small hand-built functions, then the passes together through
// the pass manager. Every rewrite is checked against the interpreter where
// the function has a result to compare.

#include "ir/interpreter.hpp"
#include "ir/pass_manager.hpp"
#include "ir/passes/common_subexpression_elimination.hpp"
#include "ir/passes/constant_folding.hpp"
#include "ir/passes/copy_propagation.hpp"
#include "ir/passes/dead_code_elimination.hpp"
#include "ir/passes/inlining.hpp"
#include "ir/passes/loop_unroll.hpp"
#include "ir/verifier.hpp"
#include "support/ir_fixtures.hpp"
#include "support/log_capture.hpp"

#include <cmath>
#include <gtest/gtest.h>

using namespace kir;
using namespace kir::ir;
using kir::test::count_of;
using kir::test::FunctionBuilder;

class PassTest : public ::testing::Test {
protected:
    Module module;

    void SetUp() override {
        module.name = "passes";
    }

    auto add(FunctionBuilder& fb) -> Function& {
        kir::test::add_function(module, fb.finish());
        return module.functions.back();
    }

    auto fn(const std::string& name) -> Function& {
        return *module.find_function(name);
    }

    void expect_valid() {
        auto result = verify_module(module);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "")
                                   << "\n"
                                   << print_module(module);
    }

    auto optimize(OptLevel level) -> OptimizationStats {
        PassManager manager(PassManagerConfig::for_level(level));
        auto result = manager.run(module);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        return is_ok(result) ? unwrap(result) : OptimizationStats{};
    }

    static auto ret_value(const Function& func) -> std::optional<Value> {
        for (const auto& block : func.blocks) {
            if (const auto* term = block.terminator()) {
                if (const auto* ret = term->as<RetInst>()) {
                    return ret->value;
                }
            }
        }
        return std::nullopt;
    }
};

// ============================================================================
// Constant Folding
// ============================================================================

TEST_F(PassTest, FoldsArithmeticChains) {
    FunctionBuilder fb("f", kir::test::i32());
    auto a = fb.add(FunctionBuilder::i32(2), FunctionBuilder::i32(3));
    auto b = fb.mul(a, FunctionBuilder::i32(4));
    auto c = fb.cmp(CmpOp::Gt, b, FunctionBuilder::i32(10));
    fb.ret(fb.emit(CastInst{CastKind::ZExt, c}, kir::test::i32()));
    add(fb);

    ConstantFoldingPass pass;
    EXPECT_TRUE(pass.run(module));
    EXPECT_EQ(fn("f").instruction_count(), 1u);
    EXPECT_EQ(ret_value(fn("f"))->as_int(), 1);
    EXPECT_EQ(pass.stats().constants_folded, 4u);
    EXPECT_FALSE(pass.run(module));
}

TEST_F(PassTest, IntegerOverflowWraps) {
    FunctionBuilder fb("f", kir::test::i32());
    fb.ret(fb.add(FunctionBuilder::i32(2147483647), FunctionBuilder::i32(1)));
    add(fb);

    ConstantFoldingPass pass;
    pass.run(module);
    EXPECT_EQ(ret_value(fn("f"))->as_int(), -2147483648LL);
}

TEST_F(PassTest, DivisionByZeroIsLeftToTrap) {
    FunctionBuilder fb("f", kir::test::i32());
    fb.ret(fb.div(FunctionBuilder::i32(7), FunctionBuilder::i32(0)));
    add(fb);

    ConstantFoldingPass fold;
    DeadCodeEliminationPass dce;
    EXPECT_FALSE(fold.run(module));
    EXPECT_FALSE(dce.run(module));
    EXPECT_EQ(count_of<BinaryInst>(fn("f")), 1u);

    auto outcome = Interpreter(module).call("f", {});
    EXPECT_EQ(outcome.status, ExecStatus::Trapped);
    EXPECT_EQ(outcome.trap, TrapKind::DivideByZero);
}

TEST_F(PassTest, FloatDivisionByZeroFolds) {
    FunctionBuilder fb("f", kir::test::f64());
    fb.ret(fb.div(FunctionBuilder::f64(1.0), FunctionBuilder::f64(0.0)));
    add(fb);

    ConstantFoldingPass pass;
    EXPECT_TRUE(pass.run(module));
    auto value = ret_value(fn("f"));
    ASSERT_TRUE(value && value->as_float());
    EXPECT_TRUE(std::isinf(*value->as_float()));
}

TEST_F(PassTest, FoldsPureIntrinsics) {
    FunctionBuilder fb("f", kir::test::f64());
    auto m = fb.intrinsic(IntrinsicKind::Max, {FunctionBuilder::f64(3.0), FunctionBuilder::f64(16.0)},
                          kir::test::f64());
    fb.ret(fb.intrinsic(IntrinsicKind::Sqrt, {m}, kir::test::f64()));
    add(fb);

    ConstantFoldingPass pass;
    pass.run(module);
    EXPECT_EQ(count_of<IntrinsicInst>(fn("f")), 0u);
    EXPECT_EQ(ret_value(fn("f"))->as_float(), 4.0);
}

TEST_F(PassTest, TrapIntrinsicIsNeverFolded) {
    FunctionBuilder fb("f", kir::test::void_type());
    fb.emit_void(IntrinsicInst{IntrinsicKind::Trap, {}});
    fb.emit_void(UnreachableInst{});
    add(fb);

    ConstantFoldingPass fold;
    DeadCodeEliminationPass dce;
    fold.run(module);
    dce.run(module);
    EXPECT_EQ(count_of<IntrinsicInst>(fn("f")), 1u);
}

TEST_F(PassTest, ConstantBranchesBecomeJumps) {
    FunctionBuilder fb("f", kir::test::i32());
    auto then_bb = fb.block("then");
    auto else_bb = fb.block("else");
    auto c = fb.cmp(CmpOp::Lt, FunctionBuilder::i32(1), FunctionBuilder::i32(2));
    fb.jump_if(c, then_bb, else_bb);
    fb.at(then_bb);
    fb.ret(FunctionBuilder::i32(10));
    fb.at(else_bb);
    fb.ret(FunctionBuilder::i32(20));
    add(fb);

    ConstantFoldingPass pass;
    EXPECT_TRUE(pass.run(module));
    const auto& f = fn("f");
    EXPECT_EQ(count_of<JumpIfInst>(f), 0u);
    EXPECT_EQ(f.get_block(else_bb), nullptr);
    EXPECT_EQ(ret_value(f)->as_int(), 10);
    expect_valid();
}

TEST_F(PassTest, IdentitiesBecomeCopies) {
    // Scenario: %a = add %x, 0; %b = mul %a, 1; ret %b
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto a = fb.add(x, FunctionBuilder::i32(0));
    auto b = fb.mul(a, FunctionBuilder::i32(1));
    fb.ret(b);
    add(fb);

    ConstantFoldingPass fold;
    EXPECT_TRUE(fold.run(module));
    EXPECT_EQ(count_of<CopyInst>(fn("f")), 2u);

    CopyPropagationPass copies;
    EXPECT_TRUE(copies.run(module));
    DeadCodeEliminationPass dce;
    dce.run(module);

    const auto& f = fn("f");
    EXPECT_EQ(f.instruction_count(), 1u);
    EXPECT_EQ(ret_value(f)->reg(), x.reg());
    expect_valid();
}

// ============================================================================
// Copy Propagation
// ============================================================================

TEST_F(PassTest, CopyChainsResolveTransitively) {
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto c1 = fb.copy(x);
    auto c2 = fb.copy(c1);
    fb.ret(fb.add(c2, c2));
    add(fb);

    CopyPropagationPass pass;
    EXPECT_TRUE(pass.run(module));
    const auto& f = fn("f");
    EXPECT_EQ(count_of<CopyInst>(f), 0u);
    const auto* sum = f.blocks[0].instructions[0].as<BinaryInst>();
    ASSERT_NE(sum, nullptr);
    EXPECT_EQ(sum->lhs.reg(), x.reg());
    EXPECT_EQ(sum->rhs.reg(), x.reg());
}

TEST_F(PassTest, TrivialPhisCollapse) {
    FunctionBuilder fb("f", kir::test::i32());
    auto c = fb.param("c", kir::test::boolean());
    auto x = fb.param("x", kir::test::i32());
    auto left = fb.block("left");
    auto right = fb.block("right");
    auto merge = fb.block("merge");
    fb.jump_if(c, left, right);
    fb.at(left);
    fb.jump(merge);
    fb.at(right);
    fb.jump(merge);
    fb.at(merge);
    fb.ret(fb.phi(kir::test::i32(), {{left, x}, {right, x}}));
    add(fb);

    CopyPropagationPass pass;
    EXPECT_TRUE(pass.run(module));
    EXPECT_EQ(count_of<PhiInst>(fn("f")), 0u);
    EXPECT_EQ(ret_value(fn("f"))->reg(), x.reg());
    expect_valid();
}

// ============================================================================
// Common Subexpression Elimination
// ============================================================================

TEST_F(PassTest, IdenticalAddsCollapse) {
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto y = fb.param("y", kir::test::i32());
    auto a = fb.add(x, y);
    auto b = fb.add(x, y);
    fb.ret(fb.mul(a, b));
    add(fb);

    CommonSubexpressionEliminationPass cse;
    EXPECT_TRUE(cse.run(module));
    DeadCodeEliminationPass dce;
    dce.run(module);

    const auto& f = fn("f");
    EXPECT_EQ(count_of<BinaryInst>(f), 2u);
    const InstructionData* mul = nullptr;
    for (const auto& inst : f.blocks[0].instructions) {
        if (const auto* bin = inst.as<BinaryInst>(); bin && bin->op == BinOp::Mul) {
            mul = &inst;
        }
    }
    ASSERT_NE(mul, nullptr);
    EXPECT_EQ(mul->as<BinaryInst>()->lhs.reg(), a.reg());
    EXPECT_EQ(mul->as<BinaryInst>()->rhs.reg(), a.reg());
    EXPECT_EQ(cse.stats().subexpressions_eliminated, 1u);
    expect_valid();
}

TEST_F(PassTest, CommutedOperandsMatch) {
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto y = fb.param("y", kir::test::i32());
    auto a = fb.mul(x, y);
    auto b = fb.mul(y, x);
    fb.ret(fb.sub(a, b));
    add(fb);

    CommonSubexpressionEliminationPass cse;
    EXPECT_TRUE(cse.run(module));
}

TEST_F(PassTest, NonCommutativeOperandsDoNotMatch) {
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto y = fb.param("y", kir::test::i32());
    auto a = fb.sub(x, y);
    auto b = fb.sub(y, x);
    fb.ret(fb.add(a, b));
    add(fb);

    CommonSubexpressionEliminationPass cse;
    EXPECT_FALSE(cse.run(module));
}

TEST_F(PassTest, CallsAndLoadsAreNotMerged) {
    FunctionBuilder fb("f", kir::test::i32());
    auto p = fb.param("p", kir::test::ptr());
    auto l1 = fb.load(p, kir::test::i32());
    auto l2 = fb.load(p, kir::test::i32());
    auto c1 = fb.call("tick", {}, kir::test::i32());
    auto c2 = fb.call("tick", {}, kir::test::i32());
    fb.ret(fb.add(fb.add(l1, l2), fb.add(c1, c2)));
    add(fb);

    CommonSubexpressionEliminationPass cse;
    EXPECT_FALSE(cse.run(module));
    EXPECT_EQ(count_of<LoadInst>(fn("f")), 2u);
    EXPECT_EQ(count_of<CallInst>(fn("f")), 2u);
}

TEST_F(PassTest, DominatingExpressionIsReused) {
    FunctionBuilder fb("f", kir::test::i32());
    auto c = fb.param("c", kir::test::boolean());
    auto x = fb.param("x", kir::test::i32());
    auto a = fb.add(x, FunctionBuilder::i32(5));
    auto then_bb = fb.block("then");
    auto exit = fb.block("exit");
    fb.jump_if(c, then_bb, exit);
    fb.at(then_bb);
    auto b = fb.add(x, FunctionBuilder::i32(5));
    fb.ret(b);
    fb.at(exit);
    fb.ret(a);
    add(fb);

    CommonSubexpressionEliminationPass cse;
    EXPECT_TRUE(cse.run(module));
    const auto* ret = fn("f").get_block(then_bb)->terminator()->as<RetInst>();
    EXPECT_EQ(ret->value->reg(), a.reg());
    expect_valid();
}

// ============================================================================
// Dead Code Elimination
// ============================================================================

TEST_F(PassTest, RemovesUnusedPureWork) {
    FunctionBuilder helper("square", kir::test::i32());
    auto v = helper.param("v", kir::test::i32());
    helper.ret(helper.mul(v, v));
    add(helper);

    Function ext;
    ext.name = "log_value";
    ext.return_type = kir::test::i32();
    ext.add_param("v", kir::test::i32());
    kir::test::add_function(module, std::move(ext));

    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto slot = fb.param("out", kir::test::ptr());
    fb.add(x, FunctionBuilder::i32(1));                        // unused
    fb.call("square", {x}, kir::test::i32());                  // pure, unused
    fb.call("log_value", {x}, kir::test::i32());               // impure, unused
    fb.div(x, x);                                              // may trap
    fb.store(slot, x);
    fb.ret(x);
    add(fb);

    DeadCodeEliminationPass dce;
    EXPECT_TRUE(dce.run(module));
    const auto& f = fn("f");
    EXPECT_EQ(count_of<CallInst>(f), 1u);
    EXPECT_EQ(count_of<BinaryInst>(f), 1u);
    EXPECT_EQ(count_of<StoreInst>(f), 1u);
    EXPECT_EQ(dce.stats().instructions_removed, 2u);

    // Idempotent once the function is clean
    EXPECT_FALSE(dce.run(module));
}

TEST_F(PassTest, RemovesDeadPhiCycles) {
    FunctionBuilder fb("f", kir::test::i32());
    auto n = fb.param("n", kir::test::i32());
    auto header = fb.block("header");
    auto body = fb.block("body");
    auto exit = fb.block("exit");
    fb.jump(header);

    fb.at(header);
    auto i = fb.phi(kir::test::i32(), {});
    auto junk = fb.phi(kir::test::i32(), {});
    auto more = fb.cmp(CmpOp::Lt, i, n);
    fb.jump_if(more, body, exit);

    fb.at(body);
    auto next = fb.add(i, FunctionBuilder::i32(1));
    auto junk_next = fb.add(junk, FunctionBuilder::i32(2));
    fb.jump(header);

    fb.at(exit);
    fb.ret(i);

    auto& phis = fb.function().get_block(header)->instructions;
    phis[0].as<PhiInst>()->incoming = {{fb.entry(), FunctionBuilder::i32(0)}, {body, next}};
    phis[1].as<PhiInst>()->incoming = {{fb.entry(), FunctionBuilder::i32(0)}, {body, junk_next}};
    add(fb);
    expect_valid();

    DeadCodeEliminationPass dce;
    EXPECT_TRUE(dce.run(module));
    EXPECT_EQ(count_of<PhiInst>(fn("f")), 1u);
    EXPECT_EQ(count_of<BinaryInst>(fn("f")), 1u);
    expect_valid();
}

// ============================================================================
// Purity
// ============================================================================

TEST_F(PassTest, PurityAnalysis) {
    module.globals["g"] = Global{"g", make_i32_type(), Constant{ConstInt{0}}, false};

    FunctionBuilder pure_fn("pure_fn", kir::test::i32());
    auto a = pure_fn.param("a", kir::test::i32());
    auto local = pure_fn.alloca_slot(kir::test::i32());
    pure_fn.store(local, a);
    pure_fn.ret(pure_fn.load(local, kir::test::i32()));
    add(pure_fn);

    FunctionBuilder writes("writes", kir::test::void_type());
    writes.store(make_global("g"), FunctionBuilder::i32(1));
    writes.ret();
    add(writes);

    FunctionBuilder caller("caller", kir::test::void_type());
    caller.call_void("writes", {});
    caller.ret();
    add(caller);

    FunctionBuilder recursive("recursive", kir::test::i32());
    auto r = recursive.param("r", kir::test::i32());
    recursive.ret(recursive.call("recursive", {r}, kir::test::i32()));
    add(recursive);

    Function trusted;
    trusted.name = "trusted";
    trusted.return_type = kir::test::f64();
    trusted.attributes = {"pure"};
    kir::test::add_function(module, std::move(trusted));

    Function unknown;
    unknown.name = "unknown";
    unknown.return_type = kir::test::f64();
    kir::test::add_function(module, std::move(unknown));

    PurityAnalysis purity(module);
    EXPECT_TRUE(purity.is_pure("pure_fn"));
    EXPECT_FALSE(purity.is_pure("writes"));
    EXPECT_FALSE(purity.is_pure("caller"));
    EXPECT_FALSE(purity.is_pure("recursive"));
    EXPECT_TRUE(purity.is_pure("trusted"));
    EXPECT_FALSE(purity.is_pure("unknown"));
    EXPECT_FALSE(purity.is_pure("missing"));

    Instruction pure_call = CallInst{"pure_fn", {}};
    EXPECT_FALSE(has_side_effects(pure_call, &purity));
    EXPECT_TRUE(has_side_effects(pure_call));
}

// ============================================================================
// Inlining
// ============================================================================

TEST_F(PassTest, InlinesSmallCallee) {
    FunctionBuilder callee("twice", kir::test::i32());
    auto v = callee.param("v", kir::test::i32());
    callee.ret(callee.add(v, v));
    add(callee);

    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto r = fb.call("twice", {x}, kir::test::i32());
    fb.ret(fb.add(r, FunctionBuilder::i32(1)));
    add(fb);

    Module original = module;
    InliningPass pass;
    EXPECT_TRUE(pass.run(module));
    EXPECT_EQ(count_of<CallInst>(fn("f")), 0u);
    EXPECT_EQ(pass.stats().calls_inlined, 1u);
    expect_valid();

    auto arg = std::vector<Value>{make_const_int(20, make_i32_type())};
    auto before = Interpreter(original).call("f", arg);
    auto after = Interpreter(module).call("f", arg);
    EXPECT_TRUE(before.same_behavior(after));
    EXPECT_EQ(after.value->as_int(), 41);
}

TEST_F(PassTest, MultipleReturnsMergeThroughPhi) {
    FunctionBuilder callee("clamp", kir::test::i32());
    auto v = callee.param("v", kir::test::i32());
    auto neg = callee.block("neg");
    auto pos = callee.block("pos");
    callee.jump_if(callee.cmp(CmpOp::Lt, v, FunctionBuilder::i32(0)), neg, pos);
    callee.at(neg);
    callee.ret(FunctionBuilder::i32(0));
    callee.at(pos);
    callee.ret(v);
    add(callee);

    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    fb.ret(fb.call("clamp", {x}, kir::test::i32()));
    add(fb);

    InliningPass pass;
    EXPECT_TRUE(pass.run(module));
    EXPECT_EQ(count_of<PhiInst>(fn("f")), 1u);
    expect_valid();

    Interpreter interp(module);
    EXPECT_EQ(interp.call("f", {make_const_int(-5, make_i32_type())}).value->as_int(), 0);
    EXPECT_EQ(interp.call("f", {make_const_int(6, make_i32_type())}).value->as_int(), 6);
}

TEST_F(PassTest, RespectsNoinlineAndThreshold) {
    FunctionBuilder small("small", kir::test::i32());
    auto s = small.param("s", kir::test::i32());
    small.attribute("noinline");
    small.ret(small.add(s, s));
    add(small);

    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    fb.ret(fb.call("small", {x}, kir::test::i32()));
    add(fb);

    InliningPass pass(InliningOptions{1, 4});
    EXPECT_FALSE(pass.run(module));
    EXPECT_EQ(pass.decide(fn("small"), {fn("f").id}), InlineDecision::NeverInline);

    fn("small").attributes.clear();
    EXPECT_EQ(pass.decide(fn("small"), {fn("f").id}), InlineDecision::TooLarge);
    fn("small").attributes.push_back("inline");
    EXPECT_EQ(pass.decide(fn("small"), {fn("f").id}), InlineDecision::Inline);
    EXPECT_EQ(pass.decide(fn("small"), {0, 1, 2, 3, 4, 5}), InlineDecision::Recursive);
}

TEST_F(PassTest, ChainDepthIsBounded) {
    FunctionBuilder leaf("leaf", kir::test::i32());
    leaf.ret(FunctionBuilder::i32(1));
    add(leaf);
    InliningPass pass(InliningOptions{10, 2});
    EXPECT_EQ(pass.decide(fn("leaf"), {10, 11, 12}), InlineDecision::ChainTooDeep);
    EXPECT_EQ(pass.decide(fn("leaf"), {10, 11}), InlineDecision::Inline);
}

TEST_F(PassTest, RecursiveCallIsRefusedAndLogged) {
    kir::test::LogCapture capture(kir::log::LogLevel::Debug);

    // fn fact(n) = n < 2 ? 1 : n * fact(n - 1)
    FunctionBuilder fb("fact", kir::test::i32());
    auto n = fb.param("n", kir::test::i32());
    auto base = fb.block("base");
    auto rec = fb.block("rec");
    fb.jump_if(fb.cmp(CmpOp::Lt, n, FunctionBuilder::i32(2)), base, rec);
    fb.at(base);
    fb.ret(FunctionBuilder::i32(1));
    fb.at(rec);
    auto sub = fb.call("fact", {fb.sub(n, FunctionBuilder::i32(1))}, kir::test::i32());
    fb.ret(fb.mul(n, sub));
    add(fb);

    InliningPass pass;
    EXPECT_FALSE(pass.run(module));
    EXPECT_EQ(count_of<CallInst>(fn("fact")), 1u);
    EXPECT_TRUE(capture.contains("opt", "inline: refusing call to 'fact' in 'fact': recursive"));
}

TEST_F(PassTest, RecursiveCalleeInlinedOneLevel) {
    kir::test::LogCapture capture(kir::log::LogLevel::Debug);

    FunctionBuilder rec("down", kir::test::i32());
    auto n = rec.param("n", kir::test::i32());
    auto base = rec.block("base");
    auto step = rec.block("step");
    rec.jump_if(rec.cmp(CmpOp::Le, n, FunctionBuilder::i32(0)), base, step);
    rec.at(base);
    rec.ret(FunctionBuilder::i32(0));
    rec.at(step);
    rec.ret(rec.call("down", {rec.sub(n, FunctionBuilder::i32(1))}, kir::test::i32()));
    add(rec);

    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    fb.ret(fb.call("down", {x}, kir::test::i32()));
    add(fb);

    InliningPass pass;
    EXPECT_TRUE(pass.run(module));
    // The clone's own call stays a call
    EXPECT_EQ(count_of<CallInst>(fn("f")), 1u);
    EXPECT_TRUE(capture.contains("opt", "refusing call to 'down' in 'f': recursive"));
    expect_valid();

    // Rounds later do not unfold further
    EXPECT_FALSE(pass.run(module));
    EXPECT_EQ(Interpreter(module).call("f", {make_const_int(5, make_i32_type())}).value->as_int(), 0);
}

// ============================================================================
// Loop Unrolling
// ============================================================================

namespace {

// s = 0; for (i = START; i < BOUND; i += 1) s += i; return s  (phi form)
void build_sum_loop(FunctionBuilder& fb, int64_t start, int64_t bound) {
    auto header = fb.block("header");
    auto body = fb.block("body");
    auto exit = fb.block("exit");
    fb.jump(header);

    fb.at(header);
    auto i = fb.phi(kir::test::i32(), {});
    auto s = fb.phi(kir::test::i32(), {});
    fb.jump_if(fb.cmp(CmpOp::Lt, i, FunctionBuilder::i32(bound)), body, exit);

    fb.at(body);
    auto s_next = fb.add(s, i);
    auto i_next = fb.add(i, FunctionBuilder::i32(1));
    fb.jump(header);

    fb.at(exit);
    fb.ret(s);

    auto& phis = fb.function().get_block(header)->instructions;
    phis[0].as<PhiInst>()->incoming = {{fb.entry(), FunctionBuilder::i32(start)}, {body, i_next}};
    phis[1].as<PhiInst>()->incoming = {{fb.entry(), FunctionBuilder::i32(0)}, {body, s_next}};
}

} // namespace

TEST_F(PassTest, UnrollsKnownTripCount) {
    FunctionBuilder fb("sum", kir::test::i32());
    build_sum_loop(fb, 1, 5);
    add(fb);
    expect_valid();

    LoopUnrollPass unroll;
    EXPECT_TRUE(unroll.run(module));
    EXPECT_EQ(unroll.stats().loops_unrolled, 1u);
    expect_valid();
    EXPECT_EQ(Interpreter(module).call("sum", {}).value->as_int(), 10);

    // Folding finishes the job: straight-line code returning 10
    PassManager manager(PassManagerConfig::for_level(OptLevel::O1));
    ASSERT_TRUE(is_ok(manager.run(module)));
    EXPECT_EQ(count_of<PhiInst>(fn("sum")), 0u);
    EXPECT_EQ(count_of<BinaryInst>(fn("sum")), 0u);
    EXPECT_EQ(ret_value(fn("sum"))->as_int(), 10);
}

TEST_F(PassTest, LongLoopsStayRolled) {
    FunctionBuilder fb("sum", kir::test::i32());
    build_sum_loop(fb, 0, 100);
    add(fb);

    LoopUnrollPass unroll(LoopUnrollOptions{8, 256});
    EXPECT_FALSE(unroll.run(module));
    EXPECT_EQ(count_of<PhiInst>(fn("sum")), 2u);
}

TEST_F(PassTest, ZeroTripLoopUnrollsToExit) {
    FunctionBuilder fb("sum", kir::test::i32());
    build_sum_loop(fb, 5, 5);
    add(fb);

    LoopUnrollPass unroll;
    EXPECT_TRUE(unroll.run(module));
    expect_valid();
    EXPECT_EQ(Interpreter(module).call("sum", {}).value->as_int(), 0);
}

// ============================================================================
// Whole Pipeline
// ============================================================================

TEST_F(PassTest, O3PipelinePreservesBehavior) {
    FunctionBuilder callee("scale", kir::test::i32());
    auto v = callee.param("v", kir::test::i32());
    callee.ret(callee.mul(v, FunctionBuilder::i32(3)));
    add(callee);

    FunctionBuilder fb("sum", kir::test::i32());
    build_sum_loop(fb, 1, 5);
    add(fb);

    FunctionBuilder top("top", kir::test::i32());
    auto x = top.param("x", kir::test::i32());
    auto total = top.call("sum", {}, kir::test::i32());
    auto scaled = top.call("scale", {x}, kir::test::i32());
    top.ret(top.add(total, scaled));
    add(top);

    Module original = module;
    auto stats = optimize(OptLevel::O3);
    EXPECT_GE(stats.calls_inlined, 1u);
    // sum's loop is unrolled in sum and again in the copy inlined into top
    EXPECT_EQ(stats.loops_unrolled, 2u);
    expect_valid();

    for (int64_t arg : {0, 7, -3}) {
        auto args = std::vector<Value>{make_const_int(arg, make_i32_type())};
        auto before = Interpreter(original).call("top", args);
        auto after = Interpreter(module).call("top", args);
        EXPECT_TRUE(before.same_behavior(after)) << "x = " << arg;
        EXPECT_EQ(after.value->as_int(), 10 + 3 * arg);
    }
}
