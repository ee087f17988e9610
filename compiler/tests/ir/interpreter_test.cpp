// Interpreter Tests
//
// Traps, budgets, memory and globals. The interpreter is the reference the
// optimizer tests compare against, so its own semantics are pinned here.

#include "ir/interpreter.hpp"
#include "support/ir_fixtures.hpp"

#include <cmath>
#include <gtest/gtest.h>

using namespace kir;
using namespace kir::ir;
using kir::test::FunctionBuilder;

class InterpreterTest : public ::testing::Test {
protected:
    Module module;

    void SetUp() override {
        module.name = "interp";
    }

    void add(FunctionBuilder& fb) {
        kir::test::add_function(module, fb.finish());
    }

    static auto int_arg(int64_t v) -> Value {
        return make_const_int(v, make_i32_type());
    }
};

TEST_F(InterpreterTest, ArithmeticAndBranches) {
    // max(a, b) * 2
    FunctionBuilder fb("f", kir::test::i32());
    auto a = fb.param("a", kir::test::i32());
    auto b = fb.param("b", kir::test::i32());
    auto left = fb.block("left");
    auto right = fb.block("right");
    auto join = fb.block("join");
    fb.jump_if(fb.cmp(CmpOp::Gt, a, b), left, right);
    fb.at(left);
    fb.jump(join);
    fb.at(right);
    fb.jump(join);
    fb.at(join);
    auto m = fb.phi(kir::test::i32(), {{left, a}, {right, b}});
    fb.ret(fb.mul(m, FunctionBuilder::i32(2)));
    add(fb);

    Interpreter interp(module);
    auto out = interp.call("f", {int_arg(3), int_arg(9)});
    ASSERT_EQ(out.status, ExecStatus::Returned) << out.message;
    EXPECT_EQ(out.value->as_int(), 18);
    EXPECT_GT(out.steps, 0u);

    EXPECT_EQ(interp.call("f", {int_arg(-1), int_arg(-4)}).value->as_int(), -2);
}

TEST_F(InterpreterTest, IntegerDivisionByZeroTraps) {
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    fb.ret(fb.div(FunctionBuilder::i32(10), x));
    add(fb);

    Interpreter interp(module);
    EXPECT_EQ(interp.call("f", {int_arg(5)}).value->as_int(), 2);

    auto out = interp.call("f", {int_arg(0)});
    EXPECT_EQ(out.status, ExecStatus::Trapped);
    EXPECT_EQ(out.trap, TrapKind::DivideByZero);
    EXPECT_FALSE(out.value.has_value());
}

TEST_F(InterpreterTest, FloatDivisionByZeroIsInfinite) {
    FunctionBuilder fb("f", kir::test::f64());
    auto x = fb.param("x", kir::test::f64());
    fb.ret(fb.div(FunctionBuilder::f64(1.0), x));
    add(fb);

    auto out = Interpreter(module).call("f", {make_const_float(0.0, make_f64_type())});
    ASSERT_EQ(out.status, ExecStatus::Returned) << out.message;
    EXPECT_TRUE(std::isinf(*out.value->as_float()));
}

TEST_F(InterpreterTest, UnrepresentableConversionTraps) {
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::f64());
    fb.ret(fb.emit(CastInst{CastKind::FpToSi, x}, kir::test::i32()));
    add(fb);

    Interpreter interp(module);
    EXPECT_EQ(interp.call("f", {make_const_float(41.9, make_f64_type())}).value->as_int(), 41);

    auto out = interp.call("f", {make_const_float(std::nan(""), make_f64_type())});
    EXPECT_EQ(out.trap, TrapKind::InvalidConversion);
}

TEST_F(InterpreterTest, TrapIntrinsicAndUnreachable) {
    FunctionBuilder trap("explicit", kir::test::void_type());
    trap.emit_void(IntrinsicInst{IntrinsicKind::Trap, {}});
    trap.ret();
    add(trap);

    FunctionBuilder dead("dead", kir::test::void_type());
    dead.emit_void(UnreachableInst{});
    add(dead);

    Interpreter interp(module);
    EXPECT_EQ(interp.call("explicit", {}).trap, TrapKind::Explicit);
    EXPECT_EQ(interp.call("dead", {}).trap, TrapKind::Unreachable);
}

TEST_F(InterpreterTest, NullLoadTraps) {
    FunctionBuilder fb("f", kir::test::i32());
    fb.ret(fb.load(make_const_null(), kir::test::i32()));
    add(fb);

    auto out = Interpreter(module).call("f", {});
    EXPECT_EQ(out.trap, TrapKind::NullAccess);
}

TEST_F(InterpreterTest, StepBudgetStopsInfiniteLoop) {
    FunctionBuilder fb("spin", kir::test::void_type());
    auto loop = fb.block("loop");
    fb.jump(loop);
    fb.at(loop);
    fb.jump(loop);
    add(fb);

    Interpreter interp(module, InterpreterOptions{1000, 16});
    auto out = interp.call("spin", {});
    EXPECT_EQ(out.status, ExecStatus::StepLimit);
    EXPECT_NE(out.message.find("step budget"), std::string::npos) << out.message;
}

TEST_F(InterpreterTest, CallDepthIsBounded) {
    FunctionBuilder fb("forever", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    fb.ret(fb.call("forever", {x}, kir::test::i32()));
    add(fb);

    Interpreter interp(module, InterpreterOptions{1'000'000, 8});
    auto out = interp.call("forever", {int_arg(1)});
    EXPECT_EQ(out.status, ExecStatus::StepLimit);
    EXPECT_NE(out.message.find("call depth"), std::string::npos) << out.message;
}

TEST_F(InterpreterTest, ExecutionErrors) {
    Function decl;
    decl.name = "ext";
    decl.return_type = kir::test::i32();
    kir::test::add_function(module, std::move(decl));

    FunctionBuilder fb("calls_ext", kir::test::i32());
    fb.ret(fb.call("ext", {}, kir::test::i32()));
    add(fb);

    Interpreter interp(module);
    EXPECT_EQ(interp.call("nope", {}).status, ExecStatus::Error);
    EXPECT_EQ(interp.call("calls_ext", {}).status, ExecStatus::Error);
    EXPECT_EQ(interp.call("calls_ext", {int_arg(1)}).status, ExecStatus::Error);
}

TEST_F(InterpreterTest, MemoryAndGlobals) {
    module.globals["counter"] = Global{"counter", make_i32_type(), Constant{ConstInt{5}}, false};
    module.globals["limit"] = Global{"limit", make_i32_type(), Constant{ConstInt{7}}, true};

    // counter += limit; returns the value of a local round-tripped through memory
    FunctionBuilder fb("bump", kir::test::i32());
    auto c = fb.load(make_global("counter"), kir::test::i32());
    auto l = fb.load(make_global("limit"), kir::test::i32());
    fb.store(make_global("counter"), fb.add(c, l));
    auto local = fb.alloca_slot(kir::test::i64(), "local");
    auto fresh = fb.load(local, kir::test::i64());
    fb.store(local, fb.add(fresh, FunctionBuilder::i64(40)));
    auto back = fb.load(local, kir::test::i64());
    fb.ret(fb.emit(CastInst{CastKind::Trunc, back}, kir::test::i32()));
    add(fb);

    Interpreter interp(module);
    EXPECT_EQ(interp.read_global("counter")->as_int(), 5);
    EXPECT_EQ(interp.call("bump", {}).value->as_int(), 40);
    EXPECT_EQ(interp.call("bump", {}).value->as_int(), 40);

    // Globals persist across calls on one interpreter
    EXPECT_EQ(interp.read_global("counter")->as_int(), 19);
    EXPECT_EQ(interp.read_global("limit")->as_int(), 7);
    EXPECT_FALSE(interp.read_global("missing").has_value());
}

TEST_F(InterpreterTest, SpillSlotsArePerFrame) {
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto slot_ptr = make_undef(kir::test::ptr());
    fb.emit_void(StoreInst{slot_ptr, x, false, 0u});
    auto reloaded = fb.emit(LoadInst{slot_ptr, false, 0u}, kir::test::i32());
    fb.ret(fb.add(reloaded, FunctionBuilder::i32(1)));
    add(fb);

    auto out = Interpreter(module).call("f", {int_arg(41)});
    ASSERT_EQ(out.status, ExecStatus::Returned) << out.message;
    EXPECT_EQ(out.value->as_int(), 42);
}

TEST_F(InterpreterTest, SameBehavior) {
    ExecOutcome a;
    a.value = make_const_int(1, make_i32_type());
    a.steps = 3;
    ExecOutcome b = a;
    b.steps = 9;
    EXPECT_TRUE(a.same_behavior(b));

    b.value = make_const_int(2, make_i32_type());
    EXPECT_FALSE(a.same_behavior(b));

    ExecOutcome t1;
    t1.status = ExecStatus::Trapped;
    t1.trap = TrapKind::DivideByZero;
    ExecOutcome t2 = t1;
    t2.message = "different text";
    EXPECT_TRUE(t1.same_behavior(t2));
    t2.trap = TrapKind::Explicit;
    EXPECT_FALSE(t1.same_behavior(t2));
    EXPECT_FALSE(t1.same_behavior(a));
}
