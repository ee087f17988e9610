// Verifier Tests
//
// One malformed function per invariant; each must be rejected with a
// MalformedIr diagnostic that names the function and the problem.

#include "ir/verifier.hpp"
#include "support/ir_fixtures.hpp"

#include <gtest/gtest.h>

using namespace kir;
using namespace kir::ir;
using kir::test::FunctionBuilder;

class VerifierTest : public ::testing::Test {
protected:
    Module module;

    void SetUp() override {
        module.name = "verify";
    }

    // Verifies `func` inside the fixture module and returns the diagnostic
    auto reject(Function func) -> Diagnostic {
        auto name = func.name;
        kir::test::add_function(module, std::move(func));
        auto result = verify_module(module);
        EXPECT_TRUE(is_err(result)) << print_module(module);
        if (is_ok(result)) {
            return make_diagnostic(DiagnosticKind::InternalCompilerError, Stage::Verify, name,
                                   "verified");
        }
        auto diag = unwrap_err(result);
        EXPECT_EQ(diag.kind, DiagnosticKind::MalformedIr);
        EXPECT_EQ(diag.stage, Stage::Verify);
        EXPECT_EQ(diag.function, name);
        return diag;
    }

    static auto contains(const Diagnostic& diag, const std::string& text) -> bool {
        return diag.message.find(text) != std::string::npos;
    }
};

TEST_F(VerifierTest, AcceptsWellFormedDiamond) {
    FunctionBuilder fb("select", kir::test::i32());
    auto c = fb.param("c", kir::test::boolean());
    auto x = fb.param("x", kir::test::i32());
    auto then_bb = fb.block("then");
    auto else_bb = fb.block("else");
    auto merge = fb.block("merge");
    fb.jump_if(c, then_bb, else_bb);
    fb.at(then_bb);
    auto a = fb.add(x, FunctionBuilder::i32(1));
    fb.jump(merge);
    fb.at(else_bb);
    auto b = fb.sub(x, FunctionBuilder::i32(1));
    fb.jump(merge);
    fb.at(merge);
    auto p = fb.phi(kir::test::i32(), {{then_bb, a}, {else_bb, b}});
    fb.ret(p);
    kir::test::add_function(module, fb.finish());

    auto result = verify_module(module);
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
}

TEST_F(VerifierTest, DeclarationsAreSkipped) {
    Function decl;
    decl.name = "ext";
    decl.return_type = kir::test::i32();
    kir::test::add_function(module, std::move(decl));
    EXPECT_TRUE(is_ok(verify_module(module)));
}

TEST_F(VerifierTest, MissingTerminator) {
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    fb.add(x, x);
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "bb0 has no terminator")) << diag.message;
}

TEST_F(VerifierTest, TerminatorInMiddle) {
    FunctionBuilder fb("f", kir::test::void_type());
    fb.ret();
    fb.ret();
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "is a terminator in the middle of the block")) << diag.message;
}

TEST_F(VerifierTest, JumpToMissingBlock) {
    FunctionBuilder fb("f", kir::test::void_type());
    fb.jump(9);
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "names missing block bb9")) << diag.message;
}

TEST_F(VerifierTest, EntryBlockHasNoPredecessors) {
    // A loop whose header is the entry block
    FunctionBuilder fb("spin", kir::test::void_type());
    auto n = fb.param("n", kir::test::boolean());
    auto done = fb.block("done");
    fb.jump_if(n, fb.entry(), done);
    fb.at(done);
    fb.ret();
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "branches to the entry block")) << diag.message;
}

TEST_F(VerifierTest, StalePredecessorList) {
    FunctionBuilder fb("f", kir::test::void_type());
    auto a = fb.block("a");
    auto b = fb.block("b");
    fb.jump(a);
    fb.at(a);
    fb.ret();
    fb.at(b);
    fb.ret();
    auto func = fb.finish();

    // Retarget without rebuilding the CFG
    retarget_successor(func.blocks[0].instructions.back().inst, a, b);
    auto diag = reject(std::move(func));
    EXPECT_TRUE(contains(diag, "predecessor list does not match the terminators")) << diag.message;
}

TEST_F(VerifierTest, PhiOperandsMustMatchPredecessors) {
    FunctionBuilder fb("f", kir::test::i32());
    auto next = fb.block("next");
    fb.jump(next);
    fb.at(next);
    auto p = fb.phi(kir::test::i32(), {{fb.entry(), FunctionBuilder::i32(1)}, {next, FunctionBuilder::i32(2)}});
    fb.ret(p);
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "operands do not match the block's predecessors")) << diag.message;
}

TEST_F(VerifierTest, PhiAfterNonPhi) {
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto next = fb.block("next");
    fb.jump(next);
    fb.at(next);
    fb.add(x, x);
    auto p = fb.phi(kir::test::i32(), {{fb.entry(), x}});
    fb.ret(p);
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "follows a non-phi instruction")) << diag.message;
}

TEST_F(VerifierTest, UndefinedRegister) {
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto y = fb.add(x, make_register(42, kir::test::i32()));
    fb.ret(y);
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "uses undefined register %42")) << diag.message;
}

TEST_F(VerifierTest, DefinitionMustDominateUse) {
    FunctionBuilder fb("f", kir::test::i32());
    auto c = fb.param("c", kir::test::boolean());
    auto x = fb.param("x", kir::test::i32());
    auto then_bb = fb.block("then");
    auto merge = fb.block("merge");
    fb.jump_if(c, then_bb, merge);
    fb.at(then_bb);
    auto v = fb.add(x, FunctionBuilder::i32(1));
    fb.jump(merge);
    fb.at(merge);
    fb.ret(v);
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "which does not dominate the use")) << diag.message;
}

TEST_F(VerifierTest, BinaryOperandTypes) {
    FunctionBuilder fb("f", kir::test::i32());
    auto x = fb.param("x", kir::test::i32());
    auto y = fb.add(x, FunctionBuilder::i64(1));
    fb.ret(y);
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "operand types differ from result type i32")) << diag.message;
}

TEST_F(VerifierTest, BranchConditionMustBeBool) {
    FunctionBuilder fb("f", kir::test::void_type());
    auto x = fb.param("x", kir::test::i32());
    auto exit = fb.block("exit");
    fb.jump_if(x, exit, exit);
    fb.at(exit);
    fb.ret();
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "condition is not bool")) << diag.message;
}

TEST_F(VerifierTest, ReturnTypeChecked) {
    FunctionBuilder fb("f", kir::test::void_type());
    fb.ret(FunctionBuilder::i32(0));
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "returns a value from a void function")) << diag.message;
}

TEST_F(VerifierTest, CallToUnknownFunction) {
    FunctionBuilder fb("f", kir::test::i32());
    auto r = fb.call("g", {}, kir::test::i32());
    fb.ret(r);
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "call to unknown function @g")) << diag.message;
}

TEST_F(VerifierTest, CallArityChecked) {
    Function callee;
    callee.name = "two";
    callee.return_type = kir::test::i32();
    callee.add_param("a", kir::test::i32());
    callee.add_param("b", kir::test::i32());
    kir::test::add_function(module, std::move(callee));

    FunctionBuilder fb("f", kir::test::i32());
    auto r = fb.call("two", {FunctionBuilder::i32(1)}, kir::test::i32());
    fb.ret(r);
    auto diag = reject(fb.finish());
    EXPECT_TRUE(contains(diag, "call passes 1 arguments, @two takes 2")) << diag.message;
}

TEST_F(VerifierTest, DiagnosticRendering) {
    FunctionBuilder fb("render", kir::test::void_type());
    fb.jump(7);
    auto diag = reject(fb.finish());
    auto text = diag.to_string();
    EXPECT_NE(text.find("'render'"), std::string::npos) << text;
    EXPECT_NE(text.find("bb7"), std::string::npos) << text;
}
