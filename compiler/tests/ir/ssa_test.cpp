// SSA Construction and CFG Analysis Tests
//
// Dominators, frontiers and natural loops on small hand-built CFGs, then
// slot promotion: phi placement, load replacement, and the slots that must
// stay in memory.

#include "ir/cfg.hpp"
#include "ir/interpreter.hpp"
#include "ir/ssa.hpp"
#include "ir/verifier.hpp"
#include "support/ir_fixtures.hpp"

#include <gtest/gtest.h>

using namespace kir;
using namespace kir::ir;
using kir::test::count_of;
using kir::test::FunctionBuilder;

namespace {

// entry -> then/else -> merge; `v` is stored in both branches and read in merge
struct Diamond {
    Function func;
    BlockId then_bb;
    BlockId else_bb;
    BlockId merge;
};

auto make_diamond() -> Diamond {
    FunctionBuilder fb("diamond", kir::test::i32());
    auto c = fb.param("c", kir::test::boolean());
    auto slot = fb.alloca_slot(kir::test::i32(), "v");
    auto then_bb = fb.block("then");
    auto else_bb = fb.block("else");
    auto merge = fb.block("merge");
    fb.jump_if(c, then_bb, else_bb);
    fb.at(then_bb);
    fb.store(slot, FunctionBuilder::i32(1));
    fb.jump(merge);
    fb.at(else_bb);
    fb.store(slot, FunctionBuilder::i32(2));
    fb.jump(merge);
    fb.at(merge);
    auto v = fb.load(slot, kir::test::i32());
    fb.ret(v);
    return Diamond{fb.finish(), then_bb, else_bb, merge};
}

// entry -> header <-> body, header -> exit; counts `i` up to `n`
auto make_counting_loop() -> Function {
    FunctionBuilder fb("count", kir::test::i32());
    auto n = fb.param("n", kir::test::i32());
    auto slot = fb.alloca_slot(kir::test::i32(), "i");
    fb.store(slot, FunctionBuilder::i32(0));
    auto header = fb.block("header");
    auto body = fb.block("body");
    auto exit = fb.block("exit");
    fb.jump(header);
    fb.at(header);
    auto i = fb.load(slot, kir::test::i32());
    auto more = fb.cmp(CmpOp::Lt, i, n);
    fb.jump_if(more, body, exit);
    fb.at(body);
    auto cur = fb.load(slot, kir::test::i32());
    fb.store(slot, fb.add(cur, FunctionBuilder::i32(1)));
    fb.jump(header);
    fb.at(exit);
    fb.ret(fb.load(slot, kir::test::i32()));
    return fb.finish();
}

auto verify(const Function& func) -> bool {
    Module module;
    module.name = "ssa";
    module.functions.push_back(func);
    module.reindex();
    auto result = verify_module(module);
    if (is_err(result)) {
        ADD_FAILURE() << unwrap_err(result).to_string() << "\n" << print_function(func);
        return false;
    }
    return true;
}

} // namespace

// ============================================================================
// CFG Analyses
// ============================================================================

TEST(DominatorTreeTest, Diamond) {
    auto d = make_diamond();
    DominatorTree dom(d.func);
    auto entry = d.func.blocks.front().id;

    EXPECT_EQ(dom.idom(d.merge), entry);
    EXPECT_EQ(dom.idom(d.then_bb), entry);
    EXPECT_FALSE(dom.idom(entry).has_value());
    EXPECT_TRUE(dom.dominates(entry, d.merge));
    EXPECT_TRUE(dom.dominates(d.merge, d.merge));
    EXPECT_FALSE(dom.dominates(d.then_bb, d.merge));

    EXPECT_EQ(dom.dominance_frontier(d.then_bb), std::vector<BlockId>{d.merge});
    EXPECT_EQ(dom.iterated_dominance_frontier({d.then_bb, d.else_bb}), std::set<BlockId>{d.merge});
    EXPECT_EQ(dom.reverse_post_order().front(), entry);
}

TEST(DominatorTreeTest, NaturalLoop) {
    auto func = make_counting_loop();
    DominatorTree dom(func);
    auto loops = find_loops(func, dom);

    ASSERT_EQ(loops.size(), 1u);
    const auto& loop = loops.front();
    EXPECT_EQ(loop.header, 1u);
    EXPECT_EQ(loop.latches, std::vector<BlockId>{2});
    EXPECT_TRUE(loop.contains(2));
    EXPECT_FALSE(loop.contains(3));
    EXPECT_EQ(loop.exits, std::vector<BlockId>{3});
}

TEST(DominatorTreeTest, UnreachableBlocksAreIgnored) {
    FunctionBuilder fb("dead", kir::test::void_type());
    auto orphan = fb.block("orphan");
    fb.ret();
    fb.at(orphan);
    fb.ret();
    auto func = fb.finish();

    DominatorTree dom(func);
    EXPECT_FALSE(dom.is_reachable(orphan));
    EXPECT_EQ(compute_rpo(func).size(), 1u);
}

// ============================================================================
// SSA Construction
// ============================================================================

TEST(SsaTest, DiamondGetsOnePhiInMerge) {
    auto d = make_diamond();
    auto stats = construct_ssa(d.func);

    EXPECT_EQ(stats.slots_promoted, 1u);
    EXPECT_EQ(stats.phis_inserted, 1u);
    EXPECT_EQ(count_of<AllocaInst>(d.func), 0u);
    EXPECT_EQ(count_of<LoadInst>(d.func), 0u);
    EXPECT_EQ(count_of<StoreInst>(d.func), 0u);
    EXPECT_EQ(count_of<PhiInst>(d.func), 1u);

    const auto& merge = *d.func.get_block(d.merge);
    const auto* phi = merge.instructions.front().as<PhiInst>();
    ASSERT_NE(phi, nullptr);
    ASSERT_EQ(phi->incoming.size(), 2u);
    EXPECT_EQ(phi->incoming[0].block, d.then_bb);
    EXPECT_EQ(phi->incoming[0].value.as_int(), 1);
    EXPECT_EQ(phi->incoming[1].block, d.else_bb);
    EXPECT_EQ(phi->incoming[1].value.as_int(), 2);

    // The load's uses now read the phi
    const auto* ret = merge.terminator()->as<RetInst>();
    ASSERT_TRUE(ret->value.has_value());
    EXPECT_EQ(ret->value->reg(), merge.instructions.front().result);
    EXPECT_TRUE(verify(d.func));
}

TEST(SsaTest, LoopCarriedSlotGetsHeaderPhi) {
    auto func = make_counting_loop();
    Module before;
    before.name = "loop";
    kir::test::add_function(before, func);

    construct_ssa(func);
    EXPECT_EQ(count_of<AllocaInst>(func), 0u);
    EXPECT_TRUE(verify(func));

    const auto& header = *func.get_block(1);
    ASSERT_TRUE(header.instructions.front().is<PhiInst>());

    Module after;
    after.name = "loop";
    kir::test::add_function(after, std::move(func));
    for (int64_t n : {0, 1, 7}) {
        auto arg = std::vector<Value>{make_const_int(n, make_i32_type())};
        auto expected = Interpreter(before).call("count", arg);
        auto actual = Interpreter(after).call("count", arg);
        EXPECT_TRUE(expected.same_behavior(actual)) << "n = " << n;
        EXPECT_EQ(actual.value->as_int(), n);
    }
}

TEST(SsaTest, DeterministicAcrossRuns) {
    auto first = make_diamond();
    auto second = make_diamond();
    construct_ssa(first.func);
    construct_ssa(second.func);
    EXPECT_EQ(print_function(first.func), print_function(second.func));

    // A second pass has nothing left to promote
    auto again = construct_ssa(first.func);
    EXPECT_EQ(again.slots_promoted, 0u);
}

TEST(SsaTest, EscapingSlotStaysInMemory) {
    FunctionBuilder fb("escape", kir::test::i32());
    auto slot = fb.alloca_slot(kir::test::i32(), "x");
    fb.store(slot, FunctionBuilder::i32(3));
    fb.call_void("observe", {slot});
    fb.ret(fb.load(slot, kir::test::i32()));
    auto func = fb.finish();

    EXPECT_TRUE(find_promotable_allocas(func).empty());
    auto stats = construct_ssa(func);
    EXPECT_EQ(stats.slots_promoted, 0u);
    EXPECT_EQ(count_of<AllocaInst>(func), 1u);
    EXPECT_EQ(count_of<LoadInst>(func), 1u);
}

TEST(SsaTest, VolatileAccessBlocksPromotion) {
    FunctionBuilder fb("mmio", kir::test::i32());
    auto slot = fb.alloca_slot(kir::test::i32(), "reg");
    fb.emit_void(StoreInst{slot, FunctionBuilder::i32(1), true, std::nullopt});
    fb.ret(fb.load(slot, kir::test::i32()));
    auto func = fb.finish();

    EXPECT_TRUE(find_promotable_allocas(func).empty());
}

TEST(SsaTest, SlotStoredIntoMemoryEscapes) {
    FunctionBuilder fb("store_addr", kir::test::void_type());
    auto holder = fb.alloca_slot(kir::test::ptr(), "holder");
    auto target = fb.alloca_slot(kir::test::i32(), "target");
    fb.store(holder, target);
    fb.ret();
    auto func = fb.finish();

    auto promotable = find_promotable_allocas(func);
    ASSERT_EQ(promotable.size(), 1u);
    EXPECT_EQ(promotable.front(), holder.reg());
}
