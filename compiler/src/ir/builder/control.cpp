// KIR Builder - Control Flow
//
// Blocks, conditionals, loops and match. Each construct allocates its blocks
// up front and wires them with JUMP / JUMP_IF / SWITCH. Value-producing
// constructs merge through a temporary slot.
//
// Loop shapes:
//
//   while:  cur -> cond -> {body -> cond, end}
//   loop:   cur -> body -> body ...            (left by break/return)
//   for:    cur -> cond -> {body -> step -> cond, end}

#include "ir/ir_builder.hpp"

#include <unordered_set>

namespace kir::ir {

auto IrBuilder::build_block(const ast::BlockExpr& block) -> Value {
    for (const auto& stmt : block.stmts) {
        build_stmt(*stmt);
        if (error_) {
            return unit_value();
        }
    }
    if (block.expr) {
        return build_expr(**block.expr);
    }
    return unit_value();
}

auto IrBuilder::build_if(const ast::IfExpr& if_expr) -> Value {
    auto cond = build_expr(*if_expr.condition);
    auto result_type = convert_type(if_expr.type, if_expr.span);
    bool has_value = if_expr.else_branch && !result_type->is_void();

    std::optional<Value> slot;
    if (has_value) {
        slot = emit_entry_alloca(result_type, "if.tmp");
    }

    auto then_block = create_block("if.then");
    auto else_block = if_expr.else_branch ? create_block("if.else") : INVALID_BLOCK;
    auto merge_block = create_block("if.end");

    emit_jump_if(cond, then_block, if_expr.else_branch ? else_block : merge_block);

    switch_to_block(then_block);
    auto then_value = build_expr(*if_expr.then_branch);
    if (!is_terminated()) {
        if (slot) {
            emit_store(*slot, then_value);
        }
        emit_jump(merge_block);
    }

    if (if_expr.else_branch) {
        switch_to_block(else_block);
        auto else_value = build_expr(**if_expr.else_branch);
        if (!is_terminated()) {
            if (slot) {
                emit_store(*slot, else_value);
            }
            emit_jump(merge_block);
        }
    }

    switch_to_block(merge_block);
    if (slot) {
        return emit_load(*slot, result_type);
    }
    return unit_value();
}

auto IrBuilder::build_while(const ast::WhileExpr& while_expr) -> Value {
    auto cond_block = create_block("while.cond");
    auto body_block = create_block("while.body");
    auto end_block = create_block("while.end");

    emit_jump(cond_block);

    switch_to_block(cond_block);
    auto cond = build_expr(*while_expr.condition);
    emit_jump_if(cond, body_block, end_block);

    switch_to_block(body_block);
    ctx_.loop_stack.push_back(LoopTarget{cond_block, end_block});
    build_expr(*while_expr.body);
    ctx_.loop_stack.pop_back();
    if (!is_terminated()) {
        emit_jump(cond_block);
    }

    switch_to_block(end_block);
    return unit_value();
}

auto IrBuilder::build_loop(const ast::LoopExpr& loop) -> Value {
    auto body_block = create_block("loop.body");
    auto end_block = create_block("loop.end");

    emit_jump(body_block);

    switch_to_block(body_block);
    ctx_.loop_stack.push_back(LoopTarget{body_block, end_block});
    build_expr(*loop.body);
    ctx_.loop_stack.pop_back();
    if (!is_terminated()) {
        emit_jump(body_block);
    }

    switch_to_block(end_block);
    return unit_value();
}

auto IrBuilder::build_for(const ast::ForExpr& for_expr) -> Value {
    auto iv_type = convert_type(for_expr.var_type, for_expr.span);
    if (!iv_type->is_integer()) {
        report_ice("for-loop variable '" + for_expr.var_name + "' is not an integer",
                   for_expr.span);
        return unit_value();
    }

    auto start = build_expr(*for_expr.start);
    auto end = build_expr(*for_expr.end);
    Value step = make_const_int(1, iv_type);
    if (for_expr.step) {
        step = build_expr(**for_expr.step);
    }

    // A constant negative step counts down
    bool descending = step.as_int() && *step.as_int() < 0;
    CmpOp cmp = descending ? (for_expr.inclusive ? CmpOp::Ge : CmpOp::Gt)
                           : (for_expr.inclusive ? CmpOp::Le : CmpOp::Lt);

    bind_local(for_expr.var, for_expr.var_name, iv_type, start);
    auto iv_slot = ctx_.bindings[for_expr.var].value;

    auto cond_block = create_block("for.cond");
    auto body_block = create_block("for.body");
    auto step_block = create_block("for.step");
    auto end_block = create_block("for.end");

    emit_jump(cond_block);

    switch_to_block(cond_block);
    auto iv = emit_load(iv_slot, iv_type);
    auto in_range = emit(CompareInst{cmp, iv, end}, make_bool_type());
    emit_jump_if(in_range, body_block, end_block);

    switch_to_block(body_block);
    ctx_.loop_stack.push_back(LoopTarget{step_block, end_block});
    build_expr(*for_expr.body);
    ctx_.loop_stack.pop_back();
    if (!is_terminated()) {
        emit_jump(step_block);
    }

    switch_to_block(step_block);
    auto current = emit_load(iv_slot, iv_type);
    auto next = emit(BinaryInst{BinOp::Add, current, step}, iv_type);
    emit_store(iv_slot, next);
    emit_jump(cond_block);

    switch_to_block(end_block);
    return unit_value();
}

auto IrBuilder::build_break(const ast::BreakExpr& brk) -> Value {
    if (ctx_.loop_stack.empty()) {
        report_ice("break outside of a loop", brk.span);
        return unit_value();
    }
    emit_jump(ctx_.loop_stack.back().break_block);
    continue_in_dead_block("break.dead");
    return unit_value();
}

auto IrBuilder::build_continue(const ast::ContinueExpr& cont) -> Value {
    if (ctx_.loop_stack.empty()) {
        report_ice("continue outside of a loop", cont.span);
        return unit_value();
    }
    emit_jump(ctx_.loop_stack.back().continue_block);
    continue_in_dead_block("continue.dead");
    return unit_value();
}

auto IrBuilder::build_return(const ast::ReturnExpr& ret) -> Value {
    std::optional<Value> value;
    if (ret.value) {
        value = build_expr(**ret.value);
    }
    if (ctx_.func->return_type->is_void() || (value && value->type->is_void())) {
        emit_return(std::nullopt);
    } else {
        emit_return(value);
    }
    continue_in_dead_block("return.dead");
    return unit_value();
}

auto IrBuilder::build_match(const ast::MatchExpr& match) -> Value {
    auto scrutinee = build_expr(*match.scrutinee);
    if (scrutinee.type->is_bool()) {
        scrutinee = emit(CastInst{CastKind::ZExt, scrutinee}, make_i32_type());
    }
    if (!scrutinee.type->is_integer()) {
        report_ice("match scrutinee of type " + scrutinee.type->to_string() +
                       " is not an integer",
                   match.span);
        return unit_value();
    }

    auto result_type = convert_type(match.type, match.span);
    std::optional<Value> slot;
    if (!result_type->is_void()) {
        slot = emit_entry_alloca(result_type, "match.tmp");
    }

    auto merge_block = create_block("match.end");
    SwitchInst sw{scrutinee, {}, INVALID_BLOCK};
    std::vector<std::pair<BlockId, const ast::MatchArm*>> arm_blocks;
    std::unordered_set<int64_t> seen;

    for (const auto& arm : match.arms) {
        auto block = create_block("match.arm");
        if (!arm.pattern) {
            sw.default_block = block;
            arm_blocks.emplace_back(block, &arm);
            break; // Arms after the wildcard can never be selected
        }
        int64_t pattern = normalize_int(*arm.pattern, *scrutinee.type);
        if (!seen.insert(pattern).second) {
            continue; // The earlier arm with this pattern wins
        }
        sw.cases.emplace_back(pattern, block);
        arm_blocks.emplace_back(block, &arm);
    }

    std::optional<BlockId> trap_block;
    if (sw.default_block == INVALID_BLOCK) {
        trap_block = create_block("match.trap");
        sw.default_block = *trap_block;
    }
    emit_void(std::move(sw));

    for (const auto& [block, arm] : arm_blocks) {
        switch_to_block(block);
        auto value = build_expr(*arm->body);
        if (!is_terminated()) {
            if (slot) {
                emit_store(*slot, value);
            }
            emit_jump(merge_block);
        }
    }

    if (trap_block) {
        switch_to_block(*trap_block);
        emit_void(IntrinsicInst{IntrinsicKind::Trap, {}});
        emit_void(UnreachableInst{});
    }

    switch_to_block(merge_block);
    if (slot) {
        return emit_load(*slot, result_type);
    }
    return unit_value();
}

} // namespace kir::ir
