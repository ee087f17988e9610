// KIR Builder - Expressions
//
// Straight-line expression lowering: literals, bindings, operators, casts,
// calls and assignments. Control-flow expressions live in control.cpp.

#include "ir/ir_builder.hpp"

namespace kir::ir {

auto IrBuilder::build_expr(const ast::Expr& expr) -> Value {
    if (error_) {
        return unit_value();
    }

    auto saved_span = ctx_.span;
    ctx_.span = expr.span();

    Value result = std::visit(
        [this](const auto& e) -> Value {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ast::LiteralExpr>) {
                return build_literal(e);
            } else if constexpr (std::is_same_v<T, ast::VarExpr>) {
                return build_var(e);
            } else if constexpr (std::is_same_v<T, ast::GlobalExpr>) {
                auto type = convert_type(e.type, e.span);
                if (!module_.globals.contains(e.name)) {
                    report_ice("unknown global '" + e.name + "'", e.span);
                    return make_undef(type);
                }
                return emit_load(make_global(e.name), type);
            } else if constexpr (std::is_same_v<T, ast::AddrOfExpr>) {
                auto it = ctx_.bindings.find(e.binding);
                if (it == ctx_.bindings.end() || !it->second.is_slot) {
                    report_ice("address of '" + e.name + "' which has no stack slot", e.span);
                    return make_undef(make_ptr_type());
                }
                return it->second.value;
            } else if constexpr (std::is_same_v<T, ast::BinaryExpr>) {
                return build_binary(e);
            } else if constexpr (std::is_same_v<T, ast::UnaryExpr>) {
                return build_unary(e);
            } else if constexpr (std::is_same_v<T, ast::CastExpr>) {
                return build_cast(e);
            } else if constexpr (std::is_same_v<T, ast::CallExpr>) {
                return build_call(e);
            } else if constexpr (std::is_same_v<T, ast::AssignExpr>) {
                return build_assign(e);
            } else if constexpr (std::is_same_v<T, ast::BlockExpr>) {
                return build_block(e);
            } else if constexpr (std::is_same_v<T, ast::IfExpr>) {
                return build_if(e);
            } else if constexpr (std::is_same_v<T, ast::WhileExpr>) {
                return build_while(e);
            } else if constexpr (std::is_same_v<T, ast::ForExpr>) {
                return build_for(e);
            } else if constexpr (std::is_same_v<T, ast::LoopExpr>) {
                return build_loop(e);
            } else if constexpr (std::is_same_v<T, ast::BreakExpr>) {
                return build_break(e);
            } else if constexpr (std::is_same_v<T, ast::ContinueExpr>) {
                return build_continue(e);
            } else if constexpr (std::is_same_v<T, ast::ReturnExpr>) {
                return build_return(e);
            } else {
                return build_match(e);
            }
        },
        expr.kind);

    ctx_.span = saved_span;
    return result;
}

auto IrBuilder::build_literal(const ast::LiteralExpr& lit) -> Value {
    auto type = convert_type(lit.type, lit.span);
    return std::visit(
        [&](const auto& v) -> Value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return make_const_bool(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return make_const_float(v, type);
            } else {
                if (type->is_bool()) {
                    return make_const_bool(v != 0);
                }
                return make_const_int(v, type);
            }
        },
        lit.value);
}

auto IrBuilder::build_var(const ast::VarExpr& var) -> Value {
    auto it = ctx_.bindings.find(var.binding);
    if (it == ctx_.bindings.end()) {
        report_ice("use of unbound variable '" + var.name + "'", var.span);
        return make_undef(convert_type(var.type, var.span));
    }
    const auto& binding = it->second;
    if (!binding.is_slot) {
        return binding.value;
    }
    return emit_load(binding.value, convert_type(var.type, var.span));
}

namespace {

auto arith_op(ast::BinaryOp op) -> std::optional<BinOp> {
    switch (op) {
    case ast::BinaryOp::Add:
        return BinOp::Add;
    case ast::BinaryOp::Sub:
        return BinOp::Sub;
    case ast::BinaryOp::Mul:
        return BinOp::Mul;
    case ast::BinaryOp::Div:
        return BinOp::Div;
    case ast::BinaryOp::Rem:
        return BinOp::Rem;
    case ast::BinaryOp::BitAnd:
        return BinOp::And;
    case ast::BinaryOp::BitOr:
        return BinOp::Or;
    case ast::BinaryOp::BitXor:
        return BinOp::Xor;
    case ast::BinaryOp::Shl:
        return BinOp::Shl;
    case ast::BinaryOp::Shr:
        return BinOp::Shr;
    default:
        return std::nullopt;
    }
}

auto compare_op(ast::BinaryOp op) -> std::optional<CmpOp> {
    switch (op) {
    case ast::BinaryOp::Eq:
        return CmpOp::Eq;
    case ast::BinaryOp::Ne:
        return CmpOp::Ne;
    case ast::BinaryOp::Lt:
        return CmpOp::Lt;
    case ast::BinaryOp::Le:
        return CmpOp::Le;
    case ast::BinaryOp::Gt:
        return CmpOp::Gt;
    case ast::BinaryOp::Ge:
        return CmpOp::Ge;
    default:
        return std::nullopt;
    }
}

} // namespace

auto IrBuilder::build_binary(const ast::BinaryExpr& bin) -> Value {
    if (bin.op == ast::BinaryOp::And || bin.op == ast::BinaryOp::Or) {
        return build_short_circuit(bin);
    }

    auto lhs = build_expr(*bin.lhs);
    auto rhs = build_expr(*bin.rhs);

    if (auto cmp = compare_op(bin.op)) {
        return emit(CompareInst{*cmp, std::move(lhs), std::move(rhs)}, make_bool_type());
    }
    auto op = arith_op(bin.op);
    return emit(BinaryInst{*op, std::move(lhs), std::move(rhs)},
                convert_type(bin.type, bin.span));
}

// `a and b` / `a or b`: the right operand is evaluated only when the left
// does not decide the result. The merged value goes through a bool slot.
auto IrBuilder::build_short_circuit(const ast::BinaryExpr& bin) -> Value {
    bool is_and = bin.op == ast::BinaryOp::And;
    auto bool_type = make_bool_type();
    auto slot = emit_entry_alloca(bool_type, is_and ? "and.tmp" : "or.tmp");

    auto lhs = build_expr(*bin.lhs);
    emit_store(slot, lhs);

    auto rhs_block = create_block(is_and ? "and.rhs" : "or.rhs");
    auto end_block = create_block(is_and ? "and.end" : "or.end");
    if (is_and) {
        emit_jump_if(lhs, rhs_block, end_block);
    } else {
        emit_jump_if(lhs, end_block, rhs_block);
    }

    switch_to_block(rhs_block);
    auto rhs = build_expr(*bin.rhs);
    if (!is_terminated()) {
        emit_store(slot, rhs);
        emit_jump(end_block);
    }

    switch_to_block(end_block);
    return emit_load(slot, bool_type);
}

auto IrBuilder::build_unary(const ast::UnaryExpr& unary) -> Value {
    auto operand = build_expr(*unary.operand);
    auto op = unary.op == ast::UnaryOp::Neg ? UnaryOp::Neg : UnaryOp::Not;
    return emit(UnaryInst{op, std::move(operand)}, convert_type(unary.type, unary.span));
}

auto IrBuilder::build_cast(const ast::CastExpr& cast) -> Value {
    auto operand = build_expr(*cast.operand);
    auto target = convert_type(cast.type, cast.span);

    if (type_equals(operand.type, target)) {
        return operand;
    }
    if (target->is_bool()) {
        // Truthiness: compare against zero of the source type
        if (operand.type->is_integer()) {
            return emit(CompareInst{CmpOp::Ne, operand, make_const_int(0, operand.type)},
                        target);
        }
        if (operand.type->is_float()) {
            return emit(CompareInst{CmpOp::Ne, operand, make_const_float(0.0, operand.type)},
                        target);
        }
    }
    auto kind = cast_kind(operand.type, target);
    if (!kind) {
        report_ice("no conversion from " + operand.type->to_string() + " to " +
                       target->to_string(),
                   cast.span);
        return make_undef(target);
    }
    return emit(CastInst{*kind, std::move(operand)}, target);
}

auto IrBuilder::build_call(const ast::CallExpr& call) -> Value {
    std::vector<Value> args;
    args.reserve(call.args.size());
    for (const auto& arg : call.args) {
        args.push_back(build_expr(*arg));
    }

    const auto* callee = module_.find_function(call.func_name);
    if (!callee) {
        auto intrinsic = intrinsic_from_name(call.func_name);
        if (!intrinsic) {
            report_ice("call to unknown function '" + call.func_name + "'", call.span);
            return make_undef(convert_type(call.type, call.span));
        }
        if (*intrinsic == IntrinsicKind::Trap) {
            emit_void(IntrinsicInst{*intrinsic, std::move(args)});
            return unit_value();
        }
        return emit(IntrinsicInst{*intrinsic, std::move(args)},
                    convert_type(call.type, call.span));
    }

    auto return_type = callee->return_type;
    if (return_type->is_void()) {
        emit_void(CallInst{call.func_name, std::move(args)});
        return unit_value();
    }
    return emit(CallInst{call.func_name, std::move(args)}, return_type);
}

auto IrBuilder::build_assign(const ast::AssignExpr& assign) -> Value {
    auto value = build_expr(*assign.value);
    if (value.type->is_void()) {
        return unit_value();
    }

    if (!assign.binding) {
        if (!module_.globals.contains(assign.name)) {
            report_ice("assignment to unknown global '" + assign.name + "'", assign.span);
            return unit_value();
        }
        emit_store(make_global(assign.name), std::move(value));
        return unit_value();
    }

    auto it = ctx_.bindings.find(*assign.binding);
    if (it == ctx_.bindings.end() || !it->second.is_slot) {
        report_ice("assignment to '" + assign.name + "' which has no stack slot", assign.span);
        return unit_value();
    }
    emit_store(it->second.value, std::move(value));
    return unit_value();
}

} // namespace kir::ir
