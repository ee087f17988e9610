// KIR Builder - Statements and Bindings
//
// Decides which bindings live in stack slots and lowers let/expression
// statements.

#include "ir/ir_builder.hpp"

namespace kir::ir {

void IrBuilder::scan_slots(const ast::Expr& expr) {
    std::visit(
        [this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ast::AddrOfExpr>) {
                ctx_.needs_slot.insert(e.binding);
            } else if constexpr (std::is_same_v<T, ast::AssignExpr>) {
                if (e.binding) {
                    ctx_.needs_slot.insert(*e.binding);
                }
                scan_slots(*e.value);
            } else if constexpr (std::is_same_v<T, ast::BinaryExpr>) {
                scan_slots(*e.lhs);
                scan_slots(*e.rhs);
            } else if constexpr (std::is_same_v<T, ast::UnaryExpr> ||
                                 std::is_same_v<T, ast::CastExpr>) {
                scan_slots(*e.operand);
            } else if constexpr (std::is_same_v<T, ast::CallExpr>) {
                for (const auto& arg : e.args) {
                    scan_slots(*arg);
                }
            } else if constexpr (std::is_same_v<T, ast::BlockExpr>) {
                for (const auto& stmt : e.stmts) {
                    if (const auto* let = std::get_if<ast::LetStmt>(&stmt->kind)) {
                        if (let->is_mut) {
                            ctx_.needs_slot.insert(let->binding);
                        }
                        if (let->init && *let->init) {
                            scan_slots(**let->init);
                        }
                    } else {
                        scan_slots(*std::get<ast::ExprStmt>(stmt->kind).expr);
                    }
                }
                if (e.expr) {
                    scan_slots(**e.expr);
                }
            } else if constexpr (std::is_same_v<T, ast::IfExpr>) {
                scan_slots(*e.condition);
                scan_slots(*e.then_branch);
                if (e.else_branch) {
                    scan_slots(**e.else_branch);
                }
            } else if constexpr (std::is_same_v<T, ast::WhileExpr>) {
                scan_slots(*e.condition);
                scan_slots(*e.body);
            } else if constexpr (std::is_same_v<T, ast::ForExpr>) {
                ctx_.needs_slot.insert(e.var);
                scan_slots(*e.start);
                scan_slots(*e.end);
                if (e.step) {
                    scan_slots(**e.step);
                }
                scan_slots(*e.body);
            } else if constexpr (std::is_same_v<T, ast::LoopExpr>) {
                scan_slots(*e.body);
            } else if constexpr (std::is_same_v<T, ast::ReturnExpr>) {
                if (e.value) {
                    scan_slots(**e.value);
                }
            } else if constexpr (std::is_same_v<T, ast::MatchExpr>) {
                scan_slots(*e.scrutinee);
                for (const auto& arm : e.arms) {
                    scan_slots(*arm.body);
                }
            }
            // Literals, variable and global reads, break and continue bind nothing
        },
        expr.kind);
}

void IrBuilder::bind_local(ast::BindingId binding, const std::string& name,
                           const IrTypePtr& type, Value init) {
    if (ctx_.needs_slot.contains(binding)) {
        auto slot = emit_entry_alloca(type, name);
        if (!init.is_undef()) {
            emit_store(slot, std::move(init));
        }
        ctx_.bindings[binding] = Binding{slot, true};
    } else {
        ctx_.bindings[binding] = Binding{std::move(init), false};
    }
}

void IrBuilder::build_stmt(const ast::Stmt& stmt) {
    if (const auto* let = std::get_if<ast::LetStmt>(&stmt.kind)) {
        ctx_.span = let->span;
        auto type = convert_type(let->type, let->span);
        if (type->is_void()) {
            // Unit-typed bindings hold no data; evaluate for effects only
            if (let->init && *let->init) {
                build_expr(**let->init);
            }
            return;
        }
        Value init = make_undef(type);
        if (let->init && *let->init) {
            init = build_expr(**let->init);
        }
        ctx_.span = let->span;
        bind_local(let->binding, let->name, type, std::move(init));
        return;
    }
    build_expr(*std::get<ast::ExprStmt>(stmt.kind).expr);
}

} // namespace kir::ir
