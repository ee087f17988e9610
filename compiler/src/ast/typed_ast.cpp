//! # Typed AST Implementation
//!
//! Node accessors and construction helpers.

#include "ast/typed_ast.hpp"

namespace kir::ast {

auto Type::to_string() const -> std::string {
    switch (kind) {
    case TypeKind::Unit:
        return "()";
    case TypeKind::Bool:
        return "bool";
    case TypeKind::I8:
        return "i8";
    case TypeKind::I16:
        return "i16";
    case TypeKind::I32:
        return "i32";
    case TypeKind::I64:
        return "i64";
    case TypeKind::U8:
        return "u8";
    case TypeKind::U16:
        return "u16";
    case TypeKind::U32:
        return "u32";
    case TypeKind::U64:
        return "u64";
    case TypeKind::F32:
        return "f32";
    case TypeKind::F64:
        return "f64";
    case TypeKind::Ptr:
        return "ptr";
    case TypeKind::Str:
        return "str";
    case TypeKind::Tuple: {
        std::string s = "(";
        for (size_t i = 0; i < elements.size(); ++i) {
            s += (i > 0 ? ", " : "") + elements[i]->to_string();
        }
        return s + ")";
    }
    case TypeKind::Closure:
        return "closure";
    }
    return "?";
}

auto make_type(TypeKind kind) -> TypePtr {
    return std::make_shared<const Type>(Type{kind, {}});
}

auto Expr::type() const -> TypePtr {
    return std::visit(
        [](const auto& e) -> TypePtr {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ForExpr> || std::is_same_v<T, WhileExpr> ||
                          std::is_same_v<T, LoopExpr> || std::is_same_v<T, BreakExpr> ||
                          std::is_same_v<T, ContinueExpr> || std::is_same_v<T, ReturnExpr> ||
                          std::is_same_v<T, AssignExpr>) {
                return make_type(TypeKind::Unit);
            } else {
                return e.type;
            }
        },
        kind);
}

auto Expr::span() const -> SourceSpan {
    return std::visit([](const auto& e) -> SourceSpan { return e.span; }, kind);
}

// ============================================================================
// Construction Helpers
// ============================================================================

namespace {

auto wrap(auto node) -> ExprPtr {
    return make_box<Expr>(Expr{std::move(node)});
}

} // namespace

auto make_int(int64_t value, TypeKind kind) -> ExprPtr {
    return wrap(LiteralExpr{value, make_type(kind), {}});
}

auto make_float(double value, TypeKind kind) -> ExprPtr {
    return wrap(LiteralExpr{value, make_type(kind), {}});
}

auto make_bool(bool value) -> ExprPtr {
    return wrap(LiteralExpr{value, make_type(TypeKind::Bool), {}});
}

auto make_var(BindingId binding, const std::string& name, TypePtr type) -> ExprPtr {
    return wrap(VarExpr{binding, name, std::move(type), {}});
}

auto make_global_ref(const std::string& name, TypePtr type) -> ExprPtr {
    return wrap(GlobalExpr{name, std::move(type), {}});
}

auto make_addr_of(BindingId binding, const std::string& name) -> ExprPtr {
    return wrap(AddrOfExpr{binding, name, make_type(TypeKind::Ptr), {}});
}

auto make_binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs) -> ExprPtr {
    TypePtr type;
    switch (op) {
    case BinaryOp::Eq:
    case BinaryOp::Ne:
    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
    case BinaryOp::And:
    case BinaryOp::Or:
        type = make_type(TypeKind::Bool);
        break;
    default:
        type = lhs->type();
        break;
    }
    return wrap(BinaryExpr{op, std::move(lhs), std::move(rhs), std::move(type), {}});
}

auto make_unary(UnaryOp op, ExprPtr operand) -> ExprPtr {
    auto type = operand->type();
    return wrap(UnaryExpr{op, std::move(operand), std::move(type), {}});
}

auto make_cast(ExprPtr operand, TypePtr type) -> ExprPtr {
    return wrap(CastExpr{std::move(operand), std::move(type), {}});
}

auto make_call(const std::string& name, std::vector<ExprPtr> args, TypePtr type) -> ExprPtr {
    return wrap(CallExpr{name, std::move(args), std::move(type), {}});
}

auto make_assign(BindingId binding, const std::string& name, ExprPtr value) -> ExprPtr {
    return wrap(AssignExpr{binding, name, std::move(value), {}});
}

auto make_global_assign(const std::string& name, ExprPtr value) -> ExprPtr {
    return wrap(AssignExpr{std::nullopt, name, std::move(value), {}});
}

auto make_block(std::vector<StmtPtr> stmts, std::optional<ExprPtr> tail) -> ExprPtr {
    auto type = tail ? (*tail)->type() : make_type(TypeKind::Unit);
    return wrap(BlockExpr{std::move(stmts), std::move(tail), std::move(type), {}});
}

auto make_if(ExprPtr cond, ExprPtr then_branch, std::optional<ExprPtr> else_branch) -> ExprPtr {
    auto type = else_branch ? then_branch->type() : make_type(TypeKind::Unit);
    return wrap(IfExpr{std::move(cond), std::move(then_branch), std::move(else_branch),
                       std::move(type), {}});
}

auto make_while(ExprPtr cond, ExprPtr body) -> ExprPtr {
    return wrap(WhileExpr{std::move(cond), std::move(body), {}});
}

auto make_for(BindingId var, const std::string& name, ExprPtr start, ExprPtr end, ExprPtr body,
              std::optional<ExprPtr> step, bool inclusive) -> ExprPtr {
    auto var_type = start->type();
    return wrap(ForExpr{var, name, std::move(var_type), std::move(start), std::move(end),
                        std::move(step), inclusive, std::move(body), {}});
}

auto make_loop(ExprPtr body) -> ExprPtr {
    return wrap(LoopExpr{std::move(body), {}});
}

auto make_break() -> ExprPtr {
    return wrap(BreakExpr{{}});
}

auto make_continue() -> ExprPtr {
    return wrap(ContinueExpr{{}});
}

auto make_return(std::optional<ExprPtr> value) -> ExprPtr {
    return wrap(ReturnExpr{std::move(value), {}});
}

auto make_match(ExprPtr scrutinee, std::vector<MatchArm> arms, TypePtr type) -> ExprPtr {
    return wrap(MatchExpr{std::move(scrutinee), std::move(arms), std::move(type), {}});
}

auto make_let(BindingId binding, const std::string& name, TypePtr type, ExprPtr init, bool is_mut)
    -> StmtPtr {
    return make_box<Stmt>(Stmt{LetStmt{binding, name, std::move(type), is_mut, std::move(init), {}}});
}

auto make_expr_stmt(ExprPtr expr) -> StmtPtr {
    return make_box<Stmt>(Stmt{ExprStmt{std::move(expr)}});
}

} // namespace kir::ast
