//! # Typed AST
//!
//! The front end's output and the midend's input. By the time a tree reaches
//! the IR builder:
//! - every expression node carries its resolved concrete type
//! - every name reference is resolved to a unique `BindingId`
//! - type errors have been rejected
//!
//! ## Node Families
//!
//! | Family      | Nodes                                                       |
//! |-------------|-------------------------------------------------------------|
//! | Values      | `LiteralExpr`, `VarExpr`, `GlobalExpr`, `AddrOfExpr`        |
//! | Operators   | `BinaryExpr`, `UnaryExpr`, `CastExpr`, `CallExpr`           |
//! | Effects     | `AssignExpr`, `ReturnExpr`, `BreakExpr`, `ContinueExpr`     |
//! | Control     | `BlockExpr`, `IfExpr`, `WhileExpr`, `ForExpr`, `LoopExpr`,  |
//! |             | `MatchExpr`                                                 |
//!
//! The `make_*` helpers at the bottom build nodes with a default span; tests
//! and embedders use them instead of spelling out every aggregate.

#pragma once

#include "common.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kir::ast {

// ============================================================================
// Types
// ============================================================================

enum class TypeKind {
    Unit,
    Bool,
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    F32,
    F64,
    Ptr,
    Str,     ///< No IR representation
    Tuple,   ///< No IR representation
    Closure, ///< No IR representation
};

struct Type;
using TypePtr = Rc<const Type>;

struct Type {
    TypeKind kind;
    std::vector<TypePtr> elements; ///< Tuple elements

    [[nodiscard]] auto to_string() const -> std::string;
};

auto make_type(TypeKind kind) -> TypePtr;

/// Identifies a local binding (parameter, let, loop variable) within a
/// function. Unique per function.
using BindingId = uint32_t;

// ============================================================================
// Expressions
// ============================================================================

struct Expr;
struct Stmt;
using ExprPtr = Box<Expr>;
using StmtPtr = Box<Stmt>;

enum class BinaryOp {
    Add,
    Sub,
    Mul,
    Div,
    Rem,
    BitAnd,
    BitOr,
    BitXor,
    Shl,
    Shr,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    And, ///< Short-circuit
    Or,  ///< Short-circuit
};

enum class UnaryOp { Neg, Not };

/// Literal: `42`, `3.5`, `true`
struct LiteralExpr {
    std::variant<int64_t, double, bool> value;
    TypePtr type;
    SourceSpan span;
};

/// Local variable read: `x`
struct VarExpr {
    BindingId binding;
    std::string name;
    TypePtr type;
    SourceSpan span;
};

/// Global variable read: `COUNTER`
struct GlobalExpr {
    std::string name;
    TypePtr type;
    SourceSpan span;
};

/// Address of a local: `&x`. Makes the binding address-taken.
struct AddrOfExpr {
    BindingId binding;
    std::string name;
    TypePtr type; ///< Always Ptr
    SourceSpan span;
};

struct BinaryExpr {
    BinaryOp op;
    ExprPtr lhs;
    ExprPtr rhs;
    TypePtr type;
    SourceSpan span;
};

struct UnaryExpr {
    UnaryOp op;
    ExprPtr operand;
    TypePtr type;
    SourceSpan span;
};

/// Conversion to `type`: `x as f64`
struct CastExpr {
    ExprPtr operand;
    TypePtr type;
    SourceSpan span;
};

/// Call to a module function or an intrinsic (`abs`, `min`, `max`, `sqrt`,
/// `trap`)
struct CallExpr {
    std::string func_name;
    std::vector<ExprPtr> args;
    TypePtr type;
    SourceSpan span;
};

/// Assignment to a local binding or, when `binding` is empty, a global
struct AssignExpr {
    std::optional<BindingId> binding;
    std::string name;
    ExprPtr value;
    SourceSpan span;
};

struct BlockExpr {
    std::vector<StmtPtr> stmts;
    std::optional<ExprPtr> expr;
    TypePtr type;
    SourceSpan span;
};

/// Expression-valued when both branches exist and the type is not Unit
struct IfExpr {
    ExprPtr condition;
    ExprPtr then_branch;
    std::optional<ExprPtr> else_branch;
    TypePtr type;
    SourceSpan span;
};

struct WhileExpr {
    ExprPtr condition;
    ExprPtr body;
    SourceSpan span;
};

/// Counted loop: `for i in start..end step s` (or `..=` when inclusive).
/// A missing step means 1. The loop variable is immutable inside the body.
struct ForExpr {
    BindingId var;
    std::string var_name;
    TypePtr var_type;
    ExprPtr start;
    ExprPtr end;
    std::optional<ExprPtr> step;
    bool inclusive = false;
    ExprPtr body;
    SourceSpan span;
};

/// Infinite loop, left by `break` or `return`
struct LoopExpr {
    ExprPtr body;
    SourceSpan span;
};

struct BreakExpr {
    SourceSpan span;
};

struct ContinueExpr {
    SourceSpan span;
};

struct ReturnExpr {
    std::optional<ExprPtr> value;
    SourceSpan span;
};

/// One arm of a match; `pattern` is empty for the wildcard arm
struct MatchArm {
    std::optional<int64_t> pattern;
    ExprPtr body;
};

/// Match on an integer scrutinee. Exhaustiveness was checked by the front
/// end; a match without a wildcard arm traps on fallthrough.
struct MatchExpr {
    ExprPtr scrutinee;
    std::vector<MatchArm> arms;
    TypePtr type;
    SourceSpan span;
};

struct Expr {
    std::variant<LiteralExpr, VarExpr, GlobalExpr, AddrOfExpr, BinaryExpr, UnaryExpr, CastExpr,
                 CallExpr, AssignExpr, BlockExpr, IfExpr, WhileExpr, ForExpr, LoopExpr, BreakExpr,
                 ContinueExpr, ReturnExpr, MatchExpr>
        kind;

    /// Resolved type; Unit for statements-like expressions.
    [[nodiscard]] auto type() const -> TypePtr;

    [[nodiscard]] auto span() const -> SourceSpan;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// ============================================================================
// Statements
// ============================================================================

/// `let x: T = init` / `let mut x: T = init`
struct LetStmt {
    BindingId binding;
    std::string name;
    TypePtr type;
    bool is_mut = false;
    std::optional<ExprPtr> init;
    SourceSpan span;
};

struct ExprStmt {
    ExprPtr expr;
};

struct Stmt {
    std::variant<LetStmt, ExprStmt> kind;
};

// ============================================================================
// Declarations
// ============================================================================

struct Param {
    BindingId binding;
    std::string name;
    TypePtr type;
    SourceSpan span;
};

struct FuncDecl {
    std::string name;
    std::vector<Param> params;
    TypePtr return_type;
    std::optional<ExprPtr> body;         ///< A BlockExpr; empty for extern declarations
    std::vector<std::string> attributes; ///< "inline", "noinline", "pure"
    SourceSpan span;
};

struct GlobalDecl {
    std::string name;
    TypePtr type;
    std::optional<std::variant<int64_t, double, bool>> init;
    bool is_const = false;
    SourceSpan span;
};

struct Module {
    std::string name;
    std::vector<GlobalDecl> globals;
    std::vector<FuncDecl> functions;
};

// ============================================================================
// Construction Helpers
// ============================================================================

auto make_int(int64_t value, TypeKind kind = TypeKind::I32) -> ExprPtr;
auto make_float(double value, TypeKind kind = TypeKind::F64) -> ExprPtr;
auto make_bool(bool value) -> ExprPtr;
auto make_var(BindingId binding, const std::string& name, TypePtr type) -> ExprPtr;
auto make_global_ref(const std::string& name, TypePtr type) -> ExprPtr;
auto make_addr_of(BindingId binding, const std::string& name) -> ExprPtr;
auto make_binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs) -> ExprPtr; ///< Type inferred
auto make_unary(UnaryOp op, ExprPtr operand) -> ExprPtr;
auto make_cast(ExprPtr operand, TypePtr type) -> ExprPtr;
auto make_call(const std::string& name, std::vector<ExprPtr> args, TypePtr type) -> ExprPtr;
auto make_assign(BindingId binding, const std::string& name, ExprPtr value) -> ExprPtr;
auto make_global_assign(const std::string& name, ExprPtr value) -> ExprPtr;
auto make_block(std::vector<StmtPtr> stmts, std::optional<ExprPtr> tail = std::nullopt)
    -> ExprPtr;
auto make_if(ExprPtr cond, ExprPtr then_branch, std::optional<ExprPtr> else_branch = std::nullopt)
    -> ExprPtr;
auto make_while(ExprPtr cond, ExprPtr body) -> ExprPtr;
auto make_for(BindingId var, const std::string& name, ExprPtr start, ExprPtr end, ExprPtr body,
              std::optional<ExprPtr> step = std::nullopt, bool inclusive = false) -> ExprPtr;
auto make_loop(ExprPtr body) -> ExprPtr;
auto make_break() -> ExprPtr;
auto make_continue() -> ExprPtr;
auto make_return(std::optional<ExprPtr> value = std::nullopt) -> ExprPtr;
auto make_match(ExprPtr scrutinee, std::vector<MatchArm> arms, TypePtr type) -> ExprPtr;

auto make_let(BindingId binding, const std::string& name, TypePtr type, ExprPtr init,
              bool is_mut = false) -> StmtPtr;
auto make_expr_stmt(ExprPtr expr) -> StmtPtr;

/// Collects move-only statements; braced lists cannot move from their elements.
template <typename... Stmts> auto stmt_list(Stmts&&... stmts) -> std::vector<StmtPtr> {
    std::vector<StmtPtr> list;
    list.reserve(sizeof...(stmts));
    (list.push_back(std::forward<Stmts>(stmts)), ...);
    return list;
}

template <typename... Exprs> auto expr_list(Exprs&&... exprs) -> std::vector<ExprPtr> {
    std::vector<ExprPtr> list;
    list.reserve(sizeof...(exprs));
    (list.push_back(std::forward<Exprs>(exprs)), ...);
    return list;
}

} // namespace kir::ast
