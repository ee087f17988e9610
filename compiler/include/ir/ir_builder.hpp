// KIR Builder - Typed AST to KIR Lowering
//
// Lowering is a structural translation:
// - every mutable binding (and every address-taken or reassigned binding)
//   gets an ALLOCA in the entry block; reads are LOADs, writes are STOREs
// - expression-valued `if`/`match` and short-circuit `and`/`or` merge their
//   branch values through a temporary ALLOCA, never through phis
// - control constructs allocate fresh blocks per branch and merge point and
//   wire them with JUMP, JUMP_IF and SWITCH
//
// SSA construction later promotes the slots to registers. The builder never
// publishes a partial module: the first unrepresentable type aborts the
// whole module with an internal-compiler-error diagnostic.
//
// Usage:
//   IrBuilder builder;
//   auto result = builder.build(ast_module);
//   if (is_ok(result)) { auto& module = unwrap(result); ... }

#pragma once

#include "ast/typed_ast.hpp"
#include "ir/diagnostic.hpp"
#include "ir/ir.hpp"

#include <unordered_map>
#include <unordered_set>

namespace kir::ir {

class IrBuilder {
public:
    IrBuilder() = default;

    auto build(const ast::Module& ast_module) -> Result<Module, Diagnostic>;

private:
    struct Binding {
        Value value;  // The slot address when `is_slot`, the value itself otherwise
        bool is_slot;
    };

    struct LoopTarget {
        BlockId continue_block;
        BlockId break_block;
    };

    struct BuildContext {
        Function* func = nullptr;
        BlockId current_block = INVALID_BLOCK;
        std::unordered_map<ast::BindingId, Binding> bindings;
        std::unordered_set<ast::BindingId> needs_slot;
        std::vector<LoopTarget> loop_stack;
        std::optional<SourceSpan> span; // Span stamped on emitted instructions
    };

    Module module_;
    BuildContext ctx_;
    std::optional<Diagnostic> error_;

    // Types (builder/types.cpp)
    auto convert_type(const ast::TypePtr& type, const SourceSpan& span) -> IrTypePtr;
    auto cast_kind(const IrTypePtr& from, const IrTypePtr& to) -> std::optional<CastKind>;
    void report_ice(const std::string& message, const SourceSpan& span);

    // Functions and statements (builder/stmt.cpp)
    void declare_function(const ast::FuncDecl& decl);
    void build_function(const ast::FuncDecl& decl, Function& func);
    void scan_slots(const ast::Expr& expr);
    void build_stmt(const ast::Stmt& stmt);
    void bind_local(ast::BindingId binding, const std::string& name, const IrTypePtr& type,
                    Value init);

    // Expressions (builder/expr.cpp)
    auto build_expr(const ast::Expr& expr) -> Value;
    auto build_literal(const ast::LiteralExpr& lit) -> Value;
    auto build_var(const ast::VarExpr& var) -> Value;
    auto build_binary(const ast::BinaryExpr& bin) -> Value;
    auto build_short_circuit(const ast::BinaryExpr& bin) -> Value;
    auto build_unary(const ast::UnaryExpr& unary) -> Value;
    auto build_cast(const ast::CastExpr& cast) -> Value;
    auto build_call(const ast::CallExpr& call) -> Value;
    auto build_assign(const ast::AssignExpr& assign) -> Value;

    // Control flow (builder/control.cpp)
    auto build_block(const ast::BlockExpr& block) -> Value;
    auto build_if(const ast::IfExpr& if_expr) -> Value;
    auto build_while(const ast::WhileExpr& while_expr) -> Value;
    auto build_for(const ast::ForExpr& for_expr) -> Value;
    auto build_loop(const ast::LoopExpr& loop) -> Value;
    auto build_break(const ast::BreakExpr& brk) -> Value;
    auto build_continue(const ast::ContinueExpr& cont) -> Value;
    auto build_return(const ast::ReturnExpr& ret) -> Value;
    auto build_match(const ast::MatchExpr& match) -> Value;

    // Emission helpers (builder/helpers.cpp)
    auto create_block(const std::string& name) -> BlockId;
    void switch_to_block(BlockId block);
    auto current_block() -> BasicBlock&;
    [[nodiscard]] auto is_terminated() -> bool;
    void continue_in_dead_block(const std::string& name);
    auto emit(Instruction inst, IrTypePtr type) -> Value;
    void emit_void(Instruction inst);
    void emit_jump(BlockId target);
    void emit_jump_if(Value cond, BlockId then_block, BlockId else_block);
    void emit_return(std::optional<Value> value);
    auto emit_entry_alloca(IrTypePtr type, const std::string& name) -> Value;
    auto emit_load(Value ptr, IrTypePtr type) -> Value;
    void emit_store(Value ptr, Value value);
    auto unit_value() -> Value;
};

auto build_module(const ast::Module& ast_module) -> Result<Module, Diagnostic>;

} // namespace kir::ir
