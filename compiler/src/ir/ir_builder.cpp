// KIR Builder - Module and Function Lowering
//
// Two passes over the AST module: first every function signature is declared
// so calls can be typed regardless of declaration order, then bodies are
// lowered one at a time.

#include "ir/ir_builder.hpp"

#include "log/log.hpp"

namespace kir::ir {

auto IrBuilder::build(const ast::Module& ast_module) -> Result<Module, Diagnostic> {
    module_ = Module{};
    module_.name = ast_module.name;
    error_.reset();

    for (const auto& global : ast_module.globals) {
        Global g;
        g.name = global.name;
        g.type = convert_type(global.type, global.span);
        g.is_constant = global.is_const;
        if (global.init) {
            std::visit(
                [&g](const auto& v) {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, int64_t>) {
                        g.initializer = ConstInt{normalize_int(v, *g.type)};
                    } else if constexpr (std::is_same_v<T, double>) {
                        g.initializer = ConstFloat{v};
                    } else {
                        g.initializer = ConstBool{v};
                    }
                },
                *global.init);
        }
        module_.globals[g.name] = std::move(g);
    }

    for (const auto& decl : ast_module.functions) {
        declare_function(decl);
        if (error_) {
            return *error_;
        }
    }

    // No functions are added past this point, so pointers into the arena
    // stay valid while bodies are lowered.
    for (size_t i = 0; i < ast_module.functions.size(); ++i) {
        const auto& decl = ast_module.functions[i];
        if (!decl.body) {
            continue;
        }
        build_function(decl, module_.functions[i]);
        if (error_) {
            return *error_;
        }
    }

    KIR_LOG_DEBUG("build", "lowered module '" << module_.name << "' with "
                                              << module_.functions.size() << " functions");
    return std::move(module_);
}

void IrBuilder::declare_function(const ast::FuncDecl& decl) {
    Function func;
    func.name = decl.name;
    func.return_type = convert_type(decl.return_type, decl.span);
    func.attributes = decl.attributes;
    if (!decl.body) {
        func.attributes.push_back("external");
    }
    for (const auto& param : decl.params) {
        auto type = convert_type(param.type, param.span);
        if (type->is_void()) {
            report_ice("parameter '" + param.name + "' has unit type", param.span);
        }
        func.add_param(param.name, std::move(type));
    }

    auto added = module_.add_function(std::move(func));
    if (is_err(added)) {
        report_ice(unwrap_err(added), decl.span);
    }
}

void IrBuilder::build_function(const ast::FuncDecl& decl, Function& func) {
    ctx_ = BuildContext{};
    ctx_.func = &func;
    ctx_.span = decl.span;

    const auto& body = **decl.body;
    scan_slots(body);

    switch_to_block(create_block("entry"));

    for (size_t i = 0; i < decl.params.size(); ++i) {
        const auto& param = decl.params[i];
        const auto& ir_param = func.params[i];
        auto value = make_register(ir_param.value_id, ir_param.type);
        bind_local(param.binding, param.name, ir_param.type, value);
    }

    auto result = build_expr(body);

    if (!is_terminated()) {
        ctx_.span = body.span();
        if (func.return_type->is_void()) {
            emit_return(std::nullopt);
        } else if (!result.is_undef() && type_equals(result.type, func.return_type)) {
            emit_return(result);
        } else {
            // Every path returned explicitly; the fallthrough is dead
            emit_void(UnreachableInst{});
        }
    }

    func.remove_unreachable_blocks();
    func.rebuild_cfg();

    KIR_LOG_TRACE("build", "lowered '" << func.name << "': " << func.blocks.size() << " blocks, "
                                       << func.instruction_count() << " instructions");
}

auto build_module(const ast::Module& ast_module) -> Result<Module, Diagnostic> {
    IrBuilder builder;
    return builder.build(ast_module);
}

} // namespace kir::ir
