#pragma once

// Typed-AST declarations for builder and pipeline tests. Expression nodes
// come from the make_* helpers in ast/typed_ast.hpp; these add the
// declaration level.

#include "ast/typed_ast.hpp"

#include <string>
#include <vector>

namespace kir::test {

inline auto ty(ast::TypeKind kind) -> ast::TypePtr {
    return ast::make_type(kind);
}

inline auto param(ast::BindingId binding, const std::string& name,
                  ast::TypeKind kind = ast::TypeKind::I32) -> ast::Param {
    return ast::Param{binding, name, ty(kind), {}};
}

inline auto func(const std::string& name, std::vector<ast::Param> params, ast::TypeKind ret,
                 ast::ExprPtr body, std::vector<std::string> attributes = {}) -> ast::FuncDecl {
    ast::FuncDecl decl;
    decl.name = name;
    decl.params = std::move(params);
    decl.return_type = ty(ret);
    decl.body = std::move(body);
    decl.attributes = std::move(attributes);
    return decl;
}

inline auto extern_func(const std::string& name, std::vector<ast::Param> params,
                        ast::TypeKind ret) -> ast::FuncDecl {
    ast::FuncDecl decl;
    decl.name = name;
    decl.params = std::move(params);
    decl.return_type = ty(ret);
    return decl;
}

inline auto i32_var(ast::BindingId binding, const std::string& name) -> ast::ExprPtr {
    return ast::make_var(binding, name, ty(ast::TypeKind::I32));
}

// Module holding the given functions, in order
template <typename... Funcs> auto module_of(const std::string& name, Funcs&&... funcs)
    -> ast::Module {
    ast::Module module;
    module.name = name;
    (module.functions.push_back(std::forward<Funcs>(funcs)), ...);
    return module;
}

} // namespace kir::test
