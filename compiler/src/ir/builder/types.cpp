// KIR Builder - Type Conversion
//
// Maps typed-AST types onto KIR types. Types with no KIR representation
// (strings, tuples, closures) are internal compiler errors: the front end is
// expected to have desugared them before handing the tree over.

#include "ir/ir_builder.hpp"
#include "log/log.hpp"

namespace kir::ir {

void IrBuilder::report_ice(const std::string& message, const SourceSpan& span) {
    if (error_) {
        return; // Keep the first error
    }
    std::string func_name = ctx_.func ? ctx_.func->name : "";
    KIR_LOG_ERROR("build", "internal compiler error in '" << func_name << "': " << message);
    error_ = make_diagnostic(DiagnosticKind::InternalCompilerError, Stage::Build, func_name,
                             message, span);
}

auto IrBuilder::convert_type(const ast::TypePtr& type, const SourceSpan& span) -> IrTypePtr {
    if (!type) {
        report_ice("expression has no resolved type", span);
        return make_void_type();
    }
    switch (type->kind) {
    case ast::TypeKind::Unit:
        return make_void_type();
    case ast::TypeKind::Bool:
        return make_bool_type();
    case ast::TypeKind::I8:
        return make_primitive_type(PrimitiveType::I8);
    case ast::TypeKind::I16:
        return make_primitive_type(PrimitiveType::I16);
    case ast::TypeKind::I32:
        return make_primitive_type(PrimitiveType::I32);
    case ast::TypeKind::I64:
        return make_primitive_type(PrimitiveType::I64);
    case ast::TypeKind::U8:
        return make_primitive_type(PrimitiveType::U8);
    case ast::TypeKind::U16:
        return make_primitive_type(PrimitiveType::U16);
    case ast::TypeKind::U32:
        return make_primitive_type(PrimitiveType::U32);
    case ast::TypeKind::U64:
        return make_primitive_type(PrimitiveType::U64);
    case ast::TypeKind::F32:
        return make_primitive_type(PrimitiveType::F32);
    case ast::TypeKind::F64:
        return make_primitive_type(PrimitiveType::F64);
    case ast::TypeKind::Ptr:
        return make_ptr_type();
    case ast::TypeKind::Str:
    case ast::TypeKind::Tuple:
    case ast::TypeKind::Closure:
        break;
    }
    report_ice("type '" + type->to_string() + "' has no IR representation", span);
    return make_void_type();
}

auto IrBuilder::cast_kind(const IrTypePtr& from, const IrTypePtr& to) -> std::optional<CastKind> {
    int from_bits = from->bit_width();
    int to_bits = to->bit_width();

    if ((from->is_integer() || from->is_bool()) && to->is_integer()) {
        if (from_bits < to_bits) {
            return from->is_signed() ? CastKind::SExt : CastKind::ZExt;
        }
        if (from_bits > to_bits) {
            return CastKind::Trunc;
        }
        return CastKind::Bitcast;
    }
    if (from->is_integer() && to->is_float()) {
        return from->is_signed() ? CastKind::SiToFp : CastKind::UiToFp;
    }
    if (from->is_float() && to->is_integer()) {
        return to->is_signed() ? CastKind::FpToSi : CastKind::FpToUi;
    }
    if (from->is_float() && to->is_float()) {
        return from_bits > to_bits ? CastKind::FpTrunc : CastKind::FpExt;
    }
    if (from->is_pointer() && to->is_integer()) {
        return CastKind::PtrToInt;
    }
    if (from->is_integer() && to->is_pointer()) {
        return CastKind::IntToPtr;
    }
    return std::nullopt;
}

} // namespace kir::ir
