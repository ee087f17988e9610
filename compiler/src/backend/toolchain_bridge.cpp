//! Toolchain Bridge
//!
//! LLVM-style textual IR from the SSA module.
//!
//! ## Naming
//!
//! | KIR            | Emitted          |
//! |----------------|------------------|
//! | register %N    | `%vN`            |
//! | block bbN      | `bbN`            |
//! | global @g      | `@g`             |
//! | float constant | 64-bit hex image |
//!
//! Intrinsics and memory builtins become calls to `llvm.*` functions; their
//! declarations are collected while emitting and appended at the end.

#include "backend/toolchain_bridge.hpp"

#include "log/log.hpp"

#include <bit>
#include <iomanip>

namespace kir::backend {

using namespace ir;

namespace {

auto hex_double(double value) -> std::string {
    std::ostringstream out;
    out << "0x" << std::hex << std::uppercase << std::setw(16) << std::setfill('0')
        << std::bit_cast<uint64_t>(value);
    return out.str();
}

// Type suffix of overloaded intrinsics ("i32", "f64")
auto intrinsic_suffix(const IrTypePtr& type) -> std::string {
    if (type->is_float()) {
        return type->bit_width() == 32 ? "f32" : "f64";
    }
    return "i" + std::to_string(type->bit_width());
}

auto constant_text(const Constant& c, const IrTypePtr& type) -> std::string {
    return std::visit(
        [&type](const auto& k) -> std::string {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, ConstInt>) {
                // Unsigned 64-bit values print as their two's-complement image
                return std::to_string(k.value);
            } else if constexpr (std::is_same_v<T, ConstFloat>) {
                if (type && type->bit_width() == 32) {
                    return hex_double(static_cast<double>(static_cast<float>(k.value)));
                }
                return hex_double(k.value);
            } else if constexpr (std::is_same_v<T, ConstBool>) {
                return k.value ? "true" : "false";
            } else {
                return "null";
            }
        },
        c);
}

auto binary_opcode(BinOp op, const IrTypePtr& type) -> std::string {
    bool is_float = type->is_float();
    bool is_signed = type->is_signed();
    switch (op) {
    case BinOp::Add:
        return is_float ? "fadd" : "add";
    case BinOp::Sub:
        return is_float ? "fsub" : "sub";
    case BinOp::Mul:
        return is_float ? "fmul" : "mul";
    case BinOp::Div:
        return is_float ? "fdiv" : (is_signed ? "sdiv" : "udiv");
    case BinOp::Rem:
        return is_float ? "frem" : (is_signed ? "srem" : "urem");
    case BinOp::And:
        return "and";
    case BinOp::Or:
        return "or";
    case BinOp::Xor:
        return "xor";
    case BinOp::Shl:
        return "shl";
    case BinOp::Shr:
        return is_signed ? "ashr" : "lshr";
    }
    return "add";
}

auto compare_predicate(CmpOp op, const IrTypePtr& type) -> std::string {
    if (type->is_float()) {
        // Ordered except for inequality, which holds for NaN
        switch (op) {
        case CmpOp::Eq:
            return "fcmp oeq";
        case CmpOp::Ne:
            return "fcmp une";
        case CmpOp::Lt:
            return "fcmp olt";
        case CmpOp::Le:
            return "fcmp ole";
        case CmpOp::Gt:
            return "fcmp ogt";
        case CmpOp::Ge:
            return "fcmp oge";
        }
    }
    std::string prefix = type->is_signed() ? "s" : "u";
    switch (op) {
    case CmpOp::Eq:
        return "icmp eq";
    case CmpOp::Ne:
        return "icmp ne";
    case CmpOp::Lt:
        return "icmp " + prefix + "lt";
    case CmpOp::Le:
        return "icmp " + prefix + "le";
    case CmpOp::Gt:
        return "icmp " + prefix + "gt";
    case CmpOp::Ge:
        return "icmp " + prefix + "ge";
    }
    return "icmp eq";
}

auto cast_opcode(CastKind kind) -> const char* {
    switch (kind) {
    case CastKind::Trunc:
        return "trunc";
    case CastKind::ZExt:
        return "zext";
    case CastKind::SExt:
        return "sext";
    case CastKind::FpToSi:
        return "fptosi";
    case CastKind::FpToUi:
        return "fptoui";
    case CastKind::SiToFp:
        return "sitofp";
    case CastKind::UiToFp:
        return "uitofp";
    case CastKind::FpTrunc:
        return "fptrunc";
    case CastKind::FpExt:
        return "fpext";
    case CastKind::PtrToInt:
        return "ptrtoint";
    case CastKind::IntToPtr:
        return "inttoptr";
    case CastKind::Bitcast:
        return "bitcast";
    }
    return "bitcast";
}

auto atomic_rmw_name(AtomicOp op) -> const char* {
    switch (op) {
    case AtomicOp::Add:
        return "add";
    case AtomicOp::Sub:
        return "sub";
    default:
        return "xchg";
    }
}

} // namespace

// ============================================================================
// ABI Table
// ============================================================================

auto AbiEntry::to_string() const -> std::string {
    std::string s = function + "(";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            s += ", ";
        }
        s += args[i];
    }
    s += ") -> " + ret + ", stack align " + std::to_string(stack_alignment);
    return s;
}

auto abi_entry(const Function& func, const regalloc::CallingConvention& cc) -> AbiEntry {
    AbiEntry entry;
    entry.function = func.name;
    entry.stack_alignment = cc.stack_alignment;

    size_t int_index = 0;
    size_t float_index = 0;
    int stack_offset = 0;
    for (const auto& param : func.params) {
        bool is_float = regalloc::reg_class_of(param.type) == regalloc::RegClass::Vector;
        const auto& regs = is_float ? cc.float_args : cc.int_args;
        size_t& index = is_float ? float_index : int_index;
        if (index < regs.size()) {
            entry.args.push_back(regs[index++]);
        } else {
            entry.args.push_back("stack+" + std::to_string(stack_offset));
            stack_offset += cc.stack_slot_size;
        }
    }

    if (!func.return_type || func.return_type->is_void()) {
        entry.ret = "void";
    } else if (regalloc::reg_class_of(func.return_type) == regalloc::RegClass::Vector) {
        entry.ret = cc.float_return;
    } else {
        entry.ret = cc.int_return;
    }
    return entry;
}

auto abi_table(const Module& module, const regalloc::CallingConvention& cc)
    -> std::vector<AbiEntry> {
    std::vector<AbiEntry> table;
    table.reserve(module.functions.size());
    for (const auto& func : module.functions) {
        table.push_back(abi_entry(func, cc));
    }
    return table;
}

auto llvm_type(const IrTypePtr& type) -> std::string {
    if (!type) {
        return "void";
    }
    return std::visit(
        [](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, IrPrimitiveType>) {
                switch (t.kind) {
                case PrimitiveType::Void:
                    return "void";
                case PrimitiveType::Bool:
                    return "i1";
                case PrimitiveType::I8:
                case PrimitiveType::U8:
                    return "i8";
                case PrimitiveType::I16:
                case PrimitiveType::U16:
                    return "i16";
                case PrimitiveType::I32:
                case PrimitiveType::U32:
                    return "i32";
                case PrimitiveType::I64:
                case PrimitiveType::U64:
                    return "i64";
                case PrimitiveType::F32:
                    return "float";
                case PrimitiveType::F64:
                    return "double";
                case PrimitiveType::Ptr:
                    return "ptr";
                }
                return "void";
            } else if constexpr (std::is_same_v<T, IrArrayType>) {
                return "[" + std::to_string(t.size) + " x " + llvm_type(t.element) + "]";
            } else {
                std::string s = "{ ";
                for (size_t i = 0; i < t.fields.size(); ++i) {
                    if (i > 0) {
                        s += ", ";
                    }
                    s += llvm_type(t.fields[i]);
                }
                return s + " }";
            }
        },
        type->kind);
}

// ============================================================================
// Emission
// ============================================================================

void ToolchainBridge::emitln(const std::string& s) {
    output_ << s << "\n";
}

auto ToolchainBridge::value(const Value& v) const -> std::string {
    if (v.is_register()) {
        return "%v" + std::to_string(v.reg());
    }
    if (v.is_global()) {
        return "@" + std::get<GlobalRef>(v.kind).symbol;
    }
    if (const auto* c = v.as_constant()) {
        return constant_text(*c, v.type);
    }
    return "undef";
}

auto ToolchainBridge::typed(const Value& v) const -> std::string {
    return llvm_type(v.type) + " " + value(v);
}

auto ToolchainBridge::result(const InstructionData& inst) const -> std::string {
    return "%v" + std::to_string(inst.result);
}

auto ToolchainBridge::block_label(BlockId id) const -> std::string {
    return "bb" + std::to_string(id);
}

auto ToolchainBridge::emit(const CompiledModule& compiled) -> Result<std::string, Diagnostic> {
    output_.str("");
    output_.clear();
    intrinsic_decls_.clear();
    module_ = &compiled.ssa_module;

    emitln("; ModuleID = '" + module_->name + "'");
    emitln("source_filename = \"" + module_->name + "\"");
    emitln("target datalayout = \"" + target_.layout.to_string() + "\"");
    emitln("target triple = \"" + target_.triple + "\"");

    if (!module_->globals.empty()) {
        emitln();
        for (const auto& [name, global] : module_->globals) {
            std::string init = global.initializer ? constant_text(*global.initializer, global.type)
                                                  : "zeroinitializer";
            emitln("@" + name + " = " + (global.is_constant ? "constant " : "global ") +
                   llvm_type(global.type) + " " + init);
        }
    }

    for (const auto& func : module_->functions) {
        if (auto error = emit_function(func)) {
            KIR_LOG_ERROR("backend", error->to_string());
            module_ = nullptr;
            return *error;
        }
    }

    if (!intrinsic_decls_.empty()) {
        emitln();
        for (const auto& decl : intrinsic_decls_) {
            emitln(decl);
        }
    }

    module_ = nullptr;
    KIR_LOG_DEBUG("backend", "toolchain bridge emitted " << compiled.ssa_module.functions.size()
                                                         << " functions for " << target_.triple);
    return output_.str();
}

auto ToolchainBridge::emit_function(const Function& func) -> std::optional<Diagnostic> {
    current_ = &func;
    emitln();
    emitln("; abi: " + abi_entry(func, target_.convention).to_string());

    std::string signature = llvm_type(func.return_type) + " @" + func.name + "(";
    for (size_t i = 0; i < func.params.size(); ++i) {
        if (i > 0) {
            signature += ", ";
        }
        signature += llvm_type(func.params[i].type);
        if (!func.is_declaration()) {
            signature += " %v" + std::to_string(func.params[i].value_id);
        }
    }
    signature += ")";

    if (func.is_declaration()) {
        emitln("declare " + signature);
        current_ = nullptr;
        return std::nullopt;
    }

    if (func.has_attribute("noinline")) {
        signature += " noinline";
    } else if (func.has_attribute("inline")) {
        signature += " inlinehint";
    }
    emitln("define " + signature + " {");
    for (const auto& block : func.blocks) {
        emitln(block_label(block.id) + ":");
        for (const auto& inst : block.instructions) {
            if (auto error = emit_instruction(inst)) {
                current_ = nullptr;
                return error;
            }
        }
    }
    emitln("}");
    current_ = nullptr;
    return std::nullopt;
}

auto ToolchainBridge::emit_instruction(const InstructionData& inst) -> std::optional<Diagnostic> {
    std::optional<Diagnostic> error;
    std::string r = inst.has_result() ? result(inst) : "";
    std::string ty = llvm_type(inst.type);

    std::visit(
        [&](const auto& i) {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, BinaryInst>) {
                emitln("    " + r + " = " + binary_opcode(i.op, inst.type) + " " + ty + " " +
                       value(i.lhs) + ", " + value(i.rhs));
            } else if constexpr (std::is_same_v<T, CompareInst>) {
                emitln("    " + r + " = " + compare_predicate(i.op, i.lhs.type) + " " +
                       llvm_type(i.lhs.type) + " " + value(i.lhs) + ", " + value(i.rhs));
            } else if constexpr (std::is_same_v<T, UnaryInst>) {
                if (i.op == UnaryOp::Neg) {
                    if (inst.type->is_float()) {
                        emitln("    " + r + " = fneg " + typed(i.operand));
                    } else {
                        emitln("    " + r + " = sub " + ty + " 0, " + value(i.operand));
                    }
                } else {
                    std::string ones = inst.type->is_bool() ? "true" : "-1";
                    emitln("    " + r + " = xor " + typed(i.operand) + ", " + ones);
                }
            } else if constexpr (std::is_same_v<T, CastInst>) {
                emitln("    " + r + " = " + cast_opcode(i.kind) + " " + typed(i.operand) + " to " +
                       ty);
            } else if constexpr (std::is_same_v<T, CopyInst>) {
                emitln("    " + r + " = select i1 true, " + typed(i.source) + ", " +
                       typed(i.source));
            } else if constexpr (std::is_same_v<T, PhiInst>) {
                std::string line = "    " + r + " = phi " + ty + " ";
                for (size_t k = 0; k < i.incoming.size(); ++k) {
                    if (k > 0) {
                        line += ", ";
                    }
                    line += "[ " + value(i.incoming[k].value) + ", %" +
                            block_label(i.incoming[k].block) + " ]";
                }
                emitln(line);
            } else if constexpr (std::is_same_v<T, AllocaInst>) {
                emitln("    " + r + " = alloca " + llvm_type(i.alloc_type));
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                if (i.spill_slot) {
                    error = make_diagnostic(DiagnosticKind::UnsupportedOpcode, Stage::Backend,
                                            current_->name, "spill reload in an SSA module",
                                            inst.span);
                    return;
                }
                emitln("    " + r + " = load " + (i.is_volatile ? "volatile " : "") + ty + ", " +
                       typed(i.ptr));
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                if (i.spill_slot) {
                    error = make_diagnostic(DiagnosticKind::UnsupportedOpcode, Stage::Backend,
                                            current_->name, "spill store in an SSA module",
                                            inst.span);
                    return;
                }
                emitln(std::string("    store ") + (i.is_volatile ? "volatile " : "") +
                       typed(i.value) + ", " + typed(i.ptr));
            } else if constexpr (std::is_same_v<T, MemsetInst>) {
                std::string byte = value(i.byte);
                if (llvm_type(i.byte.type) != "i8") {
                    byte = r.empty() ? "%memset.byte" : r + ".byte";
                    std::string op = i.byte.type->bit_width() > 8 ? "trunc" : "zext";
                    emitln("    " + byte + " = " + op + " " + typed(i.byte) + " to i8");
                }
                std::string name = "llvm.memset.p0." + intrinsic_suffix(i.size.type);
                intrinsic_decls_.insert("declare void @" + name + "(ptr, i8, " +
                                        llvm_type(i.size.type) + ", i1)");
                emitln("    call void @" + name + "(" + typed(i.dest) + ", i8 " + byte + ", " +
                       typed(i.size) + ", i1 false)");
            } else if constexpr (std::is_same_v<T, MemcpyInst>) {
                // Overlapping ranges are allowed
                std::string name = "llvm.memmove.p0.p0." + intrinsic_suffix(i.size.type);
                intrinsic_decls_.insert("declare void @" + name + "(ptr, ptr, " +
                                        llvm_type(i.size.type) + ", i1)");
                emitln("    call void @" + name + "(" + typed(i.dest) + ", " + typed(i.src) + ", " +
                       typed(i.size) + ", i1 false)");
            } else if constexpr (std::is_same_v<T, CallInst>) {
                std::string args;
                for (size_t k = 0; k < i.args.size(); ++k) {
                    if (k > 0) {
                        args += ", ";
                    }
                    args += typed(i.args[k]);
                }
                std::string prefix = inst.has_result() ? r + " = " : "";
                emitln("    " + prefix + "call " + ty + " @" + i.callee + "(" + args + ")");
            } else if constexpr (std::is_same_v<T, AtomicInst>) {
                switch (i.op) {
                case AtomicOp::Load:
                    emitln("    " + r + " = load atomic " + ty + ", " + typed(i.ptr) +
                           " seq_cst, align " + std::to_string(inst.type->size_in_bytes()));
                    break;
                case AtomicOp::Store:
                    emitln("    store atomic " + typed(*i.value) + ", " + typed(i.ptr) +
                           " seq_cst, align " + std::to_string(i.value->type->size_in_bytes()));
                    break;
                case AtomicOp::CmpXchg:
                    emitln("    " + r + ".pair = cmpxchg " + typed(i.ptr) + ", " +
                           typed(*i.expected) + ", " + typed(*i.value) + " seq_cst seq_cst");
                    emitln("    " + r + " = extractvalue { " + ty + ", i1 } " + r + ".pair, 0");
                    break;
                default:
                    emitln("    " + r + " = atomicrmw " + atomic_rmw_name(i.op) + " " +
                           typed(i.ptr) + ", " + typed(*i.value) + " seq_cst");
                    break;
                }
            } else if constexpr (std::is_same_v<T, IntrinsicInst>) {
                emit_intrinsic(inst, i);
            } else {
                emit_terminator(inst);
            }
        },
        inst.inst);
    return error;
}

void ToolchainBridge::emit_intrinsic(const InstructionData& inst, const IntrinsicInst& intrinsic) {
    if (intrinsic.kind == IntrinsicKind::Trap) {
        intrinsic_decls_.insert("declare void @llvm.trap()");
        emitln("    call void @llvm.trap()");
        return;
    }

    const auto& type = inst.type;
    std::string suffix = intrinsic_suffix(type);
    std::string ty = llvm_type(type);
    std::string base;
    switch (intrinsic.kind) {
    case IntrinsicKind::Abs:
        base = type->is_float() ? "fabs" : "abs";
        break;
    case IntrinsicKind::Min:
        base = type->is_float() ? "minnum" : (type->is_signed() ? "smin" : "umin");
        break;
    case IntrinsicKind::Max:
        base = type->is_float() ? "maxnum" : (type->is_signed() ? "smax" : "umax");
        break;
    case IntrinsicKind::Sqrt:
        base = "sqrt";
        break;
    case IntrinsicKind::Trap:
        break;
    }

    std::string name = "llvm." + base + "." + suffix;
    std::string decl_params;
    std::string args;
    for (size_t k = 0; k < intrinsic.args.size(); ++k) {
        if (k > 0) {
            decl_params += ", ";
            args += ", ";
        }
        decl_params += ty;
        args += typed(intrinsic.args[k]);
    }
    // Integer abs takes an is-int-min-poison flag
    if (intrinsic.kind == IntrinsicKind::Abs && !type->is_float()) {
        decl_params += ", i1";
        args += ", i1 false";
    }
    intrinsic_decls_.insert("declare " + ty + " @" + name + "(" + decl_params + ")");
    emitln("    " + result(inst) + " = call " + ty + " @" + name + "(" + args + ")");
}

void ToolchainBridge::emit_terminator(const InstructionData& inst) {
    std::visit(
        [this](const auto& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, JumpInst>) {
                emitln("    br label %" + block_label(t.target));
            } else if constexpr (std::is_same_v<T, JumpIfInst>) {
                emitln("    br " + typed(t.condition) + ", label %" + block_label(t.then_block) +
                       ", label %" + block_label(t.else_block));
            } else if constexpr (std::is_same_v<T, SwitchInst>) {
                std::string ty = llvm_type(t.discriminant.type);
                emitln("    switch " + typed(t.discriminant) + ", label %" +
                       block_label(t.default_block) + " [");
                for (const auto& [v, target] : t.cases) {
                    emitln("        " + ty + " " + std::to_string(v) + ", label %" +
                           block_label(target));
                }
                emitln("    ]");
            } else if constexpr (std::is_same_v<T, RetInst>) {
                if (t.value) {
                    emitln("    ret " + typed(*t.value));
                } else {
                    emitln("    ret void");
                }
            } else if constexpr (std::is_same_v<T, UnreachableInst>) {
                emitln("    unreachable");
            }
        },
        inst.inst);
}

} // namespace kir::backend
