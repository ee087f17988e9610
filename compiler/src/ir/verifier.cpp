// KIR Verifier Implementation

#include "ir/verifier.hpp"

#include "ir/cfg.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

namespace kir::ir {

namespace {

auto malformed(const Function& func, const std::string& message,
               std::optional<SourceSpan> span = std::nullopt) -> Diagnostic {
    return make_diagnostic(DiagnosticKind::MalformedIr, Stage::Verify, func.name, message,
                           std::move(span));
}

auto describe(const BasicBlock& block, const InstructionData& inst) -> std::string {
    IrPrinter printer;
    return "bb" + std::to_string(block.id) + ": '" + printer.print_instruction(inst) + "'";
}

auto same(const IrTypePtr& a, const IrTypePtr& b) -> bool {
    return type_equals(a, b);
}

auto is_void_type(const IrTypePtr& t) -> bool {
    return !t || t->is_void();
}

} // namespace

auto IrVerifier::verify() -> Result<Ok, Diagnostic> {
    for (const auto& func : module_.functions) {
        auto result = verify_function(func);
        if (is_err(result)) {
            return result;
        }
    }
    return Ok{};
}

auto IrVerifier::verify_function(const Function& func) -> Result<Ok, Diagnostic> {
    if (func.is_declaration()) {
        return Ok{};
    }
    if (auto diag = check_cfg(func)) {
        return *diag;
    }
    if (auto diag = check_phis(func)) {
        return *diag;
    }
    DominatorTree dom(func);
    if (auto diag = check_ssa(func, dom)) {
        return *diag;
    }
    if (auto diag = check_types(func)) {
        return *diag;
    }
    return Ok{};
}

// ============================================================================
// CFG
// ============================================================================

auto IrVerifier::check_cfg(const Function& func) -> std::optional<Diagnostic> {
    std::set<BlockId> ids;
    for (const auto& block : func.blocks) {
        if (!ids.insert(block.id).second) {
            return malformed(func, "duplicate block id bb" + std::to_string(block.id));
        }
    }

    std::unordered_map<BlockId, std::set<BlockId>> expected_preds;
    for (const auto& block : func.blocks) {
        if (block.instructions.empty()) {
            return malformed(func, "bb" + std::to_string(block.id) + " is empty");
        }
        for (size_t i = 0; i + 1 < block.instructions.size(); ++i) {
            if (is_terminator(block.instructions[i].inst)) {
                return malformed(func,
                                 describe(block, block.instructions[i]) +
                                     " is a terminator in the middle of the block",
                                 block.instructions[i].span);
            }
        }
        const auto& last = block.instructions.back();
        if (!is_terminator(last.inst)) {
            return malformed(func, "bb" + std::to_string(block.id) + " has no terminator");
        }
        for (BlockId succ : successors(last.inst)) {
            if (!ids.contains(succ)) {
                return malformed(func, describe(block, last) + " names missing block bb" +
                                           std::to_string(succ),
                                 last.span);
            }
            if (succ == func.blocks.front().id) {
                return malformed(func, describe(block, last) + " branches to the entry block",
                                 last.span);
            }
            expected_preds[succ].insert(block.id);
        }
    }

    for (const auto& block : func.blocks) {
        std::set<BlockId> stored(block.predecessors.begin(), block.predecessors.end());
        if (stored.size() != block.predecessors.size()) {
            return malformed(func, "bb" + std::to_string(block.id) +
                                       " lists a predecessor more than once");
        }
        if (stored != expected_preds[block.id]) {
            return malformed(func, "bb" + std::to_string(block.id) +
                                       " predecessor list does not match the terminators");
        }
    }
    return std::nullopt;
}

// ============================================================================
// Phis
// ============================================================================

auto IrVerifier::check_phis(const Function& func) -> std::optional<Diagnostic> {
    for (const auto& block : func.blocks) {
        bool past_phis = false;
        std::set<BlockId> preds(block.predecessors.begin(), block.predecessors.end());
        for (const auto& inst : block.instructions) {
            const auto* phi = inst.as<PhiInst>();
            if (!phi) {
                past_phis = true;
                continue;
            }
            if (past_phis) {
                return malformed(func, describe(block, inst) + " follows a non-phi instruction",
                                 inst.span);
            }
            std::set<BlockId> incoming;
            for (const auto& in : phi->incoming) {
                if (!incoming.insert(in.block).second) {
                    return malformed(func, describe(block, inst) + " names bb" +
                                               std::to_string(in.block) + " twice",
                                     inst.span);
                }
            }
            if (incoming != preds) {
                return malformed(func,
                                 describe(block, inst) +
                                     " operands do not match the block's predecessors",
                                 inst.span);
            }
        }
    }
    return std::nullopt;
}

// ============================================================================
// SSA
// ============================================================================

auto IrVerifier::check_ssa(const Function& func, const DominatorTree& dom)
    -> std::optional<Diagnostic> {
    struct Def {
        BlockId block;
        size_t index; // SIZE_MAX for parameters
        IrTypePtr type;
    };
    std::unordered_map<ValueId, Def> defs;
    BlockId entry = func.blocks.front().id;

    for (const auto& param : func.params) {
        if (!defs.emplace(param.value_id, Def{entry, SIZE_MAX, param.type}).second) {
            return malformed(func, "parameter register %" + std::to_string(param.value_id) +
                                       " is defined twice");
        }
    }
    for (const auto& block : func.blocks) {
        for (size_t i = 0; i < block.instructions.size(); ++i) {
            const auto& inst = block.instructions[i];
            if (!inst.has_result()) {
                continue;
            }
            if (!defs.emplace(inst.result, Def{block.id, i, inst.type}).second) {
                return malformed(func,
                                 "register %" + std::to_string(inst.result) +
                                     " has more than one definition (" + describe(block, inst) +
                                     ")",
                                 inst.span);
            }
            if (inst.result >= func.next_value_id) {
                return malformed(func, describe(block, inst) +
                                           " defines a register beyond the function's counter");
            }
        }
    }

    auto check_use = [&](const BasicBlock& block, size_t index, const InstructionData& inst,
                         const Value& v, std::optional<BlockId> phi_pred)
        -> std::optional<Diagnostic> {
        auto it = defs.find(v.reg());
        if (it == defs.end()) {
            return malformed(func,
                             describe(block, inst) + " uses undefined register %" +
                                 std::to_string(v.reg()),
                             inst.span);
        }
        const Def& def = it->second;
        if (!same(def.type, v.type)) {
            return malformed(func,
                             describe(block, inst) + " uses %" + std::to_string(v.reg()) +
                                 " as " + (v.type ? v.type->to_string() : "<null>") +
                                 " but it is defined as " + def.type->to_string(),
                             inst.span);
        }
        if (def.index == SIZE_MAX) {
            return std::nullopt;
        }
        bool ok;
        if (phi_pred) {
            ok = dom.dominates(def.block, *phi_pred);
        } else if (def.block == block.id) {
            ok = def.index < index;
        } else {
            ok = dom.dominates(def.block, block.id);
        }
        if (!ok) {
            return malformed(func,
                             describe(block, inst) + " uses %" + std::to_string(v.reg()) +
                                 " which does not dominate the use",
                             inst.span);
        }
        return std::nullopt;
    };

    for (const auto& block : func.blocks) {
        if (!dom.is_reachable(block.id)) {
            continue;
        }
        for (size_t i = 0; i < block.instructions.size(); ++i) {
            const auto& inst = block.instructions[i];
            if (const auto* phi = inst.as<PhiInst>()) {
                for (const auto& in : phi->incoming) {
                    if (!in.value.is_register() || !dom.is_reachable(in.block)) {
                        continue;
                    }
                    if (auto diag = check_use(block, i, inst, in.value, in.block)) {
                        return diag;
                    }
                }
                continue;
            }
            for (const auto& v : operands(inst.inst)) {
                if (!v.is_register()) {
                    continue;
                }
                if (auto diag = check_use(block, i, inst, v, std::nullopt)) {
                    return diag;
                }
            }
        }
    }
    return std::nullopt;
}

// ============================================================================
// Types
// ============================================================================

auto IrVerifier::check_types(const Function& func) -> std::optional<Diagnostic> {
    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            if (auto problem = check_instruction_types(func, inst)) {
                return malformed(func, describe(block, inst) + ": " + *problem, inst.span);
            }
        }
    }
    return std::nullopt;
}

auto IrVerifier::check_instruction_types(const Function& func, const InstructionData& data)
    -> std::optional<std::string> {
    const auto& rt = data.type;
    bool void_result = is_void_type(rt);

    if (data.has_result() && void_result) {
        return "instruction with a result register has void type";
    }
    if (!data.has_result() && !void_result) {
        return "instruction with a non-void type has no result register";
    }

    return std::visit(
        [&](const auto& i) -> std::optional<std::string> {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, JumpIfInst>) {
                if (!i.condition.type || !i.condition.type->is_bool()) {
                    return "condition is not bool";
                }
            } else if constexpr (std::is_same_v<T, SwitchInst>) {
                if (!i.discriminant.type || !i.discriminant.type->is_integer()) {
                    return "switch discriminant is not an integer";
                }
            } else if constexpr (std::is_same_v<T, RetInst>) {
                if (is_void_type(func.return_type)) {
                    if (i.value) {
                        return "returns a value from a void function";
                    }
                } else if (!i.value || !same(i.value->type, func.return_type)) {
                    return "return value does not match " + func.return_type->to_string();
                }
            } else if constexpr (std::is_same_v<T, CallInst>) {
                const auto* callee = module_.find_function(i.callee);
                if (!callee) {
                    return "call to unknown function @" + i.callee;
                }
                if (callee->params.size() != i.args.size()) {
                    return "call passes " + std::to_string(i.args.size()) + " arguments, @" +
                           i.callee + " takes " + std::to_string(callee->params.size());
                }
                for (size_t a = 0; a < i.args.size(); ++a) {
                    if (!same(i.args[a].type, callee->params[a].type)) {
                        return "argument " + std::to_string(a) + " type mismatch";
                    }
                }
                if (is_void_type(callee->return_type) != void_result ||
                    (!void_result && !same(rt, callee->return_type))) {
                    return "result type does not match @" + i.callee + "'s return type";
                }
            } else if constexpr (std::is_same_v<T, AllocaInst>) {
                if (void_result || !rt->is_pointer()) {
                    return "alloca must produce ptr";
                }
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                if (!i.spill_slot && (!i.ptr.type || !i.ptr.type->is_pointer())) {
                    return "load address is not a pointer";
                }
                if (void_result) {
                    return "load must produce a value";
                }
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                if (!i.spill_slot && (!i.ptr.type || !i.ptr.type->is_pointer())) {
                    return "store address is not a pointer";
                }
            } else if constexpr (std::is_same_v<T, MemsetInst>) {
                if (!i.dest.type->is_pointer() || !i.size.type->is_integer()) {
                    return "memset expects (ptr, byte, integer size)";
                }
            } else if constexpr (std::is_same_v<T, MemcpyInst>) {
                if (!i.dest.type->is_pointer() || !i.src.type->is_pointer() ||
                    !i.size.type->is_integer()) {
                    return "memcpy expects (ptr, ptr, integer size)";
                }
            } else if constexpr (std::is_same_v<T, BinaryInst>) {
                if (!same(i.lhs.type, rt) || !same(i.rhs.type, rt)) {
                    return "operand types differ from result type " + rt->to_string();
                }
                if (i.op == BinOp::Shl || i.op == BinOp::Shr) {
                    if (!rt->is_integer()) {
                        return "shift on non-integer type";
                    }
                } else if (is_bitwise(i.op)) {
                    if (!rt->is_integer() && !rt->is_bool()) {
                        return "bitwise op on non-integer type";
                    }
                } else if (!rt->is_integer() && !rt->is_float()) {
                    return "arithmetic on non-numeric type";
                }
            } else if constexpr (std::is_same_v<T, CompareInst>) {
                if (!same(i.lhs.type, i.rhs.type)) {
                    return "comparison operand types differ";
                }
                if (!rt->is_bool()) {
                    return "comparison must produce bool";
                }
            } else if constexpr (std::is_same_v<T, UnaryInst>) {
                if (!same(i.operand.type, rt)) {
                    return "operand type differs from result type";
                }
                if (i.op == UnaryOp::Neg && !rt->is_integer() && !rt->is_float()) {
                    return "negation of non-numeric type";
                }
                if (i.op == UnaryOp::Not && !rt->is_integer() && !rt->is_bool()) {
                    return "not of non-integer type";
                }
            } else if constexpr (std::is_same_v<T, CastInst>) {
                const auto& from = i.operand.type;
                if (void_result || !from) {
                    return "cast needs typed operand and result";
                }
                bool ok = true;
                switch (i.kind) {
                case CastKind::Trunc:
                    ok = from->is_integer() && (rt->is_integer() || rt->is_bool()) &&
                         from->bit_width() > rt->bit_width();
                    break;
                case CastKind::ZExt:
                case CastKind::SExt:
                    ok = (from->is_integer() || from->is_bool()) && rt->is_integer() &&
                         from->bit_width() < rt->bit_width();
                    break;
                case CastKind::FpToSi:
                case CastKind::FpToUi:
                    ok = from->is_float() && rt->is_integer();
                    break;
                case CastKind::SiToFp:
                case CastKind::UiToFp:
                    ok = from->is_integer() && rt->is_float();
                    break;
                case CastKind::FpTrunc:
                    ok = from->is_float() && rt->is_float() && from->bit_width() > rt->bit_width();
                    break;
                case CastKind::FpExt:
                    ok = from->is_float() && rt->is_float() && from->bit_width() < rt->bit_width();
                    break;
                case CastKind::PtrToInt:
                    ok = from->is_pointer() && rt->is_integer();
                    break;
                case CastKind::IntToPtr:
                    ok = from->is_integer() && rt->is_pointer();
                    break;
                case CastKind::Bitcast:
                    ok = from->bit_width() == rt->bit_width() && from->bit_width() > 0;
                    break;
                }
                if (!ok) {
                    return std::string("invalid ") + cast_name(i.kind) + " from " +
                           from->to_string() + " to " + rt->to_string();
                }
            } else if constexpr (std::is_same_v<T, AtomicInst>) {
                if (!i.ptr.type || !i.ptr.type->is_pointer()) {
                    return "atomic address is not a pointer";
                }
                bool needs_value = i.op != AtomicOp::Load;
                if (needs_value != i.value.has_value()) {
                    return "atomic operand count mismatch";
                }
                if ((i.op == AtomicOp::CmpXchg) != i.expected.has_value()) {
                    return "cmpxchg requires an expected value";
                }
                if (i.op == AtomicOp::Store) {
                    if (!void_result) {
                        return "atomic store produces no value";
                    }
                } else if (void_result) {
                    return "atomic op must produce the previous value";
                } else if (i.value && !same(i.value->type, rt)) {
                    return "atomic operand type differs from result type";
                }
            } else if constexpr (std::is_same_v<T, IntrinsicInst>) {
                size_t arity = 0;
                switch (i.kind) {
                case IntrinsicKind::Abs:
                case IntrinsicKind::Sqrt:
                    arity = 1;
                    break;
                case IntrinsicKind::Min:
                case IntrinsicKind::Max:
                    arity = 2;
                    break;
                case IntrinsicKind::Trap:
                    arity = 0;
                    break;
                }
                if (i.args.size() != arity) {
                    return std::string(intrinsic_name(i.kind)) + " takes " +
                           std::to_string(arity) + " arguments";
                }
                if (i.kind == IntrinsicKind::Trap) {
                    if (!void_result) {
                        return "trap produces no value";
                    }
                } else {
                    for (const auto& arg : i.args) {
                        if (!same(arg.type, rt)) {
                            return "intrinsic argument type differs from result type";
                        }
                    }
                    if (i.kind == IntrinsicKind::Sqrt && !rt->is_float()) {
                        return "sqrt of non-float type";
                    }
                }
            } else if constexpr (std::is_same_v<T, PhiInst>) {
                for (const auto& in : i.incoming) {
                    if (!same(in.value.type, rt)) {
                        return "phi operand from bb" + std::to_string(in.block) +
                               " has the wrong type";
                    }
                }
            } else if constexpr (std::is_same_v<T, CopyInst>) {
                if (!same(i.source.type, rt)) {
                    return "copy source type differs from result type";
                }
            }
            return std::nullopt;
        },
        data.inst);
}

// ============================================================================
// Entry Points
// ============================================================================

auto verify_module(const Module& module) -> Result<Ok, Diagnostic> {
    IrVerifier verifier(module);
    auto result = verifier.verify();
    if (is_err(result)) {
        KIR_LOG_ERROR("verify", unwrap_err(result).to_string());
    }
    return result;
}

auto verify_function(const Module& module, const Function& func) -> Result<Ok, Diagnostic> {
    IrVerifier verifier(module);
    auto result = verifier.verify_function(func);
    if (is_err(result)) {
        KIR_LOG_ERROR("verify", unwrap_err(result).to_string());
    }
    return result;
}

} // namespace kir::ir
