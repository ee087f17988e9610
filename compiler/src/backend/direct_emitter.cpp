//! Direct Emitter
//!
//! Pseudo-assembly emission from the allocated module:
//! - emit_function: frame layout, parameter moves, blocks and edge stubs
//! - emit_instruction: one line group per KIR instruction
//! - emit_terminator: branches, with phi copies on the edges
//! - emit_parallel_move: sequentializes phi, parameter and argument copies

#include "backend/direct_emitter.hpp"

#include "log/log.hpp"
#include "regalloc/live_intervals.hpp"

#include <algorithm>
#include <iomanip>

namespace kir::backend {

using namespace ir;
using regalloc::Location;
using regalloc::RegClass;

namespace {

auto round_up(int64_t value, int64_t align) -> int64_t {
    return align <= 0 ? value : (value + align - 1) / align * align;
}

auto immediate(const Constant& c) -> std::string {
    return std::visit(
        [](const auto& k) -> std::string {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, ConstInt>) {
                return "#" + std::to_string(k.value);
            } else if constexpr (std::is_same_v<T, ConstFloat>) {
                std::ostringstream out;
                out << "#" << std::setprecision(17) << k.value;
                return out.str();
            } else if constexpr (std::is_same_v<T, ConstBool>) {
                return k.value ? "#1" : "#0";
            } else {
                return "#0";
            }
        },
        c);
}

auto is_memory(const std::string& loc) -> bool {
    return !loc.empty() && loc.front() == '[';
}

// Registers are the only locations that are neither memory nor immediates
auto is_register_name(const std::string& loc) -> bool {
    return !loc.empty() && loc.front() != '[' && loc.front() != '#' && loc.front() != '@';
}

auto binary_mnemonic(BinOp op, const IrTypePtr& type) -> std::string {
    if (type->is_float()) {
        return std::string("f") + binop_name(op);
    }
    bool is_signed = type->is_signed();
    switch (op) {
    case BinOp::Div:
        return is_signed ? "sdiv" : "udiv";
    case BinOp::Rem:
        return is_signed ? "srem" : "urem";
    case BinOp::Shr:
        return is_signed ? "asr" : "lsr";
    default:
        return binop_name(op);
    }
}

} // namespace

void DirectEmitter::emitln(const std::string& s) {
    output_ << s << "\n";
}

void DirectEmitter::emit_comment(const std::string& s) {
    output_ << "    ; " << s << "\n";
}

auto DirectEmitter::label(BlockId block) const -> std::string {
    return ".L" + current_->func->name + "_bb" + std::to_string(block);
}

auto DirectEmitter::operand(const Value& value) const -> std::string {
    if (value.is_register()) {
        auto loc = current_->allocation->location(value.reg());
        if (loc.kind == Location::Kind::Register) {
            return loc.reg;
        }
        if (loc.kind == Location::Kind::SpillSlot) {
            return slot_address(loc.slot);
        }
        return "%" + std::to_string(value.reg()); // Unallocated; the caller reports it
    }
    if (value.is_global()) {
        return "@" + std::get<GlobalRef>(value.kind).symbol;
    }
    if (const auto* c = value.as_constant()) {
        return immediate(*c);
    }
    return "#0"; // undef
}

auto DirectEmitter::operand(const OperandView& op) const -> std::string {
    return operand(op.value);
}

auto DirectEmitter::in_slot(const Value& value) const -> bool {
    return value.is_register() &&
           current_->allocation->location(value.reg()).kind == Location::Kind::SpillSlot;
}

auto DirectEmitter::slot_address(uint32_t slot) const -> std::string {
    return "[fp-" + std::to_string(8 * (static_cast<int64_t>(slot) + 1)) + "]";
}

auto DirectEmitter::unsupported(const InstructionData& inst, const std::string& what) const
    -> Diagnostic {
    return make_diagnostic(DiagnosticKind::UnsupportedOpcode, Stage::Backend,
                           current_->func->name,
                           "'" + what + "' has no lowering on " + regalloc::arch_to_string(target_.arch),
                           inst.span);
}

auto DirectEmitter::emit(const CompiledModule& compiled) -> Result<std::string, Diagnostic> {
    output_.str("");
    output_.clear();
    AllocatedModuleView view(compiled);

    emitln("; module '" + compiled.allocated_module.name + "' for " + target_.triple);

    if (!compiled.allocated_module.globals.empty()) {
        emitln(".data");
        for (const auto& [name, global] : compiled.allocated_module.globals) {
            emitln(name + ":");
            if (global.initializer) {
                emitln("    .value " + immediate(*global.initializer).substr(1) + ", " +
                       std::to_string(global.type->size_in_bytes()));
            } else {
                emitln("    .zero " + std::to_string(global.type->size_in_bytes()));
            }
        }
    }

    emitln(".text");
    for (const auto& fv : view.functions()) {
        if (auto error = emit_function(fv)) {
            KIR_LOG_ERROR("backend", error->to_string());
            return *error;
        }
    }
    return output_.str();
}

auto DirectEmitter::emit_function(const FunctionView& fv) -> std::optional<Diagnostic> {
    current_ = &fv;
    alloca_offsets_.clear();
    edge_stubs_.clear();
    edge_temp_.clear();

    // Frame: spill slots, the edge temporary, then allocas
    int64_t offset = 8 * static_cast<int64_t>(fv.allocation->spill_slot_count);
    for (const auto& bv : fv.blocks) {
        for (const auto& iv : bv.instructions) {
            if (!iv.inst->is<PhiInst>() || !edge_temp_.empty()) {
                continue;
            }
            bool touches_slot = iv.result.kind == Location::Kind::SpillSlot ||
                                std::any_of(iv.operands.begin(), iv.operands.end(),
                                            [](const OperandView& op) {
                                                return op.location.kind ==
                                                       Location::Kind::SpillSlot;
                                            });
            if (touches_slot) {
                edge_temp_ = slot_address(fv.allocation->spill_slot_count);
                offset += 8;
            }
        }
    }
    for (const auto& bv : fv.blocks) {
        for (const auto& iv : bv.instructions) {
            if (const auto* alloca = iv.inst->as<AllocaInst>()) {
                offset += round_up(
                    std::max<int64_t>(8, static_cast<int64_t>(alloca->alloc_type->size_in_bytes())),
                    8);
                alloca_offsets_[iv.inst->result] = offset;
            }
        }
    }
    frame_size_ = round_up(offset, target_.layout.stack_alignment);

    emitln();
    emitln(".globl " + fv.func->name);
    emitln(fv.func->name + ":");
    emitln("    enter #" + std::to_string(frame_size_));

    // Incoming arguments; a spilled parameter goes straight to its slot
    const auto& cc = target_.convention;
    size_t int_index = 0;
    size_t float_index = 0;
    size_t stack_index = 0;
    std::vector<Move> moves;
    for (size_t i = 0; i < fv.func->params.size(); ++i) {
        const auto& loc = fv.params[i];
        RegClass cls = regalloc::reg_class_of(fv.func->params[i].type);
        const auto& regs = cls == RegClass::Vector ? cc.float_args : cc.int_args;
        size_t& index = cls == RegClass::Vector ? float_index : int_index;
        std::string source;
        if (index < regs.size()) {
            source = regs[index++];
        } else {
            source = "[fp+" + std::to_string(16 + cc.stack_slot_size * stack_index++) + "]";
        }
        if (loc.kind == Location::Kind::Register) {
            moves.push_back(Move{loc.reg, source, cls});
        } else if (loc.kind == Location::Kind::SpillSlot) {
            moves.push_back(Move{slot_address(loc.slot), source, cls});
        }
    }
    emit_parallel_move(std::move(moves));

    auto liveness = regalloc::compute_liveness(*fv.func);

    for (const auto& bv : fv.blocks) {
        emitln(label(bv.block->id) + ":");
        for (size_t i = 0; i < bv.instructions.size(); ++i) {
            const auto& iv = bv.instructions[i];

            std::vector<std::string> live_across;
            if (iv.inst->is<CallInst>() || iv.inst->is<MemsetInst>() ||
                iv.inst->is<MemcpyInst>()) {
                uint32_t k = liveness.instruction_index(bv.block->id, i);
                for (const auto& interval : liveness.intervals) {
                    if (interval.start < 2 * k && interval.end > 2 * k + 1) {
                        auto loc = fv.allocation->location(interval.vreg);
                        if (loc.kind == Location::Kind::Register &&
                            std::find(live_across.begin(), live_across.end(), loc.reg) ==
                                live_across.end()) {
                            live_across.push_back(loc.reg);
                        }
                    }
                }
            }

            if (auto error = emit_instruction(bv, iv, live_across)) {
                current_ = nullptr;
                return error;
            }
        }

        for (const auto& [from, to] : edge_stubs_) {
            emitln(label(from) + "_to_bb" + std::to_string(to) + ":");
            emit_parallel_move(phi_moves(from, to));
            emitln("    jmp " + label(to));
        }
        edge_stubs_.clear();
    }

    current_ = nullptr;
    return std::nullopt;
}

auto DirectEmitter::phi_moves(BlockId from, BlockId to) const -> std::vector<Move> {
    std::vector<Move> moves;
    const auto* block = current_->func->get_block(to);
    for (const auto& inst : block->instructions) {
        const auto* phi = inst.as<PhiInst>();
        if (!phi) {
            break;
        }
        auto dst = current_->allocation->location(inst.result);
        std::string dst_loc;
        if (dst.kind == Location::Kind::Register) {
            dst_loc = dst.reg;
        } else if (dst.kind == Location::Kind::SpillSlot) {
            dst_loc = slot_address(dst.slot);
        } else {
            continue;
        }
        for (const auto& in : phi->incoming) {
            if (in.block == from) {
                std::string src = operand(in.value);
                if (src != dst_loc) {
                    moves.push_back(Move{dst_loc, src, regalloc::reg_class_of(inst.type)});
                }
            }
        }
    }
    return moves;
}

void DirectEmitter::emit_move(const Move& move) {
    if (!is_memory(move.dst)) {
        emitln((is_memory(move.src) ? "    ld " : "    mov ") + move.dst + ", " + move.src);
        return;
    }
    if (is_register_name(move.src)) {
        emitln("    st " + move.dst + ", " + move.src);
        return;
    }
    // Memory and immediates reach a slot through a register
    const auto& regs = target_.registers(move.cls);
    bool borrowed = regs.scratch.empty();
    const std::string& via = borrowed ? regs.allocatable.front() : regs.scratch.front();
    if (borrowed) {
        emitln("    push " + via);
    }
    emitln((is_memory(move.src) ? "    ld " : "    mov ") + via + ", " + move.src);
    emitln("    st " + move.dst + ", " + via);
    if (borrowed) {
        emitln("    pop " + via);
    }
}

void DirectEmitter::emit_parallel_move(std::vector<Move> moves) {
    std::erase_if(moves, [](const Move& m) { return m.dst == m.src; });
    while (!moves.empty()) {
        // A move whose destination no other pending move still reads
        auto ready = std::find_if(moves.begin(), moves.end(), [&moves](const Move& m) {
            return std::none_of(moves.begin(), moves.end(), [&m](const Move& other) {
                return &other != &m && other.src == m.dst;
            });
        });
        if (ready != moves.end()) {
            emit_move(*ready);
            moves.erase(ready);
            continue;
        }

        // Only cycles remain. Two registers swap in place, and readers are
        // redirected
        auto swap = std::find_if(moves.begin(), moves.end(), [](const Move& m) {
            return is_register_name(m.dst) && is_register_name(m.src);
        });
        if (swap != moves.end()) {
            std::string dst = swap->dst;
            std::string src = swap->src;
            moves.erase(swap);
            emitln("    xchg " + dst + ", " + src);
            for (auto& m : moves) {
                if (m.src == dst) {
                    m.src = src;
                } else if (m.src == src) {
                    m.src = dst;
                }
            }
            std::erase_if(moves, [](const Move& m) { return m.dst == m.src; });
            continue;
        }

        // A cycle through memory: park one destination in the edge temporary
        Move park{edge_temp_, moves.front().dst, moves.front().cls};
        emit_move(park);
        for (auto& m : moves) {
            if (m.src == park.src) {
                m.src = edge_temp_;
            }
        }
    }
}

auto DirectEmitter::edge_label(BlockId from, BlockId to) -> std::string {
    if (phi_moves(from, to).empty()) {
        return label(to);
    }
    auto edge = std::make_pair(from, to);
    if (std::find(edge_stubs_.begin(), edge_stubs_.end(), edge) == edge_stubs_.end()) {
        edge_stubs_.push_back(edge);
    }
    return label(from) + "_to_bb" + std::to_string(to);
}

void DirectEmitter::emit_call(const std::string& callee, const std::vector<Value>& args,
                              const InstructionView& iv,
                              const std::vector<std::string>& live_across) {
    for (const auto& reg : live_across) {
        emitln("    push " + reg);
    }

    const auto& cc = target_.convention;
    size_t int_index = 0;
    size_t float_index = 0;
    std::vector<Move> moves;
    std::vector<std::string> stack_args;
    for (const auto& arg : args) {
        RegClass cls = regalloc::reg_class_of(arg.type);
        const auto& regs = cls == RegClass::Vector ? cc.float_args : cc.int_args;
        size_t& index = cls == RegClass::Vector ? float_index : int_index;
        if (index < regs.size()) {
            moves.push_back(Move{regs[index++], operand(arg), cls});
        } else {
            stack_args.push_back(operand(arg));
        }
    }
    // Stack arguments are pushed last to first, padded to the alignment
    int64_t stack_bytes = cc.stack_slot_size * static_cast<int64_t>(stack_args.size());
    int64_t padded = round_up(stack_bytes, cc.stack_alignment);
    if (padded > stack_bytes) {
        emitln("    sub sp, #" + std::to_string(padded - stack_bytes));
    }
    for (auto it = stack_args.rbegin(); it != stack_args.rend(); ++it) {
        emitln("    push " + *it);
    }
    emit_parallel_move(std::move(moves));
    emitln("    call " + callee);
    if (padded > 0) {
        emitln("    add sp, #" + std::to_string(padded));
    }

    if (iv.result.kind == Location::Kind::Register) {
        const auto& ret = regalloc::reg_class_of(iv.inst->type) == RegClass::Vector
                              ? cc.float_return
                              : cc.int_return;
        if (ret != iv.result.reg) {
            emitln("    mov " + iv.result.reg + ", " + ret);
        }
    }
    for (auto it = live_across.rbegin(); it != live_across.rend(); ++it) {
        emitln("    pop " + *it);
    }
}

auto DirectEmitter::emit_instruction(const BlockView& bv, const InstructionView& iv,
                                     const std::vector<std::string>& live_across)
    -> std::optional<Diagnostic> {
    const auto& inst = *iv.inst;
    if (inst.is<PhiInst>()) {
        return std::nullopt; // Copied on the incoming edges
    }
    // Spill traffic of a value that stays in its slot is done by the edge and
    // entry copies
    const auto* load = inst.as<LoadInst>();
    if (load && load->spill_slot && iv.result.kind == Location::Kind::SpillSlot) {
        return std::nullopt;
    }
    const auto* store = inst.as<StoreInst>();
    if (store && store->spill_slot && in_slot(store->value)) {
        return std::nullopt;
    }
    emit_comment(IrPrinter().print_instruction(inst));

    if (inst.has_result() && iv.result.kind != Location::Kind::Register) {
        return make_diagnostic(DiagnosticKind::InternalCompilerError, Stage::Backend,
                               current_->func->name,
                               "%" + std::to_string(inst.result) + " has no register", inst.span);
    }
    for (const auto& op : iv.operands) {
        if (op.value.is_register() && op.location.kind != Location::Kind::Register) {
            return make_diagnostic(DiagnosticKind::InternalCompilerError, Stage::Backend,
                                   current_->func->name,
                                   "operand %" + std::to_string(op.value.reg()) + " has no register",
                                   inst.span);
        }
    }

    const std::string dst = iv.result.reg;
    std::optional<Diagnostic> error;

    std::visit(
        [&](const auto& i) {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, BinaryInst>) {
                emitln("    " + binary_mnemonic(i.op, inst.type) + " " + dst + ", " +
                       operand(i.lhs) + ", " + operand(i.rhs));
            } else if constexpr (std::is_same_v<T, CompareInst>) {
                std::string m = "cmp.";
                if (i.lhs.type && i.lhs.type->is_float()) {
                    m = "fcmp.";
                }
                m += cmpop_name(i.op);
                if (i.lhs.type && i.lhs.type->is_integer() && !i.lhs.type->is_signed() &&
                    i.op != CmpOp::Eq && i.op != CmpOp::Ne) {
                    m += "u";
                }
                emitln("    " + m + " " + dst + ", " + operand(i.lhs) + ", " + operand(i.rhs));
            } else if constexpr (std::is_same_v<T, UnaryInst>) {
                std::string m = i.op == UnaryOp::Not ? "not" : (inst.type->is_float() ? "fneg" : "neg");
                emitln("    " + m + " " + dst + ", " + operand(i.operand));
            } else if constexpr (std::is_same_v<T, CastInst>) {
                emitln("    " + std::string(cast_name(i.kind)) + " " + dst + ", " +
                       operand(i.operand));
            } else if constexpr (std::is_same_v<T, CopyInst>) {
                std::string src = operand(i.source);
                if (src != dst) {
                    emitln("    mov " + dst + ", " + src);
                }
            } else if constexpr (std::is_same_v<T, AllocaInst>) {
                emitln("    lea " + dst + ", [fp-" + std::to_string(alloca_offsets_[inst.result]) +
                       "]");
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                if (i.spill_slot) {
                    emitln("    ld " + dst + ", " + slot_address(*i.spill_slot));
                } else {
                    emitln(std::string(i.is_volatile ? "    ld.volatile " : "    ld ") + dst +
                           ", [" + operand(i.ptr) + "]");
                }
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                if (i.spill_slot) {
                    emitln("    st " + slot_address(*i.spill_slot) + ", " + operand(i.value));
                } else {
                    emitln(std::string(i.is_volatile ? "    st.volatile [" : "    st [") +
                           operand(i.ptr) + "], " + operand(i.value));
                }
            } else if constexpr (std::is_same_v<T, MemsetInst>) {
                emit_call("memset", {i.dest, i.byte, i.size}, iv, live_across);
            } else if constexpr (std::is_same_v<T, MemcpyInst>) {
                emit_call("memmove", {i.dest, i.src, i.size}, iv, live_across);
            } else if constexpr (std::is_same_v<T, CallInst>) {
                emit_call(i.callee, i.args, iv, live_across);
            } else if constexpr (std::is_same_v<T, AtomicInst>) {
                std::string m = std::string("atomic.") + atomic_name(i.op);
                if (!target_.has_atomics) {
                    error = unsupported(inst, m);
                    return;
                }
                std::string line = "    " + m + " ";
                if (inst.has_result()) {
                    line += dst + ", ";
                }
                line += "[" + operand(i.ptr) + "]";
                if (i.expected) {
                    line += ", " + operand(*i.expected);
                }
                if (i.value) {
                    line += ", " + operand(*i.value);
                }
                emitln(line);
            } else if constexpr (std::is_same_v<T, IntrinsicInst>) {
                std::string m = intrinsic_name(i.kind);
                if (!target_.intrinsics.contains(i.kind)) {
                    error = unsupported(inst, m);
                    return;
                }
                if (i.kind == IntrinsicKind::Trap) {
                    emitln("    trap");
                    return;
                }
                if (inst.type->is_float()) {
                    m = "f" + m;
                }
                std::string line = "    " + m + " " + dst;
                for (const auto& arg : i.args) {
                    line += ", " + operand(arg);
                }
                emitln(line);
            } else {
                emit_terminator(bv, iv);
            }
        },
        inst.inst);
    return error;
}

void DirectEmitter::emit_terminator(const BlockView& bv, const InstructionView& iv) {
    BlockId from = bv.block->id;
    std::visit(
        [&](const auto& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, JumpInst>) {
                emit_parallel_move(phi_moves(from, t.target));
                emitln("    jmp " + label(t.target));
            } else if constexpr (std::is_same_v<T, JumpIfInst>) {
                emitln("    bnz " + operand(t.condition) + ", " + edge_label(from, t.then_block));
                emitln("    jmp " + edge_label(from, t.else_block));
            } else if constexpr (std::is_same_v<T, SwitchInst>) {
                for (const auto& [value, target] : t.cases) {
                    emitln("    beq " + operand(t.discriminant) + ", #" + std::to_string(value) +
                           ", " + edge_label(from, target));
                }
                emitln("    jmp " + edge_label(from, t.default_block));
            } else if constexpr (std::is_same_v<T, RetInst>) {
                if (t.value) {
                    const auto& ret = regalloc::reg_class_of(t.value->type) == RegClass::Vector
                                          ? target_.convention.float_return
                                          : target_.convention.int_return;
                    std::string src = operand(*t.value);
                    if (src != ret) {
                        emitln("    mov " + ret + ", " + src);
                    }
                }
                emitln("    leave");
                emitln("    ret");
            } else if constexpr (std::is_same_v<T, UnreachableInst>) {
                emitln("    trap");
            }
        },
        iv.inst->inst);
}

} // namespace kir::backend
