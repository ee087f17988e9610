// KIR Reference Interpreter Implementation

#include "ir/interpreter.hpp"

#include "ir/eval.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace kir::ir {

namespace {

// Address 0 stays unmapped so null never aliases a cell
constexpr uint64_t NULL_GUARD = 8;

auto zero_of(const IrTypePtr& type) -> Value {
    if (type->is_float()) {
        return make_const_float(0.0, type);
    }
    if (type->is_bool()) {
        return make_const_bool(false);
    }
    if (type->is_void() || type->is_aggregate()) {
        return make_undef(type);
    }
    return make_const_int(0, type);
}

auto trapped(TrapKind kind, std::string message) -> ExecOutcome {
    ExecOutcome out;
    out.status = ExecStatus::Trapped;
    out.trap = kind;
    out.message = std::move(message);
    return out;
}

auto failed(ExecStatus status, std::string message) -> ExecOutcome {
    ExecOutcome out;
    out.status = status;
    out.message = std::move(message);
    return out;
}

auto truthy(const Value& v) -> bool {
    if (auto b = v.as_bool()) {
        return *b;
    }
    return v.as_int().value_or(0) != 0;
}

} // namespace

auto trap_kind_name(TrapKind kind) -> const char* {
    switch (kind) {
    case TrapKind::DivideByZero:
        return "division by zero";
    case TrapKind::InvalidConversion:
        return "invalid conversion";
    case TrapKind::NullAccess:
        return "null access";
    case TrapKind::OutOfBounds:
        return "out-of-bounds access";
    case TrapKind::Explicit:
        return "trap";
    case TrapKind::Unreachable:
        return "unreachable executed";
    }
    return "unknown trap";
}

auto ExecOutcome::same_behavior(const ExecOutcome& other) const -> bool {
    if (status != other.status || trap != other.trap) {
        return false;
    }
    if (value.has_value() != other.value.has_value()) {
        return false;
    }
    return !value || *value == *other.value;
}

Interpreter::Interpreter(const Module& module, InterpreterOptions options)
    : module_(module), options_(options), memory_(NULL_GUARD, 0) {
    for (const auto& [name, global] : module_.globals) {
        uint64_t address = allocate(global.type->size_in_bytes());
        global_addresses_[name] = address;
        if (global.initializer) {
            if (!store(address, Value{*global.initializer, global.type})) {
                KIR_LOG_WARN("interp", "global '" << name << "' has an unstorable initializer");
            }
        }
    }
}

auto Interpreter::allocate(size_t size) -> uint64_t {
    size_t align = std::clamp<size_t>(size, 1, 8);
    uint64_t address = (memory_.size() + align - 1) / align * align;
    memory_.resize(address + std::max<size_t>(size, 1), 0);
    return address;
}

auto Interpreter::in_bounds(uint64_t address, size_t size) const -> bool {
    return address >= NULL_GUARD && address + size <= memory_.size();
}

auto Interpreter::load(uint64_t address, const IrTypePtr& type) const -> std::optional<Value> {
    size_t size = type->size_in_bytes();
    if (type->is_aggregate() || size == 0 || size > 8 || !in_bounds(address, size)) {
        return std::nullopt;
    }
    uint64_t raw = 0;
    std::memcpy(&raw, memory_.data() + address, size);

    if (type->is_float()) {
        if (size == 4) {
            return make_const_float(std::bit_cast<float>(static_cast<uint32_t>(raw)), type);
        }
        return make_const_float(std::bit_cast<double>(raw), type);
    }
    if (type->is_bool()) {
        return make_const_bool(raw != 0);
    }
    return make_const_int(static_cast<int64_t>(raw), type);
}

auto Interpreter::store(uint64_t address, const Value& value) -> bool {
    size_t size = value.type->size_in_bytes();
    if (value.type->is_aggregate() || size == 0 || size > 8 || !in_bounds(address, size)) {
        return false;
    }
    uint64_t raw = 0;
    if (auto f = value.as_float()) {
        raw = size == 4 ? std::bit_cast<uint32_t>(static_cast<float>(*f)) : std::bit_cast<uint64_t>(*f);
    } else if (auto b = value.as_bool()) {
        raw = *b ? 1 : 0;
    } else if (auto i = value.as_int()) {
        raw = static_cast<uint64_t>(*i);
    }
    std::memcpy(memory_.data() + address, &raw, size);
    return true;
}

auto Interpreter::value_of(const Frame& frame, const Value& v) const -> Value {
    if (v.is_register()) {
        auto it = frame.registers.find(v.reg());
        return it != frame.registers.end() ? it->second : zero_of(v.type);
    }
    if (v.is_global()) {
        const auto& symbol = std::get<GlobalRef>(v.kind).symbol;
        auto it = global_addresses_.find(symbol);
        return make_const_int(it != global_addresses_.end() ? static_cast<int64_t>(it->second) : 0,
                              make_ptr_type());
    }
    if (v.is_undef()) {
        return zero_of(v.type);
    }
    if (std::holds_alternative<ConstNull>(*v.as_constant())) {
        return make_const_int(0, make_ptr_type());
    }
    return v;
}

auto Interpreter::address_of(const Value& ptr) const -> std::optional<uint64_t> {
    auto address = ptr.as_int();
    if (!address || *address == 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*address);
}

auto Interpreter::read_global(const std::string& name) const -> std::optional<Value> {
    auto it = global_addresses_.find(name);
    if (it == global_addresses_.end()) {
        return std::nullopt;
    }
    return load(it->second, module_.globals.at(name).type);
}

auto Interpreter::call(std::string_view function, const std::vector<Value>& args)
    -> ExecOutcome {
    const Function* func = module_.find_function(function);
    if (!func) {
        return failed(ExecStatus::Error, "no function named '" + std::string(function) + "'");
    }
    steps_ = 0;
    depth_ = 0;
    auto outcome = execute(*func, args);
    outcome.steps = steps_;
    return outcome;
}

auto Interpreter::execute(const Function& func, const std::vector<Value>& args) -> ExecOutcome {
    if (func.is_declaration()) {
        return failed(ExecStatus::Error, "call to external function '" + func.name + "'");
    }
    if (args.size() != func.params.size()) {
        return failed(ExecStatus::Error, "'" + func.name + "' expects " +
                                             std::to_string(func.params.size()) + " arguments");
    }
    if (depth_ >= options_.max_call_depth) {
        return failed(ExecStatus::StepLimit, "call depth limit reached in '" + func.name + "'");
    }

    Frame frame{&func, {}, {}};
    for (size_t i = 0; i < args.size(); ++i) {
        frame.registers[func.params[i].value_id] = value_of(frame, args[i]);
    }

    BlockId previous = INVALID_BLOCK;
    const BasicBlock* block = &func.blocks.front();

    while (true) {
        // Phis read the incoming edge simultaneously
        size_t first = block->first_non_phi();
        std::vector<std::pair<ValueId, Value>> phi_values;
        for (size_t i = 0; i < first; ++i) {
            const auto& inst = block->instructions[i];
            const auto& phi = std::get<PhiInst>(inst.inst);
            auto in = std::find_if(phi.incoming.begin(), phi.incoming.end(),
                                   [previous](const PhiIncoming& p) { return p.block == previous; });
            if (in == phi.incoming.end()) {
                return failed(ExecStatus::Error, "phi in '" + block->name +
                                                     "' has no operand for the incoming edge");
            }
            phi_values.emplace_back(inst.result, value_of(frame, in->value));
        }
        for (auto& [id, value] : phi_values) {
            frame.registers[id] = std::move(value);
        }

        BlockId next = INVALID_BLOCK;
        for (size_t i = first; i < block->instructions.size() && next == INVALID_BLOCK; ++i) {
            if (++steps_ > options_.step_budget) {
                return failed(ExecStatus::StepLimit, "step budget exhausted in '" + func.name + "'");
            }
            const auto& inst = block->instructions[i];
            std::optional<ExecOutcome> stop;
            std::optional<Value> result;

            std::visit(
                [&](const auto& op) {
                    using T = std::decay_t<decltype(op)>;
                    if constexpr (std::is_same_v<T, JumpInst>) {
                        next = op.target;
                    } else if constexpr (std::is_same_v<T, JumpIfInst>) {
                        next = truthy(value_of(frame, op.condition)) ? op.then_block
                                                                     : op.else_block;
                    } else if constexpr (std::is_same_v<T, SwitchInst>) {
                        auto disc = value_of(frame, op.discriminant).as_int().value_or(0);
                        next = op.default_block;
                        for (const auto& [value, target] : op.cases) {
                            if (value == disc) {
                                next = target;
                                break;
                            }
                        }
                    } else if constexpr (std::is_same_v<T, RetInst>) {
                        ExecOutcome out;
                        if (op.value) {
                            out.value = value_of(frame, *op.value);
                        }
                        stop = std::move(out);
                    } else if constexpr (std::is_same_v<T, UnreachableInst>) {
                        stop = trapped(TrapKind::Unreachable, "unreachable in '" + func.name + "'");
                    } else if constexpr (std::is_same_v<T, CallInst>) {
                        const Function* callee = module_.find_function(op.callee);
                        if (!callee) {
                            stop = failed(ExecStatus::Error, "call to unknown '" + op.callee + "'");
                            return;
                        }
                        std::vector<Value> call_args;
                        for (const auto& arg : op.args) {
                            call_args.push_back(value_of(frame, arg));
                        }
                        ++depth_;
                        auto out = execute(*callee, call_args);
                        --depth_;
                        if (out.status != ExecStatus::Returned) {
                            stop = std::move(out);
                        } else if (inst.has_result()) {
                            result = out.value.value_or(zero_of(inst.type));
                        }
                    } else if constexpr (std::is_same_v<T, AllocaInst>) {
                        result = make_const_int(
                            static_cast<int64_t>(allocate(op.alloc_type->size_in_bytes())),
                            inst.type);
                    } else if constexpr (std::is_same_v<T, LoadInst>) {
                        if (op.spill_slot) {
                            auto it = frame.spill_slots.find(*op.spill_slot);
                            result = it != frame.spill_slots.end() ? it->second : zero_of(inst.type);
                            return;
                        }
                        auto address = address_of(value_of(frame, op.ptr));
                        if (!address) {
                            stop = trapped(TrapKind::NullAccess, "load through null");
                            return;
                        }
                        result = load(*address, inst.type);
                        if (!result) {
                            stop = trapped(TrapKind::OutOfBounds, "load out of bounds");
                        }
                    } else if constexpr (std::is_same_v<T, StoreInst>) {
                        auto value = value_of(frame, op.value);
                        if (op.spill_slot) {
                            frame.spill_slots[*op.spill_slot] = value;
                            return;
                        }
                        auto address = address_of(value_of(frame, op.ptr));
                        if (!address) {
                            stop = trapped(TrapKind::NullAccess, "store through null");
                        } else if (!store(*address, value)) {
                            stop = trapped(TrapKind::OutOfBounds, "store out of bounds");
                        }
                    } else if constexpr (std::is_same_v<T, MemsetInst>) {
                        auto address = address_of(value_of(frame, op.dest));
                        auto size = static_cast<size_t>(value_of(frame, op.size).as_int().value_or(0));
                        auto byte = value_of(frame, op.byte).as_int().value_or(0);
                        if (size == 0) {
                            return;
                        }
                        if (!address || !in_bounds(*address, size)) {
                            stop = trapped(TrapKind::OutOfBounds, "memset out of bounds");
                            return;
                        }
                        std::memset(memory_.data() + *address, static_cast<int>(byte & 0xff), size);
                    } else if constexpr (std::is_same_v<T, MemcpyInst>) {
                        auto dest = address_of(value_of(frame, op.dest));
                        auto src = address_of(value_of(frame, op.src));
                        auto size = static_cast<size_t>(value_of(frame, op.size).as_int().value_or(0));
                        if (size == 0) {
                            return;
                        }
                        if (!dest || !src || !in_bounds(*dest, size) || !in_bounds(*src, size)) {
                            stop = trapped(TrapKind::OutOfBounds, "memcpy out of bounds");
                            return;
                        }
                        std::memmove(memory_.data() + *dest, memory_.data() + *src, size);
                    } else if constexpr (std::is_same_v<T, BinaryInst>) {
                        result = eval_binary(op.op, value_of(frame, op.lhs), value_of(frame, op.rhs),
                                             inst.type);
                        if (!result) {
                            stop = (op.op == BinOp::Div || op.op == BinOp::Rem)
                                       ? trapped(TrapKind::DivideByZero, "division by zero")
                                       : failed(ExecStatus::Error, "operands not computable");
                        }
                    } else if constexpr (std::is_same_v<T, CompareInst>) {
                        result = eval_compare(op.op, value_of(frame, op.lhs),
                                              value_of(frame, op.rhs));
                        if (!result) {
                            stop = failed(ExecStatus::Error, "operands not comparable");
                        }
                    } else if constexpr (std::is_same_v<T, UnaryInst>) {
                        result = eval_unary(op.op, value_of(frame, op.operand), inst.type);
                        if (!result) {
                            stop = failed(ExecStatus::Error, "operand not computable");
                        }
                    } else if constexpr (std::is_same_v<T, CastInst>) {
                        auto operand = value_of(frame, op.operand);
                        if (op.kind == CastKind::PtrToInt || op.kind == CastKind::IntToPtr) {
                            result = make_const_int(operand.as_int().value_or(0), inst.type);
                            return;
                        }
                        result = eval_cast(op.kind, operand, inst.type);
                        if (!result) {
                            stop = trapped(TrapKind::InvalidConversion,
                                           std::string(cast_name(op.kind)) + " not representable");
                        }
                    } else if constexpr (std::is_same_v<T, AtomicInst>) {
                        auto address = address_of(value_of(frame, op.ptr));
                        const auto& type = inst.has_result() ? inst.type : op.value->type;
                        if (!address) {
                            stop = trapped(TrapKind::NullAccess, "atomic access through null");
                            return;
                        }
                        auto old = load(*address, type);
                        if (!old) {
                            stop = trapped(TrapKind::OutOfBounds, "atomic access out of bounds");
                            return;
                        }
                        std::optional<Value> updated;
                        auto operand = op.value ? value_of(frame, *op.value) : *old;
                        switch (op.op) {
                        case AtomicOp::Load:
                            break;
                        case AtomicOp::Store:
                        case AtomicOp::Xchg:
                            updated = operand;
                            break;
                        case AtomicOp::Add:
                            updated = eval_binary(BinOp::Add, *old, operand, type);
                            break;
                        case AtomicOp::Sub:
                            updated = eval_binary(BinOp::Sub, *old, operand, type);
                            break;
                        case AtomicOp::CmpXchg:
                            if (*old == value_of(frame, *op.expected)) {
                                updated = operand;
                            }
                            break;
                        }
                        if (updated && !store(*address, *updated)) {
                            stop = trapped(TrapKind::OutOfBounds, "atomic access out of bounds");
                            return;
                        }
                        if (inst.has_result()) {
                            result = *old;
                        }
                    } else if constexpr (std::is_same_v<T, IntrinsicInst>) {
                        if (op.kind == IntrinsicKind::Trap) {
                            stop = trapped(TrapKind::Explicit, "trap in '" + func.name + "'");
                            return;
                        }
                        std::vector<Value> values;
                        for (const auto& arg : op.args) {
                            values.push_back(value_of(frame, arg));
                        }
                        result = eval_intrinsic(op.kind, values, inst.type);
                        if (!result) {
                            stop = failed(ExecStatus::Error, std::string(intrinsic_name(op.kind)) +
                                                                 " not computable");
                        }
                    } else if constexpr (std::is_same_v<T, CopyInst>) {
                        result = value_of(frame, op.source);
                    } else if constexpr (std::is_same_v<T, PhiInst>) {
                        stop = failed(ExecStatus::Error, "phi after the head of '" + block->name +
                                                             "'");
                    }
                },
                inst.inst);

            if (stop) {
                return std::move(*stop);
            }
            if (result && inst.has_result()) {
                frame.registers[inst.result] = std::move(*result);
            }
        }

        if (next == INVALID_BLOCK) {
            return failed(ExecStatus::Error, "block '" + block->name + "' falls through");
        }
        previous = block->id;
        block = func.get_block(next);
        if (!block) {
            return failed(ExecStatus::Error, "jump to a missing block in '" + func.name + "'");
        }
    }
}

} // namespace kir::ir
