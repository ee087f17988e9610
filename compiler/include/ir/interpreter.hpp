#pragma once

// KIR Reference Interpreter
//
// Executes a Function of a Module directly, instruction by instruction. It
// is the oracle for optimization soundness: a Module and its optimized form
// must produce the same outcome on the same arguments.
//
// Semantics follow ir/eval.hpp. Memory is a flat byte array: every ALLOCA
// and every global gets its own naturally aligned cell, pointers are byte
// addresses and address 0 is null. Uninitialized memory reads as zero and
// undef operands evaluate to zero. Register-allocator spill traffic
// (LOAD/STORE carrying a spill_slot) goes to per-frame slots, so allocated
// functions run too.
//
// Runtime faults (division by zero, a null or out-of-bounds access, an
// unconvertible float, the trap intrinsic, reaching UNREACHABLE) end the run
// with a Trap outcome. The step budget bounds runaway loops.

#include "ir/ir.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace kir::ir {

enum class TrapKind {
    DivideByZero,
    InvalidConversion,
    NullAccess,
    OutOfBounds,
    Explicit,    // The trap intrinsic
    Unreachable, // Control reached UNREACHABLE
};

[[nodiscard]] auto trap_kind_name(TrapKind kind) -> const char*;

enum class ExecStatus {
    Returned,
    Trapped,
    StepLimit,
    Error, // The IR is not executable (missing callee, arity mismatch, ...)
};

struct ExecOutcome {
    ExecStatus status = ExecStatus::Returned;
    std::optional<Value> value; // Returned value; nullopt for void
    std::optional<TrapKind> trap;
    std::string message;
    size_t steps = 0;

    // Same status, same trap and same returned value
    [[nodiscard]] auto same_behavior(const ExecOutcome& other) const -> bool;
};

struct InterpreterOptions {
    size_t step_budget = 1'000'000;
    size_t max_call_depth = 256;
};

class Interpreter {
public:
    explicit Interpreter(const Module& module, InterpreterOptions options = {});

    // Runs `function` on `args`. Globals persist across calls on the same
    // interpreter.
    [[nodiscard]] auto call(std::string_view function, const std::vector<Value>& args)
        -> ExecOutcome;

    // Current contents of a scalar global, or nullopt for an unknown name
    [[nodiscard]] auto read_global(const std::string& name) const -> std::optional<Value>;

private:
    struct Frame {
        const Function* func;
        std::unordered_map<ValueId, Value> registers;
        std::unordered_map<uint32_t, Value> spill_slots;
    };

    const Module& module_;
    InterpreterOptions options_;
    std::vector<uint8_t> memory_;
    std::unordered_map<std::string, uint64_t> global_addresses_;
    size_t steps_ = 0;
    size_t depth_ = 0;

    auto allocate(size_t size) -> uint64_t;
    auto execute(const Function& func, const std::vector<Value>& args) -> ExecOutcome;

    auto value_of(const Frame& frame, const Value& v) const -> Value;
    auto address_of(const Value& ptr) const -> std::optional<uint64_t>;

    auto load(uint64_t address, const IrTypePtr& type) const -> std::optional<Value>;
    auto store(uint64_t address, const Value& value) -> bool;
    auto in_bounds(uint64_t address, size_t size) const -> bool;
};

} // namespace kir::ir
