#pragma once

// Target Descriptions
//
// What register allocation and the backends need to know about a target:
// the register classes and which of their registers are allocatable, the
// scratch registers reserved for spill traffic, the data layout and the
// calling convention used at function boundaries.

#include "ir/ir.hpp"

#include <set>
#include <string>
#include <vector>

namespace kir::regalloc {

enum class Arch {
    X86_64,
    Aarch64,
};

auto arch_to_string(Arch arch) -> std::string;

// Integers, booleans and pointers live in general-purpose registers, floats
// in vector registers
enum class RegClass {
    Gpr,
    Vector,
};

auto reg_class_name(RegClass cls) -> const char*;

[[nodiscard]] auto reg_class_of(const ir::IrTypePtr& type) -> RegClass;

struct RegisterClassDesc {
    // Registers the allocator may hand out, in preference order
    std::vector<std::string> allocatable;

    // Reserved for reloads and spilled definitions; never allocated
    std::vector<std::string> scratch;
};

struct DataLayout {
    int pointer_size = 8;    // Bytes
    int stack_alignment = 16; // Bytes, at call boundaries
    bool is_little_endian = true;

    // LLVM data layout string
    [[nodiscard]] auto to_string() const -> std::string;
};

// Argument and return registers at function boundaries
struct CallingConvention {
    std::string name;
    std::vector<std::string> int_args;   // In order
    std::vector<std::string> float_args; // In order
    std::string int_return;
    std::string float_return;
    int stack_alignment = 16;
    int stack_slot_size = 8; // Arguments beyond the registers go here, in order

    static auto sysv_x86_64() -> CallingConvention;
    static auto aapcs64() -> CallingConvention;
};

struct TargetDesc {
    Arch arch = Arch::X86_64;
    std::string triple;
    RegisterClassDesc gpr;
    RegisterClassDesc vector;
    DataLayout layout;
    CallingConvention convention;

    // Direct emitter capabilities
    bool has_atomics = true;
    std::set<ir::IntrinsicKind> intrinsics;

    [[nodiscard]] auto registers(RegClass cls) const -> const RegisterClassDesc& {
        return cls == RegClass::Gpr ? gpr : vector;
    }

    static auto x86_64() -> TargetDesc;
    static auto aarch64() -> TargetDesc;

    // Parses "x86_64" or "aarch64" (or a triple starting with either)
    static auto from_name(const std::string& name) -> std::optional<TargetDesc>;
};

} // namespace kir::regalloc
