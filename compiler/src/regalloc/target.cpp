// Target Descriptions Implementation

#include "regalloc/target.hpp"

namespace kir::regalloc {

auto arch_to_string(Arch arch) -> std::string {
    switch (arch) {
    case Arch::X86_64:
        return "x86_64";
    case Arch::Aarch64:
        return "aarch64";
    }
    return "unknown";
}

auto reg_class_name(RegClass cls) -> const char* {
    return cls == RegClass::Gpr ? "gpr" : "vector";
}

auto reg_class_of(const ir::IrTypePtr& type) -> RegClass {
    return type && type->is_float() ? RegClass::Vector : RegClass::Gpr;
}

auto DataLayout::to_string() const -> std::string {
    std::string s = is_little_endian ? "e" : "E";
    s += "-p:" + std::to_string(pointer_size * 8) + ":" + std::to_string(pointer_size * 8);
    s += "-i64:64-n8:16:32:64-S" + std::to_string(stack_alignment * 8);
    return s;
}

auto CallingConvention::sysv_x86_64() -> CallingConvention {
    CallingConvention cc;
    cc.name = "sysv";
    cc.int_args = {"rdi", "rsi", "rdx", "rcx", "r8", "r9"};
    cc.float_args = {"xmm0", "xmm1", "xmm2", "xmm3", "xmm4", "xmm5", "xmm6", "xmm7"};
    cc.int_return = "rax";
    cc.float_return = "xmm0";
    return cc;
}

auto CallingConvention::aapcs64() -> CallingConvention {
    CallingConvention cc;
    cc.name = "aapcs64";
    cc.int_args = {"x0", "x1", "x2", "x3", "x4", "x5", "x6", "x7"};
    cc.float_args = {"v0", "v1", "v2", "v3", "v4", "v5", "v6", "v7"};
    cc.int_return = "x0";
    cc.float_return = "v0";
    return cc;
}

auto TargetDesc::x86_64() -> TargetDesc {
    TargetDesc t;
    t.arch = Arch::X86_64;
    t.triple = "x86_64-unknown-linux-gnu";
    // rsp and rbp hold the frame; r10 and r11 carry spill traffic
    t.gpr.allocatable = {"rax", "rcx", "rdx", "rsi", "rdi", "r8",  "r9",
                         "rbx", "r12", "r13", "r14", "r15"};
    t.gpr.scratch = {"r10", "r11"};
    for (int i = 0; i < 14; ++i) {
        t.vector.allocatable.push_back("xmm" + std::to_string(i));
    }
    t.vector.scratch = {"xmm14", "xmm15"};
    t.convention = CallingConvention::sysv_x86_64();
    t.intrinsics = {ir::IntrinsicKind::Abs, ir::IntrinsicKind::Min, ir::IntrinsicKind::Max,
                    ir::IntrinsicKind::Sqrt, ir::IntrinsicKind::Trap};
    return t;
}

auto TargetDesc::aarch64() -> TargetDesc {
    TargetDesc t;
    t.arch = Arch::Aarch64;
    t.triple = "aarch64-unknown-linux-gnu";
    // x16/x17 are the intra-procedure-call scratch registers, x18 is the
    // platform register, x29/x30 are the frame and link registers
    for (int i = 0; i <= 15; ++i) {
        t.gpr.allocatable.push_back("x" + std::to_string(i));
    }
    for (int i = 19; i <= 28; ++i) {
        t.gpr.allocatable.push_back("x" + std::to_string(i));
    }
    t.gpr.scratch = {"x16", "x17"};
    for (int i = 0; i <= 29; ++i) {
        t.vector.allocatable.push_back("v" + std::to_string(i));
    }
    t.vector.scratch = {"v30", "v31"};
    t.convention = CallingConvention::aapcs64();
    t.intrinsics = {ir::IntrinsicKind::Abs, ir::IntrinsicKind::Min, ir::IntrinsicKind::Max,
                    ir::IntrinsicKind::Sqrt, ir::IntrinsicKind::Trap};
    return t;
}

auto TargetDesc::from_name(const std::string& name) -> std::optional<TargetDesc> {
    if (name.starts_with("x86_64") || name == "x64" || name == "amd64") {
        return x86_64();
    }
    if (name.starts_with("aarch64") || name == "arm64") {
        return aarch64();
    }
    return std::nullopt;
}

} // namespace kir::regalloc
