// KIR - Three-Address SSA Intermediate Representation
//
// KIR sits between the typed AST and the backends. The builder produces it
// with one stack slot per mutable binding, SSA construction promotes those
// slots to registers, and the optimizer rewrites it until it reaches a
// fixpoint.
//
// Structure:
// - Module owns an arena of Functions indexed by FunctionId, plus globals
// - Function owns an ordered list of BasicBlocks, entry is blocks[0]
// - BasicBlock owns its instructions; the last one is the terminator
// - Instruction is a closed variant over the opcode classes
//
// Blocks are identified by a stable BlockId assigned at creation. Phi
// operands and terminators reference blocks by id, so reordering or erasing
// blocks never renames the surviving ones.

#pragma once

#include "common.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace kir::ir {

struct BasicBlock;
struct Function;
struct Module;

// ============================================================================
// Types
// ============================================================================

enum class PrimitiveType {
    Void,
    Bool,
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    F32,
    F64,
    Ptr, // Opaque address
};

struct IrType;
using IrTypePtr = std::shared_ptr<IrType>;

struct IrPrimitiveType {
    PrimitiveType kind;
};

struct IrArrayType {
    IrTypePtr element;
    size_t size;
};

struct IrStructType {
    std::string name;
    std::vector<IrTypePtr> fields;
};

struct IrType {
    std::variant<IrPrimitiveType, IrArrayType, IrStructType> kind;

    [[nodiscard]] auto primitive() const -> std::optional<PrimitiveType>;
    [[nodiscard]] auto is_void() const -> bool;
    [[nodiscard]] auto is_bool() const -> bool;
    [[nodiscard]] auto is_integer() const -> bool;
    [[nodiscard]] auto is_float() const -> bool;
    [[nodiscard]] auto is_signed() const -> bool;
    [[nodiscard]] auto is_pointer() const -> bool;
    [[nodiscard]] auto is_aggregate() const -> bool;

    // Bits for integers, floats and bools (1); 64 for pointers; 0 otherwise
    [[nodiscard]] auto bit_width() const -> int;

    [[nodiscard]] auto size_in_bytes() const -> size_t;

    [[nodiscard]] auto to_string() const -> std::string;
};

// Structural type equality. Null pointers compare equal only to each other.
auto type_equals(const IrTypePtr& a, const IrTypePtr& b) -> bool;

auto make_primitive_type(PrimitiveType kind) -> IrTypePtr;
auto make_void_type() -> IrTypePtr;
auto make_bool_type() -> IrTypePtr;
auto make_i8_type() -> IrTypePtr;
auto make_i32_type() -> IrTypePtr;
auto make_i64_type() -> IrTypePtr;
auto make_u32_type() -> IrTypePtr;
auto make_u64_type() -> IrTypePtr;
auto make_f32_type() -> IrTypePtr;
auto make_f64_type() -> IrTypePtr;
auto make_ptr_type() -> IrTypePtr;
auto make_array_type(IrTypePtr element, size_t size) -> IrTypePtr;
auto make_struct_type(const std::string& name, std::vector<IrTypePtr> fields) -> IrTypePtr;

// ============================================================================
// Values
// ============================================================================

using ValueId = uint32_t;
using BlockId = uint32_t;
using FunctionId = uint32_t;

constexpr ValueId INVALID_VALUE = UINT32_MAX;
constexpr BlockId INVALID_BLOCK = UINT32_MAX;

// Integer constants are kept normalized to their type's width: sign-extended
// for signed types, zero-extended for unsigned ones.
struct ConstInt {
    int64_t value;
};

struct ConstFloat {
    double value;
};

struct ConstBool {
    bool value;
};

struct ConstNull {};

using Constant = std::variant<ConstInt, ConstFloat, ConstBool, ConstNull>;

struct RegisterRef {
    ValueId id;
};

struct GlobalRef {
    std::string symbol;
};

struct UndefValue {};

// An immutable operand. Optimizations never mutate a Value in place; they
// rewrite the operand lists that mention it.
struct Value {
    std::variant<Constant, RegisterRef, GlobalRef, UndefValue> kind;
    IrTypePtr type;

    [[nodiscard]] auto is_register() const -> bool {
        return std::holds_alternative<RegisterRef>(kind);
    }
    [[nodiscard]] auto is_constant() const -> bool {
        return std::holds_alternative<Constant>(kind);
    }
    [[nodiscard]] auto is_global() const -> bool {
        return std::holds_alternative<GlobalRef>(kind);
    }
    [[nodiscard]] auto is_undef() const -> bool {
        return std::holds_alternative<UndefValue>(kind);
    }

    // Register id, or INVALID_VALUE for non-register values
    [[nodiscard]] auto reg() const -> ValueId {
        if (auto* r = std::get_if<RegisterRef>(&kind)) {
            return r->id;
        }
        return INVALID_VALUE;
    }

    [[nodiscard]] auto as_constant() const -> const Constant* {
        return std::get_if<Constant>(&kind);
    }

    [[nodiscard]] auto as_int() const -> std::optional<int64_t>;
    [[nodiscard]] auto as_float() const -> std::optional<double>;
    [[nodiscard]] auto as_bool() const -> std::optional<bool>;

    // Identity: same kind, same payload, same type. Float constants compare
    // bitwise so NaN constants are identical to themselves.
    [[nodiscard]] auto operator==(const Value& other) const -> bool;
};

// Wraps `value` to the width of `type` (two's complement), then sign- or
// zero-extends it back to 64 bits.
auto normalize_int(int64_t value, const IrType& type) -> int64_t;

auto make_register(ValueId id, IrTypePtr type) -> Value;
auto make_const_int(int64_t value, IrTypePtr type) -> Value;
auto make_const_float(double value, IrTypePtr type) -> Value;
auto make_const_bool(bool value) -> Value;
auto make_const_null() -> Value;
auto make_global(const std::string& symbol) -> Value;
auto make_undef(IrTypePtr type) -> Value;

// ============================================================================
// Instructions
// ============================================================================

// Arithmetic and bitwise binary operations share one instruction class; the
// typing rules differ (see is_bitwise).
enum class BinOp {
    Add,
    Sub,
    Mul,
    Div,
    Rem,
    And,
    Or,
    Xor,
    Shl,
    Shr,
};

enum class CmpOp { Eq, Ne, Lt, Le, Gt, Ge };

enum class UnaryOp {
    Neg,
    Not, // Logical not for bool, bitwise not for integers
};

enum class CastKind {
    Trunc,
    ZExt,
    SExt,
    FpToSi,
    FpToUi,
    SiToFp,
    UiToFp,
    FpTrunc,
    FpExt,
    PtrToInt,
    IntToPtr,
    Bitcast,
};

enum class AtomicOp {
    Load,
    Store,
    Add,
    Sub,
    Xchg,
    CmpXchg,
};

enum class IntrinsicKind {
    Abs,
    Min,
    Max,
    Sqrt,
    Trap,
};

[[nodiscard]] auto is_bitwise(BinOp op) -> bool;

// --- Control transfer -------------------------------------------------------

struct JumpInst {
    BlockId target;
};

struct JumpIfInst {
    Value condition;
    BlockId then_block;
    BlockId else_block;
};

struct SwitchInst {
    Value discriminant;
    std::vector<std::pair<int64_t, BlockId>> cases;
    BlockId default_block;
};

struct RetInst {
    std::optional<Value> value;
};

struct UnreachableInst {};

struct CallInst {
    std::string callee;
    std::vector<Value> args;
};

// --- Memory -----------------------------------------------------------------

struct AllocaInst {
    IrTypePtr alloc_type;
    std::string name;
};

// A spill_slot marks register-allocator traffic to a frame slot; `ptr` is
// undef in that case.
struct LoadInst {
    Value ptr;
    bool is_volatile = false;
    std::optional<uint32_t> spill_slot;
};

struct StoreInst {
    Value ptr;
    Value value;
    bool is_volatile = false;
    std::optional<uint32_t> spill_slot;
};

struct MemsetInst {
    Value dest;
    Value byte;
    Value size;
};

struct MemcpyInst {
    Value dest;
    Value src;
    Value size;
};

// --- Computation --------------------------------------------------------------

struct BinaryInst {
    BinOp op;
    Value lhs;
    Value rhs;
};

struct CompareInst {
    CmpOp op;
    Value lhs;
    Value rhs;
};

struct UnaryInst {
    UnaryOp op;
    Value operand;
};

// Target type is the instruction's result type
struct CastInst {
    CastKind kind;
    Value operand;
};

struct AtomicInst {
    AtomicOp op;
    Value ptr;
    std::optional<Value> value;    // Store, Add, Sub, Xchg, CmpXchg (desired)
    std::optional<Value> expected; // CmpXchg only
};

struct IntrinsicInst {
    IntrinsicKind kind;
    std::vector<Value> args;
};

struct PhiIncoming {
    BlockId block;
    Value value;
};

struct PhiInst {
    std::vector<PhiIncoming> incoming;
};

// Register-to-register move
struct CopyInst {
    Value source;
};

using Instruction =
    std::variant<JumpInst, JumpIfInst, SwitchInst, RetInst, UnreachableInst, CallInst, AllocaInst,
                 LoadInst, StoreInst, MemsetInst, MemcpyInst, BinaryInst, CompareInst, UnaryInst,
                 CastInst, AtomicInst, IntrinsicInst, PhiInst, CopyInst>;

struct InstructionData {
    ValueId result = INVALID_VALUE; // INVALID_VALUE for void instructions
    IrTypePtr type;                 // Result type (void type for void instructions)
    Instruction inst;
    std::optional<SourceSpan> span;

    [[nodiscard]] auto has_result() const -> bool {
        return result != INVALID_VALUE;
    }

    [[nodiscard]] auto result_value() const -> Value {
        return make_register(result, type);
    }

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(inst);
    }

    template <typename T> [[nodiscard]] auto as() -> T* {
        return std::get_if<T>(&inst);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T* {
        return std::get_if<T>(&inst);
    }
};

[[nodiscard]] auto is_terminator(const Instruction& inst) -> bool;

// Lowercase mnemonic, e.g. "add", "jump_if", "phi"
[[nodiscard]] auto opcode_name(const Instruction& inst) -> std::string;

// Operands in order; phi incoming values included
[[nodiscard]] auto operands(const Instruction& inst) -> std::vector<Value>;

// Visits every operand slot mutably, phi incoming values included
void for_each_operand(Instruction& inst, const std::function<void(Value&)>& fn);

// Successor blocks named by a terminator, in order, duplicates removed
[[nodiscard]] auto successors(const Instruction& inst) -> std::vector<BlockId>;

// Rewrites every reference to block `from` in a terminator to `to`
void retarget_successor(Instruction& inst, BlockId from, BlockId to);

[[nodiscard]] auto binop_name(BinOp op) -> const char*;
[[nodiscard]] auto cmpop_name(CmpOp op) -> const char*;
[[nodiscard]] auto cast_name(CastKind kind) -> const char*;
[[nodiscard]] auto intrinsic_name(IntrinsicKind kind) -> const char*;
[[nodiscard]] auto atomic_name(AtomicOp op) -> const char*;

// Maps a source-level name ("abs", "sqrt", ...) to an intrinsic
[[nodiscard]] auto intrinsic_from_name(std::string_view name) -> std::optional<IntrinsicKind>;

// ============================================================================
// Basic Blocks
// ============================================================================

struct BasicBlock {
    BlockId id;
    std::string name;
    std::vector<InstructionData> instructions;

    // Maintained by Function::rebuild_cfg. Phi operand order follows
    // `predecessors`.
    std::vector<BlockId> predecessors;
    std::vector<BlockId> successors;

    [[nodiscard]] auto is_terminated() const -> bool {
        return !instructions.empty() && is_terminator(instructions.back().inst);
    }

    [[nodiscard]] auto terminator() -> InstructionData* {
        return is_terminated() ? &instructions.back() : nullptr;
    }

    [[nodiscard]] auto terminator() const -> const InstructionData* {
        return is_terminated() ? &instructions.back() : nullptr;
    }

    // Index of the first non-phi instruction
    [[nodiscard]] auto first_non_phi() const -> size_t;
};

// ============================================================================
// Functions
// ============================================================================

struct FunctionParam {
    std::string name;
    IrTypePtr type;
    ValueId value_id;
};

struct Function {
    FunctionId id = 0;
    std::string name;
    std::vector<FunctionParam> params;
    IrTypePtr return_type;
    std::vector<BasicBlock> blocks;
    std::vector<std::string> attributes; // "inline", "noinline", "pure", "external"

    ValueId next_value_id = 0;
    BlockId next_block_id = 0;

    // Allocates a fresh virtual register
    auto fresh_value() -> ValueId {
        return next_value_id++;
    }

    // Appends a new empty block, returns its id
    auto create_block(const std::string& name = "") -> BlockId;

    // Adds a parameter and allocates its register
    auto add_param(const std::string& name, IrTypePtr type) -> ValueId;

    [[nodiscard]] auto get_block(BlockId id) -> BasicBlock*;
    [[nodiscard]] auto get_block(BlockId id) const -> const BasicBlock*;

    // Position of the block in `blocks`, or nullopt
    [[nodiscard]] auto block_index(BlockId id) const -> std::optional<size_t>;

    [[nodiscard]] auto has_attribute(std::string_view attr) const -> bool;

    // External declarations have no body
    [[nodiscard]] auto is_declaration() const -> bool {
        return blocks.empty();
    }

    [[nodiscard]] auto instruction_count() const -> size_t;

    // Recomputes successors and predecessors from terminators. Predecessor
    // order is block order, then terminator successor order.
    void rebuild_cfg();

    // Drops blocks unreachable from entry and prunes phi operands that name
    // removed predecessors. Returns true if anything was removed.
    auto remove_unreachable_blocks() -> bool;
};

// Replaces every use of register `from` with `to` in the whole function
void replace_all_uses(Function& func, ValueId from, const Value& to);

// Number of operand slots that reference each register
[[nodiscard]] auto count_uses(const Function& func) -> std::unordered_map<ValueId, size_t>;

// ============================================================================
// Modules
// ============================================================================

struct Global {
    std::string name;
    IrTypePtr type;
    std::optional<Constant> initializer;
    bool is_constant = false;
};

struct Module {
    std::string name;

    // Arena of functions; FunctionId is the index. Insertion order is
    // preserved and names are unique.
    std::vector<Function> functions;
    std::map<std::string, Global> globals;

    // Adds a function, assigning its id. Fails on a duplicate name.
    auto add_function(Function func) -> Result<FunctionId, std::string>;

    [[nodiscard]] auto find_function(std::string_view name) -> Function*;
    [[nodiscard]] auto find_function(std::string_view name) const -> const Function*;
    [[nodiscard]] auto function_id(std::string_view name) const -> std::optional<FunctionId>;

    // Re-derives the name index and ids after the arena was edited in place
    void reindex();

private:
    std::unordered_map<std::string, FunctionId> index_;
};

// ============================================================================
// Printing
// ============================================================================

class IrPrinter {
public:
    auto print_module(const Module& module) -> std::string;
    auto print_function(const Function& func) -> std::string;
    auto print_block(const BasicBlock& block) -> std::string;
    auto print_instruction(const InstructionData& inst) -> std::string;
    auto print_value(const Value& value) -> std::string;
};

auto print_module(const Module& module) -> std::string;
auto print_function(const Function& func) -> std::string;

} // namespace kir::ir
