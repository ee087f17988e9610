//! # KIR Type and Value Implementation
//!
//! Type queries, type constructors, constant normalization and value
//! constructors.
//!
//! ## Integer Representation
//!
//! Every integer constant is stored as an `int64_t` that has already been
//! wrapped to its type's width. `i8 200` is stored as `-56`, `u8 -1` as `255`.
//! Folding relies on this: it computes in 64 bits and normalizes the result.

#include "ir/ir.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace kir::ir {

// ============================================================================
// IrType Methods
// ============================================================================

auto IrType::primitive() const -> std::optional<PrimitiveType> {
    if (auto* p = std::get_if<IrPrimitiveType>(&kind)) {
        return p->kind;
    }
    return std::nullopt;
}

auto IrType::is_void() const -> bool {
    return primitive() == PrimitiveType::Void;
}

auto IrType::is_bool() const -> bool {
    return primitive() == PrimitiveType::Bool;
}

auto IrType::is_integer() const -> bool {
    auto p = primitive();
    if (!p) {
        return false;
    }
    switch (*p) {
    case PrimitiveType::I8:
    case PrimitiveType::I16:
    case PrimitiveType::I32:
    case PrimitiveType::I64:
    case PrimitiveType::U8:
    case PrimitiveType::U16:
    case PrimitiveType::U32:
    case PrimitiveType::U64:
        return true;
    default:
        return false;
    }
}

auto IrType::is_float() const -> bool {
    auto p = primitive();
    return p == PrimitiveType::F32 || p == PrimitiveType::F64;
}

auto IrType::is_signed() const -> bool {
    auto p = primitive();
    return p == PrimitiveType::I8 || p == PrimitiveType::I16 || p == PrimitiveType::I32 ||
           p == PrimitiveType::I64;
}

auto IrType::is_pointer() const -> bool {
    return primitive() == PrimitiveType::Ptr;
}

auto IrType::is_aggregate() const -> bool {
    return !std::holds_alternative<IrPrimitiveType>(kind);
}

auto IrType::bit_width() const -> int {
    auto p = primitive();
    if (!p) {
        return 0;
    }
    switch (*p) {
    case PrimitiveType::Bool:
        return 1;
    case PrimitiveType::I8:
    case PrimitiveType::U8:
        return 8;
    case PrimitiveType::I16:
    case PrimitiveType::U16:
        return 16;
    case PrimitiveType::I32:
    case PrimitiveType::U32:
    case PrimitiveType::F32:
        return 32;
    case PrimitiveType::I64:
    case PrimitiveType::U64:
    case PrimitiveType::F64:
    case PrimitiveType::Ptr:
        return 64;
    case PrimitiveType::Void:
        return 0;
    }
    return 0;
}

auto IrType::size_in_bytes() const -> size_t {
    if (auto* arr = std::get_if<IrArrayType>(&kind)) {
        return arr->element->size_in_bytes() * arr->size;
    }
    if (auto* st = std::get_if<IrStructType>(&kind)) {
        // Fields are laid out naturally aligned
        size_t offset = 0;
        size_t max_align = 1;
        for (const auto& field : st->fields) {
            size_t size = field->size_in_bytes();
            size_t align = std::max<size_t>(1, std::min<size_t>(size, 8));
            offset = (offset + align - 1) / align * align;
            offset += size;
            max_align = std::max(max_align, align);
        }
        return (offset + max_align - 1) / max_align * max_align;
    }
    int bits = bit_width();
    return bits <= 8 ? (bits == 0 ? 0 : 1) : static_cast<size_t>(bits / 8);
}

auto IrType::to_string() const -> std::string {
    return std::visit(
        [](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, IrPrimitiveType>) {
                switch (t.kind) {
                case PrimitiveType::Void:
                    return "void";
                case PrimitiveType::Bool:
                    return "bool";
                case PrimitiveType::I8:
                    return "i8";
                case PrimitiveType::I16:
                    return "i16";
                case PrimitiveType::I32:
                    return "i32";
                case PrimitiveType::I64:
                    return "i64";
                case PrimitiveType::U8:
                    return "u8";
                case PrimitiveType::U16:
                    return "u16";
                case PrimitiveType::U32:
                    return "u32";
                case PrimitiveType::U64:
                    return "u64";
                case PrimitiveType::F32:
                    return "f32";
                case PrimitiveType::F64:
                    return "f64";
                case PrimitiveType::Ptr:
                    return "ptr";
                }
                return "?";
            } else if constexpr (std::is_same_v<T, IrArrayType>) {
                return "[" + t.element->to_string() + "; " + std::to_string(t.size) + "]";
            } else {
                std::string s = "{";
                for (size_t i = 0; i < t.fields.size(); ++i) {
                    if (i > 0) {
                        s += ", ";
                    }
                    s += t.fields[i]->to_string();
                }
                return t.name + s + "}";
            }
        },
        kind);
}

auto type_equals(const IrTypePtr& a, const IrTypePtr& b) -> bool {
    if (!a || !b) {
        return !a && !b;
    }
    if (a == b) {
        return true;
    }
    if (a->kind.index() != b->kind.index()) {
        return false;
    }
    if (auto pa = a->primitive()) {
        return *pa == *b->primitive();
    }
    if (auto* arr = std::get_if<IrArrayType>(&a->kind)) {
        const auto& other = std::get<IrArrayType>(b->kind);
        return arr->size == other.size && type_equals(arr->element, other.element);
    }
    const auto& sa = std::get<IrStructType>(a->kind);
    const auto& sb = std::get<IrStructType>(b->kind);
    if (sa.name != sb.name || sa.fields.size() != sb.fields.size()) {
        return false;
    }
    for (size_t i = 0; i < sa.fields.size(); ++i) {
        if (!type_equals(sa.fields[i], sb.fields[i])) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Type Constructors
// ============================================================================

auto make_primitive_type(PrimitiveType kind) -> IrTypePtr {
    return std::make_shared<IrType>(IrType{IrPrimitiveType{kind}});
}

auto make_void_type() -> IrTypePtr {
    return make_primitive_type(PrimitiveType::Void);
}

auto make_bool_type() -> IrTypePtr {
    return make_primitive_type(PrimitiveType::Bool);
}

auto make_i8_type() -> IrTypePtr {
    return make_primitive_type(PrimitiveType::I8);
}

auto make_i32_type() -> IrTypePtr {
    return make_primitive_type(PrimitiveType::I32);
}

auto make_i64_type() -> IrTypePtr {
    return make_primitive_type(PrimitiveType::I64);
}

auto make_u32_type() -> IrTypePtr {
    return make_primitive_type(PrimitiveType::U32);
}

auto make_u64_type() -> IrTypePtr {
    return make_primitive_type(PrimitiveType::U64);
}

auto make_f32_type() -> IrTypePtr {
    return make_primitive_type(PrimitiveType::F32);
}

auto make_f64_type() -> IrTypePtr {
    return make_primitive_type(PrimitiveType::F64);
}

auto make_ptr_type() -> IrTypePtr {
    return make_primitive_type(PrimitiveType::Ptr);
}

auto make_array_type(IrTypePtr element, size_t size) -> IrTypePtr {
    return std::make_shared<IrType>(IrType{IrArrayType{std::move(element), size}});
}

auto make_struct_type(const std::string& name, std::vector<IrTypePtr> fields) -> IrTypePtr {
    return std::make_shared<IrType>(IrType{IrStructType{name, std::move(fields)}});
}

// ============================================================================
// Values
// ============================================================================

auto normalize_int(int64_t value, const IrType& type) -> int64_t {
    int bits = type.bit_width();
    if (bits <= 0 || bits >= 64) {
        return value;
    }
    uint64_t mask = (uint64_t{1} << bits) - 1;
    uint64_t raw = static_cast<uint64_t>(value) & mask;
    if (type.is_signed() && (raw >> (bits - 1)) != 0) {
        raw |= ~mask;
    }
    return static_cast<int64_t>(raw);
}

auto Value::as_int() const -> std::optional<int64_t> {
    if (auto* c = as_constant()) {
        if (auto* i = std::get_if<ConstInt>(c)) {
            return i->value;
        }
    }
    return std::nullopt;
}

auto Value::as_float() const -> std::optional<double> {
    if (auto* c = as_constant()) {
        if (auto* f = std::get_if<ConstFloat>(c)) {
            return f->value;
        }
    }
    return std::nullopt;
}

auto Value::as_bool() const -> std::optional<bool> {
    if (auto* c = as_constant()) {
        if (auto* b = std::get_if<ConstBool>(c)) {
            return b->value;
        }
    }
    return std::nullopt;
}

static auto constant_equals(const Constant& a, const Constant& b) -> bool {
    if (a.index() != b.index()) {
        return false;
    }
    if (auto* i = std::get_if<ConstInt>(&a)) {
        return i->value == std::get<ConstInt>(b).value;
    }
    if (auto* f = std::get_if<ConstFloat>(&a)) {
        return std::bit_cast<uint64_t>(f->value) ==
               std::bit_cast<uint64_t>(std::get<ConstFloat>(b).value);
    }
    if (auto* bl = std::get_if<ConstBool>(&a)) {
        return bl->value == std::get<ConstBool>(b).value;
    }
    return true;
}

auto Value::operator==(const Value& other) const -> bool {
    if (kind.index() != other.kind.index()) {
        return false;
    }
    bool same = std::visit(
        [&other](const auto& k) -> bool {
            using T = std::decay_t<decltype(k)>;
            const auto& o = std::get<T>(other.kind);
            if constexpr (std::is_same_v<T, Constant>) {
                return constant_equals(k, o);
            } else if constexpr (std::is_same_v<T, RegisterRef>) {
                return k.id == o.id;
            } else if constexpr (std::is_same_v<T, GlobalRef>) {
                return k.symbol == o.symbol;
            } else {
                return true;
            }
        },
        kind);
    return same && type_equals(type, other.type);
}

auto make_register(ValueId id, IrTypePtr type) -> Value {
    return Value{RegisterRef{id}, std::move(type)};
}

auto make_const_int(int64_t value, IrTypePtr type) -> Value {
    int64_t normalized = normalize_int(value, *type);
    return Value{Constant{ConstInt{normalized}}, std::move(type)};
}

auto make_const_float(double value, IrTypePtr type) -> Value {
    if (type->primitive() == PrimitiveType::F32) {
        value = static_cast<double>(static_cast<float>(value));
    }
    return Value{Constant{ConstFloat{value}}, std::move(type)};
}

auto make_const_bool(bool value) -> Value {
    return Value{Constant{ConstBool{value}}, make_bool_type()};
}

auto make_const_null() -> Value {
    return Value{Constant{ConstNull{}}, make_ptr_type()};
}

auto make_global(const std::string& symbol) -> Value {
    return Value{GlobalRef{symbol}, make_ptr_type()};
}

auto make_undef(IrTypePtr type) -> Value {
    return Value{UndefValue{}, std::move(type)};
}

} // namespace kir::ir
