// KIR Printer Implementation
//
// Textual form used by logs, tests and the direct emitter's listing:
//
//   func @sum(%0: i32) -> i32 {
//   bb0 (entry):
//       %1 = add i32 %0, 1
//       jump bb1
//   bb1 (loop_header): preds bb0, bb2
//       %2 = phi i32 [bb0: %1], [bb2: %5]
//   }

#include "ir/ir.hpp"

#include <cmath>
#include <sstream>

namespace kir::ir {

auto IrPrinter::print_value(const Value& value) -> std::string {
    return std::visit(
        [&value](const auto& k) -> std::string {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, RegisterRef>) {
                return "%" + std::to_string(k.id);
            } else if constexpr (std::is_same_v<T, GlobalRef>) {
                return "@" + k.symbol;
            } else if constexpr (std::is_same_v<T, UndefValue>) {
                return "undef";
            } else {
                if (auto* i = std::get_if<ConstInt>(&k)) {
                    if (value.type && !value.type->is_signed()) {
                        return std::to_string(static_cast<uint64_t>(i->value));
                    }
                    return std::to_string(i->value);
                }
                if (auto* f = std::get_if<ConstFloat>(&k)) {
                    if (std::isnan(f->value)) {
                        return "nan";
                    }
                    if (std::isinf(f->value)) {
                        return f->value > 0 ? "inf" : "-inf";
                    }
                    std::ostringstream oss;
                    oss << f->value;
                    auto s = oss.str();
                    if (s.find_first_of(".e") == std::string::npos) {
                        s += ".0";
                    }
                    return s;
                }
                if (auto* b = std::get_if<ConstBool>(&k)) {
                    return b->value ? "true" : "false";
                }
                return "null";
            }
        },
        value.kind);
}

auto IrPrinter::print_instruction(const InstructionData& data) -> std::string {
    std::ostringstream out;
    if (data.has_result()) {
        out << "%" << data.result << " = ";
    }

    auto block_ref = [](BlockId id) { return "bb" + std::to_string(id); };
    auto value_list = [this](const std::vector<Value>& values) {
        std::string s;
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                s += ", ";
            }
            s += print_value(values[i]);
        }
        return s;
    };

    out << opcode_name(data.inst);

    std::visit(
        [&](const auto& i) {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, JumpInst>) {
                out << " " << block_ref(i.target);
            } else if constexpr (std::is_same_v<T, JumpIfInst>) {
                out << " " << print_value(i.condition) << ", " << block_ref(i.then_block) << ", "
                    << block_ref(i.else_block);
            } else if constexpr (std::is_same_v<T, SwitchInst>) {
                out << " " << print_value(i.discriminant) << " [";
                for (size_t c = 0; c < i.cases.size(); ++c) {
                    if (c > 0) {
                        out << ", ";
                    }
                    out << i.cases[c].first << ": " << block_ref(i.cases[c].second);
                }
                out << "] default " << block_ref(i.default_block);
            } else if constexpr (std::is_same_v<T, RetInst>) {
                if (i.value) {
                    out << " " << i.value->type->to_string() << " " << print_value(*i.value);
                }
            } else if constexpr (std::is_same_v<T, CallInst>) {
                out << " " << data.type->to_string() << " @" << i.callee << "("
                    << value_list(i.args) << ")";
            } else if constexpr (std::is_same_v<T, AllocaInst>) {
                out << " " << i.alloc_type->to_string();
                if (!i.name.empty()) {
                    out << " ; " << i.name;
                }
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                out << (i.is_volatile ? " volatile " : " ") << data.type->to_string() << " ";
                if (i.spill_slot) {
                    out << "slot" << *i.spill_slot;
                } else {
                    out << print_value(i.ptr);
                }
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                out << (i.is_volatile ? " volatile " : " ") << i.value.type->to_string() << " "
                    << print_value(i.value) << ", ";
                if (i.spill_slot) {
                    out << "slot" << *i.spill_slot;
                } else {
                    out << print_value(i.ptr);
                }
            } else if constexpr (std::is_same_v<T, PhiInst>) {
                out << " " << data.type->to_string();
                for (size_t p = 0; p < i.incoming.size(); ++p) {
                    out << (p == 0 ? " " : ", ") << "[" << block_ref(i.incoming[p].block) << ": "
                        << print_value(i.incoming[p].value) << "]";
                }
            } else if constexpr (std::is_same_v<T, CastInst>) {
                out << " " << i.operand.type->to_string() << " " << print_value(i.operand)
                    << " to " << data.type->to_string();
            } else if constexpr (std::is_same_v<T, UnreachableInst>) {
                // no operands
            } else {
                auto ops = operands(data.inst);
                if (!ops.empty()) {
                    out << " " << ops.front().type->to_string() << " " << value_list(ops);
                }
            }
        },
        data.inst);

    return out.str();
}

auto IrPrinter::print_block(const BasicBlock& block) -> std::string {
    std::ostringstream out;
    out << "bb" << block.id;
    if (block.name != "bb" + std::to_string(block.id)) {
        out << " (" << block.name << ")";
    }
    out << ":";
    if (!block.predecessors.empty()) {
        out << " preds ";
        for (size_t i = 0; i < block.predecessors.size(); ++i) {
            out << (i > 0 ? ", " : "") << "bb" << block.predecessors[i];
        }
    }
    out << "\n";
    for (const auto& inst : block.instructions) {
        out << "    " << print_instruction(inst) << "\n";
    }
    return out.str();
}

auto IrPrinter::print_function(const Function& func) -> std::string {
    std::ostringstream out;
    out << (func.is_declaration() ? "declare @" : "func @") << func.name << "(";
    for (size_t i = 0; i < func.params.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << "%" << func.params[i].value_id << ": " << func.params[i].type->to_string();
    }
    out << ") -> " << func.return_type->to_string();
    for (const auto& attr : func.attributes) {
        out << " #" << attr;
    }
    if (func.is_declaration()) {
        out << "\n";
        return out.str();
    }
    out << " {\n";
    for (const auto& block : func.blocks) {
        out << print_block(block);
    }
    out << "}\n";
    return out.str();
}

auto IrPrinter::print_module(const Module& module) -> std::string {
    std::ostringstream out;
    out << "; module " << module.name << "\n";
    for (const auto& [name, global] : module.globals) {
        out << "@" << name << " = " << (global.is_constant ? "constant " : "global ")
            << global.type->to_string();
        if (global.initializer) {
            out << " " << print_value(Value{*global.initializer, global.type});
        }
        out << "\n";
    }
    for (const auto& func : module.functions) {
        out << "\n" << print_function(func);
    }
    return out.str();
}

auto print_module(const Module& module) -> std::string {
    IrPrinter printer;
    return printer.print_module(module);
}

auto print_function(const Function& func) -> std::string {
    IrPrinter printer;
    return printer.print_function(func);
}

} // namespace kir::ir
