// Common Subexpression Elimination Pass Implementation

#include "ir/passes/common_subexpression_elimination.hpp"

#include "ir/cfg.hpp"
#include "log/log.hpp"

#include <bit>

namespace kir::ir {

namespace {

void hash_combine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

auto value_hash(const Value& v) -> std::size_t {
    std::size_t h = v.kind.index();
    std::visit(
        [&h](const auto& k) {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, RegisterRef>) {
                hash_combine(h, std::hash<ValueId>{}(k.id));
            } else if constexpr (std::is_same_v<T, GlobalRef>) {
                hash_combine(h, std::hash<std::string>{}(k.symbol));
            } else if constexpr (std::is_same_v<T, Constant>) {
                std::visit(
                    [&h](const auto& c) {
                        using C = std::decay_t<decltype(c)>;
                        if constexpr (std::is_same_v<C, ConstInt>) {
                            hash_combine(h, std::hash<int64_t>{}(c.value));
                        } else if constexpr (std::is_same_v<C, ConstFloat>) {
                            hash_combine(h, std::hash<uint64_t>{}(std::bit_cast<uint64_t>(c.value)));
                        } else if constexpr (std::is_same_v<C, ConstBool>) {
                            hash_combine(h, c.value ? 1 : 2);
                        }
                    },
                    k);
            }
        },
        v.kind);
    return h;
}

// Registers before constants, lower ids first
auto operand_less(const Value& a, const Value& b) -> bool {
    if (a.is_register() != b.is_register()) {
        return a.is_register();
    }
    if (a.is_register()) {
        return a.reg() < b.reg();
    }
    return value_hash(a) < value_hash(b);
}

auto is_commutative(BinOp op) -> bool {
    return op == BinOp::Add || op == BinOp::Mul || op == BinOp::And || op == BinOp::Or ||
           op == BinOp::Xor;
}

} // namespace

auto ExprKey::operator==(const ExprKey& other) const -> bool {
    return opcode == other.opcode && operands == other.operands && type_equals(type, other.type);
}

auto ExprKeyHash::operator()(const ExprKey& key) const -> std::size_t {
    std::size_t seed = std::hash<std::string>{}(key.opcode);
    for (const auto& op : key.operands) {
        hash_combine(seed, value_hash(op));
    }
    hash_combine(seed, std::hash<std::string>{}(key.type->to_string()));
    return seed;
}

auto CommonSubexpressionEliminationPass::make_expr_key(const InstructionData& inst)
    -> std::optional<ExprKey> {
    if (!inst.has_result()) {
        return std::nullopt;
    }
    return std::visit(
        [&inst](const auto& i) -> std::optional<ExprKey> {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, BinaryInst>) {
                ExprKey key{binop_name(i.op), {i.lhs, i.rhs}, inst.type};
                if (is_commutative(i.op) && operand_less(i.rhs, i.lhs)) {
                    std::swap(key.operands[0], key.operands[1]);
                }
                return key;
            } else if constexpr (std::is_same_v<T, CompareInst>) {
                ExprKey key{std::string("cmp.") + cmpop_name(i.op), {i.lhs, i.rhs}, inst.type};
                if ((i.op == CmpOp::Eq || i.op == CmpOp::Ne) && operand_less(i.rhs, i.lhs)) {
                    std::swap(key.operands[0], key.operands[1]);
                }
                return key;
            } else if constexpr (std::is_same_v<T, UnaryInst>) {
                return ExprKey{i.op == UnaryOp::Neg ? "neg" : "not", {i.operand}, inst.type};
            } else if constexpr (std::is_same_v<T, CastInst>) {
                return ExprKey{cast_name(i.kind), {i.operand}, inst.type};
            } else if constexpr (std::is_same_v<T, IntrinsicInst>) {
                if (i.kind == IntrinsicKind::Trap) {
                    return std::nullopt;
                }
                return ExprKey{intrinsic_name(i.kind), i.args, inst.type};
            } else {
                return std::nullopt;
            }
        },
        inst.inst);
}

auto CommonSubexpressionEliminationPass::run_on_function(Function& func) -> bool {
    func.rebuild_cfg();
    DominatorTree dom(func);
    if (dom.reverse_post_order().empty()) {
        return false;
    }

    std::unordered_map<ExprKey, Value, ExprKeyHash> available;
    std::unordered_map<ValueId, Value> replaced;

    auto resolve = [&replaced](Value& v) {
        while (v.is_register()) {
            auto it = replaced.find(v.reg());
            if (it == replaced.end()) {
                break;
            }
            v = it->second;
        }
    };

    struct Frame {
        BlockId block;
        size_t next_child;
        std::vector<ExprKey> inserted;
    };

    auto visit_block = [&](BlockId block_id) {
        std::vector<ExprKey> inserted;
        auto* block = func.get_block(block_id);
        for (auto& inst : block->instructions) {
            for_each_operand(inst.inst, resolve);
            auto key = make_expr_key(inst);
            if (!key) {
                continue;
            }
            auto it = available.find(*key);
            if (it != available.end()) {
                replaced[inst.result] = it->second;
                continue;
            }
            available.emplace(*key, inst.result_value());
            inserted.push_back(std::move(*key));
        }
        return inserted;
    };

    std::vector<Frame> work;
    work.push_back(Frame{dom.entry(), 0, visit_block(dom.entry())});
    while (!work.empty()) {
        auto& frame = work.back();
        const auto& kids = dom.children(frame.block);
        if (frame.next_child < kids.size()) {
            BlockId child = kids[frame.next_child++];
            work.push_back(Frame{child, 0, visit_block(child)});
            continue;
        }
        for (const auto& key : frame.inserted) {
            available.erase(key);
        }
        work.pop_back();
    }

    if (replaced.empty()) {
        return false;
    }

    for (auto& block : func.blocks) {
        std::erase_if(block.instructions, [&replaced](const InstructionData& inst) {
            return inst.has_result() && replaced.contains(inst.result);
        });
        for (auto& inst : block.instructions) {
            for_each_operand(inst.inst, resolve);
        }
    }

    stats_.subexpressions_eliminated += replaced.size();
    KIR_LOG_TRACE("opt", "cse eliminated " << replaced.size() << " expressions in '" << func.name
                                           << "'");
    return true;
}

} // namespace kir::ir
