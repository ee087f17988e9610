// KIR SSA Construction Implementation

#include "ir/ssa.hpp"

#include "ir/cfg.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace kir::ir {

auto find_promotable_allocas(const Function& func) -> std::vector<ValueId> {
    std::vector<ValueId> order;
    std::unordered_map<ValueId, IrTypePtr> slots;
    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            if (const auto* alloca = inst.as<AllocaInst>()) {
                if (alloca->alloc_type && !alloca->alloc_type->is_aggregate() &&
                    !alloca->alloc_type->is_void()) {
                    slots[inst.result] = alloca->alloc_type;
                    order.push_back(inst.result);
                }
            }
        }
    }
    if (slots.empty()) {
        return {};
    }

    std::unordered_set<ValueId> rejected;
    auto is_slot = [&slots](const Value& v) { return v.is_register() && slots.contains(v.reg()); };

    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            if (const auto* load = inst.as<LoadInst>()) {
                if (is_slot(load->ptr) &&
                    (load->is_volatile || !type_equals(inst.type, slots[load->ptr.reg()]))) {
                    rejected.insert(load->ptr.reg());
                }
                continue;
            }
            if (const auto* store = inst.as<StoreInst>()) {
                if (is_slot(store->value)) {
                    rejected.insert(store->value.reg()); // Address escapes to memory
                }
                if (is_slot(store->ptr) &&
                    (store->is_volatile ||
                     !type_equals(store->value.type, slots[store->ptr.reg()]))) {
                    rejected.insert(store->ptr.reg());
                }
                continue;
            }
            for (const auto& op : operands(inst.inst)) {
                if (is_slot(op)) {
                    rejected.insert(op.reg());
                }
            }
        }
    }

    std::erase_if(order, [&rejected](ValueId id) { return rejected.contains(id); });
    return order;
}

namespace {

class Promoter {
public:
    Promoter(Function& func, const std::vector<ValueId>& slots) : func_(func) {
        for (ValueId slot : slots) {
            slot_index_[slot] = slot_types_.size();
            slot_types_.push_back(nullptr);
        }
        for (const auto& block : func_.blocks) {
            for (const auto& inst : block.instructions) {
                if (const auto* alloca = inst.as<AllocaInst>()) {
                    auto it = slot_index_.find(inst.result);
                    if (it != slot_index_.end()) {
                        slot_types_[it->second] = alloca->alloc_type;
                    }
                }
            }
        }
        stacks_.resize(slot_types_.size());
    }

    auto run() -> SsaStats {
        DominatorTree dom(func_);
        insert_phis(dom);
        rename(dom);
        cleanup();
        stats_.slots_promoted = slot_types_.size();
        return stats_;
    }

private:
    Function& func_;
    std::unordered_map<ValueId, size_t> slot_index_;
    std::vector<IrTypePtr> slot_types_;
    std::vector<std::vector<Value>> stacks_;

    // Inserted phi result -> slot index
    std::unordered_map<ValueId, size_t> phi_slots_;
    // Replaced load result -> reaching value
    std::unordered_map<ValueId, Value> replacements_;
    SsaStats stats_;

    auto slot_of(const Value& ptr) const -> std::optional<size_t> {
        if (!ptr.is_register()) {
            return std::nullopt;
        }
        auto it = slot_index_.find(ptr.reg());
        if (it == slot_index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto resolve(Value v) const -> Value {
        while (v.is_register()) {
            auto it = replacements_.find(v.reg());
            if (it == replacements_.end()) {
                break;
            }
            v = it->second;
        }
        return v;
    }

    auto current_value(size_t slot) const -> Value {
        if (stacks_[slot].empty()) {
            return make_undef(slot_types_[slot]);
        }
        return stacks_[slot].back();
    }

    void insert_phis(const DominatorTree& dom) {
        std::vector<std::set<BlockId>> def_blocks(slot_types_.size());
        for (const auto& block : func_.blocks) {
            if (!dom.is_reachable(block.id)) {
                continue;
            }
            for (const auto& inst : block.instructions) {
                if (const auto* store = inst.as<StoreInst>()) {
                    if (auto slot = slot_of(store->ptr)) {
                        def_blocks[*slot].insert(block.id);
                    }
                }
            }
        }

        for (size_t slot = 0; slot < slot_types_.size(); ++slot) {
            for (BlockId target : dom.iterated_dominance_frontier(def_blocks[slot])) {
                auto* block = func_.get_block(target);
                PhiInst phi;
                for (BlockId pred : block->predecessors) {
                    phi.incoming.push_back(PhiIncoming{pred, make_undef(slot_types_[slot])});
                }
                ValueId id = func_.fresh_value();
                // New phis go after existing ones, keeping the phi group contiguous
                auto pos = block->instructions.begin() +
                           static_cast<ptrdiff_t>(block->first_non_phi());
                block->instructions.insert(
                    pos, InstructionData{id, slot_types_[slot], std::move(phi), std::nullopt});
                phi_slots_[id] = slot;
                ++stats_.phis_inserted;
            }
        }
    }

    void rename(const DominatorTree& dom) {
        struct Frame {
            BlockId block;
            size_t next_child;
            std::vector<size_t> pushed;
        };

        std::vector<Frame> work;
        work.push_back(Frame{dom.entry(), 0, enter_block(dom.entry())});

        while (!work.empty()) {
            auto& frame = work.back();
            const auto& kids = dom.children(frame.block);
            if (frame.next_child < kids.size()) {
                BlockId child = kids[frame.next_child++];
                work.push_back(Frame{child, 0, enter_block(child)});
                continue;
            }
            for (size_t slot : frame.pushed) {
                stacks_[slot].pop_back();
            }
            work.pop_back();
        }
    }

    // Processes one block in dominator order; returns the slots pushed
    auto enter_block(BlockId block_id) -> std::vector<size_t> {
        std::vector<size_t> pushed;
        auto* block = func_.get_block(block_id);

        for (auto& inst : block->instructions) {
            if (inst.is<PhiInst>()) {
                auto it = phi_slots_.find(inst.result);
                if (it != phi_slots_.end()) {
                    stacks_[it->second].push_back(inst.result_value());
                    pushed.push_back(it->second);
                }
                continue;
            }
            if (auto* load = inst.as<LoadInst>()) {
                if (auto slot = slot_of(load->ptr)) {
                    replacements_[inst.result] = current_value(*slot);
                    ++stats_.loads_replaced;
                    continue;
                }
            }
            if (auto* store = inst.as<StoreInst>()) {
                if (auto slot = slot_of(store->ptr)) {
                    stacks_[*slot].push_back(resolve(store->value));
                    pushed.push_back(*slot);
                    continue;
                }
            }
            for_each_operand(inst.inst, [this](Value& v) { v = resolve(v); });
        }

        for (BlockId succ_id : block->successors) {
            auto* succ = func_.get_block(succ_id);
            for (size_t i = 0; i < succ->first_non_phi(); ++i) {
                auto& inst = succ->instructions[i];
                auto it = phi_slots_.find(inst.result);
                if (it == phi_slots_.end()) {
                    continue;
                }
                for (auto& incoming : inst.as<PhiInst>()->incoming) {
                    if (incoming.block == block_id) {
                        incoming.value = current_value(it->second);
                    }
                }
            }
        }
        return pushed;
    }

    void cleanup() {
        // Loads in unreachable blocks were never visited; they read nothing
        for (const auto& block : func_.blocks) {
            for (const auto& inst : block.instructions) {
                const auto* load = inst.as<LoadInst>();
                if (load && slot_of(load->ptr) && !replacements_.contains(inst.result)) {
                    replacements_[inst.result] = make_undef(inst.type);
                }
            }
        }

        for (auto& block : func_.blocks) {
            std::erase_if(block.instructions, [this](const InstructionData& inst) {
                if (inst.is<AllocaInst>()) {
                    return slot_index_.contains(inst.result);
                }
                if (const auto* load = inst.as<LoadInst>()) {
                    return slot_of(load->ptr).has_value();
                }
                if (const auto* store = inst.as<StoreInst>()) {
                    return slot_of(store->ptr).has_value();
                }
                return false;
            });
        }

        // Operands in blocks visited before their reaching definition
        // (phi inputs along back edges, unreachable code)
        for (auto& block : func_.blocks) {
            for (auto& inst : block.instructions) {
                for_each_operand(inst.inst, [this](Value& v) { v = resolve(v); });
            }
        }
    }
};

} // namespace

auto construct_ssa(Function& func) -> SsaStats {
    if (func.is_declaration()) {
        return {};
    }
    func.rebuild_cfg();
    auto slots = find_promotable_allocas(func);
    if (slots.empty()) {
        return {};
    }
    Promoter promoter(func, slots);
    auto stats = promoter.run();
    KIR_LOG_DEBUG("ssa", "'" << func.name << "': promoted " << stats.slots_promoted
                             << " slots, inserted " << stats.phis_inserted << " phis");
    return stats;
}

auto construct_ssa(Module& module) -> SsaStats {
    SsaStats total;
    for (auto& func : module.functions) {
        auto stats = construct_ssa(func);
        total.slots_promoted += stats.slots_promoted;
        total.phis_inserted += stats.phis_inserted;
        total.loads_replaced += stats.loads_replaced;
    }
    return total;
}

} // namespace kir::ir
