// KIR Function and Module Implementation

#include "ir/ir.hpp"

#include <algorithm>
#include <unordered_set>

namespace kir::ir {

auto BasicBlock::first_non_phi() const -> size_t {
    size_t i = 0;
    while (i < instructions.size() && instructions[i].is<PhiInst>()) {
        ++i;
    }
    return i;
}

auto Function::create_block(const std::string& label) -> BlockId {
    BlockId id = next_block_id++;
    BasicBlock block;
    block.id = id;
    block.name = label.empty() ? "bb" + std::to_string(id) : label;
    blocks.push_back(std::move(block));
    return id;
}

auto Function::add_param(const std::string& param_name, IrTypePtr type) -> ValueId {
    ValueId id = fresh_value();
    params.push_back(FunctionParam{param_name, std::move(type), id});
    return id;
}

auto Function::get_block(BlockId block_id) -> BasicBlock* {
    for (auto& block : blocks) {
        if (block.id == block_id) {
            return &block;
        }
    }
    return nullptr;
}

auto Function::get_block(BlockId block_id) const -> const BasicBlock* {
    for (const auto& block : blocks) {
        if (block.id == block_id) {
            return &block;
        }
    }
    return nullptr;
}

auto Function::block_index(BlockId block_id) const -> std::optional<size_t> {
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (blocks[i].id == block_id) {
            return i;
        }
    }
    return std::nullopt;
}

auto Function::has_attribute(std::string_view attr) const -> bool {
    return std::find(attributes.begin(), attributes.end(), attr) != attributes.end();
}

auto Function::instruction_count() const -> size_t {
    size_t count = 0;
    for (const auto& block : blocks) {
        count += block.instructions.size();
    }
    return count;
}

void Function::rebuild_cfg() {
    for (auto& block : blocks) {
        block.predecessors.clear();
        block.successors.clear();
    }
    for (auto& block : blocks) {
        if (const auto* term = block.terminator()) {
            block.successors = successors(term->inst);
        }
    }
    for (const auto& block : blocks) {
        for (BlockId succ : block.successors) {
            if (auto* target = get_block(succ)) {
                target->predecessors.push_back(block.id);
            }
        }
    }
}

auto Function::remove_unreachable_blocks() -> bool {
    if (blocks.empty()) {
        return false;
    }
    rebuild_cfg();

    std::unordered_set<BlockId> reachable;
    std::vector<BlockId> worklist = {blocks[0].id};
    while (!worklist.empty()) {
        BlockId id = worklist.back();
        worklist.pop_back();
        if (!reachable.insert(id).second) {
            continue;
        }
        if (const auto* block = get_block(id)) {
            for (BlockId succ : block->successors) {
                worklist.push_back(succ);
            }
        }
    }

    if (reachable.size() == blocks.size()) {
        return false;
    }

    std::erase_if(blocks, [&reachable](const BasicBlock& b) { return !reachable.contains(b.id); });

    for (auto& block : blocks) {
        for (auto& inst : block.instructions) {
            if (auto* phi = inst.as<PhiInst>()) {
                std::erase_if(phi->incoming, [&reachable](const PhiIncoming& in) {
                    return !reachable.contains(in.block);
                });
            }
        }
    }
    rebuild_cfg();
    return true;
}

void replace_all_uses(Function& func, ValueId from, const Value& to) {
    for (auto& block : func.blocks) {
        for (auto& inst : block.instructions) {
            for_each_operand(inst.inst, [from, &to](Value& v) {
                if (v.reg() == from) {
                    v = to;
                }
            });
        }
    }
}

auto count_uses(const Function& func) -> std::unordered_map<ValueId, size_t> {
    std::unordered_map<ValueId, size_t> uses;
    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            for (const auto& v : operands(inst.inst)) {
                if (v.is_register()) {
                    ++uses[v.reg()];
                }
            }
        }
    }
    return uses;
}

// ============================================================================
// Module
// ============================================================================

auto Module::add_function(Function func) -> Result<FunctionId, std::string> {
    if (index_.contains(func.name)) {
        return "duplicate function '" + func.name + "' in module '" + name + "'";
    }
    auto id = static_cast<FunctionId>(functions.size());
    func.id = id;
    index_[func.name] = id;
    functions.push_back(std::move(func));
    return id;
}

auto Module::find_function(std::string_view fn_name) -> Function* {
    auto id = function_id(fn_name);
    return id ? &functions[*id] : nullptr;
}

auto Module::find_function(std::string_view fn_name) const -> const Function* {
    auto id = function_id(fn_name);
    return id ? &functions[*id] : nullptr;
}

auto Module::function_id(std::string_view fn_name) const -> std::optional<FunctionId> {
    auto it = index_.find(std::string(fn_name));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Module::reindex() {
    index_.clear();
    for (size_t i = 0; i < functions.size(); ++i) {
        functions[i].id = static_cast<FunctionId>(i);
        index_[functions[i].name] = functions[i].id;
    }
}

} // namespace kir::ir
