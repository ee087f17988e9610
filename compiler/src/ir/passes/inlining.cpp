//! # Function Inlining Pass
//!
//! This pass replaces function calls with the callee's body.
//!
//! ## Inlining Decisions
//!
//! | Attribute       | Behavior                                  |
//! |-----------------|-------------------------------------------|
//! | inline          | Always inline (up to recursion and depth) |
//! | noinline        | Never inline                              |
//! | (none)          | Inline when below the size threshold      |
//!
//! ## Inlining Process
//!
//! 1. Scan the caller for a call whose decision is `Inline`
//! 2. Split the block, clone the callee, merge the returns
//! 3. Restart the scan; calls that came from the clone carry the extended
//!    chain, so recursive bodies stop after one level

#include "ir/passes/inlining.hpp"

#include "log/log.hpp"

#include <iterator>

namespace kir::ir {

auto inline_decision_name(InlineDecision decision) -> const char* {
    switch (decision) {
    case InlineDecision::Inline:
        return "inline";
    case InlineDecision::NoDefinition:
        return "no definition";
    case InlineDecision::NeverInline:
        return "marked noinline";
    case InlineDecision::TooLarge:
        return "too large";
    case InlineDecision::Recursive:
        return "recursive";
    case InlineDecision::ChainTooDeep:
        return "inlining chain too deep";
    }
    return "unknown";
}

namespace {

// Rewrites every block reference in a terminator or phi through `map`
void remap_blocks(Instruction& inst, const std::unordered_map<BlockId, BlockId>& map) {
    auto lookup = [&map](BlockId id) {
        auto it = map.find(id);
        return it != map.end() ? it->second : id;
    };
    std::visit(
        [&lookup](auto& i) {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, JumpInst>) {
                i.target = lookup(i.target);
            } else if constexpr (std::is_same_v<T, JumpIfInst>) {
                i.then_block = lookup(i.then_block);
                i.else_block = lookup(i.else_block);
            } else if constexpr (std::is_same_v<T, SwitchInst>) {
                for (auto& entry : i.cases) {
                    entry.second = lookup(entry.second);
                }
                i.default_block = lookup(i.default_block);
            } else if constexpr (std::is_same_v<T, PhiInst>) {
                for (auto& in : i.incoming) {
                    in.block = lookup(in.block);
                }
            }
        },
        inst);
}

} // namespace

auto InliningPass::decide(const Function& callee, const std::set<FunctionId>& chain) const
    -> InlineDecision {
    if (callee.is_declaration()) {
        return InlineDecision::NoDefinition;
    }
    if (callee.has_attribute("noinline")) {
        return InlineDecision::NeverInline;
    }
    if (chain.contains(callee.id)) {
        return InlineDecision::Recursive;
    }
    if (chain.size() > options_.max_chain_depth) {
        return InlineDecision::ChainTooDeep;
    }
    if (!callee.has_attribute("inline") && callee.instruction_count() >= options_.threshold) {
        return InlineDecision::TooLarge;
    }
    return InlineDecision::Inline;
}

auto InliningPass::chain_of(const Function& func, BlockId block) -> std::set<FunctionId> {
    auto& blocks = chains_[func.id];
    auto it = blocks.find(block);
    if (it != blocks.end()) {
        return it->second;
    }
    return {func.id};
}

auto InliningPass::run(Module& module) -> bool {
    bool changed = false;
    for (auto& func : module.functions) {
        if (!func.is_declaration()) {
            changed |= inline_function_calls(module, func);
        }
    }
    return changed;
}

auto InliningPass::inline_function_calls(Module& module, Function& caller) -> bool {
    bool changed = false;
    bool progress = true;
    while (progress) {
        progress = false;
        for (size_t b = 0; b < caller.blocks.size() && !progress; ++b) {
            const auto& block = caller.blocks[b];
            for (size_t i = 0; i < block.instructions.size(); ++i) {
                const auto* call = block.instructions[i].as<CallInst>();
                if (!call) {
                    continue;
                }
                const Function* callee = module.find_function(call->callee);
                if (!callee) {
                    continue;
                }
                auto chain = chain_of(caller, block.id);
                auto decision = decide(*callee, chain);
                if (decision == InlineDecision::Recursive ||
                    decision == InlineDecision::ChainTooDeep) {
                    KIR_LOG_DEBUG("opt", "inline: refusing call to '"
                                             << callee->name << "' in '" << caller.name
                                             << "': " << inline_decision_name(decision));
                    continue;
                }
                if (decision != InlineDecision::Inline) {
                    continue;
                }
                KIR_LOG_TRACE("opt", "inline: '" << callee->name << "' into '" << caller.name
                                                 << "'");
                inline_call(caller, block.id, i, *callee, chain);
                ++stats_.calls_inlined;
                changed = true;
                progress = true;
                break;
            }
        }
    }
    return changed;
}

void InliningPass::inline_call(Function& caller, BlockId block_id, size_t index,
                               const Function& callee, const std::set<FunctionId>& chain) {
    size_t pos = *caller.block_index(block_id);
    InstructionData call_data = caller.blocks[pos].instructions[index];
    const auto& call = std::get<CallInst>(call_data.inst);

    // Split: everything after the call moves to the continuation
    BasicBlock cont;
    cont.id = caller.next_block_id++;
    cont.name = caller.blocks[pos].name + ".cont";
    {
        auto& insts = caller.blocks[pos].instructions;
        auto split = insts.begin() + static_cast<ptrdiff_t>(index);
        cont.instructions.assign(std::make_move_iterator(split + 1),
                                 std::make_move_iterator(insts.end()));
        insts.erase(split, insts.end());
    }

    // Successors now see the continuation as their predecessor
    if (const auto* term = cont.terminator()) {
        for (BlockId succ : successors(term->inst)) {
            auto* target = succ == block_id ? &caller.blocks[pos] : caller.get_block(succ);
            for (auto& inst : target->instructions) {
                if (auto* phi = inst.as<PhiInst>()) {
                    for (auto& in : phi->incoming) {
                        if (in.block == block_id) {
                            in.block = cont.id;
                        }
                    }
                }
            }
        }
    }

    // Fresh names for the callee's registers and blocks
    std::unordered_map<ValueId, Value> values;
    for (size_t i = 0; i < callee.params.size(); ++i) {
        values[callee.params[i].value_id] = call.args[i];
    }
    std::unordered_map<BlockId, BlockId> block_map;
    for (const auto& block : callee.blocks) {
        block_map[block.id] = caller.next_block_id++;
        for (const auto& inst : block.instructions) {
            if (inst.has_result()) {
                values[inst.result] = make_register(caller.fresh_value(), inst.type);
            }
        }
    }

    std::vector<BasicBlock> clones;
    std::vector<InstructionData> allocas;
    std::vector<PhiIncoming> returns;
    for (const auto& block : callee.blocks) {
        BasicBlock clone;
        clone.id = block_map[block.id];
        clone.name = callee.name + "." + block.name;
        for (const auto& inst : block.instructions) {
            InstructionData copy = inst;
            if (copy.has_result()) {
                copy.result = values[inst.result].reg();
            }
            for_each_operand(copy.inst, [&values](Value& v) {
                if (!v.is_register()) {
                    return;
                }
                auto it = values.find(v.reg());
                v = it != values.end() ? it->second : make_undef(v.type);
            });
            remap_blocks(copy.inst, block_map);

            if (auto* ret = copy.as<RetInst>()) {
                if (ret->value) {
                    returns.push_back(PhiIncoming{clone.id, *ret->value});
                } else {
                    returns.push_back(PhiIncoming{clone.id, make_undef(make_void_type())});
                }
                copy.inst = JumpInst{cont.id};
            }
            if (copy.is<AllocaInst>()) {
                allocas.push_back(std::move(copy));
                continue;
            }
            clone.instructions.push_back(std::move(copy));
        }
        clones.push_back(std::move(clone));
    }

    ValueId call_result = call_data.result;
    auto call_type = call_data.type;
    auto call_span = call_data.span;
    BlockId callee_entry = block_map[callee.blocks.front().id];

    if (call_result != INVALID_VALUE && returns.size() > 1) {
        // The merge phi takes over the call's register
        cont.instructions.insert(cont.instructions.begin(),
                                 InstructionData{call_result, call_type, PhiInst{returns},
                                                 call_span});
    }

    caller.blocks[pos].instructions.push_back(
        InstructionData{INVALID_VALUE, make_void_type(), JumpInst{callee_entry}, call_span});

    // Clones extend the call site's chain with the callee's own chain
    for (const auto& block : callee.blocks) {
        auto chained = chain_of(callee, block.id);
        chained.insert(chain.begin(), chain.end());
        chains_[caller.id][block_map[block.id]] = std::move(chained);
    }
    chains_[caller.id][cont.id] = chain;

    clones.push_back(std::move(cont));
    caller.blocks.insert(caller.blocks.begin() + static_cast<ptrdiff_t>(pos) + 1,
                         std::make_move_iterator(clones.begin()),
                         std::make_move_iterator(clones.end()));

    // Callee slots join the caller's frame at the top of its entry block
    auto& entry = caller.blocks.front().instructions;
    size_t slot_pos = 0;
    while (slot_pos < entry.size() && entry[slot_pos].is<AllocaInst>()) {
        ++slot_pos;
    }
    entry.insert(entry.begin() + static_cast<ptrdiff_t>(slot_pos),
                 std::make_move_iterator(allocas.begin()), std::make_move_iterator(allocas.end()));

    if (call_result != INVALID_VALUE) {
        if (returns.empty()) {
            replace_all_uses(caller, call_result, make_undef(call_type));
        } else if (returns.size() == 1) {
            replace_all_uses(caller, call_result, returns.front().value);
        }
    }

    caller.rebuild_cfg();
}

} // namespace kir::ir
