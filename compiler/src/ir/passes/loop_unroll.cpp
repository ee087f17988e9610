// Loop Unrolling Pass Implementation

#include "ir/passes/loop_unroll.hpp"

#include "ir/eval.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <iterator>

namespace kir::ir {

namespace {

auto remap(const Value& v, const std::unordered_map<ValueId, Value>& map) -> Value {
    if (!v.is_register()) {
        return v;
    }
    auto it = map.find(v.reg());
    return it != map.end() ? it->second : v;
}

auto find_def(const Function& func, ValueId id) -> const InstructionData* {
    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            if (inst.result == id) {
                return &inst;
            }
        }
    }
    return nullptr;
}

} // namespace

auto LoopUnrollPass::run_on_function(Function& func) -> bool {
    bool changed = false;
    bool progress = true;
    while (progress) {
        progress = false;
        func.rebuild_cfg();
        DominatorTree dom(func);
        auto loops = find_loops(func, dom);

        // Innermost first
        std::stable_sort(loops.begin(), loops.end(), [](const Loop& a, const Loop& b) {
            return a.blocks.size() < b.blocks.size();
        });

        for (const auto& loop : loops) {
            auto info = analyze_loop(func, loop);
            if (!info) {
                continue;
            }
            fully_unroll(func, *info);
            ++stats_.loops_unrolled;
            KIR_LOG_TRACE("opt", "loop-unroll: unrolled loop at bb" << info->header << " in '"
                                                                     << func.name << "' "
                                                                     << info->iv_values.size() - 1
                                                                     << " times");
            changed = true;
            progress = true;
            break;
        }
    }
    return changed;
}

auto LoopUnrollPass::analyze_loop(const Function& func, const Loop& loop)
    -> std::optional<LoopInfo> {
    if (loop.latches.size() != 1 || loop.exits.size() != 1) {
        return std::nullopt;
    }

    LoopInfo info;
    info.header = loop.header;
    info.latch = loop.latches.front();
    info.exit = loop.exits.front();

    const auto* header = func.get_block(loop.header);
    if (header->predecessors.size() != 2) {
        return std::nullopt;
    }
    info.preheader = header->predecessors[0] == info.latch ? header->predecessors[1]
                                                           : header->predecessors[0];
    if (loop.contains(info.preheader)) {
        return std::nullopt;
    }

    size_t loop_size = 0;
    for (const auto& block : func.blocks) {
        if (!loop.contains(block.id)) {
            continue;
        }
        loop_size += block.instructions.size();
        if (block.id != loop.header) {
            info.blocks.push_back(block.id);
            for (BlockId succ : block.successors) {
                if (!loop.contains(succ)) {
                    return std::nullopt; // Exits other than through the header
                }
            }
        }
        for (const auto& inst : block.instructions) {
            if (inst.is<AllocaInst>()) {
                return std::nullopt;
            }
        }
    }

    // Exit test: jump_if (cmp %iv, BOUND) with one side leaving the loop
    const auto* br = header->terminator() ? header->terminator()->as<JumpIfInst>() : nullptr;
    if (!br || !br->condition.is_register()) {
        return std::nullopt;
    }
    bool then_in_loop = loop.contains(br->then_block);
    if (then_in_loop == loop.contains(br->else_block)) {
        return std::nullopt;
    }
    info.body_entry = then_in_loop ? br->then_block : br->else_block;

    const CompareInst* cmp = nullptr;
    for (const auto& inst : header->instructions) {
        if (inst.result == br->condition.reg()) {
            cmp = inst.as<CompareInst>();
        }
    }
    if (!cmp) {
        return std::nullopt;
    }

    // The induction variable is a header phi compared against a constant
    const InstructionData* iv_phi = nullptr;
    bool iv_on_left = true;
    for (size_t i = 0; i < header->first_non_phi(); ++i) {
        const auto& inst = header->instructions[i];
        if (inst.as<PhiInst>()->incoming.size() != 2) {
            return std::nullopt;
        }
        if (cmp->lhs.is_register() && cmp->lhs.reg() == inst.result && cmp->rhs.as_int()) {
            iv_phi = &inst;
            iv_on_left = true;
        } else if (cmp->rhs.is_register() && cmp->rhs.reg() == inst.result && cmp->lhs.as_int()) {
            iv_phi = &inst;
            iv_on_left = false;
        }
    }
    if (!iv_phi || !iv_phi->type->is_integer()) {
        return std::nullopt;
    }
    info.induction_var = iv_phi->result;

    std::optional<Value> start;
    std::optional<Value> next;
    for (const auto& in : iv_phi->as<PhiInst>()->incoming) {
        if (in.block == info.preheader) {
            start = in.value;
        } else {
            next = in.value;
        }
    }
    if (!start || !start->as_int() || !next || !next->is_register()) {
        return std::nullopt;
    }

    // next = %iv + STEP, STEP + %iv or %iv - STEP
    const auto* step_def = find_def(func, next->reg());
    const auto* step_inst = step_def ? step_def->as<BinaryInst>() : nullptr;
    if (!step_inst || !loop.contains(info.latch)) {
        return std::nullopt;
    }
    auto is_iv = [&info](const Value& v) {
        return v.is_register() && v.reg() == info.induction_var;
    };
    std::optional<Value> step;
    if (step_inst->op == BinOp::Add && is_iv(step_inst->lhs) && step_inst->rhs.as_int()) {
        step = step_inst->rhs;
    } else if (step_inst->op == BinOp::Add && is_iv(step_inst->rhs) && step_inst->lhs.as_int()) {
        step = step_inst->lhs;
    } else if (step_inst->op == BinOp::Sub && is_iv(step_inst->lhs) && step_inst->rhs.as_int()) {
        step = step_inst->rhs;
    }
    if (!step) {
        return std::nullopt;
    }

    // Step the induction variable until the exit test fails
    const auto& iv_type = iv_phi->type;
    Value bound = iv_on_left ? cmp->rhs : cmp->lhs;
    Value current = *start;
    while (true) {
        auto test = iv_on_left ? eval_compare(cmp->op, current, bound)
                               : eval_compare(cmp->op, bound, current);
        if (!test || !test->as_bool()) {
            return std::nullopt;
        }
        info.iv_values.push_back(*current.as_int());
        if (*test->as_bool() != then_in_loop) {
            break; // The last value is the one seen on exit
        }
        if (info.iv_values.size() > options_.max_trip_count) {
            KIR_LOG_DEBUG("opt", "loop-unroll: loop at bb" << info.header << " in '" << func.name
                                                           << "' exceeds the trip-count cap");
            return std::nullopt;
        }
        auto stepped = eval_binary(step_inst->op, current, *step, iv_type);
        if (!stepped) {
            return std::nullopt;
        }
        current = *stepped;
    }

    size_t trips = info.iv_values.size() - 1;
    if (trips * loop_size > options_.max_unrolled_size) {
        KIR_LOG_DEBUG("opt", "loop-unroll: loop at bb" << info.header << " in '" << func.name
                                                       << "' would exceed the size cap");
        return std::nullopt;
    }
    return info;
}

void LoopUnrollPass::fully_unroll(Function& func, const LoopInfo& info) {
    size_t trips = info.iv_values.size() - 1;
    const auto* header = func.get_block(info.header);

    struct HeaderPhi {
        ValueId result;
        IrTypePtr type;
        Value initial;
        Value carried;
    };
    std::vector<HeaderPhi> phis;
    for (size_t i = 0; i < header->first_non_phi(); ++i) {
        const auto& inst = header->instructions[i];
        HeaderPhi phi{inst.result, inst.type, make_undef(inst.type), make_undef(inst.type)};
        for (const auto& in : inst.as<PhiInst>()->incoming) {
            (in.block == info.preheader ? phi.initial : phi.carried) = in.value;
        }
        phis.push_back(std::move(phi));
    }

    std::vector<BlockId> header_ids;
    for (size_t k = 0; k <= trips; ++k) {
        header_ids.push_back(func.next_block_id++);
    }

    std::vector<BasicBlock> copies;
    std::unordered_map<ValueId, Value> previous;
    std::unordered_map<ValueId, Value> values;

    for (size_t k = 0; k <= trips; ++k) {
        values.clear();
        for (const auto& phi : phis) {
            if (phi.result == info.induction_var) {
                values[phi.result] = make_const_int(info.iv_values[k], phi.type);
            } else if (k == 0) {
                values[phi.result] = phi.initial;
            } else {
                values[phi.result] = remap(phi.carried, previous);
            }
        }

        bool last = k == trips;
        std::unordered_map<BlockId, BlockId> block_map;
        block_map[info.header] = header_ids[k];
        std::vector<const BasicBlock*> sources = {header};
        if (!last) {
            for (BlockId id : info.blocks) {
                block_map[id] = func.next_block_id++;
                sources.push_back(func.get_block(id));
            }
        }

        for (const auto* block : sources) {
            size_t first = block->id == info.header ? block->first_non_phi() : 0;
            for (size_t i = first; i < block->instructions.size(); ++i) {
                const auto& inst = block->instructions[i];
                if (inst.has_result()) {
                    values[inst.result] = make_register(func.fresh_value(), inst.type);
                }
            }
        }

        // Control leaving copy k: the header's back edge goes to copy k + 1
        auto target_of = [&](BlockId id) {
            if (id == info.header) {
                return header_ids[k + 1];
            }
            return block_map.at(id);
        };

        for (const auto* block : sources) {
            BasicBlock copy;
            copy.id = block_map[block->id];
            copy.name = block->name + ".u" + std::to_string(k);
            size_t first = block->id == info.header ? block->first_non_phi() : 0;
            for (size_t i = first; i < block->instructions.size(); ++i) {
                InstructionData clone = block->instructions[i];
                if (clone.has_result()) {
                    clone.result = values[clone.result].reg();
                }
                for_each_operand(clone.inst, [&values](Value& v) { v = remap(v, values); });

                if (auto* phi = clone.as<PhiInst>()) {
                    for (auto& in : phi->incoming) {
                        in.block = block_map.at(in.block);
                    }
                } else if (is_terminator(clone.inst)) {
                    if (block->id == info.header) {
                        clone.inst = JumpInst{last ? info.exit : target_of(info.body_entry)};
                    } else {
                        for (BlockId succ : successors(clone.inst)) {
                            retarget_successor(clone.inst, succ, target_of(succ));
                        }
                    }
                }
                copy.instructions.push_back(std::move(clone));
            }
            copies.push_back(std::move(copy));
        }
        previous = values;
    }

    // The exit now follows the last header copy; uses outside the loop read
    // the values of that copy
    for (auto& block : func.blocks) {
        bool in_loop = block.id == info.header ||
                       std::find(info.blocks.begin(), info.blocks.end(), block.id) !=
                           info.blocks.end();
        if (in_loop) {
            continue;
        }
        for (auto& inst : block.instructions) {
            for_each_operand(inst.inst, [&values](Value& v) { v = remap(v, values); });
            if (auto* phi = inst.as<PhiInst>(); phi && block.id == info.exit) {
                for (auto& in : phi->incoming) {
                    if (in.block == info.header) {
                        in.block = header_ids.back();
                    }
                }
            }
        }
        if (block.id == info.preheader) {
            retarget_successor(block.terminator()->inst, info.header, header_ids.front());
        }
    }

    size_t pos = *func.block_index(info.header);
    std::erase_if(func.blocks, [&info](const BasicBlock& b) {
        return b.id == info.header ||
               std::find(info.blocks.begin(), info.blocks.end(), b.id) != info.blocks.end();
    });
    pos = std::min(pos, func.blocks.size());
    func.blocks.insert(func.blocks.begin() + static_cast<ptrdiff_t>(pos),
                       std::make_move_iterator(copies.begin()),
                       std::make_move_iterator(copies.end()));
    func.rebuild_cfg();
}

} // namespace kir::ir
