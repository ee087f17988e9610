// Liveness and Live Intervals Implementation

#include "regalloc/live_intervals.hpp"

#include "ir/cfg.hpp"

#include <algorithm>

namespace kir::regalloc {

using namespace ir;

auto LivenessInfo::find(ValueId vreg) const -> const LiveInterval* {
    for (const auto& interval : intervals) {
        if (interval.vreg == vreg) {
            return &interval;
        }
    }
    return nullptr;
}

auto compute_liveness(const Function& func) -> LivenessInfo {
    LivenessInfo info;

    // Numbering
    uint32_t k = 0;
    for (const auto& block : func.blocks) {
        auto n = static_cast<uint32_t>(block.instructions.size());
        info.blocks[block.id] = n == 0 ? BlockRange{2 * k, 2 * k}
                                       : BlockRange{2 * k, 2 * (k + n - 1) + 1};
        k += n;
    }

    std::unordered_map<ValueId, IrTypePtr> types;
    std::unordered_map<ValueId, uint32_t> def_pos;
    std::unordered_map<ValueId, std::vector<uint32_t>> use_pos;
    for (const auto& param : func.params) {
        types[param.value_id] = param.type;
        def_pos[param.value_id] = 0;
    }

    // Per-block upward-exposed uses, definitions, and phi operands by edge
    std::unordered_map<BlockId, std::set<ValueId>> upward;
    std::unordered_map<BlockId, std::set<ValueId>> defs;
    std::unordered_map<BlockId, std::set<ValueId>> phi_uses;

    for (const auto& block : func.blocks) {
        uint32_t pos = info.blocks[block.id].first;
        auto& up = upward[block.id];
        auto& def = defs[block.id];
        for (const auto& inst : block.instructions) {
            if (const auto* phi = inst.as<PhiInst>()) {
                for (const auto& in : phi->incoming) {
                    if (!in.value.is_register()) {
                        continue;
                    }
                    phi_uses[in.block].insert(in.value.reg());
                    auto pred = info.blocks.find(in.block);
                    if (pred != info.blocks.end()) {
                        uint32_t at = pred->second.last > 0 ? pred->second.last - 1 : 0;
                        use_pos[in.value.reg()].push_back(at);
                    }
                }
            } else {
                for (const auto& v : operands(inst.inst)) {
                    if (!v.is_register()) {
                        continue;
                    }
                    use_pos[v.reg()].push_back(pos);
                    if (!def.contains(v.reg())) {
                        up.insert(v.reg());
                    }
                }
            }
            if (inst.has_result()) {
                types[inst.result] = inst.type;
                def_pos[inst.result] = pos + 1;
                def.insert(inst.result);
            }
            pos += 2;
        }
    }

    // Backward dataflow to a fixpoint
    bool changed = true;
    while (changed) {
        changed = false;
        for (auto it = func.blocks.rbegin(); it != func.blocks.rend(); ++it) {
            const auto& block = *it;
            std::set<ValueId> out;
            for (BlockId succ : block.successors) {
                const auto& succ_in = info.live_in[succ];
                out.insert(succ_in.begin(), succ_in.end());
            }
            const auto& edge_uses = phi_uses[block.id];
            out.insert(edge_uses.begin(), edge_uses.end());

            std::set<ValueId> in = upward[block.id];
            for (ValueId v : out) {
                if (!defs[block.id].contains(v)) {
                    in.insert(v);
                }
            }
            if (out != info.live_out[block.id] || in != info.live_in[block.id]) {
                info.live_out[block.id] = std::move(out);
                info.live_in[block.id] = std::move(in);
                changed = true;
            }
        }
    }

    // Intervals
    std::unordered_map<ValueId, std::pair<uint32_t, uint32_t>> ranges;
    auto extend = [&ranges](ValueId v, uint32_t lo, uint32_t hi) {
        auto [it, inserted] = ranges.try_emplace(v, lo, hi);
        if (!inserted) {
            it->second.first = std::min(it->second.first, lo);
            it->second.second = std::max(it->second.second, hi);
        }
    };
    for (const auto& [v, pos] : def_pos) {
        extend(v, pos, pos);
    }
    for (const auto& [v, positions] : use_pos) {
        if (def_pos.contains(v)) {
            for (uint32_t pos : positions) {
                extend(v, pos, pos);
            }
        }
    }
    for (const auto& block : func.blocks) {
        const auto& range = info.blocks[block.id];
        for (ValueId v : info.live_in[block.id]) {
            if (def_pos.contains(v)) {
                extend(v, range.first, range.first);
            }
        }
        for (ValueId v : info.live_out[block.id]) {
            if (def_pos.contains(v)) {
                extend(v, range.last, range.last);
            }
        }
    }

    // Values live around a back edge stay live for the whole loop
    if (!func.blocks.empty()) {
        DominatorTree dom(func);
        for (const auto& loop : find_loops(func, dom)) {
            uint32_t lo = UINT32_MAX;
            uint32_t hi = 0;
            for (BlockId id : loop.blocks) {
                lo = std::min(lo, info.blocks[id].first);
                hi = std::max(hi, info.blocks[id].last);
            }
            for (ValueId v : info.live_in[loop.header]) {
                if (def_pos.contains(v)) {
                    extend(v, lo, hi);
                }
            }
        }
    }

    for (auto& [v, range] : ranges) {
        LiveInterval interval{v, reg_class_of(types[v]), range.first, range.second, {}};
        if (auto it = use_pos.find(v); it != use_pos.end()) {
            interval.uses = it->second;
            std::sort(interval.uses.begin(), interval.uses.end());
        }
        info.intervals.push_back(std::move(interval));
    }
    std::sort(info.intervals.begin(), info.intervals.end(),
              [](const LiveInterval& a, const LiveInterval& b) {
                  return a.start != b.start ? a.start < b.start : a.vreg < b.vreg;
              });
    return info;
}

} // namespace kir::regalloc
