// Linear-Scan Register Allocation Implementation

#include "regalloc/linear_scan.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <unordered_set>

namespace kir::regalloc {

using namespace ir;

auto Location::to_string() const -> std::string {
    switch (kind) {
    case Kind::None:
        return "-";
    case Kind::Register:
        return reg;
    case Kind::SpillSlot:
        return "[slot " + std::to_string(slot) + "]";
    case Kind::Constant:
        return "imm";
    case Kind::Global:
        return "global";
    }
    return "?";
}

namespace {

void spill_value(const LiveInterval& interval, AllocationResult& result) {
    uint32_t slot = result.spill_slot_count++;
    result.spilled[interval.vreg] = slot;
    result.locations[interval.vreg] = Location::in_slot(slot);
    KIR_LOG_TRACE("regalloc", "spill %" << interval.vreg << " (" << reg_class_name(interval.cls)
                                        << ") [" << interval.start << ", " << interval.end
                                        << "] to slot " << slot);
}

struct SpillContext {
    const TargetDesc& target;
    const LivenessInfo& liveness;
    AllocationResult& result;
    Function& func;

    // Registers usable for spill traffic over [lo, hi]: the scratch registers,
    // then allocatable registers no surviving interval occupies there
    [[nodiscard]] auto pool(RegClass cls, uint32_t lo, uint32_t hi) const
        -> std::vector<std::string> {
        const auto& desc = target.registers(cls);
        std::vector<std::string> regs = desc.scratch;
        std::unordered_set<std::string> busy;
        for (const auto& interval : liveness.intervals) {
            if (interval.cls != cls || !interval.overlaps(lo, hi)) {
                continue;
            }
            auto loc = result.locations.find(interval.vreg);
            if (loc != result.locations.end() && loc->second.kind == Location::Kind::Register) {
                busy.insert(loc->second.reg);
            }
        }
        for (const auto& reg : desc.allocatable) {
            if (!busy.contains(reg)) {
                regs.push_back(reg);
            }
        }
        return regs;
    }

    // First position the reloads of instruction `k` must not disturb. Phi
    // operands leaving through a terminator are read just before it.
    static auto reload_window(const InstructionData& inst, uint32_t k) -> uint32_t {
        return is_terminator(inst.inst) && k > 0 ? 2 * k - 1 : 2 * k;
    }

    // Hands out pool registers per class for one program point
    struct Picker {
        const SpillContext& ctx;
        uint32_t lo;
        uint32_t hi;
        std::unordered_map<RegClass, std::vector<std::string>> pools;
        std::unordered_map<RegClass, size_t> used;

        auto take(RegClass cls) -> std::optional<std::string> {
            auto it = pools.find(cls);
            if (it == pools.end()) {
                it = pools.emplace(cls, ctx.pool(cls, lo, hi)).first;
            }
            size_t& n = used[cls];
            if (n >= it->second.size()) {
                return std::nullopt;
            }
            return it->second[n++];
        }

        [[nodiscard]] auto available(RegClass cls) const -> size_t {
            auto it = pools.find(cls);
            return it != pools.end() ? it->second.size() : 0;
        }
    };

    auto exhausted(RegClass cls, size_t available, const std::optional<SourceSpan>& span) const
        -> Diagnostic {
        return make_diagnostic(DiagnosticKind::AllocationExhaustion, Stage::RegAlloc, func.name,
                               std::string("spill traffic needs more ") + reg_class_name(cls) +
                                   " registers than the " + std::to_string(available) +
                                   " available at one instruction",
                               span);
    }

    [[nodiscard]] auto slot_of(const Value& v) const -> std::optional<uint32_t> {
        if (!v.is_register()) {
            return std::nullopt;
        }
        auto it = result.spilled.find(v.reg());
        if (it == result.spilled.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // `where` is a register, or the slot itself for a value that stays in memory
    auto make_reload(const Value& v, uint32_t slot, Location where,
                     const std::optional<SourceSpan>& span) -> InstructionData {
        ValueId r = func.fresh_value();
        result.locations[r] = std::move(where);
        ++result.reloads_inserted;
        return InstructionData{r, v.type, LoadInst{make_undef(make_ptr_type()), false, slot}, span};
    }

    auto make_store(ValueId temp, const IrTypePtr& type, uint32_t slot,
                    const std::optional<SourceSpan>& span) -> InstructionData {
        ++result.stores_inserted;
        return InstructionData{INVALID_VALUE, make_void_type(),
                               StoreInst{make_undef(make_ptr_type()), make_register(temp, type),
                                         false, slot},
                               span};
    }
};

} // namespace

void LinearScanAllocator::scan(const std::vector<const LiveInterval*>& intervals, RegClass cls,
                               AllocationResult& result) {
    const auto& regs = target_.registers(cls).allocatable;
    // pop_back hands out registers in preference order
    std::vector<std::string> free(regs.rbegin(), regs.rend());
    std::vector<const LiveInterval*> active; // Sorted by end
    std::unordered_map<ValueId, std::string> assigned;

    auto activate = [&](const LiveInterval* interval, std::string reg) {
        assigned[interval->vreg] = reg;
        result.locations[interval->vreg] = Location::in_register(std::move(reg));
        auto pos = std::upper_bound(active.begin(), active.end(), interval,
                                    [](const LiveInterval* a, const LiveInterval* b) {
                                        return a->end < b->end;
                                    });
        active.insert(pos, interval);
    };

    for (const auto* current : intervals) {
        // Expire intervals that ended before this one starts
        while (!active.empty() && active.front()->end < current->start) {
            free.push_back(assigned[active.front()->vreg]);
            active.erase(active.begin());
        }

        if (!free.empty()) {
            std::string reg = std::move(free.back());
            free.pop_back();
            activate(current, std::move(reg));
            continue;
        }

        // Spill whichever interval reaches furthest
        if (!active.empty() && active.back()->end > current->end) {
            const auto* victim = active.back();
            active.pop_back();
            std::string reg = assigned[victim->vreg];
            assigned.erase(victim->vreg);
            spill_value(*victim, result);
            activate(current, std::move(reg));
        } else {
            spill_value(*current, result);
        }
    }
}

auto LinearScanAllocator::relieve_pressure(Function& func, const LivenessInfo& liveness,
                                           AllocationResult& result)
    -> std::optional<Diagnostic> {
    if (result.spilled.empty()) {
        return std::nullopt;
    }
    SpillContext ctx{target_, liveness, result, func};
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& block : func.blocks) {
            uint32_t base = liveness.blocks.at(block.id).first / 2;
            for (size_t i = block.first_non_phi(); i < block.instructions.size(); ++i) {
                const auto& inst = block.instructions[i];
                uint32_t k = base + static_cast<uint32_t>(i);

                std::unordered_set<ValueId> involved;
                std::unordered_map<RegClass, std::unordered_set<ValueId>> reloads;
                for (const auto& v : operands(inst.inst)) {
                    if (!v.is_register()) {
                        continue;
                    }
                    involved.insert(v.reg());
                    if (result.spilled.contains(v.reg())) {
                        reloads[reg_class_of(v.type)].insert(v.reg());
                    }
                }
                if (inst.has_result()) {
                    involved.insert(inst.result);
                }

                for (RegClass cls : {RegClass::Gpr, RegClass::Vector}) {
                    size_t demand = reloads[cls].size();
                    if (inst.has_result() && reg_class_of(inst.type) == cls &&
                        result.spilled.contains(inst.result)) {
                        demand = std::max<size_t>(demand, 1);
                    }
                    uint32_t lo = SpillContext::reload_window(inst, k);
                    size_t available = ctx.pool(cls, lo, 2 * k).size();
                    while (demand > available) {
                        // Free the register of the interval passing through
                        // here that reaches furthest
                        const LiveInterval* victim = nullptr;
                        for (const auto& interval : liveness.intervals) {
                            if (interval.cls != cls || involved.contains(interval.vreg) ||
                                !interval.overlaps(lo, 2 * k) ||
                                result.location(interval.vreg).kind != Location::Kind::Register) {
                                continue;
                            }
                            if (!victim || interval.end > victim->end) {
                                victim = &interval;
                            }
                        }
                        if (!victim) {
                            return ctx.exhausted(cls, available, inst.span);
                        }
                        spill_value(*victim, result);
                        ++available;
                        changed = true;
                    }
                }
            }
        }
    }
    return std::nullopt;
}

auto LinearScanAllocator::insert_spill_code(Function& func, const LivenessInfo& liveness,
                                            AllocationResult& result)
    -> std::optional<Diagnostic> {
    if (result.spilled.empty()) {
        return std::nullopt;
    }
    SpillContext ctx{target_, liveness, result, func};
    std::vector<InstructionData> entry_stores;

    // Spilled parameters are written to their slot by the entry store; the
    // renamed parameter never occupies a register
    for (auto& param : func.params) {
        auto it = result.spilled.find(param.value_id);
        if (it == result.spilled.end()) {
            continue;
        }
        ValueId temp = func.fresh_value();
        result.locations[temp] = Location::in_slot(it->second);
        param.value_id = temp;
        entry_stores.push_back(ctx.make_store(temp, param.type, it->second, std::nullopt));
    }

    for (auto& block : func.blocks) {
        uint32_t base = liveness.blocks.at(block.id).first / 2;
        std::vector<InstructionData> rewritten;
        if (&block == &func.blocks.front()) {
            rewritten = std::move(entry_stores);
        }

        // Spilled phi results stay in their slot: the edge copy writes the
        // slot, and the store after the last phi is where that shows in the IR
        size_t phi_count = block.first_non_phi();
        std::vector<InstructionData> phi_stores;
        for (size_t i = 0; i < phi_count; ++i) {
            auto& phi = block.instructions[i];
            auto it = result.spilled.find(phi.result);
            if (it != result.spilled.end()) {
                ValueId temp = func.fresh_value();
                result.locations[temp] = Location::in_slot(it->second);
                phi.result = temp;
                phi_stores.push_back(ctx.make_store(temp, phi.type, it->second, phi.span));
            }
            rewritten.push_back(phi);
        }
        for (auto& store : phi_stores) {
            rewritten.push_back(std::move(store));
        }

        for (size_t i = phi_count; i < block.instructions.size(); ++i) {
            InstructionData inst = block.instructions[i];
            uint32_t k = base + static_cast<uint32_t>(i);
            // Reloads die at the use, so the result's register is free for them
            SpillContext::Picker picker{ctx, SpillContext::reload_window(inst, k), 2 * k, {}, {}};
            std::unordered_map<ValueId, Value> reloaded;

            auto reload = [&](Value& v) -> std::optional<Diagnostic> {
                auto slot = ctx.slot_of(v);
                if (!slot) {
                    return std::nullopt;
                }
                if (auto it = reloaded.find(v.reg()); it != reloaded.end()) {
                    v = it->second;
                    return std::nullopt;
                }
                RegClass cls = reg_class_of(v.type);
                auto reg = picker.take(cls);
                if (!reg) {
                    return ctx.exhausted(cls, picker.available(cls), inst.span);
                }
                auto load = ctx.make_reload(v, *slot, Location::in_register(*reg), inst.span);
                Value fresh = make_register(load.result, v.type);
                reloaded[v.reg()] = fresh;
                rewritten.push_back(std::move(load));
                v = fresh;
                return std::nullopt;
            };

            std::optional<Diagnostic> error;
            for_each_operand(inst.inst, [&](Value& v) {
                if (!error) {
                    error = reload(v);
                }
            });
            if (error) {
                return error;
            }

            // Spilled phi operands flowing out of this block are reloaded
            // before the terminator without a register; the edge copy reads
            // the slot
            if (is_terminator(inst.inst)) {
                struct EdgeUse {
                    std::vector<InstructionData>* insts;
                    size_t phi;
                    size_t operand;
                };
                std::vector<EdgeUse> edge_uses;
                std::unordered_set<BlockId> seen;
                for (BlockId succ : successors(inst.inst)) {
                    if (!seen.insert(succ).second) {
                        continue;
                    }
                    auto* target = succ == block.id ? &rewritten
                                                    : &func.get_block(succ)->instructions;
                    for (size_t p = 0; p < target->size(); ++p) {
                        const auto* phi = (*target)[p].as<PhiInst>();
                        if (!phi) {
                            break;
                        }
                        for (size_t o = 0; o < phi->incoming.size(); ++o) {
                            if (phi->incoming[o].block == block.id) {
                                edge_uses.push_back(EdgeUse{target, p, o});
                            }
                        }
                    }
                }
                // Reloads append to `rewritten`, so operands are read and
                // written back by index
                std::unordered_map<ValueId, Value> edge_reloads;
                for (const auto& use : edge_uses) {
                    Value v = std::get<PhiInst>((*use.insts)[use.phi].inst).incoming[use.operand].value;
                    auto slot = ctx.slot_of(v);
                    if (!slot) {
                        continue;
                    }
                    auto it = edge_reloads.find(v.reg());
                    if (it == edge_reloads.end()) {
                        auto load = ctx.make_reload(v, *slot, Location::in_slot(*slot), inst.span);
                        it = edge_reloads.emplace(v.reg(), make_register(load.result, v.type)).first;
                        rewritten.push_back(std::move(load));
                    }
                    std::get<PhiInst>((*use.insts)[use.phi].inst).incoming[use.operand].value =
                        it->second;
                }
            }

            // A spilled definition writes a temporary that is stored at once
            std::optional<InstructionData> def_store;
            if (inst.has_result()) {
                auto it = result.spilled.find(inst.result);
                if (it != result.spilled.end()) {
                    RegClass cls = reg_class_of(inst.type);
                    auto pool = ctx.pool(cls, 2 * k + 1, 2 * k + 1);
                    if (pool.empty()) {
                        return ctx.exhausted(cls, 0, inst.span);
                    }
                    ValueId temp = func.fresh_value();
                    result.locations[temp] = Location::in_register(pool.front());
                    inst.result = temp;
                    def_store = ctx.make_store(temp, inst.type, it->second, inst.span);
                }
            }
            rewritten.push_back(std::move(inst));
            if (def_store) {
                rewritten.push_back(std::move(*def_store));
            }
        }
        block.instructions = std::move(rewritten);
    }
    return std::nullopt;
}

auto LinearScanAllocator::allocate(Function& func) -> Result<AllocationResult, Diagnostic> {
    AllocationResult result;
    result.function = func.name;
    if (func.is_declaration()) {
        return result;
    }

    func.rebuild_cfg();
    auto liveness = compute_liveness(func);

    for (RegClass cls : {RegClass::Gpr, RegClass::Vector}) {
        std::vector<const LiveInterval*> intervals;
        for (const auto& interval : liveness.intervals) {
            if (interval.cls == cls) {
                intervals.push_back(&interval);
            }
        }
        if (intervals.empty()) {
            continue;
        }
        const auto& desc = target_.registers(cls);
        if (desc.allocatable.empty() && desc.scratch.empty()) {
            return make_diagnostic(DiagnosticKind::AllocationExhaustion, Stage::RegAlloc,
                                   func.name,
                                   std::string("target has no ") + reg_class_name(cls) +
                                       " registers");
        }
        scan(intervals, cls, result);
    }

    if (auto error = relieve_pressure(func, liveness, result)) {
        KIR_LOG_ERROR("regalloc", error->to_string());
        return *error;
    }
    if (auto error = insert_spill_code(func, liveness, result)) {
        KIR_LOG_ERROR("regalloc", error->to_string());
        return *error;
    }
    func.rebuild_cfg();

    KIR_LOG_DEBUG("regalloc", "allocated '" << func.name << "': " << liveness.intervals.size()
                                            << " intervals, " << result.spilled.size()
                                            << " spilled, " << result.reloads_inserted
                                            << " reloads");
    return result;
}

auto allocate_registers(Function& func, const TargetDesc& target)
    -> Result<AllocationResult, Diagnostic> {
    LinearScanAllocator allocator(target);
    return allocator.allocate(func);
}

} // namespace kir::regalloc
