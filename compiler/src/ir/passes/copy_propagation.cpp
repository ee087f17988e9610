// Copy Propagation Pass Implementation

#include "ir/passes/copy_propagation.hpp"

#include "log/log.hpp"

namespace kir::ir {

namespace {

auto resolve(Value v, const std::unordered_map<ValueId, Value>& copies) -> Value {
    while (v.is_register()) {
        auto it = copies.find(v.reg());
        if (it == copies.end()) {
            break;
        }
        v = it->second;
    }
    return v;
}

} // namespace

auto CopyPropagationPass::run_on_function(Function& func) -> bool {
    std::unordered_map<ValueId, Value> copies;

    bool progress = true;
    while (progress) {
        progress = false;
        for (auto& block : func.blocks) {
            for (auto& inst : block.instructions) {
                for_each_operand(inst.inst, [&copies](Value& v) { v = resolve(v, copies); });
                if (!inst.has_result() || copies.contains(inst.result)) {
                    continue;
                }
                if (auto source = find_source(inst)) {
                    copies[inst.result] = *source;
                    progress = true;
                }
            }
        }
    }

    if (copies.empty()) {
        return false;
    }

    for (auto& block : func.blocks) {
        std::erase_if(block.instructions, [&copies](const InstructionData& inst) {
            return inst.has_result() && copies.contains(inst.result);
        });
        for (auto& inst : block.instructions) {
            for_each_operand(inst.inst, [&copies](Value& v) { v = resolve(v, copies); });
        }
    }

    stats_.copies_propagated += copies.size();
    KIR_LOG_TRACE("opt", "copy-prop replaced " << copies.size() << " values in '" << func.name
                                               << "'");
    return true;
}

auto CopyPropagationPass::find_source(const InstructionData& inst) -> std::optional<Value> {
    if (const auto* copy = inst.as<CopyInst>()) {
        return copy->source;
    }

    const auto* phi = inst.as<PhiInst>();
    if (!phi || phi->incoming.empty()) {
        return std::nullopt;
    }
    std::optional<Value> source;
    for (const auto& in : phi->incoming) {
        if (in.value.is_register() && in.value.reg() == inst.result) {
            continue;
        }
        if (!source) {
            source = in.value;
        } else if (!(*source == in.value)) {
            return std::nullopt;
        }
    }
    return source;
}

} // namespace kir::ir
