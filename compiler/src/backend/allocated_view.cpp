// Allocated Module View Implementation

#include "backend/allocated_view.hpp"

namespace kir::backend {

using regalloc::Location;

auto AllocatedModuleView::locate(const regalloc::AllocationResult& allocation,
                                 const ir::Value& value) -> Location {
    if (value.is_register()) {
        return allocation.location(value.reg());
    }
    if (value.is_constant()) {
        return Location{Location::Kind::Constant, {}, 0};
    }
    if (value.is_global()) {
        return Location{Location::Kind::Global, {}, 0};
    }
    return Location{};
}

AllocatedModuleView::AllocatedModuleView(const CompiledModule& compiled) {
    static const regalloc::AllocationResult empty;
    for (const auto& func : compiled.allocated_module.functions) {
        if (func.is_declaration()) {
            continue;
        }
        auto it = compiled.allocations.find(func.name);
        const auto& allocation = it != compiled.allocations.end() ? it->second : empty;

        FunctionView fv{&func, &allocation, {}, {}};
        for (const auto& param : func.params) {
            fv.params.push_back(allocation.location(param.value_id));
        }
        for (const auto& block : func.blocks) {
            BlockView bv{&block, {}};
            for (const auto& inst : block.instructions) {
                InstructionView iv{&inst, Location{}, {}};
                if (inst.has_result()) {
                    iv.result = allocation.location(inst.result);
                }
                for (const auto& op : ir::operands(inst.inst)) {
                    iv.operands.push_back(OperandView{op, locate(allocation, op)});
                }
                bv.instructions.push_back(std::move(iv));
            }
            fv.blocks.push_back(std::move(bv));
        }
        functions_.push_back(std::move(fv));
    }
}

auto AllocatedModuleView::find(std::string_view name) const -> const FunctionView* {
    for (const auto& fv : functions_) {
        if (fv.func->name == name) {
            return &fv;
        }
    }
    return nullptr;
}

} // namespace kir::backend
