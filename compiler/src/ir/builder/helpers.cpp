// KIR Builder - Emission Helpers
//
// Block cursor management and instruction emission. Every emitted
// instruction is stamped with the span of the AST node being lowered.

#include "ir/ir_builder.hpp"

namespace kir::ir {

auto IrBuilder::create_block(const std::string& name) -> BlockId {
    return ctx_.func->create_block(name);
}

void IrBuilder::switch_to_block(BlockId block) {
    ctx_.current_block = block;
}

auto IrBuilder::current_block() -> BasicBlock& {
    return *ctx_.func->get_block(ctx_.current_block);
}

auto IrBuilder::is_terminated() -> bool {
    return current_block().is_terminated();
}

void IrBuilder::continue_in_dead_block(const std::string& name) {
    // Code after return/break/continue still gets lowered, into a block
    // nothing jumps to. It is pruned once the function is complete.
    switch_to_block(create_block(name));
}

auto IrBuilder::emit(Instruction inst, IrTypePtr type) -> Value {
    ValueId id = ctx_.func->fresh_value();
    current_block().instructions.push_back(InstructionData{id, type, std::move(inst), ctx_.span});
    return make_register(id, std::move(type));
}

void IrBuilder::emit_void(Instruction inst) {
    current_block().instructions.push_back(
        InstructionData{INVALID_VALUE, make_void_type(), std::move(inst), ctx_.span});
}

void IrBuilder::emit_jump(BlockId target) {
    emit_void(JumpInst{target});
}

void IrBuilder::emit_jump_if(Value cond, BlockId then_block, BlockId else_block) {
    emit_void(JumpIfInst{std::move(cond), then_block, else_block});
}

void IrBuilder::emit_return(std::optional<Value> value) {
    emit_void(RetInst{std::move(value)});
}

auto IrBuilder::emit_entry_alloca(IrTypePtr type, const std::string& name) -> Value {
    // Slots live at the top of the entry block, in creation order
    auto& entry = ctx_.func->blocks.front();
    size_t pos = 0;
    while (pos < entry.instructions.size() && entry.instructions[pos].is<AllocaInst>()) {
        ++pos;
    }
    ValueId id = ctx_.func->fresh_value();
    auto ptr_type = make_ptr_type();
    entry.instructions.insert(entry.instructions.begin() + static_cast<ptrdiff_t>(pos),
                              InstructionData{id, ptr_type, AllocaInst{std::move(type), name},
                                              ctx_.span});
    return make_register(id, ptr_type);
}

auto IrBuilder::emit_load(Value ptr, IrTypePtr type) -> Value {
    return emit(LoadInst{std::move(ptr), false, std::nullopt}, std::move(type));
}

void IrBuilder::emit_store(Value ptr, Value value) {
    emit_void(StoreInst{std::move(ptr), std::move(value), false, std::nullopt});
}

auto IrBuilder::unit_value() -> Value {
    return make_undef(make_void_type());
}

} // namespace kir::ir
