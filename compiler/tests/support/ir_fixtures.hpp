#pragma once

// Hand-built IR for tests. FunctionBuilder appends instructions to the
// current block and hands out result values; finish() rebuilds the CFG.
//
//   FunctionBuilder fb("add1", i32());
//   auto x = fb.param("x", i32());
//   fb.ret(fb.add(x, fb.i32(1)));
//   module.add_function(fb.finish());

#include "ir/ir.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

namespace kir::test {

inline auto i32() -> ir::IrTypePtr {
    return ir::make_i32_type();
}
inline auto i64() -> ir::IrTypePtr {
    return ir::make_i64_type();
}
inline auto f64() -> ir::IrTypePtr {
    return ir::make_f64_type();
}
inline auto boolean() -> ir::IrTypePtr {
    return ir::make_bool_type();
}
inline auto ptr() -> ir::IrTypePtr {
    return ir::make_ptr_type();
}
inline auto void_type() -> ir::IrTypePtr {
    return ir::make_void_type();
}

class FunctionBuilder {
public:
    FunctionBuilder(const std::string& name, ir::IrTypePtr return_type) {
        func_.name = name;
        func_.return_type = std::move(return_type);
        current_ = func_.create_block("entry");
    }

    auto param(const std::string& name, ir::IrTypePtr type) -> ir::Value {
        auto id = func_.add_param(name, type);
        return ir::make_register(id, std::move(type));
    }

    auto block(const std::string& name) -> ir::BlockId {
        return func_.create_block(name);
    }

    void at(ir::BlockId block) {
        current_ = block;
    }

    [[nodiscard]] auto entry() const -> ir::BlockId {
        return func_.blocks.front().id;
    }

    void attribute(const std::string& attr) {
        func_.attributes.push_back(attr);
    }

    // Constants

    static auto i32(int64_t v) -> ir::Value {
        return ir::make_const_int(v, ir::make_i32_type());
    }
    static auto i64(int64_t v) -> ir::Value {
        return ir::make_const_int(v, ir::make_i64_type());
    }
    static auto f64(double v) -> ir::Value {
        return ir::make_const_float(v, ir::make_f64_type());
    }
    static auto boolean(bool v) -> ir::Value {
        return ir::make_const_bool(v);
    }

    // Instructions with a result

    auto emit(ir::Instruction inst, ir::IrTypePtr type) -> ir::Value {
        ir::InstructionData data;
        data.result = func_.fresh_value();
        data.type = type;
        data.inst = std::move(inst);
        auto value = data.result_value();
        func_.get_block(current_)->instructions.push_back(std::move(data));
        return value;
    }

    auto binary(ir::BinOp op, ir::Value lhs, ir::Value rhs) -> ir::Value {
        auto type = lhs.type;
        return emit(ir::BinaryInst{op, std::move(lhs), std::move(rhs)}, type);
    }
    auto add(ir::Value lhs, ir::Value rhs) -> ir::Value {
        return binary(ir::BinOp::Add, std::move(lhs), std::move(rhs));
    }
    auto sub(ir::Value lhs, ir::Value rhs) -> ir::Value {
        return binary(ir::BinOp::Sub, std::move(lhs), std::move(rhs));
    }
    auto mul(ir::Value lhs, ir::Value rhs) -> ir::Value {
        return binary(ir::BinOp::Mul, std::move(lhs), std::move(rhs));
    }
    auto div(ir::Value lhs, ir::Value rhs) -> ir::Value {
        return binary(ir::BinOp::Div, std::move(lhs), std::move(rhs));
    }
    auto cmp(ir::CmpOp op, ir::Value lhs, ir::Value rhs) -> ir::Value {
        return emit(ir::CompareInst{op, std::move(lhs), std::move(rhs)}, ir::make_bool_type());
    }
    auto copy(ir::Value source) -> ir::Value {
        auto type = source.type;
        return emit(ir::CopyInst{std::move(source)}, type);
    }
    auto phi(ir::IrTypePtr type, std::vector<ir::PhiIncoming> incoming) -> ir::Value {
        return emit(ir::PhiInst{std::move(incoming)}, std::move(type));
    }
    auto call(const std::string& callee, std::vector<ir::Value> args, ir::IrTypePtr type)
        -> ir::Value {
        return emit(ir::CallInst{callee, std::move(args)}, std::move(type));
    }
    auto alloca_slot(ir::IrTypePtr type, const std::string& name = "") -> ir::Value {
        return emit(ir::AllocaInst{std::move(type), name}, ir::make_ptr_type());
    }
    auto load(ir::Value address, ir::IrTypePtr type) -> ir::Value {
        return emit(ir::LoadInst{std::move(address), false, std::nullopt}, std::move(type));
    }
    auto intrinsic(ir::IntrinsicKind kind, std::vector<ir::Value> args, ir::IrTypePtr type)
        -> ir::Value {
        return emit(ir::IntrinsicInst{kind, std::move(args)}, std::move(type));
    }

    // Void instructions

    void emit_void(ir::Instruction inst) {
        ir::InstructionData data;
        data.type = ir::make_void_type();
        data.inst = std::move(inst);
        func_.get_block(current_)->instructions.push_back(std::move(data));
    }

    void store(ir::Value address, ir::Value value) {
        emit_void(ir::StoreInst{std::move(address), std::move(value), false, std::nullopt});
    }
    void call_void(const std::string& callee, std::vector<ir::Value> args) {
        emit_void(ir::CallInst{callee, std::move(args)});
    }
    void jump(ir::BlockId target) {
        emit_void(ir::JumpInst{target});
    }
    void jump_if(ir::Value cond, ir::BlockId then_block, ir::BlockId else_block) {
        emit_void(ir::JumpIfInst{std::move(cond), then_block, else_block});
    }
    void ret(std::optional<ir::Value> value = std::nullopt) {
        emit_void(ir::RetInst{std::move(value)});
    }

    // The function with its CFG rebuilt
    auto finish() -> ir::Function {
        func_.rebuild_cfg();
        return std::move(func_);
    }

    auto function() -> ir::Function& {
        return func_;
    }

private:
    ir::Function func_;
    ir::BlockId current_ = ir::INVALID_BLOCK;
};

inline void add_function(ir::Module& module, ir::Function func) {
    auto result = module.add_function(std::move(func));
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
}

// Instructions of `func` holding alternative T
template <typename T> auto count_of(const ir::Function& func) -> size_t {
    size_t n = 0;
    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            if (inst.is<T>()) {
                ++n;
            }
        }
    }
    return n;
}

// A counted loop carrying `width` accumulators through header phis:
//
//   header: i = phi [entry: 0, body: i + 1]
//           acc_k = phi [entry: k, body: next_k]
//           br (i < n) body, exit
//   body:   next_k = acc_{k+1} + (k + 1), or acc_{k+1} itself when rotating
//   exit:   ret acc_0 + ... + acc_{width-1}
inline auto carried_loop(const std::string& name, int width, bool rotate = false)
    -> ir::Function {
    FunctionBuilder fb(name, i32());
    auto n = fb.param("n", i32());
    auto header = fb.block("header");
    auto body = fb.block("body");
    auto exit = fb.block("exit");
    fb.jump(header);

    fb.at(header);
    auto i = fb.phi(i32(), {});
    std::vector<ir::Value> acc;
    for (int k = 0; k < width; ++k) {
        acc.push_back(fb.phi(i32(), {}));
    }
    fb.jump_if(fb.cmp(ir::CmpOp::Lt, i, n), body, exit);

    fb.at(body);
    std::vector<ir::Value> next;
    for (int k = 0; k < width; ++k) {
        const auto& from = acc[static_cast<size_t>((k + 1) % width)];
        next.push_back(rotate ? from : fb.add(from, FunctionBuilder::i32(k + 1)));
    }
    auto i_next = fb.add(i, FunctionBuilder::i32(1));
    fb.jump(header);

    fb.at(exit);
    ir::Value sum = acc[0];
    for (size_t k = 1; k < acc.size(); ++k) {
        sum = fb.add(sum, acc[k]);
    }
    fb.ret(sum);

    auto& phis = fb.function().get_block(header)->instructions;
    std::get<ir::PhiInst>(phis[0].inst).incoming = {{fb.entry(), FunctionBuilder::i32(0)},
                                                    {body, i_next}};
    for (size_t k = 0; k < next.size(); ++k) {
        std::get<ir::PhiInst>(phis[k + 1].inst).incoming = {
            {fb.entry(), FunctionBuilder::i32(static_cast<int64_t>(k))}, {body, next[k]}};
    }
    return fb.finish();
}

} // namespace kir::test
