//! IR Codegen Instruction Emission
//!
//! This file contains instruction and terminator emission:
//! - Constants materialize as identity operations so every temporary is a
//!   real `%tN` definition (`add i64 5, 0`, `fadd double X, -0.0`)
//! - Integer arithmetic and comparison are signed
//! - Float `!=` is unordered (`une`), every other float comparison ordered

#include "codegen/ir_codegen.hpp"

namespace kindred::codegen {

namespace {

auto int_binop(ir::BinOp op) -> std::string {
    switch (op) {
    case ir::BinOp::Add:
        return "add";
    case ir::BinOp::Sub:
        return "sub";
    case ir::BinOp::Mul:
        return "mul";
    case ir::BinOp::Div:
        return "sdiv";
    case ir::BinOp::Mod:
        return "srem";
    case ir::BinOp::Eq:
        return "icmp eq";
    case ir::BinOp::Ne:
        return "icmp ne";
    case ir::BinOp::Lt:
        return "icmp slt";
    case ir::BinOp::Le:
        return "icmp sle";
    case ir::BinOp::Gt:
        return "icmp sgt";
    case ir::BinOp::Ge:
        return "icmp sge";
    }
    return "add";
}

auto float_binop(ir::BinOp op) -> std::string {
    switch (op) {
    case ir::BinOp::Add:
        return "fadd";
    case ir::BinOp::Sub:
        return "fsub";
    case ir::BinOp::Mul:
        return "fmul";
    case ir::BinOp::Div:
        return "fdiv";
    case ir::BinOp::Mod:
        return "frem";
    case ir::BinOp::Eq:
        return "fcmp oeq";
    case ir::BinOp::Ne:
        return "fcmp une";
    case ir::BinOp::Lt:
        return "fcmp olt";
    case ir::BinOp::Le:
        return "fcmp ole";
    case ir::BinOp::Gt:
        return "fcmp ogt";
    case ir::BinOp::Ge:
        return "fcmp oge";
    }
    return "fadd";
}

} // namespace

void IrCodegen::emit_instruction(const ir::InstructionData& inst) {
    std::string result_reg = inst.result ? temp_reg(*inst.result) : "";

    std::visit(
        [&](const auto& i) {
            using T = std::decay_t<decltype(i)>;

            if constexpr (std::is_same_v<T, ir::ConstantInst>) {
                emit_constant_inst(i, result_reg);
            } else if constexpr (std::is_same_v<T, ir::BinaryInst>) {
                emit_binary_inst(i, result_reg);
            } else if constexpr (std::is_same_v<T, ir::UnaryInst>) {
                emit_unary_inst(i, result_reg);
            } else if constexpr (std::is_same_v<T, ir::LoadInst>) {
                std::string type = llvm_type(i.type);
                emitln("    " + result_reg + " = load " + type + ", " + type + "* " +
                       place_ptr(i.place));
            } else if constexpr (std::is_same_v<T, ir::StoreInst>) {
                std::string type = llvm_type(i.value.type);
                emitln("    store " + type + " " + temp_reg(i.value) + ", " + type + "* " +
                       place_ptr(i.place));
            } else if constexpr (std::is_same_v<T, ir::CallInst>) {
                emit_call_inst(i, inst.result);
            } else if constexpr (std::is_same_v<T, ir::PhiInst>) {
                emit_phi_inst(i, *inst.result);
            }
        },
        inst.inst);
}

void IrCodegen::emit_constant_inst(const ir::ConstantInst& i, const std::string& result_reg) {
    std::visit(
        [&](const auto& c) {
            using C = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<C, ir::ConstInt>) {
                emitln("    " + result_reg + " = add i64 " + std::to_string(c.value) + ", 0");
            } else if constexpr (std::is_same_v<C, ir::ConstFloat>) {
                emitln("    " + result_reg + " = fadd double " + float_constant(c.value) +
                       ", -0.0");
            } else if constexpr (std::is_same_v<C, ir::ConstBool>) {
                emitln("    " + result_reg + " = or i1 " + (c.value ? "true" : "false") +
                       ", false");
            } else if constexpr (std::is_same_v<C, ir::ConstString>) {
                std::string array = "[" + std::to_string(c.value.size() + 1) + " x i8]";
                emitln("    " + result_reg + " = getelementptr inbounds " + array + ", " + array +
                       "* " + string_constants_.at(c.value) + ", i64 0, i64 0");
            }
        },
        i.value);
}

void IrCodegen::emit_binary_inst(const ir::BinaryInst& i, const std::string& result_reg) {
    bool is_float = i.operand_type == ir::IrType::Float;
    std::string op = is_float ? float_binop(i.op) : int_binop(i.op);
    emitln("    " + result_reg + " = " + op + " " + llvm_type(i.operand_type) + " " +
           temp_reg(i.left) + ", " + temp_reg(i.right));
}

void IrCodegen::emit_unary_inst(const ir::UnaryInst& i, const std::string& result_reg) {
    std::string operand = temp_reg(i.operand);
    if (i.op == ir::UnaryOp::Not) {
        emitln("    " + result_reg + " = xor i1 " + operand + ", true");
    } else if (i.operand.type == ir::IrType::Float) {
        emitln("    " + result_reg + " = fneg double " + operand);
    } else {
        emitln("    " + result_reg + " = sub i64 0, " + operand);
    }
}

void IrCodegen::emit_call_inst(const ir::CallInst& i, const std::optional<ir::Temp>& result) {
    std::string args;
    for (size_t a = 0; a < i.args.size(); ++a) {
        if (a > 0) {
            args += ", ";
        }
        args += llvm_type(i.args[a].type) + " " + temp_reg(i.args[a]);
    }

    std::string call = "call " + llvm_type(i.return_type) + " " +
                       function_symbol(i.callee, i.is_builtin) + "(" + args + ")";
    if (result) {
        emitln("    " + temp_reg(*result) + " = " + call);
    } else {
        emitln("    " + call);
    }
}

void IrCodegen::emit_phi_inst(const ir::PhiInst& i, const ir::Temp& result) {
    std::string incoming;
    for (size_t p = 0; p < i.incoming.size(); ++p) {
        if (p > 0) {
            incoming += ", ";
        }
        incoming += "[ " + temp_reg(i.incoming[p].first) + ", %" +
                    block_label(i.incoming[p].second) + " ]";
    }
    emitln("    " + temp_reg(result) + " = phi " + llvm_type(result.type) + " " + incoming);
}

void IrCodegen::emit_terminator(const ir::Terminator& term) {
    std::visit(
        [this](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, ir::ReturnTerm>) {
                if (t.value) {
                    emitln("    ret " + llvm_type(t.value->type) + " " + temp_reg(*t.value));
                } else {
                    emitln("    ret void");
                }
            } else if constexpr (std::is_same_v<T, ir::BranchTerm>) {
                emitln("    br label %" + block_label(t.target));
            } else if constexpr (std::is_same_v<T, ir::CondBranchTerm>) {
                emitln("    br i1 " + temp_reg(t.condition) + ", label %" +
                       block_label(t.true_block) + ", label %" + block_label(t.false_block));
            } else {
                emitln("    unreachable");
            }
        },
        term);
}

} // namespace kindred::codegen
