//! # IR Pretty Printer
//!
//! ## Output Format
//!
//! ```text
//! ; IR Module: main
//!
//! global @limit: Int
//!
//! fn add(%t0: Int, %t1: Int) -> Int {
//!     slot $0 a: Int
//!     slot $1 b: Int
//! entry:
//!     store $0 a, %t0
//!     store $1 b, %t1
//!     %t2 = load $0 a
//!     %t3 = load $1 b
//!     %t4 = add Int %t2, %t3
//!     ret %t4
//! }
//! ```
//!
//! Output depends only on the module contents, so equal modules print
//! identically.

#include "ir/ir.hpp"

#include "format/formatter.hpp"

#include <sstream>

namespace kindred::ir {

auto ir_type_to_string(IrType type) -> std::string_view {
    switch (type) {
    case IrType::Unit:
        return "Unit";
    case IrType::Bool:
        return "Bool";
    case IrType::Int:
        return "Int";
    case IrType::Float:
        return "Float";
    case IrType::Str:
        return "Str";
    }
    return "?";
}

auto bin_op_to_string(BinOp op) -> std::string_view {
    switch (op) {
    case BinOp::Add:
        return "add";
    case BinOp::Sub:
        return "sub";
    case BinOp::Mul:
        return "mul";
    case BinOp::Div:
        return "div";
    case BinOp::Mod:
        return "mod";
    case BinOp::Eq:
        return "eq";
    case BinOp::Ne:
        return "ne";
    case BinOp::Lt:
        return "lt";
    case BinOp::Le:
        return "le";
    case BinOp::Gt:
        return "gt";
    case BinOp::Ge:
        return "ge";
    }
    return "?";
}

auto unary_op_to_string(UnaryOp op) -> std::string_view {
    switch (op) {
    case UnaryOp::Neg:
        return "neg";
    case UnaryOp::Not:
        return "not";
    }
    return "?";
}

auto Module::find_function(std::string_view name) const -> const Function* {
    for (const auto& func : functions) {
        if (func.name == name) {
            return &func;
        }
    }
    return nullptr;
}

auto IrPrinter::print_module(const Module& module) -> std::string {
    std::ostringstream out;
    out << "; IR Module: " << module.name << "\n";

    if (!module.globals.empty()) {
        out << "\n";
        for (const auto& global : module.globals) {
            out << "global @" << global.name << ": " << ir_type_to_string(global.type)
                << (global.is_mutable ? " (var)" : "") << "\n";
        }
    }

    for (const auto& func : module.functions) {
        out << "\n" << print_function(func, module);
    }
    return out.str();
}

auto IrPrinter::print_function(const Function& func, const Module& module) -> std::string {
    std::ostringstream out;
    out << "fn " << func.name << "(";
    for (size_t i = 0; i < func.params.size(); ++i) {
        if (i > 0)
            out << ", ";
        out << print_temp(func.params[i].value) << ": "
            << ir_type_to_string(func.params[i].type);
    }
    out << ") -> " << ir_type_to_string(func.return_type) << " {\n";

    for (const auto& slot : func.slots) {
        out << "    slot $" << slot.id << " " << slot.name << ": "
            << ir_type_to_string(slot.type) << "\n";
    }

    for (const auto& block : func.blocks) {
        out << block.label << ":\n";
        for (const auto& inst : block.instructions) {
            out << "    " << print_instruction(inst, func, module) << "\n";
        }
        if (block.terminator) {
            out << "    " << print_terminator(*block.terminator, func) << "\n";
        }
    }
    out << "}\n";
    return out.str();
}

auto IrPrinter::print_temp(const Temp& temp) -> std::string {
    return "%t" + std::to_string(temp.id);
}

auto IrPrinter::print_place(const Place& place, const Function& func, const Module& module)
    -> std::string {
    if (place.kind == StorageKind::Global) {
        return "@" + module.globals.at(place.index).name;
    }
    return "$" + std::to_string(place.index) + " " + func.slots.at(place.index).name;
}

auto IrPrinter::print_instruction(const InstructionData& inst, const Function& func,
                                  const Module& module) -> std::string {
    std::ostringstream out;
    if (inst.result) {
        out << print_temp(*inst.result) << " = ";
    }

    std::visit(
        [&](const auto& i) {
            using T = std::decay_t<decltype(i)>;

            if constexpr (std::is_same_v<T, ConstantInst>) {
                out << "const ";
                std::visit(
                    [&out](const auto& c) {
                        using C = std::decay_t<decltype(c)>;
                        if constexpr (std::is_same_v<C, ConstInt>) {
                            out << "Int " << c.value;
                        } else if constexpr (std::is_same_v<C, ConstFloat>) {
                            out << "Float " << format::Formatter::float_literal(c.value);
                        } else if constexpr (std::is_same_v<C, ConstBool>) {
                            out << "Bool " << (c.value ? "true" : "false");
                        } else if constexpr (std::is_same_v<C, ConstString>) {
                            out << "Str " << format::Formatter::string_literal(c.value);
                        }
                    },
                    i.value);
            } else if constexpr (std::is_same_v<T, BinaryInst>) {
                out << bin_op_to_string(i.op) << " " << ir_type_to_string(i.operand_type) << " "
                    << print_temp(i.left) << ", " << print_temp(i.right);
            } else if constexpr (std::is_same_v<T, UnaryInst>) {
                out << unary_op_to_string(i.op) << " " << print_temp(i.operand);
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                out << "load " << print_place(i.place, func, module);
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                out << "store " << print_place(i.place, func, module) << ", "
                    << print_temp(i.value);
            } else if constexpr (std::is_same_v<T, CallInst>) {
                out << "call " << (i.is_builtin ? "builtin " : "") << i.callee << "(";
                for (size_t a = 0; a < i.args.size(); ++a) {
                    if (a > 0)
                        out << ", ";
                    out << print_temp(i.args[a]);
                }
                out << ")";
            } else if constexpr (std::is_same_v<T, PhiInst>) {
                out << "phi ";
                for (size_t p = 0; p < i.incoming.size(); ++p) {
                    if (p > 0)
                        out << ", ";
                    out << "[" << print_temp(i.incoming[p].first) << ", "
                        << func.blocks.at(i.incoming[p].second).label << "]";
                }
            }
        },
        inst.inst);
    return out.str();
}

auto IrPrinter::print_terminator(const Terminator& term, const Function& func) -> std::string {
    return std::visit(
        [&](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, ReturnTerm>) {
                return t.value ? "ret " + print_temp(*t.value) : "ret";
            } else if constexpr (std::is_same_v<T, BranchTerm>) {
                return "br " + func.blocks.at(t.target).label;
            } else if constexpr (std::is_same_v<T, CondBranchTerm>) {
                return "condbr " + print_temp(t.condition) + ", " +
                       func.blocks.at(t.true_block).label + ", " +
                       func.blocks.at(t.false_block).label;
            } else {
                return "unreachable";
            }
        },
        term);
}

} // namespace kindred::ir
