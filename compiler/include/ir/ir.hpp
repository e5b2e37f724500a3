// Kindred IR - three-address intermediate representation
//
// The IR sits between the type-checked AST and LLVM IR generation.
//
// Design:
// 1. Every subexpression produces a fresh temporary (`%tN`), never reused
// 2. Source variables live in named storage: per-function slots or
//    module-level globals, accessed with explicit load/store
// 3. Explicit control flow with labeled basic blocks, one terminator each
// 4. Short-circuit `&&`/`||` are branches joined by a phi
// 5. Close enough to LLVM IR for a direct textual translation

#pragma once

#include "common.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kindred::ir {

// ============================================================================
// IR Types
// ============================================================================

enum class IrType {
    Unit,
    Bool,
    Int,
    Float,
    Str,
};

[[nodiscard]] auto ir_type_to_string(IrType type) -> std::string_view;

// ============================================================================
// Values and Storage
// ============================================================================

using TempId = uint32_t;
using SlotId = uint32_t;
using BlockId = uint32_t;
using GlobalId = uint32_t;

// Temporary produced by exactly one instruction (or a function parameter)
struct Temp {
    TempId id;
    IrType type;
};

enum class StorageKind {
    Slot,   // Function-local variable
    Global, // Module-level variable
};

// Named storage location
struct Place {
    StorageKind kind;
    uint32_t index; // SlotId or GlobalId
};

// ============================================================================
// Constants
// ============================================================================

struct ConstInt {
    int64_t value;
};

struct ConstFloat {
    double value;
};

struct ConstBool {
    bool value;
};

struct ConstString {
    std::string value;
};

using Constant = std::variant<ConstInt, ConstFloat, ConstBool, ConstString>;

// ============================================================================
// Instructions
// ============================================================================

enum class BinOp {
    // Arithmetic
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    // Comparison
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

enum class UnaryOp {
    Neg, // Arithmetic negation
    Not, // Logical not
};

[[nodiscard]] auto bin_op_to_string(BinOp op) -> std::string_view;
[[nodiscard]] auto unary_op_to_string(UnaryOp op) -> std::string_view;

// result = constant
struct ConstantInst {
    Constant value;
};

// result = left op right
struct BinaryInst {
    BinOp op;
    Temp left;
    Temp right;
    IrType operand_type; // Int or Float selects the LLVM opcode
};

// result = op operand
struct UnaryInst {
    UnaryOp op;
    Temp operand;
};

// result = load place
struct LoadInst {
    Place place;
    IrType type;
};

// store value -> place (no result)
struct StoreInst {
    Place place;
    Temp value;
};

// result = callee(args...), no result for Unit callees
struct CallInst {
    std::string callee;
    bool is_builtin;
    std::vector<Temp> args;
    IrType return_type;
};

// result = phi [value, block], ...
struct PhiInst {
    std::vector<std::pair<Temp, BlockId>> incoming;
};

using Instruction =
    std::variant<ConstantInst, BinaryInst, UnaryInst, LoadInst, StoreInst, CallInst, PhiInst>;

struct InstructionData {
    std::optional<Temp> result; // Empty for store and Unit calls
    Instruction inst;
    SourceSpan span;
};

// ============================================================================
// Terminators
// ============================================================================

struct ReturnTerm {
    std::optional<Temp> value;
};

struct BranchTerm {
    BlockId target;
};

struct CondBranchTerm {
    Temp condition;
    BlockId true_block;
    BlockId false_block;
};

// Control never reaches the end of this block
struct UnreachableTerm {};

using Terminator = std::variant<ReturnTerm, BranchTerm, CondBranchTerm, UnreachableTerm>;

// ============================================================================
// Blocks, Functions, Module
// ============================================================================

struct BasicBlock {
    BlockId id;
    std::string label; // Unique within the function
    std::vector<InstructionData> instructions;
    std::optional<Terminator> terminator;
};

struct Slot {
    SlotId id;
    std::string name; // Source variable name
    IrType type;
};

struct Param {
    std::string name;
    IrType type;
    Temp value; // Incoming argument
    SlotId slot;
};

struct Function {
    std::string name;
    std::vector<Param> params;
    IrType return_type;
    std::vector<Slot> slots;       // Declaration order
    std::vector<BasicBlock> blocks; // blocks[0] is the entry block
    TempId temp_count = 0;
};

struct Global {
    GlobalId id;
    std::string name;
    IrType type;
    bool is_mutable;
};

/// Name of the synthetic function holding global initializers.
constexpr const char* INIT_FUNCTION = "kindred.init";

struct Module {
    std::string name;
    std::vector<Global> globals;     // Declaration order
    std::vector<Function> functions; // Source order, `kindred.init` first

    [[nodiscard]] auto find_function(std::string_view name) const -> const Function*;
};

// ============================================================================
// IR Pretty Printer
// ============================================================================

class IrPrinter {
public:
    auto print_module(const Module& module) -> std::string;
    auto print_function(const Function& func, const Module& module) -> std::string;
    auto print_instruction(const InstructionData& inst, const Function& func,
                           const Module& module) -> std::string;
    auto print_terminator(const Terminator& term, const Function& func) -> std::string;
    auto print_temp(const Temp& temp) -> std::string;
    auto print_place(const Place& place, const Function& func, const Module& module)
        -> std::string;
};

// Convenience free function for printing a module
inline auto print_module(const Module& module) -> std::string {
    IrPrinter printer;
    return printer.print_module(module);
}

} // namespace kindred::ir
