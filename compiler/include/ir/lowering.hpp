// IR Lowering - Converts the checked AST to Kindred IR
//
// Lowering is a pure function of the program and its analysis tables:
// - Every subexpression gets a fresh temporary
// - Locals become per-function slots in declaration order; parameters are
//   stored into their slots in the entry block
// - Globals become module storage, initialized by `kindred.init`
// - `if`/`while` become labeled blocks; `&&`/`||` branch and join with a phi
//
// Only call `lower` on a program that resolved and type checked without
// errors.

#pragma once

#include "ir/ir.hpp"
#include "parser/ast.hpp"
#include "resolve/resolver.hpp"
#include "types/checker.hpp"

#include <unordered_map>

namespace kindred::ir {

[[nodiscard]] auto lower(const parser::Program& program, const resolve::Resolution& resolution,
                         const types::TypeTable& types) -> Module;

// Build context for the function currently being lowered
struct LoweringContext {
    Function* current_func = nullptr;
    BlockId current_block = 0;

    // Variable symbol to its slot in the current function
    std::unordered_map<resolve::SymbolId, SlotId> slots;
};

class IrBuilder {
public:
    IrBuilder(const resolve::Resolution& resolution, const types::TypeTable& types);

    auto build(const parser::Program& program) -> Module;

private:
    const resolve::Resolution& resolution_;
    const types::TypeTable& types_;
    Module module_;
    LoweringContext ctx_;
    std::unordered_map<resolve::SymbolId, GlobalId> globals_;

    // ============ Declarations ============
    void build_globals(const parser::Program& program);
    void build_init_function(const parser::Program& program);
    void build_func_decl(const parser::FuncDecl& func);
    void begin_function(Function func);
    void finish_function();

    // ============ Statements ============
    void build_block(const parser::BlockStmt& block);
    void build_stmt(const parser::Stmt& stmt);
    void build_var_decl(const parser::VarDecl& var, const SourceSpan& span);
    void build_assign(const parser::AssignStmt& assign, const SourceSpan& span);
    void build_if(const parser::IfStmt& if_stmt);
    void build_while(const parser::WhileStmt& while_stmt);
    void build_return(const parser::ReturnStmt& ret);

    // ============ Expressions ============
    // Empty for calls to Unit functions
    auto build_expr(const parser::Expr& expr) -> std::optional<Temp>;
    auto build_value(const parser::Expr& expr) -> Temp;
    auto build_literal(const parser::LiteralExpr& lit, const SourceSpan& span) -> Temp;
    auto build_ident(const parser::Expr& expr) -> Temp;
    auto build_unary(const parser::UnaryExpr& unary, const SourceSpan& span) -> Temp;
    auto build_binary(const parser::BinaryExpr& bin, const SourceSpan& span) -> Temp;
    auto build_short_circuit(const parser::BinaryExpr& bin, const SourceSpan& span) -> Temp;
    auto build_call(const parser::CallExpr& call, const SourceSpan& span)
        -> std::optional<Temp>;

    // ============ Helper Methods ============
    auto create_block(const std::string& name) -> BlockId;
    void switch_to_block(BlockId block);
    [[nodiscard]] auto is_terminated() const -> bool;

    auto emit(Instruction inst, IrType type, const SourceSpan& span) -> Temp;
    void emit_void(Instruction inst, const SourceSpan& span);
    void terminate(Terminator term);

    // Continues in a fresh unreachable block after a terminator
    void start_dead_block();

    auto fresh_temp(IrType type) -> Temp;
    auto add_slot(resolve::SymbolId symbol, const std::string& name, IrType type) -> SlotId;
    [[nodiscard]] auto place_of(resolve::SymbolId symbol) const -> Place;

    [[nodiscard]] auto expr_type(const parser::Expr& expr) const -> IrType;
    [[nodiscard]] auto symbol_type(resolve::SymbolId symbol) const -> IrType;
};

// Semantic type to IR type; `Unknown` and function types map to Unit
[[nodiscard]] auto to_ir_type(const types::TypePtr& type) -> IrType;

} // namespace kindred::ir
