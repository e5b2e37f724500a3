// IR Lowering - Statements
//
// Control flow shapes:
//
//   if c { A } else { B }        while c { A }
//
//   entry:                       entry:
//     condbr c, then, else         br cond
//   then: A; br end              cond: condbr c, body, end
//   else: B; br end              body: A; br cond
//   end:                         end:

#include "ir/lowering.hpp"

namespace kindred::ir {

void IrBuilder::build_block(const parser::BlockStmt& block) {
    for (const auto& stmt : block.stmts) {
        build_stmt(*stmt);
    }
}

void IrBuilder::build_stmt(const parser::Stmt& stmt) {
    std::visit(
        [this, &stmt](const auto& node) {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, parser::VarDecl>) {
                build_var_decl(node, stmt.span);
            } else if constexpr (std::is_same_v<T, parser::AssignStmt>) {
                build_assign(node, stmt.span);
            } else if constexpr (std::is_same_v<T, parser::IfStmt>) {
                build_if(node);
            } else if constexpr (std::is_same_v<T, parser::WhileStmt>) {
                build_while(node);
            } else if constexpr (std::is_same_v<T, parser::ReturnStmt>) {
                build_return(node);
            } else if constexpr (std::is_same_v<T, parser::BlockStmt>) {
                build_block(node);
            } else if constexpr (std::is_same_v<T, parser::ExprStmt>) {
                (void)build_expr(*node.expr);
            }
        },
        stmt.kind);
}

void IrBuilder::build_var_decl(const parser::VarDecl& var, const SourceSpan& span) {
    auto symbol = resolution_.declaration_of(var.id);
    auto value = build_value(*var.init);
    if (!symbol) {
        return;
    }
    // The slot is created after the initializer, matching scoping rules.
    auto slot = add_slot(*symbol, var.name, symbol_type(*symbol));
    emit_void(StoreInst{.place = Place{StorageKind::Slot, slot}, .value = value}, span);
}

void IrBuilder::build_assign(const parser::AssignStmt& assign, const SourceSpan& span) {
    auto value = build_value(*assign.value);
    auto symbol = resolution_.binding_of(assign.target->id);
    if (!symbol) {
        return;
    }
    emit_void(StoreInst{.place = place_of(*symbol), .value = value}, span);
}

void IrBuilder::build_if(const parser::IfStmt& if_stmt) {
    auto condition = build_value(*if_stmt.condition);

    BlockId then_block = create_block("if.then");
    BlockId else_block = if_stmt.else_branch ? create_block("if.else") : 0;
    BlockId end_block = create_block("if.end");

    terminate(CondBranchTerm{.condition = condition,
                             .true_block = then_block,
                             .false_block = if_stmt.else_branch ? else_block : end_block});

    switch_to_block(then_block);
    build_block(if_stmt.then_block);
    if (!is_terminated()) {
        terminate(BranchTerm{end_block});
    }

    if (if_stmt.else_branch) {
        switch_to_block(else_block);
        build_stmt(**if_stmt.else_branch);
        if (!is_terminated()) {
            terminate(BranchTerm{end_block});
        }
    }

    switch_to_block(end_block);
}

void IrBuilder::build_while(const parser::WhileStmt& while_stmt) {
    BlockId cond_block = create_block("while.cond");
    BlockId body_block = create_block("while.body");
    BlockId end_block = create_block("while.end");

    terminate(BranchTerm{cond_block});

    switch_to_block(cond_block);
    auto condition = build_value(*while_stmt.condition);
    terminate(CondBranchTerm{
        .condition = condition, .true_block = body_block, .false_block = end_block});

    switch_to_block(body_block);
    build_block(while_stmt.body);
    if (!is_terminated()) {
        terminate(BranchTerm{cond_block});
    }

    switch_to_block(end_block);
}

void IrBuilder::build_return(const parser::ReturnStmt& ret) {
    if (!ret.value) {
        terminate(ReturnTerm{});
        return;
    }

    auto value = build_expr(**ret.value);
    if (ctx_.current_func->return_type == IrType::Unit) {
        // `return unit_call();` evaluates the call for its effect.
        terminate(ReturnTerm{});
        return;
    }
    terminate(ReturnTerm{value});
}

} // namespace kindred::ir
