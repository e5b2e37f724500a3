// IR Lowering - Module, function and helper implementation
//
// This file contains the entry point, declaration lowering and the helpers
// for block management and instruction emission.

#include "ir/lowering.hpp"

#include "log/log.hpp"

namespace kindred::ir {

auto lower(const parser::Program& program, const resolve::Resolution& resolution,
           const types::TypeTable& types) -> Module {
    IrBuilder builder(resolution, types);
    return builder.build(program);
}

auto to_ir_type(const types::TypePtr& type) -> IrType {
    if (!type || !type->is<types::PrimitiveType>()) {
        return IrType::Unit;
    }
    switch (type->as<types::PrimitiveType>().kind) {
    case types::PrimitiveKind::Int:
        return IrType::Int;
    case types::PrimitiveKind::Float:
        return IrType::Float;
    case types::PrimitiveKind::Bool:
        return IrType::Bool;
    case types::PrimitiveKind::Str:
        return IrType::Str;
    case types::PrimitiveKind::Unit:
        return IrType::Unit;
    }
    return IrType::Unit;
}

IrBuilder::IrBuilder(const resolve::Resolution& resolution, const types::TypeTable& types)
    : resolution_(resolution), types_(types) {}

auto IrBuilder::build(const parser::Program& program) -> Module {
    module_ = Module{};
    module_.name = program.name;
    globals_.clear();

    build_globals(program);
    build_init_function(program);
    for (const auto& decl : program.decls) {
        if (decl->is<parser::FuncDecl>()) {
            build_func_decl(decl->as<parser::FuncDecl>());
        }
    }

    KINDRED_LOG_DEBUG("ir", "Lowered " << module_.functions.size() << " functions, "
                                       << module_.globals.size() << " globals");
    return std::move(module_);
}

// ============================================================================
// Declarations
// ============================================================================

void IrBuilder::build_globals(const parser::Program& program) {
    for (const auto& decl : program.decls) {
        if (!decl->is<parser::VarDecl>()) {
            continue;
        }
        const auto& var = decl->as<parser::VarDecl>();
        auto symbol = resolution_.declaration_of(var.id);
        if (!symbol) {
            continue;
        }
        auto id = static_cast<GlobalId>(module_.globals.size());
        module_.globals.push_back(Global{.id = id,
                                         .name = var.name,
                                         .type = symbol_type(*symbol),
                                         .is_mutable = var.is_mutable});
        globals_[*symbol] = id;
    }
}

void IrBuilder::build_init_function(const parser::Program& program) {
    begin_function(Function{.name = INIT_FUNCTION,
                            .params = {},
                            .return_type = IrType::Unit,
                            .slots = {},
                            .blocks = {},
                            .temp_count = 0});

    for (const auto& decl : program.decls) {
        if (!decl->is<parser::VarDecl>()) {
            continue;
        }
        const auto& var = decl->as<parser::VarDecl>();
        auto symbol = resolution_.declaration_of(var.id);
        if (!symbol) {
            continue;
        }
        auto value = build_value(*var.init);
        emit_void(StoreInst{.place = place_of(*symbol), .value = value}, decl->span);
    }

    finish_function();
}

void IrBuilder::build_func_decl(const parser::FuncDecl& func) {
    auto symbol = resolution_.declaration_of(func.id);
    if (!symbol) {
        return;
    }
    const auto& func_type = resolution_.symbols.get(*symbol).type->as<types::FuncType>();

    begin_function(Function{.name = func.name,
                            .params = {},
                            .return_type = to_ir_type(func_type.return_type),
                            .slots = {},
                            .blocks = {},
                            .temp_count = 0});

    // Arguments take the first temporaries and are spilled to slots.
    for (const auto& param : func.params) {
        auto param_symbol = resolution_.declaration_of(param.id);
        if (!param_symbol) {
            continue;
        }
        auto type = symbol_type(*param_symbol);
        auto value = fresh_temp(type);
        auto slot = add_slot(*param_symbol, param.name, type);
        ctx_.current_func->params.push_back(
            Param{.name = param.name, .type = type, .value = value, .slot = slot});
    }
    for (const auto& param : ctx_.current_func->params) {
        emit_void(StoreInst{.place = Place{StorageKind::Slot, param.slot}, .value = param.value},
                  func.name_span);
    }

    build_block(func.body);
    finish_function();
}

void IrBuilder::begin_function(Function func) {
    module_.functions.push_back(std::move(func));
    ctx_ = LoweringContext{};
    ctx_.current_func = &module_.functions.back();
    ctx_.current_block = create_block("entry");
}

void IrBuilder::finish_function() {
    if (!is_terminated()) {
        if (ctx_.current_func->return_type == IrType::Unit) {
            terminate(ReturnTerm{});
        } else {
            // Only reachable when every path returned earlier.
            terminate(UnreachableTerm{});
        }
    }
    ctx_ = LoweringContext{};
}

// ============================================================================
// Block Management
// ============================================================================

auto IrBuilder::create_block(const std::string& name) -> BlockId {
    auto& blocks = ctx_.current_func->blocks;
    auto id = static_cast<BlockId>(blocks.size());
    std::string label = blocks.empty() ? name : name + "." + std::to_string(id);
    blocks.push_back(BasicBlock{.id = id, .label = std::move(label), .instructions = {},
                                .terminator = std::nullopt});
    return id;
}

void IrBuilder::switch_to_block(BlockId block) {
    ctx_.current_block = block;
}

auto IrBuilder::is_terminated() const -> bool {
    return ctx_.current_func->blocks.at(ctx_.current_block).terminator.has_value();
}

void IrBuilder::start_dead_block() {
    switch_to_block(create_block("dead"));
}

// ============================================================================
// Instruction Emission
// ============================================================================

auto IrBuilder::fresh_temp(IrType type) -> Temp {
    return Temp{.id = ctx_.current_func->temp_count++, .type = type};
}

auto IrBuilder::emit(Instruction inst, IrType type, const SourceSpan& span) -> Temp {
    if (is_terminated()) {
        start_dead_block();
    }
    auto result = fresh_temp(type);
    ctx_.current_func->blocks[ctx_.current_block].instructions.push_back(
        InstructionData{.result = result, .inst = std::move(inst), .span = span});
    return result;
}

void IrBuilder::emit_void(Instruction inst, const SourceSpan& span) {
    if (is_terminated()) {
        start_dead_block();
    }
    ctx_.current_func->blocks[ctx_.current_block].instructions.push_back(
        InstructionData{.result = std::nullopt, .inst = std::move(inst), .span = span});
}

void IrBuilder::terminate(Terminator term) {
    if (is_terminated()) {
        start_dead_block();
    }
    ctx_.current_func->blocks[ctx_.current_block].terminator = std::move(term);
}

// ============================================================================
// Storage
// ============================================================================

auto IrBuilder::add_slot(resolve::SymbolId symbol, const std::string& name, IrType type)
    -> SlotId {
    auto& slots = ctx_.current_func->slots;
    auto id = static_cast<SlotId>(slots.size());
    slots.push_back(Slot{.id = id, .name = name, .type = type});
    ctx_.slots[symbol] = id;
    return id;
}

auto IrBuilder::place_of(resolve::SymbolId symbol) const -> Place {
    auto local = ctx_.slots.find(symbol);
    if (local != ctx_.slots.end()) {
        return Place{StorageKind::Slot, local->second};
    }
    return Place{StorageKind::Global, globals_.at(symbol)};
}

auto IrBuilder::expr_type(const parser::Expr& expr) const -> IrType {
    return to_ir_type(types_.type_of_expr(expr.id));
}

auto IrBuilder::symbol_type(resolve::SymbolId symbol) const -> IrType {
    return to_ir_type(types_.type_of_symbol(symbol));
}

} // namespace kindred::ir
