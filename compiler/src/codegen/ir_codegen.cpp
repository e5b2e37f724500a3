//! # IR Codegen Core
//!
//! Module layout, in emission order:
//!
//! 1. Header (`source_filename`, target triple)
//! 2. String constants `@.str.N`
//! 3. Globals
//! 4. Builtin print helpers used by the program, and `printf`
//! 5. `@kindred.init` and user functions, in module order
//! 6. The C `main` wrapper

#include "codegen/ir_codegen.hpp"

#include "log/log.hpp"

#include <cctype>
#include <cstring>
#include <iomanip>
#include <set>

namespace kindred::codegen {

namespace {

// Escapes every byte outside printable ASCII, plus `"` and `\`, as `\XX`.
auto escape_llvm_bytes(const std::string& value) -> std::string {
    static const char* digits = "0123456789ABCDEF";
    std::string escaped;
    for (unsigned char c : value) {
        if (c >= 0x20 && c < 0x7F && c != '"' && c != '\\') {
            escaped += static_cast<char>(c);
        } else {
            escaped += '\\';
            escaped += digits[c >> 4];
            escaped += digits[c & 0xF];
        }
    }
    return escaped;
}

} // namespace

auto codegen_error_kind_name(CodegenErrorKind kind) -> std::string_view {
    switch (kind) {
    case CodegenErrorKind::MissingEntryPoint:
        return "MissingEntryPoint";
    case CodegenErrorKind::InvalidEntrySignature:
        return "InvalidEntrySignature";
    }
    return "Unknown";
}

auto llvm_identifier(const std::string& name) -> std::string {
    bool plain = !name.empty();
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '_' && c != '.' && c != '$') {
            plain = false;
            break;
        }
    }
    if (plain && !std::isdigit(static_cast<unsigned char>(name[0]))) {
        return name;
    }
    return "\"" + escape_llvm_bytes(name) + "\"";
}

IrCodegen::IrCodegen(CodegenOptions options) : options_(std::move(options)) {}

void IrCodegen::emitln(const std::string& s) {
    output_ << s << "\n";
}

void IrCodegen::emit_comment(const std::string& s) {
    if (options_.emit_comments) {
        emitln("; " + s);
    }
}

// ============================================================================
// Entry Point
// ============================================================================

auto IrCodegen::validate_entry(const ir::Module& module) -> std::optional<CodegenError> {
    const auto* user_main = module.find_function("main");
    if (!user_main) {
        return CodegenError{.kind = CodegenErrorKind::MissingEntryPoint,
                            .message = "program has no `main` function"};
    }
    if (!user_main->params.empty()) {
        return CodegenError{.kind = CodegenErrorKind::InvalidEntrySignature,
                            .message = "`main` must not take parameters, found " +
                                       std::to_string(user_main->params.size())};
    }
    auto ret = user_main->return_type;
    if (ret != ir::IrType::Int && ret != ir::IrType::Unit) {
        return CodegenError{.kind = CodegenErrorKind::InvalidEntrySignature,
                            .message = "`main` must return `Int` or `Unit`, found `" +
                                       std::string(ir::ir_type_to_string(ret)) + "`"};
    }
    return std::nullopt;
}

auto IrCodegen::generate(const ir::Module& module) -> Result<std::string, CodegenError> {
    if (auto error = validate_entry(module)) {
        KINDRED_LOG_DEBUG("codegen", "Rejected module: " << error->message);
        return *error;
    }

    output_.str("");
    output_.clear();
    string_order_.clear();
    string_constants_.clear();
    current_module_ = &module;

    collect_strings(module);
    emit_preamble(module);
    emit_string_constants();
    emit_globals(module);
    emit_builtins(module);

    for (const auto& func : module.functions) {
        emit_function(func);
    }
    emit_entry_wrapper(*module.find_function("main"));

    current_module_ = nullptr;
    KINDRED_LOG_DEBUG("codegen", "Generated " << module.functions.size() << " functions, "
                                              << string_order_.size() << " strings");
    return output_.str();
}

// ============================================================================
// Module Sections
// ============================================================================

void IrCodegen::collect_strings(const ir::Module& module) {
    for (const auto& func : module.functions) {
        for (const auto& block : func.blocks) {
            for (const auto& inst : block.instructions) {
                const auto* constant = std::get_if<ir::ConstantInst>(&inst.inst);
                if (!constant) {
                    continue;
                }
                const auto* str = std::get_if<ir::ConstString>(&constant->value);
                if (str && string_constants_.find(str->value) == string_constants_.end()) {
                    string_constants_[str->value] =
                        "@.str." + std::to_string(string_order_.size());
                    string_order_.push_back(str->value);
                }
            }
        }
    }
}

void IrCodegen::emit_preamble(const ir::Module& module) {
    emitln("; ModuleID = '" + module.name + "'");
    emitln("source_filename = \"" + escape_bytes(module.name) + "\"");
    if (!options_.target_triple.empty()) {
        emitln("target triple = \"" + options_.target_triple + "\"");
    }
    emitln();
}

void IrCodegen::emit_string_constants() {
    for (const auto& value : string_order_) {
        size_t len = value.size() + 1; // +1 for null terminator
        emitln(string_constants_.at(value) + " = private unnamed_addr constant [" +
               std::to_string(len) + " x i8] c\"" + escape_bytes(value) + "\\00\"");
    }
    if (!string_order_.empty()) {
        emitln();
    }
}

void IrCodegen::emit_globals(const ir::Module& module) {
    for (const auto& global : module.globals) {
        emitln(place_ptr(ir::Place{ir::StorageKind::Global, global.id}) + " = internal global " +
               llvm_type(global.type) + " " + zero_value(global.type));
    }
    if (!module.globals.empty()) {
        emitln();
    }
}

void IrCodegen::emit_builtins(const ir::Module& module) {
    std::set<std::string> used;
    for (const auto& func : module.functions) {
        for (const auto& block : func.blocks) {
            for (const auto& inst : block.instructions) {
                const auto* call = std::get_if<ir::CallInst>(&inst.inst);
                if (call && call->is_builtin) {
                    used.insert(call->callee);
                }
            }
        }
    }
    if (used.empty()) {
        return;
    }

    emit_comment("Runtime support");
    emitln("declare i32 @printf(i8*, ...)");
    emitln();

    // Each helper formats its argument with printf and a trailing newline.
    auto begin_printer = [this](const std::string& name, const std::string& param_type,
                                const std::string& format) {
        std::string fmt_global = "@.fmt." + name;
        std::string array = "[" + std::to_string(format.size() + 1) + " x i8]";
        emitln(fmt_global + " = private unnamed_addr constant " + array + " c\"" +
               escape_bytes(format) + "\\00\"");
        emitln("define internal void @kindred." + name + "(" + param_type + " %value) {");
        emitln("entry:");
        emitln("    %fmt = getelementptr inbounds " + array + ", " + array + "* " + fmt_global +
               ", i64 0, i64 0");
    };
    auto finish_printer = [this](const std::string& arg) {
        emitln("    %written = call i32 (i8*, ...) @printf(i8* %fmt, " + arg + ")");
        emitln("    ret void");
        emitln("}");
        emitln();
    };

    if (used.count("print_int") > 0) {
        begin_printer("print_int", "i64", "%lld\n");
        finish_printer("i64 %value");
    }
    if (used.count("print_float") > 0) {
        begin_printer("print_float", "double", "%g\n");
        finish_printer("double %value");
    }
    if (used.count("print_bool") > 0) {
        emitln("@.bool.true = private unnamed_addr constant [5 x i8] c\"true\\00\"");
        emitln("@.bool.false = private unnamed_addr constant [6 x i8] c\"false\\00\"");
        begin_printer("print_bool", "i1", "%s\n");
        emitln("    %true = getelementptr inbounds [5 x i8], [5 x i8]* @.bool.true, i64 0, "
               "i64 0");
        emitln("    %false = getelementptr inbounds [6 x i8], [6 x i8]* @.bool.false, i64 0, "
               "i64 0");
        emitln("    %text = select i1 %value, i8* %true, i8* %false");
        finish_printer("i8* %text");
    }
    if (used.count("print_str") > 0) {
        begin_printer("print_str", "i8*", "%s\n");
        finish_printer("i8* %value");
    }
}

void IrCodegen::emit_entry_wrapper(const ir::Function& user_main) {
    emit_comment("C entry point");
    emitln("define i32 @main() {");
    emitln("entry:");
    emitln("    call void " + function_symbol(ir::INIT_FUNCTION, false) + "()");
    if (user_main.return_type == ir::IrType::Int) {
        emitln("    %status = call i64 " + function_symbol(user_main.name, false) + "()");
        emitln("    %code = trunc i64 %status to i32");
        emitln("    ret i32 %code");
    } else {
        emitln("    call void " + function_symbol(user_main.name, false) + "()");
        emitln("    ret i32 0");
    }
    emitln("}");
}

// ============================================================================
// Functions
// ============================================================================

void IrCodegen::emit_function(const ir::Function& func) {
    current_func_ = &func;

    std::string signature = "define internal " + llvm_type(func.return_type) + " " +
                            function_symbol(func.name, false) + "(";
    for (size_t i = 0; i < func.params.size(); ++i) {
        if (i > 0) {
            signature += ", ";
        }
        signature += llvm_type(func.params[i].type) + " " + temp_reg(func.params[i].value);
    }
    signature += ") {";

    emit_comment("fn " + func.name);
    emitln(signature);

    for (size_t b = 0; b < func.blocks.size(); ++b) {
        const auto& block = func.blocks[b];
        emitln(block_label(block.id) + ":");
        if (b == 0) {
            for (const auto& slot : func.slots) {
                emitln("    " + slot_reg(slot.id) + " = alloca " + llvm_type(slot.type));
            }
        }
        emit_block(block);
    }

    emitln("}");
    emitln();
    current_func_ = nullptr;
}

void IrCodegen::emit_block(const ir::BasicBlock& block) {
    for (const auto& inst : block.instructions) {
        emit_instruction(inst);
    }
    if (block.terminator) {
        emit_terminator(*block.terminator);
    } else {
        emitln("    unreachable");
    }
}

// ============================================================================
// Names and Types
// ============================================================================

auto IrCodegen::llvm_type(ir::IrType type) -> std::string {
    switch (type) {
    case ir::IrType::Unit:
        return "void";
    case ir::IrType::Bool:
        return "i1";
    case ir::IrType::Int:
        return "i64";
    case ir::IrType::Float:
        return "double";
    case ir::IrType::Str:
        return "i8*";
    }
    return "void";
}

auto IrCodegen::temp_reg(const ir::Temp& temp) -> std::string {
    return "%t" + std::to_string(temp.id);
}

auto IrCodegen::slot_reg(ir::SlotId slot) const -> std::string {
    return "%" + llvm_identifier(current_func_->slots.at(slot).name + ".addr" +
                                 std::to_string(slot));
}

auto IrCodegen::place_ptr(const ir::Place& place) const -> std::string {
    if (place.kind == ir::StorageKind::Slot) {
        return slot_reg(place.index);
    }
    return "@" + llvm_identifier("kin.global." + current_module_->globals.at(place.index).name);
}

auto IrCodegen::block_label(ir::BlockId block) const -> std::string {
    return llvm_identifier(current_func_->blocks.at(block).label);
}

auto IrCodegen::function_symbol(const std::string& name, bool is_builtin) -> std::string {
    if (name == ir::INIT_FUNCTION) {
        return "@" + name;
    }
    if (is_builtin) {
        return "@kindred." + name;
    }
    return "@" + llvm_identifier("kin_" + name);
}

auto IrCodegen::zero_value(ir::IrType type) -> std::string {
    switch (type) {
    case ir::IrType::Bool:
        return "false";
    case ir::IrType::Int:
        return "0";
    case ir::IrType::Float:
        return "0.0";
    case ir::IrType::Str:
        return "null";
    case ir::IrType::Unit:
        break;
    }
    return "zeroinitializer";
}

auto IrCodegen::float_constant(double value) -> std::string {
    uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    std::ostringstream out;
    out << "0x" << std::uppercase << std::hex << std::setw(16) << std::setfill('0') << bits;
    return out.str();
}

auto IrCodegen::escape_bytes(const std::string& value) -> std::string {
    return escape_llvm_bytes(value);
}

} // namespace kindred::codegen
