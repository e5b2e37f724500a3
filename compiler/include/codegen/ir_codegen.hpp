//! # IR-based LLVM IR Code Generator
//!
//! Translates a Kindred IR module into LLVM textual IR.
//!
//! ## Storage Strategy
//!
//! | IR entity      | LLVM                                               |
//! |----------------|----------------------------------------------------|
//! | slot `$N x`    | one `alloca` at the top of the entry block, in slot order |
//! | temporary `tN` | virtual register `%tN`                             |
//! | global `@x`    | `internal global`, zero-initialized                |
//! | string literal | `private constant` `@.str.N`, numbered by first use |
//!
//! Physical register assignment is left to the LLVM backend.
//!
//! ## Symbols
//!
//! User functions are emitted as `@kin_<name>` so they never collide with
//! the C runtime. The C `main` calls `@kindred.init`, then `@kin_main`, and
//! returns its result (or 0 for a `Unit` main) as the exit status.
//!
//! ## Determinism
//!
//! Output is a function of the module alone: no pointer values, hash-map
//! iteration order or timestamps reach the text.
//!
//! ## Pipeline
//!
//! ```
//! Kindred Source -> AST -> IR -> LLVM IR -> Object Code
//! ```

#ifndef KINDRED_CODEGEN_IR_CODEGEN_HPP
#define KINDRED_CODEGEN_IR_CODEGEN_HPP

#include "common.hpp"
#include "ir/ir.hpp"

#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace kindred::codegen {

enum class CodegenErrorKind {
    MissingEntryPoint,
    InvalidEntrySignature,
};

[[nodiscard]] auto codegen_error_kind_name(CodegenErrorKind kind) -> std::string_view;

struct CodegenError {
    CodegenErrorKind kind;
    std::string message;
};

/// Options for IR-to-LLVM code generation.
struct CodegenOptions {
    bool emit_comments = true; ///< Include `;` comments in the output.
    std::string target_triple; ///< Emitted when non-empty.
};

/// IR-to-LLVM IR code generator.
class IrCodegen {
public:
    explicit IrCodegen(CodegenOptions options = {});

    /// Generates LLVM IR for a whole program, including the C entry point.
    [[nodiscard]] auto generate(const ir::Module& module) -> Result<std::string, CodegenError>;

private:
    CodegenOptions options_;
    std::ostringstream output_;

    // String constants in first-use order (value -> global name)
    std::vector<std::string> string_order_;
    std::map<std::string, std::string> string_constants_;

    // Current function context
    const ir::Function* current_func_ = nullptr;
    const ir::Module* current_module_ = nullptr;

    // Entry point validation
    [[nodiscard]] static auto validate_entry(const ir::Module& module)
        -> std::optional<CodegenError>;

    // Generate helpers
    void collect_strings(const ir::Module& module);
    void emit_preamble(const ir::Module& module);
    void emit_string_constants();
    void emit_globals(const ir::Module& module);
    void emit_builtins(const ir::Module& module);
    void emit_function(const ir::Function& func);
    void emit_block(const ir::BasicBlock& block);
    void emit_instruction(const ir::InstructionData& inst);
    void emit_terminator(const ir::Terminator& term);
    void emit_entry_wrapper(const ir::Function& user_main);

    // Instruction emission helpers
    void emit_constant_inst(const ir::ConstantInst& i, const std::string& result_reg);
    void emit_binary_inst(const ir::BinaryInst& i, const std::string& result_reg);
    void emit_unary_inst(const ir::UnaryInst& i, const std::string& result_reg);
    void emit_call_inst(const ir::CallInst& i, const std::optional<ir::Temp>& result);
    void emit_phi_inst(const ir::PhiInst& i, const ir::Temp& result);

    // Names and types
    [[nodiscard]] static auto llvm_type(ir::IrType type) -> std::string;
    [[nodiscard]] static auto temp_reg(const ir::Temp& temp) -> std::string;
    [[nodiscard]] auto slot_reg(ir::SlotId slot) const -> std::string;
    [[nodiscard]] auto place_ptr(const ir::Place& place) const -> std::string;
    [[nodiscard]] auto block_label(ir::BlockId block) const -> std::string;
    [[nodiscard]] static auto function_symbol(const std::string& name, bool is_builtin)
        -> std::string;
    [[nodiscard]] static auto zero_value(ir::IrType type) -> std::string;
    [[nodiscard]] static auto float_constant(double value) -> std::string;
    [[nodiscard]] static auto escape_bytes(const std::string& value) -> std::string;

    // Emit helpers
    void emitln(const std::string& s = "");
    void emit_comment(const std::string& s);
};

/// Quotes an LLVM identifier body when it contains characters outside
/// `[A-Za-z0-9._$]`.
[[nodiscard]] auto llvm_identifier(const std::string& name) -> std::string;

} // namespace kindred::codegen

#endif // KINDRED_CODEGEN_IR_CODEGEN_HPP
