//! # LLVM Backend Implementation
//!
//! Uses the LLVM C API for direct IR compilation to object files.

#include "backend/llvm_backend.hpp"

#include "log/log.hpp"

// LLVM C API headers
#include <llvm-c/Analysis.h>
#include <llvm-c/Core.h>
#include <llvm-c/Error.h>
#include <llvm-c/IRReader.h>
#include <llvm-c/Target.h>
#include <llvm-c/TargetMachine.h>
#include <llvm-c/Transforms/PassBuilder.h>
#include <llvm/Config/llvm-config.h>

namespace kindred::backend {

// ============================================================================
// Helper Functions
// ============================================================================

/// Convert LLVM error message to string and dispose it.
static std::string consume_error_message(char* error) {
    if (error == nullptr) {
        return "";
    }
    std::string msg(error);
    LLVMDisposeMessage(error);
    return msg;
}

/// Get optimization level string for pass builder.
static const char* get_opt_level_string(int level) {
    switch (level) {
    case 0:
        return "default<O0>";
    case 1:
        return "default<O1>";
    case 2:
        return "default<O2>";
    case 3:
        return "default<O3>";
    default:
        return "default<O2>";
    }
}

static LLVMCodeGenOptLevel get_codegen_level(int level) {
    switch (level) {
    case 0:
        return LLVMCodeGenLevelNone;
    case 1:
        return LLVMCodeGenLevelLess;
    case 2:
        return LLVMCodeGenLevelDefault;
    default:
        return LLVMCodeGenLevelAggressive;
    }
}

// ============================================================================
// LLVMBackend Implementation
// ============================================================================

LLVMBackend::LLVMBackend() = default;

LLVMBackend::~LLVMBackend() {
    if (context_) {
        LLVMContextDispose(static_cast<LLVMContextRef>(context_));
        context_ = nullptr;
    }
}

auto LLVMBackend::initialize() -> bool {
    if (initialized_) {
        return true;
    }

    // Only the host target is ever used
    if (LLVMInitializeNativeTarget() != 0 || LLVMInitializeNativeAsmPrinter() != 0) {
        last_error_ = "Failed to initialize the native LLVM target";
        return false;
    }

    context_ = LLVMContextCreate();
    if (!context_) {
        last_error_ = "Failed to create LLVM context";
        return false;
    }

    initialized_ = true;
    return true;
}

auto LLVMBackend::get_default_target_triple() const -> std::string {
    char* triple = LLVMGetDefaultTargetTriple();
    std::string result(triple);
    LLVMDisposeMessage(triple);
    return result;
}

auto LLVMBackend::compile_ir_to_object(const std::string& ir_content, const fs::path& output_path,
                                       const LLVMCompileOptions& options) -> LLVMCompileResult {
    LLVMCompileResult result;

    if (!initialized_) {
        result.error_message = "LLVM backend not initialized";
        return result;
    }

    auto ctx = static_cast<LLVMContextRef>(context_);

    // LLVMParseIRInContext takes ownership of the buffer
    LLVMMemoryBufferRef buffer =
        LLVMCreateMemoryBufferWithMemoryRangeCopy(ir_content.c_str(), ir_content.size(), "ir");
    if (!buffer) {
        result.error_message = "Failed to create memory buffer for IR";
        return result;
    }

    LLVMModuleRef module = nullptr;
    char* error = nullptr;
    if (LLVMParseIRInContext(ctx, buffer, &module, &error) != 0) {
        result.error_message = "Failed to parse LLVM IR: " + consume_error_message(error);
        return result;
    }

    error = nullptr;
    if (LLVMVerifyModule(module, LLVMReturnStatusAction, &error) != 0) {
        result.error_message = "Module verification failed: " + consume_error_message(error);
        LLVMDisposeModule(module);
        return result;
    }
    consume_error_message(error);

    std::string target_triple = options.target_triple;
    if (target_triple.empty()) {
        target_triple = get_default_target_triple();
    }
    LLVMSetTarget(module, target_triple.c_str());

    LLVMTargetRef target = nullptr;
    error = nullptr;
    if (LLVMGetTargetFromTriple(target_triple.c_str(), &target, &error) != 0) {
        result.error_message = "Failed to get target: " + consume_error_message(error);
        LLVMDisposeModule(module);
        return result;
    }

    // Generic CPU keeps the object identical across build hosts
    LLVMRelocMode reloc_mode = options.position_independent ? LLVMRelocPIC : LLVMRelocDefault;
    LLVMTargetMachineRef target_machine = LLVMCreateTargetMachine(
        target, target_triple.c_str(), "generic", "",
        get_codegen_level(options.optimization_level), reloc_mode, LLVMCodeModelDefault);
    if (!target_machine) {
        result.error_message = "Failed to create target machine";
        LLVMDisposeModule(module);
        return result;
    }

    LLVMTargetDataRef data_layout = LLVMCreateTargetDataLayout(target_machine);
    char* data_layout_str = LLVMCopyStringRepOfTargetData(data_layout);
    LLVMSetDataLayout(module, data_layout_str);
    LLVMDisposeMessage(data_layout_str);
    LLVMDisposeTargetData(data_layout);

    const char* passes = get_opt_level_string(options.optimization_level);
    LLVMPassBuilderOptionsRef pass_opts = LLVMCreatePassBuilderOptions();
    LLVMErrorRef pass_error = LLVMRunPasses(module, passes, target_machine, pass_opts);
    LLVMDisposePassBuilderOptions(pass_opts);
    if (pass_error != nullptr) {
        char* message = LLVMGetErrorMessage(pass_error);
        result.error_message = std::string("Pass pipeline failed: ") + message;
        LLVMDisposeErrorMessage(message);
        LLVMDisposeTargetMachine(target_machine);
        LLVMDisposeModule(module);
        return result;
    }
    KINDRED_LOG_DEBUG("backend", "Ran pass pipeline " << passes);

    std::string output_str = output_path.string();
    error = nullptr;
    if (LLVMTargetMachineEmitToFile(target_machine, module, output_str.data(), LLVMObjectFile,
                                    &error) != 0) {
        result.error_message = "Failed to emit object file: " + consume_error_message(error);
        LLVMDisposeTargetMachine(target_machine);
        LLVMDisposeModule(module);
        return result;
    }

    KINDRED_LOG_DEBUG("backend", "Compiled to: " << output_path.string());

    LLVMDisposeTargetMachine(target_machine);
    LLVMDisposeModule(module);

    result.success = true;
    result.object_file = output_path;
    return result;
}

// ============================================================================
// Module-level Functions
// ============================================================================

auto get_llvm_version() -> std::string {
    return std::to_string(LLVM_VERSION_MAJOR) + "." + std::to_string(LLVM_VERSION_MINOR) + "." +
           std::to_string(LLVM_VERSION_PATCH);
}

} // namespace kindred::backend
