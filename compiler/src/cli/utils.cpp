#include "utils.hpp"

#include "backend/llvm_backend.hpp"
#include "common.hpp"

#include <iostream>

#include <unistd.h>

namespace kindred::cli {

bool stderr_is_terminal() {
    return isatty(STDERR_FILENO) != 0;
}

void print_diagnostics(const std::vector<diag::Diagnostic>& diagnostics, bool snippets) {
    diag::DiagnosticRenderer renderer({.snippets = snippets, .colors = stderr_is_terminal()});
    std::cerr << renderer.render_all(diagnostics);
    std::cerr.flush();
}

void print_usage() {
    std::cout << "Kindred Compiler " << VERSION << "\n\n";
    std::cout << "Usage: kindred <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  make      Compile the configured source file to an executable\n";
    std::cout << "  clean     Remove the build output directory\n";
    std::cout << "\nMake options:\n";
    std::cout << "  --mode Release|Debug   Optimization mode (default: Release)\n";
    std::cout << "  --source FILE          Source file (default: main.kin)\n";
    std::cout << "  --out DIR              Output directory (default: build)\n";
    std::cout << "  --linker CMD           Linker driver (default: cc)\n";
    std::cout << "  --timeout SECS         Linker timeout (default: 120)\n";
    std::cout << "  --keep-ir              Keep the .ll and .o files\n";
    std::cout << "  --snippets             Show the source line under each error\n";
    std::cout << "\nClean options:\n";
    std::cout << "  --out DIR              Directory to remove (default: build)\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h             Show this help\n";
    std::cout << "  --version, -V          Show version\n";
    std::cout << "  -v, -vv, -vvv, -q      Log verbosity\n";
    std::cout << "  --log-level=LEVEL      trace|debug|info|warn|error|off\n";
    std::cout << "  --log-filter=SPEC      e.g. codegen=debug,*=warn\n";
    std::cout << "  --log-file=PATH        Also write logs to a file\n";
    std::cout << "  --log-format=FMT       text|json\n";
    std::cout << "\nSettings are read from kindred.toml when present; flags override it.\n";
}

void print_version() {
    std::cout << "kindred " << VERSION << " (LLVM " << backend::get_llvm_version() << ")\n";
}

} // namespace kindred::cli
