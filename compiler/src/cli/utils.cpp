#include "utils.hpp"

namespace yuho::cli {

auto read_file(const std::string& path) -> Result<std::string, types::ReadError> {
    return types::FileSystemSourceLoader().read(path);
}

void print_usage(std::ostream& out) {
    out << "Yuho front end " << VERSION << "\n\n";
    out << "Usage: yuhoc <command> [options] <file.yh>\n\n";
    out << "Commands:\n";
    out << "  tokens    Print the token stream of a file\n";
    out << "  parse     Parse a file and pretty-print it\n";
    out << "  check     Resolve imports and run semantic analysis\n";
    out << "\nParse options:\n";
    out << "  --recover          Keep going after syntax errors\n";
    out << "  --ast              Print the syntax tree instead of source\n";
    out << "\nCheck options:\n";
    out << "  -I <dir>           Add a module search path\n";
    out << "  --json             Output diagnostics as JSON lines\n";
    out << "  -Werror            Treat warnings as errors\n";
    out << "  -Wnone             Suppress warnings\n";
    out << "  --max-errors=<n>   Stop after n errors (0 = no limit)\n";
    out << "\nOptions:\n";
    out << "  --help, -h         Show this help\n";
    out << "  --version, -V      Show version\n";
    out << "  --log-level=<lvl>  trace, debug, info, warn, error, off\n";
    out << "  --log-filter=<s>   Per-module levels, e.g. resolver=debug,*=warn\n";
    out << "  --log-file=<path>  Also write the log to a file\n";
    out << "  -v, -vv, -vvv      More log output\n";
    out << "  -q                 Errors only\n";
    out << "\nEnvironment:\n";
    out << "  YUHO_PATH          Extra search paths, separated by ':'\n";
    out << "  YUHO_LOG           Log level or filter when no flag is given\n";
}

void print_version() {
    std::cout << "yuhoc " << VERSION << "\n";
}

} // namespace yuho::cli
