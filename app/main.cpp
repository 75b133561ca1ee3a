#include "ls8/engine.hpp"
#include "ls8/error_logger.hpp"
#include "ls8/errors.hpp"
#include "ls8/program_loader.hpp"
#include "ls8/version.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitLoadFailure = 1;
constexpr int kExitRuntimeFault = 2;

struct Options {
    bool trace{false};
    bool help{false};
    bool version{false};
    std::string logPath;
    std::string programPath;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options] <program.ls8>\n"
              << "Runs an LS-8 program until it halts.\n"
              << "\n"
              << "  --trace          print a trace line per instruction to stderr\n"
              << "  --log <file>     write fault reports to <file> (default ls8_error.log)\n"
              << "  -h, --help       display this help screen\n"
              << "  -V, --version    display version information\n"
              << "\n"
              << "Programs are looked up as given, then under ./examples and $LS8_PROGRAM_PATH.\n";
}

bool parseArgs(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--trace") {
            options.trace = true;
        } else if (arg == "--log") {
            if (i + 1 >= argc) {
                std::cerr << "--log expects a file name\n";
                return false;
            }
            options.logPath = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-V" || arg == "--version") {
            options.version = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << '\n';
            return false;
        } else if (options.programPath.empty()) {
            options.programPath = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << '\n';
            return false;
        }
    }
    return true;
}

std::vector<std::string> programSearchPaths() {
    std::vector<std::string> paths = {"examples"};
    if (const char* extra = std::getenv("LS8_PROGRAM_PATH")) {
        paths.emplace_back(extra);
    }
    return paths;
}

void printErrorSourceCaret(const ls8::MalformedProgramLine& error) {
    const std::string linePrefix = std::to_string(error.lineNumber()) + " | ";
    std::cerr << linePrefix << error.line() << '\n';
    const std::size_t caretPos = error.column() > 0 ? (error.column() - 1) : 0;
    std::cerr << std::string(linePrefix.size() + caretPos, ' ') << "^" << '\n';
}

} // namespace

int main(int argc, char** argv) {
    Options options;
    if (!parseArgs(argc, argv, options)) {
        printUsage(argv[0]);
        return kExitLoadFailure;
    }
    if (options.help) {
        printUsage(argv[0]);
        return kExitOk;
    }
    if (options.version) {
        std::cout << ls8::kProgramName << ' ' << LS8_VERSION_STRING << '\n';
        return kExitOk;
    }
    if (options.programPath.empty()) {
        printUsage(argv[0]);
        return kExitLoadFailure;
    }

    auto& logger = ls8::ErrorLogger::instance();
    if (!options.logPath.empty()) {
        logger.setLogPath(options.logPath);
    }

    ls8::EngineConfig config;
    if (options.trace) {
        config.trace = &std::cerr;
    }
    ls8::ExecutionEngine engine(config);

    try {
        ls8::loadProgramFile(engine, options.programPath, programSearchPaths());
    } catch (const ls8::MalformedProgramLine& e) {
        std::cerr << e.what() << '\n';
        printErrorSourceCaret(e);
        return kExitLoadFailure;
    } catch (const ls8::Ls8Error& e) {
        std::cerr << e.what() << '\n';
        return kExitLoadFailure;
    }

    try {
        engine.runToHalt();
    } catch (const ls8::Ls8Error& e) {
        std::cout.flush();
        const std::uint8_t pc = engine.pc();
        logger.addContext("Program", options.programPath);
        logger.addContext("Instructions executed", std::to_string(engine.instructionCount()));
        logger.logCpuError(e.what(), pc, engine.memory().read(pc), engine.registers().values());
        return kExitRuntimeFault;
    }

    return kExitOk;
}
