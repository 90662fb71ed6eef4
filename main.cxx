/*
    Bfstep - A stepping brainfuck VM and debugger
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ansi.hxx"
#include "dump.hxx"
#include "vm.hxx"
#ifdef BFSTEP_ENABLE_TUI
#include "tui.hxx"
#endif

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace bfstep;

namespace {

// Read-only file mapping
struct MappedFile {
    const char* data = nullptr;
    size_t size = 0;
    int fd = -1;
    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    ~MappedFile() { close(); }
    void close() {
        if (data && size) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
            munmap(const_cast<char*>(data), size);
        }
        if (fd >= 0) ::close(fd);
        data = nullptr;
        size = 0;
        fd = -1;
    }
};

static bool mapFileReadOnly(const std::string& path, MappedFile& mf) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;
    struct stat st{};
    if (fstat(fd, &st) != 0) {
        ::close(fd);
        return false;
    }
    if (st.st_size == 0) {
        mf.fd = fd;
        mf.data = nullptr;
        mf.size = 0;
        return true;
    }
    void* view = mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
    if (view == MAP_FAILED) {
        ::close(fd);
        return false;
    }
    mf.fd = fd;
    mf.data = static_cast<const char*>(view);
    mf.size = static_cast<size_t>(st.st_size);
    return true;
}

// Reads a whole file, through a memory mapping when possible. Comments are kept so that
// diagnostics can point at lines and columns of the source text.
// Returns true on success; on error, 'err' is set and 'out' left unchanged.
static bool readWholeFile(const std::string& filename, std::string& out, std::string& err) {
    MappedFile mf;
    if (mapFileReadOnly(filename, mf)) {
        if (mf.size == 0 || mf.data == nullptr) {
            out.clear();
            return true;
        }
        out.assign(mf.data, mf.size);
        return true;
    }
    // Fallback: stream
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        err = "File could not be opened: " + filename;
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!in.eof() && in.fail()) {
        err = "Error while reading file: " + filename;
        return false;
    }
    out.swap(text);
    return true;
}

struct CmdArgs {
    std::string filename;
    std::string evalCode;
    std::string inputFile;
    std::string fixedInput;
    bool hasFixedInput = false;
    bool debug = false;
    bool dumpMemory = false;
    bool help = false;
    bool profile = false;
    int eof = BFSTEP_DEFAULT_EOF_BEHAVIOUR;
    std::size_t tapeSize = BFSTEP_DEFAULT_TAPE_SIZE;
    std::size_t throttle = BFSTEP_DEFAULT_THROTTLE;
    PointerPolicy pointerPolicy = PointerPolicy::Clamp;
    MemoryModel model = MemoryModel::Auto;
};

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-e" && i + 1 < argc) {
            args.evalCode = argv[++i];
            args.filename.clear();
        } else if (arg == "-i" && i + 1 < argc) {
            // -e wins over -i regardless of order
            ++i;
            if (args.evalCode.empty()) args.filename = argv[i];
        } else if (arg == "-in" && i + 1 < argc) {
            args.inputFile = argv[++i];
        } else if (arg == "-fi" && i + 1 < argc) {
            args.fixedInput = argv[++i];
            args.hasFixedInput = true;
        } else if (arg == "-d") {
            args.debug = true;
        } else if (arg == "-dm") {
            args.dumpMemory = true;
        } else if (arg == "-h") {
            args.help = true;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (arg == "-eof" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            long parsed = std::strtol(val, &end, 10);
            if (end == val || *end != '\0' || parsed < 0 || parsed > 2) {
                std::cerr << "Invalid EOF mode: " << val << std::endl;
                args.help = true;
            } else {
                args.eof = static_cast<int>(parsed);
            }
        } else if (arg == "-ts" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            unsigned long long parsed = std::strtoull(val, &end, 10);
            if (val[0] == '-' || end == val || *end != '\0' || parsed == 0) {
                std::cerr << "Tape size must be a positive integer: " << val << std::endl;
                args.help = true;
            } else {
                args.tapeSize = static_cast<std::size_t>(parsed);
            }
        } else if (arg == "-th" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            unsigned long long parsed = std::strtoull(val, &end, 10);
            if (val[0] == '-' || end == val || *end != '\0' || parsed == 0) {
                std::cerr << "Throttle must be a positive integer: " << val << std::endl;
                args.help = true;
            } else {
                args.throttle = static_cast<std::size_t>(parsed);
            }
        } else if (arg == "-pp" && i + 1 < argc) {
            std::string pp = lower(argv[++i]);
            if (pp == "clamp") {
                args.pointerPolicy = PointerPolicy::Clamp;
            } else if (pp == "fail") {
                args.pointerPolicy = PointerPolicy::Fail;
            } else if (pp == "wrap") {
                args.pointerPolicy = PointerPolicy::Wrap;
            } else {
                std::cerr << "Unknown pointer policy: " << pp << std::endl;
                args.help = true;
            }
        } else if (arg == "-mm" && i + 1 < argc) {
            std::string mm = lower(argv[++i]);
            if (mm == "auto") {
                args.model = MemoryModel::Auto;
            } else if (mm == "contiguous") {
                args.model = MemoryModel::Contiguous;
            } else if (mm == "fibonacci") {
                args.model = MemoryModel::Fibonacci;
            } else if (mm == "paged") {
                args.model = MemoryModel::Paged;
            } else {
                std::cerr << "Unknown memory model: " << mm << std::endl;
                args.help = true;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            args.help = true;
        }
    }
    return args;
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -e <code>        Execute Brainfuck code directly\n"
              << "  -i <file>        Execute code from file\n"
              << "  -in <file>       Read program input from file (default: stdin)\n"
              << "  -fi <text>       Use a fixed string as program input\n"
              << "  -d               Step through the program in the debugger\n"
              << "  -th <n>          Debugger steps per redraw while running (default 1)\n"
              << "  -dm              Dump memory after program\n"
              << "  -eof <value>     EOF behaviour: 0 unchanged, 1 zero (default), 2 255\n"
              << "  -pp <policy>     Pointer underflow: clamp (default), fail, wrap\n"
              << "  -ts <size>       Initial tape size in cells (default 30000)\n"
              << "  -mm <model>      Memory model (auto, contiguous, fibonacci, paged)\n"
              << "  --profile        Print execution profile\n"
              << "  -h               Show this help message" << std::endl;
}

void reportError(const Diagnostic& diag, bool runtime) {
    std::cerr << ansi::error << describe(diag.status);
    if (runtime) std::cerr << " at instruction " << diag.pc;
    std::cerr << " (line " << diag.line << ", column " << diag.column << ")" << std::endl;
}

// Input for the debugger has to be known up front: the terminal is in raw mode and the
// input region shows it.
bool loadDebugInput(const CmdArgs& opts, std::unique_ptr<InputSource>& in) {
    if (opts.hasFixedInput) {
        in = std::make_unique<StringInput>(opts.fixedInput);
        return true;
    }
    std::string text;
    if (!opts.inputFile.empty()) {
        std::string err;
        if (!readWholeFile(opts.inputFile, text, err)) {
            std::cerr << ansi::error << err << std::endl;
            return false;
        }
    }
    in = std::make_unique<StringInput>(std::move(text));
    return true;
}
}  // namespace

int main(int argc, char* argv[]) {
    CmdArgs opts = parseArgs(argc, argv);
    if (opts.help) {
        printHelp(argv[0]);
        return 0;
    }
    if (opts.tapeSize > BFSTEP_TAPE_MAX_BYTES) {
        std::cerr << ansi::error << "Requested tape exceeds maximum allowed size ("
                  << (BFSTEP_TAPE_MAX_BYTES >> 20) << " MiB)" << std::endl;
        return 1;
    }
    if (opts.tapeSize > BFSTEP_TAPE_WARN_BYTES) {
        std::cerr << ansi::warning << "Tape allocation ~" << (opts.tapeSize >> 20)
                  << " MiB may exceed system memory" << std::endl;
    }
    if (opts.filename.empty() && opts.evalCode.empty()) {
        std::cout << "No program given; use -i <file> or -e <code> to run a program" << std::endl;
        return 0;
    }

    std::string code;
    if (!opts.evalCode.empty()) {
        code = opts.evalCode;
    } else {
        std::string err;
        if (!readWholeFile(opts.filename, code, err)) {
            std::cerr << ansi::error << err << std::endl;
            return 1;
        }
    }

    Diagnostic diag;
    Program program;
    if (assemble(code, program, &diag) != Status::Ok) {
        reportError(diag, false);
        return 1;
    }

    EngineConfig cfg;
    cfg.pointerPolicy = opts.pointerPolicy;
    cfg.eof = opts.eof;
    cfg.tapeSize = opts.tapeSize;
    cfg.model = opts.model;
    Engine engine(std::move(program), cfg);

    Status ret = Status::Ok;
    if (opts.debug) {
#ifdef BFSTEP_ENABLE_TUI
        std::unique_ptr<InputSource> in;
        if (!loadDebugInput(opts, in)) return 1;
        std::string output;
        {
            TerminalSession session;
            TerminalRenderer renderer;
            TerminalKeys keys(renderer);
            Debugger debugger(engine, *in, keys, renderer, opts.throttle);
            ret = debugger.run();
            output = std::string(debugger.output());
        }
        std::cout << output << std::flush;
#else
        std::cerr << ansi::error << "Debugger disabled in this build; rebuild with "
                  << "BFSTEP_ENABLE_TUI" << std::endl;
        return 1;
#endif
    } else {
        std::unique_ptr<InputSource> in;
        std::ifstream inputFile;
        if (opts.hasFixedInput) {
            in = std::make_unique<StringInput>(opts.fixedInput);
        } else if (!opts.inputFile.empty()) {
            inputFile.open(opts.inputFile, std::ios::binary);
            if (!inputFile.is_open()) {
                std::cerr << ansi::error << "File could not be opened: " << opts.inputFile
                          << std::endl;
                return 1;
            }
            in = std::make_unique<StreamInput>(inputFile);
        } else {
            in = std::make_unique<StreamInput>(std::cin);
        }
        ProfileInfo profileInfo;
        ret = run(engine, *in, std::cout, opts.profile ? &profileInfo : nullptr, &diag);
        if (opts.profile) {
            std::cout << "Instructions executed: " << profileInfo.instructions << std::endl;
            std::cout << "Elapsed time: " << profileInfo.seconds << "s" << std::endl;
            std::cout << "Tape cells: " << profileInfo.tapeCells << std::endl;
        }
    }

    if (ret != Status::Ok) {
        diag.status = ret;
        diag.pc = engine.state().pc;
        diag.offset = engine.program()[diag.pc].srcPos;
        locate(code, diag);
        reportError(diag, true);
    }
    if (opts.dumpMemory) dumpMemory(engine.state().tape.data(), engine.state().pointer, std::cout);
    return ret == Status::Ok ? 0 : 1;
}
