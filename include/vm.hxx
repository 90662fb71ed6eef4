/*
    Bfstep - A stepping brainfuck VM and debugger
    VM API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define BFSTEP_DEFAULT_EOF_BEHAVIOUR 1
#define BFSTEP_DEFAULT_TAPE_SIZE 30000
#define BFSTEP_DEFAULT_THROTTLE 1
#define BFSTEP_TAPE_WARN_BYTES (1ull << 30)  // 1 GiB
// Hard limit to prevent uncontrolled memory allocation from user inputs.
// Growth beyond it faults the engine; larger initial sizes are rejected by the CLI.
#define BFSTEP_TAPE_MAX_BYTES (1ull << 31)  // 2 GiB

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace bfstep {

enum class Token : uint8_t {
    PTR_RGT,
    PTR_LFT,
    ADD,
    SUB,
    PUT_CHR,
    RAD_CHR,
    JMP_ZER,
    JMP_NOT_ZER,
};

struct SourceToken {
    Token op;
    size_t offset;
    uint32_t line;
    uint32_t column;
};

// partner is only meaningful for JMP_ZER/JMP_NOT_ZER
struct instruction {
    Token op = Token{};
    size_t partner = 0;
    size_t srcPos = 0;
};

using Program = std::vector<instruction>;

enum class Status : int {
    Ok = 0,
    UnmatchedLoopClose = 1,
    UnmatchedLoopOpen = 2,
    PointerUnderflow = 3,
    TapeLimitExceeded = 4,
};

/// @brief Position context for a failed Status. Parse errors fill the source fields, runtime
/// faults fill pc with the index of the faulting instruction.
struct Diagnostic {
    Status status = Status::Ok;
    size_t offset = 0;
    uint32_t line = 0;
    uint32_t column = 0;
    size_t pc = 0;
};

enum class MemoryModel { Auto, Contiguous, Fibonacci, Paged };

enum class PointerPolicy { Clamp, Fail, Wrap };

struct ProfileInfo {
    std::uint64_t instructions = 0;
    double seconds = 0.0;
    std::size_t tapeCells = 0;
};

std::string_view describe(Status status);
}  // namespace bfstep

#include "vm/lexer.hxx"
#include "vm/assembler.hxx"
#include "vm/memory.hxx"
#include "vm/input.hxx"
#include "vm/executor.hxx"
