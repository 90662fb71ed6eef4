#pragma once

#include <string_view>
#include <vector>

namespace bfstep {
enum class Status : int;
struct Diagnostic;
struct SourceToken;
struct instruction;
using Program = std::vector<instruction>;

/// @brief Resolves loop partners and lays the tokens out as a flat program.
/// @param tokens Output of lex().
/// @param program Receives the program. Untouched unless the result is Status::Ok.
/// @param diag Optional. On failure, filled with the status and the source position of the
/// offending bracket (the earliest one for unmatched opens).
/// @return Status::Ok, Status::UnmatchedLoopClose or Status::UnmatchedLoopOpen.
Status assemble(const std::vector<SourceToken>& tokens, Program& program,
                Diagnostic* diag = nullptr);

// lex() followed by assemble()
Status assemble(std::string_view source, Program& program, Diagnostic* diag = nullptr);
}  // namespace bfstep
