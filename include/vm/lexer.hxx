#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace bfstep {
enum class Token : uint8_t;
struct SourceToken;
struct Diagnostic;

bool isInstruction(char c);
char toChar(Token op);

/// @brief Filters source text down to its instruction characters. Every other byte is a
/// comment. Never fails; empty input yields no tokens.
std::vector<SourceToken> lex(std::string_view source);

// Fills diag.line and diag.column from diag.offset.
void locate(std::string_view source, Diagnostic& diag);
}  // namespace bfstep
