#include "vm/lexer.hxx"

#include <cstdint>

#include "vm.hxx"

namespace bfstep {
namespace {
bool toToken(char c, Token& op) {
    switch (c) {
        case '>':
            op = Token::PTR_RGT;
            return true;
        case '<':
            op = Token::PTR_LFT;
            return true;
        case '+':
            op = Token::ADD;
            return true;
        case '-':
            op = Token::SUB;
            return true;
        case '.':
            op = Token::PUT_CHR;
            return true;
        case ',':
            op = Token::RAD_CHR;
            return true;
        case '[':
            op = Token::JMP_ZER;
            return true;
        case ']':
            op = Token::JMP_NOT_ZER;
            return true;
        default:
            return false;
    }
}
}  // namespace

bool isInstruction(char c) {
    Token op;
    return toToken(c, op);
}

char toChar(Token op) {
    switch (op) {
        case Token::PTR_RGT:
            return '>';
        case Token::PTR_LFT:
            return '<';
        case Token::ADD:
            return '+';
        case Token::SUB:
            return '-';
        case Token::PUT_CHR:
            return '.';
        case Token::RAD_CHR:
            return ',';
        case Token::JMP_ZER:
            return '[';
        case Token::JMP_NOT_ZER:
            return ']';
    }
    return '?';
}

std::vector<SourceToken> lex(std::string_view source) {
    std::vector<SourceToken> tokens;
    tokens.reserve(source.size());
    uint32_t line = 1;
    uint32_t column = 1;
    for (size_t i = 0; i < source.size(); ++i) {
        const char c = source[i];
        Token op;
        if (toToken(c, op)) tokens.push_back(SourceToken{op, i, line, column});
        if (c == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return tokens;
}

void locate(std::string_view source, Diagnostic& diag) {
    uint32_t line = 1;
    uint32_t column = 1;
    const size_t end = diag.offset < source.size() ? diag.offset : source.size();
    for (size_t i = 0; i < end; ++i) {
        if (source[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    diag.line = line;
    diag.column = column;
}
}  // namespace bfstep
