#include "vm/assembler.hxx"

#include <cstddef>
#include <vector>

#include "vm.hxx"

namespace bfstep {
namespace {
Status fail(Status status, const SourceToken& at, Diagnostic* diag) {
    if (diag) {
        diag->status = status;
        diag->offset = at.offset;
        diag->line = at.line;
        diag->column = at.column;
        diag->pc = 0;
    }
    return status;
}
}  // namespace

Status assemble(const std::vector<SourceToken>& tokens, Program& program, Diagnostic* diag) {
    Program resolved;
    resolved.reserve(tokens.size());
    std::vector<size_t> stack;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const SourceToken& tok = tokens[i];
        resolved.push_back(instruction{tok.op, 0, tok.offset});
        if (tok.op == Token::JMP_ZER) {
            stack.push_back(i);
        } else if (tok.op == Token::JMP_NOT_ZER) {
            if (stack.empty()) return fail(Status::UnmatchedLoopClose, tok, diag);
            const size_t start = stack.back();
            stack.pop_back();
            resolved[start].partner = i;
            resolved[i].partner = start;
        }
    }
    // The bottom of the stack is the leftmost bracket that never closed.
    if (!stack.empty()) return fail(Status::UnmatchedLoopOpen, tokens[stack.front()], diag);
    program.swap(resolved);
    if (diag) *diag = Diagnostic{};
    return Status::Ok;
}

Status assemble(std::string_view source, Program& program, Diagnostic* diag) {
    return assemble(lex(source), program, diag);
}
}  // namespace bfstep
