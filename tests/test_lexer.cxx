#include <cassert>
#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "vm.hxx"

static void test_empty() {
    assert(bfstep::lex("").empty());
    assert(bfstep::lex("hello, world").size() == 1);  // the comma
    assert(bfstep::lex("no instructions here").empty());
}

static void test_filter_count() {
    std::mt19937 gen(42u);
    std::uniform_int_distribution<int> byteDist(0, 255);
    for (int round = 0; round < 50; ++round) {
        std::string src;
        std::size_t expected = 0;
        for (int i = 0; i < 200; ++i) {
            const char c = static_cast<char>(byteDist(gen));
            src += c;
            if (bfstep::isInstruction(c)) ++expected;
        }
        const std::vector<bfstep::SourceToken> toks = bfstep::lex(src);
        assert(toks.size() == expected);
        for (const bfstep::SourceToken& t : toks) {
            assert(src[t.offset] == bfstep::toChar(t.op));
        }
    }
}

static void test_positions() {
    const std::string src = "a+\n  [x\n\n]";
    const std::vector<bfstep::SourceToken> toks = bfstep::lex(src);
    assert(toks.size() == 3);
    assert(toks[0].op == bfstep::Token::ADD);
    assert(toks[0].offset == 1);
    assert(toks[0].line == 1 && toks[0].column == 2);
    assert(toks[1].op == bfstep::Token::JMP_ZER);
    assert(toks[1].line == 2 && toks[1].column == 3);
    assert(toks[2].op == bfstep::Token::JMP_NOT_ZER);
    assert(toks[2].offset == src.size() - 1);
    assert(toks[2].line == 4 && toks[2].column == 1);
}

static void test_locate() {
    const std::string src = "+\n+>\n  <";
    bfstep::Diagnostic diag;
    diag.offset = src.size() - 1;
    bfstep::locate(src, diag);
    assert(diag.line == 3);
    assert(diag.column == 3);
}

static void test_all_symbols() {
    const std::string src = "><+-.,[]";
    const std::vector<bfstep::SourceToken> toks = bfstep::lex(src);
    assert(toks.size() == src.size());
    std::string back;
    for (const bfstep::SourceToken& t : toks) back += bfstep::toChar(t.op);
    assert(back == src);
}

int main() {
    test_empty();
    test_filter_count();
    test_positions();
    test_locate();
    test_all_symbols();
    return 0;
}
