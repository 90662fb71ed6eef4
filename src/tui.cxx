/*
    Bfstep - A stepping brainfuck VM and debugger
    TUI debugger front-end
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#ifdef BFSTEP_ENABLE_TUI
#include "tui.hxx"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

#include "cpp-terminal/color.hpp"
#include "cpp-terminal/cursor.hpp"
#include "cpp-terminal/event.hpp"
#include "cpp-terminal/input.hpp"
#include "cpp-terminal/key.hpp"
#include "cpp-terminal/screen.hpp"
#include "cpp-terminal/style.hpp"
#include "cpp-terminal/terminal.hpp"
#include "cpp-terminal/terminfo.hpp"
#include "cpp-terminal/window.hpp"

namespace bfstep {
namespace {
constexpr std::size_t cellWidth = 4;  // "255 "

bool supports_color() {
    using Term::Terminfo;
    return Terminfo::get(Terminfo::Bool::ControlSequences) &&
           Terminfo::getColorMode() != Terminfo::ColorMode::NoColor &&
           Terminfo::getColorMode() != Terminfo::ColorMode::Unset;
}

Term::Color::Name tokenColor(char c) {
    switch (c) {
        case '>':
        case '<':
            return Term::Color::Name::Cyan;
        case '+':
        case '-':
            return Term::Color::Name::Yellow;
        case '[':
        case ']':
            return Term::Color::Name::Magenta;
        default:
            return Term::Color::Name::Green;
    }
}

// Control bytes would move the cursor around; show them as blanks.
std::string printable(std::string_view text) {
    std::string shown(text);
    for (char& c : shown) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u >= 0x7f) c = ' ';
    }
    return shown;
}

void printClipped(Term::Window& scr, std::size_t x, std::size_t y, const std::string& text) {
    if (y < 1 || y > scr.rows() || x > scr.columns()) return;
    const std::size_t room = scr.columns() - x + 1;
    scr.print_str(x, y, text.size() > room ? text.substr(0, room) : text);
}

void drawRegion(Term::Window& scr, std::size_t y, std::string_view label, std::string_view buf,
                std::size_t pos) {
    printClipped(scr, 1, y, std::string(label) + ":");
    const Bounds b = regionBounds(scr.columns(), buf.size(), pos);
    printClipped(scr, 1, y + 1, printable(buf.substr(b.start, b.end - b.start)));
    printClipped(scr, 1 + b.rel, y + 2, "^");
}

std::string modeLabel(const Frame& frame) {
    if (frame.exec.fault != Status::Ok)
        return "FAULT: " + std::string(describe(frame.exec.fault));
    if (frame.exec.halted) return "HALTED";
    switch (frame.dbg.mode) {
        case DebugMode::Running:
            return "RUNNING  p:pause  up/down:rate  q:quit";
        case DebugMode::Paused:
            return "PAUSED  any key:step  c:continue  q:quit";
        case DebugMode::Terminated:
            break;
    }
    return "DONE";
}

std::optional<Key> translate(const Term::Event& ev) {
    if (ev.type() != Term::Event::Type::Key) return std::nullopt;
    Term::Key key = ev;
    if (key == Term::Key::Ctrl_C || key == Term::Key::Esc) return Key::Quit;
    if (key == Term::Key::ArrowUp) return Key::SpeedUp;
    if (key == Term::Key::ArrowDown) return Key::SpeedDown;
    if (key.isprint()) {
        switch (static_cast<char>(key.value)) {
            case 'q':
                return Key::Quit;
            case 'c':
                return Key::Continue;
            case 'p':
                return Key::Pause;
            default:
                break;
        }
    }
    return Key::Step;
}
}  // namespace

TerminalSession::TerminalSession() {
    Term::terminal.setOptions(Term::Option::ClearScreen, Term::Option::NoSignalKeys,
                              Term::Option::NoCursor, Term::Option::Raw);
}

TerminalSession::~TerminalSession() {
    Term::terminal.setOptions(Term::Option::Cooked, Term::Option::SignalKeys, Term::Option::Cursor);
}

TerminalRenderer::TerminalRenderer() {
    const Term::Screen size = Term::screen_size();
    rows = size.rows();
    cols = size.columns();
}

void TerminalRenderer::resize(size_t newRows, size_t newCols) noexcept {
    rows = newRows;
    cols = newCols;
}

void TerminalRenderer::redraw(const Frame& frame) {
    if (rows == 0 || cols == 0) return;
    Term::Window scr(Term::Screen(rows, cols));
    scr.clear();
    const bool color = supports_color();
    const ExecutionState& exec = frame.exec;

    drawRegion(scr, 1, "Input", frame.input, frame.inputPos);
    printClipped(scr, 1, 5, "Pos: " + std::to_string(exec.pc));

    printClipped(scr, 1, 7, "Memory:");
    const std::vector<uint8_t>& cells = exec.tape.data();
    const Bounds mem = memory.follow(exec.pointer, std::max<size_t>(cols / cellWidth, 1),
                                     cells.size());
    const std::vector<size_t> changed = changedCells(prevCells, cells);
    for (size_t i = mem.start; i < mem.end; ++i) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%03u", static_cast<unsigned>(cells[i]));
        const std::size_t x = 1 + (i - mem.start) * cellWidth;
        printClipped(scr, x, 8, buf);
        if (!color) continue;
        const bool touched = std::binary_search(changed.begin(), changed.end(), i);
        if (i == exec.pointer || touched) {
            const auto fg = i == exec.pointer ? Term::Color::Name::Green : Term::Color::Name::Yellow;
            for (std::size_t k = 0; k < 3 && x + k <= scr.columns(); ++k) scr.set_fg(x + k, 8, fg);
        }
    }
    printClipped(scr, 1 + mem.rel * cellWidth, 9, "^");
    prevCells = cells;
    printClipped(scr, 1, 11, "Pointer: " + std::to_string(exec.pointer));

    drawRegion(scr, 13, "Output", frame.output, frame.output.size());

    std::string code;
    code.reserve(frame.program.size());
    for (const instruction& ins : frame.program) code.push_back(toChar(ins.op));
    drawRegion(scr, 17, "Code", code, exec.pc);
    if (color) {
        const Bounds b = regionBounds(scr.columns(), code.size(), exec.pc);
        for (size_t i = b.start; i < b.end; ++i) scr.set_fg(1 + i - b.start, 18, tokenColor(code[i]));
    }

    if (rows > 3) {
        printClipped(scr, 1, rows - 2,
                     "Update frequency: 1/" + std::to_string(frame.dbg.throttle) +
                         " steps displayed");
        char ops[64];
        std::snprintf(ops, sizeof(ops), "Ops/s: %.2f", frame.dbg.opsPerSecond);
        printClipped(scr, 1, rows - 1, ops);
    }
    std::string status = modeLabel(frame);
    if (status.size() < cols)
        status += std::string(cols - status.size(), ' ');
    else
        status = status.substr(0, cols);
    scr.fill_bg(1, rows, cols, 1, Term::Color::Name::White);
    scr.fill_fg(1, rows, cols, 1, Term::Color::Name::Black);
    scr.print_str(1, rows, status);
    Term::cout << scr.render(1, 1, true) << std::flush;
}

std::optional<Key> TerminalKeys::poll() {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    if (::poll(&pfd, 1, 0) <= 0 || !(pfd.revents & POLLIN)) return std::nullopt;
    Term::Event ev = Term::read_event();
    if (ev.type() == Term::Event::Type::Screen) {
        Term::Screen size = ev;
        renderer.resize(size.rows(), size.columns());
        return std::nullopt;
    }
    return translate(ev);
}

Key TerminalKeys::wait() {
    while (true) {
        Term::Event ev = Term::read_event();
        if (ev.type() == Term::Event::Type::Screen) {
            Term::Screen size = ev;
            renderer.resize(size.rows(), size.columns());
            continue;
        }
        if (auto key = translate(ev)) return *key;
    }
}
}  // namespace bfstep
#endif  // BFSTEP_ENABLE_TUI
