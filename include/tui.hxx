/*
    Bfstep - A stepping brainfuck VM and debugger
    Terminal front-end declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#ifdef BFSTEP_ENABLE_TUI
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "debugger.hxx"

namespace bfstep {

// Raw mode and a clean screen for the lifetime of the object.
class TerminalSession {
   public:
    TerminalSession();
    ~TerminalSession();
    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;
};

class TerminalRenderer final : public Renderer {
   public:
    TerminalRenderer();
    void redraw(const Frame& frame) override;
    void resize(size_t newRows, size_t newCols) noexcept;

   private:
    size_t rows;
    size_t cols;
    MemoryWindow memory;
    std::vector<uint8_t> prevCells;
};

/// @brief Keyboard events from the controlling terminal. q, Esc and Ctrl-C quit, c continues,
/// p pauses, the up and down arrows change the redraw rate, anything else steps.
class TerminalKeys final : public KeySource {
   public:
    explicit TerminalKeys(TerminalRenderer& renderer) : renderer(renderer) {}
    std::optional<Key> poll() override;
    Key wait() override;

   private:
    TerminalRenderer& renderer;
};
}  // namespace bfstep
#endif  // BFSTEP_ENABLE_TUI
