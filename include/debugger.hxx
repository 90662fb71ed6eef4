/*
    Bfstep - A stepping brainfuck VM and debugger
    Debugger API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string_view>

#include "vm.hxx"

namespace bfstep {

// Step stands for every key without a binding of its own.
enum class Key { Continue, Pause, Quit, SpeedUp, SpeedDown, Step };

enum class DebugMode { Paused, Running, Terminated };

struct DebuggerState {
    DebugMode mode = DebugMode::Paused;
    size_t throttle = BFSTEP_DEFAULT_THROTTLE;  // steps per redraw while running
    size_t countdown = BFSTEP_DEFAULT_THROTTLE;
    bool quitRequested = false;
    std::uint64_t executed = 0;
    std::uint64_t redraws = 0;
    double opsPerSecond = 0.0;
};

struct Frame {
    const Program& program;
    const ExecutionState& exec;
    const DebuggerState& dbg;
    std::string_view output;
    std::string_view input;
    size_t inputPos;
};

class KeySource {
   public:
    virtual ~KeySource() = default;
    // Must not block.
    virtual std::optional<Key> poll() = 0;
    virtual Key wait() = 0;
};

class Renderer {
   public:
    virtual ~Renderer() = default;
    virtual void redraw(const Frame& frame) = 0;
};

/// @brief Drives an Engine one instruction at a time from key events.
///
/// Starts paused. While paused every key except Quit and Continue executes one instruction and
/// redraws. While running, instructions execute back to back with a redraw every `throttle`
/// steps; SpeedUp and SpeedDown double and halve the throttle (never below 1). Pause redraws
/// once. Quit ends the session before another instruction executes; a halt or fault ends it
/// after one final redraw.
class Debugger {
   public:
    Debugger(Engine& engine, InputSource& in, KeySource& keys, Renderer& renderer,
             size_t throttle = BFSTEP_DEFAULT_THROTTLE);

    void handle(Key key);
    // One running-mode iteration: poll for a key, then step. Does nothing unless running.
    void tick();
    /// @brief Whole session: an initial frame, then keys and steps until terminated.
    /// @return The engine's fault, Status::Ok on a clean halt or quit.
    Status run();

    const DebuggerState& state() const noexcept { return st; }
    std::string_view output() const noexcept { return out.view(); }

   private:
    void stepOnce(bool manual);
    void redraw();
    void quit();

    Engine& engine;
    InputSource& in;
    KeySource& keys;
    Renderer& renderer;
    DebuggerState st;
    std::ostringstream out;
    std::chrono::steady_clock::time_point lastOpReset;
    std::uint64_t opCounter = 0;
};

struct Bounds {
    size_t start;
    size_t end;
    size_t rel;
};

/// @brief Visible slice [start, end) of a buffer of `bufLen` characters in a field `width`
/// wide, keeping `pos` centred where possible. `rel` is the column of `pos` inside the slice.
Bounds regionBounds(size_t width, size_t bufLen, size_t pos);

// Range of cells on screen. Moves only when the pointer leaves it, and then only as far as
// needed to bring the pointer back into view.
class MemoryWindow {
   public:
    Bounds follow(size_t pointer, size_t cellCount, size_t tapeLen);

   private:
    size_t start = 0;
};

// Indices where cur differs from prev, plus every non-zero cell past the end of prev.
std::vector<size_t> changedCells(const std::vector<uint8_t>& prev,
                                 const std::vector<uint8_t>& cur);
}  // namespace bfstep
