#pragma once

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "debugger.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

// Replays a fixed list of keys. Once the script runs out poll() reports nothing and wait()
// answers Quit, so a session can never hang a test.
struct ScriptedKeys final : bfstep::KeySource {
    std::deque<bfstep::Key> script;
    std::size_t polls = 0;
    std::size_t pollEvery = 1;  // deliver a scripted key on every n-th poll

    std::optional<bfstep::Key> poll() override {
        ++polls;
        if (script.empty() || polls % pollEvery != 0) return std::nullopt;
        bfstep::Key k = script.front();
        script.pop_front();
        return k;
    }
    bfstep::Key wait() override {
        if (script.empty()) return bfstep::Key::Quit;
        bfstep::Key k = script.front();
        script.pop_front();
        return k;
    }
};

struct RecordingRenderer final : bfstep::Renderer {
    std::size_t redraws = 0;
    std::vector<std::size_t> pcs;
    std::vector<std::uint64_t> executed;
    std::string lastOutput;

    void redraw(const bfstep::Frame& frame) override {
        ++redraws;
        pcs.push_back(frame.exec.pc);
        executed.push_back(frame.dbg.executed);
        lastOutput = std::string(frame.output);
    }
};
