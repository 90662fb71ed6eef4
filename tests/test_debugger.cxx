#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "debugger.hxx"
#include "helpers.hxx"
#include "vm.hxx"

namespace {
bfstep::Program assembled(const std::string& code) {
    bfstep::Program program;
    bfstep::Status st = bfstep::assemble(code, program);
    assert(st == bfstep::Status::Ok);
    (void)st;
    return program;
}

// Everything a debugger needs, wired together for one program.
struct Session {
    bfstep::Engine engine;
    bfstep::StringInput input;
    ScriptedKeys keys;
    RecordingRenderer renderer;
    bfstep::Debugger debugger;

    Session(const std::string& code, size_t throttle, std::string in = "",
            bfstep::EngineConfig cfg = {})
        : engine(assembled(code), cfg),
          input(std::move(in)),
          debugger(engine, input, keys, renderer, throttle) {}
};
}  // namespace

static void test_paused_steps() {
    Session s("+++", 1);
    s.debugger.handle(bfstep::Key::Step);
    s.debugger.handle(bfstep::Key::Step);
    assert(s.renderer.redraws == 2);
    assert(s.engine.state().pc == 2);
    assert(s.debugger.state().executed == 2);
    assert(s.debugger.state().mode == bfstep::DebugMode::Paused);
    // the last step halts: one final frame, then the session is over
    s.debugger.handle(bfstep::Key::Step);
    assert(s.renderer.redraws == 3);
    assert(s.debugger.state().mode == bfstep::DebugMode::Terminated);
    s.debugger.handle(bfstep::Key::Step);
    assert(s.renderer.redraws == 3);
    assert(s.debugger.state().executed == 3);
}

static void test_running_cadence() {
    const std::string ten(10, '+');
    {
        Session s(ten, 3);
        s.debugger.handle(bfstep::Key::Continue);
        assert(s.renderer.redraws == 0);
        while (s.debugger.state().mode == bfstep::DebugMode::Running) s.debugger.tick();
        // after steps 3, 6 and 9, then the halt
        assert(s.renderer.redraws == 4);
        assert(s.engine.state().tape[0] == 10);
    }
    {
        Session s(ten, 5);
        s.debugger.handle(bfstep::Key::Continue);
        while (s.debugger.state().mode == bfstep::DebugMode::Running) s.debugger.tick();
        // the halt on step 10 coincides with the throttle and draws once
        assert(s.renderer.redraws == 2);
        assert(s.renderer.executed.back() == 10);
    }
}

static void test_quit_paused() {
    Session s("+++", 1);
    s.debugger.handle(bfstep::Key::Quit);
    assert(s.debugger.state().mode == bfstep::DebugMode::Terminated);
    assert(s.debugger.state().quitRequested);
    assert(s.engine.state().pc == 0);
    assert(s.renderer.redraws == 0);
    s.debugger.tick();
    assert(s.engine.state().pc == 0);
}

static void test_quit_running() {
    Session s("+++++", 1);
    s.keys.script.push_back(bfstep::Key::Quit);
    s.keys.pollEvery = 3;
    s.debugger.handle(bfstep::Key::Continue);
    while (s.debugger.state().mode == bfstep::DebugMode::Running) s.debugger.tick();
    // two ticks stepped, the third polled Quit before stepping
    assert(s.engine.state().pc == 2);
    assert(s.debugger.state().executed == 2);
    assert(s.debugger.state().quitRequested);
}

static void test_pause_redraws_once() {
    Session s(std::string(50, '+'), 100);
    s.keys.script.push_back(bfstep::Key::Pause);
    s.keys.pollEvery = 4;
    s.debugger.handle(bfstep::Key::Continue);
    while (s.debugger.state().mode == bfstep::DebugMode::Running) s.debugger.tick();
    assert(s.debugger.state().mode == bfstep::DebugMode::Paused);
    assert(s.debugger.state().executed == 3);
    assert(s.renderer.redraws == 1);
    assert(s.renderer.pcs.back() == 3);
    // Pause while paused is just another step key
    s.debugger.handle(bfstep::Key::Pause);
    assert(s.debugger.state().executed == 4);
    assert(s.renderer.redraws == 2);
}

static void test_speed_keys() {
    Session s(std::string(50, '+'), 8);
    s.debugger.handle(bfstep::Key::Continue);
    for (int i = 0; i < 5; ++i) s.debugger.tick();
    assert(s.debugger.state().countdown == 3);
    s.debugger.handle(bfstep::Key::SpeedDown);
    assert(s.debugger.state().throttle == 4);
    assert(s.debugger.state().countdown == 3);
    s.debugger.handle(bfstep::Key::SpeedDown);
    assert(s.debugger.state().throttle == 2);
    assert(s.debugger.state().countdown == 2);
    s.debugger.tick();
    assert(s.renderer.redraws == 0);
    s.debugger.tick();
    assert(s.renderer.redraws == 1);
    s.debugger.handle(bfstep::Key::SpeedDown);
    s.debugger.handle(bfstep::Key::SpeedDown);
    assert(s.debugger.state().throttle == 1);
    s.debugger.handle(bfstep::Key::SpeedUp);
    assert(s.debugger.state().throttle == 2);
    // speed keys never step
    assert(s.debugger.state().executed == 7);
}

static void test_speed_up_saturates() {
    Session s("+", std::numeric_limits<size_t>::max());
    s.debugger.handle(bfstep::Key::Continue);
    s.debugger.handle(bfstep::Key::SpeedUp);
    assert(s.debugger.state().throttle == std::numeric_limits<size_t>::max());
}

static void test_run_session() {
    Session s("+++++", 1);
    s.keys.script = {bfstep::Key::Step, bfstep::Key::Step, bfstep::Key::Continue};
    bfstep::Status st = s.debugger.run();
    assert(st == bfstep::Status::Ok);
    // initial frame, two manual steps, two running steps, the halting step
    assert(s.renderer.redraws == 6);
    assert(s.renderer.pcs.front() == 0);
    assert(s.renderer.pcs.back() == 5);
    assert(s.debugger.state().mode == bfstep::DebugMode::Terminated);
    assert(!s.debugger.state().quitRequested);
    (void)st;
}

static void test_run_empty_program() {
    Session s("comment only", 1);
    assert(s.debugger.run() == bfstep::Status::Ok);
    assert(s.renderer.redraws == 1);
    assert(s.keys.polls == 0);
}

static void test_io_through_debugger() {
    Session s(",+.,.", 1, "A");
    s.keys.script = {bfstep::Key::Continue};
    assert(s.debugger.run() == bfstep::Status::Ok);
    assert(s.debugger.output() == std::string("B\0", 2));
    assert(s.renderer.lastOutput == std::string("B\0", 2));
    assert(s.input.consumed() == 1);
}

static void test_fault_ends_session() {
    bfstep::EngineConfig cfg;
    cfg.pointerPolicy = bfstep::PointerPolicy::Fail;
    Session s("+<+", 1, "", cfg);
    s.keys.script = {bfstep::Key::Step, bfstep::Key::Step, bfstep::Key::Step};
    assert(s.debugger.run() == bfstep::Status::PointerUnderflow);
    assert(s.renderer.redraws == 3);
    assert(s.debugger.state().executed == 1);
    assert(s.keys.script.size() == 1);
}

static void test_region_bounds() {
    bfstep::Bounds b = bfstep::regionBounds(10, 100, 3);
    assert(b.start == 0 && b.end == 10 && b.rel == 3);
    b = bfstep::regionBounds(10, 100, 50);
    assert(b.start == 45 && b.end == 55 && b.rel == 5);
    b = bfstep::regionBounds(10, 4, 2);
    assert(b.start == 0 && b.end == 4 && b.rel == 2);
    b = bfstep::regionBounds(10, 100, 98);
    assert(b.start == 93 && b.end == 100 && b.rel == 5);
    // a cursor one past the end, as for output
    b = bfstep::regionBounds(10, 30, 30);
    assert(b.start == 25 && b.end == 30 && b.rel == 5);
    b = bfstep::regionBounds(10, 0, 0);
    assert(b.start == 0 && b.end == 0 && b.rel == 0);
}

static void test_memory_window() {
    bfstep::MemoryWindow w;
    bfstep::Bounds b = w.follow(0, 4, 100);
    assert(b.start == 0 && b.end == 4 && b.rel == 0);
    b = w.follow(3, 4, 100);
    assert(b.start == 0 && b.rel == 3);
    b = w.follow(4, 4, 100);
    assert(b.start == 1 && b.end == 5 && b.rel == 3);
    b = w.follow(2, 4, 100);
    assert(b.start == 1 && b.rel == 1);
    b = w.follow(0, 4, 100);
    assert(b.start == 0 && b.rel == 0);
    b = w.follow(40, 4, 100);
    assert(b.start == 37 && b.rel == 3);
    bfstep::MemoryWindow small;
    b = small.follow(1, 8, 3);
    assert(b.start == 0 && b.end == 3 && b.rel == 1);
}

static void test_changed_cells() {
    std::vector<uint8_t> prev(100, 0);
    std::vector<uint8_t> cur = prev;
    assert(bfstep::changedCells(prev, cur).empty());
    cur[0] = 1;
    cur[17] = 2;
    cur[63] = 3;
    cur[64] = 4;
    cur[99] = 5;
    const std::vector<size_t> changed = bfstep::changedCells(prev, cur);
    assert((changed == std::vector<size_t>{0, 17, 63, 64, 99}));

    std::vector<uint8_t> grown(20, 0);
    std::vector<uint8_t> before(10, 0);
    before[3] = 1;
    grown[15] = 1;
    assert((bfstep::changedCells(before, grown) == std::vector<size_t>{3, 15}));
}

int main() {
    test_paused_steps();
    test_running_cadence();
    test_quit_paused();
    test_quit_running();
    test_pause_redraws_once();
    test_speed_keys();
    test_speed_up_saturates();
    test_run_session();
    test_run_empty_program();
    test_io_through_debugger();
    test_fault_ends_session();
    test_region_bounds();
    test_memory_window();
    test_changed_cells();
    return 0;
}
