/*
    Bfstep - A stepping brainfuck VM and debugger
    Debugger state machine and display helpers
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "debugger.hxx"

#include <simde/x86/avx2.h>
#include <simde/x86/avx512.h>
#include <simde/x86/sse2.h>

#include <algorithm>
#include <chrono>
#include <limits>
#include <vector>

namespace bfstep {

Debugger::Debugger(Engine& engine, InputSource& in, KeySource& keys, Renderer& renderer,
                   size_t throttle)
    : engine(engine),
      in(in),
      keys(keys),
      renderer(renderer),
      lastOpReset(std::chrono::steady_clock::now()) {
    st.throttle = std::max<size_t>(throttle, 1);
    st.countdown = st.throttle;
}

void Debugger::redraw() {
    ++st.redraws;
    renderer.redraw(Frame{engine.program(), engine.state(), st, out.view(), in.buffered(),
                          in.consumed()});
}

void Debugger::quit() {
    st.quitRequested = true;
    st.mode = DebugMode::Terminated;
}

void Debugger::stepOnce(bool manual) {
    const StepOutcome outcome = advance(engine, in, out);
    if (outcome.status != StepStatus::Halted && outcome.status != StepStatus::Faulted) {
        ++st.executed;
        ++opCounter;
    }
    // ops/s is recomputed once a second
    const auto now = std::chrono::steady_clock::now();
    const std::chrono::duration<double> since = now - lastOpReset;
    if (since.count() >= 1.0) {
        st.opsPerSecond = static_cast<double>(opCounter) / since.count();
        opCounter = 0;
        lastOpReset = now;
    }
    if (engine.halted()) {
        redraw();
        st.mode = DebugMode::Terminated;
        return;
    }
    if (manual) {
        redraw();
        return;
    }
    if (--st.countdown == 0) {
        redraw();
        st.countdown = st.throttle;
    }
}

void Debugger::handle(Key key) {
    switch (st.mode) {
        case DebugMode::Terminated:
            return;
        case DebugMode::Paused:
            switch (key) {
                case Key::Quit:
                    quit();
                    break;
                case Key::Continue:
                    st.mode = DebugMode::Running;
                    st.countdown = st.throttle;
                    break;
                default:
                    stepOnce(true);
                    break;
            }
            return;
        case DebugMode::Running:
            switch (key) {
                case Key::Quit:
                    quit();
                    break;
                case Key::Pause:
                    st.mode = DebugMode::Paused;
                    redraw();
                    break;
                case Key::SpeedUp:
                    st.throttle = st.throttle > std::numeric_limits<size_t>::max() / 2
                                      ? std::numeric_limits<size_t>::max()
                                      : st.throttle * 2;
                    break;
                case Key::SpeedDown:
                    st.throttle = std::max<size_t>(st.throttle / 2, 1);
                    st.countdown = std::min(st.countdown, st.throttle);
                    break;
                default:
                    break;
            }
            return;
    }
}

void Debugger::tick() {
    if (st.mode != DebugMode::Running) return;
    if (auto key = keys.poll()) {
        handle(*key);
        if (st.mode != DebugMode::Running) return;
    }
    stepOnce(false);
}

Status Debugger::run() {
    redraw();
    if (engine.halted()) st.mode = DebugMode::Terminated;
    while (st.mode != DebugMode::Terminated) {
        if (st.mode == DebugMode::Paused)
            handle(keys.wait());
        else
            tick();
    }
    return engine.state().fault;
}

Bounds regionBounds(size_t width, size_t bufLen, size_t pos) {
    const size_t start = pos > width / 2 ? pos - width / 2 : 0;
    const size_t end = std::min(start + width, bufLen);
    return Bounds{start, std::max(start, end), pos - start};
}

Bounds MemoryWindow::follow(size_t pointer, size_t cellCount, size_t tapeLen) {
    if (cellCount == 0) cellCount = 1;
    if (pointer < start) {
        start = pointer;
    } else if (pointer >= start + cellCount) {
        start = pointer - cellCount + 1;
    }
    const size_t end = std::min(start + cellCount, tapeLen);
    return Bounds{start, std::max(start, end), pointer - start};
}

std::vector<size_t> changedCells(const std::vector<uint8_t>& prev,
                                 const std::vector<uint8_t>& cur) {
    std::vector<size_t> changed;
    const size_t limit = std::min(prev.size(), cur.size());
#if defined(SIMDE_X86_AVX512F_NATIVE) || (SIMDE_NATURAL_VECTOR_SIZE >= 512)
    constexpr size_t simdBytes = 64;
#elif defined(SIMDE_X86_AVX2_NATIVE) || (SIMDE_NATURAL_VECTOR_SIZE >= 256)
    constexpr size_t simdBytes = 32;
#else
    constexpr size_t simdBytes = 16;
#endif
    const size_t vecEnd = (limit / simdBytes) * simdBytes;
    const uint8_t* a = cur.data();
    const uint8_t* b = prev.data();
    for (size_t off = 0; off < vecEnd; off += simdBytes) {
#if defined(SIMDE_X86_AVX512F_NATIVE) || (SIMDE_NATURAL_VECTOR_SIZE >= 512)
        simde__m512i va = simde_mm512_loadu_si512(a + off);
        simde__m512i vb = simde_mm512_loadu_si512(b + off);
        uint64_t mask = ~static_cast<uint64_t>(simde_mm512_cmpeq_epi8_mask(va, vb));
        while (mask) {
            changed.push_back(off + static_cast<size_t>(__builtin_ctzll(mask)));
            mask &= mask - 1;
        }
#elif defined(SIMDE_X86_AVX2_NATIVE) || (SIMDE_NATURAL_VECTOR_SIZE >= 256)
        auto va = simde_mm256_loadu_si256(reinterpret_cast<const simde__m256i*>(a + off));
        auto vb = simde_mm256_loadu_si256(reinterpret_cast<const simde__m256i*>(b + off));
        uint32_t mask = ~static_cast<uint32_t>(simde_mm256_movemask_epi8(simde_mm256_cmpeq_epi8(va, vb)));
        while (mask) {
            changed.push_back(off + static_cast<size_t>(__builtin_ctz(mask)));
            mask &= mask - 1;
        }
#else
        auto va = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(a + off));
        auto vb = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(b + off));
        uint32_t mask = ~static_cast<uint32_t>(simde_mm_movemask_epi8(simde_mm_cmpeq_epi8(va, vb))) &
                        0xFFFFu;
        while (mask) {
            changed.push_back(off + static_cast<size_t>(__builtin_ctz(mask)));
            mask &= mask - 1;
        }
#endif
    }
    for (size_t i = vecEnd; i < limit; ++i) {
        if (cur[i] != prev[i]) changed.push_back(i);
    }
    for (size_t i = limit; i < cur.size(); ++i) {
        if (cur[i]) changed.push_back(i);
    }
    return changed;
}
}  // namespace bfstep
