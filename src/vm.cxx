/*
    Bfstep - A stepping brainfuck VM and debugger
    VM implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "vm.hxx"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string_view>
#include <utility>
#include <vector>

namespace bfstep {

std::string_view describe(Status status) {
    switch (status) {
        case Status::Ok:
            return "ok";
        case Status::UnmatchedLoopClose:
            return "Unmatched close bracket";
        case Status::UnmatchedLoopOpen:
            return "Unmatched open bracket";
        case Status::PointerUnderflow:
            return "cell pointer moved before start";
        case Status::TapeLimitExceeded:
            return "cell pointer moved beyond maximum tape size";
    }
    return "unknown error";
}

Engine::Engine(Program program, const EngineConfig& cfg)
    : program_(std::move(program)),
      cfg(cfg),
      state_{Tape(cfg.tapeSize, cfg.model), 0, 0, false, Status::Ok} {
    state_.halted = program_.empty();
}

Engine::Engine(Program program, std::vector<uint8_t> cells, size_t pointer,
               const EngineConfig& cfg)
    : program_(std::move(program)),
      cfg(cfg),
      state_{Tape(std::move(cells), cfg.model), pointer, 0, false, Status::Ok} {
    if (!state_.tape.ensure(pointer)) state_.pointer = state_.tape.size() - 1;
    state_.halted = program_.empty();
}

void Engine::reset() {
    state_.tape = Tape(cfg.tapeSize, cfg.model);
    state_.pointer = 0;
    state_.pc = 0;
    state_.fault = Status::Ok;
    state_.halted = program_.empty();
    pendingInput = false;
}

std::vector<uint8_t> Engine::releaseCells(size_t& pointer) {
    pointer = state_.pointer;
    return state_.tape.release();
}

StepOutcome Engine::fault(Status status) {
    state_.fault = status;
    state_.halted = true;
    return StepOutcome{StepStatus::Faulted, 0};
}

void Engine::advancePc() {
    ++state_.pc;
    if (state_.pc >= program_.size()) state_.halted = true;
}

StepOutcome Engine::step() {
    if (state_.fault != Status::Ok) return StepOutcome{StepStatus::Faulted, 0};
    if (state_.halted) return StepOutcome{StepStatus::Halted, 0};
    if (pendingInput) return StepOutcome{StepStatus::NeedsInput, 0};

    const instruction& ins = program_[state_.pc];
    Tape& tape = state_.tape;
    size_t& ptr = state_.pointer;
    switch (ins.op) {
        case Token::PTR_RGT:
            if (!tape.ensure(ptr + 1)) return fault(Status::TapeLimitExceeded);
            ++ptr;
            break;
        case Token::PTR_LFT:
            if (ptr > 0) {
                --ptr;
                break;
            }
            switch (cfg.pointerPolicy) {
                case PointerPolicy::Clamp:
                    break;
                case PointerPolicy::Fail:
                    return fault(Status::PointerUnderflow);
                case PointerPolicy::Wrap:
                    ptr = tape.size() - 1;
                    break;
            }
            break;
        case Token::ADD:
            tape[ptr] = static_cast<uint8_t>(tape[ptr] + 1);
            break;
        case Token::SUB:
            tape[ptr] = static_cast<uint8_t>(tape[ptr] - 1);
            break;
        case Token::PUT_CHR: {
            const uint8_t byte = tape[ptr];
            advancePc();
            return StepOutcome{StepStatus::ProducedOutput, byte};
        }
        case Token::RAD_CHR:
            pendingInput = true;
            return StepOutcome{StepStatus::NeedsInput, 0};
        case Token::JMP_ZER:
            if (!tape[ptr]) {
                // Lands on the instruction after the matching ']', which may be the end.
                state_.pc = ins.partner;
                advancePc();
                return StepOutcome{};
            }
            break;
        case Token::JMP_NOT_ZER:
            if (tape[ptr]) {
                state_.pc = ins.partner;
                advancePc();
                return StepOutcome{};
            }
            break;
    }
    advancePc();
    return StepOutcome{};
}

void Engine::feed(std::optional<uint8_t> byte) {
    if (!pendingInput) return;
    pendingInput = false;
    uint8_t& cell = state_.tape[state_.pointer];
    if (byte) {
        cell = *byte;
    } else {
        switch (cfg.eof) {
            case 0:
                break;
            case 1:
                cell = 0;
                break;
            default:
                cell = 255;
                break;
        }
    }
    advancePc();
}

StepOutcome advance(Engine& engine, InputSource& in, std::ostream& out) {
    const StepOutcome outcome = engine.step();
    if (outcome.status == StepStatus::NeedsInput) {
        engine.feed(in.next());
    } else if (outcome.status == StepStatus::ProducedOutput) {
        out.put(static_cast<char>(outcome.byte));
    }
    return outcome;
}

Status run(Engine& engine, InputSource& in, std::ostream& out, ProfileInfo* profile,
           Diagnostic* diag) {
    const auto start = std::chrono::steady_clock::now();
    std::uint64_t executed = 0;
    while (!engine.halted()) {
        const StepOutcome outcome = advance(engine, in, out);
        if (outcome.status == StepStatus::Faulted || outcome.status == StepStatus::Halted) break;
        ++executed;
    }
    out.flush();
    const ExecutionState& st = engine.state();
    if (profile) {
        profile->instructions = executed;
        profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        profile->tapeCells = st.tape.size();
    }
    if (diag && st.fault != Status::Ok) {
        diag->status = st.fault;
        diag->pc = st.pc;
        diag->offset = engine.program()[st.pc].srcPos;
    }
    return st.fault;
}

Status execute(std::string_view code, std::vector<uint8_t>& cells, size_t& cellPtr,
               const EngineConfig& cfg, ProfileInfo* profile, Diagnostic* diag) {
    Program program;
    const Status parsed = assemble(code, program, diag);
    if (parsed != Status::Ok) return parsed;
    if (cells.empty()) cells.assign(cfg.tapeSize, 0);
    Engine engine(std::move(program), std::move(cells), cellPtr, cfg);
    StreamInput in(std::cin);
    const Status ret = run(engine, in, std::cout, profile, diag);
    if (diag && ret != Status::Ok) locate(code, *diag);
    cells = engine.releaseCells(cellPtr);
    return ret;
}
}  // namespace bfstep
