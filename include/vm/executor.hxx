#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

#include "vm/memory.hxx"

namespace bfstep {
class InputSource;

struct EngineConfig {
    PointerPolicy pointerPolicy = PointerPolicy::Clamp;
    /// EOF behaviour. 0 = cell unchanged, 1 = set to 0, 2 = set to 255.
    int eof = BFSTEP_DEFAULT_EOF_BEHAVIOUR;
    size_t tapeSize = BFSTEP_DEFAULT_TAPE_SIZE;
    MemoryModel model = MemoryModel::Auto;
};

struct ExecutionState {
    Tape tape;
    size_t pointer = 0;
    size_t pc = 0;
    bool halted = false;
    Status fault = Status::Ok;
};

enum class StepStatus { Continued, Halted, NeedsInput, ProducedOutput, Faulted };

struct StepOutcome {
    StepStatus status = StepStatus::Continued;
    uint8_t byte = 0;  // set for ProducedOutput
};

class Engine {
   public:
    Engine(Program program, const EngineConfig& cfg = {});
    // Runs on caller-supplied cells, for example to continue on a tape left by an earlier run.
    Engine(Program program, std::vector<uint8_t> cells, size_t pointer, const EngineConfig& cfg);

    /// @brief Executes the instruction at the program counter. Never performs I/O: `.` yields
    /// ProducedOutput and `,` yields NeedsInput without moving the program counter until feed()
    /// completes it. A halted or faulted state is left alone.
    StepOutcome step();

    /// @brief Completes a pending `,`. std::nullopt applies the EOF behaviour. Ignored when no
    /// input is pending.
    void feed(std::optional<uint8_t> byte);

    void reset();

    bool halted() const noexcept { return state_.halted; }
    bool awaitingInput() const noexcept { return pendingInput; }
    const ExecutionState& state() const noexcept { return state_; }
    const Program& program() const noexcept { return program_; }
    const EngineConfig& config() const noexcept { return cfg; }

    // Hands the tape back; the engine must not be stepped afterwards.
    std::vector<uint8_t> releaseCells(size_t& pointer);

   private:
    StepOutcome fault(Status status);
    void advancePc();

    Program program_;
    EngineConfig cfg;
    ExecutionState state_;
    bool pendingInput = false;
};

/// @brief One step with its I/O resolved: input is pulled from `in`, output written to `out`.
StepOutcome advance(Engine& engine, InputSource& in, std::ostream& out);

/// @brief Steps until the program halts or faults.
/// @return Status::Ok or the fault. Instruction count, time and tape size go to `profile`.
Status run(Engine& engine, InputSource& in, std::ostream& out, ProfileInfo* profile = nullptr,
           Diagnostic* diag = nullptr);

/// @brief Assemble and run `code` against std::cin and std::cout.
/// @param cells Starting tape, replaced by the final tape. Empty gets the default size.
/// @param cellPtr Starting pointer, replaced by the final pointer.
/// @return Status::Ok, a parse error (nothing runs) or a runtime fault.
Status execute(std::string_view code, std::vector<uint8_t>& cells, size_t& cellPtr,
               const EngineConfig& cfg = {}, ProfileInfo* profile = nullptr,
               Diagnostic* diag = nullptr);
}  // namespace bfstep
