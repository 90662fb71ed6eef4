#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bfstep {
enum class MemoryModel;

/// @brief Growable 8-bit cell tape. Cells past the current length read as zero once the tape
/// grows over them; growth never shrinks the tape.
class Tape {
   public:
    explicit Tape(size_t initialCells, MemoryModel model);
    explicit Tape(std::vector<uint8_t> cells, MemoryModel model);

    size_t size() const noexcept { return cells.size(); }
    uint8_t& operator[](size_t index) { return cells[index]; }
    uint8_t operator[](size_t index) const { return cells[index]; }
    const std::vector<uint8_t>& data() const noexcept { return cells; }
    MemoryModel model() const noexcept { return active; }

    /// @brief Makes `index` addressable, growing by the active memory model.
    /// @return false when that would exceed BFSTEP_TAPE_MAX_BYTES; the tape is unchanged then.
    bool ensure(size_t index);

    // Hands the cells back to the caller, leaving the tape empty.
    std::vector<uint8_t> release();

   private:
    std::vector<uint8_t> cells;
    MemoryModel requested;
    MemoryModel active;
    size_t fibA;
    size_t fibB;
};

MemoryModel chooseModel(size_t cellsNeeded);
}  // namespace bfstep
