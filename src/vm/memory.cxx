#include "vm/memory.hxx"

#include <algorithm>
#include <utility>

#include "vm.hxx"

namespace bfstep {
namespace {
constexpr size_t PAGE_SIZE = 1u << 16;  // 64KB pages for paged growth
constexpr size_t MAX_CELLS = static_cast<size_t>(BFSTEP_TAPE_MAX_BYTES);
}  // namespace

MemoryModel chooseModel(size_t cellsNeeded) {
    if (cellsNeeded > (1u << 24)) return MemoryModel::Paged;
    if (cellsNeeded > (1u << 16)) return MemoryModel::Fibonacci;
    return MemoryModel::Contiguous;
}

Tape::Tape(size_t initialCells, MemoryModel model)
    : Tape(std::vector<uint8_t>(std::max<size_t>(initialCells, 1), 0), model) {}

Tape::Tape(std::vector<uint8_t> initial, MemoryModel model)
    : cells(std::move(initial)), requested(model), active(model) {
    // The data pointer starts on cell 0, so there is always at least one cell.
    if (cells.empty()) cells.resize(1, 0);
    if (requested == MemoryModel::Auto) active = chooseModel(cells.size());
    fibA = fibB = cells.size();
}

bool Tape::ensure(size_t index) {
    if (index < cells.size()) return true;
    if (index >= MAX_CELLS) return false;
    const size_t needed = index + 1;
    if (requested == MemoryModel::Auto) {
        const MemoryModel target = chooseModel(needed);
        if (target != active) {
            active = target;
            if (active == MemoryModel::Fibonacci) fibA = fibB = cells.size();
        }
    }
    size_t newSize = cells.size();
    switch (active) {
        case MemoryModel::Paged:
            newSize = ((needed + PAGE_SIZE - 1) / PAGE_SIZE) * PAGE_SIZE;
            break;
        case MemoryModel::Fibonacci:
            while (newSize < needed) {
                const size_t next = fibA + fibB;
                fibA = fibB;
                fibB = next;
                newSize = next;
            }
            break;
        default:
            while (newSize < needed) newSize *= 2;
            break;
    }
    cells.resize(std::min(newSize, MAX_CELLS), 0);
    return true;
}

std::vector<uint8_t> Tape::release() {
    std::vector<uint8_t> out;
    out.swap(cells);
    return out;
}
}  // namespace bfstep
