/*
    Bfstep - A stepping brainfuck VM and debugger
    Memory dump
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "ansi.hxx"

namespace bfstep {
/// @brief Prints the tape ten cells per row, up to the last non-zero cell or the pointer,
/// whichever is further. The pointer's cell is green.
inline void dumpMemory(const std::vector<uint8_t>& cells, size_t cellPtr, std::ostream& out) {
    if (cells.empty()) {
        out << "Memory dump:" << '\n' << "<empty>" << std::endl;
        return;
    }
    size_t lastNonEmpty = cells.size() - 1;
    while (lastNonEmpty > cellPtr && lastNonEmpty > 0 && !cells[lastNonEmpty]) {
        --lastNonEmpty;
    }
    out << "Memory dump:" << '\n'
        << ansi::underline << "row+col |0  |1  |2  |3  |4  |5  |6  |7  |8  |9  |" << ansi::reset
        << std::endl;
    size_t end = std::max(lastNonEmpty, std::min(cellPtr, cells.size() - 1));
    for (size_t i = 0, row = 0; i <= end; ++i) {
        if (i % 10 == 0) {
            if (row) out << std::endl;
            std::string rowStr = std::to_string(row);
            size_t rowPad = rowStr.length() < 8 ? 8 - rowStr.length() : 0;
            out << rowStr << std::string(rowPad, ' ') << "|";
            row += 10;
        }
        const auto& color = i == cellPtr ? ansi::green : ansi::reset;
        std::string cellStr = std::to_string(cells[i]);
        size_t cellPad = cellStr.length() < 3 ? 3 - cellStr.length() : 0;
        out << color << cellStr << ansi::reset << std::string(cellPad, ' ') << "|";
    }
    out << ansi::reset << std::endl;
}
}  // namespace bfstep
