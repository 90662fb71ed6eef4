#include "vm/input.hxx"

namespace bfstep {
std::optional<uint8_t> StreamInput::next() {
    char c;
    if (!in.get(c)) return std::nullopt;
    ++count;
    return static_cast<uint8_t>(c);
}

std::optional<uint8_t> StringInput::next() {
    if (pos >= text.size()) return std::nullopt;
    return static_cast<uint8_t>(text[pos++]);
}
}  // namespace bfstep
