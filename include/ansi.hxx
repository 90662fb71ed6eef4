#pragma once
#include <ostream>
#include <string_view>

namespace bfstep::ansi {
inline constexpr std::string_view red{"\x1b[31m"};
inline constexpr std::string_view green{"\x1b[32m"};
inline constexpr std::string_view yellow{"\x1b[33m"};
inline constexpr std::string_view reset{"\x1b[0m"};
inline constexpr std::string_view underline{"\x1b[4m"};

// Stream manipulators for diagnostic prefixes: `std::cerr << ansi::error << "msg"`
inline std::ostream& error(std::ostream& out) { return out << red << "ERROR:" << reset << ' '; }
inline std::ostream& warning(std::ostream& out) {
    return out << yellow << "WARNING:" << reset << ' ';
}
}  // namespace bfstep::ansi
