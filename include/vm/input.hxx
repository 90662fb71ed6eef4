#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace bfstep {

/// @brief Lazy, finite, non-restartable byte sequence feeding `,`.
class InputSource {
   public:
    virtual ~InputSource() = default;
    // std::nullopt once exhausted; the engine's EOF behaviour decides what the cell gets then
    virtual std::optional<uint8_t> next() = 0;
    virtual size_t consumed() const noexcept = 0;
    // Text the debugger can show around the read position. Empty when not known in advance.
    virtual std::string_view buffered() const noexcept { return {}; }
};

// Reads from a file or standard input as the program asks for bytes.
class StreamInput final : public InputSource {
   public:
    explicit StreamInput(std::istream& in) : in(in) {}
    std::optional<uint8_t> next() override;
    size_t consumed() const noexcept override { return count; }

   private:
    std::istream& in;
    size_t count = 0;
};

// A fixed string, consumed once front to back.
class StringInput final : public InputSource {
   public:
    explicit StringInput(std::string text) : text(std::move(text)) {}
    std::optional<uint8_t> next() override;
    size_t consumed() const noexcept override { return pos; }
    std::string_view buffered() const noexcept override { return text; }

   private:
    std::string text;
    size_t pos = 0;
};
}  // namespace bfstep
