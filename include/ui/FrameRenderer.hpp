#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
#include "model/FrameSnapshot.hpp"
#include "ui/Terminal.hpp"

namespace tally::ui {

// Control sequences
inline constexpr std::string_view kBeginSync = "\x1b[?2026h";
inline constexpr std::string_view kEndSync = "\x1b[?2026l";
inline constexpr std::string_view kUpOneLine = "\x1bM";
inline constexpr std::string_view kEraseBelow = "\x1b[J";

// DEC special graphics connectors, each three columns wide
inline constexpr std::string_view kTreeTee = "\x1b\x28\x30\x74\x71\x1b\x28\x42 ";   // ├─
inline constexpr std::string_view kTreeLine = "\x1b\x28\x30\x78\x1b\x28\x42  ";     // │
inline constexpr std::string_view kTreeElbow = "\x1b\x28\x30\x6d\x71\x1b\x28\x42 "; // └─
inline constexpr std::string_view kTreeBlank = "   ";
inline constexpr int kGlyphCols = 3;

// Minimum draw buffer accepted by the progress context.
inline constexpr size_t kMinDrawBuffer = 200;

// Turns a linked snapshot into one terminal write.
//
// The renderer keeps the cursor just below the last frame; every frame
// starts by moving back up over the lines the previous one emitted. Output
// never exceeds the given buffer. Space for the closing sync sequence is
// reserved, so a truncated frame still leaves the terminal usable.
class FrameRenderer {
public:
  explicit FrameRenderer(size_t capacity);

  // Snapshot must have links built. Returns the number of bytes written.
  [[nodiscard]] size_t compose(const model::FrameSnapshot& snapshot, std::span<char> buf, TermSize size);
  // Erases the previous frame. Returns the number of bytes written.
  [[nodiscard]] size_t compose_clear(std::span<char> buf);

  // Lines emitted by the last compose().
  [[nodiscard]] size_t newline_count() const { return newline_count_; }

private:
  struct Pending {
    model::NodeIndex node;
    uint32_t depth;
  };

  size_t newline_count_{0};
  std::vector<Pending> stack_;
  // has_more_[d]: the node currently open at depth d has a later sibling
  std::vector<uint8_t> has_more_;
};

} // namespace tally::ui
