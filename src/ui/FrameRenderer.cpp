#include "ui/FrameRenderer.hpp"
#include <algorithm>
#include <charconv>
#include <cstring>

using tally::model::NodeIndex;

namespace tally::ui {

namespace {

// Bounded writer over the caller's buffer. Once something does not fit the
// buffer is marked full and every later put fails.
struct DrawBuffer {
  char* data;
  size_t limit;
  size_t pos{0};
  bool full{false};

  bool put(std::string_view s) {
    if (full || s.size() > limit - pos) { full = true; return false; }
    std::memcpy(data + pos, s.data(), s.size());
    pos += s.size();
    return true;
  }
  bool put(char c) { return put(std::string_view(&c, 1)); }
};

// Visible-column accounting for one line.
struct LineWriter {
  DrawBuffer& out;
  uint16_t cols;
  int visible{0};
  bool clipped{false};

  bool fits(int w) const { return cols == 0 || visible + w <= cols; }

  void glyph(std::string_view g) {
    if (clipped) return;
    if (!fits(kGlyphCols)) { clipped = true; return; }
    if (out.put(g)) visible += kGlyphCols;
  }

  void text(std::string_view s) {
    for (char c : s) {
      if (clipped) return;
      const auto uc = static_cast<unsigned char>(c);
      // UTF-8 continuation bytes share the column of their lead byte.
      const int w = (uc & 0xC0) == 0x80 ? 0 : 1;
      if (!fits(w)) { clipped = true; return; }
      // Control bytes would break the line count.
      if (uc < 0x20 || uc == 0x7F) c = ' ';
      if (!out.put(c)) return;
      visible += w;
    }
  }

  void number(uint32_t v) {
    char tmp[16];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), v);
    text(std::string_view(tmp, static_cast<size_t>(end - tmp)));
  }
};

constexpr size_t kFrameOverhead =
    kBeginSync.size() + 1 + kEraseBelow.size() + kEndSync.size();

} // namespace

FrameRenderer::FrameRenderer(size_t capacity) : has_more_(capacity + 1, 0) {
  stack_.reserve(capacity + 1);
}

size_t FrameRenderer::compose(const model::FrameSnapshot& snapshot, std::span<char> buf, TermSize size) {
  const size_t reserve = std::min(buf.size(), kEndSync.size());
  DrawBuffer out{buf.data(), buf.size() - reserve};

  // Strategy: keep the cursor below the frame; each redraw returns to column
  // zero, moves up over the previous frame, erases to the end of the screen
  // and writes the new frame.
  (void)out.put(kBeginSync);
  const size_t prev_lines = newline_count_;
  newline_count_ = 0;
  if (prev_lines > 0) {
    (void)out.put('\r');
    for (size_t n = 0; n < prev_lines; ++n) (void)out.put(kUpOneLine);
  }
  (void)out.put(kEraseBelow);

  // Bound the line count so the next preamble fits the same buffer, and so
  // the frame never scrolls the screen.
  size_t max_lines = buf.size() > kFrameOverhead ? (buf.size() - kFrameOverhead) / (kUpOneLine.size() + 1) : 0;
  if (size.rows > 0) max_lines = std::min<size_t>(max_lines, size.rows - 1u);

  stack_.clear();
  if (!snapshot.empty()) stack_.push_back(Pending{NodeIndex(0), 0});

  while (!stack_.empty() && !out.full && newline_count_ < max_lines) {
    const Pending cur = stack_.back();
    stack_.pop_back();
    const size_t idx = cur.node.get();
    if (cur.depth >= has_more_.size()) continue;
    const auto& node = snapshot.nodes[idx];
    const auto& links = snapshot.links[idx];
    has_more_[cur.depth] = links.next_sibling.has_value();

    LineWriter line{out, size.cols};
    for (uint32_t d = 1; d < cur.depth; ++d) line.glyph(has_more_[d] ? kTreeLine : kTreeBlank);
    if (cur.depth > 0) line.glyph(has_more_[cur.depth] ? kTreeTee : kTreeElbow);

    const std::string_view name = node.name_view();
    const uint32_t completed = node.completed_count;
    const uint32_t total = node.estimated_total_count;
    const bool counted = total > 0 || completed > 0;
    if (total > 0) {
      line.text("["); line.number(completed); line.text("/"); line.number(total); line.text("]");
    } else if (completed > 0) {
      line.text("["); line.number(completed); line.text("]");
    }
    if (!name.empty()) {
      if (counted) line.text(" ");
      line.text(name);
    }

    if (!out.put('\n')) break;
    ++newline_count_;

    // Sibling below child: the child subtree is drawn first.
    if (links.next_sibling.has_value()) stack_.push_back(Pending{links.next_sibling.value(), cur.depth});
    if (links.first_child.has_value()) stack_.push_back(Pending{links.first_child.value(), cur.depth + 1});
  }

  out.limit = buf.size();
  out.full = false;
  (void)out.put(kEndSync);
  return out.pos;
}

size_t FrameRenderer::compose_clear(std::span<char> buf) {
  DrawBuffer out{buf.data(), buf.size()};
  if (newline_count_ > 0) {
    (void)out.put('\r');
    for (size_t n = 0; n < newline_count_; ++n) (void)out.put(kUpOneLine);
  }
  newline_count_ = 0;
  (void)out.put(kEraseBelow);
  return out.pos;
}

} // namespace tally::ui
