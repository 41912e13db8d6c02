#include "layout.hpp"
#include <algorithm>
#include <numeric>
#include "line.hpp"
#include "utf8.hpp"

int PartLayout::width() const { return std::accumulate(widths.begin(), widths.end(), 0); }

int SegmentLayout::char_count() const {
  int n = 0;
  for (const auto& p : parts) n += static_cast<int>(p.widths.size());
  return n;
}

int InterfaceLayout::row_count() const {
  if (lines.empty()) return 0;
  const auto& last = lines.back();
  return last.first_row + last.row_count;
}

InterfaceLayout compute_layout(const std::vector<const Line*>& lines, int cols) {
  InterfaceLayout out;
  int row = 0;
  for (const Line* line : lines) {
    LineLayout ll;
    ll.line_id = line->identifier();
    ll.first_row = row;
    int line_row = row;
    int col = 0;
    for (std::size_t s = 0; s < line->segment_count(); ++s) {
      const Segment& seg = line->segment_at(s);
      SegmentLayout sl;
      sl.segment_id = seg.identifier();
      PartLayout part{line_row, col, 0, {}};
      int idx = 0;
      for (char32_t cp : utf8_decode(seg.text())) {
        int w = utf8_char_width(cp);
        if (col + w > cols && col > 0) {
          if (!part.widths.empty()) sl.parts.push_back(part);
          ++line_row;
          col = 0;
          part = PartLayout{line_row, 0, idx, {}};
        }
        part.widths.push_back(w);
        col += w;
        ++idx;
      }
      sl.parts.push_back(std::move(part));
      ll.segments.push_back(std::move(sl));
    }
    ll.row_count = line_row - row + 1;
    row = line_row + 1;
    out.lines.push_back(std::move(ll));
  }
  return out;
}

std::optional<Cursor> resolve_cursor(const InterfaceLayout& layout, const RelativePosition& pos, int cols) {
  for (const auto& ll : layout.lines) {
    if (ll.line_id != pos.line) continue;
    for (const auto& sl : ll.segments) {
      if (sl.segment_id != pos.segment) continue;
      int offset = std::clamp(pos.offset, 0, sl.char_count());
      for (const auto& part : sl.parts) {
        int n = static_cast<int>(part.widths.size());
        if (offset < part.first_char + n) {
          int k = offset - part.first_char;
          return Cursor{part.row, part.col + std::accumulate(part.widths.begin(), part.widths.begin() + k, 0)};
        }
      }
      const PartLayout& last = sl.parts.back();
      Cursor c{last.row, last.col + last.width()};
      if (c.col >= cols) { c.row++; c.col = 0; }
      return c;
    }
    return std::nullopt;
  }
  return std::nullopt;
}

LayoutAccessor::LayoutAccessor(InterfaceLayout layout) : layout_(std::move(layout)) {}

const SegmentLayout* LayoutAccessor::get_segment(SegmentId id) const {
  for (const auto& ll : layout_.lines) {
    for (const auto& sl : ll.segments) {
      if (sl.segment_id == id) return &sl;
    }
  }
  return nullptr;
}
