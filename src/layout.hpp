#pragma once
/*
 * Layout
 *
 * Purpose: post-paint geometry of the terminal buffer (which screen rows/columns each segment landed on).
 * Usage: Interface::apply_changes produces an InterfaceLayout; elements read it through LayoutAccessor
 *        to recompute wrap boundaries before their next render.
 */
#include <optional>
#include <vector>
#include "types.hpp"

class Line;

// One screen row's worth of a segment.
struct PartLayout {
  int row = 0;          // frame row, 0 = first row of the form
  int col = 0;
  int first_char = 0;   // index of the part's first character within the segment
  std::vector<int> widths;
  int width() const;
};

struct SegmentLayout {
  SegmentId segment_id;
  std::vector<PartLayout> parts;
  int char_count() const;
};

struct LineLayout {
  LineId line_id;
  int first_row = 0;
  int row_count = 1;
  std::vector<SegmentLayout> segments;
};

struct InterfaceLayout {
  std::vector<LineLayout> lines;
  int row_count() const;
};

InterfaceLayout compute_layout(const std::vector<const Line*>& lines, int cols);
// Screen position of a segment-relative cursor; nullopt when the segment is not on that line.
std::optional<Cursor> resolve_cursor(const InterfaceLayout& layout, const RelativePosition& pos, int cols);

class LayoutAccessor {
public:
  explicit LayoutAccessor(InterfaceLayout layout);
  const SegmentLayout* get_segment(SegmentId id) const;
  const InterfaceLayout& layout() const { return layout_; }
private:
  InterfaceLayout layout_;
};
