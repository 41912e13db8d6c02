#include "renderer.hpp"
#include <algorithm>
#include <unordered_map>
#include "line.hpp"
#include "utf8.hpp"

std::vector<std::vector<FrameRun>> build_frame(const InterfaceLayout& layout, const std::vector<const Line*>& lines) {
  std::unordered_map<SegmentId, const Segment*> by_id;
  for (const Line* line : lines) {
    for (std::size_t i = 0; i < line->segment_count(); ++i) {
      const Segment& s = line->segment_at(i);
      by_id[s.identifier()] = &s;
    }
  }
  std::vector<std::vector<FrameRun>> rows(static_cast<std::size_t>(layout.row_count()));
  for (const auto& ll : layout.lines) {
    for (const auto& sl : ll.segments) {
      auto it = by_id.find(sl.segment_id);
      if (it == by_id.end()) continue;
      const Segment& seg = *it->second;
      for (const auto& part : sl.parts) {
        if (part.widths.empty()) continue;
        FrameRun run;
        run.col = part.col;
        run.width = part.width();
        run.text = utf8_substr(seg.text(), static_cast<std::size_t>(part.first_char), part.widths.size());
        run.style = seg.style();
        rows[static_cast<std::size_t>(part.row)].push_back(std::move(run));
      }
    }
  }
  return rows;
}

static std::string signature(const std::vector<FrameRun>& runs) {
  std::string sig;
  for (const auto& r : runs) {
    sig += std::to_string(r.col);
    if (r.style) sig += "|" + std::to_string(r.style->color_pair) + (r.style->reverse ? "r" : "");
    sig += ":";
    sig += r.text;
    sig.push_back('\x1f');
  }
  return sig;
}

void Renderer::render(ITerminal& term,
                      const InterfaceLayout& layout,
                      const std::vector<const Line*>& lines,
                      const std::optional<Cursor>& cursor) {
  TermSize sz = term.getSize();
  int rows = sz.rows;
  auto frame = build_frame(layout, lines);
  int total = static_cast<int>(frame.size());
  int top = vp_.top_line;
  if (cursor) {
    if (cursor->row < top) top = cursor->row;
    if (cursor->row >= top + rows) top = cursor->row - rows + 1;
  } else if (total > top + rows) {
    top = total - rows;
  }
  top = std::max(0, std::min(top, std::max(0, total - 1)));
  if (top != vp_.top_line) {
    vp_.top_line = top;
    invalidate();
  }
  // a resized terminal keeps nothing of the previous frame
  if (static_cast<int>(painted_.size()) != rows || sz.cols != painted_cols_) {
    painted_.assign(static_cast<std::size_t>(rows), std::string("\x1e"));
    painted_cols_ = sz.cols;
  }

  for (int i = 0; i < rows; ++i) {
    int frame_row = top + i;
    const std::vector<FrameRun> empty;
    const auto& runs = frame_row < total ? frame[static_cast<std::size_t>(frame_row)] : empty;
    // rows past the previous and current frame stay untouched
    if (frame_row >= total && frame_row >= frame_rows_) continue;
    std::string sig = signature(runs);
    if (painted_[static_cast<std::size_t>(i)] == sig) continue;
    int end_col = 0;
    for (const auto& run : runs) {
      term.draw(i, run.col, run.text, run.style);
      end_col = std::max(end_col, run.col + run.width);
    }
    term.clear_to_eol(i, end_col);
    painted_[static_cast<std::size_t>(i)] = std::move(sig);
  }
  frame_rows_ = total;

  if (cursor && cursor->row - top < rows) {
    term.move_cursor(cursor->row - top, std::min(cursor->col, sz.cols - 1));
    term.set_cursor_visible(true);
  } else {
    term.set_cursor_visible(false);
  }
  term.refresh();
}

int Renderer::end_row(const ITerminal& term) const {
  int rows = term.getSize().rows;
  return std::max(0, std::min(frame_rows_ - vp_.top_line, rows - 1));
}

void Renderer::invalidate() {
  for (auto& p : painted_) p = "\x1e";
}
