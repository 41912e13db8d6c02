#include "interface.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

Interface::Interface(ITerminal& term) : term_(term) {}

Line& Interface::add_line() {
  return insert_line(lines_.size());
}

Line& Interface::insert_line(std::size_t index) {
  if (index > lines_.size()) throw std::out_of_range("interface: insert line index " + std::to_string(index) + " out of range");
  auto it = lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(index),
                          std::make_unique<Line>(LineId{line_seq_.next()}, segment_seq_));
  return **it;
}

std::size_t Interface::require_index(LineId id) const {
  auto idx = get_line_index(id);
  if (!idx) throw std::out_of_range("interface: unknown line " + std::to_string(id.value));
  return *idx;
}

void Interface::remove_line(LineId id) {
  lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(require_index(id)));
}

void Interface::remove_line_at(std::size_t index) {
  if (index >= lines_.size()) throw std::out_of_range("interface: remove line index " + std::to_string(index) + " out of range");
  lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(index));
}

std::optional<std::size_t> Interface::get_line_index(LineId id) const {
  for (std::size_t i = 0; i < lines_.size(); ++i) {
    if (lines_[i]->identifier() == id) return i;
  }
  return std::nullopt;
}

const Line& Interface::get_line(LineId id) const { return *lines_[require_index(id)]; }
Line& Interface::get_line(LineId id) { return *lines_[require_index(id)]; }

const Line& Interface::line_at(std::size_t index) const {
  if (index >= lines_.size()) throw std::out_of_range("interface: line index " + std::to_string(index) + " out of range");
  return *lines_[index];
}

std::vector<const Line*> Interface::get_lines(const std::vector<LineId>& ids) const {
  std::vector<const Line*> out;
  out.reserve(ids.size());
  for (LineId id : ids) out.push_back(&get_line(id));
  return out;
}

std::vector<LineId> Interface::line_ids() const {
  std::vector<LineId> ids;
  ids.reserve(lines_.size());
  for (const auto& l : lines_) ids.push_back(l->identifier());
  return ids;
}

void Interface::move_segment(SegmentId segment, LineId from, LineId to) {
  Line& dst = get_line(to);
  dst.push_segment(get_line(from).take_segment(segment));
}

std::vector<const Line*> Interface::ordered_lines() const {
  std::vector<const Line*> out;
  out.reserve(lines_.size());
  for (const auto& l : lines_) out.push_back(l.get());
  return out;
}

bool Interface::apply_changes(InterfaceLayout& layout, std::string& msg) {
  TermSize sz = term_.getSize();
  int cols = sz.cols;
  if (max_width_ > 0) cols = std::min(cols, max_width_);
  if (cols <= 0 || sz.rows <= 0) {
    msg = "terminal reports no drawable area";
    return false;
  }
  auto lines = ordered_lines();
  layout = compute_layout(lines, cols);
  std::optional<Cursor> screen_cursor;
  if (cursor_) {
    screen_cursor = resolve_cursor(layout, *cursor_, cols);
    if (!screen_cursor) {
      msg = "cursor anchored to segment " + std::to_string(cursor_->segment.value) +
            " which is not on line " + std::to_string(cursor_->line.value);
      return false;
    }
  }
  renderer_.render(term_, layout, lines, screen_cursor);
  spdlog::trace("interface: painted {} lines in {} rows", lines.size(), layout.row_count());
  return true;
}

void Interface::advance_to_end() {
  term_.move_cursor(renderer_.end_row(term_), 0);
  term_.set_cursor_visible(true);
  term_.refresh();
}
