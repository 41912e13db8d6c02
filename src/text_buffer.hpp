#pragma once
/*
 * TextBuffer
 *
 * Purpose: editable text of an input element: UTF-8 lines plus a cursor, driven by Key events.
 * Layout: set_layout() receives the wrapped rows of each line (per-character widths) from the
 *         last paint; Up/Down move between those visual rows keeping the visual column.
 * Note: single-line buffers ignore Enter; the buffer always holds at least one line.
 */
#include <string>
#include <utility>
#include <vector>
#include "input.hpp"
#include "types.hpp"

// Widths of the characters on each screen row one text line wrapped into.
using WrappedLine = std::vector<std::vector<int>>;

class TextBuffer {
public:
  explicit TextBuffer(bool multi_line = false);

  bool multi_line() const { return multi_line_; }
  bool empty() const;
  int line_count() const { return static_cast<int>(lines_.size()); }
  const std::string& line(int r) const { return lines_.at(static_cast<std::size_t>(r)); }
  const std::vector<std::string>& lines() const { return lines_; }
  std::string value() const;
  void set_value(const std::string& text);

  // row: line index, col: character index within the line
  Cursor cursor() const { return cur_; }
  void set_cursor(Cursor cur);

  void set_layout(std::vector<WrappedLine> layout) { layout_ = std::move(layout); }

  // Returns whether text or cursor changed.
  bool update(const Key& key);

  void insert_char(char32_t ch);
  void split_line_at_cursor();
  void backspace();
  void delete_char();
  void move_left();
  void move_right();
  void move_up();
  void move_down();
  void move_to_beginning_of_line();
  void move_to_end_of_line();

private:
  int line_length(int row) const;
  WrappedLine rows_for(int row) const;
  void move_vertical(int delta);

  bool multi_line_;
  std::vector<std::string> lines_;
  Cursor cur_{};
  std::vector<WrappedLine> layout_;
};
