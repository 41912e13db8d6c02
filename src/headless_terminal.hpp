#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Records: a rows x cols grid of cells (text and style), cursor position/visibility, refresh and draw counts.
 * Note: a wide character fills its first cell and blanks the next.
 */
#include <optional>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "types.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override { return {rows_, cols_}; }
  void draw(int row, int col, const std::string& text, const std::optional<Style>& style) override;
  void move_cursor(int row, int col) override { cursor_ = Cursor{row, col}; }
  void set_cursor_visible(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { refresh_count_++; }
  void clear_to_eol(int row, int col) override;

  void resize(int rows, int cols);
  // Row contents with trailing blanks trimmed.
  std::string row_text(int row) const;
  std::vector<std::string> screen() const;
  // Style the cell was last painted with.
  std::optional<Style> style_at(int row, int col) const;
  Cursor cursor() const { return cursor_; }
  bool cursor_visible() const { return cursor_visible_; }
  int refresh_count() const { return refresh_count_; }
  int draw_count() const { return draw_count_; }
  void reset_counters() { refresh_count_ = 0; draw_count_ = 0; }

private:
  void clear();

  int rows_;
  int cols_;
  struct Cell {
    std::string text = " ";
    std::optional<Style> style;
  };
  std::vector<std::vector<Cell>> cells_;
  Cursor cursor_{};
  bool cursor_visible_ = true;
  int refresh_count_ = 0;
  int draw_count_ = 0;
};
