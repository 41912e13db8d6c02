#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal on the ncurses stdscr; Style color pairs map onto the TF_COLOR_* pairs.
 * Note: requires an open Terminal session.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize getSize() const override;
  void draw(int row, int col, const std::string& text, const std::optional<Style>& style) override;
  void clear_to_eol(int row, int col) override;
  void move_cursor(int row, int col) override;
  void set_cursor_visible(bool visible) override;
  void refresh() override;
private:
  attr_t attributes(const std::optional<Style>& style) const;

  bool colors_ = false;
  bool cursor_visible_ = true;
};
