#include "ncurses_terminal.hpp"
#include "config.hpp"

NcursesTerminal::NcursesTerminal() {
  if (!has_colors()) return;
  start_color();
  colors_ = true;
  if (use_default_colors() == OK) {
    init_pair(TF_COLOR_ACCENT, COLOR_YELLOW, -1);
    init_pair(TF_COLOR_DEFAULT, -1, -1);
    init_pair(TF_COLOR_MUTED, COLOR_BLUE, -1);
    init_pair(TF_COLOR_ERROR, COLOR_RED, -1);
    init_pair(TF_COLOR_SELECTED, COLOR_CYAN, -1);
  } else {
    init_pair(TF_COLOR_ACCENT, COLOR_YELLOW, COLOR_BLACK); // fallback
    init_pair(TF_COLOR_DEFAULT, COLOR_WHITE, COLOR_BLACK);
    init_pair(TF_COLOR_MUTED, COLOR_BLUE, COLOR_BLACK);
    init_pair(TF_COLOR_ERROR, COLOR_RED, COLOR_BLACK);
    init_pair(TF_COLOR_SELECTED, COLOR_CYAN, COLOR_BLACK);
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

attr_t NcursesTerminal::attributes(const std::optional<Style>& style) const {
  attr_t attrs = A_NORMAL;
  int pair = style && style->color_pair > 0 ? style->color_pair : TF_COLOR_DEFAULT;
  if (colors_) attrs |= COLOR_PAIR(pair);
  if (style && style->reverse) attrs |= A_REVERSE;
  return attrs;
}

void NcursesTerminal::draw(int row, int col, const std::string& text, const std::optional<Style>& style) {
  attr_t attrs = attributes(style);
  attr_on(attrs, nullptr);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attr_off(attrs, nullptr);
}

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::set_cursor_visible(bool visible) {
  if (visible == cursor_visible_) return;
  curs_set(visible ? 1 : 0);
  cursor_visible_ = visible;
}

void NcursesTerminal::refresh() { ::refresh(); }
