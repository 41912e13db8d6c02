#pragma once
/*
 * ITerminal
 *
 * Purpose: drawing surface the Renderer paints the form onto (styled runs, row clearing, cursor).
 * Goal: keep the form independent of ncurses so tests paint into a HeadlessTerminal.
 * Coordinates: rows are relative to the top of the visible form, columns to the left edge.
 */
#include <optional>
#include <string>
#include "types.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  // Paints text starting at (row, col); nullopt style means terminal defaults.
  virtual void draw(int row, int col, const std::string& text, const std::optional<Style>& style) = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void set_cursor_visible(bool visible) = 0;
  virtual void refresh() = 0;
};
