#pragma once
/*
 * Renderer
 *
 * Purpose: paint an InterfaceLayout through ITerminal and manage viewport scrolling.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: only rows whose runs changed since the previous frame are redrawn.
 */
#include <optional>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "layout.hpp"
#include "types.hpp"

class Line;

struct FrameRun {
  int col = 0;
  int width = 0;
  std::string text;
  std::optional<Style> style;
};

class Renderer {
public:
  void render(ITerminal& term,
              const InterfaceLayout& layout,
              const std::vector<const Line*>& lines,
              const std::optional<Cursor>& cursor);
  // Screen row just below the form, clamped to the terminal.
  int end_row(const ITerminal& term) const;
  void invalidate();
  const Viewport& viewport() const { return vp_; }
private:
  Viewport vp_;
  int frame_rows_ = 0;
  int painted_cols_ = 0;
  std::vector<std::string> painted_;
};

std::vector<std::vector<FrameRun>> build_frame(const InterfaceLayout& layout, const std::vector<const Line*>& lines);
