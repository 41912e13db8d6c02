#include "headless_terminal.hpp"
#include <algorithm>
#include "utf8.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  clear();
}

void HeadlessTerminal::clear() {
  cells_.assign(static_cast<std::size_t>(rows_), std::vector<Cell>(static_cast<std::size_t>(cols_)));
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  clear();
}

void HeadlessTerminal::draw(int row, int col, const std::string& text, const std::optional<Style>& style) {
  draw_count_++;
  if (row < 0 || row >= rows_) return;
  auto& line = cells_[static_cast<std::size_t>(row)];
  for (char32_t cp : utf8_decode(text)) {
    int w = utf8_char_width(cp);
    if (col >= cols_) break;
    if (col >= 0) line[static_cast<std::size_t>(col)] = Cell{utf8_encode(cp), style};
    for (int k = 1; k < w && col + k < cols_; ++k) line[static_cast<std::size_t>(col + k)] = Cell{"", style};
    col += w;
  }
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  auto& line = cells_[static_cast<std::size_t>(row)];
  for (int c = std::max(0, col); c < cols_; ++c) line[static_cast<std::size_t>(c)] = Cell{};
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::string s;
  for (const auto& cell : cells_[static_cast<std::size_t>(row)]) s += cell.text;
  while (!s.empty() && s.back() == ' ') s.pop_back();
  return s;
}

std::vector<std::string> HeadlessTerminal::screen() const {
  std::vector<std::string> out;
  for (int r = 0; r < rows_; ++r) out.push_back(row_text(r));
  return out;
}

std::optional<Style> HeadlessTerminal::style_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return std::nullopt;
  return cells_[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)].style;
}
