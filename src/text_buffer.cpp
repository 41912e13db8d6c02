#include "text_buffer.hpp"
#include <algorithm>
#include <numeric>
#include "utf8.hpp"

TextBuffer::TextBuffer(bool multi_line) : multi_line_(multi_line), lines_(1) {}

bool TextBuffer::empty() const { return lines_.size() == 1 && lines_[0].empty(); }

std::string TextBuffer::value() const {
  std::string out;
  for (std::size_t i = 0; i < lines_.size(); ++i) {
    if (i) out.push_back('\n');
    out += lines_[i];
  }
  return out;
}

void TextBuffer::set_value(const std::string& text) {
  lines_.clear();
  std::string cur;
  for (char c : text) {
    if (c == '\n' && multi_line_) { lines_.push_back(cur); cur.clear(); }
    else if (c != '\n') cur.push_back(c);
  }
  lines_.push_back(cur);
  layout_.clear();
  cur_.row = line_count() - 1;
  cur_.col = line_length(cur_.row);
}

void TextBuffer::set_cursor(Cursor cur) {
  cur_.row = std::clamp(cur.row, 0, line_count() - 1);
  cur_.col = std::clamp(cur.col, 0, line_length(cur_.row));
}

int TextBuffer::line_length(int row) const {
  return static_cast<int>(utf8_length(lines_[static_cast<std::size_t>(row)]));
}

bool TextBuffer::update(const Key& key) {
  Cursor before = cur_;
  std::string text_before;
  std::size_t lines_before = lines_.size();
  if (key.code != KeyCode::Char) text_before = value();
  switch (key.code) {
    case KeyCode::Char: insert_char(key.ch); return true;
    case KeyCode::Enter: if (multi_line_) split_line_at_cursor(); break;
    case KeyCode::Backspace: backspace(); break;
    case KeyCode::Delete: delete_char(); break;
    case KeyCode::Left: move_left(); break;
    case KeyCode::Right: move_right(); break;
    case KeyCode::Up: move_up(); break;
    case KeyCode::Down: move_down(); break;
    case KeyCode::Home: move_to_beginning_of_line(); break;
    case KeyCode::End: move_to_end_of_line(); break;
    default: return false;
  }
  return cur_.row != before.row || cur_.col != before.col || lines_.size() != lines_before || value() != text_before;
}

void TextBuffer::insert_char(char32_t ch) {
  std::string& s = lines_[static_cast<std::size_t>(cur_.row)];
  s.insert(utf8_byte_offset(s, static_cast<std::size_t>(cur_.col)), utf8_encode(ch));
  cur_.col++;
}

void TextBuffer::split_line_at_cursor() {
  std::string& s = lines_[static_cast<std::size_t>(cur_.row)];
  std::size_t at = utf8_byte_offset(s, static_cast<std::size_t>(cur_.col));
  std::string tail = s.substr(at);
  s.erase(at);
  lines_.insert(lines_.begin() + cur_.row + 1, tail);
  cur_.row++;
  cur_.col = 0;
}

void TextBuffer::backspace() {
  if (cur_.col > 0) {
    std::string& s = lines_[static_cast<std::size_t>(cur_.row)];
    std::size_t b = utf8_byte_offset(s, static_cast<std::size_t>(cur_.col - 1));
    std::size_t e = utf8_byte_offset(s, static_cast<std::size_t>(cur_.col));
    s.erase(b, e - b);
    cur_.col--;
    return;
  }
  if (cur_.row == 0) return;
  int prev_len = line_length(cur_.row - 1);
  lines_[static_cast<std::size_t>(cur_.row - 1)] += lines_[static_cast<std::size_t>(cur_.row)];
  lines_.erase(lines_.begin() + cur_.row);
  cur_.row--;
  cur_.col = prev_len;
}

void TextBuffer::delete_char() {
  if (cur_.col < line_length(cur_.row)) {
    std::string& s = lines_[static_cast<std::size_t>(cur_.row)];
    std::size_t b = utf8_byte_offset(s, static_cast<std::size_t>(cur_.col));
    std::size_t e = utf8_byte_offset(s, static_cast<std::size_t>(cur_.col + 1));
    s.erase(b, e - b);
    return;
  }
  if (cur_.row + 1 >= line_count()) return;
  lines_[static_cast<std::size_t>(cur_.row)] += lines_[static_cast<std::size_t>(cur_.row + 1)];
  lines_.erase(lines_.begin() + cur_.row + 1);
}

void TextBuffer::move_left() {
  if (cur_.col > 0) { cur_.col--; return; }
  if (cur_.row > 0) { cur_.row--; cur_.col = line_length(cur_.row); }
}

void TextBuffer::move_right() {
  if (cur_.col < line_length(cur_.row)) { cur_.col++; return; }
  if (cur_.row + 1 < line_count()) { cur_.row++; cur_.col = 0; }
}

void TextBuffer::move_to_beginning_of_line() { cur_.col = 0; }
void TextBuffer::move_to_end_of_line() { cur_.col = line_length(cur_.row); }

WrappedLine TextBuffer::rows_for(int row) const {
  int len = line_length(row);
  if (static_cast<std::size_t>(row) < layout_.size()) {
    const WrappedLine& wl = layout_[static_cast<std::size_t>(row)];
    std::size_t n = 0;
    for (const auto& r : wl) n += r.size();
    // stale after an edit; fall back to one unwrapped row
    if (!wl.empty() && static_cast<int>(n) == len) return wl;
  }
  return WrappedLine{std::vector<int>(static_cast<std::size_t>(len), 1)};
}

void TextBuffer::move_up() { move_vertical(-1); }
void TextBuffer::move_down() { move_vertical(1); }

void TextBuffer::move_vertical(int delta) {
  WrappedLine rows = rows_for(cur_.row);
  // locate the visual row and column of the cursor
  int start = 0;
  int k = 0;
  for (; k < static_cast<int>(rows.size()); ++k) {
    int n = static_cast<int>(rows[static_cast<std::size_t>(k)].size());
    bool last = k + 1 == static_cast<int>(rows.size());
    if (cur_.col < start + n || last) break;
    start += n;
  }
  const auto& here = rows[static_cast<std::size_t>(k)];
  int visual_col = std::accumulate(here.begin(), here.begin() + std::min<int>(cur_.col - start, static_cast<int>(here.size())), 0);

  int target_line = cur_.row;
  int target_k = k + delta;
  WrappedLine target_rows = rows;
  if (target_k < 0) {
    if (cur_.row == 0) return;
    target_line = cur_.row - 1;
    target_rows = rows_for(target_line);
    target_k = static_cast<int>(target_rows.size()) - 1;
  } else if (target_k >= static_cast<int>(rows.size())) {
    if (cur_.row + 1 >= line_count()) return;
    target_line = cur_.row + 1;
    target_rows = rows_for(target_line);
    target_k = 0;
  }

  int target_start = 0;
  for (int i = 0; i < target_k; ++i) target_start += static_cast<int>(target_rows[static_cast<std::size_t>(i)].size());
  const auto& widths = target_rows[static_cast<std::size_t>(target_k)];
  int offset = 0;
  int acc = 0;
  while (offset < static_cast<int>(widths.size()) && acc + widths[static_cast<std::size_t>(offset)] <= visual_col) {
    acc += widths[static_cast<std::size_t>(offset)];
    offset++;
  }
  // stay on this visual row: the slot past a wrapped row's end belongs to the next row
  bool last_row = target_k + 1 == static_cast<int>(target_rows.size());
  if (!last_row && offset == static_cast<int>(widths.size()) && offset > 0) offset--;
  cur_.row = target_line;
  cur_.col = target_start + offset;
}
