#include "input.hpp"
#include <ncurses.h>
#include "utf8.hpp"

Key decode_key(int ch) {
  switch (ch) {
    case '\n': case '\r': case KEY_ENTER: return Key::of(KeyCode::Enter);
    case '\t': return Key::of(KeyCode::Tab);
    case KEY_BTAB: return Key::of(KeyCode::BackTab);
    case KEY_BACKSPACE: case 127: case 8: return Key::of(KeyCode::Backspace);
    case KEY_DC: return Key::of(KeyCode::Delete);
    case KEY_LEFT: return Key::of(KeyCode::Left);
    case KEY_RIGHT: return Key::of(KeyCode::Right);
    case KEY_UP: return Key::of(KeyCode::Up);
    case KEY_DOWN: return Key::of(KeyCode::Down);
    case KEY_HOME: return Key::of(KeyCode::Home);
    case KEY_END: return Key::of(KeyCode::End);
    case 27: return Key::of(KeyCode::Esc);
    case 3: return Key::of(KeyCode::CtrlC);
    default: break;
  }
  if (ch >= 32 && ch < KEY_MIN) return Key::character(static_cast<char32_t>(ch));
  return Key::of(KeyCode::Unknown);
}

std::optional<Key> NcursesInput::read_key() {
  wint_t wch = 0;
  int rc = get_wch(&wch);
  if (rc == ERR) return std::nullopt;
  if (rc == KEY_CODE_YES || wch < 32 || wch == 127) return decode_key(static_cast<int>(wch));
  return Key::character(static_cast<char32_t>(wch));
}

void ScriptedInput::type(std::string_view text) {
  for (char32_t cp : utf8_decode(text)) {
    keys_.push_back(cp == U'\n' ? Key::of(KeyCode::Enter) : Key::character(cp));
  }
}

std::optional<Key> ScriptedInput::read_key() {
  if (keys_.empty()) return std::nullopt;
  Key k = keys_.front();
  keys_.pop_front();
  return k;
}
