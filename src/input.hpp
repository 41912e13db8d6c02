#pragma once
/*
 * Input
 *
 * Purpose: key events and input devices feeding the form driver.
 * Extend: IInputDevice decouples the driver from ncurses; ScriptedInput replays keys in tests.
 */
#include <deque>
#include <initializer_list>
#include <optional>
#include <string_view>

enum class KeyCode { Char, Enter, Tab, BackTab, Backspace, Delete, Left, Right, Up, Down, Home, End, Esc, CtrlC, Unknown };

struct Key {
  KeyCode code = KeyCode::Unknown;
  char32_t ch = 0; // valid for KeyCode::Char

  static Key of(KeyCode code) { return Key{code, 0}; }
  static Key character(char32_t ch) { return Key{KeyCode::Char, ch}; }
};

// Maps a byte/ncurses key code (as returned by getch) to a Key.
Key decode_key(int ch);

class IInputDevice {
public:
  virtual ~IInputDevice() = default;
  // nullopt: no more input will arrive
  virtual std::optional<Key> read_key() = 0;
};

class NcursesInput : public IInputDevice {
public:
  std::optional<Key> read_key() override;
};

class ScriptedInput : public IInputDevice {
public:
  ScriptedInput() = default;
  ScriptedInput(std::initializer_list<Key> keys) : keys_(keys) {}
  void push(const Key& key) { keys_.push_back(key); }
  void type(std::string_view text);
  std::size_t pending() const { return keys_.size(); }
  std::optional<Key> read_key() override;
private:
  std::deque<Key> keys_;
};
