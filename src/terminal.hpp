#pragma once
/*
 * Terminal
 *
 * Purpose: ncurses session for one form run. open() switches the tty into raw/noecho/keypad mode,
 *          close() (or the destructor) restores it so the form's output stays on screen.
 * Errors: open() returns false with msg when the tty cannot be initialized (no TERM, not a tty).
 */
#include <string>
#include <ncurses.h>

class Terminal {
public:
  Terminal() = default;
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  bool open(std::string& msg);
  void close();
  bool is_open() const { return screen_ != nullptr; }

private:
  SCREEN* screen_ = nullptr;
};
