#include "terminal.hpp"
#include <clocale>
#include <cstdio>
#include <spdlog/spdlog.h>

Terminal::~Terminal() { close(); }

bool Terminal::open(std::string& msg) {
  if (screen_) return true;
  std::setlocale(LC_ALL, "");
  // newterm reports failure instead of exiting like initscr
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) {
    msg = "cannot initialize the terminal (is TERM set and stdout a tty?)";
    return false;
  }
  set_term(screen_);
  raw();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  spdlog::debug("terminal: opened {}x{}", LINES, COLS);
  return true;
}

void Terminal::close() {
  if (!screen_) return;
  endwin();
  delscreen(screen_);
  screen_ = nullptr;
  spdlog::debug("terminal: closed");
}
