#pragma once
/*
 * Terminal
 *
 * Purpose: RAII owner of the curses screen for the whole editor run.
 * Modes: raw (Ctrl-C/Ctrl-Z reach the interpreter as keys), noecho,
 *        keypad translation, nonl so Enter is never rewritten, and a short
 *        escape delay so a lone ESC is not mistaken for an Alt chord.
 * Note: restores the terminal in the destructor, rendering lives elsewhere.
 */
#ifndef NCURSES_NOMACROS
#define NCURSES_NOMACROS
#endif
#include <ncurses.h>
#include "config.hpp"

class Terminal {
public:
  explicit Terminal(int esc_delay_ms = HXV_ESC_DELAY_MS);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

private:
  int saved_cursor_ = ERR;
};
