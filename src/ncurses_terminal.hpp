#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses, plus key decoding.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 * Keys: ESC followed by a key within ESCDELAY becomes an Alt chord;
 *       control letters arrive as ctrl + the lowercase letter.
 */
#include "iterminal.hpp"
#include "key_event.hpp"
#include "terminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  KeyEvent read_key();

private:
  bool colors_ = false;
};
