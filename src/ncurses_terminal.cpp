#include "ncurses_terminal.hpp"

NcursesTerminal::NcursesTerminal() {
  colors_ = has_colors();
  if (colors_) {
    start_color();
    (void)use_default_colors();
    init_pair(PAIR_SELECTION, COLOR_BLACK, COLOR_CYAN);
    init_pair(PAIR_MAIN_SELECTION, COLOR_BLACK, COLOR_YELLOW);
    init_pair(PAIR_CURSOR, COLOR_WHITE, COLOR_RED);
    init_pair(PAIR_STATUS, COLOR_BLACK, COLOR_WHITE);
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (color_pair_id == PAIR_PLAIN) { draw_text(row, col, text); return; }
  // without colors every highlighted cell falls back to reverse video
  int attr = colors_ ? static_cast<int>(COLOR_PAIR(color_pair_id)) : static_cast<int>(A_REVERSE);
  if (color_pair_id == PAIR_CURSOR && !colors_) attr |= static_cast<int>(A_BOLD);
  attron(attr);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(attr);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

static KeyEvent decode(int ch) {
  switch (ch) {
    case KEY_LEFT: return KeyEvent::key(KeyCode::Left);
    case KEY_RIGHT: return KeyEvent::key(KeyCode::Right);
    case KEY_UP: return KeyEvent::key(KeyCode::Up);
    case KEY_DOWN: return KeyEvent::key(KeyCode::Down);
    case KEY_BACKSPACE: case 127: case 8: return KeyEvent::key(KeyCode::Backspace);
    case KEY_DC: return KeyEvent::key(KeyCode::Delete);
    case KEY_ENTER: case '\n': case '\r': return KeyEvent::key(KeyCode::Enter);
    case '\t': return KeyEvent::key(KeyCode::Tab);
    case 27: return KeyEvent::key(KeyCode::Escape);
    default: break;
  }
  if (ch == 0) return KeyEvent::ctrl_key(' ');
  if (ch >= 1 && ch <= 26) return KeyEvent::ctrl_key('a' + ch - 1);
  if (ch > 26 && ch <= 255) return KeyEvent::chr(ch);
  return KeyEvent::key(KeyCode::Unknown);
}

KeyEvent NcursesTerminal::read_key() {
  int ch = getch();
  if (ch != 27) return decode(ch);
  nodelay(stdscr, TRUE);
  int next = getch();
  nodelay(stdscr, FALSE);
  if (next == ERR) return KeyEvent::key(KeyCode::Escape);
  KeyEvent ev = decode(next);
  if (ev.code == KeyCode::Char) ev.alt = true;
  return ev;
}
