#pragma once
/*
 * KeyEvent
 *
 * Purpose: decoded key press handed to the interpreter, independent of the
 *          terminal backend. Char carries one byte in `ch`.
 */

enum class KeyCode { Char, Escape, Enter, Tab, Backspace, Delete, Left, Right, Up, Down, Unknown };

struct KeyEvent {
  KeyCode code = KeyCode::Unknown;
  int ch = 0;
  bool ctrl = false;
  bool alt = false;

  static KeyEvent chr(int c) { return {KeyCode::Char, c, false, false}; }
  static KeyEvent ctrl_key(int c) { return {KeyCode::Char, c, true, false}; }
  static KeyEvent alt_key(int c) { return {KeyCode::Char, c, false, true}; }
  static KeyEvent key(KeyCode k) { return {k, 0, false, false}; }

  bool is_char(int c) const { return code == KeyCode::Char && !ctrl && !alt && ch == c; }
  bool is_plain_char() const { return code == KeyCode::Char && !ctrl && !alt; }
  bool is_ctrl(int c) const { return code == KeyCode::Char && ctrl && ch == c; }
  bool is_alt(int c) const { return code == KeyCode::Char && alt && ch == c; }
};
