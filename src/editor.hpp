#pragma once
/*
 * Editor
 *
 * Purpose: interactive shell: opens the sessions, loads ~/.hxvimrc, then
 *          loops render -> read key -> interpret until the last session
 *          closes.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "interpreter.hpp"
#include "ncurses_terminal.hpp"
#include "renderer.hpp"
#include "session.hpp"

class Editor {
public:
  explicit Editor(const std::vector<std::filesystem::path>& files);
  void run();

private:
  void render();
  void load_rc();

  std::string startup_message_;
  SessionList sessions_;
  Interpreter interp_;
  Renderer renderer_;
  NcursesTerminal term_;
};
