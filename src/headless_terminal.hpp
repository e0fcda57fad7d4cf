#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests; records the drawn grid, the
 *          color pair of each cell and the final cursor position.
 */
#include <algorithm>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols)
      : rows_(rows), cols_(cols),
        text_(rows, std::string(cols, ' ')),
        colors_(rows, std::vector<int>(cols, PAIR_PLAIN)) {}

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override {
    for (auto& line : text_) line.assign(cols_, ' ');
    for (auto& line : colors_) line.assign(cols_, PAIR_PLAIN);
  }
  void draw_text(int row, int col, const std::string& text) override { put(row, col, text, PAIR_PLAIN); }
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override {
    put(row, col, text, color_pair_id);
  }
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override {
    if (row < 0 || row >= rows_) return;
    for (int c = std::max(col, 0); c < cols_; ++c) { text_[row][c] = ' '; colors_[row][c] = PAIR_PLAIN; }
  }

  const std::string& line(int row) const { return text_[row]; }
  int color_at(int row, int col) const { return colors_[row][col]; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refreshes() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text, int pair) {
    if (row < 0 || row >= rows_) return;
    for (size_t i = 0; i < text.size(); ++i) {
      int c = col + static_cast<int>(i);
      if (c < 0 || c >= cols_) continue;
      text_[row][c] = text[i];
      colors_[row][c] = pair;
    }
  }

  int rows_;
  int cols_;
  std::vector<std::string> text_;
  std::vector<std::vector<int>> colors_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refreshes_ = 0;
};
