#include "renderer.hpp"
#include <algorithm>
#include <cstdio>

static constexpr int OFFSET_WIDTH = 10; // "0000abcd: "

int Renderer::hex_column(const ViewOptions& opts, size_t index_in_row) {
  return (opts.show_offsets ? OFFSET_WIDTH : 0) + static_cast<int>(index_in_row) * 3;
}

int Renderer::ascii_column(const ViewOptions& opts, size_t index_in_row) {
  return hex_column(opts, opts.bytes_per_line) + 1 + static_cast<int>(index_in_row);
}

std::string Renderer::status_text(const Session& session, const StatusInfo& status) {
  char pos[32];
  std::snprintf(pos, sizeof(pos), "0x%08zx", session.selections.main().cursor);
  std::string out = status.mode + "  ";
  out += session.path ? session.path->string() : std::string("[scratch]");
  if (session.dirty()) out += " [+]";
  if (status.session_count > 1) {
    out += "  (" + std::to_string(status.session_index + 1) + "/" + std::to_string(status.session_count) + ")";
  }
  out += "  ";
  out += pos;
  out += "  " + std::to_string(session.selections.size()) + " sel";
  if (!status.message.empty()) out += "  | " + status.message;
  return out;
}

void Renderer::render(ITerminal& term, const Session& session, Viewport& vp, const ViewOptions& opts,
                      const StatusInfo& status) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  const size_t bpl = std::max<size_t>(opts.bytes_per_line, 1);
  const size_t len = session.buffer.length();
  const auto& sels = session.selections.selections();
  const size_t main_idx = session.selections.main_index();
  const size_t max_text_rows = static_cast<size_t>(std::max(1, rows - 1));

  size_t main_row = session.selections.main().cursor / bpl;
  if (main_row < vp.top_row) vp.top_row = main_row;
  if (main_row >= vp.top_row + max_text_rows) vp.top_row = main_row - max_text_rows + 1;

  static const char* digits = "0123456789abcdef";
  int cursor_r = -1, cursor_c = -1;
  for (size_t i = 0; i < max_text_rows; ++i) {
    size_t start = (vp.top_row + i) * bpl;
    // rows run up to and including the one-past-end position
    if (start > len) break;
    int screen_row = static_cast<int>(i);
    if (opts.show_offsets) {
      char off[16];
      std::snprintf(off, sizeof(off), "%08zx: ", start);
      term.draw_text(screen_row, 0, off);
    }
    Bytes row_bytes = session.buffer.slice(ByteRange{start, std::min(start + bpl, len)});
    auto k = static_cast<size_t>(std::partition_point(sels.begin(), sels.end(),
        [start](const Selection& s) { return s.max() < start; }) - sels.begin());
    for (size_t j = 0; j < bpl; ++j) {
      size_t off = start + j;
      if (off > len) break;
      while (k < sels.size() && sels[k].max() < off) ++k;
      bool inside = k < sels.size() && sels[k].min() <= off;
      int pair = PAIR_PLAIN;
      if (inside) {
        if (sels[k].cursor == off) pair = PAIR_CURSOR;
        else pair = k == main_idx ? PAIR_MAIN_SELECTION : PAIR_SELECTION;
        if (k == main_idx && sels[k].cursor == off) { cursor_r = screen_row; cursor_c = hex_column(opts, j); }
      }
      if (off == len) {
        if (pair != PAIR_PLAIN) term.draw_colored(screen_row, hex_column(opts, j), "  ", pair);
        break;
      }
      std::uint8_t b = row_bytes[j];
      std::string cell{digits[b >> 4], digits[b & 0xf]};
      term.draw_colored(screen_row, hex_column(opts, j), cell, pair);
      if (opts.show_ascii) {
        char a = (b >= 0x20 && b < 0x7f) ? static_cast<char>(b) : '.';
        term.draw_colored(screen_row, ascii_column(opts, j), std::string(1, a), pair);
      }
    }
  }

  int status_row = rows - 1;
  if (status.prompt) {
    term.draw_text(status_row, 0, *status.prompt);
    term.clear_to_eol(status_row, static_cast<int>(status.prompt->size()));
    term.move_cursor(status_row, std::min(static_cast<int>(status.prompt_cursor), std::max(0, cols - 1)));
  } else {
    std::string line = status_text(session, status);
    if (static_cast<int>(line.size()) < cols) line.append(static_cast<size_t>(cols) - line.size(), ' ');
    term.draw_colored(status_row, 0, line.substr(0, static_cast<size_t>(std::max(0, cols))), PAIR_STATUS);
    if (cursor_r >= 0) term.move_cursor(cursor_r, cursor_c);
    else term.move_cursor(status_row, 0);
  }
  term.refresh();
}
