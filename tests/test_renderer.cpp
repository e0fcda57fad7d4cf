#include "renderer.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>

static Bytes counting(size_t n) {
  Bytes b(n);
  for (size_t i = 0; i < n; ++i) b[i] = static_cast<std::uint8_t>(i);
  return b;
}

int main() {
  Renderer r;
  ViewOptions opts;
  StatusInfo status;
  status.mode = "NORMAL";

  // offsets, hex cells, ascii column and selection colors
  {
    Bytes bytes = counting(20);
    bytes[3] = 'A';
    Session s;
    s.buffer = ByteBuffer::from_bytes(bytes);
    s.saved = s.buffer;
    s.selections = SelectionSet({Selection(1, 2), Selection(17, 17)}, 0);
    HeadlessTerminal term(5, 80);
    r.render(term, s, s.vp, opts, status);
    assert(term.line(0).substr(0, 10) == "00000000: ");
    assert(term.line(0).substr(Renderer::hex_column(opts, 1), 2) == "01");
    assert(term.line(0).substr(Renderer::hex_column(opts, 3), 2) == "41");
    assert(term.line(0)[Renderer::ascii_column(opts, 3)] == 'A');
    assert(term.line(0)[Renderer::ascii_column(opts, 0)] == '.');
    assert(term.line(1).substr(0, 12) == "00000010: 10");
    assert(term.color_at(0, Renderer::hex_column(opts, 0)) == PAIR_PLAIN);
    assert(term.color_at(0, Renderer::hex_column(opts, 1)) == PAIR_MAIN_SELECTION);
    assert(term.color_at(0, Renderer::hex_column(opts, 2)) == PAIR_CURSOR);
    assert(term.color_at(1, Renderer::hex_column(opts, 1)) == PAIR_CURSOR);
    assert(term.cursor_row() == 0 && term.cursor_col() == Renderer::hex_column(opts, 2));
    // rows past the end stay blank
    assert(term.line(2).find_first_not_of(' ') == std::string::npos);

    const std::string& st = term.line(4);
    assert(st.rfind("NORMAL  [scratch]", 0) == 0);
    assert(st.find("0x00000002") != std::string::npos);
    assert(st.find("2 sel") != std::string::npos);
    assert(st.find("[+]") == std::string::npos);
    assert(term.color_at(4, 0) == PAIR_STATUS);
    assert(term.refreshes() == 1);
  }

  // the one-past-end position is drawn only while selected
  {
    Session s;
    s.buffer = ByteBuffer::from_bytes(counting(20));
    s.selections = SelectionSet({Selection(20, 20)}, 0);
    HeadlessTerminal term(5, 80);
    r.render(term, s, s.vp, opts, status);
    assert(term.color_at(1, Renderer::hex_column(opts, 4)) == PAIR_CURSOR);
    assert(term.cursor_row() == 1 && term.cursor_col() == Renderer::hex_column(opts, 4));
    assert(term.line(4).find("[+]") != std::string::npos);
  }

  // the viewport follows the main cursor
  {
    Session s;
    s.buffer = ByteBuffer::from_bytes(counting(200));
    s.selections = SelectionSet({Selection(150, 150)}, 0);
    HeadlessTerminal term(5, 80);
    r.render(term, s, s.vp, opts, status);
    assert(s.vp.top_row == 6);
    assert(term.line(0).rfind("00000060: ", 0) == 0);
    assert(term.cursor_row() == 3);
    s.selections = SelectionSet({Selection(0, 0)}, 0);
    r.render(term, s, s.vp, opts, status);
    assert(s.vp.top_row == 0);
  }

  // display options and the prompt line
  {
    Session s;
    s.buffer = ByteBuffer::from_bytes(counting(8));
    ViewOptions narrow;
    narrow.bytes_per_line = 4;
    narrow.show_offsets = false;
    narrow.show_ascii = false;
    StatusInfo prompt = status;
    prompt.prompt = ":w out.bin";
    prompt.prompt_cursor = 10;
    HeadlessTerminal term(4, 40);
    r.render(term, s, s.vp, narrow, prompt);
    assert(term.line(0).rfind("00 01 02 03", 0) == 0);
    assert(term.line(1).rfind("04 05 06 07", 0) == 0);
    assert(term.line(0).find_first_not_of(' ', 12) == std::string::npos);
    assert(term.line(3).rfind(":w out.bin", 0) == 0);
    assert(term.cursor_row() == 3 && term.cursor_col() == 10);
  }
  return 0;
}
