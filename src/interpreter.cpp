#include "interpreter.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <span>
#include "file_reader.hpp"
#include "pattern.hpp"

static int hex_digit(int ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

static const char* encoding_name(Encoding e) { return e == Encoding::Hex ? "hex" : "ascii"; }

static std::string with_half(const char* name, Encoding enc, const std::optional<std::uint8_t>& half) {
  std::string out = std::string(name) + " (" + encoding_name(enc);
  if (half) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), ": %x...", *half >> 4);
    out += buf;
  }
  return out + ")";
}

Interpreter::Interpreter(SessionList& sessions) : sessions_(sessions) {
  if (sessions_.empty()) sessions_.open_scratch();
  register_commands();
}

void Interpreter::handle_key(const KeyEvent& ev) {
  if (should_quit_ || sessions_.empty()) return;
  if (std::holds_alternative<NormalMode>(mode_)) { handle_normal(ev); return; }
  if (auto* st = std::get_if<JumpToMode>(&mode_)) { handle_jump(*st, ev); return; }
  if (std::holds_alternative<SplitMode>(mode_)) { handle_split(ev); return; }
  if (auto* st = std::get_if<InsertMode>(&mode_)) { handle_insert(*st, ev); return; }
  if (auto* st = std::get_if<ReplaceMode>(&mode_)) { handle_replace(*st, ev); return; }
  if (auto* st = std::get_if<PatternMode>(&mode_)) { handle_pattern(*st, ev); return; }
  if (auto* st = std::get_if<CommandMode>(&mode_)) { handle_command(*st, ev); return; }
}

std::string Interpreter::mode_name() const {
  if (std::holds_alternative<NormalMode>(mode_)) {
    std::string c = count_.describe();
    return c.empty() ? "NORMAL" : "NORMAL (" + c + ")";
  }
  if (auto* st = std::get_if<JumpToMode>(&mode_)) return st->extend ? "EXTEND" : "JUMP";
  if (std::holds_alternative<SplitMode>(mode_)) {
    std::string c = count_.describe();
    return c.empty() ? "SPLIT" : "SPLIT (" + c + ")";
  }
  if (auto* st = std::get_if<InsertMode>(&mode_)) {
    return with_half(st->where == InsertPoint::Before ? "INSERT" : "APPEND", st->enc, st->hex_half);
  }
  if (auto* st = std::get_if<ReplaceMode>(&mode_)) return with_half("REPLACE", st->enc, st->hex_half);
  if (auto* st = std::get_if<PatternMode>(&mode_)) {
    const char* what = st->purpose == PatternPurpose::Split ? "SPLIT" :
                       st->purpose == PatternPurpose::SelectInSelections ? "SELECT" : "SEARCH";
    return std::string(what) + " (" + encoding_name(st->enc) + ")";
  }
  return "COMMAND";
}

std::optional<std::string> Interpreter::prompt_line(size_t& cursor_col) const {
  if (auto* st = std::get_if<CommandMode>(&mode_)) {
    cursor_col = 1 + st->cursor;
    return ":" + st->text;
  }
  if (auto* st = std::get_if<PatternMode>(&mode_)) {
    std::string label = std::string(encoding_name(st->enc)) + "> ";
    cursor_col = label.size() + st->cursor;
    return label + st->text;
  }
  return std::nullopt;
}

bool Interpreter::move_key(const KeyEvent& ev, size_t count, bool letters) {
  const auto row = static_cast<std::ptrdiff_t>(view_.bytes_per_line);
  std::ptrdiff_t unit = 0;
  bool extend = false;
  switch (ev.code) {
    case KeyCode::Left: unit = -1; break;
    case KeyCode::Right: unit = 1; break;
    case KeyCode::Up: unit = -row; break;
    case KeyCode::Down: unit = row; break;
    case KeyCode::Char:
      if (!letters || !ev.is_plain_char()) return false;
      switch (ev.ch) {
        case 'h': unit = -1; break;
        case 'l': unit = 1; break;
        case 'k': unit = -row; break;
        case 'j': unit = row; break;
        case 'H': unit = -1; extend = true; break;
        case 'L': unit = 1; extend = true; break;
        case 'K': unit = -row; extend = true; break;
        case 'J': unit = row; extend = true; break;
        default: return false;
      }
      break;
    default:
      return false;
  }
  Session& s = sessions_.current();
  const size_t len = s.buffer.length();
  // no move goes further than the buffer, so the product cannot overflow
  count = std::min(count, len + 1);
  set_selections(s.selections.move_by(unit * static_cast<std::ptrdiff_t>(count), extend, len));
  return true;
}

void Interpreter::set_selections(SelectionSet sels) {
  sessions_.current().selections = std::move(sels);
}

void Interpreter::apply_edit(const Snapshot& pre, EditResult result) {
  sessions_.current().apply(pre, std::move(result.buffer), std::move(result.selections));
}

void Interpreter::handle_normal(const KeyEvent& ev) {
  if (ev.code == KeyCode::Escape) { count_.reset(); return; }
  if (ev.is_plain_char()) {
    if (count_.consume_digit(ev.ch)) return;
    if (ev.ch == 'x') { count_.toggle_hex(); return; }
  }
  if (ev.code == KeyCode::Backspace && count_.has_count()) { count_.backspace(); return; }
  // the split prefix keeps the pending count for its width
  if (ev.is_alt('s')) { mode_ = SplitMode{}; return; }

  Session& s = sessions_.current();
  const size_t len = s.buffer.length();
  const bool counted = count_.has_count();
  const size_t count = count_.take(1);
  const size_t index = count > 0 ? count - 1 : 0;
  message_.clear();

  if (move_key(ev, count, true)) return;

  if (ev.is_alt(';')) { set_selections(s.selections.swap_ends()); return; }
  if (ev.is_alt(' ')) {
    EditError err;
    auto next = counted ? s.selections.drop_index(index, err) : s.selections.drop_main(err);
    if (!next) { report(err); return; }
    set_selections(std::move(*next));
    return;
  }
  if (!ev.is_plain_char()) return;

  switch (ev.ch) {
    case 'g':
    case 'G': {
      bool extend = ev.ch == 'G';
      if (counted) set_selections(s.selections.jump_to(count, extend, len));
      else mode_ = JumpToMode{extend};
    } break;
    case ';': set_selections(s.selections.collapse_to_cursor()); break;
    case '%': set_selections(s.selections.select_all(len)); break;
    case ' ': set_selections(counted ? s.selections.keep_index(index) : s.selections.keep_only_main()); break;
    case '(': set_selections(s.selections.cycle_main(Direction::Backward, count)); break;
    case ')': set_selections(s.selections.cycle_main(Direction::Forward, count)); break;
    case 's': mode_ = PatternMode{Encoding::Ascii, PatternPurpose::SelectInSelections, {}, 0}; break;
    case 'S': mode_ = PatternMode{Encoding::Hex, PatternPurpose::SelectInSelections, {}, 0}; break;
    case '/': mode_ = PatternMode{Encoding::Ascii, PatternPurpose::SelectInBuffer, {}, 0}; break;
    case '?': mode_ = PatternMode{Encoding::Hex, PatternPurpose::SelectInBuffer, {}, 0}; break;
    case 'd': delete_selected(); break;
    case 'y': yank_selected(); break;
    case 'c': enter_change(Encoding::Ascii); break;
    case 'C': enter_change(Encoding::Hex); break;
    case 'p': paste(InsertPoint::After, count); break;
    case 'P': paste(InsertPoint::Before, count); break;
    case 'i': enter_insert(Encoding::Ascii, InsertPoint::Before); break;
    case 'I': enter_insert(Encoding::Hex, InsertPoint::Before); break;
    case 'a': enter_insert(Encoding::Ascii, InsertPoint::After); break;
    case 'A': enter_insert(Encoding::Hex, InsertPoint::After); break;
    case 'r': enter_replace(Encoding::Ascii); break;
    case 'R': enter_replace(Encoding::Hex); break;
    case 'M': measure(); break;
    case 'u': undo(std::max<size_t>(count, 1)); break;
    case 'U': redo(std::max<size_t>(count, 1)); break;
    case ':': mode_ = CommandMode{}; break;
    default: break;
  }
}

void Interpreter::handle_jump(JumpToMode st, const KeyEvent& ev) {
  mode_ = NormalMode{};
  if (!ev.is_plain_char()) return;
  Session& s = sessions_.current();
  const size_t len = s.buffer.length();
  const size_t bpl = view_.bytes_per_line;
  auto jump_each = [&](auto target) {
    set_selections(s.selections.map([&](const Selection& sel) {
      size_t c = std::min(target(sel.cursor), len);
      return std::vector<Selection>{st.extend ? Selection(std::min(sel.anchor, len), c) : Selection(c, c)};
    }));
  };
  switch (ev.ch) {
    case 'h': jump_each([bpl](size_t cur) { return row_start(cur, bpl); }); break;
    case 'l': jump_each([bpl, len](size_t cur) { return row_end(cur, bpl, len); }); break;
    case 'k': set_selections(s.selections.jump_to(0, st.extend, len)); break;
    case 'j': set_selections(s.selections.jump_to(len > 0 ? len - 1 : 0, st.extend, len)); break;
    default: break;
  }
}

void Interpreter::handle_split(const KeyEvent& ev) {
  if (ev.code == KeyCode::Escape) { count_.reset(); mode_ = NormalMode{}; return; }
  if (ev.is_plain_char()) {
    if (count_.consume_digit(ev.ch)) return;
    if (ev.ch == 'x') { count_.toggle_hex(); return; }
  }
  if (ev.code == KeyCode::Backspace && count_.has_count()) { count_.backspace(); return; }

  const size_t typed = count_.take(1);
  mode_ = NormalMode{};
  if (!ev.is_plain_char()) return;
  Session& s = sessions_.current();
  // wider pieces or longer null runs than the buffer change nothing
  const size_t count = std::clamp<size_t>(typed, 1, s.buffer.length() + 1);
  size_t width = 0;
  switch (ev.ch) {
    case 'b': width = 1; break;
    case 'w': width = 2; break;
    case 'd': width = 4; break;
    case 'q': width = 8; break;
    case 'o': width = 16; break;
    case 'n': {
      EditError err;
      auto next = s.selections.split_null(count, s.buffer, err);
      if (!next) { report(err); return; }
      set_selections(std::move(*next));
    } return;
    case '/': mode_ = PatternMode{Encoding::Ascii, PatternPurpose::Split, {}, 0}; return;
    case '?': mode_ = PatternMode{Encoding::Hex, PatternPurpose::Split, {}, 0}; return;
    default: return;
  }
  set_selections(s.selections.split_width(width * count));
}

void Interpreter::delete_selected() {
  Session& s = sessions_.current();
  Snapshot pre = s.snapshot();
  registers_.write(HXV_DEFAULT_REGISTER, yank_selections(s.buffer, s.selections));
  apply_edit(pre, delete_selections(s.buffer, s.selections));
}

void Interpreter::yank_selected() {
  Session& s = sessions_.current();
  registers_.write(HXV_DEFAULT_REGISTER, yank_selections(s.buffer, s.selections));
  message_ = "yanked " + std::to_string(s.selections.size()) + " selection(s)";
}

void Interpreter::paste(InsertPoint where, size_t count) {
  const auto& entries = registers_.read(HXV_DEFAULT_REGISTER);
  if (entries.empty()) { message_ = "register is empty"; return; }
  Session& s = sessions_.current();
  if (!paste_size(s.selections, entries, count)) {
    message_ = "paste too large, lower the count";
    return;
  }
  Snapshot pre = s.snapshot();
  apply_edit(pre, paste_entries(s.buffer, s.selections, entries, where, count));
}

void Interpreter::enter_insert(Encoding enc, InsertPoint where) {
  Session& s = sessions_.current();
  s.history.begin_group(s.snapshot());
  mode_ = InsertMode{enc, where, std::nullopt};
}

void Interpreter::enter_change(Encoding enc) {
  Session& s = sessions_.current();
  Snapshot pre = s.snapshot();
  s.history.begin_group(pre);
  registers_.write(HXV_DEFAULT_REGISTER, yank_selections(s.buffer, s.selections));
  apply_edit(pre, delete_selections(s.buffer, s.selections));
  mode_ = InsertMode{enc, InsertPoint::Before, std::nullopt};
}

void Interpreter::enter_replace(Encoding enc) {
  Session& s = sessions_.current();
  s.history.begin_group(s.snapshot());
  mode_ = ReplaceMode{enc, std::nullopt};
}

void Interpreter::leave_edit_mode() {
  Session& s = sessions_.current();
  s.history.commit_group(s.snapshot());
  mode_ = NormalMode{};
}

void Interpreter::insert_typed(const InsertMode& st, std::uint8_t byte) {
  Session& s = sessions_.current();
  apply_edit(s.snapshot(), insert_bytes(s.buffer, s.selections, std::span<const std::uint8_t>(&byte, 1), st.where));
}

void Interpreter::handle_insert(InsertMode st, const KeyEvent& ev) {
  Session& s = sessions_.current();
  switch (ev.code) {
    case KeyCode::Escape:
      leave_edit_mode();
      return;
    case KeyCode::Backspace:
      if (st.hex_half) st.hex_half.reset();
      else apply_edit(s.snapshot(), erase_before(s.buffer, s.selections, st.where));
      mode_ = st;
      return;
    case KeyCode::Delete:
      apply_edit(s.snapshot(), erase_at(s.buffer, s.selections, st.where));
      return;
    case KeyCode::Left:
    case KeyCode::Right:
    case KeyCode::Up:
    case KeyCode::Down:
      st.hex_half.reset();
      move_key(ev, 1, false);
      mode_ = st;
      return;
    case KeyCode::Enter:
      if (st.enc == Encoding::Ascii) insert_typed(st, '\n');
      return;
    case KeyCode::Tab:
      if (st.enc == Encoding::Ascii) insert_typed(st, '\t');
      return;
    case KeyCode::Char:
      break;
    default:
      return;
  }
  if (ev.is_ctrl('o')) {
    st.enc = toggled(st.enc);
    st.hex_half.reset();
  } else if (ev.is_ctrl('n')) {
    st.hex_half.reset();
    insert_typed(st, 0);
  } else if (ev.is_plain_char()) {
    if (st.enc == Encoding::Ascii) {
      insert_typed(st, static_cast<std::uint8_t>(ev.ch));
    } else {
      int d = hex_digit(ev.ch);
      if (d < 0) {
        message_ = "not a hex digit";
      } else if (!st.hex_half) {
        st.hex_half = static_cast<std::uint8_t>(d << 4);
      } else {
        std::uint8_t b = static_cast<std::uint8_t>(*st.hex_half | d);
        st.hex_half.reset();
        insert_typed(st, b);
      }
    }
  }
  mode_ = st;
}

void Interpreter::handle_replace(ReplaceMode st, const KeyEvent& ev) {
  Session& s = sessions_.current();
  switch (ev.code) {
    case KeyCode::Escape:
      leave_edit_mode();
      return;
    case KeyCode::Left:
    case KeyCode::Right:
    case KeyCode::Up:
    case KeyCode::Down:
      // a half-typed byte pins the selections
      if (!st.hex_half) move_key(ev, 1, false);
      return;
    case KeyCode::Char:
      break;
    default:
      leave_edit_mode();
      return;
  }
  auto overwrite = [&](std::uint8_t b) {
    apply_edit(s.snapshot(), overwrite_selections(s.buffer, s.selections, b));
  };
  if (ev.is_ctrl('n')) {
    overwrite(0);
    leave_edit_mode();
    return;
  }
  if (ev.is_ctrl('o')) {
    st.enc = toggled(st.enc);
    st.hex_half.reset();
    mode_ = st;
    return;
  }
  if (!ev.is_plain_char()) { leave_edit_mode(); return; }
  if (st.enc == Encoding::Ascii) {
    overwrite(static_cast<std::uint8_t>(ev.ch));
    return;
  }
  int d = hex_digit(ev.ch);
  if (d < 0) { leave_edit_mode(); return; }
  if (!st.hex_half) {
    st.hex_half = static_cast<std::uint8_t>(d << 4);
  } else {
    overwrite(static_cast<std::uint8_t>(*st.hex_half | d));
    st.hex_half.reset();
  }
  mode_ = st;
}

/* shared line editing for the command and pattern prompts */
template <typename State>
static bool edit_prompt(State& st, const KeyEvent& ev) {
  switch (ev.code) {
    case KeyCode::Left:
      if (st.cursor > 0) st.cursor--;
      return true;
    case KeyCode::Right:
      if (st.cursor < st.text.size()) st.cursor++;
      return true;
    case KeyCode::Backspace:
      if (st.cursor > 0) { st.text.erase(st.cursor - 1, 1); st.cursor--; }
      return true;
    case KeyCode::Delete:
      if (st.cursor < st.text.size()) st.text.erase(st.cursor, 1);
      return true;
    default:
      break;
  }
  if (ev.is_plain_char()) {
    st.text.insert(st.cursor, 1, static_cast<char>(ev.ch));
    st.cursor++;
    return true;
  }
  return false;
}

void Interpreter::handle_pattern(PatternMode st, const KeyEvent& ev) {
  if (ev.code == KeyCode::Escape) { mode_ = NormalMode{}; return; }
  if (ev.code == KeyCode::Enter) {
    EditError err;
    auto pattern = compile_pattern(st.text, st.enc, err);
    if (!pattern) { report(err); return; }
    mode_ = NormalMode{};
    if (!pattern->empty()) run_pattern(st, *pattern);
    return;
  }
  auto insert_text = [&st](const char* t) {
    std::string piece(t);
    st.text.insert(st.cursor, piece);
    st.cursor += piece.size();
  };
  if (ev.is_ctrl('w')) {
    insert_text(st.enc == Encoding::Hex ? "??" : "\\?");
  } else if (ev.is_ctrl('n')) {
    insert_text(st.enc == Encoding::Hex ? "00" : "\\x00");
  } else if (ev.is_ctrl('o')) {
    EditError err;
    auto pattern = compile_pattern(st.text, st.enc, err);
    if (!pattern) { report(err); return; }
    st.enc = toggled(st.enc);
    st.text = render_pattern(*pattern, st.enc);
    st.cursor = st.text.size();
  } else if (!edit_prompt(st, ev)) {
    return;
  }
  mode_ = st;
}

void Interpreter::run_pattern(const PatternMode& st, const Pattern& pattern) {
  Session& s = sessions_.current();
  const size_t len = s.buffer.length();
  EditError err;
  std::optional<SelectionSet> next;
  switch (st.purpose) {
    case PatternPurpose::SelectInSelections:
      next = s.selections.select_matching(pattern, s.buffer, s.selections.covered_ranges(len), err);
      break;
    case PatternPurpose::SelectInBuffer:
      next = s.selections.select_matching(pattern, s.buffer, ByteRange{0, len}, err);
      break;
    case PatternPurpose::Split:
      next = s.selections.split_pattern(pattern, s.buffer, err);
      break;
  }
  if (!next) { report(err); return; }
  message_ = std::to_string(next->size()) + " selection(s)";
  set_selections(std::move(*next));
}

void Interpreter::handle_command(CommandMode st, const KeyEvent& ev) {
  if (ev.code == KeyCode::Escape) { mode_ = NormalMode{}; return; }
  if (ev.code == KeyCode::Enter) {
    mode_ = NormalMode{};
    execute_command_line(st.text);
    return;
  }
  if (ev.code == KeyCode::Backspace && st.text.empty()) { mode_ = NormalMode{}; return; }
  if (edit_prompt(st, ev)) mode_ = st;
}

void Interpreter::undo(size_t count) {
  Session& s = sessions_.current();
  Snapshot cur = s.snapshot();
  size_t done = 0;
  while (done < count && s.history.undo(cur)) done++;
  if (done == 0) { message_ = "nothing left to undo"; return; }
  s.restore(cur);
}

void Interpreter::redo(size_t count) {
  Session& s = sessions_.current();
  Snapshot cur = s.snapshot();
  size_t done = 0;
  while (done < count && s.history.redo(cur)) done++;
  if (done == 0) { message_ = "nothing left to redo"; return; }
  s.restore(cur);
}

void Interpreter::measure() {
  const Session& s = sessions_.current();
  size_t n = s.selections.main().covered(s.buffer.length()).size();
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%zu = 0x%zx bytes", n, n);
  message_ = buf;
}

void Interpreter::load_rc(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return;
  std::vector<std::string> lines;
  std::string msg;
  if (!mmap_readlines(path, lines, msg)) { message_ = msg; return; }
  for (std::string s : lines) {
    auto isspace_fn = [](unsigned char c) { return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j - 1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s[0] == ':') s.erase(s.begin());
    execute_command_line(s);
  }
}
