#pragma once
/*
 * Interpreter
 *
 * Purpose: modal key interpreter. Turns key events (plus typed counts and
 *          prefixes) into atomic edits on the current session.
 * Design: the mode is a std::variant; each handler works on a copy of its
 *         state and installs the next one. A failed command leaves buffer
 *         and selections untouched and sets `message`.
 * Ex commands: routed through CommandRegistry (interpreter_commands.cpp).
 */
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include "cmd_registry.hpp"
#include "input.hpp"
#include "key_event.hpp"
#include "operations.hpp"
#include "registers.hpp"
#include "session.hpp"
#include "types.hpp"

struct NormalMode {};
struct JumpToMode { bool extend = false; };
struct SplitMode {};
struct InsertMode {
  Encoding enc = Encoding::Ascii;
  InsertPoint where = InsertPoint::Before;
  std::optional<std::uint8_t> hex_half;
};
struct ReplaceMode {
  Encoding enc = Encoding::Ascii;
  std::optional<std::uint8_t> hex_half;
};
enum class PatternPurpose { SelectInSelections, SelectInBuffer, Split };
struct PatternMode {
  Encoding enc = Encoding::Ascii;
  PatternPurpose purpose = PatternPurpose::SelectInBuffer;
  std::string text;
  size_t cursor = 0;
};
struct CommandMode {
  std::string text;
  size_t cursor = 0;
};

using ModeState = std::variant<NormalMode, JumpToMode, SplitMode, InsertMode, ReplaceMode, PatternMode, CommandMode>;

class Interpreter {
public:
  explicit Interpreter(SessionList& sessions);

  void handle_key(const KeyEvent& ev);
  /* runs one Ex command line (without the leading ':') */
  void execute_command_line(const std::string& line);
  /* executes every non-comment line of an rc file as an Ex command */
  void load_rc(const std::filesystem::path& path);

  bool should_quit() const { return should_quit_; }
  const std::string& message() const { return message_; }
  void set_message(std::string m) { message_ = std::move(m); }
  const ModeState& mode() const { return mode_; }
  std::string mode_name() const;
  /* prompt text for the command/pattern line, with the cursor column */
  std::optional<std::string> prompt_line(size_t& cursor_col) const;
  const ViewOptions& view() const { return view_; }
  RegisterStore& registers() { return registers_; }
  SessionList& sessions() { return sessions_; }

private:
  void handle_normal(const KeyEvent& ev);
  void handle_jump(JumpToMode st, const KeyEvent& ev);
  void handle_split(const KeyEvent& ev);
  void handle_insert(InsertMode st, const KeyEvent& ev);
  void handle_replace(ReplaceMode st, const KeyEvent& ev);
  void handle_pattern(PatternMode st, const KeyEvent& ev);
  void handle_command(CommandMode st, const KeyEvent& ev);

  /* arrows always move; hjkl/HJKL only when letters is set */
  bool move_key(const KeyEvent& ev, size_t count, bool letters);
  void set_selections(SelectionSet sels);
  void apply_edit(const Snapshot& pre, EditResult result);
  void report(const EditError& err) { message_ = err.message; }

  void delete_selected();
  void yank_selected();
  void paste(InsertPoint where, size_t count);
  void enter_insert(Encoding enc, InsertPoint where);
  void enter_change(Encoding enc);
  void enter_replace(Encoding enc);
  void leave_edit_mode();
  void insert_typed(const InsertMode& st, std::uint8_t byte);
  void run_pattern(const PatternMode& st, const Pattern& pattern);
  void undo(size_t count);
  void redo(size_t count);
  void measure();

  void register_commands();
  void close_session(bool force);

  SessionList& sessions_;
  RegisterStore registers_;
  CommandRegistry registry_;
  CountInput count_;
  ModeState mode_ = NormalMode{};
  ViewOptions view_;
  std::string message_;
  bool should_quit_ = false;
};
