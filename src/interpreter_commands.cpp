#include "interpreter.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <filesystem>

static bool parse_switch(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

void Interpreter::close_session(bool force) {
  EditError err;
  if (!sessions_.close_current(force, err)) { report(err); return; }
  if (sessions_.empty()) { should_quit_ = true; return; }
  const Session& s = sessions_.current();
  message_ = "now editing " + (s.path ? s.path->string() : std::string("[scratch]"));
}

void Interpreter::register_commands() {
  registry_.register_aliases({"q", "quit", "db", "delete-buffer"}, [this](const std::vector<std::string>&) {
    close_session(false);
  });
  registry_.register_aliases({"q!", "quit!", "db!", "delete-buffer!"}, [this](const std::vector<std::string>&) {
    close_session(true);
  });
  registry_.register_aliases({"w", "write"}, [this](const std::vector<std::string>& args) {
    std::string mm;
    std::optional<std::filesystem::path> target;
    if (!args.empty()) target = std::filesystem::path(args[0]);
    sessions_.write_current(target, mm);
    message_ = mm;
  });
  registry_.register_aliases({"wa", "write-all"}, [this](const std::vector<std::string>&) {
    std::string mm;
    sessions_.write_all(mm);
    message_ = mm;
  });
  registry_.register_command("wq", [this](const std::vector<std::string>& args) {
    std::string mm;
    std::optional<std::filesystem::path> target;
    if (!args.empty()) target = std::filesystem::path(args[0]);
    if (!sessions_.write_current(target, mm)) { message_ = mm; return; }
    message_ = mm;
    close_session(true);
  });
  registry_.register_aliases({"e", "edit"}, [this](const std::vector<std::string>& args) {
    if (args.empty()) { message_ = "edit: use :e <path>"; return; }
    std::string mm;
    sessions_.open(args[0], mm);
    message_ = mm;
  });
  registry_.register_aliases({"bn", "buffer-next"}, [this](const std::vector<std::string>&) {
    sessions_.next();
  });
  registry_.register_aliases({"bp", "buffer-prev"}, [this](const std::vector<std::string>&) {
    sessions_.prev();
  });
  registry_.register_command("set width", [this](const std::vector<std::string>& args) {
    if (args.empty()) { message_ = "set width: use :set width <bytes>"; return; }
    const std::string& s = args[0];
    bool ok = !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!ok) { message_ = "set width: width must be a number"; return; }
    size_t w = 0;
    try { w = std::stoul(s); } catch (const std::exception&) { message_ = "set width: invalid number"; return; }
    if (w < 1) { message_ = "set width: width must be >= 1"; return; }
    if (w > HXV_MAX_BYTES_PER_LINE) {
      message_ = "set width: width must be <= " + std::to_string(HXV_MAX_BYTES_PER_LINE);
      return;
    }
    view_.bytes_per_line = w;
    message_ = "width=" + std::to_string(w);
  });
  registry_.register_command("set ascii", [this](const std::vector<std::string>& args) {
    if (!parse_switch(args, view_.show_ascii, view_.show_ascii)) { message_ = "set ascii: use :set ascii on|off"; return; }
    message_ = view_.show_ascii ? "ascii on" : "ascii off";
  });
  registry_.register_command("set offsets", [this](const std::vector<std::string>& args) {
    if (!parse_switch(args, view_.show_offsets, view_.show_offsets)) { message_ = "set offsets: use :set offsets on|off"; return; }
    message_ = view_.show_offsets ? "offsets on" : "offsets off";
  });
}

void Interpreter::execute_command_line(const std::string& line) {
  std::string unknown;
  if (!registry_.run_line(line, unknown)) message_ = "unknown command: " + unknown;
}
