#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register, parse and dispatch Ex commands.
 * Design: map name → handler (args vector). Long and short spellings
 *         register the same handler.
 * Parsing: words split on blanks; "set opt v", "set opt=v" and "set opt"
 *          all route to the handler named "set opt".
 */
#include <functional>
#include <initializer_list>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

struct ParsedCommand {
  std::string name;
  std::vector<std::string> args;
};

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;

  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  void register_aliases(std::initializer_list<const char*> names, const Handler& h) {
    for (const char* n : names) map_[n] = h;
  }

  static ParsedCommand parse(const std::string& line) {
    ParsedCommand out;
    std::istringstream iss(line);
    iss >> out.name;
    std::string a;
    while (iss >> a) out.args.push_back(a);
    if (out.name != "set" || out.args.empty()) return out;
    std::string opt = out.args.front();
    out.args.erase(out.args.begin());
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      std::string value = opt.substr(eq + 1);
      opt.resize(eq);
      if (!value.empty()) out.args.insert(out.args.begin(), value);
    }
    out.name = "set " + opt;
    return out;
  }

  /* false with `unknown` set when no handler matches; blank lines are a no-op */
  bool run_line(const std::string& line, std::string& unknown) const {
    ParsedCommand cmd = parse(line);
    if (cmd.name.empty()) return true;
    auto it = map_.find(cmd.name);
    if (it == map_.end()) { unknown = cmd.name; return false; }
    it->second(cmd.args);
    return true;
  }

private:
  std::unordered_map<std::string, Handler> map_;
};
