#include "editor.hpp"
#include <cstdlib>
#include "config.hpp"

static SessionList open_all(const std::vector<std::filesystem::path>& files, std::string& message) {
  SessionList list;
  for (const auto& f : files) {
    std::string m;
    list.open(f, m);
    message = m;
  }
  if (list.empty()) list.open_scratch();
  return list;
}

Editor::Editor(const std::vector<std::filesystem::path>& files)
    : sessions_(open_all(files, startup_message_)), interp_(sessions_) {
  interp_.set_message(startup_message_);
  load_rc();
}

void Editor::load_rc() {
  const char* home = std::getenv("HOME");
  if (!home) return;
  interp_.load_rc(std::filesystem::path(home) / HXV_RC_FILE_NAME);
}

void Editor::run() {
  while (!interp_.should_quit()) {
    render();
    interp_.handle_key(term_.read_key());
  }
}

void Editor::render() {
  if (sessions_.empty()) return;
  StatusInfo status;
  status.mode = interp_.mode_name();
  status.message = interp_.message();
  status.prompt = interp_.prompt_line(status.prompt_cursor);
  status.session_index = sessions_.current_index();
  status.session_count = sessions_.size();
  Session& s = sessions_.current();
  renderer_.render(term_, s, s.vp, interp_.view(), status);
}
