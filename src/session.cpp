#include "session.hpp"
#include <system_error>

static std::string normalize_key(const std::filesystem::path& p) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(p, ec);
  if (ec) return p.lexically_normal().string();
  return abs.lexically_normal().string();
}

void Session::restore(const Snapshot& s) {
  buffer = s.buffer;
  selections = s.selections.clamped(buffer.length());
}

void Session::apply(const Snapshot& pre, ByteBuffer next, SelectionSet sels) {
  buffer = std::move(next);
  selections = std::move(sels);
  if (!history.grouping()) history.record(pre, snapshot());
}

SessionList::SessionList() = default;

std::optional<size_t> SessionList::find(const std::filesystem::path& path) const {
  std::string key = normalize_key(path);
  for (size_t i = 0; i < sessions_.size(); ++i) {
    if (sessions_[i].path && normalize_key(*sessions_[i].path) == key) return i;
  }
  return std::nullopt;
}

bool SessionList::open(const std::filesystem::path& path, std::string& msg) {
  if (auto idx = find(path)) {
    current_ = *idx;
    msg = "switched to " + path.string();
    return true;
  }
  Session s;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    msg = "new file: " + path.string();
  } else if (!ByteBuffer::from_file(path, s.buffer, msg)) {
    return false;
  }
  s.path = path;
  s.mark_saved();
  sessions_.push_back(std::move(s));
  current_ = sessions_.size() - 1;
  return true;
}

void SessionList::open_scratch() {
  sessions_.emplace_back();
  current_ = sessions_.size() - 1;
}

bool SessionList::close_current(bool force, EditError& err) {
  if (sessions_.empty()) return true;
  if (!force && current().dirty()) {
    err.kind = ErrorKind::DirtyBufferClose;
    err.message = "have unsaved changes, use :q! or :w";
    return false;
  }
  sessions_.erase(sessions_.begin() + static_cast<std::ptrdiff_t>(current_));
  if (current_ >= sessions_.size() && current_ > 0) current_ = sessions_.size() - 1;
  return true;
}

void SessionList::next() {
  if (sessions_.empty()) return;
  current_ = (current_ + 1) % sessions_.size();
}

void SessionList::prev() {
  if (sessions_.empty()) return;
  current_ = (current_ + sessions_.size() - 1) % sessions_.size();
}

bool SessionList::write_current(const std::optional<std::filesystem::path>& path, std::string& msg) {
  Session& s = current();
  std::optional<std::filesystem::path> target = path ? path : s.path;
  if (!target) { msg = "don't have path, use :w <path>"; return false; }
  if (!s.buffer.write_file(*target, msg)) return false;
  s.path = target;
  s.mark_saved();
  return true;
}

bool SessionList::write_all(std::string& msg) {
  size_t written = 0, skipped = 0;
  for (auto& s : sessions_) {
    if (!s.path) { skipped++; continue; }
    std::string m;
    if (!s.buffer.write_file(*s.path, m)) { msg = m; return false; }
    s.mark_saved();
    written++;
  }
  msg = "wrote " + std::to_string(written) + " buffer(s)";
  if (skipped) msg += ", " + std::to_string(skipped) + " without path";
  return true;
}
