#pragma once
/*
 * Session / SessionList
 *
 * Purpose: one open file (buffer version, selections, history, path) and
 *          the list of open sessions with a current one.
 * Dirty: the current buffer is not the version last loaded or saved.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "byte_buffer.hpp"
#include "selection.hpp"
#include "types.hpp"
#include "undo_manager.hpp"

struct Viewport {
  size_t top_row = 0;
};

struct Session {
  ByteBuffer buffer;
  SelectionSet selections;
  UndoManager history;
  std::optional<std::filesystem::path> path;
  ByteBuffer saved;
  Viewport vp;

  bool dirty() const { return !buffer.same_version(saved); }
  Snapshot snapshot() const { return Snapshot{buffer, selections}; }
  void restore(const Snapshot& s);
  /* installs a new version and records pre -> now in history */
  void apply(const Snapshot& pre, ByteBuffer next, SelectionSet sels);
  void mark_saved() { saved = buffer; }
};

class SessionList {
public:
  SessionList();

  /* opens path, or switches to it when already open; a missing file
   * starts an empty session bound to that path */
  bool open(const std::filesystem::path& path, std::string& msg);
  void open_scratch();

  Session& current() { return sessions_[current_]; }
  const Session& current() const { return sessions_[current_]; }
  size_t current_index() const { return current_; }
  size_t size() const { return sessions_.size(); }
  bool empty() const { return sessions_.empty(); }
  const Session& at(size_t i) const { return sessions_[i]; }

  /* false with DirtyBufferClose when dirty and not forced */
  bool close_current(bool force, EditError& err);
  void next();
  void prev();

  bool write_current(const std::optional<std::filesystem::path>& path, std::string& msg);
  bool write_all(std::string& msg);

private:
  std::optional<size_t> find(const std::filesystem::path& path) const;

  std::vector<Session> sessions_;
  size_t current_ = 0;
};
