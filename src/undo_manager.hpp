#pragma once
#include <vector>
#include "byte_buffer.hpp"
#include "selection.hpp"

/* buffer versions are persistent, so a snapshot is two cheap handles */
struct Snapshot {
  ByteBuffer buffer;
  SelectionSet selections;
};

struct UndoEntry {
  Snapshot pre;
  Snapshot post;
};

class UndoManager {
public:
  void begin_group(const Snapshot& pre);
  bool grouping() const { return grouping_; }
  void commit_group(const Snapshot& post);
  /* begin + commit for single-step commands */
  void record(const Snapshot& pre, const Snapshot& post);
  void clear_redo();
  bool can_undo() const;
  bool can_redo() const;
  size_t undo_depth() const { return undo_entries_.size(); }
  bool undo(Snapshot& cur);
  bool redo(Snapshot& cur);

private:
  std::vector<UndoEntry> undo_entries_;
  std::vector<UndoEntry> redo_entries_;
  bool grouping_ = false;
  UndoEntry current_;
};
