#include "undo_manager.hpp"

void UndoManager::begin_group(const Snapshot& pre) {
  if (!grouping_) {
    grouping_ = true;
    current_.pre = pre;
  }
}

void UndoManager::commit_group(const Snapshot& post) {
  if (grouping_) {
    grouping_ = false;
    current_.post = post;
    // groups that never touched the bytes leave no history
    if (!current_.pre.buffer.same_version(post.buffer)) {
      undo_entries_.push_back(current_);
      redo_entries_.clear();
    }
    current_ = UndoEntry{};
  }
}

void UndoManager::record(const Snapshot& pre, const Snapshot& post) {
  begin_group(pre);
  commit_group(post);
}

void UndoManager::clear_redo() { redo_entries_.clear(); }
bool UndoManager::can_undo() const { return !undo_entries_.empty(); }
bool UndoManager::can_redo() const { return !redo_entries_.empty(); }

bool UndoManager::undo(Snapshot& cur) {
  if (undo_entries_.empty()) return false;
  UndoEntry e = undo_entries_.back();
  undo_entries_.pop_back();
  cur = e.pre;
  redo_entries_.push_back(std::move(e));
  return true;
}

bool UndoManager::redo(Snapshot& cur) {
  if (redo_entries_.empty()) return false;
  UndoEntry e = redo_entries_.back();
  redo_entries_.pop_back();
  cur = e.post;
  undo_entries_.push_back(std::move(e));
  return true;
}
