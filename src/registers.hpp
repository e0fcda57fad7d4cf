#pragma once
/*
 * RegisterStore
 *
 * Purpose: named slots of yanked bytes, one entry per source selection.
 * Note: process lifetime only; unset registers read as empty.
 */
#include <unordered_map>
#include <vector>
#include "config.hpp"
#include "types.hpp"

class RegisterStore {
public:
  void write(char name, std::vector<Bytes> contents) { regs_[name] = std::move(contents); }
  const std::vector<Bytes>& read(char name) const;
  bool has(char name) const { return regs_.count(name) != 0; }

  /* entry used for selection i; entries must be non-empty */
  static const Bytes& entry_for(const std::vector<Bytes>& entries, size_t i);

private:
  std::unordered_map<char, std::vector<Bytes>> regs_;
};
