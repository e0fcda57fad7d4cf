#include "registers.hpp"

const std::vector<Bytes>& RegisterStore::read(char name) const {
  static const std::vector<Bytes> empty;
  auto it = regs_.find(name);
  return it == regs_.end() ? empty : it->second;
}

const Bytes& RegisterStore::entry_for(const std::vector<Bytes>& entries, size_t i) {
  if (entries.size() == 1) return entries.front();
  return entries[i % entries.size()];
}
