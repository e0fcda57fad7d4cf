#include "operations.hpp"
#include <algorithm>
#include "config.hpp"
#include "registers.hpp"

namespace {

struct LocalEdit {
  ByteRange range;
  Bytes replacement;
  Selection after; /* position with only this edit applied */
};

template <typename Fn>
EditResult apply_local_edits(const ByteBuffer& buf, const SelectionSet& sels, Fn fn) {
  std::vector<LocalEdit> edits;
  edits.reserve(sels.size());
  for (size_t i = 0; i < sels.size(); ++i) edits.push_back(fn(sels[i], i, buf.length()));

  std::vector<Selection> remapped;
  remapped.reserve(edits.size());
  std::ptrdiff_t shift = 0;
  for (const auto& e : edits) {
    remapped.push_back(e.after.shifted(shift));
    shift += static_cast<std::ptrdiff_t>(e.replacement.size()) - static_cast<std::ptrdiff_t>(e.range.size());
  }

  ByteBuffer next = buf;
  for (auto it = edits.rbegin(); it != edits.rend(); ++it) {
    if (it->range.empty() && it->replacement.empty()) continue;
    next = next.splice(it->range, it->replacement);
  }
  size_t len = next.length();
  return EditResult{std::move(next), SelectionSet(std::move(remapped), sels.main_index()).clamped(len)};
}

size_t insertion_offset(const Selection& s, InsertPoint where, size_t len) {
  return where == InsertPoint::Before ? std::min(s.min(), len) : std::min(s.max() + 1, len);
}

/* [lo, hi] keeping the direction of s */
Selection oriented(size_t lo, size_t hi, const Selection& s) {
  return s.backward() ? Selection(hi, lo) : Selection(lo, hi);
}

} // namespace

std::vector<Bytes> yank_selections(const ByteBuffer& buf, const SelectionSet& sels) {
  std::vector<Bytes> out;
  out.reserve(sels.size());
  for (const auto& s : sels) out.push_back(buf.slice(s.covered(buf.length())));
  return out;
}

EditResult delete_selections(const ByteBuffer& buf, const SelectionSet& sels) {
  return apply_local_edits(buf, sels, [](const Selection& s, size_t, size_t len) {
    ByteRange cov = s.covered(len);
    if (cov.empty()) return LocalEdit{cov, {}, s};
    return LocalEdit{cov, {}, Selection(cov.start, cov.start)};
  });
}

EditResult insert_bytes(const ByteBuffer& buf, const SelectionSet& sels, std::span<const std::uint8_t> bytes,
                        InsertPoint where) {
  const size_t n = bytes.size();
  return apply_local_edits(buf, sels, [&](const Selection& s, size_t, size_t len) {
    size_t p = insertion_offset(s, where, len);
    LocalEdit e{ByteRange{p, p}, Bytes(bytes.begin(), bytes.end()), s};
    if (n == 0) return e;
    if (where == InsertPoint::Before) {
      e.after = Selection(s.anchor + n, s.cursor + n);
    } else {
      e.after = oriented(std::min(s.min(), p), p + n - 1, s);
    }
    return e;
  });
}

EditResult paste_entries(const ByteBuffer& buf, const SelectionSet& sels, const std::vector<Bytes>& entries,
                         InsertPoint where, size_t count) {
  if (entries.empty()) return EditResult{buf, sels};
  if (count == 0) count = 1;
  return apply_local_edits(buf, sels, [&](const Selection& s, size_t i, size_t len) {
    const Bytes& entry = RegisterStore::entry_for(entries, i);
    Bytes content;
    content.reserve(entry.size() * count);
    for (size_t k = 0; k < count; ++k) content.insert(content.end(), entry.begin(), entry.end());
    size_t p = insertion_offset(s, where, len);
    Selection after = s;
    if (!content.empty()) after = Selection::from_range(ByteRange{p, p + content.size()}, false);
    return LocalEdit{ByteRange{p, p}, std::move(content), after};
  });
}

std::optional<size_t> paste_size(const SelectionSet& sels, const std::vector<Bytes>& entries, size_t count) {
  if (entries.empty()) return 0;
  if (count == 0) count = 1;
  const size_t limit = HXV_MAX_PASTE_BYTES;
  size_t total = 0;
  for (size_t i = 0; i < sels.size(); ++i) {
    size_t n = RegisterStore::entry_for(entries, i).size();
    if (n == 0) continue;
    // total <= limit holds here, so neither side can wrap
    if (count > (limit - total) / n) return std::nullopt;
    total += n * count;
  }
  return total;
}

EditResult overwrite_selections(const ByteBuffer& buf, const SelectionSet& sels, std::uint8_t byte) {
  return apply_local_edits(buf, sels, [byte](const Selection& s, size_t, size_t len) {
    ByteRange cov = s.covered(len);
    return LocalEdit{cov, Bytes(cov.size(), byte), s};
  });
}

EditResult erase_before(const ByteBuffer& buf, const SelectionSet& sels, InsertPoint where) {
  return apply_local_edits(buf, sels, [where](const Selection& s, size_t, size_t len) {
    size_t p = insertion_offset(s, where, len);
    if (p == 0) return LocalEdit{ByteRange{0, 0}, {}, s};
    LocalEdit e{ByteRange{p - 1, p}, {}, s};
    if (where == InsertPoint::Before || p - 1 < s.min()) {
      e.after = s.shifted(-1);
    } else if (s.max() > s.min()) {
      e.after = oriented(s.min(), std::min(s.max(), p) - 1, s);
    } else {
      e.after = Selection(s.min(), s.min());
    }
    return e;
  });
}

EditResult erase_at(const ByteBuffer& buf, const SelectionSet& sels, InsertPoint where) {
  return apply_local_edits(buf, sels, [where](const Selection& s, size_t, size_t len) {
    size_t p = where == InsertPoint::Before ? s.min() : s.max() + 1;
    if (p >= len) return LocalEdit{ByteRange{len, len}, {}, s};
    LocalEdit e{ByteRange{p, p + 1}, {}, s};
    if (where == InsertPoint::Before) {
      e.after = s.max() > s.min() ? oriented(s.min(), s.max() - 1, s) : Selection(s.min(), s.min());
    }
    return e;
  });
}
