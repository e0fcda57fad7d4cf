#pragma once
/*
 * Selection / SelectionSet
 *
 * Purpose: multi-selection state over one buffer version.
 * Selection: (anchor, cursor) offsets; covers [min, max] inclusive.
 * SelectionSet invariants: sorted by start, no overlaps (overlapping
 *   selections merge), never empty, main index always valid.
 * Operations never mutate: each returns a new set; offsets clamp to
 *   [0, length] instead of failing.
 */
#include <cstddef>
#include <optional>
#include <vector>
#include "byte_buffer.hpp"
#include "pattern.hpp"
#include "types.hpp"

struct Selection {
  size_t anchor = 0;
  size_t cursor = 0;

  Selection() = default;
  Selection(size_t a, size_t c) : anchor(a), cursor(c) {}
  static Selection from_range(ByteRange r, bool backward);

  size_t min() const { return anchor <= cursor ? anchor : cursor; }
  size_t max() const { return anchor <= cursor ? cursor : anchor; }
  size_t span() const { return max() - min() + 1; }
  bool backward() const { return anchor > cursor; }
  /* bytes actually present in a buffer of the given length */
  ByteRange covered(size_t length) const;

  Selection collapsed() const { return {cursor, cursor}; }
  Selection swapped() const { return {cursor, anchor}; }
  Selection with_direction(bool backward) const;
  Selection shifted(std::ptrdiff_t delta) const;
  bool overlaps(const Selection& other) const { return min() <= other.max() && other.min() <= max(); }
  bool operator==(const Selection&) const = default;
};

/* row arithmetic for the fixed-width display */
size_t row_start(size_t offset, size_t bytes_per_line);
size_t row_end(size_t offset, size_t bytes_per_line, size_t length);

class SelectionSet {
public:
  SelectionSet();
  explicit SelectionSet(std::vector<Selection> sels, size_t main = 0);

  size_t size() const { return sels_.size(); }
  const Selection& operator[](size_t i) const { return sels_[i]; }
  const Selection& main() const { return sels_[main_]; }
  size_t main_index() const { return main_; }
  const std::vector<Selection>& selections() const { return sels_; }
  std::vector<Selection>::const_iterator begin() const { return sels_.begin(); }
  std::vector<Selection>::const_iterator end() const { return sels_.end(); }
  bool operator==(const SelectionSet&) const = default;

  SelectionSet clamped(size_t length) const;

  SelectionSet move_by(std::ptrdiff_t delta, bool extend, size_t length) const;
  SelectionSet jump_to(size_t target, bool extend, size_t length) const;
  SelectionSet collapse_to_cursor() const;
  SelectionSet swap_ends() const;
  SelectionSet select_all(size_t length) const;

  SelectionSet split_width(size_t width) const;
  std::optional<SelectionSet> split_null(size_t run, const ByteBuffer& buf, EditError& err) const;
  std::optional<SelectionSet> split_pattern(const Pattern& pattern, const ByteBuffer& buf, EditError& err) const;

  SelectionSet keep_only_main() const { return keep_index(main_); }
  SelectionSet keep_index(size_t index) const;
  std::optional<SelectionSet> drop_main(EditError& err) const { return drop_index(main_, err); }
  std::optional<SelectionSet> drop_index(size_t index, EditError& err) const;
  SelectionSet cycle_main(Direction dir, size_t steps = 1) const;

  std::optional<SelectionSet> select_matching(const Pattern& pattern, const ByteBuffer& buf,
                                              ByteRange search_range, EditError& err) const;
  /* matches inside the listed ranges only (ascending, disjoint) */
  std::optional<SelectionSet> select_matching(const Pattern& pattern, const ByteBuffer& buf,
                                              const std::vector<ByteRange>& ranges, EditError& err) const;
  /* the bytes each selection covers, gaps between selections excluded */
  std::vector<ByteRange> covered_ranges(size_t length) const;

  /* f(sel) -> replacement selections; main follows the main input */
  template <typename Fn>
  SelectionSet map(Fn f) const {
    std::vector<Selection> out;
    out.reserve(sels_.size());
    size_t new_main = 0;
    for (size_t i = 0; i < sels_.size(); ++i) {
      if (i == main_) new_main = out.size();
      for (const Selection& s : f(sels_[i])) out.push_back(s);
    }
    if (out.empty()) return SelectionSet();
    if (new_main >= out.size()) new_main = out.size() - 1;
    return SelectionSet(std::move(out), new_main);
  }

private:
  void normalize();

  std::vector<Selection> sels_;
  size_t main_ = 0;
};
