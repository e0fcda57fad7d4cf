#include "selection.hpp"
#include <cassert>
#include <cstdint>
#include <vector>

static bool sorted_disjoint(const SelectionSet& s) {
  for (size_t i = 1; i < s.size(); ++i) {
    if (s[i - 1].max() >= s[i].min()) return false;
  }
  return s.size() > 0 && s.main_index() < s.size();
}

static SelectionSet three_sels() {
  return SelectionSet({Selection(0, 1), Selection(4, 5), Selection(8, 9)}, 1);
}

int main() {
  const size_t len = 16;

  // construction sorts, merges overlaps and keeps main on its selection
  SelectionSet merged({Selection(6, 8), Selection(0, 2), Selection(2, 4)}, 0);
  assert(merged.size() == 2);
  assert(merged[0].min() == 0 && merged[0].max() == 4);
  assert(merged.main().min() == 6);
  assert(sorted_disjoint(merged));
  assert(SelectionSet(std::vector<Selection>{}).size() == 1);

  // move_by(0, false) equals collapse_to_cursor
  SelectionSet s({Selection(2, 5), Selection(12, 9)}, 0);
  assert(s.move_by(0, false, len) == s.collapse_to_cursor());

  // moves clamp to [0, length]
  SelectionSet m = s.move_by(-100, false, len);
  assert(m.size() == 1 && m.main().cursor == 0);
  m = s.move_by(100, false, len);
  assert(m.size() == 1 && m.main().cursor == len);
  SelectionSet ext = s.move_by(2, true, len);
  assert(ext[0].anchor == 2 && ext[0].cursor == 7);
  assert(sorted_disjoint(ext));

  // extend into a neighbour merges the two
  SelectionSet touching = SelectionSet({Selection(0, 2), Selection(4, 5)}, 0).move_by(2, true, len);
  assert(touching.size() == 1);

  // jumps and row targets
  assert(s.jump_to(3, false, len).main().cursor == 3);
  assert(s.jump_to(99, false, len).main().cursor == len);
  assert(row_start(21, 16) == 16);
  assert(row_end(21, 16, 100) == 31);
  assert(row_end(21, 16, 25) == 24);
  assert(row_end(0, 16, 0) == 0);

  assert(s.swap_ends()[0].anchor == 5 && s.swap_ends()[0].cursor == 2);
  SelectionSet all = s.select_all(len);
  assert(all.size() == 1 && all.main().min() == 0 && all.main().max() == len - 1);

  // fixed-width split partitions the range in order
  SelectionSet one({Selection(3, 12)}, 0);  // 10 bytes
  SelectionSet w4 = one.split_width(4);
  assert(w4.size() == 3);
  assert(w4[0].min() == 3 && w4[0].max() == 6);
  assert(w4[1].min() == 7 && w4[1].max() == 10);
  assert(w4[2].min() == 11 && w4[2].max() == 12);
  assert(w4.main_index() == 0);
  SelectionSet back = SelectionSet({Selection(12, 3)}, 0).split_width(4);
  for (const auto& piece : back) assert(piece.backward() || piece.min() == piece.max());

  ByteBuffer buf = ByteBuffer::from_bytes(Bytes{1, 2, 0, 3, 4, 0, 0, 5, 0, 0, 0, 6});
  const size_t blen = buf.length();
  SelectionSet whole = SelectionSet().select_all(blen);
  EditError err;

  // null split drops the delimiters
  auto nul = whole.split_null(1, buf, err);
  assert(nul.has_value());
  assert(nul->size() == 4);
  assert((*nul)[0].min() == 0 && (*nul)[0].max() == 1);
  assert((*nul)[1].min() == 3 && (*nul)[1].max() == 4);
  assert((*nul)[2].min() == 7 && (*nul)[2].max() == 7);
  assert((*nul)[3].min() == 11);

  // with a count the delimiter is that many consecutive nulls
  auto nul2 = whole.split_null(2, buf, err);
  assert(nul2.has_value());
  assert(nul2->size() == 3);
  assert((*nul2)[0].max() == 4);
  assert((*nul2)[1].min() == 7 && (*nul2)[1].max() == 7);
  assert((*nul2)[2].min() == 10);

  // splitting a selection made only of delimiters leaves nothing
  err = EditError{};
  auto none = SelectionSet({Selection(8, 10)}, 0).split_null(1, buf, err);
  assert(!none.has_value());
  assert(err.kind == ErrorKind::NoMatch);

  // pattern split keeps the matches inside each selection
  Pattern zero{{PatternPiece::literal(0)}};
  auto zs = SelectionSet({Selection(0, 4), Selection(8, 11)}, 1).split_pattern(zero, buf, err);
  assert(zs.has_value());
  assert(zs->size() == 4);
  assert((*zs)[0].min() == 2);
  assert(zs->main().min() == 8);
  err = EditError{};
  assert(!SelectionSet({Selection(0, 1)}, 0).split_pattern(zero, buf, err).has_value());
  assert(err.kind == ErrorKind::NoMatch);

  // keep / drop / cycle
  SelectionSet t = three_sels();
  assert(t.keep_only_main().size() == 1 && t.keep_only_main().main().min() == 4);
  assert(t.keep_index(0).main().min() == 0);
  assert(t.keep_index(42).main().min() == 8);
  auto dropped = t.drop_main(err);
  assert(dropped.has_value() && dropped->size() == 2);
  assert(dropped->main_index() < dropped->size());
  auto last = t.drop_index(2, err);
  assert(last.has_value() && last->main().min() == 4);
  err = EditError{};
  assert(!t.keep_only_main().drop_main(err).has_value());
  assert(err.kind == ErrorKind::EmptySelection);

  SelectionSet c = t;
  for (size_t i = 0; i < t.size(); ++i) c = c.cycle_main(Direction::Forward);
  assert(c.main_index() == t.main_index());
  assert(t.cycle_main(Direction::Backward, 2).main_index() == 2);
  assert(t.cycle_main(Direction::Forward, 4).main_index() == 2);

  // select_matching replaces the set or fails without touching it
  Pattern six{{PatternPiece::literal(6)}};
  auto sm = t.select_matching(zero, buf, {0, blen}, err);
  assert(sm.has_value() && sm->size() == 6);
  assert(sorted_disjoint(*sm));
  assert(sm->main().min() >= t.main().min());
  err = EditError{};
  assert(!t.select_matching(six, buf, {0, 5}, err).has_value());
  assert(err.kind == ErrorKind::NoMatch);

  // searching only the covered bytes skips the gaps between selections
  SelectionSet gaps({Selection(0, 1), Selection(7, 8)}, 0);
  auto ranges = gaps.covered_ranges(blen);
  assert(ranges.size() == 2 && ranges[1] == (ByteRange{7, 9}));
  err = EditError{};
  auto in_sels = gaps.select_matching(zero, buf, ranges, err);
  assert(in_sels.has_value() && in_sels->size() == 1);
  assert(in_sels->main() == Selection(8, 8));
  assert(!SelectionSet({Selection(0, 1)}, 0).select_matching(zero, buf, SelectionSet({Selection(0, 1)}, 0).covered_ranges(blen), err));

  // shifts saturate at both ends
  assert(Selection(3, 3).shifted(PTRDIFF_MIN) == Selection(0, 0));
  assert(Selection(SIZE_MAX - 1, 5).shifted(PTRDIFF_MAX).anchor == SIZE_MAX);

  // covered bytes clamp the one-past-end position
  Selection tail(blen, blen);
  assert(tail.covered(blen).empty());
  assert(Selection(10, blen).covered(blen).size() == 2);
  return 0;
}
