#include "selection.hpp"
#include <algorithm>
#include <cstdint>
#include <numeric>

Selection Selection::from_range(ByteRange r, bool backward) {
  size_t last = r.end > r.start ? r.end - 1 : r.start;
  return backward ? Selection(last, r.start) : Selection(r.start, last);
}

ByteRange Selection::covered(size_t length) const {
  size_t lo = std::min(min(), length);
  size_t hi = std::min(max() + 1, length);
  return ByteRange{lo, std::max(lo, hi)};
}

Selection Selection::with_direction(bool back) const {
  return back ? Selection(max(), min()) : Selection(min(), max());
}

Selection Selection::shifted(std::ptrdiff_t delta) const {
  // saturates at both ends instead of wrapping
  auto shift = [delta](size_t v) {
    if (delta < 0) {
      size_t d = static_cast<size_t>(-(delta + 1)) + 1;
      return d > v ? size_t{0} : v - d;
    }
    size_t d = static_cast<size_t>(delta);
    return v > SIZE_MAX - d ? SIZE_MAX : v + d;
  };
  return {shift(anchor), shift(cursor)};
}

size_t row_start(size_t offset, size_t bytes_per_line) {
  if (bytes_per_line == 0) return offset;
  return offset - offset % bytes_per_line;
}

size_t row_end(size_t offset, size_t bytes_per_line, size_t length) {
  size_t last = length > 0 ? length - 1 : 0;
  if (bytes_per_line == 0) return std::min(offset, last);
  return std::min(row_start(offset, bytes_per_line) + bytes_per_line - 1, last);
}

SelectionSet::SelectionSet() : sels_{Selection()}, main_(0) {}

SelectionSet::SelectionSet(std::vector<Selection> sels, size_t main) : sels_(std::move(sels)), main_(main) {
  normalize();
}

void SelectionSet::normalize() {
  if (sels_.empty()) { sels_.push_back(Selection()); main_ = 0; return; }
  if (main_ >= sels_.size()) main_ = sels_.size() - 1;
  std::vector<size_t> order(sels_.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
    return sels_[a].min() < sels_[b].min();
  });
  std::vector<Selection> merged;
  merged.reserve(sels_.size());
  size_t new_main = 0;
  for (size_t idx : order) {
    const Selection& s = sels_[idx];
    if (!merged.empty() && merged.back().overlaps(s)) {
      Selection& last = merged.back();
      size_t lo = std::min(last.min(), s.min());
      size_t hi = std::max(last.max(), s.max());
      last = last.backward() ? Selection(hi, lo) : Selection(lo, hi);
    } else {
      merged.push_back(s);
    }
    if (idx == main_) new_main = merged.size() - 1;
  }
  sels_ = std::move(merged);
  main_ = new_main;
}

SelectionSet SelectionSet::clamped(size_t length) const {
  return map([length](const Selection& s) {
    return std::vector<Selection>{Selection(std::min(s.anchor, length), std::min(s.cursor, length))};
  });
}

SelectionSet SelectionSet::move_by(std::ptrdiff_t delta, bool extend, size_t length) const {
  return map([=](const Selection& s) {
    Selection moved = Selection(s.cursor, s.cursor).shifted(delta);
    size_t c = std::min(moved.cursor, length);
    return std::vector<Selection>{extend ? Selection(std::min(s.anchor, length), c) : Selection(c, c)};
  });
}

SelectionSet SelectionSet::jump_to(size_t target, bool extend, size_t length) const {
  size_t c = std::min(target, length);
  return map([=](const Selection& s) {
    return std::vector<Selection>{extend ? Selection(std::min(s.anchor, length), c) : Selection(c, c)};
  });
}

SelectionSet SelectionSet::collapse_to_cursor() const {
  return map([](const Selection& s) { return std::vector<Selection>{s.collapsed()}; });
}

SelectionSet SelectionSet::swap_ends() const {
  return map([](const Selection& s) { return std::vector<Selection>{s.swapped()}; });
}

SelectionSet SelectionSet::select_all(size_t length) const {
  size_t last = length > 0 ? length - 1 : 0;
  return SelectionSet({Selection(0, last)}, 0);
}

SelectionSet SelectionSet::split_width(size_t width) const {
  if (width == 0) width = 1;
  return map([width](const Selection& s) {
    std::vector<Selection> out;
    out.reserve(s.span() / width + 1);
    for (size_t pos = s.min(); pos <= s.max(); pos += width) {
      size_t last = std::min(s.max(), pos + width - 1);
      out.push_back(Selection(pos, last).with_direction(s.backward()));
      if (last == s.max()) break;
    }
    return out;
  });
}

std::optional<SelectionSet> SelectionSet::split_null(size_t run, const ByteBuffer& buf, EditError& err) const {
  if (run == 0) run = 1;
  Pattern delim;
  delim.pieces.assign(run, PatternPiece::literal(0));
  bool any = false;
  SelectionSet out = map([&](const Selection& s) {
    std::vector<Selection> pieces;
    ByteRange cov = s.covered(buf.length());
    if (cov.empty()) { pieces.push_back(s); any = true; return pieces; }
    size_t piece_start = cov.start;
    MatchIter it(buf, delim, cov);
    ByteRange m;
    while (it.next(m)) {
      if (m.start > piece_start) pieces.push_back(Selection::from_range({piece_start, m.start}, s.backward()));
      piece_start = m.end;
    }
    if (cov.end > piece_start) pieces.push_back(Selection::from_range({piece_start, cov.end}, s.backward()));
    if (!pieces.empty()) any = true;
    return pieces;
  });
  if (!any) {
    err.kind = ErrorKind::NoMatch;
    err.message = "split would leave no selection";
    return std::nullopt;
  }
  return out;
}

std::optional<SelectionSet> SelectionSet::split_pattern(const Pattern& pattern, const ByteBuffer& buf, EditError& err) const {
  bool any = false;
  SelectionSet out = map([&](const Selection& s) {
    std::vector<Selection> pieces;
    if (pattern.empty()) return pieces;
    MatchIter it(buf, pattern, s.covered(buf.length()));
    ByteRange m;
    while (it.next(m)) pieces.push_back(Selection::from_range(m, s.backward()));
    if (!pieces.empty()) any = true;
    return pieces;
  });
  if (!any) {
    err.kind = ErrorKind::NoMatch;
    err.message = "no match inside the selections";
    return std::nullopt;
  }
  return out;
}

SelectionSet SelectionSet::keep_index(size_t index) const {
  index = std::min(index, sels_.size() - 1);
  return SelectionSet({sels_[index]}, 0);
}

std::optional<SelectionSet> SelectionSet::drop_index(size_t index, EditError& err) const {
  if (sels_.size() <= 1) {
    err.kind = ErrorKind::EmptySelection;
    err.message = "cannot remove the last selection";
    return std::nullopt;
  }
  index = std::min(index, sels_.size() - 1);
  std::vector<Selection> rest;
  rest.reserve(sels_.size() - 1);
  for (size_t i = 0; i < sels_.size(); ++i) if (i != index) rest.push_back(sels_[i]);
  size_t new_main = main_;
  if (index < main_) new_main = main_ - 1;
  new_main = std::min(new_main, rest.size() - 1);
  return SelectionSet(std::move(rest), new_main);
}

SelectionSet SelectionSet::cycle_main(Direction dir, size_t steps) const {
  SelectionSet out = *this;
  size_t n = sels_.size();
  steps %= n;
  out.main_ = dir == Direction::Forward ? (main_ + steps) % n : (main_ + n - steps) % n;
  return out;
}

std::optional<SelectionSet> SelectionSet::select_matching(const Pattern& pattern, const ByteBuffer& buf,
                                                          ByteRange search_range, EditError& err) const {
  return select_matching(pattern, buf, std::vector<ByteRange>{search_range}, err);
}

std::optional<SelectionSet> SelectionSet::select_matching(const Pattern& pattern, const ByteBuffer& buf,
                                                          const std::vector<ByteRange>& ranges,
                                                          EditError& err) const {
  std::vector<Selection> found;
  size_t new_main = 0;
  bool main_placed = false;
  for (const ByteRange& range : ranges) {
    if (range.empty()) continue;
    MatchIter it(buf, pattern, range);
    ByteRange m;
    while (it.next(m)) {
      if (!main_placed && m.start >= main().min()) { new_main = found.size(); main_placed = true; }
      found.push_back(Selection::from_range(m, false));
    }
  }
  if (found.empty()) {
    err.kind = ErrorKind::NoMatch;
    err.message = "pattern not found";
    return std::nullopt;
  }
  return SelectionSet(std::move(found), new_main);
}

std::vector<ByteRange> SelectionSet::covered_ranges(size_t length) const {
  std::vector<ByteRange> out;
  out.reserve(sels_.size());
  for (const auto& s : sels_) out.push_back(s.covered(length));
  return out;
}
