#include "byte_rope.hpp"
#include <algorithm>
#include <cstring>
#include <future>
#include <stdexcept>
#include <string>
#include "config.hpp"

static constexpr size_t LEAF_MAX_BYTES = HXV_LEAF_MAX_BYTES;

size_t ByteRope::count_leaves(const Node* n) {
  if (!n) return 0;
  if (n->is_leaf()) return 1;
  return count_leaves(n->left.get()) + count_leaves(n->right.get());
}

ByteRope::NodePtr ByteRope::make_leaf(Bytes&& bytes) {
  if (bytes.empty()) return nullptr;
  auto n = std::make_shared<Node>();
  n->length = bytes.size();
  n->bytes = std::move(bytes);
  n->height = 1;
  return n;
}

ByteRope::NodePtr ByteRope::make_node(NodePtr l, NodePtr r) {
  auto n = std::make_shared<Node>();
  n->length = len(l.get()) + len(r.get());
  n->height = 1 + std::max(node_height(l.get()), node_height(r.get()));
  n->left = std::move(l);
  n->right = std::move(r);
  return n;
}

ByteRope::NodePtr ByteRope::rotate_left(const NodePtr& x) {
  const NodePtr& y = x->right;
  return make_node(make_node(x->left, y->left), y->right);
}

ByteRope::NodePtr ByteRope::rotate_right(const NodePtr& y) {
  const NodePtr& x = y->left;
  return make_node(x->left, make_node(x->right, y->right));
}

ByteRope::NodePtr ByteRope::balance(NodePtr l, NodePtr r) {
  int bf = node_height(l.get()) - node_height(r.get());
  if (bf > 1) { // left heavy
    if (balance_factor(l.get()) < 0) l = rotate_left(l);
    return rotate_right(make_node(std::move(l), std::move(r)));
  } else if (bf < -1) { // right heavy
    if (balance_factor(r.get()) > 0) r = rotate_right(r);
    return rotate_left(make_node(std::move(l), std::move(r)));
  }
  return make_node(std::move(l), std::move(r));
}

ByteRope::NodePtr ByteRope::join(NodePtr a, NodePtr b) {
  if (!a) return b;
  if (!b) return a;
  if (a->is_leaf() && b->is_leaf()) {
    if (a->length + b->length > LEAF_MAX_BYTES) return make_node(std::move(a), std::move(b));
    Bytes merged;
    merged.reserve(a->length + b->length);
    merged.insert(merged.end(), a->bytes.begin(), a->bytes.end());
    merged.insert(merged.end(), b->bytes.begin(), b->bytes.end());
    return make_leaf(std::move(merged));
  }
  int ha = a->height, hb = b->height;
  if (ha > hb + 1) return balance(a->left, join(a->right, std::move(b)));
  if (hb > ha + 1) return balance(join(std::move(a), b->left), b->right);
  // a lone leaf next to a low subtree folds into that subtree's edge leaf
  if (b->is_leaf()) return balance(a->left, join(a->right, std::move(b)));
  if (a->is_leaf()) return balance(join(std::move(a), b->left), b->right);
  return make_node(std::move(a), std::move(b));
}

std::pair<ByteRope::NodePtr, ByteRope::NodePtr> ByteRope::split(const NodePtr& n, size_t k) {
  if (!n) return {nullptr, nullptr};
  if (k == 0) return {nullptr, n};
  if (k >= n->length) return {n, nullptr};
  if (n->is_leaf()) {
    Bytes left_bytes(n->bytes.begin(), n->bytes.begin() + static_cast<std::ptrdiff_t>(k));
    Bytes right_bytes(n->bytes.begin() + static_cast<std::ptrdiff_t>(k), n->bytes.end());
    return {make_leaf(std::move(left_bytes)), make_leaf(std::move(right_bytes))};
  }
  size_t left_len = len(n->left.get());
  if (k < left_len) {
    auto [a, b] = split(n->left, k);
    return {std::move(a), join(std::move(b), n->right)};
  }
  if (k == left_len) return {n->left, n->right};
  auto [a, b] = split(n->right, k - left_len);
  return {join(n->left, std::move(a)), std::move(b)};
}

ByteRope::NodePtr ByteRope::build_balanced(std::span<const std::uint8_t> data) {
  size_t n = data.size();
  if (n == 0) return nullptr;
  if (n <= LEAF_MAX_BYTES) return make_leaf(Bytes(data.begin(), data.end()));
  // split on a leaf boundary so every leaf but the last is full
  size_t leaves = (n + LEAF_MAX_BYTES - 1) / LEAF_MAX_BYTES;
  size_t mid = (leaves / 2) * LEAF_MAX_BYTES;
  auto left = build_balanced(data.first(mid));
  auto right = build_balanced(data.subspan(mid));
  return balance(std::move(left), std::move(right));
}

ByteRope::NodePtr ByteRope::build_balanced_parallel(std::span<const std::uint8_t> data) {
  size_t n = data.size();
  if (n <= HXV_PARALLEL_BUILD_BYTES) return build_balanced(data);
  size_t leaves = (n + LEAF_MAX_BYTES - 1) / LEAF_MAX_BYTES;
  size_t mid = (leaves / 2) * LEAF_MAX_BYTES;
  auto fut_left = std::async(std::launch::async, [data, mid]{ return build_balanced(data.first(mid)); });
  auto right = build_balanced(data.subspan(mid));
  auto left = fut_left.get();
  return balance(std::move(left), std::move(right));
}

ByteRope ByteRope::from_bytes(std::span<const std::uint8_t> data) {
  return ByteRope(build_balanced_parallel(data));
}

void ByteRope::copy_range(const Node* n, size_t lo, size_t hi, std::uint8_t* out) {
  // lo/hi are relative to n; out receives bytes [lo, hi)
  while (n && lo < hi) {
    if (n->is_leaf()) {
      std::memcpy(out, n->bytes.data() + lo, hi - lo);
      return;
    }
    size_t left_len = len(n->left.get());
    if (hi <= left_len) { n = n->left.get(); continue; }
    if (lo >= left_len) { n = n->right.get(); lo -= left_len; hi -= left_len; continue; }
    copy_range(n->left.get(), lo, left_len, out);
    out += left_len - lo;
    n = n->right.get();
    lo = 0;
    hi -= left_len;
  }
}

Bytes ByteRope::slice(ByteRange r) const {
  if (r.start > r.end || r.end > length()) {
    throw std::out_of_range("slice [" + std::to_string(r.start) + ", " + std::to_string(r.end) +
                            ") exceeds length " + std::to_string(length()));
  }
  Bytes out(r.size());
  if (!out.empty()) copy_range(root_.get(), r.start, r.end, out.data());
  return out;
}

std::uint8_t ByteRope::at(size_t offset) const {
  if (offset >= length()) throw std::out_of_range("offset " + std::to_string(offset) + " exceeds length " + std::to_string(length()));
  const Node* cur = root_.get();
  while (!cur->is_leaf()) {
    size_t left_len = len(cur->left.get());
    if (offset < left_len) { cur = cur->left.get(); continue; }
    offset -= left_len;
    cur = cur->right.get();
  }
  return cur->bytes[offset];
}

ByteRope ByteRope::splice(ByteRange r, std::span<const std::uint8_t> replacement) const {
  if (r.start > r.end || r.end > length()) {
    throw std::out_of_range("splice [" + std::to_string(r.start) + ", " + std::to_string(r.end) +
                            ") exceeds length " + std::to_string(length()));
  }
  if (r.empty() && replacement.empty()) return *this;
  auto [a, rest] = split(root_, r.start);
  auto [removed, c] = split(rest, r.size());
  (void)removed;
  NodePtr m = build_balanced(replacement);
  return ByteRope(join(join(std::move(a), std::move(m)), std::move(c)));
}

Bytes ByteRope::to_bytes() const {
  return slice(ByteRange{0, length()});
}

bool ByteRope::operator==(const ByteRope& other) const {
  if (same_version(other)) return true;
  if (length() != other.length()) return false;
  auto a = chunks(ByteRange{0, length()});
  auto b = other.chunks(ByteRange{0, other.length()});
  std::span<const std::uint8_t> ca, cb;
  bool more_a = a.next(ca), more_b = b.next(cb);
  while (more_a && more_b) {
    size_t n = std::min(ca.size(), cb.size());
    if (std::memcmp(ca.data(), cb.data(), n) != 0) return false;
    ca = ca.subspan(n);
    cb = cb.subspan(n);
    if (ca.empty()) more_a = a.next(ca);
    if (cb.empty()) more_b = b.next(cb);
  }
  return !more_a && !more_b;
}

ByteRope::ChunkIter ByteRope::chunks(ByteRange r) const {
  ChunkIter it;
  it.keep_alive_ = root_;
  it.start_ = std::min(r.start, length());
  it.end_ = std::min(r.end, length());
  if (root_ && it.start_ < it.end_) it.stack_.push_back({root_.get(), 0});
  return it;
}

bool ByteRope::ChunkIter::next(std::span<const std::uint8_t>& out) {
  while (!stack_.empty()) {
    Frame f = stack_.back();
    stack_.pop_back();
    const Node* n = f.node;
    if (!n) continue;
    size_t lo = f.base, hi = f.base + n->length;
    if (hi <= start_ || lo >= end_) continue;
    if (n->is_leaf()) {
      size_t from = std::max(lo, start_) - lo;
      size_t to = std::min(hi, end_) - lo;
      out = std::span<const std::uint8_t>(n->bytes.data() + from, to - from);
      return true;
    }
    size_t left_len = len(n->left.get());
    stack_.push_back({n->right.get(), lo + left_len});
    stack_.push_back({n->left.get(), lo});
  }
  return false;
}
