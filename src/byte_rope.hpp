#pragma once
/*
 * ByteRope
 *
 * Purpose: persistent byte sequence stored as an AVL tree of byte chunks.
 * Design: nodes are immutable and shared between versions; every edit copies
 *         only the root-to-seam paths, so older versions stay readable.
 * Invariant: in-order leaves reproduce the bytes; no leaf is empty.
 */
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <vector>
#include "types.hpp"

class ByteRope {
private:
  struct Node;
  using NodePtr = std::shared_ptr<const Node>;

public:
  ByteRope() = default;
  static ByteRope from_bytes(std::span<const std::uint8_t> data);

  size_t length() const { return len(root_.get()); }
  bool empty() const { return length() == 0; }

  /* throws std::out_of_range when the range exceeds the rope */
  Bytes slice(ByteRange r) const;
  std::uint8_t at(size_t offset) const;
  ByteRope splice(ByteRange r, std::span<const std::uint8_t> replacement) const;
  Bytes to_bytes() const;

  /* true when both ropes are the very same version (shared root) */
  bool same_version(const ByteRope& other) const { return root_ == other.root_; }
  bool operator==(const ByteRope& other) const;

  size_t leaf_count() const { return count_leaves(root_.get()); }
  int height() const { return node_height(root_.get()); }

  class ChunkIter {
  public:
    /* yields successive chunks of the range; false when exhausted */
    bool next(std::span<const std::uint8_t>& out);

  private:
    friend class ByteRope;
    struct Frame { const Node* node; size_t base; };
    NodePtr keep_alive_;
    std::vector<Frame> stack_;
    size_t start_ = 0;
    size_t end_ = 0;
  };
  ChunkIter chunks(ByteRange r) const;

private:
  struct Node {
    NodePtr left;
    NodePtr right;
    Bytes bytes; /* non-empty only for leaves */
    size_t length = 0;
    int height = 1;
    bool is_leaf() const { return !left && !right; }
  };

  explicit ByteRope(NodePtr root) : root_(std::move(root)) {}

  static size_t len(const Node* n) { return n ? n->length : 0; }
  static int node_height(const Node* n) { return n ? n->height : 0; }
  static int balance_factor(const Node* n) { return n ? (node_height(n->left.get()) - node_height(n->right.get())) : 0; }
  static size_t count_leaves(const Node* n);

  static NodePtr make_leaf(Bytes&& bytes);
  static NodePtr make_node(NodePtr l, NodePtr r);
  static NodePtr rotate_left(const NodePtr& x);
  static NodePtr rotate_right(const NodePtr& y);
  static NodePtr balance(NodePtr l, NodePtr r);
  static NodePtr join(NodePtr a, NodePtr b);
  static std::pair<NodePtr, NodePtr> split(const NodePtr& n, size_t k);
  static NodePtr build_balanced(std::span<const std::uint8_t> data);
  static NodePtr build_balanced_parallel(std::span<const std::uint8_t> data);
  static void copy_range(const Node* n, size_t lo, size_t hi, std::uint8_t* out);

  NodePtr root_;
};
