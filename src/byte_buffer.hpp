#pragma once
/*
 * ByteBuffer
 *
 * Purpose: one immutable version of an edited file's bytes, plus file I/O.
 * Feature: safe writes (write .tmp → fsync/fdatasync → atomic rename).
 * Note: splice returns a new version; the receiver is never modified.
 */
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <utility>
#include "byte_rope.hpp"
#include "types.hpp"

class ByteBuffer {
public:
  ByteBuffer() = default;
  explicit ByteBuffer(ByteRope rope) : rope_(std::move(rope)) {}
  static ByteBuffer from_bytes(std::span<const std::uint8_t> data);

  size_t length() const { return rope_.length(); }
  bool empty() const { return rope_.empty(); }
  Bytes slice(ByteRange r) const { return rope_.slice(r); }
  std::uint8_t at(size_t offset) const { return rope_.at(offset); }
  ByteBuffer splice(ByteRange r, std::span<const std::uint8_t> replacement) const;
  ByteRope::ChunkIter chunks(ByteRange r) const { return rope_.chunks(r); }
  Bytes to_bytes() const { return rope_.to_bytes(); }
  const ByteRope& rope() const { return rope_; }

  bool same_version(const ByteBuffer& other) const { return rope_.same_version(other.rope_); }
  bool operator==(const ByteBuffer& other) const { return rope_ == other.rope_; }

  static bool from_file(const std::filesystem::path& path, ByteBuffer& out, std::string& msg);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  ByteRope rope_;
};
