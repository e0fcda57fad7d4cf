#pragma once
/*
 * Pattern
 *
 * Purpose: byte patterns made of literal bytes and one-byte wildcards,
 *          compiled from hex or literal text and searched over a buffer.
 * Text syntax:
 *   hex    "de ad ?? ef"   digit pairs, whitespace ignored, ?? = wildcard
 *   ascii  "GIF8\?a\x00"   one byte per char, \? wildcard, \\ and \xHH escapes
 * Matching: left to right, non-overlapping, resumes after each match.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "byte_buffer.hpp"
#include "types.hpp"

struct PatternPiece {
  enum class Kind { Literal, Wildcard };
  Kind kind = Kind::Literal;
  std::uint8_t byte = 0;

  static PatternPiece literal(std::uint8_t b) { return {Kind::Literal, b}; }
  static PatternPiece wildcard() { return {Kind::Wildcard, 0}; }
  bool matches(std::uint8_t b) const { return kind == Kind::Wildcard || byte == b; }
  bool operator==(const PatternPiece&) const = default;
};

struct Pattern {
  std::vector<PatternPiece> pieces;

  size_t size() const { return pieces.size(); }
  bool empty() const { return pieces.empty(); }
  bool operator==(const Pattern&) const = default;
};

std::optional<Pattern> compile_pattern(std::string_view input, Encoding enc, EditError& err);
std::string render_pattern(const Pattern& pattern, Encoding enc);

/* lazy match sequence over one buffer version; restart() rewinds it */
class MatchIter {
public:
  MatchIter(ByteBuffer buf, Pattern pattern, ByteRange range);
  bool next(ByteRange& out);
  void restart();

private:
  bool fill(size_t n);
  void advance(size_t n);

  ByteBuffer buf_;
  Pattern pattern_;
  ByteRange range_;
  ByteRope::ChunkIter chunks_;
  std::vector<std::uint8_t> window_;
  size_t head_ = 0;  /* index in window_ of the byte at pos_ */
  size_t pos_ = 0;   /* absolute offset of window_[head_] */
  bool exhausted_ = false;
};

std::vector<ByteRange> find_all(const ByteBuffer& buf, const Pattern& pattern, ByteRange range,
                                size_t limit = static_cast<size_t>(-1));
