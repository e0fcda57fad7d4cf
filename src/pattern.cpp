#include "pattern.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <span>

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static std::optional<Pattern> invalid(EditError& err, std::string msg) {
  err.kind = ErrorKind::InvalidPattern;
  err.message = std::move(msg);
  return std::nullopt;
}

static std::optional<Pattern> compile_hex(std::string_view input, EditError& err) {
  Pattern p;
  size_t i = 0;
  while (i < input.size()) {
    char c = input[i];
    if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }
    if (i + 1 >= input.size()) {
      if (c == '?') return invalid(err, "unterminated wildcard at " + std::to_string(i));
      return invalid(err, "odd number of hex digits");
    }
    char d = input[i + 1];
    if (c == '?' || d == '?') {
      if (c != '?' || d != '?') return invalid(err, "unterminated wildcard at " + std::to_string(i));
      p.pieces.push_back(PatternPiece::wildcard());
      i += 2;
      continue;
    }
    int hi = hex_value(c), lo = hex_value(d);
    if (hi < 0) return invalid(err, std::string("not a hex digit: '") + c + "'");
    if (lo < 0) {
      if (std::isspace(static_cast<unsigned char>(d))) return invalid(err, "odd number of hex digits");
      return invalid(err, std::string("not a hex digit: '") + d + "'");
    }
    p.pieces.push_back(PatternPiece::literal(static_cast<std::uint8_t>(hi << 4 | lo)));
    i += 2;
  }
  return p;
}

static std::optional<Pattern> compile_ascii(std::string_view input, EditError& err) {
  Pattern p;
  for (size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (c != '\\') { p.pieces.push_back(PatternPiece::literal(static_cast<std::uint8_t>(c))); continue; }
    if (i + 1 >= input.size()) return invalid(err, "unterminated escape at end of pattern");
    char e = input[++i];
    switch (e) {
      case '?': p.pieces.push_back(PatternPiece::wildcard()); break;
      case '\\': p.pieces.push_back(PatternPiece::literal('\\')); break;
      case 'x': {
        if (i + 2 >= input.size()) return invalid(err, "unterminated \\x escape");
        int hi = hex_value(input[i + 1]), lo = hex_value(input[i + 2]);
        if (hi < 0 || lo < 0) return invalid(err, "\\x needs two hex digits");
        p.pieces.push_back(PatternPiece::literal(static_cast<std::uint8_t>(hi << 4 | lo)));
        i += 2;
      } break;
      default:
        return invalid(err, std::string("unknown escape \\") + e);
    }
  }
  return p;
}

std::optional<Pattern> compile_pattern(std::string_view input, Encoding enc, EditError& err) {
  return enc == Encoding::Hex ? compile_hex(input, err) : compile_ascii(input, err);
}

std::string render_pattern(const Pattern& pattern, Encoding enc) {
  static const char* digits = "0123456789abcdef";
  std::string out;
  for (const auto& piece : pattern.pieces) {
    if (enc == Encoding::Hex) {
      if (!out.empty()) out.push_back(' ');
      if (piece.kind == PatternPiece::Kind::Wildcard) { out += "??"; continue; }
      out.push_back(digits[piece.byte >> 4]);
      out.push_back(digits[piece.byte & 0xf]);
      continue;
    }
    if (piece.kind == PatternPiece::Kind::Wildcard) { out += "\\?"; continue; }
    unsigned char b = piece.byte;
    if (b == '\\') { out += "\\\\"; continue; }
    if (b >= 0x20 && b < 0x7f) { out.push_back(static_cast<char>(b)); continue; }
    out += "\\x";
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0xf]);
  }
  return out;
}

MatchIter::MatchIter(ByteBuffer buf, Pattern pattern, ByteRange range)
    : buf_(std::move(buf)), pattern_(std::move(pattern)) {
  range_.start = std::min(range.start, buf_.length());
  range_.end = std::min(std::max(range.end, range_.start), buf_.length());
  restart();
}

void MatchIter::restart() {
  chunks_ = buf_.chunks(range_);
  window_.clear();
  head_ = 0;
  pos_ = range_.start;
  exhausted_ = pattern_.empty();
}

bool MatchIter::fill(size_t n) {
  while (window_.size() - head_ < n) {
    std::span<const std::uint8_t> chunk;
    if (!chunks_.next(chunk)) return false;
    if (head_ > 0 && head_ >= window_.size() / 2) {
      window_.erase(window_.begin(), window_.begin() + static_cast<std::ptrdiff_t>(head_));
      head_ = 0;
    }
    window_.insert(window_.end(), chunk.begin(), chunk.end());
  }
  return true;
}

void MatchIter::advance(size_t n) {
  head_ += n;
  pos_ += n;
}

bool MatchIter::next(ByteRange& out) {
  if (exhausted_) return false;
  const size_t m = pattern_.size();
  const auto& first = pattern_.pieces.front();
  while (true) {
    if (!fill(m)) { exhausted_ = true; return false; }
    if (first.kind == PatternPiece::Kind::Literal) {
      // skip straight to the next occurrence of the first literal byte
      const std::uint8_t* base = window_.data() + head_;
      size_t avail = window_.size() - head_;
      const void* hit = std::memchr(base, first.byte, avail);
      if (!hit) { advance(avail); continue; }
      size_t skip = static_cast<size_t>(static_cast<const std::uint8_t*>(hit) - base);
      if (skip > 0) { advance(skip); continue; }
    }
    const std::uint8_t* w = window_.data() + head_;
    bool ok = true;
    for (size_t i = 0; i < m; ++i) {
      if (!pattern_.pieces[i].matches(w[i])) { ok = false; break; }
    }
    if (ok) {
      out = ByteRange{pos_, pos_ + m};
      advance(m);
      return true;
    }
    advance(1);
  }
}

std::vector<ByteRange> find_all(const ByteBuffer& buf, const Pattern& pattern, ByteRange range, size_t limit) {
  std::vector<ByteRange> out;
  MatchIter it(buf, pattern, range);
  ByteRange r;
  while (out.size() < limit && it.next(r)) out.push_back(r);
  return out;
}
