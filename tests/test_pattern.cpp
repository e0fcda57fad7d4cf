#include "pattern.hpp"
#include <cassert>
#include <string>
#include <vector>

static ByteBuffer buf_of(const Bytes& b) { return ByteBuffer::from_bytes(b); }

static Pattern compile_ok(const std::string& text, Encoding enc) {
  EditError err;
  auto p = compile_pattern(text, enc, err);
  assert(p.has_value());
  assert(err.kind == ErrorKind::None);
  return *p;
}

static bool compile_fails(const std::string& text, Encoding enc) {
  EditError err;
  auto p = compile_pattern(text, enc, err);
  return !p.has_value() && err.kind == ErrorKind::InvalidPattern && !err.message.empty();
}

int main() {
  // hex syntax
  Pattern p = compile_ok("de ad ?? ef", Encoding::Hex);
  assert(p.size() == 4);
  assert(p.pieces[0] == PatternPiece::literal(0xde));
  assert(p.pieces[2] == PatternPiece::wildcard());
  assert(compile_ok("DEAD", Encoding::Hex).size() == 2);
  assert(compile_ok("", Encoding::Hex).empty());
  assert(compile_fails("d", Encoding::Hex));
  assert(compile_fails("de a", Encoding::Hex));
  assert(compile_fails("?", Encoding::Hex));
  assert(compile_fails("?a", Encoding::Hex));
  assert(compile_fails("zz", Encoding::Hex));

  // ascii syntax
  Pattern a = compile_ok("GIF8\\?a\\x00\\\\", Encoding::Ascii);
  assert(a.size() == 8);
  assert(a.pieces[4] == PatternPiece::wildcard());
  assert(a.pieces[6] == PatternPiece::literal(0x00));
  assert(a.pieces[7] == PatternPiece::literal('\\'));
  assert(compile_fails("abc\\", Encoding::Ascii));
  assert(compile_fails("\\q", Encoding::Ascii));
  assert(compile_fails("\\x4", Encoding::Ascii));
  assert(compile_fails("\\xzz", Encoding::Ascii));

  // render is the inverse of compile in both encodings
  assert(render_pattern(p, Encoding::Hex) == "de ad ?? ef");
  assert(render_pattern(compile_ok("A\\?\\x01\\\\", Encoding::Ascii), Encoding::Hex) == "41 ?? 01 5c");
  assert(render_pattern(compile_ok("41 ?? 01 5c", Encoding::Hex), Encoding::Ascii) == "A\\?\\x01\\\\");

  // wildcard consumes one byte; no match runs past the end
  ByteBuffer b = buf_of({0x00, 0x11, 0x22, 0x33, 0x44, 0x00, 0x55, 0x66});
  auto hits = find_all(b, compile_ok("00 ?? 22", Encoding::Hex), {0, b.length()});
  assert(hits.size() == 1);
  assert((hits[0] == ByteRange{0, 3}));

  // non-overlapping, ascending
  ByteBuffer aaaa = buf_of({'A', 'A', 'A', 'A', 'A', 'B'});
  hits = find_all(aaaa, compile_ok("AA", Encoding::Ascii), {0, aaaa.length()});
  assert(hits.size() == 2);
  assert((hits[0] == ByteRange{0, 2}) && (hits[1] == ByteRange{2, 4}));

  // wildcard-only patterns tile the range
  hits = find_all(aaaa, compile_ok("\\?\\?", Encoding::Ascii), {0, aaaa.length()});
  assert(hits.size() == 3);
  assert((hits[2] == ByteRange{4, 6}));

  // empty pattern never matches
  assert(find_all(aaaa, Pattern{}, {0, aaaa.length()}).empty());

  // the search range bounds the matches
  hits = find_all(b, compile_ok("00", Encoding::Hex), {1, 8});
  assert(hits.size() == 1 && hits[0].start == 5);
  hits = find_all(b, compile_ok("44 00 55", Encoding::Hex), {0, 6});
  assert(hits.empty());

  // matches spanning leaf boundaries
  Bytes big(5000, 0x90);
  big[1022] = 0xCA; big[1023] = 0xFE; big[1024] = 0xBA; big[1025] = 0xBE;
  big[4090] = 0xCA; big[4091] = 0xFE; big[4092] = 0xBA; big[4093] = 0xBE;
  ByteBuffer bb = buf_of(big);
  hits = find_all(bb, compile_ok("ca fe ?? be", Encoding::Hex), {0, bb.length()});
  assert(hits.size() == 2);
  assert(hits[0].start == 1022 && hits[1].start == 4090);

  // lazy and restartable; limit stops early
  MatchIter it(bb, compile_ok("90 90", Encoding::Hex), {0, 10});
  ByteRange r;
  size_t n = 0;
  while (it.next(r)) n++;
  assert(n == 5);
  assert(!it.next(r));
  it.restart();
  assert(it.next(r) && r.start == 0);
  assert(find_all(bb, compile_ok("90", Encoding::Hex), {0, bb.length()}, 3).size() == 3);
  return 0;
}
