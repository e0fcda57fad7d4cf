#include "operations.hpp"
#include "registers.hpp"
#include <cassert>
#include <vector>

static ByteBuffer buf_of(std::initializer_list<std::uint8_t> bytes) {
  Bytes b(bytes);
  return ByteBuffer::from_bytes(b);
}

int main() {
  // yank everything, jump past the end, paste: the copy lands at the end
  {
    ByteBuffer b = buf_of({0xDE, 0xAD, 0xBE, 0xEF});
    SelectionSet all = SelectionSet().select_all(b.length());
    RegisterStore regs;
    regs.write(HXV_DEFAULT_REGISTER, yank_selections(b, all));
    assert(regs.has(HXV_DEFAULT_REGISTER));
    assert(regs.read(HXV_DEFAULT_REGISTER).size() == 1);
    SelectionSet end = all.jump_to(b.length(), false, b.length());
    EditResult r = paste_entries(b, end, regs.read(HXV_DEFAULT_REGISTER), InsertPoint::Before, 1);
    assert(r.buffer.length() == 8);
    assert(r.buffer.slice({4, 8}) == (Bytes{0xDE, 0xAD, 0xBE, 0xEF}));
    assert(r.selections.size() == 1);
    assert(r.selections.main().min() == 4 && r.selections.main().max() == 7);
    // the source version is untouched
    assert(b.length() == 4);
  }

  // delete collapses each selection onto its old start, later ones shift left
  {
    ByteBuffer b = buf_of({0, 1, 2, 3, 4, 5, 6, 7, 8, 9});
    SelectionSet s({Selection(1, 2), Selection(6, 5)}, 1);
    EditResult r = delete_selections(b, s);
    assert(r.buffer.to_bytes() == (Bytes{0, 3, 4, 7, 8, 9}));
    assert(r.selections.size() == 2);
    assert(r.selections[0] == Selection(1, 1));
    assert(r.selections[1] == Selection(3, 3));
    assert(r.selections.main_index() == 1);
    EditResult gone = delete_selections(b, SelectionSet().select_all(b.length()));
    assert(gone.buffer.length() == 0);
    assert(gone.selections.main() == Selection(0, 0));
  }

  // insert before shifts the selection, after grows it
  {
    ByteBuffer b = buf_of({0, 1, 2, 3, 4});
    Bytes xy{'X', 'Y'};
    EditResult r = insert_bytes(b, SelectionSet({Selection(1, 1), Selection(3, 3)}, 0), xy, InsertPoint::Before);
    assert(r.buffer.to_bytes() == (Bytes{0, 'X', 'Y', 1, 2, 'X', 'Y', 3, 4}));
    assert(r.selections[0] == Selection(3, 3));
    assert(r.selections[1] == Selection(7, 7));

    Bytes z{'Z'};
    EditResult a = insert_bytes(b, SelectionSet({Selection(0, 1)}, 0), z, InsertPoint::After);
    assert(a.buffer.to_bytes() == (Bytes{0, 1, 'Z', 2, 3, 4}));
    assert(a.selections.main() == Selection(0, 2));

    // appending at the end of the buffer
    EditResult tail = insert_bytes(b, SelectionSet({Selection(5, 5)}, 0), z, InsertPoint::Before);
    assert(tail.buffer.to_bytes() == (Bytes{0, 1, 2, 3, 4, 'Z'}));
    assert(tail.selections.main() == Selection(6, 6));
  }

  // more selections than entries: entries are reused in order
  {
    ByteBuffer b = buf_of({0, 1, 2, 3, 4, 5});
    std::vector<Bytes> entries{{'A'}, {'B'}};
    SelectionSet s({Selection(0, 0), Selection(2, 2), Selection(4, 4)}, 0);
    EditResult r = paste_entries(b, s, entries, InsertPoint::Before, 1);
    assert(r.buffer.to_bytes() == (Bytes{'A', 0, 1, 'B', 2, 3, 'A', 4, 5}));
    assert(r.selections.size() == 3);
    assert(r.selections[1] == Selection(3, 3));
    assert(r.buffer.at(r.selections[2].min()) == 'A');
    assert(RegisterStore::entry_for(entries, 5) == (Bytes{'B'}));

    // a single entry is broadcast, count repeats it
    std::vector<Bytes> one{{0xAA}};
    EditResult rep = paste_entries(buf_of({1, 2}), SelectionSet(), one, InsertPoint::After, 2);
    assert(rep.buffer.to_bytes() == (Bytes{1, 0xAA, 0xAA, 2}));
    assert(rep.selections.main() == Selection(1, 2));

    EditResult none = paste_entries(b, s, {}, InsertPoint::Before, 1);
    assert(none.buffer.same_version(b));
    assert(none.selections == s);
  }

  // paste sizes are checked before anything is allocated
  {
    std::vector<Bytes> entries{{'A', 'B'}};
    SelectionSet two({Selection(0, 0), Selection(4, 4)}, 0);
    assert(paste_size(two, entries, 3) == std::optional<size_t>(12));
    assert(paste_size(two, {}, 3) == std::optional<size_t>(0));
    assert(!paste_size(two, entries, static_cast<size_t>(-1)).has_value());
    assert(!paste_size(two, entries, HXV_MAX_PASTE_BYTES / 2).has_value());
  }

  // overwrite keeps length and selections
  {
    ByteBuffer b = buf_of({0, 1, 2, 3, 4});
    SelectionSet s({Selection(2, 1)}, 0);
    EditResult r = overwrite_selections(b, s, 0xFF);
    assert(r.buffer.to_bytes() == (Bytes{0, 0xFF, 0xFF, 3, 4}));
    assert(r.selections == s);
  }

  // insert-mode erasing
  {
    ByteBuffer b = buf_of({0, 1, 2, 3, 4});
    EditResult bs = erase_before(b, SelectionSet({Selection(2, 2)}, 0), InsertPoint::Before);
    assert(bs.buffer.to_bytes() == (Bytes{0, 2, 3, 4}));
    assert(bs.selections.main() == Selection(1, 1));
    EditResult at_start = erase_before(b, SelectionSet(), InsertPoint::Before);
    assert(at_start.buffer.same_version(b));

    EditResult del = erase_at(b, SelectionSet({Selection(2, 2)}, 0), InsertPoint::Before);
    assert(del.buffer.to_bytes() == (Bytes{0, 1, 3, 4}));
    assert(del.selections.main() == Selection(2, 2));
    EditResult past = erase_at(b, SelectionSet({Selection(5, 5)}, 0), InsertPoint::Before);
    assert(past.buffer.same_version(b));
  }

  // unset registers read as empty
  {
    RegisterStore regs;
    assert(!regs.has('a'));
    assert(regs.read('a').empty());
  }
  return 0;
}
