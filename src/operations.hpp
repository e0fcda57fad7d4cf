#pragma once
/*
 * Edit operations
 *
 * Purpose: multi-selection edits applied to one buffer version at once.
 * Each call returns the new buffer and the remapped selections; the inputs
 * are left untouched, so a caller can discard the result on failure.
 * Edits are built per selection (ascending, disjoint) and spliced back to
 * front, so earlier offsets stay valid while later ones are rewritten.
 */
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "byte_buffer.hpp"
#include "selection.hpp"
#include "types.hpp"

enum class InsertPoint { Before, After };

struct EditResult {
  ByteBuffer buffer;
  SelectionSet selections;
};

/* one entry per selection, clamped to the bytes present */
std::vector<Bytes> yank_selections(const ByteBuffer& buf, const SelectionSet& sels);

/* removes every covered byte; each selection collapses onto its old start */
EditResult delete_selections(const ByteBuffer& buf, const SelectionSet& sels);

/*
 * Before: bytes go in front of each selection, which shifts right.
 * After:  bytes go behind each selection, which grows to include them.
 */
EditResult insert_bytes(const ByteBuffer& buf, const SelectionSet& sels, std::span<const std::uint8_t> bytes,
                        InsertPoint where);

/* one register entry is broadcast, otherwise entry i % n goes to selection i;
 * pasted runs become the new selections */
EditResult paste_entries(const ByteBuffer& buf, const SelectionSet& sels, const std::vector<Bytes>& entries,
                         InsertPoint where, size_t count);

/* bytes paste_entries would add; nullopt when that exceeds HXV_MAX_PASTE_BYTES */
std::optional<size_t> paste_size(const SelectionSet& sels, const std::vector<Bytes>& entries, size_t count);

/* every covered byte becomes `byte`; selections are kept */
EditResult overwrite_selections(const ByteBuffer& buf, const SelectionSet& sels, std::uint8_t byte);

/* insert-mode Backspace / Delete around each insertion point */
EditResult erase_before(const ByteBuffer& buf, const SelectionSet& sels, InsertPoint where);
EditResult erase_at(const ByteBuffer& buf, const SelectionSet& sels, InsertPoint where);
