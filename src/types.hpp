#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (ByteRange/Encoding/EditError).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"

using Bytes = std::vector<std::uint8_t>;

/* half-open [start, end) */
struct ByteRange {
  size_t start = 0;
  size_t end = 0;
  size_t size() const { return end - start; }
  bool empty() const { return end <= start; }
  bool operator==(const ByteRange&) const = default;
};

enum class Encoding { Hex, Ascii };

enum class Direction { Forward, Backward };

enum class ErrorKind {
  None,
  OutOfBounds,
  InvalidPattern,
  NoMatch,
  EmptySelection,
  DirtyBufferClose,
  IoFailure,
};

struct EditError {
  ErrorKind kind = ErrorKind::None;
  std::string message;
};

inline Encoding toggled(Encoding e) { return e == Encoding::Hex ? Encoding::Ascii : Encoding::Hex; }

/* display options changed by :set */
struct ViewOptions {
  size_t bytes_per_line = HXV_DEFAULT_BYTES_PER_LINE;
  bool show_ascii = true;
  bool show_offsets = true;
};
