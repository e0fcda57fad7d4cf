#pragma once
/*
 * Renderer
 *
 * Purpose: draw the hex view (offsets, hex cells, ascii column) of one
 *          session plus the status/prompt line, and keep the main cursor
 *          inside the viewport.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives snapshots from Editor to render.
 */
#include <optional>
#include <string>
#include "iterminal.hpp"
#include "session.hpp"
#include "types.hpp"

struct StatusInfo {
  std::string mode;
  std::string message;
  std::optional<std::string> prompt;
  size_t prompt_cursor = 0;
  size_t session_index = 0;
  size_t session_count = 1;
};

class Renderer {
public:
  void render(ITerminal& term, const Session& session, Viewport& vp, const ViewOptions& opts,
              const StatusInfo& status);

  static int hex_column(const ViewOptions& opts, size_t index_in_row);
  static int ascii_column(const ViewOptions& opts, size_t index_in_row);
  static std::string status_text(const Session& session, const StatusInfo& status);
};
