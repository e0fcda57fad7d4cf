#pragma once
#include <cstddef>
#include <string>
/*
 * CountInput
 *
 * Purpose: numeric count typed ahead of a Normal mode command.
 * Keys: decimal digits; 'x' toggles hex entry (0-9 a-f); backspace drops
 *       the last digit. take() hands the value over and resets.
 */

class CountInput {
public:
  /* true when ch was used as part of the count */
  bool consume_digit(int ch);
  bool toggle_hex();
  bool backspace();
  bool has_count() const { return has_; }
  bool hex() const { return hex_; }
  size_t value() const { return value_; }
  /* value, or fallback when no count was typed */
  size_t take(size_t fallback = 1);
  void reset();
  /* "12" / "0x1f"; empty without a count or hex toggle */
  std::string describe() const;

private:
  size_t value_ = 0;
  bool has_ = false;
  bool hex_ = false;
};
