#include "input.hpp"
#include <cstdint>
#include <cstdio>

static int digit_value(int ch, bool hex) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (hex && ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  return -1;
}

bool CountInput::consume_digit(int ch) {
  int d = digit_value(ch, hex_);
  if (d < 0) return false;
  size_t base = hex_ ? 16 : 10;
  // saturate; every consumer clamps the count anyway
  if (value_ > (SIZE_MAX - static_cast<size_t>(d)) / base) value_ = SIZE_MAX;
  else value_ = value_ * base + static_cast<size_t>(d);
  has_ = true;
  return true;
}

bool CountInput::toggle_hex() {
  hex_ = !hex_;
  return true;
}

bool CountInput::backspace() {
  if (!has_) return false;
  size_t base = hex_ ? 16 : 10;
  value_ /= base;
  if (value_ == 0) has_ = false;
  return true;
}

size_t CountInput::take(size_t fallback) {
  size_t c = has_ ? value_ : fallback;
  reset();
  return c;
}

void CountInput::reset() {
  value_ = 0;
  has_ = false;
  hex_ = false;
}

std::string CountInput::describe() const {
  char buf[32];
  if (hex_) {
    if (!has_) return "0x";
    std::snprintf(buf, sizeof(buf), "0x%zx", value_);
    return buf;
  }
  if (!has_) return {};
  std::snprintf(buf, sizeof(buf), "%zu", value_);
  return buf;
}
