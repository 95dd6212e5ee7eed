#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace textscrub::internal {

// Bytes that do not start a well-formed UTF-8 sequence are carried as opaque
// one-byte units with a code value above the Unicode range, so they never
// compare equal to a real scalar and never match a rule.
constexpr char32_t kInvalidByteBase = 0x110000;

inline bool IsInvalidUnit(char32_t cp) { return cp >= kInvalidByteBase; }

inline int UTF8ByteLength(uint8_t first_byte) {
  if ((first_byte & 0x80) == 0) return 1;      // 0xxxxxxx
  if ((first_byte & 0xE0) == 0xC0) return 2;   // 110xxxxx
  if ((first_byte & 0xF0) == 0xE0) return 3;   // 1110xxxx
  if ((first_byte & 0xF8) == 0xF0) return 4;   // 11110xxx
  return 1;  // Invalid, treat as single byte
}

/**
 * One decoded unit of a UTF-8 string: a Unicode scalar value (or an opaque
 * invalid byte) and the byte range it occupies in the source.
 */
struct CodeUnit {
  size_t offset = 0;
  uint8_t length = 0;
  char32_t cp = 0;
};

/**
 * Decode the unit starting at byte `pos`.
 * Malformed, truncated, overlong and surrogate sequences yield a one-byte
 * invalid unit so that re-encoding the units reproduces the input exactly.
 */
inline CodeUnit DecodeAt(std::string_view text, size_t pos) {
  const uint8_t c = static_cast<uint8_t>(text[pos]);
  CodeUnit unit{pos, 1, c};
  if (c < 0x80) {
    return unit;
  }

  const int len = UTF8ByteLength(c);
  unit.cp = kInvalidByteBase + c;
  if (len == 1 || pos + static_cast<size_t>(len) > text.size()) {
    return unit;
  }

  char32_t cp = (len == 2) ? (c & 0x1F) : (len == 3) ? (c & 0x0F) : (c & 0x07);
  for (int i = 1; i < len; ++i) {
    const uint8_t cc = static_cast<uint8_t>(text[pos + i]);
    if ((cc & 0xC0) != 0x80) {
      return unit;
    }
    cp = (cp << 6) | (cc & 0x3F);
  }

  // Reject overlong forms, surrogates and values past U+10FFFF
  static constexpr char32_t kMinForLength[5] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < kMinForLength[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    return unit;
  }

  unit.length = static_cast<uint8_t>(len);
  unit.cp = cp;
  return unit;
}

inline std::vector<CodeUnit> Decode(std::string_view text) {
  std::vector<CodeUnit> units;
  units.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    CodeUnit unit = DecodeAt(text, pos);
    pos += unit.length;
    units.push_back(unit);
  }
  return units;
}

inline void AppendUTF8(char32_t cp, std::string* out) {
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

}  // namespace textscrub::internal
