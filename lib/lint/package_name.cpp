// doculint/lint/package_name.cpp - Package identifier naming conventions
#include "doculint/lint/package_name.hpp"

#include <fmt/format.h>

#include <cstdint>

namespace doculint
{

namespace
{

/// Decode the code point starting at `pos` and advance past it.
/// Malformed sequences yield one byte as U+FFFD.
char32_t next_code_point(std::string_view text, size_t & pos)
{
  const auto lead = static_cast<uint8_t>(text[pos]);
  size_t len = 0;
  char32_t cp = 0;
  if (lead < 0x80) {
    ++pos;
    return lead;
  }
  if ((lead & 0xE0) == 0xC0) {
    len = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4;
    cp = lead & 0x07;
  } else {
    ++pos;
    return U'\uFFFD';
  }
  if (pos + len > text.size()) {
    ++pos;
    return U'\uFFFD';
  }
  for (size_t i = 1; i < len; ++i) {
    const auto cont = static_cast<uint8_t>(text[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      ++pos;
      return U'\uFFFD';
    }
    cp = (cp << 6) | (cont & 0x3F);
  }
  pos += len;
  return cp;
}

/// Letters with a distinct lowercase form in the scripts Go identifiers
/// commonly use: Latin, Greek, Cyrillic, Armenian and fullwidth Latin.
bool has_lowercase_form(char32_t cp)
{
  if (cp >= U'A' && cp <= U'Z') return true;
  if (cp < 0xC0) return false;
  // Latin-1: À..Þ except ×
  if (cp <= 0xDE) return cp != 0xD7;
  // Latin Extended-A alternates upper/lower, with the parity flipping at U+0139
  if (cp >= 0x0100 && cp <= 0x0137) return cp % 2 == 0;
  if (cp >= 0x0139 && cp <= 0x0148) return cp % 2 == 1;
  if (cp >= 0x014A && cp <= 0x0177) return cp % 2 == 0;
  if (cp == 0x0178 || cp == 0x0179 || cp == 0x017B || cp == 0x017D) return true;
  // Greek
  if (cp == 0x0386 || (cp >= 0x0388 && cp <= 0x038A) || cp == 0x038C) return true;
  if (cp == 0x038E || cp == 0x038F) return true;
  if (cp >= 0x0391 && cp <= 0x03AB) return cp != 0x03A2;
  // Cyrillic
  if (cp >= 0x0400 && cp <= 0x042F) return true;
  if (cp >= 0x0460 && cp <= 0x04FF) {
    if (cp >= 0x0482 && cp <= 0x0489) return false;
    if (cp >= 0x04C1 && cp <= 0x04CE) return cp % 2 == 1;
    return cp == 0x04C0 || cp % 2 == 0;
  }
  // Armenian
  if (cp >= 0x0531 && cp <= 0x0556) return true;
  // Fullwidth Ａ..Ｚ
  return cp >= 0xFF21 && cp <= 0xFF3A;
}

bool has_uppercase_letter(std::string_view name)
{
  size_t pos = 0;
  while (pos < name.size()) {
    if (has_lowercase_form(next_code_point(name, pos))) return true;
  }
  return false;
}

}  // namespace

std::optional<NamingViolation> validate_package_name(std::string_view name)
{
  if (name.find_first_of("-_") != std::string_view::npos) {
    return NamingViolation{
      NamingViolationKind::Separator,
      fmt::format("package \"{}\" should not contain - or _ in name", name)};
  }

  if (has_uppercase_letter(name)) {
    return NamingViolation{
      NamingViolationKind::Casing, fmt::format("package \"{}\" should be all lowercase", name)};
  }

  return std::nullopt;
}

}  // namespace doculint
