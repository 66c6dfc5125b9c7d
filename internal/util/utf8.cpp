#include "utf8.hpp"

#include <cstdint>

namespace registry::util {

std::optional<std::size_t> CodePointLength(std::string_view text) {
  std::size_t count = 0;
  std::size_t i     = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);

    std::size_t extra = 0;
    uint32_t    cp    = 0;
    uint32_t    min   = 0;
    if (lead < 0x80) {
      ++i;
      ++count;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      cp    = lead & 0x1F;
      min   = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      cp    = lead & 0x0F;
      min   = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      cp    = lead & 0x07;
      min   = 0x10000;
    } else {
      return std::nullopt;
    }

    if (text.size() - i <= extra) {
      return std::nullopt;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto c = static_cast<unsigned char>(text[i + k]);
      if ((c & 0xC0) != 0x80) {
        return std::nullopt;
      }
      cp = (cp << 6) | (c & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return std::nullopt;
    }
    i += extra + 1;
    ++count;
  }
  return count;
}

} // namespace registry::util
