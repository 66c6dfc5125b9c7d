#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace registry::util {

// Number of code points in a UTF-8 string, or nullopt when the bytes are not
// well-formed UTF-8 (bad lead or continuation bytes, truncated sequences,
// overlong encodings, surrogates, values above U+10FFFF).
std::optional<std::size_t> CodePointLength(std::string_view text);

} // namespace registry::util
