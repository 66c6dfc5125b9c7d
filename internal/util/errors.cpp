#include "errors.hpp"

namespace registry::util {

std::string_view KindName(registry::v1::ErrorKind kind) {
  static constexpr std::string_view kPrefix = "ERROR_KIND_";

  const std::string& full = registry::v1::ErrorKind_Name(kind);
  std::string_view   name(full);
  if (name.substr(0, kPrefix.size()) == kPrefix) {
    name.remove_prefix(kPrefix.size());
  }
  return name;
}

} // namespace registry::util
