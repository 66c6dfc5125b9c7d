#pragma once

#include <cstdint>
#include <string>

namespace registry::db::model {

/*
  Content attached to a registered name.

  Plain keyed values: the registry enforces nothing about them beyond who
  may write, and touches the owning NameRecord's updated_at on every save.
*/

struct MetadataRecord {
  std::string name;

  std::string title;
  std::string description;
  std::string image;

  uint64_t created_at = 0;
  uint64_t updated_at = 0;
};

struct MarkdownRecord {
  std::string name;
  std::string content;
  uint64_t    updated_at = 0;
};

} // namespace registry::db::model
