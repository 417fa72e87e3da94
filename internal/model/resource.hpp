#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/resource_type.hpp"
#include "internal/model/value.hpp"
#include "internal/util/time.hpp"

namespace vera::model {

struct Tag {
  std::string key;
  std::string value;

  bool operator==(const Tag& other) const {
    return key == other.key && value == other.value;
  }
};

/*
  Resource

  One emulated cloud object. Handlers receive copies; the store owns the
  authoritative instance and is the only writer.
*/
struct Resource {
  ResourceType     type{};
  std::string      id;
  Value            attributes = Value::Map();
  std::vector<Tag> tags;
  util::TimePoint  created_at{};
  std::string      state;

  const Tag* FindTag(std::string_view key) const;
};

// Merges `updates` into `tags`. An existing key keeps its position and takes
// the new value; new keys are appended.
void MergeTags(std::vector<Tag>& tags, const std::vector<Tag>& updates);

} // namespace vera::model
