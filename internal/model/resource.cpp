#include "internal/model/resource.hpp"

namespace vera::model {

const Tag* Resource::FindTag(std::string_view key) const {
  for (const auto& tag : tags) {
    if (tag.key == key) return &tag;
  }
  return nullptr;
}

void MergeTags(std::vector<Tag>& tags, const std::vector<Tag>& updates) {
  for (const auto& update : updates) {
    bool replaced = false;
    for (auto& tag : tags) {
      if (tag.key == update.key) {
        tag.value = update.value;
        replaced  = true;
        break;
      }
    }
    if (!replaced) tags.push_back(update);
  }
}

} // namespace vera::model
