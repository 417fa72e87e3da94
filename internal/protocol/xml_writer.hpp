#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/model/value.hpp"

namespace vera::protocol {

/*
  Element naming for one service's XML protocol.

  Lookup order for a member `Key` found under `Parent`:
    1. names["Parent.Key"]
    2. names["Key"]
    3. the key itself, lowerCamel-cased when `lower_camel` is set, with
       `list_suffix` appended when the member is a sequence
*/
struct XmlNaming {
  bool                                                lower_camel = false;
  std::string                                         list_suffix;
  std::string                                         item_tag = "member";
  const std::unordered_map<std::string, std::string>* names    = nullptr;

  std::string ElementName(std::string_view parent, std::string_view key, bool is_list) const;
};

std::string EscapeXml(std::string_view text);
std::string LowerCamel(std::string_view name);

// Minimal streaming XML builder.
class XmlWriter {
 public:
  void Declaration();
  void Open(std::string_view name, std::string_view attributes = {});
  void Close(std::string_view name);
  void Element(std::string_view name, std::string_view text);

  // Writes every member of the mapping `body` as child elements.
  void Members(const model::Value& body, const XmlNaming& naming, std::string_view parent = {});

  std::string Release() {
    return std::move(out_);
  }

 private:
  void Node(std::string_view element, const model::Value& value, const XmlNaming& naming, std::string_view key);

  std::string out_;
};

} // namespace vera::protocol
