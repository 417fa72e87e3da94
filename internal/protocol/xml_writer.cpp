#include "internal/protocol/xml_writer.hpp"

#include <cctype>

namespace vera::protocol {

std::string XmlNaming::ElementName(std::string_view parent, std::string_view key, bool is_list) const {
  if (names) {
    if (!parent.empty()) {
      std::string scoped(parent);
      scoped.push_back('.');
      scoped.append(key);
      if (auto it = names->find(scoped); it != names->end()) return it->second;
    }
    if (auto it = names->find(std::string(key)); it != names->end()) return it->second;
  }

  std::string name = lower_camel ? LowerCamel(key) : std::string(key);
  if (is_list) name += list_suffix;
  return name;
}

std::string EscapeXml(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&apos;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

std::string LowerCamel(std::string_view name) {
  std::string out(name);
  if (!out.empty()) out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
  return out;
}

void XmlWriter::Declaration() {
  out_ += R"(<?xml version="1.0" encoding="UTF-8"?>)";
}

void XmlWriter::Open(std::string_view name, std::string_view attributes) {
  out_.push_back('<');
  out_.append(name);
  if (!attributes.empty()) {
    out_.push_back(' ');
    out_.append(attributes);
  }
  out_.push_back('>');
}

void XmlWriter::Close(std::string_view name) {
  out_ += "</";
  out_.append(name);
  out_.push_back('>');
}

void XmlWriter::Element(std::string_view name, std::string_view text) {
  Open(name);
  out_ += EscapeXml(text);
  Close(name);
}

void XmlWriter::Members(const model::Value& body, const XmlNaming& naming, std::string_view parent) {
  if (!body.IsMap()) return;
  for (std::size_t i = 0; i < body.size(); ++i) {
    const auto& key   = body.KeyAt(i);
    const auto& value = body.at(i);
    if (value.IsNull()) continue;
    Node(naming.ElementName(parent, key, value.IsList()), value, naming, key);
  }
}

void XmlWriter::Node(std::string_view element, const model::Value& value, const XmlNaming& naming, std::string_view key) {
  Open(element);
  if (value.IsScalar()) {
    out_ += EscapeXml(value.ToText());
  } else if (value.IsMap()) {
    Members(value, naming, key);
  } else if (value.IsList()) {
    // Items of a list are named after the list's own key for scoped lookups.
    for (std::size_t i = 0; i < value.size(); ++i) {
      const auto& item = value.at(i);
      if (item.IsNull()) continue;
      Node(naming.item_tag, item, naming, key);
    }
  }
  Close(element);
}

} // namespace vera::protocol
