#include "internal/model/value.hpp"

#include <stdexcept>

namespace vera::model {

Value::Value(bool value) : kind_(Kind::kBool), bool_(value) {
}

Value::Value(std::int64_t value) : kind_(Kind::kInt), int_(value) {
}

Value::Value(int value) : kind_(Kind::kInt), int_(value) {
}

Value::Value(std::string value) : kind_(Kind::kString), string_(std::move(value)) {
}

Value::Value(std::string_view value) : kind_(Kind::kString), string_(value) {
}

Value::Value(const char* value) : kind_(Kind::kString), string_(value ? value : "") {
}

Value Value::List() {
  Value v;
  v.kind_ = Kind::kList;
  return v;
}

Value Value::Map() {
  Value v;
  v.kind_ = Kind::kMap;
  return v;
}

Value Value::Map(std::initializer_list<std::pair<std::string, Value>> fields) {
  Value v = Map();
  for (const auto& [key, value] : fields) {
    v.Set(key, value);
  }
  return v;
}

bool Value::AsBool() const {
  if (kind_ == Kind::kBool) return bool_;
  if (kind_ == Kind::kString) return string_ == "true";
  if (kind_ == Kind::kInt) return int_ != 0;
  return false;
}

std::int64_t Value::AsInt() const {
  if (kind_ == Kind::kInt) return int_;
  if (kind_ == Kind::kBool) return bool_ ? 1 : 0;
  if (kind_ == Kind::kString) {
    std::size_t  consumed = 0;
    std::int64_t parsed   = 0;
    try {
      parsed = std::stoll(string_, &consumed);
    } catch (const std::exception&) {
      throw std::invalid_argument("not an integer: '" + string_ + "'");
    }
    if (consumed != string_.size()) {
      throw std::invalid_argument("not an integer: '" + string_ + "'");
    }
    return parsed;
  }
  throw std::invalid_argument("value is not a scalar");
}

const std::string& Value::AsString() const {
  static const std::string kEmpty;
  return kind_ == Kind::kString ? string_ : kEmpty;
}

std::string Value::ToText() const {
  switch (kind_) {
    case Kind::kBool:
      return bool_ ? "true" : "false";
    case Kind::kInt:
      return std::to_string(int_);
    case Kind::kString:
      return string_;
    default:
      return {};
  }
}

const Value& Value::at(std::size_t index) const {
  return items_.at(index);
}

Value& Value::at(std::size_t index) {
  return items_.at(index);
}

Value& Value::Append(Value value) {
  if (kind_ == Kind::kNull) kind_ = Kind::kList;
  if (kind_ != Kind::kList) {
    throw std::logic_error("Append on a non-list value");
  }
  items_.push_back(std::move(value));
  return items_.back();
}

const std::string& Value::KeyAt(std::size_t index) const {
  return keys_.at(index);
}

const Value* Value::Find(std::string_view key) const {
  if (kind_ != Kind::kMap) return nullptr;
  for (std::size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == key) return &items_[i];
  }
  return nullptr;
}

Value* Value::Find(std::string_view key) {
  return const_cast<Value*>(static_cast<const Value&>(*this).Find(key));
}

Value& Value::Set(std::string_view key, Value value) {
  if (kind_ == Kind::kNull) kind_ = Kind::kMap;
  if (kind_ != Kind::kMap) {
    throw std::logic_error("Set on a non-map value");
  }
  if (auto* existing = Find(key)) {
    *existing = std::move(value);
    return *existing;
  }
  keys_.emplace_back(key);
  items_.push_back(std::move(value));
  return items_.back();
}

bool Value::Erase(std::string_view key) {
  if (kind_ != Kind::kMap) return false;
  for (std::size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == key) {
      keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(i));
      items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(i));
      return true;
    }
  }
  return false;
}

const Value* Value::FindPath(std::string_view path) const {
  const Value* node = this;
  while (node && !path.empty()) {
    const auto dot     = path.find('.');
    const auto segment = path.substr(0, dot);
    node               = node->Find(segment);
    path               = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);
  }
  return node;
}

std::string Value::GetString(std::string_view key, std::string_view fallback) const {
  const auto* field = Find(key);
  if (!field || !field->IsScalar()) return std::string(fallback);
  return field->ToText();
}

bool Value::operator==(const Value& other) const {
  if (kind_ != other.kind_) return false;
  switch (kind_) {
    case Kind::kNull:
      return true;
    case Kind::kBool:
      return bool_ == other.bool_;
    case Kind::kInt:
      return int_ == other.int_;
    case Kind::kString:
      return string_ == other.string_;
    case Kind::kList:
      return items_ == other.items_;
    case Kind::kMap:
      return keys_ == other.keys_ && items_ == other.items_;
  }
  return false;
}

void CollectScalars(const Value& root, std::string_view path, std::vector<std::string>& out) {
  if (root.IsList()) {
    for (std::size_t i = 0; i < root.size(); ++i) {
      CollectScalars(root.at(i), path, out);
    }
    return;
  }

  if (path.empty()) {
    if (root.IsScalar()) out.push_back(root.ToText());
    return;
  }

  const auto dot     = path.find('.');
  const auto segment = path.substr(0, dot);
  const auto rest    = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);

  if (const auto* child = root.Find(segment)) {
    CollectScalars(*child, rest, out);
  }
}

} // namespace vera::model
