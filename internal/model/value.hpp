#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vera::model {

/*
  Value

  Generic tree used for resource attributes and for decoded request
  parameters. A node is null, a scalar (bool / integer / string), an ordered
  sequence, or a mapping that keeps insertion order.

  Mappings store their keys and values in two parallel vectors so a Value can
  hold Values without indirection.
*/
class Value {
 public:
  enum class Kind {
    kNull,
    kBool,
    kInt,
    kString,
    kList,
    kMap,
  };

  Value() = default;
  Value(bool value);
  Value(std::int64_t value);
  Value(int value);
  Value(std::string value);
  Value(std::string_view value);
  Value(const char* value);

  static Value List();
  static Value Map();
  static Value Map(std::initializer_list<std::pair<std::string, Value>> fields);

  Kind kind() const {
    return kind_;
  }
  bool IsNull() const {
    return kind_ == Kind::kNull;
  }
  bool IsScalar() const {
    return kind_ == Kind::kBool || kind_ == Kind::kInt || kind_ == Kind::kString;
  }
  bool IsList() const {
    return kind_ == Kind::kList;
  }
  bool IsMap() const {
    return kind_ == Kind::kMap;
  }

  bool                AsBool() const;
  std::int64_t        AsInt() const;
  const std::string&  AsString() const;
  // Scalar rendered as text: "true"/"false", decimal integers, strings as-is.
  std::string         ToText() const;

  // Sequence access. Also used to iterate the values of a mapping.
  std::size_t  size() const {
    return items_.size();
  }
  const Value& at(std::size_t index) const;
  Value&       at(std::size_t index);
  Value&       Append(Value value);

  // Mapping access.
  const std::string& KeyAt(std::size_t index) const;
  const Value*       Find(std::string_view key) const;
  Value*             Find(std::string_view key);
  bool               Contains(std::string_view key) const {
    return Find(key) != nullptr;
  }
  Value&             Set(std::string_view key, Value value);
  bool               Erase(std::string_view key);

  // Dotted lookup through nested mappings only ("Placement.AvailabilityZone").
  const Value* FindPath(std::string_view path) const;

  // Convenience readers for mapping fields.
  std::string GetString(std::string_view key, std::string_view fallback = {}) const;

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const {
    return !(*this == other);
  }

 private:
  Kind                     kind_ = Kind::kNull;
  bool                     bool_ = false;
  std::int64_t             int_  = 0;
  std::string              string_;
  std::vector<std::string> keys_;
  std::vector<Value>       items_;
};

// Collects every scalar reachable at `path`, fanning out over sequences at any
// level. Scalars are returned as text.
void CollectScalars(const Value& root, std::string_view path, std::vector<std::string>& out);

} // namespace vera::model
