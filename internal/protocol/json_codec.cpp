#include "internal/protocol/json_codec.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace vera::protocol {

model::Value FromProtoValue(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      return model::Value(value.bool_value());
    case google::protobuf::Value::kStringValue:
      return model::Value(value.string_value());
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (std::trunc(number) == number && std::abs(number) < 9.007199254740992e15) {
        return model::Value(static_cast<std::int64_t>(number));
      }
      std::ostringstream out;
      out << number;
      return model::Value(out.str());
    }
    case google::protobuf::Value::kListValue: {
      auto list = model::Value::List();
      for (const auto& item : value.list_value().values()) {
        list.Append(FromProtoValue(item));
      }
      return list;
    }
    case google::protobuf::Value::kStructValue: {
      // protobuf maps are unordered; sort so decoding is deterministic.
      const auto&                    fields = value.struct_value().fields();
      std::vector<const std::string*> keys;
      keys.reserve(fields.size());
      for (const auto& [key, unused] : fields) {
        keys.push_back(&key);
      }
      std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

      auto map = model::Value::Map();
      for (const auto* key : keys) {
        map.Set(*key, FromProtoValue(fields.at(*key)));
      }
      return map;
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      break;
  }
  return model::Value();
}

google::protobuf::Value ToProtoValue(const model::Value& value) {
  google::protobuf::Value out;
  switch (value.kind()) {
    case model::Value::Kind::kNull:
      out.set_null_value(google::protobuf::NULL_VALUE);
      break;
    case model::Value::Kind::kBool:
      out.set_bool_value(value.AsBool());
      break;
    case model::Value::Kind::kInt:
      out.set_number_value(static_cast<double>(value.AsInt()));
      break;
    case model::Value::Kind::kString:
      out.set_string_value(value.AsString());
      break;
    case model::Value::Kind::kList: {
      auto* list = out.mutable_list_value();
      for (std::size_t i = 0; i < value.size(); ++i) {
        *list->add_values() = ToProtoValue(value.at(i));
      }
      break;
    }
    case model::Value::Kind::kMap: {
      auto* fields = out.mutable_struct_value()->mutable_fields();
      for (std::size_t i = 0; i < value.size(); ++i) {
        (*fields)[value.KeyAt(i)] = ToProtoValue(value.at(i));
      }
      break;
    }
  }
  return out;
}

model::Value ParseJson(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return model::Value::Map();

  google::protobuf::Value parsed;
  const auto status = google::protobuf::util::JsonStringToMessage(std::string(text), &parsed);
  if (!status.ok()) {
    throw util::MalformedParameter("request body is not valid JSON: " + std::string(status.message()), "SerializationException");
  }
  return FromProtoValue(parsed);
}

std::string ToJson(const model::Value& value) {
  std::string out;
  const auto  status = google::protobuf::util::MessageToJsonString(ToProtoValue(value), &out);
  if (!status.ok()) {
    throw util::InternalError("failed to render JSON: " + std::string(status.message()));
  }
  return out;
}

} // namespace vera::protocol
