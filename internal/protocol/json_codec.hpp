#pragma once

#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "internal/model/value.hpp"

namespace vera::protocol {

/*
  JSON <-> Value, through google.protobuf.Value and protobuf's JSON utilities.

  Numbers with no fractional part become integers; other numbers are kept as
  their decimal text. An empty document decodes to an empty mapping.
*/
model::Value ParseJson(std::string_view text);
std::string  ToJson(const model::Value& value);

model::Value            FromProtoValue(const google::protobuf::Value& value);
google::protobuf::Value   ToProtoValue(const model::Value& value);

} // namespace vera::protocol
