#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/model/value.hpp"

namespace vera::protocol {

using ParamList = std::vector<std::pair<std::string, std::string>>;

struct DecodeOptions {
  // Accept gaps in positional indices (Foo.1, Foo.3) and compact them.
  bool allow_sparse_lists = false;
  // Segment that introduces list members ("member" for the query protocol).
  // Empty when the service has none.
  std::string list_member_token;
};

// %XX escapes and, when `plus_as_space` is set, '+' as a space.
std::string PercentDecode(std::string_view text, bool plus_as_space);

// Splits an application/x-www-form-urlencoded body or a URL query string.
ParamList ParseFormEncoded(std::string_view text);

/*
  Rebuilds the parameter tree from flat dotted keys:

    Filter.1.Name=a, Filter.1.Value.1=x  ->  {Filter: [{Name: a, Value: [x]}]}

  Numeric segments are 1-based positions and are ordered numerically, so the
  result does not depend on key arrival order. Structural inconsistencies
  (index 0, empty segments, a key used both as a scalar and as a container,
  numeric and named children under one key, repeated keys, gaps when sparse
  lists are not allowed) raise MalformedParameter with MalformedQueryString.
*/
model::Value DecodeFlat(const ParamList& params, const DecodeOptions& options);

} // namespace vera::protocol
