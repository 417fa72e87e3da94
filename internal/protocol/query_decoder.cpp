#include "internal/protocol/query_decoder.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/util/errors.hpp"

namespace vera::protocol {

namespace {

constexpr std::string_view kMalformed = "MalformedQueryString";

[[noreturn]] void Malformed(const std::string& key, const std::string& why) {
  throw util::MalformedParameter("Malformed parameter '" + key + "': " + why, std::string(kMalformed));
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool IsIndex(std::string_view segment) {
  return !segment.empty() && std::all_of(segment.begin(), segment.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// Intermediate trie. A node is either a scalar leaf or a container; children
// keep first-arrival order.
struct Node {
  std::string                        key;
  std::optional<std::string>         scalar;
  std::vector<std::unique_ptr<Node>>     children; // first-seen order
  std::unordered_map<std::string, Node*> by_key;
  bool                                   indexed  = false; // child keys are positions
  std::size_t                            position = 0;

  Node* Child(const std::string& child_key) {
    const auto [it, inserted] = by_key.try_emplace(child_key, nullptr);
    if (!inserted) return it->second;
    children.push_back(std::make_unique<Node>());
    children.back()->key = child_key;
    it->second           = children.back().get();
    return it->second;
  }
};

std::vector<std::string> SplitKey(const std::string& key, const DecodeOptions& options) {
  std::vector<std::string> segments;
  std::size_t              start = 0;
  while (true) {
    const auto dot = key.find('.', start);
    segments.push_back(key.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
    if (dot == std::string::npos) break;
    start = dot + 1;
  }

  std::vector<std::string> out;
  out.reserve(segments.size());
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const auto& segment = segments[i];
    if (segment.empty()) Malformed(key, "empty path segment");

    if (!options.list_member_token.empty() && segment == options.list_member_token) {
      if (i + 1 >= segments.size() || !IsIndex(segments[i + 1])) {
        Malformed(key, "'" + segment + "' must be followed by a position");
      }
      continue;
    }
    out.push_back(segment);
  }
  return out;
}

model::Value Convert(const Node& node, const std::string& path, const DecodeOptions& options) {
  if (node.scalar) return model::Value(*node.scalar);

  if (!node.indexed) {
    auto map = model::Value::Map();
    for (const auto& child : node.children) {
      map.Set(child->key, Convert(*child, path.empty() ? child->key : path + "." + child->key, options));
    }
    return map;
  }

  std::vector<const Node*> ordered;
  ordered.reserve(node.children.size());
  for (const auto& child : node.children) {
    ordered.push_back(child.get());
  }
  std::sort(ordered.begin(), ordered.end(), [](const Node* a, const Node* b) { return a->position < b->position; });

  auto list = model::Value::List();
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    if (ordered[i]->position != i + 1 && !options.allow_sparse_lists) {
      Malformed(path, "list position " + std::to_string(i + 1) + " is missing");
    }
    list.Append(Convert(*ordered[i], path + "." + ordered[i]->key, options));
  }
  return list;
}

} // namespace

std::string PercentDecode(std::string_view text, bool plus_as_space) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '%') {
      const int hi = i + 2 < text.size() ? HexDigit(text[i + 1]) : -1;
      const int lo = i + 2 < text.size() ? HexDigit(text[i + 2]) : -1;
      if (hi < 0 || lo < 0) {
        throw util::MalformedParameter("invalid percent escape in request", std::string(kMalformed));
      }
      out.push_back(static_cast<char>(hi * 16 + lo));
      i += 2;
    } else if (c == '+' && plus_as_space) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

ParamList ParseFormEncoded(std::string_view text) {
  ParamList params;
  while (!text.empty()) {
    const auto amp  = text.find('&');
    const auto pair = text.substr(0, amp);
    text            = amp == std::string_view::npos ? std::string_view{} : text.substr(amp + 1);
    if (pair.empty()) continue;

    const auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      params.emplace_back(PercentDecode(pair, true), std::string{});
    } else {
      params.emplace_back(PercentDecode(pair.substr(0, eq), true), PercentDecode(pair.substr(eq + 1), true));
    }
  }
  return params;
}

model::Value DecodeFlat(const ParamList& params, const DecodeOptions& options) {
  Node root;

  for (const auto& [key, value] : params) {
    const auto segments = SplitKey(key, options);

    Node* node = &root;
    for (std::size_t i = 0; i < segments.size(); ++i) {
      if (node->scalar) Malformed(key, "used both as a value and as a container");

      const bool index = IsIndex(segments[i]);
      if (index && node == &root) Malformed(key, "parameter names cannot start with a position");
      if (!node->children.empty() && node->indexed != index) Malformed(key, "mixes positions and named members");
      node->indexed = index;

      std::string child_key = segments[i];
      std::size_t position  = 0;
      if (index) {
        const auto digits = child_key.find_first_not_of('0');
        if (digits == std::string::npos) Malformed(key, "positions start at 1");
        if (child_key.size() - digits > 9) Malformed(key, "position out of range");
        position  = std::stoul(child_key.substr(digits));
        child_key = std::to_string(position);
      }

      node           = node->Child(child_key);
      node->position = position;
    }

    if (node->scalar) Malformed(key, "given more than once");
    if (!node->children.empty()) Malformed(key, "used both as a value and as a container");
    node->scalar = value;
  }

  return Convert(root, "", options);
}

} // namespace vera::protocol
