#include "internal/handlers/key_pair_handler.hpp"

#include <cstdio>
#include <functional>

#include "internal/handlers/handler_util.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace vera::handlers {

using model::ResourceType;
using model::Value;

namespace {

// "aabb.." -> "aa:bb:..".
std::string ColonHex(const std::string& hex) {
  std::string out;
  for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
    if (!out.empty()) out.push_back(':');
    out += hex.substr(i, 2);
  }
  return out;
}

// Stable digest of imported key material; not a real MD5 fingerprint.
std::string MaterialFingerprint(const std::string& material) {
  std::string hex;
  for (std::size_t salt = 0; salt < 2; ++salt) {
    const auto digest = std::hash<std::string>{}(std::to_string(salt) + material);
    char       buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016zx", static_cast<std::size_t>(digest));
    hex += buffer;
  }
  return ColonHex(hex);
}

std::string PrivateKeyMaterial(const std::string& key_type) {
  const std::string label = key_type == "ed25519" ? "OPENSSH PRIVATE KEY" : "RSA PRIVATE KEY";

  std::string body;
  for (int line = 0; line < 8; ++line) {
    body += util::RandomHex(64) + "\n";
  }
  return "-----BEGIN " + label + "-----\n" + body + "-----END " + label + "-----";
}

} // namespace

KeyPairHandler::KeyPairHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("CreateKeyPair", [this](const Value& p, const gateway::RequestContext& c) { return CreateKeyPair(p, c); });
  On("ImportKeyPair", [this](const Value& p, const gateway::RequestContext& c) { return ImportKeyPair(p, c); });
  On("DescribeKeyPairs", [this](const Value& p, const gateway::RequestContext& c) { return DescribeKeyPairs(p, c); });
  On("DeleteKeyPair", [this](const Value& p, const gateway::RequestContext& c) { return DeleteKeyPair(p, c); });
}

Value KeyPairHandler::CreateKeyPair(const Value& params, const gateway::RequestContext&) {
  const auto name     = RequireString(params, "KeyName");
  const auto key_type = OptionalString(params, "KeyType", "rsa");
  if (key_type != "rsa" && key_type != "ed25519") {
    throw util::ValidationFailed("InvalidParameterValue", "Value (" + key_type + ") for parameter keyType is invalid.");
  }

  const auto key = CreateUnique(name,
                                Value::Map({
                                    {"KeyName", name},
                                    {"KeyFingerprint", ColonHex(util::RandomHex(40))},
                                    {"KeyType", key_type},
                                    {"CreateTime", util::FormatIso8601(util::Now())},
                                }),
                                TagsFor(params, "key-pair"));

  // Private material is returned once and never stored.
  auto body = Value::Map({
      {"KeyName", name},
      {"KeyFingerprint", key.attributes.GetString("KeyFingerprint")},
      {"KeyMaterial", PrivateKeyMaterial(key_type)},
      {"KeyPairId", key.id},
  });
  if (!key.tags.empty()) body.Set("Tags", RenderTags(key.tags));
  return body;
}

Value KeyPairHandler::ImportKeyPair(const Value& params, const gateway::RequestContext&) {
  const auto name     = RequireString(params, "KeyName");
  const auto material = RequireString(params, "PublicKeyMaterial");
  const auto key_type = material.find("ed25519") != std::string::npos ? "ed25519" : "rsa";

  const auto key = CreateUnique(name,
                                Value::Map({
                                    {"KeyName", name},
                                    {"KeyFingerprint", MaterialFingerprint(material)},
                                    {"KeyType", key_type},
                                    {"CreateTime", util::FormatIso8601(util::Now())},
                                }),
                                TagsFor(params, "key-pair"));

  auto body = Value::Map({
      {"KeyName", name},
      {"KeyFingerprint", key.attributes.GetString("KeyFingerprint")},
      {"KeyPairId", key.id},
  });
  if (!key.tags.empty()) body.Set("Tags", RenderTags(key.tags));
  return body;
}

Value KeyPairHandler::DescribeKeyPairs(const Value& params, const gateway::RequestContext&) {
  auto ids = StringList(params, "KeyPairId");
  for (const auto& name : StringList(params, "KeyName")) {
    const auto key = FindByName(name);
    if (!key) {
      throw util::NotFound(ResourceType::kKeyPair, name, "The key pair '" + name + "' does not exist");
    }
    ids.push_back(key->id);
  }

  auto list = Value::List();
  for (const auto& key : DescribeResources(store(), filters(), ResourceType::kKeyPair, ids, params)) {
    list.Append(Render(key));
  }
  return Value::Map({{"KeyPairs", std::move(list)}});
}

// Deleting a key pair that does not exist succeeds.
Value KeyPairHandler::DeleteKeyPair(const Value& params, const gateway::RequestContext&) {
  auto key_id = OptionalString(params, "KeyPairId");
  if (key_id.empty()) {
    const auto name = RequireString(params, "KeyName");
    const auto key  = FindByName(name);
    if (!key) return ReturnTrue();
    key_id = key->id;
  }

  try {
    store().Delete(ResourceType::kKeyPair, key_id);
  } catch (const util::NotFound&) {
    // Already gone.
  }
  return ReturnTrue();
}

model::Resource KeyPairHandler::CreateUnique(const std::string& name, Value attributes, std::vector<model::Tag> tags) {
  return store().Create(ResourceType::kKeyPair, std::move(attributes), std::move(tags), [&](const store::StoreView& view) {
    for (const auto* existing : view.List(ResourceType::kKeyPair)) {
      if (existing->attributes.GetString("KeyName") == name) {
        throw util::ValidationFailed("InvalidKeyPair.Duplicate", "The keypair '" + name + "' already exists.");
      }
    }
  });
}

std::optional<model::Resource> KeyPairHandler::FindByName(const std::string& name) const {
  for (auto& key : store().List(ResourceType::kKeyPair)) {
    if (key.attributes.GetString("KeyName") == name) return std::move(key);
  }
  return std::nullopt;
}

} // namespace vera::handlers
