#pragma once

#include <optional>
#include <string>

#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

// Key pairs are addressed by name on the wire and by KeyPairId in the store.
class KeyPairHandler : public HandlerBase {
 public:
  explicit KeyPairHandler(HandlerDeps deps);

 private:
  model::Value CreateKeyPair(const model::Value& params, const gateway::RequestContext& context);
  model::Value ImportKeyPair(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeKeyPairs(const model::Value& params, const gateway::RequestContext& context);
  model::Value DeleteKeyPair(const model::Value& params, const gateway::RequestContext& context);

  model::Resource                CreateUnique(const std::string& name, model::Value attributes, std::vector<model::Tag> tags);
  std::optional<model::Resource> FindByName(const std::string& name) const;
};

} // namespace vera::handlers
