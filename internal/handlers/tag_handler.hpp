#pragma once

#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

// Tagging across every resource type, addressed by id alone.
class TagHandler : public HandlerBase {
 public:
  explicit TagHandler(HandlerDeps deps);

 private:
  model::Value CreateTags(const model::Value& params, const gateway::RequestContext& context);
  model::Value DeleteTags(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeTags(const model::Value& params, const gateway::RequestContext& context);
};

} // namespace vera::handlers
