#include "internal/handlers/handler_base.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace vera::handlers {

HandlerBase::HandlerBase(HandlerDeps deps) : deps_(std::move(deps)) {
  if (!deps_.store || !deps_.filters) {
    throw std::invalid_argument("handler requires a store and a filter evaluator");
  }
}

std::vector<std::string> HandlerBase::Actions() const {
  std::vector<std::string> names;
  names.reserve(actions_.size());
  for (const auto& [name, fn] : actions_) {
    names.push_back(name);
  }
  return names;
}

model::Value HandlerBase::Handle(const std::string& action, const model::Value& params, const gateway::RequestContext& context) {
  for (const auto& [name, fn] : actions_) {
    if (name == action) return fn(params, context);
  }
  throw util::UnsupportedAction(context.service, action);
}

void HandlerBase::On(std::string action, Action fn) {
  actions_.emplace_back(std::move(action), std::move(fn));
}

} // namespace vera::handlers
