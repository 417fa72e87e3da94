#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/filter/filter_evaluator.hpp"
#include "internal/gateway/resource_handler.hpp"
#include "internal/store/resource_store.hpp"

namespace vera::handlers {

// Shared collaborators of every handler.
struct HandlerDeps {
  std::shared_ptr<store::ResourceStore>          store;
  std::shared_ptr<const filter::FilterEvaluator> filters;
};

/*
  Base for handlers: keeps an action -> member function table so concrete
  handlers only declare their actions in the constructor.
*/
class HandlerBase : public gateway::ResourceHandler {
 public:
  using Action = std::function<model::Value(const model::Value&, const gateway::RequestContext&)>;

  explicit HandlerBase(HandlerDeps deps);

  std::vector<std::string> Actions() const override;

  model::Value Handle(const std::string& action, const model::Value& params, const gateway::RequestContext& context) override;

 protected:
  void On(std::string action, Action fn);

  store::ResourceStore&          store() const {
    return *deps_.store;
  }
  const filter::FilterEvaluator& filters() const {
    return *deps_.filters;
  }

 private:
  HandlerDeps                                 deps_;
  std::vector<std::pair<std::string, Action>> actions_;
};

} // namespace vera::handlers
