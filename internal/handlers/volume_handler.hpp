#pragma once

#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

class VolumeHandler : public HandlerBase {
 public:
  explicit VolumeHandler(HandlerDeps deps);

 private:
  model::Value CreateVolume(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeVolumes(const model::Value& params, const gateway::RequestContext& context);
  model::Value DeleteVolume(const model::Value& params, const gateway::RequestContext& context);
  model::Value AttachVolume(const model::Value& params, const gateway::RequestContext& context);
  model::Value DetachVolume(const model::Value& params, const gateway::RequestContext& context);
};

class SnapshotHandler : public HandlerBase {
 public:
  explicit SnapshotHandler(HandlerDeps deps);

 private:
  model::Value CreateSnapshot(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeSnapshots(const model::Value& params, const gateway::RequestContext& context);
  model::Value DeleteSnapshot(const model::Value& params, const gateway::RequestContext& context);
};

} // namespace vera::handlers
