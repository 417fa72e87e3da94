#include "internal/handlers/volume_handler.hpp"

#include <algorithm>

#include "internal/handlers/handler_util.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace vera::handlers {

using model::ResourceType;
using model::Value;

namespace {

constexpr std::int64_t kMaxVolumeSize = 16384;

const std::vector<std::string>& VolumeTypes() {
  static const std::vector<std::string> types{"standard", "gp2", "gp3", "io1", "io2", "st1", "sc1"};
  return types;
}

std::int64_t DefaultIops(const std::string& volume_type, std::int64_t size) {
  if (volume_type == "gp2") return std::clamp<std::int64_t>(size * 3, 100, 16000);
  if (volume_type == "gp3") return 3000;
  return 0;
}

} // namespace

VolumeHandler::VolumeHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("CreateVolume", [this](const Value& p, const gateway::RequestContext& c) { return CreateVolume(p, c); });
  On("DescribeVolumes", [this](const Value& p, const gateway::RequestContext& c) { return DescribeVolumes(p, c); });
  On("DeleteVolume", [this](const Value& p, const gateway::RequestContext& c) { return DeleteVolume(p, c); });
  On("AttachVolume", [this](const Value& p, const gateway::RequestContext& c) { return AttachVolume(p, c); });
  On("DetachVolume", [this](const Value& p, const gateway::RequestContext& c) { return DetachVolume(p, c); });
}

Value VolumeHandler::CreateVolume(const Value& params, const gateway::RequestContext& context) {
  const auto zone = RequireString(params, "AvailabilityZone");
  if (!IsAvailabilityZone(context.region, zone)) {
    throw util::ValidationFailed("InvalidZone.NotFound", "The zone '" + zone + "' does not exist.");
  }

  auto       size        = OptionalInt(params, "Size");
  const auto snapshot_id = OptionalString(params, "SnapshotId");
  if (!size && snapshot_id.empty()) {
    throw util::MalformedParameter("The request must contain the parameter size or snapshotId", "MissingParameter");
  }
  if (!snapshot_id.empty()) {
    const auto snapshot      = store().Get(ResourceType::kSnapshot, snapshot_id);
    const auto snapshot_size = snapshot.attributes.Find("VolumeSize")->AsInt();
    if (!size) size = snapshot_size;
    if (*size < snapshot_size) {
      throw util::ValidationFailed("InvalidParameterValue", "Volume of " + std::to_string(*size) + "GiB is too small; minimum is " +
                                                                std::to_string(snapshot_size) + "GiB.");
    }
  }
  if (*size < 1 || *size > kMaxVolumeSize) {
    throw util::ValidationFailed("InvalidParameterValue", "Volume size " + std::to_string(*size) + " is out of range (1-16384 GiB).");
  }

  const auto volume_type = OptionalString(params, "VolumeType", "gp2");
  if (std::find(VolumeTypes().begin(), VolumeTypes().end(), volume_type) == VolumeTypes().end()) {
    throw util::ValidationFailed("InvalidParameterValue", "Value (" + volume_type + ") for parameter volumeType is invalid.");
  }

  auto attributes = Value::Map({
      {"AvailabilityZone", zone},
      {"Size", *size},
      {"SnapshotId", snapshot_id},
      {"VolumeType", volume_type},
      {"Encrypted", OptionalBool(params, "Encrypted", false)},
      {"CreateTime", util::FormatIso8601(util::Now())},
      {"MultiAttachEnabled", OptionalBool(params, "MultiAttachEnabled", false)},
      {"Attachments", Value::List()},
  });
  if (const auto iops = OptionalInt(params, "Iops").value_or(DefaultIops(volume_type, *size)); iops > 0) {
    attributes.Set("Iops", iops);
  }

  return Render(store().Create(ResourceType::kVolume, std::move(attributes), TagsFor(params, "volume")));
}

Value VolumeHandler::DescribeVolumes(const Value& params, const gateway::RequestContext&) {
  auto list = Value::List();
  for (const auto& volume : DescribeResources(store(), filters(), ResourceType::kVolume, StringList(params, "VolumeId"), params)) {
    list.Append(Render(volume));
  }
  return Value::Map({{"Volumes", std::move(list)}});
}

Value VolumeHandler::DeleteVolume(const Value& params, const gateway::RequestContext&) {
  const auto volume_id = RequireString(params, "VolumeId");

  store().Delete(ResourceType::kVolume, volume_id, [&](const store::StoreView& view) {
    const auto* volume = view.Find(ResourceType::kVolume, volume_id);
    if (volume && volume->state == "in-use") {
      std::vector<std::string> instances;
      model::CollectScalars(volume->attributes, "Attachments.InstanceId", instances);
      throw util::ValidationFailed("VolumeInUse", "Volume " + volume_id + " is currently attached to " + (instances.empty() ? "an instance" : instances.front()));
    }
  });
  return ReturnTrue();
}

Value VolumeHandler::AttachVolume(const Value& params, const gateway::RequestContext&) {
  const auto volume_id   = RequireString(params, "VolumeId");
  const auto instance_id = RequireString(params, "InstanceId");
  const auto device      = RequireString(params, "Device");

  Value attachment;
  store().Transact([&](store::StoreTransaction& transaction) {
    const auto& instance = transaction.Get(ResourceType::kInstance, instance_id);
    if (instance.state == "terminated" || instance.state == "shutting-down") {
      throw util::ValidationFailed("IncorrectInstanceState", "Instance '" + instance_id + "' is not 'running'.");
    }
    const auto instance_zone = instance.attributes.FindPath("Placement.AvailabilityZone");
    const auto zone          = instance_zone ? instance_zone->ToText() : std::string();

    transaction.Update(ResourceType::kVolume, volume_id, [&](model::Resource& volume) {
      if (volume.state != "available") {
        throw util::ValidationFailed("VolumeInUse", volume_id + " is already attached to an instance");
      }
      if (!zone.empty() && volume.attributes.GetString("AvailabilityZone") != zone) {
        throw util::ValidationFailed("InvalidVolume.ZoneMismatch",
                                     "The volume '" + volume_id + "' is not in the same availability zone as instance '" + instance_id + "'");
      }
      attachment = Value::Map({
          {"VolumeId", volume_id},
          {"InstanceId", instance_id},
          {"Device", device},
          {"State", "attached"},
          {"AttachTime", util::FormatIso8601(util::Now())},
          {"DeleteOnTermination", false},
      });
      volume.state = "in-use";
      volume.attributes.Find("Attachments")->Append(attachment);
    });
  });

  attachment.Set("State", "attaching");
  return attachment;
}

Value VolumeHandler::DetachVolume(const Value& params, const gateway::RequestContext&) {
  const auto volume_id   = RequireString(params, "VolumeId");
  const auto instance_id = OptionalString(params, "InstanceId");

  Value attachment;
  store().Update(ResourceType::kVolume, volume_id, [&](model::Resource& volume) {
    const auto* attachments = volume.attributes.Find("Attachments");
    if (volume.state != "in-use" || attachments->size() == 0) {
      throw util::ValidationFailed("IncorrectState", "Volume '" + volume_id + "' is in the '" + volume.state + "' state.");
    }
    if (!instance_id.empty() && attachments->at(0).GetString("InstanceId") != instance_id) {
      throw util::ValidationFailed("InvalidAttachment.NotFound",
                                   "The volume '" + volume_id + "' is not attached to instance '" + instance_id + "'");
    }
    attachment   = attachments->at(0);
    volume.state = "available";
    volume.attributes.Set("Attachments", Value::List());
  });

  attachment.Set("State", "detaching");
  return attachment;
}

// ------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------

SnapshotHandler::SnapshotHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("CreateSnapshot", [this](const Value& p, const gateway::RequestContext& c) { return CreateSnapshot(p, c); });
  On("DescribeSnapshots", [this](const Value& p, const gateway::RequestContext& c) { return DescribeSnapshots(p, c); });
  On("DeleteSnapshot", [this](const Value& p, const gateway::RequestContext& c) { return DeleteSnapshot(p, c); });
}

Value SnapshotHandler::CreateSnapshot(const Value& params, const gateway::RequestContext& context) {
  const auto volume = store().Get(ResourceType::kVolume, RequireString(params, "VolumeId"));

  const auto snapshot = store().Create(ResourceType::kSnapshot,
                                       Value::Map({
                                           {"VolumeId", volume.id},
                                           {"VolumeSize", volume.attributes.Find("Size")->AsInt()},
                                           {"Description", OptionalString(params, "Description")},
                                           {"StartTime", util::FormatIso8601(util::Now())},
                                           {"Progress", "100%"},
                                           {"OwnerId", context.account_id},
                                           {"Encrypted", volume.attributes.Find("Encrypted") ? volume.attributes.Find("Encrypted")->AsBool() : false},
                                           {"StorageTier", "standard"},
                                       }),
                                       TagsFor(params, "snapshot"));
  return Render(snapshot);
}

Value SnapshotHandler::DescribeSnapshots(const Value& params, const gateway::RequestContext& context) {
  // Every snapshot is owned by the caller; any other owner filter yields none.
  const auto owners = StringList(params, "Owner");
  const bool ours   = owners.empty() || std::any_of(owners.begin(), owners.end(), [&](const std::string& owner) {
                      return owner == "self" || owner == context.account_id;
                    });

  auto list = Value::List();
  if (ours) {
    for (const auto& snapshot : DescribeResources(store(), filters(), ResourceType::kSnapshot, StringList(params, "SnapshotId"), params)) {
      list.Append(Render(snapshot));
    }
  }
  return Value::Map({{"Snapshots", std::move(list)}});
}

Value SnapshotHandler::DeleteSnapshot(const Value& params, const gateway::RequestContext&) {
  store().Delete(ResourceType::kSnapshot, RequireString(params, "SnapshotId"));
  return ReturnTrue();
}

} // namespace vera::handlers
