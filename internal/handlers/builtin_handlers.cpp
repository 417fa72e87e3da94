#include "internal/handlers/builtin_handlers.hpp"

#include <memory>

#include "internal/handlers/address_handler.hpp"
#include "internal/handlers/instance_handler.hpp"
#include "internal/handlers/internet_gateway_handler.hpp"
#include "internal/handlers/key_pair_handler.hpp"
#include "internal/handlers/region_handler.hpp"
#include "internal/handlers/route_table_handler.hpp"
#include "internal/handlers/security_group_handler.hpp"
#include "internal/handlers/subnet_handler.hpp"
#include "internal/handlers/tag_handler.hpp"
#include "internal/handlers/volume_handler.hpp"
#include "internal/handlers/vpc_handler.hpp"

namespace vera::handlers {

void RegisterBuiltInHandlers(gateway::ActionRouter& router, const HandlerDeps& deps) {
  router.Register("ec2", std::make_shared<VpcHandler>(deps));
  router.Register("ec2", std::make_shared<SubnetHandler>(deps));
  router.Register("ec2", std::make_shared<NetworkAclHandler>(deps));
  router.Register("ec2", std::make_shared<SecurityGroupHandler>(deps));
  router.Register("ec2", std::make_shared<RouteTableHandler>(deps));
  router.Register("ec2", std::make_shared<InternetGatewayHandler>(deps));
  router.Register("ec2", std::make_shared<InstanceHandler>(deps));
  router.Register("ec2", std::make_shared<VolumeHandler>(deps));
  router.Register("ec2", std::make_shared<SnapshotHandler>(deps));
  router.Register("ec2", std::make_shared<KeyPairHandler>(deps));
  router.Register("ec2", std::make_shared<AddressHandler>(deps));
  router.Register("ec2", std::make_shared<TagHandler>(deps));
  router.Register("ec2", std::make_shared<RegionHandler>(deps));

  router.Register("sts", std::make_shared<IdentityHandler>(deps));
}

} // namespace vera::handlers
