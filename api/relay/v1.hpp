#pragma once

#include "relay/core/v1/execution.pb.h"
#include "relay/agent/v1/protocol.pb.h"
#include "relay/network/v1/network.pb.h"
#include "relay/admin/v1/stats.pb.h"

#include "relay/services/v1/tool_service.pb.h"
#include "relay/services/v1/agent_gateway.pb.h"
#include "relay/services/v1/dispatch_service.pb.h"
#include "relay/services/v1/network_service.pb.h"
#include "relay/services/v1/admin_service.pb.h"

#include "relay/services/v1/tool_service.grpc.pb.h"
#include "relay/services/v1/agent_gateway.grpc.pb.h"
#include "relay/services/v1/dispatch_service.grpc.pb.h"
#include "relay/services/v1/network_service.grpc.pb.h"
#include "relay/services/v1/admin_service.grpc.pb.h"

namespace relay::v1 {
using namespace ::relay::core::v1;
using namespace ::relay::agent::v1;
using namespace ::relay::network::v1;
using namespace ::relay::admin::v1;
using namespace ::relay::services::v1;
}
