#pragma once

#include "blockforge/core/v1/block.pb.h"

#include "blockforge/services/v1/block_service.pb.h"
#include "blockforge/services/v1/block_service.grpc.pb.h"

namespace blockforge::v1 {
using namespace ::blockforge::core::v1;
using namespace ::blockforge::services::v1;
}
