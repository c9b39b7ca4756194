#pragma once

#include "tierbridge/vfs/core/v1/types.pb.h"

#include "tierbridge/vfs/services/v1/catalog_service.pb.h"
#include "tierbridge/vfs/services/v1/clipboard_service.pb.h"
#include "tierbridge/vfs/services/v1/file_service.pb.h"
#include "tierbridge/vfs/services/v1/tiering_service.pb.h"
#include "tierbridge/vfs/services/v1/transfer_service.pb.h"

#include "tierbridge/vfs/services/v1/catalog_service.grpc.pb.h"
#include "tierbridge/vfs/services/v1/clipboard_service.grpc.pb.h"
#include "tierbridge/vfs/services/v1/file_service.grpc.pb.h"
#include "tierbridge/vfs/services/v1/tiering_service.grpc.pb.h"
#include "tierbridge/vfs/services/v1/transfer_service.grpc.pb.h"

namespace tierbridge::vfs::v1 {
using namespace ::tierbridge::vfs::core::v1;
using namespace ::tierbridge::vfs::services::v1;
}
