#pragma once

#include "vkyc/v1/media.pb.h"
#include "vkyc/v1/signaling.pb.h"
#include "vkyc/v1/types.pb.h"

#include "vkyc/services/v1/media_ingest_service.pb.h"
#include "vkyc/services/v1/session_service.pb.h"
#include "vkyc/services/v1/signaling_service.pb.h"

namespace vkyc::v1 {
using namespace ::vkyc::services::v1;
}
