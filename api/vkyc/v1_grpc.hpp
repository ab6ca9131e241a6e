#pragma once

#include "vkyc/v1.hpp"

#include "vkyc/services/v1/media_ingest_service.grpc.pb.h"
#include "vkyc/services/v1/session_service.grpc.pb.h"
#include "vkyc/services/v1/signaling_service.grpc.pb.h"
