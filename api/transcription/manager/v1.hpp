#pragma once

#include "transcription/manager/core/v1/types.pb.h"

#include "transcription/manager/services/v1/transcription_service.pb.h"
#include "transcription/manager/services/v1/transcription_service.grpc.pb.h"

namespace transcription::manager::v1 {
using namespace ::transcription::manager::core::v1;
using namespace ::transcription::manager::services::v1;
}
