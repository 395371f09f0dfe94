#pragma once

#include <cstdint>

namespace transcription::util {

// Wall-clock milliseconds since the Unix epoch. Job and asset rows store
// times in this unit; conversion to google.protobuf.Timestamp happens at the
// service boundary.
uint64_t NowMillis();

} // namespace transcription::util
