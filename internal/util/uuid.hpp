#pragma once

#include <string>

namespace transcription::util {

// Random RFC4122 version 4 id in canonical 8-4-4-4-12 form; used for job and
// asset ids.
std::string NewId();

} // namespace transcription::util
