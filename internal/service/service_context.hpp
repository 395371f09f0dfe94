#pragma once

#include <memory>

namespace transcription::core {
class TranscriptionManager;
}

namespace transcription::service {

/*
  Dependency container shared by the service layer.
*/
struct ServiceContext {
  std::shared_ptr<transcription::core::TranscriptionManager> manager;
};

} // namespace transcription::service
