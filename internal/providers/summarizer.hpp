#pragma once

#include <memory>
#include <vector>

#include "internal/model/segment.hpp"
#include "transcription/manager/core/v1/types.pb.h"

namespace transcription::providers {

/*
  Turns a finished transcript into an overview plus timestamped key points.

  Throws util::ProviderError on upstream failure and util::ParseError when
  the model output is not the expected JSON.
*/
class Summarizer {
 public:
  virtual ~Summarizer() = default;

  virtual transcription::manager::core::v1::Summary Summarize(const std::vector<model::Segment>& segments) = 0;
};

using SummarizerPtr = std::shared_ptr<Summarizer>;

} // namespace transcription::providers
