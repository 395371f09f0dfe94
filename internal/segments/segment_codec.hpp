#pragma once

#include <string>
#include <vector>

#include "internal/model/segment.hpp"
#include "transcription/manager/core/v1/types.pb.h"

namespace transcription::segments {

namespace corev1 = transcription::manager::core::v1;

corev1::Word    ToProto(const model::Word& word);
corev1::Segment ToProto(const model::Segment& segment);
model::Word     FromProto(const corev1::Word& word);
model::Segment  FromProto(const corev1::Segment& segment);

corev1::SegmentList ToProto(const model::Transcript& transcript);
model::Transcript   FromProto(const corev1::SegmentList& list);

// JSON form persisted in the job row.
std::string       EncodeTranscript(const model::Transcript& transcript);
model::Transcript DecodeTranscript(const std::string& json);

std::string     EncodeSummary(const corev1::Summary& summary);
corev1::Summary DecodeSummary(const std::string& json);

/*
  Checks provider-built segments before they are stored.

  Throws util::ParseError on non-finite or negative times and on end < start.
  Segments whose text trims to nothing are dropped; the rest get trimmed text
  and the UNKNOWN speaker when none was set.
*/
std::vector<model::Segment> NormalizeSegments(std::vector<model::Segment> segments);

} // namespace transcription::segments
