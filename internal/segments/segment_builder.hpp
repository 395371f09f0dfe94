#pragma once

#include <cstddef>
#include <vector>

#include "internal/model/segment.hpp"

namespace transcription::segments {

inline constexpr std::size_t kDefaultMaxSegmentLength = 200;

/*
  Merges a diarized token stream into speaker-turn segments.

  Sentences (closed by a token ending in . ? ! or by the end of the stream)
  accumulate into the open segment while len(committed) + len(sentence) stays
  within max_segment_length code points. A sentence that would overflow starts
  a new segment; a single sentence longer than the limit becomes a segment on
  its own. A speaker change ends the open segment, and the committed text plus
  any unfinished sentence are emitted together with no length check.

  Pure; no I/O.
*/
class SegmentBuilder {
 public:
  explicit SegmentBuilder(std::size_t max_segment_length = kDefaultMaxSegmentLength);

  std::vector<model::Segment> Build(const std::vector<model::Word>& tokens) const;

  std::size_t MaxSegmentLength() const {
    return max_segment_length_;
  }

 private:
  std::size_t max_segment_length_;
};

std::vector<model::Segment> BuildSegments(const std::vector<model::Word>& tokens, std::size_t max_segment_length = kDefaultMaxSegmentLength);

} // namespace transcription::segments
