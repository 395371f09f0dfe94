#include "segment_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace transcription::segments {

namespace {

template <typename Message>
std::string ToJson(const Message& message, const char* what) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error(std::string("failed to encode ") + what + ": " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message FromJson(const std::string& json, const char* what) {
  Message message;
  if (json.empty()) {
    return message;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw util::ParseError(std::string("invalid ") + what + " json: " + std::string(status.message()));
  }
  return message;
}

void CheckTime(double value, const char* field, std::size_t index) {
  if (!std::isfinite(value) || value < 0.0) {
    throw util::ParseError("segment " + std::to_string(index) + " has invalid " + field);
  }
}

} // namespace

corev1::Word ToProto(const model::Word& word) {
  corev1::Word out;
  out.set_start(word.start);
  out.set_end(word.end);
  out.set_text(word.text);
  out.set_speaker(word.speaker);
  out.set_confidence(word.confidence);
  out.set_is_spacing(word.is_spacing);
  return out;
}

corev1::Segment ToProto(const model::Segment& segment) {
  corev1::Segment out;
  out.set_start(segment.start);
  out.set_end(segment.end);
  out.set_text(segment.text);
  out.set_speaker(segment.speaker);
  for (const auto& word : segment.words) {
    *out.add_words() = ToProto(word);
  }
  return out;
}

model::Word FromProto(const corev1::Word& word) {
  model::Word out;
  out.start      = word.start();
  out.end        = word.end();
  out.text       = word.text();
  out.speaker    = word.speaker().empty() ? model::kUnknownSpeaker : word.speaker();
  out.confidence = word.confidence();
  out.is_spacing = word.is_spacing();
  return out;
}

model::Segment FromProto(const corev1::Segment& segment) {
  model::Segment out;
  out.start   = segment.start();
  out.end     = segment.end();
  out.text    = segment.text();
  out.speaker = segment.speaker().empty() ? model::kUnknownSpeaker : segment.speaker();
  out.words.reserve(segment.words_size());
  for (const auto& word : segment.words()) {
    out.words.push_back(FromProto(word));
  }
  return out;
}

corev1::SegmentList ToProto(const model::Transcript& transcript) {
  corev1::SegmentList out;
  for (const auto& segment : transcript.segments) {
    *out.add_segments() = ToProto(segment);
  }
  out.set_detected_language(transcript.detected_language);
  return out;
}

model::Transcript FromProto(const corev1::SegmentList& list) {
  model::Transcript out;
  out.segments.reserve(list.segments_size());
  for (const auto& segment : list.segments()) {
    out.segments.push_back(FromProto(segment));
  }
  out.detected_language = list.detected_language();
  return out;
}

std::string EncodeTranscript(const model::Transcript& transcript) {
  return ToJson(ToProto(transcript), "transcript");
}

model::Transcript DecodeTranscript(const std::string& json) {
  return FromProto(FromJson<corev1::SegmentList>(json, "transcript"));
}

std::string EncodeSummary(const corev1::Summary& summary) {
  return ToJson(summary, "summary");
}

corev1::Summary DecodeSummary(const std::string& json) {
  return FromJson<corev1::Summary>(json, "summary");
}

std::vector<model::Segment> NormalizeSegments(std::vector<model::Segment> segments) {
  std::vector<model::Segment> out;
  out.reserve(segments.size());

  for (std::size_t i = 0; i < segments.size(); ++i) {
    auto& segment = segments[i];
    CheckTime(segment.start, "start", i);
    CheckTime(segment.end, "end", i);
    if (segment.end < segment.start) {
      throw util::ParseError("segment " + std::to_string(i) + " ends before it starts");
    }

    segment.text = util::Trim(segment.text);
    if (segment.text.empty()) {
      continue;
    }
    if (segment.speaker.empty()) {
      segment.speaker = model::kUnknownSpeaker;
    }
    out.push_back(std::move(segment));
  }
  return out;
}

} // namespace transcription::segments
