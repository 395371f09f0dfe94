#pragma once

#include <string>
#include <vector>

namespace transcription::model {

inline constexpr const char* kUnknownSpeaker   = "UNKNOWN";
inline constexpr double      kDefaultConfidence = 0.5;

/*
  One recognizer token.

  Spacing tokens carry the inter-word whitespace / filler text; they never
  become part of a Segment's word list.
*/
struct Word {
  double      start      = 0.0;
  double      end        = 0.0;
  std::string text;
  std::string speaker    = kUnknownSpeaker;
  double      confidence = kDefaultConfidence;
  bool        is_spacing = false;
};

/*
  Speaker-homogeneous span of speech.

  words are ordered by start and share `speaker`;
  start == words.front().start, end == words.back().end when words exist.
*/
struct Segment {
  double            start = 0.0;
  double            end   = 0.0;
  std::string       text;
  std::string       speaker = kUnknownSpeaker;
  std::vector<Word> words;
};

struct Transcript {
  std::vector<Segment> segments;
  std::string          detected_language;
};

} // namespace transcription::model
