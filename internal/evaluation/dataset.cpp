#include "dataset.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace transcription::evaluation {

namespace {

double ParseSeconds(const std::string& text, std::string_view turn) {
  char*        end   = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size() || !std::isfinite(value) || value < 0) {
    throw util::ParseError("invalid time in speaker turn '" + std::string(turn) + "'");
  }
  return value;
}

} // namespace

std::string_view MetricName(MetricKind metric) {
  switch (metric) {
    case MetricKind::kWer:
      return "WER";
    case MetricKind::kCer:
      return "CER";
    case MetricKind::kDer:
      return "DER";
  }
  return "unknown";
}

std::string FormatTurns(const std::vector<scoring::SpeakerTurn>& turns) {
  std::string out;
  char        range[64];
  for (const auto& turn : turns) {
    if (!out.empty()) {
      out += ';';
    }
    std::snprintf(range, sizeof(range), "%.3f-%.3f:", turn.start, turn.end);
    out += range;
    // ';' is the turn separator
    for (char c : turn.speaker) {
      out += c == ';' ? ',' : c;
    }
  }
  return out;
}

std::vector<scoring::SpeakerTurn> ParseTurns(std::string_view text) {
  std::vector<scoring::SpeakerTurn> turns;
  for (const auto& item : util::Split(text, ';')) {
    const std::string_view turn = util::TrimView(item);
    if (turn.empty()) {
      continue;
    }
    const auto colon = turn.find(':');
    const auto dash  = turn.find('-');
    if (colon == std::string_view::npos || dash == std::string_view::npos || dash > colon) {
      throw util::ParseError("malformed speaker turn '" + std::string(turn) + "'");
    }

    scoring::SpeakerTurn t;
    t.start   = ParseSeconds(std::string(turn.substr(0, dash)), turn);
    t.end     = ParseSeconds(std::string(turn.substr(dash + 1, colon - dash - 1)), turn);
    t.speaker = std::string(turn.substr(colon + 1));
    if (t.end < t.start) {
      throw util::ParseError("speaker turn ends before it starts: '" + std::string(turn) + "'");
    }
    turns.push_back(std::move(t));
  }
  return turns;
}

} // namespace transcription::evaluation
