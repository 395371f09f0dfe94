#include "callhome_dataset.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>

#include "evaluation_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace transcription::evaluation {

namespace {

constexpr std::size_t kRttmFields = 8;

std::string ReadText(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::NotFound("cannot open " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

double ParseField(const std::string& field, std::size_t line) {
  std::istringstream in(field);
  double             value = 0.0;
  if (!(in >> value) || !in.eof() || !std::isfinite(value) || value < 0) {
    throw util::ParseError("rttm line " + std::to_string(line) + ": bad number '" + field + "'");
  }
  return value;
}

} // namespace

std::vector<scoring::SpeakerTurn> ParseRttm(const std::string& content) {
  std::vector<scoring::SpeakerTurn> turns;
  std::size_t                       line_no = 0;
  for (const auto& line : util::Split(content, '\n')) {
    ++line_no;
    const auto fields = util::SplitWhitespace(line);
    if (fields.empty() || fields[0] != "SPEAKER") {
      continue;
    }
    if (fields.size() < kRttmFields) {
      throw util::ParseError("rttm line " + std::to_string(line_no) + ": expected at least " + std::to_string(kRttmFields) + " fields");
    }

    scoring::SpeakerTurn turn;
    turn.start   = ParseField(fields[3], line_no);
    turn.end     = turn.start + ParseField(fields[4], line_no);
    turn.speaker = fields[7];
    turns.push_back(std::move(turn));
  }
  return turns;
}

CallHomeDataset::CallHomeDataset(std::filesystem::path root, std::string language) : root_(std::move(root)), language_(std::move(language)) {
}

std::vector<Sample> CallHomeDataset::Load(const std::string& split) const {
  const auto base = root_ / language_;
  const auto rows = ReadDelimited(base / (split + ".tsv"), '\t', {"id", "audio", "rttm"});

  std::vector<Sample> samples;
  samples.reserve(rows.size());
  for (const auto& row : rows) {
    Sample sample;
    sample.audio = base / row.at("audio");
    sample.turns = ParseRttm(ReadText(base / row.at("rttm")));
    samples.push_back(std::move(sample));
  }

  TRANSCRIPTION_LOG_INFO("callhome split loaded", {observability::StringField("language", language_), observability::StringField("split", split),
                                                   observability::IntField("samples", static_cast<std::int64_t>(samples.size()))});
  return samples;
}

} // namespace transcription::evaluation
