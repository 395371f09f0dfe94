#include "metrics_calculator.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>

#include "internal/util/text.hpp"

namespace transcription::scoring {

namespace {

// punctuation removed before character scoring; ASCII entries are the ones
// that commonly leak into CJK transcripts
constexpr std::u32string_view kCerPunctuation =
    U"!\"'＂＃＄％＆＇（）＊＋，－／：；＜＝＞＠［＼］＾＿｀｛｜｝～｟｠｢｣､、〃》「」『』【】〔〕〖〗〘〙〚〛〜〝〞〟〰〾〿"
    U"–—‘’‛“”„‟…‧﹏。,.?；：！~·#￥%&*+|{}《？";

std::string CollapseWhitespace(const std::u32string& text) {
  std::u32string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (char32_t cp : text) {
    if (util::IsSpace(cp)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(U' ');
      pending_space = false;
    }
    out.push_back(cp);
  }
  return util::EncodeUtf8(out);
}

std::string JoinSamples(const std::vector<std::string>& samples) {
  return util::Join(samples, "\n");
}

void CheckSameSize(const std::vector<std::string>& references, const std::vector<std::string>& hypotheses) {
  if (references.size() != hypotheses.size()) {
    throw std::invalid_argument("reference and hypothesis counts differ");
  }
}

class SpeakerIndex {
 public:
  int Get(const std::string& label) {
    auto [it, inserted] = ids_.emplace(label, static_cast<int>(ids_.size()));
    return it->second;
  }

  std::size_t Size() const {
    return ids_.size();
  }

 private:
  std::map<std::string, int> ids_;
};

struct Region {
  double           duration = 0.0;
  std::vector<int> reference;
  std::vector<int> hypothesis;
};

std::vector<int> ActiveSpeakers(const std::vector<SpeakerTurn>& turns, const std::vector<int>& ids, double from, double to) {
  const double     mid = (from + to) / 2.0;
  std::vector<int> active;
  for (std::size_t i = 0; i < turns.size(); ++i) {
    if (turns[i].start <= mid && mid < turns[i].end) {
      active.push_back(ids[i]);
    }
  }
  std::sort(active.begin(), active.end());
  active.erase(std::unique(active.begin(), active.end()), active.end());
  return active;
}

} // namespace

double DerBreakdown::Rate() const {
  if (reference <= 0.0) {
    return hypothesis > 0.0 ? 1.0 : 0.0;
  }
  return (missed + false_alarm + confusion) / reference;
}

std::string NormalizeForWer(std::string_view text) {
  std::u32string kept;
  for (char32_t cp : util::DecodeUtf8(text)) {
    cp = util::ToLower(cp);
    if (util::IsWordChar(cp) || util::IsSpace(cp)) {
      kept.push_back(cp);
    }
  }
  return CollapseWhitespace(kept);
}

std::string NormalizeForCer(std::string_view text) {
  std::u32string kept;
  for (char32_t cp : util::DecodeUtf8(text)) {
    cp = util::ToLower(cp);
    if (kCerPunctuation.find(cp) != std::u32string_view::npos) {
      continue;
    }
    if (util::IsCjkIdeograph(cp)) {
      kept.push_back(U' ');
      kept.push_back(cp);
      kept.push_back(U' ');
      continue;
    }
    kept.push_back(cp);
  }
  return CollapseWhitespace(kept);
}

double EditErrorRate(const std::vector<std::string>& reference, const std::vector<std::string>& hypothesis) {
  if (reference.empty()) {
    return hypothesis.empty() ? 0.0 : 1.0;
  }

  // single-row Levenshtein over tokens
  std::vector<std::size_t> row(hypothesis.size() + 1);
  for (std::size_t j = 0; j < row.size(); ++j) {
    row[j] = j;
  }

  for (std::size_t i = 1; i <= reference.size(); ++i) {
    std::size_t diagonal = row[0];
    row[0]               = i;
    for (std::size_t j = 1; j <= hypothesis.size(); ++j) {
      const std::size_t above = row[j];
      const std::size_t cost  = reference[i - 1] == hypothesis[j - 1] ? 0 : 1;
      row[j]                  = std::min({above + 1, row[j - 1] + 1, diagonal + cost});
      diagonal                = above;
    }
  }

  return static_cast<double>(row.back()) / static_cast<double>(reference.size());
}

double Wer(std::string_view reference, std::string_view hypothesis) {
  return EditErrorRate(util::SplitWhitespace(NormalizeForWer(reference)), util::SplitWhitespace(NormalizeForWer(hypothesis)));
}

double Cer(std::string_view reference, std::string_view hypothesis) {
  return EditErrorRate(util::SplitWhitespace(NormalizeForCer(reference)), util::SplitWhitespace(NormalizeForCer(hypothesis)));
}

double CorpusWer(const std::vector<std::string>& references, const std::vector<std::string>& hypotheses) {
  CheckSameSize(references, hypotheses);
  return Wer(JoinSamples(references), JoinSamples(hypotheses));
}

double CorpusCer(const std::vector<std::string>& references, const std::vector<std::string>& hypotheses) {
  CheckSameSize(references, hypotheses);
  return Cer(JoinSamples(references), JoinSamples(hypotheses));
}

std::vector<int> MaxWeightAssignment(const std::vector<std::vector<double>>& weights) {
  const std::size_t rows = weights.size();
  std::size_t       cols = 0;
  for (const auto& row : weights) {
    cols = std::max(cols, row.size());
  }

  std::vector<int> result(rows, -1);
  if (rows == 0 || cols == 0) {
    return result;
  }

  // Hungarian method on the square, negated matrix (1-based, column 0 is the
  // virtual start)
  const std::size_t n   = std::max(rows, cols);
  const double      inf = std::numeric_limits<double>::infinity();

  auto cost = [&](std::size_t i, std::size_t j) {
    if (i - 1 < rows && j - 1 < weights[i - 1].size()) {
      return -weights[i - 1][j - 1];
    }
    return 0.0;
  };

  std::vector<double>      u(n + 1, 0.0), v(n + 1, 0.0);
  std::vector<std::size_t> match(n + 1, 0), way(n + 1, 0);

  for (std::size_t i = 1; i <= n; ++i) {
    match[0]         = i;
    std::size_t col0 = 0;
    std::vector<double> min_slack(n + 1, inf);
    std::vector<bool>   used(n + 1, false);

    do {
      used[col0]             = true;
      const std::size_t row0 = match[col0];
      double            delta = inf;
      std::size_t       col1  = 0;

      for (std::size_t j = 1; j <= n; ++j) {
        if (used[j]) continue;
        const double slack = cost(row0, j) - u[row0] - v[j];
        if (slack < min_slack[j]) {
          min_slack[j] = slack;
          way[j]       = col0;
        }
        if (min_slack[j] < delta) {
          delta = min_slack[j];
          col1  = j;
        }
      }

      for (std::size_t j = 0; j <= n; ++j) {
        if (used[j]) {
          u[match[j]] += delta;
          v[j] -= delta;
        } else {
          min_slack[j] -= delta;
        }
      }
      col0 = col1;
    } while (match[col0] != 0);

    do {
      const std::size_t col1 = way[col0];
      match[col0]            = match[col1];
      col0                   = col1;
    } while (col0 != 0);
  }

  for (std::size_t j = 1; j <= n; ++j) {
    const std::size_t i = match[j];
    if (i >= 1 && i <= rows && j <= cols) {
      result[i - 1] = static_cast<int>(j - 1);
    }
  }
  return result;
}

DerBreakdown ComputeDer(const std::vector<SpeakerTurn>& reference, const std::vector<SpeakerTurn>& hypothesis) {
  DerBreakdown breakdown;

  SpeakerIndex     ref_index, hyp_index;
  std::vector<int> ref_ids, hyp_ids;
  std::vector<double> bounds;

  for (const auto& turn : reference) {
    ref_ids.push_back(ref_index.Get(turn.speaker));
    bounds.push_back(turn.start);
    bounds.push_back(turn.end);
  }
  for (const auto& turn : hypothesis) {
    hyp_ids.push_back(hyp_index.Get(turn.speaker));
    bounds.push_back(turn.start);
    bounds.push_back(turn.end);
  }

  std::sort(bounds.begin(), bounds.end());
  bounds.erase(std::unique(bounds.begin(), bounds.end()), bounds.end());

  // elementary intervals of the union timeline
  std::vector<Region> regions;
  std::vector<std::vector<double>> overlap(ref_index.Size(), std::vector<double>(hyp_index.Size(), 0.0));

  for (std::size_t i = 0; i + 1 < bounds.size(); ++i) {
    Region region;
    region.duration = bounds[i + 1] - bounds[i];
    if (region.duration <= 0.0) continue;

    region.reference  = ActiveSpeakers(reference, ref_ids, bounds[i], bounds[i + 1]);
    region.hypothesis = ActiveSpeakers(hypothesis, hyp_ids, bounds[i], bounds[i + 1]);
    if (region.reference.empty() && region.hypothesis.empty()) continue;

    for (int r : region.reference) {
      for (int h : region.hypothesis) {
        overlap[r][h] += region.duration;
      }
    }
    regions.push_back(std::move(region));
  }

  const auto mapping = MaxWeightAssignment(overlap);

  for (const auto& region : regions) {
    const double n_ref = static_cast<double>(region.reference.size());
    const double n_hyp = static_cast<double>(region.hypothesis.size());

    double correct = 0.0;
    for (int r : region.reference) {
      const int mapped = mapping.empty() ? -1 : mapping[r];
      if (mapped >= 0 && std::binary_search(region.hypothesis.begin(), region.hypothesis.end(), mapped)) {
        correct += 1.0;
      }
    }

    breakdown.reference += region.duration * n_ref;
    breakdown.hypothesis += region.duration * n_hyp;
    breakdown.missed += region.duration * std::max(0.0, n_ref - n_hyp);
    breakdown.false_alarm += region.duration * std::max(0.0, n_hyp - n_ref);
    breakdown.confusion += region.duration * (std::min(n_ref, n_hyp) - correct);
  }

  return breakdown;
}

double Der(const std::vector<SpeakerTurn>& reference, const std::vector<SpeakerTurn>& hypothesis) {
  return ComputeDer(reference, hypothesis).Rate();
}

} // namespace transcription::scoring
