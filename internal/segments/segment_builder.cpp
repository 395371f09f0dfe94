#include "segment_builder.hpp"

#include <iterator>
#include <string>
#include <utility>

#include "internal/util/text.hpp"

namespace transcription::segments {

namespace {

using model::Segment;
using model::Word;

struct Buffer {
  std::string       text;
  std::vector<Word> words;

  bool Empty() const {
    return words.empty();
  }

  void Clear() {
    text.clear();
    words.clear();
  }
};

bool EndsSentence(const std::string& text) {
  const auto trimmed = util::RTrim(text);
  if (trimmed.empty()) {
    return false;
  }
  const char last = trimmed.back();
  return last == '.' || last == '?' || last == '!';
}

std::string JoinSentences(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (right.empty()) return left;
  if (util::EndsWithSpace(left) || util::StartsWithSpace(right)) return left + right;
  return left + " " + right;
}

class Scan {
 public:
  explicit Scan(std::size_t max_length) : max_length_(max_length) {
  }

  void Feed(const std::vector<Word>& tokens) {
    for (std::size_t i = 0; i < tokens.size(); ++i) {
      const auto& token = tokens[i];

      if (token.is_spacing) {
        // filler only counts inside an open sentence
        if (!sentence_.Empty()) {
          sentence_.text += token.text;
        }
        continue;
      }

      Word word = token;
      if (word.speaker.empty()) {
        word.speaker = model::kUnknownSpeaker;
      }

      if (!open_) {
        open_    = true;
        speaker_ = word.speaker;
      } else if (word.speaker != speaker_) {
        FlushTurn();
        speaker_ = word.speaker;
      }

      if (!sentence_.text.empty() && !util::EndsWithSpace(sentence_.text) && !util::StartsWithSpace(word.text)) {
        sentence_.text += ' ';
      }
      sentence_.text += word.text;
      sentence_.words.push_back(std::move(word));

      if (EndsSentence(token.text) || i + 1 == tokens.size()) {
        CloseSentence();
      }
    }

    if (open_) {
      FlushTurn();
    }
  }

  std::vector<Segment> Take() {
    return std::move(segments_);
  }

 private:
  // the separator space is not charged against the budget
  void CloseSentence() {
    if (sentence_.Empty()) {
      sentence_.Clear();
      return;
    }

    bool alone = committed_.Empty();
    if (alone || util::Utf8Length(committed_.text) + util::Utf8Length(sentence_.text) <= max_length_) {
      AppendSentence();
    } else {
      Flush(committed_);
      committed_ = std::move(sentence_);
      alone      = true;
    }
    sentence_.Clear();

    // one sentence longer than the budget stands alone
    if (alone && util::Utf8Length(committed_.text) > max_length_) {
      Flush(committed_);
    }
  }

  // end of a speaker turn: committed text and any open sentence leave as one
  // segment, whatever their combined length
  void FlushTurn() {
    if (!sentence_.Empty()) {
      AppendSentence();
      sentence_.Clear();
    }
    Flush(committed_);
  }

  void AppendSentence() {
    committed_.text = JoinSentences(committed_.text, sentence_.text);
    committed_.words.insert(committed_.words.end(), std::make_move_iterator(sentence_.words.begin()),
                            std::make_move_iterator(sentence_.words.end()));
  }

  void Flush(Buffer& buffer) {
    auto text = util::Trim(buffer.text);
    if (!text.empty() && !buffer.words.empty()) {
      Segment segment;
      segment.start   = buffer.words.front().start;
      segment.end     = buffer.words.back().end;
      segment.text    = std::move(text);
      segment.speaker = speaker_;
      segment.words   = std::move(buffer.words);
      segments_.push_back(std::move(segment));
    }
    buffer.Clear();
  }

  std::size_t          max_length_;
  bool                 open_ = false;
  std::string          speaker_;
  Buffer               committed_;
  Buffer               sentence_;
  std::vector<Segment> segments_;
};

} // namespace

SegmentBuilder::SegmentBuilder(std::size_t max_segment_length) : max_segment_length_(max_segment_length) {
}

std::vector<Segment> SegmentBuilder::Build(const std::vector<Word>& tokens) const {
  Scan scan(max_segment_length_);
  scan.Feed(tokens);
  return scan.Take();
}

std::vector<Segment> BuildSegments(const std::vector<Word>& tokens, std::size_t max_segment_length) {
  return SegmentBuilder(max_segment_length).Build(tokens);
}

} // namespace transcription::segments
