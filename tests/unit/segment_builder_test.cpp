#include "internal/segments/segment_builder.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using transcription::model::Segment;
using transcription::model::Word;
using transcription::segments::BuildSegments;

Word MakeWord(const std::string& text, double start, double end, const std::string& speaker) {
  Word word;
  word.text    = text;
  word.start   = start;
  word.end     = end;
  word.speaker = speaker;
  return word;
}

Word Spacing(double at) {
  Word word;
  word.text       = " ";
  word.start      = at;
  word.end        = at;
  word.is_spacing = true;
  return word;
}

void TestSpeakerChangeStartsNewSegment() {
  const std::vector<Word> tokens = {
      MakeWord("Hello", 0.0, 0.5, "speaker_0"), Spacing(0.5), MakeWord("world.", 0.5, 1.0, "speaker_0"), Spacing(1.0),
      MakeWord("Hi", 1.2, 1.5, "speaker_1"),    Spacing(1.5), MakeWord("there.", 1.5, 2.0, "speaker_1"),
  };

  const auto segments = BuildSegments(tokens);
  assert(segments.size() == 2);

  assert(segments[0].text == "Hello world.");
  assert(segments[0].speaker == "speaker_0");
  assert(segments[0].start == 0.0);
  assert(segments[0].end == 1.0);
  assert(segments[0].words.size() == 2);

  assert(segments[1].text == "Hi there.");
  assert(segments[1].speaker == "speaker_1");
  assert(segments[1].start == 1.2);
  assert(segments[1].end == 2.0);
}

void TestSpeakerChangeMidSentenceEndsSegment() {
  const std::vector<Word> tokens = {
      MakeWord("So", 0.0, 0.2, "A"),
      Spacing(0.2),
      MakeWord("anyway", 0.2, 0.6, "A"),
      Spacing(0.6),
      MakeWord("right.", 0.7, 1.0, "B"),
  };

  const auto segments = BuildSegments(tokens);
  assert(segments.size() == 2);
  assert(segments[0].text == "So anyway");
  assert(segments[0].speaker == "A");
  assert(segments[1].text == "right.");
  assert(segments[1].speaker == "B");
}

void TestSentencesAccumulateWithinLimit() {
  const std::vector<Word> tokens = {
      MakeWord("One", 0.0, 0.3, "A"),   Spacing(0.3), MakeWord("two.", 0.3, 0.6, "A"),  Spacing(0.6),
      MakeWord("Three", 0.7, 1.0, "A"), Spacing(1.0), MakeWord("four.", 1.0, 1.4, "A"),
  };

  const auto merged = BuildSegments(tokens, 200);
  assert(merged.size() == 1);
  assert(merged[0].text == "One two. Three four.");
  assert(merged[0].words.size() == 4);

  // "One two. Three four." is 20 code points
  const auto split = BuildSegments(tokens, 16);
  assert(split.size() == 2);
  assert(split[0].text == "One two.");
  assert(split[0].end == 0.6);
  assert(split[1].text == "Three four.");
  assert(split[1].start == 0.7);
}

void TestOverlongSentenceStandsAlone() {
  const std::vector<Word> tokens = {
      MakeWord("Short.", 0.0, 0.5, "A"),
      Spacing(0.5),
      MakeWord("Extraordinarily", 0.6, 1.2, "A"),
      Spacing(1.2),
      MakeWord("verbose", 1.2, 1.6, "A"),
      Spacing(1.6),
      MakeWord("statement.", 1.6, 2.2, "A"),
      Spacing(2.2),
      MakeWord("Ok.", 2.4, 2.6, "A"),
  };

  const auto segments = BuildSegments(tokens, 16);
  assert(segments.size() == 3);
  assert(segments[0].text == "Short.");
  assert(segments[1].text == "Extraordinarily verbose statement.");
  assert(segments[2].text == "Ok.");
}

void TestSpeakerChangeKeepsOpenTurnTogether() {
  // "aaaa." is committed, "bb cc" is still open when speaker B starts;
  // together they exceed the budget but leave as one segment
  const std::vector<Word> tokens = {
      MakeWord("aaaa.", 0.0, 0.5, "A"), Spacing(0.5), MakeWord("bb", 0.6, 0.8, "A"), Spacing(0.8),
      MakeWord("cc", 0.8, 1.0, "A"),    MakeWord("x.", 1.2, 1.4, "B"),
  };

  const auto segments = BuildSegments(tokens, 8);
  assert(segments.size() == 2);
  assert(segments[0].text == "aaaa. bb cc");
  assert(segments[0].speaker == "A");
  assert(segments[0].start == 0.0);
  assert(segments[0].end == 1.0);
  assert(segments[0].words.size() == 3);
  assert(segments[1].text == "x.");
  assert(segments[1].speaker == "B");
}

void TestSentenceFillingBudgetExactlyMerges() {
  const std::vector<Word> tokens = {
      MakeWord("abc.", 0.0, 0.4, "A"),
      MakeWord("def.", 0.4, 0.8, "A"),
  };

  // 4 + 4 code points against a budget of 8
  const auto merged = BuildSegments(tokens, 8);
  assert(merged.size() == 1);
  assert(merged[0].text == "abc. def.");
  assert(merged[0].words.size() == 2);

  const auto split = BuildSegments(tokens, 7);
  assert(split.size() == 2);
  assert(split[0].text == "abc.");
  assert(split[1].text == "def.");
}

void TestSegmentAfterOverlongSentenceStartsAtNextWord() {
  const std::vector<Word> tokens = {
      MakeWord("Unbelievably", 0.0, 0.8, "A"), Spacing(0.8), MakeWord("long", 0.8, 1.1, "A"), Spacing(1.1),
      MakeWord("opening.", 1.1, 1.6, "A"),     Spacing(1.6), MakeWord("Then", 2.3, 2.5, "A"), Spacing(2.5),
      MakeWord("more.", 2.5, 2.9, "A"),
  };

  const auto segments = BuildSegments(tokens, 16);
  assert(segments.size() == 2);
  assert(segments[0].text == "Unbelievably long opening.");
  assert(segments[0].end == 1.6);
  assert(segments[1].text == "Then more.");
  assert(segments[1].start == 2.3);
  assert(segments[1].end == 2.9);
}

std::string CollapseWhitespace(const std::string& text) {
  std::istringstream in(text);
  std::string        word;
  std::string        out;
  while (in >> word) {
    if (!out.empty()) {
      out += ' ';
    }
    out += word;
  }
  return out;
}

void TestSegmentsReconstructTokenText() {
  const std::vector<Word> tokens = {
      MakeWord("Good", 0.0, 0.2, "A"),      Spacing(0.2), MakeWord("morning.", 0.2, 0.6, "A"), Spacing(0.6),
      MakeWord("How", 0.7, 0.9, "A"),       Spacing(0.9), MakeWord("are", 0.9, 1.0, "A"),      Spacing(1.0),
      MakeWord("you?", 1.0, 1.3, "A"),      Spacing(1.3), MakeWord("Fine,", 1.5, 1.8, "B"),    Spacing(1.8),
      MakeWord("thanks!", 1.8, 2.2, "B"),   Spacing(2.2), MakeWord("And", 2.4, 2.6, "B"),      Spacing(2.6),
      MakeWord("you", 2.6, 2.8, "B"),       Spacing(2.8), MakeWord("Great.", 3.0, 3.4, "A"),   Spacing(3.4),
      MakeWord("Let's", 3.5, 3.7, "A"),     Spacing(3.7), MakeWord("begin.", 3.7, 4.0, "A"),
  };

  std::string expected;
  for (const auto& token : tokens) {
    expected += token.text;
  }
  expected = CollapseWhitespace(expected);

  for (std::size_t max_length : {8u, 16u, 200u}) {
    std::string rebuilt;
    for (const auto& segment : BuildSegments(tokens, max_length)) {
      rebuilt += segment.text + " ";
    }
    assert(CollapseWhitespace(rebuilt) == expected);
  }
}

void TestMultibyteTextCountsCodePoints() {
  // 10 and 9 code points, three bytes each
  const std::vector<Word> tokens = {
      MakeWord("今日はいい天気です。", 0.0, 1.0, "A"),
      MakeWord("明日も晴れるかな。", 1.0, 2.0, "A"),
  };

  const auto segments = BuildSegments(tokens, 20);
  assert(segments.size() == 1);
}

void TestMissingSpeakerBecomesUnknown() {
  const std::vector<Word> tokens = {MakeWord("Hello.", 0.0, 0.4, "")};

  const auto segments = BuildSegments(tokens);
  assert(segments.size() == 1);
  assert(segments[0].speaker == transcription::model::kUnknownSpeaker);
}

void TestEmptyAndSpacingOnlyInput() {
  assert(BuildSegments({}).empty());
  assert(BuildSegments({Spacing(0.0), Spacing(1.0)}).empty());
}

} // namespace

int main() {
  TestSpeakerChangeStartsNewSegment();
  TestSpeakerChangeMidSentenceEndsSegment();
  TestSentencesAccumulateWithinLimit();
  TestOverlongSentenceStandsAlone();
  TestSpeakerChangeKeepsOpenTurnTogether();
  TestSentenceFillingBudgetExactlyMerges();
  TestSegmentAfterOverlongSentenceStartsAtNextWord();
  TestSegmentsReconstructTokenText();
  TestMultibyteTextCountsCodePoints();
  TestMissingSpeakerBecomesUnknown();
  TestEmptyAndSpacingOnlyInput();

  std::cout << "transcription_unit_segment_builder: pass\n";
  return 0;
}
