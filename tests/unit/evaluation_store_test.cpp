#include "internal/evaluation/evaluation_store.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using transcription::evaluation::EvaluationRecord;
using transcription::evaluation::EvaluationStore;

std::filesystem::path TestDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "transcription_evaluation_store_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

EvaluationRecord Record(std::int64_t id, std::string reference, std::string hypothesis, double metric, double seconds) {
  EvaluationRecord r;
  r.sample_id       = id;
  r.reference       = std::move(reference);
  r.hypothesis      = std::move(hypothesis);
  r.metric_value    = metric;
  r.processing_time = seconds;
  return r;
}

void TestMissingFileIsEmpty() {
  assert(EvaluationStore::Load(TestDir("missing") / "none.csv").empty());
}

void TestSaveThenLoadKeepsAwkwardText() {
  const auto path = TestDir("awkward") / "nested" / "results.csv";

  const std::vector<EvaluationRecord> records = {
      Record(0, "hello, world", "hello world", 0.0, 1.25),
      Record(3, "she said \"no\"", "she said no", 0.5, 0.75),
      Record(7, "line one\nline two", "", 1.0, 2.0),
  };
  EvaluationStore::Save(path, records);
  assert(std::filesystem::exists(path));
  assert(!std::filesystem::exists(path.string() + ".tmp"));

  const auto loaded = EvaluationStore::Load(path);
  assert(loaded.size() == 3);
  assert(loaded[0].reference == "hello, world");
  assert(loaded[1].sample_id == 3);
  assert(loaded[1].reference == "she said \"no\"");
  assert(loaded[2].reference == "line one\nline two");
  assert(loaded[2].hypothesis.empty());
  assert(std::fabs(loaded[1].metric_value - 0.5) < 1e-12);
  assert(std::fabs(loaded[2].processing_time - 2.0) < 1e-12);
}

void TestSaveReplacesPreviousTable() {
  const auto path = TestDir("replace") / "results.csv";
  EvaluationStore::Save(path, {Record(0, "a", "a", 0.0, 1.0), Record(1, "b", "c", 1.0, 1.0)});
  EvaluationStore::Save(path, {Record(5, "x", "x", 0.0, 0.5)});

  const auto loaded = EvaluationStore::Load(path);
  assert(loaded.size() == 1);
  assert(loaded[0].sample_id == 5);
}

void TestEmptyTable() {
  const auto path = TestDir("empty") / "results.csv";
  EvaluationStore::Save(path, {});
  assert(std::filesystem::exists(path));
  assert(EvaluationStore::Load(path).empty());
}

void TestReadDelimitedTsv() {
  const auto path = TestDir("tsv") / "test.tsv";
  {
    std::ofstream out(path);
    out << "client_id\tpath\tsentence\tup_votes\n";
    out << "c1\tclip_1.mp3\tIt's a \"quoted\" line.\t2\n";
    out << "c2\tclip_2.mp3\tSecond sentence\t0\n";
  }

  const auto rows = transcription::evaluation::ReadDelimited(path, '\t', {"path", "sentence"});
  assert(rows.size() == 2);
  assert(rows[0].at("path") == "clip_1.mp3");
  assert(rows[0].at("sentence") == "It's a \"quoted\" line.");
  assert(rows[1].at("sentence") == "Second sentence");
  assert(rows[0].count("client_id") == 0);
}

void TestReadDelimitedErrors() {
  const auto dir = TestDir("errors");

  bool not_found = false;
  try {
    (void)transcription::evaluation::ReadDelimited(dir / "absent.tsv", '\t', {"path"});
  } catch (const transcription::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  const auto path = dir / "short.tsv";
  {
    std::ofstream out(path);
    out << "path\tup_votes\n";
    out << "clip.mp3\t1\n";
  }
  bool parse_error = false;
  try {
    (void)transcription::evaluation::ReadDelimited(path, '\t', {"path", "sentence"});
  } catch (const transcription::util::ParseError&) {
    parse_error = true;
  }
  assert(parse_error);
}

} // namespace

int main() {
  TestMissingFileIsEmpty();
  TestSaveThenLoadKeepsAwkwardText();
  TestSaveReplacesPreviousTable();
  TestEmptyTable();
  TestReadDelimitedTsv();
  TestReadDelimitedErrors();

  std::cout << "transcription_unit_evaluation_store: pass\n";
  return 0;
}
