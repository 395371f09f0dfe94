#include "internal/sources/youtube.hpp"

#include <sys/stat.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace {

using transcription::sources::ParseVideoId;

constexpr const char* kId = "dQw4w9WgXcQ";

std::filesystem::path TestDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "transcription_youtube_source_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

// stands in for yt-dlp: honours -o and prints a title
std::filesystem::path WriteScript(const std::filesystem::path& dir, const std::string& body) {
  const auto    path = dir / "fake-yt-dlp.sh";
  std::ofstream out(path);
  out << "#!/bin/sh\n" << body;
  out.close();
  ::chmod(path.c_str(), 0755);
  return path;
}

bool Rejected(const std::string& url) {
  try {
    (void)ParseVideoId(url);
  } catch (const transcription::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestParseAcceptedForms() {
  assert(ParseVideoId("https://www.youtube.com/watch?v=dQw4w9WgXcQ") == kId);
  assert(ParseVideoId("https://youtube.com/watch?feature=share&v=dQw4w9WgXcQ&t=42") == kId);
  assert(ParseVideoId("http://m.youtube.com/watch?v=dQw4w9WgXcQ") == kId);
  assert(ParseVideoId("https://music.youtube.com/watch?v=dQw4w9WgXcQ") == kId);
  assert(ParseVideoId("https://youtu.be/dQw4w9WgXcQ?si=abc") == kId);
  assert(ParseVideoId("youtu.be/dQw4w9WgXcQ") == kId);
  assert(ParseVideoId("https://www.youtube.com/shorts/dQw4w9WgXcQ") == kId);
  assert(ParseVideoId("https://www.youtube.com/embed/dQw4w9WgXcQ") == kId);
}

void TestParseRejectsOtherInput() {
  assert(Rejected(""));
  assert(Rejected("not a url"));
  assert(Rejected("https://vimeo.com/123456"));
  assert(Rejected("https://www.youtube.com/watch?v=short"));
  assert(Rejected("https://www.youtube.com/watch?list=PL123"));
  assert(Rejected("https://youtu.be/dQw4w9WgXc$"));
  assert(Rejected("https://notyoutube.com/watch?v=dQw4w9WgXcQ"));
}

void TestShellQuote() {
  assert(transcription::util::ShellQuote("plain") == "'plain'");
  assert(transcription::util::ShellQuote("it's") == "'it'\\''s'");

  const auto result = transcription::util::RunCommand("printf '%s' " + transcription::util::ShellQuote("a b;c"));
  assert(result.exit_code == 0);
  assert(result.output == "a b;c");
}

void TestDownloadRunsDownloader() {
  const auto dir    = TestDir("download");
  const auto script = WriteScript(dir,
                                  "out=\"\"\n"
                                  "while [ $# -gt 0 ]; do\n"
                                  "  if [ \"$1\" = \"-o\" ]; then out=\"$2\"; shift; fi\n"
                                  "  shift\n"
                                  "done\n"
                                  "file=$(printf '%s' \"$out\" | sed 's/%(ext)s/m4a/')\n"
                                  "printf 'audio' > \"$file\"\n"
                                  "echo '[ExtractAudio] Destination: x'\n"
                                  "echo 'Never Gonna Give You Up'\n");

  const auto workdir = dir / "work";
  std::filesystem::create_directories(workdir);

  transcription::sources::YoutubeSource source(script.string());
  const auto                            audio = source.Download(kId, workdir);

  assert(audio.path == workdir / "dQw4w9WgXcQ.m4a");
  assert(std::filesystem::exists(audio.path));
  assert(audio.title == "Never Gonna Give You Up");
  assert(audio.mime_type == "audio/mp4");
}

void TestDownloaderFailureIsProviderError() {
  const auto dir    = TestDir("failure");
  const auto script = WriteScript(dir, "echo 'ERROR: Video unavailable'\nexit 1\n");

  transcription::sources::YoutubeSource source(script.string());

  bool threw = false;
  try {
    (void)source.Download(kId, dir);
  } catch (const transcription::util::ProviderError& e) {
    threw = std::string(e.what()).find("Video unavailable") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestParseAcceptedForms();
  TestParseRejectsOtherInput();
  TestShellQuote();
  TestDownloadRunsDownloader();
  TestDownloaderFailureIsProviderError();

  std::cout << "transcription_unit_youtube_source: pass\n";
  return 0;
}
