#include "youtube.hpp"

#include <algorithm>
#include <cctype>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/mime_type.hpp"
#include "internal/util/process.hpp"
#include "internal/util/text.hpp"

namespace transcription::sources {

namespace {

constexpr std::size_t kVideoIdLength = 11;

bool IsIdChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

// ID followed by end of string or a delimiter
bool TakeId(std::string_view s, std::string* out) {
  if (s.size() < kVideoIdLength || !std::all_of(s.begin(), s.begin() + kVideoIdLength, IsIdChar)) {
    return false;
  }
  if (s.size() > kVideoIdLength) {
    const char next = s[kVideoIdLength];
    if (next != '?' && next != '&' && next != '#' && next != '/') {
      return false;
    }
  }
  *out = std::string(s.substr(0, kVideoIdLength));
  return true;
}

bool ConsumePrefix(std::string_view& s, std::string_view prefix) {
  if (s.substr(0, prefix.size()) != prefix) {
    return false;
  }
  s.remove_prefix(prefix.size());
  return true;
}

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::string ParseVideoId(std::string_view url) {
  const auto invalid = [&] { return util::ValidationError("not a YouTube video URL: '" + std::string(url) + "'"); };

  std::string_view rest = util::TrimView(url);
  if (!ConsumePrefix(rest, "https://")) {
    ConsumePrefix(rest, "http://");
  }

  const auto  slash = rest.find('/');
  std::string host  = Lower(rest.substr(0, slash));
  rest              = slash == std::string_view::npos ? std::string_view() : rest.substr(slash);

  std::string id;
  if (host == "youtu.be" || host == "www.youtu.be") {
    if (ConsumePrefix(rest, "/") && TakeId(rest, &id)) {
      return id;
    }
    throw invalid();
  }

  if (host != "youtube.com" && host != "www.youtube.com" && host != "m.youtube.com" && host != "music.youtube.com") {
    throw invalid();
  }

  if (ConsumePrefix(rest, "/shorts/") || ConsumePrefix(rest, "/embed/")) {
    if (TakeId(rest, &id)) {
      return id;
    }
    throw invalid();
  }

  if (ConsumePrefix(rest, "/watch")) {
    const auto q = rest.find('?');
    if (q == std::string_view::npos) {
      throw invalid();
    }
    std::string_view query = rest.substr(q + 1);
    query                  = query.substr(0, query.find('#'));
    for (const auto& param : util::Split(query, '&')) {
      std::string_view p = param;
      if (ConsumePrefix(p, "v=") && p.size() == kVideoIdLength && TakeId(p, &id)) {
        return id;
      }
    }
  }
  throw invalid();
}

std::string WatchUrl(const std::string& video_id) {
  return "https://www.youtube.com/watch?v=" + video_id;
}

YoutubeSource::YoutubeSource(std::string downloader_path) : downloader_path_(downloader_path.empty() ? "yt-dlp" : std::move(downloader_path)) {
}

DownloadedAudio YoutubeSource::Download(const std::string& video_id, const std::filesystem::path& workdir) const {
  // re-validates; the id ends up on a command line
  const std::string id = ParseVideoId("youtu.be/" + video_id);

  const std::string command = util::ShellQuote(downloader_path_) + " --no-warnings --no-playlist --no-progress -x --audio-format m4a" +
                              " --print after_move:title" + " -o " + util::ShellQuote((workdir / (id + ".%(ext)s")).string()) + " " +
                              util::ShellQuote(WatchUrl(id));

  TRANSCRIPTION_LOG_INFO("downloading youtube audio", {observability::StringField("video_id", id)});

  util::CommandResult result;
  try {
    result = util::RunCommand(command);
  } catch (const std::runtime_error& e) {
    throw util::ProviderError(std::string("youtube: ") + e.what());
  }
  if (result.exit_code != 0) {
    throw util::ProviderError("youtube: download of " + id + " failed (exit " + std::to_string(result.exit_code) + "): " + util::Trim(result.output));
  }

  DownloadedAudio audio;
  for (const auto& entry : std::filesystem::directory_iterator(workdir)) {
    if (entry.is_regular_file() && entry.path().stem() == id) {
      audio.path = entry.path();
      break;
    }
  }
  if (audio.path.empty()) {
    throw util::ProviderError("youtube: downloader produced no audio file for " + id);
  }

  // --print writes the title as the last line
  const auto lines = util::Split(util::Trim(result.output), '\n');
  audio.title      = lines.empty() ? id : util::Trim(lines.back());
  if (audio.title.empty()) {
    audio.title = id;
  }
  audio.mime_type = util::GuessMimeType(audio.path);
  return audio;
}

} // namespace transcription::sources
