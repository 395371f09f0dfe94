#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace transcription::sources {

/*
  YouTube video ids are the external content key of remote assets.

  Accepted forms (http, https or no scheme; www., m. and music. hosts):
    youtube.com/watch?v=ID      youtu.be/ID
    youtube.com/shorts/ID       youtube.com/embed/ID

  ID is exactly 11 characters of [A-Za-z0-9_-]. Anything else throws
  util::ValidationError.
*/
std::string ParseVideoId(std::string_view url);

std::string WatchUrl(const std::string& video_id);

struct DownloadedAudio {
  std::filesystem::path path;
  std::string           title;
  std::string           mime_type;
};

/*
  Fetches the audio track of a video with yt-dlp.
*/
class YoutubeSource {
 public:
  explicit YoutubeSource(std::string downloader_path = "yt-dlp");
  virtual ~YoutubeSource() = default;

  // extracts the audio track into `workdir`; throws util::ProviderError
  virtual DownloadedAudio Download(const std::string& video_id, const std::filesystem::path& workdir) const;

 private:
  std::string downloader_path_;
};

} // namespace transcription::sources
