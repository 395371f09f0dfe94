#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace transcription::util {

/*
  Scoped transient files.

  The path is removed when the owner goes out of scope, on every exit path
  (return, caught error, propagating exception). Neither class creates the
  file itself; callers write to Path().
*/
class ScopedTempFile {
 public:
  // unique name under `dir` (system temp dir when empty) ending in `suffix`
  ScopedTempFile(const std::filesystem::path& dir, std::string_view suffix);
  ~ScopedTempFile();

  ScopedTempFile(const ScopedTempFile&)            = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  const std::filesystem::path& Path() const {
    return path_;
  }

  void Write(std::string_view bytes) const;
  void CopyFrom(const std::filesystem::path& source) const;

 private:
  void Remove() noexcept;

  std::filesystem::path path_;
};

class ScopedTempDir {
 public:
  explicit ScopedTempDir(const std::filesystem::path& parent);
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&)            = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

std::filesystem::path ResolveTempRoot(const std::string& configured);

} // namespace transcription::util
