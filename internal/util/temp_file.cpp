#include "temp_file.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace transcription::util {

namespace {

void RemoveQuietly(const std::filesystem::path& path, bool recursive) noexcept {
  if (path.empty()) {
    return;
  }

  std::error_code ec;
  if (recursive) {
    std::filesystem::remove_all(path, ec);
  } else {
    std::filesystem::remove(path, ec);
  }

  if (ec) {
    TRANSCRIPTION_LOG_WARN("Failed to remove temporary path",
                           {transcription::observability::StringField("path", path.string()),
                            transcription::observability::StringField("error", ec.message())});
  }
}

} // namespace

std::filesystem::path ResolveTempRoot(const std::string& configured) {
  std::filesystem::path root = configured.empty() ? std::filesystem::temp_directory_path() : std::filesystem::path(configured);
  std::filesystem::create_directories(root);
  return root;
}

ScopedTempFile::ScopedTempFile(const std::filesystem::path& dir, std::string_view suffix)
    : path_((dir.empty() ? std::filesystem::temp_directory_path() : dir) / ("transcription-" + NewId() + std::string(suffix))) {
}

ScopedTempFile::~ScopedTempFile() {
  Remove();
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept : path_(std::exchange(other.path_, {})) {
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    Remove();
    path_ = std::exchange(other.path_, {});
  }
  return *this;
}

void ScopedTempFile::Write(std::string_view bytes) const {
  std::ofstream out(path_, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot create temporary file " + path_.string());
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    throw std::runtime_error("short write to temporary file " + path_.string());
  }
}

void ScopedTempFile::CopyFrom(const std::filesystem::path& source) const {
  std::filesystem::copy_file(source, path_, std::filesystem::copy_options::overwrite_existing);
}

void ScopedTempFile::Remove() noexcept {
  RemoveQuietly(path_, /*recursive=*/false);
  path_.clear();
}

ScopedTempDir::ScopedTempDir(const std::filesystem::path& parent)
    : path_((parent.empty() ? std::filesystem::temp_directory_path() : parent) / ("transcription-" + NewId())) {
  std::filesystem::create_directories(path_);
}

ScopedTempDir::~ScopedTempDir() {
  RemoveQuietly(path_, /*recursive=*/true);
}

} // namespace transcription::util
