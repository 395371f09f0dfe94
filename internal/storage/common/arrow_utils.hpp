#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace transcription::storage::common {

// Arrow failures surface as std::runtime_error; `context` names the file or step
inline void Unwrap(const arrow::Status& status, std::string_view context = {}) {
  if (status.ok()) {
    return;
  }
  if (context.empty()) {
    throw std::runtime_error(status.ToString());
  }
  throw std::runtime_error(std::string(context) + ": " + status.ToString());
}

template <typename T>
T Unwrap(arrow::Result<T> result, std::string_view context = {}) {
  Unwrap(result.status(), context);
  return std::move(result).ValueUnsafe();
}

/*
  Whole-file read into one Arrow buffer. Media files are read once per job
  and handed to providers in full, so there is no streaming variant.
*/
inline std::shared_ptr<arrow::Buffer> ReadFile(const std::string& path) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path), path);
  auto size = Unwrap(file->GetSize(), path);
  auto data = Unwrap(file->Read(size), path);
  Unwrap(file->Close(), path);
  return data;
}

} // namespace transcription::storage::common
