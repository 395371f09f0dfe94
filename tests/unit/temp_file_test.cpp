#include "internal/util/temp_file.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

using transcription::util::ScopedTempDir;
using transcription::util::ScopedTempFile;

std::filesystem::path TestRoot() {
  const auto root = std::filesystem::temp_directory_path() / "transcription_temp_file_tests";
  std::filesystem::create_directories(root);
  return root;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void TestRemovedAtScopeExit() {
  std::filesystem::path path;
  {
    ScopedTempFile file(TestRoot(), ".wav");
    path = file.Path();
    assert(path.extension() == ".wav");
    assert(path.parent_path() == TestRoot());
    assert(!std::filesystem::exists(path));

    file.Write("RIFF");
    assert(ReadFile(path) == "RIFF");
  }
  assert(!std::filesystem::exists(path));
}

void TestRemovedWhenExceptionPropagates() {
  std::filesystem::path path;
  try {
    ScopedTempFile file(TestRoot(), ".mp3");
    path = file.Path();
    file.Write("ID3");
    throw std::runtime_error("provider failed");
  } catch (const std::runtime_error&) {
  }
  assert(!path.empty());
  assert(!std::filesystem::exists(path));
}

void TestCopyFrom() {
  const auto source = TestRoot() / "source.bin";
  {
    std::ofstream out(source, std::ios::binary | std::ios::trunc);
    out << "audio bytes";
  }

  ScopedTempFile file(TestRoot(), ".bin");
  file.CopyFrom(source);
  assert(ReadFile(file.Path()) == "audio bytes");
  std::filesystem::remove(source);
}

void TestMoveTransfersOwnership() {
  ScopedTempFile first(TestRoot(), ".tmp");
  first.Write("x");
  const auto path = first.Path();

  ScopedTempFile second(std::move(first));
  assert(second.Path() == path);
  assert(first.Path().empty());
  assert(std::filesystem::exists(path));
}

void TestNamesAreUnique() {
  ScopedTempFile a(TestRoot(), ".wav");
  ScopedTempFile b(TestRoot(), ".wav");
  assert(a.Path() != b.Path());
}

void TestTempDirRemovedRecursively() {
  std::filesystem::path dir;
  {
    ScopedTempDir scoped(TestRoot());
    dir = scoped.Path();
    assert(std::filesystem::is_directory(dir));

    std::filesystem::create_directories(dir / "nested");
    std::ofstream(dir / "nested" / "audio.m4a") << "m4a";
  }
  assert(!std::filesystem::exists(dir));
}

void TestResolveTempRootCreatesDirectory() {
  const auto configured = TestRoot() / "configured" / "deeper";
  std::filesystem::remove_all(configured);

  assert(transcription::util::ResolveTempRoot(configured.string()) == configured);
  assert(std::filesystem::is_directory(configured));
  assert(transcription::util::ResolveTempRoot("") == std::filesystem::temp_directory_path());
}

} // namespace

int main() {
  TestRemovedAtScopeExit();
  TestRemovedWhenExceptionPropagates();
  TestCopyFrom();
  TestMoveTransfersOwnership();
  TestNamesAreUnique();
  TestTempDirRemovedRecursively();
  TestResolveTempRootCreatesDirectory();

  std::cout << "transcription_unit_temp_file: pass\n";
  return 0;
}
