#include "process.hpp"

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace transcription::util {

std::string ShellQuote(std::string_view arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

CommandResult RunCommand(const std::string& command) {
  const std::string full = command + " 2>&1";
  FILE*             pipe = popen(full.c_str(), "r");
  if (!pipe) {
    throw std::runtime_error("failed to spawn command: " + std::string(std::strerror(errno)));
  }

  CommandResult            result;
  std::array<char, 4096>   chunk;
  std::size_t              n = 0;
  while ((n = std::fread(chunk.data(), 1, chunk.size(), pipe)) > 0) {
    result.output.append(chunk.data(), n);
  }

  const int status = pclose(pipe);
  if (status == -1) {
    throw std::runtime_error("failed to wait for command: " + std::string(std::strerror(errno)));
  }
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
  return result;
}

} // namespace transcription::util
