#pragma once

#include <string>
#include <string_view>

namespace transcription::util {

struct CommandResult {
  int         exit_code = -1;
  std::string output; // stdout, stderr merged
};

// POSIX single-quote escaping for /bin/sh
std::string ShellQuote(std::string_view arg);

/*
  Runs `command` through /bin/sh and captures its output. Returns the exit
  status; only failure to spawn throws (std::runtime_error).
*/
CommandResult RunCommand(const std::string& command);

} // namespace transcription::util
