#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace transcription::util {

/*
  UTF-8 text helpers shared by segmentation and scoring.

  Invalid byte sequences decode to U+FFFD instead of failing.
*/

std::u32string DecodeUtf8(std::string_view text);
std::string    EncodeUtf8(std::u32string_view text);

// number of code points
std::size_t Utf8Length(std::string_view text);

bool IsSpace(char32_t cp);

// approximates the regex class \w over Unicode
bool IsWordChar(char32_t cp);

char32_t ToLower(char32_t cp);

bool IsCjkIdeograph(char32_t cp);

std::string_view TrimView(std::string_view text);
std::string      Trim(std::string_view text);
std::string      RTrim(std::string_view text);

bool EndsWithSpace(std::string_view text);
bool StartsWithSpace(std::string_view text);

std::vector<std::string> SplitWhitespace(std::string_view text);
std::vector<std::string> Split(std::string_view text, char sep);

std::string Join(const std::vector<std::string>& parts, std::string_view sep);

} // namespace transcription::util
