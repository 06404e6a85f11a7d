/**
 * @file progress_extractor.cpp
 * @brief Progress marker scanner
 */

#include "BuildDeck/runner/progress_extractor.hpp"
#include <algorithm>
#include <charconv>

namespace BuildDeck::runner {

f64 ProgressMarker::fraction() const {
  if (total == 0) {
    return 0.0;
  }
  u64 clamped = std::min(current, total);
  return static_cast<f64>(clamped) / static_cast<f64>(total);
}

namespace ProgressExtractor {

namespace {

bool isSpace(char c) { return c == ' ' || c == '\t'; }
bool isDigit(char c) { return c >= '0' && c <= '9'; }

void skipSpaces(std::string_view line, usize& pos) {
  while (pos < line.size() && isSpace(line[pos])) {
    ++pos;
  }
}

// Parses a run of digits at pos. Fails on no digits or u64 overflow.
bool parseNumber(std::string_view line, usize& pos, u64& out) {
  usize begin = pos;
  while (pos < line.size() && isDigit(line[pos])) {
    ++pos;
  }
  if (pos == begin) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(line.data() + begin, line.data() + pos, out);
  return ec == std::errc{} && ptr == line.data() + pos;
}

// Tries to read "[ a / b ]" with the '[' at open. Returns the pair if well formed.
std::optional<ProgressMarker> parseBracket(std::string_view line, usize open) {
  usize pos = open + 1;
  ProgressMarker marker;

  skipSpaces(line, pos);
  if (!parseNumber(line, pos, marker.current)) {
    return std::nullopt;
  }
  skipSpaces(line, pos);
  if (pos >= line.size() || line[pos] != '/') {
    return std::nullopt;
  }
  ++pos;
  skipSpaces(line, pos);
  if (!parseNumber(line, pos, marker.total)) {
    return std::nullopt;
  }
  skipSpaces(line, pos);
  if (pos >= line.size() || line[pos] != ']') {
    return std::nullopt;
  }
  return marker;
}

} // namespace

std::optional<ProgressMarker> extract(std::string_view line) {
  usize open = line.find('[');
  while (open != std::string_view::npos) {
    if (auto marker = parseBracket(line, open)) {
      // First complete pair decides; a zero total means no progress here
      if (marker->total == 0) {
        return std::nullopt;
      }
      return marker;
    }
    open = line.find('[', open + 1);
  }
  return std::nullopt;
}

} // namespace ProgressExtractor

} // namespace BuildDeck::runner
