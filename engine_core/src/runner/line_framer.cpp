/**
 * @file line_framer.cpp
 * @brief LineFramer implementation
 */

#include "BuildDeck/runner/line_framer.hpp"

namespace BuildDeck::runner {

std::vector<std::string> LineFramer::feed(std::string_view chunk) {
  std::vector<std::string> lines;

  usize start = 0;
  while (start < chunk.size()) {
    usize newline = chunk.find('\n', start);
    if (newline == std::string_view::npos) {
      m_pending.append(chunk.substr(start));
      break;
    }

    m_pending.append(chunk.substr(start, newline - start));
    lines.push_back(finishLine(std::move(m_pending)));
    m_pending.clear();
    start = newline + 1;
  }

  return lines;
}

std::optional<std::string> LineFramer::flush() {
  if (m_pending.empty()) {
    return std::nullopt;
  }
  std::string line = finishLine(std::move(m_pending));
  m_pending.clear();
  return line;
}

std::string LineFramer::finishLine(std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

} // namespace BuildDeck::runner
