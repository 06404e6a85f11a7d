#pragma once

/**
 * @file line_framer.hpp
 * @brief Reassembles process output chunks into complete lines
 */

#include "BuildDeck/core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BuildDeck::runner {

/**
 * @brief Splits a byte stream on '\n', keeping the unterminated tail
 *
 * A trailing '\r' is removed from every line so CRLF output framed across
 * chunk boundaries comes out the same as LF output. The framer does no I/O;
 * use one instance per stream and per run.
 */
class LineFramer {
public:
  /**
   * @brief Consume a chunk and return the lines it completes, in order
   */
  std::vector<std::string> feed(std::string_view chunk);

  /**
   * @brief End of stream: return the buffered partial line, if any
   */
  std::optional<std::string> flush();

  /**
   * @brief Discard any buffered data
   */
  void reset() { m_pending.clear(); }

  [[nodiscard]] bool hasPending() const { return !m_pending.empty(); }
  [[nodiscard]] usize pendingSize() const { return m_pending.size(); }

private:
  static std::string finishLine(std::string line);

  std::string m_pending;
};

} // namespace BuildDeck::runner
