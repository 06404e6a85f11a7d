#pragma once

/**
 * @file progress_extractor.hpp
 * @brief Parses "[current/total]" progress markers out of tool output
 *
 * UnrealBuildTool prefixes each action with a marker such as
 * "[12/2743] Compile Module.Engine.cpp". Anything else is ordinary log text.
 */

#include "BuildDeck/core/types.hpp"
#include <optional>
#include <string_view>

namespace BuildDeck::runner {

/**
 * @brief One parsed marker; total is always > 0
 */
struct ProgressMarker {
  u64 current = 0;
  u64 total = 1;

  /**
   * @brief current/total, with current clamped to total
   */
  [[nodiscard]] f64 fraction() const;

  bool operator==(const ProgressMarker&) const = default;
};

namespace ProgressExtractor {

/**
 * @brief Find the first "[a/b]" pair in a line
 *
 * Whitespace is allowed around either number ("[ 3 / 10 ]"). A pair whose
 * total is zero yields no marker. Numbers too large for u64 do not count as a
 * pair and scanning continues after them.
 */
[[nodiscard]] std::optional<ProgressMarker> extract(std::string_view line);

} // namespace ProgressExtractor

} // namespace BuildDeck::runner
