#pragma once

/**
 * @file launcher_settings.hpp
 * @brief Persistent launcher settings (launcher_settings.json)
 *
 * Example file:
 * @code
 * {
 *   "logLevel": "info",
 *   "logFile": "logs/builddeck.log",
 *   "mergeStderr": false,
 *   "cancelGracePeriodMs": 5000,
 *   "pollIntervalMs": 100,
 *   "hostPlatform": "Linux"
 * }
 * @endcode
 *
 * Every key is optional. A missing file yields the defaults.
 */

#include "BuildDeck/core/logger.hpp"
#include "BuildDeck/core/result.hpp"
#include "BuildDeck/core/types.hpp"
#include "BuildDeck/runner/process_runner.hpp"
#include <QJsonObject>
#include <QString>
#include <optional>
#include <string>

namespace BuildDeck::editor {

struct LauncherSettings {
  core::LogLevel logLevel = core::LogLevel::Info;
  std::string logFile;             ///< Empty: console only
  bool mergeStderr = false;        ///< Parse stderr for progress markers too
  i32 cancelGracePeriodMs = 5000;  ///< Delay before a forced kill
  i32 pollIntervalMs = 100;        ///< Monitor tick and worker wake-up
  std::optional<runner::HostPlatform> hostPlatform; ///< Override of the detected host

  static constexpr const char* DEFAULT_FILENAME = "launcher_settings.json";

  /**
   * @brief Load settings from a JSON file
   *
   * A missing file is not an error. Malformed JSON, a value of the wrong type
   * or an out-of-range value fails with a message naming the key.
   */
  [[nodiscard]] static Result<LauncherSettings> load(const QString& path);

  [[nodiscard]] static Result<LauncherSettings> fromJson(const QJsonObject& json);

  [[nodiscard]] QJsonObject toJson() const;

  /**
   * @brief Write the settings as indented JSON, creating parent directories
   */
  [[nodiscard]] Result<void> save(const QString& path) const;

  /**
   * @brief Runner options for these settings
   */
  [[nodiscard]] runner::ProcessRunner::Options toRunnerOptions() const;

  /**
   * @brief Configure the global logger (level and optional log file)
   */
  [[nodiscard]] Result<void> applyLogging() const;

  bool operator==(const LauncherSettings&) const = default;
};

} // namespace BuildDeck::editor
