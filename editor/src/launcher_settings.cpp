/**
 * @file launcher_settings.cpp
 * @brief LauncherSettings load/save
 */

#include "BuildDeck/editor/launcher_settings.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>
#include <limits>

namespace BuildDeck::editor {

namespace {

Result<i32> readInt(const QJsonObject& json, const char* key, i32 fallback, i32 minimum) {
  const QJsonValue value = json.value(key);
  if (value.isUndefined()) {
    return Result<i32>::ok(fallback);
  }
  if (!value.isDouble()) {
    return Result<i32>::error(std::string("'") + key + "' must be a number");
  }

  const double number = value.toDouble();
  if (std::floor(number) != number) {
    return Result<i32>::error(std::string("'") + key + "' must be an integer");
  }
  if (number < minimum || number > std::numeric_limits<i32>::max()) {
    return Result<i32>::error(std::string("'") + key + "' must be at least " +
                              std::to_string(minimum));
  }
  return Result<i32>::ok(static_cast<i32>(number));
}

} // namespace

Result<LauncherSettings> LauncherSettings::load(const QString& path) {
  QFile file(path);
  if (!file.exists()) {
    BUILDDECK_LOG_DEBUG("Settings file not found, using defaults: {}", path.toStdString());
    return Result<LauncherSettings>::ok(LauncherSettings{});
  }

  if (!file.open(QIODevice::ReadOnly)) {
    return Result<LauncherSettings>::error("Failed to open settings file: " +
                                           path.toStdString());
  }

  QByteArray data = file.readAll();
  file.close();

  QJsonParseError error;
  QJsonDocument doc = QJsonDocument::fromJson(data, &error);
  if (error.error != QJsonParseError::NoError) {
    return Result<LauncherSettings>::error("Failed to parse " + path.toStdString() + ": " +
                                           error.errorString().toStdString());
  }
  if (!doc.isObject()) {
    return Result<LauncherSettings>::error("Settings root must be a JSON object");
  }

  auto settings = fromJson(doc.object());
  if (settings.isOk()) {
    BUILDDECK_LOG_INFO("Loaded settings from: {}", path.toStdString());
  }
  return settings;
}

Result<LauncherSettings> LauncherSettings::fromJson(const QJsonObject& json) {
  LauncherSettings settings;

  if (json.contains("logLevel")) {
    const QJsonValue value = json.value("logLevel");
    auto level = value.isString() ? core::parseLogLevel(value.toString().toStdString())
                                  : std::nullopt;
    if (!level) {
      return Result<LauncherSettings>::error(
          "'logLevel' must be one of trace, debug, info, warning, error, fatal, off");
    }
    settings.logLevel = *level;
  }

  if (json.contains("logFile")) {
    const QJsonValue value = json.value("logFile");
    if (!value.isString()) {
      return Result<LauncherSettings>::error("'logFile' must be a string");
    }
    settings.logFile = value.toString().toStdString();
  }

  if (json.contains("mergeStderr")) {
    const QJsonValue value = json.value("mergeStderr");
    if (!value.isBool()) {
      return Result<LauncherSettings>::error("'mergeStderr' must be a boolean");
    }
    settings.mergeStderr = value.toBool();
  }

  auto grace = readInt(json, "cancelGracePeriodMs", settings.cancelGracePeriodMs, 0);
  if (grace.isError()) {
    return Result<LauncherSettings>::error(grace.error());
  }
  settings.cancelGracePeriodMs = grace.value();

  auto poll = readInt(json, "pollIntervalMs", settings.pollIntervalMs, 1);
  if (poll.isError()) {
    return Result<LauncherSettings>::error(poll.error());
  }
  settings.pollIntervalMs = poll.value();

  if (json.contains("hostPlatform")) {
    const QJsonValue value = json.value("hostPlatform");
    auto host = value.isString() ? runner::parseHostPlatform(value.toString().toStdString())
                                 : std::nullopt;
    if (!host) {
      return Result<LauncherSettings>::error("'hostPlatform' must be Windows, Linux or Mac");
    }
    settings.hostPlatform = *host;
  }

  return Result<LauncherSettings>::ok(std::move(settings));
}

QJsonObject LauncherSettings::toJson() const {
  QJsonObject root;
  root.insert("logLevel", QString::fromLatin1(core::logLevelName(logLevel)));
  root.insert("logFile", QString::fromStdString(logFile));
  root.insert("mergeStderr", mergeStderr);
  root.insert("cancelGracePeriodMs", cancelGracePeriodMs);
  root.insert("pollIntervalMs", pollIntervalMs);
  if (hostPlatform) {
    root.insert("hostPlatform", QString::fromLatin1(runner::hostPlatformName(*hostPlatform)));
  }
  return root;
}

Result<void> LauncherSettings::save(const QString& path) const {
  QFileInfo info(path);
  if (!QDir().mkpath(info.absolutePath())) {
    return Result<void>::error("Failed to create directory: " +
                               info.absolutePath().toStdString());
  }

  QFile file(path);
  if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    return Result<void>::error("Failed to open settings file for writing: " +
                               path.toStdString());
  }

  QJsonDocument doc(toJson());
  const QByteArray bytes = doc.toJson(QJsonDocument::Indented);
  if (file.write(bytes) != bytes.size()) {
    return Result<void>::error("Failed to write settings file: " + path.toStdString());
  }
  file.close();

  BUILDDECK_LOG_INFO("Saved settings to: {}", path.toStdString());
  return Result<void>::ok();
}

runner::ProcessRunner::Options LauncherSettings::toRunnerOptions() const {
  runner::ProcessRunner::Options options;
  if (hostPlatform) {
    options.host = *hostPlatform;
  }
  options.mergeStderr = mergeStderr;
  options.cancelGracePeriod = std::chrono::milliseconds(cancelGracePeriodMs);
  options.pollInterval = std::chrono::milliseconds(pollIntervalMs);
  return options;
}

Result<void> LauncherSettings::applyLogging() const {
  auto& logger = core::Logger::instance();
  logger.setLevel(logLevel);

  if (logFile.empty()) {
    return Result<void>::ok();
  }

  QFileInfo info(QString::fromStdString(logFile));
  if (!QDir().mkpath(info.absolutePath())) {
    return Result<void>::error("Failed to create logs dir: " + info.absolutePath().toStdString());
  }
  if (!logger.setOutputFile(logFile)) {
    return Result<void>::error("Failed to open log file: " + logFile);
  }
  return Result<void>::ok();
}

} // namespace BuildDeck::editor
