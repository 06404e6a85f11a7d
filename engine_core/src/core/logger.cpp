/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "BuildDeck/core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define BUILDDECK_ISATTY _isatty
#define BUILDDECK_FILENO _fileno
#else
#include <unistd.h>
#define BUILDDECK_ISATTY isatty
#define BUILDDECK_FILENO fileno
#endif

namespace BuildDeck::core {

std::optional<LogLevel> parseLogLevel(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "trace")
    return LogLevel::Trace;
  if (lower == "debug")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warn" || lower == "warning")
    return LogLevel::Warning;
  if (lower == "error")
    return LogLevel::Error;
  if (lower == "fatal")
    return LogLevel::Fatal;
  if (lower == "off" || lower == "none")
    return LogLevel::Off;
  return std::nullopt;
}

const char* logLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "trace";
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warning:
    return "warning";
  case LogLevel::Error:
    return "error";
  case LogLevel::Fatal:
    return "fatal";
  case LogLevel::Off:
    return "off";
  }
  return "info";
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger()
    : m_level(LogLevel::Info), m_useColors(BUILDDECK_ISATTY(BUILDDECK_FILENO(stderr)) != 0) {}

Logger::~Logger() {
  if (m_fileStream.is_open()) {
    m_fileStream.flush();
    m_fileStream.close();
  }
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

bool Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
  m_fileStream.open(path, std::ios::out | std::ios::app);
  return m_fileStream.is_open();
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
}

void Logger::setUseColors(bool useColors) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_useColors = useColors;
}

void Logger::addLogCallback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.push_back(std::move(callback));
}

void Logger::clearLogCallbacks() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.clear();
}

void Logger::log(LogLevel level, std::string_view message) {
  std::vector<LogCallback> callbacks;
  std::string text(message);

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level < m_level || level == LogLevel::Off) {
      return;
    }

    std::string line = getCurrentTimestamp() + " [" + levelToString(level) + "] " + text;

    std::ostream& console = level >= LogLevel::Warning ? std::cerr : std::clog;
    if (m_useColors) {
      console << levelToColor(level) << line << "\033[0m\n";
    } else {
      console << line << '\n';
    }

    if (m_fileStream.is_open()) {
      m_fileStream << line << '\n';
      if (level >= LogLevel::Error) {
        m_fileStream.flush();
      }
    }

    callbacks = m_callbacks;
  }

  // Callbacks run outside the lock so they may log themselves
  for (const auto& callback : callbacks) {
    callback(level, text);
  }
}

void Logger::trace(std::string_view message) { log(LogLevel::Trace, message); }
void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message) { log(LogLevel::Info, message); }
void Logger::warning(std::string_view message) { log(LogLevel::Warning, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, message); }
void Logger::fatal(std::string_view message) { log(LogLevel::Fatal, message); }

const char* Logger::levelToString(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  case LogLevel::Off:
    return "OFF";
  }
  return "UNKNOWN";
}

const char* Logger::levelToColor(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
    return "\033[90m";
  case LogLevel::Debug:
    return "\033[36m";
  case LogLevel::Info:
    return "\033[32m";
  case LogLevel::Warning:
    return "\033[33m";
  case LogLevel::Error:
  case LogLevel::Fatal:
    return "\033[31m";
  case LogLevel::Off:
    break;
  }
  return "";
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

} // namespace BuildDeck::core
