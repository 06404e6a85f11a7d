/**
 * @file build_request.cpp
 * @brief BuildRequest helpers and enum name tables
 */

#include "BuildDeck/runner/build_request.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace BuildDeck::runner {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

template <typename Enum, usize N, typename NameFn>
std::optional<Enum> parseByName(std::string_view name, const std::array<Enum, N>& values,
                                NameFn nameOf) {
  for (Enum value : values) {
    if (equalsIgnoreCase(name, nameOf(value))) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace

const char* operationKindName(OperationKind kind) {
  switch (kind) {
  case OperationKind::Build:
    return "Build";
  case OperationKind::Package:
    return "Package";
  }
  return "Unknown";
}

const char* configurationName(BuildConfiguration config) {
  switch (config) {
  case BuildConfiguration::Debug:
    return "Debug";
  case BuildConfiguration::Development:
    return "Development";
  case BuildConfiguration::Shipping:
    return "Shipping";
  }
  return "Unknown";
}

const char* targetPlatformName(TargetPlatform platform) {
  switch (platform) {
  case TargetPlatform::Win64:
    return "Win64";
  case TargetPlatform::Linux:
    return "Linux";
  case TargetPlatform::Mac:
    return "Mac";
  case TargetPlatform::Android:
    return "Android";
  case TargetPlatform::iOS:
    return "iOS";
  case TargetPlatform::PS4:
    return "PS4";
  case TargetPlatform::PS5:
    return "PS5";
  case TargetPlatform::XBoxOne:
    return "XBoxOne";
  case TargetPlatform::XBoxSeries:
    return "XBoxSeries";
  case TargetPlatform::Switch:
    return "Switch";
  }
  return "Unknown";
}

const char* hostPlatformName(HostPlatform host) {
  switch (host) {
  case HostPlatform::Windows:
    return "Windows";
  case HostPlatform::Linux:
    return "Linux";
  case HostPlatform::Mac:
    return "Mac";
  }
  return "Unknown";
}

std::optional<OperationKind> parseOperationKind(std::string_view name) {
  static constexpr std::array<OperationKind, 2> kinds = {OperationKind::Build,
                                                         OperationKind::Package};
  return parseByName(name, kinds, operationKindName);
}

std::optional<BuildConfiguration> parseConfiguration(std::string_view name) {
  return parseByName(name, kAllConfigurations, configurationName);
}

std::optional<TargetPlatform> parseTargetPlatform(std::string_view name) {
  return parseByName(name, kAllTargetPlatforms, targetPlatformName);
}

std::optional<HostPlatform> parseHostPlatform(std::string_view name) {
  static constexpr std::array<HostPlatform, 3> hosts = {HostPlatform::Windows, HostPlatform::Linux,
                                                        HostPlatform::Mac};
  return parseByName(name, hosts, hostPlatformName);
}

HostPlatform currentHostPlatform() {
#ifdef _WIN32
  return HostPlatform::Windows;
#elif defined(__APPLE__)
  return HostPlatform::Mac;
#else
  return HostPlatform::Linux;
#endif
}

Result<void> BuildRequest::validate() const {
  if (projectPath.empty()) {
    return Result<void>::error("Project path is required");
  }
  if (engineRoot.empty()) {
    return Result<void>::error("Engine root is required");
  }
  if (projectName().empty()) {
    return Result<void>::error("Project path has no file name: " + projectPath);
  }
  return Result<void>::ok();
}

std::string BuildRequest::projectName() const {
  return fs::path(projectPath).stem().string();
}

} // namespace BuildDeck::runner
