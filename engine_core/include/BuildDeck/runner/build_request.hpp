#pragma once

/**
 * @file build_request.hpp
 * @brief Description of one build or package invocation
 *
 * A BuildRequest is created by the caller right before starting an operation
 * and is never modified afterwards. It names what to run (operation kind,
 * configuration, target platform) and where (project, engine root, working
 * directory); turning it into an actual command line is the job of the
 * CommandBuilder.
 */

#include "BuildDeck/core/result.hpp"
#include "BuildDeck/core/types.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace BuildDeck::runner {

/**
 * @brief What the external tool is asked to do
 */
enum class OperationKind : u8 {
  Build,  // Compile the project (Build.bat / Build.sh)
  Package // Cook, stage and package (RunUAT BuildCookRun)
};

/**
 * @brief Unreal build configuration
 */
enum class BuildConfiguration : u8 { Debug, Development, Shipping };

/**
 * @brief Unreal target platform
 */
enum class TargetPlatform : u8 {
  Win64,
  Linux,
  Mac,
  Android,
  iOS,
  PS4,
  PS5,
  XBoxOne,
  XBoxSeries,
  Switch
};

/**
 * @brief Platform the launcher itself runs on (selects script names)
 */
enum class HostPlatform : u8 { Windows, Linux, Mac };

inline constexpr std::array<TargetPlatform, 10> kAllTargetPlatforms = {
    TargetPlatform::Win64,   TargetPlatform::Linux, TargetPlatform::Mac,
    TargetPlatform::Android, TargetPlatform::iOS,   TargetPlatform::PS4,
    TargetPlatform::PS5,     TargetPlatform::XBoxOne, TargetPlatform::XBoxSeries,
    TargetPlatform::Switch};

inline constexpr std::array<BuildConfiguration, 3> kAllConfigurations = {
    BuildConfiguration::Debug, BuildConfiguration::Development, BuildConfiguration::Shipping};

// Names as the Unreal tools expect them on the command line
[[nodiscard]] const char* operationKindName(OperationKind kind);
[[nodiscard]] const char* configurationName(BuildConfiguration config);
[[nodiscard]] const char* targetPlatformName(TargetPlatform platform);
[[nodiscard]] const char* hostPlatformName(HostPlatform host);

// Case-insensitive inverse of the *Name functions
[[nodiscard]] std::optional<OperationKind> parseOperationKind(std::string_view name);
[[nodiscard]] std::optional<BuildConfiguration> parseConfiguration(std::string_view name);
[[nodiscard]] std::optional<TargetPlatform> parseTargetPlatform(std::string_view name);
[[nodiscard]] std::optional<HostPlatform> parseHostPlatform(std::string_view name);

/**
 * @brief Host platform this binary was compiled for
 */
[[nodiscard]] HostPlatform currentHostPlatform();

/**
 * @brief One build or package invocation
 */
struct BuildRequest {
  OperationKind operation = OperationKind::Build;
  BuildConfiguration configuration = BuildConfiguration::Development;
  TargetPlatform platform = TargetPlatform::Win64;

  std::string projectPath;      // Path to the .uproject file
  std::string engineRoot;       // Directory that contains Engine/
  std::string workingDirectory; // Empty: the directory holding the .uproject

  /**
   * @brief Check that the required fields are present
   *
   * Only checks shape, never the filesystem: a path that does not exist
   * surfaces later as a launch failure.
   */
  [[nodiscard]] Result<void> validate() const;

  /**
   * @brief Project name as Unreal derives it (file stem of the .uproject)
   */
  [[nodiscard]] std::string projectName() const;

  bool operator==(const BuildRequest&) const = default;
};

} // namespace BuildDeck::runner
