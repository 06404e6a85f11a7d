#pragma once

/**
 * @file command_builder.hpp
 * @brief Turns a BuildRequest into the Unreal tool command line
 *
 * Build requests run Engine/Build/BatchFiles/Build.{bat,sh}; package requests
 * run RunUAT BuildCookRun. Paths are not checked here: a script that does not
 * exist shows up as a launch failure when the runner spawns it.
 */

#include "BuildDeck/core/result.hpp"
#include "BuildDeck/core/types.hpp"
#include "BuildDeck/runner/build_request.hpp"
#include <string>
#include <vector>

namespace BuildDeck::runner {

/**
 * @brief Fully resolved process invocation
 */
struct CommandLine {
  std::string executable;
  std::vector<std::string> arguments; // Not including argv[0]
  std::string workingDirectory;
  // Arguments after "/C" form one cmd.exe command, wrapped in an outer pair of quotes
  bool cmdShell = false;

  bool operator==(const CommandLine&) const = default;
};

class CommandBuilder {
public:
  explicit CommandBuilder(HostPlatform host = currentHostPlatform());

  /**
   * @brief Resolve the command for a request
   * @return Error if the request is missing required fields
   */
  [[nodiscard]] Result<CommandLine> build(const BuildRequest& request) const;

  /**
   * @brief Path of the script that performs the operation on this host
   */
  [[nodiscard]] std::string scriptPath(OperationKind operation, const std::string& engineRoot) const;

  /**
   * @brief Render a command line for logs ("exe" "arg 1" arg2 ...)
   */
  [[nodiscard]] static std::string describe(const CommandLine& command);

  /**
   * @brief Quote one argument following the MSVC runtime parsing rules
   */
  [[nodiscard]] static std::string quoteWindowsArgument(const std::string& arg);

  /**
   * @brief The exact command line handed to CreateProcess
   *
   * For cmdShell commands the payload becomes /S /C ""script" args...", so
   * cmd.exe strips only the outer quotes and paths with spaces survive.
   */
  [[nodiscard]] static std::string windowsCommandLine(const CommandLine& command);

  [[nodiscard]] HostPlatform host() const { return m_host; }

private:
  [[nodiscard]] std::vector<std::string> buildArguments(const BuildRequest& request) const;
  [[nodiscard]] std::vector<std::string> packageArguments(const BuildRequest& request) const;
  [[nodiscard]] CommandLine wrapForHost(const std::string& script,
                                        std::vector<std::string> arguments) const;

  HostPlatform m_host;
};

} // namespace BuildDeck::runner
