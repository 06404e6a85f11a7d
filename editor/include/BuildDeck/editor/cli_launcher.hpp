#pragma once

/**
 * @file cli_launcher.hpp
 * @brief Command-line front end: builddeck <build|package> ...
 *
 * Runs one operation through a BuildMonitor inside the QCoreApplication
 * event loop, echoing the tool output and the progress percentage.
 * SIGINT/SIGTERM and --timeout cancel the run.
 */

#include "BuildDeck/core/result.hpp"
#include "BuildDeck/core/types.hpp"
#include "BuildDeck/runner/build_request.hpp"
#include "BuildDeck/runner/execution_state.hpp"
#include <string>

namespace BuildDeck::editor {

/**
 * @brief Parsed command-line options
 */
struct CliOptions {
  std::string operation; // "build" or "package"
  std::string engineRoot;
  std::string projectPath;
  std::string configuration = "Development";
  std::string platform;  // Empty: the host's own platform
  std::string workingDirectory;
  std::string settingsPath;
  i32 timeoutSeconds = 0; // 0: no timeout
  bool dryRun = false;
  bool verbose = false;
  bool help = false;
  bool version = false;
};

class CliLauncher {
public:
  static constexpr i32 EXIT_SUCCEEDED = 0;
  static constexpr i32 EXIT_FAILED = 1;
  static constexpr i32 EXIT_USAGE = 2;
  static constexpr i32 EXIT_CANCELLED = 130;

  /**
   * @brief Parse argv; unknown flags and missing values are usage errors
   */
  [[nodiscard]] static Result<CliOptions> parseArgs(int argc, char *argv[]);

  /**
   * @brief Turn parsed options into a validated BuildRequest
   */
  [[nodiscard]] static Result<runner::BuildRequest>
  toRequest(const CliOptions &options);

  [[nodiscard]] static i32 exitCodeFor(runner::Phase phase);

  static void printHelp(const char *programName);
  static void printVersion();

  /**
   * @brief Run the whole command; a QCoreApplication must exist
   * @return Process exit code
   */
  i32 run(int argc, char *argv[]);

private:
  i32 execute(const CliOptions &options);
};

} // namespace BuildDeck::editor
