/**
 * @file cli_launcher.cpp
 * @brief Command-line front end implementation
 */

#include "BuildDeck/editor/cli_launcher.hpp"
#include "BuildDeck/core/logger.hpp"
#include "BuildDeck/core/version.hpp"
#include "BuildDeck/editor/launcher_settings.hpp"
#include "BuildDeck/editor/qt/build_monitor.hpp"
#include "BuildDeck/runner/command_builder.hpp"
#include <QCoreApplication>
#include <QTimer>
#include <atomic>
#include <charconv>
#include <csignal>
#include <iostream>
#include <optional>

namespace BuildDeck::editor {

namespace {

// Written from the signal handler, read by a timer in the event loop
std::atomic<bool> g_interruptRequested{false};

void handleInterrupt(int) { g_interruptRequested = true; }

runner::TargetPlatform defaultTargetPlatform(runner::HostPlatform host) {
  switch (host) {
  case runner::HostPlatform::Windows:
    return runner::TargetPlatform::Win64;
  case runner::HostPlatform::Linux:
    return runner::TargetPlatform::Linux;
  case runner::HostPlatform::Mac:
    return runner::TargetPlatform::Mac;
  }
  return runner::TargetPlatform::Win64;
}

} // namespace

Result<CliOptions> CliLauncher::parseArgs(int argc, char *argv[]) {
  CliOptions opts;

  auto takeValue = [&](int &i, const std::string &flag) -> Result<std::string> {
    if (i + 1 >= argc) {
      return Result<std::string>::error("Missing value for " + flag);
    }
    return Result<std::string>::ok(argv[++i]);
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--version") {
      opts.version = true;
    } else if (arg == "--dry-run") {
      opts.dryRun = true;
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (arg == "--engine" || arg == "--project" || arg == "--config" ||
               arg == "--platform" || arg == "--workdir" || arg == "--settings" ||
               arg == "--timeout") {
      auto value = takeValue(i, arg);
      if (value.isError()) {
        return Result<CliOptions>::error(value.error());
      }

      if (arg == "--engine") {
        opts.engineRoot = value.value();
      } else if (arg == "--project") {
        opts.projectPath = value.value();
      } else if (arg == "--config") {
        opts.configuration = value.value();
      } else if (arg == "--platform") {
        opts.platform = value.value();
      } else if (arg == "--workdir") {
        opts.workingDirectory = value.value();
      } else if (arg == "--settings") {
        opts.settingsPath = value.value();
      } else {
        const std::string &text = value.value();
        i32 seconds = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
        if (ec != std::errc() || end != text.data() + text.size() || seconds < 0) {
          return Result<CliOptions>::error("Invalid --timeout value: " + text);
        }
        opts.timeoutSeconds = seconds;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      return Result<CliOptions>::error("Unknown option: " + arg);
    } else if (opts.operation.empty()) {
      opts.operation = arg;
    } else {
      return Result<CliOptions>::error("Unexpected argument: " + arg);
    }
  }

  return Result<CliOptions>::ok(std::move(opts));
}

Result<runner::BuildRequest> CliLauncher::toRequest(const CliOptions &options) {
  runner::BuildRequest request;

  if (options.operation.empty()) {
    return Result<runner::BuildRequest>::error("No operation given (build or package)");
  }
  auto operation = runner::parseOperationKind(options.operation);
  if (!operation) {
    return Result<runner::BuildRequest>::error("Unknown operation: " + options.operation);
  }
  request.operation = *operation;

  auto configuration = runner::parseConfiguration(options.configuration);
  if (!configuration) {
    return Result<runner::BuildRequest>::error("Unknown configuration: " +
                                               options.configuration);
  }
  request.configuration = *configuration;

  if (options.platform.empty()) {
    request.platform = defaultTargetPlatform(runner::currentHostPlatform());
  } else {
    auto platform = runner::parseTargetPlatform(options.platform);
    if (!platform) {
      return Result<runner::BuildRequest>::error("Unknown platform: " + options.platform);
    }
    request.platform = *platform;
  }

  request.engineRoot = options.engineRoot;
  request.projectPath = options.projectPath;
  request.workingDirectory = options.workingDirectory;

  auto valid = request.validate();
  if (valid.isError()) {
    return Result<runner::BuildRequest>::error(valid.error());
  }
  return Result<runner::BuildRequest>::ok(std::move(request));
}

i32 CliLauncher::exitCodeFor(runner::Phase phase) {
  switch (phase) {
  case runner::Phase::Succeeded:
    return EXIT_SUCCEEDED;
  case runner::Phase::Cancelled:
    return EXIT_CANCELLED;
  case runner::Phase::Idle:
  case runner::Phase::Running:
  case runner::Phase::Failed:
    return EXIT_FAILED;
  }
  return EXIT_FAILED;
}

void CliLauncher::printVersion() {
  std::cout << "BuildDeck version " << BUILDDECK_VERSION_MAJOR << "." << BUILDDECK_VERSION_MINOR
            << "." << BUILDDECK_VERSION_PATCH << "\n";
  std::cout << "Unreal Engine build and packaging launcher\n";
}

void CliLauncher::printHelp(const char *programName) {
  std::cout << "Usage: " << programName << " <build|package> [options]\n\n";
  std::cout << "Runs the Unreal build or BuildCookRun packaging scripts for a project.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --engine <dir>        Unreal Engine root directory (required)\n";
  std::cout << "  --project <file>      Path to the .uproject file (required)\n";
  std::cout << "  --config <name>       Debug, Development (default) or Shipping\n";
  std::cout << "  --platform <name>     Target platform (default: host platform)\n";
  std::cout << "  --workdir <dir>       Working directory (default: project directory)\n";
  std::cout << "  --settings <file>     Launcher settings JSON (default: "
            << LauncherSettings::DEFAULT_FILENAME << ")\n";
  std::cout << "  --timeout <seconds>   Cancel the run after this many seconds\n";
  std::cout << "  --dry-run             Print the command line without running it\n";
  std::cout << "  --verbose             Verbose logging\n";
  std::cout << "  -h, --help            Show this help message\n";
  std::cout << "  --version             Show version information\n\n";
  std::cout << "Platforms:";
  for (auto platform : runner::kAllTargetPlatforms) {
    std::cout << " " << runner::targetPlatformName(platform);
  }
  std::cout << "\n\n";
  std::cout << "Exit codes: 0 succeeded, 1 failed, 2 usage error, 130 cancelled\n";
}

i32 CliLauncher::run(int argc, char *argv[]) {
  auto parsed = parseArgs(argc, argv);
  if (parsed.isError()) {
    std::cerr << "Error: " << parsed.error() << "\n";
    std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
    return EXIT_USAGE;
  }

  const CliOptions &options = parsed.value();
  if (options.help) {
    printHelp(argv[0]);
    return EXIT_SUCCEEDED;
  }
  if (options.version) {
    printVersion();
    return EXIT_SUCCEEDED;
  }

  return execute(options);
}

i32 CliLauncher::execute(const CliOptions &options) {
  const QString settingsPath = options.settingsPath.empty()
                                   ? QString::fromLatin1(LauncherSettings::DEFAULT_FILENAME)
                                   : QString::fromStdString(options.settingsPath);
  auto loaded = LauncherSettings::load(settingsPath);
  if (loaded.isError()) {
    std::cerr << "Error: " << loaded.error() << "\n";
    return EXIT_USAGE;
  }

  LauncherSettings settings = loaded.value();
  if (options.verbose && settings.logLevel > core::LogLevel::Debug) {
    settings.logLevel = core::LogLevel::Debug;
  }
  auto logging = settings.applyLogging();
  if (logging.isError()) {
    BUILDDECK_LOG_WARN("Logging to console only: {}", logging.error());
  }

  auto request = toRequest(options);
  if (request.isError()) {
    std::cerr << "Error: " << request.error() << "\n";
    return EXIT_USAGE;
  }

  runner::ProcessRunner::Options runnerOptions = settings.toRunnerOptions();

  if (options.dryRun) {
    runner::CommandBuilder builder(runnerOptions.host);
    auto command = builder.build(request.value());
    if (command.isError()) {
      std::cerr << "Error: " << command.error() << "\n";
      return EXIT_FAILED;
    }
    std::cout << runner::CommandBuilder::describe(command.value()) << "\n";
    if (!command.value().workingDirectory.empty()) {
      std::cout << "(in " << command.value().workingDirectory << ")\n";
    }
    return EXIT_SUCCEEDED;
  }

  qt::BuildMonitor monitor(std::move(runnerOptions));
  std::optional<runner::Phase> finalPhase;
  int lastPercent = -1;

  QObject::connect(&monitor, &qt::BuildMonitor::logLinesAppended,
                   [](const QStringList &lines) {
                     for (const auto &line : lines) {
                       std::cout << line.toStdString() << "\n";
                     }
                     std::cout.flush();
                   });
  QObject::connect(&monitor, &qt::BuildMonitor::progressChanged, [&lastPercent](double fraction) {
    int percent = static_cast<int>(fraction * 100.0);
    if (percent != lastPercent) {
      lastPercent = percent;
      std::cout << "Progress: " << percent << "%\n";
    }
  });
  QObject::connect(&monitor, &qt::BuildMonitor::runFinished,
                   [&finalPhase](runner::Phase phase, int exitCode, const QString &message) {
                     finalPhase = phase;
                     std::cout << runner::phaseName(phase);
                     if (exitCode >= 0) {
                       std::cout << " (exit code " << exitCode << ")";
                     }
                     std::cout << ": " << message.toStdString() << "\n";
                     QCoreApplication::quit();
                   });

  g_interruptRequested = false;
  std::signal(SIGINT, handleInterrupt);
  std::signal(SIGTERM, handleInterrupt);

  QTimer interruptTimer;
  interruptTimer.setInterval(100);
  QObject::connect(&interruptTimer, &QTimer::timeout, [&monitor, &interruptTimer]() {
    if (g_interruptRequested) {
      BUILDDECK_LOG_INFO("Interrupted, cancelling the run");
      interruptTimer.stop();
      monitor.cancel();
    }
  });

  QTimer timeoutTimer;
  timeoutTimer.setSingleShot(true);
  if (options.timeoutSeconds > 0) {
    QObject::connect(&timeoutTimer, &QTimer::timeout, [&monitor, &options]() {
      BUILDDECK_LOG_WARN("Timed out after {} s, cancelling the run", options.timeoutSeconds);
      monitor.cancel();
    });
  }

  auto started = monitor.start(request.value());
  if (started.isError()) {
    std::cerr << "Error: " << runner::startErrorToString(started.error()) << "\n";
    return EXIT_FAILED;
  }

  // A launch failure has already been reported
  if (!finalPhase) {
    interruptTimer.start();
    if (options.timeoutSeconds > 0) {
      timeoutTimer.start(options.timeoutSeconds * 1000);
    }
    QCoreApplication::exec();
  }

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);

  return exitCodeFor(finalPhase.value_or(monitor.snapshot().phase));
}

} // namespace BuildDeck::editor
