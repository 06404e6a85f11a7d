/**
 * @file test_process_runner.cpp
 * @brief ProcessRunner against real child processes
 *
 * The command resolver is replaced so every run executes a small /bin/sh
 * script instead of the Unreal tooling.
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "BuildDeck/runner/child_process.hpp"
#include "BuildDeck/runner/process_runner.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#ifndef _WIN32

using namespace BuildDeck;
using namespace BuildDeck::runner;
using Catch::Approx;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

BuildRequest makeRequest() {
  BuildRequest request;
  request.projectPath = "/tmp/Shooter/Shooter.uproject";
  request.engineRoot = "/opt/UE";
  return request;
}

ProcessRunner::Options shellOptions(const std::string &script,
                                    const std::string &workingDirectory = "/tmp") {
  ProcessRunner::Options options;
  options.resolver = [script, workingDirectory](const BuildRequest &) {
    CommandLine command;
    command.executable = "/bin/sh";
    command.arguments = {"-c", script};
    command.workingDirectory = workingDirectory;
    return Result<CommandLine>::ok(command);
  };
  options.pollInterval = 20ms;
  options.cancelGracePeriod = 500ms;
  return options;
}

ProcessRunner::Options commandOptions(const std::string &executable) {
  ProcessRunner::Options options;
  options.resolver = [executable](const BuildRequest &) {
    CommandLine command;
    command.executable = executable;
    return Result<CommandLine>::ok(command);
  };
  options.pollInterval = 20ms;
  return options;
}

} // namespace

TEST_CASE("ProcessRunner successful build with progress", "[process_runner]") {
  ProcessRunner runner(shellOptions("echo '[1/10]'; echo '[5/10]'; echo '[10/10]'; exit 0"));

  auto started = runner.start(makeRequest());
  REQUIRE(started.isOk());
  REQUIRE(runner.waitForFinish(10s));

  auto state = runner.snapshot();
  CHECK(state.runId == started.value());
  CHECK(state.phase == Phase::Succeeded);
  CHECK(state.progress == Approx(1.0));
  REQUIRE(state.log.size() == 3);
  CHECK(state.log[0].text == "[1/10]");
  CHECK(state.log[2].text == "[10/10]");
  REQUIRE(state.exitInfo.has_value());
  CHECK(state.exitInfo->exitCode == 0);
  CHECK(state.exitInfo->failure == FailureKind::None);
  CHECK(state.durationMs >= 0.0);
}

TEST_CASE("ProcessRunner nonzero exit fails with the code", "[process_runner]") {
  ProcessRunner runner(shellOptions("echo 'Compiling'; exit 1"));

  REQUIRE(runner.start(makeRequest()).isOk());
  REQUIRE(runner.waitForFinish(10s));

  auto state = runner.snapshot();
  CHECK(state.phase == Phase::Failed);
  CHECK(state.progress == 0.0);
  REQUIRE(state.exitInfo.has_value());
  CHECK(state.exitInfo->exitCode == 1);
  CHECK(state.exitInfo->failure == FailureKind::NonZeroExit);
}

TEST_CASE("ProcessRunner keeps the final unterminated line", "[process_runner]") {
  ProcessRunner runner(shellOptions("printf 'first\\r\\nlast [2/4]'"));

  REQUIRE(runner.start(makeRequest()).isOk());
  REQUIRE(runner.waitForFinish(10s));

  auto state = runner.snapshot();
  CHECK(state.phase == Phase::Succeeded);
  REQUIRE(state.log.size() == 2);
  CHECK(state.log[0].text == "first");
  CHECK(state.log[1].text == "last [2/4]");
  CHECK(state.progress == Approx(0.5));
}

TEST_CASE("ProcessRunner cancel ends in Cancelled", "[process_runner]") {
  ProcessRunner runner(shellOptions("echo '[1/100]'; sleep 30; echo '[100/100]'"));

  REQUIRE(runner.start(makeRequest()).isOk());

  // Wait for the first line so the shell is definitely running
  for (int i = 0; i < 200 && runner.snapshot().log.empty(); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  CHECK(runner.isRunning());

  runner.cancel();
  REQUIRE(runner.waitForFinish(10s));

  auto state = runner.snapshot();
  CHECK(state.phase == Phase::Cancelled);
  CHECK(state.progress == Approx(0.01));
  REQUIRE(state.exitInfo.has_value());
  CHECK(state.exitInfo->failure == FailureKind::None);
}

TEST_CASE("ProcessRunner forces a kill after the grace period", "[process_runner]") {
  ProcessRunner runner(shellOptions("trap '' TERM; echo ready; while true; do sleep 0.1; done"));

  REQUIRE(runner.start(makeRequest()).isOk());
  for (int i = 0; i < 200 && runner.snapshot().log.empty(); ++i) {
    std::this_thread::sleep_for(10ms);
  }

  runner.cancel();
  REQUIRE(runner.waitForFinish(10s));
  CHECK(runner.phase() == Phase::Cancelled);
}

TEST_CASE("ProcessRunner kills a chatty process within the grace period", "[process_runner]") {
  auto options = shellOptions("trap '' TERM; yes '[1/2] x'");
  options.cancelGracePeriod = 300ms;
  ProcessRunner runner(std::move(options));

  REQUIRE(runner.start(makeRequest()).isOk());
  for (int i = 0; i < 200 && runner.snapshot().log.empty(); ++i) {
    std::this_thread::sleep_for(10ms);
  }

  auto cancelledAt = std::chrono::steady_clock::now();
  runner.cancel();
  REQUIRE(runner.waitForFinish(5s));
  auto elapsed = std::chrono::steady_clock::now() - cancelledAt;

  CHECK(runner.phase() == Phase::Cancelled);
  CHECK(elapsed < 3s);
}

TEST_CASE("ProcessRunner cancel right after start", "[process_runner]") {
  ProcessRunner runner(shellOptions("sleep 30; echo '[1/1]'"));

  for (int attempt = 0; attempt < 5; ++attempt) {
    REQUIRE(runner.start(makeRequest()).isOk());
    runner.cancel();
    REQUIRE(runner.waitForFinish(10s));

    auto state = runner.snapshot();
    CHECK(state.phase == Phase::Cancelled);
    CHECK(state.log.empty());
    CHECK(state.progress == 0.0);
  }
}

TEST_CASE("ProcessRunner cancel after the process exited keeps success", "[process_runner]") {
  // The unterminated line is only dispatched once the exit has been reaped
  ProcessRunner runner(shellOptions("printf 'tail'; exit 0"));

  std::atomic<bool> reachedTail{false};
  std::atomic<bool> cancelDone{false};
  runner.setOnLogLine([&](const LogLine &line) {
    if (line.text != "tail") {
      return;
    }
    reachedTail = true;
    for (int i = 0; i < 500 && !cancelDone; ++i) {
      std::this_thread::sleep_for(10ms);
    }
  });

  REQUIRE(runner.start(makeRequest()).isOk());
  for (int i = 0; i < 500 && !reachedTail; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  REQUIRE(reachedTail.load());

  runner.cancel();
  cancelDone = true;
  REQUIRE(runner.waitForFinish(10s));

  auto state = runner.snapshot();
  CHECK(state.phase == Phase::Succeeded);
  REQUIRE(state.exitInfo.has_value());
  CHECK(state.exitInfo->exitCode == 0);
}

TEST_CASE("ChildProcess terminate after reaping sends nothing", "[process_runner]") {
  CommandLine command;
  command.executable = "/bin/sh";
  command.arguments = {"-c", "exit 0"};

  auto spawned = ChildProcess::spawn(command, false);
  REQUIRE(spawned.isOk());
  auto child = std::move(spawned.value());

  std::optional<ProcessExit> exit;
  for (int i = 0; i < 500 && !exit; ++i) {
    exit = child->tryWait();
    if (!exit) {
      std::this_thread::sleep_for(10ms);
    }
  }
  REQUIRE(exit.has_value());
  CHECK(exit->exitCode == 0);

  CHECK_FALSE(child->terminate());
  CHECK_FALSE(child->terminationRequested());
}

TEST_CASE("ProcessRunner rejects start while running", "[process_runner]") {
  ProcessRunner runner(shellOptions("echo busy; sleep 30"));

  auto first = runner.start(makeRequest());
  REQUIRE(first.isOk());
  for (int i = 0; i < 200 && runner.snapshot().log.empty(); ++i) {
    std::this_thread::sleep_for(10ms);
  }

  auto second = runner.start(makeRequest());
  REQUIRE(second.isError());
  CHECK(second.error() == StartError::AlreadyRunning);

  auto state = runner.snapshot();
  CHECK(state.runId == first.value());
  CHECK(state.phase == Phase::Running);

  runner.cancel();
  REQUIRE(runner.waitForFinish(10s));
}

TEST_CASE("ProcessRunner cancel when idle is a no-op", "[process_runner]") {
  ProcessRunner runner(shellOptions("exit 0"));
  runner.cancel();
  CHECK(runner.phase() == Phase::Idle);
  CHECK(runner.waitForFinish(0ms));
}

TEST_CASE("ProcessRunner invalid request leaves state untouched", "[process_runner]") {
  ProcessRunner runner(shellOptions("exit 0"));

  BuildRequest request;
  auto started = runner.start(request);
  REQUIRE(started.isError());
  CHECK(started.error() == StartError::InvalidRequest);
  CHECK(runner.snapshot() == ExecutionState{});
}

TEST_CASE("ProcessRunner launch failures", "[process_runner]") {
  SECTION("Executable does not exist") {
    ProcessRunner runner(commandOptions("/nonexistent/builddeck/Build.sh"));

    auto started = runner.start(makeRequest());
    REQUIRE(started.isOk());

    // Reported synchronously: never observed as Running
    auto state = runner.snapshot();
    CHECK(state.phase == Phase::Failed);
    REQUIRE(state.exitInfo.has_value());
    CHECK(state.exitInfo->failure == FailureKind::CommandNotFound);
    CHECK_FALSE(state.exitInfo->exitCode.has_value());
  }

  SECTION("File is not executable") {
    fs::path script = fs::temp_directory_path() / "builddeck_not_executable.sh";
    {
      std::ofstream file(script);
      file << "#!/bin/sh\necho hi\n";
    }
    fs::permissions(script, fs::perms::owner_read | fs::perms::owner_write);

    ProcessRunner runner(commandOptions(script.string()));
    REQUIRE(runner.start(makeRequest()).isOk());

    auto state = runner.snapshot();
    CHECK(state.phase == Phase::Failed);
    REQUIRE(state.exitInfo.has_value());
    CHECK(state.exitInfo->failure == FailureKind::PermissionDenied);
    fs::remove(script);
  }

  SECTION("Working directory does not exist") {
    ProcessRunner runner(shellOptions("exit 0", "/nonexistent/builddeck/dir"));
    REQUIRE(runner.start(makeRequest()).isOk());

    auto state = runner.snapshot();
    CHECK(state.phase == Phase::Failed);
    REQUIRE(state.exitInfo.has_value());
    CHECK(state.exitInfo->failure == FailureKind::InvalidWorkingDirectory);
  }

  SECTION("Resolver error") {
    ProcessRunner::Options options;
    options.resolver = [](const BuildRequest &) {
      return Result<CommandLine>::error("no engine found");
    };
    ProcessRunner runner(options);
    REQUIRE(runner.start(makeRequest()).isOk());

    auto state = runner.snapshot();
    CHECK(state.phase == Phase::Failed);
    REQUIRE(state.exitInfo.has_value());
    CHECK(state.exitInfo->failure == FailureKind::UnresolvedCommand);
    CHECK(state.exitInfo->message == "no engine found");
  }
}

TEST_CASE("ProcessRunner keeps stderr apart from progress", "[process_runner]") {
  const std::string script = "echo '[1/4]'; echo '[3/4] warning' 1>&2; exit 0";

  SECTION("Separate streams") {
    ProcessRunner runner(shellOptions(script));
    REQUIRE(runner.start(makeRequest()).isOk());
    REQUIRE(runner.waitForFinish(10s));

    auto state = runner.snapshot();
    REQUIRE(state.log.size() == 2);
    CHECK(state.progress == Approx(0.25));

    bool sawStderr = false;
    for (const auto &line : state.log) {
      if (line.stream == OutputStream::StdErr) {
        sawStderr = true;
        CHECK(line.text == "[3/4] warning");
      }
    }
    CHECK(sawStderr);
  }

  SECTION("Merged streams") {
    auto options = shellOptions(script);
    options.mergeStderr = true;
    ProcessRunner runner(options);
    REQUIRE(runner.start(makeRequest()).isOk());
    REQUIRE(runner.waitForFinish(10s));

    auto state = runner.snapshot();
    REQUIRE(state.log.size() == 2);
    CHECK(state.log[1].text == "[3/4] warning");
    CHECK(state.progress == Approx(0.75));
  }
}

TEST_CASE("ProcessRunner runs again after a finished run", "[process_runner]") {
  ProcessRunner runner(shellOptions("echo '[1/1]'"));

  auto first = runner.start(makeRequest());
  REQUIRE(first.isOk());
  REQUIRE(runner.waitForFinish(10s));

  auto second = runner.start(makeRequest());
  REQUIRE(second.isOk());
  CHECK(second.value() == first.value() + 1);
  REQUIRE(runner.waitForFinish(10s));

  auto state = runner.snapshot();
  CHECK(state.runId == second.value());
  CHECK(state.log.size() == 1);
  CHECK(state.phase == Phase::Succeeded);
}

TEST_CASE("ProcessRunner callbacks and log growth", "[process_runner]") {
  std::string script;
  for (int i = 1; i <= 50; ++i) {
    script += "echo '[" + std::to_string(i) + "/50]'; ";
  }
  ProcessRunner runner(shellOptions(script));

  std::atomic<int> callbackLines{0};
  std::atomic<bool> finishedCalled{false};
  runner.setOnLogLine([&](const LogLine &) { ++callbackLines; });
  runner.setOnRunFinished([&](const ExecutionState &state) {
    finishedCalled = state.phase == Phase::Succeeded;
  });

  REQUIRE(runner.start(makeRequest()).isOk());

  usize lastSize = 0;
  bool monotonic = true;
  while (runner.isRunning()) {
    usize size = runner.snapshot().log.size();
    if (size < lastSize) {
      monotonic = false;
    }
    lastSize = size;
    std::this_thread::sleep_for(1ms);
  }
  REQUIRE(runner.waitForFinish(10s));

  // The finish callback runs on the worker right after the state turns terminal
  for (int i = 0; i < 500 && !finishedCalled; ++i) {
    std::this_thread::sleep_for(2ms);
  }

  CHECK(monotonic);
  CHECK(runner.snapshot().log.size() == 50);
  CHECK(callbackLines.load() == 50);
  CHECK(finishedCalled.load());
}

#endif
