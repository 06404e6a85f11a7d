#pragma once

/**
 * @file process_runner.hpp
 * @brief Runs one Unreal build/package process at a time and tracks it
 *
 * start() spawns the command and returns immediately; a worker thread then
 * streams the output through a LineFramer per stream, appends each line to
 * the execution log, feeds stdout lines to the ProgressExtractor and finally
 * records how the process ended.
 *
 * Callers observe the run by polling snapshot() / deltaSince() (for example
 * once per UI frame) or by registering callbacks, which run on the worker
 * thread. Callbacks must not call start() or cancel() or destroy the runner.
 *
 * Usage:
 * @code
 * ProcessRunner runner;
 * BuildRequest request;
 * request.projectPath = "/work/Shooter/Shooter.uproject";
 * request.engineRoot = "/opt/UnrealEngine";
 *
 * auto started = runner.start(request);
 * if (started.isError()) { ... }
 *
 * // Each frame
 * ExecutionState state = runner.snapshot();
 * drawProgress(state.progress);
 * @endcode
 */

#include "BuildDeck/core/result.hpp"
#include "BuildDeck/core/types.hpp"
#include "BuildDeck/runner/build_request.hpp"
#include "BuildDeck/runner/command_builder.hpp"
#include "BuildDeck/runner/execution_state.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace BuildDeck::runner {

class ChildProcess;
struct ProcessExit;

/**
 * @brief Maps a request to the command line to execute
 *
 * Defaults to CommandBuilder for the configured host. Tests and tools that
 * run something other than the Unreal scripts replace it.
 */
using CommandResolver = std::function<Result<CommandLine>(const BuildRequest&)>;

class ProcessRunner {
public:
  struct Options {
    HostPlatform host = currentHostPlatform();
    CommandResolver resolver;       // Empty: CommandBuilder(host)
    bool mergeStderr = false;       // Parse stderr for progress too
    std::chrono::milliseconds cancelGracePeriod{5000}; // Before a forced kill
    std::chrono::milliseconds pollInterval{100};       // Worker wake-up period
  };

  ProcessRunner();
  explicit ProcessRunner(Options options);
  ~ProcessRunner();

  ProcessRunner(const ProcessRunner&) = delete;
  ProcessRunner& operator=(const ProcessRunner&) = delete;

  /**
   * @brief Start an operation without blocking
   *
   * AlreadyRunning and InvalidRequest leave the state untouched. If the
   * process cannot be launched the run goes straight to Failed with a launch
   * FailureKind and start() still returns ok.
   *
   * @return The id of the new run
   */
  Result<u64, StartError> start(const BuildRequest& request);

  /**
   * @brief Request termination of the running process; no-op when not Running
   *
   * The phase stays Running until the process is gone, then becomes Cancelled.
   */
  void cancel();

  /**
   * @brief Block until the current run (if any) reaches a terminal phase
   * @return false on timeout
   */
  bool waitForFinish(std::chrono::milliseconds timeout);

  [[nodiscard]] ExecutionState snapshot() const { return m_state.snapshot(); }
  [[nodiscard]] StateDelta deltaSince(u64 runId, usize fromLine) const {
    return m_state.deltaSince(runId, fromLine);
  }
  [[nodiscard]] Phase phase() const { return m_state.phase(); }
  [[nodiscard]] bool isRunning() const { return m_state.phase() == Phase::Running; }

  [[nodiscard]] const Options& options() const { return m_options; }

  // Callbacks (invoked on the worker thread)
  void setOnLogLine(std::function<void(const LogLine&)> callback);
  void setOnRunFinished(std::function<void(const ExecutionState&)> callback);

private:
  struct RunContext {
    u64 runId = 0;
    std::shared_ptr<ChildProcess> child;
    std::chrono::steady_clock::time_point startTime;
  };

  void runWorker(RunContext context);
  void dispatchLine(std::string text, OutputStream stream);
  void finishRun(Phase phase, ExitInfo info, std::chrono::steady_clock::time_point startTime);
  void joinWorker();

  [[nodiscard]] static ExitInfo classifyExit(const ProcessExit& exit);

  Options m_options;
  ExecutionStateMachine m_state;

  std::mutex m_controlMutex; // Serializes start/cancel/destruction
  std::unique_ptr<std::thread> m_worker;
  std::shared_ptr<ChildProcess> m_child;
  std::atomic<bool> m_cancelRequested{false};

  std::mutex m_finishMutex;
  std::condition_variable m_finishCv;

  std::mutex m_callbackMutex;
  std::function<void(const LogLine&)> m_onLogLine;
  std::function<void(const ExecutionState&)> m_onRunFinished;
};

} // namespace BuildDeck::runner
