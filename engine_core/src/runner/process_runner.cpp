/**
 * @file process_runner.cpp
 * @brief ProcessRunner implementation
 *
 * Worker loop per run:
 * 1. Poll the output pipes (bounded by pollInterval)
 * 2. Frame chunks into lines, log them, apply progress markers
 * 3. Escalate a pending cancel to a forced kill after the grace period
 * 4. Once the process is reaped, drain what is left and finalize the state
 */

#include "BuildDeck/runner/process_runner.hpp"
#include "BuildDeck/core/logger.hpp"
#include "BuildDeck/runner/child_process.hpp"
#include "BuildDeck/runner/line_framer.hpp"
#include "BuildDeck/runner/progress_extractor.hpp"
#include <array>
#include <string>
#include <vector>

namespace BuildDeck::runner {

ProcessRunner::ProcessRunner() : ProcessRunner(Options{}) {}

ProcessRunner::ProcessRunner(Options options) : m_options(std::move(options)) {
  if (!m_options.resolver) {
    CommandBuilder builder(m_options.host);
    m_options.resolver = [builder](const BuildRequest& request) { return builder.build(request); };
  }
  if (m_options.pollInterval.count() <= 0) {
    m_options.pollInterval = std::chrono::milliseconds(100);
  }
}

ProcessRunner::~ProcessRunner() {
  cancel();
  joinWorker();
}

Result<u64, StartError> ProcessRunner::start(const BuildRequest& request) {
  std::lock_guard<std::mutex> lock(m_controlMutex);

  if (m_state.phase() == Phase::Running) {
    return Result<u64, StartError>::error(StartError::AlreadyRunning);
  }

  auto valid = request.validate();
  if (valid.isError()) {
    BUILDDECK_LOG_ERROR("Rejected build request: {}", valid.error());
    return Result<u64, StartError>::error(StartError::InvalidRequest);
  }

  // The previous worker has already finalized its run; reap the thread
  joinWorker();
  m_child.reset();

  auto begun = m_state.beginRun(request.operation);
  if (begun.isError()) {
    return begun;
  }
  const u64 runId = begun.value();
  const auto startTime = std::chrono::steady_clock::now();
  m_cancelRequested = false;

  BUILDDECK_LOG_INFO("Run {}: {} {} {} for {}", runId, operationKindName(request.operation),
                     configurationName(request.configuration),
                     targetPlatformName(request.platform), request.projectName());

  auto command = m_options.resolver(request);
  if (command.isError()) {
    ExitInfo info;
    info.failure = FailureKind::UnresolvedCommand;
    info.message = command.error();
    BUILDDECK_LOG_ERROR("Run {}: cannot resolve command: {}", runId, info.message);
    finishRun(Phase::Failed, std::move(info), startTime);
    return Result<u64, StartError>::ok(runId);
  }

  BUILDDECK_LOG_INFO("Run {}: {}", runId, CommandBuilder::describe(command.value()));
  if (!command.value().workingDirectory.empty()) {
    BUILDDECK_LOG_DEBUG("Run {}: working directory {}", runId, command.value().workingDirectory);
  }

  auto spawned = ChildProcess::spawn(command.value(), m_options.mergeStderr);
  if (spawned.isError()) {
    ExitInfo info;
    info.failure = spawned.error().kind;
    info.message = spawned.error().message;
    BUILDDECK_LOG_ERROR("Run {}: launch failed ({}): {}", runId, failureKindName(info.failure),
                        info.message);
    finishRun(Phase::Failed, std::move(info), startTime);
    return Result<u64, StartError>::ok(runId);
  }

  m_child = std::shared_ptr<ChildProcess>(std::move(spawned).value());
  BUILDDECK_LOG_DEBUG("Run {}: started pid {}", runId, m_child->pid());

  RunContext context;
  context.runId = runId;
  context.child = m_child;
  context.startTime = startTime;
  m_worker = std::make_unique<std::thread>(
      [this, context = std::move(context)]() mutable { runWorker(std::move(context)); });

  return Result<u64, StartError>::ok(runId);
}

void ProcessRunner::cancel() {
  std::lock_guard<std::mutex> lock(m_controlMutex);
  if (m_state.phase() != Phase::Running || !m_child) {
    return;
  }
  if (m_cancelRequested) {
    return; // Already requested
  }

  // An exited process that the worker already reaped keeps its own outcome
  if (!m_child->terminate()) {
    BUILDDECK_LOG_DEBUG("Cancel ignored, pid {} has already exited", m_child->pid());
    return;
  }
  m_cancelRequested = true;
  BUILDDECK_LOG_INFO("Cancellation requested, stopping pid {}", m_child->pid());
}

bool ProcessRunner::waitForFinish(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(m_finishMutex);
  return m_finishCv.wait_for(lock, timeout, [this]() { return !isRunning(); });
}

void ProcessRunner::setOnLogLine(std::function<void(const LogLine&)> callback) {
  std::lock_guard<std::mutex> lock(m_callbackMutex);
  m_onLogLine = std::move(callback);
}

void ProcessRunner::setOnRunFinished(std::function<void(const ExecutionState&)> callback) {
  std::lock_guard<std::mutex> lock(m_callbackMutex);
  m_onRunFinished = std::move(callback);
}

// ============================================================================
// Worker
// ============================================================================

void ProcessRunner::runWorker(RunContext context) {
  ChildProcess& child = *context.child;

  std::array<LineFramer, 2> framers; // Indexed by OutputStream
  std::vector<OutputChunk> chunks;

  std::optional<std::chrono::steady_clock::time_point> cancelSeenAt;
  bool forcedKill = false;

  auto consume = [&]() {
    for (auto& chunk : chunks) {
      auto& framer = framers[static_cast<usize>(chunk.stream)];
      for (auto& line : framer.feed(chunk.data)) {
        dispatchLine(std::move(line), chunk.stream);
      }
    }
    bool consumed = !chunks.empty();
    chunks.clear();
    return consumed;
  };

  auto escalateCancel = [&]() {
    if (!m_cancelRequested || forcedKill) {
      return;
    }
    auto now = std::chrono::steady_clock::now();
    if (!cancelSeenAt) {
      cancelSeenAt = now;
    } else if (now - *cancelSeenAt >= m_options.cancelGracePeriod) {
      BUILDDECK_LOG_WARN("Run {}: process ignored termination request, killing it",
                         context.runId);
      child.kill();
      forcedKill = true;
    }
  };

  std::optional<ProcessExit> exit;
  bool streamsOpen = true;

  while (!exit) {
    if (streamsOpen) {
      streamsOpen = child.readOutput(m_options.pollInterval, chunks);
      consume();
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    escalateCancel();
    exit = child.tryWait();
  }

  // The process is gone. Drain what it left in the pipes; stop as soon as a
  // read brings nothing, since descendants may still hold the write ends.
  while (streamsOpen) {
    streamsOpen = child.readOutput(std::chrono::milliseconds(0), chunks);
    if (!consume()) {
      break;
    }
  }

  for (usize i = 0; i < framers.size(); ++i) {
    if (auto tail = framers[i].flush()) {
      dispatchLine(std::move(*tail), static_cast<OutputStream>(i));
    }
  }

  ExitInfo info = classifyExit(*exit);
  Phase phase;
  if (child.terminationRequested()) {
    phase = Phase::Cancelled;
    info.failure = FailureKind::None;
    info.message = "Cancelled by request";
  } else {
    phase = info.failure == FailureKind::None ? Phase::Succeeded : Phase::Failed;
  }

  finishRun(phase, std::move(info), context.startTime);
}

void ProcessRunner::dispatchLine(std::string text, OutputStream stream) {
  std::optional<ProgressMarker> marker;
  if (stream == OutputStream::StdOut) {
    marker = ProgressExtractor::extract(text);
  }

  BUILDDECK_LOG_TRACE("[{}] {}", stream == OutputStream::StdOut ? "out" : "err", text);

  LogLine line{std::move(text), stream};

  std::function<void(const LogLine&)> callback;
  {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    callback = m_onLogLine;
  }
  if (callback) {
    m_state.appendLine(line, marker);
    callback(line);
  } else {
    m_state.appendLine(std::move(line), marker);
  }
}

void ProcessRunner::finishRun(Phase phase, ExitInfo info,
                              std::chrono::steady_clock::time_point startTime) {
  f64 durationMs = std::chrono::duration<f64, std::milli>(std::chrono::steady_clock::now() -
                                                          startTime)
                       .count();

  switch (phase) {
  case Phase::Succeeded:
    BUILDDECK_LOG_INFO("Run finished successfully in {:.1f} s", durationMs / 1000.0);
    break;
  case Phase::Cancelled:
    BUILDDECK_LOG_INFO("Run cancelled after {:.1f} s", durationMs / 1000.0);
    break;
  default:
    BUILDDECK_LOG_ERROR("Run failed ({}): {}", failureKindName(info.failure), info.message);
    break;
  }

  {
    // Publish under the finish mutex so waitForFinish cannot miss the wake-up
    std::lock_guard<std::mutex> lock(m_finishMutex);
    m_state.finish(phase, std::move(info), durationMs);
  }
  m_finishCv.notify_all();

  std::function<void(const ExecutionState&)> callback;
  {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    callback = m_onRunFinished;
  }
  if (callback) {
    callback(m_state.snapshot());
  }
}

void ProcessRunner::joinWorker() {
  if (!m_worker) {
    return;
  }
  if (m_worker->get_id() == std::this_thread::get_id()) {
    // Called from a callback on the worker itself
    m_worker->detach();
  } else if (m_worker->joinable()) {
    m_worker->join();
  }
  m_worker.reset();
}

ExitInfo ProcessRunner::classifyExit(const ProcessExit& exit) {
  ExitInfo info;
  info.exitCode = exit.exitCode;
  info.signal = exit.signal;

  if (exit.signal) {
    info.failure = FailureKind::Signaled;
    info.message = "Process killed by signal " + std::to_string(*exit.signal);
  } else if (exit.exitCode && *exit.exitCode == 0) {
    info.failure = FailureKind::None;
    info.message = "Process exited with code 0";
  } else {
    info.failure = FailureKind::NonZeroExit;
    info.message = "Process exited with code " + std::to_string(exit.exitCode.value_or(-1));
  }
  return info;
}

} // namespace BuildDeck::runner
