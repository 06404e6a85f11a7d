#pragma once

/**
 * @file execution_state.hpp
 * @brief Shared execution state of the build runner
 *
 * ExecutionStateMachine owns the one ExecutionState of a runner. The runner
 * is its only writer; any thread may read it through snapshot() or
 * deltaSince(). All access goes through one mutex, so a reader always sees
 * phase, progress and log from the same instant.
 *
 * Phases:
 *   Idle -> Running -> {Succeeded | Failed | Cancelled} -> Running -> ...
 */

#include "BuildDeck/core/result.hpp"
#include "BuildDeck/core/types.hpp"
#include "BuildDeck/runner/build_request.hpp"
#include "BuildDeck/runner/progress_extractor.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace BuildDeck::runner {

enum class Phase : u8 { Idle, Running, Succeeded, Failed, Cancelled };

[[nodiscard]] const char* phaseName(Phase phase);
[[nodiscard]] bool isTerminal(Phase phase);

/**
 * @brief Why a run ended the way it did
 */
enum class FailureKind : u8 {
  None,
  // Launch failures: the process never ran
  UnresolvedCommand,       // No command line could be built for the request
  CommandNotFound,         // Executable does not exist
  PermissionDenied,        // Executable exists but may not be run
  InvalidWorkingDirectory, // Working directory missing or inaccessible
  SpawnFailed,             // fork/pipe/CreateProcess failed for another reason
  // Runtime failures: the process ran and failed
  NonZeroExit,
  Signaled
};

[[nodiscard]] const char* failureKindName(FailureKind kind);
[[nodiscard]] bool isLaunchFailure(FailureKind kind);

/**
 * @brief Errors returned by ProcessRunner::start
 */
enum class StartError : u8 {
  AlreadyRunning, // A run is active; nothing was changed
  InvalidRequest  // The request is missing required fields
};

[[nodiscard]] const char* startErrorToString(StartError error);

enum class OutputStream : u8 { StdOut, StdErr };

struct LogLine {
  std::string text;
  OutputStream stream = OutputStream::StdOut;

  bool operator==(const LogLine&) const = default;
};

/**
 * @brief How a terminal run ended
 */
struct ExitInfo {
  std::optional<i32> exitCode; // Set when the process exited normally
  std::optional<i32> signal;   // Set when the process was killed by a signal
  FailureKind failure = FailureKind::None;
  std::string message;

  bool operator==(const ExitInfo&) const = default;
};

/**
 * @brief Snapshot of the runner state
 */
struct ExecutionState {
  u64 runId = 0; // 0 until the first run starts
  Phase phase = Phase::Idle;
  std::optional<OperationKind> operation;
  f64 progress = 0.0; // Always in [0, 1]
  std::optional<ProgressMarker> lastMarker;
  std::vector<LogLine> log;
  std::optional<ExitInfo> exitInfo; // Only in terminal phases
  f64 durationMs = 0.0;             // Set when the run finishes

  bool operator==(const ExecutionState&) const = default;
};

/**
 * @brief State change since a reader's last poll
 *
 * If runId differs from the one the reader asked about, a new run has
 * started and newLines holds that run's log from the beginning.
 */
struct StateDelta {
  u64 runId = 0;
  Phase phase = Phase::Idle;
  f64 progress = 0.0;
  std::optional<ProgressMarker> lastMarker;
  usize firstLineIndex = 0;
  std::vector<LogLine> newLines;
  usize totalLines = 0;
  std::optional<ExitInfo> exitInfo;
};

class ExecutionStateMachine {
public:
  ExecutionStateMachine() = default;

  ExecutionStateMachine(const ExecutionStateMachine&) = delete;
  ExecutionStateMachine& operator=(const ExecutionStateMachine&) = delete;

  /**
   * @brief Enter Running for a new run, resetting progress and log
   * @return The new run id, or AlreadyRunning with the state untouched
   */
  Result<u64, StartError> beginRun(OperationKind operation);

  /**
   * @brief Append one output line and, if present, apply its progress marker
   *
   * Ignored unless Running. The last marker wins, even if its fraction is
   * lower than the current progress.
   */
  void appendLine(LogLine line, std::optional<ProgressMarker> marker);

  /**
   * @brief Move from Running to a terminal phase
   * @return false (and no change) if not Running or the phase is not terminal
   */
  bool finish(Phase terminal, ExitInfo info, f64 durationMs);

  [[nodiscard]] ExecutionState snapshot() const;
  [[nodiscard]] StateDelta deltaSince(u64 runId, usize fromLine) const;

  [[nodiscard]] Phase phase() const;
  [[nodiscard]] u64 runId() const;
  [[nodiscard]] usize logSize() const;

private:
  mutable std::mutex m_mutex;
  ExecutionState m_state;
};

} // namespace BuildDeck::runner
