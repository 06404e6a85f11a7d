/**
 * @file execution_state.cpp
 * @brief ExecutionStateMachine implementation
 */

#include "BuildDeck/runner/execution_state.hpp"
#include "BuildDeck/core/logger.hpp"
#include <algorithm>

namespace BuildDeck::runner {

const char* phaseName(Phase phase) {
  switch (phase) {
  case Phase::Idle:
    return "Idle";
  case Phase::Running:
    return "Running";
  case Phase::Succeeded:
    return "Succeeded";
  case Phase::Failed:
    return "Failed";
  case Phase::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

bool isTerminal(Phase phase) {
  return phase == Phase::Succeeded || phase == Phase::Failed || phase == Phase::Cancelled;
}

const char* failureKindName(FailureKind kind) {
  switch (kind) {
  case FailureKind::None:
    return "None";
  case FailureKind::UnresolvedCommand:
    return "Unresolved command";
  case FailureKind::CommandNotFound:
    return "Command not found";
  case FailureKind::PermissionDenied:
    return "Permission denied";
  case FailureKind::InvalidWorkingDirectory:
    return "Invalid working directory";
  case FailureKind::SpawnFailed:
    return "Spawn failed";
  case FailureKind::NonZeroExit:
    return "Non-zero exit";
  case FailureKind::Signaled:
    return "Killed by signal";
  }
  return "Unknown";
}

bool isLaunchFailure(FailureKind kind) {
  switch (kind) {
  case FailureKind::UnresolvedCommand:
  case FailureKind::CommandNotFound:
  case FailureKind::PermissionDenied:
  case FailureKind::InvalidWorkingDirectory:
  case FailureKind::SpawnFailed:
    return true;
  case FailureKind::None:
  case FailureKind::NonZeroExit:
  case FailureKind::Signaled:
    return false;
  }
  return false;
}

const char* startErrorToString(StartError error) {
  switch (error) {
  case StartError::AlreadyRunning:
    return "A build is already running";
  case StartError::InvalidRequest:
    return "Invalid build request";
  }
  return "Unknown start error";
}

Result<u64, StartError> ExecutionStateMachine::beginRun(OperationKind operation) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_state.phase == Phase::Running) {
    return Result<u64, StartError>::error(StartError::AlreadyRunning);
  }

  u64 nextRunId = m_state.runId + 1;
  m_state = ExecutionState{};
  m_state.runId = nextRunId;
  m_state.phase = Phase::Running;
  m_state.operation = operation;
  return Result<u64, StartError>::ok(nextRunId);
}

void ExecutionStateMachine::appendLine(LogLine line, std::optional<ProgressMarker> marker) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_state.phase != Phase::Running) {
    return;
  }

  m_state.log.push_back(std::move(line));
  if (marker && marker->total > 0) {
    m_state.progress = std::clamp(marker->fraction(), 0.0, 1.0);
    m_state.lastMarker = marker;
  }
}

bool ExecutionStateMachine::finish(Phase terminal, ExitInfo info, f64 durationMs) {
  Phase current;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    current = m_state.phase;
    if (isTerminal(terminal) && current == Phase::Running) {
      m_state.phase = terminal;
      m_state.exitInfo = std::move(info);
      m_state.durationMs = durationMs;
      return true;
    }
  }

  // Logged outside the lock: log callbacks may read the state
  BUILDDECK_LOG_WARN("Ignoring state transition {} -> {}", phaseName(current),
                     phaseName(terminal));
  return false;
}

ExecutionState ExecutionStateMachine::snapshot() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_state;
}

StateDelta ExecutionStateMachine::deltaSince(u64 runId, usize fromLine) const {
  std::lock_guard<std::mutex> lock(m_mutex);

  StateDelta delta;
  delta.runId = m_state.runId;
  delta.phase = m_state.phase;
  delta.progress = m_state.progress;
  delta.lastMarker = m_state.lastMarker;
  delta.totalLines = m_state.log.size();
  delta.exitInfo = m_state.exitInfo;

  usize first = runId == m_state.runId ? std::min(fromLine, m_state.log.size()) : 0;
  delta.firstLineIndex = first;
  delta.newLines.assign(m_state.log.begin() + static_cast<std::ptrdiff_t>(first),
                        m_state.log.end());
  return delta;
}

Phase ExecutionStateMachine::phase() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_state.phase;
}

u64 ExecutionStateMachine::runId() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_state.runId;
}

usize ExecutionStateMachine::logSize() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_state.log.size();
}

} // namespace BuildDeck::runner
