#pragma once

/**
 * @file child_process.hpp
 * @brief Spawned external process with piped output
 *
 * Platform layer of the runner:
 * - On Unix: fork + execvp, child in its own process group, launch errors
 *   reported back through a close-on-exec status pipe
 * - On Windows: CreateProcess inside a job object so the whole process tree
 *   can be terminated; stderr always shares the stdout pipe
 *
 * readOutput() and tryWait() belong to the thread that drives the process.
 * terminate() and kill() may be called from any thread.
 */

#include "BuildDeck/core/result.hpp"
#include "BuildDeck/core/types.hpp"
#include "BuildDeck/runner/command_builder.hpp"
#include "BuildDeck/runner/execution_state.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace BuildDeck::runner {

struct OutputChunk {
  OutputStream stream = OutputStream::StdOut;
  std::string data;
};

struct ProcessExit {
  std::optional<i32> exitCode;
  std::optional<i32> signal;
};

struct LaunchError {
  FailureKind kind = FailureKind::SpawnFailed;
  std::string message;
};

class ChildProcess {
public:
  /**
   * @brief Start a process
   * @param mergeStderr Send stderr into the stdout pipe (always the case on Windows)
   */
  static Result<std::unique_ptr<ChildProcess>, LaunchError> spawn(const CommandLine& command,
                                                                  bool mergeStderr);

  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  /**
   * @brief Wait up to timeout for output and append what is available
   * @return false once every output stream has reached end of file
   */
  bool readOutput(std::chrono::milliseconds timeout, std::vector<OutputChunk>& out);

  /**
   * @brief Reap the process if it has exited, without blocking
   */
  std::optional<ProcessExit> tryWait();

  /**
   * @brief Ask the process tree to stop (SIGTERM on Unix)
   * @return false if the process had already been reaped and nothing was sent
   */
  bool terminate();

  /**
   * @brief Stop the process tree unconditionally (SIGKILL on Unix)
   */
  void kill();

  /**
   * @brief True once terminate() reached a process that had not been reaped
   */
  [[nodiscard]] bool terminationRequested() const;

  [[nodiscard]] i64 pid() const { return m_pid; }

private:
  ChildProcess() = default;

  void signalTree(bool force);
  void closeStreams();

  i64 m_pid = -1;
#ifdef _WIN32
  void* m_process = nullptr;
  void* m_job = nullptr;
  void* m_stdout = nullptr;
#else
  int m_stdoutFd = -1;
  int m_stderrFd = -1;
#endif

  mutable std::mutex m_mutex; // Guards reaping against concurrent signalling
  std::optional<ProcessExit> m_exit;
  bool m_terminationRequested = false;
};

} // namespace BuildDeck::runner
