/**
 * @file child_process.cpp
 * @brief ChildProcess implementation (POSIX and Windows)
 */

#include "BuildDeck/runner/child_process.hpp"
#include "BuildDeck/core/logger.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace BuildDeck::runner {

namespace {

constexpr usize kReadBufferSize = 64 * 1024;

} // namespace

#ifdef _WIN32

// ============================================================================
// Windows
// ============================================================================

namespace {

std::string lastErrorMessage(DWORD error) {
  char* buffer = nullptr;
  DWORD size = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                                  FORMAT_MESSAGE_IGNORE_INSERTS,
                              nullptr, error, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
  std::string message = size > 0 ? std::string(buffer, size) : "error " + std::to_string(error);
  if (buffer) {
    LocalFree(buffer);
  }
  while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
    message.pop_back();
  }
  return message;
}

FailureKind classifyLaunchError(DWORD error) {
  switch (error) {
  case ERROR_FILE_NOT_FOUND:
  case ERROR_PATH_NOT_FOUND:
    return FailureKind::CommandNotFound;
  case ERROR_ACCESS_DENIED:
  case ERROR_BAD_EXE_FORMAT:
    return FailureKind::PermissionDenied;
  case ERROR_DIRECTORY:
    return FailureKind::InvalidWorkingDirectory;
  default:
    return FailureKind::SpawnFailed;
  }
}

} // namespace

Result<std::unique_ptr<ChildProcess>, LaunchError> ChildProcess::spawn(const CommandLine& command,
                                                                        bool /*mergeStderr*/) {
  using SpawnResult = Result<std::unique_ptr<ChildProcess>, LaunchError>;

  SECURITY_ATTRIBUTES sa;
  sa.nLength = sizeof(SECURITY_ATTRIBUTES);
  sa.bInheritHandle = TRUE;
  sa.lpSecurityDescriptor = NULL;

  HANDLE readEnd = nullptr;
  HANDLE writeEnd = nullptr;
  if (!CreatePipe(&readEnd, &writeEnd, &sa, 0)) {
    return SpawnResult::error(
        {FailureKind::SpawnFailed, "Failed to create output pipe: " + lastErrorMessage(GetLastError())});
  }
  SetHandleInformation(readEnd, HANDLE_FLAG_INHERIT, 0);

  HANDLE nulInput = CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                                OPEN_EXISTING, 0, nullptr);

  HANDLE job = CreateJobObjectA(nullptr, nullptr);
  if (job) {
    JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits{};
    limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
    SetInformationJobObject(job, JobObjectExtendedLimitInformation, &limits, sizeof(limits));
  }

  STARTUPINFOA si;
  ZeroMemory(&si, sizeof(si));
  si.cb = sizeof(si);
  si.hStdInput = nulInput != INVALID_HANDLE_VALUE ? nulInput : nullptr;
  si.hStdOutput = writeEnd;
  si.hStdError = writeEnd;
  si.dwFlags |= STARTF_USESTDHANDLES;

  PROCESS_INFORMATION pi;
  ZeroMemory(&pi, sizeof(pi));

  const std::string line = CommandBuilder::windowsCommandLine(command);
  std::vector<char> cmdLine(line.begin(), line.end());
  cmdLine.push_back('\0');

  const char* workDir = command.workingDirectory.empty() ? nullptr : command.workingDirectory.c_str();

  BOOL created = CreateProcessA(nullptr, cmdLine.data(), nullptr, nullptr, TRUE,
                                CREATE_SUSPENDED | CREATE_NO_WINDOW, nullptr, workDir, &si, &pi);
  DWORD createError = created ? 0 : GetLastError();

  CloseHandle(writeEnd);
  if (nulInput != INVALID_HANDLE_VALUE) {
    CloseHandle(nulInput);
  }

  if (!created) {
    CloseHandle(readEnd);
    if (job) {
      CloseHandle(job);
    }
    return SpawnResult::error({classifyLaunchError(createError),
                               command.executable + ": " + lastErrorMessage(createError)});
  }

  if (job && !AssignProcessToJobObject(job, pi.hProcess)) {
    BUILDDECK_LOG_WARN("Could not assign process to job object: {}",
                       lastErrorMessage(GetLastError()));
    CloseHandle(job);
    job = nullptr;
  }
  ResumeThread(pi.hThread);
  CloseHandle(pi.hThread);

  std::unique_ptr<ChildProcess> child(new ChildProcess());
  child->m_pid = static_cast<i64>(pi.dwProcessId);
  child->m_process = pi.hProcess;
  child->m_job = job;
  child->m_stdout = readEnd;
  return SpawnResult::ok(std::move(child));
}

ChildProcess::~ChildProcess() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_exit) {
      signalTree(true);
      WaitForSingleObject(static_cast<HANDLE>(m_process), INFINITE);
    }
  }
  closeStreams();
  if (m_job) {
    CloseHandle(static_cast<HANDLE>(m_job));
  }
  if (m_process) {
    CloseHandle(static_cast<HANDLE>(m_process));
  }
}

bool ChildProcess::readOutput(std::chrono::milliseconds timeout, std::vector<OutputChunk>& out) {
  if (!m_stdout) {
    return false;
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<char, kReadBufferSize> buffer;

  while (true) {
    DWORD available = 0;
    if (!PeekNamedPipe(static_cast<HANDLE>(m_stdout), nullptr, 0, nullptr, &available, nullptr)) {
      // ERROR_BROKEN_PIPE: every writer is gone
      closeStreams();
      return false;
    }

    if (available > 0) {
      DWORD toRead = available < buffer.size() ? available : static_cast<DWORD>(buffer.size());
      DWORD bytesRead = 0;
      if (!ReadFile(static_cast<HANDLE>(m_stdout), buffer.data(), toRead, &bytesRead, nullptr) ||
          bytesRead == 0) {
        closeStreams();
        return false;
      }
      out.push_back({OutputStream::StdOut, std::string(buffer.data(), bytesRead)});
      return true;
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      return true;
    }
    Sleep(10);
  }
}

std::optional<ProcessExit> ChildProcess::tryWait() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_exit) {
    return m_exit;
  }
  if (WaitForSingleObject(static_cast<HANDLE>(m_process), 0) != WAIT_OBJECT_0) {
    return std::nullopt;
  }

  DWORD exitCode = 0;
  GetExitCodeProcess(static_cast<HANDLE>(m_process), &exitCode);
  ProcessExit exit;
  exit.exitCode = static_cast<i32>(exitCode);
  m_exit = exit;
  return m_exit;
}

void ChildProcess::signalTree(bool /*force*/) {
  // Console trees have no polite stop signal; the job takes everything down
  if (m_job) {
    TerminateJobObject(static_cast<HANDLE>(m_job), 1);
  } else if (m_process) {
    TerminateProcess(static_cast<HANDLE>(m_process), 1);
  }
}

void ChildProcess::closeStreams() {
  if (m_stdout) {
    CloseHandle(static_cast<HANDLE>(m_stdout));
    m_stdout = nullptr;
  }
}

#else

// ============================================================================
// POSIX
// ============================================================================

namespace {

enum class SpawnStage : int { Chdir = 1, Exec = 2, Redirect = 3 };

struct SpawnReport {
  int stage;
  int error;
};

bool makePipe(int fds[2]) {
#if defined(__linux__) || defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
  return pipe2(fds, O_CLOEXEC) == 0;
#else
  // No pipe2 on macOS: a fork from another thread could inherit these briefly
  if (pipe(fds) == -1) {
    return false;
  }
  fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
#endif
}

void closeFd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Only async-signal-safe calls: this runs in the forked child
[[noreturn]] void reportAndExit(int statusFd, SpawnStage stage, int error) {
  SpawnReport report{static_cast<int>(stage), error};
  ssize_t ignored = write(statusFd, &report, sizeof(report));
  (void)ignored;
  _exit(127);
}

LaunchError classifyLaunchError(const SpawnReport& report, const CommandLine& command) {
  auto stage = static_cast<SpawnStage>(report.stage);
  std::string reason = std::strerror(report.error);

  if (stage == SpawnStage::Chdir) {
    return {FailureKind::InvalidWorkingDirectory,
            "Cannot enter working directory " + command.workingDirectory + ": " + reason};
  }
  if (stage == SpawnStage::Redirect) {
    return {FailureKind::SpawnFailed, "Cannot redirect process output: " + reason};
  }

  switch (report.error) {
  case ENOENT:
  case ENOTDIR:
    return {FailureKind::CommandNotFound, command.executable + ": " + reason};
  case EACCES:
  case EPERM:
  case ENOEXEC:
    return {FailureKind::PermissionDenied, command.executable + ": " + reason};
  default:
    return {FailureKind::SpawnFailed, command.executable + ": " + reason};
  }
}

} // namespace

Result<std::unique_ptr<ChildProcess>, LaunchError> ChildProcess::spawn(const CommandLine& command,
                                                                        bool mergeStderr) {
  using SpawnResult = Result<std::unique_ptr<ChildProcess>, LaunchError>;

  int outPipe[2] = {-1, -1};
  int errPipe[2] = {-1, -1};
  int statusPipe[2] = {-1, -1};

  auto closeAll = [&]() {
    closeFd(outPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[0]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[0]);
    closeFd(statusPipe[1]);
  };

  if (!makePipe(outPipe) || (!mergeStderr && !makePipe(errPipe)) || !makePipe(statusPipe)) {
    int error = errno;
    closeAll();
    return SpawnResult::error(
        {FailureKind::SpawnFailed, std::string("Failed to create pipes: ") + std::strerror(error)});
  }

  // Everything the child needs is prepared before fork
  std::vector<std::string> args;
  args.reserve(command.arguments.size() + 1);
  args.push_back(command.executable);
  args.insert(args.end(), command.arguments.begin(), command.arguments.end());

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);

  const char* workDir = command.workingDirectory.empty() ? nullptr : command.workingDirectory.c_str();
  const int stderrTarget = mergeStderr ? outPipe[1] : errPipe[1];

  pid_t pid = fork();
  if (pid == -1) {
    int error = errno;
    closeAll();
    return SpawnResult::error(
        {FailureKind::SpawnFailed, std::string("Failed to fork process: ") + std::strerror(error)});
  }

  if (pid == 0) {
    // Child process
    setpgid(0, 0);

    int devNull = open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
      close(devNull);
    }

    if (workDir && chdir(workDir) != 0) {
      reportAndExit(statusPipe[1], SpawnStage::Chdir, errno);
    }

    if (dup2(outPipe[1], STDOUT_FILENO) == -1 || dup2(stderrTarget, STDERR_FILENO) == -1) {
      reportAndExit(statusPipe[1], SpawnStage::Redirect, errno);
    }

    execvp(argv[0], argv.data());
    reportAndExit(statusPipe[1], SpawnStage::Exec, errno);
  }

  // Parent process. Also set the group here so signalling works even if the
  // child has not run setpgid yet.
  setpgid(pid, pid);

  closeFd(outPipe[1]);
  closeFd(errPipe[1]);
  closeFd(statusPipe[1]);

  // The status pipe closes on a successful exec; otherwise it carries errno
  SpawnReport report{};
  usize received = 0;
  while (received < sizeof(report)) {
    ssize_t n = read(statusPipe[0], reinterpret_cast<char*>(&report) + received,
                     sizeof(report) - received);
    if (n > 0) {
      received += static_cast<usize>(n);
    } else if (n == -1 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  closeFd(statusPipe[0]);

  if (received == sizeof(report)) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    closeAll();
    return SpawnResult::error(classifyLaunchError(report, command));
  }

  fcntl(outPipe[0], F_SETFL, fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
  if (errPipe[0] >= 0) {
    fcntl(errPipe[0], F_SETFL, fcntl(errPipe[0], F_GETFL) | O_NONBLOCK);
  }

  std::unique_ptr<ChildProcess> child(new ChildProcess());
  child->m_pid = static_cast<i64>(pid);
  child->m_stdoutFd = outPipe[0];
  child->m_stderrFd = errPipe[0];
  return SpawnResult::ok(std::move(child));
}

ChildProcess::~ChildProcess() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_exit && m_pid > 0) {
      signalTree(true);
      int status = 0;
      while (waitpid(static_cast<pid_t>(m_pid), &status, 0) == -1 && errno == EINTR) {
      }
    }
  }
  closeStreams();
}

bool ChildProcess::readOutput(std::chrono::milliseconds timeout, std::vector<OutputChunk>& out) {
  std::array<pollfd, 2> fds{};
  std::array<OutputStream, 2> streams{};
  std::array<int*, 2> owners{};
  nfds_t count = 0;

  if (m_stdoutFd >= 0) {
    fds[count] = {m_stdoutFd, POLLIN, 0};
    streams[count] = OutputStream::StdOut;
    owners[count] = &m_stdoutFd;
    ++count;
  }
  if (m_stderrFd >= 0) {
    fds[count] = {m_stderrFd, POLLIN, 0};
    streams[count] = OutputStream::StdErr;
    owners[count] = &m_stderrFd;
    ++count;
  }
  if (count == 0) {
    return false;
  }

  int ready = poll(fds.data(), count, static_cast<int>(timeout.count()));
  if (ready <= 0) {
    if (ready == -1 && errno != EINTR) {
      BUILDDECK_LOG_WARN("poll() on process output failed: {}", std::strerror(errno));
    }
    return true;
  }

  std::array<char, kReadBufferSize> buffer;
  for (nfds_t i = 0; i < count; ++i) {
    if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
      continue;
    }

    // One read per stream per call, so a chatty child cannot keep the
    // caller from checking for exit or cancellation
    ssize_t n = 0;
    do {
      n = read(*owners[i], buffer.data(), buffer.size());
    } while (n == -1 && errno == EINTR);

    if (n > 0) {
      out.push_back({streams[i], std::string(buffer.data(), static_cast<usize>(n))});
    } else if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      continue;
    } else {
      if (n == -1) {
        BUILDDECK_LOG_WARN("Reading process output failed: {}", std::strerror(errno));
      }
      closeFd(*owners[i]);
    }
  }

  return m_stdoutFd >= 0 || m_stderrFd >= 0;
}

std::optional<ProcessExit> ChildProcess::tryWait() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_exit) {
    return m_exit;
  }

  int status = 0;
  pid_t result = waitpid(static_cast<pid_t>(m_pid), &status, WNOHANG);
  if (result == 0 || (result == -1 && errno == EINTR)) {
    return std::nullopt;
  }

  ProcessExit exit;
  if (result == -1) {
    BUILDDECK_LOG_WARN("waitpid() failed for pid {}: {}", m_pid, std::strerror(errno));
    exit.exitCode = -1;
  } else if (WIFEXITED(status)) {
    exit.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit.signal = WTERMSIG(status);
  } else {
    return std::nullopt; // stopped/continued, still alive
  }

  m_exit = exit;
  return m_exit;
}

void ChildProcess::signalTree(bool force) {
  const int sig = force ? SIGKILL : SIGTERM;
  if (::kill(-static_cast<pid_t>(m_pid), sig) == -1) {
    ::kill(static_cast<pid_t>(m_pid), sig);
  }
}

void ChildProcess::closeStreams() {
  closeFd(m_stdoutFd);
  closeFd(m_stderrFd);
}

#endif

bool ChildProcess::terminate() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_exit) {
    return false;
  }
  signalTree(false);
  m_terminationRequested = true;
  return true;
}

bool ChildProcess::terminationRequested() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_terminationRequested;
}

void ChildProcess::kill() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_exit) {
    signalTree(true);
  }
}

} // namespace BuildDeck::runner
