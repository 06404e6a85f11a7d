/**
 * @file build_monitor.cpp
 * @brief BuildMonitor polling and signal emission
 */

#include "BuildDeck/editor/qt/build_monitor.hpp"
#include "BuildDeck/core/logger.hpp"

namespace BuildDeck::editor::qt {

BuildMonitor::BuildMonitor(QObject *parent)
    : BuildMonitor(runner::ProcessRunner::Options{}, parent) {}

BuildMonitor::BuildMonitor(runner::ProcessRunner::Options options,
                           QObject *parent)
    : QObject(parent), m_runner(std::move(options)) {
  qRegisterMetaType<runner::Phase>("BuildDeck::runner::Phase");
  m_timer.setInterval(static_cast<int>(m_runner.options().pollInterval.count()));
  connect(&m_timer, &QTimer::timeout, this, &BuildMonitor::poll);
}

BuildMonitor::~BuildMonitor() { m_timer.stop(); }

Result<u64, runner::StartError>
BuildMonitor::start(const runner::BuildRequest &request) {
  auto started = m_runner.start(request);
  if (started.isError()) {
    BUILDDECK_LOG_WARN("Build monitor: {}",
                       runner::startErrorToString(started.error()));
    return started;
  }

  m_timer.start();
  poll();
  return started;
}

void BuildMonitor::cancel() { m_runner.cancel(); }

void BuildMonitor::poll() {
  runner::StateDelta delta = m_runner.deltaSince(m_runId, m_nextLine);

  if (delta.runId != m_runId) {
    m_runId = delta.runId;
    m_nextLine = 0;
    m_progress = 0.0;
    m_phase = runner::Phase::Idle;
    m_finishReported = false;
    emit runStarted(static_cast<quint64>(m_runId));
  }

  if (!delta.newLines.empty()) {
    QStringList lines;
    lines.reserve(static_cast<qsizetype>(delta.newLines.size()));
    for (const auto &line : delta.newLines) {
      lines.append(QString::fromStdString(line.text));
    }
    m_nextLine = delta.firstLineIndex + delta.newLines.size();
    emit logLinesAppended(lines);
  }

  if (delta.progress != m_progress) {
    m_progress = delta.progress;
    emit progressChanged(m_progress);
  }

  if (delta.phase != m_phase) {
    m_phase = delta.phase;
    emit phaseChanged(m_phase);
  }

  if (runner::isTerminal(delta.phase) && !m_finishReported) {
    m_finishReported = true;
    m_timer.stop();

    int exitCode = -1;
    QString message;
    if (delta.exitInfo) {
      exitCode = delta.exitInfo->exitCode.value_or(-1);
      message = QString::fromStdString(delta.exitInfo->message);
    }
    emit runFinished(delta.phase, exitCode, message);
  }
}

} // namespace BuildDeck::editor::qt
