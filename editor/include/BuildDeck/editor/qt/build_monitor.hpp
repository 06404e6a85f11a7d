#pragma once

/**
 * @file build_monitor.hpp
 * @brief Qt-side observer of a ProcessRunner
 *
 * The runner publishes its state from a worker thread. BuildMonitor polls it
 * on a QTimer in the owning thread and turns the changes into signals, so
 * widgets and the command-line front end never touch the worker.
 *
 * Each tick copies only the log lines added since the previous tick
 * (ProcessRunner::deltaSince). A new run is recognized by its run id.
 */

#include "BuildDeck/core/result.hpp"
#include "BuildDeck/core/types.hpp"
#include "BuildDeck/runner/process_runner.hpp"
#include <QMetaType>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

Q_DECLARE_METATYPE(BuildDeck::runner::Phase)

namespace BuildDeck::editor::qt {

class BuildMonitor : public QObject {
  Q_OBJECT

public:
  explicit BuildMonitor(QObject *parent = nullptr);
  explicit BuildMonitor(runner::ProcessRunner::Options options,
                        QObject *parent = nullptr);
  ~BuildMonitor() override;

  /**
   * @brief Start an operation and begin polling
   *
   * A run that fails to launch is reported before this returns.
   */
  Result<u64, runner::StartError> start(const runner::BuildRequest &request);

  /**
   * @brief Ask the running process to stop; runFinished follows
   */
  void cancel();

  [[nodiscard]] bool isRunning() const { return m_runner.isRunning(); }
  [[nodiscard]] runner::ExecutionState snapshot() const {
    return m_runner.snapshot();
  }
  [[nodiscard]] u64 currentRunId() const { return m_runId; }

  runner::ProcessRunner &processRunner() { return m_runner; }

public slots:
  /**
   * @brief Pull the latest state and emit what changed
   */
  void poll();

signals:
  void runStarted(quint64 runId);
  void logLinesAppended(const QStringList &lines);
  void progressChanged(double fraction);
  void phaseChanged(BuildDeck::runner::Phase phase);
  void runFinished(BuildDeck::runner::Phase phase, int exitCode,
                   const QString &message);

private:
  runner::ProcessRunner m_runner;
  QTimer m_timer;

  u64 m_runId = 0;
  usize m_nextLine = 0;
  double m_progress = 0.0;
  runner::Phase m_phase = runner::Phase::Idle;
  bool m_finishReported = true;
};

} // namespace BuildDeck::editor::qt
