#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>

class PollScheduler;
class ConsoleReporter;
struct SeismicEvent;

// Routes scheduler output to the reporter and owns the run's exit code.
// A failing sink stops polling with ExitSinkFailed. The summary is written
// once, after the scheduler has finished.
class MonitorSession : public QObject
{
    Q_OBJECT

public:
    enum ExitCode {
        ExitOk = 0,
        ExitInitializationFailed = 1,
        ExitSinkFailed = 2
    };

    MonitorSession(PollScheduler *scheduler, ConsoleReporter *reporter,
                   const QString &placeFilter, QObject *parent = nullptr);

    int exitCode() const { return m_exitCode; }
    bool summaryPrinted() const { return m_summaryPrinted; }

public slots:
    void onResponseLogFailed(const QString &error);

signals:
    void finished(int exitCode);

private slots:
    void onEventEmitted(const SeismicEvent &event, const QString &rendered);
    void onRegionMatched(const QString &rendered);
    void onSchedulerFinished();

private:
    void failSink(const QString &what);

    PollScheduler *m_scheduler;
    ConsoleReporter *m_reporter;
    QString m_placeFilter;

    int m_exitCode;
    bool m_summaryPrinted;
};
