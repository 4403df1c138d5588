#include "monitor_session.hpp"
#include "console_reporter.hpp"
#include "poll_scheduler.hpp"
#include "logging.hpp"

MonitorSession::MonitorSession(PollScheduler *scheduler, ConsoleReporter *reporter,
                               const QString &placeFilter, QObject *parent)
    : QObject(parent)
    , m_scheduler(scheduler)
    , m_reporter(reporter)
    , m_placeFilter(placeFilter)
    , m_exitCode(ExitOk)
    , m_summaryPrinted(false)
{
    connect(m_scheduler, &PollScheduler::eventEmitted,
            this, &MonitorSession::onEventEmitted);
    connect(m_scheduler, &PollScheduler::regionMatched,
            this, &MonitorSession::onRegionMatched);
    // Queued so the scheduler has fully unwound before anyone exits
    connect(m_scheduler, &PollScheduler::finished,
            this, &MonitorSession::onSchedulerFinished, Qt::QueuedConnection);
}

void MonitorSession::onResponseLogFailed(const QString &error)
{
    qCCritical(lcMain) << "Response log unavailable:" << error;
    failSink("response log");
}

void MonitorSession::onEventEmitted(const SeismicEvent &event, const QString &rendered)
{
    Q_UNUSED(event);
    m_reporter->printNewEvent(rendered);
    if (!m_reporter->isHealthy())
        failSink("standard output");
}

void MonitorSession::onRegionMatched(const QString &rendered)
{
    m_reporter->printRegionMatch(m_scheduler->regionFilter().name(), rendered);
    if (!m_reporter->isHealthy())
        failSink("standard output");
}

void MonitorSession::onSchedulerFinished()
{
    if (m_summaryPrinted)
        return;
    m_summaryPrinted = true;

    m_reporter->printSummary(m_scheduler->lastGoodBatch(), m_placeFilter,
                             m_scheduler->regionFilter().name(), m_scheduler->regionMatches());
    if (!m_reporter->isHealthy() && m_exitCode == ExitOk) {
        qCCritical(lcMain) << "Failed to write summary to standard output";
        m_exitCode = ExitSinkFailed;
    }

    emit finished(m_exitCode);
}

void MonitorSession::failSink(const QString &what)
{
    if (m_exitCode != ExitOk)
        return;

    qCCritical(lcMain) << "Output sink failed:" << what << "- stopping";
    m_exitCode = ExitSinkFailed;
    m_scheduler->stop();
}
