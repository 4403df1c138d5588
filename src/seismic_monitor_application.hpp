#pragma once
#include <QtCore/QCoreApplication>
#include <QtCore/QCommandLineParser>
#include <QtCore/QCommandLineOption>
#include <QtCore/QSocketNotifier>
#include <QtCore/QStringList>
#include <memory>

#include "monitor_settings.hpp"

class UsgsFeedSource;
class PollScheduler;
class ResponseLog;
class ConsoleReporter;
class MonitorSession;
class FeedError;

// Application information
#define QUAKEWATCH_APP_NAME "QuakeWatch"
#define QUAKEWATCH_APP_VERSION "1.0.0"
#define QUAKEWATCH_APP_ORGANIZATION "QuakeWatch"
#define QUAKEWATCH_APP_DESCRIPTION "Polls a seismic event feed and streams newly reported earthquakes"

class SeismicMonitorApplication : public QCoreApplication
{
    Q_OBJECT

public:
    SeismicMonitorApplication(int &argc, char **argv);
    ~SeismicMonitorApplication() override;

    // Loads configuration, opens sinks and starts polling. On false the
    // reason has been logged and the process should exit with
    // MonitorSession::ExitInitializationFailed.
    bool initialize();

    const MonitorSettings &settings() const { return m_settings; }

private slots:
    void onFetchFailed(const FeedError &error);
    void onSessionFinished(int exitCode);
    void onUnixSignal();

private:
    struct CommandLineArgs {
        QString configFile;
        QString logLevel;
        QString endpoint;
        QString minMagnitude;
        QString interval;
        QString cycles;
        QString responseLog;
        QString placeFilter;
        QString fingerprint;
        bool streamRegion = false;
    };

    void setupApplication();
    void parseCommandLine();
    bool loadSettings();
    void applyCommandLineOverrides(QStringList *errors);
    void setupLogging();
    bool setupSignalHandling();
    bool initializeComponents();
    void connectComponents();
    void cleanup();

    static void unixSignalHandler(int signal);

    CommandLineArgs m_commandLineArgs;
    MonitorSettings m_settings;

    std::unique_ptr<ResponseLog> m_responseLog;
    std::unique_ptr<ConsoleReporter> m_reporter;
    UsgsFeedSource *m_feedSource;
    PollScheduler *m_scheduler;
    MonitorSession *m_session;
    QSocketNotifier *m_signalNotifier;

    static int s_signalFds[2];
};
