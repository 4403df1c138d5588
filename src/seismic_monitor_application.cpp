#include "seismic_monitor_application.hpp"
#include "console_reporter.hpp"
#include "monitor_session.hpp"
#include "poll_scheduler.hpp"
#include "response_log.hpp"
#include "usgs_feed_source.hpp"
#include "logging.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QLoggingCategory>
#include <QtCore/QSettings>

#include <csignal>
#include <sys/socket.h>
#include <unistd.h>

int SeismicMonitorApplication::s_signalFds[2] = { -1, -1 };

SeismicMonitorApplication::SeismicMonitorApplication(int &argc, char **argv)
    : QCoreApplication(argc, argv)
    , m_feedSource(nullptr)
    , m_scheduler(nullptr)
    , m_session(nullptr)
    , m_signalNotifier(nullptr)
{
    setupApplication();
    parseCommandLine();
}

SeismicMonitorApplication::~SeismicMonitorApplication()
{
    cleanup();
}

bool SeismicMonitorApplication::initialize()
{
    if (!loadSettings())
        return false;

    setupLogging();

    if (!setupSignalHandling())
        qCWarning(lcMain) << "Signal handling unavailable - stop with kill -9 only";

    if (!initializeComponents())
        return false;

    connectComponents();

    qCInfo(lcMain) << "Monitoring" << m_settings.endpoint.toString()
                   << "for M" << m_settings.poll.minMagnitude << "and above";
    m_scheduler->start();
    return true;
}

void SeismicMonitorApplication::onFetchFailed(const FeedError &error)
{
    qCDebug(lcMain) << "Cycle failed with" << error.toString()
                    << "- total failed requests:" << m_feedSource->getFailedRequests();
}

void SeismicMonitorApplication::onSessionFinished(int exitCode)
{
    qCInfo(lcMain) << "Exiting with code" << exitCode;
    exit(exitCode);
}

void SeismicMonitorApplication::onUnixSignal()
{
    m_signalNotifier->setEnabled(false);
    char signalNumber = 0;
    if (::read(s_signalFds[1], &signalNumber, sizeof(signalNumber)) > 0) {
        qCInfo(lcMain) << "Received signal" << int(signalNumber) << "- initiating graceful shutdown";
    }
    if (m_scheduler) {
        m_scheduler->stop();
    } else {
        exit(MonitorSession::ExitOk);
    }
    m_signalNotifier->setEnabled(true);
}

void SeismicMonitorApplication::setupApplication()
{
    setApplicationName(QUAKEWATCH_APP_NAME);
    setApplicationVersion(QUAKEWATCH_APP_VERSION);
    setOrganizationName(QUAKEWATCH_APP_ORGANIZATION);
}

void SeismicMonitorApplication::parseCommandLine()
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QUAKEWATCH_APP_DESCRIPTION);
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption({"config", "c"}, "Read settings from an INI file", "file");
    QCommandLineOption logLevelOption({"log-level", "l"}, "Set logging level (debug, info, warning, critical)", "level");
    QCommandLineOption endpointOption("endpoint", "Feed query endpoint URL", "url");
    QCommandLineOption minMagnitudeOption("min-magnitude", "Minimum magnitude to request", "magnitude");
    QCommandLineOption intervalOption("interval", "Delay between polls in milliseconds", "ms");
    QCommandLineOption cyclesOption("cycles", "Stop after this many polls (0 = run until interrupted)", "count");
    QCommandLineOption responseLogOption("response-log", "Append raw feed responses to this file", "file");
    QCommandLineOption placeFilterOption("place-filter", "Substring for the nearby-shakers report", "text");
    QCommandLineOption fingerprintOption("fingerprint", "Duplicate detection key (rendered, feedId)", "mode");
    QCommandLineOption streamRegionOption("stream-region", "Print region matches as they arrive instead of at exit");

    parser.addOption(configOption);
    parser.addOption(logLevelOption);
    parser.addOption(endpointOption);
    parser.addOption(minMagnitudeOption);
    parser.addOption(intervalOption);
    parser.addOption(cyclesOption);
    parser.addOption(responseLogOption);
    parser.addOption(placeFilterOption);
    parser.addOption(fingerprintOption);
    parser.addOption(streamRegionOption);

    parser.process(*this);

    m_commandLineArgs.configFile = parser.value(configOption);
    m_commandLineArgs.logLevel = parser.value(logLevelOption);
    m_commandLineArgs.endpoint = parser.value(endpointOption);
    m_commandLineArgs.minMagnitude = parser.value(minMagnitudeOption);
    m_commandLineArgs.interval = parser.value(intervalOption);
    m_commandLineArgs.cycles = parser.value(cyclesOption);
    m_commandLineArgs.responseLog = parser.value(responseLogOption);
    m_commandLineArgs.placeFilter = parser.value(placeFilterOption);
    m_commandLineArgs.fingerprint = parser.value(fingerprintOption);
    m_commandLineArgs.streamRegion = parser.isSet(streamRegionOption);
}

bool SeismicMonitorApplication::loadSettings()
{
    if (!m_commandLineArgs.configFile.isEmpty()) {
        if (!QFileInfo::exists(m_commandLineArgs.configFile)) {
            qCCritical(lcMain) << "Configuration file not found:" << m_commandLineArgs.configFile;
            return false;
        }
        QSettings settings(m_commandLineArgs.configFile, QSettings::IniFormat);
        if (settings.status() != QSettings::NoError) {
            qCCritical(lcMain) << "Configuration file is not readable INI:" << m_commandLineArgs.configFile;
            return false;
        }
        m_settings.load(settings);
        qCInfo(lcMain) << "Loaded configuration from" << settings.fileName();
    } else {
        QSettings settings(QSettings::IniFormat, QSettings::UserScope,
                           QUAKEWATCH_APP_ORGANIZATION, QUAKEWATCH_APP_NAME);
        m_settings.load(settings);
    }

    QStringList errors;
    applyCommandLineOverrides(&errors);
    errors << m_settings.validate();

    if (!errors.isEmpty()) {
        for (const QString &error : errors) {
            qCCritical(lcMain).noquote() << "Configuration error:" << error;
        }
        return false;
    }
    return true;
}

void SeismicMonitorApplication::applyCommandLineOverrides(QStringList *errors)
{
    const CommandLineArgs &args = m_commandLineArgs;

    if (!args.logLevel.isEmpty())
        m_settings.logLevel = args.logLevel;
    if (!args.endpoint.isEmpty())
        m_settings.endpoint = QUrl(args.endpoint);
    if (!args.responseLog.isEmpty())
        m_settings.responseLogFile = args.responseLog;
    if (!args.placeFilter.isEmpty())
        m_settings.placeFilter = args.placeFilter;
    if (args.streamRegion)
        m_settings.poll.streamRegionMatches = true;

    if (!args.minMagnitude.isEmpty()) {
        bool ok = false;
        const double value = args.minMagnitude.toDouble(&ok);
        if (ok)
            m_settings.poll.minMagnitude = value;
        else
            *errors << QString("--min-magnitude '%1' is not a number").arg(args.minMagnitude);
    }

    if (!args.interval.isEmpty()) {
        bool ok = false;
        const int value = args.interval.toInt(&ok);
        if (ok) {
            m_settings.poll.intervalMs = value;
            m_settings.poll.maxIntervalMs = qMax(m_settings.poll.maxIntervalMs, value);
        } else {
            *errors << QString("--interval '%1' is not an integer").arg(args.interval);
        }
    }

    if (!args.cycles.isEmpty()) {
        bool ok = false;
        const int value = args.cycles.toInt(&ok);
        if (ok)
            m_settings.poll.maxCycles = value;
        else
            *errors << QString("--cycles '%1' is not an integer").arg(args.cycles);
    }

    if (!args.fingerprint.isEmpty()
        && !MonitorSettings::parseFingerprintMode(args.fingerprint, &m_settings.poll.fingerprintMode)) {
        *errors << QString("--fingerprint '%1' must be 'rendered' or 'feedId'").arg(args.fingerprint);
    }
}

void SeismicMonitorApplication::setupLogging()
{
    const QString logLevel = m_settings.logLevel.toLower();

    if (logLevel == "debug") {
        QLoggingCategory::setFilterRules("quakewatch.*=true");
    } else if (logLevel == "warning") {
        QLoggingCategory::setFilterRules("*.debug=false\n*.info=false");
    } else if (logLevel == "critical") {
        QLoggingCategory::setFilterRules("*.debug=false\n*.info=false\n*.warning=false");
    } else {
        QLoggingCategory::setFilterRules("*.debug=false"); // Default: info and above
    }

    qSetMessagePattern("[%{time yyyy-MM-dd hh:mm:ss.zzz}] [%{category}] [%{type}] %{message}");

    qCInfo(lcMain) << "Application starting..." << QUAKEWATCH_APP_NAME << QUAKEWATCH_APP_VERSION;
}

bool SeismicMonitorApplication::setupSignalHandling()
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, s_signalFds) != 0) {
        qCWarning(lcMain) << "socketpair() failed";
        return false;
    }

    m_signalNotifier = new QSocketNotifier(s_signalFds[1], QSocketNotifier::Read, this);
    connect(m_signalNotifier, &QSocketNotifier::activated,
            this, &SeismicMonitorApplication::onUnixSignal);

    struct sigaction action = {};
    action.sa_handler = &SeismicMonitorApplication::unixSignalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (::sigaction(SIGINT, &action, nullptr) != 0 || ::sigaction(SIGTERM, &action, nullptr) != 0) {
        qCWarning(lcMain) << "sigaction() failed";
        return false;
    }
    return true;
}

void SeismicMonitorApplication::unixSignalHandler(int signal)
{
    // Only async-signal-safe calls here; the notifier does the rest
    const char signalNumber = static_cast<char>(signal);
    const ssize_t written = ::write(s_signalFds[0], &signalNumber, sizeof(signalNumber));
    (void)written;
}

bool SeismicMonitorApplication::initializeComponents()
{
    if (!m_settings.responseLogFile.isEmpty()) {
        m_responseLog = std::make_unique<ResponseLog>(m_settings.responseLogFile);
        if (!m_responseLog->open()) {
            qCCritical(lcMain) << "Cannot open response log" << m_settings.responseLogFile
                               << m_responseLog->errorString();
            return false;
        }
    }

    m_reporter = std::make_unique<ConsoleReporter>();

    m_feedSource = new UsgsFeedSource(this);
    m_feedSource->setEndpoint(m_settings.endpoint);
    m_feedSource->setUserAgent(m_settings.userAgent);
    m_feedSource->setTimeout(m_settings.timeoutMs);
    m_feedSource->setResponseLog(m_responseLog.get());

    m_scheduler = new PollScheduler(m_feedSource, m_settings.regionFilter(), m_settings.poll, this);
    m_session = new MonitorSession(m_scheduler, m_reporter.get(), m_settings.placeFilter, this);

    qCInfo(lcMain) << "Components initialized, region" << m_settings.regionName
                   << "fingerprint" << MonitorSettings::fingerprintModeName(m_settings.poll.fingerprintMode);
    return true;
}

void SeismicMonitorApplication::connectComponents()
{
    connect(m_scheduler, &PollScheduler::fetchFailed,
            this, &SeismicMonitorApplication::onFetchFailed);
    connect(m_feedSource, &UsgsFeedSource::responseLogFailed,
            m_session, &MonitorSession::onResponseLogFailed);
    connect(m_session, &MonitorSession::finished,
            this, &SeismicMonitorApplication::onSessionFinished);
}

void SeismicMonitorApplication::cleanup()
{
    // Session, then scheduler: each references the next
    if (m_session) {
        delete m_session;
        m_session = nullptr;
    }
    if (m_scheduler) {
        disconnect(m_scheduler, nullptr, this, nullptr);
        m_scheduler->stop();
        delete m_scheduler;
        m_scheduler = nullptr;
    }
    if (m_feedSource) {
        m_feedSource->setResponseLog(nullptr);
        delete m_feedSource;
        m_feedSource = nullptr;
    }

    if (s_signalFds[0] >= 0) {
        ::close(s_signalFds[0]);
        ::close(s_signalFds[1]);
        s_signalFds[0] = s_signalFds[1] = -1;
    }
}
