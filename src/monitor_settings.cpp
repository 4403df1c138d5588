#include "monitor_settings.hpp"
#include "usgs_feed_source.hpp"

MonitorSettings::MonitorSettings()
    : endpoint(UsgsFeedSource::DEFAULT_ENDPOINT)
    , userAgent(QStringLiteral("QuakeWatch/1.0"))
    , timeoutMs(UsgsFeedSource::DEFAULT_TIMEOUT_MS)
{
}

namespace {

QString keyPath(const QSettings &settings, const QString &key)
{
    return settings.group().isEmpty() ? key : settings.group() + '/' + key;
}

int readInt(const QSettings &settings, const QString &key, int current, QStringList *errors)
{
    const QVariant value = settings.value(key, current);
    bool ok = false;
    const int result = value.toInt(&ok);
    if (!ok) {
        *errors << QString("%1 '%2' is not an integer").arg(keyPath(settings, key), value.toString());
        return current;
    }
    return result;
}

double readDouble(const QSettings &settings, const QString &key, double current, QStringList *errors)
{
    const QVariant value = settings.value(key, current);
    bool ok = false;
    const double result = value.toDouble(&ok);
    if (!ok) {
        *errors << QString("%1 '%2' is not a number").arg(keyPath(settings, key), value.toString());
        return current;
    }
    return result;
}

bool readBool(const QSettings &settings, const QString &key, bool current, QStringList *errors)
{
    const QString value = settings.value(key, current).toString().trimmed().toLower();
    if (value == "true" || value == "1")
        return true;
    if (value == "false" || value == "0")
        return false;
    *errors << QString("%1 '%2' must be true or false").arg(keyPath(settings, key), value);
    return current;
}

} // namespace

void MonitorSettings::load(QSettings &settings)
{
    loadErrors.clear();

    settings.beginGroup("Feed");
    endpoint = QUrl(settings.value("endpoint", endpoint.toString()).toString());
    userAgent = settings.value("userAgent", userAgent).toString();
    timeoutMs = readInt(settings, "timeoutMs", timeoutMs, &loadErrors);
    poll.minMagnitude = readDouble(settings, "minMagnitude", poll.minMagnitude, &loadErrors);
    poll.windowDays = readInt(settings, "windowDays", poll.windowDays, &loadErrors);
    poll.daysAhead = readInt(settings, "daysAhead", poll.daysAhead, &loadErrors);
    settings.endGroup();

    settings.beginGroup("Polling");
    poll.intervalMs = readInt(settings, "intervalMs", poll.intervalMs, &loadErrors);
    poll.maxIntervalMs = readInt(settings, "maxIntervalMs", poll.maxIntervalMs, &loadErrors);
    poll.maxCycles = readInt(settings, "maxCycles", poll.maxCycles, &loadErrors);
    settings.endGroup();

    settings.beginGroup("Dedup");
    const QString mode = settings.value("fingerprint", fingerprintModeName(poll.fingerprintMode)).toString();
    if (!parseFingerprintMode(mode, &poll.fingerprintMode))
        loadErrors << QString("Dedup/fingerprint '%1' must be 'rendered' or 'feedId'").arg(mode);
    poll.maxDedupEntries = readInt(settings, "maxEntries", poll.maxDedupEntries, &loadErrors);
    settings.endGroup();

    settings.beginGroup("Region");
    regionName = settings.value("name", regionName).toString();
    regionMinLatitude = readDouble(settings, "minLatitude", regionMinLatitude, &loadErrors);
    regionMaxLatitude = readDouble(settings, "maxLatitude", regionMaxLatitude, &loadErrors);
    regionMinLongitude = readDouble(settings, "minLongitude", regionMinLongitude, &loadErrors);
    regionMaxLongitude = readDouble(settings, "maxLongitude", regionMaxLongitude, &loadErrors);
    settings.endGroup();

    settings.beginGroup("Report");
    placeFilter = settings.value("placeFilter", placeFilter).toString();
    poll.maxRegionMatches = readInt(settings, "maxRegionMatches", poll.maxRegionMatches, &loadErrors);
    poll.streamRegionMatches = readBool(settings, "streamRegionMatches", poll.streamRegionMatches, &loadErrors);
    settings.endGroup();

    settings.beginGroup("Logging");
    responseLogFile = settings.value("responseLogFile", responseLogFile).toString();
    logLevel = settings.value("level", logLevel).toString();
    settings.endGroup();
}

void MonitorSettings::save(QSettings &settings) const
{
    settings.beginGroup("Feed");
    settings.setValue("endpoint", endpoint.toString());
    settings.setValue("userAgent", userAgent);
    settings.setValue("timeoutMs", timeoutMs);
    settings.setValue("minMagnitude", poll.minMagnitude);
    settings.setValue("windowDays", poll.windowDays);
    settings.setValue("daysAhead", poll.daysAhead);
    settings.endGroup();

    settings.beginGroup("Polling");
    settings.setValue("intervalMs", poll.intervalMs);
    settings.setValue("maxIntervalMs", poll.maxIntervalMs);
    settings.setValue("maxCycles", poll.maxCycles);
    settings.endGroup();

    settings.beginGroup("Dedup");
    settings.setValue("fingerprint", fingerprintModeName(poll.fingerprintMode));
    settings.setValue("maxEntries", poll.maxDedupEntries);
    settings.endGroup();

    settings.beginGroup("Region");
    settings.setValue("name", regionName);
    settings.setValue("minLatitude", regionMinLatitude);
    settings.setValue("maxLatitude", regionMaxLatitude);
    settings.setValue("minLongitude", regionMinLongitude);
    settings.setValue("maxLongitude", regionMaxLongitude);
    settings.endGroup();

    settings.beginGroup("Report");
    settings.setValue("placeFilter", placeFilter);
    settings.setValue("maxRegionMatches", poll.maxRegionMatches);
    settings.setValue("streamRegionMatches", poll.streamRegionMatches);
    settings.endGroup();

    settings.beginGroup("Logging");
    settings.setValue("responseLogFile", responseLogFile);
    settings.setValue("level", logLevel);
    settings.endGroup();
}

RegionFilter MonitorSettings::regionFilter() const
{
    return RegionFilter(regionName, regionMinLatitude, regionMaxLatitude,
                        regionMinLongitude, regionMaxLongitude);
}

QStringList MonitorSettings::validate() const
{
    QStringList errors = loadErrors;

    if (!endpoint.isValid() || endpoint.scheme().isEmpty() || endpoint.host().isEmpty())
        errors << QString("Feed/endpoint is not a valid URL: '%1'").arg(endpoint.toString());
    if (timeoutMs < 0)
        errors << "Feed/timeoutMs must not be negative";
    if (poll.minMagnitude < 0.0)
        errors << "Feed/minMagnitude must not be negative";
    if (poll.windowDays < 0)
        errors << "Feed/windowDays must not be negative";
    if (poll.intervalMs <= 0)
        errors << "Polling/intervalMs must be positive";
    if (poll.maxIntervalMs < poll.intervalMs)
        errors << "Polling/maxIntervalMs must be at least Polling/intervalMs";
    if (poll.maxCycles < 0)
        errors << "Polling/maxCycles must not be negative";
    if (poll.maxDedupEntries < 0)
        errors << "Dedup/maxEntries must not be negative";
    if (poll.maxRegionMatches < 0)
        errors << "Report/maxRegionMatches must not be negative";
    if (!regionFilter().isValid())
        errors << "Region bounds must satisfy -90 <= minLatitude <= maxLatitude <= 90 "
                  "and -180 <= minLongitude <= maxLongitude <= 180";

    const QString level = logLevel.toLower();
    if (level != "debug" && level != "info" && level != "warning" && level != "critical")
        errors << QString("Logging/level '%1' is not one of debug, info, warning, critical").arg(logLevel);

    return errors;
}

bool MonitorSettings::parseFingerprintMode(const QString &text, FingerprintMode *mode)
{
    const QString value = text.trimmed().toLower();
    if (value == "rendered") {
        *mode = FingerprintMode::Rendered;
        return true;
    }
    if (value == "feedid") {
        *mode = FingerprintMode::FeedId;
        return true;
    }
    return false;
}

QString MonitorSettings::fingerprintModeName(FingerprintMode mode)
{
    return mode == FingerprintMode::FeedId ? QStringLiteral("feedId") : QStringLiteral("rendered");
}
