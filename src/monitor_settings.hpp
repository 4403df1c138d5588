#pragma once

#include <QtCore/QSettings>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QUrl>

#include "poll_scheduler.hpp"
#include "region_filter.hpp"

struct MonitorSettings {
    // Feed
    QUrl endpoint;
    QString userAgent;
    int timeoutMs = 30000;

    // Polling, dedup and report options
    PollOptions poll;

    // Region
    QString regionName = QStringLiteral("North America");
    double regionMinLatitude = RegionFilter::NORTH_AMERICA_MIN_LAT;
    double regionMaxLatitude = RegionFilter::NORTH_AMERICA_MAX_LAT;
    double regionMinLongitude = RegionFilter::NORTH_AMERICA_MIN_LON;
    double regionMaxLongitude = RegionFilter::NORTH_AMERICA_MAX_LON;

    // Report
    QString placeFilter = QStringLiteral("Julian");

    // Logging
    QString responseLogFile;   // empty = disabled
    QString logLevel = QStringLiteral("info");

    // Values load() could not interpret
    QStringList loadErrors;

    MonitorSettings();

    void load(QSettings &settings);
    void save(QSettings &settings) const;

    RegionFilter regionFilter() const;

    // Empty when the settings are usable
    QStringList validate() const;

    static bool parseFingerprintMode(const QString &text, FingerprintMode *mode);
    static QString fingerprintModeName(FingerprintMode mode);
};
