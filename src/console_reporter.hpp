#pragma once
#include "seismic_event.hpp"

#include <QtCore/QIODevice>
#include <QtCore/QStringList>
#include <QtCore/QTextStream>

class RegionMatchLog;

// Writes the event stream and the end-of-run summary. stdout unless a
// device is given.
class ConsoleReporter
{
public:
    ConsoleReporter();
    explicit ConsoleReporter(QIODevice *device);

    void printNewEvent(const QString &rendered);
    void printRegionMatch(const QString &regionName, const QString &rendered);
    void printSummary(const EventBatch &lastBatch, const QString &placeFilter,
                      const QString &regionName, const RegionMatchLog &regionMatches);

    // False once a write has failed
    bool isHealthy() const { return m_stream.status() == QTextStream::Ok; }

    static QStringList nearbyPlaces(const EventBatch &batch, const QString &placeFilter);

private:
    void writeLine(const QString &line);

    QTextStream m_stream;
};
