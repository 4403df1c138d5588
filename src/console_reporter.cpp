#include "console_reporter.hpp"
#include "region_match_log.hpp"

#include <cstdio>

ConsoleReporter::ConsoleReporter()
    : m_stream(stdout)
{
}

ConsoleReporter::ConsoleReporter(QIODevice *device)
    : m_stream(device)
{
}

void ConsoleReporter::printNewEvent(const QString &rendered)
{
    writeLine(rendered);
}

void ConsoleReporter::printRegionMatch(const QString &regionName, const QString &rendered)
{
    writeLine(QString("[%1] %2").arg(regionName, rendered));
}

void ConsoleReporter::printSummary(const EventBatch &lastBatch, const QString &placeFilter,
                                   const QString &regionName, const RegionMatchLog &regionMatches)
{
    writeLine(QStringLiteral("Nearby shaker(s): "));
    for (const QString &place : nearbyPlaces(lastBatch, placeFilter)) {
        writeLine(place);
    }

    writeLine(QString("Filter for %1").arg(regionName));
    if (regionMatches.droppedCount() > 0) {
        writeLine(QString("(%1 older match(es) dropped)").arg(regionMatches.droppedCount()));
    }
    // Header and match lines keep their trailing space
    for (const QString &match : regionMatches.entries()) {
        writeLine(match + QLatin1Char(' '));
    }
}

QStringList ConsoleReporter::nearbyPlaces(const EventBatch &batch, const QString &placeFilter)
{
    QStringList places;
    if (placeFilter.isEmpty())
        return places;

    for (const SeismicEvent &event : batch) {
        if (event.place.contains(placeFilter))
            places.append(event.place);
    }
    return places;
}

void ConsoleReporter::writeLine(const QString &line)
{
    m_stream << line << '\n';
    m_stream.flush();
}
