#pragma once
#include "seismic_event.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QElapsedTimer>
class QByteArray;

// Decoder for the FDSN event service GeoJSON payload. Decoding is
// all-or-nothing: one bad feature fails the whole payload.
class GeoJsonParser {
public:
    struct ParseResult {
        EventBatch events;
        int totalFeatures = 0;
        qint64 parseTimeMs = 0;
        bool success = false;
        QString errorMessage;
    };

    static ParseResult parseUSGSGeoJson(const QByteArray& jsonData);

private:
    static bool validateGeoJsonStructure(const QJsonObject& root, QString* error);
    static bool parseFeature(const QJsonValue& featureValue, SeismicEvent* event, QString* error);
};
