#include "geojson_parser.hpp"

#include <cmath>
#include <QString>
#include <QByteArray>

namespace {

bool requireNumber(const QJsonObject& object, const QString& key, double* value, QString* error)
{
    const QJsonValue field = object.value(key);
    if (!field.isDouble()) {
        *error = field.isUndefined()
            ? QString("missing '%1'").arg(key)
            : QString("'%1' is not a number").arg(key);
        return false;
    }
    *value = field.toDouble();
    return true;
}

} // namespace

GeoJsonParser::ParseResult GeoJsonParser::parseUSGSGeoJson(const QByteArray& jsonData) {
    QElapsedTimer timer;
    timer.start();
    
    ParseResult result;
    
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(jsonData, &parseError);
    
    if (parseError.error != QJsonParseError::NoError) {
        result.errorMessage = "JSON Parse Error: " + parseError.errorString()
                              + QString(" at offset %1").arg(parseError.offset);
        result.parseTimeMs = timer.elapsed();
        return result;
    }
    
    if (!doc.isObject()) {
        result.errorMessage = "Invalid GeoJSON structure: top-level value is not an object";
        result.parseTimeMs = timer.elapsed();
        return result;
    }

    QJsonObject root = doc.object();
    QString structureError;
    if (!validateGeoJsonStructure(root, &structureError)) {
        result.errorMessage = "Invalid GeoJSON structure: " + structureError;
        result.parseTimeMs = timer.elapsed();
        return result;
    }
    
    QJsonArray features = root["features"].toArray();
    result.totalFeatures = features.size();
    result.events.reserve(features.size());
    
    for (int i = 0; i < features.size(); ++i) {
        SeismicEvent event;
        QString featureError;
        if (!parseFeature(features.at(i), &event, &featureError)) {
            result.events.clear();
            result.errorMessage = QString("Feature %1: %2").arg(i).arg(featureError);
            result.parseTimeMs = timer.elapsed();
            return result;
        }
        result.events.push_back(event);
    }
    
    result.success = true;
    result.parseTimeMs = timer.elapsed();
    return result;
}

bool GeoJsonParser::validateGeoJsonStructure(const QJsonObject& root, QString* error) {
    if (!root.contains("features")) {
        *error = "missing 'features'";
        return false;
    }
    if (!root["features"].isArray()) {
        *error = "'features' is not an array";
        return false;
    }
    return true;
}

bool GeoJsonParser::parseFeature(const QJsonValue& featureValue, SeismicEvent* event, QString* error) {
    if (!featureValue.isObject()) {
        *error = "not an object";
        return false;
    }
    const QJsonObject feature = featureValue.toObject();

    const QJsonValue propertiesValue = feature.value("properties");
    if (!propertiesValue.isObject()) {
        *error = "missing 'properties'";
        return false;
    }
    const QJsonObject properties = propertiesValue.toObject();

    const QJsonValue geometryValue = feature.value("geometry");
    if (!geometryValue.isObject()) {
        *error = "missing 'geometry'";
        return false;
    }
    const QJsonValue coordinatesValue = geometryValue.toObject().value("coordinates");
    if (!coordinatesValue.isArray()) {
        *error = "missing 'geometry.coordinates'";
        return false;
    }
    const QJsonArray coordinates = coordinatesValue.toArray();
    if (coordinates.size() < 3) {
        *error = QString("'geometry.coordinates' has %1 values, expected [lon, lat, depth]")
                     .arg(coordinates.size());
        return false;
    }
    for (int i = 0; i < 3; ++i) {
        if (!coordinates.at(i).isDouble()) {
            *error = QString("'geometry.coordinates[%1]' is not a number").arg(i);
            return false;
        }
    }

    double magnitude = 0.0;
    if (!requireNumber(properties, "mag", &magnitude, error))
        return false;

    const QJsonValue place = properties.value("place");
    if (!place.isString()) {
        *error = place.isUndefined() ? "missing 'place'" : "'place' is not a string";
        return false;
    }

    double time = 0.0;
    if (!requireNumber(properties, "time", &time, error))
        return false;
    if (std::trunc(time) != time) {
        *error = "'time' is not an integer";
        return false;
    }

    // GeoJSON order is [longitude, latitude, depth]
    *event = SeismicEvent(magnitude,
                          place.toString(),
                          properties.value("time").toInteger(),
                          coordinates.at(1).toDouble(),
                          coordinates.at(0).toDouble(),
                          coordinates.at(2).toDouble(),
                          feature.value("id").toString());
    return true;
}
