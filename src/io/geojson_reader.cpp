#include "io/geojson_reader.hpp"
#include "geo/coordinate_system_utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <optional>

namespace urbanmetrics {
namespace io {

std::string GeoJSONReader::last_error_ = "";

geo::GeospatialDataset GeoJSONReader::readFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        setError("Failed to open file: " + filepath);
        throw std::runtime_error(last_error_);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    try {
        return readFromString(buffer.str());
    } catch (const std::exception& e) {
        setError("Error reading file " + filepath + ": " + e.what());
        throw std::runtime_error(last_error_);
    }
}

geo::GeospatialDataset GeoJSONReader::readFromString(const std::string& geojson_string) {
    nlohmann::json geojson;
    try {
        geojson = nlohmann::json::parse(geojson_string);
    } catch (const nlohmann::json::parse_error& e) {
        setError("JSON parse error: " + std::string(e.what()));
        throw std::runtime_error(last_error_);
    }

    if (!geojson.is_object() || !geojson.contains("type")) {
        setError("Invalid GeoJSON: Missing type member");
        throw std::runtime_error(last_error_);
    }

    std::string crs = parseCRS(geojson);

    // Lengths and areas are measured after projecting from WGS84 to UTM
    if (!geo::CoordinateSystemUtils::isWGS84(crs)) {
        setError("Coordinate system must be WGS84 longitude/latitude (EPSG:4326), got " + crs);
        throw std::runtime_error(last_error_);
    }

    std::vector<geo::GeospatialFeature> features;
    if (geojson["type"] == "FeatureCollection") {
        if (geojson.contains("features") && geojson["features"].is_array()) {
            size_t featureIndex = 0;
            for (const auto& feature_json : geojson["features"]) {
                auto feature = parseFeature(feature_json, featureIndex);
                if (feature.has_value()) {
                    features.push_back(feature.value());
                }
                featureIndex++;
            }
        }
    } else if (geojson["type"] == "Feature") {
        auto feature = parseFeature(geojson, 0);
        if (feature.has_value()) {
            features.push_back(feature.value());
        }
    } else {
        setError("Invalid GeoJSON: Expected FeatureCollection or Feature type");
        throw std::runtime_error(last_error_);
    }

    return geo::GeospatialDataset(crs, features);
}

std::string GeoJSONReader::parseCRS(const nlohmann::json& geojson) {
    if (!geojson.contains("crs") || !geojson["crs"].is_object()) {
        return "";
    }
    const auto& crs_obj = geojson["crs"];
    if (!crs_obj.contains("properties") || !crs_obj["properties"].is_object()) {
        return "";
    }
    const auto& properties = crs_obj["properties"];

    // Named CRS: {"type": "name", "properties": {"name": "urn:ogc:def:crs:OGC:1.3:CRS84"}}
    if (crs_obj.value("type", "") == "name" && properties.contains("name") && properties["name"].is_string()) {
        return properties["name"].get<std::string>();
    }

    // Legacy CRS: {"type": "EPSG", "properties": {"code": 4326}}
    if (crs_obj.value("type", "") == "EPSG" && properties.contains("code") && properties["code"].is_number_integer()) {
        return "EPSG:" + std::to_string(properties["code"].get<int>());
    }

    return "";
}

std::optional<geo::GeospatialFeature> GeoJSONReader::parseFeature(const nlohmann::json& feature_json, size_t id) {
    if (!feature_json.is_object() || !feature_json.contains("type") || feature_json["type"] != "Feature") {
        setError("Invalid feature " + std::to_string(id) + ": Expected Feature type");
        throw std::runtime_error(last_error_);
    }

    // Features without geometry carry nothing to measure
    if (!feature_json.contains("geometry") || feature_json["geometry"].is_null()) {
        return std::nullopt;
    }

    nlohmann::json properties = feature_json.value("properties", nlohmann::json::object());
    if (properties.is_null()) {
        properties = nlohmann::json::object();
    }

    return geo::GeospatialFeature(id, feature_json["geometry"], properties);
}

} // namespace io
} // namespace urbanmetrics
