#include "geo/common.hpp"
#include <iostream>
#include <stdexcept>

namespace urbanmetrics {
namespace geo {

namespace {

LinearRing ringFromCoordinates(const nlohmann::json& ring_coords) {
    LinearRing ring;
    for (const auto& coord : ring_coords) {
        if (coord.size() >= 2) {
            ring.push_back(Point(coord[0].get<double>(), coord[1].get<double>()));
        }
    }

    // Ensure the ring is closed (Boost geometry requirement)
    if (ring.size() > 0 &&
        (bg::get<0>(ring.front()) != bg::get<0>(ring.back()) ||
         bg::get<1>(ring.front()) != bg::get<1>(ring.back()))) {
        ring.push_back(ring.front());
    }

    return ring;
}

Polygon polygonFromCoordinates(const nlohmann::json& coords) {
    Polygon polygon;
    if (coords.size() == 0) {
        return polygon;
    }

    polygon.outer() = ringFromCoordinates(coords[0]);
    for (size_t i = 1; i < coords.size(); ++i) {
        LinearRing inner = ringFromCoordinates(coords[i]);
        if (inner.size() >= 4) {
            polygon.inners().push_back(inner);
        }
    }

    // Validate and correct the polygon
    if (!bg::is_valid(polygon)) {
        bg::correct(polygon);

        std::string reason;
        if (!bg::is_valid(polygon, reason)) {
            std::cerr << "Error: Polygon validation failed after correction (" << reason << ")" << std::endl;
            throw std::runtime_error("Failed to create valid polygon from GeoJSON");
        }
    }

    return polygon;
}

LineString lineFromCoordinates(const nlohmann::json& coords) {
    LineString linestring;
    if (coords.size() > 1) {
        for (const auto& coord : coords) {
            if (coord.size() >= 2) {
                linestring.push_back(Point(coord[0].get<double>(), coord[1].get<double>()));
            }
        }
    }
    return linestring;
}

} // namespace

// GeoJSON to Boost Geometry Conversion Utilities
Point geoJSONPointToBoost(const nlohmann::json& geometry) {
    if (geometry["type"] == "Point") {
        const auto& coords = geometry["coordinates"];
        if (coords.size() >= 2) {
            return Point(coords[0].get<double>(), coords[1].get<double>());
        } else {
            throw std::runtime_error("Point geometry has fewer than two coordinates");
        }
    } else if (geometry["type"] == "MultiPoint") {
        const auto& coords = geometry["coordinates"];
        if (coords.size() > 1) {
            std::cerr << "Warning: MultiPoint geometry contains " << coords.size()
                      << " points, using only the first point" << std::endl;
        }
        if (coords.size() > 0 && coords[0].size() >= 2) {
            return Point(coords[0][0].get<double>(), coords[0][1].get<double>());
        }
        throw std::runtime_error("MultiPoint geometry has no usable point");
    } else {
        throw std::runtime_error("Invalid geometry type for point conversion: " + geometry["type"].get<std::string>());
    }
}

MultiLineString geoJSONLinesToBoost(const nlohmann::json& geometry) {
    MultiLineString lines;
    if (geometry["type"] == "LineString") {
        LineString linestring = lineFromCoordinates(geometry["coordinates"]);
        if (linestring.size() > 1) {
            lines.push_back(linestring);
        }
    } else if (geometry["type"] == "MultiLineString") {
        for (const auto& part : geometry["coordinates"]) {
            LineString linestring = lineFromCoordinates(part);
            if (linestring.size() > 1) {
                lines.push_back(linestring);
            }
        }
    } else {
        throw std::runtime_error("Invalid geometry type for linestring conversion: " + geometry["type"].get<std::string>());
    }
    return lines;
}

MultiPolygon geoJSONPolygonsToBoost(const nlohmann::json& geometry) {
    MultiPolygon polygons;
    if (geometry["type"] == "Polygon") {
        Polygon polygon = polygonFromCoordinates(geometry["coordinates"]);
        if (!polygon.outer().empty()) {
            polygons.push_back(polygon);
        }
    } else if (geometry["type"] == "MultiPolygon") {
        for (const auto& part : geometry["coordinates"]) {
            Polygon polygon = polygonFromCoordinates(part);
            if (!polygon.outer().empty()) {
                polygons.push_back(polygon);
            }
        }
    } else {
        throw std::runtime_error("Invalid geometry type for polygon conversion: " + geometry["type"].get<std::string>());
    }
    return polygons;
}

nlohmann::json multiPolygonToGeoJSON(const MultiPolygon& multi_polygon) {
    nlohmann::json geometry;
    geometry["type"] = "MultiPolygon";
    nlohmann::json coordinates = nlohmann::json::array();

    for (const auto& polygon : multi_polygon) {
        nlohmann::json rings = nlohmann::json::array();

        nlohmann::json outerRing = nlohmann::json::array();
        for (const auto& point : polygon.outer()) {
            outerRing.push_back({bg::get<0>(point), bg::get<1>(point)});
        }
        rings.push_back(outerRing);

        for (const auto& inner : polygon.inners()) {
            nlohmann::json innerRing = nlohmann::json::array();
            for (const auto& point : inner) {
                innerRing.push_back({bg::get<0>(point), bg::get<1>(point)});
            }
            rings.push_back(innerRing);
        }

        coordinates.push_back(rings);
    }

    geometry["coordinates"] = coordinates;
    return geometry;
}

std::optional<GeometryType> classifyGeoJSONType(const std::string& type) {
    if (type == "Point" || type == "MultiPoint") {
        return GeometryType::POINT;
    }
    if (type == "LineString" || type == "MultiLineString") {
        return GeometryType::LINE;
    }
    if (type == "Polygon" || type == "MultiPolygon") {
        return GeometryType::POLYGON;
    }
    return std::nullopt;
}

// GeoJSON Field Value Utilities
std::string getFieldValueAsString(const nlohmann::json& properties,
                                  const std::string& field_name,
                                  const std::string& default_value) {
    if (field_name.empty() || !properties.is_object() || !properties.contains(field_name)) {
        return default_value;
    }

    const auto& value = properties[field_name];

    if (value.is_string()) {
        return value.get<std::string>();
    } else if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    } else if (value.is_number()) {
        return std::to_string(value.get<double>());
    } else if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }

    return default_value;
}

} // namespace geo
} // namespace urbanmetrics
