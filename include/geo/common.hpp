#ifndef URBANMETRICS_GEO_COMMON_HPP
#define URBANMETRICS_GEO_COMMON_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>

namespace urbanmetrics {
namespace geo {

// Boost Geometry namespace alias
namespace bg = boost::geometry;

// 2D geometry types. Coordinates are [lon, lat] in WGS84 as read from GeoJSON,
// or [easting, northing] in metres after UTM projection.
using Point = bg::model::point<double, 2, bg::cs::cartesian>;
using LineString = bg::model::linestring<Point>;
using MultiLineString = bg::model::multi_linestring<LineString>;
using Box = bg::model::box<Point>;
using Polygon = bg::model::polygon<Point>;
using MultiPolygon = bg::model::multi_polygon<Polygon>;
using LinearRing = bg::model::ring<Point>;

// Geometry class of a map layer
enum class GeometryType {
    POINT,
    LINE,
    POLYGON
};

// A single GeoJSON feature kept in its JSON form until it is converted
struct GeospatialFeature {
    size_t id;
    nlohmann::json geometry;
    nlohmann::json properties;

    GeospatialFeature(size_t feature_id, const nlohmann::json& geom, const nlohmann::json& props)
        : id(feature_id), geometry(geom), properties(props) {}
};

// A parsed GeoJSON FeatureCollection
struct GeospatialDataset {
    std::string crs;
    std::vector<GeospatialFeature> features;

    GeospatialDataset() = default;
    GeospatialDataset(const std::string& crs_string, const std::vector<GeospatialFeature>& feature_list)
        : crs(crs_string), features(feature_list) {}
};

// GeoJSON to Boost Geometry conversion utilities

/**
 * Convert a GeoJSON Point (or first point of a MultiPoint) to a Boost point
 * @throws std::runtime_error for non-point geometry types
 */
Point geoJSONPointToBoost(const nlohmann::json& geometry);

/**
 * Convert a GeoJSON LineString or MultiLineString to a Boost multi-linestring
 * @throws std::runtime_error for non-line geometry types
 */
MultiLineString geoJSONLinesToBoost(const nlohmann::json& geometry);

/**
 * Convert a GeoJSON Polygon or MultiPolygon to a Boost multi-polygon.
 * Rings are closed and orientation is corrected.
 * @throws std::runtime_error for non-polygon geometry types or invalid rings
 */
MultiPolygon geoJSONPolygonsToBoost(const nlohmann::json& geometry);

/**
 * Convert a Boost multi-polygon back to a GeoJSON MultiPolygon geometry
 */
nlohmann::json multiPolygonToGeoJSON(const MultiPolygon& multi_polygon);

/**
 * Classify a GeoJSON geometry type string
 * @return Geometry class, or nullopt for unsupported types
 */
std::optional<GeometryType> classifyGeoJSONType(const std::string& type);

// GeoJSON field value utilities
std::string getFieldValueAsString(const nlohmann::json& properties,
                                  const std::string& field_name,
                                  const std::string& default_value);

} // namespace geo
} // namespace urbanmetrics

#endif // URBANMETRICS_GEO_COMMON_HPP
