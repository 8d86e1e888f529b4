#include "io/layer_reader.hpp"
#include "io/geojson_reader.hpp"
#include "geo/coordinate_system_utils.hpp"
#include "metrics/layer_manifest.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace urbanmetrics {
namespace io {

namespace {

// Reprojects every vertex it visits, remembering any failure
class PointProjector {
public:
    explicit PointProjector(OGRCoordinateTransformationH transformation)
        : transformation_(transformation), ok_(true) {}

    void operator()(geo::Point& point) {
        double x = geo::bg::get<0>(point);
        double y = geo::bg::get<1>(point);
        if (!OCTTransform(transformation_, 1, &x, &y, nullptr)) {
            ok_ = false;
            return;
        }
        geo::bg::set<0>(point, x);
        geo::bg::set<1>(point, y);
    }

    bool ok() const { return ok_; }

private:
    OGRCoordinateTransformationH transformation_;
    bool ok_;
};

std::string geometryTypeOf(const nlohmann::json& geometry) {
    if (!geometry.is_object() || !geometry.contains("type") || !geometry["type"].is_string()) {
        return "";
    }
    return geometry["type"].get<std::string>();
}

} // namespace

LayerReader::LayerReader(const LayerReaderConfig& config)
    : config_(config), coordinate_transformation_(nullptr), utm_epsg_(0), area_km2_(0.0) {
}

LayerReader::~LayerReader() {
    releaseTransformation();
}

void LayerReader::releaseTransformation() {
    if (coordinate_transformation_) {
        OCTDestroyCoordinateTransformation(coordinate_transformation_);
        coordinate_transformation_ = nullptr;
    }
}

bool LayerReader::read() {
    std::cerr << "Reading area from " << config_.area_file_path << std::endl;
    geo::GeospatialDataset area_dataset = GeoJSONReader::readFromFile(config_.area_file_path);
    if (!setArea(area_dataset)) {
        std::cerr << "Error: No valid Polygon or MultiPolygon area found in " << config_.area_file_path << std::endl;
        return false;
    }
    std::cerr << "Area size: " << area_km2_ << " km² (measured in EPSG:" << utm_epsg_ << ")" << std::endl;

    for (const auto& entry : config_.layer_files) {
        if (!metrics::LayerManifest::isKnownLayer(entry.first)) {
            std::cerr << "Warning: Skipping unknown layer '" << entry.first << "'" << std::endl;
            continue;
        }
        geo::GeospatialDataset dataset = GeoJSONReader::readFromFile(entry.second);
        addLayer(entry.first, dataset);
    }

    std::cerr << "Successfully read " << layers_.size() << " layers" << std::endl;
    return true;
}

bool LayerReader::setArea(const geo::GeospatialDataset& dataset) {
    releaseTransformation();
    area_wgs84_.clear();
    area_projected_.clear();
    area_km2_ = 0.0;
    utm_epsg_ = 0;
    area_name_.clear();
    layers_ = metrics::LayerStatsStore();

    for (const auto& feature : dataset.features) {
        auto type = geo::classifyGeoJSONType(geometryTypeOf(feature.geometry));
        if (!type || *type != geo::GeometryType::POLYGON) {
            std::cerr << "Warning: Ignoring non-polygon area feature " << feature.id << std::endl;
            continue;
        }

        geo::MultiPolygon part;
        try {
            part = geo::geoJSONPolygonsToBoost(feature.geometry);
        } catch (const std::exception& e) {
            std::cerr << "Warning: Skipping area feature " << feature.id << ": " << e.what() << std::endl;
            continue;
        }
        if (part.empty()) {
            continue;
        }

        if (area_name_.empty()) {
            area_name_ = geo::getFieldValueAsString(feature.properties, "name", "");
        }

        // Overlapping parts are counted once
        geo::MultiPolygon merged;
        geo::bg::union_(area_wgs84_, part, merged);
        area_wgs84_ = merged;
    }

    if (area_wgs84_.empty()) {
        return false;
    }

    double center_lon = 0.0;
    double center_lat = 0.0;
    if (!geo::CoordinateSystemUtils::getGeometryCenter(area_wgs84_, center_lon, center_lat)) {
        return false;
    }

    utm_epsg_ = geo::CoordinateSystemUtils::determineUTMEPSG(center_lon, center_lat);
    coordinate_transformation_ = geo::CoordinateSystemUtils::createUTMTransformation(utm_epsg_);
    if (!coordinate_transformation_) {
        throw std::runtime_error("Failed to create transformation to EPSG:" + std::to_string(utm_epsg_));
    }

    area_projected_ = area_wgs84_;
    if (!projectPolygons(area_projected_)) {
        throw std::runtime_error("Failed to project area polygon to EPSG:" + std::to_string(utm_epsg_));
    }

    area_km2_ = std::abs(geo::bg::area(area_projected_)) / 1000000.0;
    return true;
}

bool LayerReader::addLayer(const std::string& layer_id, const geo::GeospatialDataset& dataset) {
    if (!coordinate_transformation_) {
        std::cerr << "Error: Cannot clip layer '" << layer_id << "' before an area is set" << std::endl;
        return false;
    }

    auto definition = metrics::LayerManifest::findLayer(layer_id);
    if (!definition) {
        std::cerr << "Warning: Skipping unknown layer '" << layer_id << "'" << std::endl;
        return false;
    }

    metrics::LayerStats stats;
    size_t skipped = 0;

    for (const auto& feature : dataset.features) {
        auto type = geo::classifyGeoJSONType(geometryTypeOf(feature.geometry));
        if (!type || *type != definition->geometry_type) {
            ++skipped;
            continue;
        }

        try {
            bool ok = false;
            switch (definition->geometry_type) {
                case geo::GeometryType::POINT:
                    ok = clipPointFeature(feature.geometry, stats);
                    break;
                case geo::GeometryType::LINE:
                    ok = clipLineFeature(feature.geometry, stats);
                    break;
                case geo::GeometryType::POLYGON:
                    ok = clipPolygonFeature(feature.geometry, stats);
                    break;
            }
            if (!ok) {
                ++skipped;
            }
        } catch (const std::exception& e) {
            std::cerr << "Warning: Failed to clip feature " << feature.id << " of layer '" << layer_id
                      << "': " << e.what() << std::endl;
            ++skipped;
        }
    }

    if (skipped > 0) {
        std::cerr << "Warning: Skipped " << skipped << " unusable features in layer '" << layer_id << "'" << std::endl;
    }

    std::cerr << "Layer " << layer_id << ": " << stats.feature_count << " features in area" << std::endl;
    return layers_.setLayerStats(layer_id, stats);
}

metrics::AreaContext LayerReader::buildAreaContext() const {
    return metrics::AreaContext(area_km2_, area_wgs84_, layers_);
}

bool LayerReader::projectPoint(geo::Point& point) const {
    PointProjector projector(coordinate_transformation_);
    projector(point);
    return projector.ok();
}

bool LayerReader::projectLines(geo::MultiLineString& lines) const {
    PointProjector projector = geo::bg::for_each_point(lines, PointProjector(coordinate_transformation_));
    return projector.ok();
}

bool LayerReader::projectPolygons(geo::MultiPolygon& polygons) const {
    PointProjector projector = geo::bg::for_each_point(polygons, PointProjector(coordinate_transformation_));
    return projector.ok();
}

bool LayerReader::clipPointFeature(const nlohmann::json& geometry, metrics::LayerStats& stats) const {
    geo::Point point = geo::geoJSONPointToBoost(geometry);
    if (!projectPoint(point)) {
        return false;
    }
    if (geo::bg::covered_by(point, area_projected_)) {
        stats.feature_count++;
    }
    return true;
}

bool LayerReader::clipLineFeature(const nlohmann::json& geometry, metrics::LayerStats& stats) const {
    geo::MultiLineString lines = geo::geoJSONLinesToBoost(geometry);
    if (lines.empty() || !projectLines(lines)) {
        return false;
    }

    geo::MultiLineString clipped;
    geo::bg::intersection(lines, area_projected_, clipped);

    double length = geo::bg::length(clipped);
    if (length > 0.0) {
        stats.feature_count++;
        stats.total_length_m += length;
    }
    return true;
}

bool LayerReader::clipPolygonFeature(const nlohmann::json& geometry, metrics::LayerStats& stats) const {
    geo::MultiPolygon polygons = geo::geoJSONPolygonsToBoost(geometry);
    if (polygons.empty() || !projectPolygons(polygons)) {
        return false;
    }

    geo::MultiPolygon clipped;
    geo::bg::intersection(polygons, area_projected_, clipped);

    double area = std::abs(geo::bg::area(clipped));
    if (area > 0.0) {
        stats.feature_count++;
        stats.total_area_m2 += area;
    }
    return true;
}

} // namespace io
} // namespace urbanmetrics
