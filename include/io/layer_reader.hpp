#ifndef URBANMETRICS_LAYER_READER_HPP
#define URBANMETRICS_LAYER_READER_HPP

#include <map>
#include <string>
#include <ogr_srs_api.h>
#include "geo/common.hpp"
#include "metrics/area_context.hpp"
#include "metrics/layer_stats_store.hpp"

namespace urbanmetrics {
namespace io {

// Layer reader configuration
struct LayerReaderConfig {
    std::string area_file_path;                         // GeoJSON with the area polygon(s), WGS84
    std::map<std::string, std::string> layer_files;     // Layer id -> GeoJSON file path, WGS84
};

/**
 * Reads an area of interest and per-layer feature collections, clips every
 * layer to the area and computes its statistics.
 *
 * All geometry is projected from WGS84 into the UTM zone of the area center
 * before clipping, so that lengths are in metres and areas in square metres.
 * The geometry class of each layer comes from the layer manifest; features
 * of another class, or with unconvertible geometry, are skipped with a warning.
 */
class LayerReader {
public:
    explicit LayerReader(const LayerReaderConfig& config);
    ~LayerReader();

    // Disable copy constructor and assignment
    LayerReader(const LayerReader&) = delete;
    LayerReader& operator=(const LayerReader&) = delete;

    /**
     * Read the area file and all configured layer files
     * @return true if successful, false otherwise
     * @throws std::runtime_error if a file cannot be read or parsed
     */
    bool read();

    /**
     * Set the area of interest from a parsed dataset and prepare the projection.
     * Polygon and MultiPolygon features are merged into one area.
     * @return true if the dataset holds at least one valid polygon
     */
    bool setArea(const geo::GeospatialDataset& dataset);

    /**
     * Clip a parsed layer to the area and store its statistics
     * @param layer_id Known layer identifier
     * @param dataset Layer features in WGS84
     * @return true if stored, false if no area is set or the layer id is unknown
     */
    bool addLayer(const std::string& layer_id, const geo::GeospatialDataset& dataset);

    double getAreaKm2() const { return area_km2_; }

    /**
     * Get the area polygon in WGS84 longitude/latitude
     */
    const geo::MultiPolygon& getAreaPolygon() const { return area_wgs84_; }

    const metrics::LayerStatsStore& getLayerStats() const { return layers_; }

    /**
     * Get the EPSG code of the UTM zone used for measurement, 0 before an area is set
     */
    int getUTMEPSG() const { return utm_epsg_; }

    /**
     * Get the name of the area from its first feature's "name" property
     */
    const std::string& getAreaName() const { return area_name_; }

    /**
     * Build the area snapshot consumed by the calculators
     */
    metrics::AreaContext buildAreaContext() const;

private:
    LayerReaderConfig config_;
    OGRCoordinateTransformationH coordinate_transformation_;
    int utm_epsg_;

    std::string area_name_;
    geo::MultiPolygon area_wgs84_;
    geo::MultiPolygon area_projected_;
    double area_km2_;
    metrics::LayerStatsStore layers_;

    void releaseTransformation();

    // Project geometry from WGS84 to the UTM zone in place
    bool projectPoint(geo::Point& point) const;
    bool projectLines(geo::MultiLineString& lines) const;
    bool projectPolygons(geo::MultiPolygon& polygons) const;

    // Measure one feature against the projected area, adding to stats if it intersects
    bool clipPointFeature(const nlohmann::json& geometry, metrics::LayerStats& stats) const;
    bool clipLineFeature(const nlohmann::json& geometry, metrics::LayerStats& stats) const;
    bool clipPolygonFeature(const nlohmann::json& geometry, metrics::LayerStats& stats) const;
};

} // namespace io
} // namespace urbanmetrics

#endif // URBANMETRICS_LAYER_READER_HPP
