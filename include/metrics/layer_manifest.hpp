#ifndef URBANMETRICS_LAYER_MANIFEST_HPP
#define URBANMETRICS_LAYER_MANIFEST_HPP

#include <optional>
#include <string>
#include <vector>
#include "geo/common.hpp"

namespace urbanmetrics {
namespace metrics {

// Static description of a known map layer
struct LayerDefinition {
    std::string id;
    std::string name;
    std::string group;
    geo::GeometryType geometry_type;
};

// Known layer identifiers
namespace layer_ids {
constexpr const char* BUILDINGS_RESIDENTIAL = "buildings-residential";
constexpr const char* BUILDINGS_COMMERCIAL = "buildings-commercial";
constexpr const char* BUILDINGS_INDUSTRIAL = "buildings-industrial";
constexpr const char* BUILDINGS_OTHER = "buildings-other";
constexpr const char* ROADS_PRIMARY = "roads-primary";
constexpr const char* ROADS_RESIDENTIAL = "roads-residential";
constexpr const char* BIKE_LANES = "bike-lanes";
constexpr const char* TRANSIT_STOPS = "transit-stops";
constexpr const char* RAIL_LINES = "rail-lines";
constexpr const char* PARKING = "parking";
constexpr const char* TRAFFIC_SIGNALS = "traffic-signals";
constexpr const char* CROSSWALKS = "crosswalks";
constexpr const char* PARKS = "parks";
constexpr const char* WATER = "water";
constexpr const char* TREES = "trees";
constexpr const char* POI_FOOD_DRINK = "poi-food-drink";
constexpr const char* POI_SHOPPING = "poi-shopping";
constexpr const char* POI_GROCERY = "poi-grocery";
constexpr const char* POI_HEALTH = "poi-health";
constexpr const char* POI_EDUCATION = "poi-education";
constexpr const char* POI_BIKE_PARKING = "poi-bike-parking";
constexpr const char* POI_BIKE_SHOPS = "poi-bike-shops";
} // namespace layer_ids

/**
 * Closed set of layers the engine understands. Statistics for any other
 * layer id are ignored.
 */
class LayerManifest {
public:
    /**
     * Get all known layer definitions in manifest order
     */
    static const std::vector<LayerDefinition>& getLayers();

    /**
     * Find a layer definition by id
     * @param layer_id Layer identifier
     * @return Layer definition, or nullopt for unknown ids
     */
    static std::optional<LayerDefinition> findLayer(const std::string& layer_id);

    static bool isKnownLayer(const std::string& layer_id);

private:
    // Disable instantiation
    LayerManifest() = delete;
};

} // namespace metrics
} // namespace urbanmetrics

#endif // URBANMETRICS_LAYER_MANIFEST_HPP
