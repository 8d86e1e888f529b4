#include "metrics/layer_manifest.hpp"

namespace urbanmetrics {
namespace metrics {

const std::vector<LayerDefinition>& LayerManifest::getLayers() {
    using geo::GeometryType;
    static const std::vector<LayerDefinition> layers = {
        // Land use
        {layer_ids::BUILDINGS_RESIDENTIAL, "Residential Buildings", "usage", GeometryType::POLYGON},
        {layer_ids::BUILDINGS_COMMERCIAL, "Commercial Buildings", "usage", GeometryType::POLYGON},
        {layer_ids::BUILDINGS_INDUSTRIAL, "Industrial Buildings", "usage", GeometryType::POLYGON},
        {layer_ids::BUILDINGS_OTHER, "Other Buildings", "usage", GeometryType::POLYGON},
        // Infrastructure
        {layer_ids::ROADS_PRIMARY, "Primary Roads", "infrastructure", GeometryType::LINE},
        {layer_ids::ROADS_RESIDENTIAL, "Residential Streets", "infrastructure", GeometryType::LINE},
        // Access & transit
        {layer_ids::BIKE_LANES, "Bike Lanes", "access", GeometryType::LINE},
        {layer_ids::TRANSIT_STOPS, "Transit Stops", "access", GeometryType::POINT},
        {layer_ids::RAIL_LINES, "Rail Lines", "access", GeometryType::LINE},
        {layer_ids::PARKING, "Parking", "access", GeometryType::POLYGON},
        // Traffic control
        {layer_ids::TRAFFIC_SIGNALS, "Traffic Signals", "traffic", GeometryType::POINT},
        {layer_ids::CROSSWALKS, "Crosswalks", "traffic", GeometryType::POINT},
        // Environment
        {layer_ids::PARKS, "Parks", "environment", GeometryType::POLYGON},
        {layer_ids::WATER, "Water Bodies", "environment", GeometryType::POLYGON},
        {layer_ids::TREES, "Trees", "environment", GeometryType::POINT},
        // Amenities
        {layer_ids::POI_FOOD_DRINK, "Food & Drink", "amenities", GeometryType::POINT},
        {layer_ids::POI_SHOPPING, "Shopping", "amenities", GeometryType::POINT},
        {layer_ids::POI_GROCERY, "Grocery", "amenities", GeometryType::POINT},
        {layer_ids::POI_HEALTH, "Healthcare", "amenities", GeometryType::POINT},
        {layer_ids::POI_EDUCATION, "Education", "amenities", GeometryType::POINT},
        {layer_ids::POI_BIKE_PARKING, "Bike Parking", "amenities", GeometryType::POINT},
        {layer_ids::POI_BIKE_SHOPS, "Bike Services", "amenities", GeometryType::POINT},
    };
    return layers;
}

std::optional<LayerDefinition> LayerManifest::findLayer(const std::string& layer_id) {
    for (const auto& layer : getLayers()) {
        if (layer.id == layer_id) {
            return layer;
        }
    }
    return std::nullopt;
}

bool LayerManifest::isKnownLayer(const std::string& layer_id) {
    return findLayer(layer_id).has_value();
}

} // namespace metrics
} // namespace urbanmetrics
