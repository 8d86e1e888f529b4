#include "metrics/derived_metrics.hpp"
#include "metrics/layer_manifest.hpp"
#include <algorithm>
#include <cmath>

namespace urbanmetrics {
namespace metrics {

namespace {

// Road length per estimated intersection in a grid, in metres
constexpr double METRES_PER_INTERSECTION = 200.0;

// Mode-weighted stops per km² that scores 100
constexpr double TRANSIT_HIGH_DENSITY = 50.0;

// Walk score amenity share of the final score and pedestrian bonus cap
constexpr double WALK_AMENITY_FACTOR = 0.85;
constexpr double WALK_MAX_PEDESTRIAN_BONUS = 15.0;

// Intersections per km² considered a fully connected grid
constexpr double CONNECTED_GRID_DENSITY = 100.0;

// Bike score benchmarks (per km²) and component weights
constexpr double BIKE_EXCELLENT_LANE_DENSITY = 5.0;
constexpr double BIKE_EXCELLENT_PARKING_DENSITY = 50.0;
constexpr double BIKE_EXCELLENT_SHOP_DENSITY = 2.0;
constexpr double BIKE_WEIGHT_INFRASTRUCTURE = 0.50;
constexpr double BIKE_WEIGHT_AMENITIES = 0.30;
constexpr double BIKE_WEIGHT_CONNECTIVITY = 0.20;

struct TransitMode {
    const char* layer_id;
    double weight;
};

const TransitMode TRANSIT_MODES[] = {
    {layer_ids::RAIL_LINES, 2.0},
    {layer_ids::TRANSIT_STOPS, 1.0},
};

struct WalkCategory {
    const char* id;
    std::vector<std::string> layers;
    double weight;
    double max_count;
};

const std::vector<WalkCategory>& walkCategories() {
    static const std::vector<WalkCategory> categories = {
        {"grocery", {layer_ids::POI_GROCERY}, 3.0, 5.0},
        {"restaurants", {layer_ids::POI_FOOD_DRINK}, 3.0, 10.0},
        {"shopping", {layer_ids::POI_SHOPPING}, 2.0, 5.0},
        {"coffee", {layer_ids::POI_FOOD_DRINK}, 2.0, 4.0},
        {"parks", {layer_ids::PARKS}, 2.0, 3.0},
        {"schools", {layer_ids::POI_EDUCATION}, 2.0, 3.0},
        {"healthcare", {layer_ids::POI_HEALTH}, 1.0, 2.0},
    };
    return categories;
}

struct EssentialGroup {
    const char* id;
    std::vector<std::string> layers;
};

const std::vector<EssentialGroup>& essentialGroups() {
    static const std::vector<EssentialGroup> groups = {
        {"food", {layer_ids::POI_FOOD_DRINK, layer_ids::POI_GROCERY}},
        {"healthcare", {layer_ids::POI_HEALTH}},
        {"education", {layer_ids::POI_EDUCATION}},
        {"green_space", {layer_ids::PARKS}},
        {"transit", {layer_ids::TRANSIT_STOPS, layer_ids::RAIL_LINES}},
    };
    return groups;
}

const std::vector<std::string>& diversityLayers() {
    static const std::vector<std::string> layers = {
        layer_ids::POI_FOOD_DRINK, layer_ids::POI_SHOPPING, layer_ids::POI_GROCERY,
        layer_ids::POI_HEALTH, layer_ids::POI_EDUCATION,
    };
    return layers;
}

const std::vector<std::string>& greenLayers() {
    static const std::vector<std::string> layers = {layer_ids::PARKS, layer_ids::WATER};
    return layers;
}

const std::vector<std::string>& buildingLayers() {
    static const std::vector<std::string> layers = {
        layer_ids::BUILDINGS_RESIDENTIAL, layer_ids::BUILDINGS_COMMERCIAL,
        layer_ids::BUILDINGS_INDUSTRIAL, layer_ids::BUILDINGS_OTHER,
    };
    return layers;
}

const std::vector<std::string>& roadLayers() {
    static const std::vector<std::string> layers = {layer_ids::ROADS_PRIMARY, layer_ids::ROADS_RESIDENTIAL};
    return layers;
}

// Clamp a score to [0, 100]; non-finite values become 0
double clampScore(double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        return 0.0;
    }
    return std::min(value, 100.0);
}

// Logarithmic normalization 100 × ln(1 + x) / ln(1 + benchmark), capped at 100
double logNormalize(double value, double benchmark) {
    if (value <= 0.0) {
        return 0.0;
    }
    return std::min(100.0, std::log1p(value) / std::log1p(benchmark) * 100.0);
}

// Distance-decay proxy: denser amenities are more likely within walking distance
double densityToWalkScore(double density, double max_density) {
    if (density <= 0.0 || max_density <= 0.0) {
        return 0.0;
    }
    double normalized = std::min(density / max_density, 1.0);
    return std::min(100.0, std::log1p(normalized * 10.0) / std::log1p(10.0) * 100.0);
}

size_t countFromLayers(const LayerStatsStore& layers, const std::vector<std::string>& layer_ids) {
    size_t total = 0;
    for (const auto& layer_id : layer_ids) {
        total += layers.featureCount(layer_id);
    }
    return total;
}

double totalRoadLength(const LayerStatsStore& layers) {
    double total = 0.0;
    for (const auto& layer_id : roadLayers()) {
        total += layers.totalLengthM(layer_id);
    }
    return total;
}

// Sum the polygon area of a layer set relative to the area of interest
DerivedMetricValue areaCoverage(DerivedMetricType metric_id, const AreaContext& context,
                                const std::vector<std::string>& layer_ids, size_t& layers_with_area) {
    std::map<std::string, double> breakdown;
    double covered_m2 = 0.0;
    layers_with_area = 0;

    for (const auto& layer_id : layer_ids) {
        double area_m2 = context.layers.totalAreaM2(layer_id);
        breakdown[layer_id] = area_m2;
        covered_m2 += area_m2;
        if (area_m2 > 0.0) {
            ++layers_with_area;
        }
    }

    double area_m2 = context.area_km2 * 1000000.0;
    double ratio = area_m2 > 0.0 ? covered_m2 / area_m2 * 100.0 : 0.0;
    breakdown["covered_area_m2"] = covered_m2;

    return DerivedMetricValue(metric_id, clampScore(ratio), Confidence::LOW, breakdown);
}

} // namespace

double DerivedMetricsCalculator::estimateIntersectionDensity(const AreaContext& context) {
    if (context.area_km2 <= 0.0) {
        return 0.0;
    }
    double estimated_intersections = totalRoadLength(context.layers) / METRES_PER_INTERSECTION;
    return estimated_intersections / context.area_km2;
}

DerivedMetricValue DerivedMetricsCalculator::calculateDiversityIndex(const AreaContext& context) {
    const auto& layers = diversityLayers();
    std::map<std::string, double> breakdown;
    std::vector<size_t> counts;
    size_t total = 0;
    size_t layers_with_data = 0;

    for (const auto& layer_id : layers) {
        size_t count = context.layers.featureCount(layer_id);
        breakdown[layer_id] = static_cast<double>(count);
        counts.push_back(count);
        total += count;
        if (count > 0) {
            ++layers_with_data;
        }
    }

    double max_entropy = std::log(static_cast<double>(layers.size()));
    breakdown["max_entropy"] = max_entropy;
    breakdown["layers_with_data"] = static_cast<double>(layers_with_data);

    if (total == 0) {
        breakdown["entropy"] = 0.0;
        return DerivedMetricValue(DerivedMetricType::DIVERSITY_INDEX, 0.0, Confidence::LOW, breakdown);
    }

    double entropy = 0.0;
    for (size_t count : counts) {
        if (count > 0) {
            double p = static_cast<double>(count) / static_cast<double>(total);
            entropy -= p * std::log(p);
        }
    }
    entropy = std::max(entropy, 0.0);
    breakdown["entropy"] = entropy;

    double value = max_entropy > 0.0 ? entropy / max_entropy * 100.0 : 0.0;

    double present = static_cast<double>(layers_with_data);
    double required = static_cast<double>(layers.size());
    Confidence confidence = Confidence::LOW;
    if (present >= required * 0.8) {
        confidence = Confidence::HIGH;
    } else if (present >= required * 0.5) {
        confidence = Confidence::MEDIUM;
    }

    return DerivedMetricValue(DerivedMetricType::DIVERSITY_INDEX, clampScore(value), confidence, breakdown);
}

DerivedMetricValue DerivedMetricsCalculator::calculateGreenRatio(const AreaContext& context) {
    size_t layers_with_area = 0;
    DerivedMetricValue result = areaCoverage(DerivedMetricType::GREEN_RATIO, context, greenLayers(), layers_with_area);
    result.confidence = layers_with_area > 0 ? Confidence::HIGH : Confidence::LOW;
    if (result.value == 0.0) {
        result.confidence = Confidence::LOW;
    }
    return result;
}

DerivedMetricValue DerivedMetricsCalculator::calculateBuildingDensity(const AreaContext& context) {
    size_t layers_with_area = 0;
    DerivedMetricValue result = areaCoverage(DerivedMetricType::BUILDING_DENSITY, context, buildingLayers(), layers_with_area);
    if (result.value == 0.0) {
        result.confidence = Confidence::LOW;
    } else if (layers_with_area >= 2) {
        result.confidence = Confidence::HIGH;
    } else {
        result.confidence = Confidence::MEDIUM;
    }
    return result;
}

DerivedMetricValue DerivedMetricsCalculator::calculateStreetConnectivity(const AreaContext& context) {
    std::map<std::string, double> breakdown;
    size_t layers_with_length = 0;

    for (const auto& layer_id : roadLayers()) {
        double length_m = context.layers.totalLengthM(layer_id);
        breakdown[layer_id + "_length_m"] = length_m;
        if (length_m > 0.0) {
            ++layers_with_length;
        }
    }

    double road_length = totalRoadLength(context.layers);
    double intersection_density = estimateIntersectionDensity(context);
    breakdown["total_road_length_m"] = road_length;
    breakdown["estimated_intersections"] = road_length / METRES_PER_INTERSECTION;
    breakdown["intersection_density"] = intersection_density;

    double value = clampScore(intersection_density);
    Confidence confidence = Confidence::LOW;
    if (value > 0.0) {
        if (layers_with_length == roadLayers().size()) {
            confidence = Confidence::HIGH;
        } else if (layers_with_length > 0) {
            confidence = Confidence::MEDIUM;
        }
    }

    return DerivedMetricValue(DerivedMetricType::STREET_CONNECTIVITY, value, confidence, breakdown);
}

DerivedMetricValue DerivedMetricsCalculator::calculateTransitCoverage(const AreaContext& context) {
    std::map<std::string, double> breakdown;
    double weighted_sum = 0.0;
    size_t total_stops = 0;
    bool has_rail = false;
    bool has_bus = false;

    for (const auto& mode : TRANSIT_MODES) {
        size_t count = context.layers.featureCount(mode.layer_id);
        std::string layer_id(mode.layer_id);
        breakdown[layer_id + "_count"] = static_cast<double>(count);
        breakdown[layer_id + "_weighted"] = static_cast<double>(count) * mode.weight;
        weighted_sum += static_cast<double>(count) * mode.weight;
        total_stops += count;

        if (count > 0) {
            if (layer_id == layer_ids::RAIL_LINES) has_rail = true;
            if (layer_id == layer_ids::TRANSIT_STOPS) has_bus = true;
        }
    }

    breakdown["total_stops"] = static_cast<double>(total_stops);
    breakdown["weighted_sum"] = weighted_sum;

    if (weighted_sum == 0.0 || context.area_km2 <= 0.0) {
        breakdown["weighted_density"] = 0.0;
        breakdown["raw_score"] = 0.0;
        return DerivedMetricValue(DerivedMetricType::TRANSIT_COVERAGE, 0.0, Confidence::LOW, breakdown);
    }

    double weighted_density = weighted_sum / context.area_km2;
    double score = logNormalize(weighted_density, TRANSIT_HIGH_DENSITY);
    breakdown["weighted_density"] = weighted_density;
    breakdown["raw_score"] = score;

    Confidence confidence = Confidence::LOW;
    if (has_rail && has_bus) {
        confidence = Confidence::HIGH;
    } else if (has_rail || has_bus) {
        confidence = Confidence::MEDIUM;
    }

    return DerivedMetricValue(DerivedMetricType::TRANSIT_COVERAGE, clampScore(score), confidence, breakdown);
}

DerivedMetricValue DerivedMetricsCalculator::calculateMixedUseScore(const AreaContext& context) {
    std::map<std::string, double> breakdown;
    double residential = context.layers.totalAreaM2(layer_ids::BUILDINGS_RESIDENTIAL);
    double commercial = context.layers.totalAreaM2(layer_ids::BUILDINGS_COMMERCIAL);
    double total = residential + commercial;

    breakdown[layer_ids::BUILDINGS_RESIDENTIAL] = residential;
    breakdown[layer_ids::BUILDINGS_COMMERCIAL] = commercial;

    if (total <= 0.0) {
        breakdown["residential_ratio"] = 0.0;
        breakdown["commercial_ratio"] = 0.0;
        return DerivedMetricValue(DerivedMetricType::MIXED_USE_SCORE, 0.0, Confidence::LOW, breakdown);
    }

    double residential_ratio = residential / total;
    double commercial_ratio = commercial / total;
    breakdown["residential_ratio"] = residential_ratio;
    breakdown["commercial_ratio"] = commercial_ratio;

    // Highest when both shares are equal
    double score = (1.0 - std::abs(residential_ratio - commercial_ratio)) * 100.0;

    return DerivedMetricValue(DerivedMetricType::MIXED_USE_SCORE, clampScore(score), Confidence::HIGH, breakdown);
}

DerivedMetricValue DerivedMetricsCalculator::calculateWalkabilityProxy(const AreaContext& context) {
    std::map<std::string, double> breakdown;
    double total_weighted_score = 0.0;
    double total_weight = 0.0;
    size_t categories_with_data = 0;

    for (const auto& category : walkCategories()) {
        size_t count = countFromLayers(context.layers, category.layers);
        double density = context.area_km2 > 0.0 ? static_cast<double>(count) / context.area_km2 : 0.0;
        double category_score = densityToWalkScore(density, category.max_count * 2.0);

        std::string id(category.id);
        breakdown[id + "_count"] = static_cast<double>(count);
        breakdown[id + "_score"] = category_score;

        total_weighted_score += category_score * category.weight;
        total_weight += category.weight;
        if (count > 0) {
            ++categories_with_data;
        }
    }

    double amenity_component = total_weight > 0.0
        ? total_weighted_score / total_weight * WALK_AMENITY_FACTOR
        : 0.0;

    double intersection_density = estimateIntersectionDensity(context);
    double pedestrian_bonus = std::min(WALK_MAX_PEDESTRIAN_BONUS,
                                       intersection_density / CONNECTED_GRID_DENSITY * WALK_MAX_PEDESTRIAN_BONUS);

    breakdown["intersection_density"] = intersection_density;
    breakdown["pedestrian_bonus"] = pedestrian_bonus;
    breakdown["amenity_component"] = amenity_component;
    breakdown["categories_with_data"] = static_cast<double>(categories_with_data);

    double value = clampScore(amenity_component + pedestrian_bonus);

    Confidence confidence = Confidence::LOW;
    if (value > 0.0) {
        if (categories_with_data >= 5) {
            confidence = Confidence::HIGH;
        } else if (categories_with_data >= 3) {
            confidence = Confidence::MEDIUM;
        }
    }

    return DerivedMetricValue(DerivedMetricType::WALKABILITY_PROXY, value, confidence, breakdown);
}

DerivedMetricValue DerivedMetricsCalculator::calculateFifteenMinScore(const AreaContext& context) {
    std::map<std::string, double> breakdown;
    size_t groups_with_access = 0;

    for (const auto& group : essentialGroups()) {
        bool has_access = countFromLayers(context.layers, group.layers) > 0;
        breakdown[group.id] = has_access ? 1.0 : 0.0;
        if (has_access) {
            ++groups_with_access;
        }
    }

    double score = static_cast<double>(groups_with_access) / static_cast<double>(essentialGroups().size()) * 100.0;

    // Presence test only, so there is no partial-data degradation
    return DerivedMetricValue(DerivedMetricType::FIFTEEN_MIN_SCORE, clampScore(score), Confidence::HIGH, breakdown);
}

DerivedMetricValue DerivedMetricsCalculator::calculateBikeScore(const AreaContext& context) {
    std::map<std::string, double> breakdown;

    if (context.area_km2 <= 0.0) {
        breakdown["weighted_infrastructure"] = 0.0;
        breakdown["weighted_amenities"] = 0.0;
        breakdown["weighted_connectivity"] = 0.0;
        return DerivedMetricValue(DerivedMetricType::BIKE_SCORE, 0.0, Confidence::LOW, breakdown);
    }

    // Infrastructure: km of bike lane per km²
    double lane_length_m = context.layers.totalLengthM(layer_ids::BIKE_LANES);
    double lane_density = (lane_length_m / 1000.0) / context.area_km2;
    double infrastructure_score = logNormalize(lane_density, BIKE_EXCELLENT_LANE_DENSITY);
    bool has_infrastructure = lane_length_m > 0.0;

    breakdown["bike_lane_length_m"] = lane_length_m;
    breakdown["bike_lane_density"] = lane_density;
    breakdown["infrastructure_score"] = infrastructure_score;

    // Amenities: parking 70%, shops and rentals 30%
    size_t parking_count = context.layers.featureCount(layer_ids::POI_BIKE_PARKING);
    size_t shops_count = context.layers.featureCount(layer_ids::POI_BIKE_SHOPS);
    double parking_density = static_cast<double>(parking_count) / context.area_km2;
    double shops_density = static_cast<double>(shops_count) / context.area_km2;
    double parking_score = logNormalize(parking_density, BIKE_EXCELLENT_PARKING_DENSITY);
    double shops_score = logNormalize(shops_density, BIKE_EXCELLENT_SHOP_DENSITY);
    double amenities_score = parking_score * 0.7 + shops_score * 0.3;
    bool has_amenities = parking_count > 0 || shops_count > 0;

    breakdown["bike_parking_count"] = static_cast<double>(parking_count);
    breakdown["bike_shops_count"] = static_cast<double>(shops_count);
    breakdown["parking_density"] = parking_density;
    breakdown["shops_density"] = shops_density;
    breakdown["parking_score"] = parking_score;
    breakdown["shops_score"] = shops_score;
    breakdown["amenities_score"] = amenities_score;

    // Connectivity: linear in intersection density
    double intersection_density = estimateIntersectionDensity(context);
    double connectivity_score = std::min(100.0, intersection_density / CONNECTED_GRID_DENSITY * 100.0);

    breakdown["intersection_density"] = intersection_density;
    breakdown["connectivity_score"] = connectivity_score;

    double weighted_infrastructure = infrastructure_score * BIKE_WEIGHT_INFRASTRUCTURE;
    double weighted_amenities = amenities_score * BIKE_WEIGHT_AMENITIES;
    double weighted_connectivity = connectivity_score * BIKE_WEIGHT_CONNECTIVITY;

    breakdown["weighted_infrastructure"] = weighted_infrastructure;
    breakdown["weighted_amenities"] = weighted_amenities;
    breakdown["weighted_connectivity"] = weighted_connectivity;

    double value = clampScore(weighted_infrastructure + weighted_amenities + weighted_connectivity);

    Confidence confidence = Confidence::LOW;
    if (has_infrastructure && has_amenities) {
        confidence = Confidence::HIGH;
    } else if (has_infrastructure || has_amenities) {
        confidence = Confidence::MEDIUM;
    }

    return DerivedMetricValue(DerivedMetricType::BIKE_SCORE, value, confidence, breakdown);
}

std::vector<DerivedMetricValue> DerivedMetricsCalculator::calculateAll(const AreaContext& context) {
    std::vector<DerivedMetricValue> values;
    values.reserve(9);
    values.push_back(calculateDiversityIndex(context));
    values.push_back(calculateGreenRatio(context));
    values.push_back(calculateStreetConnectivity(context));
    values.push_back(calculateBuildingDensity(context));
    values.push_back(calculateTransitCoverage(context));
    values.push_back(calculateMixedUseScore(context));
    values.push_back(calculateWalkabilityProxy(context));
    values.push_back(calculateFifteenMinScore(context));
    values.push_back(calculateBikeScore(context));
    return values;
}

} // namespace metrics
} // namespace urbanmetrics
