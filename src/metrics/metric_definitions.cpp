#include "metrics/metric_definitions.hpp"
#include "metrics/layer_manifest.hpp"
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace urbanmetrics {
namespace metrics {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

std::string formatFixed(double value, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

} // namespace

const std::vector<MetricDefinition>& MetricDefinitions::getMetricDefinitions() {
    static const std::vector<MetricDefinition> definitions = {
        {
            "poiCount", "POI Count", "Count", "n",
            "Total number of points of interest within the selected area.",
            {
                {0, 10, "Very Low", "Minimal amenities present"},
                {10, 50, "Low", "Limited amenities"},
                {50, 150, "Moderate", "Typical suburban density"},
                {150, 500, "High", "Urban-level amenities"},
                {500, kInfinity, "Very High", "Dense urban core"},
            },
            std::nullopt, "count", "More amenities available in the area",
        },
        {
            "poiDensity", "POI Density", "Density", "count / area (km²)",
            "Number of points of interest per square kilometer. Normalizes for area size, "
            "enabling fair comparison between different-sized areas.",
            {
                {0, 25, "Very Low", "Rural or industrial area"},
                {25, 75, "Low", "Low-density suburban"},
                {75, 200, "Moderate", "Suburban or mixed-use"},
                {200, 500, "High", "Urban neighborhood"},
                {500, kInfinity, "Very High", "Dense urban core or commercial district"},
            },
            std::nullopt, "per km²", "More concentrated amenities; typically indicates higher walkability",
        },
        {
            "diversityIndex", "Diversity Index (Shannon)", "Diversity", "H = -Σ(pᵢ × ln(pᵢ))",
            "Shannon Diversity Index measures how evenly POIs are distributed across categories. "
            "A higher value indicates a more balanced mix of amenity types, while a lower value "
            "suggests dominance by one or two categories.",
            {
                {0, 0.5, "Very Low", "Dominated by 1-2 categories; monofunctional area"},
                {0.5, 1.0, "Low", "Limited variety; few category types"},
                {1.0, 1.5, "Moderate", "Some variety; typical residential area"},
                {1.5, 2.0, "High", "Good mix; mixed-use neighborhood"},
                {2.0, kInfinity, "Very High", "Exceptional diversity; vibrant urban area"},
            },
            Citation{"Shannon, C.E.", 1948, "A Mathematical Theory of Communication",
                     "Bell System Technical Journal, 27(3), 379-423"},
            "index", "More balanced mix of amenity types; typically indicates mixed-use character",
        },
        {
            "categoryShare", "Category Share", "Share", "(category count / total count) × 100",
            "Percentage of total POIs belonging to a specific category.",
            {
                {0, 5, "Minimal", "Category barely present"},
                {5, 15, "Minor", "Secondary presence"},
                {15, 30, "Notable", "Significant presence"},
                {30, 50, "Major", "Dominant category"},
                {50, 100, "Dominant", "Area defined by this category"},
            },
            std::nullopt, "%", "Category is more prevalent in the area's amenity mix",
        },
        {
            "coverageScore", "Data Coverage Score", "Coverage",
            "(categories with data / total categories) × 100",
            "Indicates the completeness of map data for this area. A lower score may indicate "
            "data gaps rather than actual absence of amenities.",
            {
                {0, 50, "Limited", "Significant data gaps likely; interpret with caution"},
                {50, 70, "Partial", "Some categories may be undermapped"},
                {70, 90, "Good", "Most categories represented"},
                {90, 100, "Excellent", "Comprehensive coverage"},
            },
            std::nullopt, "%", "More complete data; higher confidence in results",
        },
        {
            "areaSize", "Area Size", "Area", "Projected area calculation",
            "Total area of the selected polygon in square kilometers.",
            {
                {0, 0.1, "Very Small", "Block-level analysis"},
                {0.1, 0.5, "Small", "Neighborhood pocket"},
                {0.5, 2, "Medium", "Typical neighborhood"},
                {2, 10, "Large", "District-level"},
                {10, kInfinity, "Very Large", "City-scale analysis"},
            },
            std::nullopt, "km²", "Larger analysis area",
        },
    };
    return definitions;
}

const MetricDefinition* MetricDefinitions::findMetricDefinition(const std::string& metric_id) {
    for (const auto& definition : getMetricDefinitions()) {
        if (definition.id == metric_id) {
            return &definition;
        }
    }
    return nullptr;
}

std::optional<InterpretationRange> MetricDefinitions::getInterpretation(const std::string& metric_id, double value) {
    const MetricDefinition* definition = findMetricDefinition(metric_id);
    if (!definition || definition->interpretation.empty()) {
        return std::nullopt;
    }

    for (const auto& range : definition->interpretation) {
        if (value >= range.min && value < range.max) {
            return range;
        }
    }

    // Values beyond every range fall into the last one
    return definition->interpretation.back();
}

std::string MetricDefinitions::interpretMetricValue(const std::string& metric_id, double value) {
    auto range = getInterpretation(metric_id, value);
    if (!range) {
        return "";
    }
    return range->label + ": " + range->description;
}

std::optional<std::string> MetricDefinitions::getCitationText(const std::string& metric_id) {
    const MetricDefinition* definition = findMetricDefinition(metric_id);
    if (!definition || !definition->citation) {
        return std::nullopt;
    }

    const Citation& citation = *definition->citation;
    std::string text = citation.author + " (" + std::to_string(citation.year) + "). \"" + citation.title + "\"";
    if (!citation.source.empty()) {
        text += ". " + citation.source;
    }
    return text;
}

const std::vector<DerivedMetricDefinition>& MetricDefinitions::getDerivedDefinitions() {
    static const std::vector<DerivedMetricDefinition> definitions = {
        {
            DerivedMetricType::DIVERSITY_INDEX, "Diversity Index",
            "Shannon entropy measuring variety of POI types. Higher = more diverse mix of amenities.",
            "H = -Σ(pᵢ × ln(pᵢ)) / ln(n) × 100", "",
            {layer_ids::POI_FOOD_DRINK, layer_ids::POI_SHOPPING, layer_ids::POI_GROCERY,
             layer_ids::POI_HEALTH, layer_ids::POI_EDUCATION},
            {"< 30: Limited variety, dominated by one type",
             "30-60: Moderate mix of amenities",
             "> 60: High diversity, vibrant mixed-use area"},
            {30, 60},
        },
        {
            DerivedMetricType::GREEN_RATIO, "Green Space Ratio",
            "Percentage of area covered by parks and water.",
            "(Green Area / Total Area) × 100", "%",
            {layer_ids::PARKS, layer_ids::WATER},
            {"< 10%: Limited green space",
             "10-20%: Adequate green coverage",
             "> 20%: Excellent green space access"},
            {10, 20},
        },
        {
            DerivedMetricType::STREET_CONNECTIVITY, "Street Connectivity",
            "Intersection density indicating walkable grid vs cul-de-sac patterns.",
            "(Road Length / 200 m) / km²", "per km²",
            {layer_ids::ROADS_PRIMARY, layer_ids::ROADS_RESIDENTIAL},
            {"< 50: Disconnected, car-dependent",
             "50-100: Moderate connectivity",
             "> 100: Highly connected, walkable grid"},
            {50, 100},
        },
        {
            DerivedMetricType::BUILDING_DENSITY, "Building Density",
            "Building footprint coverage as percentage of land area.",
            "(Building Footprint / Total Area) × 100", "%",
            {layer_ids::BUILDINGS_RESIDENTIAL, layer_ids::BUILDINGS_COMMERCIAL,
             layer_ids::BUILDINGS_INDUSTRIAL, layer_ids::BUILDINGS_OTHER},
            {"< 20%: Low density, suburban",
             "20-40%: Medium density",
             "> 40%: High density urban"},
            {20, 40},
        },
        {
            DerivedMetricType::TRANSIT_COVERAGE, "Transit Score (Proxy)",
            "Estimates transit accessibility from mode-weighted stop density with logarithmic "
            "normalization. Rail stations weighted 2x, bus stops 1x.",
            "100 × ln(1 + Σ(stops × mode_weight) / km²) / ln(1 + 50)", "",
            {layer_ids::TRANSIT_STOPS, layer_ids::RAIL_LINES},
            {"< 25: Minimal Transit (few or no transit options)",
             "25-50: Some Transit (a few public transportation options)",
             "> 50: Excellent Transit to Rider's Paradise"},
            {25, 50},
        },
        {
            DerivedMetricType::MIXED_USE_SCORE, "Mixed-Use Score",
            "Measure of residential and commercial land use integration.",
            "(1 - |Residential share - Commercial share|) × 100", "",
            {layer_ids::BUILDINGS_RESIDENTIAL, layer_ids::BUILDINGS_COMMERCIAL},
            {"< 30: Segregated single-use",
             "30-60: Partial mixed-use",
             "> 60: Well-integrated mixed-use"},
            {30, 60},
        },
        {
            DerivedMetricType::WALKABILITY_PROXY, "Walk Score (Proxy)",
            "Estimates walkability from amenity categories with distance-decay weighting, plus "
            "a pedestrian friendliness bonus from intersection density.",
            "Σ(Category Score × Weight) × 0.85 + Pedestrian Friendliness Bonus", "",
            {layer_ids::POI_FOOD_DRINK, layer_ids::POI_SHOPPING, layer_ids::POI_GROCERY,
             layer_ids::POI_HEALTH, layer_ids::POI_EDUCATION, layer_ids::PARKS,
             layer_ids::TRANSIT_STOPS, layer_ids::ROADS_PRIMARY, layer_ids::ROADS_RESIDENTIAL},
            {"< 50: Car-Dependent (most errands require a car)",
             "50-70: Somewhat Walkable (some errands can be done on foot)",
             "> 70: Very Walkable to Walker's Paradise"},
            {50, 70},
        },
        {
            DerivedMetricType::FIFTEEN_MIN_SCORE, "15-Minute City Score",
            "Access to essential amenities within a 15-minute walk (1.2 km).",
            "Categories accessible / Total essential categories × 100", "%",
            {layer_ids::POI_FOOD_DRINK, layer_ids::POI_GROCERY, layer_ids::POI_HEALTH,
             layer_ids::POI_EDUCATION, layer_ids::PARKS, layer_ids::TRANSIT_STOPS},
            {"< 50%: Missing essential services",
             "50-80%: Most essentials accessible",
             "> 80%: Complete 15-minute neighborhood"},
            {50, 80},
        },
        {
            DerivedMetricType::BIKE_SCORE, "Bike Score (Proxy)",
            "Estimates bikeability from bike infrastructure density, bike facilities, and road "
            "connectivity for cycling.",
            "Infrastructure Score (50%) + Amenities Score (30%) + Connectivity Score (20%)", "",
            {layer_ids::BIKE_LANES, layer_ids::POI_BIKE_PARKING, layer_ids::POI_BIKE_SHOPS,
             layer_ids::ROADS_PRIMARY, layer_ids::ROADS_RESIDENTIAL},
            {"< 50: Minimal Bike Infrastructure (biking is inconvenient)",
             "50-70: Bikeable (biking is convenient for most trips)",
             "> 70: Very Bikeable to Biker's Paradise"},
            {50, 70},
        },
    };
    return definitions;
}

const DerivedMetricDefinition& MetricDefinitions::getDerivedDefinition(DerivedMetricType metric_id) {
    for (const auto& definition : getDerivedDefinitions()) {
        if (definition.id == metric_id) {
            return definition;
        }
    }
    throw std::out_of_range("No definition for derived metric " + toString(metric_id));
}

InterpretationLevel MetricDefinitions::getMetricInterpretation(double value, DerivedMetricType metric_id) {
    const InterpretationThresholds& thresholds = getDerivedDefinition(metric_id).thresholds;
    if (value < thresholds.low_below) {
        return InterpretationLevel::LOW;
    }
    if (value >= thresholds.high_from) {
        return InterpretationLevel::HIGH;
    }
    return InterpretationLevel::MEDIUM;
}

std::string MetricDefinitions::formatMetricValue(double value, DerivedMetricType metric_id) {
    const std::string& unit = getDerivedDefinition(metric_id).unit;
    if (unit == "%") {
        return formatFixed(value, 1) + "%";
    } else if (unit == "per km²") {
        return formatFixed(value, 0) + "/km²";
    }
    return formatFixed(value, 1);
}

std::string toString(InterpretationLevel level) {
    switch (level) {
        case InterpretationLevel::HIGH:
            return "high";
        case InterpretationLevel::MEDIUM:
            return "medium";
        case InterpretationLevel::LOW:
        default:
            return "low";
    }
}

std::string toString(DerivedMetricType metric_id) {
    switch (metric_id) {
        case DerivedMetricType::DIVERSITY_INDEX: return "diversity_index";
        case DerivedMetricType::GREEN_RATIO: return "green_ratio";
        case DerivedMetricType::STREET_CONNECTIVITY: return "street_connectivity";
        case DerivedMetricType::BUILDING_DENSITY: return "building_density";
        case DerivedMetricType::TRANSIT_COVERAGE: return "transit_coverage";
        case DerivedMetricType::MIXED_USE_SCORE: return "mixed_use_score";
        case DerivedMetricType::WALKABILITY_PROXY: return "walkability_proxy";
        case DerivedMetricType::FIFTEEN_MIN_SCORE: return "fifteen_min_score";
        case DerivedMetricType::BIKE_SCORE: return "bike_score";
    }
    return "unknown";
}

std::optional<DerivedMetricType> derivedMetricFromString(const std::string& metric_id) {
    for (const auto& definition : MetricDefinitions::getDerivedDefinitions()) {
        if (toString(definition.id) == metric_id) {
            return definition.id;
        }
    }
    return std::nullopt;
}

} // namespace metrics
} // namespace urbanmetrics
