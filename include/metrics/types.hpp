#ifndef URBANMETRICS_METRICS_TYPES_HPP
#define URBANMETRICS_METRICS_TYPES_HPP

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace urbanmetrics {
namespace metrics {

/**
 * Confidence grade of a computed value. Describes how much of the input data
 * the value was based on, not its statistical certainty.
 */
enum class Confidence {
    LOW,
    MEDIUM,
    HIGH
};

// Kind of observation produced by the insight generator
enum class InsightType {
    POSITIVE,
    CAUTION,
    NEUTRAL
};

// Identifiers of the derived indices, in definition order
enum class DerivedMetricType {
    DIVERSITY_INDEX,
    GREEN_RATIO,
    STREET_CONNECTIVITY,
    BUILDING_DENSITY,
    TRANSIT_COVERAGE,
    MIXED_USE_SCORE,
    WALKABILITY_PROXY,
    FIFTEEN_MIN_SCORE,
    BIKE_SCORE
};

using RgbColor = std::array<int, 3>;

// Scalar statistics of one layer clipped to the area of interest
struct LayerStats {
    size_t feature_count;
    double total_area_m2;     // Sum of clipped polygon areas in square metres
    double total_length_m;    // Sum of clipped line lengths in metres

    LayerStats() : feature_count(0), total_area_m2(0.0), total_length_m(0.0) {}

    LayerStats(size_t count, double area_m2, double length_m)
        : feature_count(count), total_area_m2(area_m2), total_length_m(length_m) {}

    bool hasData() const {
        return feature_count > 0 || total_area_m2 > 0.0 || total_length_m > 0.0;
    }
};

// Per-category amenity statistics
struct CategoryMetric {
    std::string id;
    std::string name;
    size_t count;
    double density;     // per km²
    double share;       // percentage of total count
    RgbColor color;

    CategoryMetric(const std::string& category_id, const std::string& category_name,
                   size_t category_count, double category_density, const RgbColor& category_color)
        : id(category_id), name(category_name), count(category_count), density(category_density),
          share(0.0), color(category_color) {}
};

// Amenity statistics of one area
struct POIMetrics {
    size_t total_count;
    double density;                 // total POIs per km²
    double diversity_index;         // Shannon index, >= 0
    std::string diversity_label;
    std::vector<CategoryMetric> category_breakdown;
    double coverage_score;          // 0-100
    std::string coverage_label;
    double area_km2;
    std::string timestamp;          // ISO 8601 capture time

    POIMetrics()
        : total_count(0), density(0.0), diversity_index(0.0), coverage_score(0.0), area_km2(0.0) {}
};

// Result of one derived index computation
struct DerivedMetricValue {
    DerivedMetricType metric_id;
    double value;
    Confidence confidence;
    std::map<std::string, double> breakdown;    // named intermediate quantities

    DerivedMetricValue(DerivedMetricType id, double metric_value, Confidence metric_confidence,
                       const std::map<std::string, double>& metric_breakdown)
        : metric_id(id), value(metric_value), confidence(metric_confidence), breakdown(metric_breakdown) {}
};

// A short natural-language observation about one or two areas
struct Insight {
    std::string title;
    std::string description;
    Confidence confidence;
    std::vector<std::string> related_metrics;
    InsightType type;

    Insight(const std::string& insight_title, const std::string& insight_description,
            Confidence insight_confidence, const std::vector<std::string>& metrics, InsightType insight_type)
        : title(insight_title), description(insight_description), confidence(insight_confidence),
          related_metrics(metrics), type(insight_type) {}
};

// Side-by-side comparison of one metric between two areas
struct MetricComparison {
    std::string metric_id;
    std::string metric_name;
    std::array<double, 2> values;
    double delta;                   // percent, area A relative to area B
    std::string delta_indicator;
    std::string unit;
};

// An index imported from an external table, keyed by area name, id or coordinates
struct ExternalIndex {
    std::string id;
    std::string name;
    std::string source;
    std::string description;
    std::map<std::string, double> values;
    double min;
    double max;
    std::string unit;
    std::string color_scale;
    std::string imported_at;        // ISO 8601

    ExternalIndex() : min(0.0), max(0.0), color_scale("sequential") {}
};

std::string toString(Confidence confidence);
std::string toString(InsightType type);

/**
 * Current UTC time formatted as ISO 8601 with millisecond precision
 * (e.g. "2025-03-01T12:00:00.000Z")
 */
std::string currentTimestampISO8601();

} // namespace metrics
} // namespace urbanmetrics

#endif // URBANMETRICS_METRICS_TYPES_HPP
