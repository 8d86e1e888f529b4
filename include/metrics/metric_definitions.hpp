#ifndef URBANMETRICS_METRIC_DEFINITIONS_HPP
#define URBANMETRICS_METRIC_DEFINITIONS_HPP

#include <optional>
#include <string>
#include <vector>
#include "metrics/types.hpp"

namespace urbanmetrics {
namespace metrics {

// Level of a derived index value relative to its interpretation thresholds
enum class InterpretationLevel {
    LOW,
    MEDIUM,
    HIGH
};

// One labelled value range of a POI-level metric, [min, max)
struct InterpretationRange {
    double min;
    double max;
    std::string label;
    std::string description;
};

// Bibliographic source of a metric's methodology
struct Citation {
    std::string author;
    int year;
    std::string title;
    std::string source;
};

// Methodology of a POI-level metric (count, density, diversity, share, coverage, area)
struct MetricDefinition {
    std::string id;
    std::string name;
    std::string short_name;
    std::string formula;
    std::string description;
    std::vector<InterpretationRange> interpretation;
    std::optional<Citation> citation;
    std::string unit;
    std::string higher_means;
};

// Interpretation text per level of a derived index
struct InterpretationText {
    std::string low;
    std::string medium;
    std::string high;
};

// Canonical level thresholds of a derived index: value < low_below is low,
// value >= high_from is high, anything in between is medium
struct InterpretationThresholds {
    double low_below;
    double high_from;
};

// Methodology of a derived index
struct DerivedMetricDefinition {
    DerivedMetricType id;
    std::string name;
    std::string description;
    std::string formula;
    std::string unit;
    std::vector<std::string> required_layers;
    InterpretationText interpretation;
    InterpretationThresholds thresholds;
};

/**
 * Static lookup tables describing every metric. Shared read-only by the
 * calculators and by callers that render names, units and interpretations.
 */
class MetricDefinitions {
public:
    /**
     * Get all POI-level metric definitions
     */
    static const std::vector<MetricDefinition>& getMetricDefinitions();

    /**
     * Find a POI-level metric definition
     * @param metric_id Metric identifier (e.g. "poiDensity")
     */
    static const MetricDefinition* findMetricDefinition(const std::string& metric_id);

    /**
     * Find the interpretation range containing a value. Values above every
     * range map to the last range.
     * @return Matching range, or nullopt for unknown metric ids
     */
    static std::optional<InterpretationRange> getInterpretation(const std::string& metric_id, double value);

    /**
     * Interpretation text "<label>: <description>" for a value, empty for unknown metrics
     */
    static std::string interpretMetricValue(const std::string& metric_id, double value);

    /**
     * Citation text for a metric, or nullopt if the metric has no citation
     */
    static std::optional<std::string> getCitationText(const std::string& metric_id);

    /**
     * Get all derived index definitions in calculation order
     */
    static const std::vector<DerivedMetricDefinition>& getDerivedDefinitions();

    /**
     * Get the definition of a derived index
     */
    static const DerivedMetricDefinition& getDerivedDefinition(DerivedMetricType metric_id);

    /**
     * Classify a derived index value as low, medium or high using the canonical thresholds
     */
    static InterpretationLevel getMetricInterpretation(double value, DerivedMetricType metric_id);

    /**
     * Format a derived index value with its unit ("12.5%", "85/km²", "42.0")
     */
    static std::string formatMetricValue(double value, DerivedMetricType metric_id);

private:
    // Disable instantiation
    MetricDefinitions() = delete;
};

std::string toString(InterpretationLevel level);

/**
 * Stable string id of a derived index (e.g. "transit_coverage")
 */
std::string toString(DerivedMetricType metric_id);

/**
 * Parse a derived index string id
 * @return Metric type, or nullopt for unknown ids
 */
std::optional<DerivedMetricType> derivedMetricFromString(const std::string& metric_id);

} // namespace metrics
} // namespace urbanmetrics

#endif // URBANMETRICS_METRIC_DEFINITIONS_HPP
