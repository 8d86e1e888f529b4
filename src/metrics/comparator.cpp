#include "metrics/comparator.hpp"
#include "metrics/metric_definitions.hpp"

namespace urbanmetrics {
namespace metrics {

namespace {

MetricComparison makeComparison(const std::string& metric_id, const std::string& metric_name,
                                double value_a, double value_b, const std::string& unit) {
    double delta = calculateDelta(value_a, value_b);
    return MetricComparison{metric_id, metric_name, {value_a, value_b}, delta, getDeltaIndicator(delta), unit};
}

} // namespace

double calculateDelta(double value_a, double value_b) {
    if (value_b == 0.0) {
        return value_a > 0.0 ? 100.0 : 0.0;
    }
    return (value_a - value_b) / value_b * 100.0;
}

std::string getDeltaIndicator(double delta) {
    if (delta > 50.0) return "▲▲";
    if (delta > 10.0) return "▲";
    if (delta < -50.0) return "▼▼";
    if (delta < -10.0) return "▼";
    return "";
}

std::vector<MetricComparison> compareAreaMetrics(const POIMetrics& metrics_a, const POIMetrics& metrics_b) {
    std::vector<MetricComparison> comparisons;
    comparisons.push_back(makeComparison("totalCount", "Total POIs",
                                         static_cast<double>(metrics_a.total_count),
                                         static_cast<double>(metrics_b.total_count), "count"));
    comparisons.push_back(makeComparison("density", "POI Density",
                                         metrics_a.density, metrics_b.density, "per km²"));
    comparisons.push_back(makeComparison("diversityIndex", "Diversity Index",
                                         metrics_a.diversity_index, metrics_b.diversity_index, "index"));
    return comparisons;
}

std::vector<MetricComparison> compareDerivedMetrics(const std::vector<DerivedMetricValue>& values_a,
                                                    const std::vector<DerivedMetricValue>& values_b) {
    std::vector<MetricComparison> comparisons;
    for (const auto& value_a : values_a) {
        for (const auto& value_b : values_b) {
            if (value_a.metric_id != value_b.metric_id) {
                continue;
            }
            const DerivedMetricDefinition& definition = MetricDefinitions::getDerivedDefinition(value_a.metric_id);
            comparisons.push_back(makeComparison(toString(value_a.metric_id), definition.name,
                                                 value_a.value, value_b.value, definition.unit));
            break;
        }
    }
    return comparisons;
}

} // namespace metrics
} // namespace urbanmetrics
