#ifndef URBANMETRICS_COMPARATOR_HPP
#define URBANMETRICS_COMPARATOR_HPP

#include <string>
#include <vector>
#include "metrics/types.hpp"

namespace urbanmetrics {
namespace metrics {

/**
 * Percentage change of value_a relative to value_b
 * @return (a - b) / b × 100, or 100 when b is 0 and a is positive, else 0
 */
double calculateDelta(double value_a, double value_b);

/**
 * Trend indicator for a percentage delta: "▲▲" above 50, "▲" above 10,
 * "▼▼" below -50, "▼" below -10, empty otherwise
 */
std::string getDeltaIndicator(double delta);

/**
 * Compare total count, density and diversity of two areas
 * @param metrics_a POI metrics of area A
 * @param metrics_b POI metrics of area B
 * @return One comparison row per metric, area A relative to area B
 */
std::vector<MetricComparison> compareAreaMetrics(const POIMetrics& metrics_a, const POIMetrics& metrics_b);

/**
 * Compare the derived indices of two areas
 * @return One comparison row for every index present in both inputs, in the order of values_a
 */
std::vector<MetricComparison> compareDerivedMetrics(const std::vector<DerivedMetricValue>& values_a,
                                                    const std::vector<DerivedMetricValue>& values_b);

} // namespace metrics
} // namespace urbanmetrics

#endif // URBANMETRICS_COMPARATOR_HPP
