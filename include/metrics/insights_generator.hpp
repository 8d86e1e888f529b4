#ifndef URBANMETRICS_INSIGHTS_GENERATOR_HPP
#define URBANMETRICS_INSIGHTS_GENERATOR_HPP

#include <string>
#include <vector>
#include "metrics/types.hpp"

namespace urbanmetrics {
namespace metrics {

// POI metrics of one named area, as consumed by the insight rules
struct AreaMetrics {
    std::string area_id;
    std::string area_name;
    double area_km2;
    POIMetrics metrics;

    AreaMetrics(const std::string& id, const std::string& name, double km2, const POIMetrics& poi_metrics)
        : area_id(id), area_name(name), area_km2(km2), metrics(poi_metrics) {}
};

/**
 * Heuristic rule set producing short observations for one area, or for a
 * comparison of exactly two areas. Rules run in a fixed order and each adds
 * at most one insight.
 */
class InsightsGenerator {
public:
    // Maximum number of insights returned
    static constexpr size_t MAX_INSIGHTS = 4;

    /**
     * Generate insights
     * @param areas One area for single-area rules, two for comparison rules
     * @return Up to MAX_INSIGHTS insights; empty for zero or more than two areas
     */
    static std::vector<Insight> generateInsights(const std::vector<AreaMetrics>& areas);

    /**
     * Explanation of what a confidence grade means for an insight
     */
    static std::string getConfidenceExplanation(Confidence confidence);

private:
    static void addSingleAreaInsights(const AreaMetrics& area, std::vector<Insight>& insights);
    static void addComparisonInsights(const AreaMetrics& a, const AreaMetrics& b, std::vector<Insight>& insights);

    // Disable instantiation
    InsightsGenerator() = delete;
};

} // namespace metrics
} // namespace urbanmetrics

#endif // URBANMETRICS_INSIGHTS_GENERATOR_HPP
