#ifndef URBANMETRICS_POI_METRICS_HPP
#define URBANMETRICS_POI_METRICS_HPP

#include <string>
#include <vector>
#include "metrics/area_context.hpp"
#include "metrics/types.hpp"

namespace urbanmetrics {
namespace metrics {

// Semantic amenity category and the layers whose features it counts
struct POICategory {
    std::string id;
    std::string name;
    std::vector<std::string> layer_ids;
    RgbColor color;
};

/**
 * Calculator for amenity counts, densities, shares, Shannon diversity and
 * data coverage of one area. Never fails: missing layers and a zero area
 * resolve to zero values.
 */
class POIMetricsCalculator {
public:
    /**
     * Get the fixed category table in breakdown order
     */
    static const std::vector<POICategory>& getCategories();

    /**
     * Calculate POI metrics for an area
     * @param context Area snapshot
     * @return Complete metrics, timestamped with the capture time
     */
    static POIMetrics calculate(const AreaContext& context);

private:
    // Disable instantiation
    POIMetricsCalculator() = delete;
};

/**
 * Shannon diversity index H = -Σ(pᵢ × ln(pᵢ))
 * @param counts Per-category counts; zero counts contribute nothing
 * @return Entropy, 0 when all counts are zero
 */
double calculateShannonIndex(const std::vector<size_t>& counts);

std::string interpretDiversityIndex(double index);

/**
 * Percentage of categories with at least one feature
 */
double calculateCoverageScore(const std::vector<CategoryMetric>& breakdown);

std::string interpretCoverageScore(double score);

} // namespace metrics
} // namespace urbanmetrics

#endif // URBANMETRICS_POI_METRICS_HPP
