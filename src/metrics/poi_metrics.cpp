#include "metrics/poi_metrics.hpp"
#include "metrics/layer_manifest.hpp"
#include <cmath>

namespace urbanmetrics {
namespace metrics {

namespace {

size_t countFromLayers(const LayerStatsStore& layers, const std::vector<std::string>& layer_ids) {
    size_t total = 0;
    for (const auto& layer_id : layer_ids) {
        total += layers.featureCount(layer_id);
    }
    return total;
}

} // namespace

const std::vector<POICategory>& POIMetricsCalculator::getCategories() {
    static const std::vector<POICategory> categories = {
        {"food", "Food & Dining", {layer_ids::POI_FOOD_DRINK}, {255, 87, 51}},
        {"shopping", "Retail & Shopping", {layer_ids::POI_SHOPPING}, {255, 195, 0}},
        {"grocery", "Grocery & Convenience", {layer_ids::POI_GROCERY}, {76, 175, 80}},
        {"health", "Healthcare", {layer_ids::POI_HEALTH}, {244, 67, 54}},
        {"education", "Education", {layer_ids::POI_EDUCATION}, {103, 58, 183}},
        {"bike", "Cycling Infrastructure",
         {layer_ids::POI_BIKE_PARKING, layer_ids::POI_BIKE_SHOPS, layer_ids::BIKE_LANES}, {0, 188, 212}},
        {"transit", "Public Transit", {layer_ids::TRANSIT_STOPS, layer_ids::RAIL_LINES}, {0, 128, 255}},
        {"green", "Green Space", {layer_ids::PARKS, layer_ids::TREES}, {34, 139, 34}},
    };
    return categories;
}

POIMetrics POIMetricsCalculator::calculate(const AreaContext& context) {
    POIMetrics metrics;
    metrics.area_km2 = context.area_km2;
    const bool has_area = context.area_km2 > 0.0;

    for (const auto& category : getCategories()) {
        size_t count = countFromLayers(context.layers, category.layer_ids);
        metrics.total_count += count;
        double density = has_area ? static_cast<double>(count) / context.area_km2 : 0.0;
        metrics.category_breakdown.emplace_back(category.id, category.name, count, density, category.color);
    }

    // Shares need the total first
    std::vector<size_t> counts;
    counts.reserve(metrics.category_breakdown.size());
    for (auto& category : metrics.category_breakdown) {
        category.share = metrics.total_count > 0
            ? static_cast<double>(category.count) / static_cast<double>(metrics.total_count) * 100.0
            : 0.0;
        counts.push_back(category.count);
    }

    metrics.density = has_area ? static_cast<double>(metrics.total_count) / context.area_km2 : 0.0;
    metrics.diversity_index = calculateShannonIndex(counts);
    metrics.diversity_label = interpretDiversityIndex(metrics.diversity_index);
    metrics.coverage_score = calculateCoverageScore(metrics.category_breakdown);
    metrics.coverage_label = interpretCoverageScore(metrics.coverage_score);
    metrics.timestamp = currentTimestampISO8601();

    return metrics;
}

double calculateShannonIndex(const std::vector<size_t>& counts) {
    size_t total = 0;
    for (size_t count : counts) {
        total += count;
    }
    if (total == 0) {
        return 0.0;
    }

    double entropy = 0.0;
    for (size_t count : counts) {
        if (count > 0) {
            double proportion = static_cast<double>(count) / static_cast<double>(total);
            entropy -= proportion * std::log(proportion);
        }
    }
    // A single category yields -1 * ln(1), keep it at exactly zero
    return entropy > 0.0 ? entropy : 0.0;
}

std::string interpretDiversityIndex(double index) {
    if (index == 0.0) return "None";
    if (index < 0.5) return "Very Low";
    if (index < 1.0) return "Low";
    if (index < 1.5) return "Moderate";
    if (index < 2.0) return "High";
    return "Very High";
}

double calculateCoverageScore(const std::vector<CategoryMetric>& breakdown) {
    if (breakdown.empty()) {
        return 0.0;
    }
    size_t present = 0;
    for (const auto& category : breakdown) {
        if (category.count > 0) {
            ++present;
        }
    }
    return static_cast<double>(present) / static_cast<double>(breakdown.size()) * 100.0;
}

std::string interpretCoverageScore(double score) {
    if (score >= 90.0) return "Excellent";
    if (score >= 70.0) return "Good";
    if (score >= 50.0) return "Partial";
    return "Limited";
}

} // namespace metrics
} // namespace urbanmetrics
