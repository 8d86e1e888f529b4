#include "metrics/insights_generator.hpp"
#include <cmath>

namespace urbanmetrics {
namespace metrics {

namespace {

std::string rounded(double value) {
    return std::to_string(std::llround(value));
}

double categoryDensity(const POIMetrics& metrics, const std::string& category_id) {
    for (const auto& category : metrics.category_breakdown) {
        if (category.id == category_id) {
            return category.density;
        }
    }
    return 0.0;
}

size_t categoryCount(const POIMetrics& metrics, const std::string& category_id) {
    for (const auto& category : metrics.category_breakdown) {
        if (category.id == category_id) {
            return category.count;
        }
    }
    return 0;
}

} // namespace

std::vector<Insight> InsightsGenerator::generateInsights(const std::vector<AreaMetrics>& areas) {
    std::vector<Insight> insights;

    if (areas.size() == 1) {
        addSingleAreaInsights(areas[0], insights);
    } else if (areas.size() == 2) {
        addComparisonInsights(areas[0], areas[1], insights);
    }

    if (insights.size() > MAX_INSIGHTS) {
        insights.erase(insights.begin() + MAX_INSIGHTS, insights.end());
    }
    return insights;
}

void InsightsGenerator::addSingleAreaInsights(const AreaMetrics& area, std::vector<Insight>& insights) {
    const POIMetrics& metrics = area.metrics;

    if (metrics.density >= 200.0) {
        insights.emplace_back(
            "High Amenity Density",
            area.area_name + " has " + rounded(metrics.density) +
                " POIs per km², suggesting a service-rich environment.",
            Confidence::HIGH, std::vector<std::string>{"density"}, InsightType::POSITIVE);
    } else if (metrics.density < 50.0) {
        insights.emplace_back(
            "Low Amenity Density",
            area.area_name + " has limited amenities (" + rounded(metrics.density) +
                " per km²). This may indicate a more residential or rural character.",
            Confidence::HIGH, std::vector<std::string>{"density"}, InsightType::CAUTION);
    }

    if (metrics.diversity_index >= 1.5) {
        insights.emplace_back(
            "Diverse Amenity Mix",
            "Good variety of amenity types, indicating a mixed-use character.",
            Confidence::MEDIUM, std::vector<std::string>{"diversityIndex"}, InsightType::POSITIVE);
    }
}

void InsightsGenerator::addComparisonInsights(const AreaMetrics& a, const AreaMetrics& b,
                                              std::vector<Insight>& insights) {
    // Density, only meaningful against a non-zero reference
    double density_diff = b.metrics.density > 0.0
        ? (a.metrics.density - b.metrics.density) / b.metrics.density * 100.0
        : 0.0;
    if (std::abs(density_diff) > 50.0) {
        const AreaMetrics& higher = density_diff > 0.0 ? a : b;
        const AreaMetrics& lower = density_diff > 0.0 ? b : a;
        insights.emplace_back(
            "Significant Density Difference",
            higher.area_name + " has " + rounded(std::abs(density_diff)) + "% higher POI density than " +
                lower.area_name + ", suggesting a more service-rich environment.",
            Confidence::HIGH, std::vector<std::string>{"poiDensity"}, InsightType::NEUTRAL);
    }

    // Coverage, in percentage points
    double coverage_diff = a.metrics.coverage_score - b.metrics.coverage_score;
    if (std::abs(coverage_diff) > 20.0) {
        const AreaMetrics& better = coverage_diff > 0.0 ? a : b;
        const AreaMetrics& worse = coverage_diff > 0.0 ? b : a;
        insights.emplace_back(
            "Data Coverage Difference",
            better.area_name + " has better data coverage than " + worse.area_name + ". Results for " +
                worse.area_name + " may be less complete.",
            Confidence::MEDIUM, std::vector<std::string>{"coverage"}, InsightType::CAUTION);
    }

    double diversity_diff = a.metrics.diversity_index - b.metrics.diversity_index;
    if (std::abs(diversity_diff) > 0.3) {
        const AreaMetrics& more_diverse = diversity_diff > 0.0 ? a : b;
        const AreaMetrics& less_diverse = diversity_diff > 0.0 ? b : a;
        insights.emplace_back(
            "Amenity Diversity",
            more_diverse.area_name + " has a more diverse mix of amenity types compared to " +
                less_diverse.area_name + ".",
            Confidence::MEDIUM, std::vector<std::string>{"diversityIndex"}, InsightType::NEUTRAL);
    }

    if (b.area_km2 > 0.0) {
        double size_diff = (a.area_km2 - b.area_km2) / b.area_km2 * 100.0;
        if (std::abs(size_diff) > 100.0) {
            insights.emplace_back(
                "Different Scale",
                "The areas differ significantly in size (" + rounded(std::abs(size_diff)) +
                    "%). Per km² metrics provide fairer comparison.",
                Confidence::HIGH, std::vector<std::string>{"areaSize"}, InsightType::CAUTION);
        }
    }

    if (categoryCount(a.metrics, "food") > 0 && categoryCount(b.metrics, "food") > 0) {
        double food_density_a = categoryDensity(a.metrics, "food");
        double food_density_b = categoryDensity(b.metrics, "food");
        double food_diff = food_density_b > 0.0
            ? (food_density_a - food_density_b) / food_density_b * 100.0
            : 0.0;
        if (std::abs(food_diff) > 75.0) {
            const AreaMetrics& more = food_diff > 0.0 ? a : b;
            insights.emplace_back(
                "Dining Options",
                more.area_name + " has significantly more food & dining options per km².",
                Confidence::MEDIUM, std::vector<std::string>{"food"}, InsightType::NEUTRAL);
        }
    }
}

std::string InsightsGenerator::getConfidenceExplanation(Confidence confidence) {
    switch (confidence) {
        case Confidence::HIGH:
            return "Based on clear quantitative differences";
        case Confidence::MEDIUM:
            return "Interpretation may depend on context";
        case Confidence::LOW:
        default:
            return "Limited data; interpret with caution";
    }
}

} // namespace metrics
} // namespace urbanmetrics
