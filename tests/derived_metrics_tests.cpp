#include <cmath>
#include <functional>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "metrics/derived_metrics.hpp"

namespace {

using urbanmetrics::metrics::AreaContext;
using urbanmetrics::metrics::Confidence;
using urbanmetrics::metrics::DerivedMetricType;
using urbanmetrics::metrics::DerivedMetricValue;
using urbanmetrics::metrics::DerivedMetricsCalculator;
using urbanmetrics::metrics::LayerStats;
using urbanmetrics::metrics::LayerStatsStore;

struct TestCase {
    const char* name;
    const char* intent;
    std::function<bool(void)> run;
};

bool almost_equal(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

bool has_key(const DerivedMetricValue& value, const std::string& key) {
    return value.breakdown.find(key) != value.breakdown.end();
}

AreaContext make_context(double area_km2, const std::vector<std::pair<std::string, LayerStats>>& stats) {
    LayerStatsStore layers;
    for (const auto& entry : stats) {
        layers.setLayerStats(entry.first, entry.second);
    }
    return AreaContext(area_km2, urbanmetrics::geo::MultiPolygon(), layers);
}

LayerStats count(size_t n) {
    return LayerStats(n, 0.0, 0.0);
}

LayerStats area(double m2) {
    return LayerStats(1, m2, 0.0);
}

LayerStats length(double m) {
    return LayerStats(1, 0.0, m);
}

// Intent: One rail line and five stops in 2 km² give the mode-weighted log score with high confidence.
bool test_transit_weighted_density() {
    DerivedMetricValue transit = DerivedMetricsCalculator::calculateTransitCoverage(
        make_context(2.0, {{"rail-lines", count(1)}, {"transit-stops", count(5)}}));
    double expected = 100.0 * std::log(4.5) / std::log(51.0);
    return almost_equal(transit.breakdown.at("weighted_sum"), 7.0) &&
           almost_equal(transit.breakdown.at("weighted_density"), 3.5) &&
           almost_equal(transit.value, expected, 1e-9) &&
           transit.value > 38.0 && transit.value < 39.0 &&
           transit.confidence == Confidence::HIGH;
}

// Intent: Transit from a single mode is graded medium.
bool test_transit_single_mode_medium() {
    DerivedMetricValue transit = DerivedMetricsCalculator::calculateTransitCoverage(
        make_context(1.0, {{"transit-stops", count(500)}}));
    return almost_equal(transit.value, 100.0) && transit.confidence == Confidence::MEDIUM;
}

// Intent: An area without data scores zero with low confidence, except the fifteen-minute score.
bool test_empty_area_all_zero() {
    std::vector<DerivedMetricValue> values = DerivedMetricsCalculator::calculateAll(make_context(1.0, {}));
    if (values.size() != 9) {
        return false;
    }
    for (const auto& value : values) {
        if (value.value != 0.0) {
            return false;
        }
        Confidence expected = value.metric_id == DerivedMetricType::FIFTEEN_MIN_SCORE
            ? Confidence::HIGH
            : Confidence::LOW;
        if (value.confidence != expected) {
            return false;
        }
    }
    return true;
}

// Intent: A zero area never produces NaN or infinite values.
bool test_zero_area_is_finite() {
    std::vector<DerivedMetricValue> values = DerivedMetricsCalculator::calculateAll(make_context(0.0, {
        {"poi-food-drink", count(10)}, {"parks", area(5000.0)}, {"roads-primary", length(3000.0)},
        {"transit-stops", count(4)}, {"bike-lanes", length(800.0)},
    }));
    for (const auto& value : values) {
        if (!std::isfinite(value.value) || value.value < 0.0 || value.value > 100.0) {
            return false;
        }
    }
    return values[static_cast<size_t>(DerivedMetricType::TRANSIT_COVERAGE)].value == 0.0 &&
           values[static_cast<size_t>(DerivedMetricType::BIKE_SCORE)].value == 0.0;
}

// Intent: Very dense inputs are clamped to 100 for every index.
bool test_values_clamped() {
    std::vector<DerivedMetricValue> values = DerivedMetricsCalculator::calculateAll(make_context(0.01, {
        {"poi-food-drink", count(1000)}, {"poi-shopping", count(1000)}, {"poi-grocery", count(1000)},
        {"poi-health", count(1000)}, {"poi-education", count(1000)}, {"parks", area(900000.0)},
        {"water", area(900000.0)}, {"buildings-residential", area(500000.0)},
        {"buildings-commercial", area(500000.0)}, {"roads-primary", length(100000.0)},
        {"roads-residential", length(100000.0)}, {"transit-stops", count(1000)},
        {"rail-lines", count(100)}, {"bike-lanes", length(100000.0)},
        {"poi-bike-parking", count(1000)}, {"poi-bike-shops", count(100)},
    }));
    for (size_t i = 0; i < values.size(); ++i) {
        if (static_cast<size_t>(values[i].metric_id) != i) {
            return false;
        }
        if (values[i].value < 0.0 || values[i].value > 100.0) {
            return false;
        }
    }
    return values[static_cast<size_t>(DerivedMetricType::GREEN_RATIO)].value == 100.0 &&
           values[static_cast<size_t>(DerivedMetricType::STREET_CONNECTIVITY)].value == 100.0;
}

// Intent: Equal counts across all five amenity layers give full diversity with high confidence.
bool test_diversity_even_mix() {
    DerivedMetricValue diversity = DerivedMetricsCalculator::calculateDiversityIndex(make_context(1.0, {
        {"poi-food-drink", count(4)}, {"poi-shopping", count(4)}, {"poi-grocery", count(4)},
        {"poi-health", count(4)}, {"poi-education", count(4)},
    }));
    return almost_equal(diversity.value, 100.0, 1e-9) &&
           diversity.confidence == Confidence::HIGH &&
           almost_equal(diversity.breakdown.at("max_entropy"), std::log(5.0)) &&
           diversity.breakdown.at("layers_with_data") == 5.0;
}

// Intent: Diversity confidence drops with the share of amenity layers that carry data.
bool test_diversity_confidence_grades() {
    DerivedMetricValue three = DerivedMetricsCalculator::calculateDiversityIndex(make_context(1.0, {
        {"poi-food-drink", count(2)}, {"poi-shopping", count(2)}, {"poi-grocery", count(2)},
    }));
    DerivedMetricValue two = DerivedMetricsCalculator::calculateDiversityIndex(make_context(1.0, {
        {"poi-food-drink", count(2)}, {"poi-shopping", count(2)},
    }));
    return three.confidence == Confidence::MEDIUM &&
           almost_equal(three.value, std::log(3.0) / std::log(5.0) * 100.0) &&
           two.confidence == Confidence::LOW &&
           almost_equal(two.value, std::log(2.0) / std::log(5.0) * 100.0);
}

// Intent: Green ratio is the park and water share of the area.
bool test_green_ratio() {
    DerivedMetricValue green = DerivedMetricsCalculator::calculateGreenRatio(make_context(1.0, {
        {"parks", area(100000.0)}, {"water", area(50000.0)},
    }));
    return almost_equal(green.value, 15.0) &&
           green.confidence == Confidence::HIGH &&
           almost_equal(green.breakdown.at("covered_area_m2"), 150000.0) &&
           almost_equal(green.breakdown.at("parks"), 100000.0);
}

// Intent: Building density uses all footprint layers; one layer alone is medium confidence.
bool test_building_density() {
    DerivedMetricValue single = DerivedMetricsCalculator::calculateBuildingDensity(make_context(2.0, {
        {"buildings-residential", area(400000.0)},
    }));
    DerivedMetricValue mixed = DerivedMetricsCalculator::calculateBuildingDensity(make_context(2.0, {
        {"buildings-residential", area(400000.0)}, {"buildings-industrial", area(200000.0)},
    }));
    return almost_equal(single.value, 20.0) && single.confidence == Confidence::MEDIUM &&
           almost_equal(mixed.value, 30.0) && mixed.confidence == Confidence::HIGH;
}

// Intent: Street connectivity estimates one intersection per 200 m of road and caps at 100.
bool test_street_connectivity() {
    DerivedMetricValue grid = DerivedMetricsCalculator::calculateStreetConnectivity(make_context(1.0, {
        {"roads-primary", length(6000.0)}, {"roads-residential", length(4000.0)},
    }));
    DerivedMetricValue dense = DerivedMetricsCalculator::calculateStreetConnectivity(make_context(1.0, {
        {"roads-residential", length(40000.0)},
    }));
    return almost_equal(grid.value, 50.0) &&
           grid.confidence == Confidence::HIGH &&
           almost_equal(grid.breakdown.at("estimated_intersections"), 50.0) &&
           almost_equal(grid.breakdown.at("total_road_length_m"), 10000.0) &&
           has_key(grid, "roads-primary_length_m") &&
           dense.value == 100.0 &&
           almost_equal(dense.breakdown.at("intersection_density"), 200.0) &&
           dense.confidence == Confidence::MEDIUM;
}

// Intent: Mixed use peaks when residential and commercial areas are balanced.
bool test_mixed_use_balance() {
    DerivedMetricValue balanced = DerivedMetricsCalculator::calculateMixedUseScore(make_context(1.0, {
        {"buildings-residential", area(1000.0)}, {"buildings-commercial", area(1000.0)},
    }));
    DerivedMetricValue skewed = DerivedMetricsCalculator::calculateMixedUseScore(make_context(1.0, {
        {"buildings-residential", area(3000.0)}, {"buildings-commercial", area(1000.0)},
    }));
    DerivedMetricValue residential_only = DerivedMetricsCalculator::calculateMixedUseScore(make_context(1.0, {
        {"buildings-residential", area(3000.0)},
    }));
    return almost_equal(balanced.value, 100.0) && balanced.confidence == Confidence::HIGH &&
           almost_equal(skewed.value, 50.0) &&
           almost_equal(skewed.breakdown.at("residential_ratio"), 0.75) &&
           residential_only.value == 0.0;
}

// Intent: Saturated amenity densities plus a connected grid give a full walk score.
bool test_walkability_saturated() {
    DerivedMetricValue walk = DerivedMetricsCalculator::calculateWalkabilityProxy(make_context(1.0, {
        {"poi-grocery", count(10)}, {"poi-food-drink", count(20)}, {"poi-shopping", count(10)},
        {"parks", LayerStats(6, 1000.0, 0.0)}, {"poi-education", count(6)}, {"poi-health", count(4)},
        {"roads-primary", length(10000.0)}, {"roads-residential", length(10000.0)},
    }));
    return almost_equal(walk.value, 100.0, 1e-9) &&
           almost_equal(walk.breakdown.at("amenity_component"), 85.0, 1e-9) &&
           almost_equal(walk.breakdown.at("pedestrian_bonus"), 15.0) &&
           walk.breakdown.at("categories_with_data") == 7.0 &&
           has_key(walk, "grocery_score") &&
           has_key(walk, "coffee_count") &&
           walk.confidence == Confidence::HIGH;
}

// Intent: Walk score without roads only has the amenity component, at most 85.
bool test_walkability_without_roads() {
    DerivedMetricValue walk = DerivedMetricsCalculator::calculateWalkabilityProxy(make_context(1.0, {
        {"poi-grocery", count(1)}, {"poi-food-drink", count(2)}, {"poi-shopping", count(1)},
    }));
    return walk.value > 0.0 && walk.value <= 85.0 &&
           walk.breakdown.at("pedestrian_bonus") == 0.0 &&
           walk.confidence == Confidence::MEDIUM;
}

// Intent: The fifteen-minute score is the share of essential groups present, always high confidence.
bool test_fifteen_min_score() {
    DerivedMetricValue partial = DerivedMetricsCalculator::calculateFifteenMinScore(make_context(1.0, {
        {"poi-grocery", count(1)}, {"parks", area(200.0)},
    }));
    DerivedMetricValue complete = DerivedMetricsCalculator::calculateFifteenMinScore(make_context(1.0, {
        {"poi-food-drink", count(1)}, {"poi-health", count(1)}, {"poi-education", count(1)},
        {"parks", area(200.0)}, {"rail-lines", count(1)},
    }));
    return almost_equal(partial.value, 40.0) && partial.confidence == Confidence::HIGH &&
           partial.breakdown.at("food") == 1.0 && partial.breakdown.at("transit") == 0.0 &&
           almost_equal(complete.value, 100.0);
}

// Intent: Bike score weights infrastructure, amenities and connectivity 50/30/20.
bool test_bike_score_components() {
    DerivedMetricValue full = DerivedMetricsCalculator::calculateBikeScore(make_context(1.0, {
        {"bike-lanes", length(5000.0)}, {"poi-bike-parking", count(50)}, {"poi-bike-shops", count(2)},
        {"roads-primary", length(20000.0)},
    }));
    DerivedMetricValue lanes_only = DerivedMetricsCalculator::calculateBikeScore(make_context(1.0, {
        {"bike-lanes", length(5000.0)},
    }));
    return almost_equal(full.value, 100.0, 1e-9) &&
           full.confidence == Confidence::HIGH &&
           almost_equal(full.breakdown.at("weighted_infrastructure"), 50.0, 1e-9) &&
           almost_equal(full.breakdown.at("weighted_amenities"), 30.0, 1e-9) &&
           almost_equal(full.breakdown.at("weighted_connectivity"), 20.0, 1e-9) &&
           almost_equal(lanes_only.value, 50.0, 1e-9) &&
           lanes_only.confidence == Confidence::MEDIUM;
}

// Intent: Identical inputs always produce identical values.
bool test_calculation_is_deterministic() {
    AreaContext context = make_context(1.7, {
        {"poi-food-drink", count(12)}, {"poi-health", count(3)}, {"transit-stops", count(9)},
        {"roads-residential", length(7300.0)}, {"parks", area(82000.0)},
    });
    std::vector<DerivedMetricValue> first = DerivedMetricsCalculator::calculateAll(context);
    std::vector<DerivedMetricValue> second = DerivedMetricsCalculator::calculateAll(context);
    for (size_t i = 0; i < first.size(); ++i) {
        if (first[i].value != second[i].value || first[i].confidence != second[i].confidence ||
            first[i].breakdown != second[i].breakdown) {
            return false;
        }
    }
    return first.size() == second.size();
}

} // namespace

int main() {
    const std::vector<TestCase> tests = {
        {"Transit_WeightedDensity", "Mode-weighted log score, high confidence", test_transit_weighted_density},
        {"Transit_SingleModeMedium", "One transit mode is medium confidence", test_transit_single_mode_medium},
        {"Derived_EmptyArea", "No data gives 0 and low confidence", test_empty_area_all_zero},
        {"Derived_ZeroAreaFinite", "Zero area gives finite values", test_zero_area_is_finite},
        {"Derived_Clamped", "Dense inputs clamp to 100", test_values_clamped},
        {"Diversity_EvenMix", "Even amenity mix scores 100", test_diversity_even_mix},
        {"Diversity_ConfidenceGrades", "Confidence follows layer completeness", test_diversity_confidence_grades},
        {"GreenRatio_Basic", "Park and water share of area", test_green_ratio},
        {"BuildingDensity_Basic", "Footprint share of area", test_building_density},
        {"StreetConnectivity_Basic", "Intersections per km² capped at 100", test_street_connectivity},
        {"MixedUse_Balance", "Balanced residential and commercial scores 100", test_mixed_use_balance},
        {"Walkability_Saturated", "Full amenity and grid score", test_walkability_saturated},
        {"Walkability_NoRoads", "No pedestrian bonus without roads", test_walkability_without_roads},
        {"FifteenMin_Groups", "Share of essential groups present", test_fifteen_min_score},
        {"BikeScore_Components", "Weighted bike components", test_bike_score_components},
        {"Derived_Deterministic", "Identical inputs, identical outputs", test_calculation_is_deterministic},
    };

    bool all_passed = true;
    for (const TestCase& test : tests) {
        const bool passed = test.run();
        std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
        all_passed = all_passed && passed;
    }

    if (!all_passed) {
        std::cerr << "derived metrics tests failed\n";
        return 1;
    }

    std::cout << "derived metrics tests passed (" << tests.size() << " cases)\n";
    return 0;
}
