#ifndef URBANMETRICS_DERIVED_METRICS_HPP
#define URBANMETRICS_DERIVED_METRICS_HPP

#include <string>
#include <vector>
#include "metrics/area_context.hpp"
#include "metrics/types.hpp"

namespace urbanmetrics {
namespace metrics {

/**
 * Calculator for the derived indices of one area.
 *
 * Every function reads the layer statistics of an area snapshot and returns
 * a value in [0, 100], a confidence grade derived from how many of its input
 * layers carried data, and a breakdown of the intermediate quantities that
 * produced the value. None of them fail: a zero area or missing layers yield
 * a value of 0 with low confidence (the fifteen-minute score is the one
 * exception and stays high).
 */
class DerivedMetricsCalculator {
public:
    /**
     * Normalized Shannon entropy over the amenity layers
     * H / ln(n) × 100 where n is the number of amenity layers
     */
    static DerivedMetricValue calculateDiversityIndex(const AreaContext& context);

    /**
     * Share of the area covered by parks and water, in percent
     */
    static DerivedMetricValue calculateGreenRatio(const AreaContext& context);

    /**
     * Estimated intersections per km² from total road length
     */
    static DerivedMetricValue calculateStreetConnectivity(const AreaContext& context);

    /**
     * Share of the area covered by building footprints, in percent
     */
    static DerivedMetricValue calculateBuildingDensity(const AreaContext& context);

    /**
     * Transit score proxy: mode-weighted stop density with logarithmic
     * normalization against a 50 stops/km² benchmark
     */
    static DerivedMetricValue calculateTransitCoverage(const AreaContext& context);

    /**
     * Balance between residential and commercial building area
     */
    static DerivedMetricValue calculateMixedUseScore(const AreaContext& context);

    /**
     * Walk score proxy: weighted amenity category scores (up to 85 points)
     * plus a pedestrian bonus from intersection density (up to 15 points)
     */
    static DerivedMetricValue calculateWalkabilityProxy(const AreaContext& context);

    /**
     * Percentage of the five essential category groups present in the area
     */
    static DerivedMetricValue calculateFifteenMinScore(const AreaContext& context);

    /**
     * Bike score proxy: infrastructure (50%), amenities (30%) and
     * connectivity (20%)
     */
    static DerivedMetricValue calculateBikeScore(const AreaContext& context);

    /**
     * Calculate all derived indices
     * @param context Area snapshot
     * @return One value per index, in definition order
     */
    static std::vector<DerivedMetricValue> calculateAll(const AreaContext& context);

    /**
     * Estimated intersection density assuming one intersection per 200 m of
     * primary and residential road
     * @return Intersections per km², 0 for a zero area
     */
    static double estimateIntersectionDensity(const AreaContext& context);

private:
    // Disable instantiation
    DerivedMetricsCalculator() = delete;
};

} // namespace metrics
} // namespace urbanmetrics

#endif // URBANMETRICS_DERIVED_METRICS_HPP
