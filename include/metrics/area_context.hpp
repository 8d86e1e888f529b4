#ifndef URBANMETRICS_AREA_CONTEXT_HPP
#define URBANMETRICS_AREA_CONTEXT_HPP

#include "geo/common.hpp"
#include "metrics/layer_stats_store.hpp"

namespace urbanmetrics {
namespace metrics {

/**
 * Input snapshot of one area of interest. Calculators only read it.
 */
struct AreaContext {
    double area_km2;                // > 0 expected, 0 tolerated
    geo::MultiPolygon polygon;      // WGS84 lon/lat
    LayerStatsStore layers;

    AreaContext() : area_km2(0.0) {}

    AreaContext(double km2, const geo::MultiPolygon& geometry, const LayerStatsStore& layer_stats)
        : area_km2(km2), polygon(geometry), layers(layer_stats) {}
};

} // namespace metrics
} // namespace urbanmetrics

#endif // URBANMETRICS_AREA_CONTEXT_HPP
