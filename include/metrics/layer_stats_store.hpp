#ifndef URBANMETRICS_LAYER_STATS_STORE_HPP
#define URBANMETRICS_LAYER_STATS_STORE_HPP

#include <string>
#include <unordered_map>
#include <vector>
#include "metrics/types.hpp"

namespace urbanmetrics {
namespace metrics {

/**
 * Keyed collection of per-layer statistics within one area of interest.
 * Only ids from the layer manifest are stored; a layer that was never set
 * reads as all-zero statistics.
 */
class LayerStatsStore {
public:
    LayerStatsStore() = default;

    /**
     * Store statistics for a layer, replacing any previous entry
     * @param layer_id Layer identifier
     * @param stats Layer statistics (negative quantities are clamped to zero)
     * @return true if stored, false if the layer id is unknown and was ignored
     */
    bool setLayerStats(const std::string& layer_id, const LayerStats& stats);

    /**
     * Get statistics for a layer
     * @param layer_id Layer identifier
     * @return Stored statistics, or all-zero statistics for absent layers
     */
    LayerStats getLayerStats(const std::string& layer_id) const;

    size_t featureCount(const std::string& layer_id) const;
    double totalAreaM2(const std::string& layer_id) const;
    double totalLengthM(const std::string& layer_id) const;

    /**
     * Check whether a layer has any non-zero quantity
     */
    bool hasData(const std::string& layer_id) const;

    /**
     * Get the ids of all stored layers, sorted
     */
    std::vector<std::string> getLayerIds() const;

    size_t size() const { return layers_.size(); }
    bool empty() const { return layers_.empty(); }

private:
    std::unordered_map<std::string, LayerStats> layers_;
};

} // namespace metrics
} // namespace urbanmetrics

#endif // URBANMETRICS_LAYER_STATS_STORE_HPP
