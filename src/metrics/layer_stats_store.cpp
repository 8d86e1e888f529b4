#include "metrics/layer_stats_store.hpp"
#include "metrics/layer_manifest.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace urbanmetrics {
namespace metrics {

namespace {

double nonNegative(double value) {
    return (std::isfinite(value) && value > 0.0) ? value : 0.0;
}

} // namespace

bool LayerStatsStore::setLayerStats(const std::string& layer_id, const LayerStats& stats) {
    if (!LayerManifest::isKnownLayer(layer_id)) {
        std::cerr << "Warning: Ignoring statistics for unknown layer '" << layer_id << "'" << std::endl;
        return false;
    }

    layers_[layer_id] = LayerStats(stats.feature_count,
                                   nonNegative(stats.total_area_m2),
                                   nonNegative(stats.total_length_m));
    return true;
}

LayerStats LayerStatsStore::getLayerStats(const std::string& layer_id) const {
    auto it = layers_.find(layer_id);
    if (it == layers_.end()) {
        return LayerStats();
    }
    return it->second;
}

size_t LayerStatsStore::featureCount(const std::string& layer_id) const {
    return getLayerStats(layer_id).feature_count;
}

double LayerStatsStore::totalAreaM2(const std::string& layer_id) const {
    return getLayerStats(layer_id).total_area_m2;
}

double LayerStatsStore::totalLengthM(const std::string& layer_id) const {
    return getLayerStats(layer_id).total_length_m;
}

bool LayerStatsStore::hasData(const std::string& layer_id) const {
    return getLayerStats(layer_id).hasData();
}

std::vector<std::string> LayerStatsStore::getLayerIds() const {
    std::vector<std::string> ids;
    ids.reserve(layers_.size());
    for (const auto& entry : layers_) {
        ids.push_back(entry.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace metrics
} // namespace urbanmetrics
