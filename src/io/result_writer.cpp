#include "io/result_writer.hpp"
#include "metrics/insights_generator.hpp"
#include "metrics/metric_definitions.hpp"
#include <fstream>
#include <stdexcept>
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

namespace urbanmetrics {
namespace io {

std::string ResultWriter::last_error_ = "";

nlohmann::json ResultWriter::poiMetricsToJSON(const metrics::POIMetrics& poi_metrics) {
    nlohmann::json categories = nlohmann::json::array();
    for (const auto& category : poi_metrics.category_breakdown) {
        categories.push_back({
            {"id", category.id},
            {"name", category.name},
            {"count", category.count},
            {"density", category.density},
            {"share", category.share},
            {"color", category.color},
        });
    }

    return {
        {"totalCount", poi_metrics.total_count},
        {"density", poi_metrics.density},
        {"diversityIndex", poi_metrics.diversity_index},
        {"diversityLabel", poi_metrics.diversity_label},
        {"categoryBreakdown", categories},
        {"coverageScore", poi_metrics.coverage_score},
        {"coverageLabel", poi_metrics.coverage_label},
        {"areaKm2", poi_metrics.area_km2},
        {"timestamp", poi_metrics.timestamp},
    };
}

nlohmann::json ResultWriter::derivedMetricToJSON(const metrics::DerivedMetricValue& value) {
    using metrics::MetricDefinitions;
    const metrics::DerivedMetricDefinition& definition = MetricDefinitions::getDerivedDefinition(value.metric_id);

    return {
        {"metricId", metrics::toString(value.metric_id)},
        {"name", definition.name},
        {"value", value.value},
        {"formatted", MetricDefinitions::formatMetricValue(value.value, value.metric_id)},
        {"unit", definition.unit},
        {"confidence", metrics::toString(value.confidence)},
        {"interpretation", metrics::toString(MetricDefinitions::getMetricInterpretation(value.value, value.metric_id))},
        {"breakdown", value.breakdown},
    };
}

nlohmann::json ResultWriter::derivedMetricsToJSON(const std::vector<metrics::DerivedMetricValue>& values) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& value : values) {
        array.push_back(derivedMetricToJSON(value));
    }
    return array;
}

nlohmann::json ResultWriter::insightsToJSON(const std::vector<metrics::Insight>& insights) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& insight : insights) {
        array.push_back({
            {"title", insight.title},
            {"description", insight.description},
            {"confidence", metrics::toString(insight.confidence)},
            {"confidenceExplanation", metrics::InsightsGenerator::getConfidenceExplanation(insight.confidence)},
            {"relatedMetrics", insight.related_metrics},
            {"type", metrics::toString(insight.type)},
        });
    }
    return array;
}

nlohmann::json ResultWriter::comparisonsToJSON(const std::vector<metrics::MetricComparison>& comparisons) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& comparison : comparisons) {
        array.push_back({
            {"metricId", comparison.metric_id},
            {"metricName", comparison.metric_name},
            {"values", comparison.values},
            {"delta", comparison.delta},
            {"deltaIndicator", comparison.delta_indicator},
            {"unit", comparison.unit},
        });
    }
    return array;
}

nlohmann::json ResultWriter::externalIndexToJSON(const metrics::ExternalIndex& index) {
    return {
        {"id", index.id},
        {"name", index.name},
        {"source", index.source},
        {"description", index.description},
        {"values", index.values},
        {"min", index.min},
        {"max", index.max},
        {"unit", index.unit},
        {"colorScale", index.color_scale},
        {"importedAt", index.imported_at},
    };
}

bool ResultWriter::writeToFile(const nlohmann::json& document, const ResultWriterConfig& config) {
    try {
        std::string content = writeToString(document, config);

        fs::path path(config.output_file_path);
        if (path.has_parent_path() && !fs::exists(path.parent_path())) {
            fs::create_directories(path.parent_path());
        }

        std::ofstream file(config.output_file_path);
        if (!file.is_open()) {
            setError("Failed to open file for writing: " + config.output_file_path);
            return false;
        }

        file << content << std::endl;
        file.close();

        return true;

    } catch (const std::exception& e) {
        setError("Error writing file " + config.output_file_path + ": " + e.what());
        return false;
    }
}

std::string ResultWriter::writeToString(const nlohmann::json& document, const ResultWriterConfig& config) {
    // Category names and indicators contain UTF-8; replace rather than throw on bad bytes from input files
    return document.dump(config.indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace io
} // namespace urbanmetrics
