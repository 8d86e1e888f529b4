#include "api/analysis_interface.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <boost/filesystem.hpp>
#include "geo/common.hpp"
#include "io/external_index_importer.hpp"
#include "io/layer_reader.hpp"
#include "io/result_writer.hpp"
#include "metrics/area_context.hpp"
#include "metrics/comparator.hpp"
#include "metrics/derived_metrics.hpp"
#include "metrics/insights_generator.hpp"
#include "metrics/poi_metrics.hpp"

namespace urbanmetrics {
namespace api {

namespace {

// Helper function to parse ResultWriterConfig from JSON
io::ResultWriterConfig parseResultWriterConfig(const nlohmann::json& config_json) {
    io::ResultWriterConfig config;

    if (config_json.contains("output_file_path")) {
        config.output_file_path = config_json["output_file_path"];
    }
    if (config_json.contains("indent")) {
        config.indent = config_json["indent"];
    }

    return config;
}

// Helper function to parse IndexImportConfig from JSON
io::IndexImportConfig parseIndexImportConfig(const nlohmann::json& config_json) {
    io::IndexImportConfig config;

    config.name = config_json.value("name", "");
    config.description = config_json.value("description", "");
    config.unit = config_json.value("unit", "");
    config.value_column = config_json.value("value_column", "");
    config.area_column = config_json.value("area_column", "");
    config.lat_column = config_json.value("lat_column", "");
    config.lon_column = config_json.value("lon_column", "");

    return config;
}

metrics::LayerStats parseLayerStats(const nlohmann::json& stats_json) {
    // Counts above this are not exactly representable as doubles
    constexpr double MAX_FEATURE_COUNT = 9.0e15;
    double count = std::min(stats_json.value("feature_count", 0.0), MAX_FEATURE_COUNT);
    return metrics::LayerStats(count > 0.0 ? static_cast<size_t>(std::llround(count)) : 0,
                               stats_json.value("total_area_m2", 0.0),
                               stats_json.value("total_length_m", 0.0));
}

AreaConfig parseAreaConfig(const nlohmann::json& area_json, size_t index) {
    AreaConfig config;
    config.id = area_json.value("id", "area-" + std::to_string(index + 1));
    config.name = area_json.value("name", "");
    config.area_file = area_json.value("area_file", "");

    if (area_json.contains("layers") && area_json["layers"].is_object()) {
        for (const auto& entry : area_json["layers"].items()) {
            config.layer_files[entry.key()] = entry.value().get<std::string>();
        }
    }
    if (area_json.contains("area_km2")) {
        config.area_km2 = area_json["area_km2"].get<double>();
    }
    if (area_json.contains("layer_stats") && area_json["layer_stats"].is_object()) {
        for (const auto& entry : area_json["layer_stats"].items()) {
            config.layer_stats[entry.key()] = parseLayerStats(entry.value());
        }
    }

    if (config.area_file.empty() && !config.area_km2) {
        throw std::runtime_error("Area '" + config.id + "' needs either area_file or area_km2");
    }
    return config;
}

// Result of one area, kept for comparisons and insights
struct AreaResult {
    std::string id;
    std::string name;
    metrics::AreaContext context;
    metrics::POIMetrics poi_metrics;
    std::vector<metrics::DerivedMetricValue> derived_metrics;
};

metrics::AreaContext buildContextFromFiles(const AreaConfig& config, std::string& area_name) {
    io::LayerReaderConfig reader_config;
    reader_config.area_file_path = config.area_file;
    reader_config.layer_files = config.layer_files;

    io::LayerReader reader(reader_config);
    if (!reader.read()) {
        throw std::runtime_error("Failed to read area '" + config.id + "' from " + config.area_file);
    }
    if (area_name.empty()) {
        area_name = reader.getAreaName();
    }
    return reader.buildAreaContext();
}

metrics::AreaContext buildContextFromStats(const AreaConfig& config) {
    double area_km2 = config.area_km2.value_or(0.0);
    if (!std::isfinite(area_km2) || area_km2 < 0.0) {
        std::cerr << "Warning: Invalid area size for '" << config.id << "', using 0" << std::endl;
        area_km2 = 0.0;
    }

    metrics::LayerStatsStore layers;
    for (const auto& entry : config.layer_stats) {
        layers.setLayerStats(entry.first, entry.second);
    }
    return metrics::AreaContext(area_km2, geo::MultiPolygon(), layers);
}

nlohmann::json areaResultToJSON(const AreaResult& result) {
    nlohmann::json area_json = {
        {"id", result.id},
        {"name", result.name},
        {"areaKm2", result.context.area_km2},
        {"poiMetrics", io::ResultWriter::poiMetricsToJSON(result.poi_metrics)},
        {"derivedMetrics", io::ResultWriter::derivedMetricsToJSON(result.derived_metrics)},
    };
    if (!result.context.polygon.empty()) {
        area_json["geometry"] = geo::multiPolygonToGeoJSON(result.context.polygon);
    }
    return area_json;
}

std::string emitDocument(const nlohmann::json& document, const io::ResultWriterConfig& writer_cfg,
                         const std::string& success_message) {
    if (writer_cfg.output_file_path.empty()) {
        return io::ResultWriter::writeToString(document, writer_cfg);
    }
    if (!io::ResultWriter::writeToFile(document, writer_cfg)) {
        return "Error: Failed to write results: " + io::ResultWriter::getLastError();
    }
    return success_message + " (written to " + writer_cfg.output_file_path + ")";
}

} // namespace

AnalysisConfig parseAnalysisConfig(const nlohmann::json& config_json) {
    AnalysisConfig config;

    if (config_json.contains("areas") && config_json["areas"].is_array()) {
        size_t index = 0;
        for (const auto& area_json : config_json["areas"]) {
            config.areas.push_back(parseAreaConfig(area_json, index));
            index++;
        }
    }
    if (config_json.contains("include_comparisons")) {
        config.include_comparisons = config_json["include_comparisons"];
    }
    if (config_json.contains("include_insights")) {
        config.include_insights = config_json["include_insights"];
    }

    return config;
}

nlohmann::json runAreaAnalysis(const AnalysisConfig& config) {
    std::vector<AreaResult> results;
    results.reserve(config.areas.size());

    for (const auto& area : config.areas) {
        AreaResult result;
        result.id = area.id;
        result.name = area.name;
        result.context = area.area_file.empty()
            ? buildContextFromStats(area)
            : buildContextFromFiles(area, result.name);
        if (result.name.empty()) {
            result.name = area.id;
        }

        result.poi_metrics = metrics::POIMetricsCalculator::calculate(result.context);
        result.derived_metrics = metrics::DerivedMetricsCalculator::calculateAll(result.context);
        results.push_back(std::move(result));
    }

    nlohmann::json document;
    document["areas"] = nlohmann::json::array();
    for (const auto& result : results) {
        document["areas"].push_back(areaResultToJSON(result));
    }

    if (config.include_comparisons && results.size() == 2) {
        document["comparisons"] = {
            {"poiMetrics", io::ResultWriter::comparisonsToJSON(
                metrics::compareAreaMetrics(results[0].poi_metrics, results[1].poi_metrics))},
            {"derivedMetrics", io::ResultWriter::comparisonsToJSON(
                metrics::compareDerivedMetrics(results[0].derived_metrics, results[1].derived_metrics))},
        };
    }

    if (config.include_insights) {
        std::vector<metrics::AreaMetrics> area_metrics;
        for (const auto& result : results) {
            area_metrics.emplace_back(result.id, result.name, result.context.area_km2, result.poi_metrics);
        }
        document["insights"] = io::ResultWriter::insightsToJSON(
            metrics::InsightsGenerator::generateInsights(area_metrics));
    }

    return document;
}

// Area Analysis Tool
std::string processAreaAnalysisTool(
    const std::string& writer_config_json,
    const std::string& analysis_config_json) {

    try {
        // Parse configurations
        nlohmann::json writer_config = nlohmann::json::parse(writer_config_json);
        nlohmann::json analysis_config = nlohmann::json::parse(analysis_config_json);

        io::ResultWriterConfig writer_cfg = parseResultWriterConfig(writer_config);
        AnalysisConfig analysis_cfg = parseAnalysisConfig(analysis_config);

        if (analysis_cfg.areas.empty()) {
            return "Error: No areas configured for analysis";
        }

        nlohmann::json document = runAreaAnalysis(analysis_cfg);

        return emitDocument(document, writer_cfg,
                            "Success: Analysis completed for " + std::to_string(analysis_cfg.areas.size()) + " areas");

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

// Index Import Tool
std::string processIndexImportTool(
    const std::string& writer_config_json,
    const std::string& import_config_json) {

    try {
        // Parse configurations
        nlohmann::json writer_config = nlohmann::json::parse(writer_config_json);
        nlohmann::json import_config = nlohmann::json::parse(import_config_json);

        io::ResultWriterConfig writer_cfg = parseResultWriterConfig(writer_config);
        io::IndexImportConfig import_cfg = parseIndexImportConfig(import_config);

        std::string file_path = import_config.value("file_path", "");
        if (file_path.empty()) {
            return "Error: No input file configured for index import";
        }
        import_cfg.source_name = boost::filesystem::path(file_path).filename().string();
        if (import_cfg.name.empty()) {
            import_cfg.name = boost::filesystem::path(file_path).stem().string();
        }

        io::ExternalIndexImporter importer;
        importer.parseFile(file_path);

        // Fall back to recognizable coordinate columns
        if (import_cfg.lat_column.empty() && import_cfg.lon_column.empty()) {
            io::DetectedColumns detected = io::ExternalIndexImporter::detectCoordinateColumns(importer.getTable().headers);
            if (detected.lat_column && detected.lon_column) {
                std::cerr << "Detected coordinate columns: " << *detected.lat_column << ", "
                          << *detected.lon_column << std::endl;
                import_cfg.lat_column = *detected.lat_column;
                import_cfg.lon_column = *detected.lon_column;
            }
        }

        metrics::ExternalIndex index = importer.importIndex(import_cfg);

        return emitDocument(io::ResultWriter::externalIndexToJSON(index), writer_cfg,
                            "Success: Imported " + std::to_string(index.values.size()) + " values");

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

} // namespace api
} // namespace urbanmetrics
