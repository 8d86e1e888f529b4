#ifndef URBANMETRICS_ANALYSIS_INTERFACE_HPP
#define URBANMETRICS_ANALYSIS_INTERFACE_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "metrics/types.hpp"

namespace urbanmetrics {
namespace api {

// One area of an analysis, read from files or given as precomputed statistics
struct AreaConfig {
    std::string id;
    std::string name;
    std::string area_file;                                  // GeoJSON area polygon (WGS84)
    std::map<std::string, std::string> layer_files;         // Layer id -> GeoJSON file (WGS84)
    std::optional<double> area_km2;                         // Inline area size, used when area_file is empty
    std::map<std::string, metrics::LayerStats> layer_stats; // Inline layer statistics
};

// Analysis configuration
struct AnalysisConfig {
    std::vector<AreaConfig> areas;
    bool include_comparisons;       // Compare metrics when exactly two areas are given
    bool include_insights;

    AnalysisConfig() : include_comparisons(true), include_insights(true) {}
};

/**
 * Parse an analysis configuration
 * @param config_json {"areas": [{"id", "name", "area_file", "layers": {id: path}}
 *                    or {"id", "name", "area_km2", "layer_stats": {id: {"feature_count",
 *                    "total_area_m2", "total_length_m"}}}], "include_comparisons", "include_insights"}
 * @throws std::runtime_error if an area has neither an area file nor an inline size
 */
AnalysisConfig parseAnalysisConfig(const nlohmann::json& config_json);

/**
 * Run the analysis and build the result document
 * @return {"areas": [...], "comparisons": {...}, "insights": [...]}
 * @throws std::runtime_error if an input file cannot be read
 */
nlohmann::json runAreaAnalysis(const AnalysisConfig& config);

/**
 * Area Analysis Tool
 * Computes POI metrics and derived indices for one or more areas, comparisons
 * and insights for a pair of areas
 * @param writer_config_json JSON string for writer configuration (output_file_path, indent)
 * @param analysis_config_json JSON string for analysis configuration
 * @return Result document when no output file is configured, a success message
 *         when it was written to a file, or a message starting with "Error"
 */
std::string processAreaAnalysisTool(
    const std::string& writer_config_json,
    const std::string& analysis_config_json
);

/**
 * Index Import Tool
 * Imports an external index from a delimited text file
 * @param writer_config_json JSON string for writer configuration (output_file_path, indent)
 * @param import_config_json JSON string for import configuration (file_path, name, description,
 *                           unit, value_column, area_column, lat_column, lon_column)
 * @return Index document, a success message, or a message starting with "Error"
 */
std::string processIndexImportTool(
    const std::string& writer_config_json,
    const std::string& import_config_json
);

} // namespace api
} // namespace urbanmetrics

#endif // URBANMETRICS_ANALYSIS_INTERFACE_HPP
