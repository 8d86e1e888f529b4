#ifndef URBANMETRICS_RESULT_WRITER_HPP
#define URBANMETRICS_RESULT_WRITER_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "metrics/types.hpp"

namespace urbanmetrics {
namespace io {

// Result writer configuration
struct ResultWriterConfig {
    std::string output_file_path;   // Output JSON file; empty returns the document as a string
    int indent;                     // Pretty-print indentation, negative for compact output

    ResultWriterConfig() : indent(2) {}
};

/**
 * JSON serialization of metric results
 */
class ResultWriter {
public:
    static nlohmann::json poiMetricsToJSON(const metrics::POIMetrics& poi_metrics);

    /**
     * Serialize a derived index value with its definition name, unit,
     * formatted value and interpretation level
     */
    static nlohmann::json derivedMetricToJSON(const metrics::DerivedMetricValue& value);

    static nlohmann::json derivedMetricsToJSON(const std::vector<metrics::DerivedMetricValue>& values);

    static nlohmann::json insightsToJSON(const std::vector<metrics::Insight>& insights);

    static nlohmann::json comparisonsToJSON(const std::vector<metrics::MetricComparison>& comparisons);

    static nlohmann::json externalIndexToJSON(const metrics::ExternalIndex& index);

    /**
     * Write a JSON document to a file, creating missing parent directories
     * @param document Document to write
     * @param config Writer configuration with the output path
     * @return true if successful, false otherwise
     */
    static bool writeToFile(const nlohmann::json& document, const ResultWriterConfig& config);

    /**
     * Convert a JSON document to a string with the configured indentation
     */
    static std::string writeToString(const nlohmann::json& document, const ResultWriterConfig& config);

    /**
     * Get the last error message
     * @return Error message from the last operation
     */
    static std::string getLastError() {
        return last_error_;
    }

private:
    static std::string last_error_;

    static void setError(const std::string& error) {
        last_error_ = error;
    }

    // Disable instantiation
    ResultWriter() = delete;
};

} // namespace io
} // namespace urbanmetrics

#endif // URBANMETRICS_RESULT_WRITER_HPP
