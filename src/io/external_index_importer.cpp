#include "io/external_index_importer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

namespace urbanmetrics {
namespace io {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string cleanField(const std::string& field) {
    std::string cleaned = trim(field);
    if (!cleaned.empty() && cleaned.front() == '"') {
        cleaned.erase(0, 1);
    }
    if (!cleaned.empty() && cleaned.back() == '"') {
        cleaned.pop_back();
    }
    return cleaned;
}

std::vector<std::string> splitFields(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(cleanField(line.substr(start)));
            break;
        }
        fields.push_back(cleanField(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return fields;
}

// Whole-field numeric parse; rejects trailing text, NaN and infinities
std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string formatCoordinate(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.6f", value);
    return buffer;
}

std::optional<size_t> columnIndex(const std::vector<std::string>& headers, const std::string& column) {
    if (column.empty()) {
        return std::nullopt;
    }
    auto it = std::find(headers.begin(), headers.end(), column);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - headers.begin());
}

bool matchesAny(const std::string& header, const std::vector<std::regex>& patterns) {
    for (const auto& pattern : patterns) {
        if (std::regex_search(header, pattern)) {
            return true;
        }
    }
    return false;
}

} // namespace

ExternalIndexImporter::ExternalIndexImporter() : state_(State::UNINGESTED) {
}

void ExternalIndexImporter::parse(const std::string& text) {
    if (state_ != State::UNINGESTED) {
        throw ImportError("A file has already been parsed by this importer");
    }
    try {
        table_ = parseTable(text);
        state_ = State::PARSED;
    } catch (const ImportError&) {
        state_ = State::FAILED;
        throw;
    }
}

void ExternalIndexImporter::parseFile(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        state_ = State::FAILED;
        throw ImportError("Failed to open file: " + filepath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());
}

const ParsedTable& ExternalIndexImporter::getTable() const {
    if (!table_) {
        throw ImportError("No file has been parsed");
    }
    return *table_;
}

metrics::ExternalIndex ExternalIndexImporter::importIndex(const IndexImportConfig& config) {
    if (state_ != State::PARSED || !table_) {
        throw ImportError("Importer is not ready to import; parse a file first");
    }

    try {
        const ParsedTable& table = *table_;

        auto value_index = columnIndex(table.headers, config.value_column);
        if (!value_index) {
            throw MissingColumnError(config.value_column);
        }
        auto area_index = columnIndex(table.headers, config.area_column);
        auto lat_index = columnIndex(table.headers, config.lat_column);
        auto lon_index = columnIndex(table.headers, config.lon_column);
        bool has_coordinates = !config.lat_column.empty() && !config.lon_column.empty();

        std::map<std::string, double> values;
        for (const auto& row : table.rows) {
            auto value = parseNumber(row[*value_index]);
            if (!value) {
                continue;
            }

            std::string key;
            if (area_index && !row[*area_index].empty()) {
                key = row[*area_index];
            } else if (has_coordinates) {
                // Configured coordinate columns missing from the header never parse
                std::optional<double> lat = lat_index ? parseNumber(row[*lat_index]) : std::nullopt;
                std::optional<double> lon = lon_index ? parseNumber(row[*lon_index]) : std::nullopt;
                if (!lat || !lon) {
                    continue;
                }
                key = formatCoordinate(*lat) + "," + formatCoordinate(*lon);
            } else {
                key = "row-" + std::to_string(values.size());
            }

            values[key] = *value;
        }

        if (values.empty()) {
            throw NoValidRowsError();
        }

        metrics::ExternalIndex index;
        auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
        index.id = "index-" + std::to_string(millis);
        index.name = config.name;
        index.source = "Imported from " + config.source_name;
        index.description = config.description;
        index.unit = config.unit;
        index.color_scale = "sequential";
        index.imported_at = metrics::currentTimestampISO8601();

        index.min = std::numeric_limits<double>::infinity();
        index.max = -std::numeric_limits<double>::infinity();
        for (const auto& entry : values) {
            index.min = std::min(index.min, entry.second);
            index.max = std::max(index.max, entry.second);
        }
        index.values = std::move(values);

        state_ = State::IMPORTED;
        return index;

    } catch (const ImportError&) {
        state_ = State::FAILED;
        throw;
    }
}

ParsedTable ExternalIndexImporter::parseTable(const std::string& text) {
    // Spreadsheet exports prefix UTF-8 files with a byte order mark
    static const std::string UTF8_BOM = "\xEF\xBB\xBF";
    const bool has_bom = text.compare(0, UTF8_BOM.size(), UTF8_BOM) == 0;

    std::vector<std::string> lines;
    std::istringstream stream(has_bom ? text.substr(UTF8_BOM.size()) : text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    // Blank lines carry no row
    lines.erase(std::remove_if(lines.begin(), lines.end(),
                               [](const std::string& l) { return trim(l).empty(); }),
                lines.end());

    if (lines.size() < 2) {
        throw EmptyFileError();
    }

    ParsedTable table;
    table.delimiter = detectDelimiter(lines[0]);
    table.headers = splitFields(lines[0], table.delimiter);

    for (size_t i = 1; i < lines.size(); ++i) {
        std::vector<std::string> fields = splitFields(lines[i], table.delimiter);
        if (fields.size() == table.headers.size()) {
            table.rows.push_back(std::move(fields));
        }
    }

    return table;
}

char ExternalIndexImporter::detectDelimiter(const std::string& header_line) {
    if (header_line.find('\t') != std::string::npos) {
        return '\t';
    }
    if (header_line.find(';') != std::string::npos && header_line.find(',') == std::string::npos) {
        return ';';
    }
    return ',';
}

DetectedColumns ExternalIndexImporter::detectCoordinateColumns(const std::vector<std::string>& headers) {
    const auto icase = std::regex::ECMAScript | std::regex::icase;
    static const std::vector<std::regex> lat_patterns = {
        std::regex("^lat$", icase),
        std::regex("^latitude$", icase),
        std::regex("^lat_", icase),
        std::regex("_lat$", icase),
        std::regex("^y$", icase),
        std::regex("^lat\\d*$", icase),
    };
    static const std::vector<std::regex> lon_patterns = {
        std::regex("^lon$", icase),
        std::regex("^lng$", icase),
        std::regex("^longitude$", icase),
        std::regex("^long$", icase),
        std::regex("^lon_", icase),
        std::regex("_lon$", icase),
        std::regex("^x$", icase),
        std::regex("^lng\\d*$", icase),
        std::regex("^lon\\d*$", icase),
    };

    DetectedColumns detected;
    for (const auto& header : headers) {
        std::string name = trim(header);
        if (!detected.lat_column && matchesAny(name, lat_patterns)) {
            detected.lat_column = name;
        }
        if (!detected.lon_column && matchesAny(name, lon_patterns)) {
            detected.lon_column = name;
        }
        if (detected.lat_column && detected.lon_column) {
            break;
        }
    }
    return detected;
}

} // namespace io
} // namespace urbanmetrics
