#ifndef URBANMETRICS_EXTERNAL_INDEX_IMPORTER_HPP
#define URBANMETRICS_EXTERNAL_INDEX_IMPORTER_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "metrics/types.hpp"

namespace urbanmetrics {
namespace io {

// Base class of all import failures
class ImportError : public std::runtime_error {
public:
    explicit ImportError(const std::string& message) : std::runtime_error(message) {}
};

// The file has fewer than a header line and one data line
class EmptyFileError : public ImportError {
public:
    EmptyFileError() : ImportError("File must have at least a header row and one data row") {}
};

// A required column is absent from the header
class MissingColumnError : public ImportError {
public:
    explicit MissingColumnError(const std::string& column)
        : ImportError("Value column \"" + column + "\" not found in file"), column_(column) {}

    const std::string& getColumn() const { return column_; }

private:
    std::string column_;
};

// No data row survived value and key validation
class NoValidRowsError : public ImportError {
public:
    NoValidRowsError() : ImportError("No valid numeric values found in file") {}
};

// Index import configuration
struct IndexImportConfig {
    std::string name;               // Display name of the index
    std::string description;
    std::string unit;
    std::string value_column;       // Required numeric column
    std::string area_column;        // Optional key column (area name or id)
    std::string lat_column;         // Optional coordinate key columns
    std::string lon_column;
    std::string source_name;        // File name shown as the index source
};

// Header and data rows of a delimited text file
struct ParsedTable {
    char delimiter;
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;     // Every row has headers.size() fields

    ParsedTable() : delimiter(',') {}
};

// Coordinate columns recognized from header names
struct DetectedColumns {
    std::optional<std::string> lat_column;
    std::optional<std::string> lon_column;
};

/**
 * Importer turning a delimited text file into an ExternalIndex.
 *
 * Runs through UNINGESTED -> PARSED -> IMPORTED, or ends in FAILED when
 * parsing or importing throws. IMPORTED and FAILED are terminal.
 */
class ExternalIndexImporter {
public:
    enum class State {
        UNINGESTED,
        PARSED,
        IMPORTED,
        FAILED
    };

    ExternalIndexImporter();

    /**
     * Parse delimited text
     * @param text File contents (UTF-8)
     * @throws EmptyFileError if there are fewer than two lines
     * @throws ImportError if the importer is not in the UNINGESTED state
     */
    void parse(const std::string& text);

    /**
     * Read and parse a delimited text file
     * @throws ImportError if the file cannot be opened
     */
    void parseFile(const std::string& filepath);

    /**
     * Get the parsed table, used to choose the columns of the import
     * @throws ImportError if nothing has been parsed
     */
    const ParsedTable& getTable() const;

    /**
     * Build the index from the parsed rows.
     *
     * Rows whose value is not a finite number, or whose coordinate key cannot
     * be parsed, are dropped. The key of a row is the area column value when
     * non-empty, else "lat,lon" rounded to 6 decimals when both coordinate
     * columns are configured, else "row-N" with N the number of values kept so far.
     *
     * @param config Import configuration
     * @return Imported index
     * @throws MissingColumnError if the value column is not in the header
     * @throws NoValidRowsError if no row survives
     * @throws ImportError if the importer is not in the PARSED state
     */
    metrics::ExternalIndex importIndex(const IndexImportConfig& config);

    State getState() const { return state_; }

    /**
     * Split text into header and rows. Tolerates CRLF line endings, trims
     * fields and strips one leading and one trailing quote from each.
     * Rows with a different field count than the header are dropped.
     * @throws EmptyFileError if there are fewer than two lines
     */
    static ParsedTable parseTable(const std::string& text);

    /**
     * Delimiter of a header line: tab if present, else ';' if present
     * without ',', else ','
     */
    static char detectDelimiter(const std::string& header_line);

    /**
     * Recognize latitude and longitude columns by common header names
     * (lat, latitude, y, ... and lon, lng, longitude, x, ...)
     */
    static DetectedColumns detectCoordinateColumns(const std::vector<std::string>& headers);

private:
    State state_;
    std::optional<ParsedTable> table_;
};

} // namespace io
} // namespace urbanmetrics

#endif // URBANMETRICS_EXTERNAL_INDEX_IMPORTER_HPP
