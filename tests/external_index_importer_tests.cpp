#include <cmath>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "io/external_index_importer.hpp"

namespace {

using urbanmetrics::io::EmptyFileError;
using urbanmetrics::io::ExternalIndexImporter;
using urbanmetrics::io::ImportError;
using urbanmetrics::io::IndexImportConfig;
using urbanmetrics::io::MissingColumnError;
using urbanmetrics::io::NoValidRowsError;
using urbanmetrics::io::ParsedTable;
using urbanmetrics::metrics::ExternalIndex;

struct TestCase {
    const char* name;
    const char* intent;
    std::function<bool(void)> run;
};

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

IndexImportConfig make_config(const std::string& value_column, const std::string& area_column = "") {
    IndexImportConfig config;
    config.name = "Noise";
    config.description = "Night noise level";
    config.unit = "dB";
    config.value_column = value_column;
    config.area_column = area_column;
    config.source_name = "noise.csv";
    return config;
}

// Intent: Area-keyed rows import with their values and min/max.
bool test_import_by_area() {
    ExternalIndexImporter importer;
    importer.parse("area,score\nA,10\nB,20\n");
    ExternalIndex index = importer.importIndex(make_config("score", "area"));
    return index.values.size() == 2 &&
           index.values.at("A") == 10.0 &&
           index.values.at("B") == 20.0 &&
           index.min == 10.0 && index.max == 20.0 &&
           index.name == "Noise" &&
           index.unit == "dB" &&
           index.source == "Imported from noise.csv" &&
           index.color_scale == "sequential" &&
           starts_with(index.id, "index-") &&
           !index.imported_at.empty() &&
           importer.getState() == ExternalIndexImporter::State::IMPORTED;
}

// Intent: A missing value column fails with a named error and a terminal state.
bool test_missing_value_column() {
    ExternalIndexImporter importer;
    importer.parse("area,score\nA,10\nB,20\n");
    try {
        importer.importIndex(make_config("value", "area"));
    } catch (const MissingColumnError& e) {
        return e.getColumn() == "value" &&
               std::string(e.what()).find("\"value\"") != std::string::npos &&
               importer.getState() == ExternalIndexImporter::State::FAILED;
    }
    return false;
}

// Intent: A header without data rows cannot be parsed.
bool test_header_only_file() {
    ExternalIndexImporter importer;
    try {
        importer.parse("area,score\n\n");
    } catch (const EmptyFileError&) {
        return importer.getState() == ExternalIndexImporter::State::FAILED;
    }
    return false;
}

// Intent: Rows with non-numeric values are dropped; none left is an error.
bool test_no_valid_rows() {
    ExternalIndexImporter importer;
    importer.parse("area,score\nA,n/a\nB,\nC,12abc\n");
    try {
        importer.importIndex(make_config("score", "area"));
    } catch (const NoValidRowsError&) {
        return importer.getState() == ExternalIndexImporter::State::FAILED;
    }
    return false;
}

// Intent: Invalid rows are dropped silently while the remaining rows import.
bool test_invalid_rows_dropped() {
    ExternalIndexImporter importer;
    importer.parse("area,score\nA,5\nB,oops\nC,-2.5\nD,inf\nE,1,extra\n");
    ExternalIndex index = importer.importIndex(make_config("score", "area"));
    return index.values.size() == 2 &&
           index.values.count("A") == 1 &&
           index.values.at("C") == -2.5 &&
           index.min == -2.5 && index.max == 5.0;
}

// Intent: Delimiter detection prefers tab, then a semicolon without commas, else comma.
bool test_detect_delimiter() {
    return ExternalIndexImporter::detectDelimiter("a\tb;c,d") == '\t' &&
           ExternalIndexImporter::detectDelimiter("a;b;c") == ';' &&
           ExternalIndexImporter::detectDelimiter("a;b,c") == ',' &&
           ExternalIndexImporter::detectDelimiter("single") == ',';
}

// Intent: Semicolon files with quoted fields and CRLF endings parse cleanly.
bool test_parse_semicolon_quoted() {
    ParsedTable table = ExternalIndexImporter::parseTable("\"name\";\"value\"\r\n\"Old Town\";\"3,5\"\r\n\"Harbor\"; 7 \r\n");
    return table.delimiter == ';' &&
           table.headers.size() == 2 &&
           table.headers[0] == "name" && table.headers[1] == "value" &&
           table.rows.size() == 2 &&
           table.rows[0][0] == "Old Town" &&
           table.rows[0][1] == "3,5" &&
           table.rows[1][1] == "7";
}

// Intent: A UTF-8 byte order mark does not become part of the first header.
bool test_import_with_byte_order_mark() {
    ExternalIndexImporter importer;
    importer.parse("\xEF\xBB\xBF" "score,area_name\n10,A\n20,B\n");
    ExternalIndex index = importer.importIndex(make_config("score", "area_name"));
    return importer.getTable().headers[0] == "score" &&
           index.values.size() == 2 &&
           index.values.at("A") == 10.0 &&
           index.values.at("B") == 20.0;
}

// Intent: Tab separated rows import with the value column chosen by name.
bool test_import_tab_separated() {
    ExternalIndexImporter importer;
    importer.parse("id\tvalue\tnote\nz1\t1.5\tx\nz2\t2.5\ty\n");
    ExternalIndex index = importer.importIndex(make_config("value", "id"));
    return importer.getTable().delimiter == '\t' &&
           index.values.size() == 2 &&
           index.values.at("z2") == 2.5;
}

// Intent: Without an area column, coordinates form "lat,lon" keys rounded to 6 decimals.
bool test_import_by_coordinates() {
    ExternalIndexImporter importer;
    importer.parse("lat,lon,score\n40.7127753,-74.0059728,3\n51.5,abc,4\n48.8566,2.3522,5\n");
    IndexImportConfig config = make_config("score");
    config.lat_column = "lat";
    config.lon_column = "lon";
    ExternalIndex index = importer.importIndex(config);
    return index.values.size() == 2 &&
           index.values.count("40.712775,-74.005973") == 1 &&
           index.values.count("48.856600,2.352200") == 1;
}

// Intent: An empty area value falls back to the coordinate key.
bool test_area_key_falls_back_to_coordinates() {
    ExternalIndexImporter importer;
    importer.parse("area,lat,lon,score\n,1.5,2.5,9\nNorth,0,0,4\n");
    IndexImportConfig config = make_config("score", "area");
    config.lat_column = "lat";
    config.lon_column = "lon";
    ExternalIndex index = importer.importIndex(config);
    return index.values.size() == 2 &&
           index.values.at("1.500000,2.500000") == 9.0 &&
           index.values.at("North") == 4.0;
}

// Intent: Without key columns rows are keyed by the number of values kept so far.
bool test_import_row_keys() {
    ExternalIndexImporter importer;
    importer.parse("score\n3\nbad\n4\n");
    ExternalIndex index = importer.importIndex(make_config("score"));
    return index.values.size() == 2 &&
           index.values.at("row-0") == 3.0 &&
           index.values.at("row-1") == 4.0;
}

// Intent: Coordinate headers are recognized by common names, case-insensitively.
bool test_detect_coordinate_columns() {
    auto full = ExternalIndexImporter::detectCoordinateColumns({"id", "Latitude", "LNG", "score"});
    auto prefixed = ExternalIndexImporter::detectCoordinateColumns({"stop_lat", "stop_lon"});
    auto none = ExternalIndexImporter::detectCoordinateColumns({"name", "value"});
    return full.lat_column && *full.lat_column == "Latitude" &&
           full.lon_column && *full.lon_column == "LNG" &&
           prefixed.lat_column && *prefixed.lat_column == "stop_lat" &&
           prefixed.lon_column && *prefixed.lon_column == "stop_lon" &&
           !none.lat_column && !none.lon_column;
}

// Intent: The importer only moves forward through its states.
bool test_state_machine() {
    ExternalIndexImporter importer;
    if (importer.getState() != ExternalIndexImporter::State::UNINGESTED) {
        return false;
    }

    bool import_before_parse_rejected = false;
    try {
        importer.importIndex(make_config("score"));
    } catch (const ImportError&) {
        import_before_parse_rejected = true;
    }

    importer.parse("score\n1\n");
    bool parsed = importer.getState() == ExternalIndexImporter::State::PARSED;

    bool second_parse_rejected = false;
    try {
        importer.parse("score\n2\n");
    } catch (const ImportError&) {
        second_parse_rejected = true;
    }

    importer.importIndex(make_config("score"));
    bool imported = importer.getState() == ExternalIndexImporter::State::IMPORTED;

    bool second_import_rejected = false;
    try {
        importer.importIndex(make_config("score"));
    } catch (const ImportError&) {
        second_import_rejected = true;
    }

    return import_before_parse_rejected && parsed && second_parse_rejected &&
           imported && second_import_rejected &&
           importer.getState() == ExternalIndexImporter::State::IMPORTED;
}

// Intent: A missing file fails the importer.
bool test_missing_file() {
    ExternalIndexImporter importer;
    try {
        importer.parseFile("/nonexistent/urbanmetrics/index.csv");
    } catch (const ImportError&) {
        return importer.getState() == ExternalIndexImporter::State::FAILED;
    }
    return false;
}

} // namespace

int main() {
    const std::vector<TestCase> tests = {
        {"Import_ByArea", "Area-keyed values with min and max", test_import_by_area},
        {"Import_MissingColumn", "Named error for absent value column", test_missing_value_column},
        {"Import_HeaderOnly", "Header without rows fails", test_header_only_file},
        {"Import_NoValidRows", "All rows invalid fails", test_no_valid_rows},
        {"Import_InvalidRowsDropped", "Invalid rows dropped silently", test_invalid_rows_dropped},
        {"Parse_DetectDelimiter", "Tab, semicolon or comma", test_detect_delimiter},
        {"Parse_SemicolonQuoted", "Quotes stripped, CRLF tolerated", test_parse_semicolon_quoted},
        {"Import_ByteOrderMark", "Leading BOM stripped from header", test_import_with_byte_order_mark},
        {"Import_TabSeparated", "Tab separated import", test_import_tab_separated},
        {"Import_ByCoordinates", "Rounded lat,lon keys", test_import_by_coordinates},
        {"Import_AreaFallback", "Empty area value uses coordinates", test_area_key_falls_back_to_coordinates},
        {"Import_RowKeys", "Synthetic row keys", test_import_row_keys},
        {"Parse_DetectCoordinates", "Coordinate header detection", test_detect_coordinate_columns},
        {"Importer_StateMachine", "Forward-only state transitions", test_state_machine},
        {"Importer_MissingFile", "Unreadable file fails", test_missing_file},
    };

    bool all_passed = true;
    for (const TestCase& test : tests) {
        bool passed = false;
        try {
            passed = test.run();
        } catch (const std::exception& e) {
            std::cerr << "Unexpected exception: " << e.what() << "\n";
        }
        std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
        all_passed = all_passed && passed;
    }

    if (!all_passed) {
        std::cerr << "external index importer tests failed\n";
        return 1;
    }

    std::cout << "external index importer tests passed (" << tests.size() << " cases)\n";
    return 0;
}
