#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "api/analysis_interface.hpp"

using namespace urbanmetrics::api;


void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --mode <mode> [options]\n"
              << "\nRequired arguments:\n"
              << "  --mode <mode>                Operation mode: 'analyze' or 'import-index'\n"
              << "\nFor analyze mode, either:\n"
              << "  --config <path>              Analysis configuration JSON file\n"
              << "or:\n"
              << "  --area-file <path>           GeoJSON file with the area polygon (WGS84)\n"
              << "  --layers <list>              Comma-separated layer-id=path pairs of GeoJSON layer files\n"
              << "  --area-name <name>           Display name of the area\n"
              << "  --compare-area-file <path>   GeoJSON file with a second area to compare against\n"
              << "  --compare-layers <list>      Layer files of the second area\n"
              << "  --compare-area-name <name>   Display name of the second area\n"
              << "\nFor import-index mode:\n"
              << "  --input-file <path>          Delimited text file (CSV, semicolon or tab separated)\n"
              << "  --value-column <name>        Column holding the index values\n"
              << "  --area-column <name>         Column holding area names or ids (optional)\n"
              << "  --lat-column <name>          Latitude column (optional, detected from headers if omitted)\n"
              << "  --lon-column <name>          Longitude column (optional, detected from headers if omitted)\n"
              << "  --name <name>                Index name (defaults to the file name)\n"
              << "  --description <text>         Index description\n"
              << "  --unit <unit>                Unit of the index values\n"
              << "\nOptional arguments:\n"
              << "  --output-file <path>         Write the JSON result to this file instead of stdout\n"
              << "\nExamples:\n"
              << "  " << programName << " --mode analyze --area-file area.geojson --layers poi-food-drink=food.geojson,parks=parks.geojson\n"
              << "  " << programName << " --mode analyze --config analysis.json --output-file results.json\n"
              << "  " << programName << " --mode import-index --input-file scores.csv --value-column score --area-column area_name\n"
              << "\nUse --help for detailed parameter explanations and examples.\n"
              << "Use --version to display version information.\n";
}

void printDetailedHelp(const char* programName) {
    std::cout << "UrbanMetrics - Urban Area Scoring Tool\n"
              << "======================================\n\n"
              << "UrbanMetrics turns map layers clipped to an area into amenity statistics and normalized,\n"
              << "confidence-rated urban indices, and imports external indices from delimited text files.\n\n"
              << "MODES:\n\n"
              << "1. ANALYZE MODE (--mode analyze)\n"
              << "   Computes POI metrics (counts, densities, Shannon diversity, data coverage) and the derived\n"
              << "   indices (diversity, green ratio, street connectivity, building density, transit, mixed use,\n"
              << "   walkability, 15-minute city, bike) for one area. With a second area, adds comparisons and\n"
              << "   insights.\n\n"
              << "   Arguments:\n"
              << "     --config <path>             Analysis configuration JSON file, or the options below\n"
              << "     --area-file <path>          GeoJSON area polygon in WGS84\n"
              << "     --layers <list>             Comma-separated layer-id=path pairs\n"
              << "     --area-name <name>          Display name of the area\n"
              << "     --compare-area-file <path>  Second area polygon\n"
              << "     --compare-layers <list>     Layer files of the second area\n"
              << "     --compare-area-name <name>  Display name of the second area\n"
              << "     --output-file <path>        Output JSON file (stdout if omitted)\n\n"
              << "   Known layer ids:\n"
              << "     buildings-residential, buildings-commercial, buildings-industrial, buildings-other,\n"
              << "     roads-primary, roads-residential, bike-lanes, transit-stops, rail-lines, parking,\n"
              << "     traffic-signals, crosswalks, parks, water, trees, poi-food-drink, poi-shopping,\n"
              << "     poi-grocery, poi-health, poi-education, poi-bike-parking, poi-bike-shops\n\n"
              << "   Example:\n"
              << "     " << programName << " --mode analyze --area-file a.geojson --layers transit-stops=stops.geojson --compare-area-file b.geojson --compare-layers transit-stops=stops.geojson\n\n"
              << "2. IMPORT INDEX MODE (--mode import-index)\n"
              << "   Imports an externally produced index keyed by area name, by rounded lat/lon, or by row.\n\n"
              << "   Arguments:\n"
              << "     --input-file <path>         Delimited text file\n"
              << "     --value-column <name>       Numeric value column (required)\n"
              << "     --area-column <name>        Area name or id column\n"
              << "     --lat-column <name>         Latitude column\n"
              << "     --lon-column <name>         Longitude column\n"
              << "     --name <name>               Index name\n"
              << "     --description <text>        Index description\n"
              << "     --unit <unit>               Value unit\n"
              << "     --output-file <path>        Output JSON file (stdout if omitted)\n\n"
              << "   Example:\n"
              << "     " << programName << " --mode import-index --input-file scores.csv --value-column score --area-column area_name\n\n"
              << "INPUT DATASET RECOMMENDATIONS:\n\n"
              << "Coordinate System:\n"
              << "  - GeoJSON input must be WGS84 longitude/latitude\n"
              << "  - Lengths and areas are measured in the UTM zone of the area center\n\n"
              << "Layers:\n"
              << "  - Each layer file holds the geometry class of its layer (points, lines or polygons)\n"
              << "  - Features are clipped to the area before measuring\n\n"
              << "OTHER OPTIONS:\n"
              << "  --help, -h     Show this detailed help message\n"
              << "  --version, -v  Show version information\n";
}

std::unordered_map<std::string, std::string> parseArgs(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);

            // Check if this is a flag argument (no value) or a key-value argument
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                args[key] = argv[i + 1];
                i++;
            } else {
                args[key] = "true";
            }
        } else if (arg == "-h") {
            args["help"] = "true";
        } else if (arg == "-v") {
            args["version"] = "true";
        }
    }

    return args;
}

// Parse "layer-id=path,layer-id=path" into a JSON object
nlohmann::json parseLayerList(const std::string& list) {
    nlohmann::json layers = nlohmann::json::object();
    std::stringstream stream(list);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item.empty()) {
            continue;
        }
        size_t separator = item.find('=');
        if (separator == std::string::npos || separator == 0 || separator + 1 == item.size()) {
            throw std::invalid_argument("Invalid layer entry '" + item + "', expected layer-id=path");
        }
        layers[item.substr(0, separator)] = item.substr(separator + 1);
    }
    return layers;
}

std::string readTextFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

nlohmann::json buildAreaConfig(const std::unordered_map<std::string, std::string>& args,
                               const std::string& prefix, const std::string& default_id) {
    nlohmann::json area = nlohmann::json::object();
    area["id"] = default_id;
    area["area_file"] = args.at(prefix + "area-file");
    if (args.count(prefix + "area-name")) area["name"] = args.at(prefix + "area-name");
    if (args.count(prefix + "layers")) area["layers"] = parseLayerList(args.at(prefix + "layers"));
    return area;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto args = parseArgs(argc, argv);

        // Check for help flag first
        if (args.count("help") > 0) {
            printDetailedHelp(argv[0]);
            return 0;
        }

        // Check for version flag
        if (args.count("version") > 0) {
            std::cout << "UrbanMetrics v1.0.0\n";
            std::cout << "Urban Area Scoring Tool\n";
            return 0;
        }

        if (args.count("mode") == 0) {
            std::cerr << "Error: --mode is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        std::string mode = args.at("mode");

        nlohmann::json writer_config = nlohmann::json::object();
        if (args.count("output-file")) writer_config["output_file_path"] = args.at("output-file");

        std::string result;

        if (mode == "analyze") {
            std::string analysis_config_json;
            if (args.count("config")) {
                analysis_config_json = readTextFile(args.at("config"));
            } else {
                if (args.count("area-file") == 0) {
                    std::cerr << "Error: --config or --area-file is required for analyze mode" << std::endl;
                    printUsage(argv[0]);
                    return 1;
                }

                nlohmann::json analysis_config = nlohmann::json::object();
                analysis_config["areas"] = nlohmann::json::array();
                analysis_config["areas"].push_back(buildAreaConfig(args, "", "area-a"));
                if (args.count("compare-area-file")) {
                    analysis_config["areas"].push_back(buildAreaConfig(args, "compare-", "area-b"));
                }
                analysis_config_json = analysis_config.dump();
            }

            result = processAreaAnalysisTool(writer_config.dump(), analysis_config_json);
        } else if (mode == "import-index") {
            if (args.count("input-file") == 0) {
                std::cerr << "Error: --input-file is required for import-index mode" << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            if (args.count("value-column") == 0) {
                std::cerr << "Error: --value-column is required for import-index mode" << std::endl;
                printUsage(argv[0]);
                return 1;
            }

            nlohmann::json import_config = nlohmann::json::object();
            import_config["file_path"] = args.at("input-file");
            import_config["value_column"] = args.at("value-column");
            if (args.count("area-column")) import_config["area_column"] = args.at("area-column");
            if (args.count("lat-column")) import_config["lat_column"] = args.at("lat-column");
            if (args.count("lon-column")) import_config["lon_column"] = args.at("lon-column");
            if (args.count("name")) import_config["name"] = args.at("name");
            if (args.count("description")) import_config["description"] = args.at("description");
            if (args.count("unit")) import_config["unit"] = args.at("unit");

            result = processIndexImportTool(writer_config.dump(), import_config.dump());
        } else {
            std::cerr << "Error: Unknown mode '" << mode << "'" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        std::cout << result << std::endl;

        // Check if result indicates an error
        if (result.substr(0, 5) == "Error") {
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
