#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "io/geojson_reader.hpp"
#include "io/layer_reader.hpp"

namespace {

using urbanmetrics::geo::GeospatialDataset;
using urbanmetrics::io::GeoJSONReader;
using urbanmetrics::io::LayerReader;
using urbanmetrics::io::LayerReaderConfig;
using urbanmetrics::metrics::AreaContext;

struct TestCase {
    const char* name;
    const char* intent;
    std::function<bool(void)> run;
};

// Ground distance of 0.01 degree at the equator, in metres
constexpr double DEGREE_STEP_M = 1113.0;

bool within_percent(double value, double expected, double percent) {
    return std::abs(value - expected) <= std::abs(expected) * percent / 100.0;
}

// A 0.01 x 0.01 degree square on the equator, centred on the UTM zone 31 meridian
GeospatialDataset make_area() {
    return GeoJSONReader::readFromString(R"({
        "type": "FeatureCollection",
        "features": [{
            "type": "Feature",
            "properties": {"name": "Test Square"},
            "geometry": {"type": "Polygon", "coordinates": [[
                [2.995, 0.0], [3.005, 0.0], [3.005, 0.01], [2.995, 0.01], [2.995, 0.0]
            ]]}
        }]
    })");
}

// Intent: The area is measured in the UTM zone of its center and keeps its name.
bool test_area_measurement() {
    LayerReader reader(LayerReaderConfig{});
    if (!reader.setArea(make_area())) {
        return false;
    }
    double expected_km2 = (DEGREE_STEP_M / 1000.0) * (1106.0 / 1000.0);
    return reader.getUTMEPSG() == 32631 &&
           reader.getAreaName() == "Test Square" &&
           within_percent(reader.getAreaKm2(), expected_km2, 2.0) &&
           reader.getAreaPolygon().size() == 1;
}

// Intent: Points are counted only when they fall inside the area.
bool test_point_layer_clipping() {
    LayerReader reader(LayerReaderConfig{});
    reader.setArea(make_area());
    GeospatialDataset stops = GeoJSONReader::readFromString(R"({
        "type": "FeatureCollection",
        "features": [
            {"type": "Feature", "properties": {}, "geometry": {"type": "Point", "coordinates": [3.0, 0.005]}},
            {"type": "Feature", "properties": {}, "geometry": {"type": "Point", "coordinates": [3.001, 0.002]}},
            {"type": "Feature", "properties": {}, "geometry": {"type": "Point", "coordinates": [3.02, 0.005]}},
            {"type": "Feature", "properties": {}, "geometry": {"type": "LineString", "coordinates": [[3.0, 0.001], [3.001, 0.001]]}}
        ]
    })");
    bool stored = reader.addLayer("transit-stops", stops);
    return stored && reader.getLayerStats().featureCount("transit-stops") == 2;
}

// Intent: Lines crossing the boundary contribute only their inside length.
bool test_line_layer_clipping() {
    LayerReader reader(LayerReaderConfig{});
    reader.setArea(make_area());
    GeospatialDataset roads = GeoJSONReader::readFromString(R"({
        "type": "FeatureCollection",
        "features": [
            {"type": "Feature", "properties": {}, "geometry": {"type": "LineString", "coordinates": [[2.98, 0.005], [3.02, 0.005]]}},
            {"type": "Feature", "properties": {}, "geometry": {"type": "LineString", "coordinates": [[3.1, 0.005], [3.2, 0.005]]}}
        ]
    })");
    reader.addLayer("roads-residential", roads);
    const auto& layers = reader.getLayerStats();
    return layers.featureCount("roads-residential") == 1 &&
           within_percent(layers.totalLengthM("roads-residential"), DEGREE_STEP_M, 2.0);
}

// Intent: Polygons are clipped to the area before their area is summed.
bool test_polygon_layer_clipping() {
    LayerReader reader(LayerReaderConfig{});
    reader.setArea(make_area());
    GeospatialDataset parks = GeoJSONReader::readFromString(R"({
        "type": "FeatureCollection",
        "features": [
            {"type": "Feature", "properties": {}, "geometry": {"type": "Polygon", "coordinates": [[
                [3.0, 0.0], [3.015, 0.0], [3.015, 0.01], [3.0, 0.01], [3.0, 0.0]
            ]]}}
        ]
    })");
    reader.addLayer("parks", parks);
    double half_area_m2 = reader.getAreaKm2() * 1000000.0 / 2.0;
    return reader.getLayerStats().featureCount("parks") == 1 &&
           within_percent(reader.getLayerStats().totalAreaM2("parks"), half_area_m2, 1.0);
}

// Intent: Layers cannot be added before an area is set or under an unknown id.
bool test_add_layer_rejections() {
    LayerReader reader(LayerReaderConfig{});
    GeospatialDataset empty = GeoJSONReader::readFromString(R"({"type": "FeatureCollection", "features": []})");
    bool rejected_without_area = !reader.addLayer("parks", empty);
    reader.setArea(make_area());
    bool rejected_unknown = !reader.addLayer("poi-nightlife", empty);
    bool accepted_empty = reader.addLayer("parks", empty);
    return rejected_without_area && rejected_unknown && accepted_empty &&
           reader.getLayerStats().size() == 1 &&
           !reader.getLayerStats().hasData("parks");
}

// Intent: An area dataset without polygons is refused.
bool test_area_without_polygon() {
    LayerReader reader(LayerReaderConfig{});
    GeospatialDataset points = GeoJSONReader::readFromString(R"({
        "type": "FeatureCollection",
        "features": [{"type": "Feature", "properties": {}, "geometry": {"type": "Point", "coordinates": [3.0, 0.0]}}]
    })");
    return !reader.setArea(points) && reader.getAreaKm2() == 0.0 && reader.getUTMEPSG() == 0;
}

// Intent: The area context carries the WGS84 polygon, the size and the clipped layers.
bool test_build_area_context() {
    LayerReader reader(LayerReaderConfig{});
    reader.setArea(make_area());
    reader.addLayer("poi-food-drink", GeoJSONReader::readFromString(R"({
        "type": "FeatureCollection",
        "features": [{"type": "Feature", "properties": {}, "geometry": {"type": "Point", "coordinates": [3.0, 0.005]}}]
    })"));
    AreaContext context = reader.buildAreaContext();
    return context.area_km2 == reader.getAreaKm2() &&
           context.polygon.size() == 1 &&
           context.layers.featureCount("poi-food-drink") == 1;
}

// Intent: Reading from files fails loudly when the area file is missing.
bool test_read_missing_area_file() {
    LayerReaderConfig config;
    config.area_file_path = "/nonexistent/urbanmetrics/area.geojson";
    LayerReader reader(config);
    try {
        reader.read();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    const std::vector<TestCase> tests = {
        {"LayerReader_AreaMeasurement", "UTM area size and name", test_area_measurement},
        {"LayerReader_PointClipping", "Points inside counted", test_point_layer_clipping},
        {"LayerReader_LineClipping", "Inside length only", test_line_layer_clipping},
        {"LayerReader_PolygonClipping", "Clipped polygon area", test_polygon_layer_clipping},
        {"LayerReader_AddLayerRejections", "No area or unknown id rejected", test_add_layer_rejections},
        {"LayerReader_AreaWithoutPolygon", "Point-only area refused", test_area_without_polygon},
        {"LayerReader_BuildAreaContext", "Context from reader state", test_build_area_context},
        {"LayerReader_MissingAreaFile", "Missing area file throws", test_read_missing_area_file},
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
        std::cerr << "layer reader tests failed\n";
        return 1;
    }

    std::cout << "layer reader tests passed (" << tests.size() << " cases)\n";
    return 0;
}
