#include "geo/coordinate_system_utils.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>
#include <iostream>

namespace urbanmetrics {
namespace geo {

int CoordinateSystemUtils::determineUTMZone(double longitude) {
    // UTM zones are 6 degrees wide, starting from -180
    int zone = static_cast<int>((longitude + 180.0) / 6.0) + 1;

    // Ensure zone is within valid range
    if (zone < 1) zone = 1;
    if (zone > 60) zone = 60;

    return zone;
}

int CoordinateSystemUtils::determineUTMEPSG(double longitude, double latitude) {
    int zone = determineUTMZone(longitude);

    if (latitude >= 0) {
        // Northern hemisphere: EPSG 326xx
        return 32600 + zone;
    } else {
        // Southern hemisphere: EPSG 327xx
        return 32700 + zone;
    }
}

bool CoordinateSystemUtils::getGeometryCenter(const MultiPolygon& geometry, double& center_x, double& center_y) {
    if (geometry.empty() || bg::is_empty(geometry)) {
        return false;
    }

    Box extent;
    bg::envelope(geometry, extent);

    center_x = (bg::get<bg::min_corner, 0>(extent) + bg::get<bg::max_corner, 0>(extent)) / 2.0;
    center_y = (bg::get<bg::min_corner, 1>(extent) + bg::get<bg::max_corner, 1>(extent)) / 2.0;

    return true;
}

OGRCoordinateTransformationH CoordinateSystemUtils::createUTMTransformation(int target_epsg) {
    OGRSpatialReferenceH source_srs = OSRNewSpatialReference(nullptr);
    if (OSRImportFromEPSG(source_srs, 4326) != OGRERR_NONE) {
        OSRDestroySpatialReference(source_srs);
        return nullptr;
    }

    // Create target spatial reference
    OGRSpatialReferenceH target_srs = OSRNewSpatialReference(nullptr);
    if (OSRImportFromEPSG(target_srs, target_epsg) != OGRERR_NONE) {
        OSRDestroySpatialReference(source_srs);
        OSRDestroySpatialReference(target_srs);
        return nullptr;
    }

    // GeoJSON coordinates are [lon, lat]
    OSRSetAxisMappingStrategy(source_srs, OAMS_TRADITIONAL_GIS_ORDER);
    OSRSetAxisMappingStrategy(target_srs, OAMS_TRADITIONAL_GIS_ORDER);

    OGRCoordinateTransformationH coord_trans = OCTNewCoordinateTransformation(source_srs, target_srs);

    OSRDestroySpatialReference(source_srs);
    OSRDestroySpatialReference(target_srs);

    if (!coord_trans) {
        std::cerr << "Error: Failed to create coordinate transformation from EPSG:4326 to EPSG:"
                  << target_epsg << std::endl;
    }

    return coord_trans;
}

bool CoordinateSystemUtils::isWGS84(const std::string& crs) {
    if (crs.empty()) {
        return true;
    }
    return crs.find("EPSG::4326") != std::string::npos ||
           crs.find("EPSG:4326") != std::string::npos ||
           crs.find("CRS84") != std::string::npos;
}

} // namespace geo
} // namespace urbanmetrics
