#ifndef URBANMETRICS_COORDINATE_SYSTEM_UTILS_HPP
#define URBANMETRICS_COORDINATE_SYSTEM_UTILS_HPP

#include <string>
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>
#include "geo/common.hpp"

namespace urbanmetrics {
namespace geo {

/**
 * Coordinate system utility functions for UTM reprojection of WGS84 input
 */
class CoordinateSystemUtils {
public:
    /**
     * Determine UTM zone from longitude coordinate
     * @param longitude Longitude in degrees
     * @return UTM zone number (1-60)
     */
    static int determineUTMZone(double longitude);

    /**
     * Determine UTM EPSG code from longitude and latitude
     * @param longitude Longitude in degrees
     * @param latitude Latitude in degrees
     * @return EPSG code for UTM zone (326xx for northern, 327xx for southern)
     */
    static int determineUTMEPSG(double longitude, double latitude);

    /**
     * Get the center of the bounding box of a lon/lat geometry
     * @param geometry Geometry in WGS84
     * @param center_x Output center longitude
     * @param center_y Output center latitude
     * @return true if successful, false for empty geometry
     */
    static bool getGeometryCenter(const MultiPolygon& geometry, double& center_x, double& center_y);

    /**
     * Create coordinate transformation from WGS84 (EPSG:4326) to a UTM zone
     * @param target_epsg Target EPSG code for UTM zone
     * @return Coordinate transformation handle (caller owns the handle), nullptr on failure
     */
    static OGRCoordinateTransformationH createUTMTransformation(int target_epsg);

    /**
     * Check whether a GeoJSON CRS string denotes WGS84 longitude/latitude
     * @param crs CRS string from the GeoJSON "crs" member (empty means default WGS84)
     */
    static bool isWGS84(const std::string& crs);

private:
    // Disable instantiation
    CoordinateSystemUtils() = delete;
};

} // namespace geo
} // namespace urbanmetrics

#endif // URBANMETRICS_COORDINATE_SYSTEM_UTILS_HPP
