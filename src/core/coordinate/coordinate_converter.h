#pragma once

#include <glm/glm.hpp>

namespace I3dm::Core::Geo {

/**
 * WGS84 ellipsoid conversions between geographic, ECEF and local ENU frames.
 */
class CoordinateConverter {
public:
    // ========== WGS84 Constants ==========
    static constexpr double WGS84_A = 6378137.0;                    // Semi-major axis (m)
    static constexpr double WGS84_F = 1.0 / 298.257223563;         // Flattening
    static constexpr double WGS84_E2 = WGS84_F * (2.0 - WGS84_F);  // First eccentricity squared
    static constexpr double WGS84_B = WGS84_A * (1.0 - WGS84_F);   // Semi-minor axis (m)
    static constexpr double WGS84_EP2 = (WGS84_A * WGS84_A - WGS84_B * WGS84_B) / (WGS84_B * WGS84_B);  // Second eccentricity squared

    static constexpr double PI = 3.14159265358979323846;
    static constexpr double DEG_TO_RAD = PI / 180.0;
    static constexpr double RAD_TO_DEG = 180.0 / PI;

    // Positions closer than this to the polar axis use the pole frame
    static constexpr double POLE_EPSILON = 1e-14;

    /**
     * Convert geographic coordinates (WGS84) to ECEF.
     *
     * @param lon Longitude in degrees
     * @param lat Latitude in degrees
     * @param height Height in meters above ellipsoid
     * @return ECEF coordinates (X, Y, Z) in meters
     */
    static glm::dvec3 geographicToEcef(double lon, double lat, double height);

    /**
     * Convert ECEF coordinates to geographic (WGS84).
     *
     * @param ecef ECEF coordinates (X, Y, Z) in meters
     * @param lon Output longitude in degrees
     * @param lat Output latitude in degrees
     * @param height Output height in meters
     */
    static void ecefToGeographic(const glm::dvec3& ecef,
                                 double& lon, double& lat, double& height);

    /**
     * Unit normal of the WGS84 ellipsoid surface through an ECEF point.
     */
    static glm::dvec3 geodeticSurfaceNormal(const glm::dvec3& ecef);

    /**
     * East-north-up frame at an ECEF origin, expressed in ECEF.
     *
     * Columns are east, north, up and the origin. On the polar axis east is +Y
     * and up follows the sign of Z (+Z at the earth center).
     */
    static glm::dmat4 eastNorthUpToFixedFrame(const glm::dvec3& ecefOrigin);
};

}
