#include "coordinate_converter.h"
#include <cmath>

namespace I3dm::Core::Geo {

glm::dvec3 CoordinateConverter::geographicToEcef(double lon, double lat, double height) {
    double lon_rad = lon * DEG_TO_RAD;
    double lat_rad = lat * DEG_TO_RAD;

    double sinLat = std::sin(lat_rad);
    double cosLat = std::cos(lat_rad);
    double sinLon = std::sin(lon_rad);
    double cosLon = std::cos(lon_rad);

    // Radius of curvature in the prime vertical
    double N = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sinLat * sinLat);

    double x = (N + height) * cosLat * cosLon;
    double y = (N + height) * cosLat * sinLon;
    double z = (N * (1.0 - WGS84_E2) + height) * sinLat;

    return glm::dvec3(x, y, z);
}

void CoordinateConverter::ecefToGeographic(const glm::dvec3& ecef,
                                           double& lon, double& lat, double& height) {
    double x = ecef.x;
    double y = ecef.y;
    double z = ecef.z;

    lon = std::atan2(y, x) * RAD_TO_DEG;

    // Bowring's method for latitude calculation
    double p = std::sqrt(x * x + y * y);
    double theta = std::atan2(z * WGS84_A, p * WGS84_B);

    lat = std::atan2(z + WGS84_EP2 * WGS84_B * std::pow(std::sin(theta), 3),
                     p - WGS84_E2 * WGS84_A * std::pow(std::cos(theta), 3));

    // Iterative refinement for better accuracy
    for (int i = 0; i < 5; ++i) {
        double sinLat = std::sin(lat);
        double N = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sinLat * sinLat);
        double prevLat = lat;
        height = p / std::cos(lat) - N;
        lat = std::atan2(z, p * (1.0 - WGS84_E2 * N / (N + height)));

        if (std::abs(lat - prevLat) < 1e-12) break;
    }

    lat *= RAD_TO_DEG;
}

glm::dvec3 CoordinateConverter::geodeticSurfaceNormal(const glm::dvec3& ecef) {
    glm::dvec3 n(ecef.x / (WGS84_A * WGS84_A),
                 ecef.y / (WGS84_A * WGS84_A),
                 ecef.z / (WGS84_B * WGS84_B));
    return glm::normalize(n);
}

glm::dmat4 CoordinateConverter::eastNorthUpToFixedFrame(const glm::dvec3& ecefOrigin) {
    glm::dmat4 T(1.0);
    T[3] = glm::dvec4(ecefOrigin, 1.0);

    if (std::abs(ecefOrigin.x) < POLE_EPSILON && std::abs(ecefOrigin.y) < POLE_EPSILON) {
        double sign = ecefOrigin.z < 0.0 ? -1.0 : 1.0;
        T[0] = glm::dvec4(0.0, 1.0, 0.0, 0.0);
        T[1] = glm::dvec4(-sign, 0.0, 0.0, 0.0);
        T[2] = glm::dvec4(0.0, 0.0, sign, 0.0);
        return T;
    }

    glm::dvec3 up = geodeticSurfaceNormal(ecefOrigin);
    glm::dvec3 east = glm::normalize(glm::dvec3(-ecefOrigin.y, ecefOrigin.x, 0.0));
    glm::dvec3 north = glm::cross(up, east);

    T[0] = glm::dvec4(east, 0.0);
    T[1] = glm::dvec4(north, 0.0);
    T[2] = glm::dvec4(up, 0.0);
    return T;
}

}
