#include <gtest/gtest.h>
#include "core/coordinate/coordinate_converter.h"
#include "utils/test_helpers.h"
#include <cmath>

using namespace I3dm::Core::Geo;
using namespace I3dm::Test;

class CoordinateConverterTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(CoordinateConverterTest, GeographicToEcef_EquatorPrimeMeridian) {
    // Origin (0°, 0°, 0m) - should be on X axis at equator radius
    auto ecef = CoordinateConverter::geographicToEcef(0.0, 0.0, 0.0);

    EXPECT_NEAR(ecef.x, 6378137.0, 0.1);  // WGS84 semi-major axis
    EXPECT_NEAR(ecef.y, 0.0, 0.1);
    EXPECT_NEAR(ecef.z, 0.0, 0.1);
}

TEST_F(CoordinateConverterTest, GeographicToEcef_NorthPole) {
    auto ecef = CoordinateConverter::geographicToEcef(0.0, 90.0, 0.0);

    EXPECT_NEAR(ecef.x, 0.0, 0.1);
    EXPECT_NEAR(ecef.y, 0.0, 0.1);
    EXPECT_NEAR(ecef.z, 6356752.3, 0.1);  // WGS84 semi-minor axis
}

TEST_F(CoordinateConverterTest, RoundTripConversion) {
    double origLon = -75.61209431;
    double origLat = 40.04253061;
    double origHeight = 100.0;

    auto ecef = CoordinateConverter::geographicToEcef(origLon, origLat, origHeight);

    double outLon, outLat, outHeight;
    CoordinateConverter::ecefToGeographic(ecef, outLon, outLat, outHeight);

    EXPECT_NEAR(origLon, outLon, 1e-6);
    EXPECT_NEAR(origLat, outLat, 1e-6);
    EXPECT_NEAR(origHeight, outHeight, 1e-3);
}

TEST_F(CoordinateConverterTest, SurfaceNormalIsGeodeticUp) {
    auto ecef = CoordinateConverter::geographicToEcef(10.0, 45.0, 0.0);
    auto normal = CoordinateConverter::geodeticSurfaceNormal(ecef);
    EXPECT_TRUE(vec3Near(normal, enuFrameAt(10.0, 45.0)[2], 1e-12));
}

TEST_F(CoordinateConverterTest, EastNorthUpMatchesGeographicFrame) {
    double lon = -75.6;
    double lat = 40.0;
    double height = 0.0;
    auto ecef = CoordinateConverter::geographicToEcef(lon, lat, height);

    auto fromEcef = CoordinateConverter::eastNorthUpToFixedFrame(ecef);

    EXPECT_TRUE(isRotation(glm::dmat3(fromEcef), 1e-10));
    EXPECT_TRUE(rotationNear(glm::dmat3(fromEcef), enuFrameAt(lon, lat), 1e-9));
    EXPECT_TRUE(vec3Near(glm::dvec3(fromEcef[3]), ecef, 1e-6));
}

TEST_F(CoordinateConverterTest, EastNorthUpAtPoles) {
    auto north = CoordinateConverter::eastNorthUpToFixedFrame(glm::dvec3(0.0, 0.0, 6356752.3));
    EXPECT_TRUE(vec3Near(glm::dvec3(north[0]), glm::dvec3(0.0, 1.0, 0.0), 1e-12));
    EXPECT_TRUE(vec3Near(glm::dvec3(north[1]), glm::dvec3(-1.0, 0.0, 0.0), 1e-12));
    EXPECT_TRUE(vec3Near(glm::dvec3(north[2]), glm::dvec3(0.0, 0.0, 1.0), 1e-12));

    auto south = CoordinateConverter::eastNorthUpToFixedFrame(glm::dvec3(0.0, 0.0, -6356752.3));
    EXPECT_TRUE(vec3Near(glm::dvec3(south[2]), glm::dvec3(0.0, 0.0, -1.0), 1e-12));
    EXPECT_TRUE(isRotation(glm::dmat3(south), 1e-12));
}

TEST_F(CoordinateConverterTest, EastNorthUpAtEarthCenter) {
    auto frame = CoordinateConverter::eastNorthUpToFixedFrame(glm::dvec3(0.0));
    EXPECT_TRUE(isRotation(glm::dmat3(frame), 1e-12));
}
