// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0

#include "geometry.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <ogr_geometry.h>
#include <ogr_spatialref.h>

#include <gtest/gtest.h>

namespace icestac {

using test::rectangle;

TEST(EnvelopeTest, DisjointRectanglesGiveTheirCommonBounds) {
    std::string envelope = envelopeOf({rectangle(0, 0, 1, 1), rectangle(2, 2, 3, 3)});

    BBox bounds = boundsOf(envelope);
    EXPECT_DOUBLE_EQ(bounds[0], 0.0);
    EXPECT_DOUBLE_EQ(bounds[1], 0.0);
    EXPECT_DOUBLE_EQ(bounds[2], 3.0);
    EXPECT_DOUBLE_EQ(bounds[3], 3.0);
}

TEST(EnvelopeTest, ResultIsAClosedRectanglePolygon) {
    const std::string triangle =
        R"({"type":"Polygon","coordinates":[[[-10,60],[5,85],[20,62],[-10,60]]]})";
    std::string envelope = envelopeOf({triangle});

    OGRGeometryUniquePtr geometry(OGRGeometryFactory::createFromGeoJson(envelope.c_str()));
    ASSERT_NE(geometry, nullptr);
    ASSERT_EQ(wkbFlatten(geometry->getGeometryType()), wkbPolygon);

    const OGRLinearRing* ring = geometry->toPolygon()->getExteriorRing();
    ASSERT_EQ(ring->getNumPoints(), 5);
    EXPECT_DOUBLE_EQ(ring->getX(0), -10.0);
    EXPECT_DOUBLE_EQ(ring->getY(0), 60.0);
    EXPECT_DOUBLE_EQ(ring->getX(2), 20.0);
    EXPECT_DOUBLE_EQ(ring->getY(2), 85.0);
    EXPECT_DOUBLE_EQ(ring->getX(4), ring->getX(0));
    EXPECT_DOUBLE_EQ(ring->getY(4), ring->getY(0));
}

TEST(EnvelopeTest, OverlappingShapesAreUnionedFirst) {
    std::string envelope = envelopeOf({rectangle(0, 0, 2, 2), rectangle(1, 1, 4, 3),
                                       rectangle(-1, 0.5, 0.5, 1)});
    BBox bounds = boundsOf(envelope);
    EXPECT_DOUBLE_EQ(bounds[0], -1.0);
    EXPECT_DOUBLE_EQ(bounds[1], 0.0);
    EXPECT_DOUBLE_EQ(bounds[2], 4.0);
    EXPECT_DOUBLE_EQ(bounds[3], 3.0);
}

TEST(EnvelopeTest, EnvelopeOfAnEnvelopeIsUnchanged) {
    std::string once = envelopeOf({rectangle(-44.25, 59.125, -20.5, 83.75)});
    EXPECT_EQ(envelopeOf({once}), once);
}

TEST(EnvelopeTest, SinglePointGivesDegenerateRectangle) {
    BBox bounds = boundsOf(envelopeOf({R"({"type":"Point","coordinates":[1,2]})"}));
    EXPECT_DOUBLE_EQ(bounds[0], 1.0);
    EXPECT_DOUBLE_EQ(bounds[1], 2.0);
    EXPECT_DOUBLE_EQ(bounds[2], 1.0);
    EXPECT_DOUBLE_EQ(bounds[3], 2.0);
}

TEST(EnvelopeTest, DegenerateRectangleIsAValidInput) {
    std::string point = envelopeOf({R"({"type":"Point","coordinates":[1,2]})"});
    EXPECT_EQ(envelopeOf({point}), point);

    std::string line = envelopeOf({R"({"type":"LineString","coordinates":[[0,5],[4,5]]})"});
    EXPECT_EQ(envelopeOf({line}), line);
    EXPECT_EQ(boundsOf(envelopeOf({line, point})), (BBox{0, 2, 4, 5}));
    EXPECT_EQ(boundsOf(envelopeOf({point, rectangle(5, 5, 6, 6)})), (BBox{1, 2, 6, 6}));
}

TEST(EnvelopeTest, EmptyGeometriesAreRejected) {
    EXPECT_THROW(envelopeOf({std::string(R"({"type":"Polygon","coordinates":[]})")}), InvalidInput);
}

TEST(EnvelopeTest, EmptyInputIsRejected) {
    EXPECT_THROW(envelopeOf(std::vector<std::string>{}), InvalidInput);
    EXPECT_THROW(envelopeOf(std::vector<const OGRGeometry*>{}), InvalidInput);
}

TEST(EnvelopeTest, UnreadableGeometryIsRejected) {
    EXPECT_THROW(envelopeOf({std::string("not a geometry")}), InvalidInput);
}

TEST(EnvelopeTest, MixedReferenceFramesAreRejected) {
    OGRSpatialReference polarStereo;
    ASSERT_EQ(polarStereo.importFromEPSG(3413), OGRERR_NONE);

    OGRPoint lonLat(10.0, 70.0);
    OGRPoint projected(100000.0, -2000000.0);
    projected.assignSpatialReference(&polarStereo);

    EXPECT_THROW(envelopeOf(std::vector<const OGRGeometry*>{&lonLat, &projected}), InvalidInput);
    projected.assignSpatialReference(nullptr);
}

TEST(EnvelopeTest, ReprojectedGeometriesShareTheCatalogFrame) {
    OGRSpatialReference webMercator;
    ASSERT_EQ(webMercator.importFromEPSG(3857), OGRERR_NONE);
    webMercator.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    OGRPoint projected(0.0, 0.0);
    projected.assignSpatialReference(&webMercator);
    ASSERT_TRUE(transformToWgs84(projected));
    EXPECT_NEAR(projected.getX(), 0.0, 1e-9);
    EXPECT_NEAR(projected.getY(), 0.0, 1e-9);

    OGRPoint lonLat(10.0, 10.0);
    BBox bounds = boundsOf(envelopeOf(std::vector<const OGRGeometry*>{&projected, &lonLat}));
    EXPECT_NEAR(bounds[0], 0.0, 1e-9);
    EXPECT_NEAR(bounds[3], 10.0, 1e-9);
    projected.assignSpatialReference(nullptr);
}

TEST(BoundsTest, EmptyGeometryIsRejected) {
    EXPECT_THROW(boundsOf(R"({"type":"Polygon","coordinates":[]})"), InvalidInput);
}

} // namespace icestac
