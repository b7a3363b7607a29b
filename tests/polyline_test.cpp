// Copyright 2022 Eric Fichter
#include <gtest/gtest.h>
#include "Polyline.h"

namespace {

    Polyline two_lines() {
        Polyline P("outline");
        P.add_vertex(0, 0);
        P.add_vertex(10, 0);
        P.add_vertex(10, 5);
        return P;
    }

}

TEST(PolylineTest, OpenPolylineHasOneSegmentLessThanVertices) {
    Polyline P = two_lines();
    EXPECT_EQ(P.number_of_segments(), 2u);

    P.set_closed(true);
    EXPECT_EQ(P.number_of_segments(), 3u);
    EXPECT_DOUBLE_EQ(P.end_of_segment(2).point.X(), 0);
    EXPECT_DOUBLE_EQ(P.end_of_segment(2).point.Y(), 0);
}

TEST(PolylineTest, SegmentOutOfRangeThrows) {
    Polyline P = two_lines();
    EXPECT_THROW(P.segment_type_at(2), std::out_of_range);
}

TEST(PolylineTest, SegmentClassification) {
    Polyline P("mixed");
    P.add_vertex(0, 0);
    P.add_vertex(4, 0, 0.5);
    P.add_vertex(8, 0);
    P.add_vertex(8, 0);

    EXPECT_EQ(P.segment_type_at(0), SEGMENT_LINE);
    EXPECT_EQ(P.segment_type_at(1), SEGMENT_ARC);
    EXPECT_EQ(P.segment_type_at(2), SEGMENT_COINCIDENT);
}

TEST(ExtractorTest, TwoLineSegmentsBecomeTwoWalls) {
    std::ostringstream log;
    auto results = Extractor().extract(two_lines(), log);

    ASSERT_EQ(results.size(), 2u);
    ASSERT_TRUE(results[0].is_wall());
    ASSERT_TRUE(results[1].is_wall());

    const WallParameters &A = results[0].wall;
    EXPECT_NEAR(A.pos_x, 5, 1e-9);
    EXPECT_NEAR(A.pos_y, 0, 1e-9);
    EXPECT_NEAR(A.dir_x, 1, 1e-9);
    EXPECT_NEAR(A.dir_y, 0, 1e-9);
    EXPECT_DOUBLE_EQ(A.dir_z, 0);
    EXPECT_NEAR(A.length, 10, 1e-9);
    EXPECT_DOUBLE_EQ(A.width, 0.5);
    EXPECT_DOUBLE_EQ(A.height, 2);

    const WallParameters &B = results[1].wall;
    EXPECT_NEAR(B.pos_x, 10, 1e-9);
    EXPECT_NEAR(B.pos_y, 2.5, 1e-9);
    EXPECT_NEAR(B.dir_x, 0, 1e-9);
    EXPECT_NEAR(B.dir_y, 1, 1e-9);
    EXPECT_NEAR(B.length, 5, 1e-9);

    EXPECT_TRUE(log.str().empty());
}

TEST(ExtractorTest, DefaultsAndPolylineOverrides) {
    Polyline P = two_lines();
    std::ostringstream log;

    auto results = Extractor(WallDefaults(0.3, 2.8)).extract(P, log);
    EXPECT_DOUBLE_EQ(results[0].wall.width, 0.3);
    EXPECT_DOUBLE_EQ(results[0].wall.height, 2.8);

    P.width = 0.24;
    results = Extractor(WallDefaults(0.3, 2.8)).extract(P, log);
    EXPECT_DOUBLE_EQ(results[0].wall.width, 0.24);
    EXPECT_DOUBLE_EQ(results[0].wall.height, 2.8);
}

TEST(ExtractorTest, ArcSegmentIsSkippedWithDiagnostic) {
    Polyline P("semicircle");
    P.add_vertex(PolylineVertex(0, 0, 1, 0.1, 0.2));
    P.add_vertex(2, 0);

    std::ostringstream log;
    auto results = Extractor().extract(P, log);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].type, SEGMENT_ARC);
    EXPECT_EQ(results[0].status, SEGMENT_SKIPPED);
    EXPECT_EQ(results[0].reason, SKIP_ARC_SEGMENT);
    EXPECT_NEAR(results[0].arc.radius, 1, 1e-9);
    EXPECT_NEAR(results[0].arc.center.X(), 1, 1e-9);
    EXPECT_NEAR(results[0].arc.center.Y(), 0, 1e-9);

    EXPECT_NE(log.str().find("Segment 0 - Arc -"), std::string::npos);
    EXPECT_NE(log.str().find("Radius:"), std::string::npos);
    EXPECT_NE(log.str().find("Start width:  0.1"), std::string::npos);
}

TEST(ExtractorTest, ArcCenterLiesLeftOfChordForCounterClockwiseBulge) {
    // quarter circle, bulge = tan(90 deg / 4)
    double b = std::tan(M_PI / 8);
    ArcGeometry arc = Extractor::arc_geometry(gp_Pnt2d(1, 0), gp_Pnt2d(0, 1), b);

    EXPECT_NEAR(arc.radius, 1, 1e-9);
    EXPECT_NEAR(arc.center.X(), 0, 1e-9);
    EXPECT_NEAR(arc.center.Y(), 0, 1e-9);
}

TEST(ExtractorTest, CoincidentSegmentIsSkippedWithDiagnostic) {
    Polyline P("dot");
    P.add_vertex(3, 3);
    P.add_vertex(3, 3);

    std::ostringstream log;
    auto results = Extractor().extract(P, log);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].reason, SKIP_COINCIDENT_SEGMENT);
    EXPECT_NE(log.str().find("Segment 0 : zero length segment"), std::string::npos);
}

TEST(ExtractorTest, OnlyArcsAndDegenerateSegmentsGiveNoWalls) {
    Polyline P("curves");
    P.add_vertex(0, 0, 0.3);
    P.add_vertex(5, 0, -0.7);
    P.add_vertex(5, 5);
    P.add_vertex(5, 5);

    std::ostringstream log;
    auto results = Extractor().extract(P, log);

    ASSERT_EQ(results.size(), 3u);
    for (const auto &r: results)
        EXPECT_FALSE(r.is_wall());
}
