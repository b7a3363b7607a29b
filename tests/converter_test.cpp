// Copyright 2022 Eric Fichter
#include <gtest/gtest.h>
#include "Converter.h"
#include "InputReader.h"
#include "TempDir.h"

namespace {

    const char *input_json = R"({
  "project": "Converted",
  "credentials": { "applicationName": "Test application", "editorsGivenName": "Ada" },
  "building": "Main building",
  "storey": { "name": "Level 0", "elevation": 0 },
  "polylines": [
    { "name": "outline",
      "vertices": [ { "x": 0, "y": 0 }, { "x": 10, "y": 0 }, { "x": 10, "y": 5 } ] },
    { "name": "curved", "width": 0.25,
      "vertices": [ { "x": 0, "y": 10, "bulge": 1, "startWidth": 0.1, "endWidth": 0.1 }, { "x": 2, "y": 10 }, { "x": 2, "y": 10 } ] }
  ]
})";

    const char *room_json = R"({
  "polylines": [
    { "name": "room", "closed": true, "width": 300, "height": 2800,
      "vertices": [ { "x": 0, "y": 0 }, { "x": 4000, "y": 0 }, { "x": 4000, "y": 3000 }, { "x": 0, "y": 3000 } ] }
  ]
})";

    const char *skipped_json = R"({
  "polylines": [
    { "name": "arcs", "vertices": [ { "x": 0, "y": 0, "bulge": 1 }, { "x": 2, "y": 0, "bulge": -0.5 }, { "x": 4, "y": 0 } ] },
    { "name": "point", "vertices": [ { "x": 1, "y": 1 }, { "x": 1, "y": 1 } ] }
  ]
})";

    size_t number_of_entities(const Model &model) {
        return (size_t) std::distance(model.file()->begin(), model.file()->end());
    }

    void write(const std::string &path, const std::string &content) {
        std::ofstream f(path);
        f << content;
    }

    std::unique_ptr<Converter> make_converter(const std::string &input, const std::string &output, bool create_spaces = false) {
        return std::unique_ptr<Converter>(new Converter(input, output, 1, boost::none, PLINE2IFC_DEFAULT_BUILDING, PLINE2IFC_DEFAULT_STOREY, 0, WallDefaults(), create_spaces, false, false, false));
    }

}

TEST(InputReaderTest, ParsesProjectCredentialsAndPolylines) {
    std::istringstream is(input_json);
    InputData D = InputReader::parse(is);

    ASSERT_TRUE(D.project);
    EXPECT_EQ(*D.project, "Converted");
    ASSERT_TRUE(D.credentials);
    EXPECT_EQ(D.credentials->application_name, "Test application");
    EXPECT_EQ(D.credentials->editors_given_name, "Ada");
    EXPECT_EQ(D.credentials->application_id, PLINE2IFC_NAME); // not given, default kept
    EXPECT_EQ(*D.building, "Main building");
    EXPECT_EQ(*D.storey, "Level 0");
    EXPECT_DOUBLE_EQ(*D.elevation, 0);

    ASSERT_EQ(D.polylines.size(), 2u);
    const Polyline &outline = D.polylines.front();
    EXPECT_EQ(outline.get_name(), "outline");
    EXPECT_FALSE(outline.is_closed());
    EXPECT_FALSE(outline.width);
    EXPECT_EQ(outline.get_vertices().size(), 3u);

    const Polyline &curved = D.polylines.back();
    ASSERT_TRUE(curved.width);
    EXPECT_DOUBLE_EQ(*curved.width, 0.25);
    EXPECT_DOUBLE_EQ(curved.get_vertices()[0].bulge, 1);
    EXPECT_DOUBLE_EQ(curved.get_vertices()[0].start_width, 0.1);
}

TEST(InputReaderTest, MissingOptionalKeysAreUnset) {
    std::istringstream is(R"({ "polylines": [ { "vertices": [ { "x": 0, "y": 0 }, { "x": 1, "y": 0 } ] } ] })");
    InputData D = InputReader::parse(is);

    EXPECT_FALSE(D.project);
    EXPECT_FALSE(D.credentials);
    EXPECT_FALSE(D.storey);
    ASSERT_EQ(D.polylines.size(), 1u);
    EXPECT_EQ(D.polylines.front().get_name(), "Polyline 0");
}

TEST(InputReaderTest, InvalidInputThrowsInputError) {
    std::istringstream malformed("{ \"polylines\": [ ");
    EXPECT_THROW(InputReader::parse(malformed), InputError);

    std::istringstream missing_coordinate(R"({ "polylines": [ { "vertices": [ { "x": 0 }, { "x": 1, "y": 0 } ] } ] })");
    EXPECT_THROW(InputReader::parse(missing_coordinate), InputError);

    std::istringstream no_vertices(R"({ "polylines": [ { "name": "empty" } ] })");
    EXPECT_THROW(InputReader::parse(no_vertices), InputError);

    std::istringstream single_vertex(R"({ "polylines": [ { "vertices": [ { "x": 0, "y": 0 } ] } ] })");
    EXPECT_THROW(InputReader::parse(single_vertex), InputError);

    EXPECT_THROW(InputReader::read("/nonexistent/input.json"), InputError);
}

TEST(ConverterTest, LineSegmentsBecomeWallsInOneStorey) {
    TempDir dir;
    write(dir.file("input.json"), input_json);

    auto C = make_converter(dir.file("input.json"), dir.file("output.ifc"));
    EXPECT_TRUE(C->run());

    EXPECT_EQ(C->get_walls_created(), 2u);
    EXPECT_EQ(C->get_segments_skipped(), 2u); // one arc, one zero length segment
    EXPECT_EQ(C->get_segments_failed(), 0u);
    EXPECT_TRUE(C->get_report().written);
    EXPECT_TRUE(boost::filesystem::exists(dir.file("output.ifc")));

    Model *model = C->get_model();
    ASSERT_NE(model, nullptr);
    EXPECT_EQ(model->project_name(), "Converted");
    EXPECT_EQ(model->credentials().application_name, "Test application");
    ASSERT_EQ(model->storeys()->size(), 1u);
    EXPECT_EQ(model->first_storey()->Name(), "Level 0");
    EXPECT_EQ((*model->buildings()->begin())->Name(), "Main building");

    auto containment = ice::containment_of<IfcSchema>(model->file(), model->first_storey());
    ASSERT_NE(containment, nullptr);
    EXPECT_EQ(containment->RelatedElements()->size(), 2u);
}

TEST(ConverterTest, ClosedPolylineCreatesSpace) {
    TempDir dir;
    write(dir.file("room.json"), room_json);

    auto C = make_converter(dir.file("room.json"), dir.file("room.ifc"), true);
    EXPECT_TRUE(C->run());

    EXPECT_EQ(C->get_walls_created(), 4u);
    EXPECT_EQ(C->get_spaces_created(), 1u);
    EXPECT_EQ(C->get_model()->project_name(), PLINE2IFC_DEFAULT_PROJECT);
    EXPECT_EQ(ice::instances<IfcSchema::IfcRelSpaceBoundary>(C->get_model()->file())->size(), 4u);
}

TEST(ConverterTest, ExistingOutputIsNotOverwritten) {
    TempDir dir;
    write(dir.file("room.json"), room_json);
    write(dir.file("room.ifc"), "keep");

    auto C = make_converter(dir.file("room.json"), dir.file("room.ifc"));
    EXPECT_FALSE(C->run());

    std::ifstream f(dir.file("room.ifc"));
    std::string content;
    f >> content;
    EXPECT_EQ(content, "keep");
}

TEST(ConverterTest, MissingInputStopsRun) {
    TempDir dir;
    auto C = make_converter(dir.file("missing.json"), dir.file("out.ifc"));

    EXPECT_FALSE(C->run());
    EXPECT_EQ(C->get_model(), nullptr);
}

TEST(ConverterTest, ArcAndZeroLengthSegmentsLeaveModelUnchanged) {
    TempDir dir;
    write(dir.file("skipped.json"), skipped_json);
    write(dir.file("empty.json"), R"({ "polylines": [] })");

    auto C = make_converter(dir.file("skipped.json"), dir.file("skipped.ifc"));
    auto E = make_converter(dir.file("empty.json"), dir.file("empty.ifc"));
    EXPECT_TRUE(C->run());
    EXPECT_TRUE(E->run());

    EXPECT_EQ(C->get_walls_created(), 0u);
    EXPECT_EQ(C->get_segments_skipped(), 3u);
    EXPECT_EQ(C->get_segments_failed(), 0u);
    EXPECT_EQ(C->get_model()->walls()->size(), 0u);

    // same as a model with building and storey only
    EXPECT_EQ(number_of_entities(*C->get_model()), number_of_entities(*E->get_model()));
}
