// Copyright 2022 Eric Fichter
#include <gtest/gtest.h>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepPrimAPI_MakeBox.hxx>
#include <gp_Pnt.hxx>
#include "Builder.h"
#include "Exporter.h"
#include "IfcCheck.h"
#include "Kernel.h"
#include "TempDir.h"

namespace {

    bool has_error(const IfcCheck &check, IfcCheck::model_errors error) {
        for (const auto &v: check.get_violations())
            if (v.error == error) return true;
        return false;
    }

    class IfcCheckTest : public ::testing::Test {
    protected:
        IfcCheckTest() : model("CheckTest") {
            auto building = Builder::create_building(model, "Building");
            storey = Builder::create_storey(model, "Ground floor", 0, building);
        }

        Model model;
        IfcSchema::IfcBuildingStorey *storey;
    };

}

TEST_F(IfcCheckTest, HierarchyWithWallsIsValid) {
    Builder::create_wall(model, 2500, 0, 1, 0, 0, 5000, 300, 2800, storey);
    Builder::create_wall(model, 5000, 2000, 0, 1, 0, 4000, 300, 2800, storey);

    IfcCheck check(model.file(), 1, false);
    EXPECT_EQ(check.count(), 0u);
    EXPECT_TRUE(check.valid());
}

TEST_F(IfcCheckTest, WallShapesPassGeometryCheck) {
    Builder::create_wall(model, 2500, 0, 1, 0, 0, 5000, 300, 2800, storey);

    IfcCheck check(model.file(), 1, true);
    EXPECT_EQ(check.count(), 0u);
}

TEST_F(IfcCheckTest, DegenerateWallIsReported) {
    Builder::create_wall(model, 0, 0, 1, 0, 0, 0, 300, 2800, storey);

    IfcCheck check(model.file(), 1, false);
    EXPECT_FALSE(check.valid());
    EXPECT_TRUE(has_error(check, IfcCheck::NON_POSITIVE_DIMENSION));
}

TEST_F(IfcCheckTest, ZeroHeightWallIsReported) {
    Builder::create_wall(model, 0, 0, 1, 0, 0, 1000, 300, 0, storey);

    IfcCheck check(model.file(), 1, false);
    EXPECT_TRUE(has_error(check, IfcCheck::NON_POSITIVE_DIMENSION));
}

TEST_F(IfcCheckTest, ZeroDirectionIsReported) {
    Builder::create_wall(model, 0, 0, 0, 0, 0, 1000, 300, 2800, storey);

    IfcCheck check(model.file(), 1, false);
    EXPECT_TRUE(has_error(check, IfcCheck::ZERO_DIRECTION));
}

TEST_F(IfcCheckTest, WallWithoutContainmentIsReported) {
    auto wall = Builder::create_wall(model, 0, 0, 1, 0, 0, 1000, 300, 2800, storey);

    auto rel = *ice::instances<IfcSchema::IfcRelContainedInSpatialStructure>(model.file())->begin();
    IfcSchema::IfcProduct::list::ptr elements(new IfcSchema::IfcProduct::list);
    elements->push(model.first_storey()); // anything but the wall
    rel->setRelatedElements(elements);

    IfcCheck check(model.file(), 1, false);
    ASSERT_TRUE(has_error(check, IfcCheck::NOT_CONTAINED));
    for (const auto &v: check.get_violations())
        if (v.error == IfcCheck::NOT_CONTAINED)
            EXPECT_EQ(v.guid, wall->GlobalId());
}

TEST_F(IfcCheckTest, UnsetAttributeIsReported) {
    auto unit = *ice::instances<IfcSchema::IfcSIUnit>(model.file())->begin();

    auto *null_argument = new IfcWrite::IfcWriteArgument();
    null_argument->set(boost::blank());
    unit->data().setArgument(3, null_argument); // Name

    IfcCheck check(model.file(), 1, false);
    ASSERT_TRUE(has_error(check, IfcCheck::MISSING_ATTRIBUTE));
    for (const auto &v: check.get_violations())
        if (v.error == IfcCheck::MISSING_ATTRIBUTE)
            EXPECT_EQ(v.id, unit->data().id());
}

TEST_F(IfcCheckTest, DuplicateGlobalIdIsReported) {
    auto first = Builder::create_wall(model, 0, 0, 1, 0, 0, 1000, 300, 2800, storey);
    auto second = Builder::create_wall(model, 0, 1000, 1, 0, 0, 1000, 300, 2800, storey);
    second->setGlobalId(first->GlobalId());

    IfcCheck check(model.file(), 1, false);
    ASSERT_TRUE(has_error(check, IfcCheck::DUPLICATE_GUID));
    for (const auto &v: check.get_violations())
        if (v.error == IfcCheck::DUPLICATE_GUID)
            EXPECT_EQ(v.id, second->data().id());
}

TEST_F(IfcCheckTest, StoreyOutsideAggregationIsReported) {
    auto building = *model.buildings()->begin();
    auto upper = Builder::create_storey(model, "Upper floor", 3000, building);

    auto rel = ice::aggregation_of<IfcSchema>(model.file(), building);
    ASSERT_NE(rel, nullptr);
    IfcSchema::IfcObjectDefinition::list::ptr related(new IfcSchema::IfcObjectDefinition::list);
    related->push(upper);
    rel->setRelatedObjects(related);

    IfcCheck check(model.file(), 1, false);
    ASSERT_TRUE(has_error(check, IfcCheck::NOT_AGGREGATED));
    for (const auto &v: check.get_violations())
        if (v.error == IfcCheck::NOT_AGGREGATED)
            EXPECT_EQ(v.guid, storey->GlobalId());
}

TEST_F(IfcCheckTest, RepresentationInOtherContextIsReported) {
    Builder::create_wall(model, 0, 0, 1, 0, 0, 1000, 300, 2800, storey);

    auto plan = new IfcSchema::IfcGeometricRepresentationContext(ice::null, std::string("Plan"), 2, 1e-5, model.context()->WorldCoordinateSystem(), model.context()->TrueNorth());
    model.file()->addEntity(plan);

    auto representation = *ice::instances<IfcSchema::IfcShapeRepresentation>(model.file())->begin();
    representation->setContextOfItems(plan);

    IfcCheck check(model.file(), 1, false);
    EXPECT_TRUE(has_error(check, IfcCheck::FOREIGN_CONTEXT));
    EXPECT_FALSE(has_error(check, IfcCheck::WRONG_NUMBER_OF_CONTEXTS)); // a 2D context does not compete with the model context
}

TEST_F(IfcCheckTest, WallWithoutMaterialUsageIsReported) {
    auto first = Builder::create_wall(model, 0, 0, 1, 0, 0, 1000, 300, 2800, storey);
    auto second = Builder::create_wall(model, 0, 1000, 1, 0, 0, 1000, 300, 2800, storey);

    for (auto rel: *ice::instances<IfcSchema::IfcRelAssociatesMaterial>(model.file())) {
        if (!rel->RelatedObjects()->contains(second)) continue;
        IfcEntityList::ptr related(new IfcEntityList);
        related->push(first);
        rel->setRelatedObjects(related);
    }

    IfcCheck check(model.file(), 1, false);
    ASSERT_TRUE(has_error(check, IfcCheck::MISSING_MATERIAL_USAGE));
    for (const auto &v: check.get_violations())
        if (v.error == IfcCheck::MISSING_MATERIAL_USAGE)
            EXPECT_EQ(v.guid, second->GlobalId());
}

TEST(IfcCheckShapeTest, NullShapeIsInvalid) {
    auto error = IfcCheck::shape_error(TopoDS_Shape());
    ASSERT_TRUE(error);
    EXPECT_EQ(*error, IfcCheck::INVALID_SHAPE);
}

TEST(IfcCheckShapeTest, FaceHasNoVolume) {
    BRepBuilderAPI_MakePolygon polygon(gp_Pnt(0, 0, 0), gp_Pnt(1000, 0, 0), gp_Pnt(1000, 300, 0), gp_Pnt(0, 300, 0), true);
    TopoDS_Shape face = BRepBuilderAPI_MakeFace(polygon.Wire()).Shape();

    auto error = IfcCheck::shape_error(face);
    ASSERT_TRUE(error);
    EXPECT_EQ(*error, IfcCheck::NON_POSITIVE_VOLUME);
}

TEST(IfcCheckShapeTest, BoxIsAccepted) {
    TopoDS_Shape box = BRepPrimAPI_MakeBox(1000, 300, 2800).Shape();
    EXPECT_FALSE(IfcCheck::shape_error(box));
}

TEST(IfcCheckModelTest, ModelWithoutProjectIsReported) {
    Model model("Empty", Credentials::defaults(), false);

    IfcCheck check(model.file(), 1, false);
    EXPECT_TRUE(has_error(check, IfcCheck::WRONG_NUMBER_OF_PROJECTS));
    EXPECT_TRUE(has_error(check, IfcCheck::WRONG_NUMBER_OF_CONTEXTS));
}

TEST(IfcCheckModelTest, ReportListsViolations) {
    Model model("Report", Credentials::defaults(), false);
    IfcCheck check(model.file(), 1, false);

    std::ostringstream os;
    check.report(os);
    EXPECT_NE(os.str().find("Violations: 2"), std::string::npos);
    EXPECT_NE(os.str().find(IfcCheck::error_to_string(IfcCheck::WRONG_NUMBER_OF_PROJECTS)), std::string::npos);
}

TEST_F(IfcCheckTest, SavedModelIsValidAfterParsing) {
    TempDir dir;
    Builder::create_wall(model, 5, 0, 1, 0, 0, 10, 0.5, 2, storey);
    Builder::create_wall(model, 10, 2.5, 0, 1, 0, 5, 0.5, 2, storey);

    ValidationReport report = Exporter::validate_and_save(model, SAVE_IF_VALID, dir.file("roundtrip.ifc"), 1, false);
    ASSERT_TRUE(report.written);
    ASSERT_TRUE(report.valid());

    std::unique_ptr<IfcParse::IfcFile> parsed;
    ASSERT_TRUE(Kernel::read_ifc_file(dir.file("roundtrip.ifc"), parsed));

    IfcCheck check(parsed.get(), 1, false);
    EXPECT_EQ(check.count(), 0u);
    EXPECT_EQ(ice::instances<IfcSchema::IfcWallStandardCase>(parsed.get())->size(), 2u);
    EXPECT_EQ(ice::instances<IfcSchema::IfcBuildingStorey>(parsed.get())->size(), 1u);
}

TEST_F(IfcCheckTest, InvalidModelIsNotSavedByDefault) {
    TempDir dir;
    Builder::create_wall(model, 0, 0, 1, 0, 0, 0, 300, 2800, storey);

    ValidationReport report = Exporter::validate_and_save(model, SAVE_IF_VALID, dir.file("invalid.ifc"), 1, false);
    EXPECT_FALSE(report.valid());
    EXPECT_FALSE(report.written);
    EXPECT_TRUE(report.report_path.empty());
    EXPECT_FALSE(boost::filesystem::exists(dir.file("invalid.ifc")));
}

TEST_F(IfcCheckTest, InvalidModelIsSavedWithReportWhenForced) {
    TempDir dir;
    Builder::create_wall(model, 0, 0, 1, 0, 0, 0, 300, 2800, storey);

    ValidationReport report = Exporter::validate_and_save(model, SAVE_WITH_REPORT, dir.file("forced.ifc"), 1, false);
    EXPECT_FALSE(report.valid());
    EXPECT_TRUE(report.written);
    EXPECT_EQ(report.report_path, dir.file("forced.ifc.validation.txt"));
    EXPECT_TRUE(boost::filesystem::exists(dir.file("forced.ifc")));
    EXPECT_TRUE(boost::filesystem::exists(report.report_path));
}

TEST_F(IfcCheckTest, SavingDuringTransactionIsRejected) {
    Transaction t(model, "Open");
    EXPECT_THROW(Exporter::validate_and_save(model), TransactionError);
}
