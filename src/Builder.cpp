// Copyright 2022 Eric Fichter
#include "Builder.h"

IfcSchema::IfcBuilding *Builder::create_building(Model &model, const std::string &name) {

    check_project(model);

    return model.run_in_transaction("Create building " + name, [&](Transaction &t) {

        auto Placement = t.add(ice::IfcLocalPlacement<IfcSchema>(nullptr, origin_placement(t)));
        auto Building = t.add(ice::IfcBuilding<IfcSchema>(model.owner_history(), name, Placement));

        aggregate(model, t, model.project(), Building);
        return Building;
    });
}

IfcSchema::IfcBuildingStorey *Builder::create_storey(Model &model, const std::string &name, double elevation, IfcSchema::IfcBuilding *building) {

    check_project(model);

    if (!model.contains(building))
        throw InvalidState("Storey " + name + " needs a building of model " + model.project_name() + ".");

    return model.run_in_transaction("Create storey " + name, [&](Transaction &t) {

        auto Location = t.add(ice::IfcCartesianPoint<IfcSchema>(0, 0, elevation));
        auto RelativePlacement = t.add(ice::IfcAxis2Placement3D<IfcSchema>(Location, nullptr, nullptr));
        auto Placement = t.add(ice::IfcLocalPlacement<IfcSchema>(building->ObjectPlacement(), RelativePlacement));
        auto Storey = t.add(ice::IfcBuildingStorey<IfcSchema>(model.owner_history(), name, Placement, elevation));

        aggregate(model, t, building, Storey);
        return Storey;
    });
}

IfcSchema::IfcWallStandardCase *Builder::create_wall(Model &model, double posX, double posY, double dirX, double dirY, double dirZ, double length, double width, double height, IfcSchema::IfcBuildingStorey *storey, const std::string &name) {

    (void) dirZ;

    check_project(model);
    check_storey(model, storey);

    if (model.context() == nullptr)
        throw InvalidState("Wall " + name + " needs the representation context of model " + model.project_name() + ".");

    if (model.wall_material_usage() == nullptr)
        throw InvalidState("Wall " + name + " needs the default material of model " + model.project_name() + ".");

    return model.run_in_transaction("Create wall " + name, [&](Transaction &t) {

        // profile, anchored at the local origin
        auto ProfileLocation = t.add(ice::IfcCartesianPoint<IfcSchema>(0, 0));
        auto ProfilePosition = t.add(ice::IfcAxis2Placement2D<IfcSchema>(ProfileLocation, nullptr));
        auto Profile = t.add(ice::IfcRectangleProfileDef<IfcSchema>(ProfilePosition, length, width));

        // extrusion along +Z
        auto ExtrudedDirection = t.add(ice::IfcDirection<IfcSchema>(0, 0, 1));
        auto Solid = t.add(ice::IfcExtrudedAreaSolid<IfcSchema>(Profile, origin_placement(t), ExtrudedDirection, height));

        IfcTemplatedEntityList<IfcSchema::IfcRepresentationItem>::ptr items(new IfcTemplatedEntityList<IfcSchema::IfcRepresentationItem>);
        items->push(Solid);
        auto ShapeRepresentation = t.add(ice::IfcShapeRepresentation<IfcSchema>(model.context(), "Body", "SweptSolid", items));

        IfcTemplatedEntityList<IfcSchema::IfcRepresentation>::ptr representations(new IfcTemplatedEntityList<IfcSchema::IfcRepresentation>);
        representations->push(ShapeRepresentation);
        auto ProductDefinitionShape = t.add(ice::IfcProductDefinitionShape<IfcSchema>(representations));

        // placement relative to the storey
        auto Location = t.add(ice::IfcCartesianPoint<IfcSchema>(posX, posY, 0));
        auto Axis = t.add(ice::IfcDirection<IfcSchema>(0, 0, 1));
        auto RefDirection = t.add(ice::IfcDirection<IfcSchema>(dirX, dirY, 0));
        auto RelativePlacement = t.add(ice::IfcAxis2Placement3D<IfcSchema>(Location, Axis, RefDirection));
        auto Placement = t.add(ice::IfcLocalPlacement<IfcSchema>(storey->ObjectPlacement(), RelativePlacement));

        auto Wall = t.add(ice::IfcWallStandardCase<IfcSchema>(model.owner_history(), name, Placement, ProductDefinitionShape));

        // shared material usage
        IfcEntityList::ptr related(new IfcEntityList);
        related->push(Wall);
        t.add(ice::IfcRelAssociatesMaterial<IfcSchema>(model.owner_history(), related, model.wall_material_usage()));

        contain(model, t, storey, Wall);
        return Wall;
    });
}

IfcSchema::IfcSpace *Builder::create_space(Model &model, IfcSchema::IfcBuildingStorey *storey, const std::vector<IfcSchema::IfcWallStandardCase *> &walls, const std::string &name, const std::string &description,
                                           const std::string &longName, IfcSchema::IfcElementCompositionEnum::Value compositionType) {
    return create_space(model, storey, walls.begin(), walls.end(), name, description, longName, compositionType);
}

void Builder::check_project(const Model &model) {
    if (model.project() == nullptr)
        throw InvalidState("Model " + model.project_name() + " has no project.");
}

void Builder::check_storey(const Model &model, IfcSchema::IfcBuildingStorey *storey) {
    if (!model.contains(storey))
        throw InvalidState("Storey is missing or not part of model " + model.project_name() + ".");
}

IfcSchema::IfcAxis2Placement3D *Builder::origin_placement(Transaction &t) {
    auto Location = t.add(ice::IfcCartesianPoint<IfcSchema>(0, 0, 0));
    return t.add(ice::IfcAxis2Placement3D<IfcSchema>(Location, nullptr, nullptr));
}

void Builder::aggregate(Model &model, Transaction &t, IfcSchema::IfcObjectDefinition *relating, IfcSchema::IfcObjectDefinition *related) {

    auto Rel = ice::aggregation_of<IfcSchema>(model.file(), relating);

    if (Rel == nullptr)
        t.add(ice::IfcRelAggregates<IfcSchema>(model.owner_history(), relating, ice::entity_list<IfcSchema::IfcObjectDefinition>(related)));
    else
        t.on_commit([Rel, related]() { ice::add_object_to_aggregation_via_related_objects<IfcSchema>(Rel, related); });
}

void Builder::contain(Model &model, Transaction &t, IfcSchema::IfcBuildingStorey *storey, IfcSchema::IfcProduct *product) {

    auto Rel = ice::containment_of<IfcSchema>(model.file(), storey);

    if (Rel == nullptr)
        t.add(ice::IfcRelContainedInSpatialStructure<IfcSchema>(model.owner_history(), ice::entity_list<IfcSchema::IfcProduct>(product), storey));
    else
        t.on_commit([Rel, product]() { ice::add_product_to_containment_via_related_elements<IfcSchema>(Rel, product); });
}
