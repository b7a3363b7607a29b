// Copyright 2022 Eric Fichter
#ifndef BUILDER_H
#define BUILDER_H

#include "headers.h"
#include "Model.h"
#include "ifc_creator.h"

//! Creates the spatial hierarchy Project -> Building -> Storey -> Wall/Space. Every operation runs in its own transaction.
//! All preconditions are checked before anything is created and violations throw InvalidState.
class Builder {

public:
    //! Building with composition type ELEMENT at the origin, aggregated into the project.
    static IfcSchema::IfcBuilding *create_building(Model &model, const std::string &name);

    //! Storey at (0,0,elevation) relative to the building, aggregated into the building.
    static IfcSchema::IfcBuildingStorey *create_storey(Model &model, const std::string &name, double elevation, IfcSchema::IfcBuilding *building);

    //! Extruded rectangle of length x width, swept along +Z by height.
    //! The profile is always anchored at the local origin, (posX, posY, 0) and (dirX, dirY, 0) define the placement relative to the storey. dirZ is not used.
    static IfcSchema::IfcWallStandardCase *create_wall(Model &model, double posX, double posY, double dirX, double dirY, double dirZ, double length, double width, double height, IfcSchema::IfcBuildingStorey *storey,
                                                       const std::string &name = "A standard wall");

    //! Space with one physical space boundary relation per wall. The walls are read in a single forward pass.
    template<typename InputIt>
    static IfcSchema::IfcSpace *create_space(Model &model, IfcSchema::IfcBuildingStorey *storey, InputIt first, InputIt last, const std::string &name, const std::string &description, const std::string &longName,
                                             IfcSchema::IfcElementCompositionEnum::Value compositionType) {

        check_project(model);
        check_storey(model, storey);

        return model.run_in_transaction("Create space " + name, [&](Transaction &t) {

            auto Placement = t.add(ice::IfcLocalPlacement<IfcSchema>(storey->ObjectPlacement(), origin_placement(t)));
            auto Space = t.add(ice::IfcSpace<IfcSchema>(model.owner_history(), name, description, Placement, longName, compositionType));

            for (InputIt it = first; it != last; ++it) {
                IfcSchema::IfcElement *wall = *it;
                if (!model.contains(wall))
                    throw InvalidState("Space " + name + " cannot be bounded by an element that is not part of model " + model.project_name() + ".");
                t.add(ice::IfcRelSpaceBoundary<IfcSchema>(model.owner_history(), "1stLevel", "Physical boundary", Space, wall,
                                                          IfcSchema::IfcPhysicalOrVirtualEnum::IfcPhysicalOrVirtual_PHYSICAL,
                                                          IfcSchema::IfcInternalOrExternalEnum::IfcInternalOrExternal_NOTDEFINED));
            }

            aggregate(model, t, storey, Space);
            return Space;
        });
    }

    static IfcSchema::IfcSpace *create_space(Model &model, IfcSchema::IfcBuildingStorey *storey, const std::vector<IfcSchema::IfcWallStandardCase *> &walls, const std::string &name, const std::string &description = "",
                                             const std::string &longName = "", IfcSchema::IfcElementCompositionEnum::Value compositionType = IfcSchema::IfcElementCompositionEnum::IfcElementComposition_ELEMENT);

private:
    static void check_project(const Model &model);

    static void check_storey(const Model &model, IfcSchema::IfcBuildingStorey *storey);

    static IfcSchema::IfcAxis2Placement3D *origin_placement(Transaction &t);

    //! Adds the object to the aggregation of the relating object. An existing relation is extended on commit, otherwise a new one is created.
    static void aggregate(Model &model, Transaction &t, IfcSchema::IfcObjectDefinition *relating, IfcSchema::IfcObjectDefinition *related);

    //! Adds the product to the spatial containment of the storey. An existing relation is extended on commit, otherwise a new one is created.
    static void contain(Model &model, Transaction &t, IfcSchema::IfcBuildingStorey *storey, IfcSchema::IfcProduct *product);
};

#endif //BUILDER_H
