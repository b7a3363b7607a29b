// Copyright 2022 Eric Fichter
#ifndef IFC_CREATOR_H
#define IFC_CREATOR_H

#include "headers.h"

namespace ice {

    typedef IfcParse::IfcGlobalId guid;
    boost::none_t const null = boost::none;

    template<typename Schema>
    typename Schema::IfcPerson *IfcPerson(const std::string &GivenName, const std::string &FamilyName) {

        return new typename Schema::IfcPerson(
                null,       // Identification
                FamilyName, // FamilyName
                GivenName,  // GivenName
                null,       // MiddleNames
                null,       // PrefixTitles
                null,       // SuffixTitles
                null,       // Roles
                null        // Addresses
        );

    }

    template<typename Schema>
    typename Schema::IfcOrganization *IfcOrganization(const std::string &Name) {

        return new typename Schema::IfcOrganization(
                null,           // Identification
                Name,           // Name
                null,           // Description
                null,           // Roles
                null            // Addresses
        );

    }

    template<typename Schema>
    typename Schema::IfcPersonAndOrganization *IfcPersonAndOrganization(typename Schema::IfcPerson *ThePerson, typename Schema::IfcOrganization *TheOrganization) {

        return new typename Schema::IfcPersonAndOrganization(
                ThePerson,          // ThePerson
                TheOrganization,    // TheOrganization
                null                // Roles
        );

    }

    template<typename Schema>
    typename Schema::IfcApplication *IfcApplication(typename Schema::IfcOrganization *ApplicationDeveloper, const std::string &Version, const std::string &ApplicationFullName, const std::string &ApplicationIdentifier) {

        return new typename Schema::IfcApplication(
                ApplicationDeveloper,       // ApplicationDeveloper
                Version,                    // Version
                ApplicationFullName,        // ApplicationFullName
                ApplicationIdentifier       // ApplicationIdentifier
        );

    }

    template<typename Schema>
    typename Schema::IfcOwnerHistory *IfcOwnerHistory(typename Schema::IfcPersonAndOrganization *OwningUser, typename Schema::IfcApplication *OwningApplication, int CreationDate) {

        return new typename Schema::IfcOwnerHistory(
                OwningUser,                                         // OwningUser
                OwningApplication,                                  // OwningApplication
                null,                                               // State
                Schema::IfcChangeActionEnum::IfcChangeAction_ADDED, // ChangeAction
                CreationDate,                                       // LastModifiedDate
                OwningUser,                                         // LastModifyingUser
                OwningApplication,                                  // LastModifyingApplication
                CreationDate                                        // CreationDate
        );

    }

    template<typename Schema>
    typename Schema::IfcGeometricRepresentationContext *IfcGeometricRepresentationContext(const std::string &ContextType, typename Schema::IfcAxis2Placement *WorldCoordinateSystem, typename Schema::IfcDirection *TrueNorth, double Precision) {

        return new typename Schema::IfcGeometricRepresentationContext(
                null,                                                   // ContextIdentifier
                ContextType,                                            // ContextType
                3,                                                      // CoordinateSpaceDimension
                Precision,                                              // Precision
                WorldCoordinateSystem,                                  // WorldCoordinateSystem
                TrueNorth                                               // TrueNorth
        );

    }

    template<typename Schema>
    typename Schema::IfcSIUnit *IfcSIUnit(typename Schema::IfcUnitEnum::Value UnitType, typename Schema::IfcSIUnitName::Value Name) {

        return new typename Schema::IfcSIUnit(
                UnitType,   // UnitType
                null,       // Prefix
                Name        // Name
        );

    }

    template<typename Schema>
    typename Schema::IfcSIUnit *IfcSIUnit(typename Schema::IfcUnitEnum::Value UnitType, typename Schema::IfcSIPrefix::Value Prefix, typename Schema::IfcSIUnitName::Value Name) {

        return new typename Schema::IfcSIUnit(
                UnitType,   // UnitType
                Prefix,     // Prefix
                Name        // Name
        );

    }

    template<typename Schema>
    typename Schema::IfcUnitAssignment *IfcUnitAssignment(IfcEntityList::ptr Units) {

        return new typename Schema::IfcUnitAssignment(
                Units       // Units
        );

    }

    template<typename Schema>
    typename Schema::IfcProject *IfcProject(typename Schema::IfcOwnerHistory *OwnerHistory, const std::string &Name, typename IfcTemplatedEntityList<typename Schema::IfcRepresentationContext>::ptr RepresentationContexts, typename Schema::IfcUnitAssignment *UnitsInContext) {

        return new typename Schema::IfcProject(
                guid(),                     // GlobalId
                OwnerHistory,               // OwnerHistory
                Name,                       // Name
                null,                       // Description
                null,                       // ObjectType
                null,                       // LongName
                null,                       // Phase
                RepresentationContexts,     // RepresentationContexts
                UnitsInContext              // UnitsInContext
        );

    }

    template<typename Schema>
    typename Schema::IfcBuilding *IfcBuilding(typename Schema::IfcOwnerHistory *OwnerHistory, const std::string &Name, typename Schema::IfcObjectPlacement *ObjectPlacement) {

        return new typename Schema::IfcBuilding(
                guid(),                                                             // GlobalId
                OwnerHistory,                                                       // OwnerHistory
                Name,                                                               // Name
                null,                                                               // Description
                null,                                                               // ObjectType
                ObjectPlacement,                                                    // ObjectPlacement
                0,                                                                  // Representation
                null,                                                               // LongName
                Schema::IfcElementCompositionEnum::IfcElementComposition_ELEMENT,   // CompositionType
                null,                                                               // ElevationOfRefHeight
                null,                                                               // ElevationOfTerrain
                0                                                                   // BuildingAddress
        );

    }

    template<typename Schema>
    typename Schema::IfcBuildingStorey *IfcBuildingStorey(typename Schema::IfcOwnerHistory *OwnerHistory, const std::string &Name, typename Schema::IfcObjectPlacement *ObjectPlacement, double Elevation) {

        return new typename Schema::IfcBuildingStorey(
                guid(),                                                             // GlobalId
                OwnerHistory,                                                       // OwnerHistory
                Name,                                                               // Name
                null,                                                               // Description
                null,                                                               // ObjectType
                ObjectPlacement,                                                    // ObjectPlacement
                0,                                                                  // Representation
                null,                                                               // LongName
                Schema::IfcElementCompositionEnum::IfcElementComposition_ELEMENT,   // CompositionType
                Elevation                                                           // Elevation
        );

    }

    template<typename Schema>
    typename Schema::IfcSpace *IfcSpace(typename Schema::IfcOwnerHistory *OwnerHistory, const std::string &Name, const std::string &Description, typename Schema::IfcObjectPlacement *ObjectPlacement, const std::string &LongName,
                                        typename Schema::IfcElementCompositionEnum::Value CompositionType) {

        return new typename Schema::IfcSpace(
                guid(),             // GlobalId
                OwnerHistory,       // OwnerHistory
                Name,               // Name
                Description,        // Description
                null,               // ObjectType
                ObjectPlacement,    // ObjectPlacement
                0,                  // Representation
                LongName,           // LongName
                CompositionType,    // CompositionType
                null,               // PredefinedType
                null                // ElevationWithFlooring
        );

    }

    template<typename Schema>
    typename Schema::IfcWallStandardCase *IfcWallStandardCase(typename Schema::IfcOwnerHistory *OwnerHistory, const std::string &Name, typename Schema::IfcObjectPlacement *ObjectPlacement, typename Schema::IfcProductRepresentation *Representation) {

        return new typename Schema::IfcWallStandardCase(
                guid(),             // GlobalId
                OwnerHistory,       // OwnerHistory
                Name,               // Name
                null,               // Description
                null,               // ObjectType
                ObjectPlacement,    // ObjectPlacement
                Representation,     // Representation
                null,               // Tag
                null                // PredefinedType
        );

    }

    template<typename Schema>
    typename Schema::IfcLocalPlacement *IfcLocalPlacement(typename Schema::IfcObjectPlacement *PlacementRelTo, typename Schema::IfcAxis2Placement *RelativePlacement) {

        return new typename Schema::IfcLocalPlacement(
                PlacementRelTo,     // PlacementRelTo
                RelativePlacement   // RelativePlacement
        );

    }

    template<typename Schema>
    typename Schema::IfcCartesianPoint *IfcCartesianPoint(double x, double y, double z) {

        std::vector<double> v = {x, y, z};
        return new typename Schema::IfcCartesianPoint(v);

    }

    template<typename Schema>
    typename Schema::IfcCartesianPoint *IfcCartesianPoint(double x, double y) {

        std::vector<double> v = {x, y};
        return new typename Schema::IfcCartesianPoint(v);

    }

    template<typename Schema>
    typename Schema::IfcDirection *IfcDirection(double x, double y, double z) {

        std::vector<double> v = {x, y, z};
        return new typename Schema::IfcDirection(v);

    }

    template<typename Schema>
    typename Schema::IfcDirection *IfcDirection(double x, double y) {

        std::vector<double> v = {x, y};
        return new typename Schema::IfcDirection(v);

    }

    template<typename Schema>
    typename Schema::IfcAxis2Placement3D *IfcAxis2Placement3D(typename Schema::IfcCartesianPoint *Location, typename Schema::IfcDirection *Axis, typename Schema::IfcDirection *RefDirection) {

        return new typename Schema::IfcAxis2Placement3D(
                Location,       // Location
                Axis,           // Axis
                RefDirection    // RefDirection
        );

    }

    template<typename Schema>
    typename Schema::IfcAxis2Placement2D *IfcAxis2Placement2D(typename Schema::IfcCartesianPoint *Location, typename Schema::IfcDirection *RefDirection) {

        return new typename Schema::IfcAxis2Placement2D(
                Location,       // Location
                RefDirection    // RefDirection
        );

    }

    template<typename Schema>
    typename Schema::IfcRectangleProfileDef *IfcRectangleProfileDef(typename Schema::IfcAxis2Placement2D *Position, double XDim, double YDim) {

        return new typename Schema::IfcRectangleProfileDef(
                Schema::IfcProfileTypeEnum::IfcProfileType_AREA,    // ProfileType
                null,                                               // ProfileName
                Position,                                           // Position
                XDim,                                               // XDim
                YDim                                                // YDim
        );

    }

    template<typename Schema>
    typename Schema::IfcExtrudedAreaSolid *IfcExtrudedAreaSolid(typename Schema::IfcProfileDef *SweptArea, typename Schema::IfcAxis2Placement3D *Position, typename Schema::IfcDirection *ExtrudedDirection, double Depth) {

        return new typename Schema::IfcExtrudedAreaSolid(
                SweptArea,          // SweptArea
                Position,           // Position
                ExtrudedDirection,  // ExtrudedDirection
                Depth               // Depth
        );

    }

    template<typename Schema>
    typename Schema::IfcShapeRepresentation *IfcShapeRepresentation(typename Schema::IfcRepresentationContext *ContextOfItems, const std::string &RepresentationIdentifier, const std::string &RepresentationType,
                                                                    typename IfcTemplatedEntityList<typename Schema::IfcRepresentationItem>::ptr Items) {

        return new typename Schema::IfcShapeRepresentation(
                ContextOfItems,             // ContextOfItems
                RepresentationIdentifier,   // RepresentationIdentifier
                RepresentationType,         // RepresentationType
                Items                       // Items
        );

    }

    template<typename Schema>
    typename Schema::IfcProductDefinitionShape *IfcProductDefinitionShape(typename IfcTemplatedEntityList<typename Schema::IfcRepresentation>::ptr Representations) {

        return new typename Schema::IfcProductDefinitionShape(
                null,               // Name
                null,               // Description
                Representations     // Representations
        );

    }

    template<typename Schema>
    typename Schema::IfcMaterial *IfcMaterial(const std::string &Name) {

        return new typename Schema::IfcMaterial(
                Name,   // Name
                null,   // Description
                null    // Category
        );

    }

    template<typename Schema>
    typename Schema::IfcMaterialLayer *IfcMaterialLayer(typename Schema::IfcMaterial *Material, double LayerThickness) {

        return new typename Schema::IfcMaterialLayer(
                Material,           // Material
                LayerThickness,     // LayerThickness
                null,               // IsVentilated
                null,               // Name
                null,               // Description
                null,               // Category
                null                // Priority
        );

    }

    template<typename Schema>
    typename Schema::IfcMaterialLayerSet *IfcMaterialLayerSet(typename IfcTemplatedEntityList<typename Schema::IfcMaterialLayer>::ptr MaterialLayers, const std::string &LayerSetName) {

        return new typename Schema::IfcMaterialLayerSet(
                MaterialLayers,     // MaterialLayers
                LayerSetName,       // LayerSetName
                null                // Description
        );

    }

    template<typename Schema>
    typename Schema::IfcMaterialLayerSetUsage *IfcMaterialLayerSetUsage(typename Schema::IfcMaterialLayerSet *ForLayerSet, typename Schema::IfcLayerSetDirectionEnum::Value LayerSetDirection, typename Schema::IfcDirectionSenseEnum::Value DirectionSense,
                                                                        double OffsetFromReferenceLine) {

        return new typename Schema::IfcMaterialLayerSetUsage(
                ForLayerSet,                // ForLayerSet
                LayerSetDirection,          // LayerSetDirection
                DirectionSense,             // DirectionSense
                OffsetFromReferenceLine,    // OffsetFromReferenceLine
                null                        // ReferenceExtent
        );

    }

    template<typename Schema>
    typename Schema::IfcRelAssociatesMaterial *IfcRelAssociatesMaterial(typename Schema::IfcOwnerHistory *OwnerHistory, IfcEntityList::ptr RelatedObjects, typename Schema::IfcMaterialSelect *RelatingMaterial) {

        return new typename Schema::IfcRelAssociatesMaterial(
                guid(),             // GlobalId
                OwnerHistory,       // OwnerHistory
                null,               // Name
                null,               // Description
                RelatedObjects,     // RelatedObjects
                RelatingMaterial    // RelatingMaterial
        );

    }

    template<typename Schema>
    typename Schema::IfcRelAggregates *IfcRelAggregates(typename Schema::IfcOwnerHistory *OwnerHistory, typename Schema::IfcObjectDefinition *RelatingObject, typename IfcTemplatedEntityList<typename Schema::IfcObjectDefinition>::ptr RelatedObjects) {

        return new typename Schema::IfcRelAggregates(
                guid(),             // GlobalId
                OwnerHistory,       // OwnerHistory
                null,               // Name
                null,               // Description
                RelatingObject,     // RelatingObject
                RelatedObjects      // RelatedObjects
        );

    }

    template<typename Schema>
    typename Schema::IfcRelContainedInSpatialStructure *IfcRelContainedInSpatialStructure(typename Schema::IfcOwnerHistory *OwnerHistory, typename IfcTemplatedEntityList<typename Schema::IfcProduct>::ptr RelatedElements,
                                                                                          typename Schema::IfcSpatialElement *RelatingStructure) {

        return new typename Schema::IfcRelContainedInSpatialStructure(
                guid(),             // GlobalId
                OwnerHistory,       // OwnerHistory
                null,               // Name
                null,               // Description
                RelatedElements,    // RelatedElements
                RelatingStructure   // RelatingStructure
        );

    }

    template<typename Schema>
    typename Schema::IfcRelSpaceBoundary *
    IfcRelSpaceBoundary(typename Schema::IfcOwnerHistory *OwnerHistory, const std::string &Name, const std::string &Description, typename Schema::IfcSpaceBoundarySelect *RelatingSpace, typename Schema::IfcElement *RelatedBuildingElement,
                        typename Schema::IfcPhysicalOrVirtualEnum::Value PhysicalOrVirtualBoundary, typename Schema::IfcInternalOrExternalEnum::Value InternalOrExternalBoundary) {

        return new typename Schema::IfcRelSpaceBoundary(
                guid(),                         // GlobalId
                OwnerHistory,                   // OwnerHistory
                Name,                           // Name
                Description,                    // Description
                RelatingSpace,                  // RelatingSpace
                RelatedBuildingElement,         // RelatedBuildingElement
                0,                              // ConnectionGeometry
                PhysicalOrVirtualBoundary,      // PhysicalOrVirtualBoundary
                InternalOrExternalBoundary      // InternalOrExternalBoundary
        );

    }

    //! Single element list as used for the related objects of relationships.
    template<typename T, typename Schema_T>
    typename IfcTemplatedEntityList<T>::ptr entity_list(Schema_T *entity) {
        typename IfcTemplatedEntityList<T>::ptr L(new IfcTemplatedEntityList<T>());
        L->push(entity);
        return L;
    }

    //! Typed instances of a file, never null. Creation order is kept.
    template<typename T>
    typename T::list::ptr instances(IfcParse::IfcFile *model) {

        typename T::list::ptr L = model->instances_by_type<T>();
        if (!L) return typename T::list::ptr(new typename T::list);
        return L;
    }

    //! Returns the first committed IfcRelAggregates that decomposes the given object or null.
    //! Scans the relationship instances instead of the inverse attribute, so it works on parsed and on created files alike.
    template<typename Schema>
    typename Schema::IfcRelAggregates *aggregation_of(IfcParse::IfcFile *model, typename Schema::IfcObjectDefinition *RelatingObject) {

        for (auto rel: *instances<typename Schema::IfcRelAggregates>(model))
            if (rel->RelatingObject() == RelatingObject)
                return rel;

        return nullptr;
    }

    //! Returns the first committed IfcRelContainedInSpatialStructure of the spatial element or null.
    template<typename Schema>
    typename Schema::IfcRelContainedInSpatialStructure *containment_of(IfcParse::IfcFile *model, typename Schema::IfcSpatialElement *RelatingStructure) {

        for (auto rel: *instances<typename Schema::IfcRelContainedInSpatialStructure>(model))
            if (rel->RelatingStructure() == RelatingStructure)
                return rel;

        return nullptr;
    }

    template<typename Schema>
    void add_object_to_aggregation_via_related_objects(typename Schema::IfcRelAggregates *IfcRelAggregates, typename Schema::IfcObjectDefinition *IfcObjectDefinition) {

        auto RelatedObjects = IfcRelAggregates->RelatedObjects();

        if (RelatedObjects->contains(IfcObjectDefinition)) return;

        RelatedObjects->push(IfcObjectDefinition);
        IfcRelAggregates->setRelatedObjects(RelatedObjects);
    }

    template<typename Schema>
    void add_product_to_containment_via_related_elements(typename Schema::IfcRelContainedInSpatialStructure *IfcRelContainedInSpatialStructure, typename Schema::IfcProduct *IfcProduct) {

        auto RelatedElements = IfcRelContainedInSpatialStructure->RelatedElements();

        if (RelatedElements->contains(IfcProduct)) return;

        RelatedElements->push(IfcProduct);
        IfcRelContainedInSpatialStructure->setRelatedElements(RelatedElements);
    }

}
#endif //IFC_CREATOR_H
