// Copyright 2022 Eric Fichter
#include "IfcCheck.h"
#include "Kernel.h"
#include "ifc_creator.h"

IfcCheck::IfcCheck(IfcParse::IfcFile *_model, const unsigned int _num_threads, bool _check_geometry) : model(_model), num_threads(_num_threads), check_geometry(_check_geometry), model_context(nullptr) {

    settings.set(IfcGeom::IteratorSettings::FASTER_BOOLEANS, true);
    settings.set(IfcGeom::IteratorSettings::SEW_SHELLS, true);
    settings.set(IfcGeom::IteratorSettings::USE_WORLD_COORDS, false);
    settings.set(IfcGeom::IteratorSettings::DISABLE_TRIANGULATION, true);

    check_model();
}

std::string IfcCheck::error_to_string(model_errors error) {

    static const std::unordered_map<int, std::string> M{
            {MISSING_ATTRIBUTE,        "misses a non-optional attribute"},
            {DUPLICATE_GUID,           "has a GlobalId used by another entity"},
            {WRONG_NUMBER_OF_PROJECTS, "does not contain exactly one IfcProject"},
            {WRONG_NUMBER_OF_CONTEXTS, "does not contain exactly one 3D model context"},
            {NOT_AGGREGATED,           "is not aggregated into its parent in the spatial structure"},
            {NOT_CONTAINED,            "is not contained in a storey"},
            {FOREIGN_CONTEXT,          "does not use the model context"},
            {MISSING_MATERIAL_USAGE,   "has no material layer set usage"},
            {NON_POSITIVE_DIMENSION,   "has a non-positive dimension"},
            {ZERO_DIRECTION,           "has zero direction ratios"},
            {INVALID_SHAPE,            "has an invalid shape"},
            {NON_POSITIVE_VOLUME,      "has non-positive volume"}
    };

    return M.at(error);
}

void IfcCheck::check_model() {

    std::cout << "\n### Check" << std::endl;

    auto start = std::chrono::high_resolution_clock::now();

    if (model->schema() != &IfcSchema::get_schema())
        std::cerr << "[Warning] Model is not IFC4. Entity checks will find nothing." << std::endl;

    check_attributes();
    check_guids();
    check_project_and_context();
    check_decomposition();
    check_representation_contexts();
    check_material_usages();
    check_dimensions();
    check_directions();
    if (check_geometry)
        check_wall_shapes();

    evaluation();

    auto finish = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = finish - start;
    std::cout << Kernel::print_time(elapsed.count(), "Check model", std::to_string(violations.size()) + " violations");
}

void IfcCheck::check_attributes() {

    for (const auto &item: *model) {

        IfcUtil::IfcBaseClass *entity = item.second;
        const IfcParse::entity *declaration = entity->declaration().as_entity();
        if (declaration == nullptr) continue;

        const std::vector<const IfcParse::attribute *> attributes = declaration->all_attributes();
        const std::vector<bool> &derived = declaration->derived();

        for (size_t i = 0; i < attributes.size(); i++) {
            if (attributes[i]->optional() || (i < derived.size() && derived[i])) continue;
            if (entity->data().getArgument(i)->isNull()) {
                std::cerr << "[Warning] Attribute " << attributes[i]->name() << " of #" << entity->data().id() << " is not set." << std::endl;
                add(entity, MISSING_ATTRIBUTE);
                break;
            }
        }
    }
}

void IfcCheck::check_guids() {

    std::unordered_map<std::string, IfcSchema::IfcRoot *> seen;

    for (auto root: *ice::instances<IfcSchema::IfcRoot>(model)) {
        auto it = seen.find(root->GlobalId());
        if (it == seen.end())
            seen[root->GlobalId()] = root;
        else
            add(root, DUPLICATE_GUID);
    }
}

void IfcCheck::check_project_and_context() {

    if (ice::instances<IfcSchema::IfcProject>(model)->size() != 1)
        violations.emplace_back(0, "IfcProject", "", WRONG_NUMBER_OF_PROJECTS);

    std::list<IfcSchema::IfcGeometricRepresentationContext *> contexts;
    for (auto c: *ice::instances<IfcSchema::IfcGeometricRepresentationContext>(model))
        if (c->declaration().name() == "IfcGeometricRepresentationContext" && c->CoordinateSpaceDimension() == 3)
            contexts.push_back(c);

    if (contexts.size() == 1)
        model_context = contexts.front();
    else
        violations.emplace_back(0, "IfcGeometricRepresentationContext", "", WRONG_NUMBER_OF_CONTEXTS);
}

void IfcCheck::check_decomposition() {

    std::unordered_map<IfcUtil::IfcBaseClass *, IfcUtil::IfcBaseClass *> parent; // related -> relating
    std::unordered_map<IfcUtil::IfcBaseClass *, IfcUtil::IfcBaseClass *> container; // element -> spatial structure

    for (auto rel: *ice::instances<IfcSchema::IfcRelAggregates>(model))
        for (auto related: *rel->RelatedObjects())
            parent[related] = rel->RelatingObject();

    for (auto rel: *ice::instances<IfcSchema::IfcRelContainedInSpatialStructure>(model))
        for (auto related: *rel->RelatedElements())
            container[related] = rel->RelatingStructure();

    auto has_parent_of_type = [&](IfcUtil::IfcBaseClass *e, const std::string &type) {
        auto it = parent.find(e);
        return it != parent.end() && it->second->declaration().is(type);
    };

    for (auto building: *ice::instances<IfcSchema::IfcBuilding>(model))
        if (!has_parent_of_type(building, "IfcProject"))
            add(building, NOT_AGGREGATED);

    for (auto storey: *ice::instances<IfcSchema::IfcBuildingStorey>(model))
        if (!has_parent_of_type(storey, "IfcBuilding"))
            add(storey, NOT_AGGREGATED);

    for (auto space: *ice::instances<IfcSchema::IfcSpace>(model))
        if (!has_parent_of_type(space, "IfcBuildingStorey"))
            add(space, NOT_AGGREGATED);

    for (auto wall: *ice::instances<IfcSchema::IfcWall>(model)) {
        auto it = container.find(wall);
        if (it == container.end() || !it->second->declaration().is("IfcBuildingStorey"))
            add(wall, NOT_CONTAINED);
    }
}

void IfcCheck::check_representation_contexts() {

    if (model_context == nullptr) return;

    for (auto representation: *ice::instances<IfcSchema::IfcShapeRepresentation>(model)) {

        IfcSchema::IfcRepresentationContext *context = representation->ContextOfItems();

        if (context->declaration().is("IfcGeometricRepresentationSubContext"))
            context = context->as<IfcSchema::IfcGeometricRepresentationSubContext>()->ParentContext();

        if (context != model_context)
            add(representation, FOREIGN_CONTEXT);
    }
}

void IfcCheck::check_material_usages() {

    std::set<IfcUtil::IfcBaseClass *> with_usage;

    for (auto rel: *ice::instances<IfcSchema::IfcRelAssociatesMaterial>(model)) {
        if (!rel->RelatingMaterial()->declaration().is("IfcMaterialLayerSetUsage")) continue;
        for (auto related: *rel->RelatedObjects())
            with_usage.insert(related);
    }

    for (auto wall: *ice::instances<IfcSchema::IfcWallStandardCase>(model))
        if (with_usage.find(wall) == with_usage.end())
            add(wall, MISSING_MATERIAL_USAGE);
}

void IfcCheck::check_dimensions() {

    for (auto profile: *ice::instances<IfcSchema::IfcRectangleProfileDef>(model))
        if (profile->XDim() <= 0 || profile->YDim() <= 0)
            add(profile, NON_POSITIVE_DIMENSION);

    for (auto solid: *ice::instances<IfcSchema::IfcExtrudedAreaSolid>(model))
        if (solid->Depth() <= 0)
            add(solid, NON_POSITIVE_DIMENSION);

    for (auto layer: *ice::instances<IfcSchema::IfcMaterialLayer>(model))
        if (layer->LayerThickness() < 0)
            add(layer, NON_POSITIVE_DIMENSION);
}

void IfcCheck::check_directions() {

    for (auto direction: *ice::instances<IfcSchema::IfcDirection>(model)) {

        double sum = 0;
        for (double r: direction->DirectionRatios())
            sum += r * r;

        if (std::sqrt(sum) < Precision::Confusion())
            add(direction, ZERO_DIRECTION);
    }
}

void IfcCheck::check_wall_shapes() {

    std::set<std::string> include_entities = {"IfcWall", "IfcWallStandardCase"};

    //***************************************************************
    // Shape generation
    IfcGeom::entity_filter entity_filter;
    entity_filter.include = true;
    entity_filter.traverse = false;
    entity_filter.entity_names = include_entities;
    std::vector<IfcGeom::filter_t> filter_funcs;
    filter_funcs.emplace_back(boost::ref(entity_filter));

    IfcGeom::Iterator<real_t> geom_iterator(settings, model, filter_funcs, num_threads);

    if (!geom_iterator.initialize()) {
        std::cout << "No IfcWall geometries found." << std::endl;
        return;
    }
    //***************************************************************

    //***************************************************************
    // Checks
    do {
        IfcGeom::Element<real_t> *geom_object = geom_iterator.get();
        TopoDS_Shape shape = Kernel::geom_object_to_shape(geom_object);

        if (auto error = shape_error(shape))
            violations.emplace_back(geom_object->id(), geom_object->type(), geom_object->guid(), *error);

    } while (geom_iterator.next());
    //***************************************************************
}

boost::optional<IfcCheck::model_errors> IfcCheck::shape_error(const TopoDS_Shape &shape) {

    if (shape.IsNull() || !BRepCheck_Analyzer(shape).IsValid())
        return INVALID_SHAPE;

    if (Kernel::volume(shape) <= 0)
        return NON_POSITIVE_VOLUME;

    return boost::none;
}

void IfcCheck::evaluation() const {

    std::unordered_map<unsigned int, std::list<model_errors>> E;
    for (const auto &v: violations)
        E[v.id].push_back(v.error);

    auto print = [&](IfcUtil::IfcBaseClass *entity, const std::string &name) {
        auto it = E.find(entity->data().id());
        if (it == E.end())
            std::cout << "\t" << name << " #" << entity->data().id() << " " << guid_of(entity) << ": ok\n";
        else {
            std::cout << "\t" << name << " #" << entity->data().id() << " " << guid_of(entity) << ":\n";
            for (const auto &error: it->second)
                std::cout << "\t\t" << error_to_string(error) << "\n";
        }
    };

    for (auto e: *ice::instances<IfcSchema::IfcBuilding>(model)) print(e, "Building");
    for (auto e: *ice::instances<IfcSchema::IfcBuildingStorey>(model)) print(e, "Storey");
    for (auto e: *ice::instances<IfcSchema::IfcWall>(model)) print(e, "Wall");
    for (auto e: *ice::instances<IfcSchema::IfcSpace>(model)) print(e, "Space");

    // model wide violations and violations of entities without own output
    for (const auto &v: violations) {
        if (v.id == 0)
            std::cout << "\tModel: " << error_to_string(v.error) << "\n";
        else if (!model->instance_by_id(v.id)->declaration().is("IfcSpatialStructureElement") && !model->instance_by_id(v.id)->declaration().is("IfcWall"))
            std::cout << "\t" << v.type << " #" << v.id << ": " << error_to_string(v.error) << "\n";
    }
}

void IfcCheck::report(std::ostream &os) const {

    os << "Validation of " << model->header().file_name().name() << "\n";
    os << "Violations: " << violations.size() << "\n";

    for (const auto &v: violations) {
        if (v.id == 0)
            os << "Model " << v.type << ": " << error_to_string(v.error) << "\n";
        else
            os << "#" << v.id << " " << v.type << (v.guid.empty() ? "" : " " + v.guid) << ": " << error_to_string(v.error) << "\n";
    }
}

void IfcCheck::add(IfcUtil::IfcBaseClass *entity, model_errors error) {
    violations.emplace_back(entity->data().id(), entity->declaration().name(), guid_of(entity), error);
}

std::string IfcCheck::guid_of(IfcUtil::IfcBaseClass *entity) {
    if (entity->declaration().is("IfcRoot"))
        return entity->as<IfcSchema::IfcRoot>()->GlobalId();
    return "";
}
