// Copyright 2022 Eric Fichter
#include "Model.h"
#include "Builder.h"
#include "ifc_creator.h"

std::atomic<Model *> Model::instance(nullptr);
std::unique_ptr<Model> Model::instance_owner;
std::mutex Model::instance_mutex;

Credentials Credentials::defaults() {

    Credentials c;
    c.developers_name = PLINE2IFC_ORGANIZATION;
    c.application_name = PLINE2IFC_FULLNAME;
    c.application_id = PLINE2IFC_NAME;
    c.application_version = PLINE2IFC_VERSION;
    c.editors_family_name = PLINE2IFC_AUTHOR_FAMILY_NAME;
    c.editors_given_name = PLINE2IFC_AUTHOR_GIVEN_NAME;
    c.editors_organisation_name = PLINE2IFC_ORGANIZATION;
    return c;
}

Model::Model(std::string _project_name, Credentials _credentials, bool with_project) : project_name_(std::move(_project_name)),
                                                                                       credentials_(std::move(_credentials)),
                                                                                       file_(new IfcParse::IfcFile(&IfcSchema::get_schema())),
                                                                                       transaction_active(false),
                                                                                       project_(nullptr),
                                                                                       context_(nullptr),
                                                                                       owner_history_(nullptr),
                                                                                       material_usage_(nullptr) {
    set_header();

    if (with_project)
        create_project();
}

Model &Model::get_or_create() {

    Model *m = instance.load(std::memory_order_acquire);

    if (m == nullptr) {

        std::lock_guard<std::mutex> lock(instance_mutex);
        m = instance.load(std::memory_order_relaxed);

        if (m == nullptr) {
            std::unique_ptr<Model> created(new Model(PLINE2IFC_DEFAULT_PROJECT));
            auto building = Builder::create_building(*created, PLINE2IFC_DEFAULT_BUILDING);
            Builder::create_storey(*created, PLINE2IFC_DEFAULT_STOREY, 0, building);

            instance_owner = std::move(created);
            m = instance_owner.get();
            instance.store(m, std::memory_order_release);
        }
    }

    return *m;
}

void Model::set_header() {

    file_->header().file_name().name(file_name());
    file_->header().file_name().author(std::vector<std::string>{credentials_.editors_given_name + " " + credentials_.editors_family_name});
    file_->header().file_name().organization(std::vector<std::string>{credentials_.editors_organisation_name});
    file_->header().file_name().originating_system(credentials_.application_name + " " + credentials_.application_version);
    file_->header().file_description().description(std::vector<std::string>{"ViewDefinition [CoordinationView]"});
}

void Model::create_project() {

    if (project_ != nullptr || ice::instances<IfcSchema::IfcProject>(file_.get())->size() != 0)
        throw InvalidState("Model " + project_name_ + " already has a project.");

    run_in_transaction("Create project", [this](Transaction &t) {

        // owner history
        auto Person = t.add(ice::IfcPerson<IfcSchema>(credentials_.editors_given_name, credentials_.editors_family_name));
        auto Organization = t.add(ice::IfcOrganization<IfcSchema>(credentials_.editors_organisation_name));
        auto Developer = t.add(ice::IfcOrganization<IfcSchema>(credentials_.developers_name));
        auto PersonAndOrganization = t.add(ice::IfcPersonAndOrganization<IfcSchema>(Person, Organization));
        auto Application = t.add(ice::IfcApplication<IfcSchema>(Developer, credentials_.application_version, credentials_.application_name, credentials_.application_id));
        auto OwnerHistory = t.add(ice::IfcOwnerHistory<IfcSchema>(PersonAndOrganization, Application, int(std::time(nullptr))));

        // units
        IfcEntityList::ptr units(new IfcEntityList);
        units->push(t.add(ice::IfcSIUnit<IfcSchema>(IfcSchema::IfcUnitEnum::IfcUnit_LENGTHUNIT, IfcSchema::IfcSIPrefix::IfcSIPrefix_MILLI, IfcSchema::IfcSIUnitName::IfcSIUnitName_METRE)));
        units->push(t.add(ice::IfcSIUnit<IfcSchema>(IfcSchema::IfcUnitEnum::IfcUnit_AREAUNIT, IfcSchema::IfcSIUnitName::IfcSIUnitName_SQUARE_METRE)));
        units->push(t.add(ice::IfcSIUnit<IfcSchema>(IfcSchema::IfcUnitEnum::IfcUnit_VOLUMEUNIT, IfcSchema::IfcSIUnitName::IfcSIUnitName_CUBIC_METRE)));
        units->push(t.add(ice::IfcSIUnit<IfcSchema>(IfcSchema::IfcUnitEnum::IfcUnit_PLANEANGLEUNIT, IfcSchema::IfcSIUnitName::IfcSIUnitName_RADIAN)));
        auto UnitAssignment = t.add(ice::IfcUnitAssignment<IfcSchema>(units));

        // single representation context, shared by all shape representations
        auto Origin = t.add(ice::IfcCartesianPoint<IfcSchema>(0, 0, 0));
        auto WorldCoordinateSystem = t.add(ice::IfcAxis2Placement3D<IfcSchema>(Origin, nullptr, nullptr));
        auto TrueNorth = t.add(ice::IfcDirection<IfcSchema>(0, 1));
        auto Context = t.add(ice::IfcGeometricRepresentationContext<IfcSchema>("Model", WorldCoordinateSystem, TrueNorth, 1.0e-5));

        IfcTemplatedEntityList<IfcSchema::IfcRepresentationContext>::ptr contexts(new IfcTemplatedEntityList<IfcSchema::IfcRepresentationContext>);
        contexts->push(Context);
        auto Project = t.add(ice::IfcProject<IfcSchema>(OwnerHistory, project_name_, contexts, UnitAssignment));

        // default wall material
        auto Material = t.add(ice::IfcMaterial<IfcSchema>("Default material"));
        auto MaterialLayer = t.add(ice::IfcMaterialLayer<IfcSchema>(Material, 10));
        auto MaterialLayerSet = t.add(ice::IfcMaterialLayerSet<IfcSchema>(ice::entity_list<IfcSchema::IfcMaterialLayer>(MaterialLayer), "Default layer set"));
        auto MaterialUsage = t.add(ice::IfcMaterialLayerSetUsage<IfcSchema>(MaterialLayerSet,
                                                                            IfcSchema::IfcLayerSetDirectionEnum::IfcLayerSetDirection_AXIS2,
                                                                            IfcSchema::IfcDirectionSenseEnum::IfcDirectionSense_NEGATIVE,
                                                                            150));

        t.on_commit([this, Project, Context, OwnerHistory, MaterialUsage]() {
            project_ = Project;
            context_ = Context;
            owner_history_ = OwnerHistory;
            material_usage_ = MaterialUsage;
        });

        return Project;
    });
}

std::string Model::schema_name() { return IfcSchema::get_schema().name(); }

IfcSchema::IfcBuilding::list::ptr Model::buildings() const { return ice::instances<IfcSchema::IfcBuilding>(file_.get()); }

IfcSchema::IfcBuildingStorey::list::ptr Model::storeys() const { return ice::instances<IfcSchema::IfcBuildingStorey>(file_.get()); }

IfcSchema::IfcWall::list::ptr Model::walls() const { return ice::instances<IfcSchema::IfcWall>(file_.get()); }

IfcSchema::IfcSpace::list::ptr Model::spaces() const { return ice::instances<IfcSchema::IfcSpace>(file_.get()); }

IfcSchema::IfcBuildingStorey *Model::first_storey() const {

    auto S = storeys();
    if (S->size() == 0)
        throw InvalidState("Model " + project_name_ + " has no storey.");

    return *S->begin();
}

bool Model::contains(IfcUtil::IfcBaseClass *entity) const { return entity != nullptr && entity->data().file == file_.get(); }
