// Copyright 2022 Eric Fichter
#ifndef MODEL_H
#define MODEL_H

#include "headers.h"
#include "Transaction.h"

//! Metadata written to the owner history and the file header. Has no effect on the model content.
struct Credentials {
    std::string developers_name;
    std::string application_name;
    std::string application_id;
    std::string application_version;
    std::string editors_family_name;
    std::string editors_given_name;
    std::string editors_organisation_name;

    static Credentials defaults();
};

//! In-memory IFC4 building model. Owns the ifc file and the entities shared by all walls (context, owner history, material usage).
//! Mutation is single writer: all changes run in transactions and only one transaction can be active.
class Model {

    friend class Transaction;

public:
    //! \param _project_name Name of the IfcProject, file name is <project name>.ifc
    //! \param _credentials Application and editor data
    //! \param with_project Creates project, units, context and default material. Without, the model is empty.
    explicit Model(std::string _project_name, Credentials _credentials = Credentials::defaults(), bool with_project = true);

    Model(const Model &) = delete;

    Model &operator=(const Model &) = delete;

    //! The process-wide model. Created once with default project, building and storey, also under concurrent first access.
    static Model &get_or_create();

    //! Creates owner history, units, representation context, the project and the default wall material in one transaction.
    void create_project();

    //! Runs body in a transaction. Returns the result of body if committed and a value-initialised result if body aborted the transaction.
    //! Exceptions thrown by body roll back the transaction and propagate.
    template<typename Body>
    auto run_in_transaction(const std::string &label, Body body) -> decltype(body(std::declval<Transaction &>())) {

        typedef decltype(body(std::declval<Transaction &>())) result_t;

        Transaction t(*this, label);
        result_t result = result_t();

        try { result = body(t); }
        catch (const std::exception &e) {
            std::cerr << "[Warning] Transaction '" << t.label() << "' rolled back. " << e.what() << std::endl;
            throw;
        }

        // body may have committed or aborted on its own
        if (!t.active())
            return t.committed() ? result : result_t();

        t.commit();
        return result;
    }

    IfcParse::IfcFile *file() const { return file_.get(); }

    const std::string &project_name() const { return project_name_; }

    std::string file_name() const { return project_name_ + ".ifc"; }

    static std::string schema_name();

    const Credentials &credentials() const { return credentials_; }

    IfcSchema::IfcProject *project() const { return project_; }

    IfcSchema::IfcGeometricRepresentationContext *context() const { return context_; }

    IfcSchema::IfcOwnerHistory *owner_history() const { return owner_history_; }

    IfcSchema::IfcMaterialLayerSetUsage *wall_material_usage() const { return material_usage_; }

    IfcSchema::IfcBuilding::list::ptr buildings() const;

    IfcSchema::IfcBuildingStorey::list::ptr storeys() const;

    IfcSchema::IfcWall::list::ptr walls() const;

    IfcSchema::IfcSpace::list::ptr spaces() const;

    //! First storey in creation order. Throws InvalidState, if there is none.
    IfcSchema::IfcBuildingStorey *first_storey() const;

    //! True, if the entity is committed to this model.
    bool contains(IfcUtil::IfcBaseClass *entity) const;

    bool in_transaction() const { return transaction_active; }

private:
    const std::string project_name_;
    const Credentials credentials_;
    std::unique_ptr<IfcParse::IfcFile> file_;
    std::atomic<bool> transaction_active;

    IfcSchema::IfcProject *project_;
    IfcSchema::IfcGeometricRepresentationContext *context_;
    IfcSchema::IfcOwnerHistory *owner_history_;
    IfcSchema::IfcMaterialLayerSetUsage *material_usage_;

    void set_header();

    static std::atomic<Model *> instance;
    static std::unique_ptr<Model> instance_owner;
    static std::mutex instance_mutex;
};

#endif //MODEL_H
