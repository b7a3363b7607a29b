// Copyright 2022 Eric Fichter
#ifndef IFCCHECK_H
#define IFCCHECK_H

#include "headers.h"

//! Structural and geometric validation of an IFC4 building model. The checks run on construction.
//! Relationships are resolved by scanning the relationship entities, so a freshly created file and a parsed file are treated alike.
class IfcCheck {

public:
    IfcCheck(IfcParse::IfcFile *_model, unsigned int _num_threads, bool _check_geometry = true);

    enum model_errors {
        MISSING_ATTRIBUTE,
        DUPLICATE_GUID,
        WRONG_NUMBER_OF_PROJECTS,
        WRONG_NUMBER_OF_CONTEXTS,
        NOT_AGGREGATED,
        NOT_CONTAINED,
        FOREIGN_CONTEXT,
        MISSING_MATERIAL_USAGE,
        NON_POSITIVE_DIMENSION,
        ZERO_DIRECTION,
        INVALID_SHAPE,
        NON_POSITIVE_VOLUME
    };

    struct Violation {
        unsigned int id; // 0 for violations of the whole model
        std::string type;
        std::string guid;
        model_errors error;

        Violation(unsigned int _id, std::string _type, std::string _guid, model_errors _error) : id(_id), type(std::move(_type)), guid(std::move(_guid)), error(_error) {}
    };

    size_t count() const { return violations.size(); }

    bool valid() const { return violations.empty(); }

    const std::list<Violation> &get_violations() const { return violations; }

    //! Writes one line per violation.
    void report(std::ostream &os) const;

    static std::string error_to_string(model_errors error);

    //! INVALID_SHAPE for null or defective shapes, NON_POSITIVE_VOLUME for valid shapes without volume, none otherwise.
    static boost::optional<model_errors> shape_error(const TopoDS_Shape &shape);

private:
    IfcParse::IfcFile *model;
    IfcGeom::IteratorSettings settings;
    const unsigned int num_threads;
    const bool check_geometry;

    std::list<Violation> violations;
    IfcUtil::IfcBaseClass *model_context;

    void check_model();

    void check_attributes();

    void check_guids();

    void check_project_and_context();

    void check_decomposition();

    void check_representation_contexts();

    void check_material_usages();

    void check_dimensions();

    void check_directions();

    void check_wall_shapes();

    //! Prints ok or the list of errors for every spatial element and wall.
    void evaluation() const;

    void add(IfcUtil::IfcBaseClass *entity, model_errors error);

    static std::string guid_of(IfcUtil::IfcBaseClass *entity);
};

#endif //IFCCHECK_H
