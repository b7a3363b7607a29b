// Copyright 2022 Eric Fichter
#ifndef DEFINITIONS_H
#define DEFINITIONS_H

#define IFCCONVERT_DOUBLE_PRECISION
#define PLINE2IFC_VERSION "0.1"
#define PLINE2IFC_FULLNAME "Polyline-based IFC Wall Generator"
#define PLINE2IFC_NAME "Pline2Ifc"
#define PLINE2IFC_AUTHOR_GIVEN_NAME "Eric"
#define PLINE2IFC_AUTHOR_FAMILY_NAME "Fichter"
#define PLINE2IFC_ORGANIZATION "Institute of Energy Efficiency and Sustainable Building at RWTH Aachen University"
#define PLINE2IFC_DEFAULT_PROJECT "TestProject"
#define PLINE2IFC_DEFAULT_BUILDING "Default building"
#define PLINE2IFC_DEFAULT_STOREY "Default storey"

#ifdef IFCCONVERT_DOUBLE_PRECISION
typedef double real_t;
#else
typedef float real_t;
#endif

//! The model is always written in IFC4.
typedef Ifc4 IfcSchema;

//! Type of a polyline segment, following the light-weight polyline definition of CAD applications.
enum segment_type {
    SEGMENT_LINE,           // Straight segment between two distinct vertices.
    SEGMENT_ARC,            // Circular segment, vertex has a non-zero bulge.
    SEGMENT_COINCIDENT      // Start and end vertex coincide.
};

//! Outcome of the conversion of a single segment.
enum segment_status {
    SEGMENT_WALL,
    SEGMENT_SKIPPED
};

//! Why a segment did not produce a wall.
enum skip_reason {
    SKIP_NONE,
    SKIP_ARC_SEGMENT,
    SKIP_COINCIDENT_SEGMENT
};

//! Defines what happens to the output file if the validation of the model fails.
enum save_policy {
    SAVE_IF_VALID,      // Only a valid model is written.
    SAVE_WITH_REPORT    // The model is always written, accompanied by a validation report.
};

//! Wall dimensions used if the polyline does not define its own.
struct WallDefaults {
    double width;
    double height;

    WallDefaults() : width(0.5), height(2.0) {}

    WallDefaults(double width, double height) : width(width), height(height) {}
};

//! A precondition of a model operation is not met, e.g. a building is requested for a model without project.
class InvalidState : public std::logic_error {
public:
    explicit InvalidState(const std::string &what) : std::logic_error(what) {}
};

//! Transactions are used in a wrong way, e.g. a second transaction is started while another one is active.
class TransactionError : public std::logic_error {
public:
    explicit TransactionError(const std::string &what) : std::logic_error(what) {}
};

//! Polyline input could not be read.
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string &what) : std::runtime_error(what) {}
};

#endif //DEFINITIONS_H
