// Copyright 2022 Eric Fichter
#ifndef CONVERTER_H
#define CONVERTER_H

#include "headers.h"
#include "Model.h"
#include "Polyline.h"
#include "InputReader.h"
#include "Exporter.h"

//! Structures the conversion of polylines to an IFC4 wall model.
//! Reads the input, builds project, building and storey, creates one wall per line segment, validates and writes the model.
class Converter {

public:
    //! _input: Path and name of the polyline input file.
    //! _output: Path and name of the ifc file. If empty, <project name>.ifc is used.
    //! _num_threads: Number of threads used for the geometry check.
    //! _project: Project name. Overrides the input file, if set.
    //! _building: Building name, if the input file has none.
    //! _storey: Storey name, if the input file has none.
    //! _elevation: Storey elevation, if the input file has none.
    //! _defaults: Wall width and height for polylines without own values.
    //! _create_spaces: If true, one IfcSpace is created per closed polyline, bounded by its walls.
    //! _force: If true, an invalid model is written too, accompanied by a validation report.
    //! _check_geometry: If false, the shape check of the walls is skipped.
    //! _overwrite: If false, an existing output file is not replaced.
    Converter(std::string _input,
              std::string _output,
              unsigned int _num_threads,
              boost::optional<std::string> _project,
              std::string _building,
              std::string _storey,
              double _elevation,
              WallDefaults _defaults,
              bool _create_spaces,
              bool _force,
              bool _check_geometry,
              bool _overwrite
    );

    //! Starts the conversion. Returns true, if the model was written and is valid (or written with report, if forced).
    bool run();

    unsigned int get_walls_created() const { return walls_created; }

    unsigned int get_spaces_created() const { return spaces_created; }

    unsigned int get_segments_skipped() const { return segments_skipped; }

    unsigned int get_segments_failed() const { return segments_failed; }

    const ValidationReport &get_report() const { return report; }

    //! Null before run().
    Model *get_model() const { return model.get(); }

private:
    const std::string input;
    std::string output;
    const unsigned int num_threads;
    const boost::optional<std::string> project;
    const std::string building_name;
    const std::string storey_name;
    const double elevation;
    const WallDefaults defaults;
    const bool create_spaces;
    const bool force;
    const bool check_geometry;
    const bool overwrite;

    InputData data;
    std::unique_ptr<Model> model;
    IfcSchema::IfcBuildingStorey *storey;

    unsigned int walls_created;
    unsigned int spaces_created;
    unsigned int segments_skipped;
    unsigned int segments_failed;
    ValidationReport report;

    bool read_input();

    bool prepare_model();

    bool process_polylines();

    bool save();

    void summary() const;
};

#endif //CONVERTER_H
