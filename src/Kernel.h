// Copyright 2022 Eric Fichter
#ifndef KERNEL_H
#define KERNEL_H

#include "headers.h"

//! Static helper functions shared by the model, the validator and the command line tool.
class Kernel {

public:

    static double volume(const TopoDS_Shape &shape);

    //! Converts a geometry iterator element to a shape in world coordinates.
    static TopoDS_Shape geom_object_to_shape(IfcGeom::Element<real_t> *geom_object);

    //! Parses an ifc file. Returns false, if the file is not readable.
    static bool read_ifc_file(const std::string &ifc_path, std::unique_ptr<IfcParse::IfcFile> &model);

    //! Serializes the model to the given path. Returns false, if the stream could not be written.
    static bool write_ifc_file(IfcParse::IfcFile *model, const std::string &output_filename);

    static bool file_exists(const std::string &filename);

    //! Replaces the extension of a path (or appends it, if there is none).
    static std::string change_extension(const std::string &fn, const std::string &ext);

    static double round_double_to_n_decimal_places(double d, unsigned int n);

    //! Aligned line with the elapsed time of a stage, e.g. "Create walls (12)  ...  Elapsed time: 0.0012 s".
    static std::string print_time(double t, const std::string &s1, const std::string &s2);

    static std::vector<std::string> split_string_by_character(const std::string &s, char delimiter);

    static std::string point_to_string(const gp_Pnt2d &p);
};

#endif //KERNEL_H
