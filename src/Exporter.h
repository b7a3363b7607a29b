// Copyright 2022 Eric Fichter
#ifndef EXPORTER_H
#define EXPORTER_H

#include "headers.h"
#include "Model.h"
#include "IfcCheck.h"

struct ValidationReport {
    size_t count;
    std::list<IfcCheck::Violation> violations;
    bool written;
    std::string output_path;
    std::string report_path; // empty, if no report was written

    bool valid() const { return count == 0; }
};

//! Validates a model and persists it according to a save policy.
class Exporter {

public:
    //! Validates first. With SAVE_IF_VALID the file is written only for a valid model, with SAVE_WITH_REPORT it is always written together with <output>.validation.txt.
    //! \param output Path of the ifc file. If empty, the file name of the model in the working directory is used.
    static ValidationReport validate_and_save(Model &model, save_policy policy = SAVE_IF_VALID, const std::string &output = "", unsigned int num_threads = 1, bool check_geometry = true);

    static std::string report_path_for(const std::string &output) { return output + ".validation.txt"; }
};

#endif //EXPORTER_H
