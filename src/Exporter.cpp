// Copyright 2022 Eric Fichter
#include "Exporter.h"
#include "Kernel.h"

ValidationReport Exporter::validate_and_save(Model &model, save_policy policy, const std::string &output, unsigned int num_threads, bool check_geometry) {

    if (model.in_transaction())
        throw TransactionError("Model " + model.project_name() + " cannot be saved during an active transaction.");

    ValidationReport R{};
    R.output_path = output.empty() ? model.file_name() : output;

    IfcCheck check(model.file(), num_threads, check_geometry);
    R.count = check.count();
    R.violations = check.get_violations();

    if (!R.valid()) {
        std::cerr << "[Warning] Model " << model.project_name() << " has " << R.count << " violations." << std::endl;

        if (policy == SAVE_IF_VALID) {
            std::cerr << "[Warning] Invalid model is not written to " << R.output_path << "." << std::endl;
            return R;
        }
    }

    R.written = Kernel::write_ifc_file(model.file(), R.output_path);

    if (policy == SAVE_WITH_REPORT) {
        std::string path = report_path_for(R.output_path);
        std::ofstream f(path);
        check.report(f);
        f.close();
        if (f.fail())
            std::cerr << "[Error] Cannot write validation report " << path << "." << std::endl;
        else
            R.report_path = path;
    }

    return R;
}
