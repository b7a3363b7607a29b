// Copyright 2022 Eric Fichter
#include "Converter.h"
#include "Builder.h"
#include "Kernel.h"

Converter::Converter(std::string _input,
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
                     bool _overwrite) :
        input(std::move(_input)),
        output(std::move(_output)),
        num_threads(_num_threads),
        project(std::move(_project)),
        building_name(std::move(_building)),
        storey_name(std::move(_storey)),
        elevation(_elevation),
        defaults(_defaults),
        create_spaces(_create_spaces),
        force(_force),
        check_geometry(_check_geometry),
        overwrite(_overwrite),
        storey(nullptr),
        walls_created(0),
        spaces_created(0),
        segments_skipped(0),
        segments_failed(0),
        report() {}

bool Converter::run() {

    if (!read_input())
        return false;

    if (!prepare_model())
        return false;

    if (!process_polylines())
        return false;

    bool status = save();
    summary();

    return status;
}

bool Converter::read_input() {

    std::cout << "\n### Input" << std::endl;

    auto start = std::chrono::high_resolution_clock::now();

    try { data = InputReader::read(input); }
    catch (const InputError &e) {
        std::cerr << "[Error] " << e.what() << std::endl;
        return false;
    }

    auto finish = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = finish - start;
    std::cout << Kernel::print_time(elapsed.count(), "Read polylines", std::to_string(data.polylines.size()));

    if (data.polylines.empty())
        std::cerr << "[Warning] Input file " << input << " contains no polylines." << std::endl;

    return true;
}

bool Converter::prepare_model() {

    std::cout << "\n### Model" << std::endl;

    auto start = std::chrono::high_resolution_clock::now();

    std::string project_name = PLINE2IFC_DEFAULT_PROJECT;
    if (project) project_name = *project;
    else if (data.project) project_name = *data.project;

    try {
        model = std::make_unique<Model>(project_name, data.credentials ? *data.credentials : Credentials::defaults());

        auto Building = Builder::create_building(*model, data.building ? *data.building : building_name);
        storey = Builder::create_storey(*model, data.storey ? *data.storey : storey_name, data.elevation ? *data.elevation : elevation, Building);
    }
    catch (const IfcParse::IfcException &e) {
        std::cerr << "[Error] Model creation failed. " << e.what() << std::endl;
        return false;
    }
    catch (const std::logic_error &e) {
        std::cerr << "[Error] Model creation failed. " << e.what() << std::endl;
        return false;
    }

    if (output.empty())
        output = model->file_name();

    auto finish = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = finish - start;
    std::cout << Kernel::print_time(elapsed.count(), "Create project, building and storey", project_name);

    return true;
}

bool Converter::process_polylines() {

    std::cout << "\n### Walls" << std::endl;

    auto start = std::chrono::high_resolution_clock::now();

    Extractor extractor(defaults);
    unsigned int n = 0;

    std::cout << "Default wall width " << extractor.get_defaults().width << ", height " << extractor.get_defaults().height << std::endl;

    for (const auto &polyline: data.polylines) {

        std::cout << "Polyline " << polyline.get_name() << " (" << polyline.number_of_segments() << " segments" << (polyline.is_closed() ? ", closed" : "") << ")" << std::endl;

        std::vector<IfcSchema::IfcWallStandardCase *> walls;

        for (const auto &result: extractor.extract(polyline, std::cout)) {

            if (!result.is_wall()) {
                segments_skipped++;
                continue;
            }

            const WallParameters &w = result.wall;

            try {
                walls.push_back(Builder::create_wall(*model, w.pos_x, w.pos_y, w.dir_x, w.dir_y, w.dir_z, w.length, w.width, w.height, storey));
                walls_created++;
            }
            catch (const std::exception &e) {
                std::cerr << "[Warning] Segment " << result.index << " of polyline " << polyline.get_name() << " skipped. Wall creation failed. " << e.what() << std::endl;
                segments_failed++;
            }
        }

        n++;

        if (!create_spaces || !polyline.is_closed()) continue;

        try {
            Builder::create_space(*model, storey, walls, polyline.get_name(), "Bounded by polyline " + polyline.get_name(), "Space " + std::to_string(n));
            spaces_created++;
        }
        catch (const std::exception &e) {
            std::cerr << "[Warning] Space of polyline " << polyline.get_name() << " not created. " << e.what() << std::endl;
        }
    }

    auto finish = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = finish - start;
    std::cout << Kernel::print_time(elapsed.count(), "Create walls", std::to_string(walls_created));

    return true;
}

bool Converter::save() {

    std::cout << "\n### Output" << std::endl;

    if (!overwrite && Kernel::file_exists(output)) {
        std::cerr << "[Error] Output file " << output << " already exists. Use --yes to overwrite it." << std::endl;
        return false;
    }

    try { report = Exporter::validate_and_save(*model, force ? SAVE_WITH_REPORT : SAVE_IF_VALID, output, num_threads, check_geometry); }
    catch (const std::exception &e) {
        std::cerr << "[Error] Validation failed. " << e.what() << std::endl;
        return false;
    }

    if (!report.written)
        return false;

    return report.valid() || force;
}

void Converter::summary() const {

    std::cout << "\n### Summary" << std::endl;
    std::cout << "Walls created:       " << walls_created << "\n";
    if (create_spaces) std::cout << "Spaces created:      " << spaces_created << "\n";
    std::cout << "Segments skipped:    " << segments_skipped << "\n";
    std::cout << "Segments failed:     " << segments_failed << "\n";
    std::cout << "Violations:          " << report.count << "\n";
    if (report.written) std::cout << "Output file:         " << report.output_path << "\n";
    if (!report.report_path.empty()) std::cout << "Validation report:   " << report.report_path << "\n";
}
