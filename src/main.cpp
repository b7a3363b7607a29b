// Copyright 2022 Eric Fichter
#include "headers.h"
#include "Converter.h"
#include "Kernel.h"

//!\mainpage Pline2Ifc - Generation of IFC4 wall models from 2D polylines
//! Every straight segment of a light-weight polyline becomes an IfcWallStandardCase, placed in a single storey of a single building.
//! Arc segments and zero length segments are reported and skipped. The finished model is validated before it is written.
//!
//!  Developer:\n Eric Fichter\n RWTH Aachen University – Institute of Energy Efficiency and Sustainable Building E3D\n fichter@e3d.rwth-aachen.de

namespace po = boost::program_options;

void print_usage(bool suggest_help = true) {
    std::cout << "\nUsage: Pline2Ifc [options] <input.json> [<output>]\n"
              << "\n"
              << "Generation of IFC4 walls from 2D polylines.\n"
              << "If no output filename given, <project name>.ifc will be used as the output file.\n";
    if (suggest_help) std::cout << "\nRun 'Pline2Ifc --help' for more information.";
    std::cout << std::endl;
}

void print_options(const po::options_description &options) {
    std::cout << "\n" << options;
    std::cout << std::endl;
}

void print_version() {
    std::cout << PLINE2IFC_NAME << " " << PLINE2IFC_VERSION << " (uses OCCT " << OCC_VERSION_STRING_EXT << " and IfcOpenShell " << IFCOPENSHELL_VERSION << ")\n";
}

int main(int argc, char **argv) {

    typedef po::command_line_parser command_line_parser;

    unsigned int num_threads;
    std::string project;
    std::string building;
    std::string storey;
    double elevation;
    double width;
    double height;

    // Generic options
    po::options_description generic_options("Command line options");
    generic_options.add_options()
            ("help,h", "display usage information")
            ("version,v", "display version information")
            ("yes,y", "answer 'yes' automatically to possible confirmation queries (e.g. overwriting an existing output file)")
            ("threads,j", po::value<unsigned int>(&num_threads)->default_value(1), "Number of parallel processing threads for the geometry check");

    // File options
    po::options_description fileio_options;
    fileio_options.add_options()
            ("input-file", new po::typed_value<std::string, char>(nullptr), "input polyline file")
            ("output-file", new po::typed_value<std::string, char>(nullptr), "output IFC file");

    // Model options
    po::options_description model_options("Model options");
    model_options.add_options()
            ("project,p", po::value<std::string>(&project), "Project name, overrides the input file (default: " PLINE2IFC_DEFAULT_PROJECT ")")
            ("building", po::value<std::string>(&building)->default_value(PLINE2IFC_DEFAULT_BUILDING), "Building name, if the input file has none")
            ("storey", po::value<std::string>(&storey)->default_value(PLINE2IFC_DEFAULT_STOREY), "Storey name, if the input file has none")
            ("elevation", po::value<double>(&elevation)->default_value(0, "0"), "Storey elevation, if the input file has none")
            ("space", "Create one IfcSpace per closed polyline, bounded by its walls");

    // Wall options
    WallDefaults defaults;
    po::options_description wall_options("Wall options");
    wall_options.add_options()
            ("width", po::value<double>(&width)->default_value(defaults.width, "0.5"), "Wall width for polylines without own width")
            ("height", po::value<double>(&height)->default_value(defaults.height, "2"), "Wall height for polylines without own height");

    // Validation options
    po::options_description check_options("Validation options");
    check_options.add_options()
            ("force", "Write the model even if the validation fails, together with a validation report")
            ("nogeometry", "Skip the shape check of the walls");

    // Command line options
    po::options_description cmdline_options;
    cmdline_options.add(generic_options).add(fileio_options).add(model_options).add(wall_options).add(check_options);

    // Positional options
    po::positional_options_description positional_options;
    positional_options.add("input-file", 1);
    positional_options.add("output-file", 1);

    po::variables_map vmap;
    try {
        po::store(command_line_parser(argc, argv).options(cmdline_options).positional(positional_options).run(), vmap);
        po::notify(vmap);
    } catch (const po::unknown_option &e) {
        std::cerr << "[Error] Unknown option '" << e.get_option_name().c_str() << "'\n\n";
        print_usage();
        return EXIT_FAILURE;
    } catch (const po::error_with_option_name &e) {
        std::cerr << "[Error] Invalid usage of '" << e.get_option_name().c_str() << "': " << e.what() << "\n\n";
        return EXIT_FAILURE;
    } catch (const std::exception &e) {
        std::cerr << "[Error] " << e.what() << "\n\n";
        print_usage();
        return EXIT_FAILURE;
    }

    if (vmap.count("version")) {
        print_version();
        return EXIT_SUCCESS;
    } else if (vmap.count("help")) {
        print_usage(false);
        print_options(generic_options.add(model_options).add(wall_options).add(check_options));
        return EXIT_SUCCESS;
    } else if (!vmap.count("input-file")) {
        std::cerr << "[Error] Input file not specified!" << std::endl;
        print_usage();
        return EXIT_FAILURE;
    }

    // input filename
    const std::string input_filename = vmap["input-file"].as<std::string>();
    if (!Kernel::file_exists(input_filename)) {
        std::cerr << "[Error] Input file '" << input_filename << "' does not exist!" << std::endl;
        return EXIT_FAILURE;
    }

    if (width <= 0 || height <= 0) {
        std::cerr << "[Error] Wall width and height must be positive!" << std::endl;
        return EXIT_FAILURE;
    }

    // output filename, empty means <project name>.ifc
    std::string output_filename;
    bool overwrite = vmap.count("yes") != 0;

    if (vmap.count("output-file") == 1) {
        output_filename = Kernel::change_extension(vmap["output-file"].as<std::string>(), ".ifc");

        if (output_filename.size() < 5) {
            std::cerr << "[Error] Invalid or unsupported output file '" << output_filename << "' given!" << std::endl;
            print_usage();
            return EXIT_FAILURE;
        }

        if (Kernel::file_exists(output_filename) && !overwrite) {
            std::string answer;
            std::cout << "A file '" << output_filename << "' already exists. Overwrite the existing file (y/n)?" << std::endl;
            std::cin >> answer;
            if (!boost::iequals(answer, "yes") && !boost::iequals(answer, "y")) {
                return EXIT_SUCCESS;
            }
            overwrite = true;
        }
    }

    // number of threads
    if (num_threads <= 0 || num_threads > std::thread::hardware_concurrency())
        num_threads = std::thread::hardware_concurrency();

    boost::optional<std::string> project_override;
    if (vmap.count("project")) project_override = project;

    const bool create_spaces = vmap.count("space") != 0;
    const bool force = vmap.count("force") != 0;
    const bool check_geometry = vmap.count("nogeometry") == 0;

    // user info
    std::cout << "\n";
    std::cout << "\033[1m\033[37m";
    std::cout << "-------------------------------------------------\n";
    std::cout << "### " << PLINE2IFC_FULLNAME << " " << PLINE2IFC_NAME << " ###\n";
    std::cout << "Generation of IFC4 walls from 2D polylines.\n";
    std::cout << "\n";
    std::cout << "#####  #      # #    # ######  ####  # ######  ####  \n";
    std::cout << "#    # #      # ##   # #      #    # # #      #    # \n";
    std::cout << "#####  #      # # #  # #####      #  # #####  #      \n";
    std::cout << "#      #      # #  # # #         #   # #      #      \n";
    std::cout << "#      #      # #   ## #       #     # #      #    # \n";
    std::cout << "#      ###### # #    # ###### ###### # #       ####  \n";
    std::cout << "\n";
    std::cout << "Version:     " << PLINE2IFC_VERSION << " (2022)" << "\n";
    std::cout << "Developer:   " << PLINE2IFC_AUTHOR_GIVEN_NAME << " " << PLINE2IFC_AUTHOR_FAMILY_NAME << "\n";
    std::cout << "Institute:   E3D - Institute of Energy Efficiency and Sustainable Building,\n";
    std::cout << "             RWTH Aachen University \n";
    std::cout << "-------------------------------------------------\n";
    std::cout << "\033[0m";
    std::cout << "\n";
    std::cout << "-------------------------------------------------\n";
    std::cout << "# Arguments\n";
    std::cout << "Input file:          " << input_filename << "\n";
    std::cout << "Output file:         " << (output_filename.empty() ? "<project name>.ifc" : output_filename) << "\n";
    std::cout << "Threads:             " << std::to_string(num_threads) << "\n";
    if (project_override) std::cout << "Project:             " << *project_override << "\n";
    std::cout << "Building:            " << building << "\n";
    std::cout << "Storey:              " << storey << "\n";
    std::cout << "Elevation:           " << elevation << "\n";
    std::cout << "Wall width:          " << width << "\n";
    std::cout << "Wall height:         " << height << "\n";
    std::cout << "Spaces:              " << std::boolalpha << create_spaces << "\n";
    std::cout << "Force:               " << std::boolalpha << force << "\n";
    std::cout << "Geometry check:      " << std::boolalpha << check_geometry << "\n";
    std::cout << "-------------------------------------------------\n";

    std::cout << "\n-------------------------------------------------" << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    bool status;

    try {
        Converter C(input_filename,
                    output_filename,
                    num_threads,
                    project_override,
                    building,
                    storey,
                    elevation,
                    WallDefaults(width, height),
                    create_spaces,
                    force,
                    check_geometry,
                    overwrite);
        status = C.run();
    }
    catch (const std::exception &e) {
        std::cerr << "[Error] " << e.what() << std::endl;
        status = false;
    }

    if (status) std::cout << "Program finished successfully!" << std::endl;
    else std::cout << "Program interrupted by error!" << std::endl;

    auto finish = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = finish - start;
    std::cout << "Total Elapsed time: " << elapsed.count() << " s\n";
    std::cout << "-------------------------------------------------\n";

    return status ? EXIT_SUCCESS : EXIT_FAILURE;
}
