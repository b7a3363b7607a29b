// Copyright 2022 Eric Fichter
#include "Kernel.h"

double Kernel::volume(const TopoDS_Shape &shape) {
    GProp_GProps gprop;
    BRepGProp::VolumeProperties(shape, gprop);
    return gprop.Mass();
}

TopoDS_Shape Kernel::geom_object_to_shape(IfcGeom::Element<real_t> *geom_object) {

    const auto *o = dynamic_cast<const IfcGeom::BRepElement<real_t> *>(geom_object);
    if (o == nullptr) return {};

    TopoDS_Shape shape = o->geometry().as_compound();
    gp_Trsf trsf = o->transformation().data();
    shape.Move(trsf);
    return shape;
}

bool Kernel::read_ifc_file(const std::string &ifc_path, std::unique_ptr<IfcParse::IfcFile> &model) {

    auto start = std::chrono::high_resolution_clock::now();

    model = std::make_unique<IfcParse::IfcFile>(ifc_path);

    auto finish = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = finish - start;
    std::cout << print_time(elapsed.count(), "Parse ifc file", "");

    if (!model->good()) {
        std::cerr << "[Error] Unable to parse .ifc file " << ifc_path << ". " << model->good().value() << "\n";
        return false;
    }

    return true;
}

bool Kernel::write_ifc_file(IfcParse::IfcFile *model, const std::string &output_filename) {

    auto start = std::chrono::high_resolution_clock::now();

    std::ofstream f(output_filename);
    if (!f.is_open()) {
        std::cerr << "[Error] Cannot open " << output_filename << " for writing." << std::endl;
        return false;
    }

    f << *model;
    f.close();

    auto finish = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = finish - start;
    std::cout << print_time(elapsed.count(), "Write Ifc file", output_filename);

    if (f.fail()) {
        std::cerr << "[Error] Writing " << output_filename << " failed." << std::endl;
        return false;
    }

    return true;
}

bool Kernel::file_exists(const std::string &filename) {
    std::ifstream file(IfcUtil::path::from_utf8(filename).c_str());
    return file.good();
}

std::string Kernel::change_extension(const std::string &fn, const std::string &ext) {
    std::string::size_type dot = fn.find_last_of('.');
    std::string::size_type sep = fn.find_last_of("/\\");
    if (dot != std::string::npos && (sep == std::string::npos || dot > sep))
        return fn.substr(0, dot) + ext;
    else
        return fn + ext;
}

double Kernel::round_double_to_n_decimal_places(double d, unsigned int n) {
    unsigned int f = pow(10, n);
    return std::round(d * f) / f;
}

std::string Kernel::print_time(double t, const std::string &s1, const std::string &s2) {

    int c = 68; // tabstop
    int places = 4; // number of decimal places

    std::string r;

    if (s2.empty())
        r = s1;
    else
        r = s1 + " (" + s2 + ")";

    std::string a;
    int n = c - (int) r.size();
    if (n > 0)
        a = std::string(n, ' ');

    double t_rounded = round_double_to_n_decimal_places(t, places);
    std::string time = std::to_string(t_rounded);
    std::vector<std::string> token = split_string_by_character(time, '.');

    if (token.size() == 1) // add zeros
        time = token[0] + "." + std::string(places, '0');
    else if (token.size() == 2) {
        if (token[1].size() < (unsigned int) places) // add zeros
            time = token[0] + "." + token[1] + std::string(places - token[1].size(), '0');
        else  // cut
            time = token[0] + "." + token[1].substr(0, places);
    }

    r += a + " ... \tElapsed time: " + time + " s\n";
    return r;
}

std::vector<std::string> Kernel::split_string_by_character(const std::string &s, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(s);
    while (std::getline(tokenStream, token, delimiter))
        tokens.push_back(token);
    return tokens;
}

std::string Kernel::point_to_string(const gp_Pnt2d &p) {
    std::ostringstream ss;
    ss << "(" << p.X() << ", " << p.Y() << ")";
    return ss.str();
}
