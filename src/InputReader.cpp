// Copyright 2022 Eric Fichter
#include "InputReader.h"

namespace pt = boost::property_tree;

InputData InputReader::read(const std::string &path) {

    std::ifstream f(path);
    if (!f.is_open())
        throw InputError("Cannot open input file " + path + ".");

    return parse(f, path);
}

InputData InputReader::parse(std::istream &is, const std::string &source) {

    pt::ptree root;

    try { pt::read_json(is, root); }
    catch (const pt::json_parser_error &e) {
        throw InputError("Malformed JSON in " + source + ": " + e.what());
    }

    InputData D;

    try {
        D.project = root.get_optional<std::string>("project");
        D.building = root.get_optional<std::string>("building");

        if (auto credentials = root.get_child_optional("credentials"))
            D.credentials = read_credentials(*credentials);

        if (auto storey = root.get_child_optional("storey")) {
            D.storey = storey->get_optional<std::string>("name");
            D.elevation = storey->get_optional<double>("elevation");
        }

        if (auto polylines = root.get_child_optional("polylines")) {
            unsigned int n = 0;
            for (const auto &item: *polylines)
                D.polylines.push_back(read_polyline(item.second, n++));
        }
    }
    catch (const pt::ptree_error &e) {
        throw InputError("Invalid content in " + source + ": " + e.what());
    }

    return D;
}

Credentials InputReader::read_credentials(const pt::ptree &pt) {

    Credentials c = Credentials::defaults();
    c.developers_name = pt.get<std::string>("developersName", c.developers_name);
    c.application_name = pt.get<std::string>("applicationName", c.application_name);
    c.application_id = pt.get<std::string>("applicationId", c.application_id);
    c.application_version = pt.get<std::string>("applicationVersion", c.application_version);
    c.editors_family_name = pt.get<std::string>("editorsFamilyName", c.editors_family_name);
    c.editors_given_name = pt.get<std::string>("editorsGivenName", c.editors_given_name);
    c.editors_organisation_name = pt.get<std::string>("editorsOrganisationName", c.editors_organisation_name);
    return c;
}

Polyline InputReader::read_polyline(const pt::ptree &pt, unsigned int n) {

    Polyline P(pt.get<std::string>("name", "Polyline " + std::to_string(n)), pt.get<bool>("closed", false));
    P.width = pt.get_optional<double>("width");
    P.height = pt.get_optional<double>("height");

    auto vertices = pt.get_child_optional("vertices");
    if (!vertices)
        throw InputError("Polyline " + P.get_name() + " has no vertices.");

    for (const auto &item: *vertices) {
        const pt::ptree &v = item.second;
        P.add_vertex(PolylineVertex(v.get<double>("x"),
                                    v.get<double>("y"),
                                    v.get<double>("bulge", 0),
                                    v.get<double>("startWidth", 0),
                                    v.get<double>("endWidth", 0)));
    }

    if (P.get_vertices().size() < 2)
        throw InputError("Polyline " + P.get_name() + " needs at least two vertices.");

    return P;
}
