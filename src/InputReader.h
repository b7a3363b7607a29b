// Copyright 2022 Eric Fichter
#ifndef INPUTREADER_H
#define INPUTREADER_H

#include "headers.h"
#include "Model.h"
#include "Polyline.h"

//! Content of a polyline input file. Unset values fall back to the command line or the defaults.
struct InputData {
    boost::optional<std::string> project;
    boost::optional<Credentials> credentials;
    boost::optional<std::string> building;
    boost::optional<std::string> storey;
    boost::optional<double> elevation;
    std::list<Polyline> polylines;
};

//! Reads the JSON polyline description. Errors are thrown as InputError.
class InputReader {

public:
    static InputData read(const std::string &path);

    static InputData parse(std::istream &is, const std::string &source = "input");

private:
    static Credentials read_credentials(const boost::property_tree::ptree &pt);

    static Polyline read_polyline(const boost::property_tree::ptree &pt, unsigned int n);
};

#endif //INPUTREADER_H
