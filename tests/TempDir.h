// Copyright 2022 Eric Fichter
#ifndef TEMPDIR_H
#define TEMPDIR_H

#include <boost/filesystem.hpp>
#include <string>

//! Unique directory below the system temp directory, removed with the object.
class TempDir {

public:
    TempDir() : path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("pline2ifc-%%%%-%%%%-%%%%")) {
        boost::filesystem::create_directories(path);
    }

    ~TempDir() {
        boost::system::error_code ec;
        boost::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string &name) const { return (path / name).string(); }

    const boost::filesystem::path path;
};

#endif //TEMPDIR_H
