// Copyright 2022 Eric Fichter
#ifndef HEADERS_H
#define HEADERS_H

// Standard
#include <atomic>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <functional>
#include <iostream>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

// Boost
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

// OpenCascade
#include <BRepCheck_Analyzer.hxx>
#include <BRepGProp.hxx>
#include <GProp_GProps.hxx>
#include <Precision.hxx>
#include <Standard_Version.hxx>
#include <TopoDS_Shape.hxx>
#include <gp_Dir2d.hxx>
#include <gp_Pnt2d.hxx>
#include <gp_Trsf.hxx>
#include <gp_Vec2d.hxx>
#include <gp_XY.hxx>

// IfcOpenShell
#include <ifcparse/IfcFile.h>
#include <ifcparse/IfcGlobalId.h>
#include <ifcparse/Ifc4.h>
#include <ifcgeom_schema_agnostic/IfcGeomIterator.h>
#include <ifcparse/utils.h>

// Pline2Ifc
#include "definitions.h"

#endif //HEADERS_H
