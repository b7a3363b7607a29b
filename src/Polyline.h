// Copyright 2022 Eric Fichter
#ifndef POLYLINE_H
#define POLYLINE_H

#include "headers.h"

//! Vertex of a light-weight polyline. The bulge is the tangent of a quarter of the included angle of the following segment, positive means counter-clockwise.
struct PolylineVertex {
    gp_Pnt2d point;
    double bulge;
    double start_width;
    double end_width;

    PolylineVertex(double x, double y, double _bulge = 0, double _start_width = 0, double _end_width = 0) : point(x, y), bulge(_bulge), start_width(_start_width), end_width(_end_width) {}
};

class Polyline {

public:
    explicit Polyline(std::string _name = "", bool _closed = false);

    void add_vertex(const PolylineVertex &v) { vertices.push_back(v); }

    void add_vertex(double x, double y, double bulge = 0) { vertices.emplace_back(x, y, bulge); }

    //! Closed polylines have a segment from the last vertex back to the first one.
    unsigned int number_of_segments() const;

    segment_type segment_type_at(unsigned int i) const;

    const PolylineVertex &start_of_segment(unsigned int i) const;

    const PolylineVertex &end_of_segment(unsigned int i) const;

    const std::vector<PolylineVertex> &get_vertices() const { return vertices; }

    const std::string &get_name() const { return name; }

    bool is_closed() const { return closed; }

    void set_closed(bool _closed) { closed = _closed; }

    boost::optional<double> width;
    boost::optional<double> height;

    static constexpr double coincidence_tolerance = 1.0e-7;

private:
    std::string name;
    bool closed;
    std::vector<PolylineVertex> vertices;
};

//! Parameters of Builder::create_wall derived from a line segment.
struct WallParameters {
    double pos_x;
    double pos_y;
    double dir_x;
    double dir_y;
    double dir_z;
    double length;
    double width;
    double height;
};

//! Circle through an arc segment.
struct ArcGeometry {
    gp_Pnt2d start;
    gp_Pnt2d end;
    gp_Pnt2d center;
    double radius;
};

//! Typed outcome of one segment. Either parameters of a wall or the reason why the segment is skipped.
struct SegmentResult {
    unsigned int index;
    segment_type type;
    segment_status status;
    skip_reason reason;
    WallParameters wall;
    ArcGeometry arc;

    bool is_wall() const { return status == SEGMENT_WALL; }
};

//! Converts polyline segments to wall parameters. Line segments become walls, arcs and coincident segments are skipped with a diagnostic.
class Extractor {

public:
    explicit Extractor(WallDefaults _defaults = WallDefaults());

    //! One result per segment, in segment order. Diagnostics of skipped segments are written to log.
    std::vector<SegmentResult> extract(const Polyline &polyline, std::ostream &log) const;

    SegmentResult extract_segment(const Polyline &polyline, unsigned int i, std::ostream &log) const;

    static ArcGeometry arc_geometry(const gp_Pnt2d &start, const gp_Pnt2d &end, double bulge);

    const WallDefaults &get_defaults() const { return defaults; }

private:
    WallDefaults defaults;
};

#endif //POLYLINE_H
