// Copyright 2022 Eric Fichter
#include "Polyline.h"
#include "Kernel.h"

constexpr double Polyline::coincidence_tolerance;

Polyline::Polyline(std::string _name, bool _closed) : name(std::move(_name)), closed(_closed) {}

unsigned int Polyline::number_of_segments() const {

    if (vertices.size() < 2) return 0;
    return closed ? (unsigned int) vertices.size() : (unsigned int) vertices.size() - 1;
}

const PolylineVertex &Polyline::start_of_segment(unsigned int i) const {

    if (i >= number_of_segments())
        throw std::out_of_range("Polyline " + name + " has no segment " + std::to_string(i) + ".");

    return vertices[i];
}

const PolylineVertex &Polyline::end_of_segment(unsigned int i) const {

    if (i >= number_of_segments())
        throw std::out_of_range("Polyline " + name + " has no segment " + std::to_string(i) + ".");

    return vertices[(i + 1) % vertices.size()];
}

segment_type Polyline::segment_type_at(unsigned int i) const {

    const PolylineVertex &s = start_of_segment(i);
    const PolylineVertex &e = end_of_segment(i);

    if (s.point.Distance(e.point) <= coincidence_tolerance)
        return SEGMENT_COINCIDENT;

    if (s.bulge != 0)
        return SEGMENT_ARC;

    return SEGMENT_LINE;
}

Extractor::Extractor(WallDefaults _defaults) : defaults(_defaults) {}

std::vector<SegmentResult> Extractor::extract(const Polyline &polyline, std::ostream &log) const {

    std::vector<SegmentResult> results;
    results.reserve(polyline.number_of_segments());

    for (unsigned int i = 0; i < polyline.number_of_segments(); i++)
        results.push_back(extract_segment(polyline, i, log));

    return results;
}

SegmentResult Extractor::extract_segment(const Polyline &polyline, unsigned int i, std::ostream &log) const {

    const PolylineVertex &s = polyline.start_of_segment(i);
    const PolylineVertex &e = polyline.end_of_segment(i);

    SegmentResult r{};
    r.index = i;
    r.type = polyline.segment_type_at(i);

    switch (r.type) {

        case SEGMENT_LINE: {
            gp_Vec2d v(s.point, e.point);
            gp_Dir2d dir(v);
            gp_XY mid = (s.point.XY() + e.point.XY()) * 0.5;

            r.status = SEGMENT_WALL;
            r.reason = SKIP_NONE;
            r.wall.pos_x = mid.X();
            r.wall.pos_y = mid.Y();
            r.wall.dir_x = dir.X();
            r.wall.dir_y = dir.Y();
            r.wall.dir_z = 0;
            r.wall.length = v.Magnitude();
            r.wall.width = polyline.width ? *polyline.width : defaults.width;
            r.wall.height = polyline.height ? *polyline.height : defaults.height;
            break;
        }

        case SEGMENT_ARC:
            r.status = SEGMENT_SKIPPED;
            r.reason = SKIP_ARC_SEGMENT;
            r.arc = arc_geometry(s.point, e.point, s.bulge);

            log << "\n Segment " << i << " - Arc -\n";
            log << "Start width:  " << s.start_width << "\n";
            log << "End width:    " << s.end_width << "\n";
            log << "Bulge:        " << s.bulge << "\n";
            log << "Start point:  " << Kernel::point_to_string(r.arc.start) << "\n";
            log << "End point:    " << Kernel::point_to_string(r.arc.end) << "\n";
            log << "Radius:       " << r.arc.radius << "\n";
            log << "Center:       " << Kernel::point_to_string(r.arc.center) << "\n";
            break;

        case SEGMENT_COINCIDENT:
            r.status = SEGMENT_SKIPPED;
            r.reason = SKIP_COINCIDENT_SEGMENT;

            log << "\n Segment " << i << " : zero length segment\n";
            log << "Start width:  " << s.start_width << "\n";
            log << "End width:    " << s.end_width << "\n";
            log << "Bulge:        " << s.bulge << "\n";
            break;
    }

    return r;
}

ArcGeometry Extractor::arc_geometry(const gp_Pnt2d &start, const gp_Pnt2d &end, double bulge) {

    // chord length d, sagitta direction given by the sign of the bulge
    double d = start.Distance(end);
    gp_XY mid = (start.XY() + end.XY()) * 0.5;
    gp_XY chord = end.XY() - start.XY();
    gp_XY left(-chord.Y() / d, chord.X() / d);

    ArcGeometry arc;
    arc.start = start;
    arc.end = end;
    arc.radius = d * (1 + bulge * bulge) / (4 * std::fabs(bulge));
    arc.center = gp_Pnt2d(mid + left * (d * (1 - bulge * bulge) / (4 * bulge)));
    return arc;
}
