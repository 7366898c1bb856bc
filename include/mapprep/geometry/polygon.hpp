#pragma once

#include "mapprep/core/types.hpp"

#include <utility>
#include <vector>

namespace mapprep::geometry {

constexpr double kGeomEpsilon = 1.0e-9;

double signed_area(const Ring& ring);
double area(const Ring& ring);

bool on_boundary(const Ring& ring, const Point2d& p, double eps = kGeomEpsilon);
// Strict interior test: points on the boundary are outside.
bool contains(const Ring& ring, const Point2d& p);

Ring rectangle(const ImageBounds& bounds);

// Drops repeated vertices, orients the ring positively (clockwise on screen,
// y down) and starts it at the vertex with the smallest (y, x).
Ring normalize_ring(const Ring& ring);

struct BoundingBox {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;
};

BoundingBox bounding_box(const Ring& ring);

/**
 * Cuts a ring along a polyline. Every stretch of the polyline that runs
 * through the interior from boundary to boundary splits the ring; the
 * resulting pieces are split again by the remaining stretches. Stretches
 * that do not connect two boundary points leave the ring untouched.
 */
std::vector<Ring> split_by_polyline(const Ring& ring, const std::vector<Point2d>& line);

/**
 * Half-open column spans [x0, x1) of a row whose pixel centres (x + 0.5, y + 0.5)
 * fall inside the ring, clipped to [0, width).
 */
std::vector<std::pair<int, int>> row_spans(const Ring& ring, int row, int width);

} // namespace mapprep::geometry
