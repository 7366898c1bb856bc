#include "mapprep/geometry/polygon.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace mapprep::geometry {

namespace {

constexpr int kMaxSplitDepth = 512;

double cross(const Point2d& a, const Point2d& b) {
    return a.x * b.y - a.y * b.x;
}

Point2d sub(const Point2d& a, const Point2d& b) {
    return {a.x - b.x, a.y - b.y};
}

double dist(const Point2d& a, const Point2d& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

double point_segment_distance(const Point2d& p, const Point2d& a, const Point2d& b) {
    const Point2d ab = sub(b, a);
    const double len2 = ab.x * ab.x + ab.y * ab.y;
    if (len2 <= 0.0) return dist(p, a);
    double t = ((p.x - a.x) * ab.x + (p.y - a.y) * ab.y) / len2;
    t = std::min(1.0, std::max(0.0, t));
    return dist(p, {a.x + ab.x * t, a.y + ab.y * t});
}

double snap(double v) {
    const double r = std::round(v);
    return std::abs(v - r) < kGeomEpsilon ? r : v;
}

// Where the cutline meets the ring boundary. `s` is the position along the
// cutline (segment index + fraction), `edge`/`u` the position on the ring.
struct Crossing {
    double s = 0.0;
    Point2d p;
    size_t edge = 0;
    double u = 0.0;
};

std::vector<Crossing> find_crossings(const Ring& ring, const std::vector<Point2d>& line) {
    std::vector<Crossing> out;
    const size_t m = ring.size();

    for (size_t i = 0; i + 1 < line.size(); ++i) {
        const Point2d a = line[i];
        const Point2d r = sub(line[i + 1], a);
        const double rlen = std::hypot(r.x, r.y);
        if (rlen <= 0.0) continue;

        for (size_t j = 0; j < m; ++j) {
            const Point2d c = ring[j];
            const Point2d q = sub(ring[(j + 1) % m], c);
            const double qlen = std::hypot(q.x, q.y);
            if (qlen <= 0.0) continue;

            const double denom = cross(r, q);
            // Parallel overlaps are picked up at the neighbouring edges' vertices.
            if (std::abs(denom) <= kGeomEpsilon * rlen * qlen) continue;

            const Point2d ca = sub(c, a);
            double t = cross(ca, q) / denom;
            double u = cross(ca, r) / denom;
            const double t_eps = kGeomEpsilon / rlen;
            const double u_eps = kGeomEpsilon / qlen;
            if (t < -t_eps || t > 1.0 + t_eps || u < -u_eps || u > 1.0 + u_eps) continue;

            t = std::min(1.0, std::max(0.0, t));
            u = std::min(1.0, std::max(0.0, u));

            Crossing x;
            x.s = static_cast<double>(i) + t;
            if (u >= 1.0 - u_eps) {
                x.edge = (j + 1) % m;
                x.u = 0.0;
                x.p = ring[x.edge];
            } else if (u <= u_eps) {
                x.edge = j;
                x.u = 0.0;
                x.p = ring[j];
            } else {
                x.edge = j;
                x.u = u;
                x.p = {c.x + q.x * u, c.y + q.y * u};
            }
            out.push_back(x);
        }
    }

    std::sort(out.begin(), out.end(), [](const Crossing& a, const Crossing& b) {
        if (a.s != b.s) return a.s < b.s;
        if (a.edge != b.edge) return a.edge < b.edge;
        return a.u < b.u;
    });

    std::vector<Crossing> unique;
    for (const auto& x : out) {
        if (!unique.empty() && dist(unique.back().p, x.p) < 1.0e-7 &&
            std::abs(unique.back().s - x.s) < 1.0e-7) {
            continue;
        }
        unique.push_back(x);
    }
    return unique;
}

Point2d point_at(const std::vector<Point2d>& line, double s) {
    size_t i = static_cast<size_t>(std::floor(s));
    if (i + 1 >= line.size()) {
        return line.back();
    }
    const double t = s - static_cast<double>(i);
    return {line[i].x + (line[i + 1].x - line[i].x) * t,
            line[i].y + (line[i + 1].y - line[i].y) * t};
}

// Position of a crossing along the ring, used to order two crossings on one edge.
double ring_position(const Crossing& x) {
    return static_cast<double>(x.edge) + x.u;
}

std::optional<std::pair<Ring, Ring>> cut_with_chord(const Ring& ring, Crossing first,
                                                     Crossing second,
                                                     std::vector<Point2d> interior) {
    const size_t m = ring.size();
    if (ring_position(first) > ring_position(second) && first.edge == second.edge) {
        std::swap(first, second);
        std::reverse(interior.begin(), interior.end());
    }

    // Walk the ring from first to second, then back along the chord.
    Ring a;
    a.push_back(first.p);
    size_t steps = (second.edge + m - first.edge) % m;
    for (size_t k = 1; k <= steps; ++k) {
        a.push_back(ring[(first.edge + k) % m]);
    }
    a.push_back(second.p);
    for (auto it = interior.rbegin(); it != interior.rend(); ++it) {
        a.push_back(*it);
    }

    // Walk the ring from second to first, then forward along the chord.
    Ring b;
    b.push_back(second.p);
    steps = (first.edge + m - second.edge) % m;
    if (steps == 0) steps = m;
    for (size_t k = 1; k <= steps; ++k) {
        b.push_back(ring[(second.edge + k) % m]);
    }
    b.push_back(first.p);
    for (const auto& p : interior) {
        b.push_back(p);
    }

    a = normalize_ring(a);
    b = normalize_ring(b);
    if (a.size() < 3 || b.size() < 3 || area(a) <= kGeomEpsilon || area(b) <= kGeomEpsilon) {
        return std::nullopt;
    }
    return std::make_pair(std::move(a), std::move(b));
}

void split_recursive(const Ring& ring, const std::vector<Point2d>& line, int depth,
                     std::vector<Ring>& out) {
    if (depth < kMaxSplitDepth) {
        std::vector<Crossing> xs = find_crossings(ring, line);
        for (size_t k = 0; k + 1 < xs.size(); ++k) {
            const Crossing& c0 = xs[k];
            const Crossing& c1 = xs[k + 1];
            if (!contains(ring, point_at(line, 0.5 * (c0.s + c1.s)))) {
                continue;
            }

            std::vector<Point2d> interior;
            for (size_t v = 0; v < line.size(); ++v) {
                const double sv = static_cast<double>(v);
                if (sv > c0.s + 1.0e-12 && sv < c1.s - 1.0e-12) {
                    interior.push_back(line[v]);
                }
            }

            auto pieces = cut_with_chord(ring, c0, c1, interior);
            if (!pieces) {
                continue;
            }
            split_recursive(pieces->first, line, depth + 1, out);
            split_recursive(pieces->second, line, depth + 1, out);
            return;
        }
    }
    out.push_back(ring);
}

} // namespace

double signed_area(const Ring& ring) {
    double sum = 0.0;
    const size_t m = ring.size();
    for (size_t i = 0; i < m; ++i) {
        sum += cross(ring[i], ring[(i + 1) % m]);
    }
    return 0.5 * sum;
}

double area(const Ring& ring) {
    return std::abs(signed_area(ring));
}

bool on_boundary(const Ring& ring, const Point2d& p, double eps) {
    const size_t m = ring.size();
    for (size_t i = 0; i < m; ++i) {
        if (point_segment_distance(p, ring[i], ring[(i + 1) % m]) <= eps) {
            return true;
        }
    }
    return false;
}

bool contains(const Ring& ring, const Point2d& p) {
    if (ring.size() < 3 || on_boundary(ring, p)) {
        return false;
    }
    bool inside = false;
    const size_t m = ring.size();
    for (size_t i = 0, j = m - 1; i < m; j = i++) {
        const Point2d& a = ring[i];
        const Point2d& b = ring[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            const double x = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < x) inside = !inside;
        }
    }
    return inside;
}

Ring rectangle(const ImageBounds& bounds) {
    const double w = static_cast<double>(bounds.width);
    const double h = static_cast<double>(bounds.height);
    return {{0.0, 0.0}, {w, 0.0}, {w, h}, {0.0, h}};
}

Ring normalize_ring(const Ring& ring) {
    Ring out;
    out.reserve(ring.size());
    for (const auto& p : ring) {
        Point2d q{snap(p.x), snap(p.y)};
        if (!out.empty() && dist(out.back(), q) < kGeomEpsilon) continue;
        out.push_back(q);
    }
    while (out.size() > 1 && dist(out.front(), out.back()) < kGeomEpsilon) {
        out.pop_back();
    }
    if (out.size() < 3) {
        return out;
    }

    if (signed_area(out) < 0.0) {
        std::reverse(out.begin(), out.end());
    }

    auto first = std::min_element(out.begin(), out.end(), [](const Point2d& a, const Point2d& b) {
        if (a.y != b.y) return a.y < b.y;
        return a.x < b.x;
    });
    std::rotate(out.begin(), first, out.end());
    return out;
}

BoundingBox bounding_box(const Ring& ring) {
    BoundingBox box;
    if (ring.empty()) return box;
    box.min_x = box.max_x = ring.front().x;
    box.min_y = box.max_y = ring.front().y;
    for (const auto& p : ring) {
        box.min_x = std::min(box.min_x, p.x);
        box.min_y = std::min(box.min_y, p.y);
        box.max_x = std::max(box.max_x, p.x);
        box.max_y = std::max(box.max_y, p.y);
    }
    return box;
}

std::vector<Ring> split_by_polyline(const Ring& ring, const std::vector<Point2d>& line) {
    std::vector<Ring> out;
    if (line.size() < 2) {
        out.push_back(ring);
        return out;
    }
    split_recursive(ring, line, 0, out);
    return out;
}

std::vector<std::pair<int, int>> row_spans(const Ring& ring, int row, int width) {
    std::vector<std::pair<int, int>> spans;
    const size_t m = ring.size();
    if (m < 3 || width <= 0) return spans;

    const double yc = static_cast<double>(row) + 0.5;
    std::vector<double> xs;
    for (size_t i = 0; i < m; ++i) {
        Point2d lo = ring[i];
        Point2d hi = ring[(i + 1) % m];
        if (lo.y == hi.y) continue;
        // Same endpoint order for an edge shared by two rings gives identical crossings.
        if (hi.y < lo.y || (hi.y == lo.y && hi.x < lo.x)) std::swap(lo, hi);
        if (yc < lo.y || yc >= hi.y) continue;
        xs.push_back(lo.x + (yc - lo.y) * (hi.x - lo.x) / (hi.y - lo.y));
    }
    std::sort(xs.begin(), xs.end());

    for (size_t k = 0; k + 1 < xs.size(); k += 2) {
        // Columns whose centre c + 0.5 lies in [xs[k], xs[k+1]).
        int x0 = static_cast<int>(std::ceil(xs[k] - 0.5));
        int x1 = static_cast<int>(std::ceil(xs[k + 1] - 0.5));
        x0 = std::max(0, x0);
        x1 = std::min(width, x1);
        if (x1 > x0) spans.emplace_back(x0, x1);
    }
    return spans;
}

} // namespace mapprep::geometry
