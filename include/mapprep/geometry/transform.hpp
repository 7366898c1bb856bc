#pragma once

#include "mapprep/core/types.hpp"

#include <Eigen/Dense>
#include <vector>

namespace mapprep::geometry {

// Minimum number of control points a transformation family needs.
int min_points_for(TransformKind kind);

// POLY resolves to a concrete degree from the point count:
// 3-5 points -> POLY1, 6-9 -> POLY2, 10 and more -> POLY3.
TransformKind resolve_transform_kind(TransformKind kind, size_t n_points);

/**
 * Fitted pixel -> geographic mapping.
 * Coordinates are normalized (centroid / max extent) on both sides
 * before solving to keep the systems well conditioned.
 */
class Transform {
public:
    struct Normalization {
        double cx = 0.0;
        double cy = 0.0;
        double scale = 1.0;

        Point2d apply(const Point2d& p) const {
            return {(p.x - cx) / scale, (p.y - cy) / scale};
        }
        Point2d revert(const Point2d& p) const {
            return {p.x * scale + cx, p.y * scale + cy};
        }
    };

    TransformKind kind() const { return kind_; }
    int degree() const { return degree_; }
    size_t point_count() const { return src_.size(); }

    Point2d forward(const Point2d& pixel) const;
    Point2d inverse(const Point2d& geo) const;

    // Per-point distance between forward(pixel) and the point's geo coordinate.
    std::vector<double> residuals(const std::vector<ControlPoint>& points) const;
    double rms_error(const std::vector<ControlPoint>& points) const;

private:
    friend Transform fit(const std::vector<ControlPoint>& points, TransformKind kind);

    Point2d forward_normalized(const Point2d& s) const;
    Eigen::Matrix2d jacobian_normalized(const Point2d& s) const;

    TransformKind kind_ = TransformKind::POLY1;
    int degree_ = 1;
    Normalization src_norm_;
    Normalization dst_norm_;
    std::vector<Point2d> src_;          // normalized pixel coordinates
    Eigen::MatrixXd coeffs_;            // polynomial terms x 2, or TPS weights (n+3) x 2
    Eigen::MatrixXd inverse_coeffs_;    // reverse polynomial, empty for TPS
};

Transform fit(const std::vector<ControlPoint>& points, TransformKind kind);

} // namespace mapprep::geometry
