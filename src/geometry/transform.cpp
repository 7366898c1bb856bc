#include "mapprep/geometry/transform.hpp"
#include "mapprep/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace mapprep::geometry {

namespace {

constexpr double kRankThreshold = 1.0e-10;
constexpr int kNewtonIterations = 30;
constexpr double kNewtonTolerance = 1.0e-13;

int term_count(int degree) {
    return (degree + 1) * (degree + 2) / 2;
}

// Terms ordered 1, x, y, x^2, xy, y^2, x^3, x^2y, xy^2, y^3.
void poly_terms(const Point2d& p, int degree, double* out) {
    const double x = p.x;
    const double y = p.y;
    out[0] = 1.0;
    out[1] = x;
    out[2] = y;
    if (degree >= 2) {
        out[3] = x * x;
        out[4] = x * y;
        out[5] = y * y;
    }
    if (degree >= 3) {
        out[6] = x * x * x;
        out[7] = x * x * y;
        out[8] = x * y * y;
        out[9] = y * y * y;
    }
}

void poly_terms_dx(const Point2d& p, int degree, double* out) {
    const double x = p.x;
    const double y = p.y;
    out[0] = 0.0;
    out[1] = 1.0;
    out[2] = 0.0;
    if (degree >= 2) {
        out[3] = 2.0 * x;
        out[4] = y;
        out[5] = 0.0;
    }
    if (degree >= 3) {
        out[6] = 3.0 * x * x;
        out[7] = 2.0 * x * y;
        out[8] = y * y;
        out[9] = 0.0;
    }
}

void poly_terms_dy(const Point2d& p, int degree, double* out) {
    const double x = p.x;
    const double y = p.y;
    out[0] = 0.0;
    out[1] = 0.0;
    out[2] = 1.0;
    if (degree >= 2) {
        out[3] = 0.0;
        out[4] = x;
        out[5] = 2.0 * y;
    }
    if (degree >= 3) {
        out[6] = 0.0;
        out[7] = x * x;
        out[8] = 2.0 * x * y;
        out[9] = 3.0 * y * y;
    }
}

Point2d eval_poly(const Eigen::MatrixXd& coeffs, const Point2d& p, int degree) {
    double terms[10];
    poly_terms(p, degree, terms);
    Point2d out;
    for (int k = 0; k < term_count(degree); ++k) {
        out.x += coeffs(k, 0) * terms[k];
        out.y += coeffs(k, 1) * terms[k];
    }
    return out;
}

// U(r) = r^2 log r^2, written in terms of the squared distance.
double tps_kernel(double r2) {
    if (r2 <= 0.0) return 0.0;
    return r2 * std::log(r2);
}

double tps_kernel_derivative(double r2) {
    // d/d(r2) of r2 * log(r2)
    if (r2 <= 0.0) return 0.0;
    return std::log(r2) + 1.0;
}

template <typename Getter>
Transform::Normalization normalization_for(const std::vector<ControlPoint>& points, Getter get) {
    double cx = 0.0;
    double cy = 0.0;
    for (const auto& cp : points) {
        Point2d p = get(cp);
        cx += p.x;
        cy += p.y;
    }
    cx /= static_cast<double>(points.size());
    cy /= static_cast<double>(points.size());

    double extent = 0.0;
    for (const auto& cp : points) {
        Point2d p = get(cp);
        extent = std::max(extent, std::abs(p.x - cx));
        extent = std::max(extent, std::abs(p.y - cy));
    }
    if (!(extent > 0.0) || !std::isfinite(extent)) {
        throw FitError(FitError::Reason::INSUFFICIENT_OR_DEGENERATE,
                       "control points are coincident");
    }

    Transform::Normalization n;
    n.cx = cx;
    n.cy = cy;
    n.scale = extent;
    return n;
}

Eigen::MatrixXd solve_polynomial(const std::vector<Point2d>& from,
                                 const std::vector<Point2d>& to, int degree) {
    const int n = static_cast<int>(from.size());
    const int m = term_count(degree);

    Eigen::MatrixXd A(n, m);
    Eigen::MatrixXd B(n, 2);
    double terms[10];
    for (int i = 0; i < n; ++i) {
        poly_terms(from[i], degree, terms);
        for (int k = 0; k < m; ++k) {
            A(i, k) = terms[k];
        }
        B(i, 0) = to[i].x;
        B(i, 1) = to[i].y;
    }

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
    qr.setThreshold(kRankThreshold);
    if (qr.rank() < m) {
        throw FitError(FitError::Reason::INSUFFICIENT_OR_DEGENERATE,
                       "control points are collinear or otherwise degenerate for a degree " +
                       std::to_string(degree) + " polynomial");
    }

    Eigen::MatrixXd coeffs = qr.solve(B);
    if (!coeffs.allFinite()) {
        throw FitError(FitError::Reason::INSUFFICIENT_OR_DEGENERATE,
                       "polynomial solution is not finite");
    }
    return coeffs;
}

// Inverse of the constant and linear terms, padded to the full term count.
Eigen::MatrixXd affine_inverse(const Eigen::MatrixXd& coeffs, int degree) {
    Eigen::MatrixXd inv = Eigen::MatrixXd::Zero(term_count(degree), 2);
    Eigen::Matrix2d A;
    A << coeffs(1, 0), coeffs(2, 0),
         coeffs(1, 1), coeffs(2, 1);
    if (std::abs(A.determinant()) < 1.0e-14) {
        return inv;
    }
    const Eigen::Matrix2d Ainv = A.inverse();
    const Eigen::Vector2d offset = -Ainv * Eigen::Vector2d(coeffs(0, 0), coeffs(0, 1));
    inv(0, 0) = offset.x();
    inv(0, 1) = offset.y();
    inv(1, 0) = Ainv(0, 0);
    inv(1, 1) = Ainv(1, 0);
    inv(2, 0) = Ainv(0, 1);
    inv(2, 1) = Ainv(1, 1);
    return inv;
}

} // namespace

int min_points_for(TransformKind kind) {
    switch (kind) {
        case TransformKind::POLY2: return 6;
        case TransformKind::POLY3: return 10;
        case TransformKind::POLY:
        case TransformKind::POLY1:
        case TransformKind::TPS:
        default: return 3;
    }
}

TransformKind resolve_transform_kind(TransformKind kind, size_t n_points) {
    if (kind != TransformKind::POLY) {
        return kind;
    }
    if (n_points >= 10) return TransformKind::POLY3;
    if (n_points >= 6) return TransformKind::POLY2;
    return TransformKind::POLY1;
}

// ─── Fitting ────────────────────────────────────────────────────────────

Transform fit(const std::vector<ControlPoint>& points, TransformKind kind) {
    const TransformKind resolved = resolve_transform_kind(kind, points.size());
    const int required = min_points_for(resolved);
    if (static_cast<int>(points.size()) < required) {
        throw FitError(FitError::Reason::INSUFFICIENT_OR_DEGENERATE,
                       transform_kind_to_string(resolved) + " needs at least " +
                       std::to_string(required) + " control points, got " +
                       std::to_string(points.size()));
    }

    Transform t;
    t.kind_ = resolved;
    t.src_norm_ = normalization_for(points, [](const ControlPoint& cp) {
        return Point2d{static_cast<double>(cp.pixel.x), static_cast<double>(cp.pixel.y)};
    });
    t.dst_norm_ = normalization_for(points, [](const ControlPoint& cp) { return cp.geo; });

    std::vector<Point2d> dst;
    t.src_.reserve(points.size());
    dst.reserve(points.size());
    for (const auto& cp : points) {
        t.src_.push_back(t.src_norm_.apply(
            {static_cast<double>(cp.pixel.x), static_cast<double>(cp.pixel.y)}));
        dst.push_back(t.dst_norm_.apply(cp.geo));
    }

    if (resolved == TransformKind::TPS) {
        t.degree_ = 0;
        const int n = static_cast<int>(points.size());

        // The affine part must be determined, which rules out collinear points.
        Eigen::MatrixXd P(n, 3);
        for (int i = 0; i < n; ++i) {
            P(i, 0) = 1.0;
            P(i, 1) = t.src_[i].x;
            P(i, 2) = t.src_[i].y;
        }
        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(P);
        qr.setThreshold(kRankThreshold);
        if (qr.rank() < 3) {
            throw FitError(FitError::Reason::INSUFFICIENT_OR_DEGENERATE,
                           "control points are collinear");
        }

        Eigen::MatrixXd L = Eigen::MatrixXd::Zero(n + 3, n + 3);
        Eigen::MatrixXd rhs = Eigen::MatrixXd::Zero(n + 3, 2);
        for (int i = 0; i < n; ++i) {
            for (int j = 0; j < n; ++j) {
                const double dx = t.src_[i].x - t.src_[j].x;
                const double dy = t.src_[i].y - t.src_[j].y;
                L(i, j) = tps_kernel(dx * dx + dy * dy);
            }
            L(i, n) = 1.0;
            L(i, n + 1) = t.src_[i].x;
            L(i, n + 2) = t.src_[i].y;
            L(n, i) = 1.0;
            L(n + 1, i) = t.src_[i].x;
            L(n + 2, i) = t.src_[i].y;
            rhs(i, 0) = dst[i].x;
            rhs(i, 1) = dst[i].y;
        }

        Eigen::FullPivLU<Eigen::MatrixXd> lu(L);
        lu.setThreshold(kRankThreshold);
        if (!lu.isInvertible()) {
            throw FitError(FitError::Reason::INSUFFICIENT_OR_DEGENERATE,
                           "thin plate spline system is singular (duplicate control points?)");
        }
        t.coeffs_ = lu.solve(rhs);
        if (!t.coeffs_.allFinite()) {
            throw FitError(FitError::Reason::INSUFFICIENT_OR_DEGENERATE,
                           "thin plate spline solution is not finite");
        }
        return t;
    }

    t.degree_ = resolved == TransformKind::POLY3 ? 3 : (resolved == TransformKind::POLY2 ? 2 : 1);
    t.coeffs_ = solve_polynomial(t.src_, dst, t.degree_);
    // Reverse fit seeds the Newton refinement in inverse(). Geo points may be
    // degenerate where the pixels are not; the affine part seeds it then.
    try {
        t.inverse_coeffs_ = solve_polynomial(dst, t.src_, t.degree_);
    } catch (const FitError&) {
        t.inverse_coeffs_ = affine_inverse(t.coeffs_, t.degree_);
    }
    return t;
}

// ─── Evaluation ─────────────────────────────────────────────────────────

Point2d Transform::forward_normalized(const Point2d& s) const {
    if (kind_ != TransformKind::TPS) {
        return eval_poly(coeffs_, s, degree_);
    }

    const int n = static_cast<int>(src_.size());
    Point2d out;
    out.x = coeffs_(n, 0) + coeffs_(n + 1, 0) * s.x + coeffs_(n + 2, 0) * s.y;
    out.y = coeffs_(n, 1) + coeffs_(n + 1, 1) * s.x + coeffs_(n + 2, 1) * s.y;
    for (int i = 0; i < n; ++i) {
        const double dx = s.x - src_[i].x;
        const double dy = s.y - src_[i].y;
        const double u = tps_kernel(dx * dx + dy * dy);
        out.x += coeffs_(i, 0) * u;
        out.y += coeffs_(i, 1) * u;
    }
    return out;
}

Eigen::Matrix2d Transform::jacobian_normalized(const Point2d& s) const {
    Eigen::Matrix2d J = Eigen::Matrix2d::Zero();
    if (kind_ != TransformKind::TPS) {
        double dx[10];
        double dy[10];
        poly_terms_dx(s, degree_, dx);
        poly_terms_dy(s, degree_, dy);
        for (int k = 0; k < term_count(degree_); ++k) {
            J(0, 0) += coeffs_(k, 0) * dx[k];
            J(0, 1) += coeffs_(k, 0) * dy[k];
            J(1, 0) += coeffs_(k, 1) * dx[k];
            J(1, 1) += coeffs_(k, 1) * dy[k];
        }
        return J;
    }

    const int n = static_cast<int>(src_.size());
    J(0, 0) = coeffs_(n + 1, 0);
    J(0, 1) = coeffs_(n + 2, 0);
    J(1, 0) = coeffs_(n + 1, 1);
    J(1, 1) = coeffs_(n + 2, 1);
    for (int i = 0; i < n; ++i) {
        const double ddx = s.x - src_[i].x;
        const double ddy = s.y - src_[i].y;
        const double g = tps_kernel_derivative(ddx * ddx + ddy * ddy);
        J(0, 0) += coeffs_(i, 0) * g * 2.0 * ddx;
        J(0, 1) += coeffs_(i, 0) * g * 2.0 * ddy;
        J(1, 0) += coeffs_(i, 1) * g * 2.0 * ddx;
        J(1, 1) += coeffs_(i, 1) * g * 2.0 * ddy;
    }
    return J;
}

Point2d Transform::forward(const Point2d& pixel) const {
    return dst_norm_.revert(forward_normalized(src_norm_.apply(pixel)));
}

Point2d Transform::inverse(const Point2d& geo) const {
    if (kind_ == TransformKind::TPS) {
        throw FitError(FitError::Reason::UNSUPPORTED,
                       "thin plate spline has no closed-form inverse");
    }

    const Point2d target = dst_norm_.apply(geo);
    Point2d s = eval_poly(inverse_coeffs_, target, degree_);

    for (int iter = 0; iter < kNewtonIterations; ++iter) {
        Point2d f = forward_normalized(s);
        Eigen::Vector2d r(f.x - target.x, f.y - target.y);
        if (r.norm() < kNewtonTolerance) break;

        Eigen::Matrix2d J = jacobian_normalized(s);
        if (std::abs(J.determinant()) < 1.0e-14) break;
        Eigen::Vector2d step = J.partialPivLu().solve(r);
        s.x -= step.x();
        s.y -= step.y();
    }
    return src_norm_.revert(s);
}

std::vector<double> Transform::residuals(const std::vector<ControlPoint>& points) const {
    std::vector<double> out;
    out.reserve(points.size());
    for (const auto& cp : points) {
        Point2d p = forward({static_cast<double>(cp.pixel.x), static_cast<double>(cp.pixel.y)});
        out.push_back(std::hypot(p.x - cp.geo.x, p.y - cp.geo.y));
    }
    return out;
}

double Transform::rms_error(const std::vector<ControlPoint>& points) const {
    if (points.empty()) return 0.0;
    double sum = 0.0;
    for (double r : residuals(points)) {
        sum += r * r;
    }
    return std::sqrt(sum / static_cast<double>(points.size()));
}

} // namespace mapprep::geometry
