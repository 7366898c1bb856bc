#include "mapprep/core/errors.hpp"
#include "mapprep/core/types.hpp"
#include "mapprep/geometry/transform.hpp"

#include <cmath>
#include <functional>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using mapprep::ControlPoint;
using mapprep::FitError;
using mapprep::Point2d;
using mapprep::TransformKind;
namespace geometry = mapprep::geometry;

namespace {

ControlPoint cp(int px, int py, double gx, double gy) {
  ControlPoint p;
  p.pixel = {px, py};
  p.geo = {gx, gy};
  return p;
}

std::vector<ControlPoint> grid(int n, int step, const std::function<Point2d(double, double)>& f) {
  std::vector<ControlPoint> points;
  for (int j = 0; j < n; ++j) {
    for (int i = 0; i < n; ++i) {
      Point2d g = f(i * step, j * step);
      points.push_back(cp(i * step, j * step, g.x, g.y));
    }
  }
  return points;
}

void require_interpolates(const geometry::Transform& t, const std::vector<ControlPoint>& points,
                          double tol) {
  for (const auto& p : points) {
    Point2d g = t.forward({static_cast<double>(p.pixel.x), static_cast<double>(p.pixel.y)});
    REQUIRE(g.x == Catch::Approx(p.geo.x).margin(tol));
    REQUIRE(g.y == Catch::Approx(p.geo.y).margin(tol));
  }
}

} // namespace

TEST_CASE("poly1_right_triangle_interpolates_interior_point") {
  std::vector<ControlPoint> points = {
      cp(0, 0, 10.0, 50.0),
      cp(100, 0, 11.0, 50.0),
      cp(0, 100, 10.0, 49.0),
  };

  auto t = geometry::fit(points, TransformKind::POLY1);
  REQUIRE(t.kind() == TransformKind::POLY1);
  REQUIRE(t.degree() == 1);

  Point2d g = t.forward({25.0, 25.0});
  REQUIRE(g.x == Catch::Approx(10.25).epsilon(1e-6));
  REQUIRE(g.y == Catch::Approx(49.75).epsilon(1e-6));
}

TEST_CASE("polynomial_fits_reproduce_generating_function") {
  SECTION("affine") {
    auto points = grid(3, 200, [](double x, double y) {
      return Point2d{500000.0 + 2.5 * x - 0.3 * y, 5400000.0 + 0.2 * x - 2.5 * y};
    });
    auto t = geometry::fit(points, TransformKind::POLY1);
    require_interpolates(t, points, 1e-6);
    REQUIRE(t.rms_error(points) < 1e-6);
  }

  SECTION("quadratic") {
    auto points = grid(3, 150, [](double x, double y) {
      return Point2d{10.0 + 0.01 * x + 1e-6 * x * y, 50.0 - 0.01 * y + 2e-6 * x * x};
    });
    auto t = geometry::fit(points, TransformKind::POLY2);
    REQUIRE(t.degree() == 2);
    require_interpolates(t, points, 1e-8);
  }

  SECTION("cubic") {
    auto points = grid(4, 100, [](double x, double y) {
      return Point2d{10.0 + 0.01 * x + 1e-9 * x * x * x, 50.0 - 0.01 * y + 1e-9 * y * y * x};
    });
    auto t = geometry::fit(points, TransformKind::POLY3);
    REQUIRE(t.degree() == 3);
    require_interpolates(t, points, 1e-8);
  }
}

TEST_CASE("tps_passes_through_control_points_and_has_no_inverse") {
  std::vector<ControlPoint> points = {
      cp(0, 0, 10.0, 50.0),
      cp(400, 0, 14.0, 50.1),
      cp(0, 300, 10.1, 47.0),
      cp(400, 300, 14.2, 46.8),
      cp(200, 150, 12.3, 48.6),
  };

  auto t = geometry::fit(points, TransformKind::TPS);
  REQUIRE(t.kind() == TransformKind::TPS);
  require_interpolates(t, points, 1e-8);

  try {
    t.inverse({12.0, 48.0});
    FAIL("inverse of a thin plate spline must be refused");
  } catch (const FitError& e) {
    REQUIRE(e.reason() == FitError::Reason::UNSUPPORTED);
  }
}

TEST_CASE("poly1_inverse_maps_back_to_pixels") {
  std::vector<ControlPoint> points = {
      cp(0, 0, 10.0, 50.0),
      cp(1000, 0, 11.0, 50.1),
      cp(0, 800, 10.05, 49.2),
      cp(1000, 800, 11.05, 49.3),
  };
  auto t = geometry::fit(points, TransformKind::POLY1);

  Point2d g = t.forward({321.0, 654.0});
  Point2d p = t.inverse(g);
  REQUIRE(p.x == Catch::Approx(321.0).margin(1e-6));
  REQUIRE(p.y == Catch::Approx(654.0).margin(1e-6));
}

TEST_CASE("poly2_inverse_when_geo_points_lie_on_a_conic") {
  // geo = (x, y + x^2) puts these points on the hyperbola gx * gy = 60.
  std::vector<ControlPoint> points;
  const int pixels[6][2] = {{1, 59}, {2, 26}, {3, 11}, {4, -1}, {5, -13}, {6, -26}};
  for (const auto& p : pixels) {
    points.push_back(cp(p[0], p[1], p[0], p[1] + p[0] * p[0]));
  }

  auto t = geometry::fit(points, TransformKind::POLY2);
  require_interpolates(t, points, 1e-6);

  Point2d p = t.inverse({4.0, 15.0});
  REQUIRE(p.x == Catch::Approx(4.0).margin(1e-6));
  REQUIRE(p.y == Catch::Approx(-1.0).margin(1e-6));
}

TEST_CASE("fit_rejects_too_few_or_degenerate_points") {
  auto reason_of = [](const std::vector<ControlPoint>& points, TransformKind kind) {
    try {
      geometry::fit(points, kind);
    } catch (const FitError& e) {
      return e.reason();
    }
    FAIL("fit should have thrown");
    return FitError::Reason::UNSUPPORTED;
  };

  std::vector<ControlPoint> two = {cp(0, 0, 1.0, 1.0), cp(10, 0, 2.0, 1.0)};
  REQUIRE(reason_of(two, TransformKind::POLY1) == FitError::Reason::INSUFFICIENT_OR_DEGENERATE);

  std::vector<ControlPoint> collinear = {
      cp(0, 0, 1.0, 1.0), cp(10, 10, 2.0, 2.0), cp(20, 20, 3.0, 3.0)};
  REQUIRE(reason_of(collinear, TransformKind::POLY1) ==
          FitError::Reason::INSUFFICIENT_OR_DEGENERATE);

  std::vector<ControlPoint> coincident = {
      cp(5, 5, 1.0, 1.0), cp(5, 5, 1.0, 1.0), cp(5, 5, 1.0, 1.0)};
  REQUIRE(reason_of(coincident, TransformKind::POLY1) ==
          FitError::Reason::INSUFFICIENT_OR_DEGENERATE);

  auto five = grid(2, 100, [](double x, double y) { return Point2d{x, y}; });
  five.push_back(cp(50, 50, 50.0, 50.0));
  REQUIRE(reason_of(five, TransformKind::POLY2) == FitError::Reason::INSUFFICIENT_OR_DEGENERATE);
}

TEST_CASE("poly_resolves_degree_from_point_count") {
  REQUIRE(geometry::min_points_for(TransformKind::POLY1) == 3);
  REQUIRE(geometry::min_points_for(TransformKind::POLY2) == 6);
  REQUIRE(geometry::min_points_for(TransformKind::POLY3) == 10);

  REQUIRE(geometry::resolve_transform_kind(TransformKind::POLY, 3) == TransformKind::POLY1);
  REQUIRE(geometry::resolve_transform_kind(TransformKind::POLY, 7) == TransformKind::POLY2);
  REQUIRE(geometry::resolve_transform_kind(TransformKind::POLY, 12) == TransformKind::POLY3);
  REQUIRE(geometry::resolve_transform_kind(TransformKind::TPS, 12) == TransformKind::TPS);

  auto points = grid(3, 100, [](double x, double y) { return Point2d{x * 2.0, y * 3.0}; });
  auto t = geometry::fit(points, TransformKind::POLY);
  REQUIRE(t.kind() == TransformKind::POLY2);
}
