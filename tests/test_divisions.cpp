#include "mapprep/core/errors.hpp"
#include "mapprep/geometry/polygon.hpp"
#include "mapprep/split/splitter.hpp"

#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using mapprep::Cutline;
using mapprep::Division;
using mapprep::ImageBounds;
using mapprep::SplitError;
namespace geometry = mapprep::geometry;
namespace split = mapprep::split;

namespace {

SplitError::Reason split_reason(const std::vector<Cutline>& cutlines, const ImageBounds& bounds) {
  try {
    split::Splitter().generate_divisions(cutlines, bounds);
  } catch (const SplitError& e) {
    return e.reason();
  }
  FAIL("generate_divisions should have thrown");
  return SplitError::Reason::IO;
}

// Every pixel centre of the image is owned by exactly one division.
void require_partition(const std::vector<Division>& divisions, const ImageBounds& bounds) {
  double total = 0.0;
  for (const auto& d : divisions) {
    total += geometry::area(d);
  }
  REQUIRE(total == Catch::Approx(static_cast<double>(bounds.width) * bounds.height));

  for (int row = 0; row < bounds.height; ++row) {
    std::vector<int> owners(bounds.width, 0);
    for (const auto& d : divisions) {
      for (const auto& [x0, x1] : geometry::row_spans(d, row, bounds.width)) {
        for (int x = x0; x < x1; ++x) ++owners[x];
      }
    }
    for (int x = 0; x < bounds.width; ++x) {
      INFO("pixel " << x << "," << row);
      REQUIRE(owners[x] == 1);
    }
  }
}

} // namespace

TEST_CASE("zero_cutlines_yield_full_image") {
  ImageBounds bounds{640, 480};
  auto divisions = split::Splitter().generate_divisions({}, bounds);

  REQUIRE(divisions.size() == 1);
  auto box = geometry::bounding_box(divisions[0]);
  REQUIRE(box.min_x == 0.0);
  REQUIRE(box.min_y == 0.0);
  REQUIRE(box.max_x == 640.0);
  REQUIRE(box.max_y == 480.0);
  REQUIRE(geometry::area(divisions[0]) == Catch::Approx(640.0 * 480.0));
}

TEST_CASE("vertical_cutline_splits_sheet_in_two_halves") {
  ImageBounds bounds{1000, 800};
  auto divisions = split::Splitter().generate_divisions({{{500.0, 0.0}, {500.0, 800.0}}}, bounds);

  REQUIRE(divisions.size() == 2);
  auto left = geometry::bounding_box(divisions[0]);
  auto right = geometry::bounding_box(divisions[1]);
  REQUIRE(left.min_x == 0.0);
  REQUIRE(left.max_x == 500.0);
  REQUIRE(right.min_x == 500.0);
  REQUIRE(right.max_x == 1000.0);
  REQUIRE(left.max_y - left.min_y == 800.0);
  REQUIRE(right.max_y - right.min_y == 800.0);
  REQUIRE(geometry::area(divisions[0]) == Catch::Approx(500.0 * 800.0));
  REQUIRE(geometry::area(divisions[1]) == Catch::Approx(500.0 * 800.0));
}

TEST_CASE("crossing_cutlines_come_back_in_reading_order") {
  ImageBounds bounds{200, 100};
  std::vector<Cutline> cutlines = {
      {{100.0, 0.0}, {100.0, 100.0}},
      {{0.0, 40.0}, {200.0, 40.0}},
  };
  auto divisions = split::Splitter().generate_divisions(cutlines, bounds);

  REQUIRE(divisions.size() == 4);
  const double expected[4][2] = {{0.0, 0.0}, {100.0, 0.0}, {0.0, 40.0}, {100.0, 40.0}};
  for (size_t i = 0; i < divisions.size(); ++i) {
    auto box = geometry::bounding_box(divisions[i]);
    REQUIRE(box.min_x == expected[i][0]);
    REQUIRE(box.min_y == expected[i][1]);
  }
  require_partition(divisions, bounds);
}

TEST_CASE("slanted_and_bent_cutlines_partition_the_image") {
  ImageBounds bounds{300, 200};
  std::vector<Cutline> cutlines = {
      {{0.0, 10.3}, {300.0, 190.7}},
      {{137.2, 0.0}, {151.9, 83.3}, {121.4, 200.0}},
  };
  auto divisions = split::Splitter().generate_divisions(cutlines, bounds);

  REQUIRE(divisions.size() == 4);
  require_partition(divisions, bounds);

  for (int row = 0; row < bounds.height; row += 7) {
    auto labels = split::Splitter::label_row(divisions, row, bounds.width);
    REQUIRE(labels.size() == static_cast<size_t>(bounds.width));
    for (int owner : labels) {
      REQUIRE(owner >= 0);
      REQUIRE(owner < static_cast<int>(divisions.size()));
    }
  }
}

TEST_CASE("dangling_cutline_leaves_image_whole") {
  ImageBounds bounds{100, 100};
  auto divisions = split::Splitter().generate_divisions({{{20.0, 20.0}, {70.0, 60.0}}}, bounds);
  REQUIRE(divisions.size() == 1);
  REQUIRE(geometry::area(divisions[0]) == Catch::Approx(100.0 * 100.0));
}

TEST_CASE("invalid_cutlines_are_rejected") {
  ImageBounds bounds{100, 50};

  REQUIRE(split_reason({{{-5.0, 0.0}, {50.0, 50.0}}}, bounds) ==
          SplitError::Reason::LINE_OUT_OF_BOUNDS);
  REQUIRE(split_reason({{{10.0, 0.0}, {10.0, 80.0}}}, bounds) ==
          SplitError::Reason::LINE_OUT_OF_BOUNDS);
  REQUIRE(split_reason({{{10.0, 10.0}}}, bounds) == SplitError::Reason::DEGENERATE_LINE);
  REQUIRE(split_reason({{{10.0, 10.0}, {10.0, 10.0}}}, bounds) ==
          SplitError::Reason::DEGENERATE_LINE);

  REQUIRE_THROWS_AS(split::Splitter().generate_divisions({}, ImageBounds{0, 10}),
                    mapprep::ValidationError);
}

TEST_CASE("normalize_ring_orients_and_rotates") {
  mapprep::Ring ring = {{10.0, 10.0}, {0.0, 10.0}, {0.0, 0.0}, {10.0, 0.0}, {10.0, 0.0}};
  auto n = geometry::normalize_ring(ring);

  REQUIRE(n.size() == 4);
  REQUIRE(n.front().x == 0.0);
  REQUIRE(n.front().y == 0.0);
  REQUIRE(geometry::signed_area(n) > 0.0);
}

TEST_CASE("contains_excludes_boundary") {
  auto rect = geometry::rectangle({10, 10});
  REQUIRE(geometry::contains(rect, {5.0, 5.0}));
  REQUIRE_FALSE(geometry::contains(rect, {10.0, 5.0}));
  REQUIRE_FALSE(geometry::contains(rect, {12.0, 5.0}));
  REQUIRE(geometry::on_boundary(rect, {10.0, 5.0}));
}
