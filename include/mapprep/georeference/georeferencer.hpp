#pragma once

#include "mapprep/core/types.hpp"
#include "mapprep/geometry/transform.hpp"
#include "mapprep/georeference/control_points.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mapprep::georeference {

struct GeoreferenceOptions {
  int target_epsg = 3857;
  std::string resampling = "bilinear";
  std::string compression = "DEFLATE";
  int jpeg_quality = 85;
  bool tiled = true;
  int block_size = 256;
  std::string overview_resampling = "AVERAGE";
  int min_overview_size = 256;
  fs::path preview_dir = "previews";
  fs::path output_dir = "layers";
};

/**
 * Warps a scanned document into the target CRS from its control points.
 *
 * Preview output is a pair of VRT files (GCP carrier + warp descriptor)
 * that reference the source pixels; Final output is a tiled, compressed
 * GeoTIFF with an alpha band and internal overviews. Both live at stable
 * paths derived from the source and are replaced atomically on each call.
 */
class Georeferencer {
public:
  explicit Georeferencer(GeoreferenceOptions options = {});

  Georeferencer& load_control_points(const ControlPointGroup& group);
  Georeferencer& load_control_points(const std::vector<ControlPoint>& points);

  void set_transformation(TransformKind kind);
  TransformKind transformation() const { return requested_; }
  TransformKind resolved_transformation() const;

  // Points reprojected into the target CRS.
  const std::vector<ControlPoint>& control_points() const { return points_; }
  const geometry::Transform& transform() const;

  fs::path georeference(const fs::path& source, OutputFormat format, bool overviews = true) const;

  fs::path preview_path(const fs::path& source) const;
  fs::path gcp_carrier_path(const fs::path& source) const;
  fs::path output_path(const fs::path& source) const;

private:
  std::vector<ControlPoint> reproject(const std::vector<ControlPoint>& points) const;
  std::vector<std::string> warp_arguments(OutputFormat format) const;

  GeoreferenceOptions options_;
  TransformKind requested_ = TransformKind::POLY1;
  std::vector<ControlPoint> points_;
  std::optional<geometry::Transform> transform_;
};

} // namespace mapprep::georeference
