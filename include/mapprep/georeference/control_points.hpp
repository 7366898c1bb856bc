#pragma once

#include "mapprep/core/types.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mapprep::georeference {

struct DiffSummary {
  int added = 0;
  int updated = 0;
  int deleted = 0;
  int unchanged = 0;
};

/**
 * Control points of one document plus the CRS and transformation they
 * are fitted with. Incoming GeoJSON coordinates are [lng, lat] in EPSG:4326.
 */
class ControlPointGroup {
public:
  ControlPointGroup() = default;
  ControlPointGroup(std::string document_ref, int crs_epsg = 3857,
                    TransformKind transformation = TransformKind::POLY1);

  const std::string& document_ref() const { return document_ref_; }
  int crs_epsg() const { return crs_epsg_; }
  TransformKind transformation() const { return transformation_; }
  void set_transformation(TransformKind kind) { transformation_ = kind; }

  const std::vector<ControlPoint>& points() const { return points_; }
  size_t size() const { return points_.size(); }
  const ControlPoint* find(const std::string& id) const;

  // Replaces the point set with the FeatureCollection. Throws ValidationError
  // without touching the group if any feature is malformed.
  DiffSummary apply_geojson(const nlohmann::json& feature_collection,
                            const std::string& user, Timestamp now);

  nlohmann::json as_geojson() const;

  static ControlPointGroup from_geojson(const nlohmann::json& feature_collection,
                                        std::string document_ref, int crs_epsg,
                                        TransformKind transformation);

  // QGIS georeferencer export: mapX,mapY,pixelX,pixelY,enable[,dX,dY,residual]
  static ControlPointGroup from_points_file(const fs::path& path, TransformKind transformation);

  nlohmann::json to_json() const;
  static ControlPointGroup from_json(const nlohmann::json& j);

private:
  std::string document_ref_;
  int crs_epsg_ = 3857;
  TransformKind transformation_ = TransformKind::POLY1;
  std::vector<ControlPoint> points_;
};

} // namespace mapprep::georeference
