#include "mapprep/config/configuration.hpp"
#include "mapprep/core/errors.hpp"
#include "mapprep/core/utils.hpp"
#include "mapprep/georeference/gdal_support.hpp"
#include "mapprep/session/gateway.hpp"
#include "mapprep/session/raster_operations.hpp"
#include "mapprep/session/status_vocabulary.hpp"

#include <gdal_priv.h>
#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace mapprep::session;
using mapprep::SessionKind;
using mapprep::TransformKind;

namespace {

fs::path make_temp_dir(const std::string& name) {
  fs::path dir = fs::temp_directory_path() / ("mapprep_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

fs::path write_png(const fs::path& dir, int width, int height) {
  cv::Mat img(height, width, CV_8UC3, cv::Scalar(30, 90, 150));
  fs::path path = dir / "sheet.png";
  REQUIRE(cv::imwrite(path.string(), img));
  return path;
}

fs::path write_scan(const fs::path& dir, int width, int height) {
  mapprep::georeference::ensure_gdal_registered();
  GDALDriver* gtiff = GetGDALDriverManager()->GetDriverByName("GTiff");
  REQUIRE(gtiff != nullptr);

  fs::path path = dir / "scan.tif";
  mapprep::georeference::DatasetPtr ds(
      gtiff->Create(path.string().c_str(), width, height, 3, GDT_Byte, nullptr));
  REQUIRE(ds);
  for (int b = 1; b <= 3; ++b) {
    REQUIRE(ds->GetRasterBand(b)->Fill(60.0 * b) == CE_None);
  }
  return path;
}

json gcp(int px, int py, double lng, double lat) {
  return {{"type", "Feature"},
          {"properties", {{"image", {px, py}}, {"note", ""}}},
          {"geometry", {{"type", "Point"}, {"coordinates", {lng, lat}}}}};
}

mapprep::config::Config config_for() {
  mapprep::config::Config cfg;
  cfg.georeference.min_overview_size = 32;
  return cfg;
}

struct Workspace {
  explicit Workspace(const std::string& name)
      : dir(make_temp_dir(name)), gateway(dir / "data"), cfg(config_for()),
        operations(cfg, dir, gateway, vocabulary) {}

  ~Workspace() { fs::remove_all(dir); }

  fs::path dir;
  LocalResourceGateway gateway;
  StatusVocabulary vocabulary;
  mapprep::config::Config cfg;
  RasterOperations operations;
};

mapprep::Timestamp now() { return mapprep::core::from_epoch_ms(1700000000000); }

// Fails the n-th child registration.
class FlakyGateway : public LocalResourceGateway {
public:
  FlakyGateway(fs::path root, int fail_at) : LocalResourceGateway(std::move(root)), fail_at_(fail_at) {}

  std::string create_child_subject(const std::string& parent, const fs::path& raster,
                                   const std::string& title) override {
    if (++calls_ == fail_at_) throw mapprep::IOError("registry full");
    return LocalResourceGateway::create_child_subject(parent, raster, title);
  }

private:
  int fail_at_;
  int calls_ = 0;
};

} // namespace

TEST_CASE("preparation_splits_document_into_children") {
  Workspace w("ops_split");
  const std::string doc = w.gateway.import_document(write_png(w.dir, 60, 40), "Sheet");

  REQUIRE(w.operations.image_bounds(doc).width == 60);
  REQUIRE(w.operations.image_bounds(doc).height == 40);

  Session s = make_session(SessionKind::PREPARATION, doc, "alice", now());
  s.id = "7";
  std::get<PreparationData>(s.data).cutlines = {{{30.0, 0.0}, {30.0, 40.0}}};

  RunResult result = w.operations.run(s);
  REQUIRE(result.outputs.size() == 2);
  REQUIRE(result.subject_status == "split");
  REQUIRE(result.note == "split into 2 documents");
  REQUIRE(w.gateway.linked(doc, "split") == result.outputs);
  REQUIRE(w.gateway.describe(result.outputs[0]).title == "Sheet [1]");
  REQUIRE(w.gateway.describe(result.outputs[1]).title == "Sheet [2]");
  for (const auto& child : result.outputs) {
    REQUIRE(w.gateway.describe(child).status == "prepared");
    REQUIRE(w.gateway.describe(child).parent == doc);
    REQUIRE(fs::exists(w.gateway.fetch_raster(child)));
  }
  REQUIRE_FALSE(fs::exists(w.dir / "work" / "session-7"));

  s.outputs = result.outputs;
  w.operations.undo(s);
  REQUIRE(w.gateway.linked(doc, "split").empty());
  REQUIRE_THROWS_AS(w.gateway.describe(result.outputs[0]), mapprep::IOError);
  REQUIRE(w.gateway.describe(doc).title == "Sheet");
}

TEST_CASE("preparation_without_cutlines_keeps_document_whole") {
  Workspace w("ops_nosplit");
  const std::string doc = w.gateway.import_document(write_png(w.dir, 60, 40), "Sheet");

  Session s = make_session(SessionKind::PREPARATION, doc, "alice", now());
  s.id = "8";
  RunResult result = w.operations.run(s);
  REQUIRE(result.outputs.empty());
  REQUIRE(result.subject_status == "prepared");
  REQUIRE(result.note == "document prepared without split");
}

TEST_CASE("preparation_failure_discards_created_children") {
  fs::path dir = make_temp_dir("ops_split_fail");
  FlakyGateway gateway(dir / "data", 2);
  StatusVocabulary vocabulary;
  mapprep::config::Config cfg = config_for();
  RasterOperations operations(cfg, dir, gateway, vocabulary);

  const std::string doc = gateway.import_document(write_png(dir, 60, 40), "Sheet");
  Session s = make_session(SessionKind::PREPARATION, doc, "alice", now());
  s.id = "9";
  std::get<PreparationData>(s.data).cutlines = {{{30.0, 0.0}, {30.0, 40.0}}};

  REQUIRE_THROWS_AS(operations.run(s), mapprep::IOError);
  REQUIRE(gateway.subjects().size() == 1);
  REQUIRE(gateway.linked(doc, "split").empty());
  REQUIRE_FALSE(fs::exists(dir / "work" / "session-9"));

  fs::remove_all(dir);
}

TEST_CASE("georeference_stores_layer_with_checksum") {
  Workspace w("ops_georef");
  const std::string doc = w.gateway.import_document(write_scan(w.dir, 200, 100), "Sheet");

  Session s = make_session(SessionKind::GEOREFERENCE, doc, "alice", now());
  s.id = "10";
  auto& d = std::get<GeoreferenceData>(s.data);
  d.epsg = 3857;
  d.transformation = TransformKind::POLY1;
  d.gcps["features"] = {gcp(0, 0, 7.0, 51.01), gcp(200, 0, 7.02, 51.01),
                        gcp(0, 100, 7.0, 51.0), gcp(200, 100, 7.02, 51.0)};

  RunResult result = w.operations.run(s);
  REQUIRE(result.outputs.size() == 1);
  const std::string layer = result.outputs[0];
  REQUIRE(mapprep::core::starts_with(result.note, "poly1 fit on 4 points, rms error "));
  REQUIRE(result.output_sha256.size() == 64);
  REQUIRE(mapprep::core::sha256_file(w.gateway.fetch_raster(layer)) == result.output_sha256);
  REQUIRE(w.gateway.describe(layer).kind == "layer");
  REQUIRE(w.gateway.describe(layer).status == "georeferenced");
  REQUIRE(w.gateway.linked(doc, "georeference") == std::vector<std::string>{layer});

  // A trim of the new layer writes a masked copy next to it.
  Session t = make_session(SessionKind::TRIM, layer, "alice", now());
  t.id = "11";
  REQUIRE_THROWS_AS(w.operations.run(t), mapprep::ValidationError);

  std::get<TrimData>(t.data).mask_geometry_wkt =
      "SRID=3857;POLYGON((779500 6621500,781000 6621500,781000 6622800,779500 6622800,779500 6621500))";
  RunResult trimmed = w.operations.run(t);
  REQUIRE(trimmed.outputs.size() == 1);
  REQUIRE(trimmed.note == "mask applied");
  REQUIRE(mapprep::core::sha256_file(w.gateway.fetch_raster(trimmed.outputs[0])) ==
          trimmed.output_sha256);
  REQUIRE(w.gateway.linked(layer, "trim") == trimmed.outputs);

  t.outputs = trimmed.outputs;
  w.operations.undo(t);
  REQUIRE(w.gateway.linked(layer, "trim").empty());
  REQUIRE(w.gateway.describe(layer).status == "georeferenced");
}

TEST_CASE("georeference_with_too_few_points_leaves_no_layer") {
  Workspace w("ops_georef_few");
  const std::string doc = w.gateway.import_document(write_scan(w.dir, 200, 100), "Sheet");

  Session s = make_session(SessionKind::GEOREFERENCE, doc, "alice", now());
  s.id = "12";
  std::get<GeoreferenceData>(s.data).gcps["features"] = {gcp(0, 0, 7.0, 51.01),
                                                         gcp(200, 0, 7.02, 51.01)};

  REQUIRE_THROWS_AS(w.operations.run(s), mapprep::GeoreferenceError);
  REQUIRE(w.gateway.linked(doc, "georeference").empty());
}
