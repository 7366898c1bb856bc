#include "mapprep/core/errors.hpp"
#include "mapprep/core/utils.hpp"
#include "mapprep/session/gateway.hpp"

#include <filesystem>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using mapprep::session::LocalResourceGateway;

namespace {

fs::path make_temp_dir(const std::string& name) {
  fs::path dir = fs::temp_directory_path() / ("mapprep_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

} // namespace

TEST_CASE("gateway_imports_and_persists_documents") {
  fs::path dir = make_temp_dir("gateway_import");
  mapprep::core::write_text(dir / "scan.tif", "raster-bytes");

  std::string ref;
  {
    LocalResourceGateway gateway(dir / "data");
    ref = gateway.import_document(dir / "scan.tif", "Sheet 12");
    REQUIRE(ref == "document:1");
    REQUIRE(gateway.describe(ref).status == "unprepared");
    gateway.set_status(ref, "prepared");
  }

  LocalResourceGateway reopened(dir / "data");
  auto info = reopened.describe(ref);
  REQUIRE(info.title == "Sheet 12");
  REQUIRE(info.status == "prepared");
  REQUIRE(mapprep::core::read_text(reopened.fetch_raster(ref)) == "raster-bytes");

  REQUIRE_THROWS_AS(reopened.describe("document:99"), mapprep::IOError);
  REQUIRE_THROWS_AS(reopened.import_document(dir / "missing.tif", "x"), mapprep::IOError);

  fs::remove_all(dir);
}

TEST_CASE("gateway_replaces_derived_raster_of_same_kind") {
  fs::path dir = make_temp_dir("gateway_derived");
  mapprep::core::write_text(dir / "scan.png", "scan");
  mapprep::core::write_text(dir / "warp1.tif", "first");
  mapprep::core::write_text(dir / "warp2.tif", "second");

  LocalResourceGateway gateway(dir / "data");
  std::string doc = gateway.import_document(dir / "scan.png", "Sheet");

  std::string layer = gateway.store_derived_raster(doc, dir / "warp1.tif", "georeference");
  REQUIRE(gateway.describe(layer).kind == "layer");
  REQUIRE(gateway.describe(layer).parent == doc);
  REQUIRE(gateway.linked(doc, "georeference") == std::vector<std::string>{layer});

  std::string again = gateway.store_derived_raster(doc, dir / "warp2.tif", "georeference");
  REQUIRE(again == layer);
  REQUIRE(mapprep::core::read_text(gateway.fetch_raster(layer)) == "second");

  fs::path layer_file = gateway.fetch_raster(layer);
  gateway.delete_subject(layer);
  REQUIRE_FALSE(fs::exists(layer_file));
  REQUIRE(gateway.linked(doc, "georeference").empty());
  REQUIRE_NOTHROW(gateway.delete_subject(layer));

  fs::remove_all(dir);
}

TEST_CASE("gateway_children_are_linked_to_parent") {
  fs::path dir = make_temp_dir("gateway_children");
  mapprep::core::write_text(dir / "scan.png", "scan");
  mapprep::core::write_text(dir / "part.png", "part");

  LocalResourceGateway gateway(dir / "data");
  std::string doc = gateway.import_document(dir / "scan.png", "Sheet");
  std::string child = gateway.create_child_subject(doc, dir / "part.png", "Sheet [1]");
  gateway.link(doc, child, "split");
  gateway.link(doc, child, "split");

  REQUIRE(gateway.linked(doc, "split").size() == 1);
  REQUIRE(gateway.describe(child).parent == doc);
  REQUIRE(gateway.subjects().size() == 2);

  fs::remove_all(dir);
}
