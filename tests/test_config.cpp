#include "mapprep/config/configuration.hpp"
#include "mapprep/core/errors.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using mapprep::config::Config;

TEST_CASE("config_defaults_are_valid") {
  Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.georeference.target_epsg == 3857);
  REQUIRE(cfg.session.lock_ttl_seconds == 600);
  REQUIRE(cfg.split.output_format == "png");
}

TEST_CASE("config_from_yaml_overrides_sections") {
  YAML::Node node = YAML::Load(R"(
paths:
  data_dir: /srv/maps
  output_dir: out/layers
georeference:
  target_epsg: 25832
  resampling: cubic
  compression: JPEG
  jpeg_quality: 70
  overviews: false
  default_transformation: tps
split:
  output_format: tif
session:
  lock_ttl_seconds: 120
runtime:
  workers: 4
)");
  Config cfg = Config::from_yaml(node);
  REQUIRE_NOTHROW(cfg.validate());

  REQUIRE(cfg.paths.data_dir == "/srv/maps");
  REQUIRE(cfg.paths.preview_dir == "previews");
  REQUIRE(cfg.georeference.target_epsg == 25832);
  REQUIRE(cfg.georeference.resampling == "cubic");
  REQUIRE(cfg.georeference.jpeg_quality == 70);
  REQUIRE_FALSE(cfg.georeference.overviews);
  REQUIRE(cfg.georeference.default_transformation == "tps");
  REQUIRE(cfg.split.output_format == "tif");
  REQUIRE(cfg.session.lock_ttl_seconds == 120);
  REQUIRE(cfg.runtime.workers == 4);

  REQUIRE(cfg.resolve("/base", cfg.paths.output_dir) == fs::path("/base/out/layers"));
  REQUIRE(cfg.resolve("/base", cfg.paths.data_dir) == fs::path("/srv/maps"));
}

TEST_CASE("config_validate_rejects_bad_values") {
  Config cfg;
  cfg.georeference.resampling = "sinc";
  REQUIRE_THROWS_AS(cfg.validate(), mapprep::ValidationError);

  cfg = Config();
  cfg.georeference.block_size = 100;
  REQUIRE_THROWS_AS(cfg.validate(), mapprep::ValidationError);

  cfg = Config();
  cfg.georeference.default_transformation = "poly4";
  REQUIRE_THROWS_AS(cfg.validate(), mapprep::ValidationError);

  cfg = Config();
  cfg.split.output_format = "jpg";
  REQUIRE_THROWS_AS(cfg.validate(), mapprep::ValidationError);

  cfg = Config();
  cfg.session.lock_ttl_seconds = 0;
  REQUIRE_THROWS_AS(cfg.validate(), mapprep::ValidationError);
}

TEST_CASE("config_save_and_load") {
  fs::path dir = fs::temp_directory_path() / "mapprep_test_config";
  fs::remove_all(dir);
  fs::create_directories(dir);

  Config cfg;
  cfg.georeference.target_epsg = 4326;
  cfg.logging.events_file = "events.jsonl";
  cfg.save(dir / "mapprep.yaml");

  Config loaded = Config::load(dir / "mapprep.yaml");
  REQUIRE(loaded.georeference.target_epsg == 4326);
  REQUIRE(loaded.logging.events_file == "events.jsonl");

  REQUIRE_THROWS_AS(Config::load(dir / "missing.yaml"), mapprep::ConfigError);

  fs::remove_all(dir);
}

TEST_CASE("config_schema_is_json") {
  auto schema = nlohmann::json::parse(mapprep::config::get_schema_json());
  REQUIRE(schema["type"] == "object");
  REQUIRE(schema["properties"].contains("georeference"));
  REQUIRE(schema["properties"].contains("session"));
}
