#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace mapprep::config {

namespace fs = std::filesystem;

struct PathsConfig {
  std::string data_dir = "data";       // resource gateway root
  std::string preview_dir = "previews";
  std::string output_dir = "layers";
  std::string work_dir = "work";
  std::string session_store = "sessions.json";
};

struct GeoreferenceConfig {
  int target_epsg = 3857;
  std::string resampling = "bilinear"; // near | bilinear | cubic | cubicspline | lanczos | average | mode
  std::string compression = "DEFLATE"; // NONE | DEFLATE | LZW | JPEG | ZSTD
  int jpeg_quality = 85;
  bool tiled = true;
  int block_size = 256;
  bool overviews = true;
  std::string overview_resampling = "AVERAGE";
  int min_overview_size = 256;
  std::string default_transformation = "poly1";
};

struct SplitConfig {
  std::string output_format = "png"; // png | tif
};

struct SessionConfig {
  int lock_ttl_seconds = 600;
};

struct RuntimeConfig {
  int workers = 2;
};

struct LoggingConfig {
  std::string events_file; // empty: stdout only
};

struct Config {
  PathsConfig paths;
  GeoreferenceConfig georeference;
  SplitConfig split;
  SessionConfig session;
  RuntimeConfig runtime;
  LoggingConfig logging;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Relative paths are taken relative to base.
  fs::path resolve(const fs::path &base, const std::string &path) const;
};

std::string get_schema_json();

} // namespace mapprep::config
