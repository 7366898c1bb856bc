#include "mapprep/config/configuration.hpp"
#include "mapprep/core/errors.hpp"
#include "mapprep/core/types.hpp"
#include "mapprep/core/utils.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

namespace mapprep::config {

static bool one_of(const std::string& value, const std::vector<std::string>& allowed) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["paths"]) {
        auto p = node["paths"];
        if (p["data_dir"]) cfg.paths.data_dir = p["data_dir"].as<std::string>();
        if (p["preview_dir"]) cfg.paths.preview_dir = p["preview_dir"].as<std::string>();
        if (p["output_dir"]) cfg.paths.output_dir = p["output_dir"].as<std::string>();
        if (p["work_dir"]) cfg.paths.work_dir = p["work_dir"].as<std::string>();
        if (p["session_store"]) cfg.paths.session_store = p["session_store"].as<std::string>();
    }

    if (node["georeference"]) {
        auto g = node["georeference"];
        if (g["target_epsg"]) cfg.georeference.target_epsg = g["target_epsg"].as<int>();
        if (g["resampling"]) cfg.georeference.resampling = g["resampling"].as<std::string>();
        if (g["compression"]) cfg.georeference.compression = g["compression"].as<std::string>();
        if (g["jpeg_quality"]) cfg.georeference.jpeg_quality = g["jpeg_quality"].as<int>();
        if (g["tiled"]) cfg.georeference.tiled = g["tiled"].as<bool>();
        if (g["block_size"]) cfg.georeference.block_size = g["block_size"].as<int>();
        if (g["overviews"]) cfg.georeference.overviews = g["overviews"].as<bool>();
        if (g["overview_resampling"]) {
            cfg.georeference.overview_resampling = g["overview_resampling"].as<std::string>();
        }
        if (g["min_overview_size"]) cfg.georeference.min_overview_size = g["min_overview_size"].as<int>();
        if (g["default_transformation"]) {
            cfg.georeference.default_transformation = g["default_transformation"].as<std::string>();
        }
    }

    if (node["split"]) {
        auto s = node["split"];
        if (s["output_format"]) cfg.split.output_format = s["output_format"].as<std::string>();
    }

    if (node["session"]) {
        auto s = node["session"];
        if (s["lock_ttl_seconds"]) cfg.session.lock_ttl_seconds = s["lock_ttl_seconds"].as<int>();
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        if (r["workers"]) cfg.runtime.workers = r["workers"].as<int>();
    }

    if (node["logging"]) {
        auto l = node["logging"];
        if (l["events_file"]) cfg.logging.events_file = l["events_file"].as<std::string>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["paths"]["data_dir"] = paths.data_dir;
    node["paths"]["preview_dir"] = paths.preview_dir;
    node["paths"]["output_dir"] = paths.output_dir;
    node["paths"]["work_dir"] = paths.work_dir;
    node["paths"]["session_store"] = paths.session_store;

    node["georeference"]["target_epsg"] = georeference.target_epsg;
    node["georeference"]["resampling"] = georeference.resampling;
    node["georeference"]["compression"] = georeference.compression;
    node["georeference"]["jpeg_quality"] = georeference.jpeg_quality;
    node["georeference"]["tiled"] = georeference.tiled;
    node["georeference"]["block_size"] = georeference.block_size;
    node["georeference"]["overviews"] = georeference.overviews;
    node["georeference"]["overview_resampling"] = georeference.overview_resampling;
    node["georeference"]["min_overview_size"] = georeference.min_overview_size;
    node["georeference"]["default_transformation"] = georeference.default_transformation;

    node["split"]["output_format"] = split.output_format;

    node["session"]["lock_ttl_seconds"] = session.lock_ttl_seconds;

    node["runtime"]["workers"] = runtime.workers;

    node["logging"]["events_file"] = logging.events_file;

    return node;
}

void Config::validate() const {
    if (paths.data_dir.empty()) {
        throw ValidationError("paths.data_dir must not be empty");
    }
    if (paths.preview_dir.empty() || paths.output_dir.empty() || paths.work_dir.empty()) {
        throw ValidationError("paths.preview_dir, paths.output_dir and paths.work_dir must not be empty");
    }

    if (georeference.target_epsg <= 0) {
        throw ValidationError("georeference.target_epsg must be a positive EPSG code");
    }
    if (!one_of(georeference.resampling,
                {"near", "bilinear", "cubic", "cubicspline", "lanczos", "average", "mode"})) {
        throw ValidationError("georeference.resampling must be one of near, bilinear, cubic, "
                              "cubicspline, lanczos, average, mode");
    }
    if (!one_of(core::to_upper(georeference.compression), {"NONE", "DEFLATE", "LZW", "JPEG", "ZSTD"})) {
        throw ValidationError("georeference.compression must be one of NONE, DEFLATE, LZW, JPEG, ZSTD");
    }
    if (georeference.jpeg_quality < 1 || georeference.jpeg_quality > 100) {
        throw ValidationError("georeference.jpeg_quality must be in [1,100]");
    }
    if (georeference.block_size < 16 || georeference.block_size > 4096 ||
        (georeference.block_size % 16) != 0) {
        throw ValidationError("georeference.block_size must be a multiple of 16 in [16,4096]");
    }
    if (!one_of(core::to_upper(georeference.overview_resampling),
                {"NEAREST", "AVERAGE", "GAUSS", "CUBIC", "CUBICSPLINE", "LANCZOS", "MODE", "BILINEAR"})) {
        throw ValidationError("georeference.overview_resampling is not a supported overview method");
    }
    if (georeference.min_overview_size < 1) {
        throw ValidationError("georeference.min_overview_size must be >= 1");
    }
    if (!parse_transform_kind(georeference.default_transformation)) {
        throw ValidationError("georeference.default_transformation must be poly, poly1, poly2, poly3 or tps");
    }

    std::string fmt = core::to_lower(split.output_format);
    if (fmt != "png" && fmt != "tif" && fmt != "tiff") {
        throw ValidationError("split.output_format must be 'png' or 'tif'");
    }

    if (session.lock_ttl_seconds < 1) {
        throw ValidationError("session.lock_ttl_seconds must be >= 1");
    }

    if (runtime.workers < 1 || runtime.workers > 64) {
        throw ValidationError("runtime.workers must be in [1,64]");
    }
}

fs::path Config::resolve(const fs::path& base, const std::string& path) const {
    fs::path p(path);
    if (p.is_absolute() || base.empty()) {
        return p;
    }
    return base / p;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "paths": {
      "type": "object",
      "properties": {
        "data_dir": {"type": "string"},
        "preview_dir": {"type": "string"},
        "output_dir": {"type": "string"},
        "work_dir": {"type": "string"},
        "session_store": {"type": "string"}
      }
    },
    "georeference": {
      "type": "object",
      "properties": {
        "target_epsg": {"type": "integer", "minimum": 1},
        "resampling": {"type": "string", "enum": ["near", "bilinear", "cubic", "cubicspline", "lanczos", "average", "mode"]},
        "compression": {"type": "string", "enum": ["NONE", "DEFLATE", "LZW", "JPEG", "ZSTD"]},
        "jpeg_quality": {"type": "integer", "minimum": 1, "maximum": 100},
        "tiled": {"type": "boolean"},
        "block_size": {"type": "integer", "minimum": 16, "maximum": 4096, "multipleOf": 16},
        "overviews": {"type": "boolean"},
        "overview_resampling": {"type": "string"},
        "min_overview_size": {"type": "integer", "minimum": 1},
        "default_transformation": {"type": "string", "enum": ["poly", "poly1", "poly2", "poly3", "tps"]}
      }
    },
    "split": {
      "type": "object",
      "properties": {
        "output_format": {"type": "string", "enum": ["png", "tif", "tiff"]}
      }
    },
    "session": {
      "type": "object",
      "properties": {
        "lock_ttl_seconds": {"type": "integer", "minimum": 1}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "workers": {"type": "integer", "minimum": 1, "maximum": 64}
      }
    },
    "logging": {
      "type": "object",
      "properties": {
        "events_file": {"type": "string"}
      }
    }
  }
})";
}

} // namespace mapprep::config
