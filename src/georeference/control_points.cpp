#include "mapprep/georeference/control_points.hpp"
#include "mapprep/core/errors.hpp"
#include "mapprep/core/utils.hpp"

#include <cmath>
#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace mapprep::georeference {

namespace {

int pixel_value(const nlohmann::json& v, const std::string& what) {
    if (!v.is_number()) {
        throw ValidationError(what + " must be numeric");
    }
    const double d = v.get<double>();
    if (!std::isfinite(d)) {
        throw ValidationError(what + " must be finite");
    }
    return static_cast<int>(std::lround(d));
}

double coord_value(const nlohmann::json& v, const std::string& what) {
    if (!v.is_number()) {
        throw ValidationError(what + " must be numeric");
    }
    const double d = v.get<double>();
    if (!std::isfinite(d)) {
        throw ValidationError(what + " must be finite");
    }
    return d;
}

ControlPoint parse_feature(const nlohmann::json& feature, size_t index) {
    const std::string where = "feature " + std::to_string(index);
    if (!feature.is_object()) {
        throw ValidationError(where + " is not an object");
    }
    if (!feature.contains("properties") || !feature["properties"].is_object()) {
        throw ValidationError(where + " has no properties");
    }
    if (!feature.contains("geometry") || !feature["geometry"].is_object()) {
        throw ValidationError(where + " has no geometry");
    }

    const auto& props = feature["properties"];
    const auto& geom = feature["geometry"];
    if (geom.value("type", "") != "Point") {
        throw ValidationError(where + " geometry must be a Point");
    }
    if (!props.contains("image") || !props["image"].is_array() || props["image"].size() < 2) {
        throw ValidationError(where + " needs properties.image = [x, y]");
    }
    if (!geom.contains("coordinates") || !geom["coordinates"].is_array() ||
        geom["coordinates"].size() < 2) {
        throw ValidationError(where + " needs geometry.coordinates = [lng, lat]");
    }

    ControlPoint cp;
    if (props.contains("id") && props["id"].is_string() && !props["id"].get<std::string>().empty()) {
        cp.id = props["id"].get<std::string>();
    } else if (props.contains("id") && props["id"].is_number_integer()) {
        cp.id = std::to_string(props["id"].get<long long>());
    } else {
        cp.id = core::generate_uuid();
    }
    cp.pixel.x = pixel_value(props["image"][0], where + " image x");
    cp.pixel.y = pixel_value(props["image"][1], where + " image y");
    cp.geo.x = coord_value(geom["coordinates"][0], where + " longitude");
    cp.geo.y = coord_value(geom["coordinates"][1], where + " latitude");
    if (cp.geo.y < -90.0 || cp.geo.y > 90.0 || cp.geo.x < -180.0 || cp.geo.x > 180.0) {
        throw ValidationError(where + " coordinates are outside EPSG:4326 range");
    }
    cp.crs_epsg = 4326;
    if (props.contains("note") && props["note"].is_string()) {
        cp.note = props["note"].get<std::string>();
    }
    if (props.contains("username") && props["username"].is_string()) {
        cp.modified_by = props["username"].get<std::string>();
    }
    return cp;
}

} // namespace

ControlPointGroup::ControlPointGroup(std::string document_ref, int crs_epsg,
                                     TransformKind transformation)
    : document_ref_(std::move(document_ref)), crs_epsg_(crs_epsg),
      transformation_(transformation) {}

const ControlPoint* ControlPointGroup::find(const std::string& id) const {
    for (const auto& cp : points_) {
        if (cp.id == id) return &cp;
    }
    return nullptr;
}

DiffSummary ControlPointGroup::apply_geojson(const nlohmann::json& feature_collection,
                                             const std::string& user, Timestamp now) {
    if (!feature_collection.is_object() ||
        feature_collection.value("type", "") != "FeatureCollection" ||
        !feature_collection.contains("features") || !feature_collection["features"].is_array()) {
        throw ValidationError("expected a GeoJSON FeatureCollection");
    }

    std::vector<ControlPoint> incoming;
    std::unordered_set<std::string> seen;
    const auto& features = feature_collection["features"];
    for (size_t i = 0; i < features.size(); ++i) {
        ControlPoint cp = parse_feature(features[i], i);
        if (!seen.insert(cp.id).second) {
            throw ValidationError("duplicate control point id " + cp.id);
        }
        incoming.push_back(std::move(cp));
    }

    std::unordered_map<std::string, const ControlPoint*> existing;
    for (const auto& cp : points_) {
        existing[cp.id] = &cp;
    }

    DiffSummary summary;
    std::vector<ControlPoint> next;
    next.reserve(incoming.size());
    for (auto& cp : incoming) {
        auto it = existing.find(cp.id);
        if (it == existing.end()) {
            cp.modified_by = user;
            cp.modified_at = now;
            ++summary.added;
        } else {
            const ControlPoint& old = *it->second;
            const bool moved = !(old.pixel == cp.pixel) || old.geo != cp.geo;
            if (moved) {
                cp.modified_by = user;
                cp.modified_at = now;
                ++summary.updated;
            } else {
                cp.modified_by = old.modified_by;
                cp.modified_at = old.modified_at;
                ++summary.unchanged;
            }
        }
        next.push_back(std::move(cp));
    }
    for (const auto& cp : points_) {
        if (seen.count(cp.id) == 0) ++summary.deleted;
    }

    points_.swap(next);
    return summary;
}

nlohmann::json ControlPointGroup::as_geojson() const {
    nlohmann::json features = nlohmann::json::array();
    for (const auto& cp : points_) {
        features.push_back({
            {"type", "Feature"},
            {"properties", {
                {"id", cp.id},
                {"image", {cp.pixel.x, cp.pixel.y}},
                {"username", cp.modified_by},
                {"note", cp.note}
            }},
            {"geometry", {
                {"type", "Point"},
                {"coordinates", {cp.geo.x, cp.geo.y}}
            }}
        });
    }
    return {{"type", "FeatureCollection"}, {"features", features}};
}

ControlPointGroup ControlPointGroup::from_geojson(const nlohmann::json& feature_collection,
                                                  std::string document_ref, int crs_epsg,
                                                  TransformKind transformation) {
    ControlPointGroup group(std::move(document_ref), crs_epsg, transformation);
    group.apply_geojson(feature_collection, "", Timestamp{});
    // Keep the authors recorded in the features.
    const auto& features = feature_collection["features"];
    for (size_t i = 0; i < features.size() && i < group.points_.size(); ++i) {
        const auto& props = features[i]["properties"];
        group.points_[i].modified_by = props.value("username", "");
    }
    return group;
}

ControlPointGroup ControlPointGroup::from_points_file(const fs::path& path,
                                                      TransformKind transformation) {
    const std::string text = core::read_text(path);

    int epsg = 4326;
    std::vector<ControlPoint> points;
    const std::regex epsg_re("EPSG[:\",]+\\s*(\\d+)");

    size_t line_no = 0;
    for (const std::string& raw : core::split(text, '\n')) {
        ++line_no;
        const std::string line = core::trim(raw);
        if (line.empty()) continue;
        if (core::starts_with(line, "#")) {
            if (core::starts_with(line, "#CRS:")) {
                std::smatch m;
                std::string::const_iterator start = line.begin();
                std::string last;
                // WKT names the authority of nested objects first, the CRS itself last.
                while (std::regex_search(start, line.end(), m, epsg_re)) {
                    last = m[1].str();
                    start = m.suffix().first;
                }
                if (!last.empty()) epsg = std::stoi(last);
            }
            continue;
        }
        if (core::starts_with(core::to_lower(line), "mapx")) continue;

        std::vector<std::string> cols = core::split(line, ',');
        if (cols.size() < 4) {
            throw ValidationError(path.string() + ":" + std::to_string(line_no) +
                                  " expected mapX,mapY,pixelX,pixelY");
        }
        double vals[4];
        for (int k = 0; k < 4; ++k) {
            try {
                vals[k] = std::stod(core::trim(cols[k]));
            } catch (const std::exception&) {
                throw ValidationError(path.string() + ":" + std::to_string(line_no) +
                                      " has a non-numeric column");
            }
        }
        if (cols.size() >= 5 && core::trim(cols[4]) == "0") continue;

        ControlPoint cp;
        cp.id = core::generate_uuid();
        cp.geo = {vals[0], vals[1]};
        cp.pixel.x = static_cast<int>(std::lround(vals[2]));
        cp.pixel.y = static_cast<int>(std::lround(std::abs(vals[3])));
        points.push_back(cp);
    }

    for (auto& cp : points) {
        cp.crs_epsg = epsg;
    }

    ControlPointGroup group(path.stem().string(), 3857, transformation);
    group.points_ = std::move(points);
    return group;
}

nlohmann::json ControlPointGroup::to_json() const {
    nlohmann::json pts = nlohmann::json::array();
    for (const auto& cp : points_) {
        pts.push_back({
            {"id", cp.id},
            {"pixel", {cp.pixel.x, cp.pixel.y}},
            {"geo", {cp.geo.x, cp.geo.y}},
            {"crs_epsg", cp.crs_epsg},
            {"note", cp.note},
            {"modified_by", cp.modified_by},
            {"modified_at_ms", core::to_epoch_ms(cp.modified_at)}
        });
    }
    return {
        {"document", document_ref_},
        {"crs_epsg", crs_epsg_},
        {"transformation", transform_kind_to_string(transformation_)},
        {"points", pts}
    };
}

ControlPointGroup ControlPointGroup::from_json(const nlohmann::json& j) {
    auto kind = parse_transform_kind(j.value("transformation", "poly1"));
    if (!kind) {
        throw ValidationError("unknown transformation " + j.value("transformation", ""));
    }
    ControlPointGroup group(j.value("document", ""), j.value("crs_epsg", 3857), *kind);
    if (j.contains("points")) {
        for (const auto& p : j.at("points")) {
            ControlPoint cp;
            cp.id = p.at("id").get<std::string>();
            cp.pixel.x = p.at("pixel").at(0).get<int>();
            cp.pixel.y = p.at("pixel").at(1).get<int>();
            cp.geo.x = p.at("geo").at(0).get<double>();
            cp.geo.y = p.at("geo").at(1).get<double>();
            cp.crs_epsg = p.value("crs_epsg", 4326);
            cp.note = p.value("note", "");
            cp.modified_by = p.value("modified_by", "");
            cp.modified_at = core::from_epoch_ms(p.value("modified_at_ms", static_cast<int64_t>(0)));
            group.points_.push_back(cp);
        }
    }
    return group;
}

} // namespace mapprep::georeference
