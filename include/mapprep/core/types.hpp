#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mapprep {

namespace fs = std::filesystem;

using Timestamp = std::chrono::system_clock::time_point;

// Plane coordinate. For image geometry x/y are pixel column/row (y down),
// for geographic points x is longitude/easting and y latitude/northing.
struct Point2d {
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const Point2d& a, const Point2d& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point2d& a, const Point2d& b) {
    return !(a == b);
}

struct PixelPoint {
    int x = 0;
    int y = 0;
};

inline bool operator==(const PixelPoint& a, const PixelPoint& b) {
    return a.x == b.x && a.y == b.y;
}

struct ImageBounds {
    int width = 0;
    int height = 0;
};

// Closed ring, first vertex is not repeated at the end.
using Ring = std::vector<Point2d>;
using Cutline = std::vector<Point2d>;
using Division = Ring;

struct ControlPoint {
    std::string id;
    PixelPoint pixel;
    Point2d geo;
    int crs_epsg = 4326;
    std::string note;
    std::string modified_by;
    Timestamp modified_at{};
};

namespace detail {

inline std::string normalize_token(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return norm;
}

} // namespace detail

// Transformation family. POLY picks the degree from the number of points.
enum class TransformKind {
    POLY,
    POLY1,
    POLY2,
    POLY3,
    TPS
};

inline std::string transform_kind_to_string(TransformKind kind) {
    switch (kind) {
        case TransformKind::POLY: return "poly";
        case TransformKind::POLY1: return "poly1";
        case TransformKind::POLY2: return "poly2";
        case TransformKind::POLY3: return "poly3";
        case TransformKind::TPS: return "tps";
        default: return "unknown";
    }
}

inline std::optional<TransformKind> parse_transform_kind(const std::string& s) {
    std::string norm = detail::normalize_token(s);
    if (norm == "poly" || norm == "polynomial") return TransformKind::POLY;
    if (norm == "poly1" || norm == "affine") return TransformKind::POLY1;
    if (norm == "poly2") return TransformKind::POLY2;
    if (norm == "poly3") return TransformKind::POLY3;
    if (norm == "tps" || norm == "thin_plate_spline") return TransformKind::TPS;
    return std::nullopt;
}

enum class OutputFormat {
    PREVIEW,
    FINAL
};

enum class SessionKind {
    PREPARATION,
    GEOREFERENCE,
    TRIM
};

inline std::string session_kind_to_string(SessionKind kind) {
    switch (kind) {
        case SessionKind::PREPARATION: return "preparation";
        case SessionKind::GEOREFERENCE: return "georeference";
        case SessionKind::TRIM: return "trim";
        default: return "unknown";
    }
}

inline std::optional<SessionKind> parse_session_kind(const std::string& s) {
    std::string norm = detail::normalize_token(s);
    if (norm == "preparation" || norm == "prep") return SessionKind::PREPARATION;
    if (norm == "georeference" || norm == "georef") return SessionKind::GEOREFERENCE;
    if (norm == "trim") return SessionKind::TRIM;
    return std::nullopt;
}

enum class SessionStage {
    INPUT,
    PROCESSING,
    FINISHED
};

inline std::string session_stage_to_string(SessionStage stage) {
    switch (stage) {
        case SessionStage::INPUT: return "input";
        case SessionStage::PROCESSING: return "processing";
        case SessionStage::FINISHED: return "finished";
        default: return "unknown";
    }
}

inline std::optional<SessionStage> parse_session_stage(const std::string& s) {
    std::string norm = detail::normalize_token(s);
    if (norm == "input") return SessionStage::INPUT;
    if (norm == "processing") return SessionStage::PROCESSING;
    if (norm == "finished") return SessionStage::FINISHED;
    return std::nullopt;
}

enum class SessionStatus {
    UNSTARTED,
    RUNNING,
    FAILED,
    SUCCESS
};

inline std::string session_status_to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::UNSTARTED: return "unstarted";
        case SessionStatus::RUNNING: return "running";
        case SessionStatus::FAILED: return "failed";
        case SessionStatus::SUCCESS: return "success";
        default: return "unknown";
    }
}

inline std::optional<SessionStatus> parse_session_status(const std::string& s) {
    std::string norm = detail::normalize_token(s);
    if (norm == "unstarted" || norm == "not started") return SessionStatus::UNSTARTED;
    if (norm == "running" || norm == "in progress") return SessionStatus::RUNNING;
    if (norm == "failed") return SessionStatus::FAILED;
    if (norm == "success") return SessionStatus::SUCCESS;
    return std::nullopt;
}

} // namespace mapprep
