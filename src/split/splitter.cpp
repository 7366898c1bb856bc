#include "mapprep/split/splitter.hpp"
#include "mapprep/core/errors.hpp"
#include "mapprep/core/utils.hpp"
#include "mapprep/geometry/polygon.hpp"

#include <opencv2/opencv.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace mapprep::split {

namespace {

std::string extension_for(const std::string& format) {
    std::string fmt = core::to_lower(format);
    if (fmt == "tif" || fmt == "tiff") return ".tif";
    return ".png";
}

cv::Mat to_bgra(const cv::Mat& img) {
    if (img.depth() != CV_8U && img.depth() != CV_16U) {
        throw SplitError(SplitError::Reason::IO,
                         "unsupported sample depth (expected 8 or 16 bit)");
    }
    cv::Mat out;
    switch (img.channels()) {
        case 1:
            cv::cvtColor(img, out, cv::COLOR_GRAY2BGRA);
            break;
        case 3:
            cv::cvtColor(img, out, cv::COLOR_BGR2BGRA);
            break;
        case 4:
            out = img;
            break;
        default:
            throw SplitError(SplitError::Reason::IO,
                             "unsupported channel count " + std::to_string(img.channels()));
    }
    return out;
}

void write_image(const cv::Mat& img, const fs::path& path) {
    // Keep the extension on the temporary name, OpenCV picks the codec from it.
    fs::path tmp = path.parent_path() /
                   ("." + path.stem().string() + "." + core::generate_uuid().substr(0, 8) +
                    path.extension().string());
    bool ok = false;
    try {
        ok = cv::imwrite(tmp.string(), img);
    } catch (const cv::Exception& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw SplitError(SplitError::Reason::IO, "cannot write " + path.string() + ": " + e.what());
    }
    if (!ok) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw SplitError(SplitError::Reason::IO, "cannot write " + path.string());
    }
    try {
        core::replace_file(tmp, path);
    } catch (const IOError& e) {
        throw SplitError(SplitError::Reason::IO, e.what());
    }
}

void validate_cutline(const Cutline& line, const ImageBounds& bounds, size_t index) {
    const std::string name = "cutline " + std::to_string(index);
    if (line.size() < 2) {
        throw SplitError(SplitError::Reason::DEGENERATE_LINE, name + " has fewer than two points");
    }

    double length = 0.0;
    for (size_t i = 0; i < line.size(); ++i) {
        const Point2d& p = line[i];
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            throw SplitError(SplitError::Reason::DEGENERATE_LINE, name + " has a non-finite vertex");
        }
        if (p.x < -geometry::kGeomEpsilon || p.y < -geometry::kGeomEpsilon ||
            p.x > bounds.width + geometry::kGeomEpsilon ||
            p.y > bounds.height + geometry::kGeomEpsilon) {
            throw SplitError(SplitError::Reason::LINE_OUT_OF_BOUNDS,
                             name + " vertex (" + std::to_string(p.x) + ", " +
                             std::to_string(p.y) + ") lies outside the image");
        }
        if (i > 0) {
            length += std::hypot(p.x - line[i - 1].x, p.y - line[i - 1].y);
        }
    }
    if (length <= geometry::kGeomEpsilon) {
        throw SplitError(SplitError::Reason::DEGENERATE_LINE, name + " has zero length");
    }
}

} // namespace

// ─── JSON ───────────────────────────────────────────────────────────────

nlohmann::json rings_to_json(const std::vector<Ring>& rings) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& ring : rings) {
        nlohmann::json pts = nlohmann::json::array();
        for (const auto& p : ring) {
            pts.push_back({p.x, p.y});
        }
        arr.push_back(pts);
    }
    return arr;
}

std::vector<Ring> rings_from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw ValidationError("expected an array of coordinate lists");
    }
    std::vector<Ring> rings;
    for (const auto& item : j) {
        if (!item.is_array()) {
            throw ValidationError("expected a coordinate list");
        }
        Ring ring;
        for (const auto& pt : item) {
            if (!pt.is_array() || pt.size() < 2 || !pt[0].is_number() || !pt[1].is_number()) {
                throw ValidationError("coordinates must be [x, y] number pairs");
            }
            ring.push_back({pt[0].get<double>(), pt[1].get<double>()});
        }
        rings.push_back(std::move(ring));
    }
    return rings;
}

nlohmann::json segmentation_to_json(const Segmentation& seg) {
    return {
        {"cutlines", rings_to_json(seg.cutlines)},
        {"divisions", rings_to_json(seg.divisions)},
        {"split_needed", seg.split_needed}
    };
}

Segmentation segmentation_from_json(const nlohmann::json& j) {
    Segmentation seg;
    if (j.contains("cutlines")) seg.cutlines = rings_from_json(j.at("cutlines"));
    if (j.contains("divisions")) seg.divisions = rings_from_json(j.at("divisions"));
    seg.split_needed = j.value("split_needed", true);
    return seg;
}

// ─── Divisions ──────────────────────────────────────────────────────────

Splitter::Splitter(SplitOptions options) : options_(std::move(options)) {}

std::vector<Division> Splitter::generate_divisions(const std::vector<Cutline>& cutlines,
                                                   const ImageBounds& bounds) const {
    if (bounds.width <= 0 || bounds.height <= 0) {
        throw ValidationError("image bounds must be positive");
    }
    for (size_t i = 0; i < cutlines.size(); ++i) {
        validate_cutline(cutlines[i], bounds, i);
    }

    std::vector<Division> divisions{geometry::normalize_ring(geometry::rectangle(bounds))};
    for (const auto& line : cutlines) {
        std::vector<Division> next;
        for (const auto& div : divisions) {
            auto pieces = geometry::split_by_polyline(div, line);
            next.insert(next.end(), pieces.begin(), pieces.end());
        }
        divisions.swap(next);
    }

    std::stable_sort(divisions.begin(), divisions.end(), [](const Division& a, const Division& b) {
        const auto ba = geometry::bounding_box(a);
        const auto bb = geometry::bounding_box(b);
        if (std::abs(ba.min_y - bb.min_y) > geometry::kGeomEpsilon) return ba.min_y < bb.min_y;
        if (std::abs(ba.min_x - bb.min_x) > geometry::kGeomEpsilon) return ba.min_x < bb.min_x;
        return geometry::area(a) > geometry::area(b);
    });
    return divisions;
}

std::vector<Division> Splitter::preview(const fs::path& image,
                                        const std::vector<Cutline>& cutlines) const {
    return generate_divisions(cutlines, read_bounds(image));
}

ImageBounds Splitter::read_bounds(const fs::path& image) {
    cv::Mat img = cv::imread(image.string(), cv::IMREAD_UNCHANGED);
    if (img.empty()) {
        throw SplitError(SplitError::Reason::IO, "cannot read image " + image.string());
    }
    return {img.cols, img.rows};
}

std::vector<int> Splitter::label_row(const std::vector<Division>& divisions, int row, int width) {
    std::vector<int> labels(static_cast<size_t>(std::max(0, width)), -1);
    for (size_t d = 0; d < divisions.size(); ++d) {
        for (const auto& [x0, x1] : geometry::row_spans(divisions[d], row, width)) {
            for (int x = x0; x < x1; ++x) {
                if (labels[x] < 0) labels[x] = static_cast<int>(d);
            }
        }
    }

    // Centres lying within rounding distance of an edge can slip between spans.
    for (int x = 0; x < width; ++x) {
        if (labels[x] >= 0) continue;
        const Point2d centre{x + 0.5, row + 0.5};
        for (size_t d = 0; d < divisions.size(); ++d) {
            if (geometry::contains(divisions[d], centre) ||
                geometry::on_boundary(divisions[d], centre, 1.0e-6)) {
                labels[x] = static_cast<int>(d);
                break;
            }
        }
        if (labels[x] < 0 && x > 0) labels[x] = labels[x - 1];
    }
    for (int x = width - 2; x >= 0; --x) {
        if (labels[x] < 0) labels[x] = labels[x + 1];
    }
    for (auto& l : labels) {
        if (l < 0) l = 0;
    }
    return labels;
}

// ─── Raster split ───────────────────────────────────────────────────────

std::vector<SplitOutput> Splitter::split_image(const fs::path& source,
                                               const std::vector<Division>& divisions,
                                               const fs::path& out_dir) const {
    if (divisions.empty()) {
        throw ValidationError("no divisions to split");
    }

    cv::Mat raw;
    try {
        raw = cv::imread(source.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw SplitError(SplitError::Reason::IO, "cannot read " + source.string() + ": " + e.what());
    }
    if (raw.empty()) {
        throw SplitError(SplitError::Reason::IO, "cannot read " + source.string());
    }
    const cv::Mat img = to_bgra(raw);
    const int width = img.cols;
    const int height = img.rows;
    const size_t elem = img.elemSize();

    // First pass: pixel extent of every division.
    struct Extent {
        int min_x = std::numeric_limits<int>::max();
        int min_y = std::numeric_limits<int>::max();
        int max_x = -1;
        int max_y = -1;
    };
    std::vector<Extent> extents(divisions.size());
    for (int y = 0; y < height; ++y) {
        std::vector<int> labels = label_row(divisions, y, width);
        for (int x = 0; x < width; ++x) {
            Extent& e = extents[labels[x]];
            e.min_x = std::min(e.min_x, x);
            e.max_x = std::max(e.max_x, x);
            e.min_y = std::min(e.min_y, y);
            e.max_y = std::max(e.max_y, y);
        }
    }

    std::vector<SplitOutput> outputs(divisions.size());
    std::vector<cv::Mat> tiles(divisions.size());
    for (size_t d = 0; d < divisions.size(); ++d) {
        SplitOutput& out = outputs[d];
        const Extent& e = extents[d];
        if (e.max_x < 0) {
            // No pixel centre falls in this division, keep a transparent placeholder.
            const auto box = geometry::bounding_box(divisions[d]);
            out.x = std::min(width - 1, std::max(0, static_cast<int>(std::floor(box.min_x))));
            out.y = std::min(height - 1, std::max(0, static_cast<int>(std::floor(box.min_y))));
            out.width = 1;
            out.height = 1;
        } else {
            out.x = e.min_x;
            out.y = e.min_y;
            out.width = e.max_x - e.min_x + 1;
            out.height = e.max_y - e.min_y + 1;
        }
        tiles[d] = cv::Mat(out.height, out.width, img.type(), cv::Scalar::all(0));
    }

    // Second pass: copy owned pixels.
    for (int y = 0; y < height; ++y) {
        std::vector<int> labels = label_row(divisions, y, width);
        const uint8_t* src_row = img.ptr<uint8_t>(y);
        for (int x = 0; x < width; ++x) {
            const int d = labels[x];
            const SplitOutput& out = outputs[d];
            uint8_t* dst = tiles[d].ptr<uint8_t>(y - out.y) + static_cast<size_t>(x - out.x) * elem;
            std::memcpy(dst, src_row + static_cast<size_t>(x) * elem, elem);
        }
    }

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        throw SplitError(SplitError::Reason::IO, "cannot create " + out_dir.string() + ": " + ec.message());
    }

    const std::string stem = source.stem().string();
    const std::string ext = extension_for(options_.output_format);
    std::vector<fs::path> written;
    try {
        for (size_t d = 0; d < divisions.size(); ++d) {
            outputs[d].path = out_dir / (stem + "__" + std::to_string(d + 1) + ext);
            write_image(tiles[d], outputs[d].path);
            written.push_back(outputs[d].path);
        }
    } catch (const SplitError&) {
        for (const auto& p : written) {
            fs::remove(p, ec);
        }
        throw;
    }
    return outputs;
}

} // namespace mapprep::split
