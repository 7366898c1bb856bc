#include "mapprep/session/raster_operations.hpp"
#include "mapprep/core/errors.hpp"
#include "mapprep/core/utils.hpp"
#include "mapprep/georeference/control_points.hpp"
#include "mapprep/split/splitter.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace mapprep::session {

RasterOperations::RasterOperations(const config::Config& cfg, const fs::path& base_dir,
                                   ResourceGateway& gateway, const StatusVocabulary& vocabulary)
    : cfg_(cfg), base_dir_(base_dir), gateway_(gateway), vocabulary_(vocabulary) {}

georeference::GeoreferenceOptions RasterOperations::georeference_options() const {
    georeference::GeoreferenceOptions o;
    const auto& g = cfg_.georeference;
    o.target_epsg = g.target_epsg;
    o.resampling = g.resampling;
    o.compression = g.compression;
    o.jpeg_quality = g.jpeg_quality;
    o.tiled = g.tiled;
    o.block_size = g.block_size;
    o.overview_resampling = g.overview_resampling;
    o.min_overview_size = g.min_overview_size;
    o.preview_dir = cfg_.resolve(base_dir_, cfg_.paths.preview_dir);
    o.output_dir = cfg_.resolve(base_dir_, cfg_.paths.output_dir);
    return o;
}

trim::MaskOptions RasterOperations::mask_options() const {
    trim::MaskOptions o;
    o.output_dir = cfg_.resolve(base_dir_, cfg_.paths.output_dir);
    o.compression = cfg_.georeference.compression;
    o.block_size = cfg_.georeference.block_size;
    o.overview_resampling = cfg_.georeference.overview_resampling;
    o.min_overview_size = cfg_.georeference.min_overview_size;
    return o;
}

ImageBounds RasterOperations::image_bounds(const std::string& subject_ref) {
    return split::Splitter::read_bounds(gateway_.fetch_raster(subject_ref));
}

RunResult RasterOperations::run(const Session& session) {
    return std::visit(detail::Overloaded{
        [&](const PreparationData& d) { return run_preparation(session, d); },
        [&](const GeoreferenceData& d) { return run_georeference(session, d); },
        [&](const TrimData& d) { return run_trim(session, d); }
    }, session.data);
}

void RasterOperations::undo(const Session& session) {
    for (const auto& ref : session.outputs) {
        gateway_.delete_subject(ref);
    }
}

void RasterOperations::discard_subjects(const std::vector<std::string>& refs) {
    for (const auto& ref : refs) {
        try {
            gateway_.delete_subject(ref);
        } catch (const std::exception& e) {
            std::cerr << "Warning: cannot remove " << ref << ": " << e.what() << std::endl;
        }
    }
}

// ─── Preparation ────────────────────────────────────────────────────────

RunResult RasterOperations::run_preparation(const Session& s, const PreparationData& d) {
    const StatusTags& tags = vocabulary_.tags(SessionKind::PREPARATION);
    RunResult result;

    std::vector<Division> divisions = d.divisions;
    if (d.split_needed && divisions.empty() && !d.cutlines.empty()) {
        divisions = split::Splitter().generate_divisions(d.cutlines, image_bounds(s.subject_ref));
    }
    if (!d.split_needed || divisions.size() <= 1) {
        result.note = "document prepared without split";
        result.subject_status = tags.after;
        return result;
    }

    const fs::path source = gateway_.fetch_raster(s.subject_ref);
    const std::string title = gateway_.describe(s.subject_ref).title;
    const fs::path work = cfg_.resolve(base_dir_, cfg_.paths.work_dir) / ("session-" + s.id);

    split::SplitOptions options;
    options.output_format = cfg_.split.output_format;

    std::vector<std::string> children;
    try {
        auto outputs = split::Splitter(options).split_image(source, divisions, work);
        for (size_t i = 0; i < outputs.size(); ++i) {
            std::string child = gateway_.create_child_subject(
                s.subject_ref, outputs[i].path, title + " [" + std::to_string(i + 1) + "]");
            children.push_back(child);
            gateway_.link(s.subject_ref, child, "split");
            gateway_.set_status(child, tags.after);
        }
    } catch (const std::exception&) {
        discard_subjects(children);
        std::error_code ec;
        fs::remove_all(work, ec);
        throw;
    }

    std::error_code ec;
    fs::remove_all(work, ec);

    result.outputs = children;
    result.note = "split into " + std::to_string(children.size()) + " documents";
    result.subject_status = vocabulary_.split_parent();
    return result;
}

// ─── Georeference ───────────────────────────────────────────────────────

RunResult RasterOperations::run_georeference(const Session& s, const GeoreferenceData& d) {
    auto group = georeference::ControlPointGroup::from_geojson(d.gcps, s.subject_ref, d.epsg,
                                                               d.transformation);
    georeference::GeoreferenceOptions options = georeference_options();
    options.target_epsg = d.epsg;

    georeference::Georeferencer georeferencer(options);
    georeferencer.load_control_points(group);

    const fs::path source = gateway_.fetch_raster(s.subject_ref);
    const fs::path output = georeferencer.georeference(source, OutputFormat::FINAL,
                                                       cfg_.georeference.overviews);

    RunResult result;
    result.output_sha256 = core::sha256_file(output);
    std::string layer = gateway_.store_derived_raster(s.subject_ref, output, "georeference");
    gateway_.set_status(layer, vocabulary_.tags(SessionKind::GEOREFERENCE).after);
    result.outputs.push_back(layer);

    std::ostringstream note;
    note << transform_kind_to_string(georeferencer.resolved_transformation()) << " fit on "
         << group.size() << " points, rms error " << std::fixed << std::setprecision(3)
         << georeferencer.transform().rms_error(georeferencer.control_points());
    result.note = note.str();
    return result;
}

// ─── Trim ───────────────────────────────────────────────────────────────

RunResult RasterOperations::run_trim(const Session& s, const TrimData& d) {
    if (d.mask_geometry_wkt.empty()) {
        throw ValidationError("no mask geometry set");
    }

    const fs::path layer = gateway_.fetch_raster(s.subject_ref);
    const fs::path output = trim::apply_mask(layer, d.mask_geometry_wkt, mask_options());

    RunResult result;
    result.output_sha256 = core::sha256_file(output);
    result.outputs.push_back(gateway_.store_derived_raster(s.subject_ref, output, "trim"));
    result.note = "mask applied";
    return result;
}

} // namespace mapprep::session
