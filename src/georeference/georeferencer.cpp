#include "mapprep/georeference/georeferencer.hpp"
#include "mapprep/core/errors.hpp"
#include "mapprep/core/utils.hpp"
#include "mapprep/georeference/gdal_support.hpp"

#include <cpl_conv.h>
#include <cpl_string.h>
#include <gdal_utils.h>
#include <ogr_spatialref.h>

#include <map>
#include <memory>

namespace mapprep::georeference {

namespace {

struct TransformationDestroyer {
    void operator()(OGRCoordinateTransformation* ct) const {
        OGRCoordinateTransformation::DestroyCT(ct);
    }
};

using TransformationPtr = std::unique_ptr<OGRCoordinateTransformation, TransformationDestroyer>;

// Temporary name next to target that keeps the extension GDAL keys on.
fs::path temp_for(const fs::path& target) {
    return target.parent_path() / ("." + target.stem().string() + "." +
                                   core::generate_uuid().substr(0, 8) +
                                   target.extension().string());
}

void remove_quietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
}

void ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw GeoreferenceError(GeoreferenceError::Reason::IO,
                                "cannot create " + dir.string() + ": " + ec.message());
    }
}

geometry::Transform fit_or_throw(const std::vector<ControlPoint>& points, TransformKind kind) {
    try {
        return geometry::fit(points, kind);
    } catch (const FitError& e) {
        throw GeoreferenceError(GeoreferenceError::Reason::TRANSFORM_FIT, e.what());
    }
}

void publish(const fs::path& tmp, const fs::path& target) {
    try {
        core::replace_file(tmp, target);
    } catch (const IOError& e) {
        throw GeoreferenceError(GeoreferenceError::Reason::IO, e.what());
    }
}

} // namespace

Georeferencer::Georeferencer(GeoreferenceOptions options) : options_(std::move(options)) {}

// ─── Control points ─────────────────────────────────────────────────────

Georeferencer& Georeferencer::load_control_points(const ControlPointGroup& group) {
    const TransformKind previous = requested_;
    requested_ = group.transformation();
    try {
        return load_control_points(group.points());
    } catch (const MapPrepError&) {
        requested_ = previous;
        throw;
    }
}

Georeferencer& Georeferencer::load_control_points(const std::vector<ControlPoint>& points) {
    std::vector<ControlPoint> projected = reproject(points);
    geometry::Transform t = fit_or_throw(projected, requested_);
    points_ = std::move(projected);
    transform_ = std::move(t);
    return *this;
}

void Georeferencer::set_transformation(TransformKind kind) {
    if (!points_.empty()) {
        transform_ = fit_or_throw(points_, kind);
    }
    requested_ = kind;
}

TransformKind Georeferencer::resolved_transformation() const {
    return geometry::resolve_transform_kind(requested_, points_.size());
}

const geometry::Transform& Georeferencer::transform() const {
    if (!transform_) {
        throw GeoreferenceError(GeoreferenceError::Reason::TRANSFORM_FIT,
                                "no control points loaded");
    }
    return *transform_;
}

std::vector<ControlPoint> Georeferencer::reproject(const std::vector<ControlPoint>& points) const {
    ensure_gdal_registered();

    std::vector<ControlPoint> out = points;
    std::map<int, std::vector<size_t>> by_crs;
    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].crs_epsg != options_.target_epsg) {
            by_crs[out[i].crs_epsg].push_back(i);
        }
    }
    if (by_crs.empty()) {
        return out;
    }

    OGRSpatialReference dst;
    if (dst.importFromEPSG(options_.target_epsg) != OGRERR_NONE) {
        throw GeoreferenceError(GeoreferenceError::Reason::RESAMPLE,
                                "unknown target CRS EPSG:" + std::to_string(options_.target_epsg));
    }
    dst.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    for (const auto& [epsg, indices] : by_crs) {
        OGRSpatialReference src;
        if (src.importFromEPSG(epsg) != OGRERR_NONE) {
            throw GeoreferenceError(GeoreferenceError::Reason::RESAMPLE,
                                    "unknown control point CRS EPSG:" + std::to_string(epsg));
        }
        src.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

        TransformationPtr ct(OGRCreateCoordinateTransformation(&src, &dst));
        if (!ct) {
            throw GeoreferenceError(GeoreferenceError::Reason::RESAMPLE,
                                    last_gdal_error("no transformation from EPSG:" +
                                                    std::to_string(epsg)));
        }

        std::vector<double> x;
        std::vector<double> y;
        for (size_t i : indices) {
            x.push_back(out[i].geo.x);
            y.push_back(out[i].geo.y);
        }
        if (!ct->Transform(static_cast<int>(x.size()), x.data(), y.data())) {
            throw GeoreferenceError(GeoreferenceError::Reason::RESAMPLE,
                                    "control points cannot be projected into EPSG:" +
                                    std::to_string(options_.target_epsg));
        }
        for (size_t k = 0; k < indices.size(); ++k) {
            ControlPoint& cp = out[indices[k]];
            cp.geo = {x[k], y[k]};
            cp.crs_epsg = options_.target_epsg;
        }
    }
    return out;
}

// ─── Paths ──────────────────────────────────────────────────────────────

fs::path Georeferencer::preview_path(const fs::path& source) const {
    return options_.preview_dir / (source.stem().string() + "_modified.vrt");
}

fs::path Georeferencer::gcp_carrier_path(const fs::path& source) const {
    return options_.preview_dir / (source.stem().string() + "_gcps.vrt");
}

fs::path Georeferencer::output_path(const fs::path& source) const {
    return options_.output_dir / (source.stem().string() + "_modified.tif");
}

// ─── Warp ───────────────────────────────────────────────────────────────

std::vector<std::string> Georeferencer::warp_arguments(OutputFormat format) const {
    std::vector<std::string> args = {
        "-of", format == OutputFormat::PREVIEW ? "VRT" : "GTiff",
        "-t_srs", "EPSG:" + std::to_string(options_.target_epsg),
        "-r", options_.resampling,
        "-dstalpha",
        "-overwrite"
    };

    switch (resolved_transformation()) {
        case TransformKind::TPS:
            args.push_back("-tps");
            break;
        case TransformKind::POLY3:
            args.insert(args.end(), {"-order", "3"});
            break;
        case TransformKind::POLY2:
            args.insert(args.end(), {"-order", "2"});
            break;
        default:
            args.insert(args.end(), {"-order", "1"});
            break;
    }

    if (format == OutputFormat::FINAL) {
        const std::string compression = core::to_upper(options_.compression);
        if (options_.tiled) {
            const std::string block = std::to_string(options_.block_size);
            args.insert(args.end(), {"-co", "TILED=YES", "-co", "BLOCKXSIZE=" + block,
                                     "-co", "BLOCKYSIZE=" + block});
        }
        args.insert(args.end(), {"-co", "COMPRESS=" + compression});
        if (compression == "JPEG") {
            args.insert(args.end(), {"-co", "JPEG_QUALITY=" + std::to_string(options_.jpeg_quality)});
        }
        args.insert(args.end(), {"-co", "BIGTIFF=IF_SAFER"});
    }
    return args;
}

namespace {

void attach_gcps(GDALDataset* ds, const std::vector<ControlPoint>& points, int epsg) {
    std::vector<std::string> ids;
    ids.reserve(points.size());
    for (const auto& cp : points) {
        ids.push_back(cp.id);
    }

    std::vector<GDAL_GCP> gcps;
    gcps.reserve(points.size());
    static char empty_info[] = "";
    for (size_t i = 0; i < points.size(); ++i) {
        gcps.push_back(GDAL_GCP{const_cast<char*>(ids[i].c_str()),
                                empty_info,
                                static_cast<double>(points[i].pixel.x),
                                static_cast<double>(points[i].pixel.y),
                                points[i].geo.x,
                                points[i].geo.y,
                                0.0});
    }

    OGRSpatialReference srs;
    if (srs.importFromEPSG(epsg) != OGRERR_NONE) {
        throw GeoreferenceError(GeoreferenceError::Reason::RESAMPLE,
                                "unknown target CRS EPSG:" + std::to_string(epsg));
    }
    char* wkt = nullptr;
    srs.exportToWkt(&wkt);
    const CPLErr err = ds->SetGCPs(static_cast<int>(gcps.size()), gcps.data(), wkt);
    CPLFree(wkt);
    if (err != CE_None) {
        throw GeoreferenceError(GeoreferenceError::Reason::IO,
                                last_gdal_error("cannot attach control points"));
    }
}

GDALDatasetH run_warp(GDALDataset* carrier, const fs::path& dest,
                      const std::vector<std::string>& args) {
    CPLStringList argv;
    for (const auto& a : args) {
        argv.AddString(a.c_str());
    }

    GDALWarpAppOptions* opts = GDALWarpAppOptionsNew(argv.List(), nullptr);
    if (!opts) {
        throw GeoreferenceError(GeoreferenceError::Reason::RESAMPLE,
                                last_gdal_error("invalid warp options"));
    }

    GDALDatasetH src = static_cast<GDALDatasetH>(carrier);
    int usage_error = FALSE;
    GDALDatasetH out = GDALWarp(dest.string().c_str(), nullptr, 1, &src, opts, &usage_error);
    GDALWarpAppOptionsFree(opts);

    if (!out || usage_error) {
        if (out) GDALClose(out);
        throw GeoreferenceError(GeoreferenceError::Reason::RESAMPLE,
                                last_gdal_error("warp failed"));
    }
    if (GDALGetRasterXSize(out) <= 0 || GDALGetRasterYSize(out) <= 0) {
        GDALClose(out);
        throw GeoreferenceError(GeoreferenceError::Reason::RESAMPLE, "warp produced an empty raster");
    }
    return out;
}

} // namespace

fs::path Georeferencer::georeference(const fs::path& source, OutputFormat format,
                                     bool overviews) const {
    if (!transform_) {
        throw GeoreferenceError(GeoreferenceError::Reason::TRANSFORM_FIT,
                                "no valid control points loaded");
    }

    ensure_gdal_registered();
    CPLErrorReset();

    DatasetPtr src(static_cast<GDALDataset*>(GDALOpen(source.string().c_str(), GA_ReadOnly)));
    if (!src) {
        throw GeoreferenceError(GeoreferenceError::Reason::IO,
                                last_gdal_error("cannot open " + source.string()));
    }
    if (src->GetRasterCount() < 1) {
        throw GeoreferenceError(GeoreferenceError::Reason::IO, source.string() + " has no raster bands");
    }

    GDALDriver* vrt = GetGDALDriverManager()->GetDriverByName("VRT");
    if (!vrt) {
        throw GeoreferenceError(GeoreferenceError::Reason::IO, "GDAL VRT driver unavailable");
    }

    const std::vector<std::string> args = warp_arguments(format);

    if (format == OutputFormat::PREVIEW) {
        ensure_directory(options_.preview_dir);

        const fs::path carrier_path = gcp_carrier_path(source);
        const fs::path carrier_tmp = temp_for(carrier_path);
        {
            DatasetPtr carrier(vrt->CreateCopy(carrier_tmp.string().c_str(), src.get(),
                                               FALSE, nullptr, nullptr, nullptr));
            if (!carrier) {
                remove_quietly(carrier_tmp);
                throw GeoreferenceError(GeoreferenceError::Reason::IO,
                                        last_gdal_error("cannot write " + carrier_path.string()));
            }
            try {
                attach_gcps(carrier.get(), points_, options_.target_epsg);
            } catch (const GeoreferenceError&) {
                carrier.reset();
                remove_quietly(carrier_tmp);
                throw;
            }
        }
        publish(carrier_tmp, carrier_path);

        DatasetPtr carrier(static_cast<GDALDataset*>(
            GDALOpen(carrier_path.string().c_str(), GA_ReadOnly)));
        if (!carrier) {
            throw GeoreferenceError(GeoreferenceError::Reason::IO,
                                    last_gdal_error("cannot reopen " + carrier_path.string()));
        }

        const fs::path target = preview_path(source);
        const fs::path tmp = temp_for(target);
        try {
            GDALClose(run_warp(carrier.get(), tmp, args));
        } catch (const GeoreferenceError&) {
            remove_quietly(tmp);
            throw;
        }
        publish(tmp, target);
        return target;
    }

    ensure_directory(options_.output_dir);

    DatasetPtr carrier(vrt->CreateCopy("", src.get(), FALSE, nullptr, nullptr, nullptr));
    if (!carrier) {
        throw GeoreferenceError(GeoreferenceError::Reason::IO,
                                last_gdal_error("cannot wrap " + source.string()));
    }
    attach_gcps(carrier.get(), points_, options_.target_epsg);

    const fs::path target = output_path(source);
    const fs::path tmp = temp_for(target);
    try {
        GDALDatasetH out = run_warp(carrier.get(), tmp, args);
        if (overviews) {
            std::vector<int> levels = overview_levels(GDALGetRasterXSize(out), GDALGetRasterYSize(out),
                                                      options_.min_overview_size);
            if (!levels.empty()) {
                const std::string method = core::to_upper(options_.overview_resampling);
                const CPLErr err = GDALBuildOverviews(out, method.c_str(),
                                                      static_cast<int>(levels.size()), levels.data(),
                                                      0, nullptr, nullptr, nullptr);
                if (err != CE_None) {
                    GDALClose(out);
                    throw GeoreferenceError(GeoreferenceError::Reason::RESAMPLE,
                                            last_gdal_error("cannot build overviews"));
                }
            }
        }
        GDALClose(out);
    } catch (const GeoreferenceError&) {
        remove_quietly(tmp);
        throw;
    }
    publish(tmp, target);
    return target;
}

} // namespace mapprep::georeference
