#include "mapprep/trim/mask.hpp"
#include "mapprep/core/errors.hpp"
#include "mapprep/core/utils.hpp"
#include "mapprep/georeference/gdal_support.hpp"

#include <cpl_string.h>
#include <gdal_alg.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>

#include <algorithm>
#include <memory>
#include <vector>

namespace mapprep::trim {

using georeference::DatasetPtr;
using georeference::last_gdal_error;

namespace {

struct GeometryDestroyer {
    void operator()(OGRGeometry* g) const {
        OGRGeometryFactory::destroyGeometry(g);
    }
};

using GeometryPtr = std::unique_ptr<OGRGeometry, GeometryDestroyer>;

GeometryPtr parse_mask(const std::string& text, const OGRSpatialReference* raster_srs) {
    std::string wkt = core::trim(text);
    int srid = 0;
    if (core::starts_with(core::to_upper(wkt), "SRID=")) {
        const size_t semi = wkt.find(';');
        if (semi == std::string::npos) {
            throw ValidationError("malformed EWKT mask");
        }
        try {
            srid = std::stoi(wkt.substr(5, semi - 5));
        } catch (const std::exception&) {
            throw ValidationError("malformed SRID in mask");
        }
        wkt = wkt.substr(semi + 1);
    }

    OGRGeometry* raw = nullptr;
    if (OGRGeometryFactory::createFromWkt(wkt.c_str(), nullptr, &raw) != OGRERR_NONE || !raw) {
        throw ValidationError("mask is not valid WKT");
    }
    GeometryPtr geom(raw);

    const OGRwkbGeometryType type = wkbFlatten(geom->getGeometryType());
    if (type != wkbPolygon && type != wkbMultiPolygon) {
        throw ValidationError("mask must be a polygon or multipolygon");
    }
    if (geom->IsEmpty()) {
        throw ValidationError("mask polygon is empty");
    }

    if (srid > 0 && raster_srs && !raster_srs->IsEmpty()) {
        OGRSpatialReference mask_srs;
        if (mask_srs.importFromEPSG(srid) != OGRERR_NONE) {
            throw ValidationError("unknown mask SRID " + std::to_string(srid));
        }
        mask_srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        OGRSpatialReference target(*raster_srs);
        target.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        if (!mask_srs.IsSame(&target)) {
            geom->assignSpatialReference(&mask_srs);
            if (geom->transformTo(&target) != OGRERR_NONE) {
                throw ValidationError("mask cannot be projected into the raster CRS");
            }
        }
        geom->assignSpatialReference(nullptr);
    }
    return geom;
}

int find_alpha_band(GDALDataset* ds) {
    for (int b = 1; b <= ds->GetRasterCount(); ++b) {
        if (ds->GetRasterBand(b)->GetColorInterpretation() == GCI_AlphaBand) {
            return b;
        }
    }
    return 0;
}

} // namespace

fs::path trimmed_path(const MaskOptions& options, const fs::path& layer_raster) {
    std::string stem = layer_raster.stem().string();
    const std::string suffix = "_modified";
    if (core::ends_with(stem, suffix)) {
        stem = stem.substr(0, stem.size() - suffix.size());
    }
    return options.output_dir / (stem + "_trimmed.tif");
}

fs::path apply_mask(const fs::path& layer_raster, const std::string& mask_wkt,
                    const MaskOptions& options) {
    georeference::ensure_gdal_registered();
    CPLErrorReset();

    DatasetPtr src(static_cast<GDALDataset*>(GDALOpen(layer_raster.string().c_str(), GA_ReadOnly)));
    if (!src) {
        throw IOError(last_gdal_error("cannot open " + layer_raster.string()));
    }

    double geotransform[6];
    if (src->GetGeoTransform(geotransform) != CE_None) {
        throw ValidationError(layer_raster.string() + " is not georeferenced");
    }
    GeometryPtr mask = parse_mask(mask_wkt, src->GetSpatialRef());

    const int width = src->GetRasterXSize();
    const int height = src->GetRasterYSize();
    const int src_alpha = find_alpha_band(src.get());
    const int data_bands = src_alpha > 0 ? src->GetRasterCount() - 1 : src->GetRasterCount();
    const GDALDataType type = src->GetRasterBand(1)->GetRasterDataType();

    GDALDriver* mem = GetGDALDriverManager()->GetDriverByName("MEM");
    GDALDriver* gtiff = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!mem || !gtiff) {
        throw IOError("GDAL MEM/GTiff drivers unavailable");
    }

    // Working copy: data bands followed by one alpha band.
    DatasetPtr work(mem->Create("", width, height, data_bands + 1, type, nullptr));
    if (!work) {
        throw IOError(last_gdal_error("cannot allocate working raster"));
    }
    work->SetGeoTransform(geotransform);
    work->SetSpatialRef(src->GetSpatialRef());

    std::vector<double> row(static_cast<size_t>(width));
    int out_band = 1;
    for (int b = 1; b <= src->GetRasterCount(); ++b) {
        if (b == src_alpha) continue;
        GDALRasterBand* in = src->GetRasterBand(b);
        GDALRasterBand* out = work->GetRasterBand(out_band);
        out->SetColorInterpretation(in->GetColorInterpretation());
        for (int y = 0; y < height; ++y) {
            if (in->RasterIO(GF_Read, 0, y, width, 1, row.data(), width, 1, GDT_Float64, 0, 0) != CE_None ||
                out->RasterIO(GF_Write, 0, y, width, 1, row.data(), width, 1, GDT_Float64, 0, 0) != CE_None) {
                throw IOError(last_gdal_error("cannot copy band " + std::to_string(b)));
            }
        }
        ++out_band;
    }

    GDALRasterBand* alpha = work->GetRasterBand(data_bands + 1);
    alpha->SetColorInterpretation(GCI_AlphaBand);
    double opaque = 255.0;
    if (type == GDT_UInt16) opaque = 65535.0;

    // Rasterize the mask into a byte band with the same georeferencing.
    DatasetPtr mask_ds(mem->Create("", width, height, 1, GDT_Byte, nullptr));
    if (!mask_ds) {
        throw IOError(last_gdal_error("cannot allocate mask raster"));
    }
    mask_ds->SetGeoTransform(geotransform);
    mask_ds->SetSpatialRef(src->GetSpatialRef());
    mask_ds->GetRasterBand(1)->Fill(0.0);

    int band_list[1] = {1};
    double burn[1] = {1.0};
    OGRGeometryH geoms[1] = {static_cast<OGRGeometryH>(mask.get())};
    if (GDALRasterizeGeometries(static_cast<GDALDatasetH>(mask_ds.get()), 1, band_list, 1, geoms,
                                nullptr, nullptr, burn, nullptr, nullptr, nullptr) != CE_None) {
        throw IOError(last_gdal_error("cannot rasterize mask"));
    }

    std::vector<double> inside(static_cast<size_t>(width));
    for (int y = 0; y < height; ++y) {
        if (mask_ds->GetRasterBand(1)->RasterIO(GF_Read, 0, y, width, 1, inside.data(), width, 1,
                                                GDT_Float64, 0, 0) != CE_None) {
            throw IOError(last_gdal_error("cannot read mask"));
        }
        if (src_alpha > 0) {
            if (src->GetRasterBand(src_alpha)->RasterIO(GF_Read, 0, y, width, 1, row.data(), width, 1,
                                                        GDT_Float64, 0, 0) != CE_None) {
                throw IOError(last_gdal_error("cannot read alpha"));
            }
        } else {
            std::fill(row.begin(), row.end(), opaque);
        }
        for (int x = 0; x < width; ++x) {
            if (inside[x] <= 0.0) row[x] = 0.0;
        }
        if (alpha->RasterIO(GF_Write, 0, y, width, 1, row.data(), width, 1, GDT_Float64, 0, 0) != CE_None) {
            throw IOError(last_gdal_error("cannot write alpha"));
        }
    }

    std::error_code ec;
    fs::create_directories(options.output_dir, ec);
    if (ec) {
        throw IOError("cannot create " + options.output_dir.string() + ": " + ec.message());
    }

    const fs::path target = trimmed_path(options, layer_raster);
    const fs::path tmp = target.parent_path() /
                         ("." + target.stem().string() + "." + core::generate_uuid().substr(0, 8) + ".tif");

    CPLStringList co;
    co.SetNameValue("TILED", "YES");
    co.SetNameValue("BLOCKXSIZE", std::to_string(options.block_size).c_str());
    co.SetNameValue("BLOCKYSIZE", std::to_string(options.block_size).c_str());
    co.SetNameValue("COMPRESS", core::to_upper(options.compression).c_str());
    co.SetNameValue("BIGTIFF", "IF_SAFER");

    {
        DatasetPtr out(gtiff->CreateCopy(tmp.string().c_str(), work.get(), FALSE, co.List(),
                                         nullptr, nullptr));
        if (!out) {
            std::error_code rm;
            fs::remove(tmp, rm);
            throw IOError(last_gdal_error("cannot write " + target.string()));
        }
        std::vector<int> levels = georeference::overview_levels(width, height, options.min_overview_size);
        if (!levels.empty()) {
            const std::string method = core::to_upper(options.overview_resampling);
            if (out->BuildOverviews(method.c_str(), static_cast<int>(levels.size()), levels.data(),
                                    0, nullptr, nullptr, nullptr) != CE_None) {
                out.reset();
                std::error_code rm;
                fs::remove(tmp, rm);
                throw IOError(last_gdal_error("cannot build overviews"));
            }
        }
    }

    core::replace_file(tmp, target);
    return target;
}

} // namespace mapprep::trim
