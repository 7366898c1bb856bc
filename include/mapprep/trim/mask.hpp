#pragma once

#include "mapprep/core/types.hpp"

#include <string>

namespace mapprep::trim {

struct MaskOptions {
  fs::path output_dir = "layers";
  std::string compression = "DEFLATE";
  int block_size = 256;
  std::string overview_resampling = "AVERAGE";
  int min_overview_size = 256;
};

// Output location for a trimmed copy of layer_raster.
fs::path trimmed_path(const MaskOptions& options, const fs::path& layer_raster);

/**
 * Writes a copy of a georeferenced raster whose alpha is zero outside the
 * mask polygon. The mask is WKT (optionally EWKT with an SRID prefix) in the
 * raster's CRS unless the SRID says otherwise. Re-applying the same mask
 * yields the same file.
 */
fs::path apply_mask(const fs::path& layer_raster, const std::string& mask_wkt,
                    const MaskOptions& options);

} // namespace mapprep::trim
