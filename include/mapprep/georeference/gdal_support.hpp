#pragma once

#include <gdal_priv.h>

#include <memory>
#include <string>
#include <vector>

namespace mapprep::georeference {

void ensure_gdal_registered();

struct DatasetCloser {
    void operator()(GDALDataset* ds) const {
        if (ds) GDALClose(ds);
    }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

// Message of the last CPL error, or fallback when GDAL recorded none.
std::string last_gdal_error(const std::string& fallback);

// Decimation factors 2, 4, 8, ... while the smaller side stays >= min_size.
std::vector<int> overview_levels(int width, int height, int min_size);

} // namespace mapprep::georeference
