#include "mapprep/georeference/gdal_support.hpp"

#include <cpl_error.h>

#include <algorithm>
#include <mutex>

namespace mapprep::georeference {

void ensure_gdal_registered() {
    static std::once_flag once;
    std::call_once(once, [] { GDALAllRegister(); });
}

std::string last_gdal_error(const std::string& fallback) {
    const char* msg = CPLGetLastErrorMsg();
    if (msg && *msg) {
        return fallback + ": " + msg;
    }
    return fallback;
}

std::vector<int> overview_levels(int width, int height, int min_size) {
    std::vector<int> levels;
    int factor = 2;
    const int smaller = std::min(width, height);
    while (min_size > 0 && smaller / factor >= min_size) {
        levels.push_back(factor);
        factor *= 2;
    }
    return levels;
}

} // namespace mapprep::georeference
