/**
 * @file RasterSampler.cpp
 * @brief Vectorized raster sampling with sentinel substitution
 */

#include "RasterSampler.hpp"
#include <cmath>

namespace rxgis {

std::vector<double> sample(const std::vector<double>& values, size_t width,
                           const PixelIndices& indices, std::optional<double> nodata,
                           double sentinel) {
    const size_t n = indices.size();
    std::vector<double> samples(n, sentinel);

    for (size_t i = 0; i < n; ++i) {
        if (!indices.in_bounds[i]) {
            continue;
        }

        const size_t offset = static_cast<size_t>(indices.rows[i]) * width +
                              static_cast<size_t>(indices.cols[i]);
        if (offset >= values.size()) {
            continue;
        }

        const double value = values[offset];
        if (std::isnan(value) || (nodata.has_value() && value == *nodata)) {
            continue;
        }
        samples[i] = value;
    }

    return samples;
}

std::vector<double> sample(const RasterGrid& grid, const PixelIndices& indices, double sentinel) {
    return sample(grid.values, grid.width, indices, grid.nodata, sentinel);
}

} // namespace rxgis
