#pragma once

/**
 * @file RasterSampler.hpp
 * @brief Gather raster values for a batch of pixel indices
 */

#include "rx_point_enricher.hpp"
#include "PixelIndexer.hpp"
#include <optional>
#include <vector>

namespace rxgis {

/**
 * @brief Sample a preloaded grid at precomputed indices
 *
 * Returns one value per index in the same order. Out-of-bounds indices and
 * cells equal to the grid's no-data value (or NaN) yield the sentinel.
 * Missing samples are data, never exceptions: receivers routinely fall just
 * outside a raster footprint at the end of a profile.
 */
std::vector<double> sample(const RasterGrid& grid, const PixelIndices& indices, double sentinel);

/**
 * @brief Low-level form over a raw row-major array
 */
std::vector<double> sample(const std::vector<double>& values, size_t width,
                           const PixelIndices& indices, std::optional<double> nodata,
                           double sentinel);

} // namespace rxgis
