#pragma once

/**
 * @file PixelIndexer.hpp
 * @brief Batched geographic coordinate to pixel index mapping
 */

#include "rx_point_enricher.hpp"
#include <cstdint>
#include <vector>

namespace rxgis {

/**
 * @brief Pixel indices for a coordinate batch, same order as the input
 *
 * Out-of-bounds entries keep row/col = -1 and in_bounds = 0.
 */
struct PixelIndices {
    std::vector<std::int64_t> rows;
    std::vector<std::int64_t> cols;
    std::vector<std::uint8_t> in_bounds;

    size_t size() const { return rows.size(); }
    size_t count_in_bounds() const;
};

/**
 * @brief Apply an inverse geotransform to a whole coordinate batch
 *
 * The affine mapping is evaluated as array expressions over the full batch,
 * then floored to cell indices. Coordinates that land outside
 * [0, height) x [0, width), or that are not finite, are flagged rather than
 * raising.
 *
 * @param coords Coordinates already expressed in the raster's CRS
 * @param inverse Inverse geotransform (GDALInvGeoTransform output)
 * @param width Raster width in pixels
 * @param height Raster height in pixels
 */
PixelIndices to_pixels(const CoordinateBatch& coords, const GeoTransform& inverse,
                       size_t width, size_t height);

/**
 * @brief Convenience overload using the grid's own inverse transform and size
 */
PixelIndices to_pixels(const CoordinateBatch& coords, const RasterGrid& grid);

} // namespace rxgis
