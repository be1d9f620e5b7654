/**
 * @file PixelIndexer.cpp
 * @brief Eigen-vectorized inverse affine transform
 */

#include "PixelIndexer.hpp"
#include <Eigen/Dense>
#include <algorithm>

namespace rxgis {

size_t PixelIndices::count_in_bounds() const {
    return static_cast<size_t>(std::count(in_bounds.begin(), in_bounds.end(), std::uint8_t{1}));
}

PixelIndices to_pixels(const CoordinateBatch& coords, const GeoTransform& inverse,
                       size_t width, size_t height) {
    const Eigen::Index n = static_cast<Eigen::Index>(coords.size());

    PixelIndices indices;
    indices.rows.assign(coords.size(), -1);
    indices.cols.assign(coords.size(), -1);
    indices.in_bounds.assign(coords.size(), 0);
    if (n == 0) {
        return indices;
    }

    Eigen::Map<const Eigen::ArrayXd> x(coords.x.data(), n);
    Eigen::Map<const Eigen::ArrayXd> y(coords.y.data(), n);

    // pixel = inv[0] + inv[1]*x + inv[2]*y, line = inv[3] + inv[4]*x + inv[5]*y
    const Eigen::ArrayXd col_f = (inverse[0] + inverse[1] * x + inverse[2] * y).floor();
    const Eigen::ArrayXd row_f = (inverse[3] + inverse[4] * x + inverse[5] * y).floor();

    // NaN compares false everywhere, so non-finite input never passes
    const auto inside = (col_f >= 0.0) && (col_f < static_cast<double>(width)) &&
                        (row_f >= 0.0) && (row_f < static_cast<double>(height));

    const Eigen::Array<std::int64_t, Eigen::Dynamic, 1> cols =
        inside.select(col_f, -1.0).cast<std::int64_t>();
    const Eigen::Array<std::int64_t, Eigen::Dynamic, 1> rows =
        inside.select(row_f, -1.0).cast<std::int64_t>();

    Eigen::Map<Eigen::Array<std::int64_t, Eigen::Dynamic, 1>>(indices.cols.data(), n) = cols;
    Eigen::Map<Eigen::Array<std::int64_t, Eigen::Dynamic, 1>>(indices.rows.data(), n) = rows;
    Eigen::Map<Eigen::Array<std::uint8_t, Eigen::Dynamic, 1>>(indices.in_bounds.data(), n) =
        inside.cast<std::uint8_t>();

    return indices;
}

PixelIndices to_pixels(const CoordinateBatch& coords, const RasterGrid& grid) {
    return to_pixels(coords, grid.inverse_geotransform, grid.width, grid.height);
}

} // namespace rxgis
