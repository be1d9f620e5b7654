#pragma once

/**
 * @file RasterPreloader.hpp
 * @brief Single-pass raster materialization using GDAL
 */

#include "rx_point_enricher.hpp"
#include "Logger.hpp"
#include <string>

namespace rxgis {

/**
 * @brief Loads a georeferenced raster into memory in one open/close cycle
 *
 * Band 1 is read in full together with the geotransform, its inverse, the
 * no-data value and the CRS. Every later lookup works on the returned grid
 * without touching the file again.
 *
 * Rasters must fit in memory; there is no tiling or windowed streaming.
 */
class RasterPreloader {
public:
    RasterPreloader();

    /**
     * @brief Materialize a raster
     * @param path Any GDAL-readable path (GeoTIFF, VRT, /vsimem/, ...)
     * @return Fully loaded grid
     * @throws RasterUnavailable if the raster cannot be opened, is not
     *         georeferenced, has a singular transform or fails to read
     */
    RasterGrid load(const std::string& path) const;

private:
    Logger logger_;
};

} // namespace rxgis
