/**
 * @file RasterPreloader.cpp
 * @brief Implementation of single-pass raster loading
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterPreloader.hpp"
#include "GdalHandles.hpp"
#include "ExtractionErrors.hpp"
#include <gdal_priv.h>
#include <cmath>
#include <new>
#include <sstream>

namespace rxgis {

RasterPreloader::RasterPreloader() : logger_("RasterPreloader") {
    ensure_gdal_registered();
}

RasterGrid RasterPreloader::load(const std::string& path) const {
    if (path.empty()) {
        throw RasterUnavailable("no raster path configured");
    }

    logger_.detailed("Opening raster: " + path);

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset) {
        throw RasterUnavailable("failed to open " + path);
    }

    if (dataset->GetRasterCount() < 1) {
        throw RasterUnavailable(path + " has no raster bands");
    }

    RasterGrid grid;
    grid.source_path = path;
    grid.width = static_cast<size_t>(dataset->GetRasterXSize());
    grid.height = static_cast<size_t>(dataset->GetRasterYSize());

    if (dataset->GetGeoTransform(grid.geotransform.data()) != CE_None) {
        throw RasterUnavailable(path + " is not georeferenced (no geotransform)");
    }
    if (!GDALInvGeoTransform(grid.geotransform.data(), grid.inverse_geotransform.data())) {
        throw RasterUnavailable(path + " has a non-invertible geotransform");
    }

    const char* projection = dataset->GetProjectionRef();
    grid.crs_wkt = projection ? projection : "";
    if (grid.crs_wkt.empty()) {
        logger_.warning(path + " declares no CRS");
    }

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (!band) {
        throw RasterUnavailable("failed to get band 1 of " + path);
    }

    int has_nodata = FALSE;
    const double nodata = band->GetNoDataValue(&has_nodata);
    if (has_nodata) {
        grid.nodata = nodata;
    }

    try {
        grid.values.resize(grid.width * grid.height);
    } catch (const std::bad_alloc&) {
        throw RasterUnavailable(path + " is too large to preload (" +
                                std::to_string(grid.width) + "x" + std::to_string(grid.height) + ")");
    }

    const CPLErr err = band->RasterIO(GF_Read, 0, 0,
                                      static_cast<int>(grid.width), static_cast<int>(grid.height),
                                      grid.values.data(),
                                      static_cast<int>(grid.width), static_cast<int>(grid.height),
                                      GDT_Float64, 0, 0);
    if (err != CE_None) {
        throw RasterUnavailable("failed to read pixels of " + path + ": " + CPLGetLastErrorMsg());
    }

    std::ostringstream msg;
    msg << "Preloaded " << path << ": " << grid.width << "x" << grid.height << " pixels, "
        << (grid.footprint_bytes() / 1024) << " KB";
    if (grid.nodata.has_value()) {
        msg << ", nodata=" << *grid.nodata;
    }
    logger_.info(msg.str());

    return grid;
}

} // namespace rxgis
