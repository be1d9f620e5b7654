#pragma once

/**
 * @file GdalHandles.hpp
 * @brief RAII ownership for GDAL datasets
 */

#include <gdal_priv.h>
#include <memory>
#include <mutex>

namespace rxgis {

struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) const {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

/**
 * @brief Register GDAL/OGR drivers once per process
 */
inline void ensure_gdal_registered() {
    static std::once_flag registered;
    std::call_once(registered, [] { GDALAllRegister(); });
}

} // namespace rxgis
