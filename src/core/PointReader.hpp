#pragma once

/**
 * @file PointReader.hpp
 * @brief Reads receiver points from an OGR point layer
 */

#include "rx_point_enricher.hpp"
#include "Logger.hpp"
#include <string>

namespace rxgis {

/**
 * @brief Loads a receiver batch from GeoJSON, GPKG, shapefile and the like
 *
 * Optional attributes azimuth_index, distance_index, azimuth_deg,
 * distance_km, tx_id and rx_id are copied when present. Features without a
 * point geometry are skipped. The batch takes the layer's CRS, or
 * EPSG:4326 when the layer declares none.
 */
class PointReader {
public:
    PointReader();

    /**
     * @throws std::runtime_error if the source cannot be opened or has no layer
     */
    ReceiverBatch read(const std::string& path) const;

private:
    Logger logger_;
};

} // namespace rxgis
