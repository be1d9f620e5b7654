#pragma once

/**
 * @file ReceiverPointGenerator.hpp
 * @brief Receiver point layouts around a transmitter
 */

#include "rx_point_enricher.hpp"
#include "Logger.hpp"
#include <string>

namespace rxgis {

/**
 * @brief Transmitter site, WGS84 degrees
 */
struct Transmitter {
    std::string tx_id;
    double lon = 0.0;
    double lat = 0.0;
};

/**
 * @brief Mean Earth radius used for great-circle destinations (meters)
 */
constexpr double EARTH_RADIUS_M = 6371008.8;

/**
 * @brief Destination reached from (lon, lat) along an initial bearing
 * @param azimuth_deg Compass bearing, 0 = north, clockwise
 * @param distance_m Great-circle distance on a spherical Earth
 * @return {lon, lat} in degrees, longitude normalized to [-180, 180)
 */
std::array<double, 2> destination_point(double lon, double lat, double azimuth_deg, double distance_m);

/**
 * @brief Generates receiver batches in EPSG:4326
 */
class ReceiverPointGenerator {
public:
    ReceiverPointGenerator();

    /**
     * @brief Layout selected by config.receiver_layout around the configured transmitter
     * @throws std::invalid_argument for an unknown layout or invalid layout parameters
     */
    ReceiverBatch generate(const EnrichmentConfig& config) const;

    /**
     * @brief Radial profile grid
     *
     * 360 / azimuth_step radials, each sampled every distance_step_km out to
     * max_distance_km. Points are ordered radial by radial, nearest first, so
     * each profile is contiguous. With include_tx_point every radial starts
     * with the transmitter itself at distance index 0.
     *
     * @throws std::invalid_argument on non-positive steps or distances
     */
    ReceiverBatch generate_radial(const Transmitter& tx,
                                  double max_distance_km,
                                  double distance_step_km,
                                  double azimuth_step_deg,
                                  bool include_tx_point = true) const;

    /**
     * @brief Golden-angle spiral of roughly uniform density
     * @param scale_m Radius of the outermost point in meters
     * @throws std::invalid_argument on zero points or non-positive scale
     */
    ReceiverBatch generate_phyllotaxis(const Transmitter& tx, size_t num_points, double scale_m) const;

private:
    Logger logger_;
};

} // namespace rxgis
