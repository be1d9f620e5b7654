/**
 * @file ReceiverPointGenerator.cpp
 * @brief Radial and phyllotaxis receiver layouts
 */

#include "ReceiverPointGenerator.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rxgis {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;
constexpr double METERS_PER_DEGREE_LAT = 111320.0;

} // anonymous namespace

std::array<double, 2> destination_point(double lon, double lat, double azimuth_deg, double distance_m) {
    const double phi1 = lat * DEG_TO_RAD;
    const double lambda1 = lon * DEG_TO_RAD;
    const double theta = azimuth_deg * DEG_TO_RAD;
    const double delta = distance_m / EARTH_RADIUS_M;

    const double sin_phi2 = std::sin(phi1) * std::cos(delta) +
                            std::cos(phi1) * std::sin(delta) * std::cos(theta);
    const double phi2 = std::asin(std::clamp(sin_phi2, -1.0, 1.0));
    const double lambda2 = lambda1 + std::atan2(std::sin(theta) * std::sin(delta) * std::cos(phi1),
                                                std::cos(delta) - std::sin(phi1) * sin_phi2);

    double lon2 = lambda2 * RAD_TO_DEG;
    lon2 = std::fmod(lon2 + 540.0, 360.0) - 180.0;

    return {lon2, phi2 * RAD_TO_DEG};
}

ReceiverPointGenerator::ReceiverPointGenerator() : logger_("ReceiverPointGenerator") {
}

ReceiverBatch ReceiverPointGenerator::generate_radial(const Transmitter& tx,
                                                      double max_distance_km,
                                                      double distance_step_km,
                                                      double azimuth_step_deg,
                                                      bool include_tx_point) const {
    if (!(distance_step_km > 0.0)) {
        throw std::invalid_argument("distance step must be positive");
    }
    if (!(max_distance_km > 0.0)) {
        throw std::invalid_argument("maximum distance must be positive");
    }
    if (!(azimuth_step_deg > 0.0) || azimuth_step_deg > 360.0) {
        throw std::invalid_argument("azimuth step must be in (0, 360]");
    }

    const int num_azimuths = static_cast<int>(std::lround(360.0 / azimuth_step_deg));
    // Tolerance keeps max_distance itself when it is a multiple of the step
    const int num_rings = static_cast<int>(std::floor(max_distance_km / distance_step_km + 1e-9));

    ReceiverBatch batch;
    batch.crs = "EPSG:4326";
    batch.points.reserve(static_cast<size_t>(num_azimuths) *
                         static_cast<size_t>(num_rings + (include_tx_point ? 1 : 0)));

    int rx_id = 1;
    for (int a = 0; a < num_azimuths; ++a) {
        const double azimuth = a * azimuth_step_deg;

        if (include_tx_point) {
            ReceiverPoint point(tx.lon, tx.lat, PointId(a, 0));
            point.tx_id = tx.tx_id;
            point.rx_id = rx_id++;
            point.azimuth_deg = azimuth;
            point.distance_km = 0.0;
            batch.points.push_back(point);
        }

        for (int d = 1; d <= num_rings; ++d) {
            const double distance_km = d * distance_step_km;
            const auto [lon, lat] = destination_point(tx.lon, tx.lat, azimuth, distance_km * 1000.0);

            ReceiverPoint point(lon, lat, PointId(a, d));
            point.tx_id = tx.tx_id;
            point.rx_id = rx_id++;
            point.azimuth_deg = azimuth;
            point.distance_km = distance_km;
            batch.points.push_back(point);
        }
    }

    logger_.info("Generated " + std::to_string(batch.size()) + " receivers on " +
                 std::to_string(num_azimuths) + " radials x " + std::to_string(num_rings) + " rings");
    return batch;
}

ReceiverBatch ReceiverPointGenerator::generate(const EnrichmentConfig& config) const {
    const Transmitter tx{config.tx_id, config.tx_longitude, config.tx_latitude};

    if (config.receiver_layout == "radial") {
        return generate_radial(tx, config.max_distance_km, config.distance_step_km,
                               config.azimuth_step_deg, config.include_tx_point);
    }
    if (config.receiver_layout == "phyllotaxis") {
        if (config.num_points <= 0) {
            throw std::invalid_argument("phyllotaxis needs at least one point");
        }
        return generate_phyllotaxis(tx, static_cast<size_t>(config.num_points), config.layout_scale_m);
    }
    throw std::invalid_argument("unknown receiver layout '" + config.receiver_layout + "'");
}

ReceiverBatch ReceiverPointGenerator::generate_phyllotaxis(const Transmitter& tx, size_t num_points,
                                                           double scale_m) const {
    if (num_points == 0) {
        throw std::invalid_argument("phyllotaxis needs at least one point");
    }
    if (!(scale_m > 0.0)) {
        throw std::invalid_argument("phyllotaxis scale must be positive");
    }

    const double golden_angle = 2.0 * PI * (1.0 - 1.0 / std::sqrt(5.0));
    const double meters_per_degree_lon = METERS_PER_DEGREE_LAT * std::cos(tx.lat * DEG_TO_RAD);

    ReceiverBatch batch;
    batch.crs = "EPSG:4326";
    batch.points.reserve(num_points);

    for (size_t i = 0; i < num_points; ++i) {
        const double angle = static_cast<double>(i) * golden_angle;
        const double radius = scale_m * std::sqrt((static_cast<double>(i) + 0.5) / static_cast<double>(num_points));

        const double x = radius * std::cos(angle);
        const double y = radius * std::sin(angle);

        ReceiverPoint point(tx.lon + x / meters_per_degree_lon,
                            tx.lat + y / METERS_PER_DEGREE_LAT,
                            PointId(static_cast<int>(i), 0));
        point.tx_id = tx.tx_id;
        point.rx_id = static_cast<int>(i) + 1;
        point.distance_km = radius / 1000.0;

        // Spiral angle is counterclockwise from east; store it as a compass bearing
        point.azimuth_deg = std::fmod(450.0 - std::fmod(angle * RAD_TO_DEG, 360.0), 360.0);
        batch.points.push_back(point);
    }

    logger_.info("Generated " + std::to_string(num_points) + " phyllotaxis receivers within " +
                 std::to_string(scale_m) + " m");
    return batch;
}

} // namespace rxgis
