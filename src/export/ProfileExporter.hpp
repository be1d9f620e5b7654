/**
 * @file ProfileExporter.hpp
 * @brief P.1812 path profile CSV export
 */

#pragma once

#include "rx_point_enricher.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace rxgis {

/**
 * @brief One radial path profile, nearest point first
 */
struct PathProfile {
    std::string tx_id;
    int azimuth_index = 0;
    double azimuth_deg = 0.0;
    std::vector<double> distances_km;
    std::vector<double> heights;
    std::vector<double> resistances;
    std::vector<int> categories;
    std::vector<int> zones;
    double rx_lon = 0.0;
    double rx_lat = 0.0;
};

/**
 * @brief Group enriched records into radial profiles
 *
 * Records sharing tx_id and azimuth_index form one profile, ordered by
 * distance index. Profiles keep the order in which their first record
 * appears.
 */
std::vector<PathProfile> build_profiles(const std::vector<EnrichedPoint>& records);

/**
 * @brief Writes one CSV row per profile in the P.1812 input layout
 *
 * Columns: f, p, d, h, R, Ct, zone, htg, hrg, pol, phi_t, phi_r, lam_t,
 * lam_r, azimuth. List columns are written as quoted "[a, b, ...]".
 */
class ProfileExporter {
public:
    struct Parameters {
        double frequency_ghz;
        double time_percentage;
        int polarization;
        double antenna_height_tx;
        double antenna_height_rx;
        double tx_lon;
        double tx_lat;

        Parameters()
            : frequency_ghz(0.9),
              time_percentage(50.0),
              polarization(1),
              antenna_height_tx(57.0),
              antenna_height_rx(10.0),
              tx_lon(0.0),
              tx_lat(0.0) {}

        static Parameters from_config(const EnrichmentConfig& config);
    };

    explicit ProfileExporter(const Parameters& parameters);

    bool export_profiles(const std::vector<EnrichedPoint>& records, const std::string& filename) const;

    void write(std::ostream& out, const std::vector<PathProfile>& profiles) const;

private:
    Parameters parameters_;
};

} // namespace rxgis
