/**
 * @file CSVExporter.hpp
 * @brief Flat CSV export of enriched receiver points
 */

#pragma once

#include "rx_point_enricher.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace rxgis {

/**
 * @brief Writes one row per enriched point
 *
 * Columns: tx_id, rx_id, azimuth_index, distance_index, azimuth_deg,
 * distance_km, lon, lat, h, ct, Ct, R, zone.
 */
class CSVExporter {
public:
    struct Options {
        int coordinate_precision;
        int value_precision;
        bool include_header;

        Options()
            : coordinate_precision(7),
              value_precision(3),
              include_header(true) {}
    };

    CSVExporter();
    explicit CSVExporter(const Options& options);

    /**
     * @return true if the file was written
     */
    bool export_csv(const std::vector<EnrichedPoint>& records, const std::string& filename) const;

    void write(std::ostream& out, const std::vector<EnrichedPoint>& records) const;

    /**
     * @brief Quote a text field when it holds a separator, quote or line break
     */
    static std::string escape_csv_field(const std::string& field);

private:
    Options options_;
};

} // namespace rxgis
